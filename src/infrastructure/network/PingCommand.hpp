#pragma once

#include "core/services/IReachabilityProbe.hpp"
#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace pingsweep::infra {

/**
 * @brief Invocation syntax and output interpretation of the platform ping tool.
 *
 * The syntax is picked once per process. Argument building and output
 * classification are pure functions so they can be exercised without
 * spawning a process.
 */
class PingCommand {
public:
    enum class Platform { Linux, MacOS, Windows };

    /**
     * @brief Command for the platform this binary was built for.
     */
    static PingCommand forHost();

    explicit PingCommand(Platform platform, std::string program = "ping");

    /**
     * @brief Full argv (program first) for one probe.
     *
     * Linux: ping -c N -W T. macOS: ping -c N -t T. Windows: ping -n N -w T*1000.
     * IPv6 literals add -6 on Linux and macOS.
     */
    std::vector<std::string> arguments(const std::string& identifier,
                                       const core::ProbeOptions& options) const;

    /**
     * @brief Hard wall-clock limit for the spawned process (timeout * count + 2s).
     */
    static std::chrono::milliseconds deadline(const core::ProbeOptions& options);

    /**
     * @brief Extracts the first round-trip time ("time=12.3 ms", "time<1ms").
     * @return Latency, or nullopt when the output carries no time token.
     */
    static std::optional<std::chrono::microseconds> parseLatency(const std::string& output);

    /**
     * @brief Maps an exit status and captured output to a ProbeResult.
     *
     * Exit 0 is a success. Otherwise the output decides between resolution
     * failure and unreachable destination; unrecognised output with an exit
     * status of 2 or more (or a failed exec, reported as -1 or 127) is a tool
     * error, anything else a timeout.
     */
    static core::ProbeResult classify(const std::string& identifier, int exitCode,
                                      const std::string& output);

    Platform platform() const { return platform_; }
    const std::string& program() const { return program_; }

private:
    Platform platform_;
    std::string program_;
};

} // namespace pingsweep::infra
