#pragma once

#include "core/services/IReachabilityProbe.hpp"
#include "infrastructure/network/PingCommand.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace pingsweep::infra {

/**
 * @brief Reachability probe that runs the platform ping tool.
 *
 * The tool is started without a shell, its stdout and stderr are captured
 * through one pipe, and the process is killed once PingCommand::deadline()
 * has elapsed. Safe to call from any number of threads at once.
 */
class SystemPingProbe : public core::IReachabilityProbe {
public:
    explicit SystemPingProbe(PingCommand command = PingCommand::forHost());

    core::ProbeResult probe(const std::string& identifier, const core::ProbeOptions& options,
                            std::stop_token stopToken) override;

    std::string name() const override { return "system-ping"; }

private:
    struct ProcessOutcome {
        int exitCode{-1};   ///< Exit status, -1 if the process could not be started
        std::string output; ///< Combined stdout and stderr
        bool timedOut{false};
    };

    static ProcessOutcome runProcess(const std::vector<std::string>& argv,
                                     std::chrono::milliseconds deadline);

    PingCommand command_;
};

} // namespace pingsweep::infra
