/**
 * @file IReachabilityProbe.hpp
 * @brief Interface for the external reachability primitive.
 *
 * The probe engine depends only on this capability: given an identifier,
 * a timeout and a packet count, report success with an optional latency or
 * failure with a reason. Implementations may spawn the system ping tool or
 * send ICMP echo requests themselves.
 */

#pragma once

#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <stop_token>
#include <string>

namespace pingsweep::core {

/**
 * @brief Options forwarded unchanged to the primitive for every call.
 */
struct ProbeOptions {
    std::chrono::seconds timeout{3}; ///< Time to wait for a reply
    int count{1};                    ///< Number of echo requests to send
};

/**
 * @brief Reachability check capability.
 *
 * Implementations must be safe to call from several worker threads at once
 * and must never throw for per-target problems; those are reported as a
 * failed ProbeResult.
 */
class IReachabilityProbe {
public:
    virtual ~IReachabilityProbe() = default;

    /**
     * @brief Probes one target.
     * @param identifier IP literal or hostname.
     * @param options Timeout and count for this call.
     * @param stopToken Signalled on process shutdown; implementations may use it
     *                  to avoid starting work, not to abort a call in flight.
     * @return Result with identifier and outcome filled in.
     */
    virtual ProbeResult probe(const std::string& identifier, const ProbeOptions& options,
                              std::stop_token stopToken) = 0;

    /**
     * @brief Short name of the implementation for log messages.
     */
    virtual std::string name() const = 0;
};

} // namespace pingsweep::core
