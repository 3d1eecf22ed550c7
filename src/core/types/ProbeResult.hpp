/**
 * @file ProbeResult.hpp
 * @brief Uniform result record for a single reachability probe.
 *
 * Whatever tool performs the probe, its outcome is normalized into a
 * ProbeResult: either a success with an optional round-trip time, or a
 * failure with a reason.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace pingsweep::core {

/**
 * @brief Why a probe did not receive a reply.
 */
enum class FailureReason : int {
    Timeout = 0,           ///< No reply within the timeout
    Unreachable = 1,       ///< Destination reported unreachable
    ResolutionFailure = 2, ///< Hostname could not be resolved
    ToolError = 3          ///< The probe tool could not run or misbehaved
};

/**
 * @brief Result of one reachability probe against one target.
 *
 * Invariant: a successful result never carries a reason, a failed result
 * always carries a reason and never a latency. A success without latency
 * means the primitive replied but could not report a round-trip time.
 */
struct ProbeResult {
    std::string identifier;                           ///< Target identifier
    std::optional<std::string> label;                 ///< Label copied from the target
    bool success{false};                              ///< Whether a reply was received
    std::optional<std::chrono::microseconds> latency; ///< Round-trip time (success only)
    std::optional<FailureReason> reason;              ///< Failure reason (failure only)
    std::string detail;                               ///< Tool message for failures
    std::chrono::system_clock::time_point timestamp;  ///< When the probe completed

    /**
     * @brief Builds a successful result.
     * @param identifier Target identifier.
     * @param latency Round-trip time, or nullopt if the tool did not report one.
     */
    static ProbeResult reachable(std::string identifier,
                                 std::optional<std::chrono::microseconds> latency);

    /**
     * @brief Builds a failed result.
     * @param identifier Target identifier.
     * @param reason Failure classification.
     * @param detail Optional human-readable detail.
     */
    static ProbeResult unreachable(std::string identifier, FailureReason reason,
                                   std::string detail = {});

    /**
     * @brief Checks the success/latency/reason invariant.
     */
    [[nodiscard]] bool isConsistent() const;

    /**
     * @brief Latency in milliseconds, if known.
     */
    [[nodiscard]] std::optional<double> latencyMs() const;

    /**
     * @brief Text used in the DETAIL column of run logs.
     *
     * Successes give "12.345ms" or "N/A"; failures give the reason string,
     * followed by ": detail" when a detail is present.
     */
    [[nodiscard]] std::string detailText() const;

    bool operator==(const ProbeResult& other) const = default;
};

/**
 * @brief Converts a failure reason to its log string (e.g. "timeout").
 */
std::string failureReasonToString(FailureReason reason);

/**
 * @brief Parses a log string back to a failure reason (unknown → ToolError).
 */
FailureReason failureReasonFromString(const std::string& str);

} // namespace pingsweep::core
