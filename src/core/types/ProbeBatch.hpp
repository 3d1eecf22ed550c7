/**
 * @file ProbeBatch.hpp
 * @brief Probe parameters and the batch produced by one engine invocation.
 */

#pragma once

#include "core/types/ProbeResult.hpp"
#include "core/types/Target.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pingsweep::core {

/**
 * @brief Parameters forwarded to every probe of a run.
 */
struct ProbeParameters {
    std::chrono::seconds timeout{3}; ///< Per-probe reply timeout
    int count{1};                    ///< Echo requests per probe, forwarded to the primitive
    int workers{10};                 ///< Maximum concurrent probes

    /**
     * @brief Validates the parameters (all values at least one).
     */
    [[nodiscard]] bool isValid() const;

    bool operator==(const ProbeParameters& other) const = default;
};

/**
 * @brief All results of one probe run.
 *
 * The timestamp is fixed when the batch is created; every file derived from
 * the batch is named after it.
 */
struct ProbeBatch {
    std::vector<ProbeResult> results;     ///< One result per target, in submission order
    std::vector<InvalidTarget> invalid;   ///< Candidates rejected before probing
    std::chrono::system_clock::time_point timestamp; ///< Batch creation time
    std::optional<std::string> jobName;   ///< Originating job, if scheduled
    ProbeParameters parameters;           ///< Parameters the run used

    /**
     * @brief Creates an empty batch stamped with the current time.
     */
    static ProbeBatch create(std::optional<std::string> jobName, ProbeParameters parameters);

    [[nodiscard]] std::size_t successCount() const;
    [[nodiscard]] std::size_t failureCount() const;

    /**
     * @brief True iff every result in the batch succeeded.
     */
    [[nodiscard]] bool allReachable() const;

    /**
     * @brief Local-time tag "YYYYMMDD_HHMMSS_mmm" derived from the timestamp.
     */
    [[nodiscard]] std::string timestampTag() const;
};

} // namespace pingsweep::core
