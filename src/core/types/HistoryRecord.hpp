/**
 * @file HistoryRecord.hpp
 * @brief Per-target reliability statistics derived from run-log history.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pingsweep::core {

/**
 * @brief Reliability bucket of a target across all observed runs.
 */
enum class Classification : int {
    Always = 0,   ///< Every observation was a success
    Never = 1,    ///< Every observation was a failure
    Sometimes = 2 ///< Mixed observations
};

/**
 * @brief Aggregated observations for one identifier.
 */
struct HistoryRecord {
    std::string identifier;
    int64_t total{0};     ///< Observations across all run logs
    int64_t successes{0}; ///< Observations found in success logs

    [[nodiscard]] int64_t failures() const { return total - successes; }

    /**
     * @brief Derives the classification from the counts.
     *
     * Always when every observation succeeded, Never when none did,
     * Sometimes otherwise.
     */
    [[nodiscard]] Classification classification() const;

    /**
     * @brief Success rate in percent, only for Sometimes records.
     */
    [[nodiscard]] std::optional<double> successRate() const;

    bool operator==(const HistoryRecord& other) const = default;
};

std::string classificationToString(Classification classification);

} // namespace pingsweep::core
