/**
 * @file Job.hpp
 * @brief Scheduled probe job definitions and scheduler bookkeeping.
 */

#pragma once

#include "core/types/CronSchedule.hpp"
#include "core/types/ProbeBatch.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace pingsweep::core {

/**
 * @brief Where a job (or a one-shot run) gets its targets from.
 *
 * Exactly one of targetFile and query is set. When neither is configured the
 * job uses the default inventory query.
 */
struct TargetSourceSpec {
    std::optional<std::string> targetFile; ///< Path to a target-list file
    std::optional<std::string> query;      ///< SQL file name run against the inventory

    [[nodiscard]] bool isFile() const { return targetFile.has_value(); }

    /**
     * @brief Human-readable description used in log messages.
     */
    [[nodiscard]] std::string describe() const;

    bool operator==(const TargetSourceSpec& other) const = default;
};

/**
 * @brief A named, independently scheduled recurring probe run.
 */
struct JobDefinition {
    std::string name;            ///< Unique job name
    TargetSourceSpec source;     ///< Target source for each run
    ProbeParameters parameters;  ///< Probe parameters for each run
    CronSchedule schedule;       ///< Recurrence rule
    bool enabled{true};          ///< Disabled jobs never fire

    /**
     * @brief Validates the definition (name, exclusive source, parameters).
     */
    [[nodiscard]] bool isValid() const;

    bool operator==(const JobDefinition& other) const = default;
};

/**
 * @brief Scheduler-owned runtime state of a job.
 */
struct JobState {
    bool running{false};
    std::optional<std::chrono::system_clock::time_point> lastRunAt;      ///< Start of the last completed run
    std::optional<std::chrono::system_clock::time_point> lastFinishedAt; ///< End of the last completed run
    std::optional<std::chrono::system_clock::time_point> nextRunAt;      ///< Next matching minute
    std::optional<std::string> lastError;  ///< Message of the last failed run
    int64_t runCount{0};                   ///< Completed runs, successful or not
    int64_t failureCount{0};               ///< Runs that raised an error
    int64_t droppedFires{0};               ///< Fires skipped because the job was running
};

} // namespace pingsweep::core
