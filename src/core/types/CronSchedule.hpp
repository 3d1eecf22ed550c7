/**
 * @file CronSchedule.hpp
 * @brief Five-field recurrence rule (minute hour day-of-month month day-of-week).
 */

#pragma once

#include <bitset>
#include <chrono>
#include <ctime>
#include <optional>
#include <string>

namespace pingsweep::core {

/**
 * @brief Parsed cron expression.
 *
 * Each field is a comma-separated list of `*`, `N` or `A-B`, each optionally
 * followed by `/S`. Months accept `jan`..`dec`, days of week `sun`..`sat`
 * (0 and 7 are both Sunday). A point in time matches when all five fields
 * match; day-of-month and day-of-week are combined with AND.
 */
class CronSchedule {
public:
    /**
     * @brief Parses a five-field expression.
     * @param expression Expression such as "*\/5 * * * 1-5".
     * @return The parsed schedule.
     * @throws CronParseError if the expression is malformed.
     */
    static CronSchedule parse(const std::string& expression);

    /**
     * @brief Checks a broken-down local time against all five fields.
     */
    [[nodiscard]] bool matches(const std::tm& localTime) const;

    /**
     * @brief Checks a time point (converted to local time) against the rule.
     */
    [[nodiscard]] bool matches(std::chrono::system_clock::time_point timePoint) const;

    /**
     * @brief Finds the first matching minute strictly after the given time.
     * @return The next fire time, or nullopt if the rule never matches
     *         (e.g. "0 0 31 2 *").
     */
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> nextFireAfter(
        std::chrono::system_clock::time_point after) const;

    [[nodiscard]] const std::string& expression() const { return expression_; }

    bool operator==(const CronSchedule& other) const = default;

private:
    std::string expression_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> daysOfMonth_; // index 1..31
    std::bitset<13> months_;      // index 1..12
    std::bitset<7> daysOfWeek_;   // 0 = Sunday
};

} // namespace pingsweep::core
