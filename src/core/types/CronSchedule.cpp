#include "core/types/CronSchedule.hpp"

#include "core/Errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <vector>

namespace pingsweep::core {

namespace {

constexpr std::array<const char*, 12> MONTH_NAMES = {"jan", "feb", "mar", "apr", "may", "jun",
                                                     "jul", "aug", "sep", "oct", "nov", "dec"};
constexpr std::array<const char*, 7> WEEKDAY_NAMES = {"sun", "mon", "tue", "wed",
                                                      "thu", "fri", "sat"};

// Upper bound on calendar steps in nextFireAfter(). About forty steps per
// year, so this spans far more than the eight-year gap between two Feb 29s.
constexpr int MAX_SEARCH_STEPS = 20000;

struct FieldSpec {
    const char* name;
    int min;
    int max;
    const char* const* names; // optional symbolic names, indexed from namesBase
    std::size_t nameCount;
    int namesBase;
};

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(text);
    while (std::getline(iss, part, separator)) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == separator) {
        parts.emplace_back();
    }
    return parts;
}

int parseValue(const std::string& token, const FieldSpec& spec) {
    if (token.empty()) {
        throw CronParseError(std::string("Empty value in ") + spec.name + " field");
    }

    if (std::all_of(token.begin(), token.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
        int value = 0;
        try {
            value = std::stoi(token);
        } catch (const std::exception&) {
            throw CronParseError(std::string("Value out of range in ") + spec.name +
                                 " field: " + token);
        }
        if (value < spec.min || value > spec.max) {
            throw CronParseError(std::string("Value ") + token + " out of range for " +
                                 spec.name + " field");
        }
        return value;
    }

    std::string lower = token;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (std::size_t i = 0; i < spec.nameCount; ++i) {
        if (lower == spec.names[i]) {
            return static_cast<int>(i) + spec.namesBase;
        }
    }
    throw CronParseError(std::string("Invalid value in ") + spec.name + " field: " + token);
}

template <std::size_t N>
std::bitset<N> parseField(const std::string& field, const FieldSpec& spec, bool wrapSeven) {
    std::bitset<N> bits;

    for (const auto& item : split(field, ',')) {
        std::string base = item;
        int step = 1;

        auto slash = item.find('/');
        if (slash != std::string::npos) {
            base = item.substr(0, slash);
            auto stepText = item.substr(slash + 1);
            if (stepText.empty() ||
                !std::all_of(stepText.begin(), stepText.end(),
                             [](unsigned char c) { return std::isdigit(c) != 0; })) {
                throw CronParseError(std::string("Invalid step in ") + spec.name +
                                     " field: " + item);
            }
            try {
                step = std::stoi(stepText);
            } catch (const std::exception&) {
                throw CronParseError(std::string("Step out of range in ") + spec.name +
                                     " field: " + item);
            }
            if (step < 1) {
                throw CronParseError(std::string("Step must be positive in ") + spec.name +
                                     " field: " + item);
            }
        }

        int first = spec.min;
        int last = spec.max;
        if (base == "*") {
            // full range
        } else if (auto dash = base.find('-'); dash != std::string::npos) {
            first = parseValue(base.substr(0, dash), spec);
            last = parseValue(base.substr(dash + 1), spec);
            if (first > last) {
                throw CronParseError(std::string("Descending range in ") + spec.name +
                                     " field: " + item);
            }
        } else {
            first = parseValue(base, spec);
            last = slash != std::string::npos ? spec.max : first;
        }

        for (int value = first; value <= last; value += step) {
            int index = (wrapSeven && value == 7) ? 0 : value;
            bits.set(static_cast<std::size_t>(index));
        }
    }

    return bits;
}

void normalize(std::tm& tm) {
    tm.tm_isdst = -1;
    std::mktime(&tm);
}

} // namespace

CronSchedule CronSchedule::parse(const std::string& expression) {
    std::istringstream iss(expression);
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }

    if (fields.size() != 5) {
        throw CronParseError("Invalid cron schedule '" + expression + "' (expected 5 fields, got " +
                             std::to_string(fields.size()) + ")");
    }

    static const FieldSpec minuteSpec{"minute", 0, 59, nullptr, 0, 0};
    static const FieldSpec hourSpec{"hour", 0, 23, nullptr, 0, 0};
    static const FieldSpec daySpec{"day-of-month", 1, 31, nullptr, 0, 0};
    static const FieldSpec monthSpec{"month", 1, 12, MONTH_NAMES.data(), MONTH_NAMES.size(), 1};
    static const FieldSpec weekdaySpec{"day-of-week", 0, 7, WEEKDAY_NAMES.data(),
                                       WEEKDAY_NAMES.size(), 0};

    CronSchedule schedule;
    schedule.expression_ = expression;
    schedule.minutes_ = parseField<60>(fields[0], minuteSpec, false);
    schedule.hours_ = parseField<24>(fields[1], hourSpec, false);
    schedule.daysOfMonth_ = parseField<32>(fields[2], daySpec, false);
    schedule.months_ = parseField<13>(fields[3], monthSpec, false);
    schedule.daysOfWeek_ = parseField<7>(fields[4], weekdaySpec, true);
    return schedule;
}

bool CronSchedule::matches(const std::tm& localTime) const {
    return minutes_.test(static_cast<std::size_t>(localTime.tm_min)) &&
           hours_.test(static_cast<std::size_t>(localTime.tm_hour)) &&
           daysOfMonth_.test(static_cast<std::size_t>(localTime.tm_mday)) &&
           months_.test(static_cast<std::size_t>(localTime.tm_mon + 1)) &&
           daysOfWeek_.test(static_cast<std::size_t>(localTime.tm_wday));
}

bool CronSchedule::matches(std::chrono::system_clock::time_point timePoint) const {
    auto time = std::chrono::system_clock::to_time_t(timePoint);
    std::tm tm{};
    localtime_r(&time, &tm);
    return matches(tm);
}

std::optional<std::chrono::system_clock::time_point> CronSchedule::nextFireAfter(
    std::chrono::system_clock::time_point after) const {
    auto time = std::chrono::system_clock::to_time_t(after);
    std::tm tm{};
    localtime_r(&time, &tm);
    tm.tm_sec = 0;
    tm.tm_min += 1;
    normalize(tm);

    for (int step = 0; step < MAX_SEARCH_STEPS; ++step) {
        if (!months_.test(static_cast<std::size_t>(tm.tm_mon + 1))) {
            tm.tm_mon += 1;
            tm.tm_mday = 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
            normalize(tm);
            continue;
        }
        if (!daysOfMonth_.test(static_cast<std::size_t>(tm.tm_mday)) ||
            !daysOfWeek_.test(static_cast<std::size_t>(tm.tm_wday))) {
            tm.tm_mday += 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
            normalize(tm);
            continue;
        }
        if (!hours_.test(static_cast<std::size_t>(tm.tm_hour))) {
            tm.tm_hour += 1;
            tm.tm_min = 0;
            normalize(tm);
            continue;
        }
        if (!minutes_.test(static_cast<std::size_t>(tm.tm_min))) {
            tm.tm_min += 1;
            normalize(tm);
            continue;
        }

        tm.tm_isdst = -1;
        return std::chrono::system_clock::from_time_t(std::mktime(&tm));
    }

    return std::nullopt;
}

} // namespace pingsweep::core
