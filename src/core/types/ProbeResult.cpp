#include "core/types/ProbeResult.hpp"

#include <iomanip>
#include <sstream>

namespace pingsweep::core {

ProbeResult ProbeResult::reachable(std::string identifier,
                                   std::optional<std::chrono::microseconds> latency) {
    ProbeResult result;
    result.identifier = std::move(identifier);
    result.success = true;
    result.latency = latency;
    result.timestamp = std::chrono::system_clock::now();
    return result;
}

ProbeResult ProbeResult::unreachable(std::string identifier, FailureReason reason,
                                     std::string detail) {
    ProbeResult result;
    result.identifier = std::move(identifier);
    result.success = false;
    result.reason = reason;
    result.detail = std::move(detail);
    result.timestamp = std::chrono::system_clock::now();
    return result;
}

bool ProbeResult::isConsistent() const {
    if (success) {
        return !reason.has_value();
    }
    return reason.has_value() && !latency.has_value();
}

std::optional<double> ProbeResult::latencyMs() const {
    if (!latency) {
        return std::nullopt;
    }
    return static_cast<double>(latency->count()) / 1000.0;
}

std::string ProbeResult::detailText() const {
    if (success) {
        auto ms = latencyMs();
        if (!ms) {
            return "N/A";
        }
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << *ms << "ms";
        return oss.str();
    }

    std::string text = failureReasonToString(reason.value_or(FailureReason::ToolError));
    if (!detail.empty()) {
        text += ": " + detail;
    }
    return text;
}

std::string failureReasonToString(FailureReason reason) {
    switch (reason) {
    case FailureReason::Timeout:
        return "timeout";
    case FailureReason::Unreachable:
        return "unreachable";
    case FailureReason::ResolutionFailure:
        return "resolution-failure";
    case FailureReason::ToolError:
        return "tool-error";
    }
    return "tool-error";
}

FailureReason failureReasonFromString(const std::string& str) {
    if (str == "timeout")
        return FailureReason::Timeout;
    if (str == "unreachable")
        return FailureReason::Unreachable;
    if (str == "resolution-failure")
        return FailureReason::ResolutionFailure;
    return FailureReason::ToolError;
}

} // namespace pingsweep::core
