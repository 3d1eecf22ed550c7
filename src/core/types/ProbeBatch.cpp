#include "core/types/ProbeBatch.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace pingsweep::core {

bool ProbeParameters::isValid() const {
    return timeout.count() >= 1 && count >= 1 && workers >= 1;
}

ProbeBatch ProbeBatch::create(std::optional<std::string> jobName, ProbeParameters parameters) {
    ProbeBatch batch;
    batch.timestamp = std::chrono::system_clock::now();
    batch.jobName = std::move(jobName);
    batch.parameters = parameters;
    return batch;
}

std::size_t ProbeBatch::successCount() const {
    return static_cast<std::size_t>(std::count_if(
        results.begin(), results.end(), [](const ProbeResult& r) { return r.success; }));
}

std::size_t ProbeBatch::failureCount() const {
    return results.size() - successCount();
}

bool ProbeBatch::allReachable() const {
    return std::all_of(results.begin(), results.end(),
                       [](const ProbeResult& r) { return r.success; });
}

std::string ProbeBatch::timestampTag() const {
    auto time = std::chrono::system_clock::to_time_t(timestamp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      timestamp.time_since_epoch()) %
                  1000;

    std::tm tm{};
    localtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &tm);

    std::ostringstream oss;
    oss << buffer << '_' << std::setw(3) << std::setfill('0') << millis.count();
    return oss.str();
}

} // namespace pingsweep::core
