#include "infrastructure/network/ProbeEngine.hpp"

#include "core/Errors.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace pingsweep::infra {

ProbeEngine::ProbeEngine(std::shared_ptr<core::IReachabilityProbe> probe)
    : probe_(std::move(probe)) {
    if (!probe_) {
        throw core::ConfigError("ProbeEngine requires a reachability probe");
    }
}

core::ProbeBatch ProbeEngine::run(const core::TargetList& targets,
                                  const core::ProbeParameters& parameters,
                                  std::optional<std::string> jobName,
                                  std::stop_token stopToken) const {
    if (!parameters.isValid()) {
        throw core::ConfigError("Invalid probe parameters: timeout, count and workers must be >= 1");
    }

    auto batch = core::ProbeBatch::create(std::move(jobName), parameters);
    batch.invalid = targets.invalid;

    const auto& list = targets.targets;
    if (list.empty()) {
        return batch;
    }

    auto threadCount = std::min(static_cast<size_t>(parameters.workers), list.size());
    core::ProbeOptions options{.timeout = parameters.timeout, .count = parameters.count};

    spdlog::info("Probing {} targets with {} workers via {} (timeout {}s, count {})",
                 list.size(), threadCount, probe_->name(), parameters.timeout.count(),
                 parameters.count);

    std::vector<core::ProbeResult> slots(list.size());
    {
        asio::thread_pool pool(threadCount);
        for (size_t i = 0; i < list.size(); ++i) {
            asio::post(pool, [this, &slots, &list, &options, stopToken, i]() {
                slots[i] = probeOne(list[i], options, stopToken);
            });
        }
        pool.join();
    }

    batch.results = std::move(slots);

    spdlog::info("Probe run finished: {} reachable, {} unreachable", batch.successCount(),
                 batch.failureCount());
    return batch;
}

core::ProbeResult ProbeEngine::probeOne(const core::Target& target,
                                        const core::ProbeOptions& options,
                                        std::stop_token stopToken) const {
    core::ProbeResult result;

    if (stopToken.stop_requested()) {
        result = core::ProbeResult::unreachable(target.identifier, core::FailureReason::ToolError,
                                                "cancelled before start");
    } else {
        try {
            result = probe_->probe(target.identifier, options, stopToken);
        } catch (const std::exception& e) {
            spdlog::warn("Probe of {} raised: {}", target.identifier, e.what());
            result = core::ProbeResult::unreachable(target.identifier,
                                                    core::FailureReason::ToolError, e.what());
        } catch (...) {
            spdlog::warn("Probe of {} raised a non-standard exception", target.identifier);
            result = core::ProbeResult::unreachable(target.identifier,
                                                    core::FailureReason::ToolError,
                                                    "unknown probe error");
        }
    }

    if (!result.isConsistent()) {
        spdlog::debug("Normalizing inconsistent result for {}", target.identifier);
        if (result.success) {
            result.reason.reset();
        } else {
            result.latency.reset();
            if (!result.reason) {
                result.reason = core::FailureReason::ToolError;
            }
        }
    }

    result.identifier = target.identifier;
    result.label = target.label;
    result.timestamp = std::chrono::system_clock::now();
    return result;
}

} // namespace pingsweep::infra
