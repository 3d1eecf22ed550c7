#pragma once

#include "core/services/IReachabilityProbe.hpp"
#include "core/types/ProbeBatch.hpp"
#include "core/types/Target.hpp"

#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace pingsweep::infra {

/**
 * @brief Fans a target list out across a bounded worker pool.
 *
 * Every invocation creates an asio::thread_pool with min(workers, targets)
 * threads, posts exactly one primitive call per target and joins the pool.
 * Results land in a pre-sized slot vector, so the batch keeps the order in
 * which targets were submitted regardless of completion order.
 */
class ProbeEngine {
public:
    /**
     * @brief Constructs an engine around a reachability primitive.
     * @param probe Primitive shared by all workers; must be thread-safe.
     */
    explicit ProbeEngine(std::shared_ptr<core::IReachabilityProbe> probe);

    /**
     * @brief Probes every target of the list.
     * @param targets Loaded targets; the invalid set is copied into the batch.
     * @param parameters Timeout, count and worker bound for this run.
     * @param jobName Job the batch belongs to, if any.
     * @param stopToken Shutdown signal; probes not yet started when it fires are
     *                  recorded as tool errors, probes in flight complete.
     * @return Batch with one result per target in submission order.
     * @throws core::ConfigError if the parameters are invalid.
     */
    core::ProbeBatch run(const core::TargetList& targets, const core::ProbeParameters& parameters,
                         std::optional<std::string> jobName = std::nullopt,
                         std::stop_token stopToken = {}) const;

private:
    core::ProbeResult probeOne(const core::Target& target, const core::ProbeOptions& options,
                               std::stop_token stopToken) const;

    std::shared_ptr<core::IReachabilityProbe> probe_;
};

} // namespace pingsweep::infra
