#include "app/RunPipeline.hpp"

#include "core/Errors.hpp"
#include "infrastructure/network/ProbeEngine.hpp"
#include "infrastructure/targets/FileTargetSource.hpp"
#include "infrastructure/targets/QueryTargetSource.hpp"
#include "infrastructure/targets/TargetLoader.hpp"

#include <spdlog/spdlog.h>

namespace pingsweep::app {

RunPipeline::RunPipeline(RuntimeContext& context) : context_(context) {}

std::unique_ptr<core::ITargetSource> RunPipeline::makeSource(const core::TargetSourceSpec& spec,
                                                             bool searchWorkingDirectory) const {
    if (spec.targetFile) {
        auto path = infra::FileTargetSource::resolve(*spec.targetFile, context_.baseDir(),
                                                     searchWorkingDirectory);
        return std::make_unique<infra::FileTargetSource>(path);
    }

    const auto& config = context_.config();
    auto queryName = spec.query.value_or(config.defaultQuery);
    std::filesystem::path queryPath(queryName);
    if (queryPath.is_relative()) {
        queryPath = context_.sqlDir() / queryPath;
    }

    std::filesystem::path inventory;
    if (!config.inventoryDatabase.empty()) {
        inventory = context_.resolve(config.inventoryDatabase);
    }
    return std::make_unique<infra::QueryTargetSource>(inventory, queryPath);
}

RunOutcome RunPipeline::run(const core::TargetSourceSpec& spec,
                            const core::ProbeParameters& parameters,
                            std::optional<std::string> jobName, std::stop_token stopToken,
                            bool searchWorkingDirectory) {
    auto started = std::chrono::steady_clock::now();

    auto source = makeSource(spec, searchWorkingDirectory);
    infra::TargetLoader loader(jobName);
    auto targets = loader.load(*source);

    for (const auto& invalid : targets.invalid) {
        spdlog::warn("Invalid target '{}' on line {} of {}", invalid.candidate,
                     invalid.lineNumber, source->describe());
    }

    infra::ProbeEngine engine(context_.probe());

    RunOutcome outcome;
    outcome.duplicatesDropped = targets.duplicatesDropped;
    outcome.batch = engine.run(targets, parameters, std::move(jobName), stopToken);
    outcome.report = context_.writer().write(outcome.batch);
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return outcome;
}

void RunPipeline::runJob(const core::JobDefinition& job, std::stop_token stopToken) {
    auto outcome = run(job.source, job.parameters, job.name, stopToken, false);

    if (outcome.noValidTargets()) {
        throw core::Error("No valid targets in " + job.source.describe());
    }

    spdlog::info("Job '{}': {} reachable, {} unreachable, {} invalid", job.name,
                 outcome.batch.successCount(), outcome.batch.failureCount(),
                 outcome.batch.invalid.size());
}

} // namespace pingsweep::app
