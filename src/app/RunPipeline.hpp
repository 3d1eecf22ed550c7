#pragma once

#include "app/RuntimeContext.hpp"
#include "core/services/ITargetSource.hpp"
#include "core/types/Job.hpp"
#include "core/types/ProbeBatch.hpp"
#include "infrastructure/storage/RunLogWriter.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace pingsweep::app {

/**
 * @brief Everything one probe run produced.
 */
struct RunOutcome {
    core::ProbeBatch batch;
    infra::RunLogReport report;
    size_t duplicatesDropped{0};
    std::chrono::milliseconds elapsed{0};

    /**
     * @brief True when the source yielded no valid target, so nothing was probed.
     */
    [[nodiscard]] bool noValidTargets() const { return batch.results.empty(); }
};

/**
 * @brief One run: load targets, probe them, write the run logs.
 *
 * Shared by the one-shot check command and by every scheduled job.
 */
class RunPipeline {
public:
    explicit RunPipeline(RuntimeContext& context);

    /**
     * @brief Builds the target source a TargetSourceSpec describes.
     * @param searchWorkingDirectory Also try relative file paths against the
     *        working directory (one-shot runs only).
     */
    std::unique_ptr<core::ITargetSource> makeSource(const core::TargetSourceSpec& spec,
                                                    bool searchWorkingDirectory) const;

    /**
     * @brief Executes one run.
     * @throws core::SourceNotFoundError, core::EmptySourceError from the source.
     */
    RunOutcome run(const core::TargetSourceSpec& spec, const core::ProbeParameters& parameters,
                   std::optional<std::string> jobName, std::stop_token stopToken,
                   bool searchWorkingDirectory);

    /**
     * @brief Scheduler action for a job.
     * @throws core::Error when the job's source yields no valid target.
     */
    void runJob(const core::JobDefinition& job, std::stop_token stopToken);

private:
    RuntimeContext& context_;
};

} // namespace pingsweep::app
