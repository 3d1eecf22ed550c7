#pragma once

#include "core/types/Job.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace pingsweep::infra {

/**
 * @brief Runs named probe jobs on cron schedules inside one process.
 *
 * A steady_timer polls the wall clock; on every tick each enabled job whose
 * rule matches the current minute fires once for that minute. A job never
 * runs concurrently with itself: a fire that arrives while the previous run
 * is still going is dropped and counted, not queued. Distinct jobs run in
 * parallel on the scheduler's own AsioContext (one thread per job plus one
 * for the timer). Exceptions from a run are caught at the job boundary and
 * recorded in the job's state.
 */
class JobScheduler {
public:
    using JobAction = std::function<void(const core::JobDefinition&, std::stop_token)>;

    static constexpr std::chrono::seconds DEFAULT_POLL_INTERVAL{15};
    static constexpr std::chrono::seconds MAX_POLL_INTERVAL{60};

    /**
     * @brief Constructs a scheduler.
     * @param action Work performed for every fire (load, probe, write in production).
     * @param pollInterval Timer period, clamped to [1s, 60s].
     */
    explicit JobScheduler(JobAction action,
                          std::chrono::seconds pollInterval = DEFAULT_POLL_INTERVAL);

    /**
     * @brief Destructor. Stops the timer and waits for running jobs without a limit.
     */
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    /**
     * @brief Registers a job.
     * @return False if the definition is invalid or the name is already taken.
     */
    bool addJob(const core::JobDefinition& job);

    /**
     * @brief Unregisters a job. A run in progress finishes normally.
     *
     * The finishing run does not update a job registered again under the same
     * name; that job is free to start its own run meanwhile.
     */
    bool removeJob(const std::string& name);

    /**
     * @brief Enables or disables a job. Disabled jobs never fire.
     */
    bool enableJob(const std::string& name, bool enabled);

    std::vector<core::JobDefinition> getJobs() const;
    std::optional<core::JobState> getJobState(const std::string& name) const;
    size_t jobCount() const;

    /**
     * @brief Starts the worker pool and the poll timer. No effect if already running.
     */
    void start();

    /**
     * @brief Graceful shutdown.
     *
     * Stops the timer, rejects further fires, signals the stop token passed to
     * running jobs and waits up to `grace` for them to finish.
     *
     * @return True if every job finished in time. False on expiry; the pool is
     *         then abandoned and the caller must terminate the process.
     */
    bool stop(std::chrono::milliseconds grace);

    bool isRunning() const { return running_; }

    /**
     * @brief Evaluates every job against one point in time.
     *
     * Called by the poll timer with the current time; exposed so tests can
     * drive the scheduler deterministically.
     *
     * @return Number of jobs that started a run.
     */
    size_t tick(std::chrono::system_clock::time_point now);

    /**
     * @brief Triggers a run immediately, subject to the same self-exclusion.
     * @return True if a run was started.
     */
    bool runNow(const std::string& name);

    /**
     * @brief Number of job runs currently in progress.
     */
    size_t activeRuns() const;

private:
    struct ScheduledJob {
        core::JobDefinition definition;
        core::JobState state;
        std::optional<int64_t> lastFireMinute; ///< Minutes since epoch of the last fire
        uint64_t generation{0};                ///< Distinguishes re-registrations of a name
    };

    bool fireLocked(ScheduledJob& job, const char* trigger);
    void execute(core::JobDefinition definition, uint64_t generation);
    void scheduleTick();

    JobAction action_;
    std::chrono::seconds pollInterval_;

    std::unique_ptr<AsioContext> context_;
    std::unique_ptr<asio::steady_timer> timer_;

    std::map<std::string, ScheduledJob> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable idle_;
    size_t activeRuns_{0};
    uint64_t nextGeneration_{0};

    std::stop_source stopSource_;
    std::atomic<bool> running_{false};
    std::atomic<bool> accepting_{false};
};

} // namespace pingsweep::infra
