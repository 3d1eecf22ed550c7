#include "infrastructure/scheduler/JobScheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>

namespace pingsweep::infra {

namespace {

int64_t minuteOf(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::minutes>(tp.time_since_epoch()).count();
}

std::string formatLocal(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M", &tm);
    return buffer;
}

} // namespace

JobScheduler::JobScheduler(JobAction action, std::chrono::seconds pollInterval)
    : action_(std::move(action)),
      pollInterval_(std::clamp(pollInterval, std::chrono::seconds(1), MAX_POLL_INTERVAL)) {
    spdlog::debug("JobScheduler initialized (poll every {}s)", pollInterval_.count());
}

JobScheduler::~JobScheduler() {
    if (!running_) {
        return;
    }

    {
        std::lock_guard lock(mutex_);
        accepting_ = false;
        if (timer_) {
            timer_->cancel();
        }
    }
    stopSource_.request_stop();

    std::unique_lock lock(mutex_);
    idle_.wait(lock, [this]() { return activeRuns_ == 0; });
    lock.unlock();

    context_->stop();
    running_ = false;
}

bool JobScheduler::addJob(const core::JobDefinition& job) {
    if (!job.isValid()) {
        spdlog::warn("Rejecting invalid job definition '{}'", job.name);
        return false;
    }

    std::lock_guard lock(mutex_);
    if (jobs_.contains(job.name)) {
        spdlog::warn("Job '{}' already exists, keeping the first definition", job.name);
        return false;
    }

    ScheduledJob scheduled;
    scheduled.definition = job;
    scheduled.state.nextRunAt = job.schedule.nextFireAfter(std::chrono::system_clock::now());
    scheduled.generation = ++nextGeneration_;
    jobs_.emplace(job.name, std::move(scheduled));

    spdlog::info("Added job '{}': {} on '{}' (timeout {}s, count {}, workers {})", job.name,
                 job.source.describe(), job.schedule.expression(),
                 job.parameters.timeout.count(), job.parameters.count, job.parameters.workers);
    return true;
}

bool JobScheduler::removeJob(const std::string& name) {
    std::lock_guard lock(mutex_);
    if (jobs_.erase(name) == 0) {
        return false;
    }
    spdlog::info("Removed job '{}'", name);
    return true;
}

bool JobScheduler::enableJob(const std::string& name, bool enabled) {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(name);
    if (it == jobs_.end()) {
        return false;
    }
    it->second.definition.enabled = enabled;
    spdlog::info("Job '{}' {}", name, enabled ? "enabled" : "disabled");
    return true;
}

std::vector<core::JobDefinition> JobScheduler::getJobs() const {
    std::lock_guard lock(mutex_);
    std::vector<core::JobDefinition> result;
    result.reserve(jobs_.size());
    for (const auto& [name, job] : jobs_) {
        result.push_back(job.definition);
    }
    return result;
}

std::optional<core::JobState> JobScheduler::getJobState(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(name);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

size_t JobScheduler::jobCount() const {
    std::lock_guard lock(mutex_);
    return jobs_.size();
}

size_t JobScheduler::activeRuns() const {
    std::lock_guard lock(mutex_);
    return activeRuns_;
}

void JobScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }

    {
        std::lock_guard lock(mutex_);
        timer_.reset();
        context_ = std::make_unique<AsioContext>(std::max<size_t>(jobs_.size(), 1) + 1);
        timer_ = std::make_unique<asio::steady_timer>(context_->getContext());
        stopSource_ = std::stop_source();
        accepting_ = true;

        auto now = std::chrono::system_clock::now();
        for (auto& [name, job] : jobs_) {
            job.state.nextRunAt = job.definition.schedule.nextFireAfter(now);
            if (!job.definition.enabled) {
                spdlog::info("Job '{}' is disabled", name);
            } else if (job.state.nextRunAt) {
                spdlog::info("Job '{}' next run at {}", name, formatLocal(*job.state.nextRunAt));
            } else {
                spdlog::warn("Job '{}' has a schedule that never fires", name);
            }
        }
    }

    context_->start();
    scheduleTick();

    spdlog::info("JobScheduler started with {} jobs", jobCount());
}

bool JobScheduler::stop(std::chrono::milliseconds grace) {
    if (!running_) {
        return true;
    }

    {
        std::lock_guard lock(mutex_);
        accepting_ = false;
        if (timer_) {
            timer_->cancel();
        }
    }
    stopSource_.request_stop();

    std::unique_lock lock(mutex_);
    if (activeRuns_ > 0) {
        spdlog::info("Waiting up to {}ms for {} running jobs", grace.count(), activeRuns_);
    }
    bool finished = idle_.wait_for(lock, grace, [this]() { return activeRuns_ == 0; });
    auto stillRunning = activeRuns_;
    lock.unlock();

    running_ = false;
    if (!finished) {
        spdlog::critical("Shutdown timed out with {} jobs still running", stillRunning);
        context_->abandon();
        return false;
    }

    context_->stop();
    spdlog::info("JobScheduler stopped");
    return true;
}

void JobScheduler::scheduleTick() {
    std::lock_guard lock(mutex_);
    if (!accepting_) {
        return;
    }

    timer_->expires_after(pollInterval_);
    timer_->async_wait([this](const asio::error_code& ec) {
        if (ec || !accepting_) {
            return;
        }
        tick(std::chrono::system_clock::now());
        scheduleTick();
    });
}

size_t JobScheduler::tick(std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    if (!accepting_) {
        return 0;
    }

    auto minute = minuteOf(now);
    size_t fired = 0;

    for (auto& [name, job] : jobs_) {
        if (!job.definition.enabled || job.lastFireMinute == minute ||
            !job.definition.schedule.matches(now)) {
            continue;
        }

        job.lastFireMinute = minute;
        if (fireLocked(job, "schedule")) {
            ++fired;
        }
        job.state.nextRunAt = job.definition.schedule.nextFireAfter(now);
    }

    return fired;
}

bool JobScheduler::runNow(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(name);
    if (it == jobs_.end()) {
        spdlog::warn("Job not found for immediate run: {}", name);
        return false;
    }
    if (!accepting_) {
        spdlog::warn("Scheduler is not running, cannot run job '{}'", name);
        return false;
    }
    return fireLocked(it->second, "manual trigger");
}

bool JobScheduler::fireLocked(ScheduledJob& job, const char* trigger) {
    const auto& name = job.definition.name;

    if (job.state.running) {
        ++job.state.droppedFires;
        spdlog::warn("Job '{}' is still running, dropping {} fire ({} dropped so far)", name,
                     trigger, job.state.droppedFires);
        return false;
    }

    job.state.running = true;
    ++activeRuns_;

    spdlog::info("Starting job '{}' ({})", name, trigger);
    context_->post([this, definition = job.definition, generation = job.generation]() mutable {
        execute(std::move(definition), generation);
    });
    return true;
}

void JobScheduler::execute(core::JobDefinition definition, uint64_t generation) {
    auto startedAt = std::chrono::system_clock::now();
    std::optional<std::string> error;

    try {
        action_(definition, stopSource_.get_token());
    } catch (const std::exception& e) {
        error = e.what();
    } catch (...) {
        error = "unknown error";
    }

    auto finishedAt = std::chrono::system_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(finishedAt - startedAt);

    if (error) {
        spdlog::error("Job '{}' failed after {}ms: {}", definition.name, elapsed.count(), *error);
    } else {
        spdlog::info("Job '{}' finished in {}ms", definition.name, elapsed.count());
    }

    {
        std::lock_guard lock(mutex_);
        // A job removed and added again while this run was going is a new entry
        auto it = jobs_.find(definition.name);
        if (it != jobs_.end() && it->second.generation == generation) {
            auto& state = it->second.state;
            state.running = false;
            state.lastRunAt = startedAt;
            state.lastFinishedAt = finishedAt;
            ++state.runCount;
            if (error) {
                ++state.failureCount;
                state.lastError = error;
            }
        }
        --activeRuns_;
    }
    idle_.notify_all();
}

} // namespace pingsweep::infra
