#include <catch2/catch_test_macros.hpp>

#include "app/RunPipeline.hpp"
#include "app/RuntimeContext.hpp"
#include "core/services/IReachabilityProbe.hpp"
#include "infrastructure/scheduler/JobScheduler.hpp"

#include <filesystem>
#include <fstream>
#include <thread>

using namespace pingsweep::app;
using namespace pingsweep::core;
using namespace pingsweep::infra;
using namespace std::chrono_literals;

namespace {

class AlwaysUpProbe : public IReachabilityProbe {
public:
    ProbeResult probe(const std::string& identifier, const ProbeOptions&,
                      std::stop_token) override {
        return ProbeResult::reachable(identifier, std::chrono::microseconds(800));
    }

    std::string name() const override { return "always-up"; }
};

class TestDaemonDir {
public:
    TestDaemonDir() : base_(std::filesystem::temp_directory_path() / "pingsweep_jobs_test") {
        std::filesystem::remove_all(base_);
        std::filesystem::create_directories(base_ / "config");

        std::ofstream config(base_ / "config" / "pingsweep.json");
        config << R"({
            "paths": {"results_dir": "logs"},
            "logging": {"level": "warn", "file": ""},
            "jobs": [
                {"name": "core", "target_file": "core.txt", "schedule": "*/5 * * * *"},
                {"name": "junk", "target_file": "junk.txt", "schedule": "*/5 * * * *"},
                {"name": "gone", "target_file": "gone.txt", "schedule": "*/5 * * * *"}
            ]
        })";
        config.close();

        std::ofstream(base_ / "config" / "core.txt") << "8.8.8.8\n1.1.1.1 cloudflare\n";
        std::ofstream(base_ / "config" / "junk.txt") << "bad..ip\n";
    }

    ~TestDaemonDir() { std::filesystem::remove_all(base_); }

    std::vector<std::string> logFiles() const {
        std::vector<std::string> names;
        if (!std::filesystem::exists(base_ / "logs")) {
            return names;
        }
        for (const auto& entry : std::filesystem::directory_iterator(base_ / "logs")) {
            names.push_back(entry.path().filename().string());
        }
        return names;
    }

    const std::filesystem::path& base() const { return base_; }

private:
    std::filesystem::path base_;
};

template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

} // namespace

TEST_CASE("Scheduled jobs write tagged run logs", "[Integration][Scheduler]") {
    TestDaemonDir dir;
    RuntimeContext context(RuntimeOptions{
        .baseDir = dir.base(), .fileLogging = false, .probe = std::make_shared<AlwaysUpProbe>()});

    REQUIRE(context.config().jobs.size() == 3);

    RunPipeline pipeline(context);
    JobScheduler scheduler(
        [&pipeline](const JobDefinition& job, std::stop_token stopToken) {
            pipeline.runJob(job, stopToken);
        },
        60s);
    for (const auto& job : context.config().jobs) {
        REQUIRE(scheduler.addJob(job));
    }
    scheduler.start();

    SECTION("A healthy job produces a success log with its name") {
        REQUIRE(scheduler.runNow("core"));
        REQUIRE(eventually([&]() { return scheduler.getJobState("core")->runCount == 1; }));

        auto state = scheduler.getJobState("core");
        REQUIRE(state->failureCount == 0);
        REQUIRE_FALSE(state->lastError);

        auto files = dir.logFiles();
        REQUIRE(files.size() == 1);
        REQUIRE(files[0].ends_with("_core_successful.txt"));
    }

    SECTION("A job without valid targets records the failure and keeps its schedule") {
        REQUIRE(scheduler.runNow("junk"));
        REQUIRE(eventually([&]() { return scheduler.getJobState("junk")->runCount == 1; }));

        auto state = scheduler.getJobState("junk");
        REQUIRE(state->failureCount == 1);
        REQUIRE(state->lastError == "No valid targets in file 'junk.txt'");
        REQUIRE(state->nextRunAt);

        auto files = dir.logFiles();
        REQUIRE(files.size() == 1);
        REQUIRE(files[0].ends_with("_junk_invalid.txt"));
    }

    SECTION("A missing source file is reported on the job") {
        REQUIRE(scheduler.runNow("gone"));
        REQUIRE(eventually([&]() { return scheduler.getJobState("gone")->runCount == 1; }));

        auto state = scheduler.getJobState("gone");
        REQUIRE(state->failureCount == 1);
        REQUIRE(state->lastError);
        REQUIRE(state->lastError->starts_with("Source not found: "));
        REQUIRE(dir.logFiles().empty());
    }

    SECTION("Failures do not disturb other jobs") {
        REQUIRE(scheduler.runNow("junk"));
        REQUIRE(scheduler.runNow("core"));
        REQUIRE(eventually([&]() {
            return scheduler.getJobState("junk")->runCount == 1 &&
                   scheduler.getJobState("core")->runCount == 1;
        }));
        REQUIRE(scheduler.getJobState("core")->failureCount == 0);
    }

    REQUIRE(scheduler.stop(5s));
}
