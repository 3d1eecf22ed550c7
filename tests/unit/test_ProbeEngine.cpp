#include <catch2/catch_test_macros.hpp>

#include "core/Errors.hpp"
#include "infrastructure/network/ProbeEngine.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

using namespace pingsweep::core;
using namespace pingsweep::infra;

namespace {

/**
 * @brief Probe that sleeps for a fixed duration and answers from a script.
 */
class ScriptedProbe : public IReachabilityProbe {
public:
    explicit ScriptedProbe(std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : delay_(delay) {}

    ProbeResult probe(const std::string& identifier, const ProbeOptions& options,
                      std::stop_token) override {
        auto now = ++inFlight_;
        auto peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
        }

        {
            std::lock_guard lock(mutex_);
            seenOptions_ = options;
        }

        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        --inFlight_;

        if (identifier.starts_with("throw")) {
            throw std::runtime_error("probe exploded");
        }
        if (identifier.starts_with("down")) {
            return ProbeResult::unreachable(identifier, FailureReason::Timeout);
        }
        if (identifier.starts_with("broken")) {
            ProbeResult bad;
            bad.success = false;
            bad.latency = std::chrono::microseconds(10);
            return bad;
        }
        return ProbeResult::reachable(identifier, std::chrono::microseconds(1500));
    }

    std::string name() const override { return "scripted"; }

    int peakConcurrency() const { return peak_; }

    ProbeOptions seenOptions() const {
        std::lock_guard lock(mutex_);
        return seenOptions_;
    }

private:
    std::chrono::milliseconds delay_;
    std::atomic<int> inFlight_{0};
    std::atomic<int> peak_{0};
    mutable std::mutex mutex_;
    ProbeOptions seenOptions_;
};

TargetList makeTargets(const std::vector<std::string>& identifiers) {
    TargetList list;
    for (const auto& id : identifiers) {
        list.targets.push_back(Target{.identifier = id, .label = "lbl-" + id, .jobName = {}});
    }
    return list;
}

} // namespace

TEST_CASE("ProbeEngine construction", "[ProbeEngine]") {
    REQUIRE_THROWS_AS(ProbeEngine(nullptr), ConfigError);
}

TEST_CASE("ProbeEngine results", "[ProbeEngine]") {
    auto probe = std::make_shared<ScriptedProbe>();
    ProbeEngine engine(probe);
    ProbeParameters parameters{.timeout = std::chrono::seconds(4), .count = 2, .workers = 4};

    SECTION("One result per target in submission order") {
        auto targets = makeTargets({"a.example", "down.example", "b.example", "c.example"});
        auto batch = engine.run(targets, parameters, "job");

        REQUIRE(batch.results.size() == 4);
        for (size_t i = 0; i < targets.targets.size(); ++i) {
            REQUIRE(batch.results[i].identifier == targets.targets[i].identifier);
            REQUIRE(batch.results[i].label == targets.targets[i].label);
        }
        REQUIRE(batch.successCount() == 3);
        REQUIRE(batch.failureCount() == 1);
        REQUIRE(batch.jobName == "job");
        REQUIRE(batch.parameters == parameters);
    }

    SECTION("Options are forwarded to the primitive") {
        engine.run(makeTargets({"a.example"}), parameters);

        auto options = probe->seenOptions();
        REQUIRE(options.timeout == std::chrono::seconds(4));
        REQUIRE(options.count == 2);
    }

    SECTION("Invalid targets are carried into the batch") {
        auto targets = makeTargets({"a.example"});
        targets.invalid.push_back(InvalidTarget{.candidate = "bad..ip", .rawLine = "bad..ip",
                                                .lineNumber = 2});

        auto batch = engine.run(targets, parameters);
        REQUIRE(batch.invalid.size() == 1);
        REQUIRE(batch.invalid[0].candidate == "bad..ip");
    }

    SECTION("Empty target list produces an empty batch") {
        auto batch = engine.run(TargetList{}, parameters);
        REQUIRE(batch.results.empty());
    }

    SECTION("Invalid parameters are rejected") {
        ProbeParameters bad{.timeout = std::chrono::seconds(1), .count = 1, .workers = 0};
        REQUIRE_THROWS_AS(engine.run(makeTargets({"a.example"}), bad), ConfigError);
    }
}

TEST_CASE("ProbeEngine failure isolation", "[ProbeEngine]") {
    ProbeEngine engine(std::make_shared<ScriptedProbe>());
    ProbeParameters parameters{.timeout = std::chrono::seconds(1), .count = 1, .workers = 2};

    auto batch = engine.run(makeTargets({"ok1.example", "throw.example", "broken.example",
                                         "ok2.example"}),
                            parameters);

    REQUIRE(batch.results.size() == 4);
    REQUIRE(batch.results[0].success);
    REQUIRE(batch.results[3].success);

    const auto& thrown = batch.results[1];
    REQUIRE_FALSE(thrown.success);
    REQUIRE(thrown.reason == FailureReason::ToolError);
    REQUIRE(thrown.detail == "probe exploded");

    const auto& broken = batch.results[2];
    REQUIRE(broken.identifier == "broken.example");
    REQUIRE(broken.isConsistent());
    REQUIRE(broken.reason == FailureReason::ToolError);

    for (const auto& result : batch.results) {
        REQUIRE(result.isConsistent());
    }
}

TEST_CASE("ProbeEngine concurrency", "[ProbeEngine]") {
    using namespace std::chrono_literals;
    constexpr auto CALL_DURATION = 200ms;

    auto probe = std::make_shared<ScriptedProbe>(CALL_DURATION);
    ProbeEngine engine(probe);

    std::vector<std::string> ids;
    for (int i = 0; i < 10; ++i) {
        ids.push_back("host" + std::to_string(i) + ".example");
    }
    ProbeParameters parameters{.timeout = 1s, .count = 1, .workers = 3};

    auto started = std::chrono::steady_clock::now();
    auto batch = engine.run(makeTargets(ids), parameters);
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(batch.results.size() == 10);
    REQUIRE(probe->peakConcurrency() <= 3);

    // ceil(10 / 3) = 4 call durations, far from the 10 a serial run needs
    REQUIRE(elapsed >= 4 * CALL_DURATION);
    REQUIRE(elapsed < 7 * CALL_DURATION);
}

TEST_CASE("ProbeEngine cancellation", "[ProbeEngine]") {
    ProbeEngine engine(std::make_shared<ScriptedProbe>());
    std::stop_source stopSource;
    stopSource.request_stop();

    auto batch = engine.run(makeTargets({"a.example", "b.example"}),
                            ProbeParameters{}, std::nullopt, stopSource.get_token());

    REQUIRE(batch.results.size() == 2);
    for (const auto& result : batch.results) {
        REQUIRE_FALSE(result.success);
        REQUIRE(result.reason == FailureReason::ToolError);
        REQUIRE(result.detail == "cancelled before start");
    }
}
