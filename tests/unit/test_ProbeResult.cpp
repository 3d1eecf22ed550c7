#include <catch2/catch_test_macros.hpp>

#include "core/types/HistoryRecord.hpp"
#include "core/types/ProbeBatch.hpp"
#include "core/types/ProbeResult.hpp"

#include <regex>

using namespace pingsweep::core;

TEST_CASE("ProbeResult factories", "[ProbeResult]") {
    SECTION("Reachable with latency") {
        auto result = ProbeResult::reachable("8.8.8.8", std::chrono::microseconds(12345));

        REQUIRE(result.success);
        REQUIRE_FALSE(result.reason.has_value());
        REQUIRE(result.latency == std::chrono::microseconds(12345));
        REQUIRE(result.isConsistent());
        REQUIRE(result.detailText() == "12.345ms");
    }

    SECTION("Reachable without latency") {
        auto result = ProbeResult::reachable("8.8.8.8", std::nullopt);

        REQUIRE(result.success);
        REQUIRE(result.isConsistent());
        REQUIRE_FALSE(result.latencyMs().has_value());
        REQUIRE(result.detailText() == "N/A");
    }

    SECTION("Unreachable carries a reason and no latency") {
        auto result = ProbeResult::unreachable("10.0.0.9", FailureReason::Timeout);

        REQUIRE_FALSE(result.success);
        REQUIRE(result.reason == FailureReason::Timeout);
        REQUIRE_FALSE(result.latency.has_value());
        REQUIRE(result.isConsistent());
        REQUIRE(result.detailText() == "timeout");
    }

    SECTION("Failure detail is appended") {
        auto result = ProbeResult::unreachable("nohost.invalid", FailureReason::ResolutionFailure,
                                               "Name or service not known");
        REQUIRE(result.detailText() == "resolution-failure: Name or service not known");
    }
}

TEST_CASE("ProbeResult consistency", "[ProbeResult]") {
    ProbeResult result;

    SECTION("Success with a reason is inconsistent") {
        result.success = true;
        result.reason = FailureReason::Timeout;
        REQUIRE_FALSE(result.isConsistent());
    }

    SECTION("Failure without a reason is inconsistent") {
        result.success = false;
        REQUIRE_FALSE(result.isConsistent());
    }

    SECTION("Failure with latency is inconsistent") {
        result.success = false;
        result.reason = FailureReason::Unreachable;
        result.latency = std::chrono::microseconds(5);
        REQUIRE_FALSE(result.isConsistent());
    }
}

TEST_CASE("FailureReason string conversion", "[ProbeResult]") {
    REQUIRE(failureReasonToString(FailureReason::Timeout) == "timeout");
    REQUIRE(failureReasonToString(FailureReason::Unreachable) == "unreachable");
    REQUIRE(failureReasonToString(FailureReason::ResolutionFailure) == "resolution-failure");
    REQUIRE(failureReasonToString(FailureReason::ToolError) == "tool-error");

    REQUIRE(failureReasonFromString("timeout") == FailureReason::Timeout);
    REQUIRE(failureReasonFromString("unreachable") == FailureReason::Unreachable);
    REQUIRE(failureReasonFromString("resolution-failure") == FailureReason::ResolutionFailure);
    REQUIRE(failureReasonFromString("garbage") == FailureReason::ToolError);
}

TEST_CASE("ProbeBatch counters", "[ProbeBatch]") {
    auto batch = ProbeBatch::create("job", ProbeParameters{});

    SECTION("Empty batch") {
        REQUIRE(batch.successCount() == 0);
        REQUIRE(batch.failureCount() == 0);
        REQUIRE(batch.allReachable());
    }

    SECTION("Counts successes and failures") {
        batch.results.push_back(ProbeResult::reachable("a", std::nullopt));
        batch.results.push_back(ProbeResult::reachable("b", std::chrono::microseconds(1)));
        REQUIRE(batch.allReachable());

        batch.results.push_back(ProbeResult::unreachable("c", FailureReason::Timeout));
        REQUIRE(batch.successCount() == 2);
        REQUIRE(batch.failureCount() == 1);
        REQUIRE_FALSE(batch.allReachable());
    }

    SECTION("Timestamp tag has millisecond resolution") {
        std::regex pattern(R"(\d{8}_\d{6}_\d{3})");
        REQUIRE(std::regex_match(batch.timestampTag(), pattern));
    }
}

TEST_CASE("ProbeParameters validation", "[ProbeBatch]") {
    REQUIRE(ProbeParameters{}.isValid());
    REQUIRE_FALSE(ProbeParameters{.timeout = std::chrono::seconds(0)}.isValid());
    REQUIRE_FALSE(ProbeParameters{.timeout = std::chrono::seconds(1), .count = 0}.isValid());
    REQUIRE_FALSE(
        ProbeParameters{.timeout = std::chrono::seconds(1), .count = 1, .workers = 0}.isValid());
}

TEST_CASE("History record classification", "[HistoryRecord]") {
    SECTION("Always") {
        HistoryRecord record{.identifier = "a", .total = 3, .successes = 3};
        REQUIRE(record.classification() == Classification::Always);
        REQUIRE_FALSE(record.successRate().has_value());
    }

    SECTION("Never") {
        HistoryRecord record{.identifier = "b", .total = 3, .successes = 0};
        REQUIRE(record.classification() == Classification::Never);
        REQUIRE(record.failures() == 3);
        REQUIRE_FALSE(record.successRate().has_value());
    }

    SECTION("Sometimes") {
        HistoryRecord record{.identifier = "c", .total = 4, .successes = 2};
        REQUIRE(record.classification() == Classification::Sometimes);
        REQUIRE(record.successRate() == 50.0);
    }

    SECTION("Names") {
        REQUIRE(classificationToString(Classification::Always) == "Always");
        REQUIRE(classificationToString(Classification::Never) == "Never");
        REQUIRE(classificationToString(Classification::Sometimes) == "Sometimes");
    }
}
