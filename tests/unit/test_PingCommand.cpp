#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/PingCommand.hpp"

using namespace pingsweep::core;
using namespace pingsweep::infra;

namespace {

const char* LINUX_REPLY = R"(PING 8.8.8.8 (8.8.8.8) 56(84) bytes of data.
64 bytes from 8.8.8.8: icmp_seq=1 ttl=117 time=12.4 ms

--- 8.8.8.8 ping statistics ---
1 packets transmitted, 1 received, 0% packet loss, time 0ms
rtt min/avg/max/mdev = 12.400/12.400/12.400/0.000 ms
)";

const char* WINDOWS_REPLY = R"(Pinging 10.0.0.1 with 32 bytes of data:
Reply from 10.0.0.1: bytes=32 time<1ms TTL=64
)";

const char* LINUX_TIMEOUT = R"(PING 10.255.255.1 (10.255.255.1) 56(84) bytes of data.

--- 10.255.255.1 ping statistics ---
1 packets transmitted, 0 received, 100% packet loss, time 0ms
)";

} // namespace

TEST_CASE("Ping command arguments", "[PingCommand]") {
    ProbeOptions options{.timeout = std::chrono::seconds(2), .count = 3};

    SECTION("Linux") {
        PingCommand command(PingCommand::Platform::Linux);
        auto argv = command.arguments("8.8.8.8", options);
        REQUIRE(argv == std::vector<std::string>{"ping", "-c", "3", "-W", "2", "8.8.8.8"});
    }

    SECTION("Linux IPv6 literal") {
        PingCommand command(PingCommand::Platform::Linux);
        auto argv = command.arguments("2001:db8::1", options);
        REQUIRE(argv ==
                std::vector<std::string>{"ping", "-6", "-c", "3", "-W", "2", "2001:db8::1"});
    }

    SECTION("macOS uses -t") {
        PingCommand command(PingCommand::Platform::MacOS);
        auto argv = command.arguments("example.com", options);
        REQUIRE(argv == std::vector<std::string>{"ping", "-c", "3", "-t", "2", "example.com"});
    }

    SECTION("Windows uses milliseconds") {
        PingCommand command(PingCommand::Platform::Windows);
        auto argv = command.arguments("10.0.0.1", options);
        REQUIRE(argv == std::vector<std::string>{"ping", "-n", "3", "-w", "2000", "10.0.0.1"});
    }

    SECTION("Custom program") {
        PingCommand command(PingCommand::Platform::Linux, "/usr/bin/ping");
        REQUIRE(command.arguments("8.8.8.8", options).front() == "/usr/bin/ping");
    }
}

TEST_CASE("Ping deadline", "[PingCommand]") {
    REQUIRE(PingCommand::deadline({.timeout = std::chrono::seconds(3), .count = 1}) ==
            std::chrono::milliseconds(5000));
    REQUIRE(PingCommand::deadline({.timeout = std::chrono::seconds(2), .count = 4}) ==
            std::chrono::milliseconds(10000));
}

TEST_CASE("Ping latency parsing", "[PingCommand]") {
    REQUIRE(PingCommand::parseLatency(LINUX_REPLY) == std::chrono::microseconds(12400));
    REQUIRE(PingCommand::parseLatency(WINDOWS_REPLY) == std::chrono::microseconds(1000));
    REQUIRE(PingCommand::parseLatency("Antwort von 10.0.0.1: Zeit time=0,25 ms") ==
            std::chrono::microseconds(250));
    REQUIRE_FALSE(PingCommand::parseLatency(LINUX_TIMEOUT).has_value());
    REQUIRE_FALSE(PingCommand::parseLatency("").has_value());
}

TEST_CASE("Ping output classification", "[PingCommand]") {
    SECTION("Exit 0 is success with latency") {
        auto result = PingCommand::classify("8.8.8.8", 0, LINUX_REPLY);
        REQUIRE(result.success);
        REQUIRE(result.latency == std::chrono::microseconds(12400));
        REQUIRE(result.isConsistent());
    }

    SECTION("Exit 0 without a time is success without latency") {
        auto result = PingCommand::classify("8.8.8.8", 0, "ok");
        REQUIRE(result.success);
        REQUIRE_FALSE(result.latency.has_value());
    }

    SECTION("Exit 1 without markers is a timeout") {
        auto result = PingCommand::classify("10.255.255.1", 1, LINUX_TIMEOUT);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.reason == FailureReason::Timeout);
        REQUIRE(result.detail.empty());
    }

    SECTION("Unknown host is a resolution failure") {
        auto result = PingCommand::classify("nohost.invalid", 2,
                                            "ping: nohost.invalid: Name or service not known\n");
        REQUIRE(result.reason == FailureReason::ResolutionFailure);
        REQUIRE(result.detail == "ping: nohost.invalid: Name or service not known");
    }

    SECTION("Destination unreachable") {
        auto result = PingCommand::classify(
            "10.0.0.50", 1, "From 10.0.0.1 icmp_seq=1 Destination Host Unreachable\n");
        REQUIRE(result.reason == FailureReason::Unreachable);
    }

    SECTION("Other errors are tool errors") {
        auto result = PingCommand::classify("8.8.8.8", 2, "ping: socket: Operation not permitted\n");
        REQUIRE(result.reason == FailureReason::ToolError);
        REQUIRE(result.detail == "ping: socket: Operation not permitted");
    }

    SECTION("Exec failure without output") {
        auto result = PingCommand::classify("8.8.8.8", 127, "");
        REQUIRE(result.reason == FailureReason::ToolError);
        REQUIRE(result.detail == "ping tool could not be executed");
    }

    SECTION("Long details are truncated") {
        auto result = PingCommand::classify("8.8.8.8", 2, std::string(500, 'x'));
        REQUIRE(result.detail.size() == 200);
    }
}
