#include "infrastructure/network/PingCommand.hpp"

#include "core/types/Target.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <sstream>

namespace pingsweep::infra {

namespace {

constexpr size_t MAX_DETAIL_LENGTH = 200;
constexpr int EXEC_FAILED_STATUS = 127;

const std::array<const char*, 7> RESOLUTION_MARKERS = {
    "unknown host",
    "name or service not known",
    "temporary failure in name resolution",
    "cannot resolve",
    "could not find host",
    "no address associated with hostname",
    "nodename nor servname provided",
};

const std::array<const char*, 4> UNREACHABLE_MARKERS = {
    "destination host unreachable",
    "destination net unreachable",
    "network is unreachable",
    "no route to host",
};

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

template <size_t N>
bool mentionsAny(const std::string& lowered, const std::array<const char*, N>& markers) {
    return std::any_of(markers.begin(), markers.end(), [&](const char* marker) {
        return lowered.find(marker) != std::string::npos;
    });
}

// Last non-empty output line, which is where ping tools put their complaint.
std::string lastLine(const std::string& output) {
    std::istringstream stream(output);
    std::string line;
    std::string last;
    while (std::getline(stream, line)) {
        auto begin = line.find_first_not_of(" \t\r");
        if (begin == std::string::npos) {
            continue;
        }
        auto end = line.find_last_not_of(" \t\r");
        last = line.substr(begin, end - begin + 1);
    }
    if (last.size() > MAX_DETAIL_LENGTH) {
        last.resize(MAX_DETAIL_LENGTH);
    }
    return last;
}

bool isIpv6Literal(const std::string& identifier) {
    return core::isIpLiteral(identifier) && identifier.find(':') != std::string::npos;
}

} // namespace

PingCommand PingCommand::forHost() {
#if defined(_WIN32)
    return PingCommand(Platform::Windows);
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
    return PingCommand(Platform::MacOS);
#else
    return PingCommand(Platform::Linux);
#endif
}

PingCommand::PingCommand(Platform platform, std::string program)
    : platform_(platform), program_(std::move(program)) {}

std::vector<std::string> PingCommand::arguments(const std::string& identifier,
                                                const core::ProbeOptions& options) const {
    std::vector<std::string> argv{program_};
    auto timeoutSeconds = options.timeout.count();

    switch (platform_) {
    case Platform::Linux:
    case Platform::MacOS:
        if (isIpv6Literal(identifier)) {
            argv.emplace_back("-6");
        }
        argv.emplace_back("-c");
        argv.push_back(std::to_string(options.count));
        argv.emplace_back(platform_ == Platform::Linux ? "-W" : "-t");
        argv.push_back(std::to_string(timeoutSeconds));
        break;
    case Platform::Windows:
        argv.emplace_back("-n");
        argv.push_back(std::to_string(options.count));
        argv.emplace_back("-w");
        argv.push_back(std::to_string(timeoutSeconds * 1000));
        break;
    }

    argv.push_back(identifier);
    return argv;
}

std::chrono::milliseconds PingCommand::deadline(const core::ProbeOptions& options) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(options.timeout) *
               std::max(options.count, 1) +
           std::chrono::seconds(2);
}

std::optional<std::chrono::microseconds> PingCommand::parseLatency(const std::string& output) {
    static const std::regex pattern(R"(time\s*([=<])\s*([0-9]+(?:[.,][0-9]+)?)\s*ms)",
                                    std::regex::icase);

    std::smatch match;
    if (!std::regex_search(output, match, pattern)) {
        return std::nullopt;
    }

    auto value = match[2].str();
    std::replace(value.begin(), value.end(), ',', '.');

    double ms = 0.0;
    try {
        ms = std::stod(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return std::chrono::microseconds(static_cast<int64_t>(ms * 1000.0 + 0.5));
}

core::ProbeResult PingCommand::classify(const std::string& identifier, int exitCode,
                                        const std::string& output) {
    if (exitCode == 0) {
        return core::ProbeResult::reachable(identifier, parseLatency(output));
    }

    auto lowered = toLower(output);
    auto detail = lastLine(output);

    if (mentionsAny(lowered, RESOLUTION_MARKERS)) {
        return core::ProbeResult::unreachable(identifier, core::FailureReason::ResolutionFailure,
                                              detail);
    }
    if (mentionsAny(lowered, UNREACHABLE_MARKERS)) {
        return core::ProbeResult::unreachable(identifier, core::FailureReason::Unreachable,
                                              detail);
    }
    if (exitCode < 0 || exitCode >= 2) {
        if (detail.empty()) {
            detail = exitCode == EXEC_FAILED_STATUS || exitCode < 0
                         ? "ping tool could not be executed"
                         : "ping exited with status " + std::to_string(exitCode);
        }
        return core::ProbeResult::unreachable(identifier, core::FailureReason::ToolError, detail);
    }
    return core::ProbeResult::unreachable(identifier, core::FailureReason::Timeout);
}

} // namespace pingsweep::infra
