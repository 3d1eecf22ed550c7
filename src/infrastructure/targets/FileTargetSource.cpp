#include "infrastructure/targets/FileTargetSource.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <string_view>

namespace pingsweep::infra {

namespace {

constexpr char COMMENT_MARKER = '#';
constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

FileTargetSource::FileTargetSource(std::filesystem::path path) : path_(std::move(path)) {}

std::vector<core::TargetEntry> FileTargetSource::read() {
    if (!std::filesystem::is_regular_file(path_)) {
        throw core::SourceNotFoundError(path_.string());
    }

    std::ifstream file(path_);
    if (!file) {
        throw core::SourceNotFoundError(path_.string());
    }

    auto entries = parse(file);
    if (entries.empty()) {
        throw core::EmptySourceError(path_.string());
    }

    spdlog::debug("Read {} candidate targets from {}", entries.size(), path_.string());
    return entries;
}

std::vector<core::TargetEntry> FileTargetSource::parse(std::istream& input) {
    std::vector<core::TargetEntry> entries;
    std::string line;
    std::size_t lineNumber = 0;

    while (std::getline(input, line)) {
        ++lineNumber;
        if (lineNumber == 1 && line.starts_with(UTF8_BOM)) {
            line.erase(0, UTF8_BOM.size());
        }

        auto marker = line.find(COMMENT_MARKER);
        if (marker != std::string::npos) {
            line.erase(marker);
        }

        auto content = trim(line);
        if (content.empty()) {
            continue;
        }

        std::istringstream tokens(content);
        core::TargetEntry entry;
        entry.rawLine = content;
        entry.lineNumber = lineNumber;
        tokens >> entry.candidate;

        std::string label;
        if (tokens >> label) {
            entry.label = label;
        }

        std::string extra;
        if (tokens >> extra) {
            spdlog::debug("Ignoring extra tokens on line {}: {}", lineNumber, content);
        }

        entries.push_back(std::move(entry));
    }

    return entries;
}

std::filesystem::path FileTargetSource::resolve(const std::string& path,
                                                const std::filesystem::path& baseDir,
                                                bool searchWorkingDirectory) {
    std::filesystem::path candidate(path);
    if (candidate.is_absolute()) {
        return candidate;
    }

    if (searchWorkingDirectory && std::filesystem::is_regular_file(candidate)) {
        return std::filesystem::absolute(candidate);
    }

    auto configPath = baseDir / "config" / candidate;
    if (std::filesystem::is_regular_file(configPath)) {
        return configPath;
    }

    auto rootPath = baseDir / candidate;
    if (std::filesystem::is_regular_file(rootPath)) {
        return rootPath;
    }

    return configPath;
}

} // namespace pingsweep::infra
