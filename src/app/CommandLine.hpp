#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace pingsweep::app {

/**
 * @brief Parsed command line.
 */
struct CommandLine {
    std::string command; ///< check, analyze, daemon or stats
    std::filesystem::path baseDir;
    std::optional<std::filesystem::path> configPath;
    bool verbose{false};

    // check
    std::optional<std::string> targetFile;
    std::optional<std::string> query;
    std::optional<int> timeout;
    std::optional<int> count;
    std::optional<int> workers;
    std::optional<std::string> jobName;

    // stats
    int hours{24};
};

/**
 * @brief Parses argv into a CommandLine.
 * @param args Arguments without the program name.
 * @param error Set to a message when parsing fails.
 * @return The command line, or nullopt on error or when help was requested
 *         (error stays empty in that case).
 */
std::optional<CommandLine> parseCommandLine(const std::vector<std::string>& args,
                                            std::string& error);

void printUsage(std::ostream& out);

} // namespace pingsweep::app
