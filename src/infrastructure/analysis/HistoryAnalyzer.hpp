#pragma once

#include "core/types/HistoryRecord.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace pingsweep::infra {

/**
 * @brief Summary of one analysis pass.
 */
struct AnalysisReport {
    std::vector<core::HistoryRecord> records; ///< All identifiers, sorted
    size_t alwaysCount{0};
    size_t neverCount{0};
    size_t sometimesCount{0};
    size_t successFilesScanned{0};
    size_t failureFilesScanned{0};
    size_t unreadableFiles{0};
    std::filesystem::path neverFile;
    std::filesystem::path alwaysFile;
    std::filesystem::path sometimesFile;
};

/**
 * @brief Rebuilds per-target reliability statistics from accumulated run logs.
 *
 * Every `*_successful.txt` line counts one success and every `*_failed.txt`
 * line one failure for the identifier in its first tab-separated field. The
 * three output files are rewritten from scratch on every pass; their content
 * depends only on the run logs, so repeated passes over unchanged logs give
 * identical files.
 */
class HistoryAnalyzer {
public:
    static constexpr const char* NEVER_FILE = "analysis_never_responded.txt";
    static constexpr const char* ALWAYS_FILE = "analysis_always_responded.txt";
    static constexpr const char* SOMETIMES_FILE = "analysis_sometimes_responded.txt";

    /**
     * @param resultsDir Directory holding the run logs.
     * @param analysisDir Directory receiving the three output files.
     */
    HistoryAnalyzer(std::filesystem::path resultsDir, std::filesystem::path analysisDir);

    /**
     * @brief Scans the run logs and rewrites the output files.
     * @throws core::SourceNotFoundError if the results directory does not exist.
     * @throws core::Error if an output file cannot be written.
     */
    AnalysisReport analyze() const;

    /**
     * @brief Renders one output file for the given category.
     * @param records All records; only those of the category are emitted.
     */
    static std::string render(core::Classification category,
                              const std::vector<core::HistoryRecord>& records);

private:
    std::vector<core::HistoryRecord> collect(AnalysisReport& report) const;
    void writeAtomically(const std::filesystem::path& path, const std::string& content) const;

    std::filesystem::path resultsDir_;
    std::filesystem::path analysisDir_;
};

} // namespace pingsweep::infra
