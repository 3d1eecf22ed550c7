#include "infrastructure/analysis/HistoryAnalyzer.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>

namespace pingsweep::infra {

namespace {

constexpr const char* SUCCESS_SUFFIX = "_successful.txt";
constexpr const char* FAILURE_SUFFIX = "_failed.txt";

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

const char* headerTitle(core::Classification category) {
    switch (category) {
    case core::Classification::Always:
        return "Targets that always responded";
    case core::Classification::Never:
        return "Targets that never responded";
    case core::Classification::Sometimes:
        return "Targets that sometimes responded";
    }
    return "";
}

const char* headerFormat(core::Classification category) {
    return category == core::Classification::Sometimes ? "IDENTIFIER\tSUCCESS_RATE"
                                                       : "IDENTIFIER";
}

} // namespace

HistoryAnalyzer::HistoryAnalyzer(std::filesystem::path resultsDir,
                                 std::filesystem::path analysisDir)
    : resultsDir_(std::move(resultsDir)), analysisDir_(std::move(analysisDir)) {}

std::vector<core::HistoryRecord> HistoryAnalyzer::collect(AnalysisReport& report) const {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(resultsDir_)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        auto name = entry.path().filename().string();
        if (endsWith(name, SUCCESS_SUFFIX) || endsWith(name, FAILURE_SUFFIX)) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    std::map<std::string, core::HistoryRecord> byIdentifier;

    for (const auto& path : files) {
        bool successFile = endsWith(path.filename().string(), SUCCESS_SUFFIX);

        std::ifstream file(path);
        if (!file) {
            spdlog::warn("Skipping unreadable run log {}", path.string());
            ++report.unreadableFiles;
            continue;
        }

        if (successFile) {
            ++report.successFilesScanned;
        } else {
            ++report.failureFilesScanned;
        }

        std::string line;
        while (std::getline(file, line)) {
            auto content = trim(line);
            if (content.empty() || content.front() == '#') {
                continue;
            }

            auto tab = content.find('\t');
            if (tab == std::string::npos) {
                continue;
            }
            auto identifier = trim(content.substr(0, tab));
            if (identifier.empty()) {
                continue;
            }

            auto& record = byIdentifier[identifier];
            record.identifier = identifier;
            ++record.total;
            if (successFile) {
                ++record.successes;
            }
        }

        if (file.bad()) {
            spdlog::warn("Read error in run log {}", path.string());
        }
    }

    std::vector<core::HistoryRecord> records;
    records.reserve(byIdentifier.size());
    for (auto& [identifier, record] : byIdentifier) {
        records.push_back(std::move(record));
    }
    return records;
}

std::string HistoryAnalyzer::render(core::Classification category,
                                    const std::vector<core::HistoryRecord>& records) {
    std::vector<const core::HistoryRecord*> selected;
    for (const auto& record : records) {
        if (record.total > 0 && record.classification() == category) {
            selected.push_back(&record);
        }
    }
    std::sort(selected.begin(), selected.end(),
              [](const auto* a, const auto* b) { return a->identifier < b->identifier; });

    std::ostringstream oss;
    oss << "# " << headerTitle(category) << '\n';
    oss << "# Total: " << selected.size() << '\n';
    oss << "# Format: " << headerFormat(category) << '\n';

    for (const auto* record : selected) {
        oss << record->identifier;
        if (category == core::Classification::Sometimes) {
            oss << '\t' << std::fixed << std::setprecision(1) << record->successRate().value_or(0.0)
                << '%';
        }
        oss << '\n';
    }
    return oss.str();
}

void HistoryAnalyzer::writeAtomically(const std::filesystem::path& path,
                                      const std::string& content) const {
    auto temp = path;
    temp += ".tmp";

    {
        std::ofstream file(temp, std::ios::out | std::ios::trunc);
        if (!file) {
            throw core::Error("Cannot create analysis file " + temp.string());
        }
        file << content;
        file.flush();
        if (!file) {
            throw core::Error("Failed to write analysis file " + temp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        throw core::Error("Cannot replace analysis file " + path.string());
    }
}

AnalysisReport HistoryAnalyzer::analyze() const {
    if (!std::filesystem::is_directory(resultsDir_)) {
        throw core::SourceNotFoundError(resultsDir_.string());
    }

    AnalysisReport report;
    report.records = collect(report);

    for (const auto& record : report.records) {
        switch (record.classification()) {
        case core::Classification::Always:
            ++report.alwaysCount;
            break;
        case core::Classification::Never:
            ++report.neverCount;
            break;
        case core::Classification::Sometimes:
            ++report.sometimesCount;
            break;
        }
    }

    std::filesystem::create_directories(analysisDir_);
    report.neverFile = analysisDir_ / NEVER_FILE;
    report.alwaysFile = analysisDir_ / ALWAYS_FILE;
    report.sometimesFile = analysisDir_ / SOMETIMES_FILE;

    writeAtomically(report.neverFile, render(core::Classification::Never, report.records));
    writeAtomically(report.alwaysFile, render(core::Classification::Always, report.records));
    writeAtomically(report.sometimesFile,
                    render(core::Classification::Sometimes, report.records));

    spdlog::info("Analyzed {} success and {} failure logs: {} always, {} never, {} sometimes",
                 report.successFilesScanned, report.failureFilesScanned, report.alwaysCount,
                 report.neverCount, report.sometimesCount);
    return report;
}

} // namespace pingsweep::infra
