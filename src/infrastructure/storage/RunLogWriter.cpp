#include "infrastructure/storage/RunLogWriter.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace pingsweep::infra {

namespace {

constexpr const char* SUCCESS_SUFFIX = "_successful.txt";
constexpr const char* FAILURE_SUFFIX = "_failed.txt";
constexpr const char* INVALID_SUFFIX = "_invalid.txt";

void writeLines(const std::filesystem::path& path, const std::vector<std::string>& lines) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        throw core::Error("Cannot create run log " + path.string());
    }
    for (const auto& line : lines) {
        file << line << '\n';
    }
    file.flush();
    if (!file) {
        throw core::Error("Failed to write run log " + path.string());
    }
}

} // namespace

std::mutex RunLogWriter::reservationMutex_;
std::set<std::string> RunLogWriter::reservedStems_;

RunLogWriter::RunLogWriter(std::filesystem::path resultsDir,
                           std::shared_ptr<core::IResultStore> store, size_t batchSize)
    : resultsDir_(std::move(resultsDir)),
      store_(std::move(store)),
      batchSize_(batchSize > 0 ? batchSize : DEFAULT_BATCH_SIZE) {}

std::string RunLogWriter::successLine(const core::ProbeResult& result) {
    std::ostringstream oss;
    oss << result.identifier << "\tSUCCESS\t" << result.detailText();
    if (result.label) {
        oss << '\t' << *result.label;
    }
    return oss.str();
}

std::string RunLogWriter::failureLine(const core::ProbeResult& result) {
    std::ostringstream oss;
    oss << result.identifier << "\tFAILED\t" << result.detailText();
    if (result.label) {
        oss << '\t' << *result.label;
    }
    return oss.str();
}

std::string RunLogWriter::invalidLine(const core::InvalidTarget& invalid) {
    std::ostringstream oss;
    oss << invalid.candidate << "\tINVALID\tline " << invalid.lineNumber << ": " << invalid.rawLine;
    return oss.str();
}

std::string RunLogWriter::sanitizeJobName(const std::string& jobName) {
    std::string sanitized;
    sanitized.reserve(jobName.size());
    for (unsigned char c : jobName) {
        sanitized += (std::isalnum(c) || c == '-' || c == '_') ? static_cast<char>(c) : '_';
    }
    return sanitized;
}

bool RunLogWriter::stemInUse(const std::string& stem) const {
    for (const char* suffix : {SUCCESS_SUFFIX, FAILURE_SUFFIX, INVALID_SUFFIX}) {
        if (std::filesystem::exists(resultsDir_ / (stem + suffix))) {
            return true;
        }
    }
    return false;
}

std::string RunLogWriter::reserveStem(const core::ProbeBatch& batch) {
    std::string base = batch.timestampTag();
    if (batch.jobName && !batch.jobName->empty()) {
        base += "_" + sanitizeJobName(*batch.jobName);
    }

    std::lock_guard lock(reservationMutex_);
    std::string stem = base;
    for (int suffix = 1; reservedStems_.contains(resultsDir_.string() + "/" + stem) ||
                         stemInUse(stem);
         ++suffix) {
        stem = base + "-" + std::to_string(suffix);
    }
    reservedStems_.insert(resultsDir_.string() + "/" + stem);
    return stem;
}

RunLogReport RunLogWriter::write(const core::ProbeBatch& batch) {
    std::error_code ec;
    std::filesystem::create_directories(resultsDir_, ec);
    if (ec) {
        throw core::Error("Cannot create results directory " + resultsDir_.string() + ": " +
                          ec.message());
    }

    RunLogReport report;
    report.paths.stem = reserveStem(batch);

    std::vector<std::string> successLines;
    std::vector<std::string> failureLines;
    std::vector<std::string> invalidLines;

    for (const auto& result : batch.results) {
        if (result.success) {
            successLines.push_back(successLine(result));
        } else {
            failureLines.push_back(failureLine(result));
        }
    }
    for (const auto& invalid : batch.invalid) {
        invalidLines.push_back(invalidLine(invalid));
    }

    report.successCount = successLines.size();
    report.failureCount = failureLines.size();
    report.invalidCount = invalidLines.size();

    if (!successLines.empty()) {
        report.paths.successful = resultsDir_ / (report.paths.stem + SUCCESS_SUFFIX);
        writeLines(*report.paths.successful, successLines);
    }
    if (!failureLines.empty()) {
        report.paths.failed = resultsDir_ / (report.paths.stem + FAILURE_SUFFIX);
        writeLines(*report.paths.failed, failureLines);
    }
    if (!invalidLines.empty()) {
        report.paths.invalid = resultsDir_ / (report.paths.stem + INVALID_SUFFIX);
        writeLines(*report.paths.invalid, invalidLines);
    }

    spdlog::info("Run log {}: {} successful, {} failed, {} invalid", report.paths.stem,
                 report.successCount, report.failureCount, report.invalidCount);

    if (store_) {
        forwardToStore(batch, report);
    }

    return report;
}

void RunLogWriter::forwardToStore(const core::ProbeBatch& batch, RunLogReport& report) {
    report.persistenceAttempted = true;

    core::StoreContext context{
        .jobName = batch.jobName,
        .batchTimestamp = batch.timestamp,
        .parameters = batch.parameters,
    };

    const auto& results = batch.results;
    for (size_t offset = 0; offset < results.size(); offset += batchSize_) {
        auto end = std::min(offset + batchSize_, results.size());
        std::vector<core::ProbeResult> chunk(results.begin() + static_cast<std::ptrdiff_t>(offset),
                                             results.begin() + static_cast<std::ptrdiff_t>(end));
        try {
            store_->insertBatch(chunk, context);
            report.storedResults += chunk.size();
        } catch (const std::exception& e) {
            report.persistenceError = e.what();
            spdlog::error("Persistence failure for run {} after {} of {} results: {}",
                          report.paths.stem, report.storedResults, results.size(), e.what());
            return;
        }
    }

    spdlog::debug("Forwarded {} results of run {} to the result store", report.storedResults,
                  report.paths.stem);
}

} // namespace pingsweep::infra
