#pragma once

#include "core/services/IResultStore.hpp"
#include "core/types/ProbeBatch.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace pingsweep::infra {

/**
 * @brief Files produced for one batch. Categories without entries have no file.
 */
struct RunLogPaths {
    std::string stem;
    std::optional<std::filesystem::path> successful;
    std::optional<std::filesystem::path> failed;
    std::optional<std::filesystem::path> invalid;
};

/**
 * @brief Outcome of writing one batch.
 */
struct RunLogReport {
    RunLogPaths paths;
    size_t successCount{0};
    size_t failureCount{0};
    size_t invalidCount{0};
    bool persistenceAttempted{false};
    size_t storedResults{0};                     ///< Results accepted by the store
    std::optional<std::string> persistenceError; ///< First store failure, if any

    [[nodiscard]] bool persisted() const { return persistenceAttempted && !persistenceError; }
};

/**
 * @brief Persists probe batches as categorized, tab-separated run logs.
 *
 * Each batch yields up to three files in the results directory named
 * `<stem>_successful.txt`, `<stem>_failed.txt` and `<stem>_invalid.txt`, where
 * the stem is the batch timestamp plus the job name. Stems are reserved
 * process-wide, so overlapping jobs never share a file. When a result store
 * is attached the batch is also forwarded to it in bounded chunks; store
 * failures are reported, never thrown.
 */
class RunLogWriter {
public:
    static constexpr size_t DEFAULT_BATCH_SIZE = 50;

    /**
     * @param resultsDir Directory receiving the run logs (created if missing).
     * @param store Optional external store.
     * @param batchSize Maximum results per store call.
     */
    explicit RunLogWriter(std::filesystem::path resultsDir,
                          std::shared_ptr<core::IResultStore> store = nullptr,
                          size_t batchSize = DEFAULT_BATCH_SIZE);

    /**
     * @brief Writes the batch's files and forwards it to the store.
     * @throws core::Error if a run-log file cannot be written.
     */
    RunLogReport write(const core::ProbeBatch& batch);

    const std::filesystem::path& resultsDirectory() const { return resultsDir_; }

    static std::string successLine(const core::ProbeResult& result);
    static std::string failureLine(const core::ProbeResult& result);
    static std::string invalidLine(const core::InvalidTarget& invalid);

    /**
     * @brief Reduces a job name to [A-Za-z0-9_-] for use in file names.
     */
    static std::string sanitizeJobName(const std::string& jobName);

private:
    std::string reserveStem(const core::ProbeBatch& batch);
    bool stemInUse(const std::string& stem) const;
    void forwardToStore(const core::ProbeBatch& batch, RunLogReport& report);

    std::filesystem::path resultsDir_;
    std::shared_ptr<core::IResultStore> store_;
    size_t batchSize_;

    static std::mutex reservationMutex_;
    static std::set<std::string> reservedStems_;
};

} // namespace pingsweep::infra
