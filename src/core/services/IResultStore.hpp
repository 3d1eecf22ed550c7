/**
 * @file IResultStore.hpp
 * @brief Interface for the optional external persistence collaborator.
 */

#pragma once

#include "core/types/ProbeBatch.hpp"
#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pingsweep::core {

/**
 * @brief Batch-level metadata stored with every result row.
 */
struct StoreContext {
    std::optional<std::string> jobName;
    std::chrono::system_clock::time_point batchTimestamp;
    ProbeParameters parameters;
};

/**
 * @brief Per-identifier totals read back from the store.
 */
struct StoredStatistics {
    std::string identifier;
    int64_t total{0};
    int64_t successes{0};
    std::chrono::system_clock::time_point firstSeen;
    std::chrono::system_clock::time_point lastSeen;

    [[nodiscard]] double successRate() const {
        return total > 0 ? (static_cast<double>(successes) / static_cast<double>(total)) * 100.0
                         : 0.0;
    }
};

/**
 * @brief Best-effort sink for probe results.
 *
 * Every call may fail independently (throws core::PersistenceError or any
 * std::exception). Concurrent callers from overlapping jobs must be tolerated.
 */
class IResultStore {
public:
    virtual ~IResultStore() = default;

    /**
     * @brief Stores one bounded chunk of results atomically.
     * @param results Chunk of results (bounded by the writer's batch size).
     * @param context Job name, batch timestamp and parameters of the run.
     */
    virtual void insertBatch(const std::vector<ProbeResult>& results,
                             const StoreContext& context) = 0;

    /**
     * @brief Summarizes stored observations per identifier since a point in time.
     */
    virtual std::vector<StoredStatistics> summarize(
        std::chrono::system_clock::time_point since) = 0;
};

} // namespace pingsweep::core
