#pragma once

#include "core/services/IResultStore.hpp"
#include "infrastructure/database/Database.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace pingsweep::infra {

/**
 * @brief SQLite-backed result store.
 *
 * Each insertBatch() call writes one chunk inside a single transaction, so a
 * chunk is either stored completely or not at all. Safe to share between
 * overlapping jobs through the full-mutex Database connection.
 */
class ResultRepository : public core::IResultStore {
public:
    /**
     * @brief Constructs a repository over an open database.
     * @param db Database with migrations applied.
     */
    explicit ResultRepository(std::shared_ptr<Database> db);

    /**
     * @brief Stores a chunk of results.
     * @throws core::PersistenceError if the chunk could not be written.
     */
    void insertBatch(const std::vector<core::ProbeResult>& results,
                     const core::StoreContext& context) override;

    /**
     * @brief Per-identifier totals for results whose batch started at or after `since`.
     * @return Statistics ordered by identifier.
     */
    std::vector<core::StoredStatistics> summarize(
        std::chrono::system_clock::time_point since) override;

private:
    std::shared_ptr<Database> db_;
};

} // namespace pingsweep::infra
