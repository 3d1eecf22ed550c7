#include "infrastructure/database/ResultRepository.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <ctime>

namespace pingsweep::infra {

namespace {

std::string timePointToString(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return buffer;
}

std::chrono::system_clock::time_point stringToTimePoint(const std::string& str) {
    std::tm tm{};
    strptime(str.c_str(), "%Y-%m-%d %H:%M:%S", &tm);
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

} // namespace

ResultRepository::ResultRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

void ResultRepository::insertBatch(const std::vector<core::ProbeResult>& results,
                                   const core::StoreContext& context) {
    if (results.empty()) {
        return;
    }

    try {
        db_->transaction([&]() {
            auto stmt = db_->prepare(R"(
                INSERT INTO probe_results (identifier, batch_timestamp, completed_at, success,
                                           latency_us, reason, detail, label, job_name,
                                           timeout_seconds, probe_count)
                VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
            )");

            auto batchTimestamp = timePointToString(context.batchTimestamp);

            for (const auto& result : results) {
                stmt.bind(1, result.identifier);
                stmt.bind(2, batchTimestamp);
                stmt.bind(3, timePointToString(result.timestamp));
                stmt.bind(4, result.success ? 1 : 0);
                if (result.latency) {
                    stmt.bind(5, static_cast<int64_t>(result.latency->count()));
                } else {
                    stmt.bindNull(5);
                }
                if (result.reason) {
                    stmt.bind(6, core::failureReasonToString(*result.reason));
                } else {
                    stmt.bindNull(6);
                }
                if (!result.detail.empty()) {
                    stmt.bind(7, result.detail);
                } else {
                    stmt.bindNull(7);
                }
                stmt.bind(8, result.label);
                stmt.bind(9, context.jobName);
                stmt.bind(10, static_cast<int64_t>(context.parameters.timeout.count()));
                stmt.bind(11, context.parameters.count);

                stmt.step();
                stmt.reset();
            }
        });
    } catch (const std::exception& e) {
        throw core::PersistenceError(std::string("Failed to store probe results: ") + e.what());
    }

    spdlog::debug("Stored {} probe results", results.size());
}

std::vector<core::StoredStatistics> ResultRepository::summarize(
    std::chrono::system_clock::time_point since) {
    std::vector<core::StoredStatistics> statistics;

    try {
        auto stmt = db_->prepare(R"(
            SELECT identifier,
                   COUNT(*) AS total,
                   SUM(CASE WHEN success = 1 THEN 1 ELSE 0 END) AS successes,
                   MIN(batch_timestamp) AS first_seen,
                   MAX(batch_timestamp) AS last_seen
            FROM probe_results
            WHERE batch_timestamp >= ?
            GROUP BY identifier
            ORDER BY identifier
        )");
        stmt.bind(1, timePointToString(since));

        while (stmt.step()) {
            core::StoredStatistics entry;
            entry.identifier = stmt.columnText(0);
            entry.total = stmt.columnInt64(1);
            entry.successes = stmt.columnInt64(2);
            entry.firstSeen = stringToTimePoint(stmt.columnText(3));
            entry.lastSeen = stringToTimePoint(stmt.columnText(4));
            statistics.push_back(std::move(entry));
        }
    } catch (const std::exception& e) {
        throw core::PersistenceError(std::string("Failed to read probe results: ") + e.what());
    }

    return statistics;
}

} // namespace pingsweep::infra
