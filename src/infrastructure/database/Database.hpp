#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>

namespace pingsweep::infra {

/**
 * @brief RAII wrapper for SQLite prepared statements.
 *
 * Provides parameter binding and column value extraction for SQLite
 * prepared statements. Supports move semantics.
 *
 * @note This class is non-copyable but moveable.
 */
class Statement {
public:
    /**
     * @brief Constructs a Statement from a raw SQLite statement handle.
     * @param stmt SQLite prepared statement handle (takes ownership).
     */
    explicit Statement(sqlite3_stmt* stmt);

    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    void bind(int index, int value);
    void bind(int index, int64_t value);
    void bind(int index, const std::string& value);
    void bindNull(int index);

    /**
     * @brief Binds an optional text value, or NULL when empty.
     * @param index Parameter index (1-based).
     * @param value Value to bind.
     */
    void bind(int index, const std::optional<std::string>& value);

    /**
     * @brief Executes the statement and advances to the next row.
     * @return True if a row is available, false if done.
     * @throws std::runtime_error on SQLite errors.
     */
    bool step();

    /**
     * @brief Resets the statement and clears bindings for re-execution.
     */
    void reset();

    /**
     * @brief Number of columns in the result set.
     */
    int columnCount() const;

    int columnInt(int index) const;
    int64_t columnInt64(int index) const;
    std::string columnText(int index) const;
    bool columnIsNull(int index) const;

private:
    sqlite3_stmt* stmt_{nullptr};
};

/**
 * @brief SQLite connection with transactions and schema migrations.
 *
 * Read-write databases use WAL mode and a full-mutex connection so that
 * overlapping jobs can write through the same instance. Read-only databases
 * (inventory sources) skip pragmas and migrations entirely.
 *
 * @note This class is non-copyable.
 */
class Database {
public:
    enum class OpenMode { ReadWrite, ReadOnly };

    /**
     * @brief Opens or creates a database at the specified path.
     * @param path File path to the SQLite database.
     * @param mode ReadOnly requires an existing file and never creates one.
     * @throws std::runtime_error if the database cannot be opened.
     */
    explicit Database(const std::string& path, OpenMode mode = OpenMode::ReadWrite);

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Executes one or more SQL statements without returning results.
     * @throws std::runtime_error on SQL error.
     */
    void execute(const std::string& sql);

    /**
     * @brief Prepares a single SQL statement.
     * @throws std::runtime_error if preparation fails.
     */
    Statement prepare(const std::string& sql);

    void beginTransaction();
    void commit();
    void rollback();

    /**
     * @brief Executes a function within a transaction.
     *
     * Commits on success, rolls back and rethrows on exception. Transactions
     * from different threads are serialized on the shared connection.
     */
    template <typename Func>
    void transaction(Func&& func) {
        std::lock_guard lock(transactionMutex_);
        beginTransaction();
        try {
            func();
            commit();
        } catch (...) {
            rollback();
            throw;
        }
    }

    /**
     * @brief Applies pending schema migrations (read-write databases only).
     */
    void runMigrations();

    const std::string& path() const { return path_; }

private:
    void enableWAL();
    void createMigrationsTable();
    int getCurrentVersion();
    void setVersion(int version);

    std::string path_;
    OpenMode mode_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
    std::mutex transactionMutex_;
};

} // namespace pingsweep::infra
