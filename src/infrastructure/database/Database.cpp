#include "infrastructure/database/Database.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace pingsweep::infra {

Statement::Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

void Statement::bind(int index, int value) {
    if (sqlite3_bind_int(stmt_, index, value) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind int parameter");
    }
}

void Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind int64 parameter");
    }
}

void Statement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind text parameter");
    }
}

void Statement::bind(int index, const std::optional<std::string>& value) {
    if (value) {
        bind(index, *value);
    } else {
        bindNull(index);
    }
}

void Statement::bindNull(int index) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind null parameter");
    }
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw std::runtime_error(std::string("SQLite step failed: ") + sqlite3_errstr(rc));
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int Statement::columnCount() const {
    return sqlite3_column_count(stmt_);
}

int Statement::columnInt(int index) const {
    return sqlite3_column_int(stmt_, index);
}

int64_t Statement::columnInt64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

std::string Statement::columnText(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? text : "";
}

bool Statement::columnIsNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

Database::Database(const std::string& path, OpenMode mode) : path_(path), mode_(mode) {
    spdlog::debug("Opening database: {} ({})", path,
                  mode == OpenMode::ReadOnly ? "read-only" : "read-write");

    int flags = SQLITE_OPEN_FULLMUTEX;
    flags |= mode == OpenMode::ReadOnly ? SQLITE_OPEN_READONLY
                                        : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database " + path + ": " + error);
    }

    sqlite3_busy_timeout(db_, 5000);

    if (mode_ == OpenMode::ReadWrite) {
        enableWAL();
        createMigrationsTable();
    }
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::enableWAL() {
    execute("PRAGMA journal_mode=WAL");
    execute("PRAGMA synchronous=NORMAL");
}

void Database::execute(const std::string& sql) {
    std::lock_guard lock(mutex_);
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw std::runtime_error("SQL execution failed: " + error);
    }
}

Statement Database::prepare(const std::string& sql) {
    std::lock_guard lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare statement: ") +
                                 sqlite3_errmsg(db_));
    }
    if (!stmt) {
        throw std::runtime_error("Statement is empty");
    }
    return Statement(stmt);
}

void Database::beginTransaction() {
    execute("BEGIN IMMEDIATE TRANSACTION");
}

void Database::commit() {
    execute("COMMIT");
}

void Database::rollback() {
    execute("ROLLBACK");
}

void Database::createMigrationsTable() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            applied_at TEXT DEFAULT CURRENT_TIMESTAMP
        )
    )");
}

int Database::getCurrentVersion() {
    auto stmt = prepare("SELECT MAX(version) FROM schema_migrations");
    if (stmt.step() && !stmt.columnIsNull(0)) {
        return stmt.columnInt(0);
    }
    return 0;
}

void Database::setVersion(int version) {
    auto stmt = prepare("INSERT INTO schema_migrations (version) VALUES (?)");
    stmt.bind(1, version);
    stmt.step();
}

void Database::runMigrations() {
    if (mode_ == OpenMode::ReadOnly) {
        throw std::runtime_error("Cannot migrate a read-only database: " + path_);
    }

    int currentVersion = getCurrentVersion();
    spdlog::debug("Result store schema version: {}", currentVersion);

    // Migration 1: probe results
    if (currentVersion < 1) {
        spdlog::info("Applying migration 1: probe_results");
        execute(R"(
            CREATE TABLE IF NOT EXISTS probe_results (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                identifier TEXT NOT NULL,
                batch_timestamp TEXT NOT NULL,
                completed_at TEXT NOT NULL,
                success INTEGER NOT NULL,
                latency_us INTEGER,
                reason TEXT,
                detail TEXT,
                label TEXT,
                job_name TEXT,
                timeout_seconds INTEGER,
                probe_count INTEGER,
                created_at TEXT DEFAULT CURRENT_TIMESTAMP
            )
        )");

        execute("CREATE INDEX IF NOT EXISTS idx_probe_results_identifier ON probe_results(identifier)");
        execute("CREATE INDEX IF NOT EXISTS idx_probe_results_batch ON probe_results(batch_timestamp)");
        execute("CREATE INDEX IF NOT EXISTS idx_probe_results_success ON probe_results(success)");
        execute("CREATE INDEX IF NOT EXISTS idx_probe_results_job ON probe_results(job_name)");

        setVersion(1);
    }

    spdlog::debug("Result store migrations complete. Version: {}", getCurrentVersion());
}

} // namespace pingsweep::infra
