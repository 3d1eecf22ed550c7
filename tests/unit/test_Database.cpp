#include <catch2/catch_test_macros.hpp>

#include "core/Errors.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/ResultRepository.hpp"

#include <filesystem>

using namespace pingsweep::infra;
using namespace pingsweep::core;
using namespace std::chrono_literals;

namespace {

class TestDatabase {
public:
    TestDatabase() : dbPath_(std::filesystem::temp_directory_path() / "pingsweep_test.db") {
        // Remove existing test database
        std::filesystem::remove(dbPath_);

        db_ = std::make_shared<Database>(dbPath_.string());
        db_->runMigrations();
    }

    ~TestDatabase() {
        db_.reset();
        std::filesystem::remove(dbPath_);
        std::filesystem::remove(dbPath_.string() + "-wal");
        std::filesystem::remove(dbPath_.string() + "-shm");
    }

    std::shared_ptr<Database> get() { return db_; }
    const std::filesystem::path& path() const { return dbPath_; }

private:
    std::filesystem::path dbPath_;
    std::shared_ptr<Database> db_;
};

StoreContext makeContext(std::chrono::system_clock::time_point batchTimestamp,
                         std::optional<std::string> jobName = std::nullopt) {
    return StoreContext{.jobName = std::move(jobName),
                        .batchTimestamp = batchTimestamp,
                        .parameters = ProbeParameters{}};
}

} // namespace

TEST_CASE("Database operations", "[Database]") {
    TestDatabase testDb;
    auto db = testDb.get();

    SECTION("Execute simple SQL") {
        REQUIRE_NOTHROW(db->execute("SELECT 1"));
    }

    SECTION("Prepare and execute statement") {
        auto stmt = db->prepare("SELECT 1 + 1");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnInt(0) == 2);
        REQUIRE_FALSE(stmt.step());
    }

    SECTION("Transaction commit") {
        db->beginTransaction();
        db->execute("CREATE TABLE test_tx (id INTEGER PRIMARY KEY, value TEXT)");
        db->execute("INSERT INTO test_tx (value) VALUES ('test')");
        db->commit();

        auto stmt = db->prepare("SELECT value FROM test_tx");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnText(0) == "test");
    }

    SECTION("Transaction rollback") {
        db->execute("CREATE TABLE test_rb (id INTEGER PRIMARY KEY, value TEXT)");

        db->beginTransaction();
        db->execute("INSERT INTO test_rb (value) VALUES ('test')");
        db->rollback();

        auto stmt = db->prepare("SELECT COUNT(*) FROM test_rb");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnInt(0) == 0);
    }

    SECTION("Scoped transaction rolls back on exception") {
        db->execute("CREATE TABLE test_scoped (value TEXT)");

        REQUIRE_THROWS_AS(db->transaction([&]() {
            db->execute("INSERT INTO test_scoped (value) VALUES ('lost')");
            throw std::runtime_error("abort");
        }),
                          std::runtime_error);

        auto stmt = db->prepare("SELECT COUNT(*) FROM test_scoped");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnInt(0) == 0);
    }

    SECTION("Binding optional text") {
        db->execute("CREATE TABLE test_opt (value TEXT)");
        auto insert = db->prepare("INSERT INTO test_opt (value) VALUES (?)");
        insert.bind(1, std::optional<std::string>{});
        insert.step();

        auto stmt = db->prepare("SELECT value FROM test_opt");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnIsNull(0));
        REQUIRE(stmt.columnText(0).empty());
    }

    SECTION("Invalid SQL throws") {
        REQUIRE_THROWS(db->execute("NOT SQL"));
        REQUIRE_THROWS(db->prepare("SELECT FROM WHERE"));
    }

    SECTION("Migrations are applied once") {
        REQUIRE_NOTHROW(db->runMigrations());
        auto stmt = db->prepare("SELECT COUNT(*) FROM schema_migrations");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnInt(0) == 1);
    }
}

TEST_CASE("Read-only databases", "[Database]") {
    auto path = std::filesystem::temp_directory_path() / "pingsweep_readonly_test.db";
    std::filesystem::remove(path);

    SECTION("Missing file is not created") {
        REQUIRE_THROWS(Database(path.string(), Database::OpenMode::ReadOnly));
        REQUIRE_FALSE(std::filesystem::exists(path));
    }

    SECTION("Writes are refused") {
        {
            Database rw(path.string());
            rw.execute("PRAGMA journal_mode=DELETE");
            rw.execute("CREATE TABLE hosts (ip TEXT)");
        }
        Database ro(path.string(), Database::OpenMode::ReadOnly);
        REQUIRE_THROWS(ro.execute("INSERT INTO hosts (ip) VALUES ('10.0.0.1')"));
        REQUIRE_NOTHROW(ro.prepare("SELECT ip FROM hosts"));
    }

    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
}

TEST_CASE("ResultRepository operations", "[Database][ResultRepository]") {
    TestDatabase testDb;
    ResultRepository repo(testDb.get());

    auto now = std::chrono::system_clock::now();

    SECTION("Insert stores every column") {
        auto up = ProbeResult::reachable("8.8.8.8", std::chrono::microseconds(12345));
        up.label = "dns";
        auto down = ProbeResult::unreachable("10.0.0.9", FailureReason::Timeout, "no reply");

        repo.insertBatch({up, down}, makeContext(now, "core"));

        auto stmt = testDb.get()->prepare(
            "SELECT identifier, success, latency_us, reason, detail, label, job_name, "
            "timeout_seconds, probe_count FROM probe_results ORDER BY identifier");

        REQUIRE(stmt.step());
        REQUIRE(stmt.columnText(0) == "10.0.0.9");
        REQUIRE(stmt.columnInt(1) == 0);
        REQUIRE(stmt.columnIsNull(2));
        REQUIRE(stmt.columnText(3) == "timeout");
        REQUIRE(stmt.columnText(4) == "no reply");
        REQUIRE(stmt.columnText(6) == "core");
        REQUIRE(stmt.columnInt(7) == 3);
        REQUIRE(stmt.columnInt(8) == 1);

        REQUIRE(stmt.step());
        REQUIRE(stmt.columnText(0) == "8.8.8.8");
        REQUIRE(stmt.columnInt(1) == 1);
        REQUIRE(stmt.columnInt64(2) == 12345);
        REQUIRE(stmt.columnIsNull(3));
        REQUIRE(stmt.columnIsNull(4));
        REQUIRE(stmt.columnText(5) == "dns");

        REQUIRE_FALSE(stmt.step());
    }

    SECTION("Empty chunk is a no-op") {
        REQUIRE_NOTHROW(repo.insertBatch({}, makeContext(now)));
        REQUIRE(repo.summarize(now - 1h).empty());
    }

    SECTION("Summaries per identifier") {
        repo.insertBatch({ProbeResult::reachable("a.example", std::nullopt),
                          ProbeResult::unreachable("b.example", FailureReason::Timeout)},
                         makeContext(now - 2h));
        repo.insertBatch({ProbeResult::unreachable("a.example", FailureReason::Unreachable),
                          ProbeResult::unreachable("b.example", FailureReason::Timeout)},
                         makeContext(now - 1h));
        repo.insertBatch({ProbeResult::reachable("a.example", std::nullopt)},
                         makeContext(now - 48h));

        auto stats = repo.summarize(now - 3h);
        REQUIRE(stats.size() == 2);

        REQUIRE(stats[0].identifier == "a.example");
        REQUIRE(stats[0].total == 2);
        REQUIRE(stats[0].successes == 1);
        REQUIRE(stats[0].successRate() == 50.0);
        REQUIRE(stats[0].lastSeen > stats[0].firstSeen);

        REQUIRE(stats[1].identifier == "b.example");
        REQUIRE(stats[1].successes == 0);

        REQUIRE(repo.summarize(now - 72h)[0].total == 3);
    }

    SECTION("Write failures surface as persistence errors") {
        testDb.get()->execute("DROP TABLE probe_results");
        REQUIRE_THROWS_AS(
            repo.insertBatch({ProbeResult::reachable("a.example", std::nullopt)}, makeContext(now)),
            PersistenceError);
        REQUIRE_THROWS_AS(repo.summarize(now), PersistenceError);
    }
}
