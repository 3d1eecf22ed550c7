#include <catch2/catch_test_macros.hpp>

#include "core/Errors.hpp"
#include "infrastructure/analysis/HistoryAnalyzer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace pingsweep::core;
using namespace pingsweep::infra;

namespace {

class TestHistoryDir {
public:
    TestHistoryDir()
        : root_(std::filesystem::temp_directory_path() / "pingsweep_history_test"),
          results_(root_ / "logs"),
          analysis_(root_ / "analysis") {
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(results_);
    }

    ~TestHistoryDir() { std::filesystem::remove_all(root_); }

    void writeRun(const std::string& stem, const std::vector<std::string>& successes,
                  const std::vector<std::string>& failures) const {
        if (!successes.empty()) {
            std::ofstream file(results_ / (stem + "_successful.txt"));
            for (const auto& id : successes) {
                file << id << "\tSUCCESS\t1.000ms\n";
            }
        }
        if (!failures.empty()) {
            std::ofstream file(results_ / (stem + "_failed.txt"));
            for (const auto& id : failures) {
                file << id << "\tFAILED\ttimeout\n";
            }
        }
    }

    void writeRaw(const std::string& name, const std::string& content) const {
        std::ofstream file(results_ / name);
        file << content;
    }

    const std::filesystem::path& results() const { return results_; }
    const std::filesystem::path& analysis() const { return analysis_; }

private:
    std::filesystem::path root_;
    std::filesystem::path results_;
    std::filesystem::path analysis_;
};

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

TEST_CASE("History classification scenarios", "[HistoryAnalyzer]") {
    TestHistoryDir dir;
    HistoryAnalyzer analyzer(dir.results(), dir.analysis());

    SECTION("Always failing target is in Never without a rate") {
        dir.writeRun("20240101_000000_000", {"8.8.8.8"}, {"10.0.0.9"});
        dir.writeRun("20240101_001500_000", {"8.8.8.8"}, {"10.0.0.9"});
        dir.writeRun("20240101_003000_000", {"8.8.8.8"}, {"10.0.0.9"});

        auto report = analyzer.analyze();
        REQUIRE(report.neverCount == 1);
        REQUIRE(report.alwaysCount == 1);
        REQUIRE(report.sometimesCount == 0);

        REQUIRE(readFile(report.neverFile) == "# Targets that never responded\n"
                                              "# Total: 1\n"
                                              "# Format: IDENTIFIER\n"
                                              "10.0.0.9\n");
        REQUIRE(readFile(report.alwaysFile) == "# Targets that always responded\n"
                                               "# Total: 1\n"
                                               "# Format: IDENTIFIER\n"
                                               "8.8.8.8\n");
    }

    SECTION("Two of four successes is Sometimes at 50.0%") {
        dir.writeRun("20240101_000000_000", {"10.0.0.5"}, {});
        dir.writeRun("20240101_001500_000", {}, {"10.0.0.5"});
        dir.writeRun("20240101_003000_000", {"10.0.0.5"}, {});
        dir.writeRun("20240101_004500_000", {}, {"10.0.0.5"});

        auto report = analyzer.analyze();
        REQUIRE(report.sometimesCount == 1);
        REQUIRE(readFile(report.sometimesFile) == "# Targets that sometimes responded\n"
                                                  "# Total: 1\n"
                                                  "# Format: IDENTIFIER\tSUCCESS_RATE\n"
                                                  "10.0.0.5\t50.0%\n");
    }
}

TEST_CASE("History partition", "[HistoryAnalyzer]") {
    TestHistoryDir dir;
    dir.writeRun("run1", {"a.example", "b.example", "c.example"}, {"d.example"});
    dir.writeRun("run2", {"a.example", "b.example"}, {"c.example", "d.example"});
    dir.writeRun("run3", {"a.example"}, {"b.example", "d.example", "e.example"});

    HistoryAnalyzer analyzer(dir.results(), dir.analysis());
    auto report = analyzer.analyze();

    SECTION("Every identifier lands in exactly one category") {
        REQUIRE(report.records.size() == 5);
        REQUIRE(report.alwaysCount + report.neverCount + report.sometimesCount ==
                report.records.size());
        REQUIRE(report.alwaysCount == 1);
        REQUIRE(report.neverCount == 2);
        REQUIRE(report.sometimesCount == 2);
    }

    SECTION("Records are sorted and counted") {
        REQUIRE(report.records.front().identifier == "a.example");
        REQUIRE(report.records.back().identifier == "e.example");

        const auto& b = report.records[1];
        REQUIRE(b.identifier == "b.example");
        REQUIRE(b.total == 3);
        REQUIRE(b.successes == 2);
    }

    SECTION("Rates are rendered with one decimal") {
        auto sometimes = readFile(report.sometimesFile);
        REQUIRE(sometimes.find("b.example\t66.7%\n") != std::string::npos);
        REQUIRE(sometimes.find("c.example\t50.0%\n") != std::string::npos);
    }

    SECTION("Scan counters") {
        REQUIRE(report.successFilesScanned == 3);
        REQUIRE(report.failureFilesScanned == 3);
    }
}

TEST_CASE("History analysis is idempotent", "[HistoryAnalyzer]") {
    TestHistoryDir dir;
    dir.writeRun("run1", {"a.example"}, {"b.example"});
    dir.writeRun("run2", {"b.example"}, {"a.example", "c.example"});

    HistoryAnalyzer analyzer(dir.results(), dir.analysis());
    auto first = analyzer.analyze();
    auto never = readFile(first.neverFile);
    auto always = readFile(first.alwaysFile);
    auto sometimes = readFile(first.sometimesFile);

    auto second = analyzer.analyze();
    REQUIRE(readFile(second.neverFile) == never);
    REQUIRE(readFile(second.alwaysFile) == always);
    REQUIRE(readFile(second.sometimesFile) == sometimes);
    REQUIRE(first.records == second.records);
}

TEST_CASE("History input handling", "[HistoryAnalyzer]") {
    TestHistoryDir dir;
    HistoryAnalyzer analyzer(dir.results(), dir.analysis());

    SECTION("Ignores other files, comments and malformed lines") {
        dir.writeRun("run1", {"a.example"}, {});
        dir.writeRaw("run1_invalid.txt", "bad..ip\tINVALID\tline 1: bad..ip\n");
        dir.writeRaw("notes.txt", "x.example\tSUCCESS\t1ms\n");
        dir.writeRaw("run2_failed.txt", "# comment\n\nno-tab-here\na.example\tFAILED\ttimeout\n");

        auto report = analyzer.analyze();
        REQUIRE(report.records.size() == 1);
        REQUIRE(report.records[0].identifier == "a.example");
        REQUIRE(report.records[0].total == 2);
        REQUIRE(report.sometimesCount == 1);
    }

    SECTION("Empty results directory writes empty reports") {
        auto report = analyzer.analyze();
        REQUIRE(report.records.empty());
        REQUIRE(readFile(report.alwaysFile) == "# Targets that always responded\n"
                                               "# Total: 0\n"
                                               "# Format: IDENTIFIER\n");
        REQUIRE_FALSE(std::filesystem::exists(dir.analysis() / "analysis_never_responded.txt.tmp"));
    }

    SECTION("Missing results directory is reported") {
        HistoryAnalyzer missing(dir.results() / "nope", dir.analysis());
        REQUIRE_THROWS_AS(missing.analyze(), SourceNotFoundError);
    }
}

TEST_CASE("History rendering", "[HistoryAnalyzer]") {
    std::vector<HistoryRecord> records{
        {.identifier = "z.example", .total = 2, .successes = 2},
        {.identifier = "m.example", .total = 3, .successes = 1},
        {.identifier = "a.example", .total = 2, .successes = 2},
    };

    REQUIRE(HistoryAnalyzer::render(Classification::Always, records) ==
            "# Targets that always responded\n# Total: 2\n# Format: IDENTIFIER\n"
            "a.example\nz.example\n");
    REQUIRE(HistoryAnalyzer::render(Classification::Sometimes, records) ==
            "# Targets that sometimes responded\n# Total: 1\n"
            "# Format: IDENTIFIER\tSUCCESS_RATE\nm.example\t33.3%\n");
}
