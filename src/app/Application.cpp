#include "app/Application.hpp"

#include "core/Errors.hpp"
#include "infrastructure/analysis/HistoryAnalyzer.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/scheduler/JobScheduler.hpp"

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace pingsweep::app {

namespace {

std::string formatLocal(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace

Application::Application(CommandLine commandLine, std::ostream& out, RuntimeOptions options)
    : commandLine_(std::move(commandLine)), out_(out), options_(std::move(options)) {
    if (!commandLine_.baseDir.empty()) {
        options_.baseDir = commandLine_.baseDir;
    }
    if (commandLine_.configPath) {
        options_.configPath = commandLine_.configPath;
    }
    options_.verbose = options_.verbose || commandLine_.verbose;
}

Application::~Application() = default;

int Application::run() {
    try {
        context_ = std::make_unique<RuntimeContext>(options_);
    } catch (const core::ConfigError& e) {
        spdlog::error("{}", e.what());
        return EXIT_CANNOT_RUN;
    }

    if (commandLine_.command == "check") {
        return runCheck();
    }
    if (commandLine_.command == "analyze") {
        return runAnalyze();
    }
    if (commandLine_.command == "daemon") {
        return runDaemon();
    }
    if (commandLine_.command == "stats") {
        return runStats();
    }

    spdlog::error("Unknown command '{}'", commandLine_.command);
    return EXIT_CANNOT_RUN;
}

int Application::runCheck() {
    auto parameters = context_->config().probeDefaults;
    if (commandLine_.timeout) {
        parameters.timeout = std::chrono::seconds(*commandLine_.timeout);
    }
    if (commandLine_.count) {
        parameters.count = *commandLine_.count;
    }
    if (commandLine_.workers) {
        parameters.workers = *commandLine_.workers;
    }
    if (!parameters.isValid()) {
        spdlog::error("Invalid probe parameters (timeout {}s, count {}, workers {})",
                      parameters.timeout.count(), parameters.count, parameters.workers);
        return EXIT_CANNOT_RUN;
    }

    core::TargetSourceSpec spec{.targetFile = commandLine_.targetFile,
                                .query = commandLine_.query};

    RunPipeline pipeline(*context_);
    RunOutcome outcome;
    try {
        outcome = pipeline.run(spec, parameters, commandLine_.jobName, {}, true);
    } catch (const core::SourceNotFoundError& e) {
        spdlog::error("{}", e.what());
        return EXIT_CANNOT_RUN;
    } catch (const core::EmptySourceError& e) {
        spdlog::error("{}", e.what());
        return EXIT_CANNOT_RUN;
    }

    if (outcome.noValidTargets()) {
        spdlog::error("No valid targets in {} ({} invalid entries)", spec.describe(),
                      outcome.batch.invalid.size());
        return EXIT_CANNOT_RUN;
    }

    printResults(outcome);
    return outcome.batch.allReachable() ? EXIT_OK : EXIT_FAILURES;
}

void Application::printResults(const RunOutcome& outcome) const {
    const auto& batch = outcome.batch;

    for (const auto& result : batch.results) {
        if (!commandLine_.verbose && result.success) {
            continue;
        }
        out_ << (result.success ? "  OK      " : "  FAILED  ") << result.identifier;
        if (result.label) {
            out_ << " (" << *result.label << ")";
        }
        out_ << "  " << result.detailText() << "\n";
    }

    out_ << "\nResults: " << batch.successCount() << " reachable, " << batch.failureCount()
         << " unreachable";
    if (!batch.invalid.empty()) {
        out_ << ", " << batch.invalid.size() << " invalid";
    }
    if (outcome.duplicatesDropped > 0) {
        out_ << ", " << outcome.duplicatesDropped << " duplicates skipped";
    }
    out_ << "\n";
    out_ << "Completed in " << std::fixed << std::setprecision(2)
         << static_cast<double>(outcome.elapsed.count()) / 1000.0 << "s\n";

    const auto& paths = outcome.report.paths;
    for (const auto& file : {paths.successful, paths.failed, paths.invalid}) {
        if (file) {
            out_ << "Wrote " << file->string() << "\n";
        }
    }
    if (outcome.report.persistenceError) {
        out_ << "Warning: results not stored: " << *outcome.report.persistenceError << "\n";
    }
}

int Application::runAnalyze() {
    infra::HistoryAnalyzer analyzer(context_->resultsDir(), context_->analysisDir());

    infra::AnalysisReport report;
    try {
        report = analyzer.analyze();
    } catch (const core::SourceNotFoundError& e) {
        spdlog::error("{}", e.what());
        return EXIT_CANNOT_RUN;
    }

    out_ << "Scanned " << report.successFilesScanned << " success and "
         << report.failureFilesScanned << " failure logs\n";
    out_ << "Always responded:    " << report.alwaysCount << "  -> "
         << report.alwaysFile.string() << "\n";
    out_ << "Never responded:     " << report.neverCount << "  -> "
         << report.neverFile.string() << "\n";
    out_ << "Sometimes responded: " << report.sometimesCount << "  -> "
         << report.sometimesFile.string() << "\n";
    if (report.unreadableFiles > 0) {
        out_ << "Skipped " << report.unreadableFiles << " unreadable files\n";
    }
    return EXIT_OK;
}

int Application::runDaemon() {
    const auto& config = context_->config();
    if (config.jobs.empty()) {
        spdlog::error("No valid jobs in {}", options_.configPath
                                                 ? options_.configPath->string()
                                                 : std::string("the configuration"));
        return EXIT_CANNOT_RUN;
    }

    RunPipeline pipeline(*context_);
    infra::JobScheduler scheduler(
        [&pipeline](const core::JobDefinition& job, std::stop_token stopToken) {
            pipeline.runJob(job, stopToken);
        },
        std::chrono::seconds(config.pollIntervalSeconds));

    for (const auto& job : config.jobs) {
        scheduler.addJob(job);
    }
    if (scheduler.jobCount() == 0) {
        spdlog::error("No job could be scheduled");
        return EXIT_CANNOT_RUN;
    }

    std::mutex mutex;
    std::condition_variable shutdownRequested;
    int receivedSignal = 0;

    infra::AsioContext signalContext(1);
    signalContext.start();
    signalContext.onSignals({SIGINT, SIGTERM}, [&](int signalNumber) {
        std::lock_guard lock(mutex);
        receivedSignal = signalNumber;
        shutdownRequested.notify_all();
    });

    scheduler.start();
    spdlog::info("Daemon running with {} jobs (base {})", scheduler.jobCount(),
                 context_->baseDir().string());

    {
        std::unique_lock lock(mutex);
        shutdownRequested.wait(lock, [&]() { return receivedSignal != 0; });
    }
    spdlog::info("Received signal {}, shutting down", receivedSignal);
    signalContext.stop();

    auto grace = std::chrono::seconds(config.shutdownGraceSeconds);
    if (!scheduler.stop(grace)) {
        spdlog::critical("Jobs still running after {}s, exiting without waiting",
                         grace.count());
        spdlog::shutdown();
        std::_Exit(EXIT_SHUTDOWN_TIMEOUT);
    }

    spdlog::info("Daemon stopped");
    return EXIT_OK;
}

int Application::runStats() {
    auto store = context_->store();
    if (!store) {
        spdlog::error("stats needs persistence enabled and a reachable result store");
        return EXIT_CANNOT_RUN;
    }

    auto since = std::chrono::system_clock::now() - std::chrono::hours(commandLine_.hours);
    std::vector<core::StoredStatistics> rows;
    try {
        rows = store->summarize(since);
    } catch (const core::PersistenceError& e) {
        spdlog::error("{}", e.what());
        return EXIT_CANNOT_RUN;
    }

    out_ << "Results since " << formatLocal(since) << " (" << rows.size() << " targets)\n";
    out_ << std::left << std::setw(40) << "IDENTIFIER" << std::right << std::setw(8) << "PROBES"
         << std::setw(8) << "OK" << std::setw(9) << "RATE" << "  LAST SEEN\n";
    for (const auto& row : rows) {
        out_ << std::left << std::setw(40) << row.identifier << std::right << std::setw(8)
             << row.total << std::setw(8) << row.successes << std::setw(8) << std::fixed
             << std::setprecision(1) << row.successRate() << "%"
             << "  " << formatLocal(row.lastSeen) << "\n";
    }
    return EXIT_OK;
}

} // namespace pingsweep::app
