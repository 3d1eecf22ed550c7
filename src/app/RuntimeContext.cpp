#include "app/RuntimeContext.hpp"

#include "core/Errors.hpp"
#include "infrastructure/network/IcmpEchoProbe.hpp"
#include "infrastructure/network/SystemPingProbe.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace pingsweep::app {

namespace {

std::filesystem::path defaultConfigPath(const std::filesystem::path& baseDir) {
    return baseDir / "config" / "pingsweep.json";
}

} // namespace

RuntimeContext::RuntimeContext(const RuntimeOptions& options)
    : baseDir_(std::filesystem::absolute(options.baseDir.empty() ? std::filesystem::current_path()
                                                                 : options.baseDir)),
      configManager_(options.configPath ? *options.configPath : defaultConfigPath(baseDir_)) {
    if (!configManager_.load()) {
        throw core::ConfigError("Cannot load configuration from " +
                                configManager_.configPath().string());
    }

    initializeLogging(config(), baseDir_, options.verbose, options.fileLogging);

    resultsDir_ = resolve(config().resultsDir);
    analysisDir_ = resolve(config().analysisDir);
    ensureDirectories();

    createProbe(options);
    if (config().persistenceEnabled) {
        openStore();
    }

    writer_ = std::make_unique<infra::RunLogWriter>(resultsDir_, store_,
                                                    config().persistenceBatchSize);

    spdlog::debug("Runtime context ready (base {}, results {}, probe {})", baseDir_.string(),
                  resultsDir_.string(), probe_->name());
}

RuntimeContext::~RuntimeContext() {
    spdlog::debug("Runtime context shutting down");
    writer_.reset();
    store_.reset();
    database_.reset();
    if (auto logger = spdlog::default_logger()) {
        logger->flush();
    }
}

std::filesystem::path RuntimeContext::resolve(const std::string& path) const {
    std::filesystem::path candidate(path);
    if (candidate.is_absolute()) {
        return candidate;
    }
    return (baseDir_ / candidate).lexically_normal();
}

void RuntimeContext::initializeLogging(const infra::AppConfig& config,
                                       const std::filesystem::path& baseDir, bool verbose,
                                       bool fileLogging) {
    auto consoleLevel = verbose ? spdlog::level::debug : spdlog::level::from_str(config.logLevel);

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(consoleLevel);

    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    if (fileLogging && !config.logFile.empty()) {
        std::filesystem::path logPath(config.logFile);
        if (logPath.is_relative()) {
            logPath = baseDir / logPath;
        }
        if (logPath.has_parent_path()) {
            std::filesystem::create_directories(logPath.parent_path());
        }

        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), static_cast<size_t>(config.logMaxSizeMb) * 1024 * 1024,
            static_cast<size_t>(config.logMaxFiles));
        fileSink->set_level(spdlog::level::debug);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("pingsweep", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

void RuntimeContext::ensureDirectories() {
    std::filesystem::create_directories(resultsDir_);
    std::filesystem::create_directories(analysisDir_);
}

void RuntimeContext::createProbe(const RuntimeOptions& options) {
    if (options.probe) {
        probe_ = options.probe;
        return;
    }

    switch (config().probeMethod) {
    case infra::ProbeMethod::Icmp:
        probe_ = std::make_shared<infra::IcmpEchoProbe>();
        break;
    case infra::ProbeMethod::System:
        probe_ = std::make_shared<infra::SystemPingProbe>();
        break;
    }
}

void RuntimeContext::openStore() {
    auto path = resolve(config().persistenceDatabase);
    try {
        database_ = std::make_shared<infra::Database>(path.string());
        database_->runMigrations();
        store_ = std::make_shared<infra::ResultRepository>(database_);
        spdlog::info("Result store: {}", path.string());
    } catch (const std::exception& e) {
        spdlog::error("Result store unavailable ({}): {}", path.string(), e.what());
        store_.reset();
        database_.reset();
    }
}

} // namespace pingsweep::app
