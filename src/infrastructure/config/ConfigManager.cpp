#include "infrastructure/config/ConfigManager.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <set>

namespace pingsweep::infra {

namespace {

core::ProbeParameters parseParameters(const nlohmann::json& j, const char* timeoutKey,
                                      const core::ProbeParameters& defaults) {
    core::ProbeParameters params;
    params.timeout = std::chrono::seconds(j.value(timeoutKey, static_cast<int>(defaults.timeout.count())));
    params.count = j.value("count", defaults.count);
    params.workers = j.value("workers", defaults.workers);
    return params;
}

std::optional<core::JobDefinition> parseJob(const nlohmann::json& j, size_t index,
                                            const core::ProbeParameters& defaults) {
    if (!j.is_object()) {
        spdlog::warn("Skipping job #{}: not an object", index);
        return std::nullopt;
    }

    auto name = j.value("name", std::string{});
    if (name.empty()) {
        spdlog::warn("Skipping job #{}: missing name", index);
        return std::nullopt;
    }

    auto scheduleText = j.value("schedule", std::string{});
    if (scheduleText.empty()) {
        spdlog::warn("Skipping job '{}': missing schedule", name);
        return std::nullopt;
    }

    if (j.contains("target_file") && j.contains("query")) {
        spdlog::warn("Skipping job '{}': target_file and query are mutually exclusive", name);
        return std::nullopt;
    }

    core::JobDefinition job;
    job.name = name;
    if (j.contains("target_file")) {
        job.source.targetFile = j["target_file"].get<std::string>();
    }
    if (j.contains("query")) {
        job.source.query = j["query"].get<std::string>();
    }
    job.parameters = parseParameters(j, "timeout", defaults);
    job.enabled = j.value("enabled", true);

    try {
        job.schedule = core::CronSchedule::parse(scheduleText);
    } catch (const core::CronParseError& e) {
        spdlog::warn("Skipping job '{}': {}", name, e.what());
        return std::nullopt;
    }

    if (!job.isValid()) {
        spdlog::warn("Skipping job '{}': timeout, count and workers must be >= 1 and the "
                     "source must not be empty",
                     name);
        return std::nullopt;
    }
    return job;
}

} // namespace

std::string probeMethodToString(ProbeMethod method) {
    return method == ProbeMethod::Icmp ? "icmp" : "system";
}

std::optional<ProbeMethod> probeMethodFromString(const std::string& str) {
    if (str == "system")
        return ProbeMethod::System;
    if (str == "icmp")
        return ProbeMethod::Icmp;
    return std::nullopt;
}

ConfigManager::ConfigManager(std::filesystem::path configPath)
    : configPath_(std::move(configPath)) {}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, writing defaults to {}", configPath_.string());
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::debug("Loaded configuration from {} ({} jobs)", configPath_.string(),
                      config_.jobs.size());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config {}: {}", configPath_.string(), e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        if (configPath_.has_parent_path()) {
            std::filesystem::create_directories(configPath_.parent_path());
        }

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2) << '\n';
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Paths
    j["paths"]["results_dir"] = config_.resultsDir;
    j["paths"]["analysis_dir"] = config_.analysisDir;
    j["paths"]["sql_dir"] = config_.sqlDir;

    // Probe defaults
    j["probe"]["method"] = probeMethodToString(config_.probeMethod);
    j["probe"]["timeout_seconds"] = config_.probeDefaults.timeout.count();
    j["probe"]["count"] = config_.probeDefaults.count;
    j["probe"]["workers"] = config_.probeDefaults.workers;

    // Persistence
    j["persistence"]["enabled"] = config_.persistenceEnabled;
    j["persistence"]["database"] = config_.persistenceDatabase;
    j["persistence"]["batch_size"] = config_.persistenceBatchSize;

    // Inventory
    j["inventory"]["database"] = config_.inventoryDatabase;
    j["inventory"]["default_query"] = config_.defaultQuery;

    // Scheduler
    j["scheduler"]["poll_interval_seconds"] = config_.pollIntervalSeconds;
    j["scheduler"]["shutdown_grace_seconds"] = config_.shutdownGraceSeconds;

    // Logging
    j["logging"]["level"] = config_.logLevel;
    j["logging"]["file"] = config_.logFile;
    j["logging"]["max_size_mb"] = config_.logMaxSizeMb;
    j["logging"]["max_files"] = config_.logMaxFiles;

    // Jobs
    j["jobs"] = nlohmann::json::array();
    for (const auto& job : config_.jobs) {
        nlohmann::json entry;
        entry["name"] = job.name;
        if (job.source.targetFile) {
            entry["target_file"] = *job.source.targetFile;
        }
        if (job.source.query) {
            entry["query"] = *job.source.query;
        }
        entry["schedule"] = job.schedule.expression();
        entry["timeout"] = job.parameters.timeout.count();
        entry["count"] = job.parameters.count;
        entry["workers"] = job.parameters.workers;
        entry["enabled"] = job.enabled;
        j["jobs"].push_back(entry);
    }

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig config;

    // Paths
    if (j.contains("paths")) {
        const auto& p = j["paths"];
        config.resultsDir = p.value("results_dir", "logs");
        config.analysisDir = p.value("analysis_dir", ".");
        config.sqlDir = p.value("sql_dir", "data/sql");
    }

    // Probe defaults
    if (j.contains("probe")) {
        const auto& p = j["probe"];
        auto method = p.value("method", "system");
        auto parsed = probeMethodFromString(method);
        if (!parsed) {
            throw core::ConfigError("Unknown probe method: " + method);
        }
        config.probeMethod = *parsed;
        config.probeDefaults = parseParameters(p, "timeout_seconds", core::ProbeParameters{});
        if (!config.probeDefaults.isValid()) {
            throw core::ConfigError("probe.timeout_seconds, probe.count and probe.workers must be >= 1");
        }
    }

    // Persistence
    if (j.contains("persistence")) {
        const auto& p = j["persistence"];
        config.persistenceEnabled = p.value("enabled", false);
        config.persistenceDatabase = p.value("database", "pingsweep.db");
        auto batchSize = p.value("batch_size", 50);
        if (batchSize < 1) {
            throw core::ConfigError("persistence.batch_size must be >= 1");
        }
        config.persistenceBatchSize = static_cast<size_t>(batchSize);
    }

    // Inventory
    if (j.contains("inventory")) {
        const auto& i = j["inventory"];
        config.inventoryDatabase = i.value("database", "");
        config.defaultQuery = i.value("default_query", "get_ips.sql");
    }

    // Scheduler
    if (j.contains("scheduler")) {
        const auto& s = j["scheduler"];
        config.pollIntervalSeconds = s.value("poll_interval_seconds", 15);
        config.shutdownGraceSeconds = s.value("shutdown_grace_seconds", 60);
        if (config.pollIntervalSeconds < 1 || config.shutdownGraceSeconds < 0) {
            throw core::ConfigError("scheduler intervals must not be negative or zero");
        }
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config.logLevel = l.value("level", "info");
        config.logFile = l.value("file", "pingsweep.log");
        config.logMaxSizeMb = l.value("max_size_mb", 5);
        config.logMaxFiles = l.value("max_files", 3);
    }

    // Jobs
    if (j.contains("jobs")) {
        if (!j["jobs"].is_array()) {
            throw core::ConfigError("jobs must be an array");
        }
        config.jobs = parseJobs(j["jobs"], config.probeDefaults);
    }

    config_ = std::move(config);
}

std::vector<core::JobDefinition> ConfigManager::parseJobs(const nlohmann::json& jobs,
                                                          const core::ProbeParameters& defaults) {
    std::vector<core::JobDefinition> result;
    std::set<std::string> names;

    size_t index = 0;
    for (const auto& entry : jobs) {
        ++index;
        std::optional<core::JobDefinition> job;
        try {
            job = parseJob(entry, index, defaults);
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Skipping job #{}: {}", index, e.what());
            continue;
        }
        if (!job) {
            continue;
        }
        if (!names.insert(job->name).second) {
            spdlog::warn("Skipping job #{}: duplicate name '{}'", index, job->name);
            continue;
        }
        result.push_back(std::move(*job));
    }

    return result;
}

} // namespace pingsweep::infra
