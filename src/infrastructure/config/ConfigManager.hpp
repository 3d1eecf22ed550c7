#pragma once

#include "core/types/Job.hpp"
#include "core/types/ProbeBatch.hpp"

#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pingsweep::infra {

/**
 * @brief Which reachability primitive the process uses.
 */
enum class ProbeMethod { System, Icmp };

std::string probeMethodToString(ProbeMethod method);
std::optional<ProbeMethod> probeMethodFromString(const std::string& str);

/**
 * @brief Application configuration settings.
 *
 * Relative paths are interpreted against the base directory by the runtime
 * context, never against the working directory.
 */
struct AppConfig {
    // Paths
    std::string resultsDir{"logs"};    ///< Run-log directory.
    std::string analysisDir{"."};      ///< Directory for the three analysis files.
    std::string sqlDir{"data/sql"};    ///< Directory holding inventory queries.

    // Probe defaults
    ProbeMethod probeMethod{ProbeMethod::System}; ///< Reachability primitive.
    core::ProbeParameters probeDefaults;          ///< Timeout, count and workers.

    // Persistence
    bool persistenceEnabled{false};           ///< Forward batches to the result store.
    std::string persistenceDatabase{"pingsweep.db"}; ///< SQLite result store path.
    size_t persistenceBatchSize{50};          ///< Results per store call.

    // Inventory
    std::string inventoryDatabase;             ///< SQLite inventory; empty disables queries.
    std::string defaultQuery{"get_ips.sql"};   ///< Query used when a job names no source.

    // Scheduler
    int pollIntervalSeconds{15};     ///< Scheduler tick period.
    int shutdownGraceSeconds{60};    ///< Wait for running jobs on shutdown.

    // Logging
    std::string logLevel{"info"};        ///< Console log level.
    std::string logFile{"pingsweep.log"}; ///< Rotating log file.
    int logMaxSizeMb{5};                 ///< Size of one log file before rotation.
    int logMaxFiles{3};                  ///< Rotated files kept.

    // Jobs
    std::vector<core::JobDefinition> jobs; ///< Valid, uniquely named jobs.
};

/**
 * @brief Manages configuration persistence.
 *
 * Handles loading and saving of the application configuration from a JSON
 * file. A missing file is created with the defaults. Invalid job entries are
 * logged and skipped rather than failing the whole load.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config file.
     * @param configPath Path to the JSON configuration file.
     */
    explicit ConfigManager(std::filesystem::path configPath);

    /**
     * @brief Loads configuration from disk, writing defaults if the file is missing.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    const std::filesystem::path& configPath() const { return configPath_; }

    /**
     * @brief Parses the "jobs" array.
     * @param jobs JSON array of job objects.
     * @param defaults Probe parameters for fields a job leaves out.
     * @return Valid jobs in file order; the first of duplicate names wins.
     */
    static std::vector<core::JobDefinition> parseJobs(const nlohmann::json& jobs,
                                                      const core::ProbeParameters& defaults);

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace pingsweep::infra
