#pragma once

#include "core/services/IReachabilityProbe.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/ResultRepository.hpp"
#include "infrastructure/storage/RunLogWriter.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace pingsweep::app {

/**
 * @brief How the process was started.
 */
struct RuntimeOptions {
    std::filesystem::path baseDir;                   ///< Root for config, logs and outputs
    std::optional<std::filesystem::path> configPath; ///< Overrides <base>/config/pingsweep.json
    bool verbose{false};                             ///< Debug output on the console
    bool fileLogging{true};                          ///< Attach the rotating file sink
    std::shared_ptr<core::IReachabilityProbe> probe; ///< Replaces the configured primitive
};

/**
 * @brief Process-wide state, constructed once and torn down explicitly.
 *
 * Loads the configuration, installs the logger, ensures the results and
 * analysis directories exist, selects the reachability primitive, and opens
 * the result store when persistence is enabled. The destructor flushes the
 * logger.
 */
class RuntimeContext {
public:
    /**
     * @throws core::ConfigError if the configuration cannot be loaded.
     */
    explicit RuntimeContext(const RuntimeOptions& options);
    ~RuntimeContext();

    RuntimeContext(const RuntimeContext&) = delete;
    RuntimeContext& operator=(const RuntimeContext&) = delete;

    const infra::AppConfig& config() const { return configManager_.config(); }
    const std::filesystem::path& baseDir() const { return baseDir_; }
    const std::filesystem::path& resultsDir() const { return resultsDir_; }
    const std::filesystem::path& analysisDir() const { return analysisDir_; }
    std::filesystem::path sqlDir() const { return resolve(config().sqlDir); }

    /**
     * @brief Interprets a configured path relative to the base directory.
     */
    std::filesystem::path resolve(const std::string& path) const;

    std::shared_ptr<core::IReachabilityProbe> probe() const { return probe_; }

    /**
     * @brief The SQLite result store, or nullptr when persistence is disabled.
     */
    std::shared_ptr<infra::ResultRepository> store() const { return store_; }

    infra::RunLogWriter& writer() { return *writer_; }

    /**
     * @brief Installs the default "pingsweep" logger (console plus rotating file).
     */
    static void initializeLogging(const infra::AppConfig& config,
                                  const std::filesystem::path& baseDir, bool verbose,
                                  bool fileLogging);

private:
    void ensureDirectories();
    void createProbe(const RuntimeOptions& options);
    void openStore();

    std::filesystem::path baseDir_;
    infra::ConfigManager configManager_;
    std::filesystem::path resultsDir_;
    std::filesystem::path analysisDir_;
    std::shared_ptr<core::IReachabilityProbe> probe_;
    std::shared_ptr<infra::Database> database_;
    std::shared_ptr<infra::ResultRepository> store_;
    std::unique_ptr<infra::RunLogWriter> writer_;
};

} // namespace pingsweep::app
