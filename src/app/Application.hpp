#pragma once

#include "app/CommandLine.hpp"
#include "app/RunPipeline.hpp"
#include "app/RuntimeContext.hpp"

#include <memory>
#include <ostream>

namespace pingsweep::app {

/**
 * @brief Entry point behind main(): builds the runtime context and runs one command.
 */
class Application {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_FAILURES = 1;        ///< check: some target did not reply
    static constexpr int EXIT_CANNOT_RUN = 2;      ///< Missing source, bad config, no jobs
    static constexpr int EXIT_SHUTDOWN_TIMEOUT = 3; ///< daemon: running jobs did not finish

    /**
     * @param commandLine Parsed arguments.
     * @param out Stream for command results (console summary, stats table).
     * @param options Runtime options; baseDir, configPath and verbose are
     *        taken from the command line when set there.
     */
    Application(CommandLine commandLine, std::ostream& out, RuntimeOptions options = {});
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs the selected command.
     * @return Process exit code.
     */
    int run();

private:
    int runCheck();
    int runAnalyze();
    int runDaemon();
    int runStats();

    void printResults(const RunOutcome& outcome) const;

    CommandLine commandLine_;
    std::ostream& out_;
    RuntimeOptions options_;
    std::unique_ptr<RuntimeContext> context_;
};

} // namespace pingsweep::app
