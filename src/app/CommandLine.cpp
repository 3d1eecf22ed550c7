#include "app/CommandLine.hpp"

#include <set>

namespace pingsweep::app {

namespace {

const std::set<std::string> COMMANDS = {"check", "analyze", "daemon", "stats"};

std::optional<int> parsePositive(const std::string& option, const std::string& value,
                                 std::string& error) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed < 1) {
            error = option + " expects a positive integer, got '" + value + "'";
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        error = option + " expects a positive integer, got '" + value + "'";
        return std::nullopt;
    }
}

} // namespace

std::optional<CommandLine> parseCommandLine(const std::vector<std::string>& args,
                                            std::string& error) {
    CommandLine cli;
    error.clear();

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        auto nextValue = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                error = arg + " requires a value";
                return std::nullopt;
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        }
        if (arg == "-v" || arg == "--verbose") {
            cli.verbose = true;
        } else if (arg == "--base-dir") {
            auto value = nextValue();
            if (!value) return std::nullopt;
            cli.baseDir = *value;
        } else if (arg == "--config") {
            auto value = nextValue();
            if (!value) return std::nullopt;
            cli.configPath = *value;
        } else if (arg == "-t" || arg == "--timeout" || arg == "-c" || arg == "--count" ||
                   arg == "-w" || arg == "--workers" || arg == "--hours") {
            auto value = nextValue();
            if (!value) return std::nullopt;
            auto parsed = parsePositive(arg, *value, error);
            if (!parsed) return std::nullopt;

            if (arg == "-t" || arg == "--timeout") {
                cli.timeout = parsed;
            } else if (arg == "-c" || arg == "--count") {
                cli.count = parsed;
            } else if (arg == "-w" || arg == "--workers") {
                cli.workers = parsed;
            } else {
                cli.hours = *parsed;
            }
        } else if (arg == "--query") {
            auto value = nextValue();
            if (!value) return std::nullopt;
            cli.query = *value;
        } else if (arg == "--job") {
            auto value = nextValue();
            if (!value) return std::nullopt;
            cli.jobName = *value;
        } else if (!arg.empty() && arg.front() == '-') {
            error = "Unknown option: " + arg;
            return std::nullopt;
        } else if (cli.command.empty()) {
            if (!COMMANDS.contains(arg)) {
                error = "Unknown command: " + arg;
                return std::nullopt;
            }
            cli.command = arg;
        } else if (cli.command == "check" && !cli.targetFile) {
            cli.targetFile = arg;
        } else {
            error = "Unexpected argument: " + arg;
            return std::nullopt;
        }
    }

    if (cli.command.empty()) {
        error = "No command given";
        return std::nullopt;
    }
    if (cli.command == "check") {
        if (cli.targetFile && cli.query) {
            error = "check takes either a target file or --query, not both";
            return std::nullopt;
        }
        if (!cli.targetFile && !cli.query) {
            error = "check requires a target file or --query";
            return std::nullopt;
        }
    }

    return cli;
}

void printUsage(std::ostream& out) {
    out << "Usage: pingsweep [--base-dir DIR] [--config FILE] <command> [options]\n"
           "\n"
           "Commands:\n"
           "  check <target-file>   Probe every target once and write run logs\n"
           "      -t, --timeout N   Reply timeout in seconds (default from config)\n"
           "      -c, --count N     Echo requests per target\n"
           "      -w, --workers N   Concurrent probes\n"
           "      --query FILE      Load targets from an inventory query instead\n"
           "      --job NAME        Tag the run logs with a job name\n"
           "      -v, --verbose     Print every target, not only failures\n"
           "  analyze               Classify targets from all run logs\n"
           "  daemon                Run the scheduled jobs until SIGINT/SIGTERM\n"
           "  stats [--hours N]     Summarize stored results (persistence enabled)\n"
           "\n"
           "Exit codes: check 0 all reachable, 1 any unreachable, 2 could not run;\n"
           "daemon 0 clean shutdown, 2 no valid jobs, 3 shutdown timeout.\n";
}

} // namespace pingsweep::app
