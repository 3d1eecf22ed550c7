#include "infrastructure/network/SystemPingProbe.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

#if defined(__unix__) || defined(__APPLE__)
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace pingsweep::infra {

namespace {

constexpr size_t MAX_CAPTURED_OUTPUT = 64 * 1024;
constexpr int EXEC_FAILED_STATUS = 127;

} // namespace

SystemPingProbe::SystemPingProbe(PingCommand command) : command_(std::move(command)) {
    spdlog::debug("SystemPingProbe using '{}'", command_.program());
}

core::ProbeResult SystemPingProbe::probe(const std::string& identifier,
                                         const core::ProbeOptions& options,
                                         std::stop_token stopToken) {
    if (stopToken.stop_requested()) {
        return core::ProbeResult::unreachable(identifier, core::FailureReason::ToolError,
                                              "cancelled before start");
    }

    auto argv = command_.arguments(identifier, options);
    auto outcome = runProcess(argv, PingCommand::deadline(options));

    if (outcome.timedOut) {
        spdlog::debug("Ping to {} killed after deadline", identifier);
        return core::ProbeResult::unreachable(identifier, core::FailureReason::Timeout,
                                              "no reply before deadline");
    }

    auto result = PingCommand::classify(identifier, outcome.exitCode, outcome.output);
    spdlog::debug("Ping to {} exited with {}: {}", identifier, outcome.exitCode,
                  result.detailText());
    return result;
}

#if defined(__unix__) || defined(__APPLE__)

SystemPingProbe::ProcessOutcome SystemPingProbe::runProcess(const std::vector<std::string>& argv,
                                                            std::chrono::milliseconds deadline) {
    ProcessOutcome outcome;

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    // Close-on-exec so that children forked by other workers never inherit the pipe.
    int fds[2];
#ifdef __linux__
    if (pipe2(fds, O_CLOEXEC) != 0) {
#else
    if (pipe(fds) != 0) {
#endif
        outcome.output = std::string("pipe failed: ") + std::strerror(errno);
        return outcome;
    }
#ifndef __linux__
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif

    pid_t pid = fork();
    if (pid < 0) {
        outcome.output = std::string("fork failed: ") + std::strerror(errno);
        close(fds[0]);
        close(fds[1]);
        return outcome;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls until exec.
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        execvp(args[0], args.data());
        const char message[] = "exec failed: ping tool not found\n";
        [[maybe_unused]] auto written = write(STDERR_FILENO, message, sizeof(message) - 1);
        _exit(EXEC_FAILED_STATUS);
    }

    close(fds[1]);

    auto expiry = std::chrono::steady_clock::now() + deadline;
    std::array<char, 4096> buffer{};
    bool eof = false;

    while (!eof) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            expiry - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            outcome.timedOut = true;
            break;
        }

        pollfd pfd{fds[0], POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = read(fds[0], buffer.data(), buffer.size());
        if (n > 0) {
            if (outcome.output.size() < MAX_CAPTURED_OUTPUT) {
                outcome.output.append(buffer.data(), static_cast<size_t>(n));
            }
        } else if (n == 0 || errno != EINTR) {
            eof = true;
        }
    }
    close(fds[0]);

    int status = 0;
    if (outcome.timedOut) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        return outcome;
    }

    // Output closed; the child may still be exiting.
    while (true) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            outcome.output += "\nwaitpid failed";
            return outcome;
        }
        if (std::chrono::steady_clock::now() >= expiry) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            outcome.timedOut = true;
            return outcome;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (WIFEXITED(status)) {
        outcome.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exitCode = 128 + WTERMSIG(status);
    }
    return outcome;
}

#else

SystemPingProbe::ProcessOutcome SystemPingProbe::runProcess(const std::vector<std::string>&,
                                                            std::chrono::milliseconds) {
    ProcessOutcome outcome;
    outcome.output = "process spawning not implemented for this platform";
    return outcome;
}

#endif

} // namespace pingsweep::infra
