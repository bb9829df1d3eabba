#include "launcher/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

extern char** environ;

namespace minibit::launcher {

namespace {

constexpr const int SIGNALED_EXIT_BASE = 128;

// RAII for posix_spawn_file_actions_t
struct FileActions
{
    inline FileActions() { posix_spawn_file_actions_init(&actions); }
    inline ~FileActions() { posix_spawn_file_actions_destroy(&actions); }

    FileActions(const FileActions&) = delete;
    FileActions& operator=(const FileActions&) = delete;

    posix_spawn_file_actions_t actions;
};

}  // namespace

auto ProcessLauncher::launch(const std::vector<PeerLaunch>& launches)
  -> LaunchReport
{
    LaunchReport report;
    report.outcomes.reserve(launches.size());

    std::vector<pid_t> pids(launches.size(), -1);

    if (_logs_dir) {
        std::error_code ec;
        std::filesystem::create_directories(*_logs_dir, ec);
        if (ec) {
            spdlog::warn(
              "Can't create logs dir {}: {}. Peers may fail to start",
              *_logs_dir, ec.message()
            );
        }
    }

    for (std::size_t i = 0; i < launches.size(); i++) {
        const auto& launch = launches[i];
        PeerOutcome outcome{.peer_id = launch.peer_id};

        auto pid = _spawn(launch);
        if (pid) {
            outcome.started = true;
            pids[i] = *pid;
            spdlog::info(
              "Starting peer {} with blocks: {}", launch.peer_id,
              fmt::join(launch.blocks, " ")
            );
        }
        else {
            outcome.start_error = pid.error().message();
            spdlog::error(
              "Peer {} failed to start: {}", launch.peer_id,
              outcome.start_error
            );
        }

        report.outcomes.push_back(std::move(outcome));
    }

    std::size_t finished = 0;
    for (std::size_t i = 0; i < launches.size(); i++) {
        auto& outcome = report.outcomes[i];

        if (outcome.started) {
            auto exit_code = _wait(pids[i]);
            if (exit_code) {
                outcome.exit_code = *exit_code;
            }
            else {
                spdlog::error(
                  "Lost track of peer {}: {}", outcome.peer_id,
                  exit_code.error().message()
                );
            }

            if (outcome.exit_code != 0) {
                spdlog::warn(
                  "Peer {} exited with code {}", outcome.peer_id,
                  outcome.exit_code
                );
            }
            else {
                spdlog::debug("Peer {} finished", outcome.peer_id);
            }
        }

        finished++;
        _progress_callback(finished, launches.size());
    }

    return report;
}

auto ProcessLauncher::_spawn(const PeerLaunch& launch) const
  -> tl::expected<pid_t, std::error_code>
{
    std::vector<std::string> args = _command;
    for (auto&& arg : peer_arguments(launch)) {
        args.push_back(std::move(arg));
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto&& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    FileActions file_actions;

    const auto log_file = log_path(launch.peer_id);
    if (log_file) {
        int result = posix_spawn_file_actions_addopen(
          &file_actions.actions, STDOUT_FILENO, log_file->c_str(),
          O_WRONLY | O_CREAT | O_TRUNC, 0644
        );

        if (result == 0) {
            result = posix_spawn_file_actions_adddup2(
              &file_actions.actions, STDOUT_FILENO, STDERR_FILENO
            );
        }

        if (result != 0) {
            return tl::make_unexpected(
              std::error_code(result, std::system_category())
            );
        }
    }

    spdlog::debug("Spawn: {}", fmt::join(args, " "));

    pid_t pid = -1;
    const int result = posix_spawnp(
      &pid, argv[0], &file_actions.actions, nullptr, argv.data(), environ
    );

    if (result != 0) {
        return tl::make_unexpected(
          std::error_code(result, std::system_category())
        );
    }

    return pid;
}

auto ProcessLauncher::_wait(pid_t pid) const
  -> tl::expected<int, std::error_code>
{
    int status = 0;

    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return tl::make_unexpected(
              std::error_code(errno, std::system_category())
            );
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return SIGNALED_EXIT_BASE + WTERMSIG(status);
    }

    return -1;
}

}  // namespace minibit::launcher
