#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/types.h>
#include <tl/expected.hpp>

#include "launcher/launcher.hpp"

namespace minibit::launcher {

/**
 * @brief Start every peer as a child process and wait for all of them
 *
 * Peer `i` runs as `<command...> <i> <total_blocks> <blocks...>`. With
 * `logs_dir` set its stdout and stderr go to `<logs_dir>/peer_<i>.log`.
 */
class ProcessLauncher : public Launcher
{
 public:
    inline explicit ProcessLauncher(
      std::vector<std::string> command,
      std::optional<std::filesystem::path> logs_dir = std::nullopt,
      ProgressCb progress_cb = [](std::size_t, std::size_t) {}
    ) :
      _command(std::move(command)),
      _logs_dir(std::move(logs_dir)),
      _progress_callback(std::move(progress_cb))
    {
    }

    auto launch(const std::vector<PeerLaunch>& launches)
      -> LaunchReport override;

    inline auto log_path(PeerId peer) const
      -> std::optional<std::filesystem::path>
    {
        if (not _logs_dir) {
            return std::nullopt;
        }
        return *_logs_dir / ("peer_" + std::to_string(peer) + ".log");
    }

 private:
    auto _spawn(const PeerLaunch& launch) const
      -> tl::expected<pid_t, std::error_code>;

    auto _wait(pid_t pid) const -> tl::expected<int, std::error_code>;

    std::vector<std::string> _command;
    std::optional<std::filesystem::path> _logs_dir;
    ProgressCb _progress_callback;
};

}  // namespace minibit::launcher
