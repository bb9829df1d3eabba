#pragma once

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include "launcher/launcher.hpp"

namespace minibit::launcher {

/**
 * @brief Run every peer as a task of a thread pool inside this process
 *
 * The pool has one thread per peer so no peer waits for another to finish.
 * A task returns the peer exit code; an exception counts as failure.
 */
class TaskLauncher : public Launcher
{
 public:
    using PeerTask = std::function<int(const PeerLaunch&)>;

    inline explicit TaskLauncher(
      PeerTask task,
      ProgressCb progress_cb = [](std::size_t, std::size_t) {}
    ) :
      _task(std::move(task)), _progress_callback(std::move(progress_cb))
    {
    }

    auto launch(const std::vector<PeerLaunch>& launches)
      -> LaunchReport override;

 private:
    PeerTask _task;
    ProgressCb _progress_callback;
};

}  // namespace minibit::launcher
