#include "launcher/task.hpp"

#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <vector>

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

namespace minibit::launcher {

auto TaskLauncher::launch(const std::vector<PeerLaunch>& launches)
  -> LaunchReport
{
    LaunchReport report;
    for (auto&& launch : launches) {
        report.outcomes.push_back(PeerOutcome{.peer_id = launch.peer_id});
    }

    if (launches.empty()) {
        return report;
    }

    asio::thread_pool pool(launches.size());

    std::atomic<std::size_t> finished = 0;
    std::mutex progress_mutex;

    for (std::size_t i = 0; i < launches.size(); i++) {
        // Every task writes only its own outcome slot
        auto& outcome = report.outcomes[i];
        const auto& launch = launches[i];

        outcome.started = true;
        spdlog::debug(
          "Starting peer {} with {} blocks", launch.peer_id,
          launch.blocks.size()
        );

        asio::post(
          pool,
          [&outcome, &launch, &finished, &progress_mutex, &launches, this] {
              try {
                  outcome.exit_code = _task(launch);
              } catch (const std::exception& e) {
                  spdlog::error(
                    "Peer {} failed: {}", launch.peer_id, e.what()
                  );
                  outcome.exit_code = EXIT_FAILURE;
              }

              std::scoped_lock lock(progress_mutex);
              _progress_callback(++finished, launches.size());
          }
        );
    }

    pool.join();

    return report;
}

}  // namespace minibit::launcher
