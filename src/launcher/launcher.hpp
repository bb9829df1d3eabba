#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "swarm/types.hpp"

namespace minibit::launcher {

using swarm::Block;
using swarm::PeerId;

/**
 * @brief Everything a peer is started with
 */
struct PeerLaunch
{
    PeerId peer_id;
    std::size_t total_blocks;
    std::vector<Block> blocks;
};

struct PeerOutcome
{
    PeerId peer_id;
    bool started = false;
    int exit_code = -1;
    std::string start_error;

    inline auto succeeded() const noexcept -> bool
    {
        return started and exit_code == 0;
    }
};

struct LaunchReport
{
    std::vector<PeerOutcome> outcomes;

    auto succeeded() const -> bool;
    auto failed_peers() const -> std::vector<PeerId>;
    auto not_started_peers() const -> std::vector<PeerId>;
};

/**
 * @brief Starts every peer of a launch list and waits for all of them
 */
class Launcher
{
 public:
    virtual ~Launcher() = default;

    virtual auto launch(const std::vector<PeerLaunch>& launches)
      -> LaunchReport = 0;
};

using ProgressCb = std::function<void(
  std::size_t /* peers_finished */, std::size_t /* peers_overall */
)>;

/**
 * @brief One launch per manifest entry, in peer id order
 */
auto make_launches(const swarm::Manifest& manifest, std::size_t total_blocks)
  -> std::vector<PeerLaunch>;

/**
 * @brief Command line arguments passed after the peer command itself
 */
auto peer_arguments(const PeerLaunch& launch) -> std::vector<std::string>;

}  // namespace minibit::launcher
