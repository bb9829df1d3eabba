#include "launcher/launcher.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view.hpp>

#include "swarm/types.hpp"

namespace minibit::launcher {

auto LaunchReport::succeeded() const -> bool
{
    return std::ranges::all_of(outcomes, &PeerOutcome::succeeded);
}

auto LaunchReport::failed_peers() const -> std::vector<PeerId>
{
    return outcomes |
           ranges::views::filter([](auto&& o) { return not o.succeeded(); }) |
           ranges::views::transform(&PeerOutcome::peer_id) |
           ranges::to<std::vector<PeerId>>();
}

auto LaunchReport::not_started_peers() const -> std::vector<PeerId>
{
    return outcomes |
           ranges::views::filter([](auto&& o) { return not o.started; }) |
           ranges::views::transform(&PeerOutcome::peer_id) |
           ranges::to<std::vector<PeerId>>();
}

auto make_launches(const swarm::Manifest& manifest, std::size_t total_blocks)
  -> std::vector<PeerLaunch>
{
    std::vector<PeerLaunch> launches;
    launches.reserve(manifest.size());

    for (auto&& [peer, blocks] : manifest) {
        launches.push_back(PeerLaunch{
          .peer_id = peer, .total_blocks = total_blocks, .blocks = blocks
        });
    }

    return launches;
}

auto peer_arguments(const PeerLaunch& launch) -> std::vector<std::string>
{
    std::vector<std::string> args{
      std::to_string(launch.peer_id), std::to_string(launch.total_blocks)
    };

    for (auto block : launch.blocks) {
        args.push_back(std::to_string(block));
    }

    return args;
}

}  // namespace minibit::launcher
