#include "swarm/scheduler.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <random>
#include <utility>
#include <vector>

#include <fmt/ranges.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view.hpp>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include "swarm/types.hpp"

namespace minibit::swarm {

auto make_random_source(std::optional<Seed> seed) -> RandomSource
{
    if (seed) {
        return RandomSource(*seed);
    }

    std::random_device entropy;
    return RandomSource(entropy());
}

auto compute_base_assignment(Integer total_blocks, Integer peer_count)
  -> tl::expected<Assignment, Error>
{
    if (peer_count <= 0 or peer_count > MAX_PEER_COUNT) {
        spdlog::error(
          "Peer count must be in [1, {}]. Got {}", MAX_PEER_COUNT, peer_count
        );
        return tl::make_unexpected(Error::INVALID_CONFIGURATION);
    }

    if (total_blocks < 0 or total_blocks > MAX_TOTAL_BLOCKS) {
        spdlog::error(
          "Blocks count must be in [0, {}]. Got {}", MAX_TOTAL_BLOCKS,
          total_blocks
        );
        return tl::make_unexpected(Error::INVALID_CONFIGURATION);
    }

    const auto blocks_count = static_cast<std::size_t>(total_blocks);
    const auto peers_count = static_cast<std::size_t>(peer_count);

    Assignment assignment{
      .total_blocks = blocks_count,
      .peers = std::vector<std::vector<Block>>(peers_count),
    };

    const auto max_load = (blocks_count + peers_count - 1) / peers_count;
    for (auto&& blocks : assignment.peers) {
        blocks.reserve(max_load);
    }

    for (Block block = 0; block < blocks_count; block++) {
        assignment.peers[block % peers_count].push_back(block);
    }

    spdlog::debug(
      "Base assignment: {} blocks over {} peers, {} to {} blocks per peer",
      blocks_count, peers_count, blocks_count / peers_count, max_load
    );

    return assignment;
}

auto randomize_order(Assignment assignment, RandomSource& random)
  -> Assignment
{
    // Independent engine per peer
    for (auto&& blocks : assignment.peers) {
        RandomSource peer_random(random());
        std::ranges::shuffle(blocks, peer_random);
    }

    return assignment;
}

auto to_per_peer_manifest(const Assignment& assignment) -> Manifest
{
    Manifest manifest;

    for (PeerId peer = 0; peer < assignment.peer_count(); peer++) {
        manifest.emplace(peer, assignment.blocks_of(peer));
    }

    return manifest;
}

auto schedule(Integer total_blocks, Integer peer_count, std::optional<Seed> seed)
  -> tl::expected<Assignment, Error>
{
    auto random = make_random_source(seed);

    return compute_base_assignment(total_blocks, peer_count)
      .map([&random](Assignment&& base) {
          return randomize_order(std::move(base), random);
      });
}

auto covers_all_blocks(const Assignment& assignment) -> bool
{
    std::vector<bool> owned(assignment.total_blocks, false);

    for (auto&& blocks : assignment.peers) {
        for (auto block : blocks) {
            if (block >= assignment.total_blocks) {
                spdlog::error(
                  "Block {} is out of range [0, {})", block,
                  assignment.total_blocks
                );
                return false;
            }
            owned[block] = true;
        }
    }

    auto orphans =
      ranges::views::ints(std::size_t(0), assignment.total_blocks) |
      ranges::views::filter([&owned](auto b) { return not owned[b]; }) |
      ranges::to<std::vector<Block>>();

    if (not orphans.empty()) {
        spdlog::error(
          "Blocks owned by no peer: {}", fmt::join(orphans, ", ")
        );
        return false;
    }

    return true;
}

auto is_load_balanced(const Assignment& assignment) -> bool
{
    if (assignment.peers.empty()) {
        return true;
    }

    auto [min_peer, max_peer] = std::ranges::minmax_element(
      assignment.peers, {}, [](auto&& blocks) { return blocks.size(); }
    );

    return max_peer->size() - min_peer->size() <= 1;
}

}  // namespace minibit::swarm
