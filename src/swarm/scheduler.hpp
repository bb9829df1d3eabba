#pragma once

#include <cstdint>
#include <optional>
#include <random>

#include <tl/expected.hpp>

#include "swarm/types.hpp"

namespace minibit::swarm {

using RandomSource = std::mt19937;
using Seed = std::uint32_t;

/**
 * @brief Make a random source seeded by `seed` or by the system entropy
 */
auto make_random_source(std::optional<Seed> seed = std::nullopt)
  -> RandomSource;

/**
 * @brief Round-robin split of blocks `[0, total_blocks)` across peers
 *
 * Block `b` goes to peer `b % peer_count`. Every block is owned by exactly
 * one peer and peer loads differ by at most one. Result is a pure function
 * of its arguments.
 */
auto compute_base_assignment(Integer total_blocks, Integer peer_count)
  -> tl::expected<Assignment, Error>;

/**
 * @brief Shuffle every peer's block list independently
 */
auto randomize_order(Assignment assignment, RandomSource& random)
  -> Assignment;

auto to_per_peer_manifest(const Assignment& assignment) -> Manifest;

/**
 * @brief Base assignment followed by the per-peer shuffle
 */
auto schedule(
  Integer total_blocks, Integer peer_count, std::optional<Seed> seed
) -> tl::expected<Assignment, Error>;

auto covers_all_blocks(const Assignment& assignment) -> bool;
auto is_load_balanced(const Assignment& assignment) -> bool;

}  // namespace minibit::swarm
