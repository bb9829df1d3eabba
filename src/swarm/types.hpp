#pragma once

#include <cstddef>
#include <map>
#include <vector>

namespace minibit::swarm {

using Block = std::size_t;
using PeerId = std::size_t;

// Raw user input, may be negative before validation
using Integer = long long;

constexpr const Integer DEFAULT_PEER_COUNT = 10;

// Every peer is a process of this host
constexpr const Integer MAX_PEER_COUNT = 1 << 16;

// Block lists are held in memory for one run
constexpr const Integer MAX_TOTAL_BLOCKS = Integer(1) << 27;

enum class Error
{
    INVALID_CONFIGURATION,
};

/**
 * @brief Blocks owned by every peer of the swarm
 *
 * `peers[i]` is the ordered block list of peer `i`. The order is the peer
 * preferred serving order, membership is what matters for coverage.
 */
struct Assignment
{
    std::size_t total_blocks = 0;
    std::vector<std::vector<Block>> peers;

    inline auto peer_count() const noexcept -> std::size_t
    {
        return peers.size();
    }

    inline auto load(PeerId peer) const -> std::size_t
    {
        return peers.at(peer).size();
    }

    inline auto blocks_of(PeerId peer) const -> const std::vector<Block>&
    {
        return peers.at(peer);
    }
};

using Manifest = std::map<PeerId, std::vector<Block>>;

}  // namespace minibit::swarm
