#pragma once

#include <cstddef>

#include <tl/expected.hpp>

#include "config.hpp"
#include "launcher/launcher.hpp"

namespace minibit::launcher {

struct RunResult
{
    std::size_t total_blocks = 0;
    LaunchReport report;
};

enum class RunError
{
    INVALID_CONFIGURATION,
    WORKSPACE_FAILURE,
    PARTITION_FAILURE,
    BROKEN_ASSIGNMENT,
};

/**
 * @brief Prepare workspace, split source, schedule blocks, start peers
 *
 * Any error before the launch step returns without starting a single peer.
 * Peer failures are not errors here, they are in the returned report.
 */
auto run_swarm(const RunConfig& config, Launcher& peers_launcher)
  -> tl::expected<RunResult, RunError>;

}  // namespace minibit::launcher
