#include "launcher/run.hpp"

#include <cstddef>
#include <stdexcept>

#include <fmt/std.h>
#include <magic_enum.hpp>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include "config.hpp"
#include "launcher/launcher.hpp"
#include "misc/workspace.hpp"
#include "partition/partition.hpp"
#include "swarm/scheduler.hpp"
#include "swarm/types.hpp"

namespace minibit::launcher {

auto run_swarm(const RunConfig& config, Launcher& peers_launcher)
  -> tl::expected<RunResult, RunError>
{
    if (config.peers <= 0 or config.peers > swarm::MAX_PEER_COUNT) {
        spdlog::error("Bad peers count: {}", config.peers);
        return tl::make_unexpected(RunError::INVALID_CONFIGURATION);
    }

    try {
        utils::prepare_workspace(config);
    } catch (const std::runtime_error& e) {
        spdlog::error("{}", e.what());
        return tl::make_unexpected(RunError::WORKSPACE_FAILURE);
    }

    const auto source_path = config.source_path();
    auto total_blocks = partition::split_file(
      source_path, config.blocks_dir, config.block_size
    );

    if (not total_blocks) {
        spdlog::error(
          "Can't split {}: {}", source_path,
          magic_enum::enum_name(total_blocks.error())
        );
        return tl::make_unexpected(RunError::PARTITION_FAILURE);
    }

    spdlog::info(
      "{} split into {} blocks of {} bytes", config.file_name, *total_blocks,
      config.block_size
    );

    auto assignment = swarm::schedule(
      static_cast<swarm::Integer>(*total_blocks), config.peers, config.seed
    );

    if (not assignment) {
        spdlog::error(
          "Can't assign blocks: {}", magic_enum::enum_name(assignment.error())
        );
        return tl::make_unexpected(RunError::INVALID_CONFIGURATION);
    }

    if (not swarm::covers_all_blocks(*assignment) or
        not swarm::is_load_balanced(*assignment)) {
        spdlog::error(
          "Broken assignment of {} blocks to {} peers", *total_blocks,
          config.peers
        );
        return tl::make_unexpected(RunError::BROKEN_ASSIGNMENT);
    }

    const auto launches = make_launches(
      swarm::to_per_peer_manifest(*assignment), assignment->total_blocks
    );

    return RunResult{
      .total_blocks = *total_blocks,
      .report = peers_launcher.launch(launches),
    };
}

}  // namespace minibit::launcher
