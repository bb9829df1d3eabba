#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <magic_enum.hpp>
#include <nlohmann/json.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "config.hpp"
#include "launcher/launcher.hpp"
#include "launcher/process.hpp"
#include "launcher/run.hpp"
#include "misc/parse_number.hpp"
#include "misc/progress.hpp"
#include "partition/partition.hpp"
#include "swarm/manifest.hpp"
#include "swarm/scheduler.hpp"

namespace fs = std::filesystem;

using namespace minibit;

#ifdef ENABLE_TESTS
void tests();
#endif


#define EXPECTED(assertion, msg_c_str, args...)                                \
    do {                                                                       \
        if (not bool(assertion)) {                                             \
            spdlog::error(msg_c_str, args);                                    \
            return ExitCode::Fail;                                             \
        }                                                                      \
    } while (0)


enum ExitCode
{
    Success = EXIT_SUCCESS,
    Fail = EXIT_FAILURE,
};

auto split_command(
  fs::path source_path, fs::path blocks_dir, std::size_t block_size
) -> ExitCode;
auto plan_command(
  swarm::Integer total_blocks,
  swarm::Integer peer_count,
  std::optional<swarm::Seed> seed
) -> ExitCode;
auto assemble_command(
  fs::path output_file_path,
  fs::path blocks_dir,
  std::string file_name,
  std::size_t total_blocks
) -> ExitCode;
auto run_command(std::optional<fs::path> config_path) -> ExitCode;


int main(int argc, char* argv[])
{
    auto internal_logger = spdlog::stdout_color_mt("internal_logger");

    std::vector<std::string_view> args(argv, argv + argc);

    if (args.size() > 1 and args[1] == "-v") {
        spdlog::set_level(spdlog::level::debug);
        internal_logger->set_level(spdlog::level::debug);
        args.erase(std::next(args.begin()));
    }
    else {
        spdlog::set_level(spdlog::level::info);
        internal_logger->set_level(spdlog::level::off);
    }

    const auto argn = args.size();

    if (argn < 2) {
        // clang-format off
        spdlog::error("Usage:");
        spdlog::error("  {} [-v] split <source_file> <blocks_dir> [block_size]", args[0]);
        spdlog::error("  {} [-v] plan <total_blocks> [peers] [seed]", args[0]);
        spdlog::error("  {} [-v] assemble -o <output_file> <blocks_dir> <file_name> <total_blocks>", args[0]);
        spdlog::error("  {} [-v] run [config.json]", args[0]);
        // clang-format on
        return ExitCode::Fail;
    }

    const std::string command(args[1]);

    try {
        if (command == "test") {
#ifdef ENABLE_TESTS
            tests();
#endif
            return ExitCode::Success;
        }

        if (command == "split") {
            EXPECTED(
              argn == 4 or argn == 5,
              "Usage: {} split <source_file> <blocks_dir> [block_size]",
              args[0]
            );

            auto block_size = partition::DEFAULT_BLOCK_SIZE;
            if (argn == 5) {
                auto parsed = utils::to_number<std::size_t>(args[4]);
                EXPECTED(parsed, "Bad block size: {}", args[4]);
                block_size = *parsed;
            }

            return split_command(args[2], args[3], block_size);
        }

        if (command == "plan") {
            EXPECTED(
              argn >= 3 and argn <= 5,
              "Usage: {} plan <total_blocks> [peers] [seed]", args[0]
            );

            auto total_blocks = utils::to_number<swarm::Integer>(args[2]);
            EXPECTED(total_blocks, "Bad blocks count: {}", args[2]);

            auto peer_count = std::optional(swarm::DEFAULT_PEER_COUNT);
            if (argn >= 4) {
                peer_count = utils::to_number<swarm::Integer>(args[3]);
                EXPECTED(peer_count, "Bad peers count: {}", args[3]);
            }

            std::optional<swarm::Seed> seed;
            if (argn == 5) {
                seed = utils::to_number<swarm::Seed>(args[4]);
                EXPECTED(seed, "Bad seed: {}", args[4]);
            }

            return plan_command(*total_blocks, *peer_count, seed);
        }

        if (command == "assemble") {
            EXPECTED(
              argn == 7 and args[2] == "-o",
              "Usage: {} assemble -o <output_file> <blocks_dir> <file_name> "
              "<total_blocks>",
              args[0]
            );

            auto total_blocks = utils::to_number<std::size_t>(args[6]);
            EXPECTED(total_blocks, "Bad blocks count: {}", args[6]);

            return assemble_command(
              args[3], args[4], std::string(args[5]), *total_blocks
            );
        }

        if (command == "run") {
            EXPECTED(argn <= 3, "Usage: {} run [config.json]", args[0]);

            std::optional<fs::path> config_path;
            if (argn == 3) {
                config_path = fs::path(args[2]);
            }

            return run_command(config_path);
        }
    } catch (const std::runtime_error& e) {
        spdlog::error("{}", e.what());
        return ExitCode::Fail;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected failure: {}", e.what());
        return ExitCode::Fail;
    }

    spdlog::error(R"(Unknown command: "{0}")", command);
    return ExitCode::Fail;
}


auto split_command(
  fs::path source_path, fs::path blocks_dir, std::size_t block_size
) -> ExitCode
{
    auto total_blocks =
      partition::split_file(source_path, blocks_dir, block_size);

    EXPECTED(
      total_blocks.has_value(), "Can't split {}: {}", source_path,
      magic_enum::enum_name(total_blocks.error())
    );

    fmt::println("{}", *total_blocks);

    return ExitCode::Success;
}

auto plan_command(
  swarm::Integer total_blocks,
  swarm::Integer peer_count,
  std::optional<swarm::Seed> seed
) -> ExitCode
{
    auto assignment = swarm::schedule(total_blocks, peer_count, seed);

    EXPECTED(
      assignment.has_value(), "Can't assign {} blocks to {} peers: {}",
      total_blocks, peer_count, magic_enum::enum_name(assignment.error())
    );

    const auto manifest = swarm::to_per_peer_manifest(*assignment);
    fmt::println(
      "{}", swarm::manifest_to_json(manifest, assignment->total_blocks).dump(2)
    );

    return ExitCode::Success;
}

auto assemble_command(
  fs::path output_file_path,
  fs::path blocks_dir,
  std::string file_name,
  std::size_t total_blocks
) -> ExitCode
{
    if (output_file_path.has_parent_path()) {
        EXPECTED(
          fs::exists(output_file_path.parent_path()), "Path not found: \"{}\"",
          output_file_path.parent_path()
        );
    }

    std::ofstream ofs;
    ofs.open(output_file_path, std::ios::out | std::ios::binary);
    EXPECTED(ofs, "Can't write to file {}", output_file_path);

    auto indexes = ranges::views::ints(std::size_t(0), total_blocks) |
                   ranges::to<std::vector<std::size_t>>();

    auto bytes =
      partition::assemble_file(indexes, blocks_dir, file_name, ofs);

    EXPECTED(
      bytes.has_value(), "Can't assemble {}: {}", file_name,
      magic_enum::enum_name(bytes.error())
    );

    fmt::println(
      "Assembled {} ({} bytes) to {}.", file_name, *bytes, output_file_path
    );

    return ExitCode::Success;
}

auto run_command(std::optional<fs::path> config_path) -> ExitCode
{
    auto config = config_path ? RunConfig::from_file(*config_path)
                              : RunConfig::from_json(nlohmann::json::object());

    EXPECTED(
      config.has_value(), "Bad configuration: {}",
      magic_enum::enum_name(config.error())
    );

    auto bar = utils::progress_bar();

    launcher::ProcessLauncher peers_launcher(
      config->peer_command, config->logs_dir,
      [&bar](std::size_t finished, std::size_t overall) {
          utils::set_progress(bar, finished, overall, "Peers finished");
      }
    );

    auto result = launcher::run_swarm(*config, peers_launcher);

    EXPECTED(
      result.has_value(), "Run aborted, no peer started: {}",
      magic_enum::enum_name(result.error())
    );

    const auto& report = result->report;

    const auto not_started = report.not_started_peers();
    if (not not_started.empty()) {
        spdlog::error(
          "Peers not started: {}", fmt::join(not_started, ", ")
        );
    }

    EXPECTED(
      report.succeeded(), "Peers failed: {}",
      fmt::join(report.failed_peers(), ", ")
    );

    fmt::println(
      "All {} peers finished, {} blocks.", report.outcomes.size(),
      result->total_blocks
    );

    return ExitCode::Success;
}
