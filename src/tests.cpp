#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view.hpp>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "launcher/launcher.hpp"
#include "launcher/process.hpp"
#include "launcher/run.hpp"
#include "launcher/task.hpp"
#include "misc/parse_number.hpp"
#include "misc/workspace.hpp"
#include "partition/partition.hpp"
#include "swarm/manifest.hpp"
#include "swarm/scheduler.hpp"
#include "swarm/types.hpp"

using namespace minibit;
namespace fs = std::filesystem;

using Json = nlohmann::json;

void test_base_assignment();
void test_assignment_properties();
void test_randomize_order();
void test_manifest();
void test_split_file();
void test_assemble_file();
void test_config();
void test_parse_number();
void test_workspace();
void test_task_launcher();
void test_process_launcher();
void test_run_swarm();

void tests()
{
    test_base_assignment();
    test_assignment_properties();
    test_randomize_order();
    test_manifest();
    test_split_file();
    test_assemble_file();
    test_config();
    test_parse_number();
    test_workspace();
    test_task_launcher();
    test_process_launcher();
    test_run_swarm();

    spdlog::info("All tests passed");
}

namespace {

auto scratch_dir(const std::string& name) -> fs::path
{
    auto dir = fs::temp_directory_path() /
               fmt::format("minibit_{}_{}", name, ::getpid());
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

auto write_file(const fs::path& path, const std::string& content)
{
    std::ofstream file(path, std::ios::out | std::ios::binary);
    file << content;
}

auto read_file(const fs::path& path) -> std::string
{
    std::ifstream file(path, std::ios::in | std::ios::binary);
    return std::string(
      (std::istreambuf_iterator<char>(file)), (std::istreambuf_iterator<char>())
    );
}

auto sorted(std::vector<swarm::Block> blocks) -> std::vector<swarm::Block>
{
    std::ranges::sort(blocks);
    return blocks;
}

}  // namespace

void test_base_assignment()
{
    using namespace minibit::swarm;

    // 23 blocks over 10 peers: first three peers get the extra block
    {
        auto res = compute_base_assignment(23, 10);
        assert(res.has_value());
        assert(res->peer_count() == 10);
        assert(res->total_blocks == 23);

        for (PeerId peer = 0; peer < 3; peer++) {
            assert(res->load(peer) == 3);
        }
        for (PeerId peer = 3; peer < 10; peer++) {
            assert(res->load(peer) == 2);
        }

        assert((res->blocks_of(0) == std::vector<Block>{0, 10, 20}));
        assert((res->blocks_of(2) == std::vector<Block>{2, 12, 22}));
        assert((res->blocks_of(9) == std::vector<Block>{9, 19}));
    }

    // One block per peer
    {
        auto res = compute_base_assignment(10, 10);
        assert(res.has_value());

        for (PeerId peer = 0; peer < 10; peer++) {
            assert((res->blocks_of(peer) == std::vector<Block>{peer}));
        }
    }

    // Fewer blocks than peers
    {
        auto res = compute_base_assignment(5, 10);
        assert(res.has_value());

        for (PeerId peer = 0; peer < 5; peer++) {
            assert((res->blocks_of(peer) == std::vector<Block>{peer}));
        }
        for (PeerId peer = 5; peer < 10; peer++) {
            assert(res->blocks_of(peer).empty());
        }
        assert(covers_all_blocks(*res));
    }

    // Empty swarm is valid
    {
        auto res = compute_base_assignment(0, 10);
        assert(res.has_value());
        assert(res->peer_count() == 10);
        assert(std::ranges::all_of(res->peers, [](auto&& b) {
            return b.empty();
        }));
        assert(covers_all_blocks(*res));
        assert(is_load_balanced(*res));
    }

    // Single peer owns everything
    {
        auto res = compute_base_assignment(7, 1);
        assert(res.has_value());
        assert((res->blocks_of(0) == std::vector<Block>{0, 1, 2, 3, 4, 5, 6}));
    }

    // Configuration errors
    {
        auto no_peers = compute_base_assignment(10, 0);
        assert(not no_peers.has_value());
        assert(no_peers.error() == Error::INVALID_CONFIGURATION);

        auto negative_peers = compute_base_assignment(10, -3);
        assert(not negative_peers.has_value());
        assert(negative_peers.error() == Error::INVALID_CONFIGURATION);

        auto negative_blocks = compute_base_assignment(-1, 10);
        assert(not negative_blocks.has_value());
        assert(negative_blocks.error() == Error::INVALID_CONFIGURATION);

        auto nothing_at_all = compute_base_assignment(0, 0);
        assert(not nothing_at_all.has_value());
    }

    // Sizes that can't be held in memory are rejected, not allocated
    {
        auto huge_swarm = compute_base_assignment(1, 100000000000000);
        assert(not huge_swarm.has_value());
        assert(huge_swarm.error() == Error::INVALID_CONFIGURATION);

        auto one_too_many = compute_base_assignment(1, MAX_PEER_COUNT + 1);
        assert(not one_too_many.has_value());

        auto huge_file = compute_base_assignment(100000000000000, 10);
        assert(not huge_file.has_value());
        assert(huge_file.error() == Error::INVALID_CONFIGURATION);

        auto largest_swarm = compute_base_assignment(3, MAX_PEER_COUNT);
        assert(largest_swarm.has_value());
        assert(largest_swarm->peer_count() ==
               static_cast<std::size_t>(MAX_PEER_COUNT));
        assert(covers_all_blocks(*largest_swarm));
    }

    // Same input gives same assignment
    {
        auto first = compute_base_assignment(137, 9);
        auto second = compute_base_assignment(137, 9);
        assert(first.has_value() and second.has_value());
        assert(first->peers == second->peers);
    }
}

void test_assignment_properties()
{
    using namespace minibit::swarm;

    for (Integer peers = 1; peers <= 13; peers++) {
        for (Integer blocks = 0; blocks <= 60; blocks++) {
            auto res = compute_base_assignment(blocks, peers);
            assert(res.has_value());
            assert(covers_all_blocks(*res));
            assert(is_load_balanced(*res));

            // Exactly one owner per block in the base pass
            std::size_t owned = 0;
            for (auto&& peer_blocks : res->peers) {
                owned += peer_blocks.size();
            }
            assert(owned == static_cast<std::size_t>(blocks));

            // Peers below `blocks % peers` carry the larger load
            const auto extra = static_cast<PeerId>(blocks % peers);
            const auto base = static_cast<std::size_t>(blocks / peers);
            for (PeerId peer = 0; peer < res->peer_count(); peer++) {
                assert(res->load(peer) == (peer < extra ? base + 1 : base));
            }
        }
    }

    // Broken assignments are detected
    {
        Assignment orphan{.total_blocks = 3, .peers = {{0}, {2}}};
        assert(not covers_all_blocks(orphan));

        Assignment out_of_range{.total_blocks = 2, .peers = {{0, 1}, {5}}};
        assert(not covers_all_blocks(out_of_range));

        Assignment skewed{.total_blocks = 4, .peers = {{0, 1, 2}, {3}}};
        assert(covers_all_blocks(skewed));
        assert(not is_load_balanced(skewed));
    }
}

void test_randomize_order()
{
    using namespace minibit::swarm;

    auto base = compute_base_assignment(500, 4);
    assert(base.has_value());

    // Membership and loads survive the shuffle
    {
        auto random = make_random_source(42);
        auto shuffled = randomize_order(*base, random);

        assert(shuffled.total_blocks == base->total_blocks);
        assert(shuffled.peer_count() == base->peer_count());

        for (PeerId peer = 0; peer < base->peer_count(); peer++) {
            assert(sorted(shuffled.blocks_of(peer)) == base->blocks_of(peer));
        }

        assert(covers_all_blocks(shuffled));
        assert(is_load_balanced(shuffled));

        // 125 blocks per peer, staying sorted would be astonishing
        assert(shuffled.blocks_of(0) != base->blocks_of(0));
    }

    // Same seed gives same order
    {
        auto first_random = make_random_source(7);
        auto second_random = make_random_source(7);

        auto first = randomize_order(*base, first_random);
        auto second = randomize_order(*base, second_random);
        assert(first.peers == second.peers);
    }

    // Peers are not shuffled in lock-step
    {
        auto random = make_random_source(1234);
        auto shuffled = randomize_order(*base, random);

        auto positions = [&](PeerId peer) {
            return shuffled.blocks_of(peer) |
                   ranges::views::transform([](Block b) { return b / 4; }) |
                   ranges::to<std::vector<Block>>();
        };

        assert(positions(0) != positions(1));
    }

    // schedule() composes both phases
    {
        auto res = schedule(23, 10, 99);
        assert(res.has_value());
        assert(covers_all_blocks(*res));
        assert(res->load(0) == 3 and res->load(9) == 2);

        auto bad = schedule(23, 0, 99);
        assert(not bad.has_value());
        assert(bad.error() == Error::INVALID_CONFIGURATION);
    }
}

void test_manifest()
{
    using namespace minibit::swarm;

    auto res = compute_base_assignment(3, 5);
    assert(res.has_value());

    auto manifest = to_per_peer_manifest(*res);
    assert(manifest.size() == 5);
    assert((manifest.at(0) == std::vector<Block>{0}));
    assert((manifest.at(2) == std::vector<Block>{2}));
    assert(manifest.at(3).empty());
    assert(manifest.at(4).empty());

    auto json = manifest_to_json(manifest, res->total_blocks);
    assert(json["total_blocks"] == 3);
    assert(json["peer_count"] == 5);
    assert(json["peers"]["1"] == Json::array({1}));
    assert(json["peers"]["4"] == Json::array());
}

void test_split_file()
{
    using namespace minibit::partition;

    const auto dir = scratch_dir("split");
    const auto blocks_dir = dir / "blocks";

    std::string content;
    for (int i = 0; i < 150; i++) {
        content.push_back(static_cast<char>('a' + i % 26));
    }
    write_file(dir / "source.bin", content);

    // Last block is shorter
    {
        auto res = split_file(dir / "source.bin", blocks_dir, 64);
        assert(res.has_value());
        assert(*res == 3);

        assert(read_file(block_path(blocks_dir, "source.bin", 0)) ==
               content.substr(0, 64));
        assert(read_file(block_path(blocks_dir, "source.bin", 2)) ==
               content.substr(128));
        assert(not fs::exists(block_path(blocks_dir, "source.bin", 3)));
    }

    // Exact multiple of block size
    {
        auto res = split_file(dir / "source.bin", dir / "exact", 50);
        assert(res.has_value());
        assert(*res == 3);
        assert(fs::file_size(block_path(dir / "exact", "source.bin", 2)) == 50);
    }

    // Empty file gives no blocks
    {
        write_file(dir / "empty.bin", "");
        auto res = split_file(dir / "empty.bin", dir / "empty_blocks", 64);
        assert(res.has_value());
        assert(*res == 0);
    }

    {
        auto res = split_file(dir / "missing.bin", blocks_dir, 64);
        assert(not res.has_value());
        assert(res.error() == Error::SOURCE_NOT_FOUND);
    }

    {
        auto res = split_file(dir / "source.bin", blocks_dir, 0);
        assert(not res.has_value());
        assert(res.error() == Error::INVALID_BLOCK_SIZE);
    }

    {
        auto res =
          split_file(dir / "source.bin", blocks_dir, 1000000000000000);
        assert(not res.has_value());
        assert(res.error() == Error::INVALID_BLOCK_SIZE);
    }

    {
        auto res = split_file(dir, blocks_dir, 64);
        assert(not res.has_value());
        assert(res.error() == Error::SOURCE_NOT_FOUND);
    }

    assert(block_path("files/blocks", "uerj.png", 7) ==
           fs::path("files/blocks/uerj.png_block_7"));

    fs::remove_all(dir);
}

void test_assemble_file()
{
    using namespace minibit::partition;

    const auto dir = scratch_dir("assemble");
    const auto blocks_dir = dir / "blocks";

    const std::string content = "The quick brown fox jumps over the lazy dog";
    write_file(dir / "fox.txt", content);

    auto total = split_file(dir / "fox.txt", blocks_dir, 8);
    assert(total.has_value());
    assert(*total == 6);

    // Order and duplicates in the request don't matter
    {
        std::ostringstream output;
        auto res =
          assemble_file({5, 3, 0, 1, 4, 2, 3}, blocks_dir, "fox.txt", output);
        assert(res.has_value());
        assert(*res == content.size());
        assert(output.str() == content);
    }

    {
        std::ostringstream output;
        auto res = assemble_file({0, 1, 6}, blocks_dir, "fox.txt", output);
        assert(not res.has_value());
        assert(res.error() == Error::BLOCK_MISSING);
    }

    {
        std::ostringstream output;
        auto res = assemble_file({}, blocks_dir, "fox.txt", output);
        assert(res.has_value());
        assert(*res == 0);
        assert(output.str().empty());
    }

    fs::remove_all(dir);
}

void test_config()
{
    // Defaults
    {
        auto config = RunConfig::from_json(Json::object());
        assert(config.has_value());
        assert(config->file_name == "uerj.png");
        assert(config->block_size == 64);
        assert(config->peers == 10);
        assert(config->blocks_dir == fs::path("files/blocks"));
        assert(config->source_path() == fs::path("files/uerj.png"));
        assert(not config->seed.has_value());
        assert((config->peer_command ==
                std::vector<std::string>{"python3", "peer/peer.py"}));
    }

    {
        auto config = RunConfig::from_json(R"({
            "file_name": "movie.mkv",
            "block_size": 1024,
            "peers": 4,
            "seed": 17,
            "peer_command": ["./peer"]
        })"_json);

        assert(config.has_value());
        assert(config->file_name == "movie.mkv");
        assert(config->block_size == 1024);
        assert(config->peers == 4);
        assert(config->seed == 17u);
        assert(config->peer_command.size() == 1);
    }

    {
        auto config = RunConfig::from_json(R"({"peers": 0})"_json);
        assert(not config.has_value());
        assert(config.error() == RunConfig::Error::INVALID_VALUE);
    }

    {
        auto config = RunConfig::from_json(R"({"block_size": -5})"_json);
        assert(not config.has_value());
        assert(config.error() == RunConfig::Error::INVALID_VALUE);
    }

    {
        auto config = RunConfig::from_json(R"({"peers": "many"})"_json);
        assert(not config.has_value());
        assert(config.error() == RunConfig::Error::INVALID_VALUE);
    }

    // Numbers of the wrong kind or range are not converted
    {
        for (auto&& bad : {
               R"({"peers": 2.5})",
               R"({"peers": true})",
               R"({"peers": 100000000000000})",
               R"({"seed": 8589934593})",
               R"({"seed": -1})",
               R"({"block_size": 1000000000000000})",
               R"({"block_size": 64.5})",
             }) {
            auto config = RunConfig::from_json(Json::parse(bad));
            assert(not config.has_value());
            assert(config.error() == RunConfig::Error::INVALID_VALUE);
        }

        auto largest_seed = RunConfig::from_json(R"({"seed": 4294967295})"_json);
        assert(largest_seed.has_value());
        assert(largest_seed->seed == 4294967295u);
    }

    {
        auto config = RunConfig::from_json(R"({"peer_command": []})"_json);
        assert(not config.has_value());
        assert(config.error() == RunConfig::Error::INVALID_VALUE);
    }

    const auto dir = scratch_dir("config");

    {
        auto config = RunConfig::from_file(dir / "absent.json");
        assert(not config.has_value());
        assert(config.error() == RunConfig::Error::FILE_NOT_FOUND);
    }

    {
        write_file(dir / "broken.json", "{\"peers\": ");
        auto config = RunConfig::from_file(dir / "broken.json");
        assert(not config.has_value());
        assert(config.error() == RunConfig::Error::MALFORMED_JSON);
    }

    {
        write_file(dir / "ok.json", R"({"peers": 3, "logs_dir": "out/logs"})");
        auto config = RunConfig::from_file(dir / "ok.json");
        assert(config.has_value());
        assert(config->peers == 3);
        assert(config->logs_dir == fs::path("out/logs"));
    }

    fs::remove_all(dir);
}

void test_parse_number()
{
    using utils::to_number;

    assert(to_number<long long>("23") == 23);
    assert(to_number<long long>("-4") == -4);
    assert(to_number<long long>("4x") == std::nullopt);
    assert(to_number<long long>("") == std::nullopt);
    assert(to_number<std::size_t>("-4") == std::nullopt);
}

void test_workspace()
{
    const auto dir = scratch_dir("workspace");

    auto config = RunConfig::from_json(Json::object());
    assert(config.has_value());
    config->blocks_dir = dir / "blocks";
    config->downloads_dir = dir / "downloads";
    config->logs_dir = dir / "logs";

    fs::create_directories(config->blocks_dir);
    write_file(config->blocks_dir / "stale_block_0", "old");

    utils::prepare_workspace(*config);

    assert(fs::is_directory(config->blocks_dir));
    assert(fs::is_directory(config->downloads_dir));
    assert(fs::is_directory(config->logs_dir));
    assert(fs::is_empty(config->blocks_dir));

    // Source file lives in a dir that would be wiped
    {
        config->files_dir = dir / "blocks";
        write_file(config->source_path(), "precious");

        bool refused = false;
        try {
            utils::prepare_workspace(*config);
        } catch (const std::runtime_error&) {
            refused = true;
        }

        assert(refused);
        assert(read_file(config->source_path()) == "precious");
    }

    assert(not utils::is_within(dir / "files/a.png", dir / "files/blocks"));
    assert(utils::is_within(dir / "files/blocks/a", dir / "files"));

    fs::remove_all(dir);
}

void test_task_launcher()
{
    using namespace minibit::launcher;

    auto assignment = swarm::schedule(23, 10, 5);
    assert(assignment.has_value());

    const auto launches = make_launches(
      swarm::to_per_peer_manifest(*assignment), assignment->total_blocks
    );
    assert(launches.size() == 10);
    assert(launches[3].peer_id == 3);
    assert(launches[3].total_blocks == 23);
    assert(launches[3].blocks == assignment->blocks_of(3));

    // Every peer runs once with its own manifest entry
    {
        std::mutex seen_mutex;
        std::set<swarm::Block> seen_blocks;
        std::set<PeerId> seen_peers;
        std::size_t last_progress = 0;

        TaskLauncher task_launcher(
          [&](const PeerLaunch& launch) {
              std::scoped_lock lock(seen_mutex);
              seen_peers.insert(launch.peer_id);
              seen_blocks.insert(launch.blocks.begin(), launch.blocks.end());
              return 0;
          },
          [&](std::size_t finished, std::size_t overall) {
              assert(overall == 10);
              last_progress = finished;
          }
        );

        auto report = task_launcher.launch(launches);
        assert(report.succeeded());
        assert(report.outcomes.size() == 10);
        assert(seen_peers.size() == 10);
        assert(seen_blocks.size() == 23);
        assert(last_progress == 10);
    }

    // Failing and throwing peers are reported, the others still run
    {
        TaskLauncher task_launcher([](const PeerLaunch& launch) -> int {
            if (launch.peer_id == 2) {
                return 3;
            }
            if (launch.peer_id == 7) {
                throw std::runtime_error("peer crashed");
            }
            return 0;
        });

        auto report = task_launcher.launch(launches);
        assert(not report.succeeded());
        assert((report.failed_peers() == std::vector<PeerId>{2, 7}));
        assert(report.not_started_peers().empty());
        assert(report.outcomes[2].exit_code == 3);
        assert(report.outcomes[0].exit_code == 0);
    }

    {
        TaskLauncher task_launcher([](const PeerLaunch&) { return 0; });
        auto report = task_launcher.launch({});
        assert(report.succeeded());
        assert(report.outcomes.empty());
    }

    {
        PeerLaunch launch{.peer_id = 4, .total_blocks = 23, .blocks = {14, 4}};
        assert((peer_arguments(launch) ==
                std::vector<std::string>{"4", "23", "14", "4"}));
    }
}

void test_process_launcher()
{
    using namespace minibit::launcher;

    const auto dir = scratch_dir("process");

    auto assignment = swarm::schedule(7, 3, 11);
    assert(assignment.has_value());

    const auto launches = make_launches(
      swarm::to_per_peer_manifest(*assignment), assignment->total_blocks
    );

    // Each peer gets its id, the blocks count and its blocks in order
    {
        const auto script =
          fmt::format(R"(echo "$0 $*" > "{}/peer_$0.txt")", dir.string());

        ProcessLauncher process_launcher({"/bin/sh", "-c", script});
        auto report = process_launcher.launch(launches);
        assert(report.succeeded());

        for (auto&& launch : launches) {
            std::vector<std::size_t> numbers{launch.total_blocks};
            numbers.insert(
              numbers.end(), launch.blocks.begin(), launch.blocks.end()
            );

            const auto expected =
              fmt::format("{} {}\n", launch.peer_id, fmt::join(numbers, " "));

            const auto received =
              read_file(dir / fmt::format("peer_{}.txt", launch.peer_id));
            assert(received == expected);
        }
    }

    // Peer output goes to its own log
    {
        const auto logs_dir = dir / "logs";

        ProcessLauncher process_launcher(
          {"/bin/sh", "-c", "echo started peer $0"}, logs_dir
        );
        auto report = process_launcher.launch(launches);
        assert(report.succeeded());

        const auto log_path = process_launcher.log_path(1);
        assert(log_path.has_value());
        assert(*log_path == logs_dir / "peer_1.log");
        assert(read_file(*log_path) == "started peer 1\n");
    }

    // Log file that can't be opened keeps the peer from starting
    {
        write_file(dir / "not_a_dir", "");

        ProcessLauncher process_launcher(
          {"/bin/sh", "-c", "exit 0"}, dir / "not_a_dir" / "logs"
        );
        auto report = process_launcher.launch(launches);
        assert(not report.succeeded());
        assert(report.not_started_peers().size() == launches.size());
        assert(not report.outcomes[0].start_error.empty());
    }

    // Exit codes are collected per peer
    {
        ProcessLauncher process_launcher(
          {"/bin/sh", "-c", R"(if [ "$0" = 1 ]; then exit 5; fi)"}
        );
        auto report = process_launcher.launch(launches);
        assert(not report.succeeded());
        assert((report.failed_peers() == std::vector<PeerId>{1}));
        assert(report.outcomes[1].started);
        assert(report.outcomes[1].exit_code == 5);
    }

    // A peer killed by a signal reports 128 + signal
    {
        ProcessLauncher process_launcher(
          {"/bin/sh", "-c", R"(if [ "$0" = 2 ]; then kill -9 $$; fi)"}
        );
        auto report = process_launcher.launch(launches);
        assert(not report.succeeded());
        assert((report.failed_peers() == std::vector<PeerId>{2}));
        assert(report.outcomes[2].started);
        assert(report.outcomes[2].exit_code == 137);
    }

    // A peer that can't start is reported and absent
    {
        ProcessLauncher process_launcher({"/nonexistent/minibit-peer"});
        auto report = process_launcher.launch(launches);
        assert(not report.succeeded());
        assert(report.not_started_peers().size() == launches.size());
        assert(not report.outcomes[0].start_error.empty());
    }

    fs::remove_all(dir);
}

void test_run_swarm()
{
    using namespace minibit::launcher;

    const auto dir = scratch_dir("run");

    auto config = RunConfig::from_json(Json::object());
    assert(config.has_value());
    config->file_name = "source.bin";
    config->files_dir = dir / "files";
    config->blocks_dir = dir / "files/blocks";
    config->downloads_dir = dir / "files/downloads";
    config->logs_dir = dir / "logs";
    config->block_size = 64;
    config->peers = 4;
    config->seed = 3;

    fs::create_directories(config->files_dir);

    std::mutex seen_mutex;
    std::set<swarm::Block> seen_blocks;
    std::size_t started = 0;

    TaskLauncher task_launcher([&](const PeerLaunch& launch) {
        std::scoped_lock lock(seen_mutex);
        started++;
        seen_blocks.insert(launch.blocks.begin(), launch.blocks.end());
        return 0;
    });

    auto reset = [&] {
        started = 0;
        seen_blocks.clear();
    };

    // Missing source aborts before any peer
    {
        auto result = run_swarm(*config, task_launcher);
        assert(not result.has_value());
        assert(result.error() == RunError::PARTITION_FAILURE);
        assert(started == 0);
    }

    write_file(config->source_path(), std::string(150, 'x'));

    // Bad peers count aborts before any peer and before cleanup
    {
        reset();
        auto bad_config = *config;
        bad_config.peers = 0;
        write_file(config->blocks_dir / "kept_block", "old");

        auto result = run_swarm(bad_config, task_launcher);
        assert(not result.has_value());
        assert(result.error() == RunError::INVALID_CONFIGURATION);
        assert(started == 0);
        assert(fs::exists(config->blocks_dir / "kept_block"));
    }

    // Source inside a dir to wipe aborts before any peer
    {
        reset();
        auto bad_config = *config;
        bad_config.logs_dir = config->files_dir;

        auto result = run_swarm(bad_config, task_launcher);
        assert(not result.has_value());
        assert(result.error() == RunError::WORKSPACE_FAILURE);
        assert(started == 0);
        assert(fs::exists(config->source_path()));
    }

    // Every block reaches some peer
    {
        reset();
        auto result = run_swarm(*config, task_launcher);
        assert(result.has_value());
        assert(result->total_blocks == 3);
        assert(result->report.succeeded());
        assert(result->report.outcomes.size() == 4);
        assert(started == 4);
        assert((seen_blocks == std::set<swarm::Block>{0, 1, 2}));
        assert(not fs::exists(config->blocks_dir / "kept_block"));
    }

    // Empty source still starts every peer
    {
        reset();
        write_file(config->source_path(), "");

        auto result = run_swarm(*config, task_launcher);
        assert(result.has_value());
        assert(result->total_blocks == 0);
        assert(result->report.succeeded());
        assert(started == 4);
        assert(seen_blocks.empty());
    }

    fs::remove_all(dir);
}
