#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include "partition/partition.hpp"
#include "swarm/scheduler.hpp"
#include "swarm/types.hpp"

namespace minibit {

struct RunConfig
{
    enum class Error
    {
        FILE_NOT_FOUND,
        MALFORMED_JSON,
        INVALID_VALUE,
    };

    std::string file_name = "uerj.png";
    std::filesystem::path files_dir = "files";
    std::filesystem::path blocks_dir = "files/blocks";
    std::filesystem::path downloads_dir = "files/downloads";
    std::filesystem::path logs_dir = "logs";
    std::size_t block_size = partition::DEFAULT_BLOCK_SIZE;
    swarm::Integer peers = swarm::DEFAULT_PEER_COUNT;
    std::vector<std::string> peer_command = {"python3", "peer/peer.py"};
    std::optional<swarm::Seed> seed;

    static auto from_file(std::filesystem::path)
      -> tl::expected<RunConfig, Error>;

    static auto from_json(const nlohmann::json&)
      -> tl::expected<RunConfig, Error>;

    auto source_path() const -> std::filesystem::path
    {
        return files_dir / file_name;
    }
};

}  // namespace minibit
