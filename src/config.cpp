#include "config.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <fmt/std.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

namespace minibit {

using Json = nlohmann::json;

auto RunConfig::from_file(std::filesystem::path file_path)
  -> tl::expected<RunConfig, Error>
{
    if (not std::filesystem::exists(file_path)) {
        spdlog::error("Config file not found: {}", file_path);
        return tl::make_unexpected(Error::FILE_NOT_FOUND);
    }

    std::ifstream config_file(file_path);

    auto config_json = Json::parse(config_file, nullptr, false);
    if (config_json.is_discarded() or not config_json.is_object()) {
        spdlog::error("Config file {} is not a JSON object", file_path);
        return tl::make_unexpected(Error::MALFORMED_JSON);
    }

    return from_json(config_json);
}

auto RunConfig::from_json(const Json& json) -> tl::expected<RunConfig, Error>
{
    RunConfig config;

    // json.value() converts any number or bool without complaint
    for (auto&& key : {"block_size", "seed"}) {
        if (json.contains(key) and not json[key].is_null() and
            not json[key].is_number_unsigned()) {
            spdlog::error("Config: \"{}\" must be a non-negative integer", key);
            return tl::make_unexpected(Error::INVALID_VALUE);
        }
    }

    if (json.contains("peers") and not json["peers"].is_number_integer()) {
        spdlog::error("Config: \"peers\" must be an integer");
        return tl::make_unexpected(Error::INVALID_VALUE);
    }

    if (json.contains("seed") and not json["seed"].is_null() and
        json["seed"].get<std::uint64_t>() >
          std::numeric_limits<swarm::Seed>::max()) {
        spdlog::error(
          "Config: \"seed\" must not exceed {}",
          std::numeric_limits<swarm::Seed>::max()
        );
        return tl::make_unexpected(Error::INVALID_VALUE);
    }

    try {
        config.file_name = json.value("file_name", config.file_name);
        config.files_dir =
          json.value("files_dir", config.files_dir.string());
        config.blocks_dir =
          json.value("blocks_dir", config.blocks_dir.string());
        config.downloads_dir =
          json.value("downloads_dir", config.downloads_dir.string());
        config.logs_dir = json.value("logs_dir", config.logs_dir.string());
        config.block_size = json.value("block_size", config.block_size);
        config.peers = json.value("peers", config.peers);
        config.peer_command = json.value("peer_command", config.peer_command);

        if (json.contains("seed") and not json["seed"].is_null()) {
            config.seed = json["seed"].get<swarm::Seed>();
        }
    } catch (const Json::exception& e) {
        spdlog::error("Bad config value: {}", e.what());
        return tl::make_unexpected(Error::INVALID_VALUE);
    }

    if (config.block_size == 0 or
        config.block_size > partition::MAX_BLOCK_SIZE) {
        spdlog::error(
          "Config: \"block_size\" must be in [1, {}]", partition::MAX_BLOCK_SIZE
        );
        return tl::make_unexpected(Error::INVALID_VALUE);
    }

    if (config.peers <= 0 or config.peers > swarm::MAX_PEER_COUNT) {
        spdlog::error(
          "Config: \"peers\" must be in [1, {}], got {}",
          swarm::MAX_PEER_COUNT, config.peers
        );
        return tl::make_unexpected(Error::INVALID_VALUE);
    }

    if (config.peer_command.empty() or config.peer_command.front().empty()) {
        spdlog::error("Config: \"peer_command\" is empty");
        return tl::make_unexpected(Error::INVALID_VALUE);
    }

    return config;
}

}  // namespace minibit
