#include "partition/partition.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

namespace minibit::partition {

namespace fs = std::filesystem;

auto block_path(
  const fs::path& blocks_dir, std::string_view file_name, std::size_t index
) -> fs::path
{
    return blocks_dir / fmt::format("{}_block_{}", file_name, index);
}

auto split_file(
  const fs::path& source, const fs::path& blocks_dir, std::size_t block_size
) -> tl::expected<std::size_t, Error>
{
    if (block_size == 0 or block_size > MAX_BLOCK_SIZE) {
        spdlog::error(
          "Block size must be in [1, {}]. Got {}", MAX_BLOCK_SIZE, block_size
        );
        return tl::make_unexpected(Error::INVALID_BLOCK_SIZE);
    }

    if (not fs::is_regular_file(source)) {
        spdlog::error("Source file not found: {}", source);
        return tl::make_unexpected(Error::SOURCE_NOT_FOUND);
    }

    std::ifstream source_file(source, std::ios::in | std::ios::binary);
    if (not source_file) {
        spdlog::error("Can't open source file {}", source);
        return tl::make_unexpected(Error::SOURCE_UNREADABLE);
    }

    std::error_code ec;
    fs::create_directories(blocks_dir, ec);
    if (ec) {
        spdlog::error("Can't create blocks dir {}: {}", blocks_dir, ec.message());
        return tl::make_unexpected(Error::DESTINATION_UNWRITABLE);
    }

    const auto file_name = source.filename().string();
    std::vector<char> chunk(block_size);

    std::size_t block_idx = 0;
    while (true) {
        source_file.read(chunk.data(), chunk.size());
        const auto read_size = source_file.gcount();

        if (source_file.bad()) {
            spdlog::error("Read error on {} at block {}", source, block_idx);
            return tl::make_unexpected(Error::SOURCE_UNREADABLE);
        }

        if (read_size == 0) {
            break;
        }

        const auto path = block_path(blocks_dir, file_name, block_idx);
        std::ofstream block_file(path, std::ios::out | std::ios::binary);
        block_file.write(chunk.data(), read_size);

        if (not block_file) {
            spdlog::error("Can't write block {}", path);
            return tl::make_unexpected(Error::DESTINATION_UNWRITABLE);
        }

        block_idx++;
    }

    spdlog::debug(
      "{} split into {} blocks of {} bytes", source, block_idx, block_size
    );

    return block_idx;
}

auto assemble_file(
  std::vector<std::size_t> block_indexes,
  const fs::path& blocks_dir,
  std::string_view file_name,
  std::ostream& output
) -> tl::expected<std::size_t, Error>
{
    std::ranges::sort(block_indexes);
    const auto [last, end] = std::ranges::unique(block_indexes);
    block_indexes.erase(last, end);

    std::size_t bytes_written = 0;

    for (auto idx : block_indexes) {
        const auto path = block_path(blocks_dir, file_name, idx);

        std::ifstream block_file(path, std::ios::in | std::ios::binary);
        if (not block_file) {
            spdlog::error("Assembling error. Block {} not found", path);
            return tl::make_unexpected(Error::BLOCK_MISSING);
        }

        // Streaming an empty buffer would set failbit on output
        const auto block_size = fs::file_size(path);
        if (block_size > 0) {
            output << block_file.rdbuf();
        }
        bytes_written += block_size;

        if (not output) {
            spdlog::error("Can't write block {} to output", idx);
            return tl::make_unexpected(Error::DESTINATION_UNWRITABLE);
        }
    }

    spdlog::debug(
      "Assembled {} blocks, {} bytes", block_indexes.size(), bytes_written
    );

    return bytes_written;
}

}  // namespace minibit::partition
