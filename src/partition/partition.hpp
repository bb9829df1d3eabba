#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

namespace minibit::partition {

enum class Error
{
    SOURCE_NOT_FOUND,
    SOURCE_UNREADABLE,
    INVALID_BLOCK_SIZE,
    DESTINATION_UNWRITABLE,
    BLOCK_MISSING,
};

constexpr const std::size_t DEFAULT_BLOCK_SIZE = 64;
constexpr const std::size_t MAX_BLOCK_SIZE = 256 * 1024 * 1024;

/**
 * @brief Path of block `index` of file `file_name` inside `blocks_dir`
 */
auto block_path(
  const std::filesystem::path& blocks_dir,
  std::string_view file_name,
  std::size_t index
) -> std::filesystem::path;

/**
 * @brief Split `source` into `block_size` chunks stored in `blocks_dir`
 *
 * Blocks are indexed from zero, the last one may be shorter. Returns the
 * count of written blocks; an empty source gives zero blocks.
 */
auto split_file(
  const std::filesystem::path& source,
  const std::filesystem::path& blocks_dir,
  std::size_t block_size
) -> tl::expected<std::size_t, Error>;

/**
 * @brief Concatenate blocks into `output` in ascending index order
 */
auto assemble_file(
  std::vector<std::size_t> block_indexes,
  const std::filesystem::path& blocks_dir,
  std::string_view file_name,
  std::ostream& output
) -> tl::expected<std::size_t, Error>;

}  // namespace minibit::partition
