#pragma once

#include <filesystem>
#include <initializer_list>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include "config.hpp"

namespace minibit::utils {

inline void recreate_dir(const std::filesystem::path& dir)
{
    std::error_code ec;

    std::filesystem::remove_all(dir, ec);
    if (ec) {
        throw std::runtime_error(fmt::format(
          "Can not clean path {}: {}", dir.c_str(), ec.message()
        ));
    }

    if (not std::filesystem::create_directories(dir, ec) or ec) {
        throw std::runtime_error(fmt::format(
          "Can not create path {}: {}", dir.c_str(), ec.message()
        ));
    }
}

inline auto is_within(
  const std::filesystem::path& path, const std::filesystem::path& dir
) -> bool
{
    const auto relative = std::filesystem::weakly_canonical(path)
                            .lexically_relative(
                              std::filesystem::weakly_canonical(dir)
                            );

    return not relative.empty() and *relative.begin() != "..";
}

/**
 * @brief Drop blocks, downloads and logs of a previous run
 */
inline void prepare_workspace(const RunConfig& config)
{
    const auto dirs = {
      config.blocks_dir, config.downloads_dir, config.logs_dir
    };

    for (auto&& dir : dirs) {
        if (is_within(config.source_path(), dir)) {
            throw std::runtime_error(fmt::format(
              "Refusing to clean {}: it holds the source file {}", dir.c_str(),
              config.source_path().c_str()
            ));
        }
    }

    for (auto&& dir : dirs) {
        spdlog::debug("Prepare dir {}", dir);
        recreate_dir(dir);
    }
}

}  // namespace minibit::utils
