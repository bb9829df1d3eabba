#pragma once

#include <nlohmann/json.hpp>

#include "swarm/types.hpp"

namespace minibit::swarm {

using Json = nlohmann::json;

/**
 * @brief Render manifest as `{"<peer id>": [blocks...], ...}`
 */
auto manifest_to_json(const Manifest& manifest, std::size_t total_blocks)
  -> Json;

}  // namespace minibit::swarm
