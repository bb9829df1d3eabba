#include "swarm/manifest.hpp"

#include <string>

#include <nlohmann/json.hpp>

#include "swarm/types.hpp"

namespace minibit::swarm {

auto manifest_to_json(const Manifest& manifest, std::size_t total_blocks)
  -> Json
{
    auto peers = Json::object();

    for (auto&& [peer, blocks] : manifest) {
        peers[std::to_string(peer)] = blocks;
    }

    return Json{
      {"total_blocks", total_blocks},
      {"peer_count", manifest.size()},
      {"peers", peers},
    };
}

}  // namespace minibit::swarm
