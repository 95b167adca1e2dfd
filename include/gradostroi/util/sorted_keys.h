#pragma once

#include <algorithm>
#include <vector>

namespace gradostroi::util {

// Content registries are std::unordered_map keyed by id. Iterating them in
// hash order would make event logs, saves and reports differ between
// platforms, so anything observable walks the keys in sorted order.
template <typename Map>
inline std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(m.size());
  for (const auto& kv : m) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace gradostroi::util
