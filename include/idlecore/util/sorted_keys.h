#pragma once

#include <algorithm>
#include <vector>

namespace idlecore::util {

// Keys of an unordered map (content overrides, JSON objects) in ascending
// order. Anything that mutates resources while walking such a map goes through
// this so every run applies the same sequence.
template <typename Map>
inline std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> out;
  out.reserve(m.size());
  for (const auto& entry : m) out.push_back(entry.first);
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace idlecore::util
