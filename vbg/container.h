#pragma once

namespace vbg {

template <typename Map, typename Key>
bool contains(const Map& map, const Key& key) {
  return map.find(key) != map.end();
}

// Returns the mapped pointer or nullptr.
template <typename Map, typename Key>
typename Map::mapped_type find_or_null(const Map& map, const Key& key) {
  auto it = map.find(key);
  if (it == map.end()) return nullptr;
  return it->second;
}

}  // namespace vbg
