#pragma once

// Helpers shared by the Simulation translation units. Not part of the public API.

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include "slingnet/core/actions.h"
#include "slingnet/core/serialization.h"
#include "slingnet/core/toroidal.h"

namespace slingnet::sim_internal {

// unordered_map iteration order is unspecified; anything that feeds the
// simulation or its logs walks keys through this instead.
template <typename Map>
std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(m.size());
  for (const auto& [k, _] : m) keys.push_back(k);
  std::sort(keys.begin(), keys.end());
  return keys;
}

// One-line description for log messages.
inline std::string describe_action(const PlayerId& pid, const LaunchAction& a) {
  std::ostringstream ss;
  ss << pid << " " << entity_type_to_string(a.item_type) << " from #" << a.source_id << " (angle " << a.angle_deg
     << ", pull " << a.pull_distance << ")";
  return ss.str();
}

// Wrapped point at `progress` in [0, 1] along a launch.
inline Vec2 point_along(const Vec2& start, const Vec2& intended, double progress, double width, double height) {
  return wrap_position(start + intended * progress, width, height);
}

} // namespace slingnet::sim_internal
