#pragma once

#include <unordered_map>
#include <vector>

#include "slingnet/core/entities.h"
#include "slingnet/core/ids.h"

namespace slingnet {

// A queued slingshot launch.
//
// The engine never rejects an action loudly: a stale source, a foreign source,
// an exhausted fuel tank or missing energy simply cause it to be skipped.
struct LaunchAction {
  // Acting player. May be left empty, in which case the key of the queue the
  // action was submitted under is used.
  PlayerId player_id;

  Id source_id{kInvalidId};
  EntityType item_type{EntityType::Weapon};

  // Degrees, 0 = +x, 90 = +y (screen space, y grows downward).
  double angle_deg{0.0};

  // Raw slingshot pull; mapped through the launch power curve.
  double pull_distance{0.0};
};

// Per-player ordered queues for one turn.
using ActionQueues = std::unordered_map<PlayerId, std::vector<LaunchAction>>;

} // namespace slingnet
