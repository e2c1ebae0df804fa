#pragma once

#include <vector>

#include "slingnet/core/game_state.h"

namespace slingnet {

enum class SnapshotType {
  Energy,    // after per-turn income
  RoundSub,  // animation frame inside a round
  Round,     // after a round's destructions, deployment and integrity check
  Final,     // end of the turn (or the only snapshot once a winner exists)
};

// One frame of the ordered playback a resolve_turn() call produces.
//
// `state` is a full independent copy. Projectiles and beams are only filled for
// RoundSub frames.
struct Snapshot {
  SnapshotType type{SnapshotType::Final};
  int round{0};
  int sub_tick{0};

  GameState state;

  std::vector<Projectile> projectiles;
  std::vector<LaserBeam> beams;
};

const char* snapshot_type_to_string(SnapshotType t);

} // namespace slingnet
