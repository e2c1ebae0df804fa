#pragma once

#include <vector>

#include "slingnet/core/game_state.h"
#include "slingnet/core/rules.h"
#include "slingnet/core/snapshot.h"

namespace slingnet {

// Viewer id that always sees everything (as does an empty id).
inline const PlayerId kSpectatorId = "spectator";

inline bool is_spectator(const PlayerId& viewer) { return viewer.empty() || viewer == kSpectatorId; }

struct VisionCircle {
  Vec2 center{0.0, 0.0};
  double radius{0.0};
  Id entity_id{kInvalidId};
};

// Vision sources of a player: its own entities with a non-zero type radius.
std::vector<VisionCircle> gather_vision_circles(const RulesConfig& cfg, const GameState& s,
                                                const PlayerId& viewer);

// True if any circle covers the point (toroidal distance, boundary inclusive).
bool any_circle_covers(const std::vector<VisionCircle>& circles, const Vec2& p, double width,
                       double height);

bool is_position_visible(const RulesConfig& cfg, const GameState& s, const PlayerId& viewer,
                         const Vec2& p);

// Fog-of-war projection of a full state.
//
// Never mutates `s`. Spectators get an unfiltered copy. Otherwise:
// - own entities and entities inside vision are kept with scouted = true;
// - a link is kept if an endpoint is owned/visible or if any point sampled
//   along its flown path is visible; both endpoints of a kept link are then
//   included, with scouted = false unless already seen;
// - everything else is dropped.
//
// Works on any full-state snapshot, so historical frames can be filtered
// during playback.
GameState project_visible_state(const RulesConfig& cfg, const GameState& s, const PlayerId& viewer);

// Same filter applied to a snapshot frame; projectiles and beams are kept when
// owned by the viewer or currently inside its vision.
Snapshot project_visible_snapshot(const RulesConfig& cfg, const Snapshot& snap, const PlayerId& viewer);

} // namespace slingnet
