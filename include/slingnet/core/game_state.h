#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "slingnet/core/entities.h"

namespace slingnet {

// Winner marker used when every player was eliminated in the same turn.
inline const std::string kDrawWinner = "DRAW";

// The authoritative game (aggregate root).
//
// Copying a GameState yields a fully independent deep copy; snapshots and
// get_state() rely on that.
struct GameState {
  int turn{1};

  Id next_id{1};

  std::unordered_map<PlayerId, Player> players;

  // Creation order. Destruction compacts the vector but keeps survivor order,
  // which is also the deterministic iteration order of the engine.
  std::vector<Entity> entities;
  std::vector<Link> links;

  MapInfo map;

  // Unset while the game is running; a player id or kDrawWinner afterwards.
  std::optional<std::string> winner;
};

Id allocate_id(GameState& s);

// Player ids in sorted order. Every per-player loop of the engine goes
// through this so results never depend on unordered_map iteration order.
std::vector<PlayerId> sorted_player_ids(const GameState& s);

// Small helper for safe lookups.
template <typename Map>
auto* find_ptr(Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<decltype(&it->second)>(nullptr);
  return &it->second;
}

template <typename Map>
const auto* find_ptr(const Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<const decltype(&it->second)>(nullptr);
  return &it->second;
}

} // namespace slingnet
