#include "slingnet/core/game_state.h"

#include <algorithm>

namespace slingnet {

Id allocate_id(GameState& s) { return s.next_id++; }

std::vector<PlayerId> sorted_player_ids(const GameState& s) {
  std::vector<PlayerId> ids;
  ids.reserve(s.players.size());
  for (const auto& [pid, _] : s.players) ids.push_back(pid);
  std::sort(ids.begin(), ids.end());
  return ids;
}

} // namespace slingnet
