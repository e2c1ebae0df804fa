#pragma once

#include <cstddef>

#include "slingnet/core/game_state.h"

namespace slingnet {

// Prune structures that lost their link path to their owner's starter hub.
//
// For every player with a starter hub, walks the link graph (both directions)
// from the starter, only stepping onto entities owned by that same player.
// Entities of that player that were not reached are destroyed together with
// every incident link, in a single batch after all players were processed.
//
// Players without a starter hub are left untouched. Running the check twice in
// a row never changes anything the second time.
//
// Returns the number of destroyed entities.
std::size_t check_link_integrity(GameState& s);

} // namespace slingnet
