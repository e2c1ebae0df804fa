#pragma once

#include <string>
#include <vector>

#include "slingnet/core/game_state.h"

namespace slingnet {

// Validate referential integrity and basic invariants of a GameState.
//
// Intended for loaded saves and hand-built scenarios: dangling link endpoints,
// duplicate ids, multiple starters, fuel tanks on types without a fuel system,
// out-of-bounds positions, negative energy...
//
// Returns a sorted list of human-readable errors. Empty => valid.
std::vector<std::string> validate_game_state(const GameState& s);

} // namespace slingnet
