#pragma once

#include <cstdint>
#include <string>

#include "slingnet/core/game_state.h"

namespace slingnet {

// Stable 64-bit digest (FNV-1a) of a game state.
//
// Independent of unordered_map iteration order (players are hashed in sorted
// order) and of the host platform; sensitive to entity/link order, which is
// part of the deterministic simulation output. Ephemeral fog-of-war
// annotations (scouted) are ignored.
std::uint64_t digest_game_state64(const GameState& state);

// Fixed-width lowercase hex.
std::string digest64_to_hex(std::uint64_t v);

} // namespace slingnet
