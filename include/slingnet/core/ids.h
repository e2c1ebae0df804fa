#pragma once
#include <cstdint>
#include <string>

namespace slingnet {

// Entity ids are allocated from GameState::next_id and never reused.
using Id = std::uint64_t;

constexpr Id kInvalidId = 0;

// Players are identified by the opaque strings the host assigns them
// ("player1", a session token, ...).
using PlayerId = std::string;

} // namespace slingnet
