#pragma once

#include <string>
#include <vector>

#include "slingnet/core/actions.h"
#include "slingnet/core/game_state.h"
#include "slingnet/core/snapshot.h"
#include "slingnet/util/json.h"

namespace slingnet {

// Upper-case tags used on the wire ("HUB", "WEAPON", ...).
const char* entity_type_to_string(EntityType t);
// Accepts any case. Throws std::runtime_error for unknown tags.
EntityType entity_type_from_string(const std::string& s);

// Full game state <-> JSON. Field names follow the client schema
// (camelCase: isStarter, maxFuel, intendedDx, ...).
json::Value serialize_game_to_json_value(const GameState& state);
std::string serialize_game_to_json(const GameState& state);

// Throws std::runtime_error on malformed documents (non-finite or
// out-of-range numbers, in-flight entity types). Positions are wrapped into
// the map; run validate_game_state() for cross-record checks.
GameState game_from_json_value(const json::Value& v);
GameState deserialize_game_from_json(const std::string& json_text);

// Snapshot frames. ROUND_SUB frames carry their projectiles and beams as extra
// PROJECTILE / VISUAL_EFFECT records appended to state.entities.
json::Value serialize_snapshot_to_json_value(const Snapshot& snap);
std::string serialize_snapshots_to_json(const std::vector<Snapshot>& snaps, int indent = 2);

// {"player1": [{"playerId": ..., "sourceId": ..., "itemType": ..., "angle": ..., "distance": ...}], ...}
ActionQueues action_queues_from_json(const json::Value& v);
json::Value action_queues_to_json(const ActionQueues& queues);

} // namespace slingnet
