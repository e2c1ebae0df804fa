#pragma once

#include <cstddef>
#include <optional>
#include <unordered_set>

#include "slingnet/core/game_state.h"
#include "slingnet/core/rules.h"

namespace slingnet {

// Creation request for a structure. Unset fields take the per-type defaults.
struct EntitySpec {
  EntityType type{EntityType::Hub};
  PlayerId owner;
  Vec2 position{0.0, 0.0};

  std::optional<double> hp;
  std::optional<FuelTank> fuel;

  bool is_starter{false};
  bool deployed{true};
};

// Allocate an id and append a structure to the state.
//
// - hub/defense without explicit fuel get a full tank from RulesConfig;
// - types without a fuel system never carry a tank, even if one was given;
// - hp defaults to the type's full hit points;
// - the position is wrapped into the map.
//
// The returned reference is invalidated by the next insertion or batch removal.
Entity& create_entity(GameState& s, const RulesConfig& cfg, const EntitySpec& spec);

// Append a directed link. `intended` is the displacement actually flown.
Link& create_link(GameState& s, Id from_id, Id to_id, const PlayerId& owner,
                  std::optional<Vec2> intended = std::nullopt);

Entity* find_entity(GameState& s, Id id);
const Entity* find_entity(const GameState& s, Id id);

// Number of hub structures owned by a player.
int count_hubs(const GameState& s, const PlayerId& owner);

const Entity* find_starter_hub(const GameState& s, const PlayerId& owner);

// Entities scheduled for removal at the next batch boundary.
//
// Collecting ids first and removing them in one pass keeps "simultaneous"
// outcomes independent of the order in which they were discovered.
class DestructionSet {
 public:
  void mark(Id id) { ids_.insert(id); }
  bool contains(Id id) const { return ids_.count(id) != 0; }
  bool empty() const { return ids_.empty(); }
  std::size_t size() const { return ids_.size(); }

 private:
  std::unordered_set<Id> ids_;
};

// Remove every marked entity and every link touching one of them.
// Survivors keep their relative order. Returns the number of removed entities.
std::size_t apply_destruction(GameState& s, const DestructionSet& doomed);

} // namespace slingnet
