#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "slingnet/core/ids.h"
#include "slingnet/core/vec2.h"

namespace slingnet {

// Closed set of entity kinds.
//
// Hub/Weapon/Extractor/Defense are also the item types a launch can carry.
// Projectile and VisualEffect only appear as tags of the ephemeral records
// injected into ROUND_SUB snapshots; they are never stored in GameState.
enum class EntityType : std::uint8_t {
  Hub = 0,
  Weapon = 1,
  Extractor = 2,
  Defense = 3,
  Projectile = 4,
  VisualEffect = 5,
};

// Types that can be queued as a launch payload.
inline bool is_launchable_item(EntityType t) {
  return t == EntityType::Hub || t == EntityType::Weapon || t == EntityType::Extractor ||
         t == EntityType::Defense;
}

// Structures with a fuel system (see RulesConfig::default_fuel_for).
inline bool has_fuel_system(EntityType t) { return t == EntityType::Hub || t == EntityType::Defense; }

// Launch/interception budget of a structure.
//
// A hub spends one unit per launch it originates, a defense one unit per
// projectile it intercepts. Tanks are refilled to max_fuel at the end of every
// turn (never between rounds).
struct FuelTank {
  int fuel{0};
  int max_fuel{0};

  bool empty() const { return fuel <= 0; }
};

// A persistent structure on the map.
struct Entity {
  Id id{kInvalidId};
  EntityType type{EntityType::Hub};

  // Empty for neutral map features.
  PlayerId owner;

  // Always wrapped into the map rectangle.
  Vec2 position{0.0, 0.0};

  double hp{0.0};

  // Present exactly for types with a fuel system.
  std::optional<FuelTank> fuel;

  // True only for each player's initial hub (root of the link network).
  bool is_starter{false};

  // False during the landing vulnerability window: 1 HP, no abilities.
  // Promoted at the end of the round the structure landed in.
  bool deployed{true};

  // Fog-of-war annotation, only set on visibility projections.
  // true = currently in vision (or owned), false = known only through a link.
  std::optional<bool> scouted;

  bool has_fuel() const { return !fuel || fuel->fuel > 0; }
};

// Directed structural edge: `from_id` launched `to_id`.
struct Link {
  Id from_id{kInvalidId};
  Id to_id{kInvalidId};
  PlayerId owner;

  // Displacement actually flown when the link was created.
  //
  // Stored instead of recomputed because the shortest toroidal path between the
  // endpoints can flip direction relative to what was animated.
  std::optional<Vec2> intended;
};

struct Player {
  PlayerId id;
  int energy{0};
  std::string color;
  bool alive{true};
};

struct ResourceNode {
  std::string id;
  Vec2 position{0.0, 0.0};
  int value{0};
};

struct MapInfo {
  double width{1000.0};
  double height{1000.0};

  // Static after initialization.
  std::vector<ResourceNode> resources;
};

// --- ephemeral, per-round records ---

// A launch in flight.
//
// position is always start + intended * progress (wrapped). The intended
// vector is fixed at launch and never re-derived from the landing point.
struct Projectile {
  Id id{kInvalidId};
  PlayerId owner;
  Id source_id{kInvalidId};
  EntityType payload{EntityType::Weapon};

  Vec2 start{0.0, 0.0};
  Vec2 intended{0.0, 0.0};
  Vec2 position{0.0, 0.0};

  bool active{true};
};

// Transient laser beam drawn from a defense to the projectile it intercepted.
struct LaserBeam {
  Id defense_id{kInvalidId};
  Id projectile_id{kInvalidId};
  PlayerId owner;
  Vec2 from{0.0, 0.0};
  Vec2 to{0.0, 0.0};

  // Sub-ticks until the effect disappears.
  int life{0};
};

} // namespace slingnet
