#include "slingnet/core/state_validation.h"

#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace slingnet {

namespace {

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

bool in_bounds(double v, double extent) { return v >= 0.0 && v < extent; }

} // namespace

std::vector<std::string> validate_game_state(const GameState& s) {
  std::vector<std::string> errors;

  if (s.turn < 1) errors.push_back(join("Turn must be >= 1, got ", s.turn));
  if (!(s.map.width > 0.0) || !(s.map.height > 0.0)) {
    errors.push_back(join("Map size must be positive, got ", s.map.width, "x", s.map.height));
  }

  for (const auto& [pid, p] : s.players) {
    if (pid.empty()) errors.push_back("Player with an empty id");
    if (p.id != pid) errors.push_back(join("Player id mismatch: key=", pid, " value.id=", p.id));
    if (p.energy < 0) errors.push_back(join("Player ", pid, " has negative energy ", p.energy));
  }

  std::unordered_set<Id> ids;
  std::unordered_map<PlayerId, int> starters;
  for (const Entity& e : s.entities) {
    const std::string tag = join("Entity #", e.id);
    if (e.id == kInvalidId) errors.push_back("Entity with invalid id 0");
    if (!ids.insert(e.id).second) errors.push_back(join("Duplicate entity id ", e.id));
    if (e.id >= s.next_id) errors.push_back(join(tag, " is not below next id ", s.next_id));

    if (e.type == EntityType::Projectile || e.type == EntityType::VisualEffect) {
      errors.push_back(join(tag, " has an ephemeral type in persistent state"));
    }
    if (!e.owner.empty() && !s.players.count(e.owner)) {
      errors.push_back(join(tag, " owned by unknown player ", e.owner));
    }
    if (!in_bounds(e.position.x, s.map.width) || !in_bounds(e.position.y, s.map.height)) {
      errors.push_back(join(tag, " is outside the map at (", e.position.x, ", ", e.position.y, ")"));
    }

    if (e.fuel) {
      if (!has_fuel_system(e.type)) errors.push_back(join(tag, " has a fuel tank but no fuel system"));
      if (e.fuel->max_fuel < 0 || e.fuel->fuel < 0 || e.fuel->fuel > e.fuel->max_fuel) {
        errors.push_back(join(tag, " fuel ", e.fuel->fuel, " outside [0, ", e.fuel->max_fuel, "]"));
      }
    }

    if (e.is_starter) {
      if (e.type != EntityType::Hub) errors.push_back(join(tag, " is a starter but not a hub"));
      ++starters[e.owner];
    }
  }

  for (const auto& [owner, count] : starters) {
    if (count > 1) errors.push_back(join("Player ", owner, " has ", count, " starter hubs"));
  }

  for (const Link& l : s.links) {
    if (!ids.count(l.from_id)) errors.push_back(join("Link ", l.from_id, "->", l.to_id, " has a missing source"));
    if (!ids.count(l.to_id)) errors.push_back(join("Link ", l.from_id, "->", l.to_id, " has a missing target"));
    if (!l.owner.empty() && !s.players.count(l.owner)) {
      errors.push_back(join("Link ", l.from_id, "->", l.to_id, " owned by unknown player ", l.owner));
    }
  }

  if (s.winner && s.winner->empty()) errors.push_back("Winner is set but empty");

  std::sort(errors.begin(), errors.end());
  return errors;
}

} // namespace slingnet
