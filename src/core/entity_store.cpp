#include "slingnet/core/entity_store.h"

#include <algorithm>

#include "slingnet/core/toroidal.h"

namespace slingnet {

Entity& create_entity(GameState& s, const RulesConfig& cfg, const EntitySpec& spec) {
  Entity e;
  e.id = allocate_id(s);
  e.type = spec.type;
  e.owner = spec.owner;
  e.position = wrap_position(spec.position, s.map.width, s.map.height);
  e.hp = (spec.hp && *spec.hp > 0.0) ? *spec.hp : max_hp_for(cfg, spec.type);
  e.is_starter = spec.is_starter;
  e.deployed = spec.deployed;

  if (has_fuel_system(spec.type)) {
    if (spec.fuel) {
      e.fuel = spec.fuel;
    } else if (const auto max_fuel = default_fuel_for(cfg, spec.type)) {
      e.fuel = FuelTank{*max_fuel, *max_fuel};
    }
  }

  s.entities.push_back(std::move(e));
  return s.entities.back();
}

Link& create_link(GameState& s, Id from_id, Id to_id, const PlayerId& owner, std::optional<Vec2> intended) {
  Link l;
  l.from_id = from_id;
  l.to_id = to_id;
  l.owner = owner;
  l.intended = intended;
  s.links.push_back(std::move(l));
  return s.links.back();
}

Entity* find_entity(GameState& s, Id id) {
  for (Entity& e : s.entities) {
    if (e.id == id) return &e;
  }
  return nullptr;
}

const Entity* find_entity(const GameState& s, Id id) {
  for (const Entity& e : s.entities) {
    if (e.id == id) return &e;
  }
  return nullptr;
}

int count_hubs(const GameState& s, const PlayerId& owner) {
  return static_cast<int>(std::count_if(s.entities.begin(), s.entities.end(), [&](const Entity& e) {
    return e.type == EntityType::Hub && e.owner == owner;
  }));
}

const Entity* find_starter_hub(const GameState& s, const PlayerId& owner) {
  for (const Entity& e : s.entities) {
    if (e.is_starter && e.type == EntityType::Hub && e.owner == owner) return &e;
  }
  return nullptr;
}

std::size_t apply_destruction(GameState& s, const DestructionSet& doomed) {
  if (doomed.empty()) return 0;

  const std::size_t before = s.entities.size();
  s.entities.erase(std::remove_if(s.entities.begin(), s.entities.end(),
                                  [&](const Entity& e) { return doomed.contains(e.id); }),
                   s.entities.end());
  s.links.erase(std::remove_if(s.links.begin(), s.links.end(),
                               [&](const Link& l) { return doomed.contains(l.from_id) || doomed.contains(l.to_id); }),
                s.links.end());
  return before - s.entities.size();
}

} // namespace slingnet
