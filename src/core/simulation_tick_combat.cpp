#include "slingnet/core/simulation.h"

#include "simulation_internal.h"

#include <limits>

#include "slingnet/core/toroidal.h"
#include "slingnet/util/log.h"

namespace slingnet {

using sim_internal::describe_action;
using sim_internal::point_along;

std::vector<Projectile> Simulation::launch_projectiles(const std::vector<std::pair<PlayerId, LaunchAction>>& actions) {
  std::vector<Projectile> out;
  out.reserve(actions.size());
  for (const auto& [pid, a] : actions) {
    Player& player = state_.players.at(pid);
    const int cost = item_cost(cfg_, a.item_type);
    if (player.energy < cost) {
      log::debug("Dropping action " + describe_action(pid, a) + ": needs " + std::to_string(cost) + " energy, has " +
                 std::to_string(player.energy));
      continue;
    }

    Entity* source = find_entity(state_, a.source_id);
    if (!source) continue;

    player.energy -= cost;
    if (source->fuel) --source->fuel->fuel;

    Projectile p;
    p.id = allocate_id(state_);
    p.owner = pid;
    p.source_id = source->id;
    p.payload = a.item_type;
    p.start = source->position;
    p.intended = launch_vector(cfg_, a.angle_deg, a.pull_distance);
    p.position = p.start;
    p.active = true;
    out.push_back(p);
  }
  return out;
}

void Simulation::tick_interception(std::vector<Projectile>& projectiles, std::vector<LaserBeam>& beams) {
  const double w = state_.map.width;
  const double h = state_.map.height;

  for (Entity& def : state_.entities) {
    if (def.type != EntityType::Defense || !def.deployed) continue;
    if (!def.fuel || def.fuel->empty()) continue;

    Projectile* target = nullptr;
    double best = std::numeric_limits<double>::infinity();
    for (Projectile& p : projectiles) {
      if (!p.active || p.owner == def.owner) continue;
      const double d = shortest_distance(def.position, p.position, w, h);
      if (d > cfg_.intercept_range) continue;
      if (d < best || (d == best && target && p.id < target->id)) {
        best = d;
        target = &p;
      }
    }
    if (!target) continue;

    target->active = false;
    --def.fuel->fuel;

    LaserBeam beam;
    beam.defense_id = def.id;
    beam.projectile_id = target->id;
    beam.owner = def.owner;
    beam.from = def.position;
    beam.to = target->position;
    beam.life = cfg_.beam_lifetime_ticks;
    beams.push_back(beam);

    log::debug("Defense #" + std::to_string(def.id) + " intercepted projectile #" + std::to_string(target->id) +
               " of " + target->owner);
  }
}

void Simulation::tick_projectile_motion(std::vector<Projectile>& projectiles, int tick) {
  const double progress = static_cast<double>(tick) / static_cast<double>(cfg_.sub_ticks_per_round);
  for (Projectile& p : projectiles) {
    if (!p.active) continue;
    p.position = point_along(p.start, p.intended, progress, state_.map.width, state_.map.height);
  }
}

void Simulation::resolve_landings(std::vector<Projectile>& projectiles, DestructionSet& doomed) {
  const double w = state_.map.width;
  const double h = state_.map.height;

  // Structures land first so a weapon arriving on the same tick can hit them
  // while they are still undeployed.
  for (Projectile& p : projectiles) {
    if (!p.active || p.payload == EntityType::Weapon) continue;

    EntitySpec spec;
    spec.type = p.payload;
    spec.owner = p.owner;
    spec.position = p.position;
    spec.hp = cfg_.undeployed_hp;
    spec.deployed = false;
    const Id landed = create_entity(state_, cfg_, spec).id;
    create_link(state_, p.source_id, landed, p.owner, p.intended);
    p.active = false;
  }

  for (Projectile& p : projectiles) {
    if (!p.active) continue;
    p.active = false;

    Entity* target = nullptr;
    double best = std::numeric_limits<double>::infinity();
    for (Entity& e : state_.entities) {
      if (e.owner == p.owner) continue;
      const double d = shortest_distance(e.position, p.position, w, h);
      if (d > cfg_.hit_radius) continue;
      if (d < best || (d == best && target && e.id < target->id)) {
        best = d;
        target = &e;
      }
    }
    if (!target) continue;

    target->hp -= cfg_.impact_damage;
    if (target->hp <= 0.0) doomed.mark(target->id);
    log::debug("Weapon #" + std::to_string(p.id) + " of " + p.owner + " hit #" + std::to_string(target->id) +
               (target->hp <= 0.0 ? " (destroyed)" : ""));
  }
}

void Simulation::deploy_landed_structures() {
  for (Entity& e : state_.entities) {
    if (e.deployed) continue;
    e.deployed = true;
    e.hp = max_hp_for(cfg_, e.type);
  }
}

} // namespace slingnet
