#include "slingnet/core/simulation.h"

#include "simulation_internal.h"

#include <cmath>
#include <stdexcept>
#include <unordered_set>

#include "slingnet/util/log.h"

namespace slingnet {
namespace {

using sim_internal::sorted_keys;

std::string player_color(std::size_t index, std::size_t count) {
  const long hue = std::lround(360.0 * static_cast<double>(index) / static_cast<double>(count));
  return "hsl(" + std::to_string(hue) + ", 70%, 50%)";
}

} // namespace

Simulation::Simulation(RulesConfig cfg) : cfg_(std::move(cfg)) {
  validate_rules_config(cfg_);
  state_.map.width = cfg_.map_width;
  state_.map.height = cfg_.map_height;
}

void Simulation::initialize_game(const std::vector<PlayerId>& player_ids) {
  if (player_ids.empty()) throw std::invalid_argument("initialize_game: at least one player is required");
  std::unordered_set<PlayerId> unique;
  for (const PlayerId& pid : player_ids) {
    if (pid.empty()) throw std::invalid_argument("initialize_game: player id must not be empty");
    if (!unique.insert(pid).second) throw std::invalid_argument("initialize_game: duplicate player id '" + pid + "'");
  }

  state_ = GameState{};
  state_.map.width = cfg_.map_width;
  state_.map.height = cfg_.map_height;

  const std::size_t n = player_ids.size();
  const double w = state_.map.width;
  const double h = state_.map.height;
  for (std::size_t i = 0; i < n; ++i) {
    const PlayerId& pid = player_ids[i];

    Player p;
    p.id = pid;
    p.energy = cfg_.starting_energy;
    p.color = player_color(i, n);
    p.alive = true;
    state_.players[pid] = std::move(p);

    EntitySpec hub;
    hub.type = EntityType::Hub;
    hub.owner = pid;
    hub.position = Vec2{w * static_cast<double>(2 * i + 1) / static_cast<double>(2 * n), h / 2.0};
    hub.is_starter = true;
    create_entity(state_, cfg_, hub);
  }

  state_.map.resources = {
      ResourceNode{"res1", Vec2{0.5 * w, 0.3 * h}, 10},
      ResourceNode{"res2", Vec2{0.5 * w, 0.7 * h}, 10},
  };

  log::info("New game with " + std::to_string(n) + " player(s)");
}

void Simulation::load_game(GameState loaded) {
  state_ = std::move(loaded);
  log::debug("Loaded game at turn " + std::to_string(state_.turn) + " (" + std::to_string(state_.entities.size()) +
             " entities, " + std::to_string(state_.links.size()) + " links)");
}

std::vector<Snapshot> Simulation::resolve_turn(const ActionQueues& actions) {
  std::vector<Snapshot> out;
  if (state_.winner) {
    out.push_back(make_snapshot(SnapshotType::Final));
    return out;
  }

  for (const PlayerId& pid : sorted_keys(actions)) {
    if (!state_.players.count(pid)) log::debug("Ignoring action queue of unknown player '" + pid + "'");
  }

  tick_energy_income();
  out.push_back(make_snapshot(SnapshotType::Energy));

  QueueCursors cursors;
  int round = 0;
  for (;;) {
    const auto contributions = collect_round_actions(actions, cursors);
    if (contributions.empty()) break;
    if (round >= cfg_.max_rounds_per_turn) {
      log::warn("Turn " + std::to_string(state_.turn) + " hit the cap of " + std::to_string(cfg_.max_rounds_per_turn) +
                " rounds; remaining actions discarded");
      break;
    }
    ++round;
    simulate_round(round, contributions, out);
  }

  finalize_turn();
  out.push_back(make_snapshot(SnapshotType::Final));
  return out;
}

GameState Simulation::get_visible_state(const PlayerId& viewer, const GameState* base) const {
  return project_visible_state(cfg_, base ? *base : state_, viewer);
}

bool Simulation::is_position_visible(const PlayerId& viewer, double x, double y) const {
  return slingnet::is_position_visible(cfg_, state_, viewer, Vec2{x, y});
}

std::vector<VisionCircle> Simulation::vision_circles(const PlayerId& viewer) const {
  return gather_vision_circles(cfg_, state_, viewer);
}

void Simulation::tick_energy_income() {
  for (auto& [_, p] : state_.players) {
    if (p.alive) p.energy += cfg_.energy_income_per_turn;
  }
}

void Simulation::finalize_turn() {
  std::vector<PlayerId> alive;
  for (const PlayerId& pid : sorted_player_ids(state_)) {
    Player& p = state_.players.at(pid);
    const bool has_hub = count_hubs(state_, pid) > 0;
    if (p.alive && !has_hub) log::info("Player " + pid + " was eliminated on turn " + std::to_string(state_.turn));
    p.alive = has_hub;
    if (p.alive) alive.push_back(pid);
  }

  if (!state_.players.empty()) {
    if (alive.size() == 1) {
      state_.winner = alive.front();
      log::info("Player " + alive.front() + " wins on turn " + std::to_string(state_.turn));
    } else if (alive.empty()) {
      state_.winner = kDrawWinner;
      log::info("All players eliminated on turn " + std::to_string(state_.turn) + ": draw");
    }
  }

  ++state_.turn;

  for (Entity& e : state_.entities) {
    if (e.fuel) e.fuel->fuel = e.fuel->max_fuel;
  }
}

Snapshot Simulation::make_snapshot(SnapshotType type, int round, int sub_tick) const {
  Snapshot snap;
  snap.type = type;
  snap.round = round;
  snap.sub_tick = sub_tick;
  snap.state = state_;
  return snap;
}

} // namespace slingnet
