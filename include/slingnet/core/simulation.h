#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "slingnet/core/actions.h"
#include "slingnet/core/entity_store.h"
#include "slingnet/core/game_state.h"
#include "slingnet/core/rules.h"
#include "slingnet/core/snapshot.h"
#include "slingnet/core/visibility.h"

namespace slingnet {

// One game instance: the only mutator of its GameState.
//
// The host owns one Simulation per match and must serialize calls into it;
// resolve_turn() runs a whole turn synchronously and is not reentrant.
// Query helpers are const and safe to call concurrently with each other.
class Simulation {
 public:
  explicit Simulation(RulesConfig cfg = {});

  const RulesConfig& cfg() const { return cfg_; }

  GameState& state() { return state_; }
  const GameState& state() const { return state_; }

  // Reset to turn 1 with one starter hub per player.
  //
  // Players get the starting energy and evenly spread colors; hubs are placed
  // on the horizontal center line at x = width * (2i + 1) / (2n).
  // Throws std::invalid_argument for an empty roster, empty or duplicate ids.
  void initialize_game(const std::vector<PlayerId>& player_ids);

  // Replace the authoritative state (save loading, scripted setups).
  void load_game(GameState loaded);

  // Resolve one full turn and return the ordered playback frames:
  //   ENERGY, (ROUND_SUB..., ROUND) per round, FINAL
  // or a single FINAL frame once a winner has been declared.
  //
  // Queues for unknown players are ignored; missing players simply act in no
  // round. Invalid actions are skipped, never reported as errors.
  std::vector<Snapshot> resolve_turn(const ActionQueues& actions);

  // Deep independent copy of the authoritative state.
  GameState get_state() const { return state_; }

  // Fog-of-war view of the live state, or of `base` (e.g. a historical
  // snapshot) when provided.
  GameState get_visible_state(const PlayerId& viewer, const GameState* base = nullptr) const;

  bool is_position_visible(const PlayerId& viewer, double x, double y) const;
  std::vector<VisionCircle> vision_circles(const PlayerId& viewer) const;

  const std::optional<std::string>& winner() const { return state_.winner; }

 private:
  // Per-turn queue cursors (skip-and-slide).
  using QueueCursors = std::unordered_map<PlayerId, std::size_t>;

  void tick_energy_income();

  // Advance each player's cursor to their next executable action.
  std::vector<std::pair<PlayerId, LaunchAction>> collect_round_actions(const ActionQueues& actions,
                                                                      QueueCursors& cursors) const;
  bool is_action_executable(const PlayerId& pid, const LaunchAction& action) const;

  void simulate_round(int round, const std::vector<std::pair<PlayerId, LaunchAction>>& actions,
                      std::vector<Snapshot>& out);

  // Pay for the launches and put them in flight.
  std::vector<Projectile> launch_projectiles(const std::vector<std::pair<PlayerId, LaunchAction>>& actions);
  void tick_interception(std::vector<Projectile>& projectiles, std::vector<LaserBeam>& beams);
  void tick_projectile_motion(std::vector<Projectile>& projectiles, int tick);
  void resolve_landings(std::vector<Projectile>& projectiles, DestructionSet& doomed);
  void deploy_landed_structures();

  void finalize_turn();

  Snapshot make_snapshot(SnapshotType type, int round = 0, int sub_tick = 0) const;

  RulesConfig cfg_;
  GameState state_;
};

} // namespace slingnet
