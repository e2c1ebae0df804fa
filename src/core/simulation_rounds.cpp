#include "slingnet/core/simulation.h"

#include "simulation_internal.h"

#include "slingnet/core/link_integrity.h"
#include "slingnet/util/log.h"

namespace slingnet {

using sim_internal::describe_action;

bool Simulation::is_action_executable(const PlayerId& pid, const LaunchAction& action) const {
  const Player* player = find_ptr(state_.players, pid);
  if (!player || !player->alive) return false;
  if (!action.player_id.empty() && action.player_id != pid) return false;
  if (!is_launchable_item(action.item_type)) return false;

  const Entity* source = find_entity(state_, action.source_id);
  if (!source) return false;
  if (source->owner != pid) return false;
  if (source->type != EntityType::Hub || !source->deployed) return false;
  return source->has_fuel();
}

std::vector<std::pair<PlayerId, LaunchAction>> Simulation::collect_round_actions(const ActionQueues& actions,
                                                                                 QueueCursors& cursors) const {
  std::vector<std::pair<PlayerId, LaunchAction>> out;
  for (const PlayerId& pid : sorted_player_ids(state_)) {
    const std::vector<LaunchAction>* queue = find_ptr(actions, pid);
    if (!queue) continue;

    std::size_t& cursor = cursors[pid];
    while (cursor < queue->size()) {
      const LaunchAction& a = (*queue)[cursor++];
      if (is_action_executable(pid, a)) {
        out.emplace_back(pid, a);
        break;
      }
      log::debug("Skipping action " + describe_action(pid, a));
    }
  }
  return out;
}

void Simulation::simulate_round(int round, const std::vector<std::pair<PlayerId, LaunchAction>>& actions,
                                std::vector<Snapshot>& out) {
  std::vector<Projectile> projectiles = launch_projectiles(actions);
  std::vector<LaserBeam> beams;
  DestructionSet doomed;

  const int ticks = cfg_.sub_ticks_per_round;
  for (int t = 1; t <= ticks; ++t) {
    tick_interception(projectiles, beams);
    tick_projectile_motion(projectiles, t);

    for (LaserBeam& b : beams) --b.life;
    beams.erase(std::remove_if(beams.begin(), beams.end(), [](const LaserBeam& b) { return b.life <= 0; }),
                beams.end());

    if (t == ticks) resolve_landings(projectiles, doomed);

    if (t % cfg_.snapshot_interval == 0 || t == ticks) {
      Snapshot snap = make_snapshot(SnapshotType::RoundSub, round, t);
      for (const Projectile& p : projectiles) {
        if (p.active) snap.projectiles.push_back(p);
      }
      snap.beams = beams;
      out.push_back(std::move(snap));
    }
  }

  const std::size_t destroyed = apply_destruction(state_, doomed);
  deploy_landed_structures();
  const std::size_t collapsed = check_link_integrity(state_);
  if (destroyed > 0 || collapsed > 0) {
    log::debug("Round " + std::to_string(round) + ": " + std::to_string(destroyed) + " destroyed, " +
               std::to_string(collapsed) + " collapsed");
  }

  out.push_back(make_snapshot(SnapshotType::Round, round));
}

} // namespace slingnet
