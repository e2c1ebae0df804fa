#include "slingnet/core/action_intake.h"

#include <algorithm>

#include "slingnet/util/log.h"

namespace slingnet {

ActionIntake::ActionIntake(std::vector<PlayerId> roster) : roster_(std::move(roster)) {
  std::sort(roster_.begin(), roster_.end());
  roster_.erase(std::unique(roster_.begin(), roster_.end()), roster_.end());
}

bool ActionIntake::in_roster(const PlayerId& player) const {
  return std::binary_search(roster_.begin(), roster_.end(), player);
}

bool ActionIntake::submit(const PlayerId& player, LaunchAction action) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!in_roster(player) || committed_.count(player)) return false;
  if (action.player_id.empty()) action.player_id = player;
  pending_[player].push_back(std::move(action));
  return true;
}

bool ActionIntake::commit(const PlayerId& player) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!in_roster(player)) return false;
  committed_.insert(player);
  return true;
}

bool ActionIntake::has_committed(const PlayerId& player) const {
  std::lock_guard<std::mutex> lock(mu_);
  return committed_.count(player) != 0;
}

bool ActionIntake::all_committed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return committed_.size() == roster_.size();
}

std::size_t ActionIntake::pending_count(const PlayerId& player) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = pending_.find(player);
  return it == pending_.end() ? 0 : it->second.size();
}

ActionQueues ActionIntake::take_turn() {
  std::lock_guard<std::mutex> lock(mu_);
  ActionQueues out;
  for (const PlayerId& pid : roster_) {
    if (!committed_.count(pid)) log::debug("Player " + pid + " did not commit; sealing their queue");
    auto it = pending_.find(pid);
    out[pid] = it == pending_.end() ? std::vector<LaunchAction>{} : std::move(it->second);
  }
  pending_.clear();
  committed_.clear();
  return out;
}

} // namespace slingnet
