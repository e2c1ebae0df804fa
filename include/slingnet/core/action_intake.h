#pragma once

#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "slingnet/core/actions.h"

namespace slingnet {

// Collects launches submitted concurrently by connected players until the
// commit point of a turn.
//
// Thread-safe. The Simulation itself is not: the host drains the intake with
// take_turn() and then runs exactly one resolve_turn() with the result.
class ActionIntake {
 public:
  explicit ActionIntake(std::vector<PlayerId> roster);

  // Append to the player's pending queue.
  // Returns false for players outside the roster or already committed.
  bool submit(const PlayerId& player, LaunchAction action);

  // Close the player's queue for this turn. Returns false for unknown players.
  bool commit(const PlayerId& player);

  bool has_committed(const PlayerId& player) const;
  bool all_committed() const;

  // Queued action count for a player (0 for unknown players).
  std::size_t pending_count(const PlayerId& player) const;

  // Hand over the turn: every roster player gets an entry, those who never
  // submitted (or timed out) an empty one. Resets the intake for the next turn.
  ActionQueues take_turn();

  const std::vector<PlayerId>& roster() const { return roster_; }

 private:
  bool in_roster(const PlayerId& player) const;

  mutable std::mutex mu_;
  std::vector<PlayerId> roster_;
  ActionQueues pending_;
  std::unordered_set<PlayerId> committed_;
};

} // namespace slingnet
