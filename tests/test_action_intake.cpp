#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "slingnet/core/action_intake.h"

#define SN_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

slingnet::LaunchAction weapon_from(slingnet::Id source) {
  slingnet::LaunchAction a;
  a.source_id = source;
  a.item_type = slingnet::EntityType::Weapon;
  a.angle_deg = 45.0;
  a.pull_distance = 120.0;
  return a;
}

} // namespace

int test_action_intake() {
  using namespace slingnet;

  ActionIntake intake({"player2", "player1", "player1"});
  SN_ASSERT(intake.roster().size() == 2);
  SN_ASSERT(intake.roster()[0] == "player1");

  SN_ASSERT(intake.submit("player1", weapon_from(1)));
  SN_ASSERT(intake.submit("player1", weapon_from(1)));
  SN_ASSERT(!intake.submit("intruder", weapon_from(1)));
  SN_ASSERT(intake.pending_count("player1") == 2);
  SN_ASSERT(intake.pending_count("intruder") == 0);

  SN_ASSERT(!intake.all_committed());
  SN_ASSERT(intake.commit("player1"));
  SN_ASSERT(!intake.commit("intruder"));
  SN_ASSERT(intake.has_committed("player1"));
  // Committed queues are sealed.
  SN_ASSERT(!intake.submit("player1", weapon_from(1)));
  SN_ASSERT(intake.pending_count("player1") == 2);
  SN_ASSERT(!intake.all_committed());

  // Timeout path: player2 never committed and gets an empty queue.
  {
    const ActionQueues turn = intake.take_turn();
    SN_ASSERT(turn.size() == 2);
    SN_ASSERT(turn.at("player1").size() == 2);
    SN_ASSERT(turn.at("player1")[0].player_id == "player1");
    SN_ASSERT(turn.at("player1")[0].source_id == 1);
    SN_ASSERT(turn.at("player2").empty());
  }

  // Reset for the next turn.
  SN_ASSERT(!intake.has_committed("player1"));
  SN_ASSERT(intake.pending_count("player1") == 0);
  SN_ASSERT(intake.submit("player1", weapon_from(7)));

  // Concurrent submissions from many connections.
  {
    ActionIntake shared({"a", "b", "c", "d"});
    std::vector<std::thread> workers;
    for (const std::string pid : {"a", "b", "c", "d"}) {
      workers.emplace_back([&shared, pid]() {
        for (int i = 0; i < 200; ++i) shared.submit(pid, weapon_from(static_cast<Id>(i + 1)));
        shared.commit(pid);
      });
    }
    for (auto& w : workers) w.join();

    SN_ASSERT(shared.all_committed());
    const ActionQueues turn = shared.take_turn();
    for (const std::string pid : {"a", "b", "c", "d"}) {
      SN_ASSERT(turn.at(pid).size() == 200);
      // Per-player order is preserved.
      SN_ASSERT(turn.at(pid).front().source_id == 1);
      SN_ASSERT(turn.at(pid).back().source_id == 200);
    }
  }

  return 0;
}
