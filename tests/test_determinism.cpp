#include <iostream>
#include <string>
#include <vector>

#include "slingnet/core/serialization.h"
#include "slingnet/core/simulation.h"
#include "slingnet/util/digest.h"

#define SN_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

std::vector<slingnet::ActionQueues> scripted_turns() {
  using namespace slingnet;
  auto act = [](Id src, EntityType t, double angle, double pull) {
    LaunchAction a;
    a.source_id = src;
    a.item_type = t;
    a.angle_deg = angle;
    a.pull_distance = pull;
    return a;
  };
  std::vector<ActionQueues> turns(3);
  turns[0]["player1"] = {act(1, EntityType::Defense, 10.0, 120.0), act(1, EntityType::Extractor, 250.0, 200.0)};
  turns[0]["player2"] = {act(2, EntityType::Hub, 160.0, 180.0), act(2, EntityType::Weapon, 185.0, 260.0)};
  turns[0]["player3"] = {act(3, EntityType::Weapon, 0.0, 210.0)};
  turns[1]["player2"] = {act(2, EntityType::Weapon, 180.0, 230.0), act(2, EntityType::Weapon, 175.0, 240.0)};
  turns[1]["player1"] = {act(1, EntityType::Weapon, 0.0, 220.0)};
  turns[2]["player3"] = {act(3, EntityType::Extractor, 90.0, 300.0)};
  return turns;
}

} // namespace

int test_determinism() {
  using namespace slingnet;

  Simulation a;
  Simulation b;
  a.initialize_game({"player1", "player2", "player3"});
  b.initialize_game({"player3", "player1", "player2"});
  // Roster order only affects colors and starting positions; align them.
  b.load_game(a.get_state());
  SN_ASSERT(digest_game_state64(a.state()) == digest_game_state64(b.state()));

  for (const ActionQueues& turn : scripted_turns()) {
    const auto snaps_a = a.resolve_turn(turn);
    const auto snaps_b = b.resolve_turn(turn);
    SN_ASSERT(snaps_a.size() == snaps_b.size());
    SN_ASSERT(serialize_snapshots_to_json(snaps_a, 0) == serialize_snapshots_to_json(snaps_b, 0));
    SN_ASSERT(digest_game_state64(a.state()) == digest_game_state64(b.state()));
  }

  // Player map insertion order does not matter.
  {
    GameState x = a.get_state();
    GameState y;
    y.turn = x.turn;
    y.next_id = x.next_id;
    y.entities = x.entities;
    y.links = x.links;
    y.map = x.map;
    y.winner = x.winner;
    const auto ids = sorted_player_ids(x);
    for (auto it = ids.rbegin(); it != ids.rend(); ++it) y.players[*it] = x.players.at(*it);
    SN_ASSERT(digest_game_state64(x) == digest_game_state64(y));

    // Fog annotations are ignored, real changes are not.
    SN_ASSERT(!y.entities.empty());
    y.entities[0].scouted = true;
    SN_ASSERT(digest_game_state64(x) == digest_game_state64(y));
    y.entities[0].hp -= 1.0;
    SN_ASSERT(digest_game_state64(x) != digest_game_state64(y));
  }

  SN_ASSERT(digest64_to_hex(0).size() == 16);
  SN_ASSERT(digest64_to_hex(0xabcULL) == "0000000000000abc");
  SN_ASSERT(digest64_to_hex(0xffffffffffffffffULL) == "ffffffffffffffff");

  return 0;
}
