#include <iostream>

#include "slingnet/core/entity_store.h"
#include "slingnet/core/simulation.h"

#define SN_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

// Two players; player2 guards its starter with a defense at (700, 500).
slingnet::Id setup(slingnet::Simulation& sim, bool deployed) {
  using namespace slingnet;
  sim.initialize_game({"player1", "player2"});
  EntitySpec spec;
  spec.type = EntityType::Defense;
  spec.owner = "player2";
  spec.position = Vec2{700.0, 500.0};
  spec.deployed = deployed;
  const Id def = create_entity(sim.state(), sim.cfg(), spec).id;
  create_link(sim.state(), 2, def, "player2");
  return def;
}

slingnet::ActionQueues two_shots_at_hub2(const slingnet::RulesConfig& cfg) {
  slingnet::LaunchAction a;
  a.source_id = 1;
  a.item_type = slingnet::EntityType::Weapon;
  a.angle_deg = 0.0;
  a.pull_distance = slingnet::pull_for_distance(cfg, 500.0);
  slingnet::ActionQueues q;
  q["player1"] = {a, a};
  return q;
}

} // namespace

int test_laser_defense() {
  using namespace slingnet;

  // The defense burns its single fuel unit on the first shot; the second lands.
  {
    Simulation sim;
    const Id def = setup(sim, true);
    const auto snaps = sim.resolve_turn(two_shots_at_hub2(sim.cfg()));

    const Snapshot* round1 = nullptr;
    const Snapshot* round2 = nullptr;
    bool saw_beam = false;
    for (const auto& s : snaps) {
      if (s.type == SnapshotType::Round && s.round == 1) round1 = &s;
      if (s.type == SnapshotType::Round && s.round == 2) round2 = &s;
      if (s.type == SnapshotType::RoundSub && s.round == 1 && !s.beams.empty()) {
        SN_ASSERT(s.beams[0].defense_id == def);
        SN_ASSERT(s.beams[0].owner == "player2");
        SN_ASSERT(s.beams[0].life > 0);
        saw_beam = true;
      }
      if (s.type == SnapshotType::RoundSub && s.round == 2) SN_ASSERT(s.beams.empty());
    }
    SN_ASSERT(saw_beam);
    SN_ASSERT(round1 != nullptr && round2 != nullptr);

    // Intercepted: hub intact, defense dry for the rest of the turn.
    SN_ASSERT(find_entity(round1->state, 2) != nullptr);
    SN_ASSERT(find_entity(round1->state, 2)->hp == 100.0);
    SN_ASSERT(find_entity(round1->state, def)->fuel->fuel == 0);

    // Second shot gets through.
    SN_ASSERT(find_entity(round2->state, 2) == nullptr);
    SN_ASSERT(find_entity(round2->state, def) != nullptr);

    SN_ASSERT(sim.winner().value_or("") == "player1");
    SN_ASSERT(!sim.state().players.at("player2").alive);
    // Refilled at the end of the turn only.
    SN_ASSERT(find_entity(sim.state(), def)->fuel->fuel == 1);
  }

  // An undeployed defense cannot intercept.
  {
    Simulation sim;
    setup(sim, false);
    const auto snaps = sim.resolve_turn(two_shots_at_hub2(sim.cfg()));
    for (const auto& s : snaps) {
      if (s.round != 1) continue;
      SN_ASSERT(s.beams.empty());
      if (s.type == SnapshotType::Round) SN_ASSERT(find_entity(s.state, 2) == nullptr);
    }
    SN_ASSERT(sim.winner().value_or("") == "player1");
  }

  // Defenses ignore their owner's projectiles.
  {
    Simulation sim;
    const Id def = setup(sim, true);
    LaunchAction a;
    a.source_id = 2;
    a.item_type = EntityType::Extractor;
    a.angle_deg = 180.0;
    a.pull_distance = pull_for_distance(sim.cfg(), 100.0);
    ActionQueues q;
    q["player2"] = {a};
    const auto snaps = sim.resolve_turn(q);
    for (const auto& s : snaps) SN_ASSERT(s.beams.empty());
    SN_ASSERT(sim.state().entities.size() == 4);
    SN_ASSERT(find_entity(sim.state(), def)->fuel->fuel == 1);
  }

  // Two attackers in range, one fuel unit: the closer projectile is taken.
  {
    RulesConfig cfg;
    cfg.intercept_range = 1000.0;
    Simulation sim(cfg);
    sim.initialize_game({"player1", "player2", "player3"});
    // Hubs at x = 166.7, 500 and 833.3 on y = 500.
    EntitySpec spec;
    spec.type = EntityType::Defense;
    spec.owner = "player2";
    spec.position = Vec2{520.0, 450.0};
    const Id def = create_entity(sim.state(), sim.cfg(), spec).id;
    create_link(sim.state(), 2, def, "player2");

    LaunchAction from1;
    from1.source_id = 1;
    from1.item_type = EntityType::Weapon;
    from1.angle_deg = 0.0;
    from1.pull_distance = pull_for_distance(sim.cfg(), 250.0);
    LaunchAction from3 = from1;
    from3.source_id = 3;
    from3.angle_deg = 180.0;
    ActionQueues q;
    q["player1"] = {from1};
    q["player3"] = {from3};
    const auto snaps = sim.resolve_turn(q);

    // Projectile ids follow sorted player order: player1 -> 5, player3 -> 6.
    Id intercepted = kInvalidId;
    for (const auto& s : snaps) {
      if (s.type == SnapshotType::RoundSub && !s.beams.empty()) intercepted = s.beams[0].projectile_id;
    }
    SN_ASSERT(intercepted == 6);
    SN_ASSERT(snaps[1].projectiles.size() == 1);
    SN_ASSERT(snaps[1].projectiles[0].owner == "player1");
    SN_ASSERT(find_entity(sim.state(), 2) != nullptr);
    SN_ASSERT(!sim.winner());
  }

  return 0;
}
