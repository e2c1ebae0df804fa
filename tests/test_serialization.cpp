#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "slingnet/core/serialization.h"
#include "slingnet/core/simulation.h"
#include "slingnet/util/digest.h"
#include "slingnet/util/json.h"

#define SN_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool load_fails(const std::string& text) {
  try {
    (void)slingnet::deserialize_game_from_json(text);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

} // namespace

int test_serialization() {
  using namespace slingnet;

  SN_ASSERT(std::string(entity_type_to_string(EntityType::Defense)) == "DEFENSE");
  SN_ASSERT(entity_type_from_string("hub") == EntityType::Hub);
  SN_ASSERT(entity_type_from_string("Visual_Effect") == EntityType::VisualEffect);
  {
    bool threw = false;
    try {
      (void)entity_type_from_string("CATAPULT");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    SN_ASSERT(threw);
  }

  Simulation sim;
  sim.initialize_game({"player1", "player2"});
  LaunchAction a;
  a.source_id = 1;
  a.item_type = EntityType::Defense;
  a.angle_deg = 33.0;
  a.pull_distance = 170.0;
  ActionQueues q;
  q["player1"] = {a};
  const auto snaps = sim.resolve_turn(q);

  // Save round trip is lossless.
  {
    const std::string text = serialize_game_to_json(sim.state());
    const GameState loaded = deserialize_game_from_json(text);
    SN_ASSERT(digest_game_state64(loaded) == digest_game_state64(sim.state()));
    SN_ASSERT(serialize_game_to_json(loaded) == text);
    SN_ASSERT(loaded.links.size() == 1);
    SN_ASSERT(loaded.links[0].intended.has_value());
    SN_ASSERT(loaded.entities[2].fuel.has_value());
    SN_ASSERT(loaded.entities[1].is_starter);
  }

  // Client field names.
  {
    const json::Value v = serialize_game_to_json_value(sim.state());
    SN_ASSERT(v.at("turn").int_value() == 2);
    SN_ASSERT(v.at("winner").is_null());
    SN_ASSERT(v.at("players").at("player1").at("energy").int_value() == 30);
    const json::Value& hub = v.at("entities").at(0);
    SN_ASSERT(hub.at("type").string_value() == "HUB");
    SN_ASSERT(hub.at("isStarter").bool_value());
    SN_ASSERT(hub.at("maxFuel").int_value() == 3);
    SN_ASSERT(hub.find("scouted") == nullptr);
    SN_ASSERT(v.at("links").at(0).find("intendedDx") != nullptr);
    SN_ASSERT(v.at("map").at("resources").array().size() == 2);
  }

  // Visibility annotations are written when present.
  {
    const json::Value v = serialize_game_to_json_value(sim.get_visible_state("player1"));
    SN_ASSERT(v.at("entities").at(0).at("scouted").bool_value());
  }

  // Sub-tick frames carry projectiles as extra entities.
  {
    const json::Value f = serialize_snapshot_to_json_value(snaps[1]);
    SN_ASSERT(f.at("type").string_value() == "ROUND_SUB");
    SN_ASSERT(f.at("round").int_value() == 1);
    const json::Array& ents = f.at("state").at("entities").array();
    SN_ASSERT(ents.size() == 3);
    SN_ASSERT(ents.back().at("type").string_value() == "PROJECTILE");
    SN_ASSERT(ents.back().at("itemType").string_value() == "DEFENSE");
    SN_ASSERT(ents.back().at("sourceId").int_value() == 1);

    const json::Value energy = serialize_snapshot_to_json_value(snaps[0]);
    SN_ASSERT(energy.find("round") == nullptr);
    SN_ASSERT(energy.find("subTick") == nullptr);
  }

  // Beams are tagged as laser effects.
  {
    Snapshot snap;
    snap.type = SnapshotType::RoundSub;
    snap.state = sim.get_state();
    LaserBeam b;
    b.defense_id = 9;
    b.projectile_id = 11;
    b.owner = "player2";
    b.from = Vec2{1.0, 2.0};
    b.to = Vec2{3.0, 4.0};
    b.life = 6;
    snap.beams = {b};
    const json::Value f = serialize_snapshot_to_json_value(snap);
    const json::Value& fx = f.at("state").at("entities").array().back();
    SN_ASSERT(fx.at("type").string_value() == "VISUAL_EFFECT");
    SN_ASSERT(fx.at("effect").string_value() == "LASER");
    SN_ASSERT(fx.at("tx").number_value() == 3.0);
    SN_ASSERT(fx.at("life").int_value() == 6);
  }

  // Action queues.
  {
    const ActionQueues parsed = action_queues_from_json(json::parse(R"({
      "player1": [
        {"playerId": "player1", "sourceId": 1, "itemType": "weapon", "angle": 90, "distance": 120.5},
        {"sourceId": "4", "itemType": "HUB", "angle": -45, "distance": 10}
      ],
      "player2": []
    })"));
    SN_ASSERT(parsed.size() == 2);
    SN_ASSERT(parsed.at("player1").size() == 2);
    SN_ASSERT(parsed.at("player1")[0].item_type == EntityType::Weapon);
    SN_ASSERT(parsed.at("player1")[0].pull_distance == 120.5);
    SN_ASSERT(parsed.at("player1")[1].player_id.empty());
    SN_ASSERT(parsed.at("player1")[1].source_id == 4);
    SN_ASSERT(parsed.at("player2").empty());

    const ActionQueues again = action_queues_from_json(action_queues_to_json(parsed));
    SN_ASSERT(again.at("player1")[1].player_id == "player1");
    SN_ASSERT(again.at("player1")[1].angle_deg == -45.0);

    bool threw = false;
    try {
      (void)action_queues_from_json(json::parse(R"({"player1": [{"itemType": "WEAPON", "angle": 0, "distance": 1}]})"));
    } catch (const std::runtime_error&) {
      threw = true;
    }
    SN_ASSERT(threw);

    threw = false;
    try {
      (void)action_queues_from_json(json::parse(R"({"player1": [{"sourceId": 1, "itemType": "PROJECTILE", "angle": 0, "distance": 1}]})"));
    } catch (const std::runtime_error&) {
      threw = true;
    }
    SN_ASSERT(threw);
  }

  // Malformed saves.
  SN_ASSERT(load_fails("[]"));
  SN_ASSERT(load_fails(R"({"turn": "one", "players": {}, "entities": [], "links": []})"));
  SN_ASSERT(load_fails(R"({"turn": 1, "players": {}, "entities": [{"id": 1}], "links": []})"));
  SN_ASSERT(load_fails(R"({"turn": 1, "players": {}, "entities": [], "links": [{"from": -1, "to": 2}]})"));

  // Numbers that do not fit the field they are read into.
  SN_ASSERT(load_fails(R"({"turn": 1e12, "players": {}, "entities": [], "links": []})"));
  SN_ASSERT(load_fails(R"({"turn": 2.5, "players": {}, "entities": [], "links": []})"));
  SN_ASSERT(load_fails(R"({"turn": 1, "players": {"p": {"energy": -1e15}}, "entities": [], "links": []})"));
  SN_ASSERT(load_fails(R"({"turn": 1, "players": {}, "entities": [], "links": [{"from": 1e300, "to": 2}]})"));
  SN_ASSERT(load_fails(R"({"turn": 1, "players": {}, "entities": [], "links": [{"from": "99999999999999999999", "to": 2}]})"));
  SN_ASSERT(load_fails(
      R"({"turn": 1, "players": {}, "entities": [{"id": 1, "type": "HUB", "x": 0, "y": 0, "hp": 100, "fuel": 1e12}], "links": []})"));
  {
    json::Value doc = json::parse(R"({"turn": 1, "players": {}, "entities": [], "links": []})");
    (*doc.as_object())["turn"] = std::numeric_limits<double>::infinity();
    bool threw = false;
    try {
      (void)game_from_json_value(doc);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    SN_ASSERT(threw);
  }

  // In-flight records belong to snapshot frames, never to a saved state.
  SN_ASSERT(load_fails(
      R"({"turn": 1, "players": {}, "entities": [{"id": 1, "type": "PROJECTILE", "x": 0, "y": 0, "hp": 1}], "links": []})"));

  // Loaded positions are wrapped into the map.
  {
    const GameState s = deserialize_game_from_json(R"({
      "turn": 1,
      "players": {"p": {"energy": 0}},
      "entities": [{"id": 1, "type": "HUB", "owner": "p", "x": 1250, "y": -100, "hp": 100}],
      "links": [],
      "map": {"width": 1000, "height": 800}
    })");
    SN_ASSERT(s.entities[0].position.x == 250.0);
    SN_ASSERT(s.entities[0].position.y == 700.0);
  }

  // A missing id counter is rebuilt above every entity id.
  {
    const GameState s = deserialize_game_from_json(R"({
      "turn": 3,
      "players": {"p": {"energy": 12, "color": "red", "alive": true}},
      "entities": [{"id": 7, "type": "EXTRACTOR", "owner": "p", "x": 1, "y": 2, "hp": 50}],
      "links": []
    })");
    SN_ASSERT(s.next_id == 8);
    SN_ASSERT(s.players.at("p").id == "p");
    SN_ASSERT(s.entities[0].deployed);
    SN_ASSERT(!s.entities[0].fuel);
    SN_ASSERT(s.map.width == 1000.0);
  }

  return 0;
}
