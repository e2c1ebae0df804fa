#include "slingnet/core/serialization.h"

#include "simulation_internal.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "slingnet/core/toroidal.h"
#include "slingnet/util/log.h"

namespace slingnet {
namespace {

using json::Array;
using json::Object;
using json::Value;

constexpr int kCurrentSaveVersion = 1;

using sim_internal::sorted_keys;

// Largest integer a double carries exactly.
constexpr double kMaxExactId = 9007199254740992.0;

double require_number(const Value& o, const char* key) {
  const Value& v = o.at(key);
  if (!v.is_number()) throw std::runtime_error(std::string("JSON key '") + key + "' must be a number");
  const double d = *v.as_number();
  if (!std::isfinite(d)) throw std::runtime_error(std::string("JSON key '") + key + "' must be finite");
  return d;
}

int to_int(double d, const char* key) {
  if (std::floor(d) != d || d < static_cast<double>(std::numeric_limits<int>::min()) ||
      d > static_cast<double>(std::numeric_limits<int>::max())) {
    throw std::runtime_error(std::string("JSON key '") + key + "' must be an integer in range");
  }
  return static_cast<int>(d);
}

int require_int(const Value& o, const char* key) { return to_int(require_number(o, key), key); }

std::string require_string(const Value& o, const char* key) {
  const Value& v = o.at(key);
  if (!v.is_string()) throw std::runtime_error(std::string("JSON key '") + key + "' must be a string");
  return *v.as_string();
}

// Ids are numbers in our own output; numeric strings are accepted as well.
Id read_id(const Value& o, const char* key) {
  const Value& v = o.at(key);
  if (const double* d = v.as_number()) {
    if (!(*d >= 0.0 && *d <= kMaxExactId) || std::floor(*d) != *d) {
      throw std::runtime_error(std::string("JSON key '") + key + "' is not a valid id");
    }
    return static_cast<Id>(*d);
  }
  if (const std::string* s = v.as_string()) {
    // 19 digits always fit in 64 bits.
    const bool digits =
        std::all_of(s->begin(), s->end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    if (s->empty() || s->size() > 19 || !digits) {
      throw std::runtime_error(std::string("JSON key '") + key + "' is not a valid id: " + *s);
    }
    return static_cast<Id>(std::stoull(*s));
  }
  throw std::runtime_error(std::string("JSON key '") + key + "' must be an id");
}

std::optional<double> optional_number(const Value& o, const char* key) {
  const Value* v = o.find(key);
  if (!v || v->is_null()) return std::nullopt;
  return require_number(o, key);
}

bool optional_bool(const Value& o, const char* key, bool def) {
  const Value* v = o.find(key);
  if (!v || v->is_null()) return def;
  if (!v->is_bool()) throw std::runtime_error(std::string("JSON key '") + key + "' must be a boolean");
  return *v->as_bool();
}

Value entity_to_json(const Entity& e) {
  Object o;
  o["id"] = static_cast<double>(e.id);
  o["type"] = std::string(entity_type_to_string(e.type));
  o["owner"] = e.owner;
  o["x"] = e.position.x;
  o["y"] = e.position.y;
  o["hp"] = e.hp;
  if (e.fuel) {
    o["fuel"] = static_cast<double>(e.fuel->fuel);
    o["maxFuel"] = static_cast<double>(e.fuel->max_fuel);
  }
  o["isStarter"] = e.is_starter;
  o["deployed"] = e.deployed;
  if (e.scouted) o["scouted"] = *e.scouted;
  return o;
}

Entity entity_from_json(const Value& v) {
  Entity e;
  e.id = read_id(v, "id");
  e.type = entity_type_from_string(require_string(v, "type"));
  if (e.type == EntityType::Projectile || e.type == EntityType::VisualEffect) {
    throw std::runtime_error("Entity #" + std::to_string(e.id) + " has a non-persistent type: " +
                             entity_type_to_string(e.type));
  }
  if (const Value* owner = v.find("owner"); owner && !owner->is_null()) e.owner = owner->string_value();
  e.position = Vec2{require_number(v, "x"), require_number(v, "y")};
  e.hp = require_number(v, "hp");

  const auto fuel = optional_number(v, "fuel");
  const auto max_fuel = optional_number(v, "maxFuel");
  if (fuel || max_fuel) {
    FuelTank tank;
    tank.max_fuel = to_int(max_fuel.value_or(fuel.value_or(0.0)), "maxFuel");
    tank.fuel = fuel ? to_int(*fuel, "fuel") : tank.max_fuel;
    e.fuel = tank;
  }

  e.is_starter = optional_bool(v, "isStarter", false);
  e.deployed = optional_bool(v, "deployed", true);
  if (const Value* sc = v.find("scouted"); sc && sc->is_bool()) e.scouted = *sc->as_bool();
  return e;
}

Value link_to_json(const Link& l) {
  Object o;
  o["from"] = static_cast<double>(l.from_id);
  o["to"] = static_cast<double>(l.to_id);
  o["owner"] = l.owner;
  if (l.intended) {
    o["intendedDx"] = l.intended->x;
    o["intendedDy"] = l.intended->y;
  }
  return o;
}

Link link_from_json(const Value& v) {
  Link l;
  l.from_id = read_id(v, "from");
  l.to_id = read_id(v, "to");
  if (const Value* owner = v.find("owner"); owner && !owner->is_null()) l.owner = owner->string_value();
  const auto dx = optional_number(v, "intendedDx");
  const auto dy = optional_number(v, "intendedDy");
  if (dx && dy) l.intended = Vec2{*dx, *dy};
  return l;
}

Value projectile_to_json(const Projectile& p) {
  Object o;
  o["id"] = static_cast<double>(p.id);
  o["type"] = std::string(entity_type_to_string(EntityType::Projectile));
  o["owner"] = p.owner;
  o["x"] = p.position.x;
  o["y"] = p.position.y;
  o["itemType"] = std::string(entity_type_to_string(p.payload));
  o["sourceId"] = static_cast<double>(p.source_id);
  o["startX"] = p.start.x;
  o["startY"] = p.start.y;
  o["dx"] = p.intended.x;
  o["dy"] = p.intended.y;
  return o;
}

Value beam_to_json(const LaserBeam& b) {
  Object o;
  o["type"] = std::string(entity_type_to_string(EntityType::VisualEffect));
  o["effect"] = std::string("LASER");
  o["owner"] = b.owner;
  o["sourceId"] = static_cast<double>(b.defense_id);
  o["targetId"] = static_cast<double>(b.projectile_id);
  o["x"] = b.from.x;
  o["y"] = b.from.y;
  o["tx"] = b.to.x;
  o["ty"] = b.to.y;
  o["life"] = static_cast<double>(b.life);
  return o;
}

LaunchAction action_from_json(const Value& v, const PlayerId& queue_owner) {
  if (!v.is_object()) throw std::runtime_error("Action for " + queue_owner + " must be an object");
  LaunchAction a;
  if (const Value* pid = v.find("playerId"); pid && !pid->is_null()) a.player_id = pid->string_value();
  a.source_id = read_id(v, "sourceId");
  a.item_type = entity_type_from_string(require_string(v, "itemType"));
  if (!is_launchable_item(a.item_type)) {
    throw std::runtime_error("Action for " + queue_owner + " has a non-launchable itemType");
  }
  a.angle_deg = require_number(v, "angle");
  a.pull_distance = require_number(v, "distance");
  return a;
}

} // namespace

const char* entity_type_to_string(EntityType t) {
  switch (t) {
    case EntityType::Hub: return "HUB";
    case EntityType::Weapon: return "WEAPON";
    case EntityType::Extractor: return "EXTRACTOR";
    case EntityType::Defense: return "DEFENSE";
    case EntityType::Projectile: return "PROJECTILE";
    case EntityType::VisualEffect: return "VISUAL_EFFECT";
  }
  return "HUB";
}

EntityType entity_type_from_string(const std::string& s) {
  std::string u = s;
  std::transform(u.begin(), u.end(), u.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (u == "HUB") return EntityType::Hub;
  if (u == "WEAPON") return EntityType::Weapon;
  if (u == "EXTRACTOR") return EntityType::Extractor;
  if (u == "DEFENSE") return EntityType::Defense;
  if (u == "PROJECTILE") return EntityType::Projectile;
  if (u == "VISUAL_EFFECT") return EntityType::VisualEffect;
  throw std::runtime_error("Unknown entity type: " + s);
}

Value serialize_game_to_json_value(const GameState& s) {
  Object root;
  root["version"] = static_cast<double>(kCurrentSaveVersion);
  root["turn"] = static_cast<double>(s.turn);
  root["nextId"] = static_cast<double>(s.next_id);

  Object players;
  for (const PlayerId& pid : sorted_keys(s.players)) {
    const Player& p = s.players.at(pid);
    Object po;
    po["energy"] = static_cast<double>(p.energy);
    po["color"] = p.color;
    po["alive"] = p.alive;
    players[pid] = po;
  }
  root["players"] = players;

  Array entities;
  entities.reserve(s.entities.size());
  for (const Entity& e : s.entities) entities.push_back(entity_to_json(e));
  root["entities"] = entities;

  Array links;
  links.reserve(s.links.size());
  for (const Link& l : s.links) links.push_back(link_to_json(l));
  root["links"] = links;

  Object map;
  map["width"] = s.map.width;
  map["height"] = s.map.height;
  Array resources;
  for (const ResourceNode& r : s.map.resources) {
    Object ro;
    ro["id"] = r.id;
    ro["x"] = r.position.x;
    ro["y"] = r.position.y;
    ro["value"] = static_cast<double>(r.value);
    resources.push_back(ro);
  }
  map["resources"] = resources;
  root["map"] = map;

  if (s.winner) {
    root["winner"] = *s.winner;
  } else {
    root["winner"] = nullptr;
  }
  return root;
}

std::string serialize_game_to_json(const GameState& s) { return json::stringify(serialize_game_to_json_value(s), 2); }

GameState game_from_json_value(const Value& root) {
  if (!root.is_object()) throw std::runtime_error("Game state must be a JSON object");

  const int version = root.find("version") ? require_int(root, "version") : kCurrentSaveVersion;
  if (version > kCurrentSaveVersion) {
    log::warn("Save version " + std::to_string(version) + " is newer than supported version " +
              std::to_string(kCurrentSaveVersion));
  }

  GameState s;
  s.turn = require_int(root, "turn");

  for (const auto& [pid, pv] : root.at("players").object()) {
    Player p;
    p.id = pid;
    p.energy = require_int(pv, "energy");
    if (const Value* c = pv.find("color")) p.color = c->string_value();
    p.alive = optional_bool(pv, "alive", true);
    s.players[pid] = std::move(p);
  }

  for (const Value& ev : root.at("entities").array()) s.entities.push_back(entity_from_json(ev));
  for (const Value& lv : root.at("links").array()) s.links.push_back(link_from_json(lv));

  if (const Value* map = root.find("map")) {
    s.map.width = require_number(*map, "width");
    s.map.height = require_number(*map, "height");
    if (const Value* res = map->find("resources")) {
      for (const Value& rv : res->array()) {
        ResourceNode r;
        r.id = require_string(rv, "id");
        r.position = Vec2{require_number(rv, "x"), require_number(rv, "y")};
        r.value = require_int(rv, "value");
        s.map.resources.push_back(std::move(r));
      }
    }
  }

  if (const Value* w = root.find("winner"); w && !w->is_null()) s.winner = w->string_value();

  for (Entity& e : s.entities) e.position = wrap_position(e.position, s.map.width, s.map.height);

  // Older documents may lack the counter; never hand out an id already in use.
  Id max_id = 0;
  for (const Entity& e : s.entities) max_id = std::max(max_id, e.id);
  s.next_id = root.find("nextId") ? read_id(root, "nextId") : max_id + 1;
  if (s.next_id <= max_id) s.next_id = max_id + 1;
  return s;
}

GameState deserialize_game_from_json(const std::string& json_text) {
  return game_from_json_value(json::parse(json_text));
}

Value serialize_snapshot_to_json_value(const Snapshot& snap) {
  Object o;
  o["type"] = std::string(snapshot_type_to_string(snap.type));
  if (snap.type == SnapshotType::RoundSub || snap.type == SnapshotType::Round) {
    o["round"] = static_cast<double>(snap.round);
  }
  if (snap.type == SnapshotType::RoundSub) o["subTick"] = static_cast<double>(snap.sub_tick);

  Value state = serialize_game_to_json_value(snap.state);
  if (snap.type == SnapshotType::RoundSub) {
    Array& entities = *state.as_object()->at("entities").as_array();
    for (const Projectile& p : snap.projectiles) entities.push_back(projectile_to_json(p));
    for (const LaserBeam& b : snap.beams) entities.push_back(beam_to_json(b));
  }
  o["state"] = std::move(state);
  return o;
}

std::string serialize_snapshots_to_json(const std::vector<Snapshot>& snaps, int indent) {
  Array out;
  out.reserve(snaps.size());
  for (const Snapshot& s : snaps) out.push_back(serialize_snapshot_to_json_value(s));
  return json::stringify(json::array(std::move(out)), indent);
}

ActionQueues action_queues_from_json(const Value& v) {
  if (!v.is_object()) throw std::runtime_error("Action queues must be a JSON object keyed by player id");
  ActionQueues out;
  for (const auto& [pid, list] : v.object()) {
    if (!list.is_array()) throw std::runtime_error("Action queue for " + pid + " must be an array");
    std::vector<LaunchAction>& q = out[pid];
    for (const Value& av : list.array()) q.push_back(action_from_json(av, pid));
  }
  return out;
}

Value action_queues_to_json(const ActionQueues& queues) {
  Object out;
  for (const PlayerId& pid : sorted_keys(queues)) {
    Array list;
    for (const LaunchAction& a : queues.at(pid)) {
      Object ao;
      ao["playerId"] = a.player_id.empty() ? pid : a.player_id;
      ao["sourceId"] = static_cast<double>(a.source_id);
      ao["itemType"] = std::string(entity_type_to_string(a.item_type));
      ao["angle"] = a.angle_deg;
      ao["distance"] = a.pull_distance;
      list.push_back(ao);
    }
    out[pid] = list;
  }
  return out;
}

} // namespace slingnet
