#include "slingnet/core/rules.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "slingnet/util/file_io.h"

namespace slingnet {
namespace {

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

void require(bool ok, const std::string& what) {
  if (!ok) throw std::runtime_error("Invalid rules config: " + what);
}

void read_number(const json::Value& obj, const char* key, double& field) {
  const json::Value* v = obj.find(key);
  if (!v) return;
  const double* d = v->as_number();
  if (!d || !std::isfinite(*d)) throw std::runtime_error(std::string("Rules key '") + key + "' must be a finite number");
  field = *d;
}

void read_int(const json::Value& obj, const char* key, int& field) {
  const json::Value* v = obj.find(key);
  if (!v) return;
  const double* d = v->as_number();
  if (!d || std::floor(*d) != *d || *d < static_cast<double>(std::numeric_limits<int>::min()) ||
      *d > static_cast<double>(std::numeric_limits<int>::max())) {
    throw std::runtime_error(std::string("Rules key '") + key + "' must be an integer");
  }
  field = static_cast<int>(*d);
}

} // namespace

int item_cost(const RulesConfig& cfg, EntityType t) {
  switch (t) {
    case EntityType::Hub: return cfg.cost_hub;
    case EntityType::Weapon: return cfg.cost_weapon;
    case EntityType::Extractor: return cfg.cost_extractor;
    case EntityType::Defense: return cfg.cost_defense;
    default: return 0;
  }
}

double max_hp_for(const RulesConfig& cfg, EntityType t) {
  return t == EntityType::Hub ? cfg.max_hp_hub : cfg.max_hp_default;
}

std::optional<int> default_fuel_for(const RulesConfig& cfg, EntityType t) {
  if (t == EntityType::Hub) return cfg.fuel_hub;
  if (t == EntityType::Defense) return cfg.fuel_defense;
  return std::nullopt;
}

double vision_radius_for(const RulesConfig& cfg, EntityType t) {
  switch (t) {
    case EntityType::Hub: return cfg.vision_hub;
    case EntityType::Extractor: return cfg.vision_extractor;
    case EntityType::Defense: return cfg.vision_defense;
    case EntityType::Weapon: return cfg.vision_weapon;
    default: return 0.0;
  }
}

double launch_distance(const RulesConfig& cfg, double pull_distance) {
  const double pull = std::clamp(pull_distance, 0.0, cfg.max_pull);
  return std::pow(pull / cfg.max_pull, cfg.power_exponent) * cfg.max_launch_distance;
}

double pull_for_distance(const RulesConfig& cfg, double distance) {
  const double d = std::clamp(distance, 0.0, cfg.max_launch_distance);
  return std::pow(d / cfg.max_launch_distance, 1.0 / cfg.power_exponent) * cfg.max_pull;
}

Vec2 launch_vector(const RulesConfig& cfg, double angle_deg, double pull_distance) {
  const double dist = launch_distance(cfg, pull_distance);
  const double rad = angle_deg * kDegToRad;
  return {std::cos(rad) * dist, std::sin(rad) * dist};
}

void validate_rules_config(const RulesConfig& cfg) {
  require(cfg.map_width > 0.0 && cfg.map_height > 0.0, "map size must be positive");
  require(cfg.starting_energy >= 0, "starting_energy must be >= 0");
  require(cfg.energy_income_per_turn >= 0, "energy_income_per_turn must be >= 0");
  require(cfg.cost_hub >= 0 && cfg.cost_weapon >= 0 && cfg.cost_extractor >= 0 && cfg.cost_defense >= 0,
          "item costs must be >= 0");
  require(cfg.max_pull > 0.0, "max_pull must be positive");
  require(cfg.max_launch_distance > 0.0, "max_launch_distance must be positive");
  require(cfg.power_exponent > 1.0, "power_exponent must be > 1");
  require(cfg.sub_ticks_per_round >= 1, "sub_ticks_per_round must be >= 1");
  require(cfg.snapshot_interval >= 1, "snapshot_interval must be >= 1");
  require(cfg.max_rounds_per_turn >= 1, "max_rounds_per_turn must be >= 1");
  require(cfg.intercept_range >= 0.0, "intercept_range must be >= 0");
  require(cfg.hit_radius >= 0.0, "hit_radius must be >= 0");
  require(cfg.impact_damage > 0.0, "impact_damage must be positive");
  require(cfg.beam_lifetime_ticks >= 0, "beam_lifetime_ticks must be >= 0");
  require(cfg.max_hp_hub > 0.0 && cfg.max_hp_default > 0.0, "max hp must be positive");
  require(cfg.undeployed_hp > 0.0, "undeployed_hp must be positive");
  require(cfg.fuel_hub >= 0 && cfg.fuel_defense >= 0, "fuel must be >= 0");
  require(cfg.vision_hub >= 0.0 && cfg.vision_extractor >= 0.0 && cfg.vision_defense >= 0.0 &&
              cfg.vision_weapon >= 0.0,
          "vision radii must be >= 0");
  require(cfg.link_sample_step > 0.0, "link_sample_step must be positive");
}

RulesConfig rules_from_json(const json::Value& v) {
  if (!v.is_object()) throw std::runtime_error("Rules config must be a JSON object");

  RulesConfig cfg;
  read_number(v, "map_width", cfg.map_width);
  read_number(v, "map_height", cfg.map_height);
  read_int(v, "starting_energy", cfg.starting_energy);
  read_int(v, "energy_income_per_turn", cfg.energy_income_per_turn);
  read_int(v, "cost_hub", cfg.cost_hub);
  read_int(v, "cost_weapon", cfg.cost_weapon);
  read_int(v, "cost_extractor", cfg.cost_extractor);
  read_int(v, "cost_defense", cfg.cost_defense);
  read_number(v, "max_pull", cfg.max_pull);
  read_number(v, "max_launch_distance", cfg.max_launch_distance);
  read_number(v, "power_exponent", cfg.power_exponent);
  read_int(v, "sub_ticks_per_round", cfg.sub_ticks_per_round);
  read_int(v, "snapshot_interval", cfg.snapshot_interval);
  read_int(v, "max_rounds_per_turn", cfg.max_rounds_per_turn);
  read_number(v, "intercept_range", cfg.intercept_range);
  read_number(v, "hit_radius", cfg.hit_radius);
  read_number(v, "impact_damage", cfg.impact_damage);
  read_int(v, "beam_lifetime_ticks", cfg.beam_lifetime_ticks);
  read_number(v, "max_hp_hub", cfg.max_hp_hub);
  read_number(v, "max_hp_default", cfg.max_hp_default);
  read_number(v, "undeployed_hp", cfg.undeployed_hp);
  read_int(v, "fuel_hub", cfg.fuel_hub);
  read_int(v, "fuel_defense", cfg.fuel_defense);
  read_number(v, "vision_hub", cfg.vision_hub);
  read_number(v, "vision_extractor", cfg.vision_extractor);
  read_number(v, "vision_defense", cfg.vision_defense);
  read_number(v, "vision_weapon", cfg.vision_weapon);
  read_number(v, "link_sample_step", cfg.link_sample_step);

  validate_rules_config(cfg);
  return cfg;
}

json::Value rules_to_json(const RulesConfig& cfg) {
  json::Object o;
  o["map_width"] = cfg.map_width;
  o["map_height"] = cfg.map_height;
  o["starting_energy"] = static_cast<double>(cfg.starting_energy);
  o["energy_income_per_turn"] = static_cast<double>(cfg.energy_income_per_turn);
  o["cost_hub"] = static_cast<double>(cfg.cost_hub);
  o["cost_weapon"] = static_cast<double>(cfg.cost_weapon);
  o["cost_extractor"] = static_cast<double>(cfg.cost_extractor);
  o["cost_defense"] = static_cast<double>(cfg.cost_defense);
  o["max_pull"] = cfg.max_pull;
  o["max_launch_distance"] = cfg.max_launch_distance;
  o["power_exponent"] = cfg.power_exponent;
  o["sub_ticks_per_round"] = static_cast<double>(cfg.sub_ticks_per_round);
  o["snapshot_interval"] = static_cast<double>(cfg.snapshot_interval);
  o["max_rounds_per_turn"] = static_cast<double>(cfg.max_rounds_per_turn);
  o["intercept_range"] = cfg.intercept_range;
  o["hit_radius"] = cfg.hit_radius;
  o["impact_damage"] = cfg.impact_damage;
  o["beam_lifetime_ticks"] = static_cast<double>(cfg.beam_lifetime_ticks);
  o["max_hp_hub"] = cfg.max_hp_hub;
  o["max_hp_default"] = cfg.max_hp_default;
  o["undeployed_hp"] = cfg.undeployed_hp;
  o["fuel_hub"] = static_cast<double>(cfg.fuel_hub);
  o["fuel_defense"] = static_cast<double>(cfg.fuel_defense);
  o["vision_hub"] = cfg.vision_hub;
  o["vision_extractor"] = cfg.vision_extractor;
  o["vision_defense"] = cfg.vision_defense;
  o["vision_weapon"] = cfg.vision_weapon;
  o["link_sample_step"] = cfg.link_sample_step;
  return json::object(std::move(o));
}

RulesConfig load_rules_config_from_file(const std::string& path) {
  try {
    return rules_from_json(json::parse(read_text_file(path)));
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load rules from " + path + ": " + e.what());
  }
}

} // namespace slingnet
