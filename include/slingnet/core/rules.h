#pragma once

#include <optional>
#include <string>

#include "slingnet/core/entities.h"
#include "slingnet/util/json.h"

namespace slingnet {

// Every tunable constant of the rules engine.
//
// Defaults reproduce the shipped balance; data/rules/default_rules.json holds
// the same values so a host can tweak them without recompiling.
struct RulesConfig {
  // --- map ---
  double map_width{1000.0};
  double map_height{1000.0};

  // --- economy ---
  int starting_energy{50};
  // Added to every alive player at the start of each resolved turn.
  int energy_income_per_turn{10};

  int cost_hub{20};
  int cost_weapon{15};
  int cost_extractor{25};
  int cost_defense{30};

  // --- slingshot ---
  //
  // launch distance = (min(pull, max_pull) / max_pull) ^ power_exponent * max_launch_distance
  //
  // The exponent must stay > 1: low-power shots are precise while the top of
  // the range is deliberately twitchy.
  double max_pull{300.0};
  double max_launch_distance{800.0};
  double power_exponent{1.6};

  // --- round simulation ---
  int sub_ticks_per_round{120};
  // A ROUND_SUB snapshot is captured every N sub-ticks (and on the last one).
  int snapshot_interval{4};
  // Safety cap against malformed queues.
  int max_rounds_per_turn{20};

  // --- combat ---
  double intercept_range{100.0};
  double hit_radius{30.0};
  double impact_damage{100.0};
  // Sub-ticks a laser beam effect stays visible.
  int beam_lifetime_ticks{8};

  // --- structures ---
  double max_hp_hub{100.0};
  double max_hp_default{50.0};
  // HP of a structure during its landing vulnerability window.
  double undeployed_hp{1.0};

  // Fuel per turn (hubs: launches, defenses: interceptions).
  int fuel_hub{3};
  int fuel_defense{1};

  // --- fog of war ---
  // 0 means the type provides no vision.
  double vision_hub{250.0};
  double vision_extractor{150.0};
  double vision_defense{200.0};
  double vision_weapon{0.0};

  // Spacing of the points sampled along a link when testing whether it crosses
  // a player's vision.
  double link_sample_step{20.0};
};

// Energy cost of launching an item (0 for non-launchable types).
int item_cost(const RulesConfig& cfg, EntityType t);

// Full hit points of a deployed structure.
double max_hp_for(const RulesConfig& cfg, EntityType t);

// Per-turn fuel for types with a fuel system, std::nullopt otherwise.
std::optional<int> default_fuel_for(const RulesConfig& cfg, EntityType t);

// Vision radius (0 = none).
double vision_radius_for(const RulesConfig& cfg, EntityType t);

// Non-linear slingshot power curve. Negative pulls are treated as 0.
double launch_distance(const RulesConfig& cfg, double pull_distance);

// Inverse of launch_distance for distances in [0, max_launch_distance].
// Used by aiming helpers (and tests) to hit a known point.
double pull_for_distance(const RulesConfig& cfg, double distance);

// Launch displacement for an angle in degrees and a raw pull.
Vec2 launch_vector(const RulesConfig& cfg, double angle_deg, double pull_distance);

// Throws std::runtime_error describing the first invalid field.
void validate_rules_config(const RulesConfig& cfg);

// Read a (possibly partial) rules object; missing keys keep their defaults.
// Throws std::runtime_error on wrong types or invalid values.
RulesConfig rules_from_json(const json::Value& v);
json::Value rules_to_json(const RulesConfig& cfg);

RulesConfig load_rules_config_from_file(const std::string& path);

} // namespace slingnet
