#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "slingnet/core/rules.h"
#include "slingnet/core/serialization.h"
#include "slingnet/core/simulation.h"
#include "slingnet/core/state_validation.h"
#include "slingnet/core/visibility.h"
#include "slingnet/util/digest.h"
#include "slingnet/util/file_io.h"
#include "slingnet/util/json.h"
#include "slingnet/util/log.h"

namespace {

#ifndef SLINGNET_VERSION
#define SLINGNET_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

void print_usage(const char* exe) {
  std::cout << "Slingnet CLI v" << SLINGNET_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "slingnet_cli") << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --players A,B     Player ids for a new game (default: player1,player2)\n";
  std::cout << "  --rules PATH      Rules JSON (default: built-in rules)\n";
  std::cout << "  --load PATH       Load a save JSON instead of starting a new game\n";
  std::cout << "  --save PATH       Save state JSON after resolving\n";
  std::cout << "  --script PATH     JSON array of per-turn action maps to resolve in order\n";
  std::cout << "  --turns N         Turns to resolve without a script (default: 1)\n";
  std::cout << "  --snapshots PATH  Write every resolved turn's snapshots as JSON\n";
  std::cout << "  --view PLAYER     Fog-of-war filter applied to written snapshots\n";
  std::cout << "  --validate        Validate the (loaded) state and exit\n";
  std::cout << "  --digest          Print the final state digest\n";
  std::cout << "  --dump            Print the resulting save JSON to stdout\n";
  std::cout << "  --quiet           Suppress non-essential output\n";
  std::cout << "  --log-level L     debug|info|warn|error|off (default: info)\n";
  std::cout << "  -h, --help        Show this help\n";
  std::cout << "  --version         Print version and exit\n";
}

void print_summary(const slingnet::GameState& s) {
  std::cout << "Turn " << s.turn << ", " << s.entities.size() << " entities, " << s.links.size() << " links\n";
  for (const auto& pid : slingnet::sorted_player_ids(s)) {
    const auto& p = s.players.at(pid);
    std::cout << "  " << pid << ": energy " << p.energy << ", hubs " << slingnet::count_hubs(s, pid)
              << (p.alive ? "" : " (eliminated)") << "\n";
  }
  if (s.winner) std::cout << "Winner: " << *s.winner << "\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << SLINGNET_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string level_text = get_str_arg(argc, argv, "--log-level", "");
    if (!level_text.empty()) {
      slingnet::log::Level lvl;
      if (!slingnet::log::parse_level(level_text, &lvl)) {
        std::cerr << "Unknown --log-level: " << level_text << "\n";
        return 2;
      }
      slingnet::log::set_level(lvl);
    }

    const bool quiet = has_flag(argc, argv, "--quiet");
    const std::string rules_path = get_str_arg(argc, argv, "--rules", "");
    const std::string load_path = get_str_arg(argc, argv, "--load", "");
    const std::string save_path = get_str_arg(argc, argv, "--save", "");
    const std::string script_path = get_str_arg(argc, argv, "--script", "");
    const std::string snapshots_path = get_str_arg(argc, argv, "--snapshots", "");
    const std::string view = get_str_arg(argc, argv, "--view", "");
    const int turns = get_int_arg(argc, argv, "--turns", 1);

    slingnet::RulesConfig rules;
    if (!rules_path.empty()) rules = slingnet::load_rules_config_from_file(rules_path);

    slingnet::Simulation sim(rules);

    if (!load_path.empty()) {
      sim.load_game(slingnet::deserialize_game_from_json(slingnet::read_text_file(load_path)));
      const auto errors = slingnet::validate_game_state(sim.state());
      if (has_flag(argc, argv, "--validate")) {
        for (const auto& e : errors) std::cout << e << "\n";
        if (!quiet) std::cout << (errors.empty() ? "State OK" : "State INVALID") << "\n";
        return errors.empty() ? 0 : 1;
      }
      if (!errors.empty()) {
        for (const auto& e : errors) slingnet::log::error(e);
        std::cerr << "Refusing to resolve an invalid state (" << errors.size() << " error(s))\n";
        return 1;
      }
    } else {
      auto players = split_csv(get_str_arg(argc, argv, "--players", "player1,player2"));
      sim.initialize_game(players);
      if (has_flag(argc, argv, "--validate")) {
        const auto errors = slingnet::validate_game_state(sim.state());
        for (const auto& e : errors) std::cout << e << "\n";
        return errors.empty() ? 0 : 1;
      }
    }

    std::vector<slingnet::ActionQueues> script;
    if (!script_path.empty()) {
      const auto doc = slingnet::json::parse(slingnet::read_text_file(script_path));
      for (const auto& turn : doc.array()) script.push_back(slingnet::action_queues_from_json(turn));
    } else {
      script.resize(static_cast<std::size_t>(turns > 0 ? turns : 0));
    }

    slingnet::json::Array turn_frames;
    for (const auto& queues : script) {
      const int turn = sim.state().turn;
      const auto snaps = sim.resolve_turn(queues);

      if (!snapshots_path.empty()) {
        slingnet::json::Array frames;
        for (const auto& snap : snaps) {
          frames.push_back(slingnet::serialize_snapshot_to_json_value(
              view.empty() ? snap : slingnet::project_visible_snapshot(sim.cfg(), snap, view)));
        }
        slingnet::json::Object t;
        t["turn"] = static_cast<double>(turn);
        t["snapshots"] = frames;
        turn_frames.push_back(t);
      }
      if (!quiet) std::cout << "Resolved turn " << turn << " (" << snaps.size() << " snapshots)\n";
      if (sim.winner()) break;
    }

    if (!snapshots_path.empty()) {
      slingnet::write_text_file(snapshots_path,
                                slingnet::json::stringify(slingnet::json::array(std::move(turn_frames)), 2) + "\n");
      if (!quiet) std::cout << "Wrote snapshots to " << snapshots_path << "\n";
    }

    if (!quiet) print_summary(sim.state());

    if (has_flag(argc, argv, "--digest")) {
      std::cout << slingnet::digest64_to_hex(slingnet::digest_game_state64(sim.state())) << "\n";
    }

    if (!save_path.empty()) {
      slingnet::write_text_file(save_path, slingnet::serialize_game_to_json(sim.state()));
      if (!quiet) std::cout << "Saved to " << save_path << "\n";
    }

    if (has_flag(argc, argv, "--dump")) {
      std::cout << "\n--- JSON ---\n" << slingnet::serialize_game_to_json(sim.state()) << "\n";
    }

    return 0;
  } catch (const std::exception& e) {
    slingnet::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
