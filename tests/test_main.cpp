#include <iostream>

#include "slingnet/util/log.h"

int test_toroidal();
int test_rules();
int test_entity_store();
int test_link_integrity();
int test_visibility();
int test_turn_resolution();
int test_laser_defense();
int test_victory();
int test_end_to_end();
int test_action_intake();
int test_serialization();
int test_state_validation();
int test_determinism();
int test_json_errors();
int test_file_io();

int main() {
  // Keep the output readable; the engine logs every elimination.
  slingnet::log::set_level(slingnet::log::Level::Warn);

  int fails = 0;
  fails += test_toroidal();
  fails += test_rules();
  fails += test_entity_store();
  fails += test_link_integrity();
  fails += test_visibility();
  fails += test_turn_resolution();
  fails += test_laser_defense();
  fails += test_victory();
  fails += test_end_to_end();
  fails += test_action_intake();
  fails += test_serialization();
  fails += test_state_validation();
  fails += test_determinism();
  fails += test_json_errors();
  fails += test_file_io();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
