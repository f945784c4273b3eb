#include "test.h"

#include <iostream>

#include "idlecore/util/log.h"

int main() {
  // Many tests exercise failure paths on purpose; keep their logging quiet.
  idlecore::log::set_level(idlecore::log::Level::Error);

  int fails = 0;
  fails += test_json();
  fails += test_file_io();
  fails += test_config();
  fails += test_digests();
  fails += test_rng();
  fails += test_resource_state();
  fails += test_event_bus();
  fails += test_command_queue();
  fails += test_command_dispatcher();
  fails += test_formula_condition();
  fails += test_progression();
  fails += test_automation();
  fails += test_transforms();
  fails += test_prestige();
  fails += test_achievements();
  fails += test_offline();
  fails += test_migration();
  fails += test_snapshot();
  fails += test_replay();
  fails += test_runtime();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
