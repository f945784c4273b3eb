#pragma once

#include <functional>

#include "idlecore/util/json.h"

namespace idlecore {

class AutomationSystem;
class CommandDispatcher;
class PrestigeSystem;
class ProgressionCoordinator;
class ResourceState;
class SimulationContext;
class TransformSystem;

struct CoreCommandHooks {
  // Receives OFFLINE_CATCHUP requests (elapsedMs, resourceDeltas). The
  // runtime runs the catch-up once the current step has finished.
  std::function<void(double, const json::Value&)> offline_catchup;
};

// Registers COLLECT_RESOURCE, PURCHASE_GENERATOR, PURCHASE_UPGRADE,
// TOGGLE_GENERATOR, TOGGLE_AUTOMATION, RUN_TRANSFORM, PRESTIGE_RESET and, when
// a hook is given, OFFLINE_CATCHUP.
void register_core_command_handlers(CommandDispatcher& dispatcher, SimulationContext& ctx,
                                    ProgressionCoordinator& progression, ResourceState& resources,
                                    AutomationSystem& automation, TransformSystem& transforms,
                                    PrestigeSystem& prestige, CoreCommandHooks hooks = {});

} // namespace idlecore
