#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "idlecore/core/command_queue.h"
#include "idlecore/core/content.h"
#include "idlecore/core/event_bus.h"
#include "idlecore/core/tick.h"
#include "idlecore/util/json.h"

namespace idlecore {

class ProgressionCoordinator;
class ResourceState;
class SimulationContext;

struct AutomationState {
  std::string id;
  bool enabled{false};
  bool unlocked{false};

  // Unset until the first fire.
  std::optional<std::int64_t> last_fired_step;
  std::int64_t cooldown_expires_step{0};

  // Threshold triggers fire on the transition into the satisfied state.
  bool last_threshold_satisfied{false};
};

// Evaluates automation triggers once per step and turns fires into
// AUTOMATION-priority commands for the next step. It never mutates game state
// directly apart from the optional per-fire resource cost.
class AutomationSystem {
 public:
  // Throws std::invalid_argument for a system target other than "offline-catchup".
  AutomationSystem(SimulationContext& ctx, const ContentPack& content, ProgressionCoordinator& progression,
                   ResourceState& resources, CommandQueue& queue, EventBus& events, double step_ms);
  ~AutomationSystem();

  AutomationSystem(const AutomationSystem&) = delete;
  AutomationSystem& operator=(const AutomationSystem&) = delete;

  void tick(const TickContext& tick);

  // False for an unknown id. Publishes automation:toggled when events is given.
  bool set_enabled(const std::string& id, bool enabled, EventBus* events = nullptr);

  // Unlocks an automation regardless of its unlock condition (upgrade grants).
  void grant(const std::string& id);

  const AutomationState* state(const std::string& id) const;

  // [{id, enabled, unlocked, lastFiredStep|null, cooldownExpiresStep, lastThresholdSatisfied, eventPending}]
  json::Value export_state() const;

  // Applies by id; unknown ids are ignored. Step fields shift by
  // current_step - saved_step when a rebase is given.
  void restore_state(const json::Value& data, const std::optional<CommandQueueRebase>& rebase = std::nullopt);

 private:
  bool evaluate_trigger(std::size_t index, const TickContext& tick);
  std::optional<Command> build_command(const AutomationDefinition& def, const TickContext& tick) const;

  SimulationContext& ctx_;
  const ContentPack& content_;
  ProgressionCoordinator& progression_;
  ResourceState& resources_;
  CommandQueue& queue_;
  double step_ms_;

  std::vector<AutomationState> states_;
  std::unordered_map<std::string, std::size_t> index_;
  // Indices sorted by (order, id).
  std::vector<std::size_t> order_;

  std::vector<bool> event_pending_;
  std::vector<Subscription> subscriptions_;
};

} // namespace idlecore
