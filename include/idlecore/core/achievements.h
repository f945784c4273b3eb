#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "idlecore/core/command_queue.h"
#include "idlecore/core/condition.h"
#include "idlecore/core/content.h"
#include "idlecore/core/tick.h"
#include "idlecore/util/json.h"

namespace idlecore {

class AutomationSystem;
class EventBus;
class ProgressionCoordinator;
class ResourceState;
class SimulationContext;

struct AchievementState {
  std::string id;
  bool visible{false};
  int completions{0};
  double progress{0.0};
  double target{1.0};
  // Repeatable achievements only; unset once max_repeats is reached.
  std::optional<std::int64_t> next_repeatable_at_step;
  std::optional<std::int64_t> last_completed_step;
};

// Tracks achievement progress once per step and hands out rewards on
// completion. Flags and automation unlocks it grants live in progression and
// automation state, so restoring a save needs no reward replay.
class AchievementTracker {
 public:
  AchievementTracker(SimulationContext& ctx, const ContentPack& content, ProgressionCoordinator& progression,
                     ResourceState& resources, AutomationSystem& automation);

  // Returns the number of completions during this step.
  int tick(const TickContext& tick);

  const AchievementState* state(const std::string& id) const;
  const std::vector<AchievementState>& states() const { return states_; }

  // [{id, visible, completions, progress, target, nextRepeatableAtStep|null, lastCompletedStep|null}]
  json::Value export_state() const;

  // Applies by id; unknown ids are ignored. Throws std::runtime_error for
  // out-of-range completion counts.
  void restore_state(const json::Value& data, const std::optional<CommandQueueRebase>& rebase = std::nullopt);

 private:
  double measure(const AchievementDefinition& def, const ConditionContext& cc) const;
  void complete(std::size_t index, const TickContext& tick, const FormulaContext& fc);
  void grant_reward(const AchievementDefinition& def, const FormulaContext& fc, EventBus* events);
  void publish(EventBus* events, const std::string& type, json::Object payload, const std::string& achievement_id);

  SimulationContext& ctx_;
  const ContentPack& content_;
  ProgressionCoordinator& progression_;
  ResourceState& resources_;
  AutomationSystem& automation_;

  std::vector<AchievementState> states_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace idlecore
