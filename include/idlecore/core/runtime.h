#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "idlecore/core/achievements.h"
#include "idlecore/core/automation.h"
#include "idlecore/core/command_dispatcher.h"
#include "idlecore/core/command_queue.h"
#include "idlecore/core/content.h"
#include "idlecore/core/event_bus.h"
#include "idlecore/core/prestige.h"
#include "idlecore/core/progression.h"
#include "idlecore/core/resource_state.h"
#include "idlecore/core/rng.h"
#include "idlecore/core/tick.h"
#include "idlecore/core/transforms.h"

namespace idlecore {

class SimulationContext;

// Channels every runtime registers before content event types.
extern const char* const kBuiltinEventTypes[];
extern const std::size_t kBuiltinEventTypeCount;

struct RuntimeOptions {
  // Seeds the context RNG when set.
  std::optional<std::int64_t> seed;
  std::int64_t initial_step{0};
};

// Fixed-step driver. Owns the per-session state (resources, queue, bus,
// progression, automations, transforms, prestige layers and achievements) and
// runs one step at a time: commands, completions, systems, then bookkeeping.
class Runtime {
 public:
  // Throws std::invalid_argument when the configured step size is not a
  // positive finite number.
  Runtime(SimulationContext& ctx, const ContentPack& content, RuntimeOptions options = {});
  ~Runtime();

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  SimulationContext& context() { return ctx_; }
  const ContentPack& content() const { return content_; }

  ResourceState& resources() { return resources_; }
  const ResourceState& resources() const { return resources_; }
  EventBus& events() { return events_; }
  CommandQueue& queue() { return queue_; }
  CommandDispatcher& dispatcher() { return dispatcher_; }
  ProgressionCoordinator& progression() { return progression_; }
  const ProgressionCoordinator& progression() const { return progression_; }
  AutomationSystem& automation() { return *automation_; }
  TransformSystem& transforms() { return *transforms_; }
  PrestigeSystem& prestige() { return *prestige_; }
  AchievementTracker& achievements() { return *achievements_; }
  PrdRegistry& prd() { return prd_; }

  double step_size_ms() const { return step_ms_; }
  int max_steps_per_frame() const { return max_steps_per_frame_; }
  std::int64_t current_step() const { return current_step_; }

  // Step a newly issued command should target: the current step, or the next
  // one while commands of the current step are executing.
  std::int64_t next_executable_step() const { return next_executable_step_; }

  // Only valid between steps; used when restoring a snapshot.
  void set_current_step(std::int64_t step);

  // Thin wrapper over the queue.
  bool enqueue(Command cmd);

  // Systems run after the built-in ones, in registration order.
  void add_system(TickSystem system);

  // Runs exactly one step.
  void tick();

  // Adds elapsed_ms to the frame accumulator and runs as many whole steps as
  // it holds, at most max_steps_per_frame. Returns the steps run.
  int advance(double elapsed_ms);

  double accumulator_ms() const { return accumulator_ms_; }

  // True while a step (or catch-up started by one) is running. Commands
  // enqueued then come from inside the simulation.
  bool ticking() const { return tick_depth_ > 0; }

  // "live" by default; replays dispatch with "replay".
  void set_dispatch_phase(std::string phase) { phase_ = std::move(phase); }

  // Ids of systems that threw during the most recent step.
  const std::vector<std::string>& last_step_failures() const { return last_failures_; }

 private:
  struct PendingOffline {
    double elapsed_ms{0.0};
    json::Value resource_deltas;
  };

  void register_event_types();
  void run_pending_offline();
  void report_system_failure(const std::string& id, std::int64_t step, const std::string& error);

  SimulationContext& ctx_;
  const ContentPack& content_;
  double step_ms_;
  int max_steps_per_frame_;

  ResourceState resources_;
  EventBus events_;
  CommandQueue queue_;
  CommandDispatcher dispatcher_;
  ProgressionCoordinator progression_;
  std::unique_ptr<AutomationSystem> automation_;
  std::unique_ptr<TransformSystem> transforms_;
  std::unique_ptr<PrestigeSystem> prestige_;
  std::unique_ptr<AchievementTracker> achievements_;
  PrdRegistry prd_;

  std::vector<TickSystem> systems_;

  std::int64_t current_step_{0};
  std::int64_t next_executable_step_{0};
  double accumulator_ms_{0.0};
  std::string phase_{"live"};
  std::vector<std::string> last_failures_;

  std::vector<PendingOffline> pending_offline_;
  bool in_offline_{false};
  int tick_depth_{0};
};

} // namespace idlecore
