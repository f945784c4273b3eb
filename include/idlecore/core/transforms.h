#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
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

struct TransformBatch {
  std::int64_t complete_at_step{0};
  // (resourceId, amount), sorted by resource id.
  std::vector<std::pair<std::string, double>> outputs;
};

struct TransformState {
  std::string id;
  bool unlocked{false};
  std::int64_t cooldown_expires_step{0};

  // Runs performed during last_run_step.
  int runs_this_step{0};
  std::optional<std::int64_t> last_run_step;

  // Outstanding batch deliveries, in run order.
  std::vector<TransformBatch> batches;
};

struct TransformRunResult {
  bool success{false};
  // UNKNOWN_TRANSFORM, TRANSFORM_LOCKED, TRANSFORM_COOLDOWN, MAX_RUNS_EXCEEDED,
  // MAX_OUTSTANDING_BATCHES, INSUFFICIENT_RESOURCES or INVALID_FORMULA.
  std::string code;
  std::string message;
};

// Converts input resources into outputs, either instantly or as delayed
// batches. Manual transforms run through RUN_TRANSFORM; condition and event
// transforms run from tick().
class TransformSystem {
 public:
  TransformSystem(SimulationContext& ctx, const ContentPack& content, ProgressionCoordinator& progression,
                  ResourceState& resources, EventBus& events, double step_ms);
  ~TransformSystem();

  TransformSystem(const TransformSystem&) = delete;
  TransformSystem& operator=(const TransformSystem&) = delete;

  void tick(const TickContext& tick);

  TransformRunResult run(const std::string& id, std::int64_t step, int runs = 1, EventBus* events = nullptr);

  const TransformState* state(const std::string& id) const;

  // Effective safety limits after clamping to the configured hard caps.
  int max_runs_per_tick(const std::string& id) const;
  int max_outstanding_batches(const std::string& id) const;

  json::Value export_state() const;
  void restore_state(const json::Value& data, const std::optional<CommandQueueRebase>& rebase = std::nullopt);

 private:
  struct Limits {
    int max_runs{0};
    int max_batches{0};
  };

  void deliver(const std::string& transform_id, const std::vector<std::pair<std::string, double>>& outputs,
               std::int64_t step, const char* mode, EventBus* events);

  SimulationContext& ctx_;
  const ContentPack& content_;
  ProgressionCoordinator& progression_;
  ResourceState& resources_;
  double step_ms_;

  std::vector<TransformState> states_;
  std::vector<Limits> limits_;
  std::unordered_map<std::string, std::size_t> index_;
  // Indices sorted by (order, id).
  std::vector<std::size_t> order_;

  std::vector<bool> event_pending_;
  std::vector<Subscription> subscriptions_;
};

} // namespace idlecore
