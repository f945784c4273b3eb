#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include "idlecore/util/json.h"

namespace idlecore {

class ResourceState;
class Runtime;

// Unset, negative or non-finite limits mean "no limit".
struct OfflineLimits {
  std::optional<double> max_elapsed_ms;
  std::optional<double> max_steps;
};

struct OfflineProgressTotals {
  double total_ms{0.0};
  std::int64_t total_steps{0};
  double total_remainder_ms{0.0};
};

// floor(x) as a step count, saturating at INT64_MAX. x must be finite and >= 0.
std::int64_t floor_to_step_count(double x);

// max_elapsed_ms is applied first. When max_steps caps the step count the
// remainder is dropped.
OfflineProgressTotals resolve_offline_progress_totals(double elapsed_ms, double step_ms,
                                                      const OfflineLimits& limits = {});

// {resourceId: delta}. Positive deltas add, negative deltas spend what is
// there (system "offline-catchup"); zero, non-finite and unknown ids are
// skipped. Returns how many deltas were applied.
int apply_offline_resource_deltas(ResourceState& resources, const json::Value& deltas);

struct OfflineProgressUpdate {
  double processed_ms{0.0};
  double total_ms{0.0};
  std::int64_t processed_steps{0};
  std::int64_t total_steps{0};
  double remaining_ms{0.0};
  std::int64_t remaining_steps{0};
};

struct OfflineProgressRequest {
  double elapsed_ms{0.0};
  // Object or null.
  json::Value resource_deltas;
  OfflineLimits limits;
  // Steps to run in this call; unset or < 1 runs everything.
  std::optional<std::int64_t> max_ticks_per_call;
  std::function<void(const OfflineProgressUpdate&)> on_progress;
};

struct OfflineProgressResult {
  bool completed{true};
  double processed_ms{0.0};
  double total_ms{0.0};
  std::int64_t processed_steps{0};
  std::int64_t total_steps{0};
  double remaining_ms{0.0};
  std::int64_t remaining_steps{0};
};

// Runs the resolved steps through the runtime. A call capped by
// max_ticks_per_call returns completed == false; call again with the
// remaining_ms as elapsed_ms to resume. Deltas apply only on the call that
// completes.
OfflineProgressResult apply_offline_progress(Runtime& runtime, const OfflineProgressRequest& request);

} // namespace idlecore
