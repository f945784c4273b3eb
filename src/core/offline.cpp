#include "idlecore/core/offline.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "idlecore/core/resource_state.h"
#include "idlecore/core/runtime.h"
#include "idlecore/util/sorted_keys.h"

namespace idlecore {
namespace {

std::optional<double> valid_limit(const std::optional<double>& v) {
  if (!v || !std::isfinite(*v) || *v < 0.0) return std::nullopt;
  return v;
}

OfflineProgressUpdate make_update(double processed_ms, const OfflineProgressTotals& totals,
                                  std::int64_t processed_steps) {
  OfflineProgressUpdate u;
  u.processed_ms = processed_ms;
  u.total_ms = totals.total_ms;
  u.processed_steps = processed_steps;
  u.total_steps = totals.total_steps;
  u.remaining_ms = std::max(0.0, totals.total_ms - processed_ms);
  u.remaining_steps = std::max<std::int64_t>(0, totals.total_steps - processed_steps);
  return u;
}

} // namespace

std::int64_t floor_to_step_count(double x) {
  // 2^63 is exactly representable; anything at or above it does not fit.
  constexpr double kLimit = 9223372036854775808.0;
  if (!(x < kLimit)) return std::numeric_limits<std::int64_t>::max();
  return static_cast<std::int64_t>(std::floor(x));
}

OfflineProgressTotals resolve_offline_progress_totals(double elapsed_ms, double step_ms, const OfflineLimits& limits) {
  OfflineProgressTotals t;
  if (!std::isfinite(step_ms) || step_ms <= 0.0) return t;
  if (!std::isfinite(elapsed_ms) || elapsed_ms <= 0.0) return t;

  double ms = elapsed_ms;
  if (const auto max_elapsed = valid_limit(limits.max_elapsed_ms)) ms = std::min(ms, *max_elapsed);

  const double whole = ms / step_ms;
  auto steps = floor_to_step_count(whole);
  double remainder = ms - static_cast<double>(steps) * step_ms;
  if (remainder < 0.0 || steps == std::numeric_limits<std::int64_t>::max()) remainder = 0.0;

  if (const auto max_steps = valid_limit(limits.max_steps)) {
    const auto cap = floor_to_step_count(*max_steps);
    if (steps > cap) {
      steps = cap;
      remainder = 0.0;
    }
  }

  t.total_steps = steps;
  t.total_remainder_ms = remainder;
  t.total_ms = static_cast<double>(steps) * step_ms + remainder;
  return t;
}

int apply_offline_resource_deltas(ResourceState& resources, const json::Value& deltas) {
  if (!deltas.is_object()) return 0;
  int applied = 0;
  for (const auto& id : util::sorted_keys(deltas.object())) {
    const json::Value& v = deltas.at(id);
    if (!v.is_number()) continue;
    const double d = *v.as_number();
    if (!std::isfinite(d) || d == 0.0) continue;
    const auto idx = resources.find_index(id);
    if (!idx) continue;

    if (d > 0.0) {
      resources.add_amount(*idx, d);
    } else {
      const double amount = std::min(-d, resources.amount(*idx));
      if (amount > 0.0) resources.spend_amount(*idx, amount, ResourceSpendContext{"", "offline-catchup"});
    }
    ++applied;
  }
  return applied;
}

OfflineProgressResult apply_offline_progress(Runtime& runtime, const OfflineProgressRequest& request) {
  OfflineProgressResult result;
  const double step_ms = runtime.step_size_ms();
  const OfflineProgressTotals totals = resolve_offline_progress_totals(request.elapsed_ms, step_ms, request.limits);
  result.total_ms = totals.total_ms;
  result.total_steps = totals.total_steps;

  std::int64_t call_steps = totals.total_steps;
  if (request.max_ticks_per_call && *request.max_ticks_per_call >= 1) {
    call_steps = std::min(call_steps, *request.max_ticks_per_call);
  }
  const bool final_call = call_steps == totals.total_steps;

  double processed_ms = 0.0;
  std::int64_t processed_steps = 0;
  for (std::int64_t i = 0; i < call_steps; ++i) {
    runtime.tick();
    ++processed_steps;
    processed_ms += step_ms;
    if (request.on_progress) request.on_progress(make_update(processed_ms, totals, processed_steps));
  }

  if (final_call && totals.total_remainder_ms > 0.0) {
    runtime.advance(totals.total_remainder_ms);
    processed_ms += totals.total_remainder_ms;
    if (request.on_progress) request.on_progress(make_update(processed_ms, totals, processed_steps));
  }

  const OfflineProgressUpdate u = make_update(processed_ms, totals, processed_steps);
  result.processed_ms = u.processed_ms;
  result.processed_steps = u.processed_steps;
  result.remaining_ms = u.remaining_ms;
  result.remaining_steps = u.remaining_steps;
  result.completed = final_call;

  if (final_call) apply_offline_resource_deltas(runtime.resources(), request.resource_deltas);
  return result;
}

} // namespace idlecore
