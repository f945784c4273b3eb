#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "idlecore/core/content.h"
#include "idlecore/core/offline.h"
#include "idlecore/core/runtime.h"
#include "idlecore/core/sim_context.h"
#include "idlecore/core/telemetry.h"

#define IC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

const char* kPack = R"({
  "id": "test.offline",
  "resources": [{"id": "gold", "unlocked": true}, {"id": "wood", "startAmount": 3, "unlocked": true}],
  "generators": [{"id": "mine", "purchase": {"currencyId": "gold"}, "initialLevel": 1,
                  "produces": [{"resourceId": "gold", "rate": 1}]}]
})";

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

} // namespace

int test_offline() {
  using namespace idlecore;

  // --- Totals ---
  {
    OfflineProgressTotals t = resolve_offline_progress_totals(1050.0, 100.0);
    IC_ASSERT(near(t.total_ms, 1050.0) && t.total_steps == 10 && near(t.total_remainder_ms, 50.0));

    OfflineLimits by_time;
    by_time.max_elapsed_ms = 550.0;
    t = resolve_offline_progress_totals(1050.0, 100.0, by_time);
    IC_ASSERT(near(t.total_ms, 550.0) && t.total_steps == 5 && near(t.total_remainder_ms, 50.0));

    OfflineLimits by_steps;
    by_steps.max_steps = 3.0;
    t = resolve_offline_progress_totals(1050.0, 100.0, by_steps);
    IC_ASSERT(near(t.total_ms, 300.0) && t.total_steps == 3 && t.total_remainder_ms == 0.0);

    OfflineLimits ignored;
    ignored.max_elapsed_ms = -1.0;
    ignored.max_steps = std::nan("");
    t = resolve_offline_progress_totals(1050.0, 100.0, ignored);
    IC_ASSERT(t.total_steps == 10);

    t = resolve_offline_progress_totals(0.0, 100.0);
    IC_ASSERT(t.total_steps == 0 && t.total_ms == 0.0);
    t = resolve_offline_progress_totals(-5.0, 100.0);
    IC_ASSERT(t.total_steps == 0);
    t = resolve_offline_progress_totals(500.0, 0.0);
    IC_ASSERT(t.total_steps == 0);

    // Absurd elapsed times saturate instead of wrapping negative.
    const std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
    t = resolve_offline_progress_totals(1e298, 100.0);
    IC_ASSERT(t.total_steps == kMax);
    IC_ASSERT(t.total_remainder_ms == 0.0);
    IC_ASSERT(t.total_ms > 0.0 && std::isfinite(t.total_ms));

    OfflineLimits huge_cap;
    huge_cap.max_steps = 1e300;
    t = resolve_offline_progress_totals(1e298, 100.0, huge_cap);
    IC_ASSERT(t.total_steps == kMax);
    huge_cap.max_steps = 4.0;
    t = resolve_offline_progress_totals(1e298, 100.0, huge_cap);
    IC_ASSERT(t.total_steps == 4 && near(t.total_ms, 400.0));

    IC_ASSERT(floor_to_step_count(0.0) == 0);
    IC_ASSERT(floor_to_step_count(7.9) == 7);
    IC_ASSERT(floor_to_step_count(9223372036854775808.0) == kMax);
    IC_ASSERT(floor_to_step_count(std::numeric_limits<double>::max()) == kMax);
  }

  auto mem = std::make_shared<MemoryTelemetry>();
  SimulationContext ctx(EngineConfig{}, mem);
  const ContentPack pack = content_pack_from_json(json::parse(kPack));

  // --- Chunked catch-up: deltas land with the final chunk ---
  {
    Runtime rt(ctx, pack);
    const std::size_t gold = rt.resources().require_index("gold");
    int updates = 0;

    OfflineProgressRequest req;
    req.elapsed_ms = 1050.0;
    req.resource_deltas = json::parse(R"({"gold": 5, "ghost": 3, "wood": 0})");
    req.max_ticks_per_call = 4;
    req.on_progress = [&](const OfflineProgressUpdate&) { ++updates; };

    OfflineProgressResult r = apply_offline_progress(rt, req);
    IC_ASSERT(!r.completed);
    IC_ASSERT(r.processed_steps == 4 && r.remaining_steps == 6);
    IC_ASSERT(near(r.remaining_ms, 650.0));
    IC_ASSERT(updates == 4);
    IC_ASSERT(rt.current_step() == 4);
    IC_ASSERT(near(rt.resources().amount(gold), 0.4));

    req.elapsed_ms = r.remaining_ms;
    req.max_ticks_per_call.reset();
    r = apply_offline_progress(rt, req);
    IC_ASSERT(r.completed);
    IC_ASSERT(r.processed_steps == 6);
    IC_ASSERT(near(r.processed_ms, 650.0));
    IC_ASSERT(r.remaining_steps == 0 && near(r.remaining_ms, 0.0));
    IC_ASSERT(rt.current_step() == 10);
    IC_ASSERT(near(rt.accumulator_ms(), 50.0));
    IC_ASSERT(near(rt.resources().amount(gold), 6.0));
    IC_ASSERT(updates == 11);
  }

  // --- Direct delta application ---
  {
    Runtime rt(ctx, pack);
    ResourceState& rs = rt.resources();
    const int applied = apply_offline_resource_deltas(rs, json::parse(R"({"wood": -10, "gold": 2.5, "ghost": 1})"));
    IC_ASSERT(applied == 2);
    IC_ASSERT(rs.amount(rs.require_index("wood")) == 0.0);
    IC_ASSERT(rs.amount(rs.require_index("gold")) == 2.5);
    IC_ASSERT(apply_offline_resource_deltas(rs, json::Value(nullptr)) == 0);
  }

  // --- OFFLINE_CATCHUP runs once the issuing step has finished ---
  {
    Runtime rt(ctx, pack);
    mem->clear();
    Command cmd;
    cmd.type = "OFFLINE_CATCHUP";
    cmd.priority = CommandPriority::System;
    cmd.step = 0;
    cmd.payload = json::parse(R"({"elapsedMs": 300, "resourceDeltas": {"wood": 2}})");
    IC_ASSERT(rt.enqueue(cmd));
    rt.tick();
    IC_ASSERT(rt.current_step() == 4);
    IC_ASSERT(mem->count(TelemetryKind::Progress, "OfflineCatchupApplied") == 1);
    IC_ASSERT(rt.resources().amount(rt.resources().require_index("wood")) == 5.0);

    // Players cannot fabricate elapsed time.
    cmd.priority = CommandPriority::Player;
    cmd.step = rt.current_step();
    IC_ASSERT(rt.enqueue(cmd));
    rt.tick();
    IC_ASSERT(rt.current_step() == 5);
    IC_ASSERT(mem->count(TelemetryKind::Warning, "CommandPriorityViolation") == 1);

    cmd.priority = CommandPriority::System;
    cmd.step = rt.current_step();
    cmd.payload = json::parse(R"({"elapsedMs": -1})");
    IC_ASSERT(rt.enqueue(cmd));
    rt.tick();
    IC_ASSERT(rt.current_step() == 6);
    IC_ASSERT(mem->count(TelemetryKind::Error, "OfflineCatchupInvalidPayload") == 1);
  }
  return 0;
}
