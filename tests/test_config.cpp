#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "idlecore/core/config.h"
#include "idlecore/core/sim_context.h"
#include "idlecore/core/telemetry.h"
#include "idlecore/util/json.h"
#include "idlecore/util/log.h"

#define IC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_config() {
  using namespace idlecore;

  // Defaults.
  const EngineConfig defaults;
  IC_ASSERT(defaults.runtime.step_size_ms == 100.0);
  IC_ASSERT(defaults.runtime.max_steps_per_frame == 50);
  IC_ASSERT(defaults.limits.max_command_queue_size == 10000);
  IC_ASSERT(defaults.limits.event_bus_default_channel_capacity == 256);
  IC_ASSERT(defaults.runtime.prestige_token_ttl_ms == 60000.0);

  // Overrides apply; invalid values keep their defaults; limits clamp to hard caps.
  const json::Value overrides = json::parse(R"({
    "runtime": {"stepSizeMs": 50, "maxStepsPerFrame": 0, "fallbackSeed": 1234, "prestigeTokenTtlMs": 0},
    "limits": {"maxRunsPerTick": 500, "maxCommandQueueSize": 2.5, "maxConditionDepth": 8},
    "precision": {"dirtyEpsilonAbsolute": -1}
  })");
  const EngineConfig cfg = engine_config_from_json(overrides);
  IC_ASSERT(cfg.runtime.step_size_ms == 50.0);
  IC_ASSERT(cfg.runtime.max_steps_per_frame == 50);
  IC_ASSERT(cfg.runtime.fallback_seed == 1234u);
  IC_ASSERT(cfg.runtime.prestige_token_ttl_ms == 0.0);
  IC_ASSERT(cfg.limits.max_runs_per_tick == cfg.limits.max_runs_per_tick_hard_cap);
  IC_ASSERT(cfg.limits.max_command_queue_size == 10000);
  IC_ASSERT(cfg.limits.max_condition_depth == 8);
  IC_ASSERT(cfg.precision.dirty_epsilon_absolute == defaults.precision.dirty_epsilon_absolute);

  // A non-object root falls back to defaults rather than throwing.
  const EngineConfig from_array = engine_config_from_json(json::parse("[1,2]"));
  IC_ASSERT(from_array.runtime.step_size_ms == 100.0);

  // to_json -> from_json is lossless.
  const EngineConfig again = engine_config_from_json(engine_config_to_json(cfg));
  IC_ASSERT(json::stringify(engine_config_to_json(again), 0) == json::stringify(engine_config_to_json(cfg), 0));

  // Log levels.
  IC_ASSERT(log::parse_level("WARN") == log::Level::Warn);
  IC_ASSERT(log::parse_level("debug") == log::Level::Debug);
  IC_ASSERT(log::parse_level("off") == log::Level::Off);
  {
    bool threw = false;
    try {
      (void)log::parse_level("loud");
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    IC_ASSERT(threw);
  }

  // Each context owns its services; a null telemetry sink falls back to logging.
  auto mem = std::make_shared<MemoryTelemetry>();
  SimulationContext a(cfg, mem);
  SimulationContext b;
  IC_ASSERT(a.config().runtime.step_size_ms == 50.0);
  IC_ASSERT(b.config().runtime.step_size_ms == 100.0);
  a.telemetry().record_warning("ContextCheck", {});
  IC_ASSERT(mem->count(TelemetryKind::Warning, "ContextCheck") == 1);
  IC_ASSERT(b.telemetry_ptr() != nullptr);

  a.rng().set_seed(5);
  b.rng().set_seed(6);
  IC_ASSERT(a.rng().seed().value_or(0) == 5u);
  IC_ASSERT(b.rng().seed().value_or(0) == 6u);

  return 0;
}
