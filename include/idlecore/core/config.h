#pragma once

#include <cstdint>
#include <string>

#include "idlecore/util/json.h"

namespace idlecore {

// Numeric tolerances used by ResourceState when deciding whether an amount
// changed enough to be republished.
struct PrecisionConfig {
  // Floor for every tolerance comparison.
  double dirty_epsilon_absolute{1e-9};

  // Scaled by max(|a|, |b|).
  double dirty_epsilon_relative{1e-9};

  // Upper bound for the relative term when a resource carries no override.
  double dirty_epsilon_ceiling{1e-3};

  // Per-resource overrides (ResourceDefinition::dirty_tolerance) are clamped
  // into [dirty_epsilon_absolute, dirty_epsilon_override_max].
  double dirty_epsilon_override_max{0.5};
};

struct LimitsConfig {
  // Transform runs per tick when a definition does not set safety.maxRunsPerTick.
  int max_runs_per_tick{10};
  int max_runs_per_tick_hard_cap{100};

  // Outstanding batch transforms per definition.
  int max_outstanding_batches{50};
  int max_outstanding_batches_hard_cap{1000};

  int max_command_queue_size{10000};

  // Nested allOf/anyOf/not deeper than this evaluate to false.
  int max_condition_depth{100};

  int event_bus_default_channel_capacity{256};
};

struct RuntimeConfig {
  double step_size_ms{100.0};

  // Frame accumulator cap: Runtime::advance() never runs more steps than
  // this per call; the excess time is carried forward.
  int max_steps_per_frame{50};

  // Seed used when the RNG is drawn from before anyone seeded it.
  std::uint32_t fallback_seed{0x1D1E5EEDu};

  // Event handlers slower than this record EventHandlerSlow. <= 0 disables.
  double slow_handler_budget_ms{2.0};

  // A prestige confirmation token cannot be reused for this long.
  double prestige_token_ttl_ms{60000.0};
};

struct EngineConfig {
  PrecisionConfig precision;
  LimitsConfig limits;
  RuntimeConfig runtime;
};

// Reads overrides from a JSON object. Missing keys keep their defaults;
// invalid values (wrong type, non-finite, out of range) are logged and ignored.
EngineConfig engine_config_from_json(const json::Value& v);
json::Value engine_config_to_json(const EngineConfig& cfg);

// Throws std::runtime_error when the file cannot be read or parsed.
EngineConfig load_engine_config(const std::string& path);

} // namespace idlecore
