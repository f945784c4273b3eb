#include "idlecore/core/config.h"

#include <cmath>
#include <limits>

#include "idlecore/util/file_io.h"
#include "idlecore/util/log.h"

namespace idlecore {
namespace {

const json::Object* section(const json::Value& root, const char* key) {
  const json::Value* v = root.find(key);
  if (!v) return nullptr;
  const json::Object* o = v->as_object();
  if (!o) log::warn(std::string("Config: '") + key + "' must be an object; ignoring");
  return o;
}

void read_positive(const json::Object& o, const char* key, double& out, bool allow_zero = false) {
  auto it = o.find(key);
  if (it == o.end()) return;
  const double* n = it->second.as_number();
  if (!n || !std::isfinite(*n) || *n < 0.0 || (!allow_zero && *n == 0.0)) {
    log::warn(std::string("Config: invalid value for '") + key + "'; keeping default");
    return;
  }
  out = *n;
}

void read_count(const json::Object& o, const char* key, int& out) {
  auto it = o.find(key);
  if (it == o.end()) return;
  const double* n = it->second.as_number();
  if (!n || !std::isfinite(*n) || *n < 1.0 || std::floor(*n) != *n ||
      *n > static_cast<double>(std::numeric_limits<int>::max())) {
    log::warn(std::string("Config: invalid value for '") + key + "'; keeping default");
    return;
  }
  out = static_cast<int>(*n);
}

} // namespace

EngineConfig engine_config_from_json(const json::Value& v) {
  EngineConfig cfg;
  if (!v.is_object()) {
    log::warn("Config: root must be an object; using defaults");
    return cfg;
  }

  if (const json::Object* p = section(v, "precision")) {
    read_positive(*p, "dirtyEpsilonAbsolute", cfg.precision.dirty_epsilon_absolute);
    read_positive(*p, "dirtyEpsilonRelative", cfg.precision.dirty_epsilon_relative);
    read_positive(*p, "dirtyEpsilonCeiling", cfg.precision.dirty_epsilon_ceiling);
    read_positive(*p, "dirtyEpsilonOverrideMax", cfg.precision.dirty_epsilon_override_max);
  }

  if (const json::Object* l = section(v, "limits")) {
    read_count(*l, "maxRunsPerTick", cfg.limits.max_runs_per_tick);
    read_count(*l, "maxRunsPerTickHardCap", cfg.limits.max_runs_per_tick_hard_cap);
    read_count(*l, "maxOutstandingBatches", cfg.limits.max_outstanding_batches);
    read_count(*l, "maxOutstandingBatchesHardCap", cfg.limits.max_outstanding_batches_hard_cap);
    read_count(*l, "maxCommandQueueSize", cfg.limits.max_command_queue_size);
    read_count(*l, "maxConditionDepth", cfg.limits.max_condition_depth);
    read_count(*l, "eventBusDefaultChannelCapacity", cfg.limits.event_bus_default_channel_capacity);
  }

  if (const json::Object* r = section(v, "runtime")) {
    read_positive(*r, "stepSizeMs", cfg.runtime.step_size_ms);
    read_count(*r, "maxStepsPerFrame", cfg.runtime.max_steps_per_frame);
    read_positive(*r, "slowHandlerBudgetMs", cfg.runtime.slow_handler_budget_ms, /*allow_zero=*/true);
    read_positive(*r, "prestigeTokenTtlMs", cfg.runtime.prestige_token_ttl_ms, /*allow_zero=*/true);
    if (auto it = r->find("fallbackSeed"); it != r->end()) {
      const double* n = it->second.as_number();
      if (n && std::isfinite(*n) && *n >= 0.0 && *n <= 4294967295.0 && std::floor(*n) == *n) {
        cfg.runtime.fallback_seed = static_cast<std::uint32_t>(*n);
      } else {
        log::warn("Config: invalid value for 'fallbackSeed'; keeping default");
      }
    }
  }

  if (cfg.limits.max_runs_per_tick > cfg.limits.max_runs_per_tick_hard_cap) {
    log::warn("Config: maxRunsPerTick exceeds its hard cap; clamping");
    cfg.limits.max_runs_per_tick = cfg.limits.max_runs_per_tick_hard_cap;
  }
  if (cfg.limits.max_outstanding_batches > cfg.limits.max_outstanding_batches_hard_cap) {
    log::warn("Config: maxOutstandingBatches exceeds its hard cap; clamping");
    cfg.limits.max_outstanding_batches = cfg.limits.max_outstanding_batches_hard_cap;
  }
  return cfg;
}

json::Value engine_config_to_json(const EngineConfig& cfg) {
  json::Object precision;
  precision["dirtyEpsilonAbsolute"] = cfg.precision.dirty_epsilon_absolute;
  precision["dirtyEpsilonRelative"] = cfg.precision.dirty_epsilon_relative;
  precision["dirtyEpsilonCeiling"] = cfg.precision.dirty_epsilon_ceiling;
  precision["dirtyEpsilonOverrideMax"] = cfg.precision.dirty_epsilon_override_max;

  json::Object limits;
  limits["maxRunsPerTick"] = static_cast<double>(cfg.limits.max_runs_per_tick);
  limits["maxRunsPerTickHardCap"] = static_cast<double>(cfg.limits.max_runs_per_tick_hard_cap);
  limits["maxOutstandingBatches"] = static_cast<double>(cfg.limits.max_outstanding_batches);
  limits["maxOutstandingBatchesHardCap"] = static_cast<double>(cfg.limits.max_outstanding_batches_hard_cap);
  limits["maxCommandQueueSize"] = static_cast<double>(cfg.limits.max_command_queue_size);
  limits["maxConditionDepth"] = static_cast<double>(cfg.limits.max_condition_depth);
  limits["eventBusDefaultChannelCapacity"] = static_cast<double>(cfg.limits.event_bus_default_channel_capacity);

  json::Object runtime;
  runtime["stepSizeMs"] = cfg.runtime.step_size_ms;
  runtime["maxStepsPerFrame"] = static_cast<double>(cfg.runtime.max_steps_per_frame);
  runtime["fallbackSeed"] = static_cast<double>(cfg.runtime.fallback_seed);
  runtime["slowHandlerBudgetMs"] = cfg.runtime.slow_handler_budget_ms;
  runtime["prestigeTokenTtlMs"] = cfg.runtime.prestige_token_ttl_ms;

  json::Object root;
  root["precision"] = json::object(std::move(precision));
  root["limits"] = json::object(std::move(limits));
  root["runtime"] = json::object(std::move(runtime));
  return json::object(std::move(root));
}

EngineConfig load_engine_config(const std::string& path) {
  return engine_config_from_json(json::parse(read_text_file(path)));
}

} // namespace idlecore
