#include "idlecore/core/transforms.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "idlecore/core/condition.h"
#include "idlecore/core/progression.h"
#include "idlecore/core/resource_state.h"
#include "idlecore/core/sim_context.h"

namespace idlecore {
namespace {

std::int64_t steps_for(double ms, double step_ms) {
  if (!std::isfinite(ms) || ms <= 0.0) return 0;
  // Capped so step arithmetic on the result cannot overflow.
  const double steps = std::min(std::ceil(ms / step_ms), 9007199254740991.0);
  return static_cast<std::int64_t>(steps);
}

TransformRunResult fail(const char* code, std::string message) {
  TransformRunResult r;
  r.code = code;
  r.message = std::move(message);
  return r;
}

int clamp_limit(SimulationContext& ctx, const std::string& id, std::optional<int> requested, int fallback,
                int hard_cap, const char* event) {
  int v = requested.value_or(fallback);
  if (v < 1) v = 1;
  if (v > hard_cap) {
    json::Object details;
    details["transformId"] = std::string(id);
    details["requested"] = static_cast<double>(v);
    details["hardCap"] = static_cast<double>(hard_cap);
    ctx.telemetry().record_warning(event, details);
    v = hard_cap;
  }
  return v;
}

} // namespace

TransformSystem::TransformSystem(SimulationContext& ctx, const ContentPack& content, ProgressionCoordinator& progression,
                                 ResourceState& resources, EventBus& events, double step_ms)
    : ctx_(ctx), content_(content), progression_(progression), resources_(resources), step_ms_(step_ms) {
  if (!(step_ms_ > 0.0) || !std::isfinite(step_ms_)) {
    throw std::invalid_argument("TransformSystem step size must be a positive finite number");
  }
  const LimitsConfig& lc = ctx_.config().limits;

  for (const auto& def : content_.transforms) {
    TransformState s;
    s.id = def.id;
    index_.emplace(def.id, states_.size());
    order_.push_back(states_.size());
    states_.push_back(std::move(s));

    Limits lim;
    lim.max_runs = clamp_limit(ctx_, def.id, def.max_runs_per_tick, lc.max_runs_per_tick,
                               lc.max_runs_per_tick_hard_cap, "TransformMaxRunsPerTickClamped");
    lim.max_batches = clamp_limit(ctx_, def.id, def.max_outstanding_batches, lc.max_outstanding_batches,
                                  lc.max_outstanding_batches_hard_cap, "TransformMaxOutstandingBatchesClamped");
    limits_.push_back(lim);
  }
  event_pending_.assign(states_.size(), false);

  std::sort(order_.begin(), order_.end(), [&](std::size_t a, std::size_t b) {
    const auto& da = content_.transforms[a];
    const auto& db = content_.transforms[b];
    if (da.order != db.order) return da.order < db.order;
    return da.id < db.id;
  });

  for (std::size_t i = 0; i < content_.transforms.size(); ++i) {
    const auto& def = content_.transforms[i];
    if (def.trigger != TransformTriggerKind::Event) continue;
    if (!events.has_event_type(def.trigger_event_id)) events.register_event_type(def.trigger_event_id);
    subscriptions_.push_back(events.on(def.trigger_event_id, [this, i](const EventEnvelope&) {
      event_pending_[i] = true;
    }));
  }
}

TransformSystem::~TransformSystem() {
  for (auto& s : subscriptions_) s.unsubscribe();
}

const TransformState* TransformSystem::state(const std::string& id) const {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &states_[it->second];
}

int TransformSystem::max_runs_per_tick(const std::string& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) throw std::out_of_range("Unknown transform: " + id);
  return limits_[it->second].max_runs;
}

int TransformSystem::max_outstanding_batches(const std::string& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) throw std::out_of_range("Unknown transform: " + id);
  return limits_[it->second].max_batches;
}

void TransformSystem::deliver(const std::string& transform_id,
                              const std::vector<std::pair<std::string, double>>& outputs, std::int64_t step,
                              const char* mode, EventBus* events) {
  json::Object delivered;
  for (const auto& [resource_id, amount] : outputs) {
    const auto idx = resources_.find_index(resource_id);
    if (!idx || amount <= 0.0) continue;
    delivered[resource_id] = resources_.add_amount(*idx, amount);
  }
  if (!events || !events->has_event_type("transform:completed")) return;
  json::Object payload;
  payload["transformId"] = std::string(transform_id);
  payload["step"] = static_cast<double>(step);
  payload["mode"] = std::string(mode);
  payload["outputs"] = json::object(std::move(delivered));
  events->publish("transform:completed", json::object(std::move(payload)));
}

TransformRunResult TransformSystem::run(const std::string& id, std::int64_t step, int runs, EventBus* events) {
  auto it = index_.find(id);
  if (it == index_.end()) return fail("UNKNOWN_TRANSFORM", "Unknown transform \"" + id + "\".");
  const std::size_t i = it->second;
  const TransformDefinition& def = content_.transforms[i];
  TransformState& s = states_[i];
  const Limits& lim = limits_[i];

  if (!s.unlocked) return fail("TRANSFORM_LOCKED", "Transform \"" + id + "\" is locked.");
  if (runs < 1) runs = 1;
  if (s.last_run_step != step) s.runs_this_step = 0;
  if (step < s.cooldown_expires_step) return fail("TRANSFORM_COOLDOWN", "Transform \"" + id + "\" is cooling down.");
  if (s.runs_this_step + runs > lim.max_runs) {
    return fail("MAX_RUNS_EXCEEDED", "Transform \"" + id + "\" exceeded its runs per tick.");
  }
  if (def.mode == TransformMode::Batch && static_cast<int>(s.batches.size()) + runs > lim.max_batches) {
    return fail("MAX_OUTSTANDING_BATCHES", "Transform \"" + id + "\" has too many outstanding batches.");
  }

  const FormulaContext fc = progression_.formula_context(0.0, static_cast<double>(step) * step_ms_, step_ms_);
  auto evaluate_io = [&](const std::vector<TransformIO>& list, bool clamp_negative,
                         std::vector<std::pair<std::string, double>>* out) -> bool {
    for (const auto& io : list) {
      double v = 0.0;
      try {
        v = evaluate_formula(io.amount, fc);
      } catch (const std::exception&) {
        return false;
      }
      if (!std::isfinite(v)) return false;
      if (v < 0.0) {
        if (!clamp_negative) return false;
        v = 0.0;
      }
      out->emplace_back(io.resource_id, v * runs);
    }
    std::sort(out->begin(), out->end());
    return true;
  };

  std::vector<std::pair<std::string, double>> inputs;
  std::vector<std::pair<std::string, double>> outputs;
  if (!evaluate_io(def.inputs, false, &inputs) || !evaluate_io(def.outputs, true, &outputs)) {
    return fail("INVALID_FORMULA", "Transform \"" + id + "\" has an invalid input or output amount.");
  }

  std::vector<std::pair<std::size_t, double>> spent;
  for (const auto& [resource_id, amount] : inputs) {
    const std::size_t idx = resources_.require_index(resource_id);
    const double before = resources_.amount(idx);
    if (amount > 0.0 && !resources_.spend_amount(idx, amount, ResourceSpendContext{"", "transform:" + id})) {
      for (const auto& [refund_idx, refund] : spent) {
        if (refund > 0.0) resources_.add_amount(refund_idx, refund);
      }
      return fail("INSUFFICIENT_RESOURCES", "Not enough \"" + resource_id + "\" to run transform \"" + id + "\".");
    }
    // Refunds give back what was debited, never the requested amount.
    spent.emplace_back(idx, before - resources_.amount(idx));
  }

  if (def.mode == TransformMode::Instant) {
    deliver(id, outputs, step, "instant", events);
  } else {
    const std::int64_t complete_at = step + steps_for(def.duration_ms, step_ms_);
    for (int r = 0; r < runs; ++r) {
      TransformBatch b;
      b.complete_at_step = complete_at;
      for (const auto& [resource_id, amount] : outputs) b.outputs.emplace_back(resource_id, amount / runs);
      s.batches.push_back(std::move(b));
    }
  }

  s.runs_this_step += runs;
  s.last_run_step = step;
  if (def.cooldown_ms) s.cooldown_expires_step = step + steps_for(*def.cooldown_ms, step_ms_) + 1;

  TransformRunResult ok;
  ok.success = true;
  return ok;
}

void TransformSystem::tick(const TickContext& tick) {
  const ConditionContext cc = progression_.condition_context();

  for (std::size_t i : order_) {
    const TransformDefinition& def = content_.transforms[i];
    TransformState& s = states_[i];

    if (!s.unlocked && evaluate_condition(def.unlock_condition, cc)) s.unlocked = true;

    if (!s.batches.empty()) {
      std::vector<TransformBatch> pending;
      for (auto& b : s.batches) {
        if (b.complete_at_step <= tick.step) {
          deliver(def.id, b.outputs, tick.step, "batch", tick.events);
        } else {
          pending.push_back(std::move(b));
        }
      }
      s.batches = std::move(pending);
    }

    bool fire = false;
    if (def.trigger == TransformTriggerKind::Condition) {
      fire = s.unlocked && evaluate_condition(def.trigger_condition, cc);
    } else if (def.trigger == TransformTriggerKind::Event) {
      fire = s.unlocked && event_pending_[i];
      event_pending_[i] = false;
    }
    if (!fire) continue;

    const TransformRunResult r = run(def.id, tick.step, 1, tick.events);
    if (!r.success && r.code == "INVALID_FORMULA") {
      json::Object details;
      details["transformId"] = std::string(def.id);
      details["message"] = std::string(r.message);
      ctx_.telemetry().record_warning("TransformRunFailed", details);
    }
  }
}

json::Value TransformSystem::export_state() const {
  json::Array out;
  for (std::size_t i = 0; i < states_.size(); ++i) {
    const TransformState& s = states_[i];
    json::Object o;
    o["eventPending"] = static_cast<bool>(event_pending_[i]);
    o["id"] = std::string(s.id);
    o["unlocked"] = s.unlocked;
    o["cooldownExpiresStep"] = static_cast<double>(s.cooldown_expires_step);
    json::Array batches;
    for (const auto& b : s.batches) {
      json::Object bo;
      bo["completeAtStep"] = static_cast<double>(b.complete_at_step);
      json::Array outputs;
      for (const auto& [resource_id, amount] : b.outputs) {
        json::Object io;
        io["resourceId"] = std::string(resource_id);
        io["amount"] = amount;
        outputs.push_back(json::object(std::move(io)));
      }
      bo["outputs"] = std::move(outputs);
      batches.push_back(json::object(std::move(bo)));
    }
    o["batches"] = std::move(batches);
    out.push_back(json::object(std::move(o)));
  }
  return json::array(std::move(out));
}

void TransformSystem::restore_state(const json::Value& data, const std::optional<CommandQueueRebase>& rebase) {
  if (data.is_null()) return;
  const std::int64_t shift = rebase ? rebase->current_step - rebase->saved_step : 0;

  for (const auto& entry : data.array()) {
    auto it = index_.find(entry.at("id").string_value());
    if (it == index_.end()) continue;
    TransformState& s = states_[it->second];

    if (const json::Value* v = entry.find("unlocked")) s.unlocked = v->bool_value(s.unlocked);
    if (const json::Value* v = entry.find("cooldownExpiresStep"); v && v->is_number()) {
      const std::int64_t expires = v->int_value();
      s.cooldown_expires_step = expires > 0 ? std::max<std::int64_t>(0, expires + shift) : 0;
    }
    s.runs_this_step = 0;
    s.last_run_step.reset();
    if (const json::Value* v = entry.find("eventPending")) event_pending_[it->second] = v->bool_value();

    s.batches.clear();
    if (const json::Value* batches = entry.find("batches"); batches && batches->is_array()) {
      for (const auto& b : batches->array()) {
        TransformBatch batch;
        batch.complete_at_step = std::max<std::int64_t>(0, b.at("completeAtStep").int_value() + shift);
        for (const auto& io : b.at("outputs").array()) {
          const double amount = io.at("amount").number_value();
          if (!std::isfinite(amount) || amount < 0.0) {
            throw std::runtime_error("Transform \"" + s.id + "\" batch has an invalid output amount");
          }
          batch.outputs.emplace_back(io.at("resourceId").string_value(), amount);
        }
        std::sort(batch.outputs.begin(), batch.outputs.end());
        s.batches.push_back(std::move(batch));
      }
    }
  }
}

} // namespace idlecore
