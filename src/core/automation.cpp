#include "idlecore/core/automation.h"

#include <algorithm>
#include <cmath>
#include <limits>
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

bool compare(double lhs, Comparator cmp, double rhs) {
  switch (cmp) {
    case Comparator::Gte: return lhs >= rhs;
    case Comparator::Gt: return lhs > rhs;
    case Comparator::Lte: return lhs <= rhs;
    case Comparator::Lt: return lhs < rhs;
  }
  return false;
}

void publish_if_registered(EventBus* events, const std::string& type, json::Object payload) {
  if (!events || !events->has_event_type(type)) return;
  events->publish(type, json::object(std::move(payload)));
}

} // namespace

AutomationSystem::AutomationSystem(SimulationContext& ctx, const ContentPack& content,
                                   ProgressionCoordinator& progression, ResourceState& resources,
                                   CommandQueue& queue, EventBus& events, double step_ms)
    : ctx_(ctx), content_(content), progression_(progression), resources_(resources), queue_(queue),
      step_ms_(step_ms) {
  if (!(step_ms_ > 0.0) || !std::isfinite(step_ms_)) {
    throw std::invalid_argument("AutomationSystem step size must be a positive finite number");
  }

  for (const auto& def : content_.automations) {
    if (def.target_type == AutomationTargetType::System && def.target_id != "offline-catchup") {
      throw std::invalid_argument("Automation \"" + def.id + "\" targets unsupported system \"" + def.target_id + "\"");
    }
    AutomationState s;
    s.id = def.id;
    s.enabled = def.enabled_by_default;
    index_.emplace(def.id, states_.size());
    order_.push_back(states_.size());
    states_.push_back(s);
  }
  event_pending_.assign(states_.size(), false);

  std::sort(order_.begin(), order_.end(), [&](std::size_t a, std::size_t b) {
    const auto& da = content_.automations[a];
    const auto& db = content_.automations[b];
    if (da.order != db.order) return da.order < db.order;
    return da.id < db.id;
  });

  for (std::size_t i = 0; i < content_.automations.size(); ++i) {
    const auto& def = content_.automations[i];
    if (def.trigger.kind != AutomationTriggerKind::Event) continue;
    if (!events.has_event_type(def.trigger.event_id)) events.register_event_type(def.trigger.event_id);
    subscriptions_.push_back(events.on(def.trigger.event_id, [this, i](const EventEnvelope&) {
      event_pending_[i] = true;
    }));
  }
}

AutomationSystem::~AutomationSystem() {
  for (auto& s : subscriptions_) s.unsubscribe();
}

const AutomationState* AutomationSystem::state(const std::string& id) const {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &states_[it->second];
}

bool AutomationSystem::set_enabled(const std::string& id, bool enabled, EventBus* events) {
  auto it = index_.find(id);
  if (it == index_.end()) return false;
  AutomationState& s = states_[it->second];
  const bool changed = s.enabled != enabled;
  s.enabled = enabled;
  if (changed) {
    json::Object payload;
    payload["automationId"] = std::string(id);
    payload["enabled"] = enabled;
    publish_if_registered(events, "automation:toggled", std::move(payload));
  }
  return true;
}

void AutomationSystem::grant(const std::string& id) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    json::Object details;
    details["automationId"] = std::string(id);
    ctx_.telemetry().record_warning("AutomationGrantUnknown", details);
    return;
  }
  states_[it->second].unlocked = true;
}

bool AutomationSystem::evaluate_trigger(std::size_t index, const TickContext& tick) {
  const AutomationDefinition& def = content_.automations[index];
  AutomationState& s = states_[index];
  const AutomationTrigger& trig = def.trigger;

  switch (trig.kind) {
    case AutomationTriggerKind::Interval: {
      if (!s.last_fired_step) return true;
      const std::int64_t interval = std::max<std::int64_t>(1, steps_for(trig.interval_ms, step_ms_));
      return tick.step - *s.last_fired_step >= interval;
    }
    case AutomationTriggerKind::ResourceThreshold: {
      const auto idx = resources_.find_index(trig.resource_id);
      if (!idx) return false;
      double threshold = 0.0;
      try {
        threshold = evaluate_formula(trig.threshold, progression_.formula_context(0.0, 0.0, 0.0));
      } catch (const std::exception& e) {
        json::Object details;
        details["automationId"] = std::string(def.id);
        details["error"] = std::string(e.what());
        ctx_.telemetry().record_warning("AutomationThresholdFailed", details);
        return false;
      }
      const bool satisfied = compare(resources_.amount(*idx), trig.comparator, threshold);
      const bool crossed = satisfied && !s.last_threshold_satisfied;
      s.last_threshold_satisfied = satisfied;
      return crossed;
    }
    case AutomationTriggerKind::CommandQueueEmpty: return queue_.empty();
    case AutomationTriggerKind::Event: return event_pending_[index];
  }
  return false;
}

std::optional<Command> AutomationSystem::build_command(const AutomationDefinition& def, const TickContext& tick) const {
  Command cmd;
  cmd.priority = CommandPriority::Automation;
  cmd.step = tick.step + 1;
  cmd.timestamp = static_cast<double>(tick.step) * step_ms_;

  json::Object payload;
  switch (def.target_type) {
    case AutomationTargetType::Generator:
      cmd.type = command_type_name(CommandKind::ToggleGenerator);
      payload["generatorId"] = std::string(def.target_id);
      payload["enabled"] = def.target_enabled;
      break;
    case AutomationTargetType::Upgrade:
      cmd.type = command_type_name(CommandKind::PurchaseUpgrade);
      payload["upgradeId"] = std::string(def.target_id);
      break;
    case AutomationTargetType::PurchaseGenerator:
      cmd.type = command_type_name(CommandKind::PurchaseGenerator);
      payload["generatorId"] = std::string(def.target_id);
      payload["count"] = static_cast<double>(def.target_count);
      break;
    case AutomationTargetType::CollectResource:
    case AutomationTargetType::System: {
      double amount = 0.0;
      try {
        amount = evaluate_formula(def.target_amount, progression_.formula_context(0.0, tick.time_ms, tick.delta_ms));
      } catch (const std::exception& e) {
        json::Object details;
        details["automationId"] = std::string(def.id);
        details["error"] = std::string(e.what());
        ctx_.telemetry().record_warning("AutomationTargetAmountFailed", details);
        return std::nullopt;
      }
      if (def.target_type == AutomationTargetType::CollectResource) {
        cmd.type = command_type_name(CommandKind::CollectResource);
        payload["resourceId"] = std::string(def.target_id);
        payload["amount"] = amount;
      } else {
        cmd.type = command_type_name(CommandKind::OfflineCatchup);
        payload["elapsedMs"] = amount;
        payload["resourceDeltas"] = json::object({});
      }
      break;
    }
  }
  cmd.payload = json::object(std::move(payload));
  return cmd;
}

void AutomationSystem::tick(const TickContext& tick) {
  const ConditionContext cc = progression_.condition_context();

  for (std::size_t i : order_) {
    const AutomationDefinition& def = content_.automations[i];
    AutomationState& s = states_[i];

    if (!s.unlocked && evaluate_condition(def.unlock_condition, cc)) s.unlocked = true;

    bool retain_event = false;
    if (s.unlocked && s.enabled && tick.step >= s.cooldown_expires_step && evaluate_trigger(i, tick)) {
      std::optional<Command> cmd = build_command(def, tick);
      if (cmd) {
        std::optional<std::size_t> cost_index;
        double cost = 0.0;
        double debited = 0.0;
        bool paid = true;
        if (def.resource_cost) {
          try {
            cost = evaluate_formula(def.resource_cost->amount, progression_.formula_context(0.0, 0.0, 0.0));
          } catch (const std::exception&) {
            cost = std::numeric_limits<double>::quiet_NaN();
          }
          cost_index = resources_.find_index(def.resource_cost->resource_id);
          if (!cost_index || !std::isfinite(cost) || cost < 0.0) {
            paid = false;
          } else if (cost > 0.0) {
            const double before = resources_.amount(*cost_index);
            paid = resources_.spend_amount(*cost_index, cost, ResourceSpendContext{"", "automation"});
            if (paid) debited = before - resources_.amount(*cost_index);
          }
        }

        if (!paid) {
          retain_event = true;
        } else if (!queue_.enqueue(*cmd)) {
          json::Object details;
          details["automationId"] = std::string(def.id);
          details["commandType"] = std::string(cmd->type);
          details["step"] = static_cast<double>(tick.step);
          ctx_.telemetry().record_warning("AutomationEnqueueRejected", details);
          if (cost_index && debited > 0.0) resources_.add_amount(*cost_index, debited);
        } else {
          s.last_fired_step = tick.step;
          s.cooldown_expires_step = def.cooldown_ms ? tick.step + steps_for(*def.cooldown_ms, step_ms_) : 0;

          json::Object payload;
          payload["automationId"] = std::string(def.id);
          payload["commandType"] = std::string(cmd->type);
          payload["step"] = static_cast<double>(tick.step);
          publish_if_registered(tick.events, "automation:fired", std::move(payload));
        }
      }
    }
    if (!retain_event) event_pending_[i] = false;
  }
}

json::Value AutomationSystem::export_state() const {
  json::Array out;
  for (std::size_t i = 0; i < states_.size(); ++i) {
    const AutomationState& s = states_[i];
    json::Object o;
    o["eventPending"] = static_cast<bool>(event_pending_[i]);
    o["id"] = std::string(s.id);
    o["enabled"] = s.enabled;
    o["unlocked"] = s.unlocked;
    if (s.last_fired_step) {
      o["lastFiredStep"] = static_cast<double>(*s.last_fired_step);
    } else {
      o["lastFiredStep"] = nullptr;
    }
    o["cooldownExpiresStep"] = static_cast<double>(s.cooldown_expires_step);
    o["lastThresholdSatisfied"] = s.last_threshold_satisfied;
    out.push_back(json::object(std::move(o)));
  }
  return json::array(std::move(out));
}

void AutomationSystem::restore_state(const json::Value& data, const std::optional<CommandQueueRebase>& rebase) {
  if (data.is_null()) return;
  const std::int64_t shift = rebase ? rebase->current_step - rebase->saved_step : 0;

  for (const auto& entry : data.array()) {
    auto it = index_.find(entry.at("id").string_value());
    if (it == index_.end()) continue;
    AutomationState& s = states_[it->second];

    if (const json::Value* v = entry.find("enabled")) s.enabled = v->bool_value(s.enabled);
    if (const json::Value* v = entry.find("unlocked")) s.unlocked = v->bool_value(s.unlocked);
    if (const json::Value* v = entry.find("lastFiredStep"); v && v->is_number()) {
      s.last_fired_step = v->int_value() + shift;
    } else {
      s.last_fired_step.reset();
    }
    if (const json::Value* v = entry.find("cooldownExpiresStep"); v && v->is_number()) {
      const std::int64_t expires = v->int_value();
      s.cooldown_expires_step = expires > 0 ? std::max<std::int64_t>(0, expires + shift) : 0;
    }
    if (const json::Value* v = entry.find("lastThresholdSatisfied")) s.last_threshold_satisfied = v->bool_value();
    if (const json::Value* v = entry.find("eventPending")) event_pending_[it->second] = v->bool_value();
  }
}

} // namespace idlecore
