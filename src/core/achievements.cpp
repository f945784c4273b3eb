#include "idlecore/core/achievements.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "idlecore/core/automation.h"
#include "idlecore/core/event_bus.h"
#include "idlecore/core/progression.h"
#include "idlecore/core/resource_state.h"
#include "idlecore/core/sim_context.h"

namespace idlecore {
namespace {

double non_negative(double v) {
  if (!std::isfinite(v) || v < 0.0) return 0.0;
  return v;
}

std::optional<std::int64_t> optional_step(const json::Value* v, std::int64_t shift) {
  if (!v || !v->is_number()) return std::nullopt;
  const double d = v->number_value();
  if (!std::isfinite(d) || d < 0.0 || d > 9007199254740991.0) return std::nullopt;
  return static_cast<std::int64_t>(std::floor(d)) + shift;
}

json::Value step_or_null(const std::optional<std::int64_t>& step) {
  if (!step) return json::Value();
  return json::Value(static_cast<double>(*step));
}

} // namespace

AchievementTracker::AchievementTracker(SimulationContext& ctx, const ContentPack& content,
                                       ProgressionCoordinator& progression, ResourceState& resources,
                                       AutomationSystem& automation)
    : ctx_(ctx),
      content_(content),
      progression_(progression),
      resources_(resources),
      automation_(automation) {
  for (const auto& def : content_.achievements) {
    AchievementState s;
    s.id = def.id;
    index_.emplace(def.id, states_.size());
    states_.push_back(s);
  }
}

const AchievementState* AchievementTracker::state(const std::string& id) const {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &states_[it->second];
}

double AchievementTracker::measure(const AchievementDefinition& def, const ConditionContext& cc) const {
  switch (def.track) {
    case AchievementTrackKind::Resource: return cc.resource_amount(def.track_id);
    case AchievementTrackKind::GeneratorLevel: return cc.generator_level(def.track_id);
    case AchievementTrackKind::UpgradeOwned: return cc.upgrade_purchases(def.track_id);
    case AchievementTrackKind::Flag: return cc.has_flag(def.track_id) ? 1.0 : 0.0;
  }
  return 0.0;
}

int AchievementTracker::tick(const TickContext& tick) {
  if (states_.empty()) return 0;
  const ConditionContext cc = progression_.condition_context();
  int completed = 0;

  for (std::size_t i = 0; i < states_.size(); ++i) {
    const AchievementDefinition& def = content_.achievements[i];
    AchievementState& s = states_[i];

    const double next_completion = def.repeatable ? static_cast<double>(s.completions) + 1.0 : 1.0;
    const FormulaContext fc = progression_.formula_context(next_completion, tick.time_ms, tick.delta_ms);
    const double target = progression_.evaluate_or_warn(def.target, fc, def.id);
    s.target = std::isfinite(target) && target > 0.0 ? target : 1.0;

    const bool eligible = evaluate_condition(def.unlock_condition, cc);
    const bool shown = !def.visibility_condition || evaluate_condition(*def.visibility_condition, cc);
    s.visible = s.completions > 0 || (eligible && shown);

    if (def.repeatable) {
      if (def.max_repeats && s.completions >= *def.max_repeats) {
        s.progress = std::max(s.progress, s.target);
        s.next_repeatable_at_step.reset();
        continue;
      }
      if (s.next_repeatable_at_step && tick.step < *s.next_repeatable_at_step) {
        s.progress = std::max(s.progress, s.target);
        continue;
      }
      const double measured = measure(def, cc);
      s.progress = non_negative(measured);
      if (!eligible) continue;
      const Comparator c = def.track == AchievementTrackKind::Resource ? def.comparator : Comparator::Gte;
      if (!compare_values(measured, s.target, c)) continue;
      complete(i, tick, fc);
      ++completed;
      continue;
    }

    if (s.completions > 0) {
      s.progress = std::max(s.progress, s.target);
      continue;
    }
    if (!eligible) {
      s.progress = 0.0;
      continue;
    }
    const double measured = measure(def, cc);
    s.progress = std::max(s.progress, non_negative(measured));
    const Comparator c = def.track == AchievementTrackKind::Resource ? def.comparator : Comparator::Gte;
    if (!compare_values(measured, s.target, c)) continue;
    complete(i, tick, fc);
    ++completed;
  }
  return completed;
}

void AchievementTracker::complete(std::size_t index, const TickContext& tick, const FormulaContext& fc) {
  const AchievementDefinition& def = content_.achievements[index];
  AchievementState& s = states_[index];
  ++s.completions;
  s.last_completed_step = tick.step;
  s.progress = s.target;
  s.visible = true;

  if (def.repeatable) {
    double window = 1.0;
    if (def.reset_window) {
      const double w = progression_.evaluate_or_warn(*def.reset_window, fc, def.id);
      if (std::isfinite(w) && w >= 0.0) window = std::floor(std::min(w, 9007199254740991.0));
    }
    s.next_repeatable_at_step = tick.step + static_cast<std::int64_t>(std::max(1.0, window));
    if (def.max_repeats && s.completions >= *def.max_repeats) s.next_repeatable_at_step.reset();
  } else {
    s.next_repeatable_at_step.reset();
  }

  grant_reward(def, fc, tick.events);

  json::Object details;
  details["achievementId"] = std::string(def.id);
  details["completions"] = static_cast<double>(s.completions);
  details["step"] = static_cast<double>(tick.step);
  ctx_.telemetry().record_progress("AchievementCompleted", details);

  json::Object payload;
  payload["achievementId"] = std::string(def.id);
  payload["completions"] = static_cast<double>(s.completions);
  publish(tick.events, "achievement:completed", std::move(payload), def.id);
  for (const auto& event_id : def.on_unlock_events) {
    json::Object p;
    p["achievementId"] = std::string(def.id);
    publish(tick.events, event_id, std::move(p), def.id);
  }
}

void AchievementTracker::grant_reward(const AchievementDefinition& def, const FormulaContext& fc, EventBus* events) {
  double scaling = 1.0;
  if (def.repeatable && def.reward_scaling) {
    const double v = progression_.evaluate_or_warn(*def.reward_scaling, fc, def.id);
    if (!std::isnan(v)) scaling = v;
  }

  switch (def.reward) {
    case AchievementRewardKind::None: break;
    case AchievementRewardKind::GrantResource: {
      const double amount = progression_.evaluate_or_warn(def.reward_amount, fc, def.id) * scaling;
      if (std::isfinite(amount) && amount > 0.0) {
        resources_.add_amount(resources_.require_index(def.reward_target_id), amount);
      }
      break;
    }
    case AchievementRewardKind::GrantUpgrade: {
      const UpgradeState* u = progression_.upgrade(def.reward_target_id);
      const UpgradeDefinition* d = content_.find_upgrade(def.reward_target_id);
      if (u && d && u->purchases < d->max_purchases) {
        progression_.record_upgrade_purchase(def.reward_target_id, events);
      } else {
        json::Object details;
        details["achievementId"] = std::string(def.id);
        details["upgradeId"] = std::string(def.reward_target_id);
        ctx_.telemetry().record_warning("AchievementRewardSkipped", details);
      }
      break;
    }
    case AchievementRewardKind::GrantFlag: progression_.set_flag(def.reward_target_id, def.reward_flag_value); break;
    case AchievementRewardKind::UnlockAutomation: automation_.grant(def.reward_target_id); break;
    case AchievementRewardKind::EmitEvent: {
      json::Object p;
      p["achievementId"] = std::string(def.id);
      publish(events, def.reward_target_id, std::move(p), def.id);
      break;
    }
  }
}

void AchievementTracker::publish(EventBus* events, const std::string& type, json::Object payload,
                                 const std::string& achievement_id) {
  if (!events) return;
  if (!events->has_event_type(type)) {
    json::Object details;
    details["achievementId"] = std::string(achievement_id);
    details["eventType"] = std::string(type);
    ctx_.telemetry().record_warning("AchievementEventUnknown", details);
    return;
  }
  events->publish(type, json::object(std::move(payload)));
}

json::Value AchievementTracker::export_state() const {
  json::Array out;
  for (const auto& s : states_) {
    json::Object o;
    o["id"] = std::string(s.id);
    o["visible"] = s.visible;
    o["completions"] = static_cast<double>(s.completions);
    o["progress"] = s.progress;
    o["target"] = s.target;
    o["nextRepeatableAtStep"] = step_or_null(s.next_repeatable_at_step);
    o["lastCompletedStep"] = step_or_null(s.last_completed_step);
    out.push_back(json::object(std::move(o)));
  }
  return json::array(std::move(out));
}

void AchievementTracker::restore_state(const json::Value& data, const std::optional<CommandQueueRebase>& rebase) {
  if (data.is_null()) return;
  if (!data.is_array()) throw std::runtime_error("Achievement state must be an array");
  const std::int64_t shift = rebase ? rebase->current_step - rebase->saved_step : 0;

  for (const auto& entry : data.array()) {
    auto it = index_.find(entry.at("id").string_value());
    if (it == index_.end()) continue;
    AchievementState& s = states_[it->second];

    if (const json::Value* v = entry.find("completions")) {
      const double d = v->number_value();
      if (!std::isfinite(d) || d < 0.0 || d > static_cast<double>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("Achievement \"" + s.id + "\" completions out of range");
      }
      s.completions = static_cast<int>(d);
    }
    if (const json::Value* v = entry.find("visible")) s.visible = v->bool_value(s.visible);
    if (const json::Value* v = entry.find("progress")) s.progress = non_negative(v->number_value());
    if (const json::Value* v = entry.find("target")) {
      const double d = v->number_value();
      if (std::isfinite(d) && d > 0.0) s.target = d;
    }
    s.next_repeatable_at_step = optional_step(entry.find("nextRepeatableAtStep"), shift);
    s.last_completed_step = optional_step(entry.find("lastCompletedStep"), shift);
    if (s.completions > 0) s.visible = true;
  }
}

} // namespace idlecore
