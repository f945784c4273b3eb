#include "idlecore/core/prestige.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <utility>

#include "idlecore/core/event_bus.h"
#include "idlecore/core/progression.h"
#include "idlecore/core/resource_state.h"
#include "idlecore/core/sim_context.h"

namespace idlecore {
namespace {

double whole_non_negative(double v) {
  if (!std::isfinite(v)) return 0.0;
  return std::max(0.0, std::floor(v));
}

} // namespace

const char* prestige_status_name(PrestigeStatus s) {
  switch (s) {
    case PrestigeStatus::Locked: return "locked";
    case PrestigeStatus::Available: return "available";
    case PrestigeStatus::Completed: return "completed";
  }
  return "locked";
}

PrestigeSystem::PrestigeSystem(SimulationContext& ctx, const ContentPack& content, ProgressionCoordinator& progression,
                               ResourceState& resources, double step_ms)
    : ctx_(ctx),
      content_(content),
      progression_(progression),
      resources_(resources),
      step_ms_(step_ms),
      token_ttl_steps_(static_cast<std::int64_t>(
          std::ceil(std::min(std::max(0.0, ctx.config().runtime.prestige_token_ttl_ms) / step_ms, 1e15)))) {
  for (const auto& def : content_.prestige_layers) {
    PrestigeLayerState s;
    s.id = def.id;
    layer_index_.emplace(def.id, layers_.size());
    layers_.push_back(s);
  }
  update_unlocks();
}

const PrestigeLayerState* PrestigeSystem::state(const std::string& layer_id) const {
  auto it = layer_index_.find(layer_id);
  return it == layer_index_.end() ? nullptr : &layers_[it->second];
}

void PrestigeSystem::update_unlocks() {
  if (layers_.empty()) return;
  const ConditionContext cc = progression_.condition_context();
  for (std::size_t i = 0; i < layers_.size(); ++i) {
    const bool unlocked = evaluate_condition(content_.prestige_layers[i].unlock_condition, cc);
    layers_[i].unlocked = unlocked;
    layers_[i].visible = unlocked;
  }
}

double PrestigeSystem::reward_for(const PrestigeLayerDefinition& def, std::int64_t step) const {
  const FormulaContext fc = progression_.formula_context(1.0, static_cast<double>(step) * step_ms_, step_ms_);
  double amount = progression_.evaluate_or_warn(def.base_reward, fc, def.id);
  if (std::isnan(amount)) amount = 0.0;
  if (def.multiplier_curve) {
    const double multiplier = progression_.evaluate_or_warn(*def.multiplier_curve, fc, def.id);
    if (!std::isnan(multiplier)) amount *= multiplier;
  }
  return whole_non_negative(amount);
}

std::optional<PrestigeQuote> PrestigeSystem::quote(const std::string& layer_id, std::int64_t step) const {
  auto it = layer_index_.find(layer_id);
  if (it == layer_index_.end()) return std::nullopt;
  const PrestigeLayerDefinition& def = content_.prestige_layers[it->second];

  PrestigeQuote q;
  q.layer_id = layer_id;
  if (!layers_[it->second].unlocked) {
    q.status = PrestigeStatus::Locked;
  } else {
    const double count = resources_.amount(resources_.require_index(def.count_resource_id()));
    q.status = count >= 1.0 ? PrestigeStatus::Completed : PrestigeStatus::Available;
  }
  q.reward_resource_id = def.reward_resource_id;
  q.reward_amount = reward_for(def, step);
  q.reset_targets = def.reset_targets;
  q.reset_generators = def.reset_generators;
  q.reset_upgrades = def.reset_upgrades;
  for (const auto& r : def.retention) q.retained.push_back(r.target_id);
  return q;
}

void PrestigeSystem::expire_tokens(std::int64_t step) {
  for (auto it = used_tokens_.begin(); it != used_tokens_.end();) {
    if (step - it->second > token_ttl_steps_) {
      it = used_tokens_.erase(it);
    } else {
      ++it;
    }
  }
}

void PrestigeSystem::apply(const std::string& layer_id, const std::string& token, std::int64_t step,
                           EventBus* events) {
  if (token.empty()) throw std::runtime_error("Prestige operation requires a confirmation token");

  expire_tokens(step);
  if (used_tokens_.count(token)) {
    json::Object details;
    details["layerId"] = std::string(layer_id);
    ctx_.telemetry().record_warning("PrestigeResetDuplicateToken", details);
    throw std::runtime_error("Confirmation token has already been used");
  }
  used_tokens_[token] = step;

  auto it = layer_index_.find(layer_id);
  if (it == layer_index_.end()) throw std::runtime_error("Prestige layer \"" + layer_id + "\" not found");
  if (!layers_[it->second].unlocked) throw std::runtime_error("Prestige layer \"" + layer_id + "\" is locked");
  const PrestigeLayerDefinition& def = content_.prestige_layers[it->second];

  {
    json::Object details;
    details["layerId"] = std::string(layer_id);
    details["tokenLength"] = static_cast<double>(token.size());
    ctx_.telemetry().record_progress("PrestigeResetTokenReceived", details);
  }

  // Reward and retained amounts see the balances from before the reset.
  const double reward = reward_for(def, step);
  std::set<std::string> kept_resources{def.count_resource_id()};
  std::set<std::string> kept_generators;
  std::set<std::string> kept_upgrades;
  std::vector<std::pair<std::size_t, double>> retained_amounts;
  const FormulaContext fc = progression_.formula_context(1.0, static_cast<double>(step) * step_ms_, step_ms_);
  for (const auto& r : def.retention) {
    switch (r.kind) {
      case PrestigeRetentionKind::Resource:
        kept_resources.insert(r.target_id);
        if (r.amount) {
          const double v = progression_.evaluate_or_warn(*r.amount, fc, def.id);
          retained_amounts.emplace_back(resources_.require_index(r.target_id), whole_non_negative(v));
        }
        break;
      case PrestigeRetentionKind::Generator: kept_generators.insert(r.target_id); break;
      case PrestigeRetentionKind::Upgrade: kept_upgrades.insert(r.target_id); break;
    }
  }

  if (reward > 0.0) resources_.add_amount(resources_.require_index(def.reward_resource_id), reward);

  int reset_count = 0;
  for (const auto& id : def.reset_targets) {
    if (kept_resources.count(id)) continue;
    for (const auto& r : content_.resources) {
      if (r.definition.id != id) continue;
      resources_.reset_amount(resources_.require_index(id), whole_non_negative(r.definition.start_amount));
      ++reset_count;
    }
  }
  for (const auto& [idx, amount] : retained_amounts) resources_.reset_amount(idx, amount);

  for (const auto& id : def.reset_generators) {
    if (kept_generators.count(id)) continue;
    if (!progression_.reset_generator(id)) {
      json::Object details;
      details["layerId"] = std::string(layer_id);
      details["generatorId"] = std::string(id);
      ctx_.telemetry().record_warning("PrestigeResetGeneratorSkipped", details);
    }
  }
  for (const auto& id : def.reset_upgrades) {
    if (kept_upgrades.count(id)) continue;
    if (!progression_.reset_upgrade(id)) {
      json::Object details;
      details["layerId"] = std::string(layer_id);
      details["upgradeId"] = std::string(id);
      ctx_.telemetry().record_warning("PrestigeResetUpgradeSkipped", details);
    }
  }

  const std::size_t count_idx = resources_.require_index(def.count_resource_id());
  resources_.add_amount(count_idx, 1.0);
  progression_.update_unlocks();
  update_unlocks();

  json::Object details;
  details["layerId"] = std::string(layer_id);
  details["rewardResourceId"] = std::string(def.reward_resource_id);
  details["rewardAmount"] = reward;
  details["resetCount"] = static_cast<double>(reset_count);
  details["retentionCount"] = static_cast<double>(retained_amounts.size());
  ctx_.telemetry().record_progress("PrestigeResetApplied", details);

  if (events && events->has_event_type("prestige:reset")) {
    json::Object payload;
    payload["layerId"] = std::string(layer_id);
    payload["rewardAmount"] = reward;
    payload["count"] = resources_.amount(count_idx);
    events->publish("prestige:reset", json::object(std::move(payload)));
  }
}

json::Value PrestigeSystem::export_state() const {
  json::Array layers;
  for (const auto& l : layers_) {
    json::Object o;
    o["id"] = std::string(l.id);
    o["unlocked"] = l.unlocked;
    o["visible"] = l.visible;
    layers.push_back(json::object(std::move(o)));
  }
  json::Object tokens;
  for (const auto& [token, step] : used_tokens_) tokens[token] = static_cast<double>(step);

  json::Object root;
  root["layers"] = std::move(layers);
  root["tokens"] = json::object(std::move(tokens));
  return json::object(std::move(root));
}

void PrestigeSystem::restore_state(const json::Value& data, const std::optional<CommandQueueRebase>& rebase) {
  if (data.is_null()) return;
  if (!data.is_object()) throw std::runtime_error("Prestige state must be an object");
  const std::int64_t shift = rebase ? rebase->current_step - rebase->saved_step : 0;

  if (const json::Value* layers = data.find("layers")) {
    for (const auto& entry : layers->array()) {
      auto it = layer_index_.find(entry.at("id").string_value());
      if (it == layer_index_.end()) continue;
      PrestigeLayerState& s = layers_[it->second];
      if (const json::Value* v = entry.find("unlocked")) s.unlocked = v->bool_value(s.unlocked);
      if (const json::Value* v = entry.find("visible")) s.visible = v->bool_value(s.visible);
    }
  }

  used_tokens_.clear();
  if (const json::Value* tokens = data.find("tokens"); tokens && tokens->is_object()) {
    for (const auto& [token, step] : tokens->object()) {
      if (token.empty() || !step.is_number()) continue;
      used_tokens_[token] = step.int_value() + shift;
    }
  }
}

} // namespace idlecore
