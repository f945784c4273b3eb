#include "idlecore/core/content.h"

#include <cmath>
#include <stdexcept>
#include <unordered_set>

#include "idlecore/util/file_io.h"

namespace idlecore {
namespace {

std::string require_string(const json::Value& v, const char* key, const std::string& where) {
  const json::Value* f = v.find(key);
  if (!f || !f->is_string() || f->as_string()->empty()) {
    throw std::runtime_error(where + ": '" + key + "' must be a non-empty string");
  }
  return *f->as_string();
}

std::string optional_string(const json::Value& v, const char* key) {
  const json::Value* f = v.find(key);
  return f ? f->string_value() : std::string();
}

double number_or(const json::Value& v, const char* key, double def, const std::string& where) {
  const json::Value* f = v.find(key);
  if (!f) return def;
  if (!f->is_number() || !std::isfinite(*f->as_number())) {
    throw std::runtime_error(where + ": '" + key + "' must be a finite number");
  }
  return *f->as_number();
}

std::optional<double> optional_number(const json::Value& v, const char* key, const std::string& where) {
  const json::Value* f = v.find(key);
  if (!f || f->is_null()) return std::nullopt;
  return number_or(v, key, 0.0, where);
}

int int_or(const json::Value& v, const char* key, int def, const std::string& where) {
  const double d = number_or(v, key, def, where);
  if (std::floor(d) != d || std::fabs(d) > 1e9) throw std::runtime_error(where + ": '" + key + "' must be an integer");
  return static_cast<int>(d);
}

std::optional<Condition> optional_condition(const json::Value& v, const char* key) {
  const json::Value* f = v.find(key);
  if (!f || f->is_null()) return std::nullopt;
  return condition_from_json(*f);
}

Condition condition_or_always(const json::Value& v, const char* key) {
  auto c = optional_condition(v, key);
  return c ? *c : always_condition();
}

const json::Array& array_or_empty(const json::Value& v, const char* key) {
  static const json::Array kEmpty;
  const json::Value* f = v.find(key);
  if (!f || f->is_null()) return kEmpty;
  return f->array();
}

EffectOperation parse_operation(const std::string& s, const std::string& where) {
  if (s == "add") return EffectOperation::Add;
  if (s == "multiply") return EffectOperation::Multiply;
  if (s == "set") return EffectOperation::Set;
  throw std::runtime_error(where + ": unknown operation \"" + s + "\"");
}

Comparator parse_comparator(const std::string& s, const std::string& where) {
  if (s == "gte") return Comparator::Gte;
  if (s == "gt") return Comparator::Gt;
  if (s == "lte") return Comparator::Lte;
  if (s == "lt") return Comparator::Lt;
  throw std::runtime_error(where + ": unknown comparator \"" + s + "\"");
}

ResourceContent parse_resource(const json::Value& v) {
  ResourceContent r;
  r.definition.id = require_string(v, "id", "resource");
  const std::string where = "resource \"" + r.definition.id + "\"";
  r.name = optional_string(v, "name");
  r.definition.start_amount = number_or(v, "startAmount", 0.0, where);
  r.definition.capacity = optional_number(v, "capacity", where);
  r.definition.unlocked = v.find("unlocked") ? v.at("unlocked").bool_value() : false;
  r.definition.visible = v.find("visible") ? v.at("visible").bool_value() : r.definition.unlocked;
  r.definition.dirty_tolerance = optional_number(v, "dirtyTolerance", where);
  r.unlock_condition = optional_condition(v, "unlockCondition");
  r.visibility_condition = optional_condition(v, "visibilityCondition");
  return r;
}

std::vector<ResourceRate> parse_rates(const json::Value& v, const char* key) {
  std::vector<ResourceRate> out;
  for (const auto& e : array_or_empty(v, key)) {
    ResourceRate rate;
    rate.resource_id = require_string(e, "resourceId", key);
    rate.rate = formula_from_json(e.at("rate"));
    out.push_back(std::move(rate));
  }
  return out;
}

GeneratorDefinition parse_generator(const json::Value& v) {
  GeneratorDefinition g;
  g.id = require_string(v, "id", "generator");
  const std::string where = "generator \"" + g.id + "\"";
  g.name = optional_string(v, "name");
  const json::Value& purchase = v.at("purchase");
  g.currency_id = require_string(purchase, "currencyId", where);
  g.base_cost = number_or(purchase, "baseCost", 1.0, where);
  g.cost_multiplier = number_or(purchase, "costMultiplier", 1.0, where);
  if (const json::Value* curve = purchase.find("costCurve")) g.cost_curve = formula_from_json(*curve);
  g.produces = parse_rates(v, "produces");
  g.consumes = parse_rates(v, "consumes");
  g.base_unlock = condition_or_always(v, "baseUnlock");
  g.visibility_condition = optional_condition(v, "visibilityCondition");
  if (const json::Value* m = v.find("maxLevel"); m && !m->is_null()) g.max_level = int_or(v, "maxLevel", 0, where);
  g.max_bulk = int_or(v, "maxBulk", 100, where);
  g.initial_level = int_or(v, "initialLevel", 0, where);
  g.enabled_by_default = v.find("enabled") ? v.at("enabled").bool_value(true) : true;
  g.order = int_or(v, "order", 0, where);
  if (g.max_bulk < 1) throw std::runtime_error(where + ": maxBulk must be >= 1");
  if (g.initial_level < 0) throw std::runtime_error(where + ": initialLevel must be >= 0");
  return g;
}

UpgradeCost parse_upgrade_cost(const json::Value& v, const std::string& where) {
  UpgradeCost c;
  c.currency_id = require_string(v, "currencyId", where);
  c.cost_multiplier = number_or(v, "costMultiplier", 1.0, where);
  if (const json::Value* curve = v.find("costCurve")) c.cost_curve = formula_from_json(*curve);
  return c;
}

UpgradeEffect parse_effect(const json::Value& v, const std::string& where) {
  UpgradeEffect e;
  const std::string kind = require_string(v, "kind", where);
  auto with_value = [&](UpgradeEffectKind k, const char* id_key) {
    e.kind = k;
    e.target_id = require_string(v, id_key, where);
    e.operation = parse_operation(require_string(v, "operation", where), where);
    e.value = formula_from_json(v.at("value"));
  };
  if (kind == "modifyResourceRate") {
    with_value(UpgradeEffectKind::ModifyResourceRate, "resourceId");
  } else if (kind == "modifyResourceCapacity") {
    with_value(UpgradeEffectKind::ModifyResourceCapacity, "resourceId");
  } else if (kind == "modifyGeneratorRate") {
    with_value(UpgradeEffectKind::ModifyGeneratorRate, "generatorId");
  } else if (kind == "modifyGeneratorCost") {
    with_value(UpgradeEffectKind::ModifyGeneratorCost, "generatorId");
  } else if (kind == "alterDirtyTolerance") {
    with_value(UpgradeEffectKind::AlterDirtyTolerance, "resourceId");
  } else if (kind == "grantAutomation") {
    e.kind = UpgradeEffectKind::GrantAutomation;
    e.target_id = require_string(v, "automationId", where);
  } else if (kind == "grantFlag") {
    e.kind = UpgradeEffectKind::GrantFlag;
    e.target_id = require_string(v, "flagId", where);
    e.flag_value = v.find("value") ? v.at("value").bool_value(true) : true;
  } else if (kind == "unlockResource") {
    e.kind = UpgradeEffectKind::UnlockResource;
    e.target_id = require_string(v, "resourceId", where);
  } else if (kind == "unlockGenerator") {
    e.kind = UpgradeEffectKind::UnlockGenerator;
    e.target_id = require_string(v, "generatorId", where);
  } else if (kind == "emitEvent") {
    e.kind = UpgradeEffectKind::EmitEvent;
    e.target_id = require_string(v, "eventId", where);
  } else {
    throw std::runtime_error(where + ": unknown effect kind \"" + kind + "\"");
  }
  return e;
}

UpgradeDefinition parse_upgrade(const json::Value& v) {
  UpgradeDefinition u;
  u.id = require_string(v, "id", "upgrade");
  const std::string where = "upgrade \"" + u.id + "\"";
  u.name = optional_string(v, "name");
  if (const json::Value* cost = v.find("cost")) {
    if (cost->is_array()) {
      for (const auto& c : cost->array()) u.costs.push_back(parse_upgrade_cost(c, where));
    } else {
      u.costs.push_back(parse_upgrade_cost(*cost, where));
    }
  }
  for (const auto& e : array_or_empty(v, "effects")) u.effects.push_back(parse_effect(e, where));
  u.unlock_condition = condition_or_always(v, "unlockCondition");
  u.visibility_condition = optional_condition(v, "visibilityCondition");
  for (const auto& p : array_or_empty(v, "prerequisites")) u.prerequisites.push_back(p.string_value());
  if (const json::Value* rep = v.find("repeatable"); rep && rep->is_object()) {
    u.max_purchases = int_or(*rep, "maxPurchases", 1000000, where);
    if (const json::Value* curve = rep->find("effectCurve")) u.effect_curve = formula_from_json(*curve);
  } else {
    u.max_purchases = int_or(v, "maxPurchases", 1, where);
  }
  u.order = int_or(v, "order", 0, where);
  if (u.max_purchases < 1) throw std::runtime_error(where + ": maxPurchases must be >= 1");
  return u;
}

AutomationDefinition parse_automation(const json::Value& v) {
  AutomationDefinition a;
  a.id = require_string(v, "id", "automation");
  const std::string where = "automation \"" + a.id + "\"";
  a.name = optional_string(v, "name");

  const std::string target = require_string(v, "targetType", where);
  if (target == "generator") {
    a.target_type = AutomationTargetType::Generator;
    a.target_id = require_string(v, "targetId", where);
    a.target_enabled = v.find("targetEnabled") ? v.at("targetEnabled").bool_value(true) : true;
  } else if (target == "upgrade") {
    a.target_type = AutomationTargetType::Upgrade;
    a.target_id = require_string(v, "targetId", where);
  } else if (target == "purchaseGenerator") {
    a.target_type = AutomationTargetType::PurchaseGenerator;
    a.target_id = require_string(v, "targetId", where);
    a.target_count = int_or(v, "targetCount", 1, where);
    if (a.target_count < 1) throw std::runtime_error(where + ": targetCount must be >= 1");
  } else if (target == "collectResource") {
    a.target_type = AutomationTargetType::CollectResource;
    a.target_id = require_string(v, "targetId", where);
    if (const json::Value* amt = v.find("targetAmount")) a.target_amount = formula_from_json(*amt);
  } else if (target == "system") {
    a.target_type = AutomationTargetType::System;
    a.target_id = require_string(v, "systemTargetId", where);
  } else {
    throw std::runtime_error(where + ": unknown targetType \"" + target + "\"");
  }

  const json::Value& trig = v.at("trigger");
  const std::string kind = require_string(trig, "kind", where);
  if (kind == "interval") {
    a.trigger.kind = AutomationTriggerKind::Interval;
    a.trigger.interval_ms = number_or(trig, "intervalMs", 1000.0, where);
    if (a.trigger.interval_ms <= 0.0) throw std::runtime_error(where + ": intervalMs must be > 0");
  } else if (kind == "resourceThreshold") {
    a.trigger.kind = AutomationTriggerKind::ResourceThreshold;
    a.trigger.resource_id = require_string(trig, "resourceId", where);
    a.trigger.comparator = parse_comparator(require_string(trig, "comparator", where), where);
    a.trigger.threshold = formula_from_json(trig.at("threshold"));
  } else if (kind == "commandQueueEmpty") {
    a.trigger.kind = AutomationTriggerKind::CommandQueueEmpty;
  } else if (kind == "event") {
    a.trigger.kind = AutomationTriggerKind::Event;
    a.trigger.event_id = require_string(trig, "eventId", where);
  } else {
    throw std::runtime_error(where + ": unknown trigger kind \"" + kind + "\"");
  }

  a.cooldown_ms = optional_number(v, "cooldownMs", where);
  if (const json::Value* cost = v.find("resourceCost"); cost && !cost->is_null()) {
    AutomationResourceCost rc;
    rc.resource_id = require_string(*cost, "resourceId", where);
    rc.amount = formula_from_json(cost->at("rate"));
    a.resource_cost = std::move(rc);
  }
  a.unlock_condition = condition_or_always(v, "unlockCondition");
  a.enabled_by_default = v.find("enabledByDefault") ? v.at("enabledByDefault").bool_value() : false;
  a.order = int_or(v, "order", 0, where);
  return a;
}

std::vector<TransformIO> parse_io(const json::Value& v, const char* key, const std::string& where) {
  std::vector<TransformIO> out;
  for (const auto& e : array_or_empty(v, key)) {
    TransformIO io;
    io.resource_id = require_string(e, "resourceId", where);
    io.amount = formula_from_json(e.at("amount"));
    out.push_back(std::move(io));
  }
  return out;
}

TransformDefinition parse_transform(const json::Value& v) {
  TransformDefinition t;
  t.id = require_string(v, "id", "transform");
  const std::string where = "transform \"" + t.id + "\"";
  t.name = optional_string(v, "name");

  const std::string mode = v.find("mode") ? v.at("mode").string_value() : std::string("instant");
  if (mode == "instant") {
    t.mode = TransformMode::Instant;
  } else if (mode == "batch") {
    t.mode = TransformMode::Batch;
  } else {
    throw std::runtime_error(where + ": unknown mode \"" + mode + "\"");
  }
  t.inputs = parse_io(v, "inputs", where);
  t.outputs = parse_io(v, "outputs", where);
  t.duration_ms = number_or(v, "durationMs", 0.0, where);
  if (t.duration_ms < 0.0) throw std::runtime_error(where + ": durationMs must be >= 0");
  t.cooldown_ms = optional_number(v, "cooldownMs", where);

  if (const json::Value* trig = v.find("trigger")) {
    const std::string kind = require_string(*trig, "kind", where);
    if (kind == "manual") {
      t.trigger = TransformTriggerKind::Manual;
    } else if (kind == "condition") {
      t.trigger = TransformTriggerKind::Condition;
      t.trigger_condition = condition_from_json(trig->at("condition"));
    } else if (kind == "event") {
      t.trigger = TransformTriggerKind::Event;
      t.trigger_event_id = require_string(*trig, "eventId", where);
    } else {
      throw std::runtime_error(where + ": unknown trigger kind \"" + kind + "\"");
    }
  }
  t.unlock_condition = condition_or_always(v, "unlockCondition");
  if (const json::Value* safety = v.find("safety"); safety && safety->is_object()) {
    if (safety->find("maxRunsPerTick")) t.max_runs_per_tick = int_or(*safety, "maxRunsPerTick", 0, where);
    if (safety->find("maxOutstandingBatches")) {
      t.max_outstanding_batches = int_or(*safety, "maxOutstandingBatches", 0, where);
    }
  }
  t.order = int_or(v, "order", 0, where);
  return t;
}

std::vector<std::string> string_list(const json::Value& v, const char* key, const std::string& where) {
  std::vector<std::string> out;
  for (const auto& e : array_or_empty(v, key)) {
    if (!e.is_string() || e.as_string()->empty()) {
      throw std::runtime_error(where + ": '" + key + "' entries must be non-empty strings");
    }
    out.push_back(*e.as_string());
  }
  return out;
}

PrestigeLayerDefinition parse_prestige_layer(const json::Value& v) {
  PrestigeLayerDefinition p;
  p.id = require_string(v, "id", "prestige layer");
  const std::string where = "prestige layer \"" + p.id + "\"";
  p.name = optional_string(v, "name");
  p.unlock_condition = condition_or_always(v, "unlockCondition");
  p.reset_targets = string_list(v, "resetTargets", where);
  p.reset_generators = string_list(v, "resetGenerators", where);
  p.reset_upgrades = string_list(v, "resetUpgrades", where);

  const json::Value& reward = v.at("reward");
  p.reward_resource_id = require_string(reward, "resourceId", where);
  p.base_reward = formula_from_json(reward.at("baseReward"));
  if (const json::Value* curve = reward.find("multiplierCurve"); curve && !curve->is_null()) {
    p.multiplier_curve = formula_from_json(*curve);
  }

  for (const auto& e : array_or_empty(v, "retention")) {
    PrestigeRetention r;
    const std::string kind = require_string(e, "kind", where);
    if (kind == "resource") {
      r.kind = PrestigeRetentionKind::Resource;
      r.target_id = require_string(e, "resourceId", where);
      if (const json::Value* amount = e.find("amount"); amount && !amount->is_null()) {
        r.amount = formula_from_json(*amount);
      }
    } else if (kind == "generator") {
      r.kind = PrestigeRetentionKind::Generator;
      r.target_id = require_string(e, "generatorId", where);
    } else if (kind == "upgrade") {
      r.kind = PrestigeRetentionKind::Upgrade;
      r.target_id = require_string(e, "upgradeId", where);
    } else {
      throw std::runtime_error(where + ": unknown retention kind \"" + kind + "\"");
    }
    p.retention.push_back(std::move(r));
  }
  return p;
}

AchievementDefinition parse_achievement(const json::Value& v) {
  AchievementDefinition a;
  a.id = require_string(v, "id", "achievement");
  const std::string where = "achievement \"" + a.id + "\"";
  a.name = optional_string(v, "name");
  a.category = optional_string(v, "category");
  a.tier = optional_string(v, "tier");

  // The track's own threshold is the target unless progress.target is given.
  std::optional<Formula> track_target;
  const json::Value& track = v.at("track");
  const std::string kind = require_string(track, "kind", where);
  if (kind == "resource") {
    a.track = AchievementTrackKind::Resource;
    a.track_id = require_string(track, "resourceId", where);
    if (const json::Value* c = track.find("comparator")) a.comparator = parse_comparator(c->string_value(), where);
    if (const json::Value* t = track.find("threshold")) track_target = formula_from_json(*t);
  } else if (kind == "generator-level") {
    a.track = AchievementTrackKind::GeneratorLevel;
    a.track_id = require_string(track, "generatorId", where);
    if (const json::Value* t = track.find("level")) track_target = formula_from_json(*t);
  } else if (kind == "upgrade-owned") {
    a.track = AchievementTrackKind::UpgradeOwned;
    a.track_id = require_string(track, "upgradeId", where);
    if (const json::Value* t = track.find("purchases")) track_target = formula_from_json(*t);
  } else if (kind == "flag") {
    a.track = AchievementTrackKind::Flag;
    a.track_id = require_string(track, "flagId", where);
  } else {
    throw std::runtime_error(where + ": unknown track kind \"" + kind + "\"");
  }

  const json::Value* progress = v.find("progress");
  const json::Value* target = progress ? progress->find("target") : nullptr;
  if (target && !target->is_null()) {
    a.target = formula_from_json(*target);
  } else if (track_target) {
    a.target = *track_target;
  }
  const std::string mode = progress && progress->find("mode") ? progress->at("mode").string_value() : "oneShot";
  if (mode == "repeatable") {
    a.repeatable = true;
    const json::Value* rep = progress->find("repeatable");
    if (!rep || !rep->is_object()) throw std::runtime_error(where + ": repeatable progress needs a 'repeatable' block");
    a.reset_window = formula_from_json(rep->at("resetWindow"));
    if (rep->find("maxRepeats")) {
      a.max_repeats = int_or(*rep, "maxRepeats", 1, where);
      if (*a.max_repeats < 1) throw std::runtime_error(where + ": maxRepeats must be >= 1");
    }
    if (const json::Value* s = rep->find("rewardScaling")) a.reward_scaling = formula_from_json(*s);
  } else if (mode != "oneShot" && mode != "incremental") {
    throw std::runtime_error(where + ": unknown progress mode \"" + mode + "\"");
  }

  a.unlock_condition = condition_or_always(v, "unlockCondition");
  a.visibility_condition = optional_condition(v, "visibilityCondition");

  if (const json::Value* reward = v.find("reward"); reward && !reward->is_null()) {
    const std::string rk = require_string(*reward, "kind", where);
    if (rk == "grantResource") {
      a.reward = AchievementRewardKind::GrantResource;
      a.reward_target_id = require_string(*reward, "resourceId", where);
      a.reward_amount = formula_from_json(reward->at("amount"));
    } else if (rk == "grantUpgrade") {
      a.reward = AchievementRewardKind::GrantUpgrade;
      a.reward_target_id = require_string(*reward, "upgradeId", where);
    } else if (rk == "grantFlag") {
      a.reward = AchievementRewardKind::GrantFlag;
      a.reward_target_id = require_string(*reward, "flagId", where);
      a.reward_flag_value = reward->find("value") ? reward->at("value").bool_value(true) : true;
    } else if (rk == "unlockAutomation") {
      a.reward = AchievementRewardKind::UnlockAutomation;
      a.reward_target_id = require_string(*reward, "automationId", where);
    } else if (rk == "emitEvent") {
      a.reward = AchievementRewardKind::EmitEvent;
      a.reward_target_id = require_string(*reward, "eventId", where);
    } else {
      throw std::runtime_error(where + ": unknown reward kind \"" + rk + "\"");
    }
  }
  a.on_unlock_events = string_list(v, "onUnlockEvents", where);
  return a;
}

template <typename T, typename IdOf>
void check_unique(const std::vector<T>& items, IdOf id_of, const char* what) {
  std::unordered_set<std::string> seen;
  for (const auto& item : items) {
    if (!seen.insert(id_of(item)).second) {
      throw std::runtime_error(std::string("Duplicate ") + what + " id \"" + id_of(item) + "\"");
    }
  }
}

void validate_references(const ContentPack& pack) {
  std::unordered_set<std::string> resources;
  for (const auto& r : pack.resources) resources.insert(r.definition.id);

  auto need_resource = [&](const std::string& id, const std::string& where) {
    if (!resources.count(id)) throw std::runtime_error(where + " references unknown resource \"" + id + "\"");
  };

  for (const auto& g : pack.generators) {
    const std::string where = "generator \"" + g.id + "\"";
    need_resource(g.currency_id, where);
    for (const auto& p : g.produces) need_resource(p.resource_id, where);
    for (const auto& c : g.consumes) need_resource(c.resource_id, where);
  }
  for (const auto& u : pack.upgrades) {
    const std::string where = "upgrade \"" + u.id + "\"";
    for (const auto& c : u.costs) need_resource(c.currency_id, where);
    for (const auto& p : u.prerequisites) {
      if (!pack.find_upgrade(p)) throw std::runtime_error(where + " requires unknown upgrade \"" + p + "\"");
    }
    for (const auto& e : u.effects) {
      switch (e.kind) {
        case UpgradeEffectKind::ModifyResourceRate:
        case UpgradeEffectKind::ModifyResourceCapacity:
        case UpgradeEffectKind::UnlockResource:
        case UpgradeEffectKind::AlterDirtyTolerance:
          need_resource(e.target_id, where);
          break;
        case UpgradeEffectKind::ModifyGeneratorRate:
        case UpgradeEffectKind::ModifyGeneratorCost:
        case UpgradeEffectKind::UnlockGenerator:
          if (!pack.find_generator(e.target_id)) {
            throw std::runtime_error(where + " references unknown generator \"" + e.target_id + "\"");
          }
          break;
        case UpgradeEffectKind::GrantAutomation:
          if (!pack.find_automation(e.target_id)) {
            throw std::runtime_error(where + " references unknown automation \"" + e.target_id + "\"");
          }
          break;
        case UpgradeEffectKind::GrantFlag:
        case UpgradeEffectKind::EmitEvent:
          break;
      }
    }
  }
  for (const auto& a : pack.automations) {
    const std::string where = "automation \"" + a.id + "\"";
    switch (a.target_type) {
      case AutomationTargetType::Generator:
      case AutomationTargetType::PurchaseGenerator:
        if (!pack.find_generator(a.target_id)) {
          throw std::runtime_error(where + " targets unknown generator \"" + a.target_id + "\"");
        }
        break;
      case AutomationTargetType::Upgrade:
        if (!pack.find_upgrade(a.target_id)) {
          throw std::runtime_error(where + " targets unknown upgrade \"" + a.target_id + "\"");
        }
        break;
      case AutomationTargetType::CollectResource: need_resource(a.target_id, where); break;
      case AutomationTargetType::System: break;
    }
    if (a.trigger.kind == AutomationTriggerKind::ResourceThreshold) need_resource(a.trigger.resource_id, where);
    if (a.resource_cost) need_resource(a.resource_cost->resource_id, where);
  }
  for (const auto& t : pack.transforms) {
    const std::string where = "transform \"" + t.id + "\"";
    for (const auto& io : t.inputs) need_resource(io.resource_id, where);
    for (const auto& io : t.outputs) need_resource(io.resource_id, where);
  }

  auto need_generator = [&](const std::string& id, const std::string& where) {
    if (!pack.find_generator(id)) throw std::runtime_error(where + " references unknown generator \"" + id + "\"");
  };
  auto need_upgrade = [&](const std::string& id, const std::string& where) {
    if (!pack.find_upgrade(id)) throw std::runtime_error(where + " references unknown upgrade \"" + id + "\"");
  };

  for (const auto& p : pack.prestige_layers) {
    const std::string where = "prestige layer \"" + p.id + "\"";
    if (!resources.count(p.count_resource_id())) {
      throw std::runtime_error(where + " needs a resource named \"" + p.count_resource_id() +
                               "\" to count its resets");
    }
    need_resource(p.reward_resource_id, where);
    for (const auto& id : p.reset_targets) need_resource(id, where);
    for (const auto& id : p.reset_generators) need_generator(id, where);
    for (const auto& id : p.reset_upgrades) need_upgrade(id, where);
    for (const auto& r : p.retention) {
      switch (r.kind) {
        case PrestigeRetentionKind::Resource: need_resource(r.target_id, where); break;
        case PrestigeRetentionKind::Generator: need_generator(r.target_id, where); break;
        case PrestigeRetentionKind::Upgrade: need_upgrade(r.target_id, where); break;
      }
    }
  }

  for (const auto& a : pack.achievements) {
    const std::string where = "achievement \"" + a.id + "\"";
    switch (a.track) {
      case AchievementTrackKind::Resource: need_resource(a.track_id, where); break;
      case AchievementTrackKind::GeneratorLevel: need_generator(a.track_id, where); break;
      case AchievementTrackKind::UpgradeOwned: need_upgrade(a.track_id, where); break;
      case AchievementTrackKind::Flag: break;
    }
    switch (a.reward) {
      case AchievementRewardKind::GrantResource: need_resource(a.reward_target_id, where); break;
      case AchievementRewardKind::GrantUpgrade: need_upgrade(a.reward_target_id, where); break;
      case AchievementRewardKind::UnlockAutomation:
        if (!pack.find_automation(a.reward_target_id)) {
          throw std::runtime_error(where + " references unknown automation \"" + a.reward_target_id + "\"");
        }
        break;
      case AchievementRewardKind::None:
      case AchievementRewardKind::GrantFlag:
      case AchievementRewardKind::EmitEvent:
        break;
    }
  }
}

} // namespace

std::vector<ResourceDefinition> ContentPack::resource_definitions() const {
  std::vector<ResourceDefinition> out;
  out.reserve(resources.size());
  for (const auto& r : resources) out.push_back(r.definition);
  return out;
}

ResourceDigest ContentPack::digest() const {
  std::vector<std::string> ids;
  ids.reserve(resources.size());
  for (const auto& r : resources) ids.push_back(r.definition.id);
  return compute_resource_digest(ids);
}

const GeneratorDefinition* ContentPack::find_generator(const std::string& id) const {
  for (const auto& g : generators) {
    if (g.id == id) return &g;
  }
  return nullptr;
}

const UpgradeDefinition* ContentPack::find_upgrade(const std::string& id) const {
  for (const auto& u : upgrades) {
    if (u.id == id) return &u;
  }
  return nullptr;
}

const AutomationDefinition* ContentPack::find_automation(const std::string& id) const {
  for (const auto& a : automations) {
    if (a.id == id) return &a;
  }
  return nullptr;
}

const TransformDefinition* ContentPack::find_transform(const std::string& id) const {
  for (const auto& t : transforms) {
    if (t.id == id) return &t;
  }
  return nullptr;
}

const PrestigeLayerDefinition* ContentPack::find_prestige_layer(const std::string& id) const {
  for (const auto& p : prestige_layers) {
    if (p.id == id) return &p;
  }
  return nullptr;
}

const AchievementDefinition* ContentPack::find_achievement(const std::string& id) const {
  for (const auto& a : achievements) {
    if (a.id == id) return &a;
  }
  return nullptr;
}

ContentPack content_pack_from_json(const json::Value& v) {
  if (!v.is_object()) throw std::runtime_error("Content pack must be a JSON object");
  ContentPack pack;
  pack.id = require_string(v, "id", "content pack");
  pack.version = v.find("version") ? v.at("version").string_value("0.0.0") : std::string("0.0.0");

  for (const auto& r : array_or_empty(v, "resources")) pack.resources.push_back(parse_resource(r));
  for (const auto& g : array_or_empty(v, "generators")) pack.generators.push_back(parse_generator(g));
  for (const auto& u : array_or_empty(v, "upgrades")) pack.upgrades.push_back(parse_upgrade(u));
  for (const auto& a : array_or_empty(v, "automations")) pack.automations.push_back(parse_automation(a));
  for (const auto& t : array_or_empty(v, "transforms")) pack.transforms.push_back(parse_transform(t));
  for (const auto& p : array_or_empty(v, "prestigeLayers")) pack.prestige_layers.push_back(parse_prestige_layer(p));
  for (const auto& a : array_or_empty(v, "achievements")) pack.achievements.push_back(parse_achievement(a));
  for (const auto& e : array_or_empty(v, "eventTypes")) {
    const std::string id = e.is_string() ? e.string_value() : e.at("id").string_value();
    if (id.empty()) throw std::runtime_error("Content event type ids must be non-empty strings");
    pack.event_types.push_back(id);
  }

  check_unique(pack.resources, [](const ResourceContent& r) { return r.definition.id; }, "resource");
  check_unique(pack.generators, [](const GeneratorDefinition& g) { return g.id; }, "generator");
  check_unique(pack.upgrades, [](const UpgradeDefinition& u) { return u.id; }, "upgrade");
  check_unique(pack.automations, [](const AutomationDefinition& a) { return a.id; }, "automation");
  check_unique(pack.transforms, [](const TransformDefinition& t) { return t.id; }, "transform");
  check_unique(pack.prestige_layers, [](const PrestigeLayerDefinition& p) { return p.id; }, "prestige layer");
  check_unique(pack.achievements, [](const AchievementDefinition& a) { return a.id; }, "achievement");
  check_unique(pack.event_types, [](const std::string& s) { return s; }, "event type");

  validate_references(pack);
  return pack;
}

ContentPack load_content_pack(const std::string& path) {
  return content_pack_from_json(json::parse(read_text_file(path)));
}

} // namespace idlecore
