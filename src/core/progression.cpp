#include "idlecore/core/progression.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

#include "idlecore/core/event_bus.h"
#include "idlecore/core/resource_state.h"
#include "idlecore/core/sim_context.h"
#include "idlecore/util/sorted_keys.h"

namespace idlecore {
namespace {

double apply_operation(double current, EffectOperation op, double value) {
  switch (op) {
    case EffectOperation::Add: return current + value;
    case EffectOperation::Multiply: return current * value;
    case EffectOperation::Set: return value;
  }
  return current;
}

double lookup_or(const std::unordered_map<std::string, double>& m, const std::string& id, double def) {
  auto it = m.find(id);
  return it == m.end() ? def : it->second;
}

} // namespace

const char* upgrade_status_name(UpgradeStatus s) {
  switch (s) {
    case UpgradeStatus::Locked: return "locked";
    case UpgradeStatus::Available: return "available";
    case UpgradeStatus::Purchased: return "purchased";
  }
  return "locked";
}

ProgressionCoordinator::ProgressionCoordinator(SimulationContext& ctx, const ContentPack& content,
                                               ResourceState& resources)
    : ctx_(ctx), content_(content), resources_(resources) {
  for (const auto& def : content_.generators) {
    GeneratorState g;
    g.id = def.id;
    g.owned = def.initial_level;
    g.enabled = def.enabled_by_default;
    generator_index_.emplace(def.id, generators_.size());
    generators_.push_back(g);
    production_order_.push_back(generators_.size() - 1);
  }
  std::sort(production_order_.begin(), production_order_.end(), [&](std::size_t a, std::size_t b) {
    const auto& da = content_.generators[a];
    const auto& db = content_.generators[b];
    if (da.order != db.order) return da.order < db.order;
    return da.id < db.id;
  });

  for (const auto& def : content_.upgrades) {
    UpgradeState u;
    u.id = def.id;
    upgrade_index_.emplace(def.id, upgrades_.size());
    upgrades_.push_back(u);
  }
  recompute_effects();
  update_unlocks();
}

const GeneratorState* ProgressionCoordinator::generator(const std::string& id) const {
  auto it = generator_index_.find(id);
  return it == generator_index_.end() ? nullptr : &generators_[it->second];
}

const UpgradeState* ProgressionCoordinator::upgrade(const std::string& id) const {
  auto it = upgrade_index_.find(id);
  return it == upgrade_index_.end() ? nullptr : &upgrades_[it->second];
}

bool ProgressionCoordinator::flag(const std::string& id) const {
  auto it = flags_.find(id);
  return it != flags_.end() && it->second;
}

void ProgressionCoordinator::set_flag(const std::string& id, bool value) { flags_[id] = value; }

double ProgressionCoordinator::generator_rate_multiplier(const std::string& id) const {
  return lookup_or(generator_rate_multipliers_, id, 1.0);
}

double ProgressionCoordinator::generator_cost_multiplier(const std::string& id) const {
  return lookup_or(generator_cost_multipliers_, id, 1.0);
}

double ProgressionCoordinator::resource_rate_multiplier(const std::string& id) const {
  return lookup_or(resource_rate_multipliers_, id, 1.0);
}

ConditionContext ProgressionCoordinator::condition_context() const {
  ConditionContext c;
  c.resource_amount = [this](const std::string& id) {
    const auto idx = resources_.find_index(id);
    return idx ? resources_.amount(*idx) : 0.0;
  };
  c.generator_level = [this](const std::string& id) {
    const GeneratorState* g = generator(id);
    return g ? static_cast<double>(g->owned) : 0.0;
  };
  c.upgrade_purchases = [this](const std::string& id) {
    const UpgradeState* u = upgrade(id);
    return u ? static_cast<double>(u->purchases) : 0.0;
  };
  c.has_flag = [this](const std::string& id) { return flag(id); };
  c.max_depth = ctx_.config().limits.max_condition_depth;
  c.telemetry = &ctx_.telemetry();
  return c;
}

FormulaContext ProgressionCoordinator::formula_context(double level, double time_ms, double delta_ms) const {
  FormulaContext fc;
  fc.level = level;
  fc.time = time_ms / 1000.0;
  fc.delta_time = delta_ms / 1000.0;
  fc.entity = [this](RefType type, const std::string& id) -> std::optional<double> {
    switch (type) {
      case RefType::Resource: {
        const auto idx = resources_.find_index(id);
        if (!idx) return std::nullopt;
        return resources_.amount(*idx);
      }
      case RefType::Generator: {
        const GeneratorState* g = generator(id);
        if (!g) return std::nullopt;
        return static_cast<double>(g->owned);
      }
      case RefType::Upgrade: {
        const UpgradeState* u = upgrade(id);
        if (!u) return std::nullopt;
        return static_cast<double>(u->purchases);
      }
      case RefType::Automation:
        if (automation_lookup_) return automation_lookup_(id);
        return std::nullopt;
      case RefType::Variable: break;
    }
    return std::nullopt;
  };
  return fc;
}

double ProgressionCoordinator::evaluate_or_warn(const Formula& f, const FormulaContext& fc,
                                                const std::string& owner) const {
  try {
    const double v = evaluate_formula(f, fc);
    if (std::isfinite(v)) return v;
    json::Object details;
    details["owner"] = std::string(owner);
    details["error"] = std::string("non-finite result");
    ctx_.telemetry().record_warning("FormulaEvaluationFailed", details);
  } catch (const std::exception& e) {
    json::Object details;
    details["owner"] = std::string(owner);
    details["error"] = std::string(e.what());
    ctx_.telemetry().record_warning("FormulaEvaluationFailed", details);
  }
  return std::numeric_limits<double>::quiet_NaN();
}

void ProgressionCoordinator::update_unlocks() {
  const ConditionContext cc = condition_context();

  for (const auto& r : content_.resources) {
    const std::size_t idx = resources_.require_index(r.definition.id);
    if (!resources_.is_unlocked(idx) && r.unlock_condition && evaluate_condition(*r.unlock_condition, cc)) {
      resources_.unlock(idx);
      resources_.grant_visibility(idx);
    }
    if (!resources_.is_visible(idx) && r.visibility_condition && evaluate_condition(*r.visibility_condition, cc)) {
      resources_.grant_visibility(idx);
    }
  }

  for (std::size_t i = 0; i < generators_.size(); ++i) {
    GeneratorState& g = generators_[i];
    const GeneratorDefinition& def = content_.generators[i];
    if (!g.unlocked && evaluate_condition(def.base_unlock, cc)) g.unlocked = true;
    if (!g.visible) {
      g.visible = def.visibility_condition ? evaluate_condition(*def.visibility_condition, cc) : g.unlocked;
    }
  }

  for (std::size_t i = 0; i < upgrades_.size(); ++i) {
    UpgradeState& u = upgrades_[i];
    const UpgradeDefinition& def = content_.upgrades[i];
    if (!u.unlocked) {
      bool prereqs = true;
      for (const auto& p : def.prerequisites) {
        const UpgradeState* ps = upgrade(p);
        if (!ps || ps->purchases <= 0) {
          prereqs = false;
          break;
        }
      }
      if (prereqs && evaluate_condition(def.unlock_condition, cc)) u.unlocked = true;
    }
    if (!u.visible) {
      u.visible = def.visibility_condition ? evaluate_condition(*def.visibility_condition, cc) : u.unlocked;
    }
  }
}

void ProgressionCoordinator::run_production(const TickContext& tick) {
  const double delta_sec = tick.delta_ms / 1000.0;
  if (delta_sec <= 0.0) return;

  for (std::size_t gi : production_order_) {
    const GeneratorState& g = generators_[gi];
    if (g.owned <= 0 || !g.enabled) continue;
    const GeneratorDefinition& def = content_.generators[gi];

    const double effective = g.owned * generator_rate_multiplier(def.id);
    if (!(effective > 0.0)) continue;
    const FormulaContext fc = formula_context(static_cast<double>(g.owned), tick.time_ms, tick.delta_ms);

    struct Flow {
      std::size_t index;
      double per_second;
    };
    std::vector<Flow> consumed;
    std::vector<Flow> produced;
    bool failed = false;

    double ratio = 1.0;
    for (const auto& c : def.consumes) {
      const double rate = evaluate_or_warn(c.rate, fc, def.id);
      if (std::isnan(rate)) {
        failed = true;
        break;
      }
      const double per_second = std::max(0.0, rate) * effective;
      const std::size_t idx = resources_.require_index(c.resource_id);
      const double required = per_second * delta_sec;
      if (required > 0.0) ratio = std::min(ratio, resources_.amount(idx) / required);
      consumed.push_back(Flow{idx, per_second});
    }
    for (const auto& p : def.produces) {
      if (failed) break;
      const double rate = evaluate_or_warn(p.rate, fc, def.id);
      if (std::isnan(rate)) {
        failed = true;
        break;
      }
      const double per_second = std::max(0.0, rate) * effective * resource_rate_multiplier(p.resource_id);
      produced.push_back(Flow{resources_.require_index(p.resource_id), per_second});
    }
    if (failed) continue;

    ratio = std::clamp(ratio, 0.0, 1.0);
    if (ratio <= 0.0) continue;

    for (const auto& c : consumed) {
      const double amount = std::min(c.per_second * delta_sec * ratio, resources_.amount(c.index));
      if (amount > 0.0) resources_.spend_amount(c.index, amount, ResourceSpendContext{"", "production"});
    }
    for (const auto& p : produced) {
      if (p.per_second > 0.0) resources_.apply_income(p.index, p.per_second * ratio);
    }
  }
}

std::optional<GeneratorQuote> ProgressionCoordinator::generator_quote(const std::string& id, int count) const {
  auto it = generator_index_.find(id);
  if (it == generator_index_.end()) return std::nullopt;
  const GeneratorState& g = generators_[it->second];
  const GeneratorDefinition& def = content_.generators[it->second];
  if (!g.unlocked || !g.visible) return std::nullopt;
  if (count < 1 || count > def.max_bulk) return std::nullopt;
  if (def.max_level && g.owned + count > *def.max_level) return std::nullopt;

  const double multiplier = def.base_cost * def.cost_multiplier * generator_cost_multiplier(id);
  double total = 0.0;
  for (int k = 0; k < count; ++k) {
    const FormulaContext fc = formula_context(static_cast<double>(g.owned + k), 0.0, 0.0);
    const double unit = evaluate_or_warn(def.cost_curve, fc, def.id) * multiplier;
    if (!std::isfinite(unit) || unit < 0.0) return std::nullopt;
    total += unit;
  }
  if (!std::isfinite(total)) return std::nullopt;

  GeneratorQuote q;
  q.generator_id = id;
  q.count = count;
  q.costs.push_back(ResourceCost{def.currency_id, total});
  return q;
}

std::optional<UpgradeQuote> ProgressionCoordinator::upgrade_quote(const std::string& id) const {
  auto it = upgrade_index_.find(id);
  if (it == upgrade_index_.end()) return std::nullopt;
  const UpgradeState& u = upgrades_[it->second];
  const UpgradeDefinition& def = content_.upgrades[it->second];

  UpgradeQuote q;
  q.upgrade_id = id;
  if (u.purchases >= def.max_purchases) {
    q.status = UpgradeStatus::Purchased;
  } else if (!u.unlocked) {
    q.status = UpgradeStatus::Locked;
  } else {
    q.status = UpgradeStatus::Available;
  }

  const FormulaContext fc = formula_context(static_cast<double>(u.purchases), 0.0, 0.0);
  for (const auto& c : def.costs) {
    const double amount = evaluate_or_warn(c.cost_curve, fc, def.id) * c.cost_multiplier;
    if (!std::isfinite(amount) || amount < 0.0) return std::nullopt;
    q.costs.push_back(ResourceCost{c.currency_id, amount});
  }
  return q;
}

void ProgressionCoordinator::add_generator_units(const std::string& id, int count) {
  auto it = generator_index_.find(id);
  if (it == generator_index_.end()) throw std::out_of_range("Unknown generator: " + id);
  if (count < 0) throw std::invalid_argument("Generator unit count must be non-negative");
  generators_[it->second].owned += count;
}

void ProgressionCoordinator::record_upgrade_purchase(const std::string& id, EventBus* events) {
  auto it = upgrade_index_.find(id);
  if (it == upgrade_index_.end()) throw std::out_of_range("Unknown upgrade: " + id);
  UpgradeState& u = upgrades_[it->second];
  ++u.purchases;
  recompute_effects();

  if (!events) return;
  for (const auto& e : content_.upgrades[it->second].effects) {
    if (e.kind != UpgradeEffectKind::EmitEvent) continue;
    json::Object payload;
    payload["upgradeId"] = std::string(id);
    payload["eventId"] = std::string(e.target_id);
    payload["purchases"] = static_cast<double>(u.purchases);
    const std::string channel = events->has_event_type(e.target_id) ? e.target_id : std::string("upgrade:event");
    events->publish(channel, json::object(std::move(payload)));
  }
}

bool ProgressionCoordinator::set_generator_enabled(const std::string& id, bool enabled) {
  auto it = generator_index_.find(id);
  if (it == generator_index_.end()) return false;
  generators_[it->second].enabled = enabled;
  return true;
}

bool ProgressionCoordinator::reset_generator(const std::string& id) {
  auto it = generator_index_.find(id);
  if (it == generator_index_.end()) return false;
  GeneratorState& g = generators_[it->second];
  g.owned = content_.generators[it->second].initial_level;
  g.enabled = true;
  g.unlocked = g.owned > 0;
  return true;
}

bool ProgressionCoordinator::reset_upgrade(const std::string& id) {
  auto it = upgrade_index_.find(id);
  if (it == upgrade_index_.end()) return false;
  upgrades_[it->second].purchases = 0;
  recompute_effects();
  return true;
}

const ResourceDefinition& ProgressionCoordinator::base_resource(const std::string& id) const {
  for (const auto& r : content_.resources) {
    if (r.definition.id == id) return r.definition;
  }
  throw std::out_of_range("ResourceUnknownId: " + id);
}

void ProgressionCoordinator::recompute_effects() {
  generator_rate_multipliers_.clear();
  generator_cost_multipliers_.clear();
  resource_rate_multipliers_.clear();
  std::unordered_map<std::string, double> capacity_overrides;
  std::unordered_map<std::string, double> tolerance_overrides;
  std::vector<std::string> granted;

  for (std::size_t i = 0; i < upgrades_.size(); ++i) {
    const UpgradeState& u = upgrades_[i];
    if (u.purchases <= 0) continue;
    const UpgradeDefinition& def = content_.upgrades[i];

    for (const auto& e : def.effects) {
      switch (e.kind) {
        case UpgradeEffectKind::UnlockResource: {
          const std::size_t idx = resources_.require_index(e.target_id);
          resources_.unlock(idx);
          resources_.grant_visibility(idx);
          break;
        }
        case UpgradeEffectKind::UnlockGenerator: {
          auto git = generator_index_.find(e.target_id);
          if (git != generator_index_.end()) {
            generators_[git->second].unlocked = true;
            generators_[git->second].visible = true;
          }
          break;
        }
        case UpgradeEffectKind::GrantAutomation: granted.push_back(e.target_id); break;
        case UpgradeEffectKind::GrantFlag: flags_[e.target_id] = e.flag_value; break;
        default: break;
      }
    }

    const int applications = def.repeatable() ? u.purchases : 1;
    for (int app = 1; app <= applications; ++app) {
      const double level = def.repeatable() ? app : u.purchases;
      const FormulaContext fc = formula_context(level, 0.0, 0.0);
      double curve = 1.0;
      if (def.effect_curve) {
        curve = evaluate_or_warn(*def.effect_curve, fc, def.id);
        if (std::isnan(curve)) continue;
      }

      for (const auto& e : def.effects) {
        std::unordered_map<std::string, double>* target = nullptr;
        switch (e.kind) {
          case UpgradeEffectKind::ModifyGeneratorRate: target = &generator_rate_multipliers_; break;
          case UpgradeEffectKind::ModifyGeneratorCost: target = &generator_cost_multipliers_; break;
          case UpgradeEffectKind::ModifyResourceRate: target = &resource_rate_multipliers_; break;
          case UpgradeEffectKind::ModifyResourceCapacity: target = &capacity_overrides; break;
          case UpgradeEffectKind::AlterDirtyTolerance: target = &tolerance_overrides; break;
          default: break;
        }
        if (!target) continue;

        const double raw = evaluate_or_warn(e.value, fc, def.id);
        if (std::isnan(raw)) continue;
        const double value = raw * curve;

        double current = 1.0;
        if (auto it = target->find(e.target_id); it != target->end()) {
          current = it->second;
        } else if (e.kind == UpgradeEffectKind::ModifyResourceCapacity) {
          current = base_resource(e.target_id).capacity.value_or(std::numeric_limits<double>::infinity());
        } else if (e.kind == UpgradeEffectKind::AlterDirtyTolerance) {
          current = base_resource(e.target_id).dirty_tolerance.value_or(ctx_.config().precision.dirty_epsilon_ceiling);
        }
        (*target)[e.target_id] = apply_operation(current, e.operation, value);
      }
    }
  }

  // Resources some upgrade can touch fall back to their base values once no
  // purchased upgrade overrides them (prestige resets purchases to zero).
  std::set<std::string> capacity_targets;
  std::set<std::string> tolerance_targets;
  for (const auto& def : content_.upgrades) {
    for (const auto& e : def.effects) {
      if (e.kind == UpgradeEffectKind::ModifyResourceCapacity) capacity_targets.insert(e.target_id);
      if (e.kind == UpgradeEffectKind::AlterDirtyTolerance) tolerance_targets.insert(e.target_id);
    }
  }
  for (const auto& id : capacity_targets) {
    if (capacity_overrides.count(id)) continue;
    const std::size_t idx = resources_.require_index(id);
    const double base = base_resource(id).capacity.value_or(std::numeric_limits<double>::infinity());
    if (resources_.capacity(idx) != base) resources_.set_capacity(idx, base);
  }
  for (const auto& id : tolerance_targets) {
    if (tolerance_overrides.count(id)) continue;
    resources_.set_dirty_tolerance(resources_.require_index(id), base_resource(id).dirty_tolerance);
  }
  for (const auto& id : util::sorted_keys(capacity_overrides)) {
    const double cap = capacity_overrides.at(id);
    if (!std::isnan(cap)) resources_.set_capacity(resources_.require_index(id), std::max(0.0, cap));
  }
  for (const auto& id : util::sorted_keys(tolerance_overrides)) {
    const double tol = tolerance_overrides.at(id);
    if (std::isfinite(tol) && tol >= 0.0) resources_.set_dirty_tolerance(resources_.require_index(id), tol);
  }
  if (on_automation_granted_) {
    for (const auto& id : granted) on_automation_granted_(id);
  }
}

json::Value ProgressionCoordinator::export_state() const {
  json::Array gens;
  for (const auto& g : generators_) {
    json::Object o;
    o["id"] = std::string(g.id);
    o["owned"] = static_cast<double>(g.owned);
    o["enabled"] = g.enabled;
    o["unlocked"] = g.unlocked;
    o["visible"] = g.visible;
    gens.push_back(json::object(std::move(o)));
  }
  json::Array ups;
  for (const auto& u : upgrades_) {
    json::Object o;
    o["id"] = std::string(u.id);
    o["purchases"] = static_cast<double>(u.purchases);
    o["unlocked"] = u.unlocked;
    o["visible"] = u.visible;
    ups.push_back(json::object(std::move(o)));
  }
  json::Object flags;
  for (const auto& [id, v] : flags_) flags[id] = v;

  json::Object root;
  root["generators"] = std::move(gens);
  root["upgrades"] = std::move(ups);
  root["flags"] = json::object(std::move(flags));
  return json::object(std::move(root));
}

void ProgressionCoordinator::restore_state(const json::Value& state) {
  if (!state.is_object()) throw std::runtime_error("Progression state must be an object");

  if (const json::Value* gens = state.find("generators")) {
    for (const auto& g : gens->array()) {
      auto it = generator_index_.find(g.at("id").string_value());
      if (it == generator_index_.end()) continue;
      GeneratorState& s = generators_[it->second];
      const std::int64_t owned = g.find("owned") ? g.at("owned").int_value(0) : 0;
      if (owned < 0 || owned > std::numeric_limits<int>::max()) {
        throw std::runtime_error("Generator \"" + s.id + "\" has an owned count out of range");
      }
      s.owned = static_cast<int>(owned);
      if (const json::Value* v = g.find("enabled")) s.enabled = v->bool_value(s.enabled);
      if (const json::Value* v = g.find("unlocked")) s.unlocked = s.unlocked || v->bool_value();
      if (const json::Value* v = g.find("visible")) s.visible = s.visible || v->bool_value();
    }
  }

  if (const json::Value* ups = state.find("upgrades")) {
    for (const auto& u : ups->array()) {
      auto it = upgrade_index_.find(u.at("id").string_value());
      if (it == upgrade_index_.end()) continue;
      UpgradeState& s = upgrades_[it->second];
      const std::int64_t purchases = u.find("purchases") ? u.at("purchases").int_value(0) : 0;
      if (purchases < 0 || purchases > std::numeric_limits<int>::max()) {
        throw std::runtime_error("Upgrade \"" + s.id + "\" has a purchase count out of range");
      }
      s.purchases = static_cast<int>(std::min<std::int64_t>(purchases, content_.upgrades[it->second].max_purchases));
      if (const json::Value* v = u.find("unlocked")) s.unlocked = s.unlocked || v->bool_value();
      if (const json::Value* v = u.find("visible")) s.visible = s.visible || v->bool_value();
    }
  }

  if (const json::Value* flags = state.find("flags"); flags && flags->is_object()) {
    flags_.clear();
    for (const auto& [id, v] : flags->object()) flags_[id] = v.bool_value();
  }

  recompute_effects();
}

} // namespace idlecore
