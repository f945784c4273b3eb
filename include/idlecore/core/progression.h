#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "idlecore/core/condition.h"
#include "idlecore/core/content.h"
#include "idlecore/core/formula.h"
#include "idlecore/core/tick.h"
#include "idlecore/util/json.h"

namespace idlecore {

class EventBus;
class ResourceState;
class SimulationContext;

struct GeneratorState {
  std::string id;
  int owned{0};
  bool enabled{true};
  bool unlocked{false};
  bool visible{false};
};

struct UpgradeState {
  std::string id;
  int purchases{0};
  bool unlocked{false};
  bool visible{false};
};

struct ResourceCost {
  std::string resource_id;
  double amount{0.0};
};

struct GeneratorQuote {
  std::string generator_id;
  int count{0};
  std::vector<ResourceCost> costs;
};

enum class UpgradeStatus { Locked, Available, Purchased };

const char* upgrade_status_name(UpgradeStatus s);

struct UpgradeQuote {
  std::string upgrade_id;
  UpgradeStatus status{UpgradeStatus::Locked};
  std::vector<ResourceCost> costs;
};

// Owns generator/upgrade progress and derives everything upgrades change
// (rate and cost multipliers, flags, unlocks). Resource amounts stay in
// ResourceState; this class only reads and spends them.
class ProgressionCoordinator {
 public:
  ProgressionCoordinator(SimulationContext& ctx, const ContentPack& content, ResourceState& resources);

  const ContentPack& content() const { return content_; }

  // Per-step passes, in this order.
  void update_unlocks();
  void run_production(const TickContext& tick);

  // Pure pricing. nullopt when the purchase is not possible at all.
  std::optional<GeneratorQuote> generator_quote(const std::string& id, int count) const;
  std::optional<UpgradeQuote> upgrade_quote(const std::string& id) const;

  // State changes after a successful spend.
  void add_generator_units(const std::string& id, int count);
  void record_upgrade_purchase(const std::string& id, EventBus* events);

  bool set_generator_enabled(const std::string& id, bool enabled);

  // Prestige resets. Generators go back to their initial level, enabled, and
  // unlocked only when that level is above zero; upgrades to zero purchases.
  // False for unknown ids.
  bool reset_generator(const std::string& id);
  bool reset_upgrade(const std::string& id);

  const GeneratorState* generator(const std::string& id) const;
  const UpgradeState* upgrade(const std::string& id) const;

  bool flag(const std::string& id) const;
  void set_flag(const std::string& id, bool value);

  double generator_rate_multiplier(const std::string& id) const;
  double generator_cost_multiplier(const std::string& id) const;
  double resource_rate_multiplier(const std::string& id) const;

  ConditionContext condition_context() const;
  FormulaContext formula_context(double level, double time_ms, double delta_ms) const;

  // NaN (plus a FormulaEvaluationFailed warning naming owner) when the formula
  // throws or yields a non-finite value.
  double evaluate_or_warn(const Formula& f, const FormulaContext& fc, const std::string& owner) const;

  // Called whenever an upgrade grants an automation (including on restore).
  void set_automation_grant_listener(std::function<void(const std::string&)> fn) {
    on_automation_granted_ = std::move(fn);
  }

  // Resolves automation refs in formulas (1 when unlocked, else 0).
  void set_automation_lookup(std::function<std::optional<double>(const std::string&)> fn) {
    automation_lookup_ = std::move(fn);
  }

  // {generators:[...], upgrades:[...], flags:{...}}
  json::Value export_state() const;

  // Applies by id; unknown ids are ignored. Re-derives upgrade effects.
  void restore_state(const json::Value& state);

 private:
  void recompute_effects();
  const ResourceDefinition& base_resource(const std::string& id) const;

  SimulationContext& ctx_;
  const ContentPack& content_;
  ResourceState& resources_;

  // Definition order.
  std::vector<GeneratorState> generators_;
  std::vector<UpgradeState> upgrades_;
  std::unordered_map<std::string, std::size_t> generator_index_;
  std::unordered_map<std::string, std::size_t> upgrade_index_;

  // Generators sorted by (order, id) for production.
  std::vector<std::size_t> production_order_;

  std::map<std::string, bool> flags_;
  std::unordered_map<std::string, double> generator_rate_multipliers_;
  std::unordered_map<std::string, double> generator_cost_multipliers_;
  std::unordered_map<std::string, double> resource_rate_multipliers_;

  std::function<void(const std::string&)> on_automation_granted_;
  std::function<std::optional<double>(const std::string&)> automation_lookup_;
};

} // namespace idlecore
