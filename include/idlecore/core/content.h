#pragma once

#include <optional>
#include <string>
#include <vector>

#include "idlecore/core/condition.h"
#include "idlecore/core/formula.h"
#include "idlecore/core/resource_state.h"
#include "idlecore/util/json.h"

namespace idlecore {

struct ResourceContent {
  ResourceDefinition definition;
  std::string name;
  // Evaluated every tick while the resource is still locked / hidden.
  std::optional<Condition> unlock_condition;
  std::optional<Condition> visibility_condition;
};

struct ResourceRate {
  std::string resource_id;
  // Per owned generator per second; level = owned count.
  Formula rate;
};

struct GeneratorDefinition {
  std::string id;
  std::string name;

  // Cost of the n-th unit: cost_curve(n) * base_cost * cost_multiplier.
  std::string currency_id;
  double base_cost{1.0};
  double cost_multiplier{1.0};
  Formula cost_curve = constant_formula(1.0);

  std::vector<ResourceRate> produces;
  std::vector<ResourceRate> consumes;

  Condition base_unlock;
  std::optional<Condition> visibility_condition;

  std::optional<int> max_level;
  int max_bulk{100};
  int initial_level{0};
  bool enabled_by_default{true};
  int order{0};
};

struct UpgradeCost {
  std::string currency_id;
  double cost_multiplier{1.0};
  // level = purchases so far.
  Formula cost_curve = constant_formula(1.0);
};

enum class UpgradeEffectKind {
  ModifyResourceRate,
  ModifyResourceCapacity,
  ModifyGeneratorRate,
  ModifyGeneratorCost,
  GrantAutomation,
  GrantFlag,
  UnlockResource,
  UnlockGenerator,
  AlterDirtyTolerance,
  EmitEvent,
};

enum class EffectOperation { Add, Multiply, Set };

struct UpgradeEffect {
  UpgradeEffectKind kind{UpgradeEffectKind::ModifyGeneratorRate};
  // Resource, generator, automation, flag or event id depending on kind.
  std::string target_id;
  EffectOperation operation{EffectOperation::Multiply};
  Formula value = constant_formula(1.0);
  bool flag_value{true};
};

struct UpgradeDefinition {
  std::string id;
  std::string name;
  std::vector<UpgradeCost> costs;
  std::vector<UpgradeEffect> effects;
  Condition unlock_condition;
  std::optional<Condition> visibility_condition;
  std::vector<std::string> prerequisites;
  // 1 for one-shot upgrades; > 1 makes the upgrade repeatable.
  int max_purchases{1};
  // Repeatable upgrades scale each application by effect_curve(application).
  std::optional<Formula> effect_curve;
  int order{0};

  bool repeatable() const { return max_purchases > 1; }
};

enum class AutomationTargetType { Generator, Upgrade, PurchaseGenerator, CollectResource, System };

enum class AutomationTriggerKind { Interval, ResourceThreshold, CommandQueueEmpty, Event };

struct AutomationTrigger {
  AutomationTriggerKind kind{AutomationTriggerKind::Interval};
  double interval_ms{1000.0};
  std::string resource_id;
  Comparator comparator{Comparator::Gte};
  Formula threshold;
  std::string event_id;
};

struct AutomationResourceCost {
  std::string resource_id;
  Formula amount;
};

struct AutomationDefinition {
  std::string id;
  std::string name;

  AutomationTargetType target_type{AutomationTargetType::Generator};
  std::string target_id;
  // generator toggles: the state to set (default true).
  bool target_enabled{true};
  // purchaseGenerator: units per fire.
  int target_count{1};
  // collectResource: amount per fire.
  Formula target_amount = constant_formula(1.0);

  AutomationTrigger trigger;
  std::optional<double> cooldown_ms;
  std::optional<AutomationResourceCost> resource_cost;
  Condition unlock_condition;
  bool enabled_by_default{false};
  int order{0};
};

enum class TransformMode { Instant, Batch };

enum class TransformTriggerKind { Manual, Condition, Event };

struct TransformIO {
  std::string resource_id;
  Formula amount;
};

struct TransformDefinition {
  std::string id;
  std::string name;
  TransformMode mode{TransformMode::Instant};
  std::vector<TransformIO> inputs;
  std::vector<TransformIO> outputs;

  // Batch transforms deliver outputs this long after the run.
  double duration_ms{0.0};
  std::optional<double> cooldown_ms;

  TransformTriggerKind trigger{TransformTriggerKind::Manual};
  Condition trigger_condition;
  std::string trigger_event_id;

  Condition unlock_condition;

  std::optional<int> max_runs_per_tick;
  std::optional<int> max_outstanding_batches;
  int order{0};
};

enum class PrestigeRetentionKind { Resource, Generator, Upgrade };

struct PrestigeRetention {
  PrestigeRetentionKind kind{PrestigeRetentionKind::Resource};
  std::string target_id;
  // Resources only: amount kept, evaluated before the reset. Unset keeps the
  // balance as is.
  std::optional<Formula> amount;
};

struct PrestigeLayerDefinition {
  std::string id;
  std::string name;
  Condition unlock_condition;

  // Resources reset to their start amount; generators to their initial level;
  // upgrades to zero purchases. Retained entries are skipped.
  std::vector<std::string> reset_targets;
  std::vector<std::string> reset_generators;
  std::vector<std::string> reset_upgrades;
  std::vector<PrestigeRetention> retention;

  // Granted before the reset: floor(base_reward * multiplier_curve), >= 0.
  std::string reward_resource_id;
  Formula base_reward;
  std::optional<Formula> multiplier_curve;

  // Every layer counts its resets in a resource named "<id>-prestige-count".
  std::string count_resource_id() const { return id + "-prestige-count"; }
};

enum class AchievementTrackKind { Resource, GeneratorLevel, UpgradeOwned, Flag };

enum class AchievementRewardKind { None, GrantResource, GrantUpgrade, GrantFlag, UnlockAutomation, EmitEvent };

struct AchievementDefinition {
  std::string id;
  std::string name;
  std::string category;
  std::string tier;

  AchievementTrackKind track{AchievementTrackKind::Resource};
  std::string track_id;
  // Resource tracks only; every other track compares with gte.
  Comparator comparator{Comparator::Gte};
  // level = the completion being worked towards (1-based).
  Formula target = constant_formula(1.0);

  bool repeatable{false};
  std::optional<int> max_repeats;
  // Steps before a repeatable achievement can complete again; default 1.
  std::optional<Formula> reset_window;
  std::optional<Formula> reward_scaling;

  Condition unlock_condition;
  std::optional<Condition> visibility_condition;

  AchievementRewardKind reward{AchievementRewardKind::None};
  std::string reward_target_id;
  Formula reward_amount = constant_formula(0.0);
  bool reward_flag_value{true};

  std::vector<std::string> on_unlock_events;
};

struct ContentPack {
  std::string id;
  std::string version;

  std::vector<ResourceContent> resources;
  std::vector<GeneratorDefinition> generators;
  std::vector<UpgradeDefinition> upgrades;
  std::vector<AutomationDefinition> automations;
  std::vector<TransformDefinition> transforms;
  std::vector<PrestigeLayerDefinition> prestige_layers;
  std::vector<AchievementDefinition> achievements;

  // Content-defined runtime event channels.
  std::vector<std::string> event_types;

  std::vector<ResourceDefinition> resource_definitions() const;

  // Digest over the resource ids, in definition order.
  ResourceDigest digest() const;

  const GeneratorDefinition* find_generator(const std::string& id) const;
  const UpgradeDefinition* find_upgrade(const std::string& id) const;
  const AutomationDefinition* find_automation(const std::string& id) const;
  const TransformDefinition* find_transform(const std::string& id) const;
  const PrestigeLayerDefinition* find_prestige_layer(const std::string& id) const;
  const AchievementDefinition* find_achievement(const std::string& id) const;
};

// Parses and cross-checks a pack (duplicate ids, dangling references).
// Throws std::runtime_error with the offending id in the message.
ContentPack content_pack_from_json(const json::Value& v);
ContentPack load_content_pack(const std::string& path);

} // namespace idlecore
