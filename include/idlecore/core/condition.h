#pragma once

#include <functional>
#include <string>
#include <vector>

#include "idlecore/core/formula.h"
#include "idlecore/util/json.h"

namespace idlecore {

class Telemetry;

enum class ConditionKind { Always, Never, ResourceThreshold, GeneratorLevel, UpgradeOwned, Flag, AllOf, AnyOf, Not };

enum class Comparator { Gte, Gt, Lte, Lt };

struct Condition {
  ConditionKind kind{ConditionKind::Always};

  // resourceId / generatorId / upgradeId / flagId depending on kind.
  std::string id;

  Comparator comparator{Comparator::Gte};

  // resourceThreshold amount or generatorLevel level. Evaluated with the
  // static context (level 0, time 0).
  Formula amount;

  int required_purchases{1};

  // allOf / anyOf operands; `not` has exactly one.
  std::vector<Condition> children;
};

struct ConditionContext {
  std::function<double(const std::string&)> resource_amount;
  std::function<double(const std::string&)> generator_level;
  std::function<double(const std::string&)> upgrade_purchases;
  std::function<bool(const std::string&)> has_flag;

  int max_depth{100};

  // Receives ConditionDepthExceeded / ConditionEvaluationFailed warnings. May be null.
  Telemetry* telemetry{nullptr};
};

Condition always_condition();

bool compare_values(double left, double right, Comparator c);

// Throws std::runtime_error on malformed input.
Condition condition_from_json(const json::Value& v);

// Never throws for content problems: formula errors and runaway nesting
// evaluate to false and record a warning.
bool evaluate_condition(const Condition& c, const ConditionContext& ctx);

} // namespace idlecore
