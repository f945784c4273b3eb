#include "idlecore/core/condition.h"

#include <stdexcept>

#include "idlecore/core/telemetry.h"

namespace idlecore {
namespace {

const char* kind_name(ConditionKind k) {
  switch (k) {
    case ConditionKind::Always: return "always";
    case ConditionKind::Never: return "never";
    case ConditionKind::ResourceThreshold: return "resourceThreshold";
    case ConditionKind::GeneratorLevel: return "generatorLevel";
    case ConditionKind::UpgradeOwned: return "upgradeOwned";
    case ConditionKind::Flag: return "flag";
    case ConditionKind::AllOf: return "allOf";
    case ConditionKind::AnyOf: return "anyOf";
    case ConditionKind::Not: return "not";
  }
  return "unknown";
}

Comparator comparator_from_string(const std::string& s) {
  if (s == "gte") return Comparator::Gte;
  if (s == "gt") return Comparator::Gt;
  if (s == "lte") return Comparator::Lte;
  if (s == "lt") return Comparator::Lt;
  throw std::runtime_error("Unknown condition comparator \"" + s + "\"");
}

bool compare(double left, double right, Comparator c) {
  switch (c) {
    case Comparator::Gte: return left >= right;
    case Comparator::Gt: return left > right;
    case Comparator::Lte: return left <= right;
    case Comparator::Lt: return left < right;
  }
  return false;
}

std::string require_id(const json::Value& v, const char* key) {
  const std::string id = v.at(key).string_value();
  if (id.empty()) throw std::runtime_error(std::string("Condition field '") + key + "' must be a non-empty string");
  return id;
}

FormulaContext static_formula_context(const ConditionContext& ctx) {
  FormulaContext fc;
  fc.level = 0.0;
  fc.time = 0.0;
  fc.delta_time = 0.0;
  fc.entity = [&ctx](RefType type, const std::string& id) -> std::optional<double> {
    switch (type) {
      case RefType::Resource:
        if (ctx.resource_amount) return ctx.resource_amount(id);
        break;
      case RefType::Generator:
        if (ctx.generator_level) return ctx.generator_level(id);
        break;
      case RefType::Upgrade:
        if (ctx.upgrade_purchases) return ctx.upgrade_purchases(id);
        break;
      default:
        break;
    }
    return std::nullopt;
  };
  return fc;
}

void warn(const ConditionContext& ctx, const std::string& event, json::Object details) {
  if (ctx.telemetry) ctx.telemetry->record_warning(event, details);
}

bool evaluate_at(const Condition& c, const ConditionContext& ctx, int depth) {
  if (depth > ctx.max_depth) {
    json::Object details;
    details["kind"] = std::string(kind_name(c.kind));
    details["depth"] = static_cast<double>(depth);
    details["maxDepth"] = static_cast<double>(ctx.max_depth);
    warn(ctx, "ConditionDepthExceeded", std::move(details));
    return false;
  }

  switch (c.kind) {
    case ConditionKind::Always: return true;
    case ConditionKind::Never: return false;
    case ConditionKind::ResourceThreshold:
    case ConditionKind::GeneratorLevel: {
      try {
        const double left = c.kind == ConditionKind::ResourceThreshold
                                ? (ctx.resource_amount ? ctx.resource_amount(c.id) : 0.0)
                                : (ctx.generator_level ? ctx.generator_level(c.id) : 0.0);
        const double right = evaluate_formula(c.amount, static_formula_context(ctx));
        return compare(left, right, c.comparator);
      } catch (const std::exception& e) {
        json::Object details;
        details["kind"] = std::string(kind_name(c.kind));
        details["id"] = std::string(c.id);
        details["error"] = std::string(e.what());
        warn(ctx, "ConditionEvaluationFailed", std::move(details));
        return false;
      }
    }
    case ConditionKind::UpgradeOwned:
      return ctx.upgrade_purchases && ctx.upgrade_purchases(c.id) >= c.required_purchases;
    case ConditionKind::Flag: return ctx.has_flag && ctx.has_flag(c.id);
    case ConditionKind::AllOf:
      for (const auto& child : c.children) {
        if (!evaluate_at(child, ctx, depth + 1)) return false;
      }
      return true;
    case ConditionKind::AnyOf:
      for (const auto& child : c.children) {
        if (evaluate_at(child, ctx, depth + 1)) return true;
      }
      return false;
    case ConditionKind::Not:
      return c.children.empty() ? false : !evaluate_at(c.children.front(), ctx, depth + 1);
  }
  return false;
}

} // namespace

Condition always_condition() { return Condition{}; }

bool compare_values(double left, double right, Comparator c) { return compare(left, right, c); }

Condition condition_from_json(const json::Value& v) {
  if (!v.is_object()) throw std::runtime_error("Condition must be an object");
  Condition c;
  const std::string kind = v.at("kind").string_value();
  if (kind == "always") {
    c.kind = ConditionKind::Always;
  } else if (kind == "never") {
    c.kind = ConditionKind::Never;
  } else if (kind == "resourceThreshold") {
    c.kind = ConditionKind::ResourceThreshold;
    c.id = require_id(v, "resourceId");
    c.comparator = comparator_from_string(v.at("comparator").string_value());
    c.amount = formula_from_json(v.at("amount"));
  } else if (kind == "generatorLevel") {
    c.kind = ConditionKind::GeneratorLevel;
    c.id = require_id(v, "generatorId");
    c.comparator = comparator_from_string(v.at("comparator").string_value());
    c.amount = formula_from_json(v.at("level"));
  } else if (kind == "upgradeOwned") {
    c.kind = ConditionKind::UpgradeOwned;
    c.id = require_id(v, "upgradeId");
    if (const json::Value* n = v.find("requiredPurchases")) {
      c.required_purchases = static_cast<int>(n->int_value(1));
      if (c.required_purchases < 1) throw std::runtime_error("upgradeOwned requiredPurchases must be >= 1");
    }
  } else if (kind == "flag") {
    c.kind = ConditionKind::Flag;
    c.id = require_id(v, "flagId");
  } else if (kind == "allOf" || kind == "anyOf") {
    c.kind = kind == "allOf" ? ConditionKind::AllOf : ConditionKind::AnyOf;
    for (const auto& child : v.at("conditions").array()) c.children.push_back(condition_from_json(child));
  } else if (kind == "not") {
    c.kind = ConditionKind::Not;
    c.children.push_back(condition_from_json(v.at("condition")));
  } else {
    throw std::runtime_error("Unknown condition kind \"" + kind + "\"");
  }
  return c;
}

bool evaluate_condition(const Condition& c, const ConditionContext& ctx) { return evaluate_at(c, ctx, 0); }

} // namespace idlecore
