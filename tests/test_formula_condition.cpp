#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "idlecore/core/condition.h"
#include "idlecore/core/formula.h"
#include "idlecore/core/telemetry.h"

#define IC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

double at_level(const char* text, double level) {
  idlecore::FormulaContext fc;
  fc.level = level;
  return idlecore::evaluate_formula(idlecore::formula_from_json(idlecore::json::parse(text)), fc);
}

} // namespace

int test_formula_condition() {
  using namespace idlecore;

  // --- Formula kinds ---
  IC_ASSERT(near(at_level("4.5", 9), 4.5));
  IC_ASSERT(near(at_level(R"({"kind":"constant","value":2})", 0), 2.0));
  IC_ASSERT(near(at_level(R"({"kind":"linear","base":1,"slope":2})", 3), 7.0));
  IC_ASSERT(near(at_level(R"({"kind":"exponential","base":10,"growth":2,"offset":1})", 3), 81.0));
  IC_ASSERT(near(at_level(R"({"kind":"exponential","base":10,"growth":1.5})", 0), 10.0));
  IC_ASSERT(near(at_level(R"({"kind":"polynomial","coefficients":[1,0,2]})", 3), 19.0));

  const char* piecewise = R"({"kind":"piecewise","pieces":[
      {"untilLevel": 5, "formula": 1},
      {"untilLevel": 10, "formula": {"kind":"linear","base":0,"slope":1}},
      {"formula": 100}]})";
  IC_ASSERT(near(at_level(piecewise, 0), 1.0));
  IC_ASSERT(near(at_level(piecewise, 4.99), 1.0));
  IC_ASSERT(near(at_level(piecewise, 5), 5.0));
  IC_ASSERT(near(at_level(piecewise, 10), 100.0));

  // --- Expressions ---
  {
    const char* text = R"({"kind":"expression","expression":{
        "kind":"binary","op":"add",
        "left":{"kind":"binary","op":"mul",
                "left":{"kind":"ref","target":{"type":"variable","name":"level"}},
                "right":{"kind":"ref","target":{"type":"resource","id":"energy"}}},
        "right":{"kind":"call","name":"clamp","args":[
                {"kind":"ref","target":{"type":"variable","name":"time"}}, 0, 3]}}})";
    const Formula f = formula_from_json(json::parse(text));
    IC_ASSERT(f.kind == FormulaKind::Expression);

    FormulaContext fc;
    fc.level = 2.0;
    fc.time = 10.0;
    fc.entity = [](RefType t, const std::string& id) -> std::optional<double> {
      if (t == RefType::Resource && id == "energy") return 4.0;
      return std::nullopt;
    };
    IC_ASSERT(near(evaluate_formula(f, fc), 11.0));

    fc.entity = nullptr;
    bool threw = false;
    try {
      evaluate_formula(f, fc);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);
  }
  {
    const char* text = R"({"kind":"expression","expression":{
        "kind":"unary","op":"round","operand":{"kind":"call","name":"root","args":[27, 3]}}})";
    IC_ASSERT(near(at_level(text, 0), 3.0));
    IC_ASSERT(near(at_level(R"({"kind":"expression","expression":{"kind":"call","name":"pow10","args":[2]}})", 0),
                   100.0));
    IC_ASSERT(near(at_level(R"({"kind":"expression","expression":{"kind":"call","name":"lerp","args":[2, 4, 0.5]}})",
                            0),
                   3.0));
  }

  // Missing level.
  {
    bool threw = false;
    try {
      evaluate_formula(formula_from_json(json::parse(R"({"kind":"linear","base":1,"slope":1})")), FormulaContext{});
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("Missing variable") != std::string::npos;
    }
    IC_ASSERT(threw);
  }

  // Wrong arity and malformed definitions.
  {
    bool threw = false;
    try {
      at_level(R"({"kind":"expression","expression":{"kind":"call","name":"clamp","args":[1, 2]}})", 0);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);

    for (const char* bad : {R"({"kind":"sigmoid"})", R"({"kind":"linear","base":1})", R"("ten")",
                            R"({"kind":"piecewise","pieces":[]})",
                            R"({"kind":"expression","expression":{"kind":"binary","op":"mod","left":1,"right":2}})",
                            R"({"kind":"expression","expression":{"kind":"ref","target":{"type":"variable","name":"speed"}}})"}) {
      bool rejected = false;
      try {
        formula_from_json(json::parse(bad));
      } catch (const std::runtime_error&) {
        rejected = true;
      }
      IC_ASSERT(rejected);
    }
  }

  // --- Conditions ---
  std::map<std::string, double> resources = {{"energy", 50.0}};
  std::map<std::string, double> generators = {{"reactor", 3.0}};
  std::map<std::string, double> upgrades = {{"overclock", 1.0}};
  auto lookup = [](const std::map<std::string, double>& m) {
    return [&m](const std::string& id) {
      auto it = m.find(id);
      return it == m.end() ? 0.0 : it->second;
    };
  };

  MemoryTelemetry mem;
  ConditionContext cc;
  cc.resource_amount = lookup(resources);
  cc.generator_level = lookup(generators);
  cc.upgrade_purchases = lookup(upgrades);
  cc.has_flag = [](const std::string& id) { return id == "tutorial-done"; };
  cc.telemetry = &mem;

  auto check = [&](const char* text) { return evaluate_condition(condition_from_json(json::parse(text)), cc); };

  IC_ASSERT(check(R"({"kind":"always"})"));
  IC_ASSERT(!check(R"({"kind":"never"})"));
  IC_ASSERT(check(R"({"kind":"resourceThreshold","resourceId":"energy","comparator":"gte","amount":50})"));
  IC_ASSERT(!check(R"({"kind":"resourceThreshold","resourceId":"energy","comparator":"gt","amount":50})"));
  IC_ASSERT(check(R"({"kind":"resourceThreshold","resourceId":"crystal","comparator":"lt","amount":1})"));
  IC_ASSERT(check(R"({"kind":"generatorLevel","generatorId":"reactor","comparator":"lte","level":3})"));
  IC_ASSERT(check(R"({"kind":"upgradeOwned","upgradeId":"overclock"})"));
  IC_ASSERT(!check(R"({"kind":"upgradeOwned","upgradeId":"overclock","requiredPurchases":2})"));
  IC_ASSERT(check(R"({"kind":"flag","flagId":"tutorial-done"})"));
  IC_ASSERT(check(R"({"kind":"not","condition":{"kind":"flag","flagId":"hard-mode"}})"));
  IC_ASSERT(check(R"({"kind":"allOf","conditions":[{"kind":"always"},
      {"kind":"resourceThreshold","resourceId":"energy","comparator":"gte","amount":10}]})"));
  IC_ASSERT(!check(R"({"kind":"allOf","conditions":[{"kind":"always"},{"kind":"never"}]})"));
  IC_ASSERT(check(R"({"kind":"anyOf","conditions":[{"kind":"never"},{"kind":"always"}]})"));
  IC_ASSERT(check(R"({"kind":"allOf","conditions":[]})"));

  // Thresholds may reference live state.
  IC_ASSERT(check(R"({"kind":"resourceThreshold","resourceId":"energy","comparator":"gte","amount":
      {"kind":"expression","expression":{"kind":"binary","op":"mul",
        "left":{"kind":"ref","target":{"type":"generator","id":"reactor"}},"right":10}}})"));

  // Unresolvable references evaluate to false with a warning.
  IC_ASSERT(!check(R"({"kind":"resourceThreshold","resourceId":"energy","comparator":"gte","amount":
      {"kind":"expression","expression":{"kind":"ref","target":{"type":"automation","id":"auto"}}}})"));
  IC_ASSERT(mem.count(TelemetryKind::Warning, "ConditionEvaluationFailed") == 1);

  // Depth guard.
  const Condition nested = condition_from_json(json::parse(
      R"({"kind":"anyOf","conditions":[{"kind":"anyOf","conditions":[{"kind":"anyOf","conditions":[{"kind":"always"}]}]}]})"));
  cc.max_depth = 3;
  IC_ASSERT(evaluate_condition(nested, cc));
  cc.max_depth = 2;
  IC_ASSERT(!evaluate_condition(nested, cc));
  IC_ASSERT(mem.count(TelemetryKind::Warning, "ConditionDepthExceeded") == 1);

  for (const char* bad : {R"({"kind":"sometimes"})", R"({"kind":"flag","flagId":""})",
                          R"({"kind":"resourceThreshold","resourceId":"energy","comparator":"eq","amount":1})",
                          R"({"kind":"upgradeOwned","upgradeId":"x","requiredPurchases":0})", R"([1])"}) {
    bool rejected = false;
    try {
      condition_from_json(json::parse(bad));
    } catch (const std::runtime_error&) {
      rejected = true;
    }
    IC_ASSERT(rejected);
  }
  return 0;
}
