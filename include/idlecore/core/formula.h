#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "idlecore/util/json.h"

namespace idlecore {

enum class FormulaKind { Constant, Linear, Exponential, Polynomial, Piecewise, Expression };

enum class ExprKind { Literal, Ref, Binary, Unary, Call };

enum class RefType { Variable, Resource, Generator, Upgrade, Automation };

struct ExprNode;
using ExprPtr = std::shared_ptr<const ExprNode>;

// Expression tree node.
//
// Literal: value.
// Ref:     ref_type + name (variable name or entity id).
// Binary:  name is add|sub|mul|div|pow|min|max, args = {left, right}.
// Unary:   name is abs|ceil|floor|round|sqrt|log10|ln, args = {operand}.
// Call:    name is clamp|lerp|min3|max3|pow10|root, args as given.
struct ExprNode {
  ExprKind kind{ExprKind::Literal};
  double value{0.0};
  RefType ref_type{RefType::Variable};
  std::string name;
  std::vector<ExprPtr> args;
};

struct PiecewiseSegment;

struct Formula {
  FormulaKind kind{FormulaKind::Constant};

  // constant
  double value{0.0};

  // linear: base + slope * level
  // exponential: base * growth^level + offset
  double base{0.0};
  double slope{0.0};
  double growth{1.0};
  double offset{0.0};

  // polynomial: sum(coefficients[i] * level^i)
  std::vector<double> coefficients;

  std::vector<PiecewiseSegment> pieces;

  ExprPtr expression;
};

struct PiecewiseSegment {
  // Applies while level < until_level. The last segment usually has none.
  std::optional<double> until_level;
  Formula formula;
};

struct FormulaContext {
  std::optional<double> level;
  std::optional<double> time;
  std::optional<double> delta_time;

  // Entity lookups for ref nodes. Returning nullopt means "unknown id".
  std::function<std::optional<double>(RefType, const std::string&)> entity;
};

Formula constant_formula(double value);

// Accepts a bare number as a constant. Throws std::runtime_error on malformed input.
Formula formula_from_json(const json::Value& v);

// Throws std::runtime_error for a missing variable, an unknown entity or a
// call with the wrong number of arguments.
double evaluate_formula(const Formula& f, const FormulaContext& ctx);

} // namespace idlecore
