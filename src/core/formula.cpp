#include "idlecore/core/formula.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace idlecore {
namespace {

const char* ref_type_name(RefType t) {
  switch (t) {
    case RefType::Variable: return "variable";
    case RefType::Resource: return "resource";
    case RefType::Generator: return "generator";
    case RefType::Upgrade: return "upgrade";
    case RefType::Automation: return "automation";
  }
  return "unknown";
}

double require_number(const json::Value& v, const char* key) {
  const json::Value* f = v.find(key);
  if (!f || !f->is_number()) throw std::runtime_error(std::string("Formula field '") + key + "' must be a number");
  return *f->as_number();
}

double optional_number(const json::Value& v, const char* key, double def) {
  const json::Value* f = v.find(key);
  if (!f) return def;
  if (!f->is_number()) throw std::runtime_error(std::string("Formula field '") + key + "' must be a number");
  return *f->as_number();
}

ExprPtr expr_from_json(const json::Value& v, int depth) {
  if (depth > 256) throw std::runtime_error("Formula expression is nested too deeply");
  if (v.is_number()) {
    auto n = std::make_shared<ExprNode>();
    n->value = *v.as_number();
    return n;
  }
  if (!v.is_object()) throw std::runtime_error("Formula expression node must be an object");

  auto n = std::make_shared<ExprNode>();
  const std::string kind = v.at("kind").string_value();
  if (kind == "literal") {
    n->kind = ExprKind::Literal;
    n->value = require_number(v, "value");
  } else if (kind == "ref") {
    n->kind = ExprKind::Ref;
    const json::Value& target = v.at("target");
    const std::string type = target.at("type").string_value();
    if (type == "variable") {
      n->ref_type = RefType::Variable;
      n->name = target.at("name").string_value();
      if (n->name != "level" && n->name != "time" && n->name != "deltaTime") {
        throw std::runtime_error("Unknown formula variable \"" + n->name + "\"");
      }
    } else {
      if (type == "resource") {
        n->ref_type = RefType::Resource;
      } else if (type == "generator") {
        n->ref_type = RefType::Generator;
      } else if (type == "upgrade") {
        n->ref_type = RefType::Upgrade;
      } else if (type == "automation") {
        n->ref_type = RefType::Automation;
      } else {
        throw std::runtime_error("Unknown formula reference type \"" + type + "\"");
      }
      n->name = target.at("id").string_value();
      if (n->name.empty()) throw std::runtime_error("Formula reference id must be a non-empty string");
    }
  } else if (kind == "binary") {
    n->kind = ExprKind::Binary;
    n->name = v.at("op").string_value();
    static const char* kOps[] = {"add", "sub", "mul", "div", "pow", "min", "max"};
    if (std::none_of(std::begin(kOps), std::end(kOps), [&](const char* op) { return n->name == op; })) {
      throw std::runtime_error("Unknown binary operator \"" + n->name + "\"");
    }
    n->args.push_back(expr_from_json(v.at("left"), depth + 1));
    n->args.push_back(expr_from_json(v.at("right"), depth + 1));
  } else if (kind == "unary") {
    n->kind = ExprKind::Unary;
    n->name = v.at("op").string_value();
    static const char* kOps[] = {"abs", "ceil", "floor", "round", "sqrt", "log10", "ln"};
    if (std::none_of(std::begin(kOps), std::end(kOps), [&](const char* op) { return n->name == op; })) {
      throw std::runtime_error("Unknown unary operator \"" + n->name + "\"");
    }
    n->args.push_back(expr_from_json(v.at("operand"), depth + 1));
  } else if (kind == "call") {
    n->kind = ExprKind::Call;
    n->name = v.at("name").string_value();
    static const char* kFns[] = {"clamp", "lerp", "min3", "max3", "pow10", "root"};
    if (std::none_of(std::begin(kFns), std::end(kFns), [&](const char* fn) { return n->name == fn; })) {
      throw std::runtime_error("Unknown formula function \"" + n->name + "\"");
    }
    for (const auto& a : v.at("args").array()) n->args.push_back(expr_from_json(a, depth + 1));
  } else {
    throw std::runtime_error("Unknown formula expression kind \"" + kind + "\"");
  }
  return n;
}

double resolve_variable(const std::string& name, const FormulaContext& ctx) {
  const std::optional<double>* slot = nullptr;
  if (name == "level") {
    slot = &ctx.level;
  } else if (name == "time") {
    slot = &ctx.time;
  } else if (name == "deltaTime") {
    slot = &ctx.delta_time;
  }
  if (!slot || !slot->has_value()) {
    throw std::runtime_error("Missing variable \"" + name + "\" in formula evaluation context.");
  }
  return **slot;
}

double eval_expr(const ExprNode& n, const FormulaContext& ctx);

std::vector<double> eval_args(const ExprNode& n, std::size_t expected, const FormulaContext& ctx) {
  if (n.args.size() != expected) {
    throw std::runtime_error("Function expects " + std::to_string(expected) + " arguments, received " +
                             std::to_string(n.args.size()) + ".");
  }
  std::vector<double> out;
  out.reserve(expected);
  for (const auto& a : n.args) out.push_back(eval_expr(*a, ctx));
  return out;
}

double eval_expr(const ExprNode& n, const FormulaContext& ctx) {
  switch (n.kind) {
    case ExprKind::Literal: return n.value;
    case ExprKind::Ref: {
      if (n.ref_type == RefType::Variable) return resolve_variable(n.name, ctx);
      std::optional<double> v;
      if (ctx.entity) v = ctx.entity(n.ref_type, n.name);
      if (!v) {
        throw std::runtime_error(std::string("Unknown ") + ref_type_name(n.ref_type) + " \"" + n.name +
                                 "\" in formula evaluation context.");
      }
      return *v;
    }
    case ExprKind::Binary: {
      const double l = eval_expr(*n.args[0], ctx);
      const double r = eval_expr(*n.args[1], ctx);
      if (n.name == "add") return l + r;
      if (n.name == "sub") return l - r;
      if (n.name == "mul") return l * r;
      if (n.name == "div") return l / r;
      if (n.name == "pow") return std::pow(l, r);
      if (n.name == "min") return std::min(l, r);
      return std::max(l, r);
    }
    case ExprKind::Unary: {
      const double x = eval_expr(*n.args[0], ctx);
      if (n.name == "abs") return std::fabs(x);
      if (n.name == "ceil") return std::ceil(x);
      if (n.name == "floor") return std::floor(x);
      if (n.name == "round") return std::floor(x + 0.5);
      if (n.name == "sqrt") return std::sqrt(x);
      if (n.name == "log10") return std::log10(x);
      return std::log(x);
    }
    case ExprKind::Call: {
      if (n.name == "clamp") {
        const auto a = eval_args(n, 3, ctx);
        const double lo = std::min(a[1], a[2]);
        const double hi = std::max(a[1], a[2]);
        return std::min(std::max(a[0], lo), hi);
      }
      if (n.name == "lerp") {
        const auto a = eval_args(n, 3, ctx);
        return a[0] + (a[1] - a[0]) * a[2];
      }
      if (n.name == "min3") {
        const auto a = eval_args(n, 3, ctx);
        return std::min({a[0], a[1], a[2]});
      }
      if (n.name == "max3") {
        const auto a = eval_args(n, 3, ctx);
        return std::max({a[0], a[1], a[2]});
      }
      if (n.name == "pow10") {
        const auto a = eval_args(n, 1, ctx);
        return std::pow(10.0, a[0]);
      }
      const auto a = eval_args(n, 2, ctx);
      return std::pow(a[0], 1.0 / a[1]);
    }
  }
  return 0.0;
}

} // namespace

Formula constant_formula(double value) {
  Formula f;
  f.kind = FormulaKind::Constant;
  f.value = value;
  return f;
}

Formula formula_from_json(const json::Value& v) {
  if (v.is_number()) return constant_formula(*v.as_number());
  if (!v.is_object()) throw std::runtime_error("Formula must be a number or an object");

  Formula f;
  const std::string kind = v.at("kind").string_value();
  if (kind == "constant") {
    f.kind = FormulaKind::Constant;
    f.value = require_number(v, "value");
  } else if (kind == "linear") {
    f.kind = FormulaKind::Linear;
    f.base = require_number(v, "base");
    f.slope = require_number(v, "slope");
  } else if (kind == "exponential") {
    f.kind = FormulaKind::Exponential;
    f.base = require_number(v, "base");
    f.growth = require_number(v, "growth");
    f.offset = optional_number(v, "offset", 0.0);
  } else if (kind == "polynomial") {
    f.kind = FormulaKind::Polynomial;
    for (const auto& c : v.at("coefficients").array()) {
      if (!c.is_number()) throw std::runtime_error("Polynomial coefficients must be numbers");
      f.coefficients.push_back(*c.as_number());
    }
  } else if (kind == "piecewise") {
    f.kind = FormulaKind::Piecewise;
    for (const auto& p : v.at("pieces").array()) {
      PiecewiseSegment seg;
      if (const json::Value* until = p.find("untilLevel"); until && !until->is_null()) {
        if (!until->is_number()) throw std::runtime_error("Piecewise untilLevel must be a number");
        seg.until_level = *until->as_number();
      }
      seg.formula = formula_from_json(p.at("formula"));
      f.pieces.push_back(std::move(seg));
    }
    if (f.pieces.empty()) throw std::runtime_error("Piecewise formula needs at least one piece");
  } else if (kind == "expression") {
    f.kind = FormulaKind::Expression;
    f.expression = expr_from_json(v.at("expression"), 0);
  } else {
    throw std::runtime_error("Unknown formula kind \"" + kind + "\"");
  }
  return f;
}

double evaluate_formula(const Formula& f, const FormulaContext& ctx) {
  switch (f.kind) {
    case FormulaKind::Constant: return f.value;
    case FormulaKind::Linear: return f.base + f.slope * resolve_variable("level", ctx);
    case FormulaKind::Exponential:
      return f.base * std::pow(f.growth, resolve_variable("level", ctx)) + f.offset;
    case FormulaKind::Polynomial: {
      const double level = resolve_variable("level", ctx);
      double total = 0.0;
      for (std::size_t i = 0; i < f.coefficients.size(); ++i) {
        total += f.coefficients[i] * std::pow(level, static_cast<double>(i));
      }
      return total;
    }
    case FormulaKind::Piecewise: {
      const double level = resolve_variable("level", ctx);
      for (const auto& seg : f.pieces) {
        if (!seg.until_level || level < *seg.until_level) return evaluate_formula(seg.formula, ctx);
      }
      return evaluate_formula(f.pieces.back().formula, ctx);
    }
    case FormulaKind::Expression:
      if (!f.expression) throw std::runtime_error("Expression formula has no expression");
      return eval_expr(*f.expression, ctx);
  }
  return 0.0;
}

} // namespace idlecore
