// codesynth/ast/json_visitor.cpp - JSON serialization implementation
//
#include "codesynth/ast/json_visitor.hpp"

#include <nlohmann/json.hpp>
#include <string>

#include "codesynth/ast/ast.hpp"
#include "codesynth/ast/ast_enums.hpp"
#include "codesynth/ast/ast_printer.hpp"
#include "codesynth/basic/casting.hpp"
#include "codesynth/types/type_utils.hpp"

namespace codesynth
{
namespace
{

using nlohmann::json;

// Forward declarations
json j_expr(const Expr * e);
json j_pattern(const Pattern * p);

json j_exprs(gsl::span<const Expr *> es)
{
  json arr = json::array();
  for (const auto * e : es) {
    arr.push_back(j_expr(e));
  }
  return arr;
}

json j_patterns(gsl::span<const Pattern *> ps)
{
  json arr = json::array();
  for (const auto * p : ps) {
    arr.push_back(j_pattern(p));
  }
  return arr;
}

// ============================================================================
// Pattern serialization
// ============================================================================

json j_pattern(const Pattern * p)
{
  if (!p) return json{{"type", "Missing"}};

  json j{{"type", std::string(to_string(p->get_kind()))}};

  if (const auto * v = dyn_cast<VarPattern>(p)) {
    j["name"] = std::string(v->name);
  } else if (const auto * t = dyn_cast<TuplePattern>(p)) {
    j["elements"] = j_patterns(t->elements);
  } else if (const auto * c = dyn_cast<ConstructorPattern>(p)) {
    j["module"] = std::string(c->module);
    j["name"] = std::string(c->name);
    j["args"] = j_patterns(c->args);
  }
  return j;
}

// ============================================================================
// Expression serialization
// ============================================================================

json j_expr(const Expr * e)
{
  if (!e) return json{{"type", "Missing"}};

  json j{{"type", std::string(to_string(e->get_kind()))}};

  switch (e->get_kind()) {
    case NodeKind::Reference: {
      const auto * r = cast<ReferenceExpr>(e);
      j["module"] = std::string(r->module);
      j["name"] = std::string(r->name);
      break;
    }
    case NodeKind::Application: {
      const auto * a = cast<ApplicationExpr>(e);
      j["fn"] = j_expr(a->fn);
      j["args"] = j_exprs(a->args);
      break;
    }
    case NodeKind::Lambda: {
      const auto * l = cast<LambdaExpr>(e);
      j["params"] = j_patterns(l->params);
      j["body"] = j_expr(l->body);
      break;
    }
    case NodeKind::Operator: {
      const auto * o = cast<OperatorExpr>(e);
      j["op"] = std::string(o->op);
      j["lhs"] = j_expr(o->lhs);
      j["rhs"] = j_expr(o->rhs);
      break;
    }
    case NodeKind::Record: {
      json fields = json::array();
      for (const auto & f : cast<RecordExpr>(e)->fields) {
        fields.push_back(json{{"name", std::string(f.name)}, {"value", j_expr(f.value)}});
      }
      j["fields"] = std::move(fields);
      break;
    }
    case NodeKind::RecordAccess: {
      const auto * a = cast<RecordAccessExpr>(e);
      j["record"] = j_expr(a->record);
      j["field"] = std::string(a->field);
      break;
    }
    case NodeKind::RecordAccessFunction:
      j["field"] = std::string(cast<RecordAccessFunctionExpr>(e)->field);
      break;
    case NodeKind::Tuple:
      j["elements"] = j_exprs(cast<TupleExpr>(e)->elements);
      break;
    case NodeKind::List:
      j["elements"] = j_exprs(cast<ListExpr>(e)->elements);
      break;
    case NodeKind::StringLiteral:
      j["value"] = std::string(cast<StringLiteralExpr>(e)->value);
      break;
    case NodeKind::IntLiteral:
      j["value"] = cast<IntLiteralExpr>(e)->value;
      break;
    case NodeKind::FloatLiteral:
      j["value"] = cast<FloatLiteralExpr>(e)->value;
      break;
    case NodeKind::Case: {
      const auto * c = cast<CaseExpr>(e);
      j["subject"] = j_expr(c->subject);
      json branches = json::array();
      for (const auto & b : c->branches) {
        branches.push_back(json{{"pattern", j_pattern(b.pattern)}, {"body", j_expr(b.body)}});
      }
      j["branches"] = std::move(branches);
      break;
    }
    default:
      break;
  }
  return j;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

json to_json(const AstNode * node)
{
  if (!node) return json{{"type", "Missing"}};
  if (const auto * p = dyn_cast<Pattern>(node)) {
    return j_pattern(p);
  }
  return j_expr(cast<Expr>(node));
}

json to_json(const Declaration & decl)
{
  json params = json::array();
  for (const auto * p : decl.params) {
    params.push_back(j_pattern(p));
  }
  return json{
    {"name", decl.name},
    {"annotation", decl.annotation ? json(render_type(decl.annotation)) : json(nullptr)},
    {"params", std::move(params)},
    {"body", j_expr(decl.body)},
    {"source", render_declaration(decl)}};
}

}  // namespace codesynth
