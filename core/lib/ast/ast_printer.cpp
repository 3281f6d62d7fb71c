// codesynth/ast/ast_printer.cpp - Source rendering of synthesized code
#include "codesynth/ast/ast_printer.hpp"

#include <fmt/core.h>

#include <string_view>

#include "codesynth/types/type_utils.hpp"

namespace codesynth
{
namespace
{

constexpr int k_indent_width = 4;

std::string pad(int n) { return std::string(static_cast<size_t>(n), ' '); }

std::string qualified(std::string_view module, std::string_view name)
{
  if (module.empty()) {
    return std::string(name);
  }
  return fmt::format("{}.{}", module, name);
}

std::string escape_string(std::string_view s)
{
  std::string out;
  out.reserve(s.size() + 2);
  out += '"';
  for (const char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
    }
  }
  out += '"';
  return out;
}

std::string render_float(double v)
{
  std::string s = fmt::format("{}", v);
  if (s.find_first_of(".eE") == std::string::npos && s.find_first_of("ni") == std::string::npos) {
    s += ".0";
  }
  return s;
}

bool is_negative_literal(const Expr * e)
{
  if (const auto * i = dyn_cast<IntLiteralExpr>(e)) return i->value < 0;
  if (const auto * f = dyn_cast<FloatLiteralExpr>(e)) return f->value < 0;
  return false;
}

/// Lambdas, operators and case expressions extend as far right as possible.
bool is_open_ended(const Expr * e)
{
  return isa<LambdaExpr>(e) || isa<OperatorExpr>(e) || isa<CaseExpr>(e);
}

bool is_atomic(const Expr * e) { return !isa<ApplicationExpr>(e) && !is_open_ended(e) && !is_negative_literal(e); }

class Printer
{
public:
  std::string expr(const Expr * e, int indent);

private:
  std::string parens(const Expr * e, int indent) { return "(" + expr(e, indent) + ")"; }

  std::string as_argument(const Expr * e, int indent)
  {
    return is_atomic(e) ? expr(e, indent) : parens(e, indent);
  }

  std::string sequence(
    gsl::span<const Expr *> elements, int indent, std::string_view open, std::string_view close)
  {
    if (elements.empty()) {
      return fmt::format("{}{}", open, close);
    }
    std::string out = fmt::format("{} ", open);
    for (size_t i = 0; i < elements.size(); ++i) {
      if (i > 0) out += ", ";
      out += expr(elements[i], indent);
    }
    return out + fmt::format(" {}", close);
  }

  std::string case_of(const CaseExpr * c, int indent);
};

std::string Printer::expr(const Expr * e, int indent)
{
  if (!e) {
    return "<missing>";
  }

  switch (e->get_kind()) {
    case NodeKind::Reference: {
      const auto * r = cast<ReferenceExpr>(e);
      return qualified(r->module, r->name);
    }

    case NodeKind::Application: {
      const auto * a = cast<ApplicationExpr>(e);
      std::string out = is_open_ended(a->fn) ? parens(a->fn, indent) : expr(a->fn, indent);
      for (const auto * arg : a->args) {
        out += " " + as_argument(arg, indent);
      }
      return out;
    }

    case NodeKind::Lambda: {
      const auto * l = cast<LambdaExpr>(e);
      std::string out = "\\";
      for (size_t i = 0; i < l->params.size(); ++i) {
        if (i > 0) out += " ";
        out += render_pattern(l->params[i]);
      }
      return out + " -> " + expr(l->body, indent);
    }

    case NodeKind::Operator: {
      const auto * o = cast<OperatorExpr>(e);
      // Left-associative: a chain of the same operator needs no parens on the left.
      const auto * lhs_op = dyn_cast<OperatorExpr>(o->lhs);
      const bool lhs_parens =
        isa<LambdaExpr>(o->lhs) || isa<CaseExpr>(o->lhs) || (lhs_op && lhs_op->op != o->op);
      std::string lhs = lhs_parens ? parens(o->lhs, indent) : expr(o->lhs, indent);
      std::string rhs = is_open_ended(o->rhs) ? parens(o->rhs, indent) : expr(o->rhs, indent);
      return fmt::format("{} {} {}", lhs, o->op, rhs);
    }

    case NodeKind::Record: {
      const auto * r = cast<RecordExpr>(e);
      if (r->fields.empty()) {
        return "{}";
      }
      std::string out = "{ ";
      for (size_t i = 0; i < r->fields.size(); ++i) {
        if (i > 0) out += ", ";
        out += fmt::format("{} = {}", r->fields[i].name, expr(r->fields[i].value, indent));
      }
      return out + " }";
    }

    case NodeKind::RecordAccess: {
      const auto * a = cast<RecordAccessExpr>(e);
      const bool bare = isa<ReferenceExpr>(a->record) || isa<RecordAccessExpr>(a->record) ||
                        isa<RecordExpr>(a->record);
      return fmt::format(
        "{}.{}", bare ? expr(a->record, indent) : parens(a->record, indent), a->field);
    }

    case NodeKind::RecordAccessFunction:
      return fmt::format(".{}", cast<RecordAccessFunctionExpr>(e)->field);

    case NodeKind::Tuple:
      return sequence(cast<TupleExpr>(e)->elements, indent, "(", ")");

    case NodeKind::List:
      return sequence(cast<ListExpr>(e)->elements, indent, "[", "]");

    case NodeKind::StringLiteral:
      return escape_string(cast<StringLiteralExpr>(e)->value);

    case NodeKind::IntLiteral:
      return std::to_string(cast<IntLiteralExpr>(e)->value);

    case NodeKind::FloatLiteral:
      return render_float(cast<FloatLiteralExpr>(e)->value);

    case NodeKind::Unit:
      return "()";

    case NodeKind::Case:
      return case_of(cast<CaseExpr>(e), indent);

    default:
      return "<unknown>";
  }
}

std::string Printer::case_of(const CaseExpr * c, int indent)
{
  const int branch_indent = indent + k_indent_width;
  const int body_indent = branch_indent + k_indent_width;

  std::string out = fmt::format("case {} of", expr(c->subject, indent));
  for (size_t i = 0; i < c->branches.size(); ++i) {
    const CaseBranch & b = c->branches[i];
    if (i > 0) out += "\n";
    out += fmt::format("\n{}{} ->", pad(branch_indent), render_pattern(b.pattern));
    out += fmt::format("\n{}{}", pad(body_indent), expr(b.body, body_indent));
  }
  return out;
}

}  // namespace

std::string render_expr(const Expr * expr, int indent)
{
  Printer printer;
  return printer.expr(expr, indent);
}

std::string render_pattern(const Pattern * pattern)
{
  if (!pattern) {
    return "<missing>";
  }

  if (const auto * v = dyn_cast<VarPattern>(pattern)) {
    return std::string(v->name);
  }
  if (isa<WildcardPattern>(pattern)) {
    return "_";
  }
  if (isa<UnitPattern>(pattern)) {
    return "()";
  }
  if (const auto * t = dyn_cast<TuplePattern>(pattern)) {
    std::string out = "( ";
    for (size_t i = 0; i < t->elements.size(); ++i) {
      if (i > 0) out += ", ";
      out += render_pattern(t->elements[i]);
    }
    return out + " )";
  }
  if (const auto * c = dyn_cast<ConstructorPattern>(pattern)) {
    std::string out = qualified(c->module, c->name);
    for (const auto * arg : c->args) {
      const auto * nested = dyn_cast<ConstructorPattern>(arg);
      const bool needs_parens = nested && !nested->args.empty();
      out += needs_parens ? " (" + render_pattern(arg) + ")" : " " + render_pattern(arg);
    }
    return out;
  }
  return "<unknown>";
}

std::string render_declaration(const Declaration & decl)
{
  std::string out;
  if (decl.annotation) {
    out += fmt::format("{} : {}\n", decl.name, render_type(decl.annotation));
  }
  out += decl.name;
  for (const auto * p : decl.params) {
    const auto * c = dyn_cast<ConstructorPattern>(p);
    const bool needs_parens = c && !c->args.empty();
    out += needs_parens ? " (" + render_pattern(p) + ")" : " " + render_pattern(p);
  }
  out += fmt::format(" =\n{}{}\n", pad(k_indent_width), render_expr(decl.body, k_indent_width));
  return out;
}

}  // namespace codesynth
