// codesynth/ast/ast_utils.cpp - Structural queries and rewrites
#include "codesynth/ast/ast_utils.hpp"

#include <algorithm>

#include "codesynth/basic/casting.hpp"

namespace codesynth
{

namespace
{

bool binds(const Pattern * pattern, std::string_view name)
{
  std::vector<std::string_view> bound;
  collect_bound_names(pattern, bound);
  return std::find(bound.begin(), bound.end(), name) != bound.end();
}

bool any_binds(gsl::span<const Pattern *> patterns, std::string_view name)
{
  return std::any_of(
    patterns.begin(), patterns.end(), [&](const Pattern * p) { return binds(p, name); });
}

void collect_free(const Expr * expr, NameSet & bound, NameSet & out);

void collect_free_under(
  const Expr * expr, const std::vector<std::string_view> & new_names, NameSet & bound,
  NameSet & out)
{
  std::vector<std::string_view> added;
  for (auto n : new_names) {
    if (bound.insert(n).second) {
      added.push_back(n);
    }
  }
  collect_free(expr, bound, out);
  for (auto n : added) {
    bound.erase(n);
  }
}

void collect_free(const Expr * expr, NameSet & bound, NameSet & out)
{
  if (!expr) return;

  if (const auto * r = dyn_cast<ReferenceExpr>(expr)) {
    if (r->is_local() && bound.find(r->name) == bound.end()) {
      out.insert(r->name);
    }
    return;
  }

  if (const auto * lam = dyn_cast<LambdaExpr>(expr)) {
    std::vector<std::string_view> names;
    for (const auto * p : lam->params) {
      collect_bound_names(p, names);
    }
    collect_free_under(lam->body, names, bound, out);
    return;
  }

  if (const auto * c = dyn_cast<CaseExpr>(expr)) {
    collect_free(c->subject, bound, out);
    for (const auto & branch : c->branches) {
      std::vector<std::string_view> names;
      collect_bound_names(branch.pattern, names);
      collect_free_under(branch.body, names, bound, out);
    }
    return;
  }

  switch (expr->get_kind()) {
    case NodeKind::Application: {
      const auto * app = cast<ApplicationExpr>(expr);
      collect_free(app->fn, bound, out);
      for (const auto * a : app->args) collect_free(a, bound, out);
      return;
    }
    case NodeKind::Operator: {
      const auto * o = cast<OperatorExpr>(expr);
      collect_free(o->lhs, bound, out);
      collect_free(o->rhs, bound, out);
      return;
    }
    case NodeKind::Record:
      for (const auto & f : cast<RecordExpr>(expr)->fields) collect_free(f.value, bound, out);
      return;
    case NodeKind::RecordAccess:
      collect_free(cast<RecordAccessExpr>(expr)->record, bound, out);
      return;
    case NodeKind::Tuple:
      for (const auto * e : cast<TupleExpr>(expr)->elements) collect_free(e, bound, out);
      return;
    case NodeKind::List:
      for (const auto * e : cast<ListExpr>(expr)->elements) collect_free(e, bound, out);
      return;
    default:
      return;
  }
}

bool eager_reference(const Expr * expr, std::string_view name)
{
  if (!expr) return false;

  if (const auto * r = dyn_cast<ReferenceExpr>(expr)) {
    return r->is_local() && r->name == name;
  }
  if (isa<LambdaExpr>(expr)) {
    // Deferred until the function is called.
    return false;
  }
  if (const auto * c = dyn_cast<CaseExpr>(expr)) {
    if (eager_reference(c->subject, name)) return true;
    return std::any_of(c->branches.begin(), c->branches.end(), [&](const CaseBranch & b) {
      return !binds(b.pattern, name) && eager_reference(b.body, name);
    });
  }

  bool found = false;
  for_each_child(expr, [&](const Expr * child) { found = found || eager_reference(child, name); });
  return found;
}

bool spans_equal(gsl::span<const Expr *> a, gsl::span<const Expr *> b)
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (!structurally_equal(a[i], b[i])) return false;
  }
  return true;
}

bool spans_equal(gsl::span<const Pattern *> a, gsl::span<const Pattern *> b)
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (!structurally_equal(a[i], b[i])) return false;
  }
  return true;
}

}  // namespace

// ============================================================================
// Queries
// ============================================================================

void collect_bound_names(const Pattern * pattern, std::vector<std::string_view> & out)
{
  if (!pattern) return;
  switch (pattern->get_kind()) {
    case NodeKind::VarPattern:
      out.push_back(cast<VarPattern>(pattern)->name);
      return;
    case NodeKind::TuplePattern:
      for (const auto * p : cast<TuplePattern>(pattern)->elements) collect_bound_names(p, out);
      return;
    case NodeKind::ConstructorPattern:
      for (const auto * p : cast<ConstructorPattern>(pattern)->args) collect_bound_names(p, out);
      return;
    default:
      return;
  }
}

bool is_simple_bind(const Pattern * pattern) noexcept { return isa<VarPattern>(pattern); }

NameSet free_locals(const Expr * expr)
{
  NameSet bound;
  NameSet out;
  collect_free(expr, bound, out);
  return out;
}

bool references_local(const Expr * expr, std::string_view name)
{
  const NameSet free = free_locals(expr);
  return free.find(name) != free.end();
}

bool references_local_eagerly(const Expr * expr, std::string_view name)
{
  return eager_reference(expr, name);
}

bool structurally_equal(const Pattern * a, const Pattern * b)
{
  if (a == b) return true;
  if (!a || !b || a->get_kind() != b->get_kind()) return false;

  switch (a->get_kind()) {
    case NodeKind::VarPattern:
      return cast<VarPattern>(a)->name == cast<VarPattern>(b)->name;
    case NodeKind::TuplePattern:
      return spans_equal(cast<TuplePattern>(a)->elements, cast<TuplePattern>(b)->elements);
    case NodeKind::ConstructorPattern: {
      const auto * ca = cast<ConstructorPattern>(a);
      const auto * cb = cast<ConstructorPattern>(b);
      return ca->module == cb->module && ca->name == cb->name && spans_equal(ca->args, cb->args);
    }
    default:
      return true;
  }
}

bool structurally_equal(const Expr * a, const Expr * b)
{
  if (a == b) return true;
  if (!a || !b || a->get_kind() != b->get_kind()) return false;

  switch (a->get_kind()) {
    case NodeKind::Reference: {
      const auto * ra = cast<ReferenceExpr>(a);
      const auto * rb = cast<ReferenceExpr>(b);
      return ra->module == rb->module && ra->name == rb->name;
    }
    case NodeKind::Application: {
      const auto * aa = cast<ApplicationExpr>(a);
      const auto * ab = cast<ApplicationExpr>(b);
      return structurally_equal(aa->fn, ab->fn) && spans_equal(aa->args, ab->args);
    }
    case NodeKind::Lambda: {
      const auto * la = cast<LambdaExpr>(a);
      const auto * lb = cast<LambdaExpr>(b);
      return spans_equal(la->params, lb->params) && structurally_equal(la->body, lb->body);
    }
    case NodeKind::Operator: {
      const auto * oa = cast<OperatorExpr>(a);
      const auto * ob = cast<OperatorExpr>(b);
      return oa->op == ob->op && structurally_equal(oa->lhs, ob->lhs) &&
             structurally_equal(oa->rhs, ob->rhs);
    }
    case NodeKind::Record: {
      const auto & fa = cast<RecordExpr>(a)->fields;
      const auto & fb = cast<RecordExpr>(b)->fields;
      if (fa.size() != fb.size()) return false;
      for (size_t i = 0; i < fa.size(); ++i) {
        if (fa[i].name != fb[i].name || !structurally_equal(fa[i].value, fb[i].value)) {
          return false;
        }
      }
      return true;
    }
    case NodeKind::RecordAccess: {
      const auto * ra = cast<RecordAccessExpr>(a);
      const auto * rb = cast<RecordAccessExpr>(b);
      return ra->field == rb->field && structurally_equal(ra->record, rb->record);
    }
    case NodeKind::RecordAccessFunction:
      return cast<RecordAccessFunctionExpr>(a)->field == cast<RecordAccessFunctionExpr>(b)->field;
    case NodeKind::Tuple:
      return spans_equal(cast<TupleExpr>(a)->elements, cast<TupleExpr>(b)->elements);
    case NodeKind::List:
      return spans_equal(cast<ListExpr>(a)->elements, cast<ListExpr>(b)->elements);
    case NodeKind::StringLiteral:
      return cast<StringLiteralExpr>(a)->value == cast<StringLiteralExpr>(b)->value;
    case NodeKind::IntLiteral:
      return cast<IntLiteralExpr>(a)->value == cast<IntLiteralExpr>(b)->value;
    case NodeKind::FloatLiteral:
      return cast<FloatLiteralExpr>(a)->value == cast<FloatLiteralExpr>(b)->value;
    case NodeKind::Case: {
      const auto * ca = cast<CaseExpr>(a);
      const auto * cb = cast<CaseExpr>(b);
      if (!structurally_equal(ca->subject, cb->subject)) return false;
      if (ca->branches.size() != cb->branches.size()) return false;
      for (size_t i = 0; i < ca->branches.size(); ++i) {
        if (
          !structurally_equal(ca->branches[i].pattern, cb->branches[i].pattern) ||
          !structurally_equal(ca->branches[i].body, cb->branches[i].body)) {
          return false;
        }
      }
      return true;
    }
    default:
      return true;
  }
}

void for_each_child(const Expr * expr, const std::function<void(const Expr *)> & fn)
{
  if (!expr) return;
  switch (expr->get_kind()) {
    case NodeKind::Application: {
      const auto * app = cast<ApplicationExpr>(expr);
      fn(app->fn);
      for (const auto * a : app->args) fn(a);
      return;
    }
    case NodeKind::Lambda:
      fn(cast<LambdaExpr>(expr)->body);
      return;
    case NodeKind::Operator:
      fn(cast<OperatorExpr>(expr)->lhs);
      fn(cast<OperatorExpr>(expr)->rhs);
      return;
    case NodeKind::Record:
      for (const auto & f : cast<RecordExpr>(expr)->fields) fn(f.value);
      return;
    case NodeKind::RecordAccess:
      fn(cast<RecordAccessExpr>(expr)->record);
      return;
    case NodeKind::Tuple:
      for (const auto * e : cast<TupleExpr>(expr)->elements) fn(e);
      return;
    case NodeKind::List:
      for (const auto * e : cast<ListExpr>(expr)->elements) fn(e);
      return;
    case NodeKind::Case: {
      const auto * c = cast<CaseExpr>(expr);
      fn(c->subject);
      for (const auto & b : c->branches) fn(b.body);
      return;
    }
    default:
      return;
  }
}

// ============================================================================
// Rewrites
// ============================================================================

const Expr * map_children(
  AstBuilder & builder, const Expr * expr, const std::function<const Expr *(const Expr *)> & fn)
{
  if (!expr) return expr;

  auto map_list = [&](gsl::span<const Expr *> items, bool & changed) {
    std::vector<const Expr *> out;
    out.reserve(items.size());
    for (const auto * item : items) {
      const Expr * mapped = fn(item);
      changed = changed || mapped != item;
      out.push_back(mapped);
    }
    return out;
  };

  switch (expr->get_kind()) {
    case NodeKind::Application: {
      const auto * app = cast<ApplicationExpr>(expr);
      const Expr * f = fn(app->fn);
      bool changed = f != app->fn;
      auto args = map_list(app->args, changed);
      return changed ? builder.apply(f, args) : expr;
    }
    case NodeKind::Lambda: {
      const auto * lam = cast<LambdaExpr>(expr);
      const Expr * body = fn(lam->body);
      if (body == lam->body) return expr;
      return builder.lambda(std::vector<const Pattern *>(lam->params.begin(), lam->params.end()), body);
    }
    case NodeKind::Operator: {
      const auto * o = cast<OperatorExpr>(expr);
      const Expr * lhs = fn(o->lhs);
      const Expr * rhs = fn(o->rhs);
      if (lhs == o->lhs && rhs == o->rhs) return expr;
      return builder.op(o->op, lhs, rhs);
    }
    case NodeKind::Record: {
      const auto * rec = cast<RecordExpr>(expr);
      bool changed = false;
      std::vector<std::pair<std::string_view, const Expr *>> fields;
      fields.reserve(rec->fields.size());
      for (const auto & f : rec->fields) {
        const Expr * v = fn(f.value);
        changed = changed || v != f.value;
        fields.emplace_back(f.name, v);
      }
      return changed ? builder.record(fields) : expr;
    }
    case NodeKind::RecordAccess: {
      const auto * ra = cast<RecordAccessExpr>(expr);
      const Expr * r = fn(ra->record);
      return r == ra->record ? expr : builder.access(r, ra->field);
    }
    case NodeKind::Tuple: {
      bool changed = false;
      auto elems = map_list(cast<TupleExpr>(expr)->elements, changed);
      return changed ? builder.tuple(elems) : expr;
    }
    case NodeKind::List: {
      bool changed = false;
      auto elems = map_list(cast<ListExpr>(expr)->elements, changed);
      return changed ? builder.list(elems) : expr;
    }
    case NodeKind::Case: {
      const auto * c = cast<CaseExpr>(expr);
      const Expr * subject = fn(c->subject);
      bool changed = subject != c->subject;
      std::vector<CaseBranch> branches;
      branches.reserve(c->branches.size());
      for (const auto & b : c->branches) {
        const Expr * body = fn(b.body);
        changed = changed || body != b.body;
        branches.push_back(CaseBranch{b.pattern, body});
      }
      return changed ? builder.case_of(subject, branches) : expr;
    }
    default:
      return expr;
  }
}

const Expr * substitute(AstBuilder & builder, const Expr * expr, const Substitution & subst)
{
  if (!expr || subst.empty()) return expr;

  if (const auto * r = dyn_cast<ReferenceExpr>(expr)) {
    if (!r->is_local()) return expr;
    auto it = subst.find(r->name);
    return it != subst.end() ? it->second : expr;
  }

  if (const auto * lam = dyn_cast<LambdaExpr>(expr)) {
    Substitution inner;
    for (const auto & [name, value] : subst) {
      if (!any_binds(lam->params, name)) inner.emplace(name, value);
    }
    const Expr * body = substitute(builder, lam->body, inner);
    if (body == lam->body) return expr;
    return builder.lambda(std::vector<const Pattern *>(lam->params.begin(), lam->params.end()), body);
  }

  if (const auto * c = dyn_cast<CaseExpr>(expr)) {
    const Expr * subject = substitute(builder, c->subject, subst);
    bool changed = subject != c->subject;
    std::vector<CaseBranch> branches;
    branches.reserve(c->branches.size());
    for (const auto & b : c->branches) {
      Substitution inner;
      for (const auto & [name, value] : subst) {
        if (!binds(b.pattern, name)) inner.emplace(name, value);
      }
      const Expr * body = substitute(builder, b.body, inner);
      changed = changed || body != b.body;
      branches.push_back(CaseBranch{b.pattern, body});
    }
    return changed ? builder.case_of(subject, branches) : expr;
  }

  return map_children(
    builder, expr, [&](const Expr * child) { return substitute(builder, child, subst); });
}

const Expr * rename_locals(
  AstBuilder & builder, const Expr * expr,
  const std::unordered_map<std::string_view, std::string_view> & renames)
{
  Substitution subst;
  for (const auto & [from, to] : renames) {
    if (from != to) subst.emplace(from, builder.local(to));
  }
  return substitute(builder, expr, subst);
}

}  // namespace codesynth
