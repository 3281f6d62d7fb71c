// codesynth/ast/ast_builder.cpp - AstBuilder implementation
#include "codesynth/ast/ast_builder.hpp"

namespace codesynth
{

std::string_view AstBuilder::fresh_name(std::string_view base)
{
  std::string candidate(base);
  for (int n = 1; taken_.count(candidate) > 0; ++n) {
    candidate = std::string(base) + std::to_string(n);
  }
  taken_.insert(candidate);
  return ctx_.intern(candidate);
}

const ReferenceExpr * AstBuilder::ref(std::string_view module, std::string_view name)
{
  return ctx_.create<ReferenceExpr>(ctx_.intern(module), ctx_.intern(name));
}

const Expr * AstBuilder::apply(const Expr * fn, const std::vector<const Expr *> & args)
{
  if (args.empty()) {
    return fn;
  }
  return ctx_.create<ApplicationExpr>(fn, ctx_.copy_to_arena(args));
}

const LambdaExpr * AstBuilder::lambda(
  const std::vector<const Pattern *> & params, const Expr * body)
{
  return ctx_.create<LambdaExpr>(ctx_.copy_to_arena(params), body);
}

const OperatorExpr * AstBuilder::op(std::string_view op, const Expr * lhs, const Expr * rhs)
{
  return ctx_.create<OperatorExpr>(ctx_.intern(op), lhs, rhs);
}

const RecordExpr * AstBuilder::record(
  const std::vector<std::pair<std::string_view, const Expr *>> & fields)
{
  auto out = ctx_.allocate_array<RecordField>(fields.size());
  for (size_t i = 0; i < fields.size(); ++i) {
    out[i] = RecordField{ctx_.intern(fields[i].first), fields[i].second};
  }
  return ctx_.create<RecordExpr>(out);
}

const RecordAccessExpr * AstBuilder::access(const Expr * record, std::string_view field)
{
  return ctx_.create<RecordAccessExpr>(record, ctx_.intern(field));
}

const RecordAccessFunctionExpr * AstBuilder::access_function(std::string_view field)
{
  return ctx_.create<RecordAccessFunctionExpr>(ctx_.intern(field));
}

const TupleExpr * AstBuilder::tuple(const std::vector<const Expr *> & elements)
{
  return ctx_.create<TupleExpr>(ctx_.copy_to_arena(elements));
}

const ListExpr * AstBuilder::list(const std::vector<const Expr *> & elements)
{
  return ctx_.create<ListExpr>(ctx_.copy_to_arena(elements));
}

const StringLiteralExpr * AstBuilder::string(std::string_view value)
{
  return ctx_.create<StringLiteralExpr>(ctx_.intern(value));
}

const IntLiteralExpr * AstBuilder::integer(int64_t value)
{
  return ctx_.create<IntLiteralExpr>(value);
}

const FloatLiteralExpr * AstBuilder::floating(double value)
{
  return ctx_.create<FloatLiteralExpr>(value);
}

const UnitExpr * AstBuilder::unit() { return ctx_.create<UnitExpr>(); }

const CaseExpr * AstBuilder::case_of(
  const Expr * subject, const std::vector<CaseBranch> & branches)
{
  return ctx_.create<CaseExpr>(subject, ctx_.copy_to_arena(branches));
}

const VarPattern * AstBuilder::var(std::string_view name)
{
  return ctx_.create<VarPattern>(ctx_.intern(name));
}

const WildcardPattern * AstBuilder::wildcard() { return ctx_.create<WildcardPattern>(); }

const UnitPattern * AstBuilder::unit_pattern() { return ctx_.create<UnitPattern>(); }

const TuplePattern * AstBuilder::tuple_pattern(const std::vector<const Pattern *> & elements)
{
  return ctx_.create<TuplePattern>(ctx_.copy_to_arena(elements));
}

const ConstructorPattern * AstBuilder::ctor_pattern(
  const QualifiedName & ctor, const std::vector<const Pattern *> & args)
{
  return ctx_.create<ConstructorPattern>(
    ctx_.intern(ctor.module), ctx_.intern(ctor.name), ctx_.copy_to_arena(args));
}

}  // namespace codesynth
