// codesynth/synth/simplifier.cpp - Beta/eta simplification of synthesized code
#include "codesynth/synth/simplifier.hpp"

#include <algorithm>
#include <vector>

#include "codesynth/ast/ast_utils.hpp"
#include "codesynth/basic/casting.hpp"

namespace codesynth
{

namespace
{

const Expr * reduce(AstBuilder & builder, const Expr * expr);

bool all_simple(gsl::span<const Pattern *> params)
{
  return std::all_of(params.begin(), params.end(), [](const Pattern * p) { return is_simple_bind(p); });
}

/// `(f a) b` -> `f a b`
const Expr * flatten(AstBuilder & builder, const ApplicationExpr * app)
{
  const auto * inner = dyn_cast<ApplicationExpr>(app->fn);
  if (!inner) {
    return app;
  }
  std::vector<const Expr *> args(inner->args.begin(), inner->args.end());
  args.insert(args.end(), app->args.begin(), app->args.end());
  return builder.apply(inner->fn, args);
}

const Expr * beta(AstBuilder & builder, const ApplicationExpr * app)
{
  const auto * lam = dyn_cast<LambdaExpr>(app->fn);
  if (!lam || lam->params.size() != app->args.size() || !all_simple(lam->params)) {
    return app;
  }

  Substitution subst;
  for (size_t i = 0; i < lam->params.size(); ++i) {
    subst[cast<VarPattern>(lam->params[i])->name] = app->args[i];
  }
  // Arguments are already simplified; substituting them can expose new
  // redexes in the body, which are reduced here before returning.
  const Expr * body = substitute(builder, lam->body, subst);
  if (body == lam->body) {
    return body;
  }
  return simplify(builder, body);
}

/// Number of trailing parameters passed straight through as trailing arguments
size_t pass_through_count(const LambdaExpr * lam, const ApplicationExpr * app)
{
  size_t count = 0;
  while (count < lam->params.size() && count < app->args.size()) {
    const auto * param = dyn_cast<VarPattern>(lam->params[lam->params.size() - 1 - count]);
    const auto * arg = dyn_cast<ReferenceExpr>(app->args[app->args.size() - 1 - count]);
    if (!param || !arg || !arg->is_local() || arg->name != param->name) {
      break;
    }
    ++count;
  }
  return count;
}

const Expr * eta(AstBuilder & builder, const LambdaExpr * lam)
{
  const auto * app = dyn_cast<ApplicationExpr>(lam->body);
  if (!app) {
    return lam;
  }

  for (size_t k = pass_through_count(lam, app); k > 0; --k) {
    const size_t kept_args = app->args.size() - k;
    const size_t kept_params = lam->params.size() - k;

    // The dropped names must not be needed by what stays.
    NameSet used = free_locals(app->fn);
    for (size_t i = 0; i < kept_args; ++i) {
      for (auto name : free_locals(app->args[i])) {
        used.insert(name);
      }
    }
    bool clash = false;
    for (size_t i = kept_params; i < lam->params.size() && !clash; ++i) {
      clash = used.count(cast<VarPattern>(lam->params[i])->name) > 0;
    }
    if (clash) {
      continue;
    }

    const Expr * fn = builder.apply(
      app->fn, std::vector<const Expr *>(app->args.begin(), app->args.begin() + kept_args));
    if (kept_params == 0) {
      return fn;
    }
    return builder.lambda(
      std::vector<const Pattern *>(lam->params.begin(), lam->params.begin() + kept_params), fn);
  }
  return lam;
}

const Expr * reduce(AstBuilder & builder, const Expr * expr)
{
  if (const auto * app = dyn_cast<ApplicationExpr>(expr)) {
    const Expr * flat = flatten(builder, app);
    if (const auto * flat_app = dyn_cast<ApplicationExpr>(flat)) {
      return beta(builder, flat_app);
    }
    return flat;
  }
  if (const auto * lam = dyn_cast<LambdaExpr>(expr)) {
    return eta(builder, lam);
  }
  return expr;
}

}  // namespace

const Expr * simplify(AstBuilder & builder, const Expr * expr)
{
  if (!expr) {
    return expr;
  }
  const Expr * rebuilt =
    map_children(builder, expr, [&](const Expr * child) { return simplify(builder, child); });
  return reduce(builder, rebuilt);
}

}  // namespace codesynth
