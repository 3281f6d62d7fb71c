// codesynth/synth/declaration_normalizer.cpp - Hoisting of lambda parameters
#include "codesynth/synth/declaration_normalizer.hpp"

#include <algorithm>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "codesynth/ast/ast_utils.hpp"
#include "codesynth/basic/casting.hpp"

namespace codesynth
{

Declaration normalize_declaration(AstBuilder & builder, Declaration decl)
{
  const auto * lam = dyn_cast<LambdaExpr>(decl.body);
  if (!lam) {
    return decl;
  }

  if (decl.params.empty()) {
    decl.params.assign(lam->params.begin(), lam->params.end());
    decl.body = lam->body;
    return decl;
  }

  const auto simple = [](const Pattern * p) { return is_simple_bind(p); };
  if (
    decl.params.size() != lam->params.size() ||
    !std::all_of(decl.params.begin(), decl.params.end(), simple) ||
    !std::all_of(lam->params.begin(), lam->params.end(), simple)) {
    return decl;
  }

  std::unordered_map<std::string_view, std::string_view> renames;
  for (size_t i = 0; i < decl.params.size(); ++i) {
    renames.emplace(cast<VarPattern>(lam->params[i])->name, cast<VarPattern>(decl.params[i])->name);
  }
  decl.body = rename_locals(builder, lam->body, renames);
  return decl;
}

}  // namespace codesynth
