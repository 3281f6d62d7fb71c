// codesynth/ast/declaration.hpp - Top-level named definitions
#pragma once

#include <string>
#include <vector>

#include "codesynth/ast/ast.hpp"
#include "codesynth/types/resolved_type.hpp"

namespace codesynth
{

/**
 * A top-level binding: `name : annotation` / `name p1 p2 = body`.
 *
 * Nodes are owned by the AstContext and types by the TypeContext the
 * declaration was synthesized with.
 */
struct Declaration
{
  std::string name;
  const ResolvedType * annotation = nullptr;
  std::vector<const Pattern *> params;
  const Expr * body = nullptr;
};

}  // namespace codesynth
