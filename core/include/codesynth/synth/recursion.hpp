// codesynth/synth/recursion.hpp - Reference cycles between synthesized declarations
//
// A recursive type yields declarations that reference each other. Under
// strict evaluation a value declaration that reaches itself without passing
// through a function loops on first use, so references closing a cycle are
// deferred through the generator's lambda-breaker.
//
#pragma once

#include <string>
#include <vector>

#include "codesynth/ast/ast_builder.hpp"
#include "codesynth/ast/declaration.hpp"
#include "codesynth/basic/result.hpp"
#include "codesynth/registry/definition.hpp"

namespace codesynth
{

/// A reference from one declaration's body to a declaration on the DFS stack
struct CycleReference
{
  size_t from = 0;     ///< index of the referencing declaration
  std::string target;  ///< name of the referenced declaration
  std::string path;    ///< e.g. "decodeTree -> decodeForest -> decodeTree"
};

/**
 * Find the references that close a cycle.
 *
 * Edges are free local references between the given declarations. A
 * depth-first search from each declaration in order reports every back
 * edge once.
 */
[[nodiscard]] std::vector<CycleReference> find_cycle_references(
  const std::vector<Declaration> & decls);

/**
 * Make recursive declarations safe under strict evaluation.
 *
 * With a lambda-breaker every cycle-closing reference is wrapped through
 * it. Without one, a cycle-closing reference evaluated eagerly (outside any
 * lambda, in a declaration without parameters) fails with
 * GenErrorKind::EagerRecursion; references under lambdas are left as is.
 */
[[nodiscard]] GenResult<std::vector<Declaration>> break_recursion(
  AstBuilder & builder, std::vector<Declaration> decls, const LambdaBreaker * breaker);

}  // namespace codesynth
