// codesynth/types/type_utils.hpp - Rendering and comparison of resolved types
#pragma once

#include <string>

#include "codesynth/types/resolved_type.hpp"

namespace codesynth
{

/**
 * Render a type in annotation syntax with qualified names,
 * e.g. `List.List Basics.Int`, `{ name : String.String }`, `( a, b )`.
 *
 * Named types render by name only, so cyclic types terminate.
 */
[[nodiscard]] std::string render_type(const ResolvedType * type);

/**
 * Structural type equivalence.
 *
 * Named types (opaque, custom, alias) compare by qualified name and
 * arguments; a custom type or alias is equivalent to a bare reference
 * (opaque type without arguments) of the same name.
 */
[[nodiscard]] bool types_equivalent(const ResolvedType * a, const ResolvedType * b);

/// Bare annotation referring to a named type: `Opaque(ref)` without arguments
[[nodiscard]] const ResolvedType * reference_to(TypeContext & types, const ResolvedType * named);

/// Follow alias chains to the first non-alias type
[[nodiscard]] const ResolvedType * strip_aliases(const ResolvedType * type);

}  // namespace codesynth
