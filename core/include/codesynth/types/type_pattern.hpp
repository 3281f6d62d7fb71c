// codesynth/types/type_pattern.hpp - Search patterns selecting a generator
//
// A TypePattern is the outer shape of the annotations a generator handles,
// e.g. `Json.Decode.Decoder a` or `a -> Json.Encode.Value`. The single hole
// `a` marks the child type the generator is asked to implement.
//
#pragma once

#include <string>
#include <vector>

#include "codesynth/basic/qualified_name.hpp"
#include "codesynth/types/resolved_type.hpp"

namespace codesynth
{

class TypePattern
{
public:
  enum class Kind : uint8_t {
    Hole,      ///< the child type of interest
    Named,     ///< qualified type name applied to sub-patterns
    Function,  ///< `from -> to`
  };

  /// The child position
  static TypePattern hole();

  /// `Module.Name p1 p2 ...`
  static TypePattern named(QualifiedName ref, std::vector<TypePattern> args = {});

  /// `from -> to`
  static TypePattern function(TypePattern from, TypePattern to);

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] const QualifiedName & ref() const noexcept { return ref_; }
  [[nodiscard]] const std::vector<TypePattern> & args() const noexcept { return args_; }

  /**
   * Match an annotation against this pattern.
   *
   * Matching is purely structural (qualified name and arity). Returns the
   * type found at the hole, or nullptr when the annotation does not match.
   * A pattern without a hole yields the annotation itself on success.
   */
  [[nodiscard]] const ResolvedType * match(const ResolvedType * annotation) const;

  /// Build the annotation of this shape with `child` placed at the hole.
  [[nodiscard]] const ResolvedType * rebuild(TypeContext & types, const ResolvedType * child) const;

  /// Pattern text with the hole rendered as `a`
  [[nodiscard]] std::string render() const;

private:
  explicit TypePattern(Kind kind) : kind_(kind) {}

  bool match_into(const ResolvedType * type, const ResolvedType *& child) const;

  Kind kind_;
  QualifiedName ref_;
  std::vector<TypePattern> args_;
};

}  // namespace codesynth
