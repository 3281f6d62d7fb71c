// codesynth/types/resolved_type.hpp - Resolved structural type descriptions
//
// Normalized, fully-qualified description of the type a generator is asked
// to implement. Produced by the host from source annotations; the engine
// only reads it.
//
#pragma once

#include <cstdint>
#include <deque>
#include <memory_resource>
#include <string>
#include <vector>

#include "codesynth/basic/qualified_name.hpp"

namespace codesynth
{

// ============================================================================
// Type Kind
// ============================================================================

/**
 * Kind of resolved type.
 */
enum class TypeKind : uint8_t {
  GenericVar,       ///< unresolved type variable `a`
  Function,         ///< `a -> b`
  Opaque,           ///< primitive-opaque: qualified name + type arguments
  AnonymousRecord,  ///< `{ a : Int, b : String }`
  CustomType,       ///< sum type with constructors
  TypeAlias,        ///< named alias of another type
  Tuple,            ///< `()`, `( a, b )`, `( a, b, c )`, ...
};

struct ResolvedType;

/// One constructor of a custom type
struct TypeConstructor
{
  QualifiedName ref;
  std::vector<const ResolvedType *> args;
};

/// One field of an anonymous record
struct TypeField
{
  std::string name;
  const ResolvedType * type = nullptr;
};

// ============================================================================
// ResolvedType
// ============================================================================

/**
 * Resolved type representation.
 *
 * A single tagged struct: only the members relevant to `kind` are set.
 * Named types (custom types, aliases) may be declared first and completed
 * later through TypeContext, which is how self-referential types form a
 * cyclic graph. All references are fully qualified.
 */
struct ResolvedType
{
  TypeKind kind;

  /// For Opaque/CustomType/TypeAlias: the qualified type name
  QualifiedName ref;

  /// For GenericVar: the variable name.
  /// For AnonymousRecord: extension variable of `{ r | ... }` (empty if closed)
  std::string var_name;

  /// For Opaque: type arguments. For Tuple: elements. For Function: [from, to]
  std::vector<const ResolvedType *> args;

  /// For CustomType/TypeAlias: declared generic parameters
  std::vector<std::string> generics;

  /// For CustomType: constructors in declaration order
  std::vector<TypeConstructor> constructors;

  /// For AnonymousRecord: fields in declaration order
  std::vector<TypeField> fields;

  /// For TypeAlias: the aliased type
  const ResolvedType * aliased = nullptr;

  // ===========================================================================
  // Type Queries
  // ===========================================================================

  [[nodiscard]] bool is_named() const noexcept
  {
    return kind == TypeKind::Opaque || kind == TypeKind::CustomType || kind == TypeKind::TypeAlias;
  }

  [[nodiscard]] bool is_generic_var() const noexcept { return kind == TypeKind::GenericVar; }

  [[nodiscard]] bool is_record() const noexcept { return kind == TypeKind::AnonymousRecord; }

  [[nodiscard]] bool has_generics() const noexcept { return !generics.empty(); }

  /// Function types: argument and result
  [[nodiscard]] const ResolvedType * from() const noexcept
  {
    return args.size() == 2 ? args[0] : nullptr;
  }
  [[nodiscard]] const ResolvedType * to() const noexcept
  {
    return args.size() == 2 ? args[1] : nullptr;
  }
};

// ============================================================================
// Type Context
// ============================================================================

/**
 * Owns resolved types with stable addresses.
 *
 * Types are not interned: two structurally equal types may be distinct
 * objects. Use types_equivalent() for comparisons.
 */
class TypeContext
{
public:
  TypeContext() = default;

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Type Creation
  // ===========================================================================

  const ResolvedType * generic_var(std::string name);
  const ResolvedType * function(const ResolvedType * from, const ResolvedType * to);
  const ResolvedType * opaque(QualifiedName ref, std::vector<const ResolvedType *> args = {});
  const ResolvedType * record(std::vector<TypeField> fields, std::string extension = {});
  const ResolvedType * tuple(std::vector<const ResolvedType *> elements);

  /// Unit `()` as a zero-element tuple
  const ResolvedType * unit() { return tuple({}); }

  // ===========================================================================
  // Named Types (two-phase construction for recursive definitions)
  // ===========================================================================

  /// Declare a custom type; constructors are attached with define_constructors()
  ResolvedType * declare_custom_type(QualifiedName ref, std::vector<std::string> generics = {});

  void define_constructors(ResolvedType * custom_type, std::vector<TypeConstructor> ctors);

  /// Declare an alias; the aliased type is attached with define_alias()
  ResolvedType * declare_alias(QualifiedName ref, std::vector<std::string> generics = {});

  void define_alias(ResolvedType * alias, const ResolvedType * aliased);

  /// One-shot helpers for non-recursive named types
  const ResolvedType * custom_type(
    QualifiedName ref, std::vector<TypeConstructor> ctors, std::vector<std::string> generics = {});
  const ResolvedType * alias(
    QualifiedName ref, const ResolvedType * aliased, std::vector<std::string> generics = {});

  [[nodiscard]] size_t size() const noexcept { return types_.size(); }

private:
  ResolvedType * make(TypeKind kind);

  std::pmr::monotonic_buffer_resource arena_{4096};
  // NOTE: pointers to types are handed out widely; the container must keep
  // element addresses stable.
  std::pmr::deque<ResolvedType> types_{&arena_};
};

}  // namespace codesynth
