// codesynth/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// This header provides type-safe casting utilities.
// These work with any class hierarchy that implements the `classof`
// static method pattern (expression nodes, pattern nodes).
//
// Usage:
//   if (isa<LambdaExpr>(node)) { ... }
//   auto* lam = cast<LambdaExpr>(node);      // asserts on failure
//   if (auto* app = dyn_cast<ApplicationExpr>(node)) { ... }  // nullptr on failure
//
#pragma once

#include <cassert>
#include <type_traits>

namespace codesynth
{

// ============================================================================
// Type Traits for RTTI Support
// ============================================================================

namespace detail
{

/// Check if T has a classof static method
template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

// ============================================================================
// isa<T> - Type checking
// ============================================================================

/**
 * Check if a node is of type T.
 *
 * @tparam T The target type to check for
 * @param node The node to check (may be nullptr)
 * @return true if node is of type T, false otherwise (including if node is null)
 */
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

/// isa for non-const pointers
template <typename T, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node));
}

// ============================================================================
// cast<T> - Unchecked cast (asserts on failure)
// ============================================================================

/**
 * Cast a node to type T, asserting on failure.
 *
 * @note Use dyn_cast if the node kind has not been checked yet.
 */
template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

// ============================================================================
// dyn_cast<T> - Safe dynamic cast (returns nullptr on failure)
// ============================================================================

template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace codesynth
