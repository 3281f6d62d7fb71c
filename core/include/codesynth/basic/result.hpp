// codesynth/basic/result.hpp - Value-or-error result for synthesis passes
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace codesynth
{

// ============================================================================
// Error Types
// ============================================================================

/**
 * Failure categories of the synthesis engine.
 *
 * Every composer failure is fatal for the declaration being synthesized:
 * there is no partial result and no retry.
 */
enum class GenErrorKind : uint8_t {
  GenericVariable,      ///< E001
  FunctionType,         ///< E002
  GenericAlias,         ///< E003
  GenericCustomType,    ///< E004
  IllegalTupleArity,    ///< E005
  NoMatchingResolver,   ///< E006
  UnsupportedShape,     ///< E007
  EagerRecursion,       ///< E008
  NoGenerator,          ///< E009
  InvalidInput,         ///< E010
};

/// Stable diagnostic code for an error kind ("E001" .. "E010")
[[nodiscard]] const char * error_code(GenErrorKind kind) noexcept;

/**
 * A single synthesis diagnostic.
 */
struct GenError
{
  GenErrorKind kind = GenErrorKind::UnsupportedShape;
  std::string message;

  [[nodiscard]] const char * code() const noexcept { return error_code(kind); }
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * Result type using std::variant.
 * Holds either a success value T or one GenError.
 */
template <typename T>
class GenResult
{
public:
  using ValueType = T;
  using ErrorType = GenError;

  // Construct with success value
  GenResult(T value) : data_(std::move(value)) {}

  // Construct with an error
  GenResult(GenError error) : data_(std::move(error)) {}

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }

  [[nodiscard]] bool has_error() const { return std::holds_alternative<ErrorType>(data_); }

  explicit operator bool() const { return has_value(); }

  // Get the value (undefined behavior if has_error())
  T & value() & { return std::get<T>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<T>(data_); }
  T && value() && { return std::get<T>(std::move(data_)); }

  // Get the error (undefined behavior if has_value())
  ErrorType & error() & { return std::get<ErrorType>(data_); }
  [[nodiscard]] const ErrorType & error() const & { return std::get<ErrorType>(data_); }
  ErrorType && error() && { return std::get<ErrorType>(std::move(data_)); }

  T * operator->() { return &value(); }
  const T * operator->() const { return &value(); }
  T & operator*() & { return value(); }
  const T & operator*() const & { return value(); }

private:
  std::variant<T, ErrorType> data_;
};

/// Convenience constructor for failures
[[nodiscard]] inline GenError make_error(GenErrorKind kind, std::string message)
{
  return GenError{kind, std::move(message)};
}

}  // namespace codesynth
