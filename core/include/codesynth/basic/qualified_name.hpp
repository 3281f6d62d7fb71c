// codesynth/basic/qualified_name.hpp - Fully qualified (module path + name) references
#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace codesynth
{

/**
 * A fully qualified reference: dotted module path plus a name.
 *
 * Every type and value reference handled by the engine is qualified, so no
 * ambiguity from local import aliases can arise. An empty module denotes a
 * local (module-internal) name.
 */
struct QualifiedName
{
  std::string module;  ///< e.g. "Json.Decode"
  std::string name;    ///< e.g. "Decoder"

  QualifiedName() = default;
  QualifiedName(std::string m, std::string n) : module(std::move(m)), name(std::move(n)) {}

  /// Local (unqualified) name
  static QualifiedName local(std::string n) { return QualifiedName({}, std::move(n)); }

  [[nodiscard]] bool is_local() const noexcept { return module.empty(); }

  /// "Module.Name", or just "Name" for local names
  [[nodiscard]] std::string render() const
  {
    if (module.empty()) {
      return name;
    }
    return module + "." + name;
  }

  friend bool operator==(const QualifiedName & a, const QualifiedName & b)
  {
    return a.module == b.module && a.name == b.name;
  }
  friend bool operator!=(const QualifiedName & a, const QualifiedName & b) { return !(a == b); }
  friend bool operator<(const QualifiedName & a, const QualifiedName & b)
  {
    return a.module != b.module ? a.module < b.module : a.name < b.name;
  }
};

/// Hash functor for unordered containers keyed by QualifiedName
struct QualifiedNameHash
{
  size_t operator()(const QualifiedName & q) const noexcept
  {
    const size_t h1 = std::hash<std::string_view>{}(q.module);
    const size_t h2 = std::hash<std::string_view>{}(q.name);
    return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
  }
};

}  // namespace codesynth
