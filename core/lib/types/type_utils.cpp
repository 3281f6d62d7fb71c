// codesynth/types/type_utils.cpp - Rendering and comparison of resolved types
#include "codesynth/types/type_utils.hpp"

#include <fmt/core.h>

namespace codesynth
{

namespace
{

bool needs_parens_as_argument(const ResolvedType * t)
{
  if (!t) return false;
  if (t->kind == TypeKind::Function) return true;
  return t->kind == TypeKind::Opaque && !t->args.empty();
}

std::string render_argument(const ResolvedType * t)
{
  std::string s = render_type(t);
  return needs_parens_as_argument(t) ? "(" + s + ")" : s;
}

bool all_equivalent(
  const std::vector<const ResolvedType *> & a, const std::vector<const ResolvedType *> & b)
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (!types_equivalent(a[i], b[i])) return false;
  }
  return true;
}

}  // namespace

std::string render_type(const ResolvedType * type)
{
  if (!type) {
    return "<missing>";
  }

  switch (type->kind) {
    case TypeKind::GenericVar:
      return type->var_name;

    case TypeKind::Function: {
      const ResolvedType * from = type->from();
      std::string lhs = render_type(from);
      if (from && from->kind == TypeKind::Function) {
        lhs = "(" + lhs + ")";
      }
      return lhs + " -> " + render_type(type->to());
    }

    case TypeKind::Opaque: {
      std::string out = type->ref.render();
      for (const auto * arg : type->args) {
        out += " " + render_argument(arg);
      }
      return out;
    }

    case TypeKind::CustomType:
    case TypeKind::TypeAlias: {
      std::string out = type->ref.render();
      for (const auto & g : type->generics) {
        out += " " + g;
      }
      return out;
    }

    case TypeKind::AnonymousRecord: {
      if (type->fields.empty()) {
        return type->var_name.empty() ? "{}" : "{ " + type->var_name + " }";
      }
      std::string out = "{ ";
      if (!type->var_name.empty()) {
        out += type->var_name + " | ";
      }
      for (size_t i = 0; i < type->fields.size(); ++i) {
        if (i > 0) out += ", ";
        out += fmt::format("{} : {}", type->fields[i].name, render_type(type->fields[i].type));
      }
      return out + " }";
    }

    case TypeKind::Tuple: {
      if (type->args.empty()) {
        return "()";
      }
      std::string out = "( ";
      for (size_t i = 0; i < type->args.size(); ++i) {
        if (i > 0) out += ", ";
        out += render_type(type->args[i]);
      }
      return out + " )";
    }
  }
  return "<unknown>";
}

bool types_equivalent(const ResolvedType * a, const ResolvedType * b)
{
  if (a == b) return true;
  if (!a || !b) return false;

  if (a->is_named() && b->is_named()) {
    if (a->ref != b->ref) return false;
    if (a->kind == TypeKind::Opaque && b->kind == TypeKind::Opaque) {
      return all_equivalent(a->args, b->args);
    }
    // Bare name vs full application of the same custom type / alias.
    const ResolvedType * bare = a->kind == TypeKind::Opaque ? a : b;
    if (bare->kind == TypeKind::Opaque) {
      return bare->args.empty();
    }
    return true;
  }

  if (a->kind != b->kind) return false;

  switch (a->kind) {
    case TypeKind::GenericVar:
      return a->var_name == b->var_name;
    case TypeKind::Function:
    case TypeKind::Tuple:
      return all_equivalent(a->args, b->args);
    case TypeKind::AnonymousRecord: {
      if (a->var_name != b->var_name || a->fields.size() != b->fields.size()) return false;
      for (size_t i = 0; i < a->fields.size(); ++i) {
        if (
          a->fields[i].name != b->fields[i].name ||
          !types_equivalent(a->fields[i].type, b->fields[i].type)) {
          return false;
        }
      }
      return true;
    }
    default:
      return false;
  }
}

const ResolvedType * reference_to(TypeContext & types, const ResolvedType * named)
{
  return types.opaque(named->ref);
}

const ResolvedType * strip_aliases(const ResolvedType * type)
{
  while (type && type->kind == TypeKind::TypeAlias && type->aliased) {
    type = type->aliased;
  }
  return type;
}

}  // namespace codesynth
