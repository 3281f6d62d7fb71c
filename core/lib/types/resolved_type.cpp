// codesynth/types/resolved_type.cpp - TypeContext implementation
#include "codesynth/types/resolved_type.hpp"

#include <utility>

namespace codesynth
{

ResolvedType * TypeContext::make(TypeKind kind)
{
  types_.emplace_back();
  ResolvedType & t = types_.back();
  t.kind = kind;
  return &t;
}

const ResolvedType * TypeContext::generic_var(std::string name)
{
  ResolvedType * t = make(TypeKind::GenericVar);
  t->var_name = std::move(name);
  return t;
}

const ResolvedType * TypeContext::function(const ResolvedType * from, const ResolvedType * to)
{
  ResolvedType * t = make(TypeKind::Function);
  t->args = {from, to};
  return t;
}

const ResolvedType * TypeContext::opaque(QualifiedName ref, std::vector<const ResolvedType *> args)
{
  ResolvedType * t = make(TypeKind::Opaque);
  t->ref = std::move(ref);
  t->args = std::move(args);
  return t;
}

const ResolvedType * TypeContext::record(std::vector<TypeField> fields, std::string extension)
{
  ResolvedType * t = make(TypeKind::AnonymousRecord);
  t->fields = std::move(fields);
  t->var_name = std::move(extension);
  return t;
}

const ResolvedType * TypeContext::tuple(std::vector<const ResolvedType *> elements)
{
  ResolvedType * t = make(TypeKind::Tuple);
  t->args = std::move(elements);
  return t;
}

ResolvedType * TypeContext::declare_custom_type(QualifiedName ref, std::vector<std::string> generics)
{
  ResolvedType * t = make(TypeKind::CustomType);
  t->ref = std::move(ref);
  t->generics = std::move(generics);
  return t;
}

void TypeContext::define_constructors(ResolvedType * custom_type, std::vector<TypeConstructor> ctors)
{
  custom_type->constructors = std::move(ctors);
}

ResolvedType * TypeContext::declare_alias(QualifiedName ref, std::vector<std::string> generics)
{
  ResolvedType * t = make(TypeKind::TypeAlias);
  t->ref = std::move(ref);
  t->generics = std::move(generics);
  return t;
}

void TypeContext::define_alias(ResolvedType * alias, const ResolvedType * aliased)
{
  alias->aliased = aliased;
}

const ResolvedType * TypeContext::custom_type(
  QualifiedName ref, std::vector<TypeConstructor> ctors, std::vector<std::string> generics)
{
  ResolvedType * t = declare_custom_type(std::move(ref), std::move(generics));
  define_constructors(t, std::move(ctors));
  return t;
}

const ResolvedType * TypeContext::alias(
  QualifiedName ref, const ResolvedType * aliased, std::vector<std::string> generics)
{
  ResolvedType * t = declare_alias(std::move(ref), std::move(generics));
  define_alias(t, aliased);
  return t;
}

}  // namespace codesynth
