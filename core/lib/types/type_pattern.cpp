// codesynth/types/type_pattern.cpp - TypePattern matching and rebuilding
#include "codesynth/types/type_pattern.hpp"

#include <utility>

namespace codesynth
{

TypePattern TypePattern::hole() { return TypePattern(Kind::Hole); }

TypePattern TypePattern::named(QualifiedName ref, std::vector<TypePattern> args)
{
  TypePattern p(Kind::Named);
  p.ref_ = std::move(ref);
  p.args_ = std::move(args);
  return p;
}

TypePattern TypePattern::function(TypePattern from, TypePattern to)
{
  TypePattern p(Kind::Function);
  p.args_.push_back(std::move(from));
  p.args_.push_back(std::move(to));
  return p;
}

const ResolvedType * TypePattern::match(const ResolvedType * annotation) const
{
  if (!annotation) {
    return nullptr;
  }
  const ResolvedType * child = nullptr;
  if (!match_into(annotation, child)) {
    return nullptr;
  }
  return child ? child : annotation;
}

bool TypePattern::match_into(const ResolvedType * type, const ResolvedType *& child) const
{
  switch (kind_) {
    case Kind::Hole:
      child = type;
      return true;

    case Kind::Named: {
      if (!type->is_named() || type->ref != ref_) {
        return false;
      }
      if (type->kind != TypeKind::Opaque) {
        // Custom types and aliases are only referenced bare.
        return args_.empty();
      }
      if (type->args.size() != args_.size()) {
        return false;
      }
      for (size_t i = 0; i < args_.size(); ++i) {
        if (!args_[i].match_into(type->args[i], child)) {
          return false;
        }
      }
      return true;
    }

    case Kind::Function:
      if (type->kind != TypeKind::Function) {
        return false;
      }
      return args_[0].match_into(type->from(), child) && args_[1].match_into(type->to(), child);
  }
  return false;
}

const ResolvedType * TypePattern::rebuild(TypeContext & types, const ResolvedType * child) const
{
  switch (kind_) {
    case Kind::Hole:
      return child;

    case Kind::Named: {
      std::vector<const ResolvedType *> args;
      args.reserve(args_.size());
      for (const auto & a : args_) {
        args.push_back(a.rebuild(types, child));
      }
      return types.opaque(ref_, std::move(args));
    }

    case Kind::Function:
      return types.function(args_[0].rebuild(types, child), args_[1].rebuild(types, child));
  }
  return child;
}

std::string TypePattern::render() const
{
  switch (kind_) {
    case Kind::Hole:
      return "a";

    case Kind::Named: {
      std::string out = ref_.render();
      for (const auto & a : args_) {
        const bool parens = a.kind_ == Kind::Function || (a.kind_ == Kind::Named && !a.args_.empty());
        out += parens ? " (" + a.render() + ")" : " " + a.render();
      }
      return out;
    }

    case Kind::Function: {
      std::string lhs = args_[0].render();
      if (args_[0].kind_ == Kind::Function) {
        lhs = "(" + lhs + ")";
      }
      return lhs + " -> " + args_[1].render();
    }
  }
  return {};
}

}  // namespace codesynth
