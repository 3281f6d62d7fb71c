// codesynth/synth/composer.cpp - Recursive composition of resolvers
#include "codesynth/synth/composer.hpp"

#include <fmt/core.h>

#include <utility>

#include "codesynth/ast/ast_printer.hpp"
#include "codesynth/types/type_utils.hpp"

namespace codesynth
{

namespace
{

const QualifiedName k_unit_type{"Basics", "()"};
const QualifiedName k_pair{"Tuple", "pair"};

bool is_legal_tuple(const ResolvedType * tuple)
{
  const size_t n = tuple->args.size();
  return n == 0 || n == 2 || n == 3;
}

GenError illegal_tuple(const ResolvedType * tuple)
{
  return make_error(
    GenErrorKind::IllegalTupleArity,
    fmt::format(
      "Illegal tuple `{}`: only tuples of two or three elements exist", render_type(tuple)));
}

GenError extensible_record(const ResolvedType * record)
{
  return make_error(
    GenErrorKind::GenericVariable,
    fmt::format(
      "Cannot generate code for the extensible record `{}`: generic types are not supported",
      render_type(record)));
}

}  // namespace

Composer::Composer(
  AstBuilder & builder, TypeContext & types, const ResolvedGenerator & generator,
  const std::vector<KnownProvider> & providers)
: builder_(builder), types_(types), generator_(generator), providers_(providers)
{
}

GenResult<Generated> Composer::generate(bool is_top_level, const ResolvedType * type)
{
  auxiliaries_.clear();
  Body body = compose(is_top_level, type);
  if (!body) {
    return std::move(body).error();
  }
  return Generated{body.value(), std::move(auxiliaries_)};
}

// ============================================================================
// Dispatch
// ============================================================================

Composer::Body Composer::compose(bool is_top_level, const ResolvedType * type)
{
  if (!type) {
    return make_error(GenErrorKind::UnsupportedShape, "missing type");
  }

  if (const Expr * provided = find_provider(is_top_level, type)) {
    return provided;
  }

  switch (type->kind) {
    case TypeKind::GenericVar:
      return make_error(
        GenErrorKind::GenericVariable,
        fmt::format(
          "Cannot generate code for the type variable `{}`: generic types are not supported",
          type->var_name));
    case TypeKind::Function:
      return make_error(
        GenErrorKind::FunctionType,
        fmt::format("Cannot generate code for the function type `{}`", render_type(type)));
    case TypeKind::Tuple:
      if (!is_legal_tuple(type)) {
        return illegal_tuple(type);
      }
      break;
    case TypeKind::AnonymousRecord:
      if (!type->var_name.empty()) {
        return extensible_record(type);
      }
      break;
    default:
      break;
  }

  if (const Expr * universal = try_universal(type)) {
    return universal;
  }

  switch (type->kind) {
    case TypeKind::Opaque:
      return compose_opaque(type);

    case TypeKind::TypeAlias: {
      if (type->has_generics()) {
        return make_error(
          GenErrorKind::GenericAlias,
          fmt::format(
            "Cannot generate code for `{}`: type aliases with type parameters are not supported",
            render_type(type)));
      }
      const ResolvedType * aliased = type->aliased;
      if (aliased && aliased->is_record()) {
        return named(is_top_level, type, [&] { return compose_record(aliased); });
      }
      return unwrap_alias(is_top_level, type);
    }

    case TypeKind::AnonymousRecord:
      return compose_record(type);

    case TypeKind::Tuple:
      return compose_tuple(type);

    case TypeKind::CustomType:
      if (type->has_generics()) {
        return make_error(
          GenErrorKind::GenericCustomType,
          fmt::format(
            "Cannot generate code for `{}`: custom types with type parameters are not supported",
            render_type(type)));
      }
      return named(is_top_level, type, [&] { return compose_custom_type(type); });

    default:
      return make_error(
        GenErrorKind::UnsupportedShape,
        fmt::format("Cannot generate code for `{}`", render_type(type)));
  }
}

const Expr * Composer::find_provider(bool is_top_level, const ResolvedType * type)
{
  for (const auto & provider : providers_) {
    if (provides(provider, type)) {
      return builder_.ref(provider.location);
    }
  }
  if (!is_top_level && self_ && provides(*self_, type)) {
    return builder_.ref(self_->location);
  }
  return nullptr;
}

bool Composer::provides(const KnownProvider & provider, const ResolvedType * type) const
{
  if (provider.generator_id != generator_.id) {
    return false;
  }
  const ResolvedType * child = generator_.pattern.match(provider.declared_type);
  return child && types_equivalent(child, type);
}

const Expr * Composer::try_universal(const ResolvedType * type)
{
  for (const auto & resolver : generator_.resolvers) {
    if (const auto * universal = std::get_if<UniversalResolver>(&resolver)) {
      if (const Expr * e = universal->fn(builder_, type)) {
        return e;
      }
    }
  }
  return nullptr;
}

// ============================================================================
// Shapes
// ============================================================================

Composer::Body Composer::compose_opaque(const ResolvedType * type)
{
  Exprs children;
  children.reserve(type->args.size());
  for (const auto * arg : type->args) {
    Body child = compose(false, arg);
    if (!child) {
      return child;
    }
    children.push_back(child.value());
  }

  for (const auto & resolver : generator_.resolvers) {
    const auto * primitive = std::get_if<PrimitiveResolver>(&resolver);
    if (!primitive || primitive->type != type->ref) {
      continue;
    }
    if (const Expr * e = primitive->fn(builder_, type->args, children)) {
      return e;
    }
  }

  return make_error(
    GenErrorKind::NoMatchingResolver,
    fmt::format("I don't know how to implement a {} for `{}`", generator_.id, render_type(type)));
}

Composer::Body Composer::unwrap_alias(bool is_top_level, const ResolvedType * alias)
{
  // A non-record alias has no declaration of its own to refer back to.
  if (!unwrapping_.insert(alias).second) {
    return make_error(
      GenErrorKind::UnsupportedShape,
      fmt::format(
        "Cannot generate code for `{}`: the type alias refers to itself", render_type(alias)));
  }
  Body body = compose(is_top_level, alias->aliased);
  unwrapping_.erase(alias);
  return body;
}

Composer::Body Composer::compose_record(const ResolvedType * record)
{
  if (!record->var_name.empty()) {
    return extensible_record(record);
  }

  const Expr * ctor = nullptr;
  Types child_types;

  if (record->fields.empty()) {
    ctor = builder_.record({});
  } else {
    std::vector<const Pattern *> params;
    std::vector<std::pair<std::string_view, const Expr *>> fields;
    for (const auto & field : record->fields) {
      const std::string_view param = builder_.fresh_name(field.name);
      params.push_back(builder_.var(param));
      fields.emplace_back(field.name, builder_.local(param));
      child_types.push_back(field.type);
    }
    ctor = builder_.lambda(params, builder_.record(fields));
  }

  return combine(record, ctor, child_types);
}

Composer::Body Composer::compose_tuple(const ResolvedType * tuple)
{
  switch (tuple->args.size()) {
    case 0:
      return compose(false, types_.opaque(k_unit_type));

    case 2:
      return combine(tuple, builder_.ref(k_pair), tuple->args);

    case 3: {
      const std::string_view a = builder_.fresh_name("a");
      const std::string_view b = builder_.fresh_name("b");
      const std::string_view c = builder_.fresh_name("c");
      const Expr * ctor = builder_.lambda(
        {builder_.var(a), builder_.var(b), builder_.var(c)},
        builder_.tuple({builder_.local(a), builder_.local(b), builder_.local(c)}));
      return combine(tuple, ctor, tuple->args);
    }

    default:
      return illegal_tuple(tuple);
  }
}

Composer::Body Composer::compose_custom_type(const ResolvedType * custom)
{
  std::vector<ConstructorExpr> branches;
  branches.reserve(custom->constructors.size());
  for (const auto & ctor : custom->constructors) {
    Body branch = combine(custom, builder_.ref(ctor.ref), ctor.args);
    if (!branch) {
      return branch;
    }
    branches.push_back(ConstructorExpr{ctor.ref, branch.value()});
  }

  for (const auto & resolver : generator_.resolvers) {
    if (const auto * custom_resolver = std::get_if<CustomTypeResolver>(&resolver)) {
      if (const Expr * e = custom_resolver->fn(builder_, custom->constructors, branches)) {
        return e;
      }
      break;
    }
  }

  return make_error(
    GenErrorKind::NoMatchingResolver,
    fmt::format(
      "I don't know how to implement a {} for the custom type `{}`", generator_.id,
      render_type(custom)));
}

Composer::Body Composer::combine(
  const ResolvedType * type, const Expr * ctor, const Types & child_types)
{
  Exprs children;
  children.reserve(child_types.size());
  for (const auto * child_type : child_types) {
    Body child = compose(false, child_type);
    if (!child) {
      return child;
    }
    children.push_back(child.value());
  }

  for (const auto & resolver : generator_.resolvers) {
    if (const auto * combiner = std::get_if<Combiner>(&resolver)) {
      if (const Expr * e = combiner->fn(builder_, type, ctor, children)) {
        return e;
      }
    }
  }

  return make_error(
    GenErrorKind::NoMatchingResolver,
    fmt::format(
      "I don't know how to combine `{}` with {} argument(s) for a {}", render_expr(ctor),
      children.size(), generator_.id));
}

// ============================================================================
// Auxiliary declarations
// ============================================================================

template <typename Fn>
Composer::Body Composer::named(bool is_top_level, const ResolvedType * type, Fn && compose_body)
{
  if (is_top_level) {
    return compose_body();
  }

  if (auto it = named_.find(type->ref); it != named_.end()) {
    return builder_.local(it->second);
  }

  const std::string name = unique_declaration_name(generator_.make_name(type->ref.name));
  named_.emplace(type->ref, name);

  // Alias unwrapping starts over inside the helper: a cycle through it ends
  // at the reference to `name`.
  std::unordered_set<const ResolvedType *> outer;
  std::swap(outer, unwrapping_);
  Body body = compose_body();
  std::swap(outer, unwrapping_);
  if (!body) {
    return body;
  }

  auxiliaries_.push_back(AuxiliaryDeclaration{
    name, generator_.pattern.rebuild(types_, reference_to(types_, type)), body.value(), type});
  return builder_.local(name);
}

std::string Composer::unique_declaration_name(const std::string & base)
{
  std::string candidate = base;
  for (int n = 2; taken_names_.count(candidate) > 0; ++n) {
    candidate = base + std::to_string(n);
  }
  taken_names_.insert(candidate);
  return candidate;
}

GenResult<Generated> generate(
  AstBuilder & builder, TypeContext & types, const ResolvedGenerator & generator,
  const std::vector<KnownProvider> & providers, const ResolvedType * type, bool is_top_level)
{
  Composer composer(builder, types, generator, providers);
  return composer.generate(is_top_level, type);
}

}  // namespace codesynth
