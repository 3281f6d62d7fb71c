// codesynth/registry/vocabulary.cpp - Builders for definition fragments
#include "codesynth/registry/vocabulary.hpp"

#include <utility>

namespace codesynth::vocab
{

namespace
{

Definition always(Definition::Payload payload)
{
  return Definition{std::move(payload), Condition::always()};
}

PrimitiveResolver::Fn constant(QualifiedName impl)
{
  return [impl = std::move(impl)](AstBuilder & b, const Types &, const Exprs &) -> const Expr * {
    return b.ref(impl);
  };
}

PrimitiveResolver::Fn constant(ExprFn fn)
{
  return [fn = std::move(fn)](AstBuilder & b, const Types &, const Exprs &) { return fn(b); };
}

PrimitiveResolver::Fn applied(QualifiedName impl, size_t arity)
{
  return [impl = std::move(impl), arity](
           AstBuilder & b, const Types &, const Exprs & children) -> const Expr * {
    if (children.size() != arity) {
      return nullptr;
    }
    return b.apply(impl, children);
  };
}

bool is_tuple_of(const ResolvedType * type, size_t arity)
{
  return type->kind == TypeKind::Tuple && type->args.size() == arity;
}

const QualifiedName k_bool{"Basics", "Bool"};
const QualifiedName k_int{"Basics", "Int"};
const QualifiedName k_float{"Basics", "Float"};
const QualifiedName k_string{"String", "String"};
const QualifiedName k_char{"Char", "Char"};
const QualifiedName k_unit{"Basics", "()"};

}  // namespace

// ============================================================================
// Primitives
// ============================================================================

Definition primitive(QualifiedName type, QualifiedName impl)
{
  return primitive(std::move(type), constant(std::move(impl)));
}

Definition primitive(QualifiedName type, PrimitiveResolver::Fn fn)
{
  return always(PrimitiveResolver{std::move(type), std::move(fn)});
}

Definition bool_(QualifiedName impl) { return primitive(k_bool, std::move(impl)); }
Definition bool_(ExprFn fn) { return primitive(k_bool, constant(std::move(fn))); }
Definition int_(QualifiedName impl) { return primitive(k_int, std::move(impl)); }
Definition int_(ExprFn fn) { return primitive(k_int, constant(std::move(fn))); }
Definition float_(QualifiedName impl) { return primitive(k_float, std::move(impl)); }
Definition float_(ExprFn fn) { return primitive(k_float, constant(std::move(fn))); }
Definition string_(QualifiedName impl) { return primitive(k_string, std::move(impl)); }
Definition string_(ExprFn fn) { return primitive(k_string, constant(std::move(fn))); }
Definition char_(QualifiedName impl) { return primitive(k_char, std::move(impl)); }
Definition char_(ExprFn fn) { return primitive(k_char, constant(std::move(fn))); }
Definition unit(QualifiedName impl) { return primitive(k_unit, std::move(impl)); }
Definition unit(ExprFn fn) { return primitive(k_unit, constant(std::move(fn))); }

// ============================================================================
// Containers
// ============================================================================

Definition container1(QualifiedName type, QualifiedName impl)
{
  return primitive(std::move(type), applied(std::move(impl), 1));
}

Definition container2(QualifiedName type, QualifiedName impl)
{
  return primitive(std::move(type), applied(std::move(impl), 2));
}

Definition list(QualifiedName impl) { return container1({"List", "List"}, std::move(impl)); }
Definition array(QualifiedName impl) { return container1({"Array", "Array"}, std::move(impl)); }
Definition set(QualifiedName impl) { return container1({"Set", "Set"}, std::move(impl)); }
Definition maybe(QualifiedName impl) { return container1({"Maybe", "Maybe"}, std::move(impl)); }
Definition dict(QualifiedName impl) { return container2({"Dict", "Dict"}, std::move(impl)); }

// ============================================================================
// Combiners
// ============================================================================

Definition wrap(QualifiedName impl)
{
  return combiner([impl = std::move(impl)](
                    AstBuilder & b, const ResolvedType *, const Expr * ctor,
                    const Exprs & children) -> const Expr * {
    if (!children.empty()) {
      return nullptr;
    }
    return b.apply(impl, {ctor});
  });
}

Definition map(QualifiedName impl)
{
  return combiner([impl = std::move(impl)](
                    AstBuilder & b, const ResolvedType *, const Expr * ctor,
                    const Exprs & children) -> const Expr * {
    if (children.size() != 1) {
      return nullptr;
    }
    return b.apply(impl, {ctor, children[0]});
  });
}

Definition map_n(std::string module, std::string base, size_t max)
{
  return map_n([module = std::move(module), base = std::move(base),
                max](size_t n) -> std::optional<QualifiedName> {
    if (n == 0 || n > max) {
      return std::nullopt;
    }
    return QualifiedName(module, n == 1 ? base : base + std::to_string(n));
  });
}

Definition map_n(std::function<std::optional<QualifiedName>(size_t)> name_for)
{
  return combiner([name_for = std::move(name_for)](
                    AstBuilder & b, const ResolvedType *, const Expr * ctor,
                    const Exprs & children) -> const Expr * {
    const auto name = name_for(children.size());
    if (!name) {
      return nullptr;
    }
    Exprs args{ctor};
    args.insert(args.end(), children.begin(), children.end());
    return b.apply(*name, args);
  });
}

Definition pipeline(
  std::function<const Expr *(AstBuilder &, const Expr * ctor)> init,
  std::function<const Expr *(AstBuilder &, const ResolvedType * type, size_t index, const Expr * child)>
    step)
{
  return combiner([init = std::move(init), step = std::move(step)](
                    AstBuilder & b, const ResolvedType * type, const Expr * ctor,
                    const Exprs & children) -> const Expr * {
    const Expr * acc = init(b, ctor);
    if (!acc) {
      return nullptr;
    }
    for (size_t i = 0; i < children.size(); ++i) {
      const Expr * next = step(b, type, i, children[i]);
      if (!next) {
        return nullptr;
      }
      acc = b.pipe(acc, next);
    }
    return acc;
  });
}

Definition combiner(Combiner::Fn fn) { return always(Combiner{std::move(fn)}); }

Definition tuple(QualifiedName impl)
{
  return combiner([impl = std::move(impl)](
                    AstBuilder & b, const ResolvedType * type, const Expr *,
                    const Exprs & children) -> const Expr * {
    if (!is_tuple_of(type, 2)) {
      return nullptr;
    }
    return b.apply(impl, children);
  });
}

Definition triple(QualifiedName impl)
{
  return combiner([impl = std::move(impl)](
                    AstBuilder & b, const ResolvedType * type, const Expr *,
                    const Exprs & children) -> const Expr * {
    if (!is_tuple_of(type, 3)) {
      return nullptr;
    }
    return b.apply(impl, children);
  });
}

// ============================================================================
// Others
// ============================================================================

Definition custom_type(CustomTypeResolver::Fn fn) { return always(CustomTypeResolver{std::move(fn)}); }

Definition universal(UniversalResolver::Fn fn) { return always(UniversalResolver{std::move(fn)}); }

Definition lambda_breaker(LambdaBreaker::Fn fn) { return always(LambdaBreaker{std::move(fn)}); }

Definition lambda_breaker(QualifiedName impl)
{
  return lambda_breaker([impl = std::move(impl)](AstBuilder & b, const Expr * expr) {
    return b.apply(impl, {b.lambda({b.wildcard()}, expr)});
  });
}

Definition blessed(QualifiedName ref) { return always(BlessedImplementation{std::move(ref)}); }

Definition conditional(std::string capability, Definition definition)
{
  definition.condition.dependencies.push_back(std::move(capability));
  return definition;
}

}  // namespace codesynth::vocab
