// codesynth/builtins/builtin_generators.cpp - Generators shipped with codesynth
#include "codesynth/builtins/builtin_generators.hpp"

#include <string>

#include "codesynth/basic/casting.hpp"
#include "codesynth/registry/generator_registry.hpp"
#include "codesynth/registry/vocabulary.hpp"

namespace codesynth
{

namespace
{

constexpr const char * k_json_cap = "elm/json";
constexpr const char * k_pipeline_cap = "NoRedInk/elm-json-decode-pipeline";
constexpr const char * k_random_cap = "elm/random";
constexpr const char * k_random_extra_cap = "elm-community/random-extra";
constexpr const char * k_test_cap = "elm-explorations/test";

// ============================================================================
// Expression helpers
// ============================================================================

const Expr * call(AstBuilder & b, std::string_view module, std::string_view fn, const Exprs & args)
{
  return b.apply(b.ref(module, fn), args);
}

const Expr * identity(AstBuilder & b) { return b.ref("Basics", "identity"); }

bool is_named(const ResolvedType * type, std::string_view module, std::string_view name)
{
  return type->is_named() && type->ref.module == module && type->ref.name == name;
}

/// Constructor name of a custom-type branch (`Main.Leaf` -> "Leaf")
std::string_view ctor_name(const Expr * ctor)
{
  const auto * ref = dyn_cast<ReferenceExpr>(ctor);
  return ref ? ref->name : std::string_view{};
}

/// `\a0 a1 ... -> body(a0, a1, ...)` over fresh names, or just body() without params
template <typename Body>
const Expr * lambda_over(AstBuilder & b, size_t arity, std::string_view base, Body && body)
{
  std::vector<const Pattern *> params;
  Exprs refs;
  for (size_t i = 0; i < arity; ++i) {
    const std::string_view name = b.fresh_name(base);
    params.push_back(b.var(name));
    refs.push_back(b.local(name));
  }
  const Expr * result = body(refs);
  return params.empty() ? result : b.lambda(params, result);
}

// ============================================================================
// Json.Encode
// ============================================================================

const Expr * encode_tagged(AstBuilder & b, std::string_view tag, const Exprs & args)
{
  Exprs fields{b.tuple({b.string("tag"), call(b, "Json.Encode", "string", {b.string(tag)})})};
  if (!args.empty()) {
    fields.push_back(
      b.tuple({b.string("args"), call(b, "Json.Encode", "list", {identity(b), b.list(args)})}));
  }
  return call(b, "Json.Encode", "object", {b.list(fields)});
}

const Expr * encode_composite(
  AstBuilder & b, const ResolvedType * type, const Expr * ctor, const Exprs & children)
{
  switch (type->kind) {
    case TypeKind::AnonymousRecord: {
      const std::string_view value = b.fresh_name("value");
      Exprs fields;
      for (size_t i = 0; i < children.size(); ++i) {
        const std::string & field = type->fields[i].name;
        fields.push_back(
          b.tuple({b.string(field), b.apply(children[i], {b.access(b.local(value), field)})}));
      }
      return b.lambda({b.var(value)}, call(b, "Json.Encode", "object", {b.list(fields)}));
    }

    case TypeKind::Tuple: {
      std::vector<const Pattern *> elements;
      Exprs encoded;
      for (const auto * child : children) {
        const std::string_view item = b.fresh_name("item");
        elements.push_back(b.var(item));
        encoded.push_back(b.apply(child, {b.local(item)}));
      }
      return b.lambda(
        {b.tuple_pattern(elements)}, call(b, "Json.Encode", "list", {identity(b), b.list(encoded)}));
    }

    case TypeKind::CustomType:
      return lambda_over(b, children.size(), "arg", [&](const Exprs & args) {
        Exprs encoded;
        for (size_t i = 0; i < args.size(); ++i) {
          encoded.push_back(b.apply(children[i], {args[i]}));
        }
        return encode_tagged(b, ctor_name(ctor), encoded);
      });

    default:
      return nullptr;
  }
}

const Expr * encode_custom_type(
  AstBuilder & b, const std::vector<TypeConstructor> & ctors,
  const std::vector<ConstructorExpr> & branches)
{
  const std::string_view value = b.fresh_name("value");
  std::vector<CaseBranch> cases;
  for (size_t i = 0; i < ctors.size(); ++i) {
    std::vector<const Pattern *> binds;
    Exprs args;
    for (size_t j = 0; j < ctors[i].args.size(); ++j) {
      const std::string_view arg = b.fresh_name("arg");
      binds.push_back(b.var(arg));
      args.push_back(b.local(arg));
    }
    cases.push_back(CaseBranch{b.ctor_pattern(ctors[i].ref, binds), b.apply(branches[i].expr, args)});
  }
  return b.lambda({b.var(value)}, b.case_of(b.local(value), cases));
}

// ============================================================================
// Json.Decode
// ============================================================================

constexpr size_t k_decode_map_max = 8;

const Expr * decode_composite(
  AstBuilder & b, const ResolvedType * type, const Expr * ctor, const Exprs & children)
{
  if (children.empty() || children.size() > k_decode_map_max) {
    return nullptr;
  }

  Exprs args{ctor};
  for (size_t i = 0; i < children.size(); ++i) {
    if (type->kind == TypeKind::AnonymousRecord) {
      args.push_back(
        call(b, "Json.Decode", "field", {b.string(type->fields[i].name), children[i]}));
    } else {
      args.push_back(call(
        b, "Json.Decode", "index", {b.integer(static_cast<int64_t>(i)), children[i]}));
    }
  }

  const std::string map = children.size() == 1 ? "map" : "map" + std::to_string(children.size());
  const Expr * decoded = call(b, "Json.Decode", map, args);
  if (type->kind == TypeKind::CustomType) {
    return call(b, "Json.Decode", "field", {b.string("args"), decoded});
  }
  return decoded;
}

const Expr * decode_custom_type(
  AstBuilder & b, const std::vector<TypeConstructor> & ctors,
  const std::vector<ConstructorExpr> & branches)
{
  const std::string_view tag = b.fresh_name("tag");

  Exprs entries;
  for (size_t i = 0; i < ctors.size(); ++i) {
    entries.push_back(b.tuple({b.string(ctors[i].ref.name), branches[i].expr}));
  }
  const Expr * lookup =
    call(b, "Dict", "get", {b.local(tag), call(b, "Dict", "fromList", {b.list(entries)})});
  const Expr * unknown = call(
    b, "Json.Decode", "fail", {b.op("++", b.string("Unknown constructor: "), b.local(tag))});

  return b.pipe(
    call(b, "Json.Decode", "field", {b.string("tag"), b.ref("Json.Decode", "string")}),
    call(
      b, "Json.Decode", "andThen",
      {b.lambda({b.var(tag)}, call(b, "Maybe", "withDefault", {unknown, lookup}))}));
}

const Expr * decode_pipeline_step(
  AstBuilder & b, const ResolvedType * type, size_t index, const Expr * child)
{
  switch (type->kind) {
    case TypeKind::AnonymousRecord:
      return call(
        b, "Json.Decode.Pipeline", "required", {b.string(type->fields[index].name), child});
    case TypeKind::Tuple:
      return call(
        b, "Json.Decode.Pipeline", "custom",
        {call(b, "Json.Decode", "index", {b.integer(static_cast<int64_t>(index)), child})});
    default:
      return nullptr;
  }
}

// ============================================================================
// Random
// ============================================================================

constexpr size_t k_random_map_max = 5;

const Expr * random_list(AstBuilder & b, const Expr * element)
{
  const std::string_view len = b.fresh_name("len");
  return b.pipe(
    call(b, "Random", "int", {b.integer(0), b.integer(10)}),
    call(
      b, "Random", "andThen",
      {b.lambda({b.var(len)}, call(b, "Random", "list", {b.local(len), element}))}));
}

/// `first [ rest... ]` arguments of uniform / choices
Exprs first_and_rest(AstBuilder & b, const std::vector<ConstructorExpr> & branches)
{
  if (branches.empty()) {
    return {};
  }
  Exprs rest;
  for (size_t i = 1; i < branches.size(); ++i) {
    rest.push_back(branches[i].expr);
  }
  return {branches.front().expr, b.list(rest)};
}

}  // namespace

// ============================================================================
// Generator definitions
// ============================================================================

GeneratorDefinition json_encoder_generator()
{
  using namespace vocab;
  return define_generator(
    generator_ids::k_json_encoder, Condition::requires_all({k_json_cap}),
    TypePattern::function(
      TypePattern::hole(), TypePattern::named({"Json.Encode", "Value"})),
    name_with_prefix("encode"),
    {
      string_({"Json.Encode", "string"}),
      int_({"Json.Encode", "int"}),
      float_({"Json.Encode", "float"}),
      bool_({"Json.Encode", "bool"}),
      char_([](AstBuilder & b) {
        return b.op(">>", b.ref("String", "fromChar"), b.ref("Json.Encode", "string"));
      }),
      unit([](AstBuilder & b) {
        return b.lambda({b.wildcard()}, b.ref("Json.Encode", "null"));
      }),
      primitive({"Json.Encode", "Value"}, [](AstBuilder & b, const Types &, const Exprs &) {
        return identity(b);
      }),
      list({"Json.Encode", "list"}),
      array({"Json.Encode", "array"}),
      set({"Json.Encode", "set"}),
      primitive(
        {"Maybe", "Maybe"},
        [](AstBuilder & b, const Types &, const Exprs & children) -> const Expr * {
          if (children.size() != 1) {
            return nullptr;
          }
          return b.op(
            ">>", call(b, "Maybe", "map", {children[0]}),
            call(b, "Maybe", "withDefault", {b.ref("Json.Encode", "null")}));
        }),
      primitive(
        {"Dict", "Dict"},
        [](AstBuilder & b, const Types & args, const Exprs & children) -> const Expr * {
          if (children.size() != 2) {
            return nullptr;
          }
          if (!is_named(args[0], "String", "String")) {
            return nullptr;
          }
          return call(b, "Json.Encode", "dict", {identity(b), children[1]});
        }),
      combiner(encode_composite),
      custom_type(encode_custom_type),
    });
}

GeneratorDefinition json_decoder_generator()
{
  using namespace vocab;
  return define_generator(
    generator_ids::k_json_decoder, Condition::requires_all({k_json_cap}),
    TypePattern::named({"Json.Decode", "Decoder"}, {TypePattern::hole()}),
    name_with_prefix("decode"),
    {
      blessed({"Json.Decode", "value"}),
      string_({"Json.Decode", "string"}),
      int_({"Json.Decode", "int"}),
      float_({"Json.Decode", "float"}),
      bool_({"Json.Decode", "bool"}),
      unit([](AstBuilder & b) { return call(b, "Json.Decode", "succeed", {b.unit()}); }),
      primitive({"Json.Encode", "Value"}, {"Json.Decode", "value"}),
      list({"Json.Decode", "list"}),
      array({"Json.Decode", "array"}),
      maybe({"Json.Decode", "nullable"}),
      primitive(
        {"Set", "Set"},
        [](AstBuilder & b, const Types &, const Exprs & children) -> const Expr * {
          if (children.size() != 1) {
            return nullptr;
          }
          return call(
            b, "Json.Decode", "map",
            {b.ref("Set", "fromList"), call(b, "Json.Decode", "list", {children[0]})});
        }),
      primitive(
        {"Dict", "Dict"},
        [](AstBuilder & b, const Types & args, const Exprs & children) -> const Expr * {
          if (children.size() != 2) {
            return nullptr;
          }
          if (!is_named(args[0], "String", "String")) {
            return nullptr;
          }
          return call(b, "Json.Decode", "dict", {children[1]});
        }),
      wrap({"Json.Decode", "succeed"}),
      combiner(decode_composite),
      custom_type(decode_custom_type),
      lambda_breaker({"Json.Decode", "lazy"}),
    });
}

GeneratorDefinition json_decode_pipeline_amendment()
{
  using namespace vocab;
  return amend(
    generator_ids::k_json_decoder,
    {
      conditional(
        k_pipeline_cap,
        pipeline(
          [](AstBuilder & b, const Expr * ctor) {
            return call(b, "Json.Decode", "succeed", {ctor});
          },
          decode_pipeline_step)),
    });
}

GeneratorDefinition random_generator()
{
  using namespace vocab;
  return define_generator(
    generator_ids::k_random, Condition::requires_all({k_random_cap}),
    TypePattern::named({"Random", "Generator"}, {TypePattern::hole()}),
    name_with_prefix("random"),
    {
      int_([](AstBuilder & b) {
        return call(b, "Random", "int", {b.ref("Random", "minInt"), b.ref("Random", "maxInt")});
      }),
      float_([](AstBuilder & b) {
        return call(b, "Random", "float", {b.floating(0.0), b.floating(1.0)});
      }),
      bool_([](AstBuilder & b) {
        return call(
          b, "Random", "uniform", {b.ref("Basics", "True"), b.list({b.ref("Basics", "False")})});
      }),
      char_([](AstBuilder & b) {
        return call(
          b, "Random", "map",
          {b.ref("Char", "fromCode"), call(b, "Random", "int", {b.integer(32), b.integer(126)})});
      }),
      unit([](AstBuilder & b) { return call(b, "Random", "constant", {b.unit()}); }),
      primitive(
        {"List", "List"},
        [](AstBuilder & b, const Types &, const Exprs & children) -> const Expr * {
          if (children.size() != 1) {
            return nullptr;
          }
          return random_list(b, children[0]);
        }),
      primitive(
        {"Array", "Array"},
        [](AstBuilder & b, const Types &, const Exprs & children) -> const Expr * {
          if (children.size() != 1) {
            return nullptr;
          }
          return call(b, "Random", "map", {b.ref("Array", "fromList"), random_list(b, children[0])});
        }),
      primitive(
        {"Set", "Set"},
        [](AstBuilder & b, const Types &, const Exprs & children) -> const Expr * {
          if (children.size() != 1) {
            return nullptr;
          }
          return call(b, "Random", "map", {b.ref("Set", "fromList"), random_list(b, children[0])});
        }),
      primitive(
        {"Dict", "Dict"},
        [](AstBuilder & b, const Types &, const Exprs & children) -> const Expr * {
          if (children.size() != 2) {
            return nullptr;
          }
          return call(
            b, "Random", "map",
            {b.ref("Dict", "fromList"),
             random_list(b, call(b, "Random", "pair", {children[0], children[1]}))});
        }),
      universal([](AstBuilder & b, const ResolvedType * type) -> const Expr * {
        if (!is_named(type, "Basics", "Order")) {
          return nullptr;
        }
        return call(
          b, "Random", "uniform",
          {b.ref("Basics", "LT"), b.list({b.ref("Basics", "EQ"), b.ref("Basics", "GT")})});
      }),
      wrap({"Random", "constant"}),
      map_n("Random", "map", k_random_map_max),
      tuple({"Random", "pair"}),
      custom_type([](AstBuilder & b, const std::vector<TypeConstructor> &,
                     const std::vector<ConstructorExpr> & branches) -> const Expr * {
        if (branches.empty()) {
          return nullptr;
        }
        return b.pipe(
          call(b, "Random", "uniform", first_and_rest(b, branches)),
          call(b, "Random", "andThen", {identity(b)}));
      }),
      lambda_breaker({"Random", "lazy"}),
    });
}

GeneratorDefinition random_extra_amendment()
{
  using namespace vocab;
  return amend(
    generator_ids::k_random,
    {
      conditional(
        k_random_extra_cap,
        primitive(
          {"Maybe", "Maybe"},
          [](AstBuilder & b, const Types &, const Exprs & children) -> const Expr * {
            if (children.size() != 1) {
              return nullptr;
            }
            return call(b, "Random.Extra", "maybe", {b.ref("Random.Extra", "bool"), children[0]});
          })),
      conditional(
        k_random_extra_cap,
        combiner([](AstBuilder & b, const ResolvedType *, const Expr * ctor,
                    const Exprs & children) -> const Expr * {
          // Random.mapN stops at map5.
          if (children.size() <= k_random_map_max) {
            return nullptr;
          }
          const Expr * acc = call(b, "Random", "constant", {ctor});
          for (const auto * child : children) {
            acc = b.pipe(acc, call(b, "Random.Extra", "andMap", {child}));
          }
          return acc;
        })),
      conditional(
        k_random_extra_cap,
        custom_type([](AstBuilder & b, const std::vector<TypeConstructor> &,
                       const std::vector<ConstructorExpr> & branches) -> const Expr * {
          if (branches.empty()) {
            return nullptr;
          }
          return call(b, "Random.Extra", "choices", first_and_rest(b, branches));
        })),
    });
}

GeneratorDefinition fuzzer_generator()
{
  using namespace vocab;
  return define_generator(
    generator_ids::k_fuzzer, Condition::requires_all({k_test_cap}),
    TypePattern::named({"Fuzz", "Fuzzer"}, {TypePattern::hole()}), name_with_prefix("fuzz"),
    {
      string_({"Fuzz", "string"}),
      int_({"Fuzz", "int"}),
      float_({"Fuzz", "niceFloat"}),
      bool_({"Fuzz", "bool"}),
      char_({"Fuzz", "char"}),
      unit({"Fuzz", "unit"}),
      list({"Fuzz", "list"}),
      array({"Fuzz", "array"}),
      maybe({"Fuzz", "maybe"}),
      primitive(
        {"Set", "Set"},
        [](AstBuilder & b, const Types &, const Exprs & children) -> const Expr * {
          if (children.size() != 1) {
            return nullptr;
          }
          return call(
            b, "Fuzz", "map", {b.ref("Set", "fromList"), call(b, "Fuzz", "list", {children[0]})});
        }),
      primitive(
        {"Dict", "Dict"},
        [](AstBuilder & b, const Types &, const Exprs & children) -> const Expr * {
          if (children.size() != 2) {
            return nullptr;
          }
          return call(
            b, "Fuzz", "map",
            {b.ref("Dict", "fromList"),
             call(b, "Fuzz", "list", {call(b, "Fuzz", "pair", {children[0], children[1]})})});
        }),
      universal([](AstBuilder & b, const ResolvedType * type) -> const Expr * {
        if (!is_named(type, "Basics", "Order")) {
          return nullptr;
        }
        return call(
          b, "Fuzz", "oneOfValues",
          {b.list({b.ref("Basics", "LT"), b.ref("Basics", "EQ"), b.ref("Basics", "GT")})});
      }),
      wrap({"Fuzz", "constant"}),
      map_n("Fuzz", "map", 8),
      tuple({"Fuzz", "pair"}),
      triple({"Fuzz", "triple"}),
      custom_type([](AstBuilder & b, const std::vector<TypeConstructor> &,
                     const std::vector<ConstructorExpr> & branches) -> const Expr * {
        Exprs options;
        for (const auto & branch : branches) {
          options.push_back(branch.expr);
        }
        return call(b, "Fuzz", "oneOf", {b.list(options)});
      }),
      lambda_breaker({"Fuzz", "lazy"}),
    });
}

std::vector<GeneratorDefinition> builtin_generators()
{
  return {
    json_encoder_generator(), json_decoder_generator(), json_decode_pipeline_amendment(),
    random_generator(),       random_extra_amendment(), fuzzer_generator(),
  };
}

std::vector<std::string> base_capabilities()
{
  return {k_json_cap, k_random_cap, k_test_cap};
}

}  // namespace codesynth
