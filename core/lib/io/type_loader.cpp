// codesynth/io/type_loader.cpp - Resolved types and requests from JSON
#include "codesynth/io/type_loader.hpp"

#include <fmt/core.h>

#include <fstream>
#include <optional>
#include <unordered_map>
#include <utility>

namespace codesynth
{

namespace
{

using nlohmann::json;

GenError invalid(std::string message)
{
  return make_error(GenErrorKind::InvalidInput, std::move(message));
}

std::optional<std::string> get_string(const json & node, const char * key)
{
  if (!node.is_object()) return std::nullopt;
  const auto it = node.find(key);
  if (it == node.end() || !it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

/// "Main.Sub.Person" -> {"Main.Sub", "Person"}
QualifiedName split_qualified(const std::string & key)
{
  const auto dot = key.rfind('.');
  if (dot == std::string::npos) {
    return QualifiedName::local(key);
  }
  return QualifiedName(key.substr(0, dot), key.substr(dot + 1));
}

class TypeLoader
{
public:
  explicit TypeLoader(TypeContext & types) : types_(types) {}

  std::optional<GenError> declare_named(const json & table);
  std::optional<GenError> define_named(const json & table);

  GenResult<const ResolvedType *> parse(const json & node, const std::string & where);

private:
  GenResult<std::vector<const ResolvedType *>> parse_list(
    const json & node, const char * key, const std::string & where);

  TypeContext & types_;
  std::unordered_map<QualifiedName, ResolvedType *, QualifiedNameHash> named_;
};

std::optional<GenError> TypeLoader::declare_named(const json & table)
{
  if (!table.is_object()) {
    return invalid("\"types\" must be an object keyed by qualified type name");
  }
  for (const auto & [key, entry] : table.items()) {
    const QualifiedName ref = split_qualified(key);
    const auto kind = get_string(entry, "kind");

    std::vector<std::string> generics;
    if (entry.is_object() && entry.contains("generics")) {
      for (const auto & g : entry["generics"]) {
        if (!g.is_string()) {
          return invalid(fmt::format("type `{}`: generics must be strings", key));
        }
        generics.push_back(g.get<std::string>());
      }
    }

    if (kind == "custom") {
      named_.emplace(ref, types_.declare_custom_type(ref, std::move(generics)));
    } else if (kind == "alias") {
      named_.emplace(ref, types_.declare_alias(ref, std::move(generics)));
    } else {
      return invalid(fmt::format("type `{}`: kind must be \"custom\" or \"alias\"", key));
    }
  }
  return std::nullopt;
}

std::optional<GenError> TypeLoader::define_named(const json & table)
{
  for (const auto & [key, entry] : table.items()) {
    ResolvedType * named = named_.at(split_qualified(key));

    if (named->kind == TypeKind::TypeAlias) {
      if (!entry.contains("type")) {
        return invalid(fmt::format("alias `{}` has no \"type\"", key));
      }
      auto aliased = parse(entry["type"], key);
      if (!aliased) return aliased.error();
      types_.define_alias(named, aliased.value());
      continue;
    }

    if (!entry.contains("constructors") || !entry["constructors"].is_array()) {
      return invalid(fmt::format("custom type `{}` needs a \"constructors\" list", key));
    }
    std::vector<TypeConstructor> ctors;
    for (const auto & ctor : entry["constructors"]) {
      const auto name = get_string(ctor, "name");
      if (!name) {
        return invalid(fmt::format("custom type `{}`: constructor without a name", key));
      }
      const std::string where = fmt::format("{}.{}", key, *name);
      auto args = parse_list(ctor, "args", where);
      if (!args) return args.error();
      ctors.push_back(TypeConstructor{
        QualifiedName(get_string(ctor, "module").value_or(named->ref.module), *name),
        std::move(args).value()});
    }
    types_.define_constructors(named, std::move(ctors));
  }
  return std::nullopt;
}

GenResult<std::vector<const ResolvedType *>> TypeLoader::parse_list(
  const json & node, const char * key, const std::string & where)
{
  std::vector<const ResolvedType *> out;
  if (!node.contains(key)) {
    return out;
  }
  if (!node[key].is_array()) {
    return invalid(fmt::format("{}: \"{}\" must be a list", where, key));
  }
  for (const auto & item : node[key]) {
    auto t = parse(item, where);
    if (!t) return t.error();
    out.push_back(t.value());
  }
  return out;
}

GenResult<const ResolvedType *> TypeLoader::parse(const json & node, const std::string & where)
{
  const auto kind = get_string(node, "kind");
  if (!kind) {
    return invalid(fmt::format("{}: type node without \"kind\"", where));
  }

  if (*kind == "var") {
    const auto name = get_string(node, "name");
    if (!name) return invalid(fmt::format("{}: type variable without a name", where));
    return types_.generic_var(*name);
  }

  if (*kind == "opaque" || *kind == "ref") {
    const auto module = get_string(node, "module");
    const auto name = get_string(node, "name");
    if (!module || !name) {
      return invalid(fmt::format("{}: {} type needs \"module\" and \"name\"", where, *kind));
    }
    const QualifiedName ref(*module, *name);
    auto args = parse_list(node, "args", where);
    if (!args) return args.error();

    // Arguments of a named type are only checked for arity: parameterized
    // named types are rejected by the composer.
    if (const auto it = named_.find(ref); it != named_.end()) {
      const ResolvedType * named = it->second;
      if (!args->empty() && args->size() != named->generics.size()) {
        return invalid(fmt::format(
          "{}: type `{}` takes {} argument(s) but {} were given", where, ref.render(),
          named->generics.size(), args->size()));
      }
      return named;
    }
    if (*kind == "ref") {
      return invalid(fmt::format("{}: unknown type `{}`", where, ref.render()));
    }
    return types_.opaque(ref, std::move(args).value());
  }

  if (*kind == "record") {
    if (!node.contains("fields") || !node["fields"].is_array()) {
      return invalid(fmt::format("{}: record needs a \"fields\" list", where));
    }
    std::vector<TypeField> fields;
    for (const auto & field : node["fields"]) {
      const auto name = get_string(field, "name");
      if (!name || !field.contains("type")) {
        return invalid(fmt::format("{}: record field needs \"name\" and \"type\"", where));
      }
      auto t = parse(field["type"], where + "." + *name);
      if (!t) return t.error();
      fields.push_back(TypeField{*name, t.value()});
    }
    return types_.record(std::move(fields), get_string(node, "extension").value_or(""));
  }

  if (*kind == "tuple") {
    auto elements = parse_list(node, "elements", where);
    if (!elements) return elements.error();
    return types_.tuple(std::move(elements).value());
  }

  if (*kind == "unit") {
    return types_.unit();
  }

  if (*kind == "function") {
    if (!node.contains("from") || !node.contains("to")) {
      return invalid(fmt::format("{}: function type needs \"from\" and \"to\"", where));
    }
    auto from = parse(node["from"], where);
    if (!from) return from;
    auto to = parse(node["to"], where);
    if (!to) return to;
    return types_.function(from.value(), to.value());
  }

  return invalid(fmt::format("{}: unknown type kind \"{}\"", where, *kind));
}

}  // namespace

GenResult<LoadedInput> load_input(const json & document, TypeContext & types)
{
  if (!document.is_object()) {
    return invalid("input must be a JSON object");
  }

  try {
    TypeLoader loader(types);
    if (document.contains("types")) {
      if (auto error = loader.declare_named(document["types"])) return *error;
      if (auto error = loader.define_named(document["types"])) return *error;
    }

    LoadedInput input;

    if (document.contains("requests")) {
      for (const auto & entry : document["requests"]) {
        const auto name = get_string(entry, "name");
        if (!name || !entry.contains("annotation")) {
          return invalid("request needs \"name\" and \"annotation\"");
        }
        auto annotation = loader.parse(entry["annotation"], *name);
        if (!annotation) return annotation.error();

        SynthesisRequest request{*name, annotation.value(), {}};
        if (entry.contains("params")) {
          for (const auto & p : entry["params"]) {
            if (!p.is_string()) {
              return invalid(fmt::format("{}: params must be strings", *name));
            }
            request.params.push_back(p.get<std::string>());
          }
        }
        input.requests.push_back(std::move(request));
      }
    }

    if (document.contains("providers")) {
      for (const auto & entry : document["providers"]) {
        const auto generator = get_string(entry, "generator");
        const auto module = get_string(entry, "module");
        const auto name = get_string(entry, "name");
        if (!generator || !module || !name || !entry.contains("type")) {
          return invalid("provider needs \"generator\", \"module\", \"name\" and \"type\"");
        }
        auto type = loader.parse(entry["type"], *module + "." + *name);
        if (!type) return type.error();
        input.providers.push_back(KnownProvider{*generator, QualifiedName(*module, *name), type.value()});
      }
    }

    return input;
  } catch (const json::exception & e) {
    return invalid(fmt::format("malformed input: {}", e.what()));
  }
}

GenResult<LoadedInput> load_input_file(const std::filesystem::path & path, TypeContext & types)
{
  std::ifstream in(path);
  if (!in) {
    return invalid("cannot open input file: " + path.string());
  }

  json document;
  try {
    document = json::parse(in);
  } catch (const json::parse_error & e) {
    return invalid(fmt::format("{}: {}", path.string(), e.what()));
  }
  return load_input(document, types);
}

}  // namespace codesynth
