// codesynth/synth/recursion.cpp - Reference cycles between synthesized declarations
#include "codesynth/synth/recursion.hpp"

#include <fmt/core.h>

#include <functional>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "codesynth/ast/ast_utils.hpp"

namespace codesynth
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

/// Names bound by the declaration's parameters shadow other declarations.
NameSet body_references(const Declaration & decl)
{
  NameSet refs = free_locals(decl.body);
  std::vector<std::string_view> bound;
  for (const auto * p : decl.params) {
    collect_bound_names(p, bound);
  }
  for (auto name : bound) {
    refs.erase(name);
  }
  return refs;
}

std::string cycle_path(
  const std::vector<size_t> & stack, size_t target, const std::vector<Declaration> & decls)
{
  size_t start = 0;
  while (start < stack.size() && stack[start] != target) {
    ++start;
  }
  std::string path;
  for (size_t i = start; i < stack.size(); ++i) {
    path += decls[stack[i]].name + " -> ";
  }
  return path + decls[target].name;
}

}  // namespace

std::vector<CycleReference> find_cycle_references(const std::vector<Declaration> & decls)
{
  std::unordered_map<std::string_view, size_t> index;
  for (size_t i = 0; i < decls.size(); ++i) {
    index.emplace(decls[i].name, i);
  }

  // Adjacency in declaration order of the targets, for stable output.
  std::vector<std::vector<size_t>> adj(decls.size());
  for (size_t i = 0; i < decls.size(); ++i) {
    const NameSet refs = body_references(decls[i]);
    for (size_t j = 0; j < decls.size(); ++j) {
      if (refs.count(decls[j].name) > 0) {
        adj[i].push_back(j);
      }
    }
  }

  std::vector<Color> color(decls.size(), Color::White);
  std::vector<size_t> stack;
  std::vector<CycleReference> out;

  std::function<void(size_t)> dfs;
  dfs = [&](size_t u) {
    color[u] = Color::Gray;
    stack.push_back(u);
    for (size_t v : adj[u]) {
      if (color[v] == Color::Gray) {
        out.push_back(CycleReference{u, decls[v].name, cycle_path(stack, v, decls)});
      } else if (color[v] == Color::White) {
        dfs(v);
      }
    }
    stack.pop_back();
    color[u] = Color::Black;
  };

  for (size_t root = 0; root < decls.size(); ++root) {
    if (color[root] == Color::White) {
      dfs(root);
    }
  }
  return out;
}

GenResult<std::vector<Declaration>> break_recursion(
  AstBuilder & builder, std::vector<Declaration> decls, const LambdaBreaker * breaker)
{
  const std::vector<CycleReference> cycles = find_cycle_references(decls);

  if (!breaker) {
    for (const auto & cycle : cycles) {
      const Declaration & decl = decls[cycle.from];
      if (decl.params.empty() && references_local_eagerly(decl.body, cycle.target)) {
        return make_error(
          GenErrorKind::EagerRecursion,
          fmt::format(
            "`{}` refers to itself eagerly ({}) and the generator has no lambda-breaker to "
            "defer the reference",
            decl.name, cycle.path));
      }
    }
    return decls;
  }

  for (const auto & cycle : cycles) {
    Declaration & decl = decls[cycle.from];
    const std::string_view target = builder.context().intern(cycle.target);
    Substitution subst;
    subst.emplace(target, breaker->fn(builder, builder.local(target)));
    decl.body = substitute(builder, decl.body, subst);
  }
  return decls;
}

}  // namespace codesynth
