// codesynth/io/type_loader.hpp - Resolved types and requests from JSON
//
// Input document:
//
// @code
//   {
//     "types": {
//       "Main.Tree": {"kind": "custom", "constructors": [
//         {"name": "Leaf", "args": [{"kind": "opaque", "module": "Basics", "name": "Int"}]},
//         {"name": "Node", "args": [{"kind": "ref", "module": "Main", "name": "Tree"},
//                                   {"kind": "ref", "module": "Main", "name": "Tree"}]}]}
//     },
//     "requests": [{"name": "decodeTree", "annotation": {...}, "params": []}],
//     "providers": [{"generator": "...", "module": "Api", "name": "decodeId", "type": {...}}]
//   }
// @endcode
//
// Type nodes: var, opaque, ref, record, tuple, function. Named entries in
// "types" are custom types or aliases and may reference each other and
// themselves.
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "codesynth/basic/result.hpp"
#include "codesynth/synth/composer.hpp"
#include "codesynth/synth/synthesizer.hpp"
#include "codesynth/types/resolved_type.hpp"

namespace codesynth
{

/// Contents of one input document
struct LoadedInput
{
  std::vector<SynthesisRequest> requests;
  std::vector<KnownProvider> providers;
};

/**
 * Build types, requests and providers from a parsed document.
 *
 * All types are created in `types`. Failures are GenErrorKind::InvalidInput
 * with a message naming the offending entry.
 */
[[nodiscard]] GenResult<LoadedInput> load_input(const nlohmann::json & document, TypeContext & types);

/// Parse and load a JSON file.
[[nodiscard]] GenResult<LoadedInput> load_input_file(
  const std::filesystem::path & path, TypeContext & types);

}  // namespace codesynth
