// codesynth/builtins/builtin_generators.hpp - Generators shipped with codesynth
//
// Definitions for the common Elm packages:
//
//   elm/json/Json.Encode.Value          a -> Json.Encode.Value
//   elm/json/Json.Decode.Decoder        Json.Decode.Decoder a
//   elm/random/Random.Generator         Random.Generator a
//   elm-explorations/test/Fuzz.Fuzzer   Fuzz.Fuzzer a
//
// plus amendments enabled by NoRedInk/elm-json-decode-pipeline and
// elm-community/random-extra.
//
#pragma once

#include <string>
#include <vector>

#include "codesynth/registry/definition.hpp"

namespace codesynth
{

namespace generator_ids
{
inline constexpr const char * k_json_encoder = "elm/json/Json.Encode.Value";
inline constexpr const char * k_json_decoder = "elm/json/Json.Decode.Decoder";
inline constexpr const char * k_random = "elm/random/Random.Generator";
inline constexpr const char * k_fuzzer = "elm-explorations/test/Fuzz.Fuzzer";
}  // namespace generator_ids

/// All built-in generator and amendment definitions, in precedence order
[[nodiscard]] std::vector<GeneratorDefinition> builtin_generators();

[[nodiscard]] GeneratorDefinition json_encoder_generator();
[[nodiscard]] GeneratorDefinition json_decoder_generator();
[[nodiscard]] GeneratorDefinition json_decode_pipeline_amendment();
[[nodiscard]] GeneratorDefinition random_generator();
[[nodiscard]] GeneratorDefinition random_extra_amendment();
[[nodiscard]] GeneratorDefinition fuzzer_generator();

/// Packages enabled when a run names no capabilities
[[nodiscard]] std::vector<std::string> base_capabilities();

}  // namespace codesynth
