/// @file yaml.hpp
/// @brief YAML documents as Values, via fkYAML.
///
/// YAML input is converted to the JSON model before patching and back to
/// YAML afterwards. Mapping order is kept in both directions.

#pragma once

#include <jsonpatch-cpp/value.hpp>

#include <string>
#include <string_view>

namespace jsonpatch_cpp {

/// Decode a YAML document.
/// @throws PatchError(malformed_document) for invalid YAML or a mapping key
///   that is not a string.
auto decode_yaml(std::string_view text) -> Value;

/// Encode a value as a YAML document.
auto encode_yaml(const Value& value) -> std::string;

/// True for paths ending in ".yaml" or ".yml".
auto is_yaml_path(std::string_view path) -> bool;

}  // namespace jsonpatch_cpp
