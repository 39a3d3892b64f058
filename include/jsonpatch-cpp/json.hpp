/// @file json.hpp
/// @brief JSON text codec and nlohmann/json interoperability.
///
/// Decodes JSON text into Value (keeping number literals and key order),
/// encodes Value back to text, and converts RFC 6902 patch documents to
/// and from the Patch model.

#pragma once

#include <jsonpatch-cpp/op.hpp>
#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace jsonpatch_cpp {

// =============================================================================
// Documents
// =============================================================================

/// Decode JSON text.
///
/// Object keys keep their source order; a repeated key keeps the last
/// value at the first key's position. Floating-point literals keep their
/// source text. Integer literals too large for a finite double are
/// rejected, and `-0` decodes as the integer 0.
/// @throws PatchError(malformed_document) if the text is not valid JSON or
///   nests deeper than max_nesting_depth.
auto decode(std::string_view text) -> Value;

/// Encode a value as JSON text.
/// @param indent Negative for compact output; otherwise the number of
///   spaces per nesting level, with one member or element per line.
auto encode(const Value& value, int indent = -1) -> std::string;

// =============================================================================
// Patches (RFC 6902)
// =============================================================================

/// Decode an RFC 6902 patch document.
/// @throws PatchError(malformed_document) for invalid JSON,
///   PatchError(malformed_patch) for a document that does not follow the
///   operation schema, PatchError(unknown_operation) for an "op" outside
///   the six kinds and PatchError(malformed_pointer) for a bad path/from.
auto decode_patch(std::string_view text) -> Patch;

/// Decode an already-parsed patch document.
auto decode_patch(const Value& value) -> Patch;

/// The RFC 6902 object form of one operation.
auto to_value(const Operation& op) -> Value;

/// The RFC 6902 array form of a patch.
auto to_value(const Patch& patch) -> Value;

/// Encode a patch as RFC 6902 JSON text.
auto encode_patch(const Patch& patch, int indent = -1) -> std::string;

/// Decode a document and a patch, apply, and encode the result.
/// @throws PatchError from decoding, OperationError from applying.
auto apply_text(std::string_view document, std::string_view patch,
                int indent = -1) -> std::string;

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// nlohmann::json sorts object keys and stores floats as doubles, so a
// round trip through it loses key order and number literals;
// nlohmann::ordered_json keeps the order.

void to_json(nlohmann::json& j, const Value& v);
void from_json(const nlohmann::json& j, Value& v);

void to_json(nlohmann::ordered_json& j, const Value& v);
void from_json(const nlohmann::ordered_json& j, Value& v);

void to_json(nlohmann::json& j, const Pointer& p);
void from_json(const nlohmann::json& j, Pointer& p);

}  // namespace jsonpatch_cpp
