/// @file pointer.hpp
/// @brief JSON Pointer (RFC 6901): parsing, escaping and resolution.

#pragma once

#include <jsonpatch-cpp/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

/// A parsed JSON Pointer: an ordered list of unescaped reference tokens.
///
/// The empty pointer addresses the whole document. Tokens are stored
/// unescaped; to_string() escapes them again.
///
/// @code
/// auto p = Pointer::parse("/a~1b/0");   // tokens: "a/b", "0"
/// auto q = p.parent() / "c";            // "/a~1b/c"
/// @endcode
class Pointer {
public:
    Pointer() = default;
    explicit Pointer(std::vector<std::string> tokens) : tokens_{std::move(tokens)} {}

    /// Parse pointer text.
    /// @throws PatchError(malformed_pointer) if the text is non-empty and does
    ///   not start with '/', or contains a '~' not followed by '0' or '1'.
    static auto parse(std::string_view text) -> Pointer;

    /// Escape a single token: '~' -> "~0", '/' -> "~1".
    static auto escape(std::string_view token) -> std::string;

    /// The pointer text, with every token escaped.
    auto to_string() const -> std::string;

    auto tokens() const noexcept -> const std::vector<std::string>& { return tokens_; }
    auto size() const noexcept -> std::size_t { return tokens_.size(); }
    auto empty() const noexcept -> bool { return tokens_.empty(); }

    /// The last token. Precondition: !empty().
    auto back() const -> const std::string& { return tokens_.back(); }

    /// This pointer without its last token. The parent of the root is the root.
    auto parent() const -> Pointer;

    /// True if every token of this pointer is a leading token of `other`.
    /// A pointer is a prefix of itself.
    auto is_prefix_of(const Pointer& other) const noexcept -> bool;

    /// A new pointer with `token` appended.
    friend auto operator/(Pointer lhs, std::string token) -> Pointer {
        lhs.tokens_.push_back(std::move(token));
        return lhs;
    }

    auto operator==(const Pointer&) const -> bool = default;

private:
    std::vector<std::string> tokens_;
};

/// Parse an array index token: "0" or digits without a leading zero.
/// Returns nullopt for "-", signs, leading zeros, non-digits and overflow.
auto parse_array_index(std::string_view token) -> std::optional<std::size_t>;

/// Resolve a pointer to an existing value.
///
/// Every token must name an existing object member or an in-bounds array
/// element.
/// @throws PatchError(path_not_found) for a missing key, a token applied to
///   a scalar, or an out-of-range index before the last token.
/// @throws PatchError(invalid_array_index) for a malformed index or "-",
///   or an out-of-range last index.
auto resolve(Value& root, const Pointer& pointer) -> Value&;
auto resolve(const Value& root, const Pointer& pointer) -> const Value&;

/// Resolve the container that holds the last token of `pointer`.
///
/// Every token of the parent is intermediate, so an out-of-range index
/// anywhere is path_not_found. The parent of the root pointer is the root.
auto resolve_parent(Value& root, const Pointer& pointer) -> Value&;

/// Non-throwing lookup: nullptr wherever resolve() would throw.
auto try_resolve(const Value& root, const Pointer& pointer) noexcept -> const Value*;

}  // namespace jsonpatch_cpp
