#include <jsonpatch-cpp/pointer.hpp>

#include <jsonpatch-cpp/error.hpp>

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace jsonpatch_cpp {

// =============================================================================
// Parsing and escaping
// =============================================================================

namespace {

auto unescape_token(std::string_view raw, std::string_view pointer) -> std::string {
    auto token = std::string{};
    token.reserve(raw.size());
    for (auto i = std::size_t{0}; i < raw.size(); ++i) {
        if (raw[i] != '~') {
            token.push_back(raw[i]);
            continue;
        }
        if (i + 1 < raw.size() && raw[i + 1] == '0') {
            token.push_back('~');
        } else if (i + 1 < raw.size() && raw[i + 1] == '1') {
            token.push_back('/');
        } else {
            throw PatchError{ErrorKind::malformed_pointer,
                             "invalid escape sequence in JSON Pointer \"" +
                             std::string{pointer} + "\""};
        }
        ++i;
    }
    return token;
}

}  // anonymous namespace

auto Pointer::parse(std::string_view text) -> Pointer {
    if (text.empty()) return Pointer{};
    if (text[0] != '/') {
        throw PatchError{ErrorKind::malformed_pointer,
                         "JSON Pointer \"" + std::string{text} +
                         "\" must be empty or start with '/'"};
    }
    auto tokens = std::vector<std::string>{};
    auto pos = std::size_t{1};
    while (true) {
        auto next = text.find('/', pos);
        tokens.push_back(unescape_token(text.substr(pos, next - pos), text));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return Pointer{std::move(tokens)};
}

auto Pointer::escape(std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    for (char c : token) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

auto Pointer::to_string() const -> std::string {
    auto result = std::string{};
    for (const auto& token : tokens_) {
        result += '/';
        result += escape(token);
    }
    return result;
}

auto Pointer::parent() const -> Pointer {
    if (tokens_.empty()) return Pointer{};
    return Pointer{std::vector<std::string>(tokens_.begin(), tokens_.end() - 1)};
}

auto Pointer::is_prefix_of(const Pointer& other) const noexcept -> bool {
    if (tokens_.size() > other.tokens_.size()) return false;
    for (auto i = std::size_t{0}; i < tokens_.size(); ++i) {
        if (tokens_[i] != other.tokens_[i]) return false;
    }
    return true;
}

auto parse_array_index(std::string_view token) -> std::optional<std::size_t> {
    if (token.empty()) return std::nullopt;
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (token.size() > 1 && token[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
    if (ec == std::errc{} && ptr == token.data() + token.size()) return result;
    return std::nullopt;
}

// =============================================================================
// Resolution
// =============================================================================

namespace {

/// Outcome of stepping one token into a value.
enum class Step : std::uint8_t {
    ok,
    missing_key,
    not_a_container,
    bad_index,
    index_out_of_range,
};

/// Step from `current` through `token`. Works for Value and const Value.
template <typename V>
auto step(V& current, const std::string& token, V*& child) noexcept -> Step {
    if (auto* obj = current.template get_if<Object>()) {
        child = obj->find(token);
        return child ? Step::ok : Step::missing_key;
    }
    if (auto* arr = current.template get_if<Array>()) {
        auto idx = parse_array_index(token);
        if (!idx) return Step::bad_index;
        if (*idx >= arr->size()) return Step::index_out_of_range;
        child = &(*arr)[*idx];
        return Step::ok;
    }
    return Step::not_a_container;
}

/// Walk every token of `pointer`. When `last_is_target` is false the last
/// token is reported like an intermediate one.
template <typename V>
auto resolve_impl(V& root, const Pointer& pointer, bool last_is_target) -> V& {
    auto* current = &root;
    const auto& tokens = pointer.tokens();
    for (auto i = std::size_t{0}; i < tokens.size(); ++i) {
        auto is_last = last_is_target && (i + 1 == tokens.size());
        V* child = nullptr;
        switch (step(*current, tokens[i], child)) {
            case Step::ok:
                current = child;
                continue;
            case Step::missing_key:
                throw PatchError{ErrorKind::path_not_found,
                                 "key \"" + tokens[i] + "\" not found at \"" +
                                 Pointer{std::vector<std::string>(tokens.begin(), tokens.begin() + i)}.to_string() +
                                 "\" resolving \"" + pointer.to_string() + "\""};
            case Step::not_a_container:
                throw PatchError{ErrorKind::path_not_found,
                                 "cannot step into a " +
                                 std::string{to_string_view(current->kind())} +
                                 " resolving \"" + pointer.to_string() + "\""};
            case Step::bad_index:
                throw PatchError{ErrorKind::invalid_array_index,
                                 "invalid array index \"" + tokens[i] +
                                 "\" resolving \"" + pointer.to_string() + "\""};
            case Step::index_out_of_range:
                throw PatchError{is_last ? ErrorKind::invalid_array_index
                                         : ErrorKind::path_not_found,
                                 "array index " + tokens[i] + " out of range resolving \"" +
                                 pointer.to_string() + "\""};
        }
    }
    return *current;
}

}  // anonymous namespace

auto resolve(Value& root, const Pointer& pointer) -> Value& {
    return resolve_impl(root, pointer, true);
}

auto resolve(const Value& root, const Pointer& pointer) -> const Value& {
    return resolve_impl(root, pointer, true);
}

auto resolve_parent(Value& root, const Pointer& pointer) -> Value& {
    return resolve_impl(root, pointer.parent(), false);
}

auto try_resolve(const Value& root, const Pointer& pointer) noexcept -> const Value* {
    const auto* current = &root;
    for (const auto& token : pointer.tokens()) {
        const Value* child = nullptr;
        if (step(*current, token, child) != Step::ok) return nullptr;
        current = child;
    }
    return current;
}

}  // namespace jsonpatch_cpp
