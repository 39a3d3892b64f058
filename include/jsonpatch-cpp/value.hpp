/// @file value.hpp
/// @brief The document model: Null, Number, Object, Array and Value.

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace jsonpatch_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A JSON number that remembers how it was written.
///
/// Integers that fit in 64 bits are stored exactly. Every other literal
/// (decimals, exponents, integers wider than 64 bits) is stored as a
/// double together with its source text, and the source text is what
/// gets encoded again. Equality is numeric: `1`, `1.0` and `1e0` compare
/// equal.
class Number {
public:
    using Repr = std::variant<std::int64_t, std::uint64_t, double>;

    Number() = default;

    template <std::signed_integral T>
    Number(T v) : repr_{static_cast<std::int64_t>(v)} {}

    template <std::unsigned_integral T>
        requires (!std::same_as<T, bool>)
    Number(T v) : repr_{static_cast<std::uint64_t>(v)} {}

    Number(double v) : repr_{v} {}

    /// A floating value decoded from text; `literal` is kept for encoding.
    Number(double v, std::string literal)
        : repr_{v}, literal_{std::move(literal)} {}

    auto repr() const noexcept -> const Repr& { return repr_; }

    auto is_integer() const noexcept -> bool { return !std::holds_alternative<double>(repr_); }

    /// The value as a double (may round for large integers).
    auto as_double() const noexcept -> double;

    /// The value as int64_t if it is an integer that fits.
    auto as_int64() const noexcept -> std::optional<std::int64_t>;

    /// The original literal, if this number was decoded from text as a float.
    auto literal() const noexcept -> const std::optional<std::string>& { return literal_; }

    /// Canonical text: the source literal when there is one, otherwise
    /// the shortest representation that round-trips.
    auto to_string() const -> std::string;

    friend auto operator==(const Number& a, const Number& b) noexcept -> bool;

private:
    Repr repr_{std::int64_t{0}};
    std::optional<std::string> literal_;
};

class Value;

/// An ordered sequence of values.
using Array = std::vector<Value>;

/// An object whose keys are unique and iterate in insertion order.
///
/// Entries live in a vector; a hash index maps each key to its position.
/// Overwriting a key keeps its position, new keys are appended and
/// erasing a key shifts the later entries down.
class Object {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Object() = default;
    Object(std::initializer_list<Entry> entries);

    auto size() const noexcept -> std::size_t;
    auto empty() const noexcept -> bool;

    auto contains(const std::string& key) const -> bool;

    /// Look up a key. Returns nullptr if the key is absent.
    auto find(const std::string& key) -> Value*;
    auto find(const std::string& key) const -> const Value*;

    /// Insert or overwrite. Returns a reference to the stored value.
    auto set(std::string key, Value value) -> Value&;

    /// Remove a key. Returns false if the key was absent.
    auto erase(const std::string& key) -> bool;

    /// Remove a key and return its value. Returns nullopt if the key was absent.
    auto take(const std::string& key) -> std::optional<Value>;

    auto begin() const -> const_iterator;
    auto end() const -> const_iterator;

    /// Key order is not significant for equality.
    friend auto operator==(const Object& a, const Object& b) -> bool;

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

/// The six kinds of JSON value.
enum class ValueKind : std::uint8_t {
    null,
    boolean,
    number,
    string,
    array,
    object,
};

/// Convert a ValueKind to its string representation.
constexpr auto to_string_view(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::null:    return "null";
        case ValueKind::boolean: return "boolean";
        case ValueKind::number:  return "number";
        case ValueKind::string:  return "string";
        case ValueKind::array:   return "array";
        case ValueKind::object:  return "object";
    }
    return "unknown";
}

/// Deepest container nesting the decoders accept. Copying, comparing and
/// destroying a Value recurse once per level.
inline constexpr std::size_t max_nesting_depth = 1000;

/// A JSON value: a closed tagged union over the six JSON kinds.
///
/// Value has value semantics. Copying a Value deep-copies the whole tree,
/// so two values never share a subtree.
///
/// @code
/// auto doc = Value{Object{{"name", "Alice"}, {"tags", Array{"a", "b"}}}};
/// if (auto* tags = doc.get_if<Object>()->find("tags")) {
///     tags->as<Array>().push_back("c");
/// }
/// @endcode
class Value {
public:
    using Storage = std::variant<Null, bool, Number, std::string, Array, Object>;

    Value() = default;
    Value(Null) {}
    Value(std::nullptr_t) {}
    Value(bool b) : storage_{b} {}
    Value(Number n) : storage_{std::move(n)} {}

    template <typename T>
        requires (std::integral<T> && !std::same_as<T, bool>)
    Value(T v) : storage_{Number{v}} {}

    Value(double d) : storage_{Number{d}} {}
    Value(std::string s) : storage_{std::move(s)} {}
    Value(std::string_view s) : storage_{std::string{s}} {}
    Value(const char* s) : storage_{std::string{s}} {}
    Value(Array a) : storage_{std::move(a)} {}
    Value(Object o) : storage_{std::move(o)} {}

    auto kind() const noexcept -> ValueKind { return static_cast<ValueKind>(storage_.index()); }

    auto is_null() const noexcept -> bool { return kind() == ValueKind::null; }
    auto is_container() const noexcept -> bool {
        return kind() == ValueKind::array || kind() == ValueKind::object;
    }

    template <typename T>
    auto is() const noexcept -> bool { return std::holds_alternative<T>(storage_); }

    /// Typed access. Throws std::bad_variant_access on a kind mismatch.
    template <typename T>
    auto as() -> T& { return std::get<T>(storage_); }
    template <typename T>
    auto as() const -> const T& { return std::get<T>(storage_); }

    /// Typed access, or nullptr on a kind mismatch.
    template <typename T>
    auto get_if() noexcept -> T* { return std::get_if<T>(&storage_); }
    template <typename T>
    auto get_if() const noexcept -> const T* { return std::get_if<T>(&storage_); }

    auto storage() noexcept -> Storage& { return storage_; }
    auto storage() const noexcept -> const Storage& { return storage_; }

    /// Deep structural equality: arrays are order-sensitive, objects are not,
    /// numbers compare by value.
    friend auto operator==(const Value& a, const Value& b) -> bool;

private:
    Storage storage_;
};

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { std::printf("%s\n", s.c_str()); },
///     [](const Number& n) { std::printf("%s\n", n.to_string().c_str()); },
///     [](const auto&) { std::printf("other\n"); },
/// }, value.storage());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jsonpatch_cpp
