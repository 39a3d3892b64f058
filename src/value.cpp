#include <jsonpatch-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <limits>
#include <type_traits>
#include <utility>

namespace jsonpatch_cpp {

// =============================================================================
// Number
// =============================================================================

auto Number::as_double() const noexcept -> double {
    return std::visit([](auto v) { return static_cast<double>(v); }, repr_);
}

auto Number::as_int64() const noexcept -> std::optional<std::int64_t> {
    return std::visit(overload{
        [](std::int64_t v) -> std::optional<std::int64_t> { return v; },
        [](std::uint64_t v) -> std::optional<std::int64_t> {
            if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return std::nullopt;
            }
            return static_cast<std::int64_t>(v);
        },
        [](double) -> std::optional<std::int64_t> { return std::nullopt; },
    }, repr_);
}

auto Number::to_string() const -> std::string {
    if (literal_) return *literal_;
    return std::visit(overload{
        [](std::int64_t v) { return std::to_string(v); },
        [](std::uint64_t v) { return std::to_string(v); },
        // nlohmann/json prints the shortest text that reads back to the same double
        [](double v) { return nlohmann::json(v).dump(); },
    }, repr_);
}

auto operator==(const Number& a, const Number& b) noexcept -> bool {
    if (a.literal_ && b.literal_ && *a.literal_ == *b.literal_) return true;
    return std::visit([](auto x, auto y) {
        if constexpr (std::is_integral_v<decltype(x)> && std::is_integral_v<decltype(y)>) {
            return std::cmp_equal(x, y);
        } else {
            return static_cast<double>(x) == static_cast<double>(y);
        }
    }, a.repr_, b.repr_);
}

// =============================================================================
// Object
// =============================================================================

Object::Object(std::initializer_list<Entry> entries) {
    entries_.reserve(entries.size());
    for (const auto& [key, value] : entries) {
        set(key, value);
    }
}

auto Object::size() const noexcept -> std::size_t { return entries_.size(); }

auto Object::empty() const noexcept -> bool { return entries_.empty(); }

auto Object::contains(const std::string& key) const -> bool {
    return index_.contains(key);
}

auto Object::find(const std::string& key) -> Value* {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

auto Object::find(const std::string& key) const -> const Value* {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

auto Object::set(std::string key, Value value) -> Value& {
    if (auto it = index_.find(key); it != index_.end()) {
        auto& slot = entries_[it->second].second;
        slot = std::move(value);
        return slot;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(std::move(key), std::move(value));
    return entries_.back().second;
}

auto Object::erase(const std::string& key) -> bool {
    return take(key).has_value();
}

auto Object::take(const std::string& key) -> std::optional<Value> {
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    const auto pos = it->second;
    index_.erase(it);

    auto removed = std::optional<Value>{std::move(entries_[pos].second)};
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
    for (auto i = pos; i < entries_.size(); ++i) {
        index_[entries_[i].first] = i;
    }
    return removed;
}

auto Object::begin() const -> const_iterator { return entries_.begin(); }

auto Object::end() const -> const_iterator { return entries_.end(); }

auto operator==(const Object& a, const Object& b) -> bool {
    if (a.size() != b.size()) return false;
    for (const auto& [key, value] : a.entries_) {
        const auto* other = b.find(key);
        if (!other || !(value == *other)) return false;
    }
    return true;
}

// =============================================================================
// Value
// =============================================================================

auto operator==(const Value& a, const Value& b) -> bool {
    if (a.storage_.index() != b.storage_.index()) return false;
    return std::visit([&](const auto& lhs) {
        using T = std::decay_t<decltype(lhs)>;
        return lhs == std::get<T>(b.storage_);
    }, a.storage_);
}

}  // namespace jsonpatch_cpp
