#include <jsonpatch-cpp/op.hpp>

#include <jsonpatch-cpp/json.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <utility>

namespace jsonpatch_cpp {

auto op_type_from_string(std::string_view name) -> std::optional<OpType> {
    static constexpr auto all = std::array{
        OpType::add, OpType::remove, OpType::replace,
        OpType::move, OpType::copy, OpType::test,
    };
    for (auto type : all) {
        if (to_string_view(type) == name) return type;
    }
    return std::nullopt;
}

auto op_type(const Operation& op) noexcept -> OpType {
    return static_cast<OpType>(op.index());
}

auto op_path(const Operation& op) noexcept -> const Pointer& {
    return std::visit([](const auto& o) -> const Pointer& { return o.path; }, op);
}

TestFailedError::TestFailedError(TestMismatch mismatch)
    : PatchError{ErrorKind::test_failed,
                 "test failed at \"" + mismatch.path.to_string() + "\": expected " +
                 encode(mismatch.expected) + ", found " + encode(mismatch.actual)},
      mismatch_{std::move(mismatch)} {}

// =============================================================================
// Primitive edits
//
// Each helper validates everything it needs before it touches the
// document, so a throw leaves the document as it was.
// =============================================================================

namespace {

/// Position addressed by the last token of `path` inside an array, for add.
auto insertion_index(const Array& arr, const Pointer& path) -> std::size_t {
    const auto& token = path.back();
    if (token == "-") return arr.size();
    auto idx = parse_array_index(token);
    if (!idx) {
        throw PatchError{ErrorKind::invalid_array_index,
                         "invalid array index \"" + token + "\" in \"" + path.to_string() + "\""};
    }
    if (*idx > arr.size()) {
        throw PatchError{ErrorKind::invalid_array_index,
                         "insertion index " + token + " is past the end of the array (size " +
                         std::to_string(arr.size()) + ") in \"" + path.to_string() + "\""};
    }
    return *idx;
}

/// Position addressed by the last token of `path` inside an array, for remove.
auto element_index(const Array& arr, const Pointer& path) -> std::size_t {
    const auto& token = path.back();
    auto idx = parse_array_index(token);
    if (!idx) {
        throw PatchError{ErrorKind::invalid_array_index,
                         "invalid array index \"" + token + "\" in \"" + path.to_string() + "\""};
    }
    if (*idx >= arr.size()) {
        throw PatchError{ErrorKind::invalid_array_index,
                         "array index " + token + " out of range (size " +
                         std::to_string(arr.size()) + ") in \"" + path.to_string() + "\""};
    }
    return *idx;
}

[[noreturn]] void throw_scalar_parent(const Value& parent, const Pointer& path) {
    throw PatchError{ErrorKind::path_not_found,
                     "parent of \"" + path.to_string() + "\" is a " +
                     std::string{to_string_view(parent.kind())} + ", not a container"};
}

void add_at(Value& doc, const Pointer& path, Value value) {
    if (path.empty()) {
        doc = std::move(value);
        return;
    }
    auto& parent = resolve_parent(doc, path);
    if (auto* obj = parent.get_if<Object>()) {
        obj->set(path.back(), std::move(value));
        return;
    }
    if (auto* arr = parent.get_if<Array>()) {
        auto idx = insertion_index(*arr, path);
        arr->insert(arr->begin() + static_cast<std::ptrdiff_t>(idx), std::move(value));
        return;
    }
    throw_scalar_parent(parent, path);
}

auto remove_at(Value& doc, const Pointer& path) -> Value {
    if (path.empty()) {
        throw PatchError{ErrorKind::path_not_found, "cannot remove the document root"};
    }
    auto& parent = resolve_parent(doc, path);
    if (auto* obj = parent.get_if<Object>()) {
        auto removed = obj->take(path.back());
        if (!removed) {
            throw PatchError{ErrorKind::path_not_found,
                             "key \"" + path.back() + "\" not found removing \"" +
                             path.to_string() + "\""};
        }
        return std::move(*removed);
    }
    if (auto* arr = parent.get_if<Array>()) {
        auto idx = element_index(*arr, path);
        auto pos = arr->begin() + static_cast<std::ptrdiff_t>(idx);
        auto removed = std::move(*pos);
        arr->erase(pos);
        return removed;
    }
    throw_scalar_parent(parent, path);
}

}  // anonymous namespace

// =============================================================================
// Operation executor
// =============================================================================

void apply_operation(Value& doc, const Operation& op) {
    std::visit(overload{
        [&](const AddOp& o) {
            add_at(doc, o.path, o.value);
        },
        [&](const RemoveOp& o) {
            (void)remove_at(doc, o.path);
        },
        [&](const ReplaceOp& o) {
            auto& target = resolve(doc, o.path);
            auto replacement = o.value;
            target = std::move(replacement);
        },
        [&](const MoveOp& o) {
            (void)resolve(std::as_const(doc), o.from);
            if (o.from.is_prefix_of(o.path)) {
                throw PatchError{ErrorKind::invalid_move,
                                 "cannot move \"" + o.from.to_string() + "\" to \"" +
                                 o.path.to_string() + "\": target is the source or inside it"};
            }
            // Stage on a clone so a failing add leaves `doc` untouched.
            auto staged = doc;
            auto moved = remove_at(staged, o.from);
            add_at(staged, o.path, std::move(moved));
            doc = std::move(staged);
        },
        [&](const CopyOp& o) {
            auto copied = resolve(std::as_const(doc), o.from);
            add_at(doc, o.path, std::move(copied));
        },
        [&](const TestOp& o) {
            const auto& actual = resolve(std::as_const(doc), o.path);
            if (!(actual == o.value)) {
                throw TestFailedError{TestMismatch{o.path, o.value, actual}};
            }
        },
    }, op);
}

}  // namespace jsonpatch_cpp
