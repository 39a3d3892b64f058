/// @file op.hpp
/// @brief RFC 6902 operations and the executor that applies one of them.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace jsonpatch_cpp {

/// The six RFC 6902 operation kinds.
enum class OpType : std::uint8_t {
    add,
    remove,
    replace,
    move,
    copy,
    test,
};

/// Convert an OpType to its RFC 6902 "op" name.
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::add:     return "add";
        case OpType::remove:  return "remove";
        case OpType::replace: return "replace";
        case OpType::move:    return "move";
        case OpType::copy:    return "copy";
        case OpType::test:    return "test";
    }
    return "unknown";
}

/// Parse an RFC 6902 "op" name. Returns nullopt for anything else.
auto op_type_from_string(std::string_view name) -> std::optional<OpType>;

/// Insert `value` at `path`: before an array index, at the end for "-",
/// or create/overwrite an object member.
struct AddOp {
    Pointer path;
    Value value;
    auto operator==(const AddOp&) const -> bool = default;
};

/// Delete the value at `path`.
struct RemoveOp {
    Pointer path;
    auto operator==(const RemoveOp&) const -> bool = default;
};

/// Overwrite the existing value at `path`.
struct ReplaceOp {
    Pointer path;
    Value value;
    auto operator==(const ReplaceOp&) const -> bool = default;
};

/// Remove the value at `from` and add it at `path`.
struct MoveOp {
    Pointer from;
    Pointer path;
    auto operator==(const MoveOp&) const -> bool = default;
};

/// Add a deep copy of the value at `from` at `path`.
struct CopyOp {
    Pointer from;
    Pointer path;
    auto operator==(const CopyOp&) const -> bool = default;
};

/// Assert that the value at `path` equals `value`.
struct TestOp {
    Pointer path;
    Value value;
    auto operator==(const TestOp&) const -> bool = default;
};

/// One RFC 6902 operation.
using Operation = std::variant<
    AddOp,
    RemoveOp,
    ReplaceOp,
    MoveOp,
    CopyOp,
    TestOp
>;

/// The kind of an operation.
auto op_type(const Operation& op) noexcept -> OpType;

/// The target `path` of an operation.
auto op_path(const Operation& op) noexcept -> const Pointer&;

/// What a failed test operation compared.
struct TestMismatch {
    Pointer path;    ///< The tested location.
    Value expected;  ///< The operation's value.
    Value actual;    ///< The value found in the document.
    auto operator==(const TestMismatch&) const -> bool = default;
};

/// Thrown when a test operation's comparison does not hold.
class TestFailedError : public PatchError {
public:
    explicit TestFailedError(TestMismatch mismatch);

    auto mismatch() const noexcept -> const TestMismatch& { return mismatch_; }

private:
    TestMismatch mismatch_;
};

/// Apply one operation to `doc` in place.
///
/// Strong guarantee: when this throws, `doc` is unchanged.
/// @throws PatchError with kind path_not_found, invalid_array_index or
///   invalid_move, or TestFailedError for a failed test.
void apply_operation(Value& doc, const Operation& op);

}  // namespace jsonpatch_cpp
