/// @file patch.hpp
/// @brief Patch: an ordered list of operations, and the runner that applies it.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/op.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace jsonpatch_cpp {

/// An RFC 6902 patch. Operations run left to right.
using Patch = std::vector<Operation>;

/// Thrown by apply() when one operation of a patch fails.
///
/// kind() is the kind of the underlying failure. The failing operation is
/// available by index and content, and a failed test also carries what it
/// compared.
class OperationError : public PatchError {
public:
    OperationError(std::size_t index, Operation operation, const Error& cause,
                   std::optional<TestMismatch> mismatch = std::nullopt);

    /// Zero-based position of the failing operation in the patch.
    auto index() const noexcept -> std::size_t { return index_; }

    auto operation() const noexcept -> const Operation& { return operation_; }

    /// Set when the failing operation was a test.
    auto mismatch() const noexcept -> const std::optional<TestMismatch>& { return mismatch_; }

    /// The failure without the operation context.
    auto cause() const noexcept -> const Error& { return cause_; }

private:
    std::size_t index_;
    Operation operation_;
    Error cause_;
    std::optional<TestMismatch> mismatch_;
};

/// Apply a patch to a document and return the patched copy.
///
/// The operations run in order on a private copy of `document`; the first
/// failure aborts the run. `document` itself is never modified, whether
/// the patch succeeds or not.
///
/// @code
/// auto doc = decode(R"({"a":[1,2,3]})");
/// auto patched = apply(doc, decode_patch(R"([{"op":"add","path":"/a/1","value":9}])"));
/// // encode(patched) == R"({"a":[1,9,2,3]})"
/// @endcode
/// @throws OperationError naming the failing operation.
auto apply(const Value& document, const Patch& patch) -> Value;

}  // namespace jsonpatch_cpp
