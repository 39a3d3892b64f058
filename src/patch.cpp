#include <jsonpatch-cpp/patch.hpp>

#include <string>
#include <utility>

namespace jsonpatch_cpp {

namespace {

auto describe(std::size_t index, const Operation& op, const Error& cause) -> std::string {
    return "operation " + std::to_string(index) + " (" +
           std::string{to_string_view(op_type(op))} + " \"" +
           op_path(op).to_string() + "\"): " + cause.message;
}

}  // anonymous namespace

OperationError::OperationError(std::size_t index, Operation operation, const Error& cause,
                               std::optional<TestMismatch> mismatch)
    : PatchError{Error{cause.kind, describe(index, operation, cause)}},
      index_{index},
      operation_{std::move(operation)},
      cause_{cause},
      mismatch_{std::move(mismatch)} {}

auto apply(const Value& document, const Patch& patch) -> Value {
    auto working = document;
    for (std::size_t i = 0; i < patch.size(); ++i) {
        try {
            apply_operation(working, patch[i]);
        } catch (const TestFailedError& e) {
            throw OperationError{i, patch[i], e.error(), e.mismatch()};
        } catch (const PatchError& e) {
            throw OperationError{i, patch[i], e.error()};
        }
    }
    return working;
}

}  // namespace jsonpatch_cpp
