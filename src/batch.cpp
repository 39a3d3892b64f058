#include <jsonpatch-cpp/batch.hpp>

#include <jsonpatch-cpp/json.hpp>

#include "executor.hpp"

#include <exception>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace jsonpatch_cpp {

BatchError::BatchError(std::size_t entry_index, std::string document, const Error& cause)
    : PatchError{Error{cause.kind, "entry " + std::to_string(entry_index) + ", " +
                                   document + ": " + cause.message}},
      entry_index_{entry_index},
      document_{std::move(document)},
      cause_{cause} {}

// =============================================================================
// Descriptor decoding
// =============================================================================

namespace {

constexpr auto selector_member = "glob";
constexpr auto patch_member = "jsonPatch";

[[noreturn]] void throw_malformed(std::size_t index, const std::string& what) {
    throw PatchError{ErrorKind::malformed_patch,
                     "batch entry " + std::to_string(index) + ": " + what};
}

auto decode_entry(const Value& element, std::size_t index) -> BatchEntry {
    const auto* obj = element.get_if<Object>();
    if (!obj) {
        throw_malformed(index, "expected an object, not a " +
                               std::string{to_string_view(element.kind())});
    }
    for (const auto& [key, _] : *obj) {
        if (key != selector_member && key != patch_member) {
            throw_malformed(index, "unknown field \"" + key + "\"");
        }
    }

    const auto* selector = obj->find(selector_member);
    if (!selector) throw_malformed(index, "missing \"glob\"");
    const auto* glob = selector->get_if<std::string>();
    if (!glob) throw_malformed(index, "\"glob\" must be a string");

    const auto* patch = obj->find(patch_member);
    if (!patch) throw_malformed(index, "missing \"jsonPatch\"");

    try {
        return BatchEntry{*glob, decode_patch(*patch)};
    } catch (const PatchError& e) {
        throw PatchError{e.kind(), "batch entry " + std::to_string(index) + ": " + e.what()};
    }
}

}  // anonymous namespace

auto decode_batch(std::string_view text) -> Batch {
    return decode_batch(decode(text));
}

auto decode_batch(const Value& value) -> Batch {
    const auto* arr = value.get_if<Array>();
    if (!arr) {
        throw PatchError{ErrorKind::malformed_patch,
                         "batch file must be an array, not a " +
                         std::string{to_string_view(value.kind())}};
    }
    auto batch = Batch{};
    batch.reserve(arr->size());
    for (std::size_t i = 0; i < arr->size(); ++i) {
        batch.push_back(decode_entry((*arr)[i], i));
    }
    return batch;
}

// =============================================================================
// Running
// =============================================================================

namespace {

/// Patched documents accumulated across entries, in first-match order.
class Results {
public:
    auto find(const std::string& id) const -> const Value* {
        auto it = index_.find(id);
        return it == index_.end() ? nullptr : &documents_[it->second].value;
    }

    void put(const std::string& id, Value value) {
        if (auto it = index_.find(id); it != index_.end()) {
            documents_[it->second].value = std::move(value);
            return;
        }
        index_.emplace(id, documents_.size());
        documents_.push_back(PatchedDocument{id, std::move(value)});
    }

    auto release() -> std::vector<PatchedDocument> { return std::move(documents_); }

private:
    std::vector<PatchedDocument> documents_;
    std::unordered_map<std::string, std::size_t> index_;
};

auto unique_in_order(const std::vector<std::string>& ids) -> std::vector<std::string> {
    auto seen = std::unordered_set<std::string>{};
    auto result = std::vector<std::string>{};
    result.reserve(ids.size());
    for (const auto& id : ids) {
        if (seen.insert(id).second) result.push_back(id);
    }
    return result;
}

/// Apply `patch` to every document in `ids`, in parallel. Inputs come from
/// `results` when an earlier entry already patched the document.
/// `results` is only updated once every document has succeeded.
void apply_entry(std::size_t entry_index, const Patch& patch,
                 const std::vector<std::string>& ids,
                 const DocumentSource& source, Results& results) {
    auto outputs = std::vector<std::optional<Value>>(ids.size());
    auto failures = std::vector<std::exception_ptr>(ids.size());

    auto taskflow = tf::Taskflow{};
    for (std::size_t i = 0; i < ids.size(); ++i) {
        taskflow.emplace([&, i]() {
            try {
                if (const auto* previous = results.find(ids[i])) {
                    outputs[i] = jsonpatch_cpp::apply(*previous, patch);
                } else {
                    outputs[i] = jsonpatch_cpp::apply(source.load(ids[i]), patch);
                }
            } catch (...) {
                failures[i] = std::current_exception();
            }
        });
    }
    detail::global_executor().run(taskflow).wait();

    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (!failures[i]) continue;
        try {
            std::rethrow_exception(failures[i]);
        } catch (const PatchError& e) {
            throw BatchError{entry_index, ids[i], e.error()};
        }
    }

    for (std::size_t i = 0; i < ids.size(); ++i) {
        results.put(ids[i], std::move(*outputs[i]));
    }
}

}  // anonymous namespace

auto run_batch(const Batch& batch, const DocumentSource& source)
    -> std::vector<PatchedDocument> {
    auto results = Results{};
    for (std::size_t i = 0; i < batch.size(); ++i) {
        const auto& entry = batch[i];
        auto ids = std::vector<std::string>{};
        try {
            ids = unique_in_order(source.match(entry.selector));
        } catch (const PatchError& e) {
            throw BatchError{i, entry.selector, e.error()};
        }
        apply_entry(i, entry.patch, ids, source, results);
    }
    return results.release();
}

auto run_patch(const Patch& patch, const std::vector<std::string>& documents,
               const DocumentSource& source) -> std::vector<PatchedDocument> {
    auto results = Results{};
    apply_entry(0, patch, unique_in_order(documents), source, results);
    return results.release();
}

}  // namespace jsonpatch_cpp
