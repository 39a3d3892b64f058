/// @file batch.hpp
/// @brief Batch application: one patch per selector, all-or-nothing.
///
/// A batch descriptor pairs selectors with patches:
///
/// @code
/// [
///   { "glob": "*.json", "jsonPatch": [ { "op": "add", "path": "/a", "value": 1 } ] },
///   { "glob": "*.yaml", "jsonPatch": [ { "op": "remove", "path": "/b" } ] }
/// ]
/// @endcode
///
/// Documents are found and loaded through a DocumentSource. run_batch()
/// either returns every patched document or throws; callers write
/// nothing unless it returns.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

/// One selector/patch pair of a batch descriptor.
struct BatchEntry {
    std::string selector;  ///< Which documents the patch applies to (a glob for files).
    Patch patch;           ///< The patch to apply to every matched document.
    auto operator==(const BatchEntry&) const -> bool = default;
};

/// A batch descriptor. Entries run in order.
using Batch = std::vector<BatchEntry>;

/// Decode a batch descriptor.
/// @throws PatchError(malformed_patch) for a descriptor that is not an
///   array of {"glob", "jsonPatch"} objects, including unknown members,
///   plus any error decode_patch() raises for an entry's patch.
auto decode_batch(std::string_view text) -> Batch;
auto decode_batch(const Value& value) -> Batch;

/// Where a batch finds its documents.
///
/// load() may be called from several threads at once.
class DocumentSource {
public:
    virtual ~DocumentSource() = default;

    /// Identifiers of the documents matching `selector`, in a stable order.
    virtual auto match(const std::string& selector) const -> std::vector<std::string> = 0;

    /// Load and decode one document.
    virtual auto load(const std::string& id) const -> Value = 0;
};

/// A document after every entry that matched it has been applied.
struct PatchedDocument {
    std::string id;
    Value value;
    auto operator==(const PatchedDocument&) const -> bool = default;
};

/// Thrown by run_batch() and run_patch() when one document fails.
class BatchError : public PatchError {
public:
    BatchError(std::size_t entry_index, std::string document, const Error& cause);

    /// Zero-based index of the batch entry that failed.
    auto entry_index() const noexcept -> std::size_t { return entry_index_; }

    /// The document the entry failed on (the selector if matching failed).
    auto document() const noexcept -> const std::string& { return document_; }

    auto cause() const noexcept -> const Error& { return cause_; }

private:
    std::size_t entry_index_;
    std::string document_;
    Error cause_;
};

/// Apply a batch.
///
/// Entries run in order. The documents matched by one entry are patched
/// independently and in parallel. A document matched by several entries
/// receives their patches in entry order.
/// @return Every patched document, in order of first match.
/// @throws BatchError for the first failure, by entry and then by match
///   order. Nothing is returned for any document in that case.
auto run_batch(const Batch& batch, const DocumentSource& source)
    -> std::vector<PatchedDocument>;

/// Apply one patch to the listed documents, all-or-nothing.
/// @throws BatchError (entry index 0) for the first failing document.
auto run_patch(const Patch& patch, const std::vector<std::string>& documents,
               const DocumentSource& source) -> std::vector<PatchedDocument>;

}  // namespace jsonpatch_cpp
