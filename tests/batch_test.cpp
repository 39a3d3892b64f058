#include <jsonpatch-cpp/batch.hpp>

#include <jsonpatch-cpp/json.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <string>
#include <utility>
#include <vector>

using namespace jsonpatch_cpp;

namespace {

/// Documents held in memory. A selector ending in '*' matches by prefix,
/// anything else must name a document exactly.
class MemorySource final : public DocumentSource {
public:
    explicit MemorySource(std::map<std::string, std::string> documents)
        : documents_{std::move(documents)} {}

    auto match(const std::string& selector) const -> std::vector<std::string> override {
        auto ids = std::vector<std::string>{};
        if (!selector.empty() && selector.back() == '*') {
            const auto prefix = selector.substr(0, selector.size() - 1);
            for (const auto& [id, _] : documents_) {
                if (id.rfind(prefix, 0) == 0) ids.push_back(id);
            }
        } else if (documents_.contains(selector)) {
            ids.push_back(selector);
        }
        return ids;
    }

    auto load(const std::string& id) const -> Value override {
        ++loads_;
        auto it = documents_.find(id);
        if (it == documents_.end()) {
            throw PatchError{ErrorKind::io_error, "cannot open " + id};
        }
        return decode(it->second);
    }

    auto loads() const -> int { return loads_.load(); }

private:
    std::map<std::string, std::string> documents_;
    mutable std::atomic<int> loads_{0};
};

auto batch_error(const Batch& batch, const DocumentSource& source) -> BatchError {
    try {
        (void)run_batch(batch, source);
    } catch (const BatchError& e) {
        return e;
    }
    ADD_FAILURE() << "expected run_batch to fail";
    return BatchError{0, "", Error{ErrorKind::io_error, "no error"}};
}

auto decode_batch_kind(const std::string& text) -> ErrorKind {
    try {
        (void)decode_batch(text);
    } catch (const PatchError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected decode_batch to fail on " << text;
    return ErrorKind::io_error;
}

}  // anonymous namespace

// =============================================================================
// Descriptor decoding
// =============================================================================

TEST(DecodeBatch, entries_in_order) {
    const auto batch = decode_batch(R"([
        {"glob":"*.json","jsonPatch":[{"op":"add","path":"/a","value":1}]},
        {"jsonPatch":[],"glob":"*.yaml"}
    ])");

    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0].selector, "*.json");
    EXPECT_EQ(batch[0].patch, decode_patch(R"([{"op":"add","path":"/a","value":1}])"));
    EXPECT_EQ(batch[1].selector, "*.yaml");
    EXPECT_TRUE(batch[1].patch.empty());
}

TEST(DecodeBatch, must_be_an_array_of_objects) {
    EXPECT_EQ(decode_batch_kind(R"({"glob":"*","jsonPatch":[]})"), ErrorKind::malformed_patch);
    EXPECT_EQ(decode_batch_kind(R"(["*"])"), ErrorKind::malformed_patch);
}

TEST(DecodeBatch, rejects_unknown_members) {
    try {
        (void)decode_batch(R"([{"glob":"*","jsonPatch":[],"extra":1}])");
        FAIL() << "unknown member accepted";
    } catch (const PatchError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::malformed_patch);
        EXPECT_NE(std::string{e.what()}.find("\"extra\""), std::string::npos) << e.what();
    }
}

TEST(DecodeBatch, requires_both_members) {
    EXPECT_EQ(decode_batch_kind(R"([{"jsonPatch":[]}])"), ErrorKind::malformed_patch);
    EXPECT_EQ(decode_batch_kind(R"([{"glob":"*"}])"), ErrorKind::malformed_patch);
    EXPECT_EQ(decode_batch_kind(R"([{"glob":1,"jsonPatch":[]}])"), ErrorKind::malformed_patch);
}

TEST(DecodeBatch, patch_errors_name_the_entry) {
    try {
        (void)decode_batch(R"([{"glob":"*","jsonPatch":[]},{"glob":"*","jsonPatch":[{"op":"nope","path":""}]}])");
        FAIL() << "unknown op accepted";
    } catch (const PatchError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::unknown_operation);
        EXPECT_EQ(std::string{e.what()}.rfind("batch entry 1: ", 0), 0u) << e.what();
    }
}

// =============================================================================
// Running
// =============================================================================

TEST(RunBatch, applies_each_entry_to_its_matches) {
    const auto source = MemorySource{{
        {"a.json", R"({"n":1})"},
        {"b.json", R"({"n":2})"},
        {"c.yaml", R"({"n":3})"},
    }};
    const auto batch = decode_batch(R"([
        {"glob":"a*","jsonPatch":[{"op":"add","path":"/tag","value":"a"}]},
        {"glob":"c*","jsonPatch":[{"op":"remove","path":"/n"}]}
    ])");

    const auto docs = run_batch(batch, source);
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs[0].id, "a.json");
    EXPECT_EQ(encode(docs[0].value), R"({"n":1,"tag":"a"})");
    EXPECT_EQ(docs[1].id, "c.yaml");
    EXPECT_EQ(encode(docs[1].value), "{}");
}

TEST(RunBatch, chains_entries_matching_the_same_document) {
    const auto source = MemorySource{{{"doc.json", R"({"list":[]})"}}};
    const auto batch = decode_batch(R"([
        {"glob":"doc.json","jsonPatch":[{"op":"add","path":"/list/-","value":1}]},
        {"glob":"doc*","jsonPatch":[{"op":"test","path":"/list/0","value":1},{"op":"add","path":"/list/-","value":2}]}
    ])");

    const auto docs = run_batch(batch, source);
    ASSERT_EQ(docs.size(), 1u);
    EXPECT_EQ(encode(docs[0].value), R"({"list":[1,2]})");
    EXPECT_EQ(source.loads(), 1);
}

TEST(RunBatch, selector_without_matches_is_not_an_error) {
    const auto source = MemorySource{{{"a.json", "{}"}}};
    const auto batch = decode_batch(R"([{"glob":"none*","jsonPatch":[{"op":"remove","path":"/x"}]}])");
    EXPECT_TRUE(run_batch(batch, source).empty());
}

TEST(RunBatch, failure_in_a_later_entry_returns_nothing) {
    const auto source = MemorySource{{
        {"a.json", R"({"a":1})"},
        {"b.json", R"({"b":1})"},
    }};
    const auto batch = decode_batch(R"([
        {"glob":"*","jsonPatch":[{"op":"add","path":"/seen","value":true}]},
        {"glob":"b.json","jsonPatch":[{"op":"remove","path":"/missing"}]}
    ])");

    const auto e = batch_error(batch, source);
    EXPECT_EQ(e.entry_index(), 1u);
    EXPECT_EQ(e.document(), "b.json");
    EXPECT_EQ(e.kind(), ErrorKind::path_not_found);
    EXPECT_EQ(e.cause().kind, ErrorKind::path_not_found);
}

TEST(RunBatch, reports_the_first_failure_in_match_order) {
    const auto source = MemorySource{{
        {"1.json", R"({"v":1})"},
        {"2.json", R"({"v":2})"},
        {"3.json", R"({"v":3})"},
    }};
    const auto batch = decode_batch(R"([{"glob":"*","jsonPatch":[{"op":"test","path":"/v","value":1}]}])");

    const auto e = batch_error(batch, source);
    EXPECT_EQ(e.entry_index(), 0u);
    EXPECT_EQ(e.document(), "2.json");
    EXPECT_EQ(e.kind(), ErrorKind::test_failed);
}

TEST(RunBatch, load_failures_are_batch_errors) {
    const auto source = MemorySource{{{"bad.json", "{not json"}}};
    const auto batch = decode_batch(R"([{"glob":"bad.json","jsonPatch":[]}])");

    const auto e = batch_error(batch, source);
    EXPECT_EQ(e.document(), "bad.json");
    EXPECT_EQ(e.cause().kind, ErrorKind::malformed_document);
}

TEST(RunBatch, patches_many_documents_in_parallel) {
    auto documents = std::map<std::string, std::string>{};
    for (int i = 0; i < 200; ++i) {
        documents.emplace("doc" + std::to_string(1000 + i), R"({"id":)" + std::to_string(i) + "}");
    }
    const auto source = MemorySource{documents};
    const auto batch = decode_batch(R"([{"glob":"doc*","jsonPatch":[{"op":"copy","from":"/id","path":"/copy"}]}])");

    const auto docs = run_batch(batch, source);
    ASSERT_EQ(docs.size(), 200u);
    for (std::size_t i = 0; i < docs.size(); ++i) {
        EXPECT_EQ(docs[i].id, "doc" + std::to_string(1000 + i));
        EXPECT_EQ(encode(docs[i].value),
                  R"({"id":)" + std::to_string(i) + R"(,"copy":)" + std::to_string(i) + "}");
    }
    EXPECT_EQ(source.loads(), 200);
}

// =============================================================================
// Single patch over listed documents
// =============================================================================

TEST(RunPatch, applies_to_each_listed_document_once) {
    const auto source = MemorySource{{
        {"x.json", "[]"},
        {"y.json", "[0]"},
    }};
    const auto patch = decode_patch(R"([{"op":"add","path":"/-","value":9}])");

    const auto docs = run_patch(patch, {"y.json", "x.json", "y.json"}, source);
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs[0].id, "y.json");
    EXPECT_EQ(encode(docs[0].value), "[0,9]");
    EXPECT_EQ(docs[1].id, "x.json");
    EXPECT_EQ(encode(docs[1].value), "[9]");
}

TEST(RunPatch, failure_names_the_document) {
    const auto source = MemorySource{{{"x.json", "{}"}}};
    const auto patch = decode_patch(R"([{"op":"replace","path":"/a","value":1}])");

    try {
        (void)run_patch(patch, {"x.json"}, source);
        FAIL() << "replace of a missing member succeeded";
    } catch (const BatchError& e) {
        EXPECT_EQ(e.entry_index(), 0u);
        EXPECT_EQ(e.document(), "x.json");
        EXPECT_EQ(e.kind(), ErrorKind::path_not_found);
    }
}

TEST(RunPatch, missing_document_is_io_error) {
    const auto source = MemorySource{std::map<std::string, std::string>{}};
    try {
        (void)run_patch(Patch{}, {"gone.json"}, source);
        FAIL() << "missing document loaded";
    } catch (const BatchError& e) {
        EXPECT_EQ(e.cause().kind, ErrorKind::io_error);
    }
}
