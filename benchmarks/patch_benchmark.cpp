// jsonpatch-cpp benchmarks: measures decoding, encoding and patch application.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace jsonpatch_cpp;

namespace {

/// {"items":[{"id":0,"name":"item0","price":0.5,"tags":["a","b"]}, ...]}
auto make_document(std::size_t n) -> Value {
    auto items = Array{};
    items.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        items.push_back(Object{
            {"id", i},
            {"name", "item" + std::to_string(i)},
            {"price", static_cast<double>(i) + 0.5},
            {"tags", Array{"a", "b"}},
        });
    }
    return Object{{"items", std::move(items)}};
}

auto ptr(const std::string& text) -> Pointer { return Pointer::parse(text); }

class VectorSource final : public DocumentSource {
public:
    VectorSource(std::size_t count, std::size_t size) : document_{make_document(size)} {
        for (std::size_t i = 0; i < count; ++i) ids_.push_back("doc" + std::to_string(i));
    }

    auto match(const std::string&) const -> std::vector<std::string> override { return ids_; }
    auto load(const std::string&) const -> Value override { return document_; }

private:
    Value document_;
    std::vector<std::string> ids_;
};

}  // anonymous namespace

// =============================================================================
// Codec
// =============================================================================

static void bm_decode(benchmark::State& state) {
    const auto text = encode(make_document(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        benchmark::DoNotOptimize(decode(text));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_decode)->Range(10, 10000);

static void bm_encode(benchmark::State& state) {
    const auto doc = make_document(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(encode(doc, 2));
    }
}
BENCHMARK(bm_encode)->Range(10, 10000);

static void bm_pointer_parse(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(Pointer::parse("/items/1234/tags/0/a~1b/c~0d"));
    }
}
BENCHMARK(bm_pointer_parse);

// =============================================================================
// Operations
// =============================================================================

static void bm_resolve_deep(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto doc = make_document(n);
    const auto target = ptr("/items/" + std::to_string(n - 1) + "/tags/1");
    for (auto _ : state) {
        benchmark::DoNotOptimize(&resolve(doc, target));
    }
}
BENCHMARK(bm_resolve_deep)->Range(10, 10000);

static void bm_apply_small_patch(benchmark::State& state) {
    const auto doc = make_document(static_cast<std::size_t>(state.range(0)));
    const auto patch = Patch{
        TestOp{ptr("/items/0/id"), 0},
        ReplaceOp{ptr("/items/0/price"), 1.25},
        AddOp{ptr("/items/-"), Object{{"id", -1}}},
        RemoveOp{ptr("/items/1/tags/0")},
    };
    for (auto _ : state) {
        benchmark::DoNotOptimize(jsonpatch_cpp::apply(doc, patch));
    }
}
BENCHMARK(bm_apply_small_patch)->Range(10, 10000);

static void bm_apply_move(benchmark::State& state) {
    const auto doc = make_document(static_cast<std::size_t>(state.range(0)));
    const auto patch = Patch{MoveOp{ptr("/items/0"), ptr("/items/-")}};
    for (auto _ : state) {
        benchmark::DoNotOptimize(jsonpatch_cpp::apply(doc, patch));
    }
}
BENCHMARK(bm_apply_move)->Range(10, 10000);

static void bm_apply_many_operations(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto patch = Patch{};
    for (std::size_t i = 0; i < n; ++i) {
        patch.push_back(AddOp{ptr("/k" + std::to_string(i)), i});
    }
    const auto doc = Value{Object{}};
    for (auto _ : state) {
        benchmark::DoNotOptimize(jsonpatch_cpp::apply(doc, patch));
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_apply_many_operations)->Range(10, 1000);

// =============================================================================
// Batch
// =============================================================================

static void bm_run_batch(benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto source = VectorSource{count, 100};
    const auto batch = Batch{BatchEntry{"*", Patch{
        ReplaceOp{ptr("/items/0/name"), "patched"},
        AddOp{ptr("/items/-"), Object{{"id", -1}}},
    }}};
    for (auto _ : state) {
        benchmark::DoNotOptimize(run_batch(batch, source));
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * count));
}
BENCHMARK(bm_run_batch)->Range(1, 256);
