// Fuzz target for patch application.
// The input is split at the first newline: a JSON document, then a JSON
// Patch. A failing patch must leave the document untouched.

#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/patch.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\n');
    if (split == std::string_view::npos) return 0;

    try {
        const auto doc = jsonpatch_cpp::decode(input.substr(0, split));
        const auto patch = jsonpatch_cpp::decode_patch(input.substr(split + 1));
        const auto before = doc;
        try {
            auto patched = jsonpatch_cpp::apply(doc, patch);
            (void)jsonpatch_cpp::encode(patched, 2);
        } catch (const jsonpatch_cpp::OperationError&) {
        }
        if (!(doc == before)) std::abort();
    } catch (const jsonpatch_cpp::PatchError&) {
    }
    return 0;
}
