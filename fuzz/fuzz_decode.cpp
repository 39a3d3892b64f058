// Fuzz target for the JSON and patch decoders.
// Anything that decodes must encode and decode again to an equal value.

#include <jsonpatch-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    try {
        const auto value = jsonpatch_cpp::decode(text);
        const auto again = jsonpatch_cpp::decode(jsonpatch_cpp::encode(value));
        if (!(again == value)) std::abort();
    } catch (const jsonpatch_cpp::PatchError&) {
        return 0;
    }

    try {
        const auto patch = jsonpatch_cpp::decode_patch(text);
        if (!(jsonpatch_cpp::decode_patch(jsonpatch_cpp::encode_patch(patch)) == patch)) std::abort();
    } catch (const jsonpatch_cpp::PatchError&) {
    }
    return 0;
}
