// basic_usage — demonstrates the core jsonpatch-cpp API
//
// Builds a document both from JSON text and from Value literals, applies
// patches decoded from text and built in code, and shows how failures
// are reported.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstdio>
#include <string>

namespace jp = jsonpatch_cpp;

int main() {
    // -- Decode a document: key order and number literals are kept ------------
    const auto doc = jp::decode(R"({
        "name": "widget",
        "price": 10.50,
        "tags": ["new"],
        "stock": {"warehouse": 12}
    })");

    // -- A patch from RFC 6902 text -------------------------------------------
    const auto patch = jp::decode_patch(R"([
        {"op": "test", "path": "/name", "value": "widget"},
        {"op": "add", "path": "/tags/-", "value": "sale"},
        {"op": "replace", "path": "/price", "value": 8.25},
        {"op": "copy", "from": "/stock/warehouse", "path": "/stock/shop"}
    ])");

    const auto patched = jp::apply(doc, patch);
    std::printf("patched:\n%s\n\n", jp::encode(patched, 2).c_str());

    // -- A patch built in code -------------------------------------------------
    auto ptr = [](const char* text) { return jp::Pointer::parse(text); };
    const auto more = jp::Patch{
        jp::MoveOp{ptr("/stock/shop"), ptr("/shop_stock")},
        jp::AddOp{ptr("/dimensions"), jp::Object{{"w", 3}, {"h", 4}}},
        jp::RemoveOp{ptr("/tags/0")},
    };
    const auto result = jp::apply(patched, more);
    std::printf("compact: %s\n", jp::encode(result).c_str());
    std::printf("as a patch document: %s\n\n", jp::encode_patch(more).c_str());

    // -- Reading values through pointers --------------------------------------
    const auto& shop = jp::resolve(result, ptr("/shop_stock"));
    std::printf("/shop_stock = %s\n", jp::encode(shop).c_str());
    if (jp::try_resolve(result, ptr("/stock/shop")) == nullptr) {
        std::printf("/stock/shop is gone\n\n");
    }

    // -- Failures name the operation and leave the input untouched ------------
    try {
        (void)jp::apply(result, jp::Patch{
            jp::TestOp{ptr("/price"), 8.25},
            jp::TestOp{ptr("/name"), "gadget"},
        });
    } catch (const jp::OperationError& e) {
        std::printf("failed (%s) at operation %zu: %s\n",
                    std::string{jp::to_string_view(e.kind())}.c_str(), e.index(), e.what());
        if (const auto& mismatch = e.mismatch()) {
            std::printf("  expected %s, found %s\n",
                        jp::encode(mismatch->expected).c_str(),
                        jp::encode(mismatch->actual).c_str());
        }
    }

    try {
        (void)jp::decode_patch(R"([{"op": "increment", "path": "/price"}])");
    } catch (const jp::PatchError& e) {
        std::printf("rejected (%s): %s\n",
                    std::string{jp::to_string_view(e.kind())}.c_str(), e.what());
    }

    return 0;
}
