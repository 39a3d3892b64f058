// Helper to generate seed corpus files for fuzz testing.
// Build and run once from the repository root: ./generate_seeds

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace jp = jsonpatch_cpp;

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs << data;
}

static auto ptr(const char* text) -> jp::Pointer { return jp::Pointer::parse(text); }

int main() {
    namespace fs = std::filesystem;
    const auto decode_dir = std::string{"fuzz/corpus/decode"};
    const auto apply_dir = std::string{"fuzz/corpus/apply"};
    fs::create_directories(decode_dir);
    fs::create_directories(apply_dir);

    const auto doc = jp::decode(R"({"a":[{"b":1,"c":2},{"b":3,"c":4}],"s":"x~y/z","n":1.50,"e":{}})");

    // Decoder seeds: documents and patches
    write_seed(decode_dir + "/seed_document.json", jp::encode(doc));
    write_seed(decode_dir + "/seed_document_indented.json", jp::encode(doc, 2));
    write_seed(decode_dir + "/seed_scalars.json", R"([null,true,false,-0,1e-7,18446744073709551615,"é\n"])");

    const auto patches = std::vector<jp::Patch>{
        {jp::TestOp{ptr("/a/0/b"), 1}, jp::ReplaceOp{ptr("/a/0/b"), 11}},
        {jp::AddOp{ptr("/a/-"), jp::Object{{"b", 5}}}, jp::RemoveOp{ptr("/a/1/c")}},
        {jp::MoveOp{ptr("/a/0"), ptr("/e/first")}, jp::CopyOp{ptr("/s"), ptr("/a/0")}},
        {jp::AddOp{ptr(""), jp::Array{}}},
        {jp::MoveOp{ptr("/a"), ptr("/a/0")}},
    };

    // Apply seeds: document, newline, patch
    for (std::size_t i = 0; i < patches.size(); ++i) {
        const auto patch_text = jp::encode_patch(patches[i]);
        write_seed(decode_dir + "/seed_patch_" + std::to_string(i) + ".json", patch_text);
        write_seed(apply_dir + "/seed_" + std::to_string(i) + ".txt",
                   jp::encode(doc) + "\n" + patch_text);
    }

    return 0;
}
