// yaml_patch — patches a YAML document and a batch of in-memory documents
//
// Shows the YAML codec and the batch runner with a custom DocumentSource.
//
// Build: cmake --build build
// Run:   ./build/yaml_patch

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstdio>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace jp = jsonpatch_cpp;

namespace {

/// Named YAML documents held in memory. The selector is a key prefix.
class InlineSource final : public jp::DocumentSource {
public:
    explicit InlineSource(std::map<std::string, std::string> documents)
        : documents_{std::move(documents)} {}

    auto match(const std::string& selector) const -> std::vector<std::string> override {
        auto ids = std::vector<std::string>{};
        for (const auto& [id, _] : documents_) {
            if (id.rfind(selector, 0) == 0) ids.push_back(id);
        }
        return ids;
    }

    auto load(const std::string& id) const -> jp::Value override {
        return jp::decode_yaml(documents_.at(id));
    }

private:
    std::map<std::string, std::string> documents_;
};

}  // anonymous namespace

int main() {
    // -- One YAML document ----------------------------------------------------
    const auto deployment = jp::decode_yaml(
        "name: api\n"
        "replicas: 2\n"
        "ports:\n"
        "  - 8080\n");

    const auto scaled = jp::apply(deployment, jp::decode_patch(R"([
        {"op": "replace", "path": "/replicas", "value": 4},
        {"op": "add", "path": "/ports/-", "value": 9090}
    ])"));
    std::printf("%s\n", jp::encode_yaml(scaled).c_str());

    // -- A batch over several documents --------------------------------------
    const auto source = InlineSource{{
        {"svc/api.yaml", "name: api\nenv: dev\n"},
        {"svc/web.yaml", "name: web\nenv: dev\n"},
        {"job/cron.yaml", "name: cron\n"},
    }};

    const auto batch = jp::decode_batch(R"([
        {"glob": "svc/", "jsonPatch": [{"op": "replace", "path": "/env", "value": "prod"}]},
        {"glob": "job/", "jsonPatch": [{"op": "add", "path": "/schedule", "value": "@daily"}]}
    ])");

    try {
        for (const auto& doc : jp::run_batch(batch, source)) {
            std::printf("%s -> %s\n", doc.id.c_str(), jp::encode(doc.value).c_str());
        }
    } catch (const jp::BatchError& e) {
        std::printf("batch failed: %s\n", e.what());
        return 1;
    }

    return 0;
}
