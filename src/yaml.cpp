#include <jsonpatch-cpp/yaml.hpp>

#include <jsonpatch-cpp/error.hpp>

#include <fkYAML/node.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace jsonpatch_cpp {

namespace {

// fkyaml::ordered_map keeps mappings in source order.
using yaml_node = fkyaml::basic_node<
    std::vector,
    fkyaml::ordered_map,
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
>;

auto from_yaml(const yaml_node& node, std::size_t depth) -> Value {
    if (node.is_null()) return Value{};
    if (node.is_boolean()) return Value{node.get_value<bool>()};
    if (node.is_integer()) return Value{node.get_value<std::int64_t>()};
    if (node.is_float_number()) return Value{node.get_value<double>()};
    if (node.is_string()) return Value{node.get_value<std::string>()};
    if (depth >= max_nesting_depth) {
        throw PatchError{ErrorKind::malformed_document,
                         "nesting deeper than " + std::to_string(max_nesting_depth) + " levels"};
    }
    if (node.is_sequence()) {
        auto arr = Array{};
        arr.reserve(node.size());
        for (std::size_t i = 0; i < node.size(); ++i) {
            arr.push_back(from_yaml(node.at(i), depth + 1));
        }
        return arr;
    }
    auto obj = Object{};
    for (const auto& [mk, mv] : node.map_items()) {
        if (!mk.is_string()) {
            throw PatchError{ErrorKind::malformed_document,
                             "non-string key " + yaml_node::serialize(mk) + " in YAML mapping"};
        }
        obj.set(mk.get_value<std::string>(), from_yaml(mv, depth + 1));
    }
    return obj;
}

auto to_yaml(const Value& value) -> yaml_node {
    return std::visit(overload{
        [](Null) { return yaml_node{}; },
        [](bool b) { return yaml_node(b); },
        [](const Number& n) {
            if (auto i = n.as_int64()) return yaml_node(*i);
            return yaml_node(n.as_double());
        },
        [](const std::string& s) { return yaml_node(s); },
        [](const Array& arr) {
            auto items = yaml_node::sequence_type{};
            items.reserve(arr.size());
            for (const auto& elem : arr) {
                items.push_back(to_yaml(elem));
            }
            return yaml_node::sequence(std::move(items));
        },
        [](const Object& obj) {
            auto map = yaml_node::mapping();
            for (const auto& [key, elem] : obj) {
                map[key] = to_yaml(elem);
            }
            return map;
        },
    }, value.storage());
}

}  // anonymous namespace

auto decode_yaml(std::string_view text) -> Value {
    auto node = yaml_node{};
    try {
        node = yaml_node::deserialize(std::string{text});
    } catch (const fkyaml::exception& e) {
        throw PatchError{ErrorKind::malformed_document, std::string{"invalid YAML: "} + e.what()};
    }
    return from_yaml(node, 0);
}

auto encode_yaml(const Value& value) -> std::string {
    return yaml_node::serialize(to_yaml(value));
}

auto is_yaml_path(std::string_view path) -> bool {
    auto ext = std::filesystem::path{path}.extension();
    return ext == ".yaml" || ext == ".yml";
}

}  // namespace jsonpatch_cpp
