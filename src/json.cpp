#include <jsonpatch-cpp/json.hpp>

#include <jsonpatch-cpp/error.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsonpatch_cpp {

// =============================================================================
// Decoding: nlohmann/json SAX events -> Value
// =============================================================================

namespace {

/// Builds a Value from SAX events. Float literals arrive with their source
/// text, which Number keeps.
///
/// `stack_` holds the open containers. A container only gains children
/// while it is the innermost open one, so the pointers stay valid.
class ValueBuilder final : public nlohmann::json_sax<nlohmann::json> {
public:
    auto null() -> bool override { return handle(Value{}); }
    auto boolean(bool val) -> bool override { return handle(Value{val}); }
    auto number_integer(number_integer_t val) -> bool override { return handle(Value{val}); }
    auto number_unsigned(number_unsigned_t val) -> bool override { return handle(Value{val}); }

    auto number_float(number_float_t val, const string_t& s) -> bool override {
        return handle(Value{Number{val, s}});
    }

    auto string(string_t& val) -> bool override { return handle(Value{std::move(val)}); }

    auto binary(binary_t&) -> bool override {
        error_ = "binary values are not JSON";
        return false;
    }

    auto start_object(std::size_t) -> bool override { return open(Value{Object{}}); }

    auto key(string_t& val) -> bool override {
        key_ = std::move(val);
        return true;
    }

    auto end_object() -> bool override {
        stack_.pop_back();
        return true;
    }

    auto start_array(std::size_t) -> bool override { return open(Value{Array{}}); }

    auto end_array() -> bool override {
        stack_.pop_back();
        return true;
    }

    auto parse_error(std::size_t, const std::string&,
                     const nlohmann::json::exception& ex) -> bool override {
        error_ = ex.what();
        return false;
    }

    auto result() -> Value& { return root_; }
    auto error() const -> const std::string& { return error_; }

private:
    auto insert(Value v) -> Value* {
        if (stack_.empty()) {
            root_ = std::move(v);
            return &root_;
        }
        auto& top = *stack_.back();
        if (auto* arr = top.get_if<Array>()) {
            arr->push_back(std::move(v));
            return &arr->back();
        }
        return &top.as<Object>().set(std::move(key_), std::move(v));
    }

    auto handle(Value v) -> bool {
        insert(std::move(v));
        return true;
    }

    auto open(Value container) -> bool {
        if (stack_.size() >= max_nesting_depth) {
            error_ = "nesting deeper than " + std::to_string(max_nesting_depth) + " levels";
            return false;
        }
        stack_.push_back(insert(std::move(container)));
        return true;
    }

    Value root_;
    std::vector<Value*> stack_;
    std::string key_;
    std::string error_;
};

}  // anonymous namespace

auto decode(std::string_view text) -> Value {
    auto builder = ValueBuilder{};
    if (!nlohmann::json::sax_parse(text.begin(), text.end(), &builder)) {
        throw PatchError{ErrorKind::malformed_document,
                         builder.error().empty() ? std::string{"invalid JSON"} : builder.error()};
    }
    return std::move(builder.result());
}

// =============================================================================
// Encoding
// =============================================================================

namespace {

void append_string(std::string& out, const std::string& s) {
    // nlohmann/json does the escaping; invalid UTF-8 becomes U+FFFD.
    out += nlohmann::json(s).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void append_newline(std::string& out, int indent, int level) {
    if (indent < 0) return;
    out += '\n';
    out.append(static_cast<std::size_t>(indent) * static_cast<std::size_t>(level), ' ');
}

void append_value(std::string& out, const Value& value, int indent, int level) {
    std::visit(overload{
        [&](Null) { out += "null"; },
        [&](bool b) { out += b ? "true" : "false"; },
        [&](const Number& n) { out += n.to_string(); },
        [&](const std::string& s) { append_string(out, s); },
        [&](const Array& arr) {
            if (arr.empty()) {
                out += "[]";
                return;
            }
            out += '[';
            for (std::size_t i = 0; i < arr.size(); ++i) {
                if (i > 0) out += ',';
                append_newline(out, indent, level + 1);
                append_value(out, arr[i], indent, level + 1);
            }
            append_newline(out, indent, level);
            out += ']';
        },
        [&](const Object& obj) {
            if (obj.empty()) {
                out += "{}";
                return;
            }
            out += '{';
            auto first = true;
            for (const auto& [key, child] : obj) {
                if (!first) out += ',';
                first = false;
                append_newline(out, indent, level + 1);
                append_string(out, key);
                out += indent < 0 ? ":" : ": ";
                append_value(out, child, indent, level + 1);
            }
            append_newline(out, indent, level);
            out += '}';
        },
    }, value.storage());
}

}  // anonymous namespace

auto encode(const Value& value, int indent) -> std::string {
    auto out = std::string{};
    append_value(out, value, indent, 0);
    return out;
}

// =============================================================================
// Patch documents
// =============================================================================

namespace {

[[noreturn]] void throw_malformed(std::size_t index, const std::string& what) {
    throw PatchError{ErrorKind::malformed_patch,
                     "operation " + std::to_string(index) + ": " + what};
}

auto member_string(const Object& obj, const std::string& name, std::size_t index, OpType type)
    -> const std::string& {
    const auto* member = obj.find(name);
    if (!member) {
        throw_malformed(index, std::string{to_string_view(type)} + " is missing \"" + name + "\"");
    }
    const auto* s = member->get_if<std::string>();
    if (!s) {
        throw_malformed(index, "\"" + name + "\" must be a string, not a " +
                               std::string{to_string_view(member->kind())});
    }
    return *s;
}

auto member_value(const Object& obj, std::size_t index, OpType type) -> const Value& {
    const auto* member = obj.find("value");
    if (!member) {
        throw_malformed(index, std::string{to_string_view(type)} + " is missing \"value\"");
    }
    return *member;
}

auto decode_operation(const Value& element, std::size_t index) -> Operation {
    const auto* obj = element.get_if<Object>();
    if (!obj) {
        throw_malformed(index, "expected an object, not a " +
                               std::string{to_string_view(element.kind())});
    }

    const auto* op_member = obj->find("op");
    if (!op_member) throw_malformed(index, "missing \"op\"");
    const auto* op_name = op_member->get_if<std::string>();
    if (!op_name) throw_malformed(index, "\"op\" must be a string");

    auto type = op_type_from_string(*op_name);
    if (!type) {
        throw PatchError{ErrorKind::unknown_operation,
                         "operation " + std::to_string(index) + ": unknown op \"" + *op_name + "\""};
    }

    auto path = Pointer::parse(member_string(*obj, "path", index, *type));

    switch (*type) {
        case OpType::add:
            return AddOp{std::move(path), member_value(*obj, index, *type)};
        case OpType::remove:
            return RemoveOp{std::move(path)};
        case OpType::replace:
            return ReplaceOp{std::move(path), member_value(*obj, index, *type)};
        case OpType::move:
            return MoveOp{Pointer::parse(member_string(*obj, "from", index, *type)), std::move(path)};
        case OpType::copy:
            return CopyOp{Pointer::parse(member_string(*obj, "from", index, *type)), std::move(path)};
        case OpType::test:
            return TestOp{std::move(path), member_value(*obj, index, *type)};
    }
    throw PatchError{ErrorKind::unknown_operation, "unhandled op \"" + *op_name + "\""};
}

}  // anonymous namespace

auto decode_patch(std::string_view text) -> Patch {
    return decode_patch(decode(text));
}

auto decode_patch(const Value& value) -> Patch {
    const auto* arr = value.get_if<Array>();
    if (!arr) {
        throw PatchError{ErrorKind::malformed_patch,
                         "JSON Patch must be an array, not a " +
                         std::string{to_string_view(value.kind())}};
    }
    auto patch = Patch{};
    patch.reserve(arr->size());
    for (std::size_t i = 0; i < arr->size(); ++i) {
        patch.push_back(decode_operation((*arr)[i], i));
    }
    return patch;
}

auto to_value(const Operation& op) -> Value {
    auto obj = Object{};
    obj.set("op", std::string{to_string_view(op_type(op))});
    std::visit(overload{
        [&](const AddOp& o) {
            obj.set("path", o.path.to_string());
            obj.set("value", o.value);
        },
        [&](const RemoveOp& o) {
            obj.set("path", o.path.to_string());
        },
        [&](const ReplaceOp& o) {
            obj.set("path", o.path.to_string());
            obj.set("value", o.value);
        },
        [&](const MoveOp& o) {
            obj.set("from", o.from.to_string());
            obj.set("path", o.path.to_string());
        },
        [&](const CopyOp& o) {
            obj.set("from", o.from.to_string());
            obj.set("path", o.path.to_string());
        },
        [&](const TestOp& o) {
            obj.set("path", o.path.to_string());
            obj.set("value", o.value);
        },
    }, op);
    return obj;
}

auto to_value(const Patch& patch) -> Value {
    auto arr = Array{};
    arr.reserve(patch.size());
    for (const auto& op : patch) {
        arr.push_back(to_value(op));
    }
    return arr;
}

auto encode_patch(const Patch& patch, int indent) -> std::string {
    return encode(to_value(patch), indent);
}

auto apply_text(std::string_view document, std::string_view patch, int indent) -> std::string {
    auto doc = decode(document);
    auto ops = decode_patch(patch);
    return encode(jsonpatch_cpp::apply(doc, ops), indent);
}

// =============================================================================
// ADL serialization
// =============================================================================

namespace {

template <typename BasicJson>
void value_to_json(BasicJson& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](const Number& n) {
            std::visit([&](auto x) { j = x; }, n.repr());
        },
        [&](const std::string& s) { j = s; },
        [&](const Array& arr) {
            j = BasicJson::array();
            for (const auto& elem : arr) {
                auto child = BasicJson{};
                value_to_json(child, elem);
                j.push_back(std::move(child));
            }
        },
        [&](const Object& obj) {
            j = BasicJson::object();
            for (const auto& [key, elem] : obj) {
                value_to_json(j[key], elem);
            }
        },
    }, v.storage());
}

template <typename BasicJson>
auto value_from_json(const BasicJson& j) -> Value {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            return Value{};
        case nlohmann::json::value_t::boolean:
            return Value{j.template get<bool>()};
        case nlohmann::json::value_t::number_integer:
            return Value{j.template get<std::int64_t>()};
        case nlohmann::json::value_t::number_unsigned:
            return Value{j.template get<std::uint64_t>()};
        case nlohmann::json::value_t::number_float:
            return Value{j.template get<double>()};
        case nlohmann::json::value_t::string:
            return Value{j.template get<std::string>()};
        case nlohmann::json::value_t::array: {
            auto arr = Array{};
            arr.reserve(j.size());
            for (const auto& elem : j) {
                arr.push_back(value_from_json(elem));
            }
            return arr;
        }
        case nlohmann::json::value_t::object: {
            auto obj = Object{};
            for (const auto& [key, elem] : j.items()) {
                obj.set(key, value_from_json(elem));
            }
            return obj;
        }
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            break;
    }
    throw PatchError{ErrorKind::malformed_document,
                     std::string{"cannot convert a "} + j.type_name() + " to a JSON value"};
}

}  // anonymous namespace

void to_json(nlohmann::json& j, const Value& v) { value_to_json(j, v); }
void from_json(const nlohmann::json& j, Value& v) { v = value_from_json(j); }

void to_json(nlohmann::ordered_json& j, const Value& v) { value_to_json(j, v); }
void from_json(const nlohmann::ordered_json& j, Value& v) { v = value_from_json(j); }

void to_json(nlohmann::json& j, const Pointer& p) { j = p.to_string(); }
void from_json(const nlohmann::json& j, Pointer& p) { p = Pointer::parse(j.get<std::string>()); }

}  // namespace jsonpatch_cpp
