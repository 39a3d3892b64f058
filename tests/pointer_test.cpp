#include <jsonpatch-cpp/pointer.hpp>

#include <jsonpatch-cpp/error.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <vector>

using namespace jsonpatch_cpp;

namespace {

auto error_kind(const std::function<void()>& fn) -> ErrorKind {
    try {
        fn();
    } catch (const PatchError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a PatchError";
    return ErrorKind::io_error;
}

// The example document of RFC 6901 section 5.
auto rfc_document() -> Value {
    return Object{
        {"foo", Array{"bar", "baz"}},
        {"", 0},
        {"a/b", 1},
        {"c%d", 2},
        {"e^f", 3},
        {"g|h", 4},
        {"i\\j", 5},
        {"k\"l", 6},
        {" ", 7},
        {"m~n", 8},
    };
}

}  // anonymous namespace

// -- Parsing ------------------------------------------------------------------

TEST(Pointer, empty_text_is_the_root) {
    const auto p = Pointer::parse("");
    EXPECT_TRUE(p.empty());
    EXPECT_EQ(p.to_string(), "");
}

TEST(Pointer, parses_and_unescapes_tokens) {
    const auto p = Pointer::parse("/a~1b/m~0n/0");
    EXPECT_EQ(p.tokens(), (std::vector<std::string>{"a/b", "m~n", "0"}));
}

TEST(Pointer, unescapes_tilde_one_before_tilde_zero) {
    // "~01" is "~" followed by "1", never "/".
    EXPECT_EQ(Pointer::parse("/~01").back(), "~1");
}

TEST(Pointer, keeps_empty_tokens) {
    const auto p = Pointer::parse("/");
    ASSERT_EQ(p.size(), 1u);
    EXPECT_EQ(p.back(), "");

    EXPECT_EQ(Pointer::parse("//").size(), 2u);
}

TEST(Pointer, rejects_text_without_leading_slash) {
    EXPECT_EQ(error_kind([] { Pointer::parse("a/b"); }), ErrorKind::malformed_pointer);
    EXPECT_EQ(error_kind([] { Pointer::parse("#/a"); }), ErrorKind::malformed_pointer);
}

TEST(Pointer, rejects_bad_escapes) {
    EXPECT_EQ(error_kind([] { Pointer::parse("/a~"); }), ErrorKind::malformed_pointer);
    EXPECT_EQ(error_kind([] { Pointer::parse("/a~2"); }), ErrorKind::malformed_pointer);
}

TEST(Pointer, to_string_reescapes) {
    for (const auto* text : {"", "/", "/a~1b", "/m~0n/1", "/~0~1/x//y"}) {
        EXPECT_EQ(Pointer::parse(text).to_string(), text);
    }
}

TEST(Pointer, escape_single_token) {
    EXPECT_EQ(Pointer::escape("a/b~c"), "a~1b~0c");
    EXPECT_EQ(Pointer::escape("plain"), "plain");
}

// -- Structure ----------------------------------------------------------------

TEST(Pointer, parent_and_append) {
    const auto p = Pointer::parse("/a/b");
    EXPECT_EQ(p.parent(), Pointer::parse("/a"));
    EXPECT_EQ(p.parent() / "c", Pointer::parse("/a/c"));
    EXPECT_EQ(Pointer{}.parent(), Pointer{});
}

TEST(Pointer, prefix_relation) {
    const auto a = Pointer::parse("/a");
    EXPECT_TRUE(a.is_prefix_of(Pointer::parse("/a/b")));
    EXPECT_TRUE(a.is_prefix_of(a));
    EXPECT_TRUE(Pointer{}.is_prefix_of(a));
    EXPECT_FALSE(a.is_prefix_of(Pointer::parse("/ab")));
    EXPECT_FALSE(Pointer::parse("/a/b").is_prefix_of(a));
}

// -- Array indices ------------------------------------------------------------

TEST(ArrayIndex, accepts_canonical_decimal) {
    EXPECT_EQ(parse_array_index("0"), std::size_t{0});
    EXPECT_EQ(parse_array_index("17"), std::size_t{17});
}

TEST(ArrayIndex, rejects_everything_else) {
    EXPECT_FALSE(parse_array_index("").has_value());
    EXPECT_FALSE(parse_array_index("-").has_value());
    EXPECT_FALSE(parse_array_index("01").has_value());
    EXPECT_FALSE(parse_array_index("+1").has_value());
    EXPECT_FALSE(parse_array_index("-1").has_value());
    EXPECT_FALSE(parse_array_index("1a").has_value());
    EXPECT_FALSE(parse_array_index("99999999999999999999999").has_value());
}

// -- Resolution ---------------------------------------------------------------

TEST(Resolve, rfc6901_examples) {
    const auto doc = rfc_document();

    EXPECT_EQ(resolve(doc, Pointer::parse("")), doc);
    EXPECT_EQ(resolve(doc, Pointer::parse("/foo")), (Value{Array{"bar", "baz"}}));
    EXPECT_EQ(resolve(doc, Pointer::parse("/foo/0")), Value{"bar"});
    EXPECT_EQ(resolve(doc, Pointer::parse("/")), Value{0});
    EXPECT_EQ(resolve(doc, Pointer::parse("/a~1b")), Value{1});
    EXPECT_EQ(resolve(doc, Pointer::parse("/c%d")), Value{2});
    EXPECT_EQ(resolve(doc, Pointer::parse("/e^f")), Value{3});
    EXPECT_EQ(resolve(doc, Pointer::parse("/g|h")), Value{4});
    EXPECT_EQ(resolve(doc, Pointer::parse("/i\\j")), Value{5});
    EXPECT_EQ(resolve(doc, Pointer::parse("/k\"l")), Value{6});
    EXPECT_EQ(resolve(doc, Pointer::parse("/ ")), Value{7});
    EXPECT_EQ(resolve(doc, Pointer::parse("/m~0n")), Value{8});
}

TEST(Resolve, returns_a_mutable_reference) {
    auto doc = Value{Object{{"a", Array{1, 2}}}};
    resolve(doc, Pointer::parse("/a/1")) = "two";
    EXPECT_EQ(doc, (Value{Object{{"a", Array{1, "two"}}}}));
}

TEST(Resolve, missing_key_is_path_not_found) {
    const auto doc = Value{Object{{"a", Object{}}}};
    EXPECT_EQ(error_kind([&] { resolve(doc, Pointer::parse("/b")); }),
              ErrorKind::path_not_found);
    EXPECT_EQ(error_kind([&] { resolve(doc, Pointer::parse("/a/b/c")); }),
              ErrorKind::path_not_found);
}

TEST(Resolve, stepping_into_a_scalar_is_path_not_found) {
    const auto doc = Value{Object{{"a", 1}}};
    EXPECT_EQ(error_kind([&] { resolve(doc, Pointer::parse("/a/b")); }),
              ErrorKind::path_not_found);
}

TEST(Resolve, bad_array_tokens_are_invalid_array_index) {
    const auto doc = Value{Array{1, 2}};
    EXPECT_EQ(error_kind([&] { resolve(doc, Pointer::parse("/x")); }),
              ErrorKind::invalid_array_index);
    EXPECT_EQ(error_kind([&] { resolve(doc, Pointer::parse("/01")); }),
              ErrorKind::invalid_array_index);
    EXPECT_EQ(error_kind([&] { resolve(doc, Pointer::parse("/-")); }),
              ErrorKind::invalid_array_index);
}

TEST(Resolve, out_of_range_depends_on_position) {
    const auto doc = Value{Array{Array{1}}};
    EXPECT_EQ(error_kind([&] { resolve(doc, Pointer::parse("/1")); }),
              ErrorKind::invalid_array_index);
    EXPECT_EQ(error_kind([&] { resolve(doc, Pointer::parse("/1/0")); }),
              ErrorKind::path_not_found);
}

TEST(ResolveParent, treats_every_parent_token_as_intermediate) {
    auto doc = Value{Object{{"a", Array{Object{}}}}};
    EXPECT_EQ(&resolve_parent(doc, Pointer::parse("/a/0/x")),
              &resolve(doc, Pointer::parse("/a/0")));
    EXPECT_EQ(error_kind([&] { resolve_parent(doc, Pointer::parse("/a/5/x")); }),
              ErrorKind::path_not_found);
    EXPECT_EQ(&resolve_parent(doc, Pointer::parse("")), &doc);
}

TEST(TryResolve, returns_nullptr_instead_of_throwing) {
    const auto doc = Value{Object{{"a", Array{1}}}};
    ASSERT_NE(try_resolve(doc, Pointer::parse("/a/0")), nullptr);
    EXPECT_EQ(*try_resolve(doc, Pointer::parse("/a/0")), Value{1});
    EXPECT_EQ(try_resolve(doc, Pointer::parse("/a/1")), nullptr);
    EXPECT_EQ(try_resolve(doc, Pointer::parse("/b")), nullptr);
    EXPECT_EQ(try_resolve(doc, Pointer::parse("/a/0/c")), nullptr);
}
