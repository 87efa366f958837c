#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "json_util.hpp"

using namespace prefixcrawl;

TEST(JsonParseTest, ParsesNestedDocument) {
    JsonValue v;
    ASSERT_EQ(json_parse(R"({"a": [1, 2.5, -3e2], "b": {"c": true, "d": null}, "e": "x"})", v), "");

    ASSERT_TRUE(v.is_object());
    const JsonValue* a = v.find("a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->is_array());
    ASSERT_EQ(a->items.size(), 3u);
    EXPECT_DOUBLE_EQ(a->items[1].number, 2.5);
    EXPECT_DOUBLE_EQ(a->items[2].number, -300.0);

    const JsonValue* b = v.find("b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->find("c")->type, JsonValue::Type::Bool);
    EXPECT_TRUE(b->find("c")->boolean);
    EXPECT_EQ(b->find("d")->type, JsonValue::Type::Null);
    EXPECT_EQ(v.find("e")->str, "x");
    EXPECT_EQ(v.find("missing"), nullptr);
}

TEST(JsonParseTest, KeepsMemberOrder) {
    JsonValue v;
    ASSERT_EQ(json_parse(R"({"z": 1, "a": 2, "m": 3})", v), "");
    ASSERT_EQ(v.members.size(), 3u);
    EXPECT_EQ(v.members[0].first, "z");
    EXPECT_EQ(v.members[1].first, "a");
    EXPECT_EQ(v.members[2].first, "m");
}

TEST(JsonParseTest, DecodesEscapes) {
    JsonValue v;
    ASSERT_EQ(json_parse(R"(["a\"b\\c\n", "\u00e9", "\ud83d\ude00", "\/"])", v), "");
    ASSERT_EQ(v.items.size(), 4u);
    EXPECT_EQ(v.items[0].str, "a\"b\\c\n");
    EXPECT_EQ(v.items[1].str, "\xc3\xa9");
    EXPECT_EQ(v.items[2].str, "\xf0\x9f\x98\x80");
    EXPECT_EQ(v.items[3].str, "/");
}

TEST(JsonParseTest, RejectsMalformedInput) {
    JsonValue v;
    EXPECT_NE(json_parse("", v), "");
    EXPECT_NE(json_parse("{", v), "");
    EXPECT_NE(json_parse("[1,]", v), "");
    EXPECT_NE(json_parse("{\"a\" 1}", v), "");
    EXPECT_NE(json_parse("\"unterminated", v), "");
    EXPECT_NE(json_parse("[1] trailing", v), "");
    EXPECT_NE(json_parse("tru", v), "");
}

TEST(JsonParseTest, RejectsExcessiveNesting) {
    JsonValue v;
    std::string deep(1000, '[');
    deep += std::string(1000, ']');
    EXPECT_NE(json_parse(deep, v), "");
}

TEST(JsonEscapeTest, EscapesQuotesAndControlCharacters) {
    EXPECT_EQ(json_escape("plain"), "plain");
    EXPECT_EQ(json_escape("a\"b"), "a\\\"b");
    EXPECT_EQ(json_escape("back\\slash"), "back\\\\slash");
    EXPECT_EQ(json_escape("line\nbreak\t"), "line\\nbreak\\t");
    EXPECT_EQ(json_escape(std::string("\b\f\x01\x1f", 4)), "\\b\\f\\u0001\\u001f");
}

TEST(JsonArrayTest, CompactAndIndentedForms) {
    std::string compact;
    json_append_string_array(compact, {"a", "b\"c"});
    EXPECT_EQ(compact, "[\"a\", \"b\\\"c\"]");

    std::string empty;
    json_append_string_array(empty, {});
    EXPECT_EQ(empty, "[]");

    std::string pretty;
    json_append_string_array(pretty, {"x", "y"}, 2, 1);
    EXPECT_EQ(pretty, "[\n    \"x\",\n    \"y\"\n  ]");
}

TEST(JsonArrayTest, OutputParsesBack) {
    const std::vector<std::string> names{"O'Brien", "Zoë", "a\\b"};
    std::string text;
    json_append_string_array(text, names, 2, 0);

    JsonValue v;
    ASSERT_EQ(json_parse(text, v), "");
    ASSERT_EQ(v.items.size(), 3u);
    for (size_t i = 0; i < names.size(); i++) EXPECT_EQ(v.items[i].str, names[i]);
}
