#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace prefixcrawl {

// Parsed JSON document. Objects keep their members in document order.
struct JsonValue {
    enum class Type {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object,
    };

    Type type = Type::Null;
    bool boolean = false;
    double number = 0.0;
    std::string str;
    std::vector<JsonValue> items;
    std::vector<std::pair<std::string, JsonValue>> members;

    bool is_object() const { return type == Type::Object; }
    bool is_array() const { return type == Type::Array; }
    bool is_string() const { return type == Type::String; }
    bool is_number() const { return type == Type::Number; }

    // Returns nullptr when this is not an object or the key is absent.
    const JsonValue* find(const std::string& key) const;
};

// Returns empty string on success; otherwise a description of the first syntax error.
std::string json_parse(const std::string& text, JsonValue& out);

// Escapes `s` for use between double quotes.
std::string json_escape(const std::string& s);

// Appends `["a","b",...]` to `out`. With indent > 0 each element goes on its own line.
void json_append_string_array(std::string& out, const std::vector<std::string>& items, int indent = 0,
                              int depth = 0);

}  // namespace prefixcrawl
