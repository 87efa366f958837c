#include "json_util.hpp"

#include <cstdint>
#include <cstdlib>
#include <sstream>

namespace prefixcrawl {

const JsonValue* JsonValue::find(const std::string& key) const {
    if (type != Type::Object) return nullptr;
    for (const auto& m : members) {
        if (m.first == key) return &m.second;
    }
    return nullptr;
}

static const char* short_escape(unsigned char c) {
    switch (c) {
        case '\\': return "\\\\";
        case '"': return "\\\"";
        case '\b': return "\\b";
        case '\f': return "\\f";
        case '\n': return "\\n";
        case '\r': return "\\r";
        case '\t': return "\\t";
        default: return nullptr;
    }
}

std::string json_escape(const std::string& s) {
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() + s.size() / 8 + 2);
    for (char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        if (const char* e = short_escape(c)) {
            out += e;
        } else if (c < 0x20) {
            out += "\\u00";
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        } else {
            out += ch;
        }
    }
    return out;
}

void json_append_string_array(std::string& out, const std::vector<std::string>& items, int indent, int depth) {
    if (items.empty()) {
        out += "[]";
        return;
    }
    const std::string inner = indent > 0 ? "\n" + std::string(static_cast<size_t>(indent * (depth + 1)), ' ') : "";
    const std::string outer = indent > 0 ? "\n" + std::string(static_cast<size_t>(indent * depth), ' ') : "";
    out += "[";
    for (size_t i = 0; i < items.size(); i++) {
        if (i) out += indent > 0 ? "," : ", ";
        out += inner;
        out += "\"";
        out += json_escape(items[i]);
        out += "\"";
    }
    out += outer;
    out += "]";
}

// -------------------------
// Parser
// -------------------------
namespace {

constexpr int kMaxDepth = 256;

class Parser {
public:
    explicit Parser(const std::string& text) : s_(text) {}

    std::string parse(JsonValue& out) {
        skip_ws();
        auto err = parse_value(out, 0);
        if (!err.empty()) return err;
        skip_ws();
        if (pos_ != s_.size()) return error("trailing characters after document");
        return "";
    }

private:
    const std::string& s_;
    size_t pos_ = 0;

    std::string error(const std::string& what) const {
        std::ostringstream ss;
        ss << what << " at offset " << pos_;
        return ss.str();
    }

    void skip_ws() {
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            pos_++;
        }
    }

    bool consume_literal(const char* lit) {
        size_t n = std::char_traits<char>::length(lit);
        if (s_.compare(pos_, n, lit) != 0) return false;
        pos_ += n;
        return true;
    }

    std::string parse_value(JsonValue& out, int depth) {
        if (depth > kMaxDepth) return error("document nested too deeply");
        if (pos_ >= s_.size()) return error("unexpected end of input");

        out = JsonValue{};
        char c = s_[pos_];
        switch (c) {
            case '{': return parse_object(out, depth);
            case '[': return parse_array(out, depth);
            case '"':
                out.type = JsonValue::Type::String;
                return parse_string(out.str);
            case 't':
                if (!consume_literal("true")) return error("invalid literal");
                out.type = JsonValue::Type::Bool;
                out.boolean = true;
                return "";
            case 'f':
                if (!consume_literal("false")) return error("invalid literal");
                out.type = JsonValue::Type::Bool;
                out.boolean = false;
                return "";
            case 'n':
                if (!consume_literal("null")) return error("invalid literal");
                return "";
            default:
                if (c == '-' || (c >= '0' && c <= '9')) return parse_number(out);
                return error(std::string("unexpected character '") + c + "'");
        }
    }

    std::string parse_object(JsonValue& out, int depth) {
        out.type = JsonValue::Type::Object;
        pos_++;  // '{'
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == '}') {
            pos_++;
            return "";
        }
        while (true) {
            skip_ws();
            if (pos_ >= s_.size() || s_[pos_] != '"') return error("expected object key");
            std::string key;
            auto err = parse_string(key);
            if (!err.empty()) return err;
            skip_ws();
            if (pos_ >= s_.size() || s_[pos_] != ':') return error("expected ':'");
            pos_++;
            skip_ws();
            JsonValue v;
            err = parse_value(v, depth + 1);
            if (!err.empty()) return err;
            out.members.emplace_back(std::move(key), std::move(v));
            skip_ws();
            if (pos_ >= s_.size()) return error("unterminated object");
            if (s_[pos_] == ',') {
                pos_++;
                continue;
            }
            if (s_[pos_] == '}') {
                pos_++;
                return "";
            }
            return error("expected ',' or '}'");
        }
    }

    std::string parse_array(JsonValue& out, int depth) {
        out.type = JsonValue::Type::Array;
        pos_++;  // '['
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == ']') {
            pos_++;
            return "";
        }
        while (true) {
            skip_ws();
            JsonValue v;
            auto err = parse_value(v, depth + 1);
            if (!err.empty()) return err;
            out.items.push_back(std::move(v));
            skip_ws();
            if (pos_ >= s_.size()) return error("unterminated array");
            if (s_[pos_] == ',') {
                pos_++;
                continue;
            }
            if (s_[pos_] == ']') {
                pos_++;
                return "";
            }
            return error("expected ',' or ']'");
        }
    }

    std::string parse_number(JsonValue& out) {
        const size_t start = pos_;
        if (s_[pos_] == '-') pos_++;
        auto digits = [&]() {
            size_t before = pos_;
            while (pos_ < s_.size() && s_[pos_] >= '0' && s_[pos_] <= '9') pos_++;
            return pos_ > before;
        };
        if (!digits()) return error("invalid number");
        if (pos_ < s_.size() && s_[pos_] == '.') {
            pos_++;
            if (!digits()) return error("invalid number fraction");
        }
        if (pos_ < s_.size() && (s_[pos_] == 'e' || s_[pos_] == 'E')) {
            pos_++;
            if (pos_ < s_.size() && (s_[pos_] == '+' || s_[pos_] == '-')) pos_++;
            if (!digits()) return error("invalid number exponent");
        }
        const std::string slice = s_.substr(start, pos_ - start);
        out.type = JsonValue::Type::Number;
        out.number = std::strtod(slice.c_str(), nullptr);
        return "";
    }

    bool read_hex4(uint32_t& out) {
        if (pos_ + 4 > s_.size()) return false;
        out = 0;
        for (int i = 0; i < 4; i++) {
            char h = s_[pos_++];
            out <<= 4;
            if (h >= '0' && h <= '9') out |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') out |= static_cast<uint32_t>(10 + h - 'a');
            else if (h >= 'A' && h <= 'F') out |= static_cast<uint32_t>(10 + h - 'A');
            else return false;
        }
        return true;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::string parse_string(std::string& out) {
        out.clear();
        pos_++;  // opening quote
        while (true) {
            if (pos_ >= s_.size()) return error("unterminated string");
            unsigned char c = static_cast<unsigned char>(s_[pos_++]);
            if (c == '"') return "";
            if (c < 0x20) return error("control character in string");
            if (c != '\\') {
                out.push_back(static_cast<char>(c));
                continue;
            }
            if (pos_ >= s_.size()) return error("unterminated escape");
            char e = s_[pos_++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!read_hex4(cp)) return error("invalid \\u escape");
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        uint32_t lo = 0;
                        if (pos_ + 2 > s_.size() || s_[pos_] != '\\' || s_[pos_ + 1] != 'u') {
                            return error("unpaired surrogate");
                        }
                        pos_ += 2;
                        if (!read_hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) return error("invalid low surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        return error("unpaired surrogate");
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    return error(std::string("invalid escape '\\") + e + "'");
            }
        }
    }
};

}  // namespace

std::string json_parse(const std::string& text, JsonValue& out) {
    out = JsonValue{};
    Parser p(text);
    return p.parse(out);
}

}  // namespace prefixcrawl
