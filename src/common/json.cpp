/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: json.cpp

    Description:
        Recursive-descent JSON parser and compact serializer for JsonValue.

*******************************************************************************/

#include "common/json.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace dss {

//==============================================================================
// ACCESSORS
//==============================================================================

bool JsonValue::as_bool() const {
    if (type_ != JsonType::BOOLEAN) throw JsonParseError("JSON value is not a boolean");
    return bool_;
}

double JsonValue::as_number() const {
    if (type_ != JsonType::NUMBER) throw JsonParseError("JSON value is not a number");
    return number_;
}

int64_t JsonValue::as_int() const {
    if (type_ != JsonType::NUMBER) throw JsonParseError("JSON value is not a number");
    if (!std::isfinite(number_) || std::floor(number_) != number_) {
        throw JsonParseError("JSON number is not an integer");
    }
    // 2^63 is exact as a double; anything at or above it does not fit.
    if (number_ < -9223372036854775808.0 || number_ >= 9223372036854775808.0) {
        throw JsonParseError("JSON integer is out of range");
    }
    return static_cast<int64_t>(number_);
}

int JsonValue::as_int32() const {
    int64_t value = as_int();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw JsonParseError("JSON integer is out of range");
    }
    return static_cast<int>(value);
}

const std::string& JsonValue::as_string() const {
    if (type_ != JsonType::STRING) throw JsonParseError("JSON value is not a string");
    return string_;
}

const JsonValue::Array& JsonValue::as_array() const {
    if (type_ != JsonType::ARRAY) throw JsonParseError("JSON value is not an array");
    return array_;
}

const JsonValue::Object& JsonValue::as_object() const {
    if (type_ != JsonType::OBJECT) throw JsonParseError("JSON value is not an object");
    return object_;
}

JsonValue::Array& JsonValue::items() {
    if (type_ != JsonType::ARRAY) throw JsonParseError("JSON value is not an array");
    return array_;
}

JsonValue::Object& JsonValue::members() {
    if (type_ != JsonType::OBJECT) throw JsonParseError("JSON value is not an object");
    return object_;
}

const JsonValue* JsonValue::find(const std::string& key) const {
    if (type_ != JsonType::OBJECT) return nullptr;
    auto it = object_.find(key);
    return it == object_.end() ? nullptr : &it->second;
}

std::string JsonValue::get_string(const std::string& key, const std::string& fallback) const {
    const JsonValue* value = find(key);
    if (!value || value->is_null()) return fallback;
    return value->as_string();
}

int64_t JsonValue::get_int(const std::string& key, int64_t fallback) const {
    const JsonValue* value = find(key);
    if (!value || value->is_null()) return fallback;
    return value->as_int();
}

double JsonValue::get_number(const std::string& key, double fallback) const {
    const JsonValue* value = find(key);
    if (!value || value->is_null()) return fallback;
    return value->as_number();
}

bool JsonValue::get_bool(const std::string& key, bool fallback) const {
    const JsonValue* value = find(key);
    if (!value || value->is_null()) return fallback;
    return value->as_bool();
}

JsonValue& JsonValue::operator[](const std::string& key) {
    if (type_ == JsonType::NUL) {
        type_ = JsonType::OBJECT;
    }
    return members()[key];
}

void JsonValue::push_back(JsonValue value) {
    if (type_ == JsonType::NUL) {
        type_ = JsonType::ARRAY;
    }
    items().push_back(std::move(value));
}

//==============================================================================
// SERIALIZATION
//==============================================================================

void json_escape_string(const std::string& value, std::string& out) {
    out.push_back('"');
    for (unsigned char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back('"');
}

void JsonValue::dump_to(std::string& out) const {
    switch (type_) {
        case JsonType::NUL:
            out += "null";
            break;
        case JsonType::BOOLEAN:
            out += bool_ ? "true" : "false";
            break;
        case JsonType::NUMBER: {
            if (!std::isfinite(number_)) {
                out += "null";
            } else if (std::floor(number_) == number_ && std::fabs(number_) < 1e15) {
                out += std::to_string(static_cast<int64_t>(number_));
            } else {
                char buf[32];
                std::snprintf(buf, sizeof(buf), "%.17g", number_);
                out += buf;
            }
            break;
        }
        case JsonType::STRING:
            json_escape_string(string_, out);
            break;
        case JsonType::ARRAY: {
            out.push_back('[');
            bool first = true;
            for (const auto& item : array_) {
                if (!first) out.push_back(',');
                first = false;
                item.dump_to(out);
            }
            out.push_back(']');
            break;
        }
        case JsonType::OBJECT: {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, item] : object_) {
                if (!first) out.push_back(',');
                first = false;
                json_escape_string(key, out);
                out.push_back(':');
                item.dump_to(out);
            }
            out.push_back('}');
            break;
        }
    }
}

std::string JsonValue::dump() const {
    std::string out;
    dump_to(out);
    return out;
}

//==============================================================================
// PARSER
//==============================================================================

namespace {

constexpr int kMaxDepth = 64;

class Parser {
public:
    explicit Parser(const std::string& text) : text_(text), pos_(0) {}

    JsonValue parse_document() {
        JsonValue value = parse_value(0);
        skip_whitespace();
        if (pos_ != text_.size()) fail("trailing characters");
        return value;
    }

private:
    const std::string& text_;
    size_t pos_;

    [[noreturn]] void fail(const std::string& reason) const {
        throw JsonParseError("Invalid JSON at offset " + std::to_string(pos_) + ": " + reason);
    }

    void skip_whitespace() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                text_[pos_] == '\n' || text_[pos_] == '\r')) {
            pos_++;
        }
    }

    bool consume_literal(const char* literal) {
        size_t len = std::char_traits<char>::length(literal);
        if (text_.compare(pos_, len, literal) == 0) {
            pos_ += len;
            return true;
        }
        return false;
    }

    JsonValue parse_value(int depth) {
        if (depth > kMaxDepth) fail("nesting too deep");
        skip_whitespace();
        if (pos_ >= text_.size()) fail("unexpected end of input");

        char c = text_[pos_];
        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '"') return JsonValue(parse_string());
        if (c == '-' || (c >= '0' && c <= '9')) return JsonValue(parse_number());
        if (consume_literal("true")) return JsonValue(true);
        if (consume_literal("false")) return JsonValue(false);
        if (consume_literal("null")) return JsonValue();
        fail("unexpected character");
    }

    JsonValue parse_object(int depth) {
        pos_++;  // '{'
        JsonValue result = JsonValue::object();
        skip_whitespace();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            pos_++;
            return result;
        }
        while (true) {
            skip_whitespace();
            if (pos_ >= text_.size() || text_[pos_] != '"') fail("expected object key");
            std::string key = parse_string();
            skip_whitespace();
            if (pos_ >= text_.size() || text_[pos_] != ':') fail("expected ':'");
            pos_++;
            result.members()[key] = parse_value(depth + 1);
            skip_whitespace();
            if (pos_ >= text_.size()) fail("unterminated object");
            if (text_[pos_] == ',') {
                pos_++;
                continue;
            }
            if (text_[pos_] == '}') {
                pos_++;
                return result;
            }
            fail("expected ',' or '}'");
        }
    }

    JsonValue parse_array(int depth) {
        pos_++;  // '['
        JsonValue result = JsonValue::array();
        skip_whitespace();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            pos_++;
            return result;
        }
        while (true) {
            result.items().push_back(parse_value(depth + 1));
            skip_whitespace();
            if (pos_ >= text_.size()) fail("unterminated array");
            if (text_[pos_] == ',') {
                pos_++;
                continue;
            }
            if (text_[pos_] == ']') {
                pos_++;
                return result;
            }
            fail("expected ',' or ']'");
        }
    }

    double parse_number() {
        size_t start = pos_;
        if (text_[pos_] == '-') pos_++;
        if (pos_ >= text_.size()) fail("truncated number");
        if (text_[pos_] == '0') {
            pos_++;
        } else if (text_[pos_] >= '1' && text_[pos_] <= '9') {
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) pos_++;
        } else {
            fail("invalid number");
        }
        if (pos_ < text_.size() && text_[pos_] == '.') {
            pos_++;
            if (pos_ >= text_.size() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                fail("invalid fraction");
            }
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) pos_++;
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            pos_++;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) pos_++;
            if (pos_ >= text_.size() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                fail("invalid exponent");
            }
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) pos_++;
        }
        std::string literal = text_.substr(start, pos_ - start);
        return std::strtod(literal.c_str(), nullptr);
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > text_.size()) fail("truncated unicode escape");
        unsigned code = 0;
        for (int i = 0; i < 4; ++i) {
            char h = text_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') code |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
            else fail("invalid unicode escape");
        }
        return code;
    }

    static void append_utf8(std::string& out, unsigned code) {
        if (code < 0x80) {
            out.push_back(static_cast<char>(code));
        } else if (code < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (code >> 6)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (code >> 12)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (code >> 18)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parse_string() {
        pos_++;  // opening quote
        std::string result;
        while (true) {
            if (pos_ >= text_.size()) fail("unterminated string");
            char c = text_[pos_++];
            if (c == '"') return result;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
            if (c != '\\') {
                result.push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) fail("unterminated escape");
            char e = text_[pos_++];
            switch (e) {
                case '"':  result.push_back('"'); break;
                case '\\': result.push_back('\\'); break;
                case '/':  result.push_back('/'); break;
                case 'b':  result.push_back('\b'); break;
                case 'f':  result.push_back('\f'); break;
                case 'n':  result.push_back('\n'); break;
                case 'r':  result.push_back('\r'); break;
                case 't':  result.push_back('\t'); break;
                case 'u': {
                    unsigned code = parse_hex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (!consume_literal("\\u")) fail("unpaired surrogate");
                        unsigned low = parse_hex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("unpaired surrogate");
                    }
                    append_utf8(result, code);
                    break;
                }
                default:
                    fail("invalid escape");
            }
        }
    }
};

} // namespace

JsonValue JsonValue::parse(const std::string& text) {
    Parser parser(text);
    return parser.parse_document();
}

} // namespace dss
