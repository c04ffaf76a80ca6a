/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: json.h

    Description:
        Small JSON document model used by the inter-instance transfer
        protocol, the administrative endpoints and the JSONL persistence
        gateway. Parsing is a single recursive-descent pass; serialization
        writes compact JSON with full string escaping.

        Supported:
        - null, true/false, numbers (stored as double), strings with all
          escapes including \uXXXX surrogate pairs, arrays, objects
        - Object keys keep sorted order (std::map)

        Errors:
        - JsonParseError (std::runtime_error) on malformed input; messages
          carry the byte offset only, never the offending text.

*******************************************************************************/

#ifndef JSON_H
#define JSON_H

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace dss {

class JsonParseError : public std::runtime_error {
public:
    explicit JsonParseError(const std::string& what) : std::runtime_error(what) {}
};

enum class JsonType {
    NUL,
    BOOLEAN,
    NUMBER,
    STRING,
    ARRAY,
    OBJECT
};

class JsonValue {
public:
    using Array = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue>;

    JsonValue() : type_(JsonType::NUL), bool_(false), number_(0.0) {}
    JsonValue(bool value) : type_(JsonType::BOOLEAN), bool_(value), number_(0.0) {}
    JsonValue(int value) : type_(JsonType::NUMBER), bool_(false), number_(value) {}
    JsonValue(int64_t value)
        : type_(JsonType::NUMBER), bool_(false), number_(static_cast<double>(value)) {}
    JsonValue(double value) : type_(JsonType::NUMBER), bool_(false), number_(value) {}
    JsonValue(const char* value)
        : type_(JsonType::STRING), bool_(false), number_(0.0), string_(value) {}
    JsonValue(std::string value)
        : type_(JsonType::STRING), bool_(false), number_(0.0), string_(std::move(value)) {}
    JsonValue(Array value)
        : type_(JsonType::ARRAY), bool_(false), number_(0.0), array_(std::move(value)) {}
    JsonValue(Object value)
        : type_(JsonType::OBJECT), bool_(false), number_(0.0), object_(std::move(value)) {}

    static JsonValue array() { return JsonValue(Array()); }
    static JsonValue object() { return JsonValue(Object()); }

    JsonType type() const { return type_; }
    bool is_null() const { return type_ == JsonType::NUL; }
    bool is_bool() const { return type_ == JsonType::BOOLEAN; }
    bool is_number() const { return type_ == JsonType::NUMBER; }
    bool is_string() const { return type_ == JsonType::STRING; }
    bool is_array() const { return type_ == JsonType::ARRAY; }
    bool is_object() const { return type_ == JsonType::OBJECT; }

    // Typed accessors throw JsonParseError on a type mismatch.
    bool as_bool() const;
    double as_number() const;
    int64_t as_int() const;
    // as_int() narrowed to int; out-of-range values throw JsonParseError.
    int as_int32() const;
    const std::string& as_string() const;
    const Array& as_array() const;
    const Object& as_object() const;

    Array& items();
    Object& members();

    // Object helpers. find() returns nullptr when the key is absent or this
    // value is not an object.
    const JsonValue* find(const std::string& key) const;
    bool has(const std::string& key) const { return find(key) != nullptr; }
    std::string get_string(const std::string& key, const std::string& fallback = "") const;
    int64_t get_int(const std::string& key, int64_t fallback = 0) const;
    double get_number(const std::string& key, double fallback = 0.0) const;
    bool get_bool(const std::string& key, bool fallback = false) const;

    JsonValue& operator[](const std::string& key);
    void push_back(JsonValue value);

    std::string dump() const;
    static JsonValue parse(const std::string& text);

private:
    JsonType type_;
    bool bool_;
    double number_;
    std::string string_;
    Array array_;
    Object object_;

    void dump_to(std::string& out) const;
};

// Writes `value` as a JSON string literal (with quotes) into `out`.
void json_escape_string(const std::string& value, std::string& out);

} // namespace dss

#endif // JSON_H
