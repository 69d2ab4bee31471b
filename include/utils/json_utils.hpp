#pragma once

#include <string>
#include <map>
#include <vector>

namespace affectrt {
namespace utils {

// Simple JSON value types
enum class JsonType {
    NULL_VALUE,
    BOOLEAN,
    NUMBER,
    STRING,
    ARRAY,
    OBJECT
};

class JsonValue {
public:
    JsonValue() : type_(JsonType::NULL_VALUE) {}
    explicit JsonValue(bool value) : type_(JsonType::BOOLEAN), bool_value_(value) {}
    explicit JsonValue(double value) : type_(JsonType::NUMBER), number_value_(value) {}
    explicit JsonValue(const std::string& value) : type_(JsonType::STRING), string_value_(value) {}

    JsonType getType() const { return type_; }
    bool isNull() const { return type_ == JsonType::NULL_VALUE; }
    bool isNumber() const { return type_ == JsonType::NUMBER; }
    bool isObject() const { return type_ == JsonType::OBJECT; }

    bool asBool() const { return bool_value_; }
    double asNumber() const { return number_value_; }
    const std::string& asString() const { return string_value_; }

    // Array operations
    void setArray() { type_ = JsonType::ARRAY; array_value_.clear(); }
    void addArrayElement(const JsonValue& value) { array_value_.push_back(value); }
    const std::vector<JsonValue>& asArray() const { return array_value_; }

    // Object operations
    void setObject() { type_ = JsonType::OBJECT; object_value_.clear(); }
    void setObjectProperty(const std::string& key, const JsonValue& value) { object_value_[key] = value; }
    const std::map<std::string, JsonValue>& asObject() const { return object_value_; }
    bool hasProperty(const std::string& key) const { return object_value_.find(key) != object_value_.end(); }
    const JsonValue& getProperty(const std::string& key) const;

    /**
     * Typed lookups on an object. A missing key returns the fallback;
     * a present key of the wrong type throws std::invalid_argument.
     */
    double getNumber(const std::string& key, double fallback) const;
    bool getBool(const std::string& key, bool fallback) const;
    std::string getString(const std::string& key, const std::string& fallback) const;

private:
    JsonType type_;
    bool bool_value_ = false;
    double number_value_ = 0.0;
    std::string string_value_;
    std::vector<JsonValue> array_value_;
    std::map<std::string, JsonValue> object_value_;
    static const JsonValue null_value_;
};

/**
 * Minimal recursive-descent JSON reader/writer. Parse failures throw
 * std::runtime_error with the byte offset of the problem.
 */
class JsonParser {
public:
    static JsonValue parse(const std::string& json);
    static JsonValue parseFile(const std::string& path);
    static std::string stringify(const JsonValue& value);

private:
    explicit JsonParser(const std::string& text) : text_(text) {}

    JsonValue readValue();
    JsonValue readObject();
    JsonValue readArray();
    std::string readString();
    JsonValue readNumber();
    JsonValue readLiteral();

    void skipWhitespace();
    bool atEnd() const { return pos_ >= text_.size(); }
    char peek() const { return text_[pos_]; }
    void expect(char c, const char* what);
    [[noreturn]] void fail(const std::string& message) const;

    static void writeValue(const JsonValue& value, std::string& out);
    static void writeString(const std::string& str, std::string& out);

    const std::string& text_;
    size_t pos_ = 0;
};

} // namespace utils
} // namespace affectrt
