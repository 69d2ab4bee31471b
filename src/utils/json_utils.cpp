#include "utils/json_utils.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace affectrt {
namespace utils {

const JsonValue JsonValue::null_value_;

const JsonValue& JsonValue::getProperty(const std::string& key) const {
    auto it = object_value_.find(key);
    return (it != object_value_.end()) ? it->second : null_value_;
}

double JsonValue::getNumber(const std::string& key, double fallback) const {
    const JsonValue& value = getProperty(key);
    if (value.isNull()) {
        return fallback;
    }
    if (value.getType() != JsonType::NUMBER) {
        throw std::invalid_argument("'" + key + "' must be a number");
    }
    return value.asNumber();
}

bool JsonValue::getBool(const std::string& key, bool fallback) const {
    const JsonValue& value = getProperty(key);
    if (value.isNull()) {
        return fallback;
    }
    if (value.getType() != JsonType::BOOLEAN) {
        throw std::invalid_argument("'" + key + "' must be a boolean");
    }
    return value.asBool();
}

std::string JsonValue::getString(const std::string& key, const std::string& fallback) const {
    const JsonValue& value = getProperty(key);
    if (value.isNull()) {
        return fallback;
    }
    if (value.getType() != JsonType::STRING) {
        throw std::invalid_argument("'" + key + "' must be a string");
    }
    return value.asString();
}

JsonValue JsonParser::parse(const std::string& json) {
    JsonParser parser(json);
    JsonValue root = parser.readValue();
    parser.skipWhitespace();
    if (!parser.atEnd()) {
        parser.fail("Trailing characters after JSON value");
    }
    return root;
}

JsonValue JsonParser::parseFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open JSON file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::string JsonParser::stringify(const JsonValue& value) {
    std::string out;
    writeValue(value, out);
    return out;
}

void JsonParser::fail(const std::string& message) const {
    throw std::runtime_error(message + " at offset " + std::to_string(pos_));
}

void JsonParser::skipWhitespace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        pos_++;
    }
}

void JsonParser::expect(char c, const char* what) {
    skipWhitespace();
    if (atEnd() || peek() != c) {
        fail(std::string("Expected ") + what);
    }
    pos_++;
}

JsonValue JsonParser::readValue() {
    skipWhitespace();
    if (atEnd()) {
        fail("Unexpected end of JSON");
    }

    char c = peek();
    if (c == '{') {
        return readObject();
    }
    if (c == '[') {
        return readArray();
    }
    if (c == '"') {
        return JsonValue(readString());
    }
    if (c == 't' || c == 'f' || c == 'n') {
        return readLiteral();
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        return readNumber();
    }
    fail("Unexpected character '" + std::string(1, c) + "'");
}

JsonValue JsonParser::readObject() {
    JsonValue obj;
    obj.setObject();
    pos_++; // '{'

    skipWhitespace();
    if (!atEnd() && peek() == '}') {
        pos_++;
        return obj;
    }

    while (true) {
        skipWhitespace();
        if (atEnd() || peek() != '"') {
            fail("Expected string key in object");
        }
        std::string key = readString();
        expect(':', "':' after object key");
        obj.setObjectProperty(key, readValue());

        skipWhitespace();
        if (atEnd()) {
            fail("Unexpected end of JSON in object");
        }
        if (peek() == '}') {
            pos_++;
            return obj;
        }
        expect(',', "',' or '}' in object");
    }
}

JsonValue JsonParser::readArray() {
    JsonValue arr;
    arr.setArray();
    pos_++; // '['

    skipWhitespace();
    if (!atEnd() && peek() == ']') {
        pos_++;
        return arr;
    }

    while (true) {
        arr.addArrayElement(readValue());
        skipWhitespace();
        if (atEnd()) {
            fail("Unexpected end of JSON in array");
        }
        if (peek() == ']') {
            pos_++;
            return arr;
        }
        expect(',', "',' or ']' in array");
    }
}

std::string JsonParser::readString() {
    pos_++; // opening quote
    std::string result;

    while (!atEnd()) {
        char c = text_[pos_++];
        if (c == '"') {
            return result;
        }
        if (c != '\\') {
            result += c;
            continue;
        }
        if (atEnd()) {
            fail("Unexpected end of JSON in string escape");
        }
        char escaped = text_[pos_++];
        switch (escaped) {
            case '"': result += '"'; break;
            case '\\': result += '\\'; break;
            case '/': result += '/'; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            default:
                fail("Invalid escape sequence \\" + std::string(1, escaped));
        }
    }
    fail("Unterminated string");
}

JsonValue JsonParser::readNumber() {
    const size_t start = pos_;
    auto digits = [this]() {
        size_t begin = pos_;
        while (!atEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
            pos_++;
        }
        return pos_ > begin;
    };

    if (peek() == '-') {
        pos_++;
    }
    if (!digits()) {
        fail("Invalid number format");
    }
    if (!atEnd() && peek() == '.') {
        pos_++;
        if (!digits()) {
            fail("Invalid number format");
        }
    }
    if (!atEnd() && (peek() == 'e' || peek() == 'E')) {
        pos_++;
        if (!atEnd() && (peek() == '+' || peek() == '-')) {
            pos_++;
        }
        if (!digits()) {
            fail("Invalid number format");
        }
    }
    return JsonValue(std::stod(text_.substr(start, pos_ - start)));
}

JsonValue JsonParser::readLiteral() {
    if (text_.compare(pos_, 4, "true") == 0) {
        pos_ += 4;
        return JsonValue(true);
    }
    if (text_.compare(pos_, 5, "false") == 0) {
        pos_ += 5;
        return JsonValue(false);
    }
    if (text_.compare(pos_, 4, "null") == 0) {
        pos_ += 4;
        return JsonValue();
    }
    fail("Invalid literal");
}

void JsonParser::writeValue(const JsonValue& value, std::string& out) {
    switch (value.getType()) {
        case JsonType::NULL_VALUE:
            out += "null";
            return;
        case JsonType::BOOLEAN:
            out += value.asBool() ? "true" : "false";
            return;
        case JsonType::NUMBER: {
            std::ostringstream oss;
            oss << value.asNumber();
            out += oss.str();
            return;
        }
        case JsonType::STRING:
            writeString(value.asString(), out);
            return;
        case JsonType::ARRAY: {
            out += '[';
            bool first = true;
            for (const auto& element : value.asArray()) {
                if (!first) out += ',';
                writeValue(element, out);
                first = false;
            }
            out += ']';
            return;
        }
        case JsonType::OBJECT: {
            out += '{';
            bool first = true;
            for (const auto& pair : value.asObject()) {
                if (!first) out += ',';
                writeString(pair.first, out);
                out += ':';
                writeValue(pair.second, out);
                first = false;
            }
            out += '}';
            return;
        }
    }
}

void JsonParser::writeString(const std::string& str, std::string& out) {
    out += '"';
    for (char c : str) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    out += '"';
}

} // namespace utils
} // namespace affectrt
