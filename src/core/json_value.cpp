// WatchParty - Watch-party signaling and process supervision core
// JSON document model implementation

#include "watchparty/core/json_value.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace watchparty {
namespace core {

// =============================================================================
// JsonValue
// =============================================================================

JsonValue::JsonValue(bool value)
    : type_(JsonType::Boolean), boolValue_(value) {}

JsonValue::JsonValue(int value)
    : type_(JsonType::Number), numberValue_(static_cast<double>(value)) {}

JsonValue::JsonValue(int64_t value)
    : type_(JsonType::Number), numberValue_(static_cast<double>(value)) {}

JsonValue::JsonValue(uint64_t value)
    : type_(JsonType::Number), numberValue_(static_cast<double>(value)) {}

JsonValue::JsonValue(double value)
    : type_(JsonType::Number), numberValue_(value) {}

JsonValue::JsonValue(const char* value)
    : type_(JsonType::String), stringValue_(value != nullptr ? value : "") {}

JsonValue::JsonValue(std::string value)
    : type_(JsonType::String), stringValue_(std::move(value)) {}

JsonValue JsonValue::object() {
    JsonValue value;
    value.type_ = JsonType::Object;
    return value;
}

JsonValue JsonValue::array() {
    JsonValue value;
    value.type_ = JsonType::Array;
    return value;
}

namespace {

// Doubles in [-2^63, 2^63) convert to int64_t without overflow
constexpr double INT64_LOWER = -9223372036854775808.0;
constexpr double INT64_UPPER = 9223372036854775808.0;

bool fitsInt64(double value) {
    return value >= INT64_LOWER && value < INT64_UPPER;
}

} // anonymous namespace

bool JsonValue::isInteger() const {
    return isNumber() && std::isfinite(numberValue_) &&
           std::floor(numberValue_) == numberValue_ && fitsInt64(numberValue_);
}

bool JsonValue::getBool(bool defaultVal) const {
    return isBool() ? boolValue_ : defaultVal;
}

int64_t JsonValue::getInt(int64_t defaultVal) const {
    if (!isNumber() || !fitsInt64(numberValue_)) {
        return defaultVal;
    }
    return static_cast<int64_t>(numberValue_);
}

double JsonValue::getDouble(double defaultVal) const {
    return isNumber() ? numberValue_ : defaultVal;
}

std::string JsonValue::getString(const std::string& defaultVal) const {
    return isString() ? stringValue_ : defaultVal;
}

bool JsonValue::contains(const std::string& key) const {
    return isObject() && objectValue_.find(key) != objectValue_.end();
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    static const JsonValue nullValue;
    if (!isObject()) {
        return nullValue;
    }
    auto it = objectValue_.find(key);
    return it != objectValue_.end() ? it->second : nullValue;
}

size_t JsonValue::size() const {
    if (isArray()) {
        return arrayValue_.size();
    }
    if (isObject()) {
        return objectValue_.size();
    }
    return 0;
}

JsonValue& JsonValue::set(const std::string& key, JsonValue value) {
    if (isNull()) {
        type_ = JsonType::Object;
    }
    objectValue_[key] = std::move(value);
    return *this;
}

JsonValue& JsonValue::push(JsonValue value) {
    if (isNull()) {
        type_ = JsonType::Array;
    }
    arrayValue_.push_back(std::move(value));
    return *this;
}

bool JsonValue::operator==(const JsonValue& other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case JsonType::Null:
            return true;
        case JsonType::Boolean:
            return boolValue_ == other.boolValue_;
        case JsonType::Number:
            return numberValue_ == other.numberValue_;
        case JsonType::String:
            return stringValue_ == other.stringValue_;
        case JsonType::Array:
            return arrayValue_ == other.arrayValue_;
        case JsonType::Object:
            return objectValue_ == other.objectValue_;
    }
    return false;
}

std::string JsonValue::dump() const {
    std::string out;
    dumpTo(out);
    return out;
}

void JsonValue::dumpTo(std::string& out) const {
    switch (type_) {
        case JsonType::Null:
            out += "null";
            break;
        case JsonType::Boolean:
            out += boolValue_ ? "true" : "false";
            break;
        case JsonType::Number: {
            char buf[32];
            if (!std::isfinite(numberValue_)) {
                out += "null";
            } else if (isInteger() && std::fabs(numberValue_) < 1e15) {
                std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(numberValue_));
                out += buf;
            } else {
                std::snprintf(buf, sizeof(buf), "%.17g", numberValue_);
                out += buf;
            }
            break;
        }
        case JsonType::String:
            out += '"';
            out += escapeJsonString(stringValue_);
            out += '"';
            break;
        case JsonType::Array: {
            out += '[';
            bool first = true;
            for (const auto& item : arrayValue_) {
                if (!first) {
                    out += ',';
                }
                first = false;
                item.dumpTo(out);
            }
            out += ']';
            break;
        }
        case JsonType::Object: {
            out += '{';
            bool first = true;
            for (const auto& [key, value] : objectValue_) {
                if (!first) {
                    out += ',';
                }
                first = false;
                out += '"';
                out += escapeJsonString(key);
                out += "\":";
                value.dumpTo(out);
            }
            out += '}';
            break;
        }
    }
}

std::string escapeJsonString(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

// =============================================================================
// Parser
// =============================================================================

namespace {

constexpr int kMaxDepth = 64;

void appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

class JsonParser {
public:
    using ParseResult = Result<JsonValue, JsonError>;

    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    ParseResult parse() {
        skipWhitespace();
        auto result = parseValue(0);
        if (result.isError()) {
            return result;
        }
        skipWhitespace();
        if (pos_ < input_.size()) {
            return fail("Unexpected characters after JSON value");
        }
        return result;
    }

private:
    const std::string& input_;
    size_t pos_;

    ParseResult fail(const std::string& message) const {
        return ParseResult::error(JsonError(message, pos_));
    }

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            pos_++;
        }
    }

    char peek() const {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    char consume() {
        return pos_ < input_.size() ? input_[pos_++] : '\0';
    }

    bool match(char c) {
        if (pos_ < input_.size() && input_[pos_] == c) {
            pos_++;
            return true;
        }
        return false;
    }

    ParseResult parseValue(int depth) {
        if (depth > kMaxDepth) {
            return fail("Nesting too deep");
        }

        skipWhitespace();
        if (pos_ >= input_.size()) {
            return fail("Unexpected end of input");
        }

        char c = peek();
        if (c == '"') return parseStringValue();
        if (c == '{') return parseObject(depth);
        if (c == '[') return parseArray(depth);
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        return fail("Unexpected character: " + std::string(1, c));
    }

    bool readHex4(uint32_t& out) {
        if (pos_ + 4 > input_.size()) {
            return false;
        }
        out = 0;
        for (int i = 0; i < 4; ++i) {
            char h = input_[pos_++];
            out <<= 4;
            if (h >= '0' && h <= '9') {
                out |= static_cast<uint32_t>(h - '0');
            } else if (h >= 'a' && h <= 'f') {
                out |= static_cast<uint32_t>(h - 'a' + 10);
            } else if (h >= 'A' && h <= 'F') {
                out |= static_cast<uint32_t>(h - 'A' + 10);
            } else {
                return false;
            }
        }
        return true;
    }

    Result<std::string, JsonError> parseString() {
        using StringResult = Result<std::string, JsonError>;
        if (!match('"')) {
            return StringResult::error(JsonError("Expected '\"'", pos_));
        }

        std::string result;
        while (pos_ < input_.size() && peek() != '"') {
            char c = consume();
            if (c != '\\') {
                result += c;
                continue;
            }

            char escaped = consume();
            switch (escaped) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    uint32_t codepoint = 0;
                    if (!readHex4(codepoint)) {
                        return StringResult::error(JsonError("Invalid \\u escape", pos_));
                    }
                    if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                        uint32_t low = 0;
                        if (!match('\\') || !match('u') || !readHex4(low) ||
                            low < 0xDC00 || low > 0xDFFF) {
                            return StringResult::error(
                                JsonError("Invalid surrogate pair", pos_));
                        }
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                    } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                        return StringResult::error(JsonError("Unpaired low surrogate", pos_));
                    }
                    appendUtf8(result, codepoint);
                    break;
                }
                default:
                    return StringResult::error(JsonError("Invalid escape sequence", pos_));
            }
        }

        if (!match('"')) {
            return StringResult::error(JsonError("Unterminated string", pos_));
        }
        return StringResult::success(std::move(result));
    }

    ParseResult parseStringValue() {
        auto str = parseString();
        if (str.isError()) {
            return ParseResult::error(str.error());
        }
        return ParseResult::success(JsonValue(std::move(str.value())));
    }

    ParseResult parseNumber() {
        size_t start = pos_;
        if (peek() == '-') consume();

        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return fail("Invalid number");
        }
        if (peek() == '0') {
            consume();
            if (std::isdigit(static_cast<unsigned char>(peek()))) {
                return fail("Leading zero in number");
            }
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();

        if (peek() == '.') {
            consume();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                return fail("Invalid number");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                return fail("Invalid number");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        std::string numStr = input_.substr(start, pos_ - start);
        errno = 0;
        char* end = nullptr;
        double number = std::strtod(numStr.c_str(), &end);
        if (errno == ERANGE || end != numStr.c_str() + numStr.size()) {
            return fail("Invalid number: " + numStr);
        }
        return ParseResult::success(JsonValue(number));
    }

    ParseResult parseBool() {
        if (input_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return ParseResult::success(JsonValue(true));
        }
        if (input_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return ParseResult::success(JsonValue(false));
        }
        return fail("Expected 'true' or 'false'");
    }

    ParseResult parseNull() {
        if (input_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return ParseResult::success(JsonValue());
        }
        return fail("Expected 'null'");
    }

    ParseResult parseArray(int depth) {
        match('[');
        JsonValue value = JsonValue::array();

        skipWhitespace();
        if (match(']')) {
            return ParseResult::success(std::move(value));
        }

        while (true) {
            auto element = parseValue(depth + 1);
            if (element.isError()) {
                return element;
            }
            value.push(std::move(element.value()));

            skipWhitespace();
            if (match(']')) break;
            if (!match(',')) {
                return fail("Expected ',' or ']' in array");
            }
        }

        return ParseResult::success(std::move(value));
    }

    ParseResult parseObject(int depth) {
        match('{');
        JsonValue value = JsonValue::object();

        skipWhitespace();
        if (match('}')) {
            return ParseResult::success(std::move(value));
        }

        while (true) {
            skipWhitespace();
            if (peek() != '"') {
                return fail("Expected string key in object");
            }
            auto key = parseString();
            if (key.isError()) {
                return ParseResult::error(key.error());
            }

            skipWhitespace();
            if (!match(':')) {
                return fail("Expected ':' after key");
            }

            auto member = parseValue(depth + 1);
            if (member.isError()) {
                return member;
            }
            value.set(key.value(), std::move(member.value()));

            skipWhitespace();
            if (match('}')) break;
            if (!match(',')) {
                return fail("Expected ',' or '}' in object");
            }
        }

        return ParseResult::success(std::move(value));
    }
};

} // anonymous namespace

Result<JsonValue, JsonError> parseJson(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}

} // namespace core
} // namespace watchparty
