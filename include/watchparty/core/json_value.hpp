// WatchParty - Watch-party signaling and process supervision core
// JSON document model, parser and serializer
//
// Used by the configuration loader and by the signaling message codec.
// Objects keep their keys sorted; key order carries no meaning on the wire.

#ifndef WATCHPARTY_CORE_JSON_VALUE_HPP
#define WATCHPARTY_CORE_JSON_VALUE_HPP

#include "watchparty/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace watchparty {
namespace core {

enum class JsonType {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object
};

/**
 * @brief Parse failure with the byte offset where it was detected.
 */
struct JsonError {
    std::string message;
    size_t position = 0;

    JsonError() = default;
    JsonError(std::string msg, size_t pos)
        : message(std::move(msg)), position(pos) {}
};

/**
 * @brief A JSON value.
 *
 * Read accessors never fail: asking for the wrong type returns the
 * supplied default, and indexing a missing key returns a null value.
 */
class JsonValue {
public:
    using Array = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue>;

    JsonValue() = default;
    JsonValue(std::nullptr_t) {}
    JsonValue(bool value);
    JsonValue(int value);
    JsonValue(int64_t value);
    JsonValue(uint64_t value);
    JsonValue(double value);
    JsonValue(const char* value);
    JsonValue(std::string value);

    static JsonValue object();
    static JsonValue array();

    JsonType type() const { return type_; }
    bool isNull() const { return type_ == JsonType::Null; }
    bool isBool() const { return type_ == JsonType::Boolean; }
    bool isNumber() const { return type_ == JsonType::Number; }
    bool isString() const { return type_ == JsonType::String; }
    bool isArray() const { return type_ == JsonType::Array; }
    bool isObject() const { return type_ == JsonType::Object; }

    /**
     * @brief True for numbers without a fractional part that fit in int64_t.
     */
    bool isInteger() const;

    bool getBool(bool defaultVal = false) const;
    /// defaultVal for non-numbers and numbers outside the int64_t range
    int64_t getInt(int64_t defaultVal = 0) const;
    double getDouble(double defaultVal = 0.0) const;
    std::string getString(const std::string& defaultVal = "") const;

    bool contains(const std::string& key) const;
    const JsonValue& operator[](const std::string& key) const;

    const Array& items() const { return arrayValue_; }
    const Object& members() const { return objectValue_; }

    /**
     * @brief Number of array elements or object members, 0 otherwise.
     */
    size_t size() const;

    /**
     * @brief Set an object member, converting a null value into an object.
     * @return *this for chaining
     */
    JsonValue& set(const std::string& key, JsonValue value);

    /**
     * @brief Append an array element, converting a null value into an array.
     * @return *this for chaining
     */
    JsonValue& push(JsonValue value);

    /**
     * @brief Serialize to compact JSON text.
     *
     * Non-ASCII UTF-8 is emitted as-is; only quotes, backslashes and
     * control characters are escaped.
     */
    std::string dump() const;

    bool operator==(const JsonValue& other) const;
    bool operator!=(const JsonValue& other) const { return !(*this == other); }

private:
    void dumpTo(std::string& out) const;

    JsonType type_ = JsonType::Null;
    bool boolValue_ = false;
    double numberValue_ = 0.0;
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;
};

/**
 * @brief Parse a complete JSON document.
 *
 * Trailing non-whitespace, nesting deeper than 64 levels and invalid
 * escape sequences are errors. \\uXXXX escapes (surrogate pairs
 * included) are decoded to UTF-8.
 */
Result<JsonValue, JsonError> parseJson(const std::string& text);

/**
 * @brief Escape a string for embedding between JSON quotes.
 */
std::string escapeJsonString(const std::string& text);

} // namespace core
} // namespace watchparty

#endif // WATCHPARTY_CORE_JSON_VALUE_HPP
