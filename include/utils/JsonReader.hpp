/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ShoalEngine {

class JsonValue;

// Keys are kept sorted so serialized output is deterministic
using JsonObject = std::map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

// Stream operator for JsonType (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null:
    return os << "Null";
  case JsonType::Boolean:
    return os << "Boolean";
  case JsonType::Number:
    return os << "Number";
  case JsonType::String:
    return os << "String";
  case JsonType::Array:
    return os << "Array";
  case JsonType::Object:
    return os << "Object";
  }
  return os << "Unknown";
}

class JsonValue {
public:
  using ValueType =
      std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(std::nullptr_t) : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(unsigned value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(long value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(long long value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(unsigned long long value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(unsigned long value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(float value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(std::string value) : m_value(std::move(value)) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

  JsonType getType() const;
  bool isNull() const { return std::holds_alternative<std::nullptr_t>(m_value); }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  // Throw std::bad_variant_access on a type mismatch
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  int asInt() const { return static_cast<int>(std::get<double>(m_value)); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }
  JsonArray &asArray() { return std::get<JsonArray>(m_value); }
  JsonObject &asObject() { return std::get<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  std::optional<std::string> tryAsString() const;
  const JsonObject *tryAsObject() const;

  bool hasKey(const std::string &key) const;

  // Missing keys and out-of-range indices read as null
  const JsonValue &operator[](const std::string &key) const;
  const JsonValue &operator[](size_t index) const;

  // Converts this value to an object if needed and inserts the key
  JsonValue &operator[](const std::string &key);

  // Converts this value to an array if needed and grows it to fit index
  JsonValue &operator[](size_t index);

  // Appends to an array, converting this value to one if needed
  void push(JsonValue value);

  size_t size() const;

  /**
   * @brief Serialize to JSON text
   * @param indent Spaces per nesting level; 0 writes compact single-line output
   *
   * Strings are escaped; non-finite numbers are written as null.
   */
  std::string toString(int indent = 0) const;

  bool operator==(const JsonValue &other) const { return m_value == other.m_value; }
  bool operator!=(const JsonValue &other) const { return !(*this == other); }

private:
  void write(std::string &out, int indent, int depth) const;

  ValueType m_value;
};

// Appends value to out as a quoted, escaped JSON string
void appendJsonString(std::string &out, std::string_view value);

/**
 * @brief Strict RFC 8259 parser
 *
 * Errors are reported with line and column through getLastError(); a failed
 * parse leaves getRoot() null.
 */
class JsonReader {
public:
  bool loadFromFile(const std::string &path);
  bool parse(std::string_view text);

  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }

private:
  std::optional<JsonValue> parseValue(size_t depth);
  std::optional<JsonValue> parseObject(size_t depth);
  std::optional<JsonValue> parseArray(size_t depth);
  std::optional<std::string> parseString();
  std::optional<JsonValue> parseNumber();
  bool parseLiteral(std::string_view literal);
  bool appendCodepoint(std::string &out);
  std::optional<uint32_t> parseHex4();

  void skipWhitespace();
  bool atEnd() const { return m_position >= m_input.size(); }
  char peek() const { return atEnd() ? '\0' : m_input[m_position]; }
  void fail(const std::string &message);

  static constexpr size_t MAX_DEPTH = 128;

  std::string_view m_input;
  size_t m_position{0};
  std::string m_lastError;
  JsonValue m_root;
};

} // namespace ShoalEngine

#endif // JSONREADER_HPP
