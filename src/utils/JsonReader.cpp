/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>

namespace ShoalEngine {

JsonType JsonValue::getType() const {
  return static_cast<JsonType>(m_value.index());
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().count(key) > 0;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  auto it = asObject().find(key);
  return (it != asObject().end()) ? it->second : null_value;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  if (!isArray() || index >= asArray().size())
    return null_value;
  return asArray()[index];
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

JsonValue &JsonValue::operator[](size_t index) {
  if (!isArray()) {
    m_value = JsonArray{};
  }
  auto &arr = asArray();
  if (index >= arr.size()) {
    arr.resize(index + 1);
  }
  return arr[index];
}

void JsonValue::push(JsonValue value) {
  if (!isArray()) {
    m_value = JsonArray{};
  }
  asArray().push_back(std::move(value));
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString(int indent) const {
  std::string out;
  write(out, indent, 0);
  return out;
}

namespace {

void appendNewline(std::string &out, int indent, int depth) {
  if (indent <= 0)
    return;
  out += '\n';
  out.append(static_cast<size_t>(indent * depth), ' ');
}

void appendNumber(std::string &out, double num) {
  if (!std::isfinite(num)) {
    out += "null";
    return;
  }
  if (std::floor(num) == num && std::abs(num) < 1e15) {
    out += std::to_string(static_cast<long long>(num));
    return;
  }
  // Shortest representation that reads back to the same double
  char buffer[32];
  auto result = std::to_chars(buffer, buffer + sizeof(buffer), num);
  out.append(buffer, result.ptr);
}

} // anonymous namespace

void appendJsonString(std::string &out, std::string_view value) {
  static constexpr char HEX[] = "0123456789abcdef";
  out += '"';
  for (char c : value) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        out += "\\u00";
        out += HEX[(c >> 4) & 0xF];
        out += HEX[c & 0xF];
      } else {
        out += c;
      }
    }
  }
  out += '"';
}

void JsonValue::write(std::string &out, int indent, int depth) const {
  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number:
    appendNumber(out, asNumber());
    break;
  case JsonType::String:
    appendJsonString(out, asString());
    break;
  case JsonType::Array: {
    const auto &arr = asArray();
    out += '[';
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        out += ',';
      appendNewline(out, indent, depth + 1);
      arr[i].write(out, indent, depth + 1);
    }
    if (!arr.empty())
      appendNewline(out, indent, depth);
    out += ']';
    break;
  }
  case JsonType::Object: {
    const auto &obj = asObject();
    out += '{';
    bool first = true;
    for (const auto &[key, value] : obj) {
      if (!first)
        out += ',';
      first = false;
      appendNewline(out, indent, depth + 1);
      appendJsonString(out, key);
      out += indent > 0 ? ": " : ":";
      value.write(out, indent, depth + 1);
    }
    if (!obj.empty())
      appendNewline(out, indent, depth);
    out += '}';
    break;
  }
  }
}

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_root = JsonValue();
    m_lastError = "Could not open file: " + path;
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  const std::string contents = buffer.str();
  return parse(contents);
}

bool JsonReader::parse(std::string_view text) {
  m_input = text;
  m_position = 0;
  m_lastError.clear();
  m_root = JsonValue();

  skipWhitespace();
  auto value = parseValue(0);
  if (value) {
    skipWhitespace();
    if (!atEnd()) {
      fail("Unexpected trailing characters");
      value.reset();
    }
  }

  if (value) {
    m_root = std::move(*value);
  }
  m_input = {};
  return m_lastError.empty();
}

void JsonReader::fail(const std::string &message) {
  if (!m_lastError.empty())
    return;
  size_t line = 1;
  size_t column = 1;
  for (size_t i = 0; i < m_position && i < m_input.size(); ++i) {
    if (m_input[i] == '\n') {
      ++line;
      column = 1;
    } else {
      ++column;
    }
  }
  m_lastError = message + " at line " + std::to_string(line) + ", column " +
                std::to_string(column);
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = m_input[m_position];
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    ++m_position;
  }
}

std::optional<JsonValue> JsonReader::parseValue(size_t depth) {
  if (depth > MAX_DEPTH) {
    fail("Nesting too deep");
    return std::nullopt;
  }

  switch (peek()) {
  case '{':
    return parseObject(depth);
  case '[':
    return parseArray(depth);
  case '"': {
    auto str = parseString();
    if (!str)
      return std::nullopt;
    return JsonValue(std::move(*str));
  }
  case 't':
    if (parseLiteral("true"))
      return JsonValue(true);
    return std::nullopt;
  case 'f':
    if (parseLiteral("false"))
      return JsonValue(false);
    return std::nullopt;
  case 'n':
    if (parseLiteral("null"))
      return JsonValue();
    return std::nullopt;
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9'))
      return parseNumber();
    fail(atEnd() ? "Unexpected end of input" : "Unexpected character");
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseObject(size_t depth) {
  ++m_position; // '{'
  JsonObject obj;

  skipWhitespace();
  if (peek() == '}') {
    ++m_position;
    return JsonValue(std::move(obj));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      fail("Expected string key");
      return std::nullopt;
    }
    auto key = parseString();
    if (!key)
      return std::nullopt;

    skipWhitespace();
    if (peek() != ':') {
      fail("Expected ':' after key");
      return std::nullopt;
    }
    ++m_position;
    skipWhitespace();

    auto value = parseValue(depth + 1);
    if (!value)
      return std::nullopt;
    obj.insert_or_assign(std::move(*key), std::move(*value));

    skipWhitespace();
    if (peek() == ',') {
      ++m_position;
      continue;
    }
    if (peek() == '}') {
      ++m_position;
      return JsonValue(std::move(obj));
    }
    fail("Expected ',' or '}' in object");
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseArray(size_t depth) {
  ++m_position; // '['
  JsonArray arr;

  skipWhitespace();
  if (peek() == ']') {
    ++m_position;
    return JsonValue(std::move(arr));
  }

  while (true) {
    skipWhitespace();
    auto value = parseValue(depth + 1);
    if (!value)
      return std::nullopt;
    arr.push_back(std::move(*value));

    skipWhitespace();
    if (peek() == ',') {
      ++m_position;
      continue;
    }
    if (peek() == ']') {
      ++m_position;
      return JsonValue(std::move(arr));
    }
    fail("Expected ',' or ']' in array");
    return std::nullopt;
  }
}

std::optional<std::string> JsonReader::parseString() {
  ++m_position; // opening quote
  std::string result;

  while (!atEnd()) {
    char c = m_input[m_position++];
    if (c == '"')
      return result;

    if (static_cast<unsigned char>(c) < 0x20) {
      --m_position;
      fail("Unescaped control character in string");
      return std::nullopt;
    }

    if (c != '\\') {
      result += c;
      continue;
    }

    if (atEnd())
      break;
    char escaped = m_input[m_position++];
    switch (escaped) {
    case '"':
      result += '"';
      break;
    case '\\':
      result += '\\';
      break;
    case '/':
      result += '/';
      break;
    case 'b':
      result += '\b';
      break;
    case 'f':
      result += '\f';
      break;
    case 'n':
      result += '\n';
      break;
    case 'r':
      result += '\r';
      break;
    case 't':
      result += '\t';
      break;
    case 'u':
      if (!appendCodepoint(result))
        return std::nullopt;
      break;
    default:
      --m_position;
      fail("Invalid escape sequence");
      return std::nullopt;
    }
  }

  fail("Unterminated string");
  return std::nullopt;
}

std::optional<uint32_t> JsonReader::parseHex4() {
  if (m_position + 4 > m_input.size()) {
    fail("Truncated unicode escape");
    return std::nullopt;
  }
  uint32_t value = 0;
  auto result = std::from_chars(m_input.data() + m_position,
                                m_input.data() + m_position + 4, value, 16);
  if (result.ec != std::errc() || result.ptr != m_input.data() + m_position + 4) {
    fail("Invalid unicode escape");
    return std::nullopt;
  }
  m_position += 4;
  return value;
}

// Decodes \uXXXX (with surrogate pairs) and appends it as UTF-8
bool JsonReader::appendCodepoint(std::string &out) {
  auto high = parseHex4();
  if (!high)
    return false;
  uint32_t codepoint = *high;

  if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
    if (m_input.substr(m_position, 2) != "\\u") {
      fail("Unpaired surrogate in unicode escape");
      return false;
    }
    m_position += 2;
    auto low = parseHex4();
    if (!low)
      return false;
    if (*low < 0xDC00 || *low > 0xDFFF) {
      fail("Invalid low surrogate in unicode escape");
      return false;
    }
    codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (*low - 0xDC00);
  } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
    fail("Unpaired surrogate in unicode escape");
    return false;
  }

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
  return true;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  const size_t start = m_position;
  auto digits = [this] {
    size_t count = 0;
    while (peek() >= '0' && peek() <= '9') {
      ++m_position;
      ++count;
    }
    return count;
  };

  if (peek() == '-')
    ++m_position;

  if (peek() == '0') {
    ++m_position;
  } else if (digits() == 0) {
    fail("Invalid number");
    return std::nullopt;
  }

  if (peek() == '.') {
    ++m_position;
    if (digits() == 0) {
      fail("Expected digits after decimal point");
      return std::nullopt;
    }
  }

  if (peek() == 'e' || peek() == 'E') {
    ++m_position;
    if (peek() == '+' || peek() == '-')
      ++m_position;
    if (digits() == 0) {
      fail("Expected digits in exponent");
      return std::nullopt;
    }
  }

  double value = 0.0;
  auto result = std::from_chars(m_input.data() + start, m_input.data() + m_position, value);
  if (result.ec != std::errc()) {
    m_position = start;
    fail("Number out of range");
    return std::nullopt;
  }
  return JsonValue(value);
}

bool JsonReader::parseLiteral(std::string_view literal) {
  if (m_input.substr(m_position, literal.size()) != literal) {
    fail("Invalid literal");
    return false;
  }
  m_position += literal.size();
  return true;
}

} // namespace ShoalEngine
