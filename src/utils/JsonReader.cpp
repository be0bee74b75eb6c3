/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace Nightfall {

namespace {
// Nesting limit for arrays and objects
constexpr int MAX_DEPTH = 64;

bool isDigit(char c) { return c >= '0' && c <= '9'; }

int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

void appendUtf8(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}
} // namespace

// JsonValue implementation
JsonType JsonValue::getType() const {
  if (isBool())
    return JsonType::Boolean;
  if (isNumber())
    return JsonType::Number;
  if (isString())
    return JsonType::String;
  if (isArray())
    return JsonType::Array;
  if (isObject())
    return JsonType::Object;
  return JsonType::Null;
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

std::optional<int> JsonValue::tryAsInt() const {
  if (!isNumber())
    return std::nullopt;
  const double number = asNumber();
  if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max())
    return std::nullopt;
  return static_cast<int>(number);
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return isArray() ? &asArray() : nullptr;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  if (!isObject())
    return false;
  const auto &obj = asObject();
  return obj.find(key) != obj.end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : null_value;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  if (!isArray())
    return null_value;
  const auto &arr = asArray();
  return (index < arr.size()) ? arr[index] : null_value;
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_line = 0;
    m_column = 0;
    setError("Could not open file: " + path);
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  JsonValue parsed;
  skipWhitespace();
  if (!parseValue(parsed, 0)) {
    return false;
  }
  skipWhitespace();
  if (m_position < m_input.length()) {
    setError("Unexpected trailing content");
    return false;
  }
  m_root = std::move(parsed);
  return true;
}

void JsonReader::setError(const std::string &message) {
  m_lastError = "Line " + std::to_string(m_line) + ", Column " +
                std::to_string(m_column) + ": " + message;
}

char JsonReader::peek() const {
  return (m_position < m_input.length()) ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.length())
    return '\0';

  char c = m_input[m_position++];
  if (c == '\n') {
    m_line++;
    m_column = 1;
  } else {
    m_column++;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (m_position < m_input.length()) {
    char c = peek();
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
      advance();
    } else {
      break;
    }
  }
}

bool JsonReader::expectLiteral(const char *literal) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (peek() != *p) {
      setError(std::string("Invalid token, expected '") + literal + "'");
      return false;
    }
    advance();
  }
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return false;
  }

  char c = peek();
  switch (c) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string str;
    if (!parseString(str))
      return false;
    out = JsonValue(std::move(str));
    return true;
  }
  case 't':
    if (!expectLiteral("true"))
      return false;
    out = JsonValue(true);
    return true;
  case 'f':
    if (!expectLiteral("false"))
      return false;
    out = JsonValue(false);
    return true;
  case 'n':
    if (!expectLiteral("null"))
      return false;
    out = JsonValue();
    return true;
  case '\0':
    setError("Unexpected end of input");
    return false;
  default:
    if (isDigit(c) || c == '-') {
      double number = 0.0;
      if (!parseNumber(number))
        return false;
      out = JsonValue(number);
      return true;
    }
    setError("Unexpected character: " + std::string(1, c));
    return false;
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject object;
  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return false;
    }
    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (peek() != ':') {
      setError("Expected ':' after object key");
      return false;
    }
    advance();
    skipWhitespace();

    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    object[std::move(key)] = std::move(value);

    skipWhitespace();
    char c = advance();
    if (c == '}')
      break;
    if (c != ',') {
      setError("Expected ',' or '}' in object");
      return false;
    }
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray array;
  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    array.push_back(std::move(value));

    skipWhitespace();
    char c = advance();
    if (c == ']')
      break;
    if (c != ',') {
      setError("Expected ',' or ']' in array");
      return false;
    }
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (m_position < m_input.length()) {
    char c = advance();
    if (c == '"')
      return true;

    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Control character in string");
      return false;
    }

    if (c != '\\') {
      out += c;
      continue;
    }

    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out += escaped;
      break;
    case 'b':
      out += '\b';
      break;
    case 'f':
      out += '\f';
      break;
    case 'n':
      out += '\n';
      break;
    case 'r':
      out += '\r';
      break;
    case 't':
      out += '\t';
      break;
    case 'u':
      if (!parseUnicodeEscape(out))
        return false;
      break;
    case '\0':
      setError("Unexpected end of input in string escape");
      return false;
    default:
      setError("Invalid escape sequence: \\" + std::string(1, escaped));
      return false;
    }
  }

  setError("Unterminated string");
  return false;
}

bool JsonReader::parseUnicodeEscape(std::string &out) {
  auto readHex4 = [this](uint32_t &value) {
    value = 0;
    for (int i = 0; i < 4; ++i) {
      int digit = hexValue(peek());
      if (digit < 0) {
        setError("Invalid unicode escape");
        return false;
      }
      advance();
      value = (value << 4) | static_cast<uint32_t>(digit);
    }
    return true;
  };

  uint32_t cp = 0;
  if (!readHex4(cp))
    return false;

  // Surrogate pair
  if (cp >= 0xD800 && cp <= 0xDBFF) {
    if (peek() != '\\')
      return setError("Unpaired surrogate in unicode escape"), false;
    advance();
    if (peek() != 'u')
      return setError("Unpaired surrogate in unicode escape"), false;
    advance();
    uint32_t low = 0;
    if (!readHex4(low))
      return false;
    if (low < 0xDC00 || low > 0xDFFF)
      return setError("Invalid low surrogate in unicode escape"), false;
    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
  }

  appendUtf8(out, cp);
  return true;
}

bool JsonReader::parseNumber(double &out) {
  size_t start = m_position;
  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek()))
      advance();
  } else {
    setError("Invalid number");
    return false;
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      setError("Expected digit after decimal point");
      return false;
    }
    while (isDigit(peek()))
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek())) {
      setError("Expected digit in exponent");
      return false;
    }
    while (isDigit(peek()))
      advance();
  }

  std::string text = m_input.substr(start, m_position - start);
  errno = 0;
  char *end = nullptr;
  out = std::strtod(text.c_str(), &end);
  if (errno == ERANGE || end != text.c_str() + text.size()) {
    setError("Number out of range: " + text);
    return false;
  }
  return true;
}

} // namespace Nightfall
