/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace RiverForge {

namespace {

const JsonValue &nullNode() {
  static const JsonValue node;
  return node;
}

} // namespace

std::optional<bool> JsonValue::tryAsBool() const {
  if (const auto *value = std::get_if<bool>(&m_value))
    return *value;
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const auto *value = std::get_if<double>(&m_value))
    return *value;
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (const auto number = tryAsNumber())
    return static_cast<int>(*number);
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const auto *value = std::get_if<std::string>(&m_value))
    return *value;
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  const auto *object = std::get_if<JsonObject>(&m_value);
  return object != nullptr && object->find(key) != object->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (const auto *object = std::get_if<JsonObject>(&m_value)) {
    if (auto it = object->find(key); it != object->end())
      return it->second;
  }
  return nullNode();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const auto *array = std::get_if<JsonArray>(&m_value);
  if (array == nullptr || index >= array->size())
    return nullNode();
  return (*array)[index];
}

size_t JsonValue::size() const {
  if (const auto *array = std::get_if<JsonArray>(&m_value))
    return array->size();
  if (const auto *object = std::get_if<JsonObject>(&m_value))
    return object->size();
  return 0;
}

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_lastError.clear();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (!parseValue(root, 0)) {
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected trailing characters");
  }

  m_root = std::move(root);
  return true;
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';
  char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (!atEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
    advance();
  }
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = message + " at line " + std::to_string(m_line) +
                  ", column " + std::to_string(m_column);
  }
  return false;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }

  switch (peek()) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string text;
    if (!parseString(text))
      return false;
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  case '\0':
    return fail("Unexpected end of input");
  default:
    if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) {
      return parseNumber(out);
    }
    return fail(std::string("Unexpected character '") + peek() + "'");
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  JsonObject object;
  advance(); // {
  skipWhitespace();

  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key in object");
    }
    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (advance() != ':') {
      return fail("Expected ':' after object key");
    }
    skipWhitespace();

    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    object[key] = std::move(value);

    skipWhitespace();
    char next = advance();
    if (next == '}')
      break;
    if (next != ',') {
      return fail("Expected ',' or '}' in object");
    }
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  JsonArray array;
  advance(); // [
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
    char next = advance();
    if (next == ']')
      break;
    if (next != ',') {
      return fail("Expected ',' or ']' in array");
    }
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  while (true) {
    if (atEnd()) {
      return fail("Unterminated string");
    }
    char c = advance();
    if (c == '"')
      return true;
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Control character in string");
    }
    if (c != '\\') {
      out.push_back(c);
      continue;
    }

    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out.push_back(escaped);
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u':
      if (!parseUnicodeEscape(out))
        return false;
      break;
    default:
      return fail("Invalid escape sequence");
    }
  }
}

bool JsonReader::parseUnicodeEscape(std::string &out) {
  uint32_t codePoint = 0;
  for (int i = 0; i < 4; ++i) {
    char h = advance();
    if (!std::isxdigit(static_cast<unsigned char>(h))) {
      return fail("Invalid unicode escape");
    }
    codePoint = (codePoint << 4) |
                static_cast<uint32_t>(std::isdigit(static_cast<unsigned char>(h))
                                          ? h - '0'
                                          : (std::tolower(h) - 'a' + 10));
  }

  // Encode the BMP code point as UTF-8
  if (codePoint < 0x80) {
    out.push_back(static_cast<char>(codePoint));
  } else if (codePoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_position;
  if (peek() == '-')
    advance();
  if (!std::isdigit(static_cast<unsigned char>(peek()))) {
    return fail("Invalid number");
  }
  while (std::isdigit(static_cast<unsigned char>(peek())))
    advance();
  if (peek() == '.') {
    advance();
    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
      return fail("Expected digit after decimal point");
    }
    while (std::isdigit(static_cast<unsigned char>(peek())))
      advance();
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
      return fail("Expected digit in exponent");
    }
    while (std::isdigit(static_cast<unsigned char>(peek())))
      advance();
  }

  const std::string text = m_input.substr(start, m_position - start);
  out = JsonValue(std::strtod(text.c_str(), nullptr));
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value,
                              JsonValue &out) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (advance() != *p) {
      return fail(std::string("Invalid literal, expected '") + literal + "'");
    }
  }
  out = std::move(value);
  return true;
}

} // namespace RiverForge
