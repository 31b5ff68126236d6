/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace RiverForge {

class JsonValue;

using JsonObject = std::map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

// Enumerators follow the alternative order of JsonValue's variant
enum class JsonType { Null, Boolean, Number, String, Array, Object };

// Stream operator for JsonType (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, JsonType type) {
  static constexpr const char *names[] = {"Null",   "Boolean", "Number",
                                          "String", "Array",   "Object"};
  return os << names[static_cast<size_t>(type)];
}

/**
 * @brief Node of a parsed config document
 *
 * Lookups never throw: a missing key, an out of range index or a lookup on
 * a non-container all yield a shared null node, so nested sections can be
 * chained as reader.getRoot()["streaming"]["chunkSize"]. Only the as*()
 * accessors throw (std::bad_variant_access) when the type is wrong.
 */
class JsonValue {
public:
  JsonValue() = default;
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(std::string value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

  JsonType getType() const { return static_cast<JsonType>(m_value.index()); }
  bool isNull() const { return holds<std::monostate>(); }
  bool isBool() const { return holds<bool>(); }
  bool isNumber() const { return holds<double>(); }
  bool isString() const { return holds<std::string>(); }
  bool isArray() const { return holds<JsonArray>(); }
  bool isObject() const { return holds<JsonObject>(); }

  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  int asInt() const { return static_cast<int>(asNumber()); }
  const std::string &asString() const { return std::get<std::string>(m_value); }

  // Empty when the node holds another type
  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  std::optional<int> tryAsInt() const;
  std::optional<std::string> tryAsString() const;

  bool hasKey(const std::string &key) const;
  const JsonValue &operator[](const std::string &key) const;
  const JsonValue &operator[](size_t index) const;

  // Element count of an array or object, 0 for scalars
  size_t size() const;

private:
  std::variant<std::monostate, bool, double, std::string, JsonArray,
               JsonObject>
      m_value;

  template <typename T> bool holds() const {
    return std::holds_alternative<T>(m_value);
  }
};

/**
 * @brief Recursive descent JSON reader
 *
 * Parses a complete document into a JsonValue tree. Errors carry the line
 * and column where parsing stopped.
 */
class JsonReader {
public:
  JsonReader() = default;

  bool loadFromFile(const std::string &path);
  bool parse(const std::string &jsonString);
  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }

private:
  std::string m_input;
  size_t m_position{0};
  size_t m_line{1};
  size_t m_column{1};
  std::string m_lastError;
  JsonValue m_root;

  bool parseValue(JsonValue &out, int depth);
  bool parseObject(JsonValue &out, int depth);
  bool parseArray(JsonValue &out, int depth);
  bool parseString(std::string &out);
  bool parseNumber(JsonValue &out);
  bool parseLiteral(const char *literal, JsonValue value, JsonValue &out);
  bool parseUnicodeEscape(std::string &out);

  char peek() const;
  char advance();
  bool atEnd() const { return m_position >= m_input.size(); }
  void skipWhitespace();
  bool fail(const std::string &message);

  static constexpr int MAX_DEPTH = 64;
};

} // namespace RiverForge

#endif // JSONREADER_HPP
