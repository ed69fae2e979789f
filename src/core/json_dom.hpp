#ifndef GARMIN_COACH_CORE_JSON_DOM_HPP_
#define GARMIN_COACH_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace garmin_coach::core::json {

// STL-only JSON document used for the operation config file.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;
};

inline const char* TypeName(Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNull:
    return "null";
  }
  return "null";
}

namespace detail {

// Containers nested deeper than this are rejected before recursion can
// exhaust the stack.
inline constexpr std::size_t kMaxNestingDepth = 64;

// Cursor over the input that tracks line/column for diagnostics.
class Cursor {
public:
  explicit Cursor(std::string_view input) : input_(input) {}

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  char Peek() const {
    return input_[pos_];
  }

  char Take() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool TakeIf(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Take();
    return true;
  }

  bool TakeWord(std::string_view word) {
    if (input_.substr(pos_, word.size()) != word) {
      return false;
    }
    for (std::size_t i = 0; i < word.size(); ++i) {
      Take();
    }
    return true;
  }

  void SkipSpace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Take();
    }
  }

  std::size_t Position() const {
    return pos_;
  }

  std::string_view Slice(std::size_t begin) const {
    return input_.substr(begin, pos_ - begin);
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

private:
  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool ParseValue(Cursor& cursor, Value& value, std::size_t depth, std::string& error);

inline bool ParseString(Cursor& cursor, std::string& output, std::string& error) {
  output.clear();
  if (!cursor.TakeIf('"')) {
    return cursor.Fail("expected '\"' to start string", error);
  }

  while (!cursor.AtEnd()) {
    const char c = cursor.Take();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20U) {
      return cursor.Fail("control character in string is not allowed", error);
    }
    if (c != '\\') {
      output.push_back(c);
      continue;
    }

    if (cursor.AtEnd()) {
      break;
    }
    switch (const char esc = cursor.Take(); esc) {
    case '"':
    case '\\':
    case '/':
      output.push_back(esc);
      break;
    case 'b':
      output.push_back('\b');
      break;
    case 'f':
      output.push_back('\f');
      break;
    case 'n':
      output.push_back('\n');
      break;
    case 'r':
      output.push_back('\r');
      break;
    case 't':
      output.push_back('\t');
      break;
    case 'u':
      return cursor.Fail("unicode escapes are not supported", error);
    default:
      return cursor.Fail("invalid escape sequence in string", error);
    }
  }

  return cursor.Fail("unterminated string literal", error);
}

inline bool ParseNumber(Cursor& cursor, double& output, std::string& error) {
  const std::size_t begin = cursor.Position();
  const auto take_digits = [&cursor] {
    std::size_t count = 0;
    while (!cursor.AtEnd() && std::isdigit(static_cast<unsigned char>(cursor.Peek())) != 0) {
      cursor.Take();
      ++count;
    }
    return count;
  };

  cursor.TakeIf('-');
  if (!cursor.TakeIf('0') && take_digits() == 0U) {
    return cursor.Fail("expected digits in number", error);
  }
  if (cursor.TakeIf('.') && take_digits() == 0U) {
    return cursor.Fail("expected digits after decimal point", error);
  }
  if (cursor.TakeIf('e') || cursor.TakeIf('E')) {
    if (!cursor.TakeIf('+')) {
      cursor.TakeIf('-');
    }
    if (take_digits() == 0U) {
      return cursor.Fail("expected exponent digits", error);
    }
  }

  const std::string text(cursor.Slice(begin));
  char* end = nullptr;
  output = std::strtod(text.c_str(), &end);
  if (end == nullptr || *end != '\0') {
    return cursor.Fail("invalid numeric value", error);
  }
  return true;
}

inline bool ParseObject(Cursor& cursor, Value& value, std::size_t depth, std::string& error) {
  value = Value{};
  value.type = Value::Type::kObject;
  cursor.Take(); // '{'
  cursor.SkipSpace();
  if (cursor.TakeIf('}')) {
    return true;
  }

  while (true) {
    cursor.SkipSpace();
    std::string key;
    if (!ParseString(cursor, key, error)) {
      return false;
    }
    cursor.SkipSpace();
    if (!cursor.TakeIf(':')) {
      return cursor.Fail("expected ':' after object key", error);
    }
    cursor.SkipSpace();
    if (value.object_value.count(key) != 0U) {
      return cursor.Fail("duplicate object key '" + key + "'", error);
    }
    if (!ParseValue(cursor, value.object_value[key], depth + 1U, error)) {
      return false;
    }
    cursor.SkipSpace();
    if (cursor.TakeIf('}')) {
      return true;
    }
    if (!cursor.TakeIf(',')) {
      return cursor.Fail("expected ',' between object entries", error);
    }
  }
}

inline bool ParseArray(Cursor& cursor, Value& value, std::size_t depth, std::string& error) {
  value = Value{};
  value.type = Value::Type::kArray;
  cursor.Take(); // '['
  cursor.SkipSpace();
  if (cursor.TakeIf(']')) {
    return true;
  }

  while (true) {
    cursor.SkipSpace();
    Value& item = value.array_value.emplace_back();
    if (!ParseValue(cursor, item, depth + 1U, error)) {
      return false;
    }
    cursor.SkipSpace();
    if (cursor.TakeIf(']')) {
      return true;
    }
    if (!cursor.TakeIf(',')) {
      return cursor.Fail("expected ',' between array items", error);
    }
  }
}

inline bool ParseValue(Cursor& cursor, Value& value, std::size_t depth, std::string& error) {
  if (cursor.AtEnd()) {
    return cursor.Fail("unexpected end of input while parsing value", error);
  }

  const char c = cursor.Peek();
  if ((c == '{' || c == '[') && depth >= kMaxNestingDepth) {
    return cursor.Fail("nesting too deep (limit " + std::to_string(kMaxNestingDepth) + ")",
                       error);
  }
  if (c == '{') {
    return ParseObject(cursor, value, depth, error);
  }
  if (c == '[') {
    return ParseArray(cursor, value, depth, error);
  }
  if (c == '"') {
    value.type = Value::Type::kString;
    return ParseString(cursor, value.string_value, error);
  }
  if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
    value.type = Value::Type::kNumber;
    return ParseNumber(cursor, value.number_value, error);
  }
  if (cursor.TakeWord("true") || cursor.TakeWord("false")) {
    value.type = Value::Type::kBool;
    value.bool_value = (c == 't');
    return true;
  }
  if (cursor.TakeWord("null")) {
    value.type = Value::Type::kNull;
    return true;
  }
  return cursor.Fail("expected JSON value", error);
}

} // namespace detail

// Parses one JSON document. Trailing non-space content is an error.
inline bool Parse(std::string_view input, Value& root, std::string& error) {
  detail::Cursor cursor(input);
  cursor.SkipSpace();
  if (!detail::ParseValue(cursor, root, 0U, error)) {
    return false;
  }
  cursor.SkipSpace();
  if (!cursor.AtEnd()) {
    return cursor.Fail("unexpected trailing content after JSON value", error);
  }
  return true;
}

} // namespace garmin_coach::core::json

#endif // GARMIN_COACH_CORE_JSON_DOM_HPP_
