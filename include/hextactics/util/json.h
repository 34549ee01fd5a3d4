#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace hextactics::json {

struct Value;
using Array = std::vector<Value>;
using Object = std::unordered_map<std::string, Value>;

// JSON document node used for rules files, saved games and move logs.
//
// Numbers are doubles, so only integers up to 2^53 survive a round trip.
// 64-bit quantities (RNG state, digests) are stored as hex strings instead.
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  bool is_null() const;
  bool is_object() const;

  // nullptr on a type mismatch.
  const bool* as_bool() const;
  const double* as_number() const;
  const std::string* as_string() const;
  const Array* as_array() const;
  const Object* as_object() const;
  Object* as_object();

  // Required member lookup. Throws std::runtime_error naming the key.
  const Value& at(const std::string& key) const;
  // Optional member lookup.
  const Value* find(const std::string& key) const;

  // Scalar reads that fall back to def on a type mismatch.
  bool bool_value(bool def = false) const;
  double number_value(double def = 0.0) const;
  std::int64_t int_value(std::int64_t def = 0) const;
  std::string string_value(const std::string& def = "") const;

  const Object& object() const;
  const Array& array() const;
};

// Throws std::runtime_error with line, column and a caret snippet.
Value parse(const std::string& text);

// Keys are written sorted, so equal values give identical bytes.
// indent <= 0 gives a single line.
std::string stringify(const Value& v, int indent = 2);

Value object(Object o);
Value array(Array a);

} // namespace hextactics::json
