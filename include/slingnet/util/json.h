#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace slingnet::json {

struct Value;
using Array = std::vector<Value>;
using Object = std::unordered_map<std::string, Value>;

// Minimal JSON document tree (null, bool, number, string, array, object).
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool* as_bool() const;
  const double* as_number() const;
  const std::string* as_string() const;
  const Array* as_array() const;
  const Object* as_object() const;

  Array* as_array();
  Object* as_object();

  // Throws std::runtime_error if not present / wrong container type.
  const Value& at(const std::string& key) const;
  const Value& at(std::size_t index) const;

  // nullptr if this is not an object or the key is missing.
  const Value* find(const std::string& key) const;

  // Lenient accessors: return `def` on a type mismatch.
  bool bool_value(bool def = false) const;
  double number_value(double def = 0.0) const;
  std::int64_t int_value(std::int64_t def = 0) const;
  std::string string_value(const std::string& def = "") const;

  // Throw std::runtime_error on a type mismatch.
  const Object& object() const;
  const Array& array() const;
};

// Parse a JSON document. Throws std::runtime_error with line/column context.
Value parse(const std::string& text);

// Serialize. Object keys are written in sorted order so output is stable.
// indent <= 0 produces compact output.
std::string stringify(const Value& v, int indent = 2);

Value object(Object o);
Value array(Array a);

} // namespace slingnet::json
