#pragma once

// preflight/jsonlite.hpp: Schema-agnostic JSON document tree.
//
// The node config is read, mutated and written back as a generic tree so that
// fields this harness does not understand survive the round trip untouched.
// Objects are std::map: serialization emits keys in sorted order, the same
// order the node itself uses when it marshals a map.
//
// Integers keep their integer form (u64 for non-negative, i64 for negative);
// only literals with a fraction or exponent become double.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace preflight::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, std::int64_t, double,
               std::string, Object, Array>
      v{nullptr};

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t n) : v(n) {}
  Value(std::int64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_bool() const { return std::holds_alternative<bool>(v); }
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse any JSON value. Trailing data, duplicate keys, unterminated strings
// and malformed numbers set *error.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a document whose root must be an object.
Object parse(const std::string& text, std::optional<JsonError>* error);

// indent == 0: compact. indent > 0: one member per line, nested by indent spaces.
std::string serialize(const Value& value, int indent = 0);

std::string escape(const std::string& s);

// Type-checked member access. Return nullptr when the key is absent or holds
// another type.
Object* find_object(Object& obj, const std::string& key);
const Object* find_object(const Object& obj, const std::string& key);
const std::string* find_string(const Object& obj, const std::string& key);
const Array* find_array(const Object& obj, const std::string& key);

// Value-or-default extractors.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);

}  // namespace preflight::jsonlite
