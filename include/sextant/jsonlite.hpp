#pragma once

// sextant/jsonlite.hpp — Minimal JSON value model, parser and serializer.
//
// Used for the message envelope wire codec, spool frame headers, the JSON
// secret/seed stores, audit records and structured log lines.
//
// INVARIANTS:
//   - Objects serialize with sorted keys (std::map iteration), so to_json()
//     output is stable for equal values.
//   - Duplicate object keys are a parse error.
//   - Non-negative integers are held as uint64; negative or fractional numbers
//     as double.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sextant::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, double, Object, Array> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : v(b) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(std::uint64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
};

struct JsonError {
  std::string code;
  std::string message;
};

Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parses text that must hold a top-level object. Returns {} on error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. Missing keys and type mismatches yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

Array to_array(const std::vector<std::string>& items);
Object to_object(const std::map<std::string, std::string>& items);

}  // namespace sextant::jsonlite
