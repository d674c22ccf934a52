#pragma once

// cordon/jsonlite.hpp: Minimal JSON value tree, parser and canonical writer.
//
// Used for three things only:
//   - AllowList configuration files (allow_list.cpp)
//   - Artifact payloads and their canonical digests (types.cpp)
//   - The outcome frame shipped from a forked worker to its parent (executor.cpp)
//
// DETERMINISM:
//   Object is a std::map, so to_json() always emits keys sorted. format_double()
//   emits the shortest rendering that parses back to the same bits, so a
//   value survives a trip through the forked-worker pipe unchanged.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cordon::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Object, Array> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(int i) : v(static_cast<std::int64_t>(i)) {}
  Value(std::int64_t i) : v(i) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_number() const {
    return std::holds_alternative<std::int64_t>(v) || std::holds_alternative<double>(v);
  }

  bool operator==(const Value& other) const { return v == other.v; }
  bool operator!=(const Value& other) const { return !(*this == other); }
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse any JSON value. On failure *error is set and a null Value is returned.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON document that must be an object.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. Missing or mistyped keys return the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);

}  // namespace cordon::jsonlite
