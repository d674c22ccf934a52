#include "cordon/jsonlite.hpp"

// DETERMINISM RISKS:
//   - std::strtod() honours the C locale. cordon never calls setlocale(), so the
//     decimal separator is always '.'. Output uses format_double(). → safe.

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace cordon::jsonlite {

namespace {

// Nesting bound for arrays/objects. Frames arriving from a forked worker are
// produced by cordon itself, but config files are operator input.
constexpr std::size_t kMaxDepth = 128;

struct Parser {
  const std::string& s;
  size_t i{0};
  size_t depth{0};
  std::optional<JsonError> err;

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  void fail(const std::string& message) {
    if (!err) err = JsonError{"json_parse_error", message + " at offset " + std::to_string(i)};
  }

  static void append_utf8(std::string& o, unsigned cp) {
    if (cp < 0x80) {
      o += static_cast<char>(cp);
    } else if (cp < 0x800) {
      o += static_cast<char>(0xC0 | (cp >> 6));
      o += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      o += static_cast<char>(0xE0 | (cp >> 12));
      o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      o += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  std::string parse_string() {
    if (!eat('"')) { fail("expected string"); return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (c == '\\' && i < s.size()) {
        char n = s[i++];
        if (n == 'n') o += '\n';
        else if (n == 't') o += '\t';
        else if (n == 'r') o += '\r';
        else if (n == 'b') o += '\b';
        else if (n == 'f') o += '\f';
        else if (n == 'u') {
          if (i + 4 > s.size()) { fail("truncated \\u escape"); return {}; }
          unsigned cp = 0;
          for (int k = 0; k < 4; ++k) {
            const char h = s[i++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
            else { fail("invalid \\u escape"); return {}; }
          }
          append_utf8(o, cp);
        } else {
          o += n;
        }
      } else {
        o += c;
      }
    }
    fail("unterminated string");
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    const size_t start = i;
    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool is_float = false;
    if (i < s.size() && s[i] == '.') {
      is_float = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid number format");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      is_float = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid exponent");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num_str = s.substr(start, i - start);
    errno = 0;
    if (!is_float) {
      char* end = nullptr;
      const long long n = std::strtoll(num_str.c_str(), &end, 10);
      if (errno == 0 && end && *end == '\0') {
        out_val = Value{static_cast<std::int64_t>(n)};
        return true;
      }
      errno = 0;
    }
    char* end = nullptr;
    const double d = std::strtod(num_str.c_str(), &end);
    if (!end || *end != '\0') {
      fail("invalid number");
      return false;
    }
    out_val = Value{d};
    return true;
  }

  Value parse_any() {
    ws();
    if (i >= s.size()) { fail("unexpected eof"); return {}; }
    if (s[i] == '{' || s[i] == '[') {
      if (++depth > kMaxDepth) { fail("nesting too deep"); return {}; }
      Value out = s[i] == '{' ? Value{parse_object()} : Value{parse_array()};
      --depth;
      return out;
    }
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 ||
        s.compare(i, 9, "-Infinity") == 0) {
      fail("NaN/Infinity unsupported");
      return {};
    }
    Value num_val;
    if (parse_number(num_val)) return num_val;
    fail("unexpected token");
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    if (eat('}')) return out;
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.count(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { fail("expected :"); break; }
      out[k] = parse_any();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { fail("expected ,"); break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_any());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { fail("expected ,"); break; }
    }
    return out;
  }
};

std::string escape_inner(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    } else {
      o += c;
    }
  }
  return o;
}

}  // namespace

// Non-finite doubles have no JSON spelling; they are emitted as null so that
// artifacts built from data with missing values stay valid JSON.
std::string format_double(double d) {
  if (!std::isfinite(d)) return "null";
  if (d == 0.0) return "0.0";
  // Shortest "%.Ng" that parses back to the same bits.
  char buf[64];
  int n = 0;
  for (int precision = 1; precision <= 17; ++precision) {
    n = std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
    if (std::strtod(buf, nullptr) == d) break;
  }
  std::string result(buf, static_cast<size_t>(n > 0 ? n : 0));
  if (result.find_first_of(".eEn") == std::string::npos) result += ".0";
  return result;
}

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (std::holds_alternative<bool>(v.v)) return std::get<bool>(v.v) ? "true" : "false";
  if (std::holds_alternative<std::string>(v.v)) return "\"" + escape_inner(std::get<std::string>(v.v)) + "\"";
  if (std::holds_alternative<std::int64_t>(v.v)) return std::to_string(std::get<std::int64_t>(v.v));
  if (std::holds_alternative<double>(v.v)) return format_double(std::get<double>(v.v));
  if (std::holds_alternative<Object>(v.v)) {
    std::string out = "{";
    bool first = true;
    for (const auto& [k, vv] : std::get<Object>(v.v)) {
      if (!first) out += ",";
      first = false;
      out += "\"" + escape_inner(k) + "\":" + to_json(vv);
    }
    return out + "}";
  }
  std::string out = "[";
  bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) {
    if (!first) out += ",";
    first = false;
    out += to_json(vv);
  }
  return out + "]";
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_any();
  p.ws();
  if (!p.err && p.i != text.size()) p.fail("trailing data");
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  auto v = parse_value(text, &err);
  if (!err && !v.is_object()) err = JsonError{"json_parse_error", "document is not an object"};
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

std::string escape(const std::string& s) { return escape_inner(s); }

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}

std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::int64_t>(it->second.v)) return def;
  return std::get<std::int64_t>(it->second.v);
}

double get_double(const Object& obj, const std::string& key, double def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (std::holds_alternative<double>(it->second.v)) return std::get<double>(it->second.v);
  if (std::holds_alternative<std::int64_t>(it->second.v)) {
    return static_cast<double>(std::get<std::int64_t>(it->second.v));
  }
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return out;
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (std::holds_alternative<std::string>(item.v)) {
      out.push_back(std::get<std::string>(item.v));
    }
  }
  return out;
}

}  // namespace cordon::jsonlite
