#include "cordon/value.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <limits>

#include "cordon/interpreter.hpp"

namespace cordon {

namespace {

constexpr int kMaxReprDepth = 64;

std::string quote_string(const std::string& s) {
  const bool has_single = s.find('\'') != std::string::npos;
  const bool has_double = s.find('"') != std::string::npos;
  const char q = (has_single && !has_double) ? '"' : '\'';
  std::string out;
  out.reserve(s.size() + 2);
  out += q;
  for (char c : s) {
    const auto u = static_cast<unsigned char>(c);
    if (c == q || c == '\\') {
      out += '\\';
      out += c;
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\t') {
      out += "\\t";
    } else if (c == '\r') {
      out += "\\r";
    } else if (u < 0x20 || u == 0x7f) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\x%02x", u);
      out += buf;
    } else {
      out += c;
    }
  }
  out += q;
  return out;
}

std::string join_repr(const std::vector<Value>& items, int depth) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i) out += ", ";
    out += repr(items[i], depth + 1);
  }
  return out;
}

std::string group_thousands(const std::string& number, char sep) {
  size_t start = (!number.empty() && (number[0] == '-' || number[0] == '+')) ? 1 : 0;
  size_t end = number.find_first_of(".eE%", start);
  if (end == std::string::npos) end = number.size();
  std::string digits = number.substr(start, end - start);
  std::string grouped;
  const size_t n = digits.size();
  for (size_t i = 0; i < n; ++i) {
    grouped += digits[i];
    const size_t remaining = n - i - 1;
    if (remaining > 0 && remaining % 3 == 0) grouped += sep;
  }
  return number.substr(0, start) + grouped + number.substr(end);
}

}  // namespace

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

std::string ScriptError::describe() const {
  std::string out = type_name_;
  if (!message_.empty()) out += ": " + message_;
  if (line_ > 0) out += " (line " + std::to_string(line_) + ")";
  return out;
}

std::string CapabilityViolation::describe() const {
  std::string out = kind_ == Kind::import_blocked ? "ImportBlocked: " : "AttributeBlocked: ";
  out += detail_;
  if (line_ > 0) out += " (line " + std::to_string(line_) + ")";
  return out;
}

void throw_type_error(const std::string& message) { throw ScriptError("TypeError", message); }
void throw_value_error(const std::string& message) { throw ScriptError("ValueError", message); }

bool exception_matches(const std::string& raised, const std::string& handler) {
  if (handler == raised || handler == "Exception" || handler == "BaseException") return true;
  if (handler == "LookupError") return raised == "KeyError" || raised == "IndexError";
  if (handler == "ArithmeticError") return raised == "ZeroDivisionError" || raised == "OverflowError";
  if (handler == "ValueError") return raised == "StatisticsError";
  return false;
}

// ---------------------------------------------------------------------------
// ArgBinder
// ---------------------------------------------------------------------------

ArgBinder::ArgBinder(const std::string& function, const CallArgs& args, std::initializer_list<const char*> params,
                     std::size_t required)
    : function_(function) {
  for (const char* p : params) names_.emplace_back(p);
  bound_.assign(names_.size(), nullptr);
  if (args.positional.size() > names_.size()) {
    throw_type_error(function + "() takes at most " + std::to_string(names_.size()) + " positional arguments (" +
                     std::to_string(args.positional.size()) + " given)");
  }
  for (size_t i = 0; i < args.positional.size(); ++i) bound_[i] = &args.positional[i];
  for (const auto& [name, value] : args.keywords) {
    auto it = std::find(names_.begin(), names_.end(), name);
    if (it == names_.end()) throw_type_error(function + "() got an unexpected keyword argument '" + name + "'");
    const size_t idx = static_cast<size_t>(it - names_.begin());
    if (bound_[idx] != nullptr) throw_type_error(function + "() got multiple values for argument '" + name + "'");
    bound_[idx] = &value;
  }
  for (size_t i = 0; i < required && i < names_.size(); ++i) {
    if (bound_[i] == nullptr) {
      throw_type_error(function + "() missing required argument: '" + names_[i] + "'");
    }
  }
}

const Value& ArgBinder::get(std::size_t index) const {
  if (!has(index)) {
    throw_type_error(function_ + "() missing required argument: '" +
                     (index < names_.size() ? names_[index] : std::string("?")) + "'");
  }
  return *bound_[index];
}

Value ArgBinder::get_or(std::size_t index, Value fallback) const {
  return has(index) ? *bound_[index] : std::move(fallback);
}

// ---------------------------------------------------------------------------
// Objects
// ---------------------------------------------------------------------------

std::string Object::repr(int) const { return "<" + type_name() + " object>"; }

std::optional<Value> Object::attribute(Interpreter&, const std::shared_ptr<Object>&, const std::string&) {
  return std::nullopt;
}

std::optional<jsonlite::Value> Object::to_json(int) const { return std::nullopt; }

void release_nested(std::vector<Value> values) {
  while (!values.empty()) {
    Value value = std::move(values.back());
    values.pop_back();
    if (value.is_object() && value.as_object().use_count() == 1) value.as_object()->move_children(values);
  }
}

void ListObject::move_children(std::vector<Value>& out) {
  std::move(items.begin(), items.end(), std::back_inserter(out));
  items.clear();
}

void TupleObject::move_children(std::vector<Value>& out) {
  std::move(items.begin(), items.end(), std::back_inserter(out));
  items.clear();
}

DictObject::~DictObject() {
  std::vector<Value> values;
  move_children(values);
  release_nested(std::move(values));
}

void DictObject::move_children(std::vector<Value>& out) {
  out.reserve(out.size() + 2 * entries_.size());
  for (auto& [key, value] : entries_) {
    out.push_back(std::move(key));
    out.push_back(std::move(value));
  }
  entries_.clear();
  index_.clear();
}

std::string ListObject::repr(int depth) const {
  if (depth > kMaxReprDepth) return "[...]";
  return "[" + join_repr(items, depth) + "]";
}

std::string TupleObject::repr(int depth) const {
  if (depth > kMaxReprDepth) return "(...)";
  if (items.size() == 1) return "(" + cordon::repr(items[0], depth + 1) + ",)";
  return "(" + join_repr(items, depth) + ")";
}

std::string DictObject::repr(int depth) const {
  if (depth > kMaxReprDepth) return "{...}";
  std::string out = "{";
  for (size_t i = 0; i < entries_.size(); ++i) {
    if (i) out += ", ";
    out += cordon::repr(entries_[i].first, depth + 1) + ": " + cordon::repr(entries_[i].second, depth + 1);
  }
  return out + "}";
}

const Value* DictObject::find(const Value& key) const {
  auto it = index_.find(hash_key(key));
  return it == index_.end() ? nullptr : &entries_[it->second].second;
}

void DictObject::set(const Value& key, Value value) {
  const std::string k = hash_key(key);
  auto it = index_.find(k);
  if (it != index_.end()) {
    entries_[it->second].second = std::move(value);
    return;
  }
  index_.emplace(k, entries_.size());
  entries_.emplace_back(key, std::move(value));
}

bool DictObject::erase(const Value& key) {
  auto it = index_.find(hash_key(key));
  if (it == index_.end()) return false;
  const size_t pos = it->second;
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
  index_.erase(it);
  for (auto& [k, i] : index_) {
    if (i > pos) --i;
  }
  return true;
}

std::string SliceObject::repr(int depth) const {
  return "slice(" + cordon::repr(lower, depth + 1) + ", " + cordon::repr(upper, depth + 1) + ", " +
         cordon::repr(step, depth + 1) + ")";
}

std::vector<std::int64_t> SliceObject::resolve(std::int64_t n) const {
  auto bound = [](const Value& v, const char* what) -> std::optional<std::int64_t> {
    if (v.is_none()) return std::nullopt;
    if (v.is_int()) return v.as_int();
    if (v.is_bool()) return v.as_bool() ? 1 : 0;
    throw_type_error(std::string("slice ") + what + " must be an integer or None");
  };
  const std::int64_t step_v = bound(step, "step").value_or(1);
  if (step_v == 0) throw_value_error("slice step cannot be zero");
  std::optional<std::int64_t> lo = bound(lower, "indices");
  std::optional<std::int64_t> hi = bound(upper, "indices");

  auto clamp = [n, step_v](std::int64_t i) {
    if (i < 0) {
      i += n;
      if (i < 0) i = step_v < 0 ? -1 : 0;
    } else if (i >= n) {
      i = step_v < 0 ? n - 1 : n;
    }
    return i;
  };
  std::int64_t start = lo ? clamp(*lo) : (step_v < 0 ? n - 1 : 0);
  std::int64_t stop = hi ? clamp(*hi) : (step_v < 0 ? -1 : n);

  std::vector<std::int64_t> out;
  if (step_v > 0) {
    for (std::int64_t i = start; i < stop; i += step_v) out.push_back(i);
  } else {
    for (std::int64_t i = start; i > stop; i += step_v) out.push_back(i);
  }
  return out;
}

std::int64_t RangeObject::size() const {
  if (step > 0 && start < stop) return (stop - start + step - 1) / step;
  if (step < 0 && start > stop) return (start - stop - step - 1) / (-step);
  return 0;
}

std::string RangeObject::repr(int) const {
  std::string out = "range(" + std::to_string(start) + ", " + std::to_string(stop);
  if (step != 1) out += ", " + std::to_string(step);
  return out + ")";
}

const Value* Scope::lookup(const std::string& name) const {
  for (const Scope* s = this; s != nullptr; s = s->parent.get()) {
    auto it = s->vars.find(name);
    if (it != s->vars.end()) return &it->second;
  }
  return nullptr;
}

std::string FunctionObject::repr(int) const { return "<function " + name + ">"; }
std::string NativeFunction::repr(int) const { return "<built-in function " + name + ">"; }
std::string ModuleObject::repr(int) const { return "<module '" + name + "'>"; }

std::optional<Value> ModuleObject::attribute(Interpreter&, const ObjectPtr&, const std::string& attr) {
  auto it = attrs.find(attr);
  if (it == attrs.end()) return std::nullopt;
  return it->second;
}

std::string ExceptionTypeObject::repr(int) const { return "<class '" + name + "'>"; }

std::string ExceptionObject::repr(int) const { return type + "(" + quote_string(message) + ")"; }

std::optional<Value> ExceptionObject::attribute(Interpreter&, const ObjectPtr&, const std::string& name) {
  if (name == "args") return Value(make_tuple({Value(message)}));
  if (name == "message") return Value(message);
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

ObjectPtr make_native(std::string name, NativeFn fn) {
  return std::make_shared<NativeFunction>(std::move(name), std::move(fn));
}

ObjectPtr make_tuple(std::vector<Value> items) { return std::make_shared<TupleObject>(std::move(items)); }

std::string type_name(const Value& value) {
  switch (value.v.index()) {
    case 0: return "NoneType";
    case 1: return "bool";
    case 2: return "int";
    case 3: return "float";
    case 4: return "str";
    default: return value.as_object()->type_name();
  }
}

bool truthy(const Value& value) {
  switch (value.v.index()) {
    case 0: return false;
    case 1: return value.as_bool();
    case 2: return value.as_int() != 0;
    case 3: return value.as_float() != 0.0;
    case 4: return !value.as_str().empty();
    default: return value.as_object()->truthy();
  }
}

std::string format_float(double d) {
  if (std::isnan(d)) return "nan";
  if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
  if (d == 0.0) return std::signbit(d) ? "-0.0" : "0.0";

  char buf[40];
  for (int precision = 1; precision <= 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*e", precision - 1, d);
    if (std::strtod(buf, nullptr) == d) break;
  }
  // buf is "[-]d[.ddd]e[+-]XX"
  std::string s(buf);
  const bool negative = s[0] == '-';
  if (negative) s.erase(0, 1);
  const size_t e = s.find('e');
  const int exponent = std::atoi(s.c_str() + e + 1);
  std::string digits;
  for (size_t i = 0; i < e; ++i) {
    if (s[i] != '.') digits += s[i];
  }
  while (digits.size() > 1 && digits.back() == '0') digits.pop_back();

  std::string out;
  if (exponent >= -4 && exponent < 16) {
    if (exponent >= 0) {
      const size_t int_len = static_cast<size_t>(exponent) + 1;
      if (digits.size() <= int_len) {
        out = digits + std::string(int_len - digits.size(), '0') + ".0";
      } else {
        out = digits.substr(0, int_len) + "." + digits.substr(int_len);
      }
    } else {
      out = "0." + std::string(static_cast<size_t>(-exponent - 1), '0') + digits;
    }
  } else {
    out = digits.substr(0, 1);
    if (digits.size() > 1) out += "." + digits.substr(1);
    char exp_buf[16];
    std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+', std::abs(exponent));
    out += exp_buf;
  }
  return negative ? "-" + out : out;
}

std::string repr(const Value& value, int depth) {
  switch (value.v.index()) {
    case 0: return "None";
    case 1: return value.as_bool() ? "True" : "False";
    case 2: return std::to_string(value.as_int());
    case 3: return format_float(value.as_float());
    case 4: return quote_string(value.as_str());
    default: return value.as_object()->repr(depth);
  }
}

std::string str(const Value& value) {
  if (value.is_str()) return value.as_str();
  if (auto e = value.as<ExceptionObject>()) return e->message;
  return repr(value);
}

bool values_equal(const Value& a, const Value& b, int depth) {
  if (depth > kMaxReprDepth) throw ResourceLimitExceeded("maximum recursion depth exceeded in comparison");
  if (a.is_number() && b.is_number()) {
    if (a.is_float() || b.is_float()) return to_double(a, "") == to_double(b, "");
    return to_int(a, "") == to_int(b, "");
  }
  if (a.v.index() != b.v.index()) return false;
  switch (a.v.index()) {
    case 0: return true;
    case 4: return a.as_str() == b.as_str();
    default: break;
  }
  const ObjectPtr& oa = a.as_object();
  const ObjectPtr& ob = b.as_object();
  if (oa == ob) return true;
  auto seq_equal = [depth](const std::vector<Value>& x, const std::vector<Value>& y) {
    if (x.size() != y.size()) return false;
    for (size_t i = 0; i < x.size(); ++i) {
      if (!values_equal(x[i], y[i], depth + 1)) return false;
    }
    return true;
  };
  if (auto la = std::dynamic_pointer_cast<ListObject>(oa)) {
    auto lb = std::dynamic_pointer_cast<ListObject>(ob);
    return lb && seq_equal(la->items, lb->items);
  }
  if (auto ta = std::dynamic_pointer_cast<TupleObject>(oa)) {
    auto tb = std::dynamic_pointer_cast<TupleObject>(ob);
    return tb && seq_equal(ta->items, tb->items);
  }
  if (auto da = std::dynamic_pointer_cast<DictObject>(oa)) {
    auto db = std::dynamic_pointer_cast<DictObject>(ob);
    if (!db || da->size() != db->size()) return false;
    for (const auto& [k, v] : da->entries()) {
      const Value* other = db->find(k);
      if (other == nullptr || !values_equal(v, *other, depth + 1)) return false;
    }
    return true;
  }
  if (auto ea = std::dynamic_pointer_cast<ExceptionTypeObject>(oa)) {
    auto eb = std::dynamic_pointer_cast<ExceptionTypeObject>(ob);
    return eb && ea->name == eb->name;
  }
  if (auto ra = std::dynamic_pointer_cast<RangeObject>(oa)) {
    auto rb = std::dynamic_pointer_cast<RangeObject>(ob);
    return rb && ra->start == rb->start && ra->stop == rb->stop && ra->step == rb->step;
  }
  return false;
}

bool less_than(const Value& a, const Value& b) {
  if (a.is_number() && b.is_number()) {
    if (a.is_float() || b.is_float()) return to_double(a, "") < to_double(b, "");
    return to_int(a, "") < to_int(b, "");
  }
  if (a.is_str() && b.is_str()) return a.as_str() < b.as_str();
  auto seq = [](const Value& v) -> const std::vector<Value>* {
    if (auto l = v.as<ListObject>()) return &l->items;
    if (auto t = v.as<TupleObject>()) return &t->items;
    return nullptr;
  };
  const auto* sa = seq(a);
  const auto* sb = seq(b);
  if (sa != nullptr && sb != nullptr && type_name(a) == type_name(b)) {
    const size_t n = std::min(sa->size(), sb->size());
    for (size_t i = 0; i < n; ++i) {
      if (values_equal((*sa)[i], (*sb)[i])) continue;
      return less_than((*sa)[i], (*sb)[i]);
    }
    return sa->size() < sb->size();
  }
  throw_type_error("'<' not supported between instances of '" + type_name(a) + "' and '" + type_name(b) + "'");
}

double to_double(const Value& value, const std::string& context) {
  if (value.is_float()) return value.as_float();
  if (value.is_int()) return static_cast<double>(value.as_int());
  if (value.is_bool()) return value.as_bool() ? 1.0 : 0.0;
  throw_type_error((context.empty() ? std::string("expected a number") : context) + ", got '" + type_name(value) +
                   "'");
}

std::int64_t to_int(const Value& value, const std::string& context) {
  if (value.is_int()) return value.as_int();
  if (value.is_bool()) return value.as_bool() ? 1 : 0;
  throw_type_error((context.empty() ? std::string("expected an integer") : context) + ", got '" +
                   type_name(value) + "'");
}

std::string format_value(const Value& value, const std::string& spec) {
  if (spec.empty()) return str(value);

  size_t i = 0;
  char fill = ' ';
  char align = 0;
  auto is_align = [](char c) { return c == '<' || c == '>' || c == '^' || c == '='; };
  if (spec.size() >= 2 && is_align(spec[1])) {
    fill = spec[0];
    align = spec[1];
    i = 2;
  } else if (is_align(spec[0])) {
    align = spec[0];
    i = 1;
  }
  char sign = '-';
  if (i < spec.size() && (spec[i] == '+' || spec[i] == '-' || spec[i] == ' ')) sign = spec[i++];
  if (i < spec.size() && spec[i] == '#') ++i;
  if (i < spec.size() && spec[i] == '0') {
    if (align == 0) {
      fill = '0';
      align = '=';
    }
    ++i;
  }
  size_t width = 0;
  while (i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) {
    width = width * 10 + static_cast<size_t>(spec[i++] - '0');
    if (width > 10000) throw_value_error("format width too large");
  }
  char grouping = 0;
  if (i < spec.size() && (spec[i] == ',' || spec[i] == '_')) grouping = spec[i++];
  int precision = -1;
  if (i < spec.size() && spec[i] == '.') {
    ++i;
    precision = 0;
    bool any = false;
    while (i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) {
      precision = precision * 10 + (spec[i++] - '0');
      any = true;
      if (precision > 100) throw_value_error("format precision too large");
    }
    if (!any) throw_value_error("Format specifier missing precision");
  }
  char type = 0;
  if (i < spec.size()) type = spec[i++];
  if (i != spec.size()) throw_value_error("Invalid format specifier '" + spec + "'");

  std::string body;
  const bool numeric = value.is_number();
  if (type == 0 && !numeric) {
    if (value.is_str() || precision < 0) {
      body = str(value);
      if (precision >= 0 && body.size() > static_cast<size_t>(precision)) body.resize(static_cast<size_t>(precision));
    } else {
      throw_value_error("Invalid format specifier for object of type '" + type_name(value) + "'");
    }
  } else if (type == 's') {
    if (!value.is_str()) {
      throw_value_error("Unknown format code 's' for object of type '" + type_name(value) + "'");
    }
    body = value.as_str();
    if (precision >= 0 && body.size() > static_cast<size_t>(precision)) body.resize(static_cast<size_t>(precision));
  } else {
    if (!numeric) {
      throw_value_error(std::string("Unknown format code '") + (type ? type : ' ') + "' for object of type '" +
                        type_name(value) + "'");
    }
    char buf[512];
    const double d = to_double(value, "");
    switch (type) {
      case 'd':
      case 'x':
      case 'X':
        if (value.is_float()) {
          throw_value_error(std::string("Unknown format code '") + type + "' for object of type 'float'");
        }
        if (type == 'd') {
          body = std::to_string(to_int(value, ""));
        } else {
          std::snprintf(buf, sizeof(buf), type == 'x' ? "%llx" : "%llX",
                        static_cast<unsigned long long>(std::llabs(to_int(value, ""))));
          body = (to_int(value, "") < 0 ? "-" : "") + std::string(buf);
        }
        break;
      case 'f':
      case 'F':
        std::snprintf(buf, sizeof(buf), "%.*f", precision < 0 ? 6 : precision, d);
        body = buf;
        break;
      case 'e':
      case 'E':
        std::snprintf(buf, sizeof(buf), type == 'e' ? "%.*e" : "%.*E", precision < 0 ? 6 : precision, d);
        body = buf;
        break;
      case 'g':
      case 'G':
        std::snprintf(buf, sizeof(buf), type == 'g' ? "%.*g" : "%.*G", precision < 0 ? 6 : std::max(precision, 1),
                      d);
        body = buf;
        break;
      case '%':
        std::snprintf(buf, sizeof(buf), "%.*f", precision < 0 ? 6 : precision, d * 100.0);
        body = std::string(buf) + "%";
        break;
      case 0:
        if (precision >= 0 && !value.is_int() && !value.is_bool()) {
          std::snprintf(buf, sizeof(buf), "%.*g", std::max(precision, 1), d);
          body = buf;
        } else if (value.is_bool() && grouping == 0 && width == 0) {
          body = str(value);
        } else {
          body = value.is_float() ? format_float(d) : std::to_string(to_int(value, ""));
        }
        break;
      default:
        throw_value_error(std::string("Unknown format code '") + type + "' for object of type '" +
                          type_name(value) + "'");
    }
    if (std::isinf(d) || std::isnan(d)) {
      if (type == 'f' || type == 'e' || type == 'g' || type == '%') {
        body = std::isnan(d) ? "nan" : (d > 0 ? "inf" : "-inf");
        if (type == '%') body += "%";
      }
    }
    if (grouping != 0) body = group_thousands(body, grouping);
    if (sign != '-' && !body.empty() && body[0] != '-') body.insert(body.begin(), sign);
  }

  if (body.size() >= width) return body;
  const size_t pad = width - body.size();
  if (align == 0) align = numeric ? '>' : '<';
  switch (align) {
    case '<': return body + std::string(pad, fill);
    case '^': return std::string(pad / 2, fill) + body + std::string(pad - pad / 2, fill);
    case '=': {
      const size_t sign_len = (!body.empty() && (body[0] == '-' || body[0] == '+' || body[0] == ' ')) ? 1 : 0;
      return body.substr(0, sign_len) + std::string(pad, fill) + body.substr(sign_len);
    }
    default: return std::string(pad, fill) + body;
  }
}

std::string hash_key(const Value& value, int depth) {
  if (depth > kMaxReprDepth) throw ResourceLimitExceeded("maximum recursion depth exceeded while hashing");
  switch (value.v.index()) {
    case 0: return "n";
    case 1: return value.as_bool() ? "i1" : "i0";
    case 2: return "i" + std::to_string(value.as_int());
    case 3: {
      const double d = value.as_float();
      if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.2e18) {
        return "i" + std::to_string(static_cast<std::int64_t>(d));
      }
      return "f" + format_float(d);
    }
    case 4: return "s" + std::to_string(value.as_str().size()) + ":" + value.as_str();
    default: break;
  }
  if (auto t = value.as<TupleObject>()) {
    std::string out = "t" + std::to_string(t->items.size()) + "(";
    for (const auto& item : t->items) out += hash_key(item, depth + 1) + ";";
    return out + ")";
  }
  if (auto e = value.as<ExceptionTypeObject>()) return "x" + e->name;
  throw_type_error("unhashable type: '" + type_name(value) + "'");
}

jsonlite::Value to_json_value(const Value& value, int depth) {
  if (depth > kMaxReprDepth) throw_value_error("value is nested too deeply to serialize");
  switch (value.v.index()) {
    case 0: return jsonlite::Value(nullptr);
    case 1: return jsonlite::Value(value.as_bool());
    case 2: return jsonlite::Value(value.as_int());
    case 3: return jsonlite::Value(value.as_float());
    case 4: return jsonlite::Value(value.as_str());
    default: break;
  }
  auto seq = [depth](const std::vector<Value>& items) {
    jsonlite::Array arr;
    arr.reserve(items.size());
    for (const auto& item : items) arr.push_back(to_json_value(item, depth + 1));
    return jsonlite::Value(std::move(arr));
  };
  if (auto l = value.as<ListObject>()) return seq(l->items);
  if (auto t = value.as<TupleObject>()) return seq(t->items);
  if (auto d = value.as<DictObject>()) {
    jsonlite::Object obj;
    for (const auto& [k, v] : d->entries()) obj[str(k)] = to_json_value(v, depth + 1);
    return jsonlite::Value(std::move(obj));
  }
  if (auto rendered = value.as_object()->to_json(depth + 1)) return *rendered;
  throw_type_error("Object of type " + type_name(value) + " is not JSON serializable");
}

Value from_json_value(Interpreter& interp, const jsonlite::Value& value) {
  return std::visit(
      [&](const auto& x) -> Value {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return Value();
        } else if constexpr (std::is_same_v<T, jsonlite::Object>) {
          auto dict = interp.new_dict();
          for (const auto& [k, v] : x) dict->set(Value(k), from_json_value(interp, v));
          return Value(dict);
        } else if constexpr (std::is_same_v<T, jsonlite::Array>) {
          std::vector<Value> items;
          items.reserve(x.size());
          for (const auto& v : x) items.push_back(from_json_value(interp, v));
          return Value(interp.new_list(std::move(items)));
        } else {
          return Value(x);
        }
      },
      value.v);
}

}  // namespace cordon
