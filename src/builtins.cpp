#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

#include "cordon/frame.hpp"
#include "cordon/interpreter.hpp"
#include "cordon/library.hpp"

namespace cordon {

namespace {

using Args = CallArgs;

std::string strip_ascii(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::int64_t parse_int(const std::string& text) {
  std::string t = strip_ascii(text);
  t.erase(std::remove(t.begin(), t.end(), '_'), t.end());
  if (t.empty()) throw_value_error("invalid literal for int() with base 10: " + repr(Value(text)));
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(t.c_str(), &end, 10);
  if (end == nullptr || *end != '\0') throw_value_error("invalid literal for int() with base 10: " + repr(Value(text)));
  if (errno == ERANGE) throw ScriptError("OverflowError", "int too large");
  return static_cast<std::int64_t>(v);
}

double parse_float(const std::string& text) {
  std::string t = strip_ascii(text);
  std::string lower = t;
  for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower == "nan" || lower == "+nan" || lower == "-nan") return std::numeric_limits<double>::quiet_NaN();
  if (lower == "inf" || lower == "+inf" || lower == "infinity" || lower == "+infinity") {
    return std::numeric_limits<double>::infinity();
  }
  if (lower == "-inf" || lower == "-infinity") return -std::numeric_limits<double>::infinity();
  t.erase(std::remove(t.begin(), t.end(), '_'), t.end());
  char* end = nullptr;
  const double d = std::strtod(t.c_str(), &end);
  if (t.empty() || end == nullptr || *end != '\0' || lower.find("inf") != std::string::npos ||
      lower.find("nan") != std::string::npos || lower.find('x') != std::string::npos) {
    throw_value_error("could not convert string to float: " + repr(Value(text)));
  }
  return d;
}

std::int64_t float_to_int(double d) {
  if (std::isnan(d)) throw_value_error("cannot convert float NaN to integer");
  if (std::isinf(d)) throw ScriptError("OverflowError", "cannot convert float infinity to integer");
  const double t = std::trunc(d);
  if (t >= 9.2233720368547758e18 || t < -9.2233720368547758e18) throw ScriptError("OverflowError", "int too large");
  return static_cast<std::int64_t>(t);
}

std::int64_t normalize_index(std::int64_t i, std::size_t n, const char* what) {
  const auto size = static_cast<std::int64_t>(n);
  if (i < 0) i += size;
  if (i < 0 || i >= size) throw ScriptError("IndexError", std::string(what) + " index out of range");
  return i;
}

// Sorts by precomputed keys so a throwing key function leaves `items` intact.
std::vector<Value> sort_values(Interpreter& interp, const std::vector<Value>& items, const Value& key, bool reverse) {
  std::vector<Value> keys;
  keys.reserve(items.size());
  for (const auto& item : items) {
    interp.check_interrupts();
    keys.push_back(key.is_none() ? item : interp.call1(key, item));
  }
  std::vector<std::size_t> order(items.size());
  for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return reverse ? less_than(keys[b], keys[a]) : less_than(keys[a], keys[b]);
  });
  std::vector<Value> out;
  out.reserve(items.size());
  for (std::size_t i : order) out.push_back(items[i]);
  return out;
}

Value round_value(const Value& x, const Value& ndigits) {
  if (x.as<SeriesObject>()) throw_type_error("use Series.round() to round a Series");
  if (ndigits.is_none()) {
    if (x.is_int() || x.is_bool()) return Value(to_int(x, ""));
    return Value(float_to_int(std::nearbyint(to_double(x, "round() expects a number"))));
  }
  const std::int64_t n = to_int(ndigits, "ndigits must be an integer");
  if (x.is_int() || x.is_bool()) {
    if (n >= 0) return Value(to_int(x, ""));
    const double scale = std::pow(10.0, static_cast<double>(-n));
    return Value(float_to_int(std::nearbyint(static_cast<double>(x.as_int()) / scale) * scale));
  }
  const double d = to_double(x, "round() expects a number");
  if (!std::isfinite(d) || n > 300) return Value(d);
  const double scale = std::pow(10.0, static_cast<double>(n));
  const double scaled = d * scale;
  if (!std::isfinite(scaled)) return Value(d);
  return Value(std::nearbyint(scaled) / scale);
}

Value min_max(Interpreter& interp, Args& a, bool want_max) {
  const char* fn = want_max ? "max" : "min";
  Value key;
  std::optional<Value> fallback;
  for (const auto& [k, v] : a.keywords) {
    if (k == "key") key = v;
    else if (k == "default") fallback = v;
    else throw_type_error(std::string(fn) + "() got an unexpected keyword argument '" + k + "'");
  }
  if (a.positional.empty()) throw_type_error(std::string(fn) + "() expected at least 1 argument, got 0");
  std::vector<Value> items;
  if (a.positional.size() == 1) items = interp.to_vector(a.positional[0]);
  else items = a.positional;
  if (items.empty()) {
    if (fallback) return *fallback;
    throw_value_error(std::string(fn) + "() arg is an empty sequence");
  }
  std::size_t best = 0;
  Value best_key = key.is_none() ? items[0] : interp.call1(key, items[0]);
  for (std::size_t i = 1; i < items.size(); ++i) {
    interp.check_interrupts();
    Value k = key.is_none() ? items[i] : interp.call1(key, items[i]);
    if (want_max ? less_than(best_key, k) : less_than(k, best_key)) {
      best = i;
      best_key = std::move(k);
    }
  }
  return items[best];
}

Value builtin_len(Interpreter&, Args& a) {
  ArgBinder args("len", a, {"obj"}, 1);
  const Value& v = args.get(0);
  auto count = [](std::size_t n) { return Value(static_cast<std::int64_t>(n)); };
  if (v.is_str()) return count(v.as_str().size());
  if (auto l = v.as<ListObject>()) return count(l->items.size());
  if (auto t = v.as<TupleObject>()) return count(t->items.size());
  if (auto d = v.as<DictObject>()) return count(d->size());
  if (auto r = v.as<RangeObject>()) return Value(r->size());
  if (auto s = v.as<SeriesObject>()) return count(s->size());
  if (auto f = v.as<FrameObject>()) return count(f->data.row_count());
  throw_type_error("object of type '" + type_name(v) + "' has no len()");
}

Value builtin_range(Interpreter&, Args& a) {
  ArgBinder args("range", a, {"start", "stop", "step"}, 1);
  std::int64_t start = 0;
  std::int64_t stop = 0;
  std::int64_t step = 1;
  if (!args.has(1)) {
    stop = to_int(args.get(0), "range() integer end argument expected");
  } else {
    start = to_int(args.get(0), "range() integer start argument expected");
    stop = to_int(args.get(1), "range() integer end argument expected");
    if (args.has(2)) step = to_int(args.get(2), "range() integer step argument expected");
  }
  if (step == 0) throw_value_error("range() arg 3 must not be zero");
  return Value(std::make_shared<RangeObject>(start, stop, step));
}

Value builtin_int(Interpreter&, Args& a) {
  ArgBinder args("int", a, {"x"});
  if (!args.has(0)) return Value(0);
  const Value& v = args.get(0);
  if (v.is_int()) return v;
  if (v.is_bool()) return Value(static_cast<std::int64_t>(v.as_bool() ? 1 : 0));
  if (v.is_float()) return Value(float_to_int(v.as_float()));
  if (v.is_str()) return Value(parse_int(v.as_str()));
  throw_type_error("int() argument must be a string or a number, not '" + type_name(v) + "'");
}

Value builtin_float(Interpreter&, Args& a) {
  ArgBinder args("float", a, {"x"});
  if (!args.has(0)) return Value(0.0);
  const Value& v = args.get(0);
  if (v.is_number()) return Value(to_double(v, ""));
  if (v.is_str()) return Value(parse_float(v.as_str()));
  throw_type_error("float() argument must be a string or a number, not '" + type_name(v) + "'");
}

Value builtin_str(Interpreter&, Args& a) {
  ArgBinder args("str", a, {"object"});
  return Value(args.has(0) ? str(args.get(0)) : std::string());
}

Value builtin_bool(Interpreter&, Args& a) {
  ArgBinder args("bool", a, {"x"});
  return Value(args.has(0) && truthy(args.get(0)));
}

Value builtin_list(Interpreter& interp, Args& a) {
  ArgBinder args("list", a, {"iterable"});
  if (!args.has(0)) return Value(interp.new_list());
  return Value(interp.new_list(interp.to_vector(args.get(0))));
}

Value builtin_tuple(Interpreter& interp, Args& a) {
  ArgBinder args("tuple", a, {"iterable"});
  if (!args.has(0)) return Value(make_tuple({}));
  return Value(make_tuple(interp.to_vector(args.get(0))));
}

void update_dict(Interpreter& interp, DictObject& target, const Value& source) {
  if (auto d = source.as<DictObject>()) {
    for (const auto& [k, v] : d->entries()) target.set(k, v);
    return;
  }
  interp.for_each(source, [&](const Value& pair) {
    const std::vector<Value> kv = interp.to_vector(pair);
    if (kv.size() != 2) throw_value_error("dictionary update sequence element has length " +
                                          std::to_string(kv.size()) + "; 2 is required");
    target.set(kv[0], kv[1]);
    interp.check_size(target.size());
    return true;
  });
}

Value builtin_dict(Interpreter& interp, Args& a) {
  if (a.positional.size() > 1) throw_type_error("dict expected at most 1 argument");
  auto out = interp.new_dict();
  if (!a.positional.empty()) update_dict(interp, *out, a.positional[0]);
  for (const auto& [k, v] : a.keywords) out->set(Value(k), v);
  return Value(out);
}

Value builtin_abs(Interpreter& interp, Args& a) {
  ArgBinder args("abs", a, {"x"}, 1);
  const Value& v = args.get(0);
  if (v.is_int()) {
    if (v.as_int() == std::numeric_limits<std::int64_t>::min()) throw ScriptError("OverflowError", "int too large");
    return Value(v.as_int() < 0 ? -v.as_int() : v.as_int());
  }
  if (v.is_bool()) return Value(static_cast<std::int64_t>(v.as_bool() ? 1 : 0));
  if (v.is_float()) return Value(std::fabs(v.as_float()));
  if (v.as<SeriesObject>()) return map_numeric(interp, v, [](double d) { return std::fabs(d); }, "abs");
  throw_type_error("bad operand type for abs(): '" + type_name(v) + "'");
}

Value builtin_sum(Interpreter& interp, Args& a) {
  ArgBinder args("sum", a, {"iterable", "start"}, 1);
  Value total = args.get_or(1, Value(0));
  if (total.is_str()) throw_type_error("sum() can't sum strings [use ''.join(seq) instead]");
  std::size_t i = 0;
  interp.for_each(args.get(0), [&](const Value& v) {
    if ((++i & 1023) == 0) interp.check_interrupts();
    total = interp.binary_op("+", total, v);
    return true;
  });
  return total;
}

Value builtin_round(Interpreter&, Args& a) {
  ArgBinder args("round", a, {"number", "ndigits"}, 1);
  return round_value(args.get(0), args.get_or(1, Value()));
}

Value builtin_sorted(Interpreter& interp, Args& a) {
  ArgBinder args("sorted", a, {"iterable", "key", "reverse"}, 1);
  return Value(interp.new_list(
      sort_values(interp, interp.to_vector(args.get(0)), args.get_or(1, Value()), truthy(args.get_or(2, Value(false))))));
}

Value builtin_reversed(Interpreter& interp, Args& a) {
  ArgBinder args("reversed", a, {"sequence"}, 1);
  if (args.get(0).as<DictObject>()) throw_type_error("'dict' object is not reversible");
  std::vector<Value> items = interp.to_vector(args.get(0));
  std::reverse(items.begin(), items.end());
  return Value(interp.new_list(std::move(items)));
}

Value builtin_enumerate(Interpreter& interp, Args& a) {
  ArgBinder args("enumerate", a, {"iterable", "start"}, 1);
  std::int64_t i = to_int(args.get_or(1, Value(0)), "enumerate() start must be an integer");
  std::vector<Value> out;
  interp.for_each(args.get(0), [&](const Value& v) {
    out.push_back(Value(make_tuple({Value(i++), v})));
    return true;
  });
  return Value(interp.new_list(std::move(out)));
}

Value builtin_zip(Interpreter& interp, Args& a) {
  if (!a.keywords.empty()) throw_type_error("zip() takes no keyword arguments");
  std::vector<std::vector<Value>> columns;
  std::size_t n = std::numeric_limits<std::size_t>::max();
  for (const auto& it : a.positional) {
    columns.push_back(interp.to_vector(it));
    n = std::min(n, columns.back().size());
  }
  if (columns.empty()) n = 0;
  std::vector<Value> out;
  out.reserve(n);
  for (std::size_t r = 0; r < n; ++r) {
    std::vector<Value> row;
    for (const auto& c : columns) row.push_back(c[r]);
    out.push_back(Value(make_tuple(std::move(row))));
  }
  return Value(interp.new_list(std::move(out)));
}

Value builtin_any_all(Interpreter& interp, Args& a, bool want_all) {
  ArgBinder args(want_all ? "all" : "any", a, {"iterable"}, 1);
  bool result = want_all;
  interp.for_each(args.get(0), [&](const Value& v) {
    if (truthy(v) != want_all) {
      result = !want_all;
      return false;
    }
    return true;
  });
  return Value(result);
}

Value builtin_isinstance(Interpreter&, Args& a) {
  ArgBinder args("isinstance", a, {"obj", "class_or_tuple"}, 2);
  const Value& cls = args.get(1);
  if (auto t = cls.as<TupleObject>()) {
    for (const auto& c : t->items) {
      if (is_instance(args.get(0), c)) return Value(true);
    }
    return Value(false);
  }
  return Value(is_instance(args.get(0), cls));
}

Value builtin_type(Interpreter& interp, Args& a) {
  ArgBinder args("type", a, {"object"}, 1);
  const Value& v = args.get(0);
  const std::string name = type_name(v);
  if (const Value* bound = interp.find_builtin(name)) {
    if (bound->as<TypeObject>() || bound->as<ExceptionTypeObject>()) return *bound;
  }
  if (v.as<ExceptionObject>()) return Value(std::make_shared<ExceptionTypeObject>(name));
  return Value(std::make_shared<TypeObject>(name, [name](Interpreter&, CallArgs&) -> Value {
    throw_type_error("cannot create '" + name + "' instances");
  }));
}

Value builtin_print(Interpreter& interp, Args& a) {
  std::string sep = " ";
  std::string end = "\n";
  for (const auto& [k, v] : a.keywords) {
    if (k == "sep") sep = v.is_none() ? " " : str(v);
    else if (k == "end") end = v.is_none() ? "\n" : str(v);
    else if (k == "flush") continue;
    else throw_type_error("print() got an unexpected keyword argument '" + k + "'");
  }
  std::string line;
  for (std::size_t i = 0; i < a.positional.size(); ++i) {
    if (i) line += sep;
    line += str(a.positional[i]);
  }
  interp.write_output(line + end);
  return Value();
}

Value builtin_format(Interpreter&, Args& a) {
  ArgBinder args("format", a, {"value", "format_spec"}, 1);
  return Value(format_value(args.get(0), args.has(1) ? str(args.get(1)) : std::string()));
}

Value builtin_repr(Interpreter&, Args& a) {
  ArgBinder args("repr", a, {"obj"}, 1);
  return Value(repr(args.get(0)));
}

Value builtin_divmod(Interpreter& interp, Args& a) {
  ArgBinder args("divmod", a, {"a", "b"}, 2);
  return Value(make_tuple({interp.binary_op("//", args.get(0), args.get(1)),
                           interp.binary_op("%", args.get(0), args.get(1))}));
}

Value builtin_pow(Interpreter& interp, Args& a) {
  ArgBinder args("pow", a, {"base", "exp"}, 2);
  return interp.binary_op("**", args.get(0), args.get(1));
}

Value builtin_map(Interpreter& interp, Args& a) {
  ArgBinder args("map", a, {"function", "iterable"}, 2);
  std::vector<Value> out;
  interp.for_each(args.get(1), [&](const Value& v) {
    out.push_back(interp.call1(args.get(0), v));
    return true;
  });
  return Value(interp.new_list(std::move(out)));
}

Value builtin_filter(Interpreter& interp, Args& a) {
  ArgBinder args("filter", a, {"function", "iterable"}, 2);
  std::vector<Value> out;
  interp.for_each(args.get(1), [&](const Value& v) {
    const bool keep = args.get(0).is_none() ? truthy(v) : truthy(interp.call1(args.get(0), v));
    if (keep) out.push_back(v);
    return true;
  });
  return Value(interp.new_list(std::move(out)));
}

// -- str --------------------------------------------------------------------

std::vector<std::string> split_whitespace(const std::string& s, std::int64_t maxsplit) {
  std::vector<std::string> out;
  std::size_t i = 0;
  const std::size_t n = s.size();
  while (i < n) {
    while (i < n && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (i >= n) break;
    if (maxsplit >= 0 && static_cast<std::int64_t>(out.size()) == maxsplit) {
      std::size_t e = n;
      while (e > i && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
      out.push_back(s.substr(i, e - i));
      break;
    }
    std::size_t j = i;
    while (j < n && !std::isspace(static_cast<unsigned char>(s[j]))) ++j;
    out.push_back(s.substr(i, j - i));
    i = j;
  }
  return out;
}

std::vector<std::string> split_on(const std::string& s, const std::string& sep, std::int64_t maxsplit) {
  if (sep.empty()) throw_value_error("empty separator");
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    if (maxsplit >= 0 && static_cast<std::int64_t>(out.size()) == maxsplit) break;
    const auto pos = s.find(sep, start);
    if (pos == std::string::npos) break;
    out.push_back(s.substr(start, pos - start));
    start = pos + sep.size();
  }
  out.push_back(s.substr(start));
  return out;
}

std::string strip_chars(const std::string& s, const Value& chars, bool left, bool right) {
  auto strip_this = [&](char c) {
    if (chars.is_none()) return std::isspace(static_cast<unsigned char>(c)) != 0;
    return chars.as_str().find(c) != std::string::npos;
  };
  if (!chars.is_none() && !chars.is_str()) throw_type_error("strip arg must be None or str");
  std::size_t b = 0;
  std::size_t e = s.size();
  if (left) {
    while (b < e && strip_this(s[b])) ++b;
  }
  if (right) {
    while (e > b && strip_this(s[e - 1])) --e;
  }
  return s.substr(b, e - b);
}

Value string_list_value(Interpreter& interp, const std::vector<std::string>& parts) {
  std::vector<Value> out;
  out.reserve(parts.size());
  for (const auto& p : parts) out.push_back(Value(p));
  return Value(interp.new_list(std::move(out)));
}

bool affix_matches(const std::string& s, const Value& affix, bool prefix) {
  auto one = [&](const Value& v) {
    if (!v.is_str()) throw_type_error("startswith/endswith arg must be str or a tuple of str");
    const std::string& a = v.as_str();
    if (a.size() > s.size()) return false;
    return prefix ? s.compare(0, a.size(), a) == 0 : s.compare(s.size() - a.size(), a.size(), a) == 0;
  };
  if (auto t = affix.as<TupleObject>()) {
    return std::any_of(t->items.begin(), t->items.end(), one);
  }
  return one(affix);
}

std::string str_format(Interpreter& interp, const std::string& fmt, const CallArgs& a) {
  std::string out;
  std::size_t auto_index = 0;
  for (std::size_t i = 0; i < fmt.size(); ++i) {
    const char c = fmt[i];
    if (c == '}') {
      if (i + 1 < fmt.size() && fmt[i + 1] == '}') {
        out += '}';
        ++i;
        continue;
      }
      throw_value_error("Single '}' encountered in format string");
    }
    if (c != '{') {
      out += c;
      continue;
    }
    if (i + 1 < fmt.size() && fmt[i + 1] == '{') {
      out += '{';
      ++i;
      continue;
    }
    const auto close = fmt.find('}', i);
    if (close == std::string::npos) throw_value_error("Single '{' encountered in format string");
    std::string field = fmt.substr(i + 1, close - i - 1);
    i = close;
    std::string spec;
    char conversion = 0;
    if (auto colon = field.find(':'); colon != std::string::npos) {
      spec = field.substr(colon + 1);
      field = field.substr(0, colon);
    }
    if (auto bang = field.find('!'); bang != std::string::npos) {
      if (bang + 2 != field.size()) throw_value_error("invalid conversion in format string");
      conversion = field[bang + 1];
      field = field.substr(0, bang);
    }
    Value v;
    if (field.empty()) {
      if (auto_index >= a.positional.size()) throw ScriptError("IndexError", "Replacement index out of range");
      v = a.positional[auto_index++];
    } else if (std::all_of(field.begin(), field.end(), [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)); })) {
      errno = 0;
      const unsigned long long parsed = std::strtoull(field.c_str(), nullptr, 10);
      if (errno == ERANGE) throw_value_error("Too many decimal digits in format string");
      const auto idx = static_cast<std::size_t>(parsed);
      if (idx >= a.positional.size()) throw ScriptError("IndexError", "Replacement index out of range");
      v = a.positional[idx];
    } else {
      // Only plain names: no attribute or item lookups inside format fields.
      if (!std::all_of(field.begin(), field.end(),
                       [](char ch) { return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_'; })) {
        throw_value_error("unsupported format field '" + field + "'");
      }
      auto it = std::find_if(a.keywords.begin(), a.keywords.end(), [&](const auto& kv) { return kv.first == field; });
      if (it == a.keywords.end()) throw ScriptError("KeyError", repr(Value(field)));
      v = it->second;
    }
    if (conversion == 'r' || conversion == 'a') v = Value(repr(v));
    else if (conversion == 's') v = Value(str(v));
    else if (conversion != 0) throw_value_error(std::string("Unknown conversion specifier ") + conversion);
    out += format_value(v, spec);
    interp.check_size(out.size(), "string");
  }
  return out;
}

std::string pad(Interpreter& interp, const std::string& s, const ArgBinder& args, const std::string& how) {
  const std::int64_t width = to_int(args.get(0), "width must be an integer");
  std::string fill = args.has(1) ? str(args.get(1)) : " ";
  if (fill.size() != 1) throw_type_error("The fill character must be exactly one character long");
  if (width <= static_cast<std::int64_t>(s.size())) return s;
  interp.check_size(static_cast<std::size_t>(width), "string");
  const std::size_t total = static_cast<std::size_t>(width) - s.size();
  if (how == "ljust") return s + std::string(total, fill[0]);
  if (how == "rjust") return std::string(total, fill[0]) + s;
  const std::size_t left = total / 2 + (total & static_cast<std::size_t>(width) & 1);
  return std::string(left, fill[0]) + s + std::string(total - left, fill[0]);
}

template <typename Pred>
bool all_chars(const std::string& s, Pred pred) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [&](char c) { return pred(static_cast<unsigned char>(c)) != 0; });
}

// -- list / tuple / dict methods ---------------------------------------------

std::int64_t index_of(const std::vector<Value>& items, const Value& needle, const char* what) {
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (values_equal(items[i], needle)) return static_cast<std::int64_t>(i);
  }
  throw_value_error(repr(needle) + " is not in " + what);
}

std::int64_t count_of(const std::vector<Value>& items, const Value& needle) {
  std::int64_t n = 0;
  for (const auto& item : items) {
    if (values_equal(item, needle)) ++n;
  }
  return n;
}

template <typename Fn>
Value bind(const std::string& name, Fn fn) {
  return Value(make_native(name, std::move(fn)));
}

Value exception_type(const char* name) { return Value(std::make_shared<ExceptionTypeObject>(name)); }

Value type_value(const char* name, Value (*fn)(Interpreter&, CallArgs&)) {
  return Value(std::make_shared<TypeObject>(name, fn));
}

}  // namespace

// ---------------------------------------------------------------------------
// Container attributes
// ---------------------------------------------------------------------------

std::optional<Value> ListObject::attribute(Interpreter&, const ObjectPtr& self, const std::string& name) {
  auto me = std::static_pointer_cast<ListObject>(self);
  if (name == "append") {
    return cordon::bind("list.append", [me](Interpreter& in, CallArgs& a) {
      ArgBinder args("list.append", a, {"object"}, 1);
      in.check_size(me->items.size() + 1);
      me->items.push_back(args.get(0));
      return Value();
    });
  }
  if (name == "extend") {
    return cordon::bind("list.extend", [me](Interpreter& in, CallArgs& a) {
      ArgBinder args("list.extend", a, {"iterable"}, 1);
      std::vector<Value> more = in.to_vector(args.get(0));
      in.check_size(me->items.size() + more.size());
      me->items.insert(me->items.end(), more.begin(), more.end());
      return Value();
    });
  }
  if (name == "insert") {
    return cordon::bind("list.insert", [me](Interpreter& in, CallArgs& a) {
      ArgBinder args("list.insert", a, {"index", "object"}, 2);
      in.check_size(me->items.size() + 1);
      auto n = static_cast<std::int64_t>(me->items.size());
      std::int64_t i = to_int(args.get(0), "list indices must be integers");
      if (i < 0) i = std::max<std::int64_t>(0, i + n);
      i = std::min(i, n);
      me->items.insert(me->items.begin() + i, args.get(1));
      return Value();
    });
  }
  if (name == "pop") {
    return cordon::bind("list.pop", [me](Interpreter&, CallArgs& a) {
      ArgBinder args("list.pop", a, {"index"});
      if (me->items.empty()) throw ScriptError("IndexError", "pop from empty list");
      const std::int64_t i = normalize_index(to_int(args.get_or(0, Value(-1)), "list indices must be integers"),
                                             me->items.size(), "pop");
      Value out = me->items[static_cast<std::size_t>(i)];
      me->items.erase(me->items.begin() + i);
      return out;
    });
  }
  if (name == "remove") {
    return cordon::bind("list.remove", [me](Interpreter&, CallArgs& a) {
      ArgBinder args("list.remove", a, {"value"}, 1);
      const std::int64_t i = index_of(me->items, args.get(0), "list");
      me->items.erase(me->items.begin() + i);
      return Value();
    });
  }
  if (name == "index") {
    return cordon::bind("list.index", [me](Interpreter&, CallArgs& a) {
      ArgBinder args("list.index", a, {"value"}, 1);
      return Value(index_of(me->items, args.get(0), "list"));
    });
  }
  if (name == "count") {
    return cordon::bind("list.count", [me](Interpreter&, CallArgs& a) {
      ArgBinder args("list.count", a, {"value"}, 1);
      return Value(count_of(me->items, args.get(0)));
    });
  }
  if (name == "sort") {
    return cordon::bind("list.sort", [me](Interpreter& in, CallArgs& a) {
      ArgBinder args("list.sort", a, {"key", "reverse"});
      if (!a.positional.empty()) throw_type_error("sort() takes no positional arguments");
      me->items = sort_values(in, me->items, args.get_or(0, Value()), cordon::truthy(args.get_or(1, Value(false))));
      return Value();
    });
  }
  if (name == "reverse") {
    return cordon::bind("list.reverse", [me](Interpreter&, CallArgs& a) {
      ArgBinder("list.reverse", a, {});
      std::reverse(me->items.begin(), me->items.end());
      return Value();
    });
  }
  if (name == "copy") {
    return cordon::bind("list.copy", [me](Interpreter& in, CallArgs& a) {
      ArgBinder("list.copy", a, {});
      return Value(in.new_list(me->items));
    });
  }
  if (name == "clear") {
    return cordon::bind("list.clear", [me](Interpreter&, CallArgs& a) {
      ArgBinder("list.clear", a, {});
      me->items.clear();
      return Value();
    });
  }
  return std::nullopt;
}

std::optional<Value> TupleObject::attribute(Interpreter&, const ObjectPtr& self, const std::string& name) {
  auto me = std::static_pointer_cast<TupleObject>(self);
  if (name == "index") {
    return cordon::bind("tuple.index", [me](Interpreter&, CallArgs& a) {
      ArgBinder args("tuple.index", a, {"value"}, 1);
      return Value(index_of(me->items, args.get(0), "tuple"));
    });
  }
  if (name == "count") {
    return cordon::bind("tuple.count", [me](Interpreter&, CallArgs& a) {
      ArgBinder args("tuple.count", a, {"value"}, 1);
      return Value(count_of(me->items, args.get(0)));
    });
  }
  return std::nullopt;
}

std::optional<Value> DictObject::attribute(Interpreter&, const ObjectPtr& self, const std::string& name) {
  auto me = std::static_pointer_cast<DictObject>(self);
  if (name == "get") {
    return cordon::bind("dict.get", [me](Interpreter&, CallArgs& a) {
      ArgBinder args("dict.get", a, {"key", "default"}, 1);
      const Value* v = me->find(args.get(0));
      return v ? *v : args.get_or(1, Value());
    });
  }
  if (name == "keys" || name == "values" || name == "items") {
    // Views are materialized as lists.
    return cordon::bind("dict." + name, [me, name](Interpreter& in, CallArgs& a) {
      ArgBinder("dict." + name, a, {});
      std::vector<Value> out;
      out.reserve(me->size());
      for (const auto& [k, v] : me->entries()) {
        if (name == "keys") out.push_back(k);
        else if (name == "values") out.push_back(v);
        else out.push_back(Value(make_tuple({k, v})));
      }
      return Value(in.new_list(std::move(out)));
    });
  }
  if (name == "pop") {
    return cordon::bind("dict.pop", [me](Interpreter&, CallArgs& a) {
      ArgBinder args("dict.pop", a, {"key", "default"}, 1);
      const Value* v = me->find(args.get(0));
      if (v == nullptr) {
        if (args.has(1)) return args.get(1);
        throw ScriptError("KeyError", cordon::repr(args.get(0)));
      }
      Value out = *v;
      me->erase(args.get(0));
      return out;
    });
  }
  if (name == "setdefault") {
    return cordon::bind("dict.setdefault", [me](Interpreter& in, CallArgs& a) {
      ArgBinder args("dict.setdefault", a, {"key", "default"}, 1);
      if (const Value* v = me->find(args.get(0))) return *v;
      in.check_size(me->size() + 1);
      me->set(args.get(0), args.get_or(1, Value()));
      return args.get_or(1, Value());
    });
  }
  if (name == "update") {
    return cordon::bind("dict.update", [me](Interpreter& in, CallArgs& a) {
      if (a.positional.size() > 1) throw_type_error("update expected at most 1 argument");
      if (!a.positional.empty()) update_dict(in, *me, a.positional[0]);
      for (const auto& [k, v] : a.keywords) me->set(Value(k), v);
      in.check_size(me->size());
      return Value();
    });
  }
  if (name == "copy") {
    return cordon::bind("dict.copy", [me](Interpreter& in, CallArgs& a) {
      ArgBinder("dict.copy", a, {});
      auto out = in.new_dict();
      for (const auto& [k, v] : me->entries()) out->set(k, v);
      return Value(out);
    });
  }
  if (name == "clear") {
    return cordon::bind("dict.clear", [me](Interpreter&, CallArgs& a) {
      ArgBinder("dict.clear", a, {});
      me->clear();
      return Value();
    });
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// str methods
// ---------------------------------------------------------------------------

std::optional<Value> string_attribute(Interpreter&, const std::string& self, const std::string& name) {
  const std::string s = self;
  auto method = [&](auto fn) { return cordon::bind("str." + name, fn); };

  if (name == "upper" || name == "lower" || name == "title" || name == "capitalize" || name == "swapcase") {
    return method([s, name](Interpreter&, CallArgs& a) {
      ArgBinder("str." + name, a, {});
      std::string out = s;
      bool start = true;
      for (std::size_t i = 0; i < out.size(); ++i) {
        const auto c = static_cast<unsigned char>(out[i]);
        if (name == "upper") out[i] = static_cast<char>(std::toupper(c));
        else if (name == "lower") out[i] = static_cast<char>(std::tolower(c));
        else if (name == "swapcase") out[i] = static_cast<char>(std::isupper(c) ? std::tolower(c) : std::toupper(c));
        else if (name == "capitalize") out[i] = static_cast<char>(i == 0 ? std::toupper(c) : std::tolower(c));
        else {
          out[i] = static_cast<char>(start ? std::toupper(c) : std::tolower(c));
          start = !std::isalpha(c);
        }
      }
      return Value(out);
    });
  }
  if (name == "strip" || name == "lstrip" || name == "rstrip") {
    return method([s, name](Interpreter&, CallArgs& a) {
      ArgBinder args("str." + name, a, {"chars"});
      return Value(strip_chars(s, args.get_or(0, Value()), name != "rstrip", name != "lstrip"));
    });
  }
  if (name == "split" || name == "rsplit") {
    return method([s, name](Interpreter& in, CallArgs& a) {
      ArgBinder args("str." + name, a, {"sep", "maxsplit"});
      const Value sep = args.get_or(0, Value());
      const std::int64_t maxsplit = to_int(args.get_or(1, Value(-1)), "maxsplit must be an integer");
      if (name == "rsplit" && maxsplit >= 0) {
        // Split from the right: reverse, split, reverse back.
        std::string rs(s.rbegin(), s.rend());
        std::vector<std::string> parts;
        if (sep.is_none()) {
          parts = split_whitespace(rs, maxsplit);
        } else {
          const std::string& fwd = str(sep);
          parts = split_on(rs, std::string(fwd.rbegin(), fwd.rend()), maxsplit);
        }
        std::reverse(parts.begin(), parts.end());
        for (auto& p : parts) std::reverse(p.begin(), p.end());
        return string_list_value(in, parts);
      }
      if (sep.is_none()) return string_list_value(in, split_whitespace(s, maxsplit));
      if (!sep.is_str()) throw_type_error("must be str or None, not " + type_name(sep));
      return string_list_value(in, split_on(s, sep.as_str(), maxsplit));
    });
  }
  if (name == "splitlines") {
    return method([s](Interpreter& in, CallArgs& a) {
      ArgBinder("str.splitlines", a, {});
      std::vector<std::string> parts;
      std::string cur;
      for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\n' || s[i] == '\r') {
          parts.push_back(cur);
          cur.clear();
          if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') ++i;
        } else {
          cur += s[i];
        }
      }
      if (!cur.empty()) parts.push_back(cur);
      return string_list_value(in, parts);
    });
  }
  if (name == "join") {
    return method([s](Interpreter& in, CallArgs& a) {
      ArgBinder args("str.join", a, {"iterable"}, 1);
      std::string out;
      bool first = true;
      in.for_each(args.get(0), [&](const Value& v) {
        if (!v.is_str()) throw_type_error("sequence item: expected str instance, " + type_name(v) + " found");
        if (!first) out += s;
        out += v.as_str();
        first = false;
        in.check_size(out.size(), "string");
        return true;
      });
      return Value(out);
    });
  }
  if (name == "replace") {
    return method([s](Interpreter& in, CallArgs& a) {
      ArgBinder args("str.replace", a, {"old", "new", "count"}, 2);
      if (!args.get(0).is_str() || !args.get(1).is_str()) throw_type_error("replace() arguments must be str");
      const std::string& from = args.get(0).as_str();
      const std::string& to = args.get(1).as_str();
      std::int64_t remaining = to_int(args.get_or(2, Value(-1)), "count must be an integer");
      std::string out;
      if (from.empty()) {
        for (std::size_t i = 0; i <= s.size(); ++i) {
          if (remaining != 0) {
            out += to;
            --remaining;
          }
          if (i < s.size()) out += s[i];
          in.check_size(out.size(), "string");
        }
        return Value(out);
      }
      std::size_t pos = 0;
      while (remaining != 0) {
        const auto hit = s.find(from, pos);
        if (hit == std::string::npos) break;
        out.append(s, pos, hit - pos);
        out += to;
        pos = hit + from.size();
        --remaining;
        in.check_size(out.size(), "string");
      }
      out.append(s, pos, std::string::npos);
      in.check_size(out.size(), "string");
      return Value(out);
    });
  }
  if (name == "startswith" || name == "endswith") {
    return method([s, name](Interpreter&, CallArgs& a) {
      ArgBinder args("str." + name, a, {"affix"}, 1);
      return Value(affix_matches(s, args.get(0), name == "startswith"));
    });
  }
  if (name == "find" || name == "rfind" || name == "index" || name == "rindex") {
    return method([s, name](Interpreter&, CallArgs& a) {
      ArgBinder args("str." + name, a, {"sub"}, 1);
      if (!args.get(0).is_str()) throw_type_error("must be str, not " + type_name(args.get(0)));
      const bool from_right = name[0] == 'r';
      const auto pos = from_right ? s.rfind(args.get(0).as_str()) : s.find(args.get(0).as_str());
      if (pos == std::string::npos) {
        if (name == "index" || name == "rindex") throw_value_error("substring not found");
        return Value(-1);
      }
      return Value(static_cast<std::int64_t>(pos));
    });
  }
  if (name == "count") {
    return method([s](Interpreter&, CallArgs& a) {
      ArgBinder args("str.count", a, {"sub"}, 1);
      if (!args.get(0).is_str()) throw_type_error("must be str, not " + type_name(args.get(0)));
      const std::string& sub = args.get(0).as_str();
      if (sub.empty()) return Value(static_cast<std::int64_t>(s.size() + 1));
      std::int64_t n = 0;
      for (auto pos = s.find(sub); pos != std::string::npos; pos = s.find(sub, pos + sub.size())) ++n;
      return Value(n);
    });
  }
  if (name == "format") {
    return method([s](Interpreter& in, CallArgs& a) { return Value(str_format(in, s, a)); });
  }
  if (name == "zfill") {
    return method([s](Interpreter& in, CallArgs& a) {
      ArgBinder args("str.zfill", a, {"width"}, 1);
      const std::int64_t width = to_int(args.get(0), "width must be an integer");
      if (width <= static_cast<std::int64_t>(s.size())) return Value(s);
      in.check_size(static_cast<std::size_t>(width), "string");
      const std::size_t fill = static_cast<std::size_t>(width) - s.size();
      if (!s.empty() && (s[0] == '-' || s[0] == '+')) return Value(s.substr(0, 1) + std::string(fill, '0') + s.substr(1));
      return Value(std::string(fill, '0') + s);
    });
  }
  if (name == "center" || name == "ljust" || name == "rjust") {
    return method([s, name](Interpreter& in, CallArgs& a) {
      ArgBinder args("str." + name, a, {"width", "fillchar"}, 1);
      return Value(pad(in, s, args, name));
    });
  }
  if (name == "partition") {
    return method([s](Interpreter&, CallArgs& a) {
      ArgBinder args("str.partition", a, {"sep"}, 1);
      const std::string sep = str(args.get(0));
      if (sep.empty()) throw_value_error("empty separator");
      const auto pos = s.find(sep);
      if (pos == std::string::npos) return Value(make_tuple({Value(s), Value(""), Value("")}));
      return Value(make_tuple({Value(s.substr(0, pos)), Value(sep), Value(s.substr(pos + sep.size()))}));
    });
  }
  if (name == "isdigit" || name == "isnumeric" || name == "isdecimal") {
    return method([s, name](Interpreter&, CallArgs& a) {
      ArgBinder("str." + name, a, {});
      return Value(all_chars(s, [](unsigned char c) { return std::isdigit(c); }));
    });
  }
  if (name == "isalpha") {
    return method([s](Interpreter&, CallArgs& a) {
      ArgBinder("str.isalpha", a, {});
      return Value(all_chars(s, [](unsigned char c) { return std::isalpha(c); }));
    });
  }
  if (name == "isalnum") {
    return method([s](Interpreter&, CallArgs& a) {
      ArgBinder("str.isalnum", a, {});
      return Value(all_chars(s, [](unsigned char c) { return std::isalnum(c); }));
    });
  }
  if (name == "isspace") {
    return method([s](Interpreter&, CallArgs& a) {
      ArgBinder("str.isspace", a, {});
      return Value(all_chars(s, [](unsigned char c) { return std::isspace(c); }));
    });
  }
  if (name == "isupper" || name == "islower") {
    return method([s, name](Interpreter&, CallArgs& a) {
      ArgBinder("str." + name, a, {});
      bool cased = false;
      for (char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        if (!std::isalpha(c)) continue;
        cased = true;
        if (name == "isupper" ? std::islower(c) : std::isupper(c)) return Value(false);
      }
      return Value(cased);
    });
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// isinstance
// ---------------------------------------------------------------------------

bool is_instance(const Value& value, const Value& cls) {
  if (auto e = cls.as<ExceptionTypeObject>()) {
    auto raised = value.as<ExceptionObject>();
    return raised && exception_matches(raised->type, e->name);
  }
  auto t = cls.as<TypeObject>();
  if (!t) throw_type_error("isinstance() arg 2 must be a type or tuple of types");
  if (t->name == "int") return value.is_int() || value.is_bool();
  if (t->name == "float") return value.is_float();
  return type_name(value) == t->name;
}

// ---------------------------------------------------------------------------
// Catalogue
// ---------------------------------------------------------------------------

const std::map<std::string, Value>& builtin_catalogue() {
  static const std::map<std::string, Value> kCatalogue = [] {
    std::map<std::string, Value> m;
    m["len"] = cordon::bind("len", builtin_len);
    m["range"] = type_value("range", builtin_range);
    m["int"] = type_value("int", builtin_int);
    m["float"] = type_value("float", builtin_float);
    m["str"] = type_value("str", builtin_str);
    m["bool"] = type_value("bool", builtin_bool);
    m["list"] = type_value("list", builtin_list);
    m["dict"] = type_value("dict", builtin_dict);
    m["tuple"] = type_value("tuple", builtin_tuple);
    m["abs"] = cordon::bind("abs", builtin_abs);
    m["min"] = cordon::bind("min", [](Interpreter& in, CallArgs& a) { return min_max(in, a, false); });
    m["max"] = cordon::bind("max", [](Interpreter& in, CallArgs& a) { return min_max(in, a, true); });
    m["sum"] = cordon::bind("sum", builtin_sum);
    m["round"] = cordon::bind("round", builtin_round);
    m["sorted"] = cordon::bind("sorted", builtin_sorted);
    m["reversed"] = cordon::bind("reversed", builtin_reversed);
    m["enumerate"] = cordon::bind("enumerate", builtin_enumerate);
    m["zip"] = cordon::bind("zip", builtin_zip);
    m["any"] = cordon::bind("any", [](Interpreter& in, CallArgs& a) { return builtin_any_all(in, a, false); });
    m["all"] = cordon::bind("all", [](Interpreter& in, CallArgs& a) { return builtin_any_all(in, a, true); });
    m["isinstance"] = cordon::bind("isinstance", builtin_isinstance);
    m["print"] = cordon::bind("print", builtin_print);
    m["type"] = cordon::bind("type", builtin_type);
    m["format"] = cordon::bind("format", builtin_format);
    m["repr"] = cordon::bind("repr", builtin_repr);
    m["divmod"] = cordon::bind("divmod", builtin_divmod);
    m["pow"] = cordon::bind("pow", builtin_pow);
    m["map"] = cordon::bind("map", builtin_map);
    m["filter"] = cordon::bind("filter", builtin_filter);
    for (const char* e : {"Exception", "ValueError", "TypeError", "KeyError", "IndexError", "ZeroDivisionError",
                          "NameError", "AttributeError", "RuntimeError", "AssertionError", "LookupError",
                          "ArithmeticError", "OverflowError", "StatisticsError"}) {
      m[e] = exception_type(e);
    }
    return m;
  }();
  return kCatalogue;
}

const std::set<std::string>& builtin_names() {
  static const std::set<std::string> kNames = [] {
    std::set<std::string> names;
    for (const auto& [name, value] : builtin_catalogue()) names.insert(name);
    return names;
  }();
  return kNames;
}

}  // namespace cordon
