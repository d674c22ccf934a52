#include "cordon/interpreter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

#include "cordon/frame.hpp"
#include "cordon/library.hpp"

namespace cordon {

namespace {

constexpr std::size_t kPollInterval = 1024;

// Decrements the call depth on every exit path.
struct DepthGuard {
  int& depth;
  ~DepthGuard() { --depth; }
};

struct ActiveErrorGuard {
  std::vector<ScriptError>& stack;
  ~ActiveErrorGuard() { stack.pop_back(); }
};

Value constant_value(const ast::Constant& c) {
  return std::visit(
      [](const auto& v) -> Value {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return Value();
        } else {
          return Value(v);
        }
      },
      c);
}

bool is_integral(const Value& v) { return v.is_int() || v.is_bool(); }

std::int64_t integral(const Value& v) { return v.is_bool() ? (v.as_bool() ? 1 : 0) : v.as_int(); }

[[noreturn]] void unsupported_operands(const std::string& op, const Value& a, const Value& b) {
  throw_type_error("unsupported operand type(s) for " + op + ": '" + type_name(a) + "' and '" + type_name(b) + "'");
}

[[noreturn]] void overflow() { throw ScriptError("OverflowError", "integer overflow"); }

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  if (a == std::numeric_limits<std::int64_t>::min() && b == -1) overflow();
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

std::int64_t floor_mod(std::int64_t a, std::int64_t b) {
  if (b == -1) return 0;
  std::int64_t r = a % b;
  if (r != 0 && ((r < 0) != (b < 0))) r += b;
  return r;
}

std::int64_t int_pow(std::int64_t base, std::int64_t exp) {
  std::int64_t result = 1;
  while (exp > 0) {
    if (exp & 1) {
      if (__builtin_mul_overflow(result, base, &result)) overflow();
    }
    exp >>= 1;
    if (exp > 0 && __builtin_mul_overflow(base, base, &base)) overflow();
  }
  return result;
}

Value int_arith(const std::string& op, std::int64_t a, std::int64_t b) {
  std::int64_t out = 0;
  if (op == "+") {
    if (__builtin_add_overflow(a, b, &out)) overflow();
    return Value(out);
  }
  if (op == "-") {
    if (__builtin_sub_overflow(a, b, &out)) overflow();
    return Value(out);
  }
  if (op == "*") {
    if (__builtin_mul_overflow(a, b, &out)) overflow();
    return Value(out);
  }
  if (op == "/") {
    if (b == 0) throw ScriptError("ZeroDivisionError", "division by zero");
    return Value(static_cast<double>(a) / static_cast<double>(b));
  }
  if (op == "//") {
    if (b == 0) throw ScriptError("ZeroDivisionError", "integer division or modulo by zero");
    return Value(floor_div(a, b));
  }
  if (op == "%") {
    if (b == 0) throw ScriptError("ZeroDivisionError", "integer modulo by zero");
    return Value(floor_mod(a, b));
  }
  if (op == "**") {
    if (b < 0) {
      if (a == 0) throw ScriptError("ZeroDivisionError", "0 cannot be raised to a negative power");
      return Value(std::pow(static_cast<double>(a), static_cast<double>(b)));
    }
    return Value(int_pow(a, b));
  }
  if (op == "&") return Value(a & b);
  if (op == "|") return Value(a | b);
  if (op == "^") return Value(a ^ b);
  if (op == "<<" || op == ">>") {
    if (b < 0) throw_value_error("negative shift count");
    if (op == ">>") return Value(b >= 63 ? (a < 0 ? -1 : 0) : (a >> b));
    if (a == 0) return Value(std::int64_t{0});
    if (b >= 63) overflow();
    const std::int64_t shifted = static_cast<std::int64_t>(static_cast<std::uint64_t>(a) << b);
    if ((shifted >> b) != a) overflow();
    return Value(shifted);
  }
  return Value();
}

Value float_arith(const std::string& op, double a, double b) {
  if (op == "+") return Value(a + b);
  if (op == "-") return Value(a - b);
  if (op == "*") return Value(a * b);
  if (op == "/") {
    if (b == 0.0) throw ScriptError("ZeroDivisionError", "float division by zero");
    return Value(a / b);
  }
  if (op == "//") {
    if (b == 0.0) throw ScriptError("ZeroDivisionError", "float floor division by zero");
    return Value(std::floor(a / b));
  }
  if (op == "%") {
    if (b == 0.0) throw ScriptError("ZeroDivisionError", "float modulo");
    double r = std::fmod(a, b);
    if (r != 0.0 && ((r < 0) != (b < 0))) r += b;
    return Value(r);
  }
  if (op == "**") {
    if (a == 0.0 && b < 0) throw ScriptError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
    const double r = std::pow(a, b);
    if (std::isnan(r) && !std::isnan(a) && !std::isnan(b)) throw_value_error("math domain error");
    return Value(r);
  }
  return Value();
}

// printf-style "%" formatting for strings: %s %r %d %i %f %e %g %x %%.
std::string percent_format(const std::string& fmt, const Value& args) {
  std::vector<Value> values;
  if (auto tuple = args.as<TupleObject>()) {
    values = tuple->items;
  } else {
    values.push_back(args);
  }
  std::size_t next = 0;
  std::string out;
  for (std::size_t i = 0; i < fmt.size(); ++i) {
    if (fmt[i] != '%') {
      out += fmt[i];
      continue;
    }
    if (++i >= fmt.size()) throw_value_error("incomplete format");
    if (fmt[i] == '%') {
      out += '%';
      continue;
    }
    bool left = false, zero = false, plus = false, space = false;
    for (; i < fmt.size(); ++i) {
      const char f = fmt[i];
      if (f == '-') left = true;
      else if (f == '0') zero = true;
      else if (f == '+') plus = true;
      else if (f == ' ') space = true;
      else break;
    }
    std::string width, precision;
    while (i < fmt.size() && std::isdigit(static_cast<unsigned char>(fmt[i]))) width += fmt[i++];
    if (i < fmt.size() && fmt[i] == '.') {
      ++i;
      precision = ".";
      while (i < fmt.size() && std::isdigit(static_cast<unsigned char>(fmt[i]))) precision += fmt[i++];
      if (precision == ".") precision = ".0";
    }
    if (i >= fmt.size()) throw_value_error("incomplete format");
    const char conv = fmt[i];
    if (next >= values.size()) throw_type_error("not enough arguments for format string");
    const Value& arg = values[next++];

    std::string spec;
    if (left) spec += '<';
    if (plus) spec += '+';
    else if (space) spec += ' ';
    if (zero && !left) spec += '0';
    spec += width;
    switch (conv) {
      case 's':
        out += format_value(Value(str(arg)), spec + precision);
        break;
      case 'r':
        out += format_value(Value(repr(arg)), spec + precision);
        break;
      case 'd':
      case 'i':
      case 'u':
        if (!arg.is_number()) throw_type_error("%d format: a real number is required, not " + type_name(arg));
        if (arg.is_float() && !(std::fabs(arg.as_float()) < 9.2233720368547758e18)) {
          throw ScriptError("OverflowError", "cannot convert float " + repr(arg) + " to integer");
        }
        out += format_value(Value(arg.is_float() ? static_cast<std::int64_t>(std::trunc(arg.as_float()))
                                                 : integral(arg)),
                            spec + "d");
        break;
      case 'f':
      case 'F':
      case 'e':
      case 'g':
        out += format_value(Value(to_double(arg, "format")), spec + (precision.empty() ? ".6" : precision) +
                                                                 (conv == 'F' ? 'f' : conv));
        break;
      case 'x':
        out += format_value(Value(to_int(arg, "format")), spec + "x");
        break;
      default:
        throw_value_error(std::string("unsupported format character '") + conv + "'");
    }
  }
  if (next < values.size()) {
    throw_type_error("not all arguments converted during string formatting");
  }
  return out;
}

std::int64_t index_of(const Value& index, std::size_t size, const char* what) {
  if (!is_integral(index)) {
    throw_type_error(std::string(what) + " indices must be integers or slices, not " + type_name(index));
  }
  std::int64_t i = integral(index);
  const auto n = static_cast<std::int64_t>(size);
  if (i < 0) i += n;
  if (i < 0 || i >= n) throw ScriptError("IndexError", std::string(what) + " index out of range");
  return i;
}

bool same_object(const Value& a, const Value& b) {
  if (a.v.index() != b.v.index()) return false;
  if (a.is_object()) return a.as_object() == b.as_object();
  return values_equal(a, b);
}

}  // namespace

Interpreter::Interpreter(ExecutionEnvironment env, ExecutionControl control)
    : env_(std::move(env)), control_(std::move(control)) {
  globals_ = new_scope(env_.builtins);
}

Interpreter::~Interpreter() {
  // Break every cycle a script may have built: container to itself, function
  // to the scope it is stored in, and so on.
  for (auto& weak : heap_) {
    if (auto object = weak.lock()) object->release_references();
  }
  for (auto& weak : scopes_) {
    if (auto scope = weak.lock()) {
      scope->vars.clear();
      scope->parent.reset();
    }
  }
}

void Interpreter::run(std::shared_ptr<const ast::Module> module) {
  module_ = std::move(module);
  const Flow flow = exec_block(module_->body, globals_);
  if (flow == Flow::return_value) throw ScriptError("SyntaxError", "'return' outside function", current_line_);
  if (flow != Flow::normal) throw ScriptError("SyntaxError", "'break' or 'continue' outside loop", current_line_);
}

void Interpreter::set_global(const std::string& name, Value value) { globals_->vars[name] = std::move(value); }

const Value* Interpreter::find_global(const std::string& name) const {
  auto it = globals_->vars.find(name);
  return it == globals_->vars.end() ? nullptr : &it->second;
}

const Value* Interpreter::find_builtin(const std::string& name) const {
  if (!env_.builtins) return nullptr;
  auto it = env_.builtins->vars.find(name);
  return it == env_.builtins->vars.end() ? nullptr : &it->second;
}

// ---------------------------------------------------------------------------
// Services
// ---------------------------------------------------------------------------

void Interpreter::check_interrupts() {
  if (control_.token && control_.token->cancelled()) throw ExecutionCancelled(true);
  if (control_.stop && control_.stop->load(std::memory_order_relaxed)) throw ExecutionCancelled(false);
}

void Interpreter::check_size(std::size_t n, const char* what) {
  if (n > env_.limits.max_collection_size) {
    throw ResourceLimitExceeded(std::string(what) + " size limit exceeded (" + std::to_string(n) + " > " +
                                    std::to_string(env_.limits.max_collection_size) + ")",
                                current_line_);
  }
}

void Interpreter::write_output(const std::string& text) {
  const std::size_t limit = env_.limits.max_output_bytes;
  if (output_.size() + text.size() <= limit) {
    output_ += text;
    return;
  }
  output_.append(text, 0, limit - output_.size());
  output_truncated_ = true;
  throw ResourceLimitExceeded("output limit exceeded (" + std::to_string(limit) + " bytes)", current_line_);
}

void Interpreter::track(const ObjectPtr& object) {
  heap_.push_back(object);
  if (heap_.size() >= prune_at_) {
    heap_.erase(std::remove_if(heap_.begin(), heap_.end(), [](const auto& w) { return w.expired(); }), heap_.end());
    prune_at_ = std::max<std::size_t>(4096, heap_.size() * 2);
  }
}

std::shared_ptr<ListObject> Interpreter::new_list(std::vector<Value> items) {
  check_size(items.size(), "list");
  auto list = std::make_shared<ListObject>(std::move(items));
  track(list);
  return list;
}

std::shared_ptr<DictObject> Interpreter::new_dict() {
  auto dict = std::make_shared<DictObject>();
  track(dict);
  return dict;
}

std::shared_ptr<Scope> Interpreter::new_scope(std::shared_ptr<Scope> parent) {
  auto scope = std::make_shared<Scope>();
  scope->parent = std::move(parent);
  scopes_.push_back(scope);
  if (scopes_.size() >= 4 * prune_at_) {
    scopes_.erase(std::remove_if(scopes_.begin(), scopes_.end(), [](const auto& w) { return w.expired(); }),
                  scopes_.end());
  }
  return scope;
}

void Interpreter::for_each(const Value& iterable, const std::function<bool(const Value&)>& fn) {
  std::size_t n = 0;
  auto step = [&](const Value& item) {
    if (++n % kPollInterval == 0) check_interrupts();
    return fn(item);
  };

  if (iterable.is_str()) {
    const std::string& s = iterable.as_str();
    for (char c : s) {
      if (!step(Value(std::string(1, c)))) return;
    }
    return;
  }
  if (auto list = iterable.as<ListObject>()) {
    // Indexed so the body may append to the list it iterates.
    for (std::size_t i = 0; i < list->items.size(); ++i) {
      Value item = list->items[i];
      if (!step(item)) return;
    }
    return;
  }
  if (auto tuple = iterable.as<TupleObject>()) {
    for (std::size_t i = 0; i < tuple->items.size(); ++i) {
      if (!step(tuple->items[i])) return;
    }
    return;
  }
  if (auto range = iterable.as<RangeObject>()) {
    const std::int64_t size = range->size();
    for (std::int64_t i = 0; i < size; ++i) {
      if (!step(Value(range->at(i)))) return;
    }
    return;
  }
  if (auto dict = iterable.as<DictObject>()) {
    std::vector<Value> keys;
    keys.reserve(dict->size());
    for (const auto& entry : dict->entries()) keys.push_back(entry.first);
    for (const auto& key : keys) {
      if (!step(key)) return;
    }
    return;
  }
  if (auto series = iterable.as<SeriesObject>()) {
    for (std::size_t r = 0; r < series->size(); ++r) {
      if (!step(series->at(r))) return;
    }
    return;
  }
  if (auto frame = iterable.as<FrameObject>()) {
    for (const auto& name : frame->data.column_names()) {
      if (!step(Value(name))) return;
    }
    return;
  }
  throw_type_error("'" + type_name(iterable) + "' object is not iterable");
}

std::vector<Value> Interpreter::to_vector(const Value& iterable) {
  if (auto list = iterable.as<ListObject>()) return list->items;
  if (auto tuple = iterable.as<TupleObject>()) return tuple->items;
  if (auto range = iterable.as<RangeObject>()) check_size(static_cast<std::size_t>(range->size()), "range");
  std::vector<Value> out;
  for_each(iterable, [&](const Value& item) {
    out.push_back(item);
    if (out.size() % kPollInterval == 0) check_size(out.size());
    return true;
  });
  return out;
}

Value Interpreter::call(const Value& callee, CallArgs& args, int line) {
  check_interrupts();
  if (line > 0) current_line_ = line;
  if (auto fn = callee.as<FunctionObject>()) return call_function(*fn, args);
  if (auto native = callee.as<NativeFunction>()) return native->fn(*this, args);
  if (auto type = callee.as<ExceptionTypeObject>()) {
    if (!args.keywords.empty()) throw_type_error(type->name + "() takes no keyword arguments");
    std::string message;
    if (args.positional.size() == 1) {
      message = str(args.positional[0]);
    } else if (args.positional.size() > 1) {
      message = repr(Value(make_tuple(args.positional)));
    }
    return Value(std::make_shared<ExceptionObject>(type->name, std::move(message)));
  }
  throw_type_error("'" + type_name(callee) + "' object is not callable");
}

Value Interpreter::call1(const Value& callee, Value arg) {
  CallArgs args;
  args.positional.push_back(std::move(arg));
  return call(callee, args);
}

Value Interpreter::get_attribute(const Value& object, const std::string& name, int line) {
  check_attribute(name, line);
  std::optional<Value> found;
  if (object.is_str()) {
    found = string_attribute(*this, object.as_str(), name);
  } else if (object.is_object()) {
    found = object.as_object()->attribute(*this, object.as_object(), name);
  }
  if (!found) {
    if (auto module = object.as<ModuleObject>()) {
      throw ScriptError("AttributeError", "module '" + module->name + "' has no attribute '" + name + "'", line);
    }
    throw ScriptError("AttributeError", "'" + type_name(object) + "' object has no attribute '" + name + "'", line);
  }
  return std::move(*found);
}

void Interpreter::check_attribute(const std::string& name, int line) const {
  if (env_.allow_list->is_blocked_attribute(name)) {
    throw CapabilityViolation(CapabilityViolation::Kind::attribute_blocked, name, line);
  }
}

// ---------------------------------------------------------------------------
// Operators
// ---------------------------------------------------------------------------

Value Interpreter::binary_op(const std::string& op, const Value& a, const Value& b) {
  if (is_tabular(a) || is_tabular(b)) return tabular_binary_op(*this, op, a, b);

  if (is_integral(a) && is_integral(b)) {
    if (a.is_bool() && b.is_bool() && (op == "&" || op == "|" || op == "^")) {
      const bool x = a.as_bool(), y = b.as_bool();
      return Value(op == "&" ? (x && y) : op == "|" ? (x || y) : (x != y));
    }
    Value out = int_arith(op, integral(a), integral(b));
    if (!out.is_none()) return out;
    unsupported_operands(op, a, b);
  }
  if (a.is_number() && b.is_number()) {
    Value out = float_arith(op, to_double(a, op), to_double(b, op));
    if (!out.is_none()) return out;
    unsupported_operands(op, a, b);
  }

  if (op == "+") {
    if (a.is_str() && b.is_str()) {
      check_size(a.as_str().size() + b.as_str().size(), "str");
      return Value(a.as_str() + b.as_str());
    }
    auto la = a.as<ListObject>();
    auto lb = b.as<ListObject>();
    if (la && lb) {
      check_size(la->items.size() + lb->items.size(), "list");
      std::vector<Value> items = la->items;
      items.insert(items.end(), lb->items.begin(), lb->items.end());
      return Value(new_list(std::move(items)));
    }
    auto ta = a.as<TupleObject>();
    auto tb = b.as<TupleObject>();
    if (ta && tb) {
      check_size(ta->items.size() + tb->items.size(), "tuple");
      std::vector<Value> items = ta->items;
      items.insert(items.end(), tb->items.begin(), tb->items.end());
      return Value(make_tuple(std::move(items)));
    }
  }

  if (op == "*") {
    const Value* seq = is_integral(b) ? &a : is_integral(a) ? &b : nullptr;
    if (seq && !seq->is_number()) {
      std::int64_t times = std::max<std::int64_t>(0, integral(seq == &a ? b : a));
      // An empty operand repeats to an empty result without iterating.
      auto repeated_size = [&](std::size_t unit) {
        if (unit == 0) times = 0;
        if (times > 0 && static_cast<std::uint64_t>(times) > env_.limits.max_collection_size / unit) {
          check_size(env_.limits.max_collection_size + 1, type_name(*seq).c_str());
        }
        return unit * static_cast<std::size_t>(times);
      };
      auto poll = [&](std::int64_t i) {
        if (i % kPollInterval == 0) check_interrupts();
      };
      if (seq->is_str()) {
        const std::string& s = seq->as_str();
        std::string out;
        out.reserve(repeated_size(s.size()));
        for (std::int64_t i = 0; i < times; ++i) {
          poll(i);
          out += s;
        }
        return Value(std::move(out));
      }
      if (auto list = seq->as<ListObject>()) {
        std::vector<Value> items;
        items.reserve(repeated_size(list->items.size()));
        for (std::int64_t i = 0; i < times; ++i) {
          poll(i);
          items.insert(items.end(), list->items.begin(), list->items.end());
        }
        return Value(new_list(std::move(items)));
      }
      if (auto tuple = seq->as<TupleObject>()) {
        std::vector<Value> items;
        items.reserve(repeated_size(tuple->items.size()));
        for (std::int64_t i = 0; i < times; ++i) {
          poll(i);
          items.insert(items.end(), tuple->items.begin(), tuple->items.end());
        }
        return Value(make_tuple(std::move(items)));
      }
    }
  }

  if (op == "%" && a.is_str()) {
    std::string out = percent_format(a.as_str(), b);
    check_size(out.size(), "str");
    return Value(std::move(out));
  }

  if (op == "|") {
    auto da = a.as<DictObject>();
    auto db = b.as<DictObject>();
    if (da && db) {
      auto merged = new_dict();
      for (const auto& [k, v] : da->entries()) merged->set(k, v);
      for (const auto& [k, v] : db->entries()) merged->set(k, v);
      check_size(merged->size(), "dict");
      return Value(merged);
    }
  }

  unsupported_operands(op, a, b);
}

Value Interpreter::compare_op(const std::string& op, const Value& a, const Value& b) {
  if (op == "is") return Value(same_object(a, b));
  if (op == "is not") return Value(!same_object(a, b));

  if (op == "in" || op == "not in") {
    bool found = false;
    if (b.is_str()) {
      if (!a.is_str()) throw_type_error("'in <string>' requires string as left operand, not " + type_name(a));
      found = b.as_str().find(a.as_str()) != std::string::npos;
    } else if (auto dict = b.as<DictObject>()) {
      found = dict->find(a) != nullptr;
    } else if (auto range = b.as<RangeObject>()) {
      if (is_integral(a)) {
        const std::int64_t x = integral(a);
        const std::int64_t n = range->size();
        if (n > 0) {
          const std::int64_t offset = x - range->start;
          found = offset % range->step == 0 && offset / range->step >= 0 && offset / range->step < n;
        }
      }
    } else if (auto frame = b.as<FrameObject>()) {
      found = a.is_str() && frame->data.find_column(a.as_str()) >= 0;
    } else if (b.as<SeriesObject>()) {
      throw_type_error("use Series.isin() to test membership of Series values");
    } else {
      for_each(b, [&](const Value& item) {
        found = values_equal(a, item);
        return !found;
      });
    }
    return Value(op == "in" ? found : !found);
  }

  if (is_tabular(a) || is_tabular(b)) return tabular_compare_op(*this, op, a, b);

  if (op == "==") return Value(values_equal(a, b));
  if (op == "!=") return Value(!values_equal(a, b));
  if (op == "<") return Value(less_than(a, b));
  if (op == ">") return Value(less_than(b, a));
  if (op == "<=") return Value(less_than(a, b) || values_equal(a, b));
  if (op == ">=") return Value(less_than(b, a) || values_equal(a, b));
  throw_type_error("unknown comparison '" + op + "'");
}

Value Interpreter::unary_op(const std::string& op, const Value& a) {
  if (op == "not") return Value(!truthy(a));
  if (is_tabular(a)) return tabular_unary_op(*this, op, a);
  if (is_integral(a)) {
    const std::int64_t x = integral(a);
    if (op == "-") {
      if (x == std::numeric_limits<std::int64_t>::min()) overflow();
      return Value(-x);
    }
    if (op == "+") return Value(x);
    if (op == "~") return Value(~x);
  }
  if (a.is_float()) {
    if (op == "-") return Value(-a.as_float());
    if (op == "+") return a;
  }
  throw_type_error("bad operand type for unary " + op + ": '" + type_name(a) + "'");
}

Value Interpreter::get_item(const Value& object, const Value& index) {
  auto slice = index.as<SliceObject>();

  if (object.is_str()) {
    const std::string& s = object.as_str();
    if (slice) {
      std::string out;
      for (auto i : slice->resolve(static_cast<std::int64_t>(s.size()))) out += s[static_cast<std::size_t>(i)];
      return Value(std::move(out));
    }
    return Value(std::string(1, s[static_cast<std::size_t>(index_of(index, s.size(), "string"))]));
  }
  if (auto list = object.as<ListObject>()) {
    if (slice) {
      std::vector<Value> items;
      for (auto i : slice->resolve(static_cast<std::int64_t>(list->items.size()))) {
        items.push_back(list->items[static_cast<std::size_t>(i)]);
      }
      return Value(new_list(std::move(items)));
    }
    return list->items[static_cast<std::size_t>(index_of(index, list->items.size(), "list"))];
  }
  if (auto tuple = object.as<TupleObject>()) {
    if (slice) {
      std::vector<Value> items;
      for (auto i : slice->resolve(static_cast<std::int64_t>(tuple->items.size()))) {
        items.push_back(tuple->items[static_cast<std::size_t>(i)]);
      }
      return Value(make_tuple(std::move(items)));
    }
    return tuple->items[static_cast<std::size_t>(index_of(index, tuple->items.size(), "tuple"))];
  }
  if (auto dict = object.as<DictObject>()) {
    if (const Value* found = dict->find(index)) return *found;
    throw ScriptError("KeyError", repr(index));
  }
  if (auto range = object.as<RangeObject>()) {
    if (slice) {
      std::vector<Value> items;
      for (auto i : slice->resolve(range->size())) items.push_back(Value(range->at(i)));
      return Value(new_list(std::move(items)));
    }
    return Value(range->at(index_of(index, static_cast<std::size_t>(range->size()), "range")));
  }
  if (auto frame = object.as<FrameObject>()) return frame_get_item(*this, *frame, index);
  if (auto series = object.as<SeriesObject>()) return series_get_item(*this, *series, index);
  if (auto group = object.as<GroupByObject>()) return groupby_get_item(*group, index);
  throw_type_error("'" + type_name(object) + "' object is not subscriptable");
}

void Interpreter::set_item(const Value& object, const Value& index, const Value& value) {
  if (auto list = object.as<ListObject>()) {
    auto slice = index.as<SliceObject>();
    if (!slice) {
      list->items[static_cast<std::size_t>(index_of(index, list->items.size(), "list assignment"))] = value;
      return;
    }
    std::vector<Value> replacement = to_vector(value);
    const auto n = static_cast<std::int64_t>(list->items.size());
    const bool simple = slice->step.is_none() || (is_integral(slice->step) && integral(slice->step) == 1);
    if (simple) {
      auto bound = [n](const Value& v, std::int64_t fallback) {
        if (v.is_none()) return fallback;
        std::int64_t i = integral(v);
        if (i < 0) i = std::max<std::int64_t>(0, i + n);
        return std::min(i, n);
      };
      const std::int64_t lo = bound(slice->lower, 0);
      const std::int64_t hi = std::max(lo, bound(slice->upper, n));
      check_size(list->items.size() - static_cast<std::size_t>(hi - lo) + replacement.size(), "list");
      list->items.erase(list->items.begin() + lo, list->items.begin() + hi);
      list->items.insert(list->items.begin() + lo, replacement.begin(), replacement.end());
      return;
    }
    const auto indices = slice->resolve(n);
    if (indices.size() != replacement.size()) {
      throw_value_error("attempt to assign sequence of size " + std::to_string(replacement.size()) +
                        " to extended slice of size " + std::to_string(indices.size()));
    }
    for (std::size_t k = 0; k < indices.size(); ++k) list->items[static_cast<std::size_t>(indices[k])] = replacement[k];
    return;
  }
  if (auto dict = object.as<DictObject>()) {
    dict->set(index, value);
    check_size(dict->size(), "dict");
    return;
  }
  if (auto frame = object.as<FrameObject>()) {
    frame_set_item(*this, *frame, index, value);
    return;
  }
  throw_type_error("'" + type_name(object) + "' object does not support item assignment");
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

Interpreter::Flow Interpreter::exec_block(const ast::Block& block, const std::shared_ptr<Scope>& scope) {
  for (const auto& stmt : block) {
    const Flow flow = exec(*stmt, scope);
    if (flow != Flow::normal) return flow;
  }
  return Flow::normal;
}

Interpreter::Flow Interpreter::exec(const ast::Stmt& stmt, const std::shared_ptr<Scope>& scope) {
  check_interrupts();
  current_line_ = stmt.line;
  // Errors raised by native code carry no line; attribute them to the
  // innermost statement being executed.
  try {
    switch (stmt.kind) {
      case ast::StmtKind::expr:
        eval(*stmt.value, scope);
        return Flow::normal;

      case ast::StmtKind::assign: {
        const Value value = eval(*stmt.value, scope);
        for (const auto& target : stmt.targets) assign(*target, value, scope);
        return Flow::normal;
      }

      case ast::StmtKind::aug_assign: {
        const ast::Expr& target = *stmt.targets[0];
        const Value rhs = eval(*stmt.value, scope);
        if (target.kind == ast::ExprKind::subscript) {
          const Value object = eval(*target.a, scope);
          const Value index = eval(*target.b, scope);
          set_item(object, index, binary_op(stmt.op, get_item(object, index), rhs));
          return Flow::normal;
        }
        const Value current = eval(target, scope);
        if (stmt.op == "+") {
          // list += iterable extends in place.
          if (auto list = current.as<ListObject>()) {
            std::vector<Value> more = to_vector(rhs);
            check_size(list->items.size() + more.size(), "list");
            list->items.insert(list->items.end(), more.begin(), more.end());
            return Flow::normal;
          }
        }
        assign(target, binary_op(stmt.op, current, rhs), scope);
        return Flow::normal;
      }

      case ast::StmtKind::import:
        exec_import(stmt, scope);
        return Flow::normal;

      case ast::StmtKind::import_from:
        exec_import_from(stmt, scope);
        return Flow::normal;

      case ast::StmtKind::if_:
        if (truthy(eval(*stmt.test, scope))) return exec_block(stmt.body, scope);
        return exec_block(stmt.orelse, scope);

      case ast::StmtKind::for_:
        return exec_for(stmt, scope);

      case ast::StmtKind::while_:
        return exec_while(stmt, scope);

      case ast::StmtKind::break_:
        return Flow::break_loop;

      case ast::StmtKind::continue_:
        return Flow::continue_loop;

      case ast::StmtKind::pass:
        return Flow::normal;

      case ast::StmtKind::function_def:
        exec_def(stmt, scope);
        return Flow::normal;

      case ast::StmtKind::return_:
        return_value_ = stmt.value ? eval(*stmt.value, scope) : Value();
        return Flow::return_value;

      case ast::StmtKind::with: {
        const Value context = eval(*stmt.value, scope);
        if (stmt.target) assign(*stmt.target, context, scope);
        return exec_block(stmt.body, scope);
      }

      case ast::StmtKind::try_:
        return exec_try(stmt, scope);

      case ast::StmtKind::raise: {
        if (!stmt.value) {
          if (active_errors_.empty()) throw ScriptError("RuntimeError", "No active exception to reraise");
          throw active_errors_.back();
        }
        const Value raised = eval(*stmt.value, scope);
        if (auto error = raised.as<ExceptionObject>()) throw ScriptError(error->type, error->message, stmt.line);
        if (auto type = raised.as<ExceptionTypeObject>()) throw ScriptError(type->name, "", stmt.line);
        throw_type_error("exceptions must derive from BaseException");
      }

      case ast::StmtKind::assert_:
        if (!truthy(eval(*stmt.test, scope))) {
          throw ScriptError("AssertionError", stmt.value ? str(eval(*stmt.value, scope)) : "", stmt.line);
        }
        return Flow::normal;

      case ast::StmtKind::del:
        for (const auto& target : stmt.targets) exec_del(*target, scope);
        return Flow::normal;
    }
  } catch (ScriptError& e) {
    if (e.line() == 0) e.set_line(stmt.line);
    throw;
  } catch (ResourceLimitExceeded& e) {
    if (e.line() == 0) e.set_line(stmt.line);
    throw;
  } catch (CapabilityViolation& e) {
    if (e.line() == 0) e.set_line(stmt.line);
    throw;
  }
  return Flow::normal;
}

Interpreter::Flow Interpreter::exec_for(const ast::Stmt& stmt, const std::shared_ptr<Scope>& scope) {
  const Value iterable = eval(*stmt.iter, scope);
  bool broke = false;
  bool returned = false;
  for_each(iterable, [&](const Value& item) {
    check_interrupts();
    assign(*stmt.target, item, scope);
    const Flow flow = exec_block(stmt.body, scope);
    if (flow == Flow::break_loop) {
      broke = true;
      return false;
    }
    if (flow == Flow::return_value) {
      returned = true;
      return false;
    }
    return true;
  });
  if (returned) return Flow::return_value;
  if (!broke) return exec_block(stmt.orelse, scope);
  return Flow::normal;
}

Interpreter::Flow Interpreter::exec_while(const ast::Stmt& stmt, const std::shared_ptr<Scope>& scope) {
  while (true) {
    check_interrupts();
    if (!truthy(eval(*stmt.test, scope))) break;
    const Flow flow = exec_block(stmt.body, scope);
    if (flow == Flow::break_loop) return Flow::normal;
    if (flow == Flow::return_value) return flow;
  }
  return exec_block(stmt.orelse, scope);
}

Interpreter::Flow Interpreter::exec_try(const ast::Stmt& stmt, const std::shared_ptr<Scope>& scope) {
  Flow flow = Flow::normal;
  // Only script errors run finally blocks; the uncatchable errors end the
  // execution immediately.
  std::exception_ptr pending;
  try {
    bool raised = false;
    try {
      flow = exec_block(stmt.body, scope);
    } catch (const ScriptError& error) {
      raised = true;
      const ast::ExceptHandler* handler = nullptr;
      for (const auto& candidate : stmt.handlers) {
        if (!candidate.type) {
          handler = &candidate;
          break;
        }
        const Value type = eval(*candidate.type, scope);
        std::vector<Value> classes;
        if (auto tuple = type.as<TupleObject>()) {
          classes = tuple->items;
        } else {
          classes.push_back(type);
        }
        bool matched = false;
        for (const auto& cls : classes) {
          auto exception_type = cls.as<ExceptionTypeObject>();
          if (!exception_type) {
            throw_type_error("catching classes that do not inherit from BaseException is not allowed");
          }
          if (exception_matches(error.type_name(), exception_type->name)) matched = true;
        }
        if (matched) {
          handler = &candidate;
          break;
        }
      }
      if (!handler) throw;
      if (!handler->name.empty()) {
        scope->vars[handler->name] = Value(std::make_shared<ExceptionObject>(error.type_name(), error.message()));
      }
      active_errors_.push_back(error);
      ActiveErrorGuard guard{active_errors_};
      flow = exec_block(handler->body, scope);
    }
    if (!raised && flow == Flow::normal) flow = exec_block(stmt.orelse, scope);
  } catch (const ScriptError&) {
    if (stmt.finalbody.empty()) throw;
    pending = std::current_exception();
  }

  if (!stmt.finalbody.empty()) {
    const Value saved = return_value_;
    const Flow final_flow = exec_block(stmt.finalbody, scope);
    if (final_flow != Flow::normal) return final_flow;
    return_value_ = saved;
  }
  if (pending) std::rethrow_exception(pending);
  return flow;
}

void Interpreter::exec_import(const ast::Stmt& stmt, const std::shared_ptr<Scope>& scope) {
  for (const auto& alias : stmt.names) {
    ResolveResult resolved = env_.resolver->resolve(alias.name);
    if (resolved.status == ResolveResult::Status::blocked) {
      throw CapabilityViolation(CapabilityViolation::Kind::import_blocked, resolved.detail, alias.line);
    }
    if (resolved.status == ResolveResult::Status::not_found) {
      throw ScriptError("ModuleNotFoundError", "No module named '" + alias.name + "'", alias.line);
    }
    if (!alias.as_name.empty()) {
      scope->vars[alias.as_name] = Value(resolved.module);
      continue;
    }
    const auto dot = alias.name.find('.');
    if (dot == std::string::npos) {
      scope->vars[alias.name] = Value(resolved.module);
      continue;
    }
    // "import a.b" binds a.
    const std::string head = alias.name.substr(0, dot);
    ResolveResult top = env_.resolver->resolve(head);
    if (top.status != ResolveResult::Status::ok) {
      throw ScriptError("ModuleNotFoundError", "No module named '" + head + "'", alias.line);
    }
    scope->vars[head] = Value(top.module);
  }
}

void Interpreter::exec_import_from(const ast::Stmt& stmt, const std::shared_ptr<Scope>& scope) {
  ResolveResult resolved = env_.resolver->resolve(stmt.module);
  if (resolved.status == ResolveResult::Status::blocked) {
    throw CapabilityViolation(CapabilityViolation::Kind::import_blocked, resolved.detail, stmt.line);
  }
  if (resolved.status == ResolveResult::Status::not_found) {
    throw ScriptError("ModuleNotFoundError", "No module named '" + stmt.module + "'", stmt.line);
  }
  const Value module(resolved.module);
  for (const auto& alias : stmt.names) {
    check_attribute(alias.name, alias.line);
    auto member = resolved.module->attribute(*this, resolved.module, alias.name);
    if (!member) {
      throw ScriptError("ImportError", "cannot import name '" + alias.name + "' from '" + stmt.module + "'",
                        alias.line);
    }
    scope->vars[alias.as_name.empty() ? alias.name : alias.as_name] = std::move(*member);
  }
}

void Interpreter::exec_def(const ast::Stmt& stmt, const std::shared_ptr<Scope>& scope) {
  scope->vars[stmt.name] = make_function(stmt.name, stmt.params, &stmt.body, nullptr, scope);
}

void Interpreter::exec_del(const ast::Expr& target, const std::shared_ptr<Scope>& scope) {
  switch (target.kind) {
    case ast::ExprKind::name:
      if (scope->vars.erase(target.name) == 0) {
        throw ScriptError("NameError", "name '" + target.name + "' is not defined", target.line);
      }
      return;
    case ast::ExprKind::tuple:
    case ast::ExprKind::list:
      for (const auto& item : target.items) exec_del(*item, scope);
      return;
    case ast::ExprKind::subscript: {
      const Value object = eval(*target.a, scope);
      const Value index = eval(*target.b, scope);
      if (auto list = object.as<ListObject>()) {
        if (auto slice = index.as<SliceObject>()) {
          auto indices = slice->resolve(static_cast<std::int64_t>(list->items.size()));
          std::sort(indices.begin(), indices.end());
          for (auto it = indices.rbegin(); it != indices.rend(); ++it) list->items.erase(list->items.begin() + *it);
          return;
        }
        list->items.erase(list->items.begin() + index_of(index, list->items.size(), "list assignment"));
        return;
      }
      if (auto dict = object.as<DictObject>()) {
        if (!dict->erase(index)) throw ScriptError("KeyError", repr(index), target.line);
        return;
      }
      if (auto frame = object.as<FrameObject>()) {
        frame_delete_item(*frame, index);
        return;
      }
      throw_type_error("'" + type_name(object) + "' object does not support item deletion");
    }
    case ast::ExprKind::attribute:
      check_attribute(target.name, target.line);
      throw ScriptError("AttributeError", "cannot delete attribute '" + target.name + "'", target.line);
    default:
      throw ScriptError("SyntaxError", "cannot delete expression", target.line);
  }
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

Value Interpreter::eval(const ast::Expr& expr, const std::shared_ptr<Scope>& scope) {
  switch (expr.kind) {
    case ast::ExprKind::name:
      return eval_name(expr, scope);

    case ast::ExprKind::constant:
      return constant_value(expr.constant);

    case ast::ExprKind::fstring:
      return eval_fstring(expr, scope);

    case ast::ExprKind::list: {
      std::vector<Value> items;
      items.reserve(expr.items.size());
      for (const auto& item : expr.items) items.push_back(eval(*item, scope));
      return Value(new_list(std::move(items)));
    }

    case ast::ExprKind::tuple: {
      std::vector<Value> items;
      items.reserve(expr.items.size());
      for (const auto& item : expr.items) items.push_back(eval(*item, scope));
      return Value(make_tuple(std::move(items)));
    }

    case ast::ExprKind::dict: {
      auto dict = new_dict();
      for (std::size_t i = 0; i < expr.items.size(); ++i) {
        Value key = eval(*expr.items[i], scope);
        dict->set(key, eval(*expr.values[i], scope));
      }
      return Value(dict);
    }

    case ast::ExprKind::list_comp:
    case ast::ExprKind::dict_comp:
      return eval_comprehension(expr, scope);

    case ast::ExprKind::unary:
      return unary_op(expr.op, eval(*expr.a, scope));

    case ast::ExprKind::binary: {
      const Value a = eval(*expr.a, scope);
      const Value b = eval(*expr.b, scope);
      return binary_op(expr.op, a, b);
    }

    case ast::ExprKind::bool_op: {
      Value last;
      for (const auto& item : expr.items) {
        last = eval(*item, scope);
        const bool t = truthy(last);
        if (expr.op == "and" ? !t : t) return last;
      }
      return last;
    }

    case ast::ExprKind::compare:
      return eval_compare(expr, scope);

    case ast::ExprKind::conditional:
      return truthy(eval(*expr.a, scope)) ? eval(*expr.b, scope) : eval(*expr.c, scope);

    case ast::ExprKind::call:
      return eval_call(expr, scope);

    case ast::ExprKind::attribute:
      return get_attribute(eval(*expr.a, scope), expr.name, expr.line);

    case ast::ExprKind::subscript: {
      const Value object = eval(*expr.a, scope);
      return get_item(object, eval(*expr.b, scope));
    }

    case ast::ExprKind::slice: {
      auto slice = std::make_shared<SliceObject>();
      if (expr.a) slice->lower = eval(*expr.a, scope);
      if (expr.b) slice->upper = eval(*expr.b, scope);
      if (expr.c) slice->step = eval(*expr.c, scope);
      return Value(slice);
    }

    case ast::ExprKind::lambda:
      return make_function("<lambda>", expr.params, nullptr, expr.a.get(), scope);
  }
  return Value();
}

Value Interpreter::eval_name(const ast::Expr& expr, const std::shared_ptr<Scope>& scope) {
  if (is_dunder(expr.name)) check_attribute(expr.name, expr.line);
  if (const Value* found = scope->lookup(expr.name)) return *found;
  throw ScriptError("NameError", "name '" + expr.name + "' is not defined", expr.line);
}

Value Interpreter::eval_call(const ast::Expr& expr, const std::shared_ptr<Scope>& scope) {
  const Value callee = eval(*expr.a, scope);
  CallArgs args;
  args.positional.reserve(expr.items.size());
  for (const auto& item : expr.items) args.positional.push_back(eval(*item, scope));
  for (const auto& keyword : expr.keywords) {
    for (const auto& existing : args.keywords) {
      if (existing.first == keyword.name) throw_type_error("keyword argument repeated: " + keyword.name);
    }
    args.keywords.emplace_back(keyword.name, eval(*keyword.value, scope));
  }
  return call(callee, args, expr.line);
}

Value Interpreter::eval_compare(const ast::Expr& expr, const std::shared_ptr<Scope>& scope) {
  Value left = eval(*expr.a, scope);
  Value result(true);
  for (std::size_t i = 0; i < expr.ops.size(); ++i) {
    Value right = eval(*expr.items[i], scope);
    result = compare_op(expr.ops[i], left, right);
    // Chains stop at the first false link; a tabular mask is returned as is.
    if (expr.ops.size() == 1 || !truthy(result)) return result;
    left = std::move(right);
  }
  return result;
}

Value Interpreter::eval_fstring(const ast::Expr& expr, const std::shared_ptr<Scope>& scope) {
  std::string out;
  for (const auto& part : expr.parts) {
    if (!part.expr) {
      out += part.literal;
      continue;
    }
    Value value = eval(*part.expr, scope);
    if (part.conversion == 'r' || part.conversion == 'a') {
      value = Value(repr(value));
    } else if (part.conversion == 's') {
      value = Value(str(value));
    }
    out += format_value(value, part.format_spec);
    check_size(out.size(), "str");
  }
  return Value(std::move(out));
}

Value Interpreter::eval_comprehension(const ast::Expr& expr, const std::shared_ptr<Scope>& scope) {
  // Comprehension variables live in their own scope.
  auto inner = new_scope(scope);
  if (expr.kind == ast::ExprKind::dict_comp) {
    auto dict = new_dict();
    run_generators(expr, 0, inner, [&] {
      Value key = eval(*expr.a, inner);
      dict->set(key, eval(*expr.b, inner));
      check_size(dict->size(), "dict");
    });
    return Value(dict);
  }
  auto list = new_list();
  run_generators(expr, 0, inner, [&] {
    list->items.push_back(eval(*expr.a, inner));
    if (list->items.size() % kPollInterval == 0) check_size(list->items.size(), "list");
  });
  return Value(list);
}

void Interpreter::run_generators(const ast::Expr& expr, std::size_t level, const std::shared_ptr<Scope>& scope,
                                 const std::function<void()>& emit) {
  if (level == expr.generators.size()) {
    emit();
    return;
  }
  const ast::Comprehension& gen = expr.generators[level];
  const Value iterable = eval(*gen.iter, scope);
  for_each(iterable, [&](const Value& item) {
    assign(*gen.target, item, scope);
    for (const auto& condition : gen.conditions) {
      if (!truthy(eval(*condition, scope))) return true;
    }
    run_generators(expr, level + 1, scope, emit);
    return true;
  });
}

Value Interpreter::make_function(const std::string& name, const std::vector<ast::Param>& params,
                                 const ast::Block* body, const ast::Expr* expression,
                                 const std::shared_ptr<Scope>& scope) {
  auto fn = std::make_shared<FunctionObject>();
  fn->name = name;
  fn->params = &params;
  fn->body = body;
  fn->expression = expression;
  fn->closure = scope;
  fn->module = module_;
  fn->defaults.reserve(params.size());
  for (const auto& param : params) {
    fn->defaults.push_back(param.default_value ? eval(*param.default_value, scope) : Value());
  }
  track(fn);
  return Value(fn);
}

Value Interpreter::call_function(const FunctionObject& fn, CallArgs& args) {
  if (call_depth_ >= env_.limits.max_call_depth) {
    throw ResourceLimitExceeded("maximum recursion depth exceeded (" + std::to_string(env_.limits.max_call_depth) +
                                    ")",
                                current_line_);
  }
  ++call_depth_;
  DepthGuard guard{call_depth_};

  const auto& params = *fn.params;
  if (args.positional.size() > params.size()) {
    throw_type_error(fn.name + "() takes " + std::to_string(params.size()) + " positional arguments but " +
                     std::to_string(args.positional.size()) + " were given");
  }
  auto local = new_scope(fn.closure);
  std::vector<bool> bound(params.size(), false);
  for (std::size_t i = 0; i < args.positional.size(); ++i) {
    local->vars[params[i].name] = std::move(args.positional[i]);
    bound[i] = true;
  }
  for (auto& [name, value] : args.keywords) {
    auto it = std::find_if(params.begin(), params.end(), [&](const ast::Param& p) { return p.name == name; });
    if (it == params.end()) throw_type_error(fn.name + "() got an unexpected keyword argument '" + name + "'");
    const auto i = static_cast<std::size_t>(it - params.begin());
    if (bound[i]) throw_type_error(fn.name + "() got multiple values for argument '" + name + "'");
    local->vars[name] = std::move(value);
    bound[i] = true;
  }
  for (std::size_t i = 0; i < params.size(); ++i) {
    if (bound[i]) continue;
    if (!params[i].default_value) {
      throw_type_error(fn.name + "() missing required argument: '" + params[i].name + "'");
    }
    local->vars[params[i].name] = fn.defaults[i];
  }

  if (fn.expression) return eval(*fn.expression, local);
  if (exec_block(*fn.body, local) == Flow::return_value) {
    Value result = std::move(return_value_);
    return_value_ = Value();
    return result;
  }
  return Value();
}

void Interpreter::assign(const ast::Expr& target, const Value& value, const std::shared_ptr<Scope>& scope) {
  switch (target.kind) {
    case ast::ExprKind::name:
      if (is_dunder(target.name)) check_attribute(target.name, target.line);
      scope->vars[target.name] = value;
      return;

    case ast::ExprKind::tuple:
    case ast::ExprKind::list: {
      const std::vector<Value> values = to_vector(value);
      if (values.size() < target.items.size()) {
        throw_value_error("not enough values to unpack (expected " + std::to_string(target.items.size()) + ", got " +
                          std::to_string(values.size()) + ")");
      }
      if (values.size() > target.items.size()) {
        throw_value_error("too many values to unpack (expected " + std::to_string(target.items.size()) + ")");
      }
      for (std::size_t i = 0; i < values.size(); ++i) assign(*target.items[i], values[i], scope);
      return;
    }

    case ast::ExprKind::subscript: {
      const Value object = eval(*target.a, scope);
      set_item(object, eval(*target.b, scope), value);
      return;
    }

    case ast::ExprKind::attribute: {
      check_attribute(target.name, target.line);
      const Value object = eval(*target.a, scope);
      throw ScriptError("AttributeError",
                        "'" + type_name(object) + "' object attribute '" + target.name + "' is read-only",
                        target.line);
    }

    default:
      throw ScriptError("SyntaxError", "cannot assign to expression", target.line);
  }
}

}  // namespace cordon
