#pragma once

// cordon/value.hpp: Runtime values of the analysis script.
//
// A Value is a small variant: None, bool, int, float, str, or a shared
// heap Object. Everything a script can touch is one of these; there is no
// reflective path from a Value to host memory, host functions or host types
// beyond what an Object explicitly exposes through attribute().
//
// MEMORY OWNERSHIP:
//   Objects are reference counted (shared_ptr). Containers and scopes may
//   form cycles; the interpreter tracks them and calls release_references()
//   at teardown so an execution never leaks its heap.
//
// ERRORS:
//   ScriptError is the only exception a script can observe (try/except).
//   ExecutionCancelled, ResourceLimitExceeded and CapabilityViolation are
//   never catchable by script code and always end the execution.

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "cordon/ast.hpp"
#include "cordon/jsonlite.hpp"

namespace cordon {

class Interpreter;
class Object;
using ObjectPtr = std::shared_ptr<Object>;

struct Value {
  std::variant<std::monostate, bool, std::int64_t, double, std::string, ObjectPtr> v;

  Value() = default;
  Value(bool b) : v(b) {}
  Value(int i) : v(static_cast<std::int64_t>(i)) {}
  Value(std::int64_t i) : v(i) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(ObjectPtr o) : v(std::move(o)) {}
  template <typename T, typename = std::enable_if_t<std::is_base_of_v<Object, T>>>
  Value(std::shared_ptr<T> o) : v(ObjectPtr(std::move(o))) {}

  bool is_none() const { return std::holds_alternative<std::monostate>(v); }
  bool is_bool() const { return std::holds_alternative<bool>(v); }
  bool is_int() const { return std::holds_alternative<std::int64_t>(v); }
  bool is_float() const { return std::holds_alternative<double>(v); }
  bool is_str() const { return std::holds_alternative<std::string>(v); }
  bool is_object() const { return std::holds_alternative<ObjectPtr>(v); }
  // bool, int or float
  bool is_number() const { return is_bool() || is_int() || is_float(); }

  bool as_bool() const { return std::get<bool>(v); }
  std::int64_t as_int() const { return std::get<std::int64_t>(v); }
  double as_float() const { return std::get<double>(v); }
  const std::string& as_str() const { return std::get<std::string>(v); }
  const ObjectPtr& as_object() const { return std::get<ObjectPtr>(v); }

  // Typed view of an object value, or null when the value is something else.
  template <typename T>
  std::shared_ptr<T> as() const {
    if (!is_object()) return nullptr;
    return std::dynamic_pointer_cast<T>(as_object());
  }
};

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

class ScriptError : public std::runtime_error {
 public:
  ScriptError(std::string type_name, const std::string& message, int line = 0)
      : std::runtime_error(type_name + ": " + message),
        type_name_(std::move(type_name)),
        message_(message),
        line_(line) {}

  const std::string& type_name() const noexcept { return type_name_; }
  const std::string& message() const noexcept { return message_; }
  int line() const noexcept { return line_; }
  void set_line(int line) noexcept { line_ = line; }

  // "ValueError: bad input (line 4)"
  std::string describe() const;

 private:
  std::string type_name_;
  std::string message_;
  int line_;
};

// Raised when the timeout flag or the caller's CancellationToken is set.
class ExecutionCancelled : public std::runtime_error {
 public:
  explicit ExecutionCancelled(bool by_caller)
      : std::runtime_error(by_caller ? "cancelled" : "timed out"), by_caller_(by_caller) {}
  bool by_caller() const noexcept { return by_caller_; }

 private:
  bool by_caller_;
};

class ResourceLimitExceeded : public std::runtime_error {
 public:
  ResourceLimitExceeded(const std::string& message, int line = 0)
      : std::runtime_error(message), line_(line) {}
  int line() const noexcept { return line_; }
  void set_line(int line) noexcept { line_ = line; }

 private:
  int line_;
};

// Blocked import or attribute caught by the runtime gate.
class CapabilityViolation : public std::runtime_error {
 public:
  enum class Kind { import_blocked, attribute_blocked };

  CapabilityViolation(Kind kind, std::string detail, int line = 0)
      : std::runtime_error(detail), kind_(kind), detail_(std::move(detail)), line_(line) {}

  Kind kind() const noexcept { return kind_; }
  const std::string& detail() const noexcept { return detail_; }
  int line() const noexcept { return line_; }
  void set_line(int line) noexcept { line_ = line; }

  // "ImportBlocked: os (line 1)"
  std::string describe() const;

 private:
  Kind kind_;
  std::string detail_;
  int line_;
};

[[noreturn]] void throw_type_error(const std::string& message);
[[noreturn]] void throw_value_error(const std::string& message);

// ---------------------------------------------------------------------------
// Calls
// ---------------------------------------------------------------------------

struct CallArgs {
  std::vector<Value> positional;
  std::vector<std::pair<std::string, Value>> keywords;
};

// Binds a native call's arguments against a fixed parameter list, the way a
// script-level def would: positional first, then keywords by name. Unknown
// keywords, duplicates and missing required parameters are TypeErrors.
class ArgBinder {
 public:
  ArgBinder(const std::string& function, const CallArgs& args, std::initializer_list<const char*> params,
            std::size_t required = 0);

  bool has(std::size_t index) const { return index < bound_.size() && bound_[index] != nullptr; }
  const Value& get(std::size_t index) const;
  Value get_or(std::size_t index, Value fallback) const;

 private:
  std::string function_;
  std::vector<std::string> names_;
  std::vector<const Value*> bound_;
};

using NativeFn = std::function<Value(Interpreter&, CallArgs&)>;

// ---------------------------------------------------------------------------
// Objects
// ---------------------------------------------------------------------------

class Object {
 public:
  virtual ~Object() = default;

  virtual std::string type_name() const = 0;
  virtual std::string repr(int depth) const;
  virtual bool truthy() const { return true; }

  // Script-visible attributes. Returning nullopt produces an AttributeError.
  // The interpreter applies the blocked-attribute gate before calling this.
  virtual std::optional<Value> attribute(Interpreter& interp, const std::shared_ptr<Object>& self,
                                         const std::string& name);

  // JSON rendering for artifacts and figure specs; nullopt when the object
  // has none (to_json_value() then raises TypeError).
  virtual std::optional<jsonlite::Value> to_json(int depth) const;

  // Drops references to other objects; called once at interpreter teardown.
  virtual void release_references() {}

  // Moves the values this object holds onto the worklist of
  // release_nested(), leaving the object empty.
  virtual void move_children(std::vector<Value>&) {}
};

// Destroys `values` iteratively. Containers whose last reference is in the
// worklist hand over their children before they die, so dropping a chain
// like [[[...]]] uses constant stack depth.
void release_nested(std::vector<Value> values);

class ListObject : public Object {
 public:
  ListObject() = default;
  explicit ListObject(std::vector<Value> values) : items(std::move(values)) {}
  ~ListObject() override { release_nested(std::move(items)); }

  std::string type_name() const override { return "list"; }
  std::string repr(int depth) const override;
  bool truthy() const override { return !items.empty(); }
  std::optional<Value> attribute(Interpreter& interp, const ObjectPtr& self, const std::string& name) override;
  void release_references() override { items.clear(); }
  void move_children(std::vector<Value>& out) override;

  std::vector<Value> items;
};

class TupleObject : public Object {
 public:
  TupleObject() = default;
  explicit TupleObject(std::vector<Value> values) : items(std::move(values)) {}
  ~TupleObject() override { release_nested(std::move(items)); }

  std::string type_name() const override { return "tuple"; }
  std::string repr(int depth) const override;
  bool truthy() const override { return !items.empty(); }
  std::optional<Value> attribute(Interpreter& interp, const ObjectPtr& self, const std::string& name) override;
  void release_references() override { items.clear(); }
  void move_children(std::vector<Value>& out) override;

  std::vector<Value> items;
};

// Insertion-ordered dict. Keys must be hashable: None, bool, int, float, str
// or tuples of those. 1, 1.0 and True are the same key.
class DictObject : public Object {
 public:
  ~DictObject() override;

  std::string type_name() const override { return "dict"; }
  std::string repr(int depth) const override;
  bool truthy() const override { return !entries_.empty(); }
  std::optional<Value> attribute(Interpreter& interp, const ObjectPtr& self, const std::string& name) override;
  void release_references() override {
    entries_.clear();
    index_.clear();
  }
  void move_children(std::vector<Value>& out) override;

  const Value* find(const Value& key) const;
  void set(const Value& key, Value value);
  bool erase(const Value& key);
  void clear() { release_references(); }
  std::size_t size() const { return entries_.size(); }
  const std::vector<std::pair<Value, Value>>& entries() const { return entries_; }

 private:
  std::vector<std::pair<Value, Value>> entries_;
  std::unordered_map<std::string, std::size_t> index_;
};

// Result of evaluating a[lower:upper:step]. Bounds are None, int, or (for
// label-based tables) anything else; resolve() applies the usual clamping.
class SliceObject : public Object {
 public:
  std::string type_name() const override { return "slice"; }
  std::string repr(int depth) const override;

  // Indices selected in a sequence of length n.
  std::vector<std::int64_t> resolve(std::int64_t n) const;

  Value lower;
  Value upper;
  Value step;
};

class RangeObject : public Object {
 public:
  RangeObject(std::int64_t start, std::int64_t stop, std::int64_t step) : start(start), stop(stop), step(step) {}

  std::string type_name() const override { return "range"; }
  std::string repr(int depth) const override;
  bool truthy() const override { return size() > 0; }

  std::int64_t size() const;
  std::int64_t at(std::int64_t i) const { return start + i * step; }

  std::int64_t start;
  std::int64_t stop;
  std::int64_t step;
};

struct Scope {
  std::unordered_map<std::string, Value> vars;
  std::shared_ptr<Scope> parent;

  const Value* lookup(const std::string& name) const;
};

class FunctionObject : public Object {
 public:
  std::string type_name() const override { return "function"; }
  std::string repr(int depth) const override;
  void release_references() override {
    defaults.clear();
    closure.reset();
  }

  std::string name;
  const std::vector<ast::Param>* params{nullptr};
  const ast::Block* body{nullptr};        // def
  const ast::Expr* expression{nullptr};   // lambda
  std::vector<Value> defaults;            // one per param, none for required ones
  std::shared_ptr<Scope> closure;
  std::shared_ptr<const ast::Module> module;  // keeps the nodes above alive
};

class NativeFunction : public Object {
 public:
  NativeFunction(std::string name, NativeFn fn) : name(std::move(name)), fn(std::move(fn)) {}

  std::string type_name() const override { return "builtin_function_or_method"; }
  std::string repr(int depth) const override;

  std::string name;
  NativeFn fn;
};

class ModuleObject : public Object {
 public:
  explicit ModuleObject(std::string name) : name(std::move(name)) {}

  std::string type_name() const override { return "module"; }
  std::string repr(int depth) const override;
  std::optional<Value> attribute(Interpreter& interp, const ObjectPtr& self, const std::string& name) override;

  std::string name;
  std::map<std::string, Value> attrs;
};

// Builtin exception class, usable in except clauses and callable to build
// a raisable ExceptionObject.
class ExceptionTypeObject : public Object {
 public:
  explicit ExceptionTypeObject(std::string name) : name(std::move(name)) {}

  std::string type_name() const override { return "type"; }
  std::string repr(int depth) const override;

  std::string name;
};

class ExceptionObject : public Object {
 public:
  ExceptionObject(std::string type, std::string message) : type(std::move(type)), message(std::move(message)) {}

  std::string type_name() const override { return type; }
  std::string repr(int depth) const override;
  std::optional<Value> attribute(Interpreter& interp, const ObjectPtr& self, const std::string& name) override;

  std::string type;
  std::string message;
};

// True when an error of type `raised` is caught by `except handler`.
bool exception_matches(const std::string& raised, const std::string& handler);

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

ObjectPtr make_native(std::string name, NativeFn fn);
// Lists and dicts are created through Interpreter::new_list()/new_dict() so
// teardown can find them; tuples cannot form cycles on their own.
ObjectPtr make_tuple(std::vector<Value> items);

std::string type_name(const Value& value);
bool truthy(const Value& value);
std::string repr(const Value& value, int depth = 0);
std::string str(const Value& value);

// Shortest round-trip rendering: 2.0 -> "2.0", 0.1 -> "0.1", 1e16 -> "1e+16".
std::string format_float(double d);

bool values_equal(const Value& a, const Value& b, int depth = 0);
// Total order used by sorted()/min()/max() and the < operator. TypeError
// for values of incomparable types.
bool less_than(const Value& a, const Value& b);

double to_double(const Value& value, const std::string& context);
std::int64_t to_int(const Value& value, const std::string& context);

// Format-spec mini-language shared by f-strings, str.format and format():
// [[fill]align][sign][,][0][width][.precision][type], type in "dfegs%x".
std::string format_value(const Value& value, const std::string& spec);

// Canonical key for dict storage; throws TypeError for unhashable values.
std::string hash_key(const Value& value, int depth = 0);

// Conversions between script values and JSON value trees (artifacts,
// figure specs, chart options).
jsonlite::Value to_json_value(const Value& value, int depth = 0);
Value from_json_value(Interpreter& interp, const jsonlite::Value& value);

}  // namespace cordon
