#pragma once

// cordon/library.hpp: The runtime library a restricted environment draws on.
//
// Two catalogues: builtin functions and importable modules. The catalogues
// list everything cordon implements; an environment binds only the subset
// its AllowList permits. Names that are blocked (open, eval, __import__ ...)
// have no implementation anywhere in the library, so no allow-list mistake
// can make them reachable.

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "cordon/value.hpp"

namespace cordon {

// A builtin type: callable as a constructor, usable with isinstance() and
// returned by type().
class TypeObject : public NativeFunction {
 public:
  TypeObject(std::string name, NativeFn fn) : NativeFunction(std::move(name), std::move(fn)) {}

  std::string type_name() const override { return "type"; }
  std::string repr(int) const override { return "<class '" + name + "'>"; }
};

// Every implemented builtin, keyed by name.
const std::map<std::string, Value>& builtin_catalogue();
const std::set<std::string>& builtin_names();

// Names of the modules instantiate_module() can build.
const std::set<std::string>& module_names();

// A fresh module instance, or null for an unknown name.
std::shared_ptr<ModuleObject> instantiate_module(const std::string& name);

// str methods ("a,b".split(",")); nullopt for unknown names.
std::optional<Value> string_attribute(Interpreter& interp, const std::string& self, const std::string& name);

// True when `value` is an instance of the builtin type or exception class
// `cls`.
bool is_instance(const Value& value, const Value& cls);

}  // namespace cordon
