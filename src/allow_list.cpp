#include "cordon/allow_list.hpp"

#include <fstream>
#include <mutex>
#include <sstream>

#include "cordon/library.hpp"

namespace cordon {

namespace {

// File, process, code-evaluation, dynamic-import, environment and
// introspection entry points. None of them is implemented by the runtime
// library; listing them makes the validator reject the attempt outright.
const std::set<std::string>& default_blocked_calls() {
  static const std::set<std::string> kCalls = {
      "open",    "exec",     "eval",     "compile", "__import__", "import_module", "input",
      "breakpoint", "exit",  "quit",     "globals", "locals",     "getattr",       "setattr",
      "delattr", "vars",     "dir",      "memoryview", "bytearray", "getenv",      "system",
      "popen",   "spawn",    "fork",     "execv",   "execve",     "unlink",
      "rmdir",   "chdir",    "read_csv", "read_pickle", "to_pickle", "to_csv",     "load",
      "loads",   "dump",     "help",     "id",      "hash",       "object",        "super",
      "classmethod", "staticmethod", "property", "callable", "iter", "next",      "hasattr",
  };
  return kCalls;
}

const std::set<std::string>& default_blocked_attributes() {
  static const std::set<std::string> kAttributes = {
      "eval",       "query",     "system",    "popen",     "environ",  "to_csv",   "to_pickle",
      "to_parquet", "to_excel",  "to_sql",    "read_csv",  "f_globals", "f_locals", "f_back",
      "gi_frame",   "gi_code",   "co_code",   "func_globals", "mro",  "modules",  "builtins",
  };
  return kAttributes;
}

std::mutex g_allow_list_mu;
std::shared_ptr<const AllowList> g_allow_list;

bool read_string_set(const jsonlite::Value& value, std::set<std::string>* out) {
  if (!value.is_array()) return false;
  std::set<std::string> names;
  for (const auto& item : std::get<jsonlite::Array>(value.v)) {
    if (!item.is_string()) return false;
    names.insert(std::get<std::string>(item.v));
  }
  *out = std::move(names);
  return true;
}

jsonlite::Value to_array(const std::set<std::string>& names) {
  jsonlite::Array out;
  for (const auto& name : names) out.emplace_back(name);
  return out;
}

}  // namespace

AllowList AllowList::defaults() {
  AllowList list;
  list.modules = module_names();
  list.builtins = builtin_names();
  list.blocked_calls = default_blocked_calls();
  list.blocked_attributes = default_blocked_attributes();
  list.block_dunder_attributes = true;
  return list;
}

std::string AllowList::first_blocked_prefix(const std::string& dotted) const {
  if (dotted.empty()) return dotted;
  std::size_t pos = 0;
  while (true) {
    const std::size_t dot = dotted.find('.', pos);
    const std::string prefix = dotted.substr(0, dot);
    if (modules.count(prefix) == 0) return prefix;
    if (dot == std::string::npos) return "";
    pos = dot + 1;
  }
}

bool AllowList::is_blocked_attribute(const std::string& name) const {
  if (block_dunder_attributes && is_dunder(name)) return true;
  return blocked_attributes.count(name) != 0;
}

bool is_dunder(const std::string& name) {
  return name.size() > 4 && name.compare(0, 2, "__") == 0 && name.compare(name.size() - 2, 2, "__") == 0;
}

std::optional<AllowList> allow_list_from_json(const std::string& text, std::optional<jsonlite::JsonError>* error) {
  std::optional<jsonlite::JsonError> parse_error;
  const jsonlite::Object doc = jsonlite::parse(text, &parse_error);
  if (parse_error) {
    if (error) *error = parse_error;
    return std::nullopt;
  }
  auto fail = [&](const std::string& message) -> std::optional<AllowList> {
    if (error) *error = jsonlite::JsonError{"allowlist_invalid", message};
    return std::nullopt;
  };

  AllowList list = AllowList::defaults();
  for (const auto& [key, value] : doc) {
    if (key == "modules") {
      if (!read_string_set(value, &list.modules)) return fail("modules must be an array of strings");
    } else if (key == "builtins") {
      if (!read_string_set(value, &list.builtins)) return fail("builtins must be an array of strings");
    } else if (key == "blocked_calls") {
      if (!read_string_set(value, &list.blocked_calls)) return fail("blocked_calls must be an array of strings");
    } else if (key == "blocked_attributes") {
      if (!read_string_set(value, &list.blocked_attributes)) {
        return fail("blocked_attributes must be an array of strings");
      }
    } else if (key == "block_dunder_attributes") {
      if (!std::holds_alternative<bool>(value.v)) return fail("block_dunder_attributes must be a boolean");
      list.block_dunder_attributes = std::get<bool>(value.v);
    } else {
      return fail("unknown key: " + key);
    }
  }
  return list;
}

std::optional<AllowList> load_allow_list_file(const std::string& path, std::optional<jsonlite::JsonError>* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (error) *error = jsonlite::JsonError{"allowlist_unreadable", "cannot read " + path};
    return std::nullopt;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return allow_list_from_json(buf.str(), error);
}

std::string allow_list_to_json(const AllowList& list) {
  jsonlite::Object doc;
  doc["modules"] = to_array(list.modules);
  doc["builtins"] = to_array(list.builtins);
  doc["blocked_calls"] = to_array(list.blocked_calls);
  doc["blocked_attributes"] = to_array(list.blocked_attributes);
  doc["block_dunder_attributes"] = list.block_dunder_attributes;
  return jsonlite::to_json(doc);
}

AllowListLint check_allow_list(const AllowList& list) {
  AllowListLint result;
  auto error = [&](const std::string& message) {
    result.valid = false;
    result.errors.push_back(message);
  };

  if (list.modules.empty()) error("module list is empty");

  const auto& implemented_modules = module_names();
  for (const auto& name : list.modules) {
    // Dotted entries only widen what a dotted import may name; the top-level
    // module must still exist.
    const std::string head = name.substr(0, name.find('.'));
    if (implemented_modules.count(head) == 0) error("module '" + name + "' has no implementation");
    if (list.blocked_calls.count(name) != 0) error("module '" + name + "' is both permitted and blocked");
  }

  const auto& implemented_builtins = builtin_names();
  for (const auto& name : list.builtins) {
    if (implemented_builtins.count(name) == 0) error("builtin '" + name + "' has no implementation");
    if (list.blocked_calls.count(name) != 0) error("builtin '" + name + "' is both permitted and blocked");
    if (list.is_blocked_attribute(name)) error("builtin '" + name + "' is a blocked name");
  }

  if (!list.block_dunder_attributes) result.warnings.push_back("dunder attribute blocking is disabled");
  if (list.blocked_calls.empty()) result.warnings.push_back("blocked call list is empty");
  return result;
}

void init_allow_list(std::shared_ptr<const AllowList> list) {
  std::lock_guard<std::mutex> lk(g_allow_list_mu);
  if (!g_allow_list) g_allow_list = std::move(list);
}

std::shared_ptr<const AllowList> global_allow_list() {
  std::lock_guard<std::mutex> lk(g_allow_list_mu);
  if (!g_allow_list) g_allow_list = std::make_shared<const AllowList>(AllowList::defaults());
  return g_allow_list;
}

}  // namespace cordon
