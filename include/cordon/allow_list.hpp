#pragma once

// cordon/allow_list.hpp: The process-wide capability allow-list.
//
// LIFECYCLE:
//   Built once at startup (compiled-in defaults, optionally replaced by a JSON
//   file), linted by check_allow_list(), then published through
//   init_allow_list(). From then on it is only ever read, through
//   std::shared_ptr<const AllowList>; no code path mutates a published list.
//
// SEMANTICS:
//   modules: importable module names. A dotted import is permitted only
//     when every prefix is listed.
//   builtins: builtin names bound into each execution's scope. Anything
//     not listed is simply absent.
//   blocked_calls: call targets rejected by the static validator.
//   blocked_attributes: attribute names rejected statically and at run time.
//   block_dunder_attributes: also reject every "__name__"-shaped identifier.

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "cordon/jsonlite.hpp"

namespace cordon {

struct AllowList {
  std::set<std::string> modules;
  std::set<std::string> builtins;
  std::set<std::string> blocked_calls;
  std::set<std::string> blocked_attributes;
  bool block_dunder_attributes{true};

  // Compiled-in configuration: the five analysis modules, the safe builtin
  // catalogue, and the enumerated dangerous calls.
  static AllowList defaults();

  bool permits_module(const std::string& dotted) const { return first_blocked_prefix(dotted).empty(); }
  // "a.b" for "a.b.c" when "a" is listed but "a.b" is not; empty when permitted.
  std::string first_blocked_prefix(const std::string& dotted) const;
  bool is_blocked_attribute(const std::string& name) const;
  bool is_blocked_call(const std::string& name) const { return blocked_calls.count(name) != 0; }
};

bool is_dunder(const std::string& name);

/**
 * @brief Parses the JSON allow-list schema:
 *        {"modules":[...],"builtins":[...],"blocked_calls":[...],
 *         "blocked_attributes":[...],"block_dunder_attributes":true}
 * @details Missing keys keep their compiled-in default. Unknown keys and
 *          mistyped values are errors.
 */
std::optional<AllowList> allow_list_from_json(const std::string& text, std::optional<jsonlite::JsonError>* error);
std::optional<AllowList> load_allow_list_file(const std::string& path, std::optional<jsonlite::JsonError>* error);
std::string allow_list_to_json(const AllowList& list);

struct AllowListLint {
  bool valid{true};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

/**
 * @brief Lints a configuration before it is published.
 * @details Errors: empty module list, a permitted module or builtin with no
 *          implementation, a name both permitted and blocked. Warnings:
 *          dunder blocking disabled, an empty blocked-call list.
 */
AllowListLint check_allow_list(const AllowList& list);

/// @brief Publishes the process-wide list. First call wins; later calls are no-ops.
void init_allow_list(std::shared_ptr<const AllowList> list);

/// @brief The published list, or the defaults when nothing was published.
std::shared_ptr<const AllowList> global_allow_list();

}  // namespace cordon
