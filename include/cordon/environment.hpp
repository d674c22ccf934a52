#pragma once

// cordon/environment.hpp: Capability Restrictor.
//
// build_environment() produces the only capabilities a candidate program
// gets: a builtin scope holding exactly the allow-listed builtins, and a
// ModuleResolver through which every import statement is routed. The
// environment is created fresh per execution and never shared, so nothing a
// program does to its modules or builtins is visible to the next one.
//
// EXTENSION_POINT: module_resolution
//   Hosts with their own module catalogue implement ModuleResolver and pass
//   it to build_environment(). The interpreter has no other import path.

#include <cstddef>
#include <map>
#include <memory>
#include <string>

#include "cordon/allow_list.hpp"
#include "cordon/parser.hpp"
#include "cordon/value.hpp"

namespace cordon {

struct InterpreterLimits {
  int max_call_depth{64};
  // Elements in one list/dict/table, characters in one string.
  std::size_t max_collection_size{10'000'000};
  std::size_t max_output_bytes{64 * 1024};
  int max_parse_depth{kDefaultMaxParseDepth};
};

struct ResolveResult {
  enum class Status { ok, blocked, not_found };

  Status status{Status::not_found};
  std::shared_ptr<ModuleObject> module;
  // blocked: the first non-permitted prefix of the requested name.
  std::string detail;
};

class ModuleResolver {
 public:
  virtual ~ModuleResolver() = default;
  virtual ResolveResult resolve(const std::string& dotted_name) = 0;
};

// Re-checks every prefix against the allow-list, then instantiates the
// module from the catalogue. Each module is built once per resolver.
class AllowListResolver final : public ModuleResolver {
 public:
  explicit AllowListResolver(std::shared_ptr<const AllowList> list) : list_(std::move(list)) {}

  ResolveResult resolve(const std::string& dotted_name) override;

 private:
  std::shared_ptr<const AllowList> list_;
  std::map<std::string, std::shared_ptr<ModuleObject>> loaded_;
};

struct ExecutionEnvironment {
  std::shared_ptr<const AllowList> allow_list;
  std::shared_ptr<Scope> builtins;
  std::shared_ptr<ModuleResolver> resolver;
  InterpreterLimits limits;
};

/**
 * @brief Builds a fresh restricted environment.
 * @param resolver Optional replacement resolver; defaults to an
 *        AllowListResolver over `list`.
 */
ExecutionEnvironment build_environment(std::shared_ptr<const AllowList> list, const InterpreterLimits& limits = {},
                                       std::shared_ptr<ModuleResolver> resolver = nullptr);

}  // namespace cordon
