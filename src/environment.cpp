#include "cordon/environment.hpp"

#include "cordon/library.hpp"

namespace cordon {

ResolveResult AllowListResolver::resolve(const std::string& dotted_name) {
  ResolveResult result;
  // The validator checked the same prefixes statically; this is the check
  // that holds even when validation is bypassed or the list differs.
  const std::string blocked = list_->first_blocked_prefix(dotted_name);
  if (!blocked.empty()) {
    result.status = ResolveResult::Status::blocked;
    result.detail = blocked;
    return result;
  }
  auto it = loaded_.find(dotted_name);
  if (it == loaded_.end()) {
    auto module = instantiate_module(dotted_name);
    if (!module) {
      result.status = ResolveResult::Status::not_found;
      result.detail = dotted_name;
      return result;
    }
    it = loaded_.emplace(dotted_name, std::move(module)).first;
  }
  result.status = ResolveResult::Status::ok;
  result.module = it->second;
  return result;
}

ExecutionEnvironment build_environment(std::shared_ptr<const AllowList> list, const InterpreterLimits& limits,
                                       std::shared_ptr<ModuleResolver> resolver) {
  if (!list) list = global_allow_list();

  ExecutionEnvironment env;
  env.allow_list = list;
  env.limits = limits;
  env.builtins = std::make_shared<Scope>();
  // Default deny: a catalogue entry is bound only when the list names it.
  for (const auto& [name, value] : builtin_catalogue()) {
    if (list->builtins.count(name) != 0 && !list->is_blocked_call(name)) env.builtins->vars.emplace(name, value);
  }
  env.resolver = resolver ? std::move(resolver) : std::make_shared<AllowListResolver>(list);
  return env;
}

}  // namespace cordon
