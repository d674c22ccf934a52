#pragma once

// cordon/runtime.hpp: Engine entry point.
//
// execute() is the only blocking call and the only way in. Order:
//   1. request checks (attempt, timeout, dataset, result name)
//   2. canonicalize_request -> BLAKE3 -> request_digest
//   3. Static Validator; a rejection short-circuits, no environment is built
//   4. Capability Restrictor builds a fresh environment
//   5. Isolation Guard binds a dataset copy (on the worker)
//   6. Bounded Executor runs the program under the deadline
//   7. Isolation Guard captures the result binding (on the worker)
//   8. Result/Error Classifier
//   9. ExecutionEvent emission
//
// THREADING:
//   An Engine is immutable after construction; execute() may be called
//   concurrently from any number of threads. Each call owns its worker,
//   environment and dataset copy. Only the AllowList is shared.

#include <memory>
#include <string>
#include <vector>

#include "cordon/allow_list.hpp"
#include "cordon/config.hpp"
#include "cordon/types.hpp"
#include "cordon/validator.hpp"

namespace cordon {

class Engine {
 public:
  explicit Engine(EngineConfig config = {}, std::shared_ptr<const AllowList> allow_list = nullptr);

  ExecutionOutcome execute(const ExecutionRequest& request) const;

  // Validation only, with the engine's list and options.
  ValidationResult validate(const std::string& source, const std::string& result_name = "result") const;

  const EngineConfig& config() const { return config_; }
  const std::shared_ptr<const AllowList>& allow_list() const { return allow_list_; }

 private:
  ValidatorOptions validator_options(const std::string& result_name) const;

  EngineConfig config_;
  std::shared_ptr<const AllowList> allow_list_;
};

// Configuration and allow-list as loaded at startup.
struct EngineSetup {
  EngineConfig config;
  std::shared_ptr<const AllowList> allow_list;
  std::vector<std::string> errors;    // any error is fatal
  std::vector<std::string> warnings;

  bool ok() const { return errors.empty(); }
};

/**
 * @brief Reads EngineConfig::from_env(), loads CORDON_ALLOWLIST (or the
 *        compiled-in defaults) and lints both.
 */
EngineSetup load_engine_setup();

/**
 * @brief Process-wide engine built from load_engine_setup() on first use.
 *        Publishes its allow-list through init_allow_list().
 * @throws std::runtime_error on the first call when the setup has errors.
 */
const Engine& global_engine();

// Free entry point on the global engine.
ExecutionOutcome execute(const ExecutionRequest& request);

// Keeps [A-Za-z0-9_-], at most 128 characters.
std::string sanitize_request_id(const std::string& id);

}  // namespace cordon
