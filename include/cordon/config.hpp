#pragma once

// cordon/config.hpp: Engine configuration.
//
// Compiled-in defaults, overridable from the environment:
//   CORDON_TIMEOUT_MS         default per-request timeout (ms, > 0)
//   CORDON_ISOLATION          "thread" (default) or "process"
//   CORDON_MAX_MEMORY_BYTES   RLIMIT_AS for process mode (0 = unlimited)
//   CORDON_MAX_OUTPUT_BYTES   captured print() output per execution
//   CORDON_MAX_CALL_DEPTH     script call-depth bound
//   CORDON_ALLOWLIST          path of an AllowList JSON file
//   CORDON_REQUIRE_RESULT=1   enable the MissingResultBinding check
//   CORDON_BIND_DF_ALIAS=0    do not bind `df` next to `dataset`
//
// Malformed values keep the default and are reported by from_env() so the
// CLI's doctor command can show them.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cordon/environment.hpp"

namespace cordon {

enum class IsolationMode { thread, process };

std::string to_string(IsolationMode mode);
std::optional<IsolationMode> parse_isolation_mode(const std::string& text);

struct EngineConfig {
  std::uint64_t default_timeout_ms{30000};
  IsolationMode isolation{IsolationMode::thread};

  // Process mode only.
  std::uint64_t max_memory_bytes{0};
  std::uint64_t max_file_descriptors{64};
  bool enforce_network_isolation{true};

  InterpreterLimits limits;

  bool require_result_assignment{false};
  std::string dataset_binding{"dataset"};
  bool bind_df_alias{true};

  std::string allow_list_path;

  /// @param problems When non-null, receives one message per malformed variable.
  static EngineConfig from_env(std::vector<std::string>* problems = nullptr);
};

/// @brief Structural checks; returns one message per problem (empty = valid).
std::vector<std::string> validate_config(const EngineConfig& config);

std::string config_to_json(const EngineConfig& config);

}  // namespace cordon
