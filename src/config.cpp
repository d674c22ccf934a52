#include "cordon/config.hpp"

#include <cstdlib>

#include "cordon/jsonlite.hpp"

namespace cordon {

namespace {

// Parses a non-negative decimal; nullopt on junk or overflow.
std::optional<std::uint64_t> parse_u64(const char* text) {
  if (!text || !text[0]) return std::nullopt;
  std::uint64_t out = 0;
  for (const char* p = text; *p; ++p) {
    if (*p < '0' || *p > '9') return std::nullopt;
    const std::uint64_t digit = static_cast<std::uint64_t>(*p - '0');
    if (out > (UINT64_MAX - digit) / 10) return std::nullopt;
    out = out * 10 + digit;
  }
  return out;
}

void read_u64(const char* name, std::uint64_t* field, std::vector<std::string>* problems) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return;
  if (auto v = parse_u64(e)) {
    *field = *v;
  } else if (problems) {
    problems->push_back(std::string(name) + ": expected a non-negative integer, got '" + e + "'");
  }
}

bool env_flag(const char* name, bool fallback) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return fallback;
  return std::string(e) == "1" || std::string(e) == "true";
}

}  // namespace

std::string to_string(IsolationMode mode) { return mode == IsolationMode::process ? "process" : "thread"; }

std::optional<IsolationMode> parse_isolation_mode(const std::string& text) {
  if (text == "thread") return IsolationMode::thread;
  if (text == "process") return IsolationMode::process;
  return std::nullopt;
}

EngineConfig EngineConfig::from_env(std::vector<std::string>* problems) {
  EngineConfig config;
  read_u64("CORDON_TIMEOUT_MS", &config.default_timeout_ms, problems);
  read_u64("CORDON_MAX_MEMORY_BYTES", &config.max_memory_bytes, problems);

  std::uint64_t output = config.limits.max_output_bytes;
  read_u64("CORDON_MAX_OUTPUT_BYTES", &output, problems);
  config.limits.max_output_bytes = static_cast<std::size_t>(output);

  std::uint64_t depth = static_cast<std::uint64_t>(config.limits.max_call_depth);
  read_u64("CORDON_MAX_CALL_DEPTH", &depth, problems);
  if (depth <= 10'000) {
    config.limits.max_call_depth = static_cast<int>(depth);
  } else if (problems) {
    problems->push_back("CORDON_MAX_CALL_DEPTH: must be at most 10000");
  }

  if (const char* e = std::getenv("CORDON_ISOLATION"); e && e[0]) {
    if (auto mode = parse_isolation_mode(e)) {
      config.isolation = *mode;
    } else if (problems) {
      problems->push_back(std::string("CORDON_ISOLATION: expected 'thread' or 'process', got '") + e + "'");
    }
  }
  if (const char* e = std::getenv("CORDON_ALLOWLIST"); e && e[0]) config.allow_list_path = e;

  config.require_result_assignment = env_flag("CORDON_REQUIRE_RESULT", config.require_result_assignment);
  config.bind_df_alias = env_flag("CORDON_BIND_DF_ALIAS", config.bind_df_alias);
  return config;
}

std::vector<std::string> validate_config(const EngineConfig& config) {
  std::vector<std::string> errors;
  if (config.default_timeout_ms == 0) errors.push_back("default_timeout_ms must be > 0");
  if (config.limits.max_call_depth <= 0) errors.push_back("max_call_depth must be > 0");
  if (config.limits.max_collection_size == 0) errors.push_back("max_collection_size must be > 0");
  if (config.limits.max_parse_depth <= 0) errors.push_back("max_parse_depth must be > 0");
  if (config.dataset_binding.empty()) errors.push_back("dataset_binding must not be empty");
  if (config.bind_df_alias && config.dataset_binding == "df") {
    errors.push_back("dataset_binding 'df' collides with the df alias");
  }
  if (config.isolation == IsolationMode::process && config.max_memory_bytes != 0 &&
      config.max_memory_bytes < 64ull * 1024 * 1024) {
    errors.push_back("max_memory_bytes below 64 MiB leaves the worker unable to start");
  }
  return errors;
}

std::string config_to_json(const EngineConfig& config) {
  jsonlite::Object o;
  o["default_timeout_ms"] = static_cast<std::int64_t>(config.default_timeout_ms);
  o["isolation"] = to_string(config.isolation);
  o["max_memory_bytes"] = static_cast<std::int64_t>(config.max_memory_bytes);
  o["max_file_descriptors"] = static_cast<std::int64_t>(config.max_file_descriptors);
  o["enforce_network_isolation"] = config.enforce_network_isolation;
  o["max_call_depth"] = config.limits.max_call_depth;
  o["max_collection_size"] = static_cast<std::int64_t>(config.limits.max_collection_size);
  o["max_output_bytes"] = static_cast<std::int64_t>(config.limits.max_output_bytes);
  o["max_parse_depth"] = config.limits.max_parse_depth;
  o["require_result_assignment"] = config.require_result_assignment;
  o["dataset_binding"] = config.dataset_binding;
  o["bind_df_alias"] = config.bind_df_alias;
  o["allow_list_path"] = config.allow_list_path;
  return jsonlite::to_json(o);
}

}  // namespace cordon
