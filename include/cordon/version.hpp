#pragma once

// cordon/version.hpp: Version manifest for every versioned surface.
//
// INVARIANT:
//   All constants are compile-time. A reader of a versioned format checks
//   the matching constant before trusting the data; mismatches fail fast.

#include <cstdint>
#include <string>

namespace cordon {
namespace version {

// Script grammar and runtime library. Bump when a program that parsed or
// ran before may now behave differently.
constexpr std::uint32_t LANGUAGE_VERSION = 1;

// outcome_to_json() / Artifact::to_json() layout.
constexpr std::uint32_t OUTCOME_SCHEMA_VERSION = 1;

// AllowList JSON file schema.
constexpr std::uint32_t ALLOWLIST_SCHEMA_VERSION = 1;

// Outcome document sent from a process-mode worker to its parent.
constexpr std::uint32_t WORKER_FRAME_VERSION = 1;

// 1 = BLAKE3, 32-byte output, lowercase hex.
constexpr std::uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  std::uint32_t language{LANGUAGE_VERSION};
  std::uint32_t outcome_schema{OUTCOME_SCHEMA_VERSION};
  std::uint32_t allowlist_schema{ALLOWLIST_SCHEMA_VERSION};
  std::uint32_t worker_frame{WORKER_FRAME_VERSION};
  std::uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
};

// Callers that persist outcomes pass the schema version they were built for.
CompatibilityResult check_compatibility(std::uint32_t outcome_schema_version = OUTCOME_SCHEMA_VERSION);

}  // namespace version
}  // namespace cordon
