#include "cordon/version.hpp"

#include <sstream>

#ifndef CORDON_VERSION_STRING
#define CORDON_VERSION_STRING "0.1.0"
#endif

namespace cordon {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver = CORDON_VERSION_STRING;
  m.hash_primitive = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"language\":" << m.language
    << ",\"outcome_schema\":" << m.outcome_schema
    << ",\"allowlist_schema\":" << m.allowlist_schema
    << ",\"worker_frame\":" << m.worker_frame
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_compatibility(std::uint32_t outcome_schema_version) {
  CompatibilityResult r;
  if (outcome_schema_version != OUTCOME_SCHEMA_VERSION) {
    r.ok = false;
    r.error_code = "outcome_schema_mismatch";
    r.description = "Caller outcome schema " + std::to_string(outcome_schema_version) + " != engine schema " +
                    std::to_string(OUTCOME_SCHEMA_VERSION) + ".";
  }
  return r;
}

}  // namespace version
}  // namespace cordon
