#pragma once

// cordon/hash.hpp: BLAKE3 digests for datasets, requests and artifacts.
//
// DOMAIN SEPARATION:
//   "req:"  canonical request (program source, dataset fingerprint, limits)
//   "art:"  canonical artifact JSON
//   "ds:"   canonical dataset byte stream (see Dataset::fingerprint())
//   These prefixes are part of the digest contract. Changing one invalidates
//   every digest a caller may have stored for idempotence checks.

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace cordon {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

std::string blake3_hex(std::string_view payload);
std::string hash_domain(std::string_view domain, std::string_view payload);
HashRuntimeInfo hash_runtime_info();

std::string request_hash(std::string_view canonical_request);
std::string artifact_hash(std::string_view canonical_artifact_json);

// Incremental domain-separated hasher. Feeds length-prefixed fields so that
// ("ab","c") and ("a","bc") never collide.
class StreamHasher {
 public:
  explicit StreamHasher(std::string_view domain);

  void update(std::string_view bytes);
  void update_field(std::string_view field);
  void update_u64(std::uint64_t value);
  void update_f64(double value);

  std::string hex_digest();

 private:
  blake3_hasher hasher_;
};

}  // namespace cordon
