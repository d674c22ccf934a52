#include "cordon/hash.hpp"

// BLAKE3 is the only hash primitive. There is no fallback: a build without
// libblake3 does not link.

#include <cstring>

namespace cordon {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string request_hash(std::string_view canonical_request) {
  return hash_domain("req:", canonical_request);
}

std::string artifact_hash(std::string_view canonical_artifact_json) {
  return hash_domain("art:", canonical_artifact_json);
}

StreamHasher::StreamHasher(std::string_view domain) {
  blake3_hasher_init(&hasher_);
  blake3_hasher_update(&hasher_, domain.data(), domain.size());
}

void StreamHasher::update(std::string_view bytes) {
  blake3_hasher_update(&hasher_, bytes.data(), bytes.size());
}

void StreamHasher::update_field(std::string_view field) {
  update_u64(field.size());
  update(field);
}

void StreamHasher::update_u64(std::uint64_t value) {
  unsigned char buf[8];
  for (int i = 0; i < 8; ++i) buf[i] = static_cast<unsigned char>(value >> (8 * i));
  blake3_hasher_update(&hasher_, buf, sizeof(buf));
}

// Hashes the IEEE 754 bit pattern, so -0.0 and 0.0 (and NaN payloads) are
// distinguished. The fingerprint is a bit-exactness check, not equality.
void StreamHasher::update_f64(double value) {
  std::uint64_t bits = 0;
  static_assert(sizeof(bits) == sizeof(value));
  std::memcpy(&bits, &value, sizeof(bits));
  update_u64(bits);
}

std::string StreamHasher::hex_digest() {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher_, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace cordon
