#include "mender/hash.hpp"

// BLAKE3 is the sole hash primitive. Digests identify artifacts across
// iterations and exported sessions, so the domain prefixes below must not change
// without changing every stored digest.

#include <array>
#include <initializer_list>

extern "C" {
#include <blake3.h>
}

namespace mender {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

// BLAKE3 over the concatenation of parts, hex-encoded.
std::string digest_hex(std::initializer_list<std::string_view> parts) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  for (std::string_view p : parts) blake3_hasher_update(&hasher, p.data(), p.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());

  std::string hex(out.size() * 2, '0');
  for (std::size_t i = 0; i < out.size(); ++i) {
    hex[i * 2] = kHexChars[out[i] >> 4];
    hex[i * 2 + 1] = kHexChars[out[i] & 0x0f];
  }
  return hex;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.version = blake3_version();
  info.primitive = "blake3";
  info.blake3_available = true;
  return info;
}

std::string blake3_hex(std::string_view payload) { return digest_hex({payload}); }

std::string hash_domain(std::string_view domain, std::string_view payload) {
  return digest_hex({domain, payload});
}

std::string artifact_digest(std::string_view program_text) { return hash_domain("src:", program_text); }

std::string trace_digest(std::string_view canonical_trace) { return hash_domain("trace:", canonical_trace); }

}  // namespace mender
