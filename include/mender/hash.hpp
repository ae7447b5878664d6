#pragma once

#include <string>
#include <string_view>

namespace mender {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
  bool blake3_available{false};
};

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing. Prefixes are part of the digest contract:
//   "src:"     program text (SourceArtifact::digest)
//   "trace:"   canonical trace record (exported sessions)
//   "session:" session id seed
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string artifact_digest(std::string_view program_text);
std::string trace_digest(std::string_view canonical_trace);

}  // namespace mender
