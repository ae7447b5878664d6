#pragma once

// mender/version.hpp: Version manifest for every persisted or streamed format.
//
// INVARIANT:
//   Any change to the shape of an exported session, a JSONL event line or the
//   digest domains bumps the matching constant here. Readers key on them.

#include <cstdint>
#include <string>

namespace mender {
namespace version {

constexpr const char* ENGINE_SEMVER = "0.3.0";

// 1 = BLAKE3, 32-byte output, hex-encoded, "src:"/"trace:"/"session:" domains.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// 1 = session_to_json() layout: traces[], patches[] with edits[], findings[].
constexpr uint32_t SESSION_FORMAT_VERSION = 1;

// 1 = one RepairEvent object per line.
constexpr uint32_t EVENT_LOG_VERSION = 1;

// 1 = flat EngineConfig keys (see config.hpp).
constexpr uint32_t CONFIG_SCHEMA_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t session_format{SESSION_FORMAT_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  uint32_t config_schema{CONFIG_SCHEMA_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;  // from __DATE__/__TIME__
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace mender
