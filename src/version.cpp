#include "mender/version.hpp"

#include <sstream>

#include "mender/hash.hpp"

namespace mender {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver = ENGINE_SEMVER;
  m.hash_primitive = hash_runtime_info().primitive;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"build_timestamp\":\"" << m.build_timestamp << "\""
    << ",\"config_schema\":" << m.config_schema
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"event_log\":" << m.event_log
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"session_format\":" << m.session_format
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace mender
