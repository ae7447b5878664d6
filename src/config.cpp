#include "mender/config.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "mender/jsonlite.hpp"
#include "mender/version.hpp"

namespace mender {

namespace {

enum class Kind { text, count, signed_ms, ratio, flag };

struct KeySpec {
  const char* name;
  Kind kind;
};

constexpr KeySpec kKeys[] = {
    {"backend", Kind::text},
    {"interpreter", Kind::text},
    {"docker_binary", Kind::text},
    {"docker_image", Kind::text},
    {"staging_root", Kind::text},
    {"memory_limit_mb", Kind::count},
    {"exec_timeout_ms", Kind::count},
    {"max_output_bytes", Kind::count},
    {"strategy", Kind::text},
    {"advisory_url", Kind::text},
    {"advisory_model", Kind::text},
    {"advisory_timeout_ms", Kind::count},
    {"max_iterations", Kind::count},
    {"max_infra_failures", Kind::count},
    {"max_stalled_patches", Kind::count},
    {"infra_retry_delay_ms", Kind::signed_ms},
    {"min_length_ratio", Kind::ratio},
    {"heuristics", Kind::flag},
    {"event_log", Kind::text},
};

const KeySpec* find_key(const std::string& name) {
  for (const auto& k : kKeys) {
    if (name == k.name) return &k;
  }
  return nullptr;
}

const char* kind_name(Kind kind) {
  switch (kind) {
    case Kind::text: return "string";
    case Kind::count: return "non-negative integer";
    case Kind::signed_ms: return "integer";
    case Kind::ratio: return "number";
    case Kind::flag: return "boolean";
  }
  return "value";
}

bool type_matches(Kind kind, const jsonlite::Value& v) {
  switch (kind) {
    case Kind::text: return std::holds_alternative<std::string>(v.v);
    case Kind::count: return std::holds_alternative<std::uint64_t>(v.v);
    case Kind::signed_ms:
      if (std::holds_alternative<std::uint64_t>(v.v)) return true;
      if (std::holds_alternative<double>(v.v)) {
        const double d = std::get<double>(v.v);
        return d >= -9.0e18 && d <= 9.0e18 && d == static_cast<double>(static_cast<std::int64_t>(d));
      }
      return false;
    case Kind::ratio:
      return std::holds_alternative<double>(v.v) || std::holds_alternative<std::uint64_t>(v.v);
    case Kind::flag: return std::holds_alternative<bool>(v.v);
  }
  return false;
}

double as_double(const jsonlite::Value& v) {
  if (std::holds_alternative<double>(v.v)) return std::get<double>(v.v);
  return static_cast<double>(std::get<std::uint64_t>(v.v));
}

// Caller has checked type_matches().
void assign(EngineConfig& cfg, const std::string& key, const jsonlite::Value& v) {
  auto text = [&v]() { return std::get<std::string>(v.v); };
  auto count = [&v]() { return std::get<std::uint64_t>(v.v); };
  if (key == "backend") cfg.backend = text();
  else if (key == "interpreter") cfg.interpreter = text();
  else if (key == "docker_binary") cfg.docker_binary = text();
  else if (key == "docker_image") cfg.docker_image = text();
  else if (key == "staging_root") cfg.staging_root = text();
  else if (key == "memory_limit_mb") cfg.memory_limit_mb = count();
  else if (key == "exec_timeout_ms") cfg.exec_timeout_ms = count();
  else if (key == "max_output_bytes") cfg.max_output_bytes = count();
  else if (key == "strategy") cfg.strategy = text();
  else if (key == "advisory_url") cfg.advisory_url = text();
  else if (key == "advisory_model") cfg.advisory_model = text();
  else if (key == "advisory_timeout_ms") cfg.advisory_timeout_ms = count();
  else if (key == "max_iterations") cfg.max_iterations = count();
  else if (key == "max_infra_failures") cfg.max_infra_failures = count();
  else if (key == "max_stalled_patches") cfg.max_stalled_patches = count();
  else if (key == "infra_retry_delay_ms") cfg.infra_retry_delay_ms = static_cast<std::int64_t>(as_double(v));
  else if (key == "min_length_ratio") cfg.min_length_ratio = as_double(v);
  else if (key == "heuristics") cfg.heuristics = std::get<bool>(v.v);
  else if (key == "event_log") cfg.event_log = text();
}

// Parses an environment string into the JSON value the key expects.
std::optional<jsonlite::Value> parse_env_value(Kind kind, const std::string& raw) {
  switch (kind) {
    case Kind::text:
      return jsonlite::Value{raw};
    case Kind::count: {
      if (raw.empty() || raw[0] == '-') return std::nullopt;
      char* end = nullptr;
      errno = 0;
      const unsigned long long n = std::strtoull(raw.c_str(), &end, 10);
      if (errno != 0 || *end != '\0') return std::nullopt;
      return jsonlite::Value{static_cast<std::uint64_t>(n)};
    }
    case Kind::signed_ms: {
      char* end = nullptr;
      errno = 0;
      const long long n = std::strtoll(raw.c_str(), &end, 10);
      if (raw.empty() || errno != 0 || *end != '\0') return std::nullopt;
      return jsonlite::Value{static_cast<double>(n)};
    }
    case Kind::ratio: {
      char* end = nullptr;
      const double d = std::strtod(raw.c_str(), &end);
      if (raw.empty() || *end != '\0') return std::nullopt;
      return jsonlite::Value{d};
    }
    case Kind::flag:
      if (raw == "1" || raw == "true" || raw == "yes" || raw == "on") return jsonlite::Value{true};
      if (raw == "0" || raw == "false" || raw == "no" || raw == "off") return jsonlite::Value{false};
      return std::nullopt;
  }
  return std::nullopt;
}

std::string env_name(const char* key) {
  std::string out = "MENDER_";
  for (const char* p = key; *p; ++p) out += static_cast<char>(std::toupper(static_cast<unsigned char>(*p)));
  return out;
}

ConfigValidationResult check_document(const std::string& config_json, jsonlite::Object& obj) {
  ConfigValidationResult r;
  r.config_version = std::to_string(version::CONFIG_SCHEMA_VERSION);
  std::optional<jsonlite::JsonError> err;
  obj = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }
  for (const auto& [key, value] : obj) {
    const KeySpec* spec = find_key(key);
    if (!spec) {
      r.warnings.push_back("unknown key: " + key);
      continue;
    }
    if (!type_matches(spec->kind, value)) {
      r.errors.push_back(key + ": expected " + kind_name(spec->kind));
    }
  }
  r.ok = r.errors.empty();
  return r;
}

}  // namespace

void check_config(const EngineConfig& cfg, ConfigValidationResult& result) {
  auto& e = result.errors;
  if (cfg.backend != "process" && cfg.backend != "docker") e.push_back("backend: must be \"process\" or \"docker\"");
  if (cfg.strategy != "rule_based" && cfg.strategy != "advisory") {
    e.push_back("strategy: must be \"rule_based\" or \"advisory\"");
  }
  if (cfg.backend == "process" && cfg.interpreter.empty()) e.push_back("interpreter: must not be empty");
  if (cfg.backend == "docker" && cfg.docker_image.empty()) e.push_back("docker_image: must not be empty");
  if (cfg.memory_limit_mb == 0) e.push_back("memory_limit_mb: must be > 0");
  if (cfg.exec_timeout_ms == 0) e.push_back("exec_timeout_ms: must be > 0");
  if (cfg.max_output_bytes == 0) e.push_back("max_output_bytes: must be > 0");
  if (cfg.advisory_timeout_ms == 0) e.push_back("advisory_timeout_ms: must be > 0");
  if (cfg.max_iterations < 1) e.push_back("max_iterations: must be >= 1");
  if (cfg.max_infra_failures < 1) e.push_back("max_infra_failures: must be >= 1");
  if (cfg.max_stalled_patches < 1) e.push_back("max_stalled_patches: must be >= 1");
  if (cfg.infra_retry_delay_ms < -1) e.push_back("infra_retry_delay_ms: must be >= -1");
  if (cfg.min_length_ratio < 0.0 || cfg.min_length_ratio > 1.0) {
    e.push_back("min_length_ratio: must be within [0, 1]");
  }
  result.ok = e.empty();
}

ConfigValidationResult validate_config(const std::string& config_json) {
  jsonlite::Object obj;
  ConfigValidationResult r = check_document(config_json, obj);
  if (!r.ok) return r;
  EngineConfig cfg;
  for (const auto& [key, value] : obj) {
    if (find_key(key)) assign(cfg, key, value);
  }
  check_config(cfg, r);
  return r;
}

ConfigValidationResult apply_config_json(EngineConfig& cfg, const std::string& config_json) {
  jsonlite::Object obj;
  ConfigValidationResult r = check_document(config_json, obj);
  if (!r.ok) return r;
  EngineConfig next = cfg;
  for (const auto& [key, value] : obj) {
    if (find_key(key)) assign(next, key, value);
  }
  check_config(next, r);
  if (r.ok) cfg = std::move(next);
  return r;
}

void apply_env_overrides(EngineConfig& cfg, ConfigValidationResult& result, const EnvLookup& lookup) {
  for (const auto& spec : kKeys) {
    const std::string var = env_name(spec.name);
    std::optional<std::string> raw;
    if (lookup) {
      raw = lookup(var);
    } else if (const char* v = std::getenv(var.c_str())) {
      raw = std::string(v);
    }
    if (!raw) continue;
    auto value = parse_env_value(spec.kind, *raw);
    if (!value) {
      result.errors.push_back(var + ": expected " + kind_name(spec.kind) + ", got \"" + *raw + "\"");
      continue;
    }
    assign(cfg, spec.name, *value);
  }
}

ConfigLoadResult load_config(const std::string& path, const EnvLookup& lookup) {
  ConfigLoadResult out;
  out.validation.config_version = std::to_string(version::CONFIG_SCHEMA_VERSION);
  if (!path.empty()) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
      out.validation.errors.push_back("cannot read config file: " + path);
      return out;
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out.validation = apply_config_json(out.config, ss.str());
    if (!out.validation.ok) return out;
  }
  apply_env_overrides(out.config, out.validation, lookup);
  check_config(out.config, out.validation);
  return out;
}

std::string config_to_json(const EngineConfig& cfg) {
  jsonlite::Object o;
  o["backend"] = cfg.backend;
  o["interpreter"] = cfg.interpreter;
  o["docker_binary"] = cfg.docker_binary;
  o["docker_image"] = cfg.docker_image;
  o["staging_root"] = cfg.staging_root;
  o["memory_limit_mb"] = cfg.memory_limit_mb;
  o["exec_timeout_ms"] = cfg.exec_timeout_ms;
  o["max_output_bytes"] = cfg.max_output_bytes;
  o["strategy"] = cfg.strategy;
  o["advisory_url"] = cfg.advisory_url;
  o["advisory_model"] = cfg.advisory_model;
  o["advisory_timeout_ms"] = cfg.advisory_timeout_ms;
  o["max_iterations"] = cfg.max_iterations;
  o["max_infra_failures"] = cfg.max_infra_failures;
  o["max_stalled_patches"] = cfg.max_stalled_patches;
  o["infra_retry_delay_ms"] = static_cast<double>(cfg.infra_retry_delay_ms);
  o["min_length_ratio"] = cfg.min_length_ratio;
  o["heuristics"] = cfg.heuristics;
  o["event_log"] = cfg.event_log;
  return jsonlite::to_json(o);
}

}  // namespace mender
