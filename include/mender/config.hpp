#pragma once

// mender/config.hpp: Engine configuration.
//
// Resolution order, later wins:
//   1. compiled defaults (EngineConfig{})
//   2. optional JSON config file (flat object, keys as below)
//   3. MENDER_<KEY> environment variables (upper-cased key)
//
// Loading never throws. Problems are reported through ConfigValidationResult:
// errors make the configuration unusable, warnings (unknown keys) do not.

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mender {

struct EngineConfig {
  std::string backend{"process"};  // "process" | "docker"
  std::string interpreter{"/usr/bin/python3"};
  std::string docker_binary{"/usr/bin/docker"};
  std::string docker_image{"mender-sandbox"};
  std::string staging_root;  // empty = $TMPDIR or /tmp
  std::uint64_t memory_limit_mb{128};
  std::uint64_t exec_timeout_ms{5000};
  std::uint64_t max_output_bytes{65536};

  std::string strategy{"rule_based"};  // "rule_based" | "advisory"
  std::string advisory_url{"http://localhost:11434"};
  std::string advisory_model{"llama3"};
  std::uint64_t advisory_timeout_ms{30000};

  std::uint64_t max_iterations{5};
  std::uint64_t max_infra_failures{2};
  std::uint64_t max_stalled_patches{2};
  std::int64_t infra_retry_delay_ms{-1};  // -1 = exec_timeout_ms
  double min_length_ratio{0.3};
  bool heuristics{false};
  std::string event_log;

  std::uint64_t effective_retry_delay_ms() const {
    return infra_retry_delay_ms < 0 ? exec_timeout_ms : static_cast<std::uint64_t>(infra_retry_delay_ms);
  }
};

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Validates a JSON config document without applying it.
ConfigValidationResult validate_config(const std::string& config_json);

// Applies a JSON config document on top of cfg. Returns the validation result;
// cfg is left untouched when it has errors.
ConfigValidationResult apply_config_json(EngineConfig& cfg, const std::string& config_json);

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Applies MENDER_* overrides. Malformed values are reported as errors and
// leave the field unchanged. lookup defaults to the process environment.
void apply_env_overrides(EngineConfig& cfg, ConfigValidationResult& result, const EnvLookup& lookup = nullptr);

// Range and enumeration checks on a fully resolved configuration.
void check_config(const EngineConfig& cfg, ConfigValidationResult& result);

struct ConfigLoadResult {
  EngineConfig config;
  ConfigValidationResult validation;
};

// Defaults -> file (when path is non-empty) -> environment -> check_config().
ConfigLoadResult load_config(const std::string& path, const EnvLookup& lookup = nullptr);

std::string config_to_json(const EngineConfig& cfg);

}  // namespace mender
