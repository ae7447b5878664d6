#include "mender/sandbox.hpp"

// Docker backend: every instance is a fresh detached container started from the
// sandbox image with the staging directory bind-mounted read-only at /app.
// All daemon interaction goes through the docker CLI under run_process(), so
// every call carries a hard deadline.

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>

namespace mender {

namespace {

std::string trim(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
    s.pop_back();
  std::size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\n')) ++i;
  return s.substr(i);
}

bool contains_ci(const std::string& hay, const std::string& needle) {
  auto it = std::search(hay.begin(), hay.end(), needle.begin(), needle.end(),
                        [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                        });
  return it != hay.end();
}

std::string failure_message(const ProcessResult& r) {
  if (!r.error_message.empty()) return r.error_message;
  std::string msg = trim(r.stderr_text);
  if (msg.empty()) msg = "docker exited with status " + std::to_string(r.exit_code);
  return msg;
}

}  // namespace

BackendFault classify_docker_failure(int exit_code, const std::string& stderr_text) {
  if (contains_ci(stderr_text, "Unable to find image") || contains_ci(stderr_text, "No such image") ||
      contains_ci(stderr_text, "pull access denied") || contains_ci(stderr_text, "manifest unknown") ||
      contains_ci(stderr_text, "executable file not found")) {
    return BackendFault::image_missing;
  }
  // 127 with nothing on stderr is execve failing on the docker binary itself.
  if (exit_code == 127 || contains_ci(stderr_text, "Cannot connect to the Docker daemon") ||
      contains_ci(stderr_text, "Is the docker daemon running") ||
      contains_ci(stderr_text, "error during connect")) {
    return BackendFault::unreachable;
  }
  if (contains_ci(stderr_text, "cannot allocate memory") ||
      contains_ci(stderr_text, "no space left on device") ||
      contains_ci(stderr_text, "resource temporarily unavailable")) {
    return BackendFault::allocation_failed;
  }
  return BackendFault::api_error;
}

DockerSandboxBackend::DockerSandboxBackend(DockerOptions options) : options_(std::move(options)) {}

ProcessResult DockerSandboxBackend::docker(std::vector<std::string> args, std::uint64_t timeout_ms) const {
  ProcessSpec ps;
  ps.command = options_.docker_binary;
  ps.argv = std::move(args);
  ps.timeout_ms = timeout_ms;
  ps.max_output_bytes = 1 << 20;
  for (const char* key : {"PATH", "HOME", "DOCKER_HOST", "DOCKER_CONFIG", "DOCKER_CONTEXT", "XDG_RUNTIME_DIR"}) {
    if (const char* v = std::getenv(key)) ps.env[key] = v;
  }
  return run_process(ps);
}

std::string DockerSandboxBackend::next_container_name() {
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
  std::lock_guard<std::mutex> lk(mu_);
  return "mender-" + std::to_string(::getpid()) + "-" + std::to_string(next_seq_++) + "-" +
         std::to_string(static_cast<std::uint64_t>(ns) % 1000000000ull);
}

bool DockerSandboxBackend::remove_container(const std::string& name) {
  ProcessResult r = docker({"rm", "-f", name}, options_.cli_timeout_ms);
  if (r.error_message.empty() && !r.timed_out &&
      (r.exit_code == 0 || contains_ci(r.stderr_text, "No such container"))) {
    return true;
  }
  cleanup_failures_.fetch_add(1, std::memory_order_relaxed);
  return false;
}

std::vector<std::string> DockerSandboxBackend::run_arguments(const SandboxSpec& spec,
                                                             const std::string& name) const {
  const std::string mem = std::to_string(spec.memory_limit_mb) + "m";
  std::vector<std::string> args = {
      "run", "-d",
      "--name", name,
      "--pull", "never",
      "--memory=" + mem,
      "--memory-swap=" + mem,
      "--read-only",
      "--pids-limit", "64",
      "--cap-drop", "ALL",
      "--security-opt", "no-new-privileges",
      "-e", "PIP_NO_INDEX=1",
      "-e", "PYTHONUNBUFFERED=1",
      "-e", "PYTHONDONTWRITEBYTECODE=1",
      "-v", spec.staging_dir + ":/app:ro",
      "-w", "/app",
  };
  if (spec.network_disabled) {
    args.push_back("--network");
    args.push_back("none");
  }
  args.push_back(options_.image);
  args.push_back(options_.interpreter);
  args.push_back("/app/" + spec.script_name);
  return args;
}

// The container is named up front, so every failure after `docker run` was
// issued can remove it by name, including a run that timed out or a start
// failure that left it in the Created state.
CreateResult DockerSandboxBackend::create(const SandboxSpec& spec) {
  CreateResult out;
  const std::string name = next_container_name();
  ProcessResult r = docker(run_arguments(spec, name), options_.cli_timeout_ms);
  if (!r.error_message.empty()) {
    out.fault = BackendFault::allocation_failed;
    out.message = r.error_message;
    return out;
  }
  if (r.timed_out) {
    out.fault = BackendFault::api_error;
    out.message = "docker run did not return within " + std::to_string(options_.cli_timeout_ms) + " ms";
  } else if (r.exit_code != 0) {
    out.fault = classify_docker_failure(r.exit_code, r.stderr_text);
    out.message = failure_message(r);
  } else if (trim(r.stdout_text).empty()) {
    out.fault = BackendFault::api_error;
    out.message = "docker run returned no container id";
  }
  if (out.fault != BackendFault::none) {
    if (!remove_container(name)) out.message += " (container " + name + " could not be removed)";
    return out;
  }
  std::lock_guard<std::mutex> lk(mu_);
  containers_[name] = spec.max_output_bytes;
  out.instance = name;
  return out;
}

WaitResult DockerSandboxBackend::wait(const std::string& instance, std::uint64_t timeout_ms) {
  WaitResult out;
  ProcessResult r = docker({"wait", instance}, timeout_ms);
  if (r.timed_out) {
    out.timed_out = true;
    return out;
  }
  if (!r.error_message.empty() || r.exit_code != 0) {
    out.fault = r.error_message.empty() ? classify_docker_failure(r.exit_code, r.stderr_text)
                                        : BackendFault::api_error;
    out.message = failure_message(r);
    return out;
  }
  const std::string code = trim(r.stdout_text);
  char* end = nullptr;
  const long status = std::strtol(code.c_str(), &end, 10);
  if (code.empty() || end == code.c_str()) {
    out.fault = BackendFault::api_error;
    out.message = "unexpected docker wait output: " + code;
    return out;
  }
  out.exited = true;
  out.exit_status = static_cast<int>(status);
  return out;
}

LogsResult DockerSandboxBackend::logs(const std::string& instance) {
  LogsResult out;
  std::size_t limit = 65536;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = containers_.find(instance);
    if (it != containers_.end()) limit = it->second;
  }
  ProcessResult r = docker({"logs", instance}, options_.cli_timeout_ms);
  if (!r.error_message.empty() || r.timed_out || r.exit_code != 0) {
    out.fault = r.error_message.empty() && !r.timed_out ? classify_docker_failure(r.exit_code, r.stderr_text)
                                                        : BackendFault::api_error;
    out.message = r.timed_out ? "docker logs timed out" : failure_message(r);
    return out;
  }
  // docker logs replays the container's stdout and stderr on the CLI's own
  // streams; the relative order between the two is not preserved.
  out.text = r.stdout_text + r.stderr_text;
  if (out.text.size() > limit) {
    out.text.resize(limit);
    out.text += "(truncated)";
  }
  return out;
}

void DockerSandboxBackend::kill(const std::string& instance) {
  ProcessResult r = docker({"kill", instance}, options_.cli_timeout_ms);
  (void)r;  // destroy() follows with rm -f, which also stops the container
}

void DockerSandboxBackend::destroy(const std::string& instance) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = containers_.find(instance);
    if (it == containers_.end()) return;
    containers_.erase(it);
  }
  remove_container(instance);
}

std::uint64_t DockerSandboxBackend::cleanup_failures() const {
  return cleanup_failures_.load(std::memory_order_relaxed);
}

ProbeResult DockerSandboxBackend::probe() {
  ProbeResult p;
  p.backend = "docker";
  p.capabilities = {"memory_ceiling", "memory_swap_ceiling", "network_none", "read_only_rootfs",
                    "pids_limit", "cap_drop_all"};
  ProcessResult v = docker({"version", "--format", "{{.Server.Version}}"}, 5000);
  if (!v.error_message.empty() || v.timed_out || v.exit_code != 0) {
    p.detail = "daemon " + to_string(classify_docker_failure(v.exit_code, v.stderr_text)) + ": " +
               (v.timed_out ? std::string("timed out") : failure_message(v));
    return p;
  }
  ProcessResult img = docker({"image", "inspect", "--format", "{{.Id}}", options_.image}, 5000);
  if (img.timed_out || img.exit_code != 0) {
    p.detail = "daemon " + trim(v.stdout_text) + "; image " + options_.image + " missing";
    return p;
  }
  p.available = true;
  p.detail = "daemon " + trim(v.stdout_text) + "; image " + options_.image;
  return p;
}

}  // namespace mender
