#pragma once

// mender/sandbox.hpp: Process runner and sandbox backends.
//
// run_process() is the low-level fork/exec primitive with rlimits and a
// poll/deadline/SIGKILL loop. It is used directly by DockerSandboxBackend to
// drive the docker CLI.
//
// ISandboxBackend is the instance-oriented contract the executor works with:
//   create()  -> start exactly one instance running one command
//   wait()    -> block up to timeout_ms for it to exit
//   logs()    -> combined stdout+stderr once it has exited
//   kill()    -> force-stop a running instance
//   destroy() -> release every resource held for the instance (idempotent)
//
// THREAD SAFETY:
//   Both backends guard their instance tables with a mutex. Distinct sessions
//   may drive the same backend concurrently; a single instance id must only be
//   driven by one thread at a time. ProcessSandboxBackend instances are tied to
//   the creating thread: if that thread exits first, the instance is stopped.

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mender {

struct ProcessSpec {
  std::string command;  // absolute path, passed to execve
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;
  std::string cwd;
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{65536};
  std::uint64_t max_memory_bytes{0};      // 0 = unlimited
  std::uint64_t max_file_descriptors{0};  // 0 = unlimited
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;  // "spawn_failed" when fork/pipe failed
};

ProcessResult run_process(const ProcessSpec& spec);

// ---------------------------------------------------------------------------
// Sandbox backend contract
// ---------------------------------------------------------------------------

enum class BackendFault {
  none,
  unreachable,        // backend daemon not reachable
  image_missing,      // base image or interpreter not present
  allocation_failed,  // could not allocate resources for the instance
  api_error,          // any other backend-level failure
};

std::string to_string(BackendFault fault);

struct SandboxSpec {
  std::string staging_dir;   // private directory holding the program
  std::string script_name;   // file name inside staging_dir
  std::uint64_t memory_limit_mb{128};
  std::uint64_t timeout_ms{5000};  // used for CPU rlimits, not for waiting
  std::size_t max_output_bytes{65536};
  bool network_disabled{true};
};

struct CreateResult {
  BackendFault fault{BackendFault::none};
  std::string message;
  std::string instance;
};

struct WaitResult {
  BackendFault fault{BackendFault::none};
  std::string message;
  bool exited{false};
  bool timed_out{false};
  int exit_status{0};
};

struct LogsResult {
  BackendFault fault{BackendFault::none};
  std::string message;
  std::string text;
};

struct ProbeResult {
  bool available{false};
  std::string backend;
  std::string detail;
  std::vector<std::string> capabilities;
};

class ISandboxBackend {
 public:
  virtual ~ISandboxBackend() = default;
  virtual std::string name() const = 0;
  virtual CreateResult create(const SandboxSpec& spec) = 0;
  virtual WaitResult wait(const std::string& instance, std::uint64_t timeout_ms) = 0;
  virtual LogsResult logs(const std::string& instance) = 0;
  virtual void kill(const std::string& instance) = 0;
  virtual void destroy(const std::string& instance) = 0;
  virtual ProbeResult probe() = 0;
};

// Cuts the calling process off the network (Linux network namespace, via an
// unprivileged user namespace when needed). False when neither is permitted.
bool isolate_network();

// ---------------------------------------------------------------------------
// ProcessSandboxBackend: local fork/exec with setrlimit and netns isolation.
// ---------------------------------------------------------------------------
// Each instance runs under a supervisor process that owns the program's
// process group and, as child subreaper, every process the program leaves
// behind (including ones that call setsid). The supervisor kills all of them
// before it exits, so once wait() or kill() has reaped an instance nothing it
// started survives. logs() and destroy() never wait on the output pipe for
// more than a short grace period.
//
// Network isolation is mandatory when SandboxSpec::network_disabled is set:
// if no network namespace can be created, create() fails with
// allocation_failed and the program never runs.
//
// Combined output: the child's stdout and stderr share one pipe, so the
// interleaving seen by logs() matches what the program wrote.
class ProcessSandboxBackend : public ISandboxBackend {
 public:
  // Runs in the forked supervisor before the program starts; only
  // async-signal-safe calls are allowed.
  using NetworkIsolator = bool (*)();

  explicit ProcessSandboxBackend(std::string interpreter, NetworkIsolator isolate = nullptr);
  ~ProcessSandboxBackend() override;

  ProcessSandboxBackend(const ProcessSandboxBackend&) = delete;
  ProcessSandboxBackend& operator=(const ProcessSandboxBackend&) = delete;

  std::string name() const override { return "process"; }
  CreateResult create(const SandboxSpec& spec) override;
  WaitResult wait(const std::string& instance, std::uint64_t timeout_ms) override;
  LogsResult logs(const std::string& instance) override;
  void kill(const std::string& instance) override;
  void destroy(const std::string& instance) override;
  ProbeResult probe() override;

  std::size_t live_instances() const;

  struct Instance;  // defined in sandbox_posix.cpp

 private:
  std::shared_ptr<Instance> find(const std::string& id) const;

  std::string interpreter_;
  NetworkIsolator isolate_;
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<Instance>> instances_;
  std::uint64_t next_id_{1};
};

// ---------------------------------------------------------------------------
// DockerSandboxBackend: one throwaway container per instance, via docker CLI.
// ---------------------------------------------------------------------------
struct DockerOptions {
  std::string docker_binary{"/usr/bin/docker"};
  std::string image{"mender-sandbox"};
  std::string interpreter{"python"};  // inside the image
  std::uint64_t cli_timeout_ms{30000};
};

// Maps a failed docker CLI invocation to a fault. Exposed for tests.
BackendFault classify_docker_failure(int exit_code, const std::string& stderr_text);

class DockerSandboxBackend : public ISandboxBackend {
 public:
  explicit DockerSandboxBackend(DockerOptions options);

  std::string name() const override { return "docker"; }
  CreateResult create(const SandboxSpec& spec) override;
  WaitResult wait(const std::string& instance, std::uint64_t timeout_ms) override;
  LogsResult logs(const std::string& instance) override;
  void kill(const std::string& instance) override;
  void destroy(const std::string& instance) override;
  ProbeResult probe() override;

  std::vector<std::string> run_arguments(const SandboxSpec& spec, const std::string& name) const;

  // Containers whose `docker rm -f` failed; each one may still exist.
  std::uint64_t cleanup_failures() const;

 private:
  ProcessResult docker(std::vector<std::string> args, std::uint64_t timeout_ms) const;
  std::string next_container_name();
  bool remove_container(const std::string& name);

  DockerOptions options_;
  mutable std::mutex mu_;
  std::map<std::string, std::size_t> containers_;  // name -> output byte limit
  std::uint64_t next_seq_{1};
  std::atomic<std::uint64_t> cleanup_failures_{0};
};

}  // namespace mender
