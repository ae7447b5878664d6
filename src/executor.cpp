#include "mender/executor.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <vector>

#include "mender/classifier.hpp"

namespace mender {

namespace {

std::uint64_t now_unix_ms() {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::system_clock::now().time_since_epoch())
                                        .count());
}

// Private per-call directory holding the staged program. Removed on scope exit.
class StagingDir {
 public:
  StagingDir() = default;
  ~StagingDir() {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  StagingDir(const StagingDir&) = delete;
  StagingDir& operator=(const StagingDir&) = delete;

  bool create(const std::string& root, std::string& error) {
    std::string base = root;
    if (base.empty()) {
      const char* tmp = std::getenv("TMPDIR");
      base = tmp && *tmp ? tmp : "/tmp";
    }
    std::string templ = base + "/mender-XXXXXX";
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
      error = "mkdtemp under " + base + ": " + std::strerror(errno);
      return false;
    }
    path_ = buf.data();
    if (chmod(path_.c_str(), 0700) != 0) {
      error = "chmod " + path_ + ": " + std::strerror(errno);
      return false;
    }
    return true;
  }

  bool write(const std::string& name, const std::string& text, std::string& error) const {
    const std::string file = path_ + "/" + name;
    int fd = open(file.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
      error = "open " + file + ": " + std::strerror(errno);
      return false;
    }
    std::size_t off = 0;
    while (off < text.size()) {
      ssize_t n = ::write(fd, text.data() + off, text.size() - off);
      if (n < 0 && errno == EINTR) continue;
      if (n <= 0) {
        error = "write " + file + ": " + std::strerror(errno);
        close(fd);
        return false;
      }
      off += static_cast<std::size_t>(n);
    }
    if (close(fd) != 0) {
      error = "close " + file + ": " + std::strerror(errno);
      return false;
    }
    return true;
  }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

// Destroys the backend instance on every exit path. A destroy() that throws is
// recorded in failure instead of escaping the destructor.
class InstanceGuard {
 public:
  InstanceGuard(ISandboxBackend& backend, std::string id, std::string& failure)
      : backend_(backend), id_(std::move(id)), failure_(failure) {}
  ~InstanceGuard() {
    try {
      backend_.destroy(id_);
    } catch (const std::exception& e) {
      failure_ = "destroy " + id_ + " raised: " + e.what();
    }
  }
  InstanceGuard(const InstanceGuard&) = delete;
  InstanceGuard& operator=(const InstanceGuard&) = delete;

 private:
  ISandboxBackend& backend_;
  std::string id_;
  std::string& failure_;
};

const char* fault_category(BackendFault fault) {
  switch (fault) {
    case BackendFault::unreachable: return category::kSandboxUnavailable;
    case BackendFault::image_missing: return category::kImageNotFound;
    case BackendFault::allocation_failed: return category::kSandboxAllocation;
    case BackendFault::api_error:
    case BackendFault::none: break;
  }
  return category::kSandboxApi;
}

ErrorCode fault_code(BackendFault fault) {
  switch (fault) {
    case BackendFault::unreachable: return ErrorCode::backend_unreachable;
    case BackendFault::image_missing: return ErrorCode::image_missing;
    case BackendFault::allocation_failed: return ErrorCode::allocation_failed;
    case BackendFault::api_error:
    case BackendFault::none: break;
  }
  return ErrorCode::backend_api_error;
}

void mark_infrastructure(ExecutionTrace& t, const std::string& cat, ErrorCode code,
                         const std::string& message) {
  t.ok = false;
  t.infrastructure = true;
  t.category = cat;
  t.detail = message;
  t.error_code = code;
  t.output = cat + ": " + message;
  t.output_lines = non_empty_lines(t.output);
}

// Creates, runs and collects one instance, filling trace. Backend exceptions
// propagate to execute().
void run_instance(ISandboxBackend& backend, const ExecutorLimits& limits, const SandboxSpec& spec,
                  ExecutionTrace& trace, std::string& destroy_failure) {
  CreateResult created = backend.create(spec);
  if (created.fault != BackendFault::none) {
    mark_infrastructure(trace, fault_category(created.fault), fault_code(created.fault), created.message);
    return;
  }
  InstanceGuard guard(backend, created.instance, destroy_failure);

  WaitResult waited = backend.wait(created.instance, limits.exec_timeout_ms);
  if (waited.fault != BackendFault::none) {
    backend.kill(created.instance);
    mark_infrastructure(trace, fault_category(waited.fault), fault_code(waited.fault), waited.message);
    return;
  }
  if (waited.timed_out || !waited.exited) {
    backend.kill(created.instance);
    trace.ok = false;
    trace.timed_out = true;
    trace.exit_status = 124;
    trace.error_code = ErrorCode::timeout;
    trace.output = timeout_marker(limits.exec_timeout_ms);
    trace.output_lines = non_empty_lines(trace.output);
    trace.category = category::kTimeout;
    trace.detail = trace.output.substr(trace.output.find(':') + 2);
    return;
  }

  LogsResult logs = backend.logs(created.instance);
  if (logs.fault != BackendFault::none) {
    mark_infrastructure(trace, fault_category(logs.fault), fault_code(logs.fault), logs.message);
    return;
  }

  trace.exit_status = waited.exit_status;
  trace.output = std::move(logs.text);
  if (waited.exit_status == 137) {
    if (!trace.output.empty() && trace.output.back() != '\n') trace.output += '\n';
    trace.output += memory_kill_marker(limits.memory_limit_mb);
    trace.output += '\n';
  }
  trace.output_lines = non_empty_lines(trace.output);
  trace.ok = waited.exit_status == 0;
  if (!trace.ok) {
    FailureContext ctx = analyze(trace.output);
    trace.category = ctx.category;
    trace.detail = ctx.detail;
    if (ctx.line != 0) trace.failing_line = ctx.line;
  }
}

}  // namespace

SandboxExecutor::SandboxExecutor(std::shared_ptr<ISandboxBackend> backend, ExecutorLimits limits)
    : backend_(std::move(backend)), limits_(std::move(limits)) {}

ExecutionTrace SandboxExecutor::execute(const SourceArtifact& program, std::uint32_t iteration) const {
  const auto start = std::chrono::steady_clock::now();
  ExecutionTrace trace;
  trace.iteration = iteration;
  trace.timestamp_ms = now_unix_ms();
  trace.artifact = program;

  auto finish = [&]() {
    trace.duration_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
            .count());
    return trace;
  };

  StagingDir staging;
  std::string error;
  if (!staging.create(limits_.staging_root, error) || !staging.write(kScriptName, program.text, error)) {
    mark_infrastructure(trace, category::kStagingWrite, ErrorCode::staging_write_failed, error);
    return finish();
  }

  SandboxSpec spec;
  spec.staging_dir = staging.path();
  spec.script_name = kScriptName;
  spec.memory_limit_mb = limits_.memory_limit_mb;
  spec.timeout_ms = limits_.exec_timeout_ms;
  spec.max_output_bytes = limits_.max_output_bytes;
  spec.network_disabled = true;

  std::string destroy_failure;
  try {
    run_instance(*backend_, limits_, spec, trace, destroy_failure);
  } catch (const std::exception& e) {
    trace.exit_status = 0;
    trace.timed_out = false;
    trace.failing_line.reset();
    mark_infrastructure(trace, category::kSandboxApi, ErrorCode::backend_api_error,
                        std::string("sandbox backend raised: ") + e.what());
  }
  if (!destroy_failure.empty() && !trace.infrastructure) {
    mark_infrastructure(trace, category::kSandboxApi, ErrorCode::backend_api_error, destroy_failure);
  }
  return finish();
}

}  // namespace mender
