#pragma once

// mender/executor.hpp: Run one candidate program inside a sandbox instance.
//
// CONTRACT:
//   execute() never throws and never retries. Every outcome, including backend
//   faults and staging failures, comes back as a populated ExecutionTrace. An
//   exception raised by the backend becomes a SandboxApiError trace.
//   Exactly one backend instance is created per call, and it is destroyed on
//   every exit path before execute() returns. The staging directory is private
//   to the call and removed before return.

#include <cstdint>
#include <memory>
#include <string>

#include "mender/sandbox.hpp"
#include "mender/types.hpp"

namespace mender {

struct ExecutorLimits {
  std::uint64_t memory_limit_mb{128};
  std::uint64_t exec_timeout_ms{5000};
  std::size_t max_output_bytes{65536};
  std::string staging_root;  // empty = $TMPDIR or /tmp
};

inline constexpr const char* kScriptName = "program.py";

class SandboxExecutor {
 public:
  SandboxExecutor(std::shared_ptr<ISandboxBackend> backend, ExecutorLimits limits);

  ExecutionTrace execute(const SourceArtifact& program, std::uint32_t iteration) const;

  const ExecutorLimits& limits() const { return limits_; }
  ISandboxBackend& backend() const { return *backend_; }

 private:
  std::shared_ptr<ISandboxBackend> backend_;
  ExecutorLimits limits_;
};

}  // namespace mender
