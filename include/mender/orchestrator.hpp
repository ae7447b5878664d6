#pragma once

// mender/orchestrator.hpp: The execute/classify/patch/validate repair loop.
//
// STATE MACHINE:
//   running(i) --execute ok-------------------------------> success
//   running(i) --execute failed, i == max_iterations-------> aborted("max iterations reached")
//   running(i) --cancel requested-------------------------> aborted("cancelled")
//   running(i) --max_infra_failures infra traces in a row--> aborted("sandbox infrastructure unavailable: <cat>")
//   running(i) --patch leaves the program unchanged--------> aborted("no further progress: <cat> requires manual review")
//   running(i) --patch applied----------------------------> running(i+1)
//
// A RepairOrchestrator holds no per-session state. run() and step() may be
// called from several threads at once; each session is strictly sequential.

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "mender/config.hpp"
#include "mender/executor.hpp"
#include "mender/heuristics.hpp"
#include "mender/patch.hpp"
#include "mender/types.hpp"
#include "mender/validator.hpp"

namespace mender {

class CancelToken {
 public:
  void cancel() { flag_.store(true, std::memory_order_release); }
  bool cancelled() const { return flag_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> flag_{false};
};

struct OrchestratorOptions {
  std::uint32_t max_iterations{5};
  std::uint32_t max_infra_failures{2};
  std::uint32_t max_stalled_patches{2};
  std::uint64_t infra_retry_delay_ms{5000};
};

class RepairOrchestrator {
 public:
  RepairOrchestrator(SandboxExecutor executor, std::shared_ptr<IPatchStrategy> strategy, PatchValidator validator,
                     OrchestratorOptions options, std::vector<std::shared_ptr<IHeuristicCheck>> checks = {});

  // New running session at iteration 0 with current == original.
  RepairSession begin(const std::string& program) const;

  // One execute (and, on failure, one patch) cycle. No-op on a terminal session.
  void step(RepairSession& session, const CancelToken* cancel = nullptr) const;

  // begin() then step() until terminal.
  RepairSession run(const std::string& program, const CancelToken* cancel = nullptr) const;

  const OrchestratorOptions& options() const { return options_; }
  const SandboxExecutor& executor() const { return executor_; }
  IPatchStrategy& strategy() const { return *strategy_; }

 private:
  void abort(RepairSession& session, ErrorCode code, std::string reason) const;
  void succeed(RepairSession& session) const;
  void wait_before_retry(const CancelToken* cancel) const;

  SandboxExecutor executor_;
  std::shared_ptr<IPatchStrategy> strategy_;
  PatchValidator validator_;
  OrchestratorOptions options_;
  std::vector<std::shared_ptr<IHeuristicCheck>> checks_;
};

// ---------------------------------------------------------------------------
// Assembly from configuration
// ---------------------------------------------------------------------------
std::shared_ptr<ISandboxBackend> make_backend(const EngineConfig& cfg);

// "advisory" wraps a RuleBasedStrategy fallback; anything else is rule-based.
// transport defaults to a CurlTransport.
std::shared_ptr<IPatchStrategy> make_strategy(const EngineConfig& cfg,
                                              std::shared_ptr<IHttpTransport> transport = nullptr);

ExecutorLimits make_limits(const EngineConfig& cfg);
OrchestratorOptions make_options(const EngineConfig& cfg);

RepairOrchestrator make_orchestrator(const EngineConfig& cfg, std::shared_ptr<IHttpTransport> transport = nullptr);

}  // namespace mender
