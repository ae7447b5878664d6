#pragma once

// mender/observability.hpp: Repair event stream and process-wide counters.
//
// RepairEvent is the observable unit. The orchestrator emits one per trace,
// one per patch and one when a session reaches a terminal state. Each event:
//   - is recorded into global_engine_stats() (always),
//   - is passed to the registered hook, if any,
//   - is appended as one JSON line to the event log, if one is configured
//     (set_event_log_path() or MENDER_EVENT_LOG).
//
// Events carry metadata only. Program text and program output never leave
// the session through this channel.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mender/types.hpp"

namespace mender {

enum class RepairEventKind { trace, patch, session };

std::string to_string(RepairEventKind kind);

struct RepairEvent {
  RepairEventKind kind{RepairEventKind::trace};
  std::string session_id;
  std::uint32_t iteration{0};
  std::string artifact_digest;

  // trace
  bool ok{false};
  std::string category;
  bool infrastructure{false};
  bool timed_out{false};
  int exit_status{0};

  // trace: sandbox wall clock. patch: generation time.
  std::uint64_t duration_ms{0};

  // patch
  std::string strategy;
  bool advisory_fallback{false};
  bool substituted{false};
  std::size_t edit_count{0};

  // session
  SessionState state{SessionState::running};
  ErrorCode abort_code{ErrorCode::none};
};

std::string event_to_json(const RepairEvent& ev);

// Inverse of event_to_json(). nullopt for malformed lines or another
// event log version.
std::optional<RepairEvent> event_from_json(const std::string& line);

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two microsecond buckets
// ---------------------------------------------------------------------------
// Bucket 0 is [0, 1us); bucket i > 0 is [2^(i-1), 2^i) us.
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 40;

  void record_ms(std::uint64_t duration_ms);
  void record_us(std::uint64_t duration_us);

  // p in [0.0, 1.0]. Returns microseconds, 0.0 when empty.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<std::uint64_t> count_{0};
  alignas(64) std::atomic<std::uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats: process-wide aggregate
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomics; the category map is mutex-guarded.
// Exposed through `mender stats` and `mender doctor`.
class EngineStats {
 public:
  void record(const RepairEvent& ev);
  std::string to_json() const;

  // Category -> number of failing traces with that category.
  std::map<std::string, std::uint64_t> failure_categories_snapshot() const;

  // Executions
  alignas(64) std::atomic<std::uint64_t> executions{0};
  alignas(64) std::atomic<std::uint64_t> successful_executions{0};
  alignas(64) std::atomic<std::uint64_t> failed_executions{0};
  alignas(64) std::atomic<std::uint64_t> timeouts{0};
  alignas(64) std::atomic<std::uint64_t> infrastructure_faults{0};

  // Patches
  alignas(64) std::atomic<std::uint64_t> patches{0};
  alignas(64) std::atomic<std::uint64_t> advisory_patches{0};
  alignas(64) std::atomic<std::uint64_t> advisory_fallbacks{0};
  alignas(64) std::atomic<std::uint64_t> rejected_candidates{0};

  // Sessions by outcome
  alignas(64) std::atomic<std::uint64_t> sessions_succeeded{0};
  alignas(64) std::atomic<std::uint64_t> sessions_aborted{0};

  LatencyHistogram sandbox_latency;
  LatencyHistogram patch_latency;
  LatencyHistogram advisory_latency;

 private:
  mutable std::mutex category_mu_;
  std::map<std::string, std::uint64_t> failure_categories_;
};

EngineStats& global_engine_stats();

void emit_repair_event(const RepairEvent& ev);

using RepairEventHook = void (*)(const RepairEvent&);
void set_repair_event_hook(RepairEventHook hook);

// Overrides MENDER_EVENT_LOG. An empty path falls back to the variable.
void set_event_log_path(const std::string& path);

// ---------------------------------------------------------------------------
// ScopeTimer: RAII wall-clock capture in milliseconds
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ms;
  explicit ScopeTimer(std::uint64_t& out) : out_ms(out) {}
  ~ScopeTimer() {
    out_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
  }
};

}  // namespace mender
