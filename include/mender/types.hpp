#pragma once

// mender/types.hpp: Core data structures for the Mender repair engine.
//
// OWNERSHIP:
//   - SourceArtifact, ExecutionTrace, PatchRecord and RepairSession are value
//     types. Every member is value-owned; no borrowed references or raw pointers.
//   - ExecutionTrace is produced only by SandboxExecutor::execute() and returned
//     by value. Nothing downstream edits it.
//   - RepairSession is returned by value from RepairOrchestrator. The caller owns
//     it; there is no process-wide session registry.
//
// SESSION INVARIANTS:
//   - patches.size() == traces.size() - 1 whenever traces is non-empty.
//   - traces.back().artifact == patches.back().after (or == original when no
//     patch exists).
//   - state == aborted  =>  !failure_reason.empty().

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mender {

enum class ErrorCode {
  none,
  json_parse_error,
  json_duplicate_key,
  spawn_failed,
  timeout,
  staging_write_failed,
  backend_unreachable,
  image_missing,
  allocation_failed,
  backend_api_error,
  advisory_unreachable,
  advisory_timeout,
  advisory_bad_status,
  advisory_malformed,
  candidate_rejected,
  config_invalid,
  max_iterations,
  cancelled,
  no_progress,
  infrastructure_persistent,
};

std::string to_string(ErrorCode code);

// Symbolic failure categories. Program-level categories are open-ended (any
// Python exception name); the ones below are the synthetic and infrastructure
// categories the engine itself produces.
namespace category {
inline constexpr const char* kTimeout = "TimeoutError";
inline constexpr const char* kMemory = "MemoryError";
inline constexpr const char* kModuleNotFound = "ModuleNotFoundError";
inline constexpr const char* kGenericRuntime = "RuntimeError";
inline constexpr const char* kSandboxUnavailable = "SandboxUnavailableError";
inline constexpr const char* kImageNotFound = "ImageNotFoundError";
inline constexpr const char* kSandboxAllocation = "SandboxAllocationError";
inline constexpr const char* kSandboxApi = "SandboxApiError";
inline constexpr const char* kStagingWrite = "StagingWriteError";

// True for categories produced by backend faults rather than by the program.
bool is_infrastructure(const std::string& category);
}  // namespace category

// ---------------------------------------------------------------------------
// SourceArtifact: immutable program text plus its BLAKE3 content digest.
// ---------------------------------------------------------------------------
struct SourceArtifact {
  std::string text;
  std::string digest;  // hash_domain("src:", text), 64 hex chars

  bool operator==(const SourceArtifact& other) const { return text == other.text; }
};

SourceArtifact make_artifact(std::string text);

// ---------------------------------------------------------------------------
// FailureContext: what the patch strategies see about a failed run.
// ---------------------------------------------------------------------------
struct FailureContext {
  std::string category;
  std::string detail;          // text after "<Category>:" on the matched line
  std::uint32_t line{0};       // 1-based failing line in the program, 0 = unknown
  std::string undefined_name;  // NameError only
  std::string output;          // raw combined output
  bool infrastructure{false};
};

// ---------------------------------------------------------------------------
// ExecutionTrace: one sandbox run.
// ---------------------------------------------------------------------------
struct ExecutionTrace {
  std::uint32_t iteration{0};
  std::uint64_t timestamp_ms{0};  // unix epoch, milliseconds
  SourceArtifact artifact;
  bool ok{false};
  std::string output;             // combined stdout + stderr
  std::optional<std::string> category;
  std::optional<std::string> detail;
  std::optional<std::uint32_t> failing_line;
  std::vector<std::string> output_lines;  // non-empty lines of output
  std::uint64_t duration_ms{0};
  int exit_status{0};
  bool timed_out{false};
  bool infrastructure{false};
  ErrorCode error_code{ErrorCode::none};
};

std::vector<std::string> non_empty_lines(const std::string& text);

// ---------------------------------------------------------------------------
// LineEdit: one line-level operation of a structured diff.
// ---------------------------------------------------------------------------
//   insert:  new_text becomes line new_line of the candidate; it is placed
//            before original line old_line (old_line = original size + 1 at EOF).
//   remove:  original line old_line is dropped.
//   replace: original line old_line becomes new_text at candidate line new_line.
enum class EditKind { insert, remove, replace };

std::string to_string(EditKind kind);

struct LineEdit {
  EditKind kind{EditKind::insert};
  std::uint32_t old_line{0};
  std::uint32_t new_line{0};
  std::string old_text;
  std::string new_text;
};

// ---------------------------------------------------------------------------
// PatchRecord: one patch generation + validation event.
// ---------------------------------------------------------------------------
struct PatchRecord {
  std::uint32_t iteration{0};
  SourceArtifact before;
  SourceArtifact after;
  std::string unified_diff;
  std::vector<LineEdit> edits;
  std::string explanation;   // one sentence
  std::string rationale;     // longer reasoning
  std::uint64_t generation_ms{0};
  std::string strategy;      // "advisory" | "rule_based"
  bool advisory_fallback{false};
  bool substituted{false};   // validator replaced the candidate
  std::string rejection_reason;
};

// ---------------------------------------------------------------------------
// RepairSession: aggregate root of one repair request.
// ---------------------------------------------------------------------------
enum class SessionState { running, success, aborted };

std::string to_string(SessionState state);

struct HeuristicFinding {
  std::string check;
  std::string symbol;
  std::uint32_t line{0};
  std::string message;
};

struct RepairSession {
  std::string session_id;
  SourceArtifact original;
  SourceArtifact current;  // final artifact once terminal
  std::vector<ExecutionTrace> traces;
  std::vector<PatchRecord> patches;
  std::uint32_t total_iterations{0};
  SessionState state{SessionState::running};
  std::string failure_reason;
  ErrorCode abort_code{ErrorCode::none};
  std::vector<HeuristicFinding> findings;

  // Bookkeeping for the orchestrator's retry policy.
  std::uint32_t consecutive_infra_failures{0};
  std::uint32_t stalled_patches{0};

  bool terminal() const { return state != SessionState::running; }
  bool success() const { return state == SessionState::success; }
};

}  // namespace mender
