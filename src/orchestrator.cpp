#include "mender/orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include "mender/classifier.hpp"
#include "mender/hash.hpp"
#include "mender/observability.hpp"

namespace mender {

namespace {

std::atomic<std::uint64_t> g_session_seq{0};

std::string new_session_id(const SourceArtifact& original) {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const std::string seed = original.digest + ":" +
                           std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count()) + ":" +
                           std::to_string(g_session_seq.fetch_add(1, std::memory_order_relaxed));
  return hash_domain("session:", seed).substr(0, 32);
}

void emit_trace(const RepairSession& s, const ExecutionTrace& t) {
  RepairEvent ev;
  ev.kind = RepairEventKind::trace;
  ev.session_id = s.session_id;
  ev.iteration = t.iteration;
  ev.artifact_digest = t.artifact.digest;
  ev.ok = t.ok;
  ev.category = t.category.value_or("");
  ev.infrastructure = t.infrastructure;
  ev.timed_out = t.timed_out;
  ev.exit_status = t.exit_status;
  ev.duration_ms = t.duration_ms;
  emit_repair_event(ev);
}

void emit_patch(const RepairSession& s, const PatchRecord& p, const std::string& category) {
  RepairEvent ev;
  ev.kind = RepairEventKind::patch;
  ev.session_id = s.session_id;
  ev.iteration = p.iteration;
  ev.artifact_digest = p.after.digest;
  ev.category = category;
  ev.duration_ms = p.generation_ms;
  ev.strategy = p.strategy;
  ev.advisory_fallback = p.advisory_fallback;
  ev.substituted = p.substituted;
  ev.edit_count = p.edits.size();
  emit_repair_event(ev);
}

void emit_session(const RepairSession& s) {
  RepairEvent ev;
  ev.kind = RepairEventKind::session;
  ev.session_id = s.session_id;
  ev.iteration = s.total_iterations;
  ev.artifact_digest = s.current.digest;
  ev.state = s.state;
  ev.abort_code = s.abort_code;
  emit_repair_event(ev);
}

}  // namespace

RepairOrchestrator::RepairOrchestrator(SandboxExecutor executor, std::shared_ptr<IPatchStrategy> strategy,
                                       PatchValidator validator, OrchestratorOptions options,
                                       std::vector<std::shared_ptr<IHeuristicCheck>> checks)
    : executor_(std::move(executor)),
      strategy_(std::move(strategy)),
      validator_(std::move(validator)),
      options_(options),
      checks_(std::move(checks)) {
  if (options_.max_iterations < 1) options_.max_iterations = 1;
  if (options_.max_infra_failures < 1) options_.max_infra_failures = 1;
  if (options_.max_stalled_patches < 1) options_.max_stalled_patches = 1;
}

RepairSession RepairOrchestrator::begin(const std::string& program) const {
  RepairSession s;
  s.original = make_artifact(program);
  s.current = s.original;
  s.session_id = new_session_id(s.original);
  s.state = SessionState::running;
  return s;
}

void RepairOrchestrator::abort(RepairSession& session, ErrorCode code, std::string reason) const {
  session.state = SessionState::aborted;
  session.abort_code = code;
  session.failure_reason = std::move(reason);
  emit_session(session);
}

void RepairOrchestrator::succeed(RepairSession& session) const {
  session.state = SessionState::success;
  for (const auto& check : checks_) {
    auto found = check->check(session.current);
    session.findings.insert(session.findings.end(), found.begin(), found.end());
  }
  emit_session(session);
}

void RepairOrchestrator::wait_before_retry(const CancelToken* cancel) const {
  using namespace std::chrono;
  const auto deadline = steady_clock::now() + milliseconds(options_.infra_retry_delay_ms);
  while (steady_clock::now() < deadline) {
    if (cancel && cancel->cancelled()) return;
    const auto left = duration_cast<milliseconds>(deadline - steady_clock::now());
    std::this_thread::sleep_for(std::min(left, milliseconds(50)));
  }
}

void RepairOrchestrator::step(RepairSession& session, const CancelToken* cancel) const {
  if (session.terminal()) return;

  const auto iteration = static_cast<std::uint32_t>(session.traces.size() + 1);
  session.traces.push_back(executor_.execute(session.current, iteration));
  session.total_iterations = static_cast<std::uint32_t>(session.traces.size());
  const ExecutionTrace& trace = session.traces.back();
  emit_trace(session, trace);

  if (trace.ok) {
    succeed(session);
    return;
  }

  const std::string cat = trace.category.value_or(category::kGenericRuntime);
  if (trace.infrastructure) {
    ++session.consecutive_infra_failures;
  } else {
    session.consecutive_infra_failures = 0;
  }

  if (session.traces.size() >= options_.max_iterations) {
    abort(session, ErrorCode::max_iterations, "max iterations reached");
    return;
  }
  if (cancel && cancel->cancelled()) {
    abort(session, ErrorCode::cancelled, "cancelled");
    return;
  }
  if (trace.infrastructure && session.consecutive_infra_failures >= options_.max_infra_failures) {
    abort(session, ErrorCode::infrastructure_persistent, "sandbox infrastructure unavailable: " + cat);
    return;
  }

  const FailureContext context = failure_context(trace);
  PatchResult result = strategy_->generate(session.current, context);
  ValidatedPatch validated = validator_.validate_and_diff(session.current, result.program, context);

  if (!trace.infrastructure && validated.accepted_program == session.current.text) {
    const bool deterministic = result.deterministic || validated.substituted;
    ++session.stalled_patches;
    if (deterministic || session.stalled_patches >= options_.max_stalled_patches) {
      abort(session, ErrorCode::no_progress, "no further progress: " + cat + " requires manual review");
      return;
    }
  } else if (!trace.infrastructure) {
    session.stalled_patches = 0;
  }

  PatchRecord record;
  record.iteration = iteration;
  record.before = session.current;
  record.after = make_artifact(std::move(validated.accepted_program));
  record.unified_diff = std::move(validated.unified_diff);
  record.edits = std::move(validated.edits);
  record.generation_ms = result.elapsed_ms;
  record.advisory_fallback = result.advisory_fallback;
  record.substituted = validated.substituted;
  record.rejection_reason = std::move(validated.rejection_reason);
  if (validated.substituted) {
    record.explanation = std::move(validated.substitute_explanation);
    record.rationale = "Candidate rejected (" + record.rejection_reason + "). " + validated.substitute_rationale;
    record.strategy = "rule_based";
  } else {
    record.explanation = std::move(result.explanation);
    record.rationale = std::move(result.rationale);
    record.strategy = std::move(result.strategy);
  }

  session.current = record.after;
  session.patches.push_back(std::move(record));
  emit_patch(session, session.patches.back(), cat);

  if (trace.infrastructure) wait_before_retry(cancel);
}

RepairSession RepairOrchestrator::run(const std::string& program, const CancelToken* cancel) const {
  RepairSession session = begin(program);
  while (!session.terminal()) step(session, cancel);
  return session;
}

// ---------------------------------------------------------------------------
// Assembly
// ---------------------------------------------------------------------------

std::shared_ptr<ISandboxBackend> make_backend(const EngineConfig& cfg) {
  if (cfg.backend == "docker") {
    DockerOptions opts;
    opts.docker_binary = cfg.docker_binary;
    opts.image = cfg.docker_image;
    return std::make_shared<DockerSandboxBackend>(opts);
  }
  return std::make_shared<ProcessSandboxBackend>(cfg.interpreter);
}

std::shared_ptr<IPatchStrategy> make_strategy(const EngineConfig& cfg, std::shared_ptr<IHttpTransport> transport) {
  auto rules = std::make_shared<RuleBasedStrategy>();
  if (cfg.strategy != "advisory") return rules;
  if (!transport) transport = std::make_shared<CurlTransport>();
  AdvisoryOptions opts;
  opts.base_url = cfg.advisory_url;
  opts.model = cfg.advisory_model;
  opts.timeout_ms = cfg.advisory_timeout_ms;
  return std::make_shared<AdvisoryStrategy>(opts, std::move(transport), rules);
}

ExecutorLimits make_limits(const EngineConfig& cfg) {
  ExecutorLimits limits;
  limits.memory_limit_mb = cfg.memory_limit_mb;
  limits.exec_timeout_ms = cfg.exec_timeout_ms;
  limits.max_output_bytes = static_cast<std::size_t>(cfg.max_output_bytes);
  limits.staging_root = cfg.staging_root;
  return limits;
}

OrchestratorOptions make_options(const EngineConfig& cfg) {
  OrchestratorOptions o;
  o.max_iterations = static_cast<std::uint32_t>(cfg.max_iterations);
  o.max_infra_failures = static_cast<std::uint32_t>(cfg.max_infra_failures);
  o.max_stalled_patches = static_cast<std::uint32_t>(cfg.max_stalled_patches);
  o.infra_retry_delay_ms = cfg.effective_retry_delay_ms();
  return o;
}

RepairOrchestrator make_orchestrator(const EngineConfig& cfg, std::shared_ptr<IHttpTransport> transport) {
  std::vector<std::shared_ptr<IHeuristicCheck>> checks;
  if (cfg.heuristics) checks = default_heuristic_checks();
  return RepairOrchestrator(SandboxExecutor(make_backend(cfg), make_limits(cfg)),
                            make_strategy(cfg, std::move(transport)),
                            PatchValidator(std::make_shared<RuleBasedStrategy>(), cfg.min_length_ratio),
                            make_options(cfg), std::move(checks));
}

}  // namespace mender
