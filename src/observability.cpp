#include "mender/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "mender/jsonlite.hpp"
#include "mender/version.hpp"

namespace mender {

namespace {

// bit_width gives floor(log2(x)) + 1 for x > 0 without a search loop.
inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const std::size_t b = static_cast<std::size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::string fixed(double v, const char* fmt) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), fmt, v);
  return buf;
}

}  // namespace

std::string to_string(RepairEventKind kind) {
  switch (kind) {
    case RepairEventKind::trace: return "trace";
    case RepairEventKind::patch: return "patch";
    case RepairEventKind::session: return "session";
  }
  return "unknown";
}

std::string event_to_json(const RepairEvent& ev) {
  jsonlite::Object o;
  o["v"] = static_cast<std::uint64_t>(version::EVENT_LOG_VERSION);
  o["kind"] = to_string(ev.kind);
  o["session_id"] = ev.session_id;
  o["iteration"] = static_cast<std::uint64_t>(ev.iteration);
  o["artifact_digest"] = ev.artifact_digest;
  o["duration_ms"] = ev.duration_ms;
  switch (ev.kind) {
    case RepairEventKind::trace:
      o["ok"] = ev.ok;
      o["infrastructure"] = ev.infrastructure;
      o["timed_out"] = ev.timed_out;
      o["exit_status"] = static_cast<double>(ev.exit_status);
      if (!ev.category.empty()) o["category"] = ev.category;
      break;
    case RepairEventKind::patch:
      o["strategy"] = ev.strategy;
      o["advisory_fallback"] = ev.advisory_fallback;
      o["substituted"] = ev.substituted;
      o["edits"] = static_cast<std::uint64_t>(ev.edit_count);
      o["category"] = ev.category;
      break;
    case RepairEventKind::session:
      o["state"] = to_string(ev.state);
      if (ev.abort_code != ErrorCode::none) o["abort_code"] = to_string(ev.abort_code);
      break;
  }
  return jsonlite::to_json(o);
}

std::optional<RepairEvent> event_from_json(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(line, &err);
  if (err || jsonlite::get_u64(o, "v") != version::EVENT_LOG_VERSION) return std::nullopt;

  RepairEvent ev;
  const std::string kind = jsonlite::get_string(o, "kind");
  if (kind == "trace") ev.kind = RepairEventKind::trace;
  else if (kind == "patch") ev.kind = RepairEventKind::patch;
  else if (kind == "session") ev.kind = RepairEventKind::session;
  else return std::nullopt;

  ev.session_id = jsonlite::get_string(o, "session_id");
  ev.iteration = static_cast<std::uint32_t>(jsonlite::get_u64(o, "iteration"));
  ev.artifact_digest = jsonlite::get_string(o, "artifact_digest");
  ev.duration_ms = jsonlite::get_u64(o, "duration_ms");
  ev.category = jsonlite::get_string(o, "category");
  ev.ok = jsonlite::get_bool(o, "ok");
  ev.infrastructure = jsonlite::get_bool(o, "infrastructure");
  ev.timed_out = jsonlite::get_bool(o, "timed_out");
  ev.exit_status = static_cast<int>(jsonlite::get_double(o, "exit_status"));
  ev.strategy = jsonlite::get_string(o, "strategy");
  ev.advisory_fallback = jsonlite::get_bool(o, "advisory_fallback");
  ev.substituted = jsonlite::get_bool(o, "substituted");
  ev.edit_count = static_cast<std::size_t>(jsonlite::get_u64(o, "edits"));
  const std::string state = jsonlite::get_string(o, "state");
  if (state == "success") ev.state = SessionState::success;
  else if (state == "aborted") ev.state = SessionState::aborted;
  return ev;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record_us(std::uint64_t duration_us) {
  buckets_[bucket_for_us(duration_us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(duration_us, std::memory_order_relaxed);
}

void LatencyHistogram::record_ms(std::uint64_t duration_ms) { record_us(duration_ms * 1000u); }

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  std::uint64_t target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  if (target == 0) target = 1;
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      // Midpoint of the bucket.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_ms\":";
  out += fixed(mean_us() / 1000.0, "%.3f");
  out += ",\"p50_ms\":";
  out += fixed(percentile(0.50) / 1000.0, "%.3f");
  out += ",\"p95_ms\":";
  out += fixed(percentile(0.95) / 1000.0, "%.3f");
  out += ",\"p99_ms\":";
  out += fixed(percentile(0.99) / 1000.0, "%.3f");
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record(const RepairEvent& ev) {
  switch (ev.kind) {
    case RepairEventKind::trace:
      executions.fetch_add(1, std::memory_order_relaxed);
      if (ev.ok) {
        successful_executions.fetch_add(1, std::memory_order_relaxed);
      } else {
        failed_executions.fetch_add(1, std::memory_order_relaxed);
        if (!ev.category.empty()) {
          std::lock_guard<std::mutex> lk(category_mu_);
          ++failure_categories_[ev.category];
        }
      }
      if (ev.timed_out) timeouts.fetch_add(1, std::memory_order_relaxed);
      if (ev.infrastructure) infrastructure_faults.fetch_add(1, std::memory_order_relaxed);
      sandbox_latency.record_ms(ev.duration_ms);
      break;
    case RepairEventKind::patch:
      patches.fetch_add(1, std::memory_order_relaxed);
      if (ev.strategy == "advisory") advisory_patches.fetch_add(1, std::memory_order_relaxed);
      if (ev.advisory_fallback) advisory_fallbacks.fetch_add(1, std::memory_order_relaxed);
      if (ev.strategy == "advisory" || ev.advisory_fallback) advisory_latency.record_ms(ev.duration_ms);
      if (ev.substituted) rejected_candidates.fetch_add(1, std::memory_order_relaxed);
      patch_latency.record_ms(ev.duration_ms);
      break;
    case RepairEventKind::session:
      if (ev.state == SessionState::success) {
        sessions_succeeded.fetch_add(1, std::memory_order_relaxed);
      } else if (ev.state == SessionState::aborted) {
        sessions_aborted.fetch_add(1, std::memory_order_relaxed);
      }
      break;
  }
}

std::map<std::string, std::uint64_t> EngineStats::failure_categories_snapshot() const {
  std::lock_guard<std::mutex> lk(category_mu_);
  return failure_categories_;
}

std::string EngineStats::to_json() const {
  auto load = [](const std::atomic<std::uint64_t>& a) {
    return std::to_string(a.load(std::memory_order_relaxed));
  };
  const std::uint64_t total = executions.load(std::memory_order_relaxed);
  const std::uint64_t ok = successful_executions.load(std::memory_order_relaxed);
  const double success_rate = total > 0 ? static_cast<double>(ok) / static_cast<double>(total) : 0.0;

  std::string out;
  out.reserve(1024);
  out += "{\"executions\":{\"total\":";
  out += std::to_string(total);
  out += ",\"successful\":";
  out += std::to_string(ok);
  out += ",\"failed\":";
  out += load(failed_executions);
  out += ",\"timeouts\":";
  out += load(timeouts);
  out += ",\"infrastructure_faults\":";
  out += load(infrastructure_faults);
  out += ",\"success_rate\":";
  out += fixed(success_rate, "%.6f");
  out += "}";

  out += ",\"patches\":{\"total\":";
  out += load(patches);
  out += ",\"advisory\":";
  out += load(advisory_patches);
  out += ",\"advisory_fallbacks\":";
  out += load(advisory_fallbacks);
  out += ",\"rejected_candidates\":";
  out += load(rejected_candidates);
  out += "}";

  out += ",\"sessions\":{\"succeeded\":";
  out += load(sessions_succeeded);
  out += ",\"aborted\":";
  out += load(sessions_aborted);
  out += "}";

  out += ",\"latency\":{\"sandbox\":";
  out += sandbox_latency.to_json();
  out += ",\"patch\":";
  out += patch_latency.to_json();
  out += ",\"advisory\":";
  out += advisory_latency.to_json();
  out += "}";

  out += ",\"failure_categories\":{";
  bool first = true;
  for (const auto& [name, n] : failure_categories_snapshot()) {
    if (!first) out += ',';
    first = false;
    out += '"';
    out += jsonlite::escape(name);
    out += "\":";
    out += std::to_string(n);
  }
  out += "}}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

namespace {
std::atomic<RepairEventHook> g_event_hook{nullptr};
std::mutex g_log_mu;
std::string g_log_path;
}  // namespace

void set_repair_event_hook(RepairEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_log_path = path;
}

void emit_repair_event(const RepairEvent& ev) {
  global_engine_stats().record(ev);

  if (RepairEventHook hook = g_event_hook.load(std::memory_order_acquire)) hook(ev);

  std::lock_guard<std::mutex> lk(g_log_mu);
  std::string path = g_log_path;
  if (path.empty()) {
    const char* env = std::getenv("MENDER_EVENT_LOG");
    if (!env || !env[0]) return;
    path = env;
  }
  const std::string line = event_to_json(ev) + "\n";
  // Serialized by g_log_mu; one fwrite per line keeps lines whole.
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace mender
