#include "mender/session_io.hpp"

#include <unistd.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

#if defined(MENDER_WITH_ZSTD)
#include <zstd.h>
#endif

#include "mender/hash.hpp"
#include "mender/jsonlite.hpp"
#include "mender/version.hpp"

namespace fs = std::filesystem;

namespace mender {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

Object artifact_object(const SourceArtifact& a) {
  Object o;
  o["text"] = a.text;
  o["digest"] = a.digest;
  return o;
}

Object trace_object(const ExecutionTrace& t) {
  Object o;
  o["iteration"] = static_cast<std::uint64_t>(t.iteration);
  o["timestamp_ms"] = t.timestamp_ms;
  o["artifact_digest"] = t.artifact.digest;
  o["ok"] = t.ok;
  o["output"] = t.output;
  o["category"] = t.category ? Value(*t.category) : Value(nullptr);
  o["detail"] = t.detail ? Value(*t.detail) : Value(nullptr);
  o["failing_line"] = t.failing_line ? Value(static_cast<std::uint64_t>(*t.failing_line)) : Value(nullptr);
  Array lines;
  for (const auto& l : t.output_lines) lines.emplace_back(l);
  o["output_lines"] = std::move(lines);
  o["duration_ms"] = t.duration_ms;
  o["exit_status"] = static_cast<double>(t.exit_status);
  o["timed_out"] = t.timed_out;
  o["infrastructure"] = t.infrastructure;
  if (t.error_code != ErrorCode::none) o["error_code"] = to_string(t.error_code);
  o["digest"] = trace_digest(jsonlite::to_json(o));
  return o;
}

Object edit_object(const LineEdit& e) {
  Object o;
  o["op"] = to_string(e.kind);
  o["old_line"] = static_cast<std::uint64_t>(e.old_line);
  o["new_line"] = static_cast<std::uint64_t>(e.new_line);
  if (e.kind != EditKind::insert) o["old_text"] = e.old_text;
  if (e.kind != EditKind::remove) o["new_text"] = e.new_text;
  return o;
}

Object patch_object(const PatchRecord& p) {
  Object o;
  o["iteration"] = static_cast<std::uint64_t>(p.iteration);
  o["before_digest"] = p.before.digest;
  o["after"] = artifact_object(p.after);
  o["unified_diff"] = p.unified_diff;
  Array edits;
  for (const auto& e : p.edits) edits.emplace_back(edit_object(e));
  o["edits"] = std::move(edits);
  o["explanation"] = p.explanation;
  o["rationale"] = p.rationale;
  o["generation_ms"] = p.generation_ms;
  o["strategy"] = p.strategy;
  o["advisory_fallback"] = p.advisory_fallback;
  o["substituted"] = p.substituted;
  if (p.substituted) o["rejection_reason"] = p.rejection_reason;
  return o;
}

bool atomic_write(const fs::path& target, const std::string& data, std::string& error) {
  std::error_code ec;
  if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);
  const std::string tmp = target.string() + ".tmp." + std::to_string(::getpid());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      error = "cannot open " + tmp;
      return false;
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      error = "short write to " + tmp;
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    error = "rename to " + target.string() + ": " + ec.message();
    return false;
  }
  return true;
}

#if defined(MENDER_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  const size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data) {
  const unsigned long long size = ZSTD_getFrameContentSize(data.data(), data.size());
  if (size == ZSTD_CONTENTSIZE_ERROR || size == ZSTD_CONTENTSIZE_UNKNOWN) return std::nullopt;
  std::string out;
  out.resize(static_cast<std::size_t>(size));
  const size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
}
#endif

// zstd frame magic, little-endian 0xFD2FB528.
bool has_zstd_magic(const std::string& data) {
  return data.size() >= 4 && static_cast<unsigned char>(data[0]) == 0x28 &&
         static_cast<unsigned char>(data[1]) == 0xB5 && static_cast<unsigned char>(data[2]) == 0x2F &&
         static_cast<unsigned char>(data[3]) == 0xFD;
}

}  // namespace

std::string trace_to_json(const ExecutionTrace& trace) { return jsonlite::to_json(trace_object(trace)); }

std::string patch_to_json(const PatchRecord& patch) { return jsonlite::to_json(patch_object(patch)); }

std::string session_to_json(const RepairSession& s) {
  Object o;
  o["format_version"] = static_cast<std::uint64_t>(version::SESSION_FORMAT_VERSION);
  o["session_id"] = s.session_id;
  o["state"] = to_string(s.state);
  o["failure_reason"] = s.failure_reason;
  if (s.abort_code != ErrorCode::none) o["abort_code"] = to_string(s.abort_code);
  o["total_iterations"] = static_cast<std::uint64_t>(s.total_iterations);
  o["original"] = artifact_object(s.original);
  o["final"] = artifact_object(s.current);
  Array traces;
  for (const auto& t : s.traces) traces.emplace_back(trace_object(t));
  o["traces"] = std::move(traces);
  Array patches;
  for (const auto& p : s.patches) patches.emplace_back(patch_object(p));
  o["patches"] = std::move(patches);
  Array findings;
  for (const auto& f : s.findings) {
    Object fo;
    fo["check"] = f.check;
    fo["symbol"] = f.symbol;
    fo["line"] = static_cast<std::uint64_t>(f.line);
    fo["message"] = f.message;
    findings.emplace_back(std::move(fo));
  }
  o["findings"] = std::move(findings);
  return jsonlite::to_json(o);
}

bool zstd_available() {
#if defined(MENDER_WITH_ZSTD)
  return true;
#else
  return false;
#endif
}

ExportResult export_session(const RepairSession& session, const std::string& path, bool compress) {
  ExportResult r;
  std::string data = session_to_json(session);
  r.encoding = "identity";
#if defined(MENDER_WITH_ZSTD)
  if (compress) {
    std::string c = compress_zstd(data);
    if (c.empty()) {
      r.error = "zstd compression failed";
      return r;
    }
    data = std::move(c);
    r.encoding = "zstd";
  }
#else
  (void)compress;
#endif
  if (!atomic_write(path, data, r.error)) return r;
  r.ok = true;
  r.bytes_written = data.size();
  return r;
}

std::optional<std::string> read_exported(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::ostringstream ss;
  ss << ifs.rdbuf();
  std::string data = ss.str();
  if (!has_zstd_magic(data)) return data;
#if defined(MENDER_WITH_ZSTD)
  return decompress_zstd(data);
#else
  return std::nullopt;
#endif
}

}  // namespace mender
