#pragma once

// mender/session_io.hpp: Read-only JSON rendering and file export of sessions.
//
// Layout is versioned by version::SESSION_FORMAT_VERSION. Each trace carries
// a "digest" = trace_digest() of the trace rendered without that field, so an
// exported session can be checked for tampering trace by trace.

#include <cstdint>
#include <optional>
#include <string>

#include "mender/types.hpp"

namespace mender {

std::string trace_to_json(const ExecutionTrace& trace);
std::string patch_to_json(const PatchRecord& patch);
std::string session_to_json(const RepairSession& session);

struct ExportResult {
  bool ok{false};
  std::string encoding;  // "identity" | "zstd"
  std::size_t bytes_written{0};
  std::string error;
};

// Writes session_to_json() to path atomically (temp file + rename). With
// compress=true and zstd support compiled in, the file is one zstd frame;
// without zstd support the file is written uncompressed.
ExportResult export_session(const RepairSession& session, const std::string& path, bool compress);

// Reads an exported file back, decompressing a zstd frame when present.
std::optional<std::string> read_exported(const std::string& path);

bool zstd_available();

}  // namespace mender
