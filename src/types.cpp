#include "mender/types.hpp"

#include "mender/hash.hpp"

namespace mender {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::staging_write_failed: return "staging_write_failed";
    case ErrorCode::backend_unreachable: return "backend_unreachable";
    case ErrorCode::image_missing: return "image_missing";
    case ErrorCode::allocation_failed: return "allocation_failed";
    case ErrorCode::backend_api_error: return "backend_api_error";
    case ErrorCode::advisory_unreachable: return "advisory_unreachable";
    case ErrorCode::advisory_timeout: return "advisory_timeout";
    case ErrorCode::advisory_bad_status: return "advisory_bad_status";
    case ErrorCode::advisory_malformed: return "advisory_malformed";
    case ErrorCode::candidate_rejected: return "candidate_rejected";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::max_iterations: return "max_iterations";
    case ErrorCode::cancelled: return "cancelled";
    case ErrorCode::no_progress: return "no_progress";
    case ErrorCode::infrastructure_persistent: return "infrastructure_persistent";
  }
  return "";
}

std::string to_string(EditKind kind) {
  switch (kind) {
    case EditKind::insert: return "insert";
    case EditKind::remove: return "delete";
    case EditKind::replace: return "replace";
  }
  return "";
}

std::string to_string(SessionState state) {
  switch (state) {
    case SessionState::running: return "running";
    case SessionState::success: return "success";
    case SessionState::aborted: return "aborted";
  }
  return "";
}

namespace category {
bool is_infrastructure(const std::string& c) {
  return c == kSandboxUnavailable || c == kImageNotFound ||
         c == kSandboxAllocation || c == kSandboxApi || c == kStagingWrite;
}
}  // namespace category

SourceArtifact make_artifact(std::string text) {
  SourceArtifact a;
  a.digest = artifact_digest(text);
  a.text = std::move(text);
  return a;
}

std::vector<std::string> non_empty_lines(const std::string& text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string::npos) end = text.size();
    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") != std::string::npos) out.push_back(std::move(line));
    start = end + 1;
  }
  return out;
}

}  // namespace mender
