#pragma once

// mender/patch.hpp: Patch strategies.
//
// IPatchStrategy::generate() turns (program, failure context) into a candidate
// replacement program. Both shipped strategies always return a non-empty
// program together with a non-empty explanation and rationale:
//
//   RuleBasedStrategy  deterministic mechanical fixes keyed on the category.
//   AdvisoryStrategy   asks an Ollama-compatible text-generation service and
//                      falls back to RuleBasedStrategy on any failure.
//
// Strategy selection happens once, from configuration (make_strategy()).

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

#include "mender/types.hpp"

namespace mender {

struct PatchResult {
  std::string explanation;
  std::string program;
  std::string rationale;
  std::uint64_t elapsed_ms{0};
  std::string strategy;        // "rule_based" | "advisory"
  bool deterministic{true};    // same input always yields the same program
  bool advisory_fallback{false};
  ErrorCode fallback_code{ErrorCode::none};
};

class IPatchStrategy {
 public:
  virtual ~IPatchStrategy() = default;
  virtual std::string name() const = 0;
  virtual PatchResult generate(const SourceArtifact& program, const FailureContext& context) = 0;
};

// ---------------------------------------------------------------------------
// RuleBasedStrategy
// ---------------------------------------------------------------------------
class RuleBasedStrategy : public IPatchStrategy {
 public:
  std::string name() const override { return "rule_based"; }
  PatchResult generate(const SourceArtifact& program, const FailureContext& context) override;
};

// ---------------------------------------------------------------------------
// HTTP transport
// ---------------------------------------------------------------------------
struct HttpResponse {
  long status{0};
  std::string body;
  ErrorCode error{ErrorCode::none};  // advisory_unreachable | advisory_timeout
  std::string error_message;
};

class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;
  virtual HttpResponse post_json(const std::string& url, const std::string& body,
                                 std::uint64_t timeout_ms) = 0;
  virtual HttpResponse get(const std::string& url, std::uint64_t timeout_ms) = 0;
};

// libcurl-backed transport. One easy handle per call, so a single instance may
// be shared by concurrent sessions.
class CurlTransport : public IHttpTransport {
 public:
  CurlTransport();
  HttpResponse post_json(const std::string& url, const std::string& body,
                         std::uint64_t timeout_ms) override;
  HttpResponse get(const std::string& url, std::uint64_t timeout_ms) override;
};

// ---------------------------------------------------------------------------
// AdvisoryStrategy
// ---------------------------------------------------------------------------
struct AdvisoryOptions {
  std::string base_url{"http://localhost:11434"};
  std::string model{"llama3"};
  std::uint64_t timeout_ms{30000};
  std::uint64_t probe_timeout_ms{2000};
};

struct ParsedCandidate {
  std::string explanation;
  std::string program;
  std::string rationale;
};

struct FallbackRequired {
  ErrorCode code{ErrorCode::advisory_malformed};
  std::string reason;
};

using AdvisoryParse = std::variant<ParsedCandidate, FallbackRequired>;

std::string build_advisory_prompt(const SourceArtifact& program, const FailureContext& context);
std::string build_advisory_request(const AdvisoryOptions& options, const std::string& prompt);

// Strict parse of the service response: envelope JSON, then the inner JSON in
// "response", then a non-empty "fixed_code".
AdvisoryParse parse_advisory_response(const HttpResponse& response);

// Strips markdown fences and, when the body has no real newline, expands
// literal \n \t \" \' \\ sequences.
std::string normalize_candidate_code(std::string code);

struct AdvisoryProbe {
  bool available{false};
  std::string detail;
};

class AdvisoryStrategy : public IPatchStrategy {
 public:
  AdvisoryStrategy(AdvisoryOptions options, std::shared_ptr<IHttpTransport> transport,
                   std::shared_ptr<IPatchStrategy> fallback);

  std::string name() const override { return "advisory"; }
  PatchResult generate(const SourceArtifact& program, const FailureContext& context) override;

  AdvisoryProbe probe();
  const AdvisoryOptions& options() const { return options_; }

 private:
  AdvisoryOptions options_;
  std::shared_ptr<IHttpTransport> transport_;
  std::shared_ptr<IPatchStrategy> fallback_;
};

}  // namespace mender
