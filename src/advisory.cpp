#include "mender/patch.hpp"

// Advisory patch source: an Ollama-compatible /api/generate endpoint asked for
// a JSON object {explanation, fixed_code, reasoning}. The service is untrusted
// and optional; every failure mode lands in FallbackRequired and the rule-based
// strategy answers instead.

#include <chrono>

#include "mender/jsonlite.hpp"

namespace mender {

namespace {

constexpr const char* kSandboxRules =
    "You are an expert Python debugging assistant. The program runs in a RESTRICTED SANDBOX.\n"
    "\n"
    "RULES:\n"
    "1. The sandbox has NO network access.\n"
    "2. Packages cannot be installed (pip is disabled).\n"
    "3. Third-party libraries such as numpy, pandas or scipy are NOT available.\n"
    "4. Fix the code using ONLY the Python standard library.\n"
    "5. Keep every existing function and class; return the COMPLETE program.\n"
    "\n"
    "Respond with ONLY a valid JSON object:\n"
    "{\n"
    "  \"explanation\": \"Single sentence explaining the bug and the fix\",\n"
    "  \"fixed_code\": \"Complete corrected Python program\",\n"
    "  \"reasoning\": \"Step-by-step analysis\"\n"
    "}";

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string strip_fences(std::string s) {
  s = trim(s);
  if (s.rfind("```", 0) == 0) {
    const auto nl = s.find('\n');
    s = nl == std::string::npos ? s.substr(3) : s.substr(nl + 1);
  }
  if (s.size() >= 3 && s.compare(s.size() - 3, 3, "```") == 0) s.resize(s.size() - 3);
  return trim(s);
}

std::string unescape_literals(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 1 < s.size()) {
      const char n = s[i + 1];
      if (n == 'n') { out += '\n'; ++i; continue; }
      if (n == 't') { out += '\t'; ++i; continue; }
      if (n == '"') { out += '"'; ++i; continue; }
      if (n == '\'') { out += '\''; ++i; continue; }
      if (n == '\\') { out += '\\'; ++i; continue; }
    }
    out += s[i];
  }
  return out;
}

std::uint64_t elapsed_since(std::chrono::steady_clock::time_point start) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

}  // namespace

std::string normalize_candidate_code(std::string code) {
  code = strip_fences(std::move(code));
  if (code.find('\n') == std::string::npos && code.find("\\n") != std::string::npos) {
    code = trim(unescape_literals(code));
  }
  return code;
}

std::string build_advisory_prompt(const SourceArtifact& program, const FailureContext& context) {
  std::string prompt = kSandboxRules;
  prompt += "\n\nCODE:\n";
  prompt += program.text;
  prompt += "\n\nERROR (" + context.category;
  if (context.line) prompt += ", line " + std::to_string(context.line);
  prompt += "):\n";
  prompt += context.output.empty() ? context.category + ": " + context.detail : context.output;
  prompt += "\n\nReturn ONLY the JSON object with explanation, fixed_code and reasoning.";
  return prompt;
}

std::string build_advisory_request(const AdvisoryOptions& options, const std::string& prompt) {
  jsonlite::Object req;
  req["model"] = options.model;
  req["prompt"] = prompt;
  req["stream"] = false;
  req["format"] = "json";
  return jsonlite::to_json(req);
}

AdvisoryParse parse_advisory_response(const HttpResponse& response) {
  if (response.error != ErrorCode::none) {
    return FallbackRequired{response.error, response.error_message};
  }
  if (response.status != 200) {
    return FallbackRequired{ErrorCode::advisory_bad_status, "HTTP status " + std::to_string(response.status)};
  }
  std::optional<jsonlite::JsonError> err;
  const auto envelope = jsonlite::parse(response.body, &err);
  if (err) return FallbackRequired{ErrorCode::advisory_malformed, "envelope: " + err->message};
  auto it = envelope.find("response");
  if (it == envelope.end() || !std::holds_alternative<std::string>(it->second.v)) {
    return FallbackRequired{ErrorCode::advisory_malformed, "envelope has no response text"};
  }

  const auto inner = jsonlite::parse(strip_fences(std::get<std::string>(it->second.v)), &err);
  if (err) return FallbackRequired{ErrorCode::advisory_malformed, "response is not a JSON object: " + err->message};

  ParsedCandidate c;
  c.program = normalize_candidate_code(jsonlite::get_string(inner, "fixed_code"));
  if (c.program.empty()) return FallbackRequired{ErrorCode::advisory_malformed, "missing or empty fixed_code"};
  c.explanation = trim(jsonlite::get_string(inner, "explanation"));
  if (c.explanation.empty()) c.explanation = "The advisory service proposed a corrected program.";
  c.rationale = trim(jsonlite::get_string(inner, "reasoning"));
  if (c.rationale.empty()) c.rationale = c.explanation;
  return c;
}

AdvisoryStrategy::AdvisoryStrategy(AdvisoryOptions options, std::shared_ptr<IHttpTransport> transport,
                                   std::shared_ptr<IPatchStrategy> fallback)
    : options_(std::move(options)), transport_(std::move(transport)), fallback_(std::move(fallback)) {}

PatchResult AdvisoryStrategy::generate(const SourceArtifact& program, const FailureContext& context) {
  const auto start = std::chrono::steady_clock::now();
  const std::string request = build_advisory_request(options_, build_advisory_prompt(program, context));
  const HttpResponse response = transport_->post_json(options_.base_url + "/api/generate", request,
                                                      options_.timeout_ms);
  AdvisoryParse parsed = parse_advisory_response(response);

  if (auto* candidate = std::get_if<ParsedCandidate>(&parsed)) {
    PatchResult r;
    r.explanation = std::move(candidate->explanation);
    r.program = std::move(candidate->program);
    r.rationale = std::move(candidate->rationale);
    r.strategy = name();
    r.deterministic = false;
    r.elapsed_ms = elapsed_since(start);
    return r;
  }

  const auto& fallback = std::get<FallbackRequired>(parsed);
  PatchResult r = fallback_->generate(program, context);
  r.advisory_fallback = true;
  r.fallback_code = fallback.code;
  r.rationale = "Advisory service unavailable (" + to_string(fallback.code) + ": " + fallback.reason +
                "); applied the rule-based fix. " + r.rationale;
  r.elapsed_ms = elapsed_since(start);
  return r;
}

AdvisoryProbe AdvisoryStrategy::probe() {
  AdvisoryProbe p;
  const HttpResponse resp = transport_->get(options_.base_url + "/api/tags", options_.probe_timeout_ms);
  if (resp.error != ErrorCode::none) {
    p.detail = to_string(resp.error) + ": " + resp.error_message;
    return p;
  }
  if (resp.status != 200) {
    p.detail = "HTTP status " + std::to_string(resp.status);
    return p;
  }
  p.available = true;
  std::optional<jsonlite::JsonError> err;
  const auto tags = jsonlite::parse(resp.body, &err);
  bool has_model = false;
  auto it = tags.find("models");
  if (!err && it != tags.end() && std::holds_alternative<jsonlite::Array>(it->second.v)) {
    for (const auto& m : std::get<jsonlite::Array>(it->second.v)) {
      if (!std::holds_alternative<jsonlite::Object>(m.v)) continue;
      const std::string model = jsonlite::get_string(std::get<jsonlite::Object>(m.v), "name");
      if (model == options_.model || model.rfind(options_.model + ":", 0) == 0) has_model = true;
    }
  }
  p.detail = has_model ? "model " + options_.model + " available"
                       : "service reachable; model " + options_.model + " not listed";
  return p;
}

}  // namespace mender
