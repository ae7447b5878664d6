#include "mender/validator.hpp"

#include <algorithm>
#include <regex>

#include "mender/diff.hpp"

namespace mender {

std::vector<std::string> declared_names(const std::string& program) {
  static const std::regex decl(R"(^(?:async\s+def|def|class)\s+([A-Za-z_][A-Za-z0-9_]*))");
  std::vector<std::string> names;
  for (const auto& line : split_lines(program)) {
    std::smatch m;
    if (std::regex_search(line, m, decl)) names.push_back(m[1].str());
  }
  return names;
}

std::string regression_check(const std::string& original, const std::string& candidate, double min_length_ratio) {
  if (candidate.find_first_not_of(" \t\r\n") == std::string::npos) return "candidate is empty";

  const double floor = min_length_ratio * static_cast<double>(original.size());
  if (static_cast<double>(candidate.size()) < floor) {
    return "candidate is " + std::to_string(candidate.size()) + " bytes, below " +
           std::to_string(static_cast<int>(min_length_ratio * 100)) + "% of the original " +
           std::to_string(original.size()) + " bytes";
  }

  const auto before = declared_names(original);
  if (!before.empty()) {
    const auto after = declared_names(candidate);
    const bool any_kept = std::any_of(before.begin(), before.end(), [&after](const std::string& n) {
      return std::find(after.begin(), after.end(), n) != after.end();
    });
    if (!any_kept) return "candidate drops every declared function and class";
  }
  return "";
}

PatchValidator::PatchValidator(std::shared_ptr<RuleBasedStrategy> fallback, double min_length_ratio)
    : fallback_(std::move(fallback)), min_length_ratio_(min_length_ratio) {}

ValidatedPatch PatchValidator::validate_and_diff(const SourceArtifact& original, const std::string& candidate,
                                                 const FailureContext& context) const {
  ValidatedPatch out;
  out.rejection_reason = regression_check(original.text, candidate, min_length_ratio_);
  if (out.rejection_reason.empty()) {
    out.accepted_program = candidate;
  } else {
    PatchResult sub = fallback_->generate(original, context);
    out.substituted = true;
    out.accepted_program = std::move(sub.program);
    out.substitute_explanation = std::move(sub.explanation);
    out.substitute_rationale = std::move(sub.rationale);
  }
  out.edits = diff_lines(original.text, out.accepted_program);
  out.unified_diff = unified_diff(original.text, out.accepted_program);
  return out;
}

}  // namespace mender
