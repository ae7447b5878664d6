#pragma once

// mender/validator.hpp: Regression guard and diff for candidate programs.
//
// A candidate is rejected when it is empty, when it is shorter than
// min_length_ratio of the program it replaces, or when the program declared
// top-level functions/classes and the candidate keeps none of them. A rejected
// candidate is replaced by RuleBasedStrategy output for the same failure.

#include <memory>
#include <string>
#include <vector>

#include "mender/patch.hpp"
#include "mender/types.hpp"

namespace mender {

struct ValidatedPatch {
  std::string accepted_program;
  std::string unified_diff;
  std::vector<LineEdit> edits;
  bool substituted{false};
  std::string rejection_reason;
  // Set when substituted: the replacement's own explanation and rationale.
  std::string substitute_explanation;
  std::string substitute_rationale;
};

// Column-0 "def", "async def" and "class" names in declaration order.
std::vector<std::string> declared_names(const std::string& program);

// Empty when the candidate passes the regression guard.
std::string regression_check(const std::string& original, const std::string& candidate,
                             double min_length_ratio);

class PatchValidator {
 public:
  PatchValidator(std::shared_ptr<RuleBasedStrategy> fallback, double min_length_ratio = 0.3);

  ValidatedPatch validate_and_diff(const SourceArtifact& original, const std::string& candidate,
                                   const FailureContext& context) const;

 private:
  std::shared_ptr<RuleBasedStrategy> fallback_;
  double min_length_ratio_;
};

}  // namespace mender
