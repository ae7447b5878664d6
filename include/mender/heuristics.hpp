#pragma once

// mender/heuristics.hpp: Optional post-success intent checks.
//
// Checks inspect a program that already runs cleanly and report suspicious
// patterns. Findings are advisory only: they are stored on the session and
// never change its state.

#include <memory>
#include <string>
#include <vector>

#include "mender/types.hpp"

namespace mender {

class IHeuristicCheck {
 public:
  virtual ~IHeuristicCheck() = default;
  virtual std::string name() const = 0;
  virtual std::vector<HeuristicFinding> check(const SourceArtifact& program) const = 0;
};

// Recursive preorder/inorder/postorder functions whose visit statement sits in
// the wrong place relative to the recursive calls.
class TraversalOrderCheck : public IHeuristicCheck {
 public:
  std::string name() const override { return "traversal_order"; }
  std::vector<HeuristicFinding> check(const SourceArtifact& program) const override;
};

std::vector<std::shared_ptr<IHeuristicCheck>> default_heuristic_checks();

}  // namespace mender
