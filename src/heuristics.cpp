#include "mender/heuristics.hpp"

#include <cctype>
#include <regex>

#include "mender/diff.hpp"

namespace mender {

namespace {

std::size_t indent_width(const std::string& line) {
  std::size_t w = 0;
  for (char c : line) {
    if (c == ' ') ++w;
    else if (c == '\t') w = (w / 4 + 1) * 4;
    else break;
  }
  return w;
}

bool blank_or_comment(const std::string& line) {
  const auto b = line.find_first_not_of(" \t");
  return b == std::string::npos || line[b] == '#';
}

bool is_visit(const std::string& line) {
  return line.find("print(") != std::string::npos || line.find(".append(") != std::string::npos ||
         line.find("yield ") != std::string::npos || line.find("visit(") != std::string::npos ||
         line.find("+= [") != std::string::npos;
}

}  // namespace

std::vector<HeuristicFinding> TraversalOrderCheck::check(const SourceArtifact& program) const {
  static const std::regex def_re(R"(^(\s*)def\s+([A-Za-z_]*?(pre|in|post)_?order[A-Za-z0-9_]*)\s*\()",
                                 std::regex::icase);
  std::vector<HeuristicFinding> findings;
  const auto lines = split_lines(program.text);

  for (std::size_t i = 0; i < lines.size(); ++i) {
    std::smatch m;
    if (!std::regex_search(lines[i], m, def_re)) continue;
    const std::string fname = m[2].str();
    std::string kind = m[3].str();
    for (auto& c : kind) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    const std::size_t def_indent = indent_width(lines[i]);
    const std::regex call_re("(^|[^A-Za-z0-9_])" + fname + R"(\s*\()");

    std::vector<std::size_t> calls;
    std::size_t visit = 0;
    bool ambiguous = false;
    for (std::size_t j = i + 1; j < lines.size(); ++j) {
      if (blank_or_comment(lines[j])) continue;
      if (indent_width(lines[j]) <= def_indent) break;
      const bool call = std::regex_search(lines[j], call_re);
      const bool v = is_visit(lines[j]);
      if (call && v) ambiguous = true;
      if (call) calls.push_back(j + 1);
      else if (v && visit == 0) visit = j + 1;
    }
    if (ambiguous || calls.empty() || visit == 0) continue;

    HeuristicFinding f;
    f.check = name();
    f.symbol = fname;
    f.line = static_cast<std::uint32_t>(visit);
    if (kind == "pre" && visit > calls.front()) {
      f.message = "preorder visit at line " + std::to_string(visit) + " runs after the recursive call at line " +
                  std::to_string(calls.front()) + "; the node should be visited before its children";
      findings.push_back(f);
    } else if (kind == "post" && visit < calls.back()) {
      f.message = "postorder visit at line " + std::to_string(visit) + " runs before the recursive call at line " +
                  std::to_string(calls.back()) + "; the node should be visited after its children";
      findings.push_back(f);
    } else if (kind == "in" && calls.size() >= 2 && (visit < calls.front() || visit > calls.back())) {
      f.message = "inorder visit at line " + std::to_string(visit) + " is not between the recursive calls at lines " +
                  std::to_string(calls.front()) + " and " + std::to_string(calls.back());
      findings.push_back(f);
    }
  }
  return findings;
}

std::vector<std::shared_ptr<IHeuristicCheck>> default_heuristic_checks() {
  return {std::make_shared<TraversalOrderCheck>()};
}

}  // namespace mender
