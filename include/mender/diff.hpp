#pragma once

// mender/diff.hpp: Line-level structural diff (Myers O(ND), linear space).
//
// Lines are the segments between '\n' characters. A trailing '\n' yields a
// trailing empty segment, so join_lines(split_lines(t)) == t for every t.
//
// apply_edits(a, diff_lines(a, b)) == b for every pair of texts.

#include <string>
#include <vector>

#include "mender/types.hpp"

namespace mender {

std::vector<std::string> split_lines(const std::string& text);
std::string join_lines(const std::vector<std::string>& lines);

enum class DiffOp { equal, remove, insert };

struct DiffStep {
  DiffOp op{DiffOp::equal};
  std::size_t a_index{0};  // index into the original lines (equal/remove)
  std::size_t b_index{0};  // index into the candidate lines (equal/insert)
};

// Shortest edit script between two line sequences. Memory stays linear in the
// input size however many lines differ.
std::vector<DiffStep> myers_diff(const std::vector<std::string>& a, const std::vector<std::string>& b);

// Structured edits: runs of removals and insertions are paired into replace
// operations; leftovers become plain removes or inserts.
std::vector<LineEdit> diff_lines(const std::string& original, const std::string& candidate);

std::string apply_edits(const std::string& original, const std::vector<LineEdit>& edits);

// Unified diff with difflib-compatible hunk headers. Empty when the texts are
// line-for-line identical.
std::string unified_diff(const std::string& original, const std::string& candidate,
                         const std::string& from_name = "original.py",
                         const std::string& to_name = "fixed.py", std::size_t context = 3);

}  // namespace mender
