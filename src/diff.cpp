#include "mender/diff.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace mender {

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    std::size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      out.push_back(text.substr(start));
      break;
    }
    out.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

std::string join_lines(const std::vector<std::string>& lines) {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i) out += '\n';
    out += lines[i];
  }
  return out;
}

namespace {

// Linear-space Myers: walk the edit graph from both corners of a box until
// the furthest-reaching paths meet, split the box there and recurse. Diagonals
// are clipped to the box so no path ever leaves it. Only matched line pairs are
// collected; the caller fills the gaps with removals and insertions.
class LinearMyers {
 public:
  using Lines = std::vector<std::string_view>;
  using Matches = std::vector<std::pair<std::size_t, std::size_t>>;

  LinearMyers(const Lines& a, const Lines& b, Matches& out)
      : a_(a),
        b_(b),
        out_(out),
        offset_(static_cast<std::int64_t>(b.size()) + 1),
        fwd_(a.size() + b.size() + 3, 0),
        bwd_(a.size() + b.size() + 3, 0) {}

  void run() { split(0, size(a_), 0, size(b_)); }

 private:
  static std::int64_t size(const Lines& l) { return static_cast<std::int64_t>(l.size()); }

  bool same(std::int64_t i, std::int64_t j) const {
    return a_[static_cast<std::size_t>(i)] == b_[static_cast<std::size_t>(j)];
  }

  std::int64_t& fwd(std::int64_t k) { return fwd_[static_cast<std::size_t>(k + offset_)]; }
  std::int64_t& bwd(std::int64_t k) { return bwd_[static_cast<std::size_t>(k + offset_)]; }

  void match(std::int64_t i, std::int64_t j) {
    out_.emplace_back(static_cast<std::size_t>(i), static_cast<std::size_t>(j));
  }

  void split(std::int64_t a0, std::int64_t a1, std::int64_t b0, std::int64_t b1) {
    while (a0 < a1 && b0 < b1 && same(a0, b0)) match(a0++, b0++);
    std::int64_t tail = 0;
    while (a0 < a1 && b0 < b1 && same(a1 - 1, b1 - 1)) {
      --a1;
      --b1;
      ++tail;
    }
    if (a0 < a1 && b0 < b1) {
      const auto [i, j] = bisect(a0, a1, b0, b1);
      split(a0, i, b0, j);
      split(i, a1, j, b1);
    }
    for (std::int64_t t = 0; t < tail; ++t) match(a1 + t, b1 + t);
  }

  // A point on a shortest path through the box [a0, a1) x [b0, b1). Diagonal k
  // holds points with i - j == k.
  std::pair<std::int64_t, std::int64_t> bisect(std::int64_t a0, std::int64_t a1, std::int64_t b0,
                                               std::int64_t b1) {
    constexpr std::int64_t kUnreached = std::numeric_limits<std::int64_t>::max();
    const std::int64_t dmin = a0 - b1;
    const std::int64_t dmax = a1 - b0;
    const std::int64_t fmid = a0 - b0;
    const std::int64_t bmid = a1 - b1;
    const bool odd = ((fmid - bmid) & 1) != 0;
    std::int64_t fmin = fmid, fmax = fmid;
    std::int64_t bmin = bmid, bmax = bmid;
    fwd(fmid) = a0;
    bwd(bmid) = a1;

    while (true) {
      if (fmin > dmin) {
        fwd(--fmin - 1) = -1;
      } else {
        ++fmin;
      }
      if (fmax < dmax) {
        fwd(++fmax + 1) = -1;
      } else {
        --fmax;
      }
      for (std::int64_t k = fmax; k >= fmin; k -= 2) {
        std::int64_t i = fwd(k - 1) >= fwd(k + 1) ? fwd(k - 1) + 1 : fwd(k + 1);
        std::int64_t j = i - k;
        while (i < a1 && j < b1 && same(i, j)) {
          ++i;
          ++j;
        }
        fwd(k) = i;
        if (odd && bmin <= k && k <= bmax && bwd(k) <= i) return {i, j};
      }

      if (bmin > dmin) {
        bwd(--bmin - 1) = kUnreached;
      } else {
        ++bmin;
      }
      if (bmax < dmax) {
        bwd(++bmax + 1) = kUnreached;
      } else {
        --bmax;
      }
      for (std::int64_t k = bmax; k >= bmin; k -= 2) {
        std::int64_t i = bwd(k - 1) < bwd(k + 1) ? bwd(k - 1) : bwd(k + 1) - 1;
        std::int64_t j = i - k;
        while (i > a0 && j > b0 && same(i - 1, j - 1)) {
          --i;
          --j;
        }
        bwd(k) = i;
        if (!odd && fmin <= k && k <= fmax && i <= fwd(k)) return {i, j};
      }
    }
  }

  const Lines& a_;
  const Lines& b_;
  Matches& out_;
  std::int64_t offset_;
  std::vector<std::int64_t> fwd_;
  std::vector<std::int64_t> bwd_;
};

}  // namespace

std::vector<DiffStep> myers_diff(const std::vector<std::string>& a, const std::vector<std::string>& b) {
  // A line with no counterpart on the other side can never be part of a match.
  // Dropping those first makes whole-file rewrites (re-indentation) linear.
  const std::unordered_set<std::string_view> in_a(a.begin(), a.end());
  const std::unordered_set<std::string_view> in_b(b.begin(), b.end());
  LinearMyers::Lines ra;
  LinearMyers::Lines rb;
  std::vector<std::size_t> ia;
  std::vector<std::size_t> ib;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (in_b.count(a[i]) == 0) continue;
    ra.push_back(a[i]);
    ia.push_back(i);
  }
  for (std::size_t j = 0; j < b.size(); ++j) {
    if (in_a.count(b[j]) == 0) continue;
    rb.push_back(b[j]);
    ib.push_back(j);
  }

  LinearMyers::Matches matches;
  LinearMyers(ra, rb, matches).run();

  std::vector<DiffStep> steps;
  steps.reserve(a.size() + b.size());
  std::size_t x = 0;
  std::size_t y = 0;
  auto gap = [&](std::size_t x_end, std::size_t y_end) {
    for (; x < x_end; ++x) steps.push_back({DiffOp::remove, x, y});
    for (; y < y_end; ++y) steps.push_back({DiffOp::insert, x, y});
  };
  for (const auto& [ri, rj] : matches) {
    gap(ia[ri], ib[rj]);
    steps.push_back({DiffOp::equal, x++, y++});
  }
  gap(a.size(), b.size());
  return steps;
}

std::vector<LineEdit> diff_lines(const std::string& original, const std::string& candidate) {
  const auto a = split_lines(original);
  const auto b = split_lines(candidate);
  const auto steps = myers_diff(a, b);

  std::vector<LineEdit> edits;
  std::size_t a_pos = 0;
  std::size_t b_pos = 0;
  std::size_t i = 0;
  while (i < steps.size()) {
    if (steps[i].op == DiffOp::equal) {
      ++a_pos;
      ++b_pos;
      ++i;
      continue;
    }
    std::size_t dels = 0;
    std::size_t ins = 0;
    while (i < steps.size() && steps[i].op != DiffOp::equal) {
      if (steps[i].op == DiffOp::remove) ++dels;
      else ++ins;
      ++i;
    }
    const std::size_t pairs = std::min(dels, ins);
    for (std::size_t p = 0; p < pairs; ++p) {
      LineEdit e;
      e.kind = EditKind::replace;
      e.old_line = static_cast<std::uint32_t>(a_pos + p + 1);
      e.new_line = static_cast<std::uint32_t>(b_pos + p + 1);
      e.old_text = a[a_pos + p];
      e.new_text = b[b_pos + p];
      edits.push_back(std::move(e));
    }
    for (std::size_t p = pairs; p < dels; ++p) {
      LineEdit e;
      e.kind = EditKind::remove;
      e.old_line = static_cast<std::uint32_t>(a_pos + p + 1);
      e.new_line = static_cast<std::uint32_t>(b_pos + ins + 1);
      e.old_text = a[a_pos + p];
      edits.push_back(std::move(e));
    }
    for (std::size_t p = pairs; p < ins; ++p) {
      LineEdit e;
      e.kind = EditKind::insert;
      e.old_line = static_cast<std::uint32_t>(a_pos + dels + 1);
      e.new_line = static_cast<std::uint32_t>(b_pos + p + 1);
      e.new_text = b[b_pos + p];
      edits.push_back(std::move(e));
    }
    a_pos += dels;
    b_pos += ins;
  }
  return edits;
}

std::string apply_edits(const std::string& original, const std::vector<LineEdit>& edits) {
  const auto lines = split_lines(original);
  std::vector<std::string> out;
  out.reserve(lines.size() + edits.size());
  std::size_t cursor = 0;
  for (const auto& e : edits) {
    const std::size_t target = e.old_line > 0 ? e.old_line - 1 : 0;
    while (cursor < target && cursor < lines.size()) out.push_back(lines[cursor++]);
    switch (e.kind) {
      case EditKind::insert:
        out.push_back(e.new_text);
        break;
      case EditKind::remove:
        ++cursor;
        break;
      case EditKind::replace:
        out.push_back(e.new_text);
        ++cursor;
        break;
    }
  }
  while (cursor < lines.size()) out.push_back(lines[cursor++]);
  return join_lines(out);
}

namespace {

// Lines as Python's str.splitlines() sees them: no trailing empty segment.
std::vector<std::string> display_lines(const std::string& text) {
  auto v = split_lines(text);
  if (!v.empty() && v.back().empty()) v.pop_back();
  return v;
}

struct Opcode {
  char tag;  // 'e' equal, 'r' replace, 'd' delete, 'i' insert
  std::size_t i1, i2, j1, j2;
};

std::vector<Opcode> opcodes(const std::vector<DiffStep>& steps) {
  std::vector<Opcode> out;
  std::size_t a_pos = 0;
  std::size_t b_pos = 0;
  std::size_t i = 0;
  while (i < steps.size()) {
    const std::size_t a0 = a_pos;
    const std::size_t b0 = b_pos;
    if (steps[i].op == DiffOp::equal) {
      while (i < steps.size() && steps[i].op == DiffOp::equal) {
        ++a_pos;
        ++b_pos;
        ++i;
      }
      out.push_back({'e', a0, a_pos, b0, b_pos});
      continue;
    }
    while (i < steps.size() && steps[i].op != DiffOp::equal) {
      if (steps[i].op == DiffOp::remove) ++a_pos;
      else ++b_pos;
      ++i;
    }
    const char tag = (a_pos > a0 && b_pos > b0) ? 'r' : (a_pos > a0 ? 'd' : 'i');
    out.push_back({tag, a0, a_pos, b0, b_pos});
  }
  return out;
}

std::vector<std::vector<Opcode>> grouped(std::vector<Opcode> codes, std::size_t n) {
  std::vector<std::vector<Opcode>> groups;
  if (codes.empty()) return groups;
  if (codes.front().tag == 'e') {
    auto& c = codes.front();
    c.i1 = std::max(c.i1, c.i2 > n ? c.i2 - n : 0);
    c.j1 = std::max(c.j1, c.j2 > n ? c.j2 - n : 0);
  }
  if (codes.back().tag == 'e') {
    auto& c = codes.back();
    c.i2 = std::min(c.i2, c.i1 + n);
    c.j2 = std::min(c.j2, c.j1 + n);
  }
  const std::size_t nn = n + n;
  std::vector<Opcode> group;
  for (auto c : codes) {
    if (c.tag == 'e' && c.i2 - c.i1 > nn) {
      group.push_back({'e', c.i1, std::min(c.i2, c.i1 + n), c.j1, std::min(c.j2, c.j1 + n)});
      groups.push_back(std::move(group));
      group.clear();
      c.i1 = std::max(c.i1, c.i2 - n);
      c.j1 = std::max(c.j1, c.j2 - n);
    }
    group.push_back(c);
  }
  if (!group.empty() && !(group.size() == 1 && group.front().tag == 'e')) groups.push_back(std::move(group));
  return groups;
}

std::string format_range(std::size_t start, std::size_t stop) {
  std::size_t beginning = start + 1;
  const std::size_t length = stop - start;
  if (length == 1) return std::to_string(beginning);
  if (length == 0) beginning -= 1;
  return std::to_string(beginning) + "," + std::to_string(length);
}

}  // namespace

std::string unified_diff(const std::string& original, const std::string& candidate,
                         const std::string& from_name, const std::string& to_name, std::size_t context) {
  const auto a = display_lines(original);
  const auto b = display_lines(candidate);
  const auto groups = grouped(opcodes(myers_diff(a, b)), context);
  if (groups.empty()) return "";

  std::string out = "--- " + from_name + "\n+++ " + to_name + "\n";
  for (const auto& group : groups) {
    out += "@@ -" + format_range(group.front().i1, group.back().i2) + " +" +
           format_range(group.front().j1, group.back().j2) + " @@\n";
    for (const auto& c : group) {
      if (c.tag == 'e') {
        for (std::size_t k = c.i1; k < c.i2; ++k) out += " " + a[k] + "\n";
        continue;
      }
      if (c.tag == 'r' || c.tag == 'd') {
        for (std::size_t k = c.i1; k < c.i2; ++k) out += "-" + a[k] + "\n";
      }
      if (c.tag == 'r' || c.tag == 'i') {
        for (std::size_t k = c.j1; k < c.j2; ++k) out += "+" + b[k] + "\n";
      }
    }
  }
  return out;
}

}  // namespace mender
