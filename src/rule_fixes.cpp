#include "mender/patch.hpp"

// Deterministic repairs keyed on the failure category. Each rule works on the
// program's lines, touches the failing line when the traceback named one, and
// otherwise falls back to a conservative whole-program scan. A rule that finds
// nothing to change leaves the program as it was; the orchestrator's progress
// guard decides what happens next.

#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <regex>
#include <set>

#include "mender/diff.hpp"

namespace mender {

namespace {

struct Fix {
  std::string explanation;
  std::string rationale;
  std::vector<std::string> lines;
  bool changed{false};
};

std::string lstrip(const std::string& s) {
  const auto b = s.find_first_not_of(" \t");
  return b == std::string::npos ? "" : s.substr(b);
}

std::string rstrip(const std::string& s) {
  const auto e = s.find_last_not_of(" \t\r");
  return e == std::string::npos ? "" : s.substr(0, e + 1);
}

std::string indent_of(const std::string& line) {
  return line.substr(0, line.size() - lstrip(line).size());
}

bool is_blank(const std::string& line) { return lstrip(line).empty(); }
bool is_comment(const std::string& line) { return lstrip(line).rfind("#", 0) == 0; }

// Scans one physical line outside string literals.
struct LineScan {
  std::size_t code_end{0};  // index of a trailing comment, or line size
  int bracket_delta{0};
};

LineScan scan(const std::string& line) {
  LineScan r;
  r.code_end = line.size();
  char quote = 0;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote) {
      if (c == '\\') {
        ++i;
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (c == '\'' || c == '"') {
      quote = c;
    } else if (c == '#') {
      r.code_end = i;
      break;
    } else if (c == '(' || c == '[' || c == '{') {
      ++r.bracket_delta;
    } else if (c == ')' || c == ']' || c == '}') {
      --r.bracket_delta;
    }
  }
  return r;
}

std::string code_part(const std::string& line) { return rstrip(line.substr(0, scan(line).code_end)); }

bool is_header(const std::string& line) {
  const std::string code = code_part(line);
  return !code.empty() && code.back() == ':';
}

std::string first_word(const std::string& line) {
  const std::string s = lstrip(line);
  std::size_t i = 0;
  while (i < s.size() && (std::isalnum(static_cast<unsigned char>(s[i])) || s[i] == '_')) ++i;
  return s.substr(0, i);
}

bool valid_line(const FailureContext& ctx, const std::vector<std::string>& lines) {
  return ctx.line >= 1 && ctx.line <= lines.size();
}

// try/except around a single statement, at the statement's own indentation.
std::vector<std::string> guarded(const std::string& line, const std::string& exception,
                                 const std::string& message) {
  const std::string ind = indent_of(line);
  return {ind + "try:", ind + "    " + lstrip(rstrip(line)), ind + "except " + exception + ":",
          ind + "    print(\"" + message + "\")"};
}

bool wrappable(const std::string& line) {
  if (is_blank(line) || is_comment(line) || is_header(line)) return false;
  const std::string code = code_part(line);
  if (!code.empty() && code.back() == '\\') return false;
  if (scan(line).bracket_delta != 0) return false;
  static const std::set<std::string> kBlockWords = {"return", "yield", "break", "continue", "pass",
                                                    "raise", "global", "nonlocal", "import", "from",
                                                    "elif", "else", "except", "finally"};
  return !kBlockWords.contains(first_word(line));
}

std::vector<std::string> wrap_lines(const std::vector<std::string>& lines, const std::set<std::size_t>& targets,
                                    const std::string& exception, const std::string& message) {
  std::vector<std::string> out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (targets.contains(i)) {
      auto block = guarded(lines[i], exception, message);
      out.insert(out.end(), block.begin(), block.end());
    } else {
      out.push_back(lines[i]);
    }
  }
  return out;
}

std::string line_list(const std::set<std::size_t>& targets) {
  std::string out;
  for (auto t : targets) {
    if (!out.empty()) out += ", ";
    out += std::to_string(t + 1);
  }
  return out;
}

// --- ZeroDivisionError ------------------------------------------------------

Fix fix_zero_division(const std::vector<std::string>& lines, const FailureContext& ctx) {
  Fix f;
  std::set<std::size_t> targets;
  if (valid_line(ctx, lines) && wrappable(lines[ctx.line - 1])) {
    targets.insert(ctx.line - 1);
  } else {
    for (std::size_t i = 0; i < lines.size(); ++i) {
      const std::string code = code_part(lines[i]);
      if (code.find('/') != std::string::npos && code.find('=') != std::string::npos && wrappable(lines[i])) {
        targets.insert(i);
      }
    }
  }
  f.explanation = "Guarded the division that raised ZeroDivisionError with a try/except handler.";
  if (targets.empty()) {
    f.lines = lines;
    f.rationale = "The traceback reports a division by zero, but no single-line division statement could be "
                  "isolated for guarding.";
    return f;
  }
  f.lines = wrap_lines(lines, targets, "ZeroDivisionError", "Error: Division by zero");
  f.changed = true;
  f.rationale = "The divisor evaluates to zero at runtime. Line(s) " + line_list(targets) +
                " now run inside try/except ZeroDivisionError, which reports the problem instead of "
                "terminating the program.";
  return f;
}

// --- IndexError -------------------------------------------------------------

Fix fix_index_error(const std::vector<std::string>& lines, const FailureContext& ctx) {
  Fix f;
  std::set<std::size_t> targets;
  if (valid_line(ctx, lines) && wrappable(lines[ctx.line - 1])) {
    targets.insert(ctx.line - 1);
  } else {
    static const std::regex subscript(R"([A-Za-z0-9_\)\]]\[)");
    for (std::size_t i = 0; i < lines.size(); ++i) {
      const std::string code = code_part(lines[i]);
      if (std::regex_search(code, subscript) && wrappable(lines[i])) targets.insert(i);
    }
  }
  f.explanation = "Guarded the out-of-range subscript with a try/except IndexError handler.";
  if (targets.empty()) {
    f.lines = lines;
    f.rationale = "The traceback reports an index out of range, but no subscript statement could be isolated.";
    return f;
  }
  f.lines = wrap_lines(lines, targets, "IndexError", "Error: Index out of range");
  f.changed = true;
  f.rationale = "A sequence was indexed past its end. Line(s) " + line_list(targets) +
                " now run inside try/except IndexError so the program reports the bad index and continues.";
  return f;
}

// --- NameError --------------------------------------------------------------

Fix fix_name_error(const std::vector<std::string>& lines, const FailureContext& ctx) {
  Fix f;
  f.lines = lines;
  std::string name = ctx.undefined_name;
  if (name.empty()) {
    static const std::regex re(R"(name '([A-Za-z_][A-Za-z0-9_]*)' is not defined)");
    std::smatch m;
    if (std::regex_search(ctx.detail, m, re)) name = m[1].str();
  }
  if (name.empty()) {
    f.explanation = "Could not determine which name is undefined; manual review required.";
    f.rationale = "The NameError message did not name the missing identifier.";
    return f;
  }
  f.explanation = "Defined the missing name '" + name + "' as None before its first use.";

  std::size_t at = lines.size();
  if (valid_line(ctx, lines)) {
    at = ctx.line - 1;
  } else {
    const std::regex word("(^|[^A-Za-z0-9_.])" + name + "([^A-Za-z0-9_]|$)");
    for (std::size_t i = 0; i < lines.size(); ++i) {
      if (!is_comment(lines[i]) && std::regex_search(code_part(lines[i]), word)) {
        at = i;
        break;
      }
    }
  }
  if (at == lines.size()) at = 0;

  // An assignment cannot sit between a block and its continuation clause.
  static const std::set<std::string> kContinuations = {"elif", "else", "except", "finally"};
  std::string ind = at < lines.size() ? indent_of(lines[at]) : "";
  if (at < lines.size() && kContinuations.contains(first_word(lines[at]))) {
    at = 0;
    ind.clear();
  }
  const std::string definition = ind + name + " = None";
  if (at > 0 && rstrip(lines[at - 1]) == definition) {
    f.rationale = "'" + name + "' is already defined as None immediately before line " + std::to_string(at + 1) +
                  "; the failure needs a real value and manual review.";
    return f;
  }
  f.lines.insert(f.lines.begin() + static_cast<std::ptrdiff_t>(at), definition);
  f.changed = true;
  f.rationale = "Python raised NameError because '" + name + "' is used before any assignment. A placeholder "
                "definition was inserted before line " + std::to_string(at + 1) +
                " at the same indentation so the statement can execute.";
  return f;
}

// --- IndentationError / TabError ---------------------------------------------

Fix fix_indentation(const std::vector<std::string>& lines, const FailureContext&) {
  Fix f;
  f.explanation = "Normalized indentation to consistent four-space levels.";
  std::vector<std::string> out;
  out.reserve(lines.size());

  std::vector<std::size_t> stack = {0};
  bool expect_block = false;
  int depth = 0;  // open brackets carried over from previous lines
  for (const auto& raw : lines) {
    std::string ws = indent_of(raw);
    std::string body = raw.substr(ws.size());
    std::size_t width = 0;
    for (char c : ws) width = c == '\t' ? (width / 4 + 1) * 4 : width + 1;

    if (body.empty() || body[0] == '#' || depth > 0) {
      if (depth > 0) {
        std::string expanded(width, ' ');
        out.push_back(expanded + body);
      } else {
        out.push_back(raw.find('\t') != std::string::npos ? std::string(width, ' ') + body : raw);
      }
      if (!body.empty() && body[0] != '#') depth = std::max(0, depth + scan(body).bracket_delta);
      continue;
    }

    std::size_t level = (width + 2) / 4 * 4;
    if (expect_block) {
      if (level <= stack.back()) level = stack.back() + 4;
      stack.push_back(level);
    } else if (level > stack.back()) {
      level = stack.back();
    } else if (level < stack.back()) {
      while (stack.size() > 1 && stack.back() > level) stack.pop_back();
      level = stack.back();
    }
    out.push_back(std::string(level, ' ') + body);
    const LineScan s = scan(body);
    depth = std::max(0, s.bracket_delta);
    expect_block = depth == 0 && is_header(body);
  }

  f.changed = out != lines;
  f.lines = std::move(out);
  f.rationale = f.changed
                    ? "Tabs were expanded to spaces, indentation rounded to multiples of four, unexpected indents "
                      "removed and the bodies of compound statements indented one level."
                    : "Indentation is already consistent; the reported error needs manual review.";
  return f;
}

// --- SyntaxError: missing colon ----------------------------------------------

bool needs_colon(const std::string& line) {
  static const std::set<std::string> kHeaders = {"if", "elif", "else", "for", "while", "def", "class",
                                                 "try", "except", "finally", "with", "async"};
  if (!kHeaders.contains(first_word(line))) return false;
  const LineScan s = scan(line);
  if (s.bracket_delta != 0) return false;
  const std::string code = code_part(line);
  return !code.empty() && code.back() != ':' && code.back() != '\\';
}

std::string add_colon(const std::string& line) {
  const std::size_t end = scan(line).code_end;
  const std::string code = rstrip(line.substr(0, end));
  std::string rest = line.substr(code.size());
  return code + ":" + rest;
}

Fix fix_missing_colon(const std::vector<std::string>& lines, const FailureContext& ctx) {
  Fix f;
  f.lines = lines;
  f.explanation = "Added the missing ':' to the compound statement header.";
  std::set<std::size_t> fixed;
  if (valid_line(ctx, lines) && needs_colon(lines[ctx.line - 1])) {
    fixed.insert(ctx.line - 1);
  } else {
    for (std::size_t i = 0; i < lines.size(); ++i) {
      if (needs_colon(lines[i])) fixed.insert(i);
    }
  }
  for (auto i : fixed) f.lines[i] = add_colon(lines[i]);
  f.changed = !fixed.empty();
  f.rationale = f.changed ? "Compound statements (if/for/while/def/class and friends) must end their header with "
                            "':'. Line(s) " + line_list(fixed) + " were missing it."
                          : "No compound statement header without ':' was found; manual review required.";
  return f;
}

// --- TypeError: str/number concatenation -------------------------------------

bool is_concat_error(const FailureContext& ctx) {
  const std::string& d = ctx.detail;
  return d.find("can only concatenate str") != std::string::npos || d.find("can't concat") != std::string::npos ||
         d.find("unsupported operand type(s) for +") != std::string::npos ||
         d.find("must be str, not") != std::string::npos;
}

// Splits an expression on '+' outside strings and brackets.
std::vector<std::string> split_plus(const std::string& expr) {
  std::vector<std::string> parts;
  std::string cur;
  char quote = 0;
  int depth = 0;
  for (std::size_t i = 0; i < expr.size(); ++i) {
    const char c = expr[i];
    if (quote) {
      cur += c;
      if (c == '\\' && i + 1 < expr.size()) {
        cur += expr[++i];
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (c == '\'' || c == '"') quote = c;
    if (c == '(' || c == '[' || c == '{') ++depth;
    if (c == ')' || c == ']' || c == '}') --depth;
    if (c == '+' && depth == 0) {
      parts.push_back(cur);
      cur.clear();
      continue;
    }
    cur += c;
  }
  parts.push_back(cur);
  return parts;
}

bool is_string_operand(const std::string& op) {
  const std::string s = lstrip(rstrip(op));
  if (s.empty()) return true;
  if (s.rfind("str(", 0) == 0) return true;
  std::size_t i = 0;
  while (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i])) && i < 2) ++i;
  const std::string prefix = s.substr(0, i);
  const bool string_prefix = prefix.empty() || prefix == "f" || prefix == "r" || prefix == "b" ||
                             prefix == "F" || prefix == "R" || prefix == "rb" || prefix == "fr";
  return string_prefix && i < s.size() && (s[i] == '"' || s[i] == '\'');
}

std::string stringify_concat(const std::string& expr, bool& changed) {
  auto parts = split_plus(expr);
  if (parts.size() < 2) return expr;
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    std::string p = parts[i];
    const std::string lead = p.substr(0, p.size() - lstrip(p).size());
    const std::string core = lstrip(rstrip(p));
    const std::string trail = p.substr(lead.size() + core.size());
    if (!is_string_operand(core)) {
      p = lead + "str(" + core + ")" + trail;
      changed = true;
    }
    if (i) out += "+";
    out += p;
  }
  return out;
}

// Position of the first plain '=' or '+=' outside strings and brackets.
std::size_t assignment_pos(const std::string& code, bool& augmented) {
  char quote = 0;
  int depth = 0;
  augmented = false;
  for (std::size_t i = 0; i < code.size(); ++i) {
    const char c = code[i];
    if (quote) {
      if (c == '\\') ++i;
      else if (c == quote) quote = 0;
      continue;
    }
    if (c == '\'' || c == '"') quote = c;
    else if (c == '(' || c == '[' || c == '{') ++depth;
    else if (c == ')' || c == ']' || c == '}') --depth;
    else if (c == '=' && depth == 0) {
      const char prev = i ? code[i - 1] : ' ';
      const char next = i + 1 < code.size() ? code[i + 1] : ' ';
      if (next == '=' || prev == '=' || prev == '!' || prev == '<' || prev == '>') continue;
      augmented = prev == '+';
      return i;
    }
  }
  return std::string::npos;
}

std::string fix_concat_line(const std::string& line, bool& changed) {
  const std::size_t end = scan(line).code_end;
  const std::string code = rstrip(line.substr(0, end));
  const std::string tail = line.substr(code.size());
  bool augmented = false;
  const std::size_t eq = assignment_pos(code, augmented);
  if (eq != std::string::npos) {
    std::string rhs = code.substr(eq + 1);
    if (augmented) {
      const std::string core = lstrip(rstrip(rhs));
      if (!is_string_operand(core)) {
        changed = true;
        return code.substr(0, eq + 1) + " str(" + core + ")" + tail;
      }
      return line;
    }
    return code.substr(0, eq + 1) + stringify_concat(rhs, changed) + tail;
  }
  // Bare call such as print("a" + n): rewrite inside the outermost parentheses.
  const std::size_t open = code.find('(');
  const std::size_t close = code.rfind(')');
  if (open != std::string::npos && close != std::string::npos && close > open) {
    return code.substr(0, open + 1) + stringify_concat(code.substr(open + 1, close - open - 1), changed) +
           code.substr(close) + tail;
  }
  return line;
}

Fix fix_concat(const std::vector<std::string>& lines, const FailureContext& ctx) {
  Fix f;
  f.lines = lines;
  f.explanation = "Converted the non-string operands of a string concatenation with str().";
  std::set<std::size_t> fixed;
  auto try_line = [&](std::size_t i) {
    if (is_blank(lines[i]) || is_comment(lines[i])) return;
    bool changed = false;
    std::string repl = fix_concat_line(lines[i], changed);
    if (changed) {
      f.lines[i] = std::move(repl);
      fixed.insert(i);
    }
  };
  if (valid_line(ctx, lines)) {
    try_line(ctx.line - 1);
  } else {
    for (std::size_t i = 0; i < lines.size(); ++i) {
      const std::string code = code_part(lines[i]);
      if (code.find('+') != std::string::npos && (code.find('"') != std::string::npos ||
                                                  code.find('\'') != std::string::npos)) {
        try_line(i);
      }
    }
  }
  f.changed = !fixed.empty();
  f.rationale = f.changed ? "Python does not convert numbers to text implicitly when concatenating with '+'. The "
                            "operands on line(s) " + line_list(fixed) + " are now wrapped in str()."
                          : "No concatenation with a non-string operand could be isolated; manual review required.";
  return f;
}

// --- ModuleNotFoundError / ImportError ---------------------------------------

std::string missing_module(const FailureContext& ctx) {
  static const std::regex re(R"(No module named '([A-Za-z0-9_.]+)')");
  std::smatch m;
  if (std::regex_search(ctx.detail, m, re) || std::regex_search(ctx.output, m, re)) {
    std::string mod = m[1].str();
    return mod.substr(0, mod.find('.'));
  }
  return "";
}

// Replaces alias.fn(args) using the balanced argument text.
std::string rewrite_calls(const std::string& text, const std::string& callee,
                          const std::function<std::string(const std::string&)>& render, int& count) {
  std::string out;
  std::size_t pos = 0;
  while (true) {
    std::size_t hit = text.find(callee + "(", pos);
    while (hit != std::string::npos && hit > 0 &&
           (std::isalnum(static_cast<unsigned char>(text[hit - 1])) || text[hit - 1] == '_' || text[hit - 1] == '.')) {
      hit = text.find(callee + "(", hit + 1);
    }
    if (hit == std::string::npos) break;
    const std::size_t open = hit + callee.size();
    int depth = 0;
    std::size_t close = std::string::npos;
    for (std::size_t i = open; i < text.size(); ++i) {
      if (text[i] == '(') ++depth;
      if (text[i] == ')' && --depth == 0) {
        close = i;
        break;
      }
    }
    if (close == std::string::npos) break;
    out += text.substr(pos, hit - pos);
    out += render(text.substr(open + 1, close - open - 1));
    ++count;
    pos = close + 1;
  }
  out += text.substr(pos);
  return out;
}

Fix fix_numpy(const std::vector<std::string>& lines) {
  Fix f;
  static const std::regex import_re(R"(^\s*import\s+numpy(\s+as\s+([A-Za-z_][A-Za-z0-9_]*))?\s*(#.*)?$)");
  static const std::regex from_re(R"(^\s*from\s+numpy(\.[A-Za-z0-9_.]+)?\s+import\s+.*$)");
  std::string alias = "numpy";
  std::vector<std::string> kept;
  std::size_t import_at = std::string::npos;
  for (const auto& line : lines) {
    std::smatch m;
    if (std::regex_match(line, m, import_re)) {
      if (m[2].matched) alias = m[2].str();
      if (import_at == std::string::npos) import_at = kept.size();
      continue;
    }
    if (std::regex_match(line, from_re)) {
      if (import_at == std::string::npos) import_at = kept.size();
      continue;
    }
    kept.push_back(line);
  }

  std::string text = join_lines(kept);
  int rewrites = 0;
  text = rewrite_calls(text, alias + ".mean",
                       [](const std::string& a) { return "(sum(" + a + ") / len(" + a + "))"; }, rewrites);
  for (const char* fn : {"sum", "max", "min"}) {
    const std::string f_name = fn;
    text = rewrite_calls(text, alias + "." + f_name,
                         [f_name](const std::string& a) { return f_name + "(" + a + ")"; }, rewrites);
  }
  text = rewrite_calls(text, alias + ".array", [](const std::string& a) { return "list(" + a + ")"; }, rewrites);
  bool uses_math = false;
  text = rewrite_calls(text, alias + ".sqrt",
                       [&uses_math](const std::string& a) {
                         uses_math = true;
                         return "math.sqrt(" + a + ")";
                       },
                       rewrites);
  if (const std::string pi = alias + ".pi"; text.find(pi) != std::string::npos) {
    std::size_t p = 0;
    while ((p = text.find(pi, p)) != std::string::npos) {
      text.replace(p, pi.size(), "math.pi");
      p += 7;
      ++rewrites;
      uses_math = true;
    }
  }

  auto out = split_lines(text);
  if (uses_math && !std::regex_search(text, std::regex(R"((^|\n)\s*import\s+math\b)"))) {
    const std::size_t at = import_at == std::string::npos ? 0 : std::min(import_at, out.size());
    out.insert(out.begin() + static_cast<std::ptrdiff_t>(at), "import math");
  }
  f.lines = std::move(out);
  f.changed = f.lines != lines;
  f.explanation = "Replaced numpy with standard-library equivalents because packages cannot be installed in the "
                  "sandbox.";
  f.rationale = "The sandbox has no network and no package installer, so numpy is unavailable. " +
                std::to_string(rewrites) +
                " numpy call(s) were rewritten (mean -> sum/len, sum/max/min -> builtins, array -> list, "
                "sqrt/pi -> math) and the import was removed.";
  if (text.find(alias + ".") != std::string::npos) {
    f.rationale += " Some numpy usage has no mechanical replacement and still needs manual review.";
  }
  return f;
}

Fix fix_unused_import(const std::vector<std::string>& lines, const std::string& module) {
  Fix f;
  f.lines = lines;
  const std::regex import_re(R"(^\s*import\s+)" + module + R"((\.[A-Za-z0-9_.]+)?(\s+as\s+([A-Za-z_][A-Za-z0-9_]*))?\s*(#.*)?$)");
  const std::regex from_re(R"(^\s*from\s+)" + module + R"((\.[A-Za-z0-9_.]+)?\s+import\s+.*$)");
  std::set<std::size_t> import_lines;
  std::string alias = module;
  bool has_from = false;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    std::smatch m;
    if (std::regex_match(lines[i], m, import_re)) {
      import_lines.insert(i);
      if (m[3].matched) alias = m[3].str();
    } else if (std::regex_match(lines[i], from_re)) {
      import_lines.insert(i);
      has_from = true;
    }
  }
  const std::regex use("(^|[^A-Za-z0-9_])" + alias + "([^A-Za-z0-9_]|$)");
  bool referenced = false;
  for (std::size_t i = 0; i < lines.size() && !referenced; ++i) {
    if (import_lines.contains(i) || is_comment(lines[i])) continue;
    referenced = std::regex_search(code_part(lines[i]), use);
  }
  if (import_lines.empty() || referenced || has_from) {
    f.explanation = "Module '" + module + "' is not installed in the sandbox; manual review required.";
    f.rationale = "The program depends on '" + module + "', which cannot be installed without network access, "
                  "and no standard-library rewrite is known for it.";
    return f;
  }
  std::vector<std::string> out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (!import_lines.contains(i)) out.push_back(lines[i]);
  }
  f.lines = std::move(out);
  f.changed = true;
  f.explanation = "Removed the unused import of '" + module + "', which is not available in the sandbox.";
  f.rationale = "'" + module + "' cannot be installed in the sandbox and nothing in the program references it, "
                "so the import statement was dropped.";
  return f;
}

bool contains(const std::string& hay, const char* needle) { return hay.find(needle) != std::string::npos; }

}  // namespace

PatchResult RuleBasedStrategy::generate(const SourceArtifact& program, const FailureContext& context) {
  const auto start = std::chrono::steady_clock::now();
  const auto lines = split_lines(program.text);
  const std::string& cat = context.category;

  Fix fix;
  if (context.infrastructure || category::is_infrastructure(cat)) {
    fix.lines = lines;
    fix.explanation = "Left the program unchanged because the failure came from the sandbox (" + cat + ").";
    fix.rationale = "Sandbox infrastructure faults are not caused by the program; the same code is retried once "
                    "the backend recovers.";
  } else if (cat == "ZeroDivisionError" || contains(context.detail, "division by zero")) {
    fix = fix_zero_division(lines, context);
  } else if (cat == "NameError") {
    fix = fix_name_error(lines, context);
  } else if (cat == "IndentationError" || cat == "TabError") {
    fix = fix_indentation(lines, context);
  } else if (cat == "SyntaxError" && contains(context.detail, "expected ':'")) {
    fix = fix_missing_colon(lines, context);
  } else if (cat == "IndexError") {
    fix = fix_index_error(lines, context);
  } else if (cat == "TypeError" && is_concat_error(context)) {
    fix = fix_concat(lines, context);
  } else if (cat == category::kModuleNotFound || cat == "ImportError") {
    const std::string module = missing_module(context);
    if (module == "numpy") {
      fix = fix_numpy(lines);
    } else if (!module.empty()) {
      fix = fix_unused_import(lines, module);
    } else {
      fix.lines = lines;
      fix.explanation = "Import failed for an unidentified module; manual review required.";
      fix.rationale = "The import error did not name the missing module.";
    }
  } else {
    fix.lines = lines;
    fix.explanation = "No mechanical fix is known for " + (cat.empty() ? std::string("this failure") : cat) +
                      "; manual review required.";
    fix.rationale = "The failure (" + (context.detail.empty() ? cat : context.detail) +
                    ") is outside the set of deterministic repairs, so the program is returned unchanged.";
  }

  PatchResult r;
  r.program = join_lines(fix.lines);
  if (r.program.empty()) r.program = "pass\n";
  r.explanation = fix.explanation;
  r.rationale = fix.rationale;
  r.strategy = name();
  r.deterministic = true;
  r.elapsed_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
  return r;
}

}  // namespace mender
