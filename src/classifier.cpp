#include "mender/classifier.hpp"

#include <cstdlib>
#include <regex>
#include <vector>

namespace mender {

namespace {

// Name of the staged file inside the sandbox; traceback frames from it are
// the program's own lines.
constexpr const char* kScriptSuffix = "program.py";

const std::regex& exception_re() {
  static const std::regex re(
      R"((?:^|[^A-Za-z0-9_])([A-Za-z_][A-Za-z0-9_]*(?:Error|Exception|Warning)):)");
  return re;
}

const std::regex& frame_re() {
  static const std::regex re(R"re(File "([^"]*)", line ([0-9]+))re");
  return re;
}

// MemoryError as a whole exception token: "MemoryError: ..." or a bare
// "MemoryError" line. Identifiers that merely contain the word do not count.
const std::regex& memory_error_re() {
  static const std::regex re(R"((?:^|[^A-Za-z0-9_])MemoryError(?::|\s*$))");
  return re;
}

const std::regex& undefined_name_re() {
  static const std::regex re(R"(name '([A-Za-z_][A-Za-z0-9_]*)' is not defined)");
  return re;
}

std::vector<std::string> split(const std::string& text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string::npos) end = text.size();
    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    out.push_back(std::move(line));
    start = end + 1;
  }
  return out;
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return "";
  const auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

bool memory_signature(const std::vector<std::string>& lines) {
  for (const auto& line : lines) {
    if (std::regex_search(line, memory_error_re())) return true;
    if (line.find("Cannot allocate memory") != std::string::npos) return true;
    if (line.find("std::bad_alloc") != std::string::npos) return true;
    if (trim(line) == "Killed") return true;
  }
  return false;
}

bool timeout_signature(const std::vector<std::string>& lines) {
  for (const auto& line : lines) {
    if (line.find("TimeoutError: execution exceeded") != std::string::npos) return true;
    if (line.find("TIMEOUT ERROR") != std::string::npos) return true;
  }
  return false;
}

struct ExceptionMatch {
  std::string name;
  std::string detail;
};

// The final exception of a traceback is printed last, so the last match wins.
bool last_exception(const std::vector<std::string>& lines, ExceptionMatch& out) {
  bool found = false;
  for (const auto& line : lines) {
    auto begin = std::sregex_iterator(line.begin(), line.end(), exception_re());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
      const auto& m = *it;
      out.name = m[1].str();
      out.detail = trim(line.substr(static_cast<std::size_t>(m.position(0) + m.length(0))));
      found = true;
    }
  }
  return found;
}

std::string line_after(const std::vector<std::string>& lines, const std::string& needle) {
  std::string found;
  for (const auto& line : lines) {
    auto pos = line.find(needle);
    if (pos != std::string::npos) found = trim(line.substr(pos + needle.size()));
  }
  return found;
}

std::uint32_t failing_line(const std::vector<std::string>& lines) {
  std::uint32_t any = 0;
  std::uint32_t own = 0;
  for (const auto& line : lines) {
    std::smatch m;
    if (!std::regex_search(line, m, frame_re())) continue;
    const std::uint32_t n = static_cast<std::uint32_t>(std::strtoul(m[2].str().c_str(), nullptr, 10));
    any = n;
    const std::string path = m[1].str();
    if (path.size() >= std::char_traits<char>::length(kScriptSuffix) &&
        path.compare(path.size() - std::char_traits<char>::length(kScriptSuffix),
                     std::string::npos, kScriptSuffix) == 0) {
      own = n;
    }
  }
  return own != 0 ? own : any;
}

}  // namespace

std::string memory_kill_marker(std::uint64_t memory_limit_mb) {
  return "MemoryError: sandbox killed after exceeding the " + std::to_string(memory_limit_mb) +
         " MB memory ceiling (exit 137)";
}

std::string timeout_marker(std::uint64_t timeout_ms) {
  return "TimeoutError: execution exceeded " + std::to_string(timeout_ms) +
         " ms wall-clock limit; possible infinite loop";
}

std::string classify(const std::string& output) {
  const auto lines = split(output);
  if (memory_signature(lines)) return category::kMemory;
  if (timeout_signature(lines)) return category::kTimeout;
  ExceptionMatch m;
  if (last_exception(lines, m)) return m.name;
  if (output.find("No module named") != std::string::npos) return category::kModuleNotFound;
  return category::kGenericRuntime;
}

FailureContext analyze(const std::string& output) {
  FailureContext ctx;
  ctx.output = output;
  ctx.category = classify(output);
  const auto lines = split(output);

  ExceptionMatch m;
  if (ctx.category == category::kMemory) {
    ctx.detail = line_after(lines, "MemoryError:");
    if (ctx.detail.empty()) ctx.detail = "out of memory";
  } else if (ctx.category == category::kTimeout && timeout_signature(lines)) {
    ctx.detail = line_after(lines, "TimeoutError:");
    if (ctx.detail.empty()) ctx.detail = "execution timed out";
  } else if (last_exception(lines, m)) {
    ctx.detail = m.detail;
  } else if (ctx.category == category::kModuleNotFound) {
    ctx.detail = "No module named " + line_after(lines, "No module named");
  } else {
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
      if (!trim(*it).empty()) {
        ctx.detail = trim(*it);
        break;
      }
    }
  }

  ctx.line = failing_line(lines);

  if (ctx.category == "NameError" || ctx.category == "UnboundLocalError") {
    std::smatch nm;
    if (std::regex_search(ctx.detail, nm, undefined_name_re())) ctx.undefined_name = nm[1].str();
  }
  ctx.infrastructure = category::is_infrastructure(ctx.category);
  return ctx;
}

FailureContext failure_context(const ExecutionTrace& trace) {
  if (trace.infrastructure) {
    FailureContext ctx;
    ctx.category = trace.category.value_or(category::kSandboxApi);
    ctx.detail = trace.detail.value_or("");
    ctx.output = trace.output;
    ctx.infrastructure = true;
    return ctx;
  }
  FailureContext ctx = analyze(trace.output);
  if (trace.category) ctx.category = *trace.category;
  if (trace.failing_line) ctx.line = *trace.failing_line;
  return ctx;
}

}  // namespace mender
