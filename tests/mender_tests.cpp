#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mender/classifier.hpp"
#include "mender/config.hpp"
#include "mender/diff.hpp"
#include "mender/executor.hpp"
#include "mender/hash.hpp"
#include "mender/heuristics.hpp"
#include "mender/jsonlite.hpp"
#include "mender/observability.hpp"
#include "mender/orchestrator.hpp"
#include "mender/patch.hpp"
#include "mender/sandbox.hpp"
#include "mender/session_io.hpp"
#include "mender/validator.hpp"
#include "mender/version.hpp"

namespace fs = std::filesystem;
using namespace mender;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;
int g_tests_skipped = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

void skip_test(const std::string& name, const std::string& why) {
  std::cout << "  " << name << "... SKIPPED (" << why << ")\n";
  g_tests_skipped++;
}

bool contains(const std::string& hay, const std::string& needle) { return hay.find(needle) != std::string::npos; }

// ============================================================================
// Fakes
// ============================================================================

// What the fake sandbox does with one staged program.
struct FakeRun {
  BackendFault create_fault{BackendFault::none};
  BackendFault wait_fault{BackendFault::none};
  bool hang{false};
  bool throw_in_create{false};
  bool throw_in_wait{false};
  bool throw_in_destroy{false};
  int exit_status{0};
  std::string output;
};

// Records every call and checks the staging contract on create().
class FakeBackend : public ISandboxBackend {
 public:
  using Script = std::function<FakeRun(const std::string& program)>;

  explicit FakeBackend(Script script) : script_(std::move(script)) {}

  std::string name() const override { return "fake"; }

  CreateResult create(const SandboxSpec& spec) override {
    create_calls++;
    const fs::path dir = spec.staging_dir;
    const fs::path file = dir / spec.script_name;
    struct stat dst {};
    struct stat fst {};
    if (stat(dir.c_str(), &dst) == 0 && (dst.st_mode & 0777) != 0700) bad_permissions++;
    if (stat(file.c_str(), &fst) == 0 && (fst.st_mode & 0777) != 0600) bad_permissions++;
    if (!spec.network_disabled) network_enabled++;

    std::ifstream ifs(file, std::ios::binary);
    const std::string program((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    const FakeRun run = script_(program);

    CreateResult out;
    {
      std::lock_guard<std::mutex> lk(mu_);
      staging_dirs_.push_back(dir.string());
    }
    if (run.throw_in_create) throw std::runtime_error("fake create exploded");
    if (run.create_fault != BackendFault::none) {
      out.fault = run.create_fault;
      out.message = "fake create fault";
      return out;
    }
    std::lock_guard<std::mutex> lk(mu_);
    out.instance = "fake-" + std::to_string(next_++);
    live_[out.instance] = run;
    created++;
    return out;
  }

  WaitResult wait(const std::string& instance, std::uint64_t) override {
    WaitResult out;
    const FakeRun run = get(instance);
    if (run.throw_in_wait) throw std::runtime_error("fake wait exploded");
    if (run.wait_fault != BackendFault::none) {
      out.fault = run.wait_fault;
      out.message = "fake wait fault";
      return out;
    }
    if (run.hang) {
      out.timed_out = true;
      return out;
    }
    out.exited = true;
    out.exit_status = run.exit_status;
    return out;
  }

  LogsResult logs(const std::string& instance) override {
    logs_calls++;
    LogsResult out;
    out.text = get(instance).output;
    return out;
  }

  void kill(const std::string&) override { kill_calls++; }

  void destroy(const std::string& instance) override {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = live_.find(instance);
    if (it == live_.end()) return;
    const bool explode = it->second.throw_in_destroy;
    live_.erase(it);
    destroyed++;
    if (explode) throw std::runtime_error("fake destroy exploded");
  }

  ProbeResult probe() override {
    ProbeResult r;
    r.available = true;
    r.backend = name();
    return r;
  }

  std::size_t live() const {
    std::lock_guard<std::mutex> lk(mu_);
    return live_.size();
  }

  std::vector<std::string> staging_dirs() const {
    std::lock_guard<std::mutex> lk(mu_);
    return staging_dirs_;
  }

  std::atomic<int> create_calls{0};
  std::atomic<int> created{0};
  std::atomic<int> destroyed{0};
  std::atomic<int> kill_calls{0};
  std::atomic<int> logs_calls{0};
  std::atomic<int> bad_permissions{0};
  std::atomic<int> network_enabled{0};

 private:
  FakeRun get(const std::string& instance) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = live_.find(instance);
    return it == live_.end() ? FakeRun{} : it->second;
  }

  Script script_;
  mutable std::mutex mu_;
  std::map<std::string, FakeRun> live_;
  std::vector<std::string> staging_dirs_;
  int next_{1};
};

std::string traceback(int line, const std::string& code, const std::string& error) {
  return "Traceback (most recent call last):\n  File \"/app/program.py\", line " + std::to_string(line) +
         ", in <module>\n    " + code + "\n" + error + "\n";
}

FakeRun ok_run(const std::string& output) {
  FakeRun r;
  r.output = output;
  return r;
}

FakeRun fail_run(const std::string& output, int status = 1) {
  FakeRun r;
  r.exit_status = status;
  r.output = output;
  return r;
}

const char* kDivisionProgram = "x = 100\ny = 0\nprint(x / y)\n";

// Behaves like Python on kDivisionProgram: fails until the division is guarded.
FakeRun division_script(const std::string& program) {
  if (contains(program, "try:")) return ok_run("Error: Division by zero\n");
  return fail_run(traceback(3, "print(x / y)", "ZeroDivisionError: division by zero"));
}

std::shared_ptr<FakeBackend> division_backend() { return std::make_shared<FakeBackend>(division_script); }

class FakeTransport : public IHttpTransport {
 public:
  HttpResponse post_json(const std::string& url, const std::string& body, std::uint64_t timeout_ms) override {
    std::lock_guard<std::mutex> lk(mu);
    posts++;
    last_url = url;
    last_body = body;
    last_timeout_ms = timeout_ms;
    return next;
  }
  HttpResponse get(const std::string& url, std::uint64_t) override {
    std::lock_guard<std::mutex> lk(mu);
    last_url = url;
    return get_response;
  }

  std::mutex mu;
  HttpResponse next;
  HttpResponse get_response;
  int posts{0};
  std::string last_url;
  std::string last_body;
  std::uint64_t last_timeout_ms{0};
};

// Ollama-style envelope around an inner JSON object.
HttpResponse advisory_reply(const std::string& fixed_code, const std::string& explanation = "Fixed it.") {
  jsonlite::Object inner;
  inner["explanation"] = explanation;
  inner["fixed_code"] = fixed_code;
  inner["reasoning"] = "Because.";
  jsonlite::Object envelope;
  envelope["model"] = "llama3";
  envelope["response"] = jsonlite::to_json(inner);
  envelope["done"] = true;
  HttpResponse r;
  r.status = 200;
  r.body = jsonlite::to_json(envelope);
  return r;
}

ExecutorLimits fast_limits() {
  ExecutorLimits l;
  l.exec_timeout_ms = 300;
  return l;
}

OrchestratorOptions fast_options() {
  OrchestratorOptions o;
  o.infra_retry_delay_ms = 0;
  return o;
}

RepairOrchestrator orchestrator_for(std::shared_ptr<ISandboxBackend> backend,
                                    std::shared_ptr<IPatchStrategy> strategy = nullptr,
                                    OrchestratorOptions options = fast_options(),
                                    std::vector<std::shared_ptr<IHeuristicCheck>> checks = {}) {
  if (!strategy) strategy = std::make_shared<RuleBasedStrategy>();
  return RepairOrchestrator(SandboxExecutor(std::move(backend), fast_limits()), std::move(strategy),
                            PatchValidator(std::make_shared<RuleBasedStrategy>()), options, std::move(checks));
}

void expect_session_invariants(const RepairSession& s, const std::string& label) {
  expect(s.total_iterations == s.traces.size(), label + ": total_iterations == traces.size()");
  if (!s.traces.empty()) {
    expect(s.patches.size() == s.traces.size() - 1, label + ": patches.size() == traces.size() - 1");
    const SourceArtifact& expected = s.patches.empty() ? s.original : s.patches.back().after;
    expect(s.traces.back().artifact == expected, label + ": last trace ran the last patched artifact");
  }
  for (std::size_t i = 0; i < s.patches.size(); ++i) {
    expect(s.patches[i].before == s.traces[i].artifact, label + ": patch applies to the traced artifact");
    expect(!s.patches[i].explanation.empty(), label + ": patch explanation non-empty");
    expect(!s.patches[i].rationale.empty(), label + ": patch rationale non-empty");
  }
  if (s.state == SessionState::aborted) expect(!s.failure_reason.empty(), label + ": aborted has a reason");
}

fs::path temp_path(const std::string& name) {
  return fs::temp_directory_path() / ("mender-test-" + std::to_string(::getpid()) + "-" + name);
}

bool executable(const char* path) { return access(path, X_OK) == 0; }

// ============================================================================
// Hashing & JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_artifact_digest_domain() {
  const SourceArtifact a = make_artifact("print(1)\n");
  expect(a.digest.size() == 64, "artifact digest is 64 hex chars");
  expect(a.digest == artifact_digest("print(1)\n"), "make_artifact uses artifact_digest");
  expect(a.digest != blake3_hex("print(1)\n"), "src: domain separates artifact digests");
  expect(a.digest != trace_digest("print(1)\n"), "src: and trace: domains differ");
  expect(make_artifact("print(1)\n") == a, "equal text gives equal artifacts");
}

void test_json_strict_parse() {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(R"({"a":1,"b":"x","c":[true,null],"d":-2.5})", &err);
  expect(!err, "valid document parses");
  expect(jsonlite::get_u64(obj, "a") == 1, "integer value");
  expect(jsonlite::get_string(obj, "b") == "x", "string value");
  expect(jsonlite::get_double(obj, "d") == -2.5, "negative number is a double");

  jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate keys rejected");

  jsonlite::parse(R"({"a":1} trailing)", &err);
  expect(err.has_value(), "trailing data rejected");

  std::string deep;
  for (int i = 0; i < 70; ++i) deep += "[";
  for (int i = 0; i < 70; ++i) deep += "]";
  expect(jsonlite::validate_strict(deep).has_value(), "nesting deeper than the limit rejected");

  obj = jsonlite::parse(R"({"s":"\u00e9\ud83d\ude00"})", &err);
  expect(!err, "unicode escapes parse");
  expect(jsonlite::get_string(obj, "s") == "\xC3\xA9\xF0\x9F\x98\x80", "surrogate pair decoded to UTF-8");
}

void test_json_writer_sorted_and_escaped() {
  jsonlite::Object o;
  o["b"] = std::string("line\n\"q\"");
  o["a"] = true;
  const std::string s = jsonlite::to_json(o);
  expect(s == R"({"a":true,"b":"line\n\"q\""})", "keys sorted, control chars escaped: " + s);
}

// ============================================================================
// Classifier
// ============================================================================

void test_classifier_categories() {
  expect(classify(traceback(3, "print(x / y)", "ZeroDivisionError: division by zero")) == "ZeroDivisionError",
         "traceback category");
  expect(classify("Killed\n") == "MemoryError", "Killed line is a memory kill");
  expect(classify(memory_kill_marker(128)) == "MemoryError", "executor memory marker");
  expect(classify(timeout_marker(5000)) == "TimeoutError", "executor timeout marker");
  expect(classify("ImportError: No module named foo\n") == "ImportError", "explicit error name wins");
  expect(classify("python: No module named pip\n") == "ModuleNotFoundError", "bare 'No module named'");
  expect(classify("segfault\n") == "RuntimeError", "fallback category");
  expect(classify("") == "RuntimeError", "empty output is total");
  expect(classify("ValueError: a\nDuring handling...\nKeyError: 'k'\n") == "KeyError", "last exception wins");
  expect(classify("UserWarning: deprecated\n") == "UserWarning", "warnings are categories");
  // Memory signature outranks a later exception.
  expect(classify("MemoryError\nValueError: x\n") == "MemoryError", "memory priority");
  expect(classify(traceback(1, "x = [0] * 10**12", "MemoryError")) == "MemoryError", "bare MemoryError line");
  expect(classify("NameError: name 'MemoryError_count' is not defined\n") == "NameError",
         "identifier containing MemoryError is not a memory failure");
  expect(classify("NameError: name 'MemoryError' is not defined\n") == "NameError",
         "quoted MemoryError name is not a memory failure");
  expect(classify("print('OutOfMemoryErrorHandler')\nTypeError: bad\n") == "TypeError", "embedded word ignored");
}

void test_classifier_idempotent() {
  const std::vector<std::string> outputs = {
      traceback(2, "print(total)", "NameError: name 'total' is not defined"), "Killed", "", "garbage \xff\xfe",
      timeout_marker(300), "SyntaxError: expected ':'"};
  for (const auto& o : outputs) {
    expect(classify(o) == classify(o), "classify is deterministic");
    const FailureContext a = analyze(o);
    const FailureContext b = analyze(o);
    expect(a.category == b.category && a.detail == b.detail && a.line == b.line, "analyze is deterministic");
  }
}

void test_analyze_details() {
  const std::string out =
      "Traceback (most recent call last):\n"
      "  File \"/app/program.py\", line 7, in <module>\n"
      "    main()\n"
      "  File \"/app/program.py\", line 4, in main\n"
      "    print(total)\n"
      "  File \"/usr/lib/python3.11/helper.py\", line 99, in h\n"
      "NameError: name 'total' is not defined\n";
  const FailureContext ctx = analyze(out);
  expect(ctx.category == "NameError", "NameError category");
  expect(ctx.detail == "name 'total' is not defined", "detail after the category: " + ctx.detail);
  expect(ctx.line == 4, "last program.py frame is the failing line");
  expect(ctx.undefined_name == "total", "undefined name extracted");
  expect(!ctx.infrastructure, "program failure is not infrastructure");

  const FailureContext infra = analyze("SandboxUnavailableError: docker daemon down");
  expect(infra.infrastructure, "infrastructure categories flagged");
}

// ============================================================================
// Diff
// ============================================================================

void test_split_join_round_trip() {
  for (const std::string t : {"", "a", "a\n", "a\nb", "\n\n", "x\r\ny\n"}) {
    expect(join_lines(split_lines(t)) == t, "join(split(t)) == t");
  }
  expect(split_lines("a\n").size() == 2, "trailing newline keeps an empty segment");
}

void test_unified_diff_format() {
  expect(unified_diff("a\nb\nc\n", "a\nb\nc\n").empty(), "no diff for identical text");
  const std::string d = unified_diff("a\nb\nc\n", "a\nB\nc\n");
  expect(d == "--- original.py\n+++ fixed.py\n@@ -1,3 +1,3 @@\n a\n-b\n+B\n c\n", "single replace hunk: " + d);

  std::string big_a;
  std::string big_b;
  for (int i = 1; i <= 20; ++i) {
    big_a += "line" + std::to_string(i) + "\n";
    big_b += (i == 2 || i == 18 ? "CHANGED" : "line" + std::to_string(i)) + "\n";
  }
  const std::string d2 = unified_diff(big_a, big_b);
  expect(contains(d2, "@@ -1,5 +1,5 @@"), "first hunk clipped at file start: " + d2);
  expect(contains(d2, "@@ -15,6 +15,6 @@"), "second hunk clipped at file end: " + d2);
}

void test_diff_apply_round_trip() {
  const std::vector<std::pair<std::string, std::string>> pairs = {
      {"", "a\n"},
      {"a\n", ""},
      {"a\nb\nc\n", "a\nc\n"},
      {"a\nb\nc\n", "x\na\nb\nc\ny\n"},
      {kDivisionProgram,
       "x = 100\ny = 0\ntry:\n    print(x / y)\nexcept ZeroDivisionError:\n    print(\"Error: Division by zero\")\n"},
      {"def f():\n\treturn 1\n", "def f():\n    return 1\n"},
      {"a\nb\nc\nd\ne\n", "e\nd\nc\nb\na\n"},
  };
  for (const auto& [a, b] : pairs) {
    const auto edits = diff_lines(a, b);
    expect(apply_edits(a, edits) == b, "apply_edits(a, diff(a, b)) == b");
    for (const auto& e : edits) {
      if (e.kind != EditKind::insert) expect(e.old_line >= 1, "1-based old line");
      if (e.kind != EditKind::remove) expect(e.new_line >= 1, "1-based new line");
    }
  }
  expect(diff_lines("same\n", "same\n").empty(), "no edits for identical text");
}

// Replays an edit script and returns the number of equal steps.
std::size_t replay_steps(const std::vector<std::string>& a, const std::vector<std::string>& b,
                         const std::vector<DiffStep>& steps) {
  std::size_t x = 0;
  std::size_t y = 0;
  std::size_t equal = 0;
  for (const auto& s : steps) {
    if (s.op == DiffOp::equal) {
      expect(x < a.size() && y < b.size() && a[x] == b[y], "equal step pairs equal lines");
      ++x;
      ++y;
      ++equal;
    } else if (s.op == DiffOp::remove) {
      expect(x < a.size(), "remove inside the original");
      ++x;
    } else {
      expect(y < b.size(), "insert inside the candidate");
      ++y;
    }
  }
  expect(x == a.size() && y == b.size(), "script consumes both sides");
  return equal;
}

std::size_t lcs_length(const std::vector<std::string>& a, const std::vector<std::string>& b) {
  std::vector<std::vector<std::size_t>> t(a.size() + 1, std::vector<std::size_t>(b.size() + 1, 0));
  for (std::size_t i = 1; i <= a.size(); ++i)
    for (std::size_t j = 1; j <= b.size(); ++j)
      t[i][j] = a[i - 1] == b[j - 1] ? t[i - 1][j - 1] + 1 : std::max(t[i - 1][j], t[i][j - 1]);
  return t[a.size()][b.size()];
}

void test_diff_shortest_script() {
  std::uint32_t seed = 12345;
  auto next = [&seed]() {
    seed = seed * 1103515245u + 12345u;
    return (seed >> 16) & 0x7fff;
  };
  const char* alphabet[] = {"a", "b", "c", "d"};
  for (int round = 0; round < 300; ++round) {
    std::vector<std::string> a(next() % 14);
    std::vector<std::string> b(next() % 14);
    const std::uint32_t width = 2 + next() % 3;
    for (auto& l : a) l = alphabet[next() % width];
    for (auto& l : b) l = alphabet[next() % width];
    const std::size_t equal = replay_steps(a, b, myers_diff(a, b));
    expect(equal == lcs_length(a, b), "edit script is a shortest one");
  }
}

void test_diff_large_reindent() {
  std::string tabs;
  std::string spaces;
  constexpr int kFunctions = 2500;
  for (int i = 0; i < kFunctions; ++i) {
    const std::string n = std::to_string(i);
    tabs += "def f" + n + "(x):\n\treturn x + " + n + "\n";
    spaces += "def f" + n + "(x):\n    return x + " + n + "\n";
  }
  const auto start = std::chrono::steady_clock::now();
  const auto edits = diff_lines(tabs, spaces);
  const std::string unified = unified_diff(tabs, spaces);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
  expect(edits.size() == static_cast<std::size_t>(kFunctions), "one replace per re-indented line");
  expect(std::all_of(edits.begin(), edits.end(), [](const LineEdit& e) { return e.kind == EditKind::replace; }),
         "re-indented lines pair up as replacements");
  expect(apply_edits(tabs, edits) == spaces, "apply_edits reproduces the re-indented program");
  expect(contains(unified, "-\treturn x + 2499\n+    return x + 2499\n"), "unified diff covers the last line");
  expect(ms < 5000, "large diff completes quickly: " + std::to_string(ms) + " ms");

  // Every line rewritten and no line shared: the script degenerates to
  // remove-all/insert-all without quadratic work.
  std::string upper = tabs;
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
  expect(apply_edits(tabs, diff_lines(tabs, upper)) == upper, "full rewrite round trip");
}

// ============================================================================
// Rule-based strategy
// ============================================================================

PatchResult rule_fix(const std::string& program, const std::string& output) {
  RuleBasedStrategy rules;
  return rules.generate(make_artifact(program), analyze(output));
}

void test_rule_zero_division() {
  const PatchResult r = rule_fix(kDivisionProgram, traceback(3, "print(x / y)", "ZeroDivisionError: division by zero"));
  expect(r.program ==
             "x = 100\ny = 0\ntry:\n    print(x / y)\nexcept ZeroDivisionError:\n    print(\"Error: Division by zero\")\n",
         "division line wrapped: " + r.program);
  expect(r.deterministic && r.strategy == "rule_based", "rule-based result metadata");
  expect(!r.explanation.empty() && !r.rationale.empty(), "explanation and rationale");

  // No line known: every division assignment is guarded.
  const PatchResult all = rule_fix("a = 1 / 0\nb = 2\nc = b / 0\n", "ZeroDivisionError: division by zero");
  expect(contains(all.program, "try:\n    a = 1 / 0\n") && contains(all.program, "try:\n    c = b / 0\n"),
         "all division assignments guarded: " + all.program);
}

void test_rule_name_error() {
  const PatchResult r =
      rule_fix("count = 1\nprint(total)\n", traceback(2, "print(total)", "NameError: name 'total' is not defined"));
  expect(r.program == "count = 1\ntotal = None\nprint(total)\n", "name defined before use: " + r.program);

  const PatchResult nested = rule_fix("def f():\n    return missing\nf()\n",
                                      traceback(2, "return missing", "NameError: name 'missing' is not defined"));
  expect(contains(nested.program, "    missing = None\n    return missing"), "definition at the use's indentation");
}

void test_rule_indentation() {
  const PatchResult r = rule_fix("def f():\nreturn 1\nprint(f())\n",
                                 traceback(2, "return 1", "IndentationError: expected an indented block"));
  expect(r.program == "def f():\n    return 1\nprint(f())\n", "header body indented: " + r.program);

  const PatchResult tabs = rule_fix("if True:\n\tprint(1)\n      print(2)\n", "TabError: inconsistent use of tabs");
  expect(!contains(tabs.program, "\t"), "tabs expanded");
  expect(contains(tabs.program, "    print(1)\n    print(2)"), "levels rounded to four: " + tabs.program);
}

void test_rule_missing_colon() {
  const PatchResult r = rule_fix("x = 3\nif x > 1\n    print(x)\n",
                                 traceback(2, "if x > 1", "SyntaxError: expected ':'"));
  expect(r.program == "x = 3\nif x > 1:\n    print(x)\n", "colon added: " + r.program);
}

void test_rule_index_error() {
  const PatchResult r =
      rule_fix("items = [1]\nprint(items[5])\n", traceback(2, "print(items[5])", "IndexError: list index out of range"));
  expect(contains(r.program, "try:\n    print(items[5])\nexcept IndexError:\n"), "subscript guarded: " + r.program);
}

void test_rule_concat() {
  const PatchResult r = rule_fix("n = 5\nmsg = \"Total: \" + n\nprint(msg)\n",
                                 traceback(2, "msg = \"Total: \" + n",
                                           "TypeError: can only concatenate str (not \"int\") to str"));
  expect(contains(r.program, "msg = \"Total: \" + str(n)"), "operand wrapped in str(): " + r.program);
}

void test_rule_numpy_rewrite() {
  const PatchResult r = rule_fix("import numpy as np\ndata = [1, 2, 3]\nprint(np.mean(data))\nprint(np.sqrt(4))\n",
                                 traceback(1, "import numpy as np",
                                           "ModuleNotFoundError: No module named 'numpy'"));
  expect(!contains(r.program, "numpy") && !contains(r.program, "np."), "numpy removed: " + r.program);
  expect(contains(r.program, "(sum(data) / len(data))"), "mean rewritten");
  expect(contains(r.program, "import math") && contains(r.program, "math.sqrt(4)"), "sqrt moved to math");
}

void test_rule_unused_import() {
  const PatchResult r = rule_fix("import requests\nprint('hi')\n",
                                 traceback(1, "import requests", "ModuleNotFoundError: No module named 'requests'"));
  expect(r.program == "print('hi')\n", "unused import dropped: " + r.program);

  const PatchResult used = rule_fix("import requests\nrequests.get('x')\n",
                                    "ModuleNotFoundError: No module named 'requests'");
  expect(used.program == "import requests\nrequests.get('x')\n", "used import kept");
  expect(contains(used.explanation, "manual review"), "manual review requested");
}

void test_rule_unknown_and_infrastructure() {
  const PatchResult r = rule_fix("raise ValueError('x')\n", "ValueError: x");
  expect(r.program == "raise ValueError('x')\n", "unknown failure leaves program unchanged");
  expect(contains(r.explanation, "manual review"), "unknown failure asks for review");

  RuleBasedStrategy rules;
  FailureContext infra;
  infra.category = category::kSandboxUnavailable;
  infra.infrastructure = true;
  const PatchResult i = rules.generate(make_artifact("print(1)\n"), infra);
  expect(i.program == "print(1)\n", "infrastructure failures leave program unchanged");

  const PatchResult empty = rules.generate(make_artifact(""), analyze("ValueError: x"));
  expect(!empty.program.empty(), "never returns an empty program");
}

// ============================================================================
// Advisory strategy
// ============================================================================

void test_advisory_parse_variants() {
  auto parsed = parse_advisory_response(advisory_reply("print('ok')"));
  expect(std::holds_alternative<ParsedCandidate>(parsed), "well-formed reply parses");
  expect(std::get<ParsedCandidate>(parsed).program == "print('ok')", "fixed_code extracted");

  parsed = parse_advisory_response(advisory_reply("```python\nprint('ok')\n```"));
  expect(std::get<ParsedCandidate>(parsed).program == "print('ok')", "fences stripped");

  parsed = parse_advisory_response(advisory_reply("a = 1\\nprint(\\\"a\\\")"));
  expect(std::get<ParsedCandidate>(parsed).program == "a = 1\nprint(\"a\")", "literal escapes normalized");

  HttpResponse bad_status = advisory_reply("print(1)");
  bad_status.status = 500;
  parsed = parse_advisory_response(bad_status);
  expect(std::get<FallbackRequired>(parsed).code == ErrorCode::advisory_bad_status, "non-200 falls back");

  HttpResponse down;
  down.error = ErrorCode::advisory_unreachable;
  down.error_message = "connection refused";
  parsed = parse_advisory_response(down);
  expect(std::get<FallbackRequired>(parsed).code == ErrorCode::advisory_unreachable, "transport error falls back");

  HttpResponse not_json;
  not_json.status = 200;
  not_json.body = "<html>";
  expect(std::holds_alternative<FallbackRequired>(parse_advisory_response(not_json)), "non-JSON envelope");

  HttpResponse inner_bad;
  inner_bad.status = 200;
  inner_bad.body = R"({"response":"sure! here is the fix"})";
  expect(std::holds_alternative<FallbackRequired>(parse_advisory_response(inner_bad)), "non-JSON inner body");

  expect(std::holds_alternative<FallbackRequired>(parse_advisory_response(advisory_reply("   "))),
         "empty fixed_code falls back");
}

void test_advisory_request_shape() {
  AdvisoryOptions opts;
  opts.base_url = "http://advisor:11434";
  opts.timeout_ms = 1234;
  auto transport = std::make_shared<FakeTransport>();
  transport->next = advisory_reply("x = 100\ny = 0\ntry:\n    print(x / y)\nexcept ZeroDivisionError:\n    pass\n");
  AdvisoryStrategy advisory(opts, transport, std::make_shared<RuleBasedStrategy>());

  const PatchResult r = advisory.generate(make_artifact(kDivisionProgram),
                                          analyze(traceback(3, "print(x / y)", "ZeroDivisionError: division by zero")));
  expect(r.strategy == "advisory" && !r.deterministic && !r.advisory_fallback, "advisory result metadata");
  expect(transport->last_url == "http://advisor:11434/api/generate", "generate endpoint");
  expect(transport->last_timeout_ms == 1234, "timeout passed to transport");

  std::optional<jsonlite::JsonError> err;
  const auto body = jsonlite::parse(transport->last_body, &err);
  expect(!err, "request body is JSON");
  expect(jsonlite::get_string(body, "model") == "llama3", "default model");
  expect(jsonlite::get_string(body, "format") == "json", "json format requested");
  expect(!jsonlite::get_bool(body, "stream", true), "streaming disabled");
  const std::string prompt = jsonlite::get_string(body, "prompt");
  expect(contains(prompt, "NO network") && contains(prompt, "print(x / y)") && contains(prompt, "ZeroDivisionError"),
         "prompt carries rules, code and error");
}

void test_advisory_falls_back_to_rules() {
  auto transport = std::make_shared<FakeTransport>();
  transport->next.error = ErrorCode::advisory_timeout;
  transport->next.error_message = "timed out";
  AdvisoryStrategy advisory(AdvisoryOptions{}, transport, std::make_shared<RuleBasedStrategy>());
  const PatchResult r = advisory.generate(make_artifact(kDivisionProgram),
                                          analyze(traceback(3, "print(x / y)", "ZeroDivisionError: division by zero")));
  expect(r.advisory_fallback && r.fallback_code == ErrorCode::advisory_timeout, "fallback recorded");
  expect(r.strategy == "rule_based", "rule-based answered");
  expect(contains(r.program, "except ZeroDivisionError:"), "rule-based fix applied");
  expect(contains(r.rationale, "Advisory service unavailable"), "rationale notes the fallback");
}

void test_advisory_probe() {
  auto transport = std::make_shared<FakeTransport>();
  transport->get_response.status = 200;
  transport->get_response.body = R"({"models":[{"name":"llama3:latest"}]})";
  AdvisoryStrategy advisory(AdvisoryOptions{}, transport, std::make_shared<RuleBasedStrategy>());
  AdvisoryProbe p = advisory.probe();
  expect(p.available && contains(p.detail, "available"), "model listed");
  expect(transport->last_url == "http://localhost:11434/api/tags", "tags endpoint");

  transport->get_response = HttpResponse{};
  transport->get_response.error = ErrorCode::advisory_unreachable;
  p = advisory.probe();
  expect(!p.available, "unreachable service reported");
}

// ============================================================================
// Validator
// ============================================================================

void test_regression_guard() {
  const std::string original = "def area(r):\n    return 3.14 * r * r\n\nclass Shape:\n    pass\n\nprint(area(2))\n";
  expect(declared_names(original) == std::vector<std::string>({"area", "Shape"}), "declared names");
  expect(regression_check(original, original, 0.3).empty(), "identical candidate passes");
  expect(!regression_check(original, "", 0.3).empty(), "empty candidate rejected");
  expect(!regression_check(original, "print(1)\n", 0.3).empty(), "short candidate rejected");
  const std::string renamed = "def circle_area(r):\n    return 3.14 * r * r\n\nclass Figure:\n    pass\n\n"
                              "print(circle_area(2))\n";
  expect(contains(regression_check(original, renamed, 0.3), "declared"), "dropping every declared name rejected");
  expect(regression_check("print(1)\n", "x = 1\nprint(x)\n", 0.3).empty(), "no declarations, no name check");
}

void test_validator_substitutes_rule_fix() {
  PatchValidator validator(std::make_shared<RuleBasedStrategy>(), 0.3);
  const std::string program = "def ratio(a, b):\n    return a / b\n\nvalue = ratio(1, 0)\nprint(value)\n";
  const FailureContext ctx = analyze(traceback(4, "value = ratio(1, 0)", "ZeroDivisionError: division by zero"));

  const ValidatedPatch v = validator.validate_and_diff(make_artifact(program), "pass", ctx);
  expect(v.substituted && !v.rejection_reason.empty(), "gutted candidate rejected");
  expect(contains(v.accepted_program, "def ratio"), "substitute keeps the declared surface");
  expect(contains(v.accepted_program, "except ZeroDivisionError"), "substitute is the rule-based fix");
  expect(apply_edits(program, v.edits) == v.accepted_program, "edits reproduce the accepted program");
  expect(contains(v.unified_diff, "--- original.py\n+++ fixed.py\n"), "unified diff headers");

  const ValidatedPatch ok = validator.validate_and_diff(make_artifact(program), program + "# done\n", ctx);
  expect(!ok.substituted && ok.accepted_program == program + "# done\n", "acceptable candidate kept");
}

// ============================================================================
// Executor (fake backend)
// ============================================================================

void test_executor_success_and_cleanup() {
  auto backend = std::make_shared<FakeBackend>([](const std::string& p) { return ok_run("ran: " + p); });
  SandboxExecutor exec(backend, fast_limits());
  const ExecutionTrace t = exec.execute(make_artifact("print(1)\n"), 1);
  expect(t.ok && t.exit_status == 0 && !t.category, "success trace");
  expect(t.output == "ran: print(1)\n", "staged program text reached the sandbox");
  expect(t.output_lines == std::vector<std::string>({"ran: print(1)"}), "non-empty output lines");
  expect(t.iteration == 1 && t.timestamp_ms > 0, "iteration and timestamp");
  expect(backend->created == 1 && backend->destroyed == 1 && backend->live() == 0, "one instance, destroyed");
  expect(backend->bad_permissions == 0, "staging is 0700 dir / 0600 file");
  expect(backend->network_enabled == 0, "network disabled");
  for (const auto& dir : backend->staging_dirs()) expect(!fs::exists(dir), "staging directory removed");
}

void test_executor_failure_classified() {
  auto backend = division_backend();
  SandboxExecutor exec(backend, fast_limits());
  const ExecutionTrace t = exec.execute(make_artifact(kDivisionProgram), 2);
  expect(!t.ok && t.exit_status == 1, "failure trace");
  expect(t.category && *t.category == "ZeroDivisionError", "category recorded");
  expect(t.detail && *t.detail == "division by zero", "detail recorded");
  expect(t.failing_line && *t.failing_line == 3, "failing line recorded");
  expect(!t.infrastructure, "program failure");
}

void test_executor_timeout_path() {
  auto backend = std::make_shared<FakeBackend>([](const std::string&) {
    FakeRun r;
    r.hang = true;
    r.output = "should never be read";
    return r;
  });
  SandboxExecutor exec(backend, fast_limits());
  const ExecutionTrace t = exec.execute(make_artifact("while True: pass\n"), 1);
  expect(t.timed_out && !t.ok, "timed out");
  expect(t.category && *t.category == "TimeoutError", "TimeoutError category");
  expect(t.output == timeout_marker(300), "synthetic timeout output");
  expect(backend->logs_calls == 0, "no logs read after timeout");
  expect(backend->kill_calls >= 1, "instance killed");
  expect(backend->live() == 0 && backend->destroyed == 1, "instance destroyed after timeout");
}

void test_executor_memory_marker() {
  auto backend = std::make_shared<FakeBackend>([](const std::string&) { return fail_run("allocating\n", 137); });
  SandboxExecutor exec(backend, fast_limits());
  const ExecutionTrace t = exec.execute(make_artifact("x = ' ' * 10**10\n"), 1);
  expect(t.exit_status == 137, "exit 137 kept");
  expect(contains(t.output, memory_kill_marker(128)), "memory marker appended");
  expect(t.category && *t.category == "MemoryError", "MemoryError category");
}

void test_executor_backend_faults() {
  const std::vector<std::pair<BackendFault, std::string>> cases = {
      {BackendFault::unreachable, category::kSandboxUnavailable},
      {BackendFault::image_missing, category::kImageNotFound},
      {BackendFault::allocation_failed, category::kSandboxAllocation},
      {BackendFault::api_error, category::kSandboxApi},
  };
  for (const auto& [fault, cat] : cases) {
    auto on_create = std::make_shared<FakeBackend>([fault = fault](const std::string&) {
      FakeRun r;
      r.create_fault = fault;
      return r;
    });
    const ExecutionTrace t = SandboxExecutor(on_create, fast_limits()).execute(make_artifact("print(1)\n"), 1);
    expect(t.infrastructure && t.category && *t.category == cat, "create fault -> " + cat);
    expect(on_create->live() == 0, "nothing to destroy after a create fault");

    auto on_wait = std::make_shared<FakeBackend>([fault = fault](const std::string&) {
      FakeRun r;
      r.wait_fault = fault;
      return r;
    });
    const ExecutionTrace w = SandboxExecutor(on_wait, fast_limits()).execute(make_artifact("print(1)\n"), 1);
    expect(w.infrastructure && w.category && *w.category == cat, "wait fault -> " + cat);
    expect(on_wait->created == 1 && on_wait->destroyed == 1, "instance destroyed after a wait fault");
  }
}

void test_executor_contains_backend_exceptions() {
  auto run_with = [](FakeRun run) {
    auto backend = std::make_shared<FakeBackend>([run](const std::string&) { return run; });
    const ExecutionTrace t = SandboxExecutor(backend, fast_limits()).execute(make_artifact("print(1)\n"), 1);
    expect(backend->live() == 0, "instance destroyed after a backend exception");
    for (const auto& dir : backend->staging_dirs()) expect(!fs::exists(dir), "staging removed");
    return t;
  };

  FakeRun create_throws;
  create_throws.throw_in_create = true;
  ExecutionTrace t = run_with(create_throws);
  expect(t.infrastructure && t.category && *t.category == category::kSandboxApi, "create() exception");
  expect(t.error_code == ErrorCode::backend_api_error && contains(t.output, "fake create exploded"),
         "exception text kept: " + t.output);

  FakeRun wait_throws;
  wait_throws.throw_in_wait = true;
  t = run_with(wait_throws);
  expect(t.infrastructure && t.category && *t.category == category::kSandboxApi, "wait() exception");
  expect(!t.timed_out && contains(t.output, "fake wait exploded"), "wait exception reported");

  FakeRun destroy_throws = ok_run("fine\n");
  destroy_throws.throw_in_destroy = true;
  t = run_with(destroy_throws);
  expect(t.infrastructure && t.category && *t.category == category::kSandboxApi,
         "destroy() exception is an infrastructure fault");
  expect(contains(t.output, "fake destroy exploded"), "destroy exception reported: " + t.output);
}

void test_executor_staging_failure() {
  auto backend = division_backend();
  ExecutorLimits limits = fast_limits();
  limits.staging_root = "/nonexistent/mender/staging";
  const ExecutionTrace t = SandboxExecutor(backend, limits).execute(make_artifact("print(1)\n"), 1);
  expect(t.infrastructure && t.category && *t.category == category::kStagingWrite, "StagingWriteError");
  expect(t.error_code == ErrorCode::staging_write_failed, "staging error code");
  expect(backend->create_calls == 0, "backend not asked to run unstaged code");
}

// ============================================================================
// Orchestrator
// ============================================================================

void test_first_attempt_success() {
  auto backend = std::make_shared<FakeBackend>([](const std::string&) { return ok_run("hello\n"); });
  const RepairSession s = orchestrator_for(backend).run("print('hello')\n");
  expect(s.success() && s.total_iterations == 1 && s.patches.empty(), "one iteration, no patches");
  expect(s.current == s.original, "final equals original");
  expect(s.session_id.size() == 32, "session id assigned");
  expect_session_invariants(s, "first attempt");
}

void test_division_scenario() {
  auto backend = division_backend();
  const RepairSession s = orchestrator_for(backend).run(kDivisionProgram);
  expect(s.success(), "division scenario succeeds");
  expect(s.total_iterations == 2 && s.patches.size() == 1, "2 iterations, 1 patch");
  expect(s.traces[0].category && *s.traces[0].category == "ZeroDivisionError", "first trace classified");
  expect(contains(s.current.text, "except ZeroDivisionError:"), "final program guarded");
  expect(s.patches[0].strategy == "rule_based" && !s.patches[0].substituted, "rule-based patch");
  expect(apply_edits(s.original.text, s.patches[0].edits) == s.current.text, "edits reproduce the patch");
  expect(backend->created == backend->destroyed && backend->live() == 0, "no leaked instances");
  expect_session_invariants(s, "division");
}

void test_max_iterations() {
  // Every run fails on the first name that has not been defined yet.
  auto backend = std::make_shared<FakeBackend>([](const std::string& program) {
    for (const std::string name : {"a", "b", "c", "d"}) {
      if (!contains(program, name + " = None")) {
        return fail_run(traceback(1, "print(a, b, c, d)", "NameError: name '" + name + "' is not defined"));
      }
    }
    return ok_run("None None None None\n");
  });
  OrchestratorOptions opts = fast_options();
  opts.max_iterations = 3;
  const RepairSession s = orchestrator_for(backend, nullptr, opts).run("print(a, b, c, d)\n");
  expect(s.state == SessionState::aborted && s.failure_reason == "max iterations reached", s.failure_reason);
  expect(s.abort_code == ErrorCode::max_iterations, "abort code");
  expect(s.traces.size() == 3 && s.patches.size() == 2, "3 traces, 2 patches");
  expect_session_invariants(s, "max iterations");

  opts.max_iterations = 1;
  const RepairSession one = orchestrator_for(backend, nullptr, opts).run("print(a, b, c, d)\n");
  expect(one.traces.size() == 1 && one.patches.empty() && !one.success(), "max_iterations = 1");

  opts.max_iterations = 10;
  const RepairSession full = orchestrator_for(backend, nullptr, opts).run("print(a, b, c, d)\n");
  expect(full.success() && full.total_iterations == 5, "four NameError patches then success");
  expect_session_invariants(full, "name chain");
}

void test_infrastructure_abort() {
  auto backend = std::make_shared<FakeBackend>([](const std::string&) {
    FakeRun r;
    r.create_fault = BackendFault::unreachable;
    return r;
  });
  const RepairSession s = orchestrator_for(backend).run("print(1)\n");
  expect(s.state == SessionState::aborted, "aborted");
  expect(s.failure_reason == "sandbox infrastructure unavailable: SandboxUnavailableError", s.failure_reason);
  expect(s.abort_code == ErrorCode::infrastructure_persistent, "abort code");
  expect(s.traces.size() == 2 && s.patches.size() == 1, "one retry before giving up");
  expect(s.patches[0].after == s.original, "infrastructure patch leaves program unchanged");
  expect_session_invariants(s, "infra");
}

void test_infrastructure_retry_delay() {
  int calls = 0;
  auto backend = std::make_shared<FakeBackend>([&calls](const std::string&) {
    FakeRun r;
    if (++calls == 1) r.create_fault = BackendFault::allocation_failed;
    return r;
  });
  OrchestratorOptions opts = fast_options();
  opts.infra_retry_delay_ms = 150;
  const auto start = std::chrono::steady_clock::now();
  const RepairSession s = orchestrator_for(backend, nullptr, opts).run("print(1)\n");
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
  expect(s.success() && s.total_iterations == 2, "recovers after a transient fault");
  expect(ms.count() >= 150, "waited before retrying");
  expect_session_invariants(s, "retry");
}

void test_no_progress_abort() {
  auto backend = std::make_shared<FakeBackend>([](const std::string&) { return fail_run("ValueError: bad input\n"); });
  const RepairSession s = orchestrator_for(backend).run("raise ValueError('bad input')\n");
  expect(s.state == SessionState::aborted, "aborted");
  expect(s.failure_reason == "no further progress: ValueError requires manual review", s.failure_reason);
  expect(s.traces.size() == 1 && s.patches.empty(), "no-op patch not recorded");
  expect_session_invariants(s, "no progress");
}

void test_cancellation() {
  auto backend = division_backend();
  CancelToken cancel;
  cancel.cancel();
  const RepairSession s = orchestrator_for(backend).run(kDivisionProgram, &cancel);
  expect(s.state == SessionState::aborted && s.failure_reason == "cancelled", "cancelled");
  expect(s.traces.size() == 1 && s.patches.empty(), "stopped after the running iteration");
  expect(backend->live() == 0, "no leaked instance on cancel");
}

void test_step_by_step() {
  auto backend = division_backend();
  const RepairOrchestrator orch = orchestrator_for(backend);
  RepairSession s = orch.begin(kDivisionProgram);
  expect(s.state == SessionState::running && s.traces.empty() && s.current == s.original, "begin state");
  orch.step(s);
  expect(s.state == SessionState::running && s.traces.size() == 1 && s.patches.size() == 1, "after one step");
  orch.step(s);
  expect(s.success() && s.traces.size() == 2, "after two steps");
  orch.step(s);
  expect(s.traces.size() == 2, "step on a terminal session is a no-op");
}

void test_advisory_session() {
  auto transport = std::make_shared<FakeTransport>();
  transport->next = advisory_reply(
      "x = 100\ny = 0\ntry:\n    print(x / y)\nexcept ZeroDivisionError:\n    print(\"Error: Division by zero\")");
  auto strategy = std::make_shared<AdvisoryStrategy>(AdvisoryOptions{}, transport,
                                                     std::make_shared<RuleBasedStrategy>());
  const RepairSession s = orchestrator_for(division_backend(), strategy).run(kDivisionProgram);
  expect(s.success() && s.patches.size() == 1, "advisory session succeeds");
  expect(s.patches[0].strategy == "advisory" && !s.patches[0].advisory_fallback, "advisory patch recorded");
  expect_session_invariants(s, "advisory");

  transport->next = HttpResponse{};
  transport->next.error = ErrorCode::advisory_unreachable;
  const RepairSession fb = orchestrator_for(division_backend(), strategy).run(kDivisionProgram);
  expect(fb.success() && fb.patches[0].advisory_fallback, "fallback session succeeds");
  expect(fb.patches[0].strategy == "rule_based", "fallback patch is rule-based");
}

void test_advisory_candidate_rejected() {
  const std::string program = "def ratio(a, b):\n    return a / b\n\nprint(ratio(1, 0))\n";
  auto backend = std::make_shared<FakeBackend>([](const std::string& p) {
    if (contains(p, "try:")) return ok_run("Error: Division by zero\n");
    return fail_run(traceback(4, "print(ratio(1, 0))", "ZeroDivisionError: division by zero"));
  });
  auto transport = std::make_shared<FakeTransport>();
  transport->next = advisory_reply("print(0)");
  auto strategy = std::make_shared<AdvisoryStrategy>(AdvisoryOptions{}, transport,
                                                     std::make_shared<RuleBasedStrategy>());
  const RepairSession s = orchestrator_for(backend, strategy).run(program);
  expect(s.success(), "session recovers through the substitute");
  expect(s.patches[0].substituted && !s.patches[0].rejection_reason.empty(), "candidate rejected");
  expect(s.patches[0].strategy == "rule_based", "substitute recorded as rule-based");
  expect(contains(s.current.text, "def ratio"), "declared surface preserved");
  expect_session_invariants(s, "rejected");
}

void test_advisory_stall_guard() {
  const std::string program = "value = int('x')";
  auto backend = std::make_shared<FakeBackend>(
      [](const std::string&) { return fail_run("ValueError: invalid literal for int()\n"); });
  auto transport = std::make_shared<FakeTransport>();
  transport->next = advisory_reply(program);
  auto strategy = std::make_shared<AdvisoryStrategy>(AdvisoryOptions{}, transport,
                                                     std::make_shared<RuleBasedStrategy>());
  const RepairSession s = orchestrator_for(backend, strategy).run(program);
  expect(s.failure_reason == "no further progress: ValueError requires manual review", s.failure_reason);
  expect(s.traces.size() == 2 && s.patches.size() == 1, "one unchanged advisory patch tolerated");
  expect(transport->posts == 2, "advisory asked twice");
  expect_session_invariants(s, "stall");
}

void test_heuristic_findings() {
  const std::string program =
      "def preorder(node):\n"
      "    if node is None:\n"
      "        return\n"
      "    preorder(node.left)\n"
      "    print(node.val)\n"
      "    preorder(node.right)\n";
  TraversalOrderCheck check;
  const auto findings = check.check(make_artifact(program));
  expect(findings.size() == 1 && findings[0].symbol == "preorder" && findings[0].line == 5, "misplaced visit");

  const std::string good =
      "def inorder(node):\n"
      "    if node:\n"
      "        inorder(node.left)\n"
      "        print(node.val)\n"
      "        inorder(node.right)\n";
  expect(check.check(make_artifact(good)).empty(), "correct inorder is clean");

  auto backend = std::make_shared<FakeBackend>([](const std::string&) { return ok_run(""); });
  const RepairSession s = orchestrator_for(backend, nullptr, fast_options(), default_heuristic_checks()).run(program);
  expect(s.success() && s.findings.size() == 1, "findings stored, state unchanged");
  const RepairSession off = orchestrator_for(backend).run(program);
  expect(off.findings.empty(), "heuristics disabled by default");
}

void test_concurrent_sessions() {
  auto backend = division_backend();
  const RepairOrchestrator orch = orchestrator_for(backend);
  constexpr int kThreads = 8;
  std::vector<RepairSession> sessions(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&orch, &sessions, i] { sessions[static_cast<std::size_t>(i)] = orch.run(kDivisionProgram); });
  }
  for (auto& t : threads) t.join();
  std::set<std::string> ids;
  for (const auto& s : sessions) {
    expect(s.success() && s.total_iterations == 2, "each concurrent session succeeds");
    expect_session_invariants(s, "concurrent");
    ids.insert(s.session_id);
  }
  expect(ids.size() == kThreads, "session ids are distinct");
  expect(backend->created == 2 * kThreads && backend->destroyed == 2 * kThreads, "every instance destroyed");
  expect(backend->live() == 0, "no live instances");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_defaults() {
  EngineConfig cfg;
  ConfigValidationResult r;
  check_config(cfg, r);
  expect(r.ok && r.errors.empty(), "defaults are valid");
  expect(cfg.memory_limit_mb == 128 && cfg.exec_timeout_ms == 5000 && cfg.max_iterations == 5, "default limits");
  expect(cfg.effective_retry_delay_ms() == 5000, "retry delay follows the timeout");
  cfg.infra_retry_delay_ms = 10;
  expect(cfg.effective_retry_delay_ms() == 10, "explicit retry delay");
}

void test_config_validation() {
  ConfigValidationResult r = validate_config(R"({"backend":"docker","max_iterations":3,"colour":"blue"})");
  expect(r.ok && r.warnings.size() == 1 && contains(r.warnings[0], "colour"), "unknown key is a warning");
  expect(r.config_version == "1", "schema version reported");

  r = validate_config(R"({"backend":"podman"})");
  expect(!r.ok, "unknown backend rejected");
  r = validate_config(R"({"max_iterations":0})");
  expect(!r.ok, "max_iterations >= 1");
  r = validate_config(R"({"memory_limit_mb":"lots"})");
  expect(!r.ok && contains(r.errors[0], "memory_limit_mb"), "type error names the key");
  r = validate_config(R"({"min_length_ratio":1.5})");
  expect(!r.ok, "ratio range checked");
  r = validate_config("{not json");
  expect(!r.ok, "parse error reported");
  r = validate_config(R"({"infra_retry_delay_ms":-1})");
  expect(r.ok, "-1 retry delay allowed");
}

void test_config_precedence() {
  const fs::path path = temp_path("config.json");
  {
    std::ofstream ofs(path);
    ofs << R"({"strategy":"advisory","max_iterations":7,"exec_timeout_ms":2000})";
  }
  const std::map<std::string, std::string> env = {{"MENDER_MAX_ITERATIONS", "9"}, {"MENDER_HEURISTICS", "true"}};
  auto lookup = [&env](const std::string& k) -> std::optional<std::string> {
    auto it = env.find(k);
    if (it == env.end()) return std::nullopt;
    return it->second;
  };
  const ConfigLoadResult loaded = load_config(path.string(), lookup);
  fs::remove(path);
  expect(loaded.validation.ok, "config loads");
  expect(loaded.config.strategy == "advisory", "file value applied");
  expect(loaded.config.exec_timeout_ms == 2000, "file value kept");
  expect(loaded.config.max_iterations == 9, "environment overrides file");
  expect(loaded.config.heuristics, "environment boolean parsed");

  const std::map<std::string, std::string> bad = {{"MENDER_EXEC_TIMEOUT_MS", "soon"}};
  auto bad_lookup = [&bad](const std::string& k) -> std::optional<std::string> {
    auto it = bad.find(k);
    if (it == bad.end()) return std::nullopt;
    return it->second;
  };
  const ConfigLoadResult rejected = load_config("", bad_lookup);
  expect(!rejected.validation.ok && rejected.config.exec_timeout_ms == 5000, "malformed env value rejected");

  expect(!load_config("/nonexistent/mender.json", lookup).validation.ok, "missing config file reported");
  expect(validate_config(config_to_json(EngineConfig{})).ok, "serialized defaults validate");
}

void test_factories() {
  EngineConfig cfg;
  cfg.strategy = "advisory";
  auto transport = std::make_shared<FakeTransport>();
  expect(make_strategy(cfg, transport)->name() == "advisory", "advisory strategy selected by config");
  cfg.strategy = "rule_based";
  expect(make_strategy(cfg)->name() == "rule_based", "rule-based strategy selected by config");
  expect(make_backend(cfg)->name() == "process", "process backend by default");
  cfg.backend = "docker";
  expect(make_backend(cfg)->name() == "docker", "docker backend selected by config");
  cfg.max_iterations = 4;
  cfg.infra_retry_delay_ms = -1;
  cfg.exec_timeout_ms = 700;
  const OrchestratorOptions o = make_options(cfg);
  expect(o.max_iterations == 4 && o.infra_retry_delay_ms == 700, "options derived from config");
}

// ============================================================================
// Observability & export
// ============================================================================

std::atomic<int> g_hook_events{0};
void counting_hook(const RepairEvent&) { g_hook_events++; }

void test_latency_histogram() {
  LatencyHistogram h;
  expect(h.percentile(0.5) == 0.0, "empty histogram");
  for (int i = 0; i < 99; ++i) h.record_ms(1);
  h.record_ms(1000);
  expect(h.count() == 100, "count");
  expect(h.percentile(0.5) < 2000.0, "p50 in the 1 ms bucket");
  expect(h.percentile(1.0) > 500000.0, "max in the 1 s bucket");
  expect(contains(h.to_json(), "\"count\":100"), "json count");
}

void test_engine_stats_and_events() {
  EngineStats stats;
  RepairEvent trace;
  trace.kind = RepairEventKind::trace;
  trace.category = "ZeroDivisionError";
  trace.duration_ms = 12;
  stats.record(trace);
  RepairEvent patch;
  patch.kind = RepairEventKind::patch;
  patch.strategy = "rule_based";
  patch.advisory_fallback = true;
  stats.record(patch);
  RepairEvent done;
  done.kind = RepairEventKind::session;
  done.state = SessionState::success;
  stats.record(done);

  expect(stats.executions == 1 && stats.failed_executions == 1, "execution counters");
  expect(stats.patches == 1 && stats.advisory_fallbacks == 1, "patch counters");
  expect(stats.sessions_succeeded == 1, "session counter");
  expect(stats.failure_categories_snapshot().at("ZeroDivisionError") == 1, "category counted");
  expect(contains(stats.to_json(), "\"failure_categories\":{\"ZeroDivisionError\":1}"), "stats json");

  const auto back = event_from_json(event_to_json(trace));
  expect(back && back->kind == RepairEventKind::trace && back->category == "ZeroDivisionError" &&
             back->duration_ms == 12,
         "event line parses back");
  expect(!event_from_json("{\"v\":99,\"kind\":\"trace\"}"), "other event log versions rejected");
}

void test_event_hook_and_log() {
  const fs::path log = temp_path("events.jsonl");
  set_event_log_path(log.string());
  set_repair_event_hook(counting_hook);
  g_hook_events = 0;
  const std::uint64_t before = global_engine_stats().sessions_succeeded.load();
  const RepairSession s = orchestrator_for(division_backend()).run(kDivisionProgram);
  set_repair_event_hook(nullptr);
  set_event_log_path("");
  expect(s.success(), "session succeeded");
  expect(g_hook_events == 4, "2 traces + 1 patch + 1 session event");
  expect(global_engine_stats().sessions_succeeded.load() == before + 1, "global stats updated");

  std::ifstream ifs(log);
  std::string line;
  int lines = 0;
  while (std::getline(ifs, line)) {
    expect(event_from_json(line).has_value(), "every log line is an event");
    expect(!contains(line, "print(x / y)"), "events carry no program text");
    ++lines;
  }
  fs::remove(log);
  expect(lines == 4, "one JSONL line per event");
}

void test_session_export() {
  const RepairSession s = orchestrator_for(division_backend()).run(kDivisionProgram);
  const std::string json = session_to_json(s);
  std::optional<jsonlite::JsonError> err;
  const auto doc = jsonlite::parse(json, &err);
  expect(!err, "session json parses");
  expect(jsonlite::get_string(doc, "state") == "success", "state exported");
  expect(jsonlite::get_u64(doc, "total_iterations") == 2, "iterations exported");
  expect(jsonlite::get_u64(doc, "format_version") == version::SESSION_FORMAT_VERSION, "format version");

  // Each trace digest covers the trace rendered without the digest field.
  const auto& traces = std::get<jsonlite::Array>(doc.at("traces").v);
  expect(traces.size() == 2, "two traces exported");
  jsonlite::Object first = std::get<jsonlite::Object>(traces[0].v);
  const std::string digest = jsonlite::get_string(first, "digest");
  first.erase("digest");
  expect(digest == trace_digest(jsonlite::to_json(first)), "trace digest verifies");

  const fs::path plain = temp_path("session.json");
  ExportResult r = export_session(s, plain.string(), false);
  expect(r.ok && r.encoding == "identity", "plain export");
  expect(read_exported(plain.string()) == json, "plain export reads back");
  fs::remove(plain);

  const fs::path packed = temp_path("session.json.zst");
  r = export_session(s, packed.string(), true);
  expect(r.ok, "compressed export");
  expect(r.encoding == (zstd_available() ? "zstd" : "identity"), "encoding matches build");
  expect(read_exported(packed.string()) == json, "compressed export reads back");
  fs::remove(packed);
}

void test_version_manifest() {
  const auto m = version::current_manifest();
  expect(m.engine_semver == version::ENGINE_SEMVER && m.hash_primitive == "blake3", "manifest fields");
  std::optional<jsonlite::JsonError> err;
  jsonlite::parse(version::manifest_to_json(m), &err);
  expect(!err, "manifest json parses");
}

// ============================================================================
// Docker backend (no daemon needed)
// ============================================================================

void test_docker_arguments_and_faults() {
  DockerOptions opts;
  opts.image = "mender-sandbox:test";
  DockerSandboxBackend docker(opts);
  SandboxSpec spec;
  spec.staging_dir = "/tmp/mender-abc";
  spec.script_name = "program.py";
  spec.memory_limit_mb = 64;
  const auto args = docker.run_arguments(spec, "mender-test-1");
  auto has = [&args](const std::string& a) { return std::find(args.begin(), args.end(), a) != args.end(); };
  const auto name_flag = std::find(args.begin(), args.end(), "--name");
  expect(name_flag != args.end() && *(name_flag + 1) == "mender-test-1", "container named up front");
  expect(has("--memory=64m") && has("--memory-swap=64m"), "memory ceiling without swap");
  expect(has("--read-only") && has("none") && has("/tmp/mender-abc:/app:ro"), "isolation flags");
  expect(args.back() == "/app/program.py" && has("mender-sandbox:test"), "runs the staged program in the image");

  expect(classify_docker_failure(125, "Unable to find image 'x:latest' locally") == BackendFault::image_missing,
         "missing image");
  expect(classify_docker_failure(1, "Cannot connect to the Docker daemon at unix:///var/run/docker.sock") ==
             BackendFault::unreachable,
         "daemon down");
  expect(classify_docker_failure(127, "") == BackendFault::unreachable, "docker binary missing");
  expect(classify_docker_failure(125, "fork/exec: cannot allocate memory") == BackendFault::allocation_failed,
         "allocation failure");
  expect(classify_docker_failure(125, "something else") == BackendFault::api_error, "other faults");

  DockerOptions missing;
  missing.docker_binary = "/nonexistent/docker";
  missing.cli_timeout_ms = 2000;
  auto backend = std::make_shared<DockerSandboxBackend>(missing);
  const ExecutionTrace t = SandboxExecutor(backend, fast_limits()).execute(make_artifact("print(1)\n"), 1);
  expect(t.infrastructure && t.category && category::is_infrastructure(*t.category),
         "missing docker binary is an infrastructure fault");
}

// Shell stand-in for the docker CLI. Every call is appended to <dir>/calls;
// flag files in <dir> select the failure to simulate.
fs::path write_fake_docker(const fs::path& dir) {
  fs::create_directories(dir);
  const fs::path script = dir / "docker";
  std::ofstream out(script);
  out << "#!/bin/sh\n"
      << "d='" << dir.string() << "'\n"
      << "echo \"$*\" >> \"$d/calls\"\n"
      << "case \"$1\" in\n"
      << "  run)\n"
      << "    if [ -f \"$d/run_hangs\" ]; then sleep 3; fi\n"
      << "    if [ -f \"$d/start_fails\" ]; then\n"
      << "      echo 'docker: Error response from daemon: failed to create task for container: exec: \"python\": "
         "executable file not found in $PATH: unknown.' >&2\n"
      << "      exit 127\n"
      << "    fi\n"
      << "    echo 3f2a9c0d1e7b\n"
      << "    exit 0 ;;\n"
      << "  wait) echo 0; exit 0 ;;\n"
      << "  logs) echo hello; exit 0 ;;\n"
      << "  rm)\n"
      << "    if [ -f \"$d/rm_fails\" ]; then\n"
      << "      echo 'Error response from daemon: removal of container is already in progress' >&2\n"
      << "      exit 1\n"
      << "    fi\n"
      << "    exit 0 ;;\n"
      << "esac\n"
      << "exit 0\n";
  out.close();
  fs::permissions(script, fs::perms::owner_all);
  return script;
}

std::vector<std::string> read_lines(const fs::path& file) {
  std::vector<std::string> lines;
  std::ifstream in(file);
  for (std::string line; std::getline(in, line);) lines.push_back(line);
  return lines;
}

// Name passed with --name on the most recent `docker run`.
std::string last_run_name(const std::vector<std::string>& calls) {
  std::string name;
  for (const auto& c : calls) {
    if (c.rfind("run ", 0) != 0) continue;
    const auto pos = c.find("--name ");
    if (pos == std::string::npos) continue;
    name = c.substr(pos + 7, c.find(' ', pos + 7) - (pos + 7));
  }
  return name;
}

void touch(const fs::path& file) { std::ofstream(file) << "1\n"; }

void test_docker_cleans_up_failed_create() {
  const fs::path dir = temp_path("fake-docker");
  fs::remove_all(dir);
  DockerOptions opts;
  opts.docker_binary = write_fake_docker(dir).string();
  opts.cli_timeout_ms = 1000;
  auto backend = std::make_shared<DockerSandboxBackend>(opts);
  SandboxExecutor exec(backend, fast_limits());

  touch(dir / "start_fails");
  ExecutionTrace t = exec.execute(make_artifact("print(1)\n"), 1);
  expect(t.infrastructure && t.category && *t.category == category::kImageNotFound, "start failure classified");
  auto calls = read_lines(dir / "calls");
  std::string name = last_run_name(calls);
  expect(name.rfind("mender-", 0) == 0, "run carries a container name");
  expect(std::find(calls.begin(), calls.end(), "rm -f " + name) != calls.end(),
         "container left by a failed start is removed");
  fs::remove(dir / "start_fails");

  touch(dir / "run_hangs");
  t = exec.execute(make_artifact("print(1)\n"), 2);
  expect(t.infrastructure && contains(t.output, "did not return"), "hung docker run is a fault: " + t.output);
  calls = read_lines(dir / "calls");
  name = last_run_name(calls);
  expect(std::find(calls.begin(), calls.end(), "rm -f " + name) != calls.end(),
         "container of a timed-out run is removed");
  fs::remove(dir / "run_hangs");
  expect(backend->cleanup_failures() == 0, "no cleanup failures so far");

  touch(dir / "rm_fails");
  t = exec.execute(make_artifact("print(1)\n"), 3);
  expect(t.ok && contains(t.output, "hello"), "run succeeds: " + t.output);
  expect(backend->cleanup_failures() == 1, "failed removal is counted");
  calls = read_lines(dir / "calls");
  expect(!calls.empty() && calls.back() == "rm -f " + last_run_name(calls), "destroy removes by name");
  fs::remove_all(dir);
}

// ============================================================================
// Process backend (real processes, /bin/sh as the interpreter)
// ============================================================================

SandboxExecutor shell_executor(std::shared_ptr<ProcessSandboxBackend> backend, std::uint64_t timeout_ms = 5000) {
  ExecutorLimits limits;
  limits.exec_timeout_ms = timeout_ms;
  return SandboxExecutor(std::move(backend), limits);
}

void test_process_backend_runs() {
  auto backend = std::make_shared<ProcessSandboxBackend>("/bin/sh");
  const ExecutionTrace ok = shell_executor(backend).execute(make_artifact("echo hello\n"), 1);
  expect(ok.ok && ok.exit_status == 0, "shell program succeeds: " + ok.output);
  expect(ok.output == "hello\n", "stdout captured: " + ok.output);

  const ExecutionTrace bad = shell_executor(backend).execute(make_artifact("echo out\necho oops >&2\nexit 3\n"), 1);
  expect(!bad.ok && bad.exit_status == 3, "exit status kept");
  expect(bad.output == "out\noops\n", "stdout and stderr combined in order: " + bad.output);
  expect(backend->live_instances() == 0, "instances destroyed");
}

void test_process_backend_timeout() {
  auto backend = std::make_shared<ProcessSandboxBackend>("/bin/sh");
  const auto start = std::chrono::steady_clock::now();
  const ExecutionTrace t = shell_executor(backend, 300).execute(make_artifact("while :; do :; done\n"), 1);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
  expect(t.timed_out && t.category && *t.category == "TimeoutError", "infinite loop times out");
  expect(t.output == timeout_marker(300), "timeout marker output");
  expect(ms.count() < 3000, "killed promptly");
  expect(backend->live_instances() == 0, "no leaked process after timeout");
}

void test_process_backend_kill_signal() {
  auto backend = std::make_shared<ProcessSandboxBackend>("/bin/sh");
  const ExecutionTrace t = shell_executor(backend).execute(make_artifact("echo start\nkill -9 $$\n"), 1);
  expect(t.exit_status == 137, "SIGKILL reported as 137");
  expect(contains(t.output, "start\n") && contains(t.output, memory_kill_marker(128)), "memory marker appended");
  expect(t.category && *t.category == "MemoryError", "MemoryError category");
}

void test_process_backend_clean_environment() {
  setenv("MENDER_TEST_SECRET", "leak", 1);
  auto backend = std::make_shared<ProcessSandboxBackend>("/bin/sh");
  const ExecutionTrace t = shell_executor(backend).execute(
      make_artifact("echo \"secret=${MENDER_TEST_SECRET:-none} pip=$PIP_NO_INDEX\"\n"), 1);
  unsetenv("MENDER_TEST_SECRET");
  expect(t.ok && t.output == "secret=none pip=1\n", "clean environment: " + t.output);
}

void test_process_backend_missing_interpreter() {
  auto backend = std::make_shared<ProcessSandboxBackend>("/nonexistent/python3");
  const ExecutionTrace t = shell_executor(backend).execute(make_artifact("print(1)\n"), 1);
  expect(t.infrastructure && t.category && *t.category == category::kImageNotFound, "missing interpreter");
  expect(!backend->probe().available, "probe reports the missing interpreter");
}

bool refuse_isolation() { return false; }

void test_process_backend_requires_network_isolation() {
  const fs::path marker = temp_path("isolation-marker");
  fs::remove(marker);
  auto backend = std::make_shared<ProcessSandboxBackend>("/bin/sh", refuse_isolation);
  const ExecutionTrace t =
      shell_executor(backend).execute(make_artifact("echo ran > " + marker.string() + "\n"), 1);
  expect(t.infrastructure && t.category && *t.category == category::kSandboxAllocation,
         "missing network isolation is an allocation fault");
  expect(contains(t.output, "network isolation unavailable"), "fault names the cause: " + t.output);
  expect(!fs::exists(marker), "program never ran with the host network");
  expect(backend->live_instances() == 0, "no instance left behind");

  const ProbeResult p = backend->probe();
  expect(!p.available, "probe reports the backend unusable");
  expect(std::find(p.capabilities.begin(), p.capabilities.end(), "network_namespace_unavailable") !=
             p.capabilities.end(),
         "probe names the missing capability");
}

// Pids of live processes whose command line contains needle.
std::vector<int> processes_matching(const std::string& needle) {
  std::vector<int> out;
  for (const auto& entry : fs::directory_iterator("/proc")) {
    const std::string name = entry.path().filename().string();
    if (name.empty() || !std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; }))
      continue;
    std::ifstream ifs(entry.path() / "cmdline", std::ios::binary);
    std::string cmd((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    std::replace(cmd.begin(), cmd.end(), '\0', ' ');
    if (contains(cmd, needle)) out.push_back(std::stoi(name));
  }
  return out;
}

void test_process_backend_detached_descendants() {
  auto backend = std::make_shared<ProcessSandboxBackend>("/bin/sh");
  const ExecutionTrace t = shell_executor(backend, 2000).execute(
      make_artifact("setsid sleep 31.4159 &\nsleep 31.4158 &\nsleep 0.2\necho hi\nexit 0\n"), 1);
  expect(t.ok && t.output == "hi\n", "program output kept: " + t.output);
  expect(t.duration_ms < 2000, "execute() returns within the exec timeout: " + std::to_string(t.duration_ms));
  expect(processes_matching("sleep 31.415").empty(), "no descendant outlives the call");

  const ExecutionTrace hung = shell_executor(backend, 300).execute(
      make_artifact("setsid sleep 31.4157 &\nwhile :; do :; done\n"), 1);
  expect(hung.timed_out, "looping program times out");
  expect(hung.duration_ms < 2000, "timeout path bounded: " + std::to_string(hung.duration_ms));
  expect(processes_matching("sleep 31.415").empty(), "no descendant outlives a timed-out call");
  expect(backend->live_instances() == 0, "instances destroyed");
}

void test_process_backend_instances_independent() {
  auto backend = std::make_shared<ProcessSandboxBackend>("/bin/sh");
  ExecutionTrace slow;
  std::thread runner(
      [&] { slow = shell_executor(backend).execute(make_artifact("sleep 0.5\necho survived\n"), 1); });
  for (int i = 0; i < 10; ++i) {
    const std::string n = std::to_string(i);
    const ExecutionTrace quick =
        shell_executor(backend).execute(make_artifact("sleep 31.4156 &\necho " + n + "\n"), 1);
    expect(quick.ok && quick.output == n + "\n", "short instance output: " + quick.output);
  }
  runner.join();
  expect(slow.ok && slow.output == "survived\n", "cleaning up other instances leaves a running one alone");
  expect(processes_matching("sleep 31.4156").empty(), "background jobs of finished instances killed");
  expect(backend->live_instances() == 0, "instances destroyed");
}

void test_python_division_end_to_end() {
  EngineConfig cfg;
  cfg.infra_retry_delay_ms = 0;
  const RepairSession s = make_orchestrator(cfg).run(kDivisionProgram);
  expect(s.success(), "python scenario succeeds: " + s.failure_reason);
  expect(s.total_iterations == 2 && s.patches.size() == 1, "2 iterations, 1 patch");
  expect(s.traces[1].output == "Error: Division by zero\n", "guarded program output: " + s.traces[1].output);
}

}  // namespace

int main() {
  std::cout << "=== Mender Test Suite ===\n";

  std::cout << "\n[Hashing & JSON]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("artifact digest domain", test_artifact_digest_domain);
  run_test("JSON strict parse", test_json_strict_parse);
  run_test("JSON writer", test_json_writer_sorted_and_escaped);

  std::cout << "\n[Classifier]\n";
  run_test("categories and priority", test_classifier_categories);
  run_test("idempotence", test_classifier_idempotent);
  run_test("detail, line and name", test_analyze_details);

  std::cout << "\n[Diff]\n";
  run_test("split/join round trip", test_split_join_round_trip);
  run_test("unified diff format", test_unified_diff_format);
  run_test("apply edits round trip", test_diff_apply_round_trip);
  run_test("shortest edit script", test_diff_shortest_script);
  run_test("large re-indented program", test_diff_large_reindent);

  std::cout << "\n[Rule-based fixes]\n";
  run_test("ZeroDivisionError", test_rule_zero_division);
  run_test("NameError", test_rule_name_error);
  run_test("IndentationError/TabError", test_rule_indentation);
  run_test("missing colon", test_rule_missing_colon);
  run_test("IndexError", test_rule_index_error);
  run_test("str concatenation", test_rule_concat);
  run_test("numpy rewrite", test_rule_numpy_rewrite);
  run_test("unused import", test_rule_unused_import);
  run_test("unknown and infrastructure", test_rule_unknown_and_infrastructure);

  std::cout << "\n[Advisory]\n";
  run_test("response parsing", test_advisory_parse_variants);
  run_test("request shape", test_advisory_request_shape);
  run_test("rule-based fallback", test_advisory_falls_back_to_rules);
  run_test("probe", test_advisory_probe);

  std::cout << "\n[Validator]\n";
  run_test("regression guard", test_regression_guard);
  run_test("substitution", test_validator_substitutes_rule_fix);

  std::cout << "\n[Executor]\n";
  run_test("success and cleanup", test_executor_success_and_cleanup);
  run_test("failure classified", test_executor_failure_classified);
  run_test("timeout path", test_executor_timeout_path);
  run_test("memory marker", test_executor_memory_marker);
  run_test("backend faults", test_executor_backend_faults);
  run_test("staging failure", test_executor_staging_failure);
  run_test("backend exceptions contained", test_executor_contains_backend_exceptions);

  std::cout << "\n[Orchestrator]\n";
  run_test("first attempt success", test_first_attempt_success);
  run_test("division scenario", test_division_scenario);
  run_test("max iterations", test_max_iterations);
  run_test("infrastructure abort", test_infrastructure_abort);
  run_test("infrastructure retry delay", test_infrastructure_retry_delay);
  run_test("no progress", test_no_progress_abort);
  run_test("cancellation", test_cancellation);
  run_test("step by step", test_step_by_step);
  run_test("advisory session", test_advisory_session);
  run_test("advisory candidate rejected", test_advisory_candidate_rejected);
  run_test("advisory stall guard", test_advisory_stall_guard);
  run_test("heuristic findings", test_heuristic_findings);
  run_test("concurrent sessions", test_concurrent_sessions);

  std::cout << "\n[Configuration]\n";
  run_test("defaults", test_config_defaults);
  run_test("validation", test_config_validation);
  run_test("precedence", test_config_precedence);
  run_test("factories", test_factories);

  std::cout << "\n[Observability & export]\n";
  run_test("latency histogram", test_latency_histogram);
  run_test("engine stats and events", test_engine_stats_and_events);
  run_test("event hook and log", test_event_hook_and_log);
  run_test("session export", test_session_export);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Sandbox backends]\n";
  run_test("docker arguments and faults", test_docker_arguments_and_faults);
  const bool have_sh = executable("/bin/sh");
  if (have_sh) {
    run_test("docker cleanup of failed creates", test_docker_cleans_up_failed_create);
  } else {
    skip_test("docker cleanup of failed creates", "/bin/sh not available");
  }
  const bool isolated = have_sh && ProcessSandboxBackend("/bin/sh").probe().available;
  if (isolated) {
    run_test("process backend runs", test_process_backend_runs);
    run_test("process backend timeout", test_process_backend_timeout);
    run_test("process backend SIGKILL", test_process_backend_kill_signal);
    run_test("process backend clean environment", test_process_backend_clean_environment);
    run_test("process backend independent instances", test_process_backend_instances_independent);
    if (executable("/usr/bin/setsid") || executable("/bin/setsid")) {
      run_test("process backend detached descendants", test_process_backend_detached_descendants);
    } else {
      skip_test("process backend detached descendants", "setsid not available");
    }
  } else {
    skip_test("process backend", have_sh ? "network namespaces not permitted" : "/bin/sh not available");
  }
  if (have_sh) {
    run_test("process backend requires network isolation", test_process_backend_requires_network_isolation);
  }
  run_test("process backend missing interpreter", test_process_backend_missing_interpreter);
  if (isolated && executable("/usr/bin/python3")) {
    run_test("python division end to end", test_python_division_end_to_end);
  } else {
    skip_test("python division end to end", "/usr/bin/python3 or network namespaces not available");
  }

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed";
  if (g_tests_skipped > 0) std::cout << ", " << g_tests_skipped << " skipped";
  std::cout << " ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
