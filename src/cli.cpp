#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "mender/classifier.hpp"
#include "mender/config.hpp"
#include "mender/diff.hpp"
#include "mender/hash.hpp"
#include "mender/jsonlite.hpp"
#include "mender/observability.hpp"
#include "mender/orchestrator.hpp"
#include "mender/session_io.hpp"
#include "mender/version.hpp"

namespace {

std::optional<std::string> read_file(const std::string& path) {
  if (path == "-") {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
  }
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void print_error(const std::string& code, const std::string& message) {
  std::cerr << "{\"error\":\"" << mender::jsonlite::escape(code) << "\",\"message\":\""
            << mender::jsonlite::escape(message) << "\"}\n";
}

std::string json_string_array(const std::vector<std::string>& items) {
  std::string out = "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ",";
    out += "\"" + mender::jsonlite::escape(items[i]) + "\"";
  }
  return out + "]";
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  if (mender::blake3_hex("") != "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262") {
    return false;
  }
  if (mender::blake3_hex("hello") != "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f") {
    return false;
  }
  return true;
}

struct CliArgs {
  std::vector<std::string> positional;
  std::string config_path;
  std::string strategy;
  std::string backend;
  std::string max_iterations;
  std::string export_path;
  std::string events_path;
  bool compress{false};
  bool heuristics{false};
};

CliArgs parse_args(int argc, char** argv, int first) {
  CliArgs a;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&](std::string& out) {
      if (i + 1 < argc) out = argv[++i];
    };
    if (arg == "--config") next(a.config_path);
    else if (arg == "--strategy") next(a.strategy);
    else if (arg == "--backend") next(a.backend);
    else if (arg == "--max-iterations") next(a.max_iterations);
    else if (arg == "--export") next(a.export_path);
    else if (arg == "--events") next(a.events_path);
    else if (arg == "--compress") a.compress = true;
    else if (arg == "--heuristics") a.heuristics = true;
    else a.positional.push_back(arg);
  }
  return a;
}

// Defaults -> --config -> MENDER_* -> command-line flags.
std::optional<mender::EngineConfig> resolve_config(const CliArgs& args) {
  mender::ConfigLoadResult loaded = mender::load_config(args.config_path);
  mender::EngineConfig cfg = loaded.config;
  if (!args.strategy.empty()) cfg.strategy = args.strategy;
  if (!args.backend.empty()) cfg.backend = args.backend;
  if (args.heuristics) cfg.heuristics = true;
  if (!args.max_iterations.empty()) {
    char* end = nullptr;
    const unsigned long long n = std::strtoull(args.max_iterations.c_str(), &end, 10);
    if (args.max_iterations[0] == '-' || *end != '\0') {
      loaded.validation.errors.push_back("--max-iterations: expected a positive integer");
    } else {
      cfg.max_iterations = n;
    }
  }
  mender::check_config(cfg, loaded.validation);
  if (!loaded.validation.ok) {
    std::cerr << "{\"error\":\"config_invalid\",\"errors\":" << json_string_array(loaded.validation.errors)
              << "}\n";
    return std::nullopt;
  }
  for (const auto& w : loaded.validation.warnings) print_error("config_warning", w);
  if (!args.events_path.empty()) cfg.event_log = args.events_path;
  if (!cfg.event_log.empty()) mender::set_event_log_path(cfg.event_log);
  return cfg;
}

void usage() {
  std::cerr << "usage: mender <command> [args]\n"
               "  repair <file> [--config f] [--strategy s] [--backend b] [--max-iterations n]\n"
               "                [--heuristics] [--events log.jsonl] [--export path] [--compress]\n"
               "  run <file> [--config f] [--backend b]\n"
               "  classify <output-file|->\n"
               "  diff <original> <candidate>\n"
               "  doctor [--config f]\n"
               "  config validate <file>\n"
               "  config show [--config f]\n"
               "  stats [--events log.jsonl]\n"
               "  version\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  const std::string cmd = argv[1];

  if (cmd == "version") {
    std::cout << mender::version::manifest_to_json(mender::version::current_manifest()) << "\n";
    return 0;
  }

  if (cmd == "repair") {
    const CliArgs args = parse_args(argc, argv, 2);
    if (args.positional.empty()) {
      usage();
      return 1;
    }
    auto program = read_file(args.positional[0]);
    if (!program) {
      print_error("read_failed", "cannot read " + args.positional[0]);
      return 1;
    }
    auto cfg = resolve_config(args);
    if (!cfg) return 1;

    const mender::RepairOrchestrator orchestrator = mender::make_orchestrator(*cfg);
    const mender::RepairSession session = orchestrator.run(*program);
    std::cout << mender::session_to_json(session) << "\n";

    if (!args.export_path.empty()) {
      const auto exported = mender::export_session(session, args.export_path, args.compress);
      if (!exported.ok) {
        print_error("export_failed", exported.error);
        return 1;
      }
      if (args.compress && exported.encoding != "zstd") {
        print_error("compression_unavailable", "zstd support not compiled in; wrote uncompressed");
      }
    }
    if (!session.success()) {
      print_error(mender::to_string(session.abort_code), session.failure_reason);
      return 2;
    }
    return 0;
  }

  if (cmd == "run") {
    const CliArgs args = parse_args(argc, argv, 2);
    if (args.positional.empty()) {
      usage();
      return 1;
    }
    auto program = read_file(args.positional[0]);
    if (!program) {
      print_error("read_failed", "cannot read " + args.positional[0]);
      return 1;
    }
    auto cfg = resolve_config(args);
    if (!cfg) return 1;

    const mender::SandboxExecutor executor(mender::make_backend(*cfg), mender::make_limits(*cfg));
    const mender::ExecutionTrace trace = executor.execute(mender::make_artifact(*program), 1);
    std::cout << mender::trace_to_json(trace) << "\n";
    return trace.ok ? 0 : 2;
  }

  if (cmd == "classify") {
    const CliArgs args = parse_args(argc, argv, 2);
    const std::string path = args.positional.empty() ? "-" : args.positional[0];
    auto output = read_file(path);
    if (!output) {
      print_error("read_failed", "cannot read " + path);
      return 1;
    }
    const mender::FailureContext ctx = mender::analyze(*output);
    mender::jsonlite::Object o;
    o["category"] = ctx.category;
    o["detail"] = ctx.detail;
    o["line"] = static_cast<std::uint64_t>(ctx.line);
    if (!ctx.undefined_name.empty()) o["undefined_name"] = ctx.undefined_name;
    std::cout << mender::jsonlite::to_json(o) << "\n";
    return 0;
  }

  if (cmd == "diff") {
    const CliArgs args = parse_args(argc, argv, 2);
    if (args.positional.size() < 2) {
      usage();
      return 1;
    }
    auto a = read_file(args.positional[0]);
    auto b = read_file(args.positional[1]);
    if (!a || !b) {
      print_error("read_failed", "cannot read " + args.positional[a ? 1 : 0]);
      return 1;
    }
    std::cout << mender::unified_diff(*a, *b);
    return 0;
  }

  if (cmd == "doctor") {
    const CliArgs args = parse_args(argc, argv, 2);
    auto cfg = resolve_config(args);
    if (!cfg) return 1;

    std::vector<std::string> blockers;
    std::vector<std::string> warnings;
    const auto h = mender::hash_runtime_info();
    if (!h.blake3_available) blockers.push_back("blake3_not_available");
    if (!verify_hash_vectors()) blockers.push_back("hash_vectors_failed");

    const auto backend = mender::make_backend(*cfg);
    const mender::ProbeResult sandbox = backend->probe();
    if (!sandbox.available) blockers.push_back("sandbox_unavailable");

    std::string advisory_json = "{\"configured\":false}";
    if (cfg->strategy == "advisory") {
      mender::AdvisoryOptions opts;
      opts.base_url = cfg->advisory_url;
      opts.model = cfg->advisory_model;
      mender::AdvisoryStrategy advisory(opts, std::make_shared<mender::CurlTransport>(),
                                        std::make_shared<mender::RuleBasedStrategy>());
      const mender::AdvisoryProbe p = advisory.probe();
      // Advisory outages degrade to rule-based patches, never a blocker.
      if (!p.available) warnings.push_back("advisory_unavailable");
      advisory_json = "{\"configured\":true,\"available\":" + std::string(p.available ? "true" : "false") +
                      ",\"url\":\"" + mender::jsonlite::escape(opts.base_url) + "\",\"detail\":\"" +
                      mender::jsonlite::escape(p.detail) + "\"}";
    }

    std::cout << "{\"ok\":" << (blockers.empty() ? "true" : "false") << ",\"blockers\":"
              << json_string_array(blockers) << ",\"warnings\":" << json_string_array(warnings)
              << ",\"version\":" << mender::version::manifest_to_json(mender::version::current_manifest())
              << ",\"hash\":{\"primitive\":\"" << h.primitive << "\",\"version\":\""
              << mender::jsonlite::escape(h.version) << "\"}"
              << ",\"sandbox\":{\"backend\":\"" << mender::jsonlite::escape(sandbox.backend)
              << "\",\"available\":" << (sandbox.available ? "true" : "false") << ",\"detail\":\""
              << mender::jsonlite::escape(sandbox.detail)
              << "\",\"capabilities\":" << json_string_array(sandbox.capabilities) << "}"
              << ",\"advisory\":" << advisory_json << ",\"compression_capabilities\":[\"identity\""
              << (mender::zstd_available() ? ",\"zstd\"" : "") << "]"
              << ",\"stats\":" << mender::global_engine_stats().to_json() << "}\n";
    return blockers.empty() ? 0 : 2;
  }

  if (cmd == "config" && argc >= 3 && std::string(argv[2]) == "validate") {
    const CliArgs args = parse_args(argc, argv, 3);
    if (args.positional.empty()) {
      usage();
      return 1;
    }
    auto text = read_file(args.positional[0]);
    if (!text) {
      print_error("read_failed", "cannot read " + args.positional[0]);
      return 1;
    }
    const mender::ConfigValidationResult r = mender::validate_config(*text);
    std::cout << "{\"ok\":" << (r.ok ? "true" : "false") << ",\"config_version\":\"" << r.config_version
              << "\",\"errors\":" << json_string_array(r.errors) << ",\"warnings\":"
              << json_string_array(r.warnings) << "}\n";
    return r.ok ? 0 : 2;
  }

  if (cmd == "config" && argc >= 3 && std::string(argv[2]) == "show") {
    const CliArgs args = parse_args(argc, argv, 3);
    auto cfg = resolve_config(args);
    if (!cfg) return 1;
    std::cout << mender::config_to_json(*cfg) << "\n";
    return 0;
  }

  if (cmd == "stats") {
    const CliArgs args = parse_args(argc, argv, 2);
    std::string path = args.events_path;
    if (path.empty()) {
      const char* env = std::getenv("MENDER_EVENT_LOG");
      if (env) path = env;
    }
    if (!path.empty()) {
      std::ifstream ifs(path);
      if (!ifs) {
        print_error("read_failed", "cannot read " + path);
        return 1;
      }
      std::string line;
      size_t skipped = 0;
      while (std::getline(ifs, line)) {
        if (line.empty()) continue;
        if (auto ev = mender::event_from_json(line)) {
          mender::global_engine_stats().record(*ev);
        } else {
          ++skipped;
        }
      }
      if (skipped > 0) print_error("event_log_skipped", std::to_string(skipped) + " unreadable line(s) in " + path);
    }
    std::cout << mender::global_engine_stats().to_json() << "\n";
    return 0;
  }

  usage();
  return 1;
}
