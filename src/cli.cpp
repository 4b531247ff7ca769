#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "reprise/config.hpp"
#include "reprise/fsutil.hpp"
#include "reprise/hash.hpp"
#include "reprise/jsonlite.hpp"
#include "reprise/observability.hpp"
#include "reprise/process_target.hpp"
#include "reprise/replay.hpp"
#include "reprise/server.hpp"
#include "reprise/status.hpp"
#include "reprise/testcase.hpp"
#include "reprise/version.hpp"

namespace {

// Exit codes
constexpr int kReproduced = 0;
constexpr int kNotReproduced = 1;
constexpr int kUsageError = 2;
constexpr int kLaunchError = 3;

std::string reports_to_json(const std::map<std::string, const reprise::Report*>& reports) {
  std::ostringstream o;
  o << "[";
  bool first = true;
  for (const auto& [key, report] : reports) {
    if (!first) o << ",";
    first = false;
    o << "{\"key\":\"" << reprise::jsonlite::escape(key) << "\""
      << ",\"signature\":\"" << reprise::jsonlite::escape(report->short_signature()) << "\""
      << ",\"major\":\"" << report->major() << "\""
      << ",\"minor\":\"" << report->minor() << "\""
      << ",\"crash_hash\":\"" << report->crash_hash() << "\""
      << "}";
  }
  o << "]";
  return o.str();
}

std::vector<const reprise::Report*> values(
    const std::map<std::string, const reprise::Report*>& reports) {
  std::vector<const reprise::Report*> out;
  for (const auto& [key, report] : reports) out.push_back(report);
  return out;
}

void export_results(const reprise::ReplayConfig& cfg, const reprise::ReplayManager& replay,
                    const std::vector<reprise::TestCase>& testcases) {
  if (cfg.output_dir.empty()) return;
  const auto expected = replay.reports();
  const auto other = replay.other_reports();
  if (!reprise::ReplayManager::report_to_filesystem(cfg.output_dir, values(expected),
                                                    values(other), testcases)) {
    reprise::log(reprise::LogLevel::error, "results were only partially exported");
  }
  // Record the signature a bootstrapped run settled on.
  const auto& state = replay.signature_state();
  if (state.kind() == reprise::SignatureState::Kind::bootstrapped && !expected.empty()) {
    reprise::write_file(reprise::fs::path(cfg.output_dir) / "signature.json",
                        state.signature().to_json() + "\n");
  }
}

int cmd_replay(const std::vector<std::string>& args) {
  reprise::ReplayConfig cfg = reprise::ReplayConfig::from_env();
  std::string error;
  if (!reprise::parse_replay_args(args, &cfg, &error)) {
    std::cerr << "reprise: " << error << "\n" << reprise::replay_usage();
    return kUsageError;
  }
  reprise::set_log_level(cfg.log_level);
  const auto validation = reprise::validate_config(cfg);
  for (const auto& w : validation.warnings) reprise::log(reprise::LogLevel::warn, w);
  if (!validation.ok) {
    for (const auto& e : validation.errors) std::cerr << "reprise: " << e << "\n";
    std::cerr << reprise::replay_usage();
    return kUsageError;
  }

  const reprise::fs::path tmp_root =
      cfg.tmp_dir.empty() ? reprise::temp_root() : reprise::fs::path(cfg.tmp_dir);
  const reprise::fs::path status_dir =
      cfg.status_dir.empty() ? tmp_root / "status" : reprise::fs::path(cfg.status_dir);

  std::vector<reprise::TestCase> testcases;
  for (const auto& input : cfg.inputs) {
    auto tc = reprise::TestCase::load(input, &error);
    if (!tc) {
      std::cerr << "reprise: " << error << "\n";
      return kUsageError;
    }
    testcases.push_back(std::move(*tc));
  }

  reprise::ReplayOptions options;
  options.any_crash = cfg.any_crash;
  options.tmp_root = tmp_root;
  options.status_dir = status_dir;
  if (!cfg.signature_path.empty()) {
    options.signature = reprise::CrashSignature::load(cfg.signature_path, &error);
    if (!options.signature) {
      std::cerr << "reprise: " << error << "\n";
      return kUsageError;
    }
  }
  if (cfg.use_harness) {
    options.harness = cfg.harness_path.empty()
                          ? reprise::ReplayManager::default_harness(cfg.time_limit_s * 1000)
                          : reprise::read_file(cfg.harness_path);
  }

  reprise::HarnessServerOptions server_options;
  server_options.port = cfg.port;
  server_options.timeout_ms = cfg.effective_timeout_s() * 1000;
  reprise::HarnessServer server(server_options);
  if (!server.start(&error)) {
    std::cerr << "reprise: harness server: " << error << "\n";
    return kUsageError;
  }

  reprise::ProcessTargetOptions target_options;
  target_options.binary = cfg.binary;
  target_options.args = cfg.binary_args;
  target_options.launch_timeout_ms = cfg.launch_timeout_s * 1000;
  target_options.time_limit_ms = cfg.effective_timeout_s() * 1000;
  target_options.log_limit_bytes = cfg.log_limit_mb * 1048576;
  target_options.memory_limit_bytes = cfg.memory_mb * 1048576;
  target_options.relaunch = cfg.relaunch;
  target_options.log_root = tmp_root;
  reprise::ProcessTarget target(target_options);

  reprise::ReplayManager replay(cfg.ignore, server, target, options);
  bool reproduced = false;
  try {
    reproduced = replay.run(testcases, cfg.repeat, cfg.min_results);
  } catch (const reprise::TargetLaunchError& e) {
    std::cerr << "reprise: launch failed (" << reprise::to_string(e.code()) << "): " << e.what()
              << "\n";
    export_results(cfg, replay, testcases);
    return kLaunchError;
  } catch (const std::invalid_argument& e) {
    std::cerr << "reprise: " << e.what() << "\n";
    return kUsageError;
  }

  const reprise::Status* status = replay.status();
  std::ostringstream o;
  o << "{"
    << "\"reproduced\":" << (reproduced ? "true" : "false")
    << ",\"iteration\":" << status->iteration
    << ",\"results\":" << status->results
    << ",\"ignored\":" << status->ignored
    << ",\"expected\":" << reports_to_json(replay.reports())
    << ",\"other\":" << reports_to_json(replay.other_reports())
    << ",\"stats\":" << reprise::global_replay_stats().to_json() << ",\"events\":[";
  const auto events = reprise::global_replay_stats().recent_events_snapshot();
  for (size_t i = 0; i < events.size(); ++i) {
    if (i) o << ",";
    o << reprise::replay_event_to_json(events[i]);
  }
  o << "]}\n";
  std::cout << o.str();

  export_results(cfg, replay, testcases);
  target.cleanup();
  return reproduced ? kReproduced : kNotReproduced;
}

int cmd_status(const std::vector<std::string>& args) {
  reprise::ReplayConfig cfg = reprise::ReplayConfig::from_env();
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--status-dir" && i + 1 < args.size()) cfg.status_dir = args[++i];
  }
  const reprise::fs::path dir = cfg.status_dir.empty()
                                    ? reprise::temp_root() / "status"
                                    : reprise::fs::path(cfg.status_dir);
  std::vector<std::string> errors;
  const auto records = reprise::load_status_records(dir, &errors);
  for (const auto& e : errors) reprise::log(reprise::LogLevel::warn, e);

  std::uint64_t iterations = 0, results = 0, ignored = 0;
  std::ostringstream o;
  o << "{\"records\":[";
  for (size_t i = 0; i < records.size(); ++i) {
    const auto& r = records[i];
    iterations += r.iteration;
    results += r.results;
    ignored += r.ignored;
    if (i) o << ",";
    o << "{\"pid\":" << r.pid
      << ",\"hostname\":\"" << reprise::jsonlite::escape(r.hostname) << "\""
      << ",\"start_ms\":" << r.start_ms
      << ",\"timestamp_ms\":" << r.timestamp_ms
      << ",\"iteration\":" << r.iteration
      << ",\"ignored\":" << r.ignored
      << ",\"results\":" << r.results
      << ",\"log_size\":" << r.log_size << "}";
  }
  o << "],\"iteration\":" << iterations << ",\"results\":" << results
    << ",\"ignored\":" << ignored << "}\n";
  std::cout << o.str();
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (const char* e = std::getenv("REPRISE_LOG_LEVEL"); e && e[0]) {
    reprise::LogLevel level;
    if (reprise::parse_log_level(e, &level)) reprise::set_log_level(level);
  }

  if (argc < 2) {
    std::cerr << "usage: reprise <replay|status|version|health> [options]\n";
    return kUsageError;
  }
  const std::string cmd = argv[1];
  const std::vector<std::string> args(argv + 2, argv + argc);

  if (cmd == "replay") return cmd_replay(args);
  if (cmd == "status") return cmd_status(args);

  if (cmd == "version") {
    std::cout << reprise::version::manifest_to_json(reprise::version::current_manifest())
              << "\n";
    return 0;
  }

  if (cmd == "health") {
    const auto h = reprise::hash_runtime_info();
    std::cout << "{\"hash_primitive\":\"" << h.primitive
              << "\",\"hash_version\":\"" << h.version
              << "\",\"temp_root\":\"" << reprise::jsonlite::escape(reprise::temp_root().string())
              << "\"}\n";
    return 0;
  }

  if (cmd == "help" || cmd == "--help" || cmd == "-h") {
    std::cout << reprise::replay_usage();
    return 0;
  }

  std::cerr << "reprise: unknown command '" << cmd << "'\n";
  return kUsageError;
}
