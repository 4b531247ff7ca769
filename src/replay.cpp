#include "reprise/replay.hpp"

#include <chrono>
#include <stdexcept>

#include "reprise/fsutil.hpp"
#include "reprise/observability.hpp"

namespace reprise {

namespace {

std::uint64_t elapsed_ns(std::chrono::steady_clock::time_point start) {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                        std::chrono::steady_clock::now() - start)
                                        .count());
}

// First "<prefix>", "<prefix>_1", ... for which "<dir>/<name>_logs" is free.
std::string unique_report_name(const fs::path& dir, const std::string& prefix) {
  std::error_code ec;
  std::string name = prefix;
  for (unsigned n = 1; fs::exists(dir / (name + "_logs"), ec); ++n) {
    name = prefix + "_" + std::to_string(n);
  }
  return name;
}

bool export_reports(const fs::path& dir, const std::vector<const Report*>& reports,
                    const std::vector<TestCase>& tests) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    log(LogLevel::error, "export: cannot create " + dir.string() + ": " + ec.message());
    return false;
  }
  bool ok = true;
  for (const Report* report : reports) {
    const std::string name = unique_report_name(dir, report->prefix());
    if (!move_path(report->path(), dir / (name + "_logs"), ec)) {
      log(LogLevel::error, "export: cannot move " + report->path().string() + ": " + ec.message());
      ok = false;
    }
    for (size_t i = 0; i < tests.size(); ++i) {
      std::string error;
      if (!tests[i].dump(dir / (name + "-" + std::to_string(i)), &error)) {
        log(LogLevel::error, "export: " + error);
        ok = false;
      }
    }
  }
  return ok;
}

}  // namespace

ReplayManager::ReplayManager(IgnoreSet ignore, Server& server, Target& target,
                             ReplayOptions options)
    : ignore_(std::move(ignore)),
      server_(server),
      target_(target),
      options_(std::move(options)) {
  if (options_.signature && options_.any_crash) {
    throw std::invalid_argument("signature and any_crash are mutually exclusive");
  }
  if (options_.signature) initial_signature_ = SignatureState(*options_.signature);
  signature_ = initial_signature_;
  if (!options_.report_factory) {
    const fs::path root = options_.tmp_root;
    options_.report_factory = [root](const fs::path& log_dir, const std::string& binary) {
      return CrashReport::from_path(log_dir, binary, root);
    };
  }
}

ReplayManager::~ReplayManager() { cleanup(); }

void ReplayManager::release_results() noexcept {
  // Dropping a ReportPtr runs Report::cleanup().
  expected_.clear();
  other_.clear();
}

void ReplayManager::cleanup() noexcept {
  release_results();
  if (status_) {
    status_->cleanup();
    status_.reset();
  }
}

std::map<std::string, const Report*> ReplayManager::reports() const {
  std::map<std::string, const Report*> out;
  for (const auto& [key, report] : expected_) out.emplace(key, report.get());
  return out;
}

std::map<std::string, const Report*> ReplayManager::other_reports() const {
  std::map<std::string, const Report*> out;
  for (const auto& [key, report] : other_) out.emplace(key, report.get());
  return out;
}

ReplayManager::ReportMap ReplayManager::take_reports() {
  ReportMap out;
  out.swap(expected_);
  return out;
}

ReplayManager::ReportMap ReplayManager::take_other_reports() {
  ReportMap out;
  out.swap(other_);
  return out;
}

std::string ReplayManager::location(const char* url) const {
  return "http://127.0.0.1:" + std::to_string(server_.port()) + "/" + url;
}

ReportPtr ReplayManager::build_report(const fs::path& log_dir) {
  ReportPtr report = options_.report_factory(log_dir, target_.binary());
  if (!report) log(LogLevel::error, "replay: could not build a report from " + log_dir.string());
  return report;
}

void ReplayManager::launch_target(const EnvMap& env, const std::string& where) {
  try {
    target_.launch(where, env);
  } catch (const TargetLaunchError& e) {
    log(LogLevel::error, std::string("replay: launch failed: ") + e.what());
    ReplayEvent ev;
    ev.iteration = status_ ? status_->iteration : 0;
    ev.outcome = "launch_failed";
    ev.results = status_ ? status_->results : 0;

    // Keep whatever the target logged for diagnosis.
    target_.close();
    const fs::path root = options_.tmp_root.empty() ? temp_root() : options_.tmp_root;
    TempDir log_dir(root, "logs_");
    if (log_dir.valid() && target_.save_logs(log_dir.path())) {
      if (ReportPtr report = build_report(log_dir.path())) {
        ev.short_signature = report->short_signature();
        ev.classification = "other";
        other_[kStartupKey] = std::move(report);
      }
    }
    emit_replay_event(ev);
    throw;
  }
}

std::string ReplayManager::keep(ReportMap& set, const std::string& key, ReportPtr report) {
  ReportMap& opposite = &set == &expected_ ? other_ : expected_;
  if (set.count(key) || (&set == &other_ && opposite.count(key))) {
    log(LogLevel::debug, "replay: duplicate '" + key + "' released");
    return "duplicate";  // `report` released on return
  }
  // An expected result supersedes an unrelated one filed under the same key.
  opposite.erase(key);
  set.emplace(key, std::move(report));
  return &set == &expected_ ? "expected" : "other";
}

std::string ReplayManager::count_missing_evidence() {
  if (options_.any_crash) {
    status_->count_result(kNoEvidenceKey, CrashReport::kNoSignature);
    log(LogLevel::warn, "replay: result counted without evidence");
  } else {
    log(LogLevel::warn, "replay: failure without evidence cannot be classified");
  }
  return "no_evidence";
}

std::string ReplayManager::classify(ReportPtr report) {
  const std::string symptom = report->short_signature();

  if (options_.any_crash) {
    const std::string key = report->crash_hash();
    status_->count_result(key, symptom);
    log(LogLevel::info, "replay: result " + symptom + " (" + key + ")");
    return keep(expected_, key, std::move(report));
  }

  if (!signature_.has_signature() && symptom != CrashReport::kNoSignature) {
    signature_.bootstrap(CrashSignature::from_report(*report));
    log(LogLevel::info, "replay: using signature '" + symptom + "'");
  }
  if (signature_.has_signature() && signature_.signature().matches(*report)) {
    const std::string key = signature_.signature().symptom;
    status_->count_result(key, symptom);
    log(LogLevel::info, "replay: result " + symptom);
    return keep(expected_, key, std::move(report));
  }
  log(LogLevel::info, "replay: different signature " + symptom);
  return keep(other_, symptom, std::move(report));
}

bool ReplayManager::run(const std::vector<TestCase>& testcases, std::uint32_t repeat,
                        std::uint32_t min_results) {
  if (testcases.empty()) throw std::invalid_argument("testcases must not be empty");
  if (repeat < 1) throw std::invalid_argument("repeat must be >= 1");
  if (min_results < 1) throw std::invalid_argument("min_results must be >= 1");
  if (min_results > repeat) throw std::invalid_argument("min_results must be <= repeat");

  release_results();
  signature_ = initial_signature_;
  status_ = std::make_unique<Status>(options_.status_dir);

  const fs::path root = options_.tmp_root.empty() ? temp_root() : options_.tmp_root;
  std::vector<TempDir> serve_dirs;
  serve_dirs.reserve(testcases.size());
  for (const auto& tc : testcases) {
    serve_dirs.emplace_back(root, "serve_");
    std::string error;
    if (!serve_dirs.back().valid() || !tc.dump(serve_dirs.back().path(), &error)) {
      log(LogLevel::error, "replay: cannot prepare test case: " +
                               (error.empty() ? serve_dirs.back().error().message() : error));
      return false;
    }
  }

  ServerMap server_map;
  if (options_.harness) {
    const std::string harness = *options_.harness;
    server_map.set_dynamic_response(kHarnessUrl, [harness] { return harness; });
  }
  const EnvMap& env = testcases.front().env_vars();
  const std::string launch_location =
      location(options_.harness ? kHarnessUrl : kCurrentTestUrl);

  bool success = false;
  while (status_->iteration < repeat) {
    const auto started = std::chrono::steady_clock::now();
    ++status_->iteration;
    ReplayEvent ev;
    ev.iteration = status_->iteration;

    if (target_.closed()) {
      log(LogLevel::debug, "replay: launching target");
      launch_target(env, launch_location);
    }

    // Deliver the sequence; a non-none result ends it early.
    FailureResult result = FailureResult::none;
    bool served = true;
    for (size_t i = 0; i < testcases.size(); ++i) {
      const TestCase& tc = testcases[i];
      if (options_.harness) {
        server_map.set_redirect(kNextTestUrl, tc.landing_page());
      } else {
        server_map.set_redirect(kCurrentTestUrl, tc.landing_page());
        if (i > 0) {
          target_.close();
          launch_target(env, launch_location);
        }
      }
      log(LogLevel::debug, "replay: serving " + tc.landing_page() + " (" +
                               std::to_string(i + 1) + "/" + std::to_string(testcases.size()) + ")");
      const ServeResult sr = server_.serve_path(serve_dirs[i].path(), tc.optional(), server_map);
      if (sr.status != ServeStatus::all_served) {
        log(LogLevel::error, "replay: test case was not served (" + to_string(sr.status) + ")");
        served = false;
        break;
      }
      result = target_.detect_failure(ignore_);
      if (result != FailureResult::none) break;
    }

    if (!served) {
      ev.outcome = "serve_failed";
      ev.results = status_->results;
      ev.duration_ns = elapsed_ns(started);
      emit_replay_event(ev);
      break;
    }

    ev.outcome = to_string(result);
    if (result == FailureResult::failure) {
      target_.close();
      ReportPtr report;
      TempDir log_dir(root, "logs_");
      if (!log_dir.valid()) {
        log(LogLevel::error, "replay: cannot create log directory: " + log_dir.error().message());
      } else if (!target_.save_logs(log_dir.path())) {
        log(LogLevel::warn, "replay: target logs could not be saved");
      } else {
        report = build_report(log_dir.path());
      }
      if (report) {
        ev.short_signature = report->short_signature();
        ev.major = report->major();
        ev.minor = report->minor();
        status_->log_size += path_size(report->path());
        ev.classification = classify(std::move(report));
      } else {
        ev.classification = count_missing_evidence();
      }
    } else if (result == FailureResult::ignored) {
      ++status_->ignored;
      log(LogLevel::debug, "replay: ignored");
    }

    if (!options_.harness) {
      target_.close();
    } else if (!target_.closed()) {
      target_.check_relaunch();
    }
    if (target_.closed() && target_.forced_close()) {
      log(LogLevel::debug, "replay: target did not exit on its own, relaunching");
      ev.forced_close = true;
    }

    ev.results = status_->results;
    ev.duration_ns = elapsed_ns(started);
    emit_replay_event(ev);
    status_->report();

    if (status_->results >= min_results) {
      success = true;
      break;
    }
    if (repeat - status_->iteration < min_results - status_->results) {
      log(LogLevel::debug, "replay: remaining iterations cannot reach " +
                               std::to_string(min_results) + " result(s)");
      break;
    }
  }

  log(LogLevel::info, "replay: " + std::string(success ? "reproduced" : "not reproduced") +
                          " (" + std::to_string(status_->results) + "/" +
                          std::to_string(min_results) + " result(s), " +
                          std::to_string(status_->iteration) + " iteration(s), " +
                          std::to_string(status_->ignored) + " ignored)");
  status_->report(true);
  return success;
}

bool ReplayManager::report_to_filesystem(const fs::path& dst,
                                         const std::vector<const Report*>& expected,
                                         const std::vector<const Report*>& other,
                                         const std::vector<TestCase>& tests) {
  if (expected.empty() && other.empty()) return true;
  bool ok = true;
  if (!expected.empty()) ok = export_reports(dst / "reports", expected, tests) && ok;
  if (!other.empty()) ok = export_reports(dst / "other_reports", other, tests) && ok;
  return ok;
}

std::string ReplayManager::default_harness(std::uint64_t time_limit_ms) {
  return R"(<!DOCTYPE html>
<html>
<head><meta charset="UTF-8"><title>reprise harness</title></head>
<body>
<script>
const TIME_LIMIT = )" + std::to_string(time_limit_ms) + R"(;
let win = null;
function next() {
  if (win && !win.closed) {
    win.close();
  }
  win = window.open("/)" + std::string(kNextTestUrl) + R"(", "reprise_test");
  setTimeout(next, TIME_LIMIT);
}
window.addEventListener("load", next);
</script>
</body>
</html>
)";
}

}  // namespace reprise
