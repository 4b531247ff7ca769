#include "reprise/process_target.hpp"

#include <algorithm>
#include <cstdlib>
#include <iterator>

#include "reprise/observability.hpp"

namespace reprise {

namespace {

constexpr const char* kSanitizerVars[] = {
    "ASAN_OPTIONS", "UBSAN_OPTIONS", "TSAN_OPTIONS", "MSAN_OPTIONS"};
constexpr const char* kSanitizerLogNames[] = {"asan", "ubsan", "tsan", "msan"};

// "a=1:b=2" -> {"a=1", "b=2"}
std::vector<std::string> split_options(const std::string& opts) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= opts.size()) {
    size_t end = opts.find(':', pos);
    if (end == std::string::npos) end = opts.size();
    if (end > pos) out.push_back(opts.substr(pos, end - pos));
    pos = end + 1;
  }
  return out;
}

std::chrono::milliseconds ms(std::uint64_t v) {
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(v));
}

}  // namespace

ProcessTarget::ProcessTarget(ProcessTargetOptions options)
    : options_(std::move(options)) {}

ProcessTarget::~ProcessTarget() { cleanup(); }

void ProcessTarget::apply_sanitizer_env(EnvMap& env, const fs::path& log_dir) {
  for (size_t i = 0; i < std::size(kSanitizerVars); ++i) {
    const std::string var = kSanitizerVars[i];
    std::string existing;
    if (auto it = env.find(var); it != env.end()) {
      existing = it->second;
    } else if (const char* inherited = std::getenv(var.c_str())) {
      existing = inherited;
    }
    std::vector<std::string> opts;
    for (auto& opt : split_options(existing)) {
      if (opt.rfind("log_path=", 0) != 0) opts.push_back(std::move(opt));
    }
    opts.push_back("log_path=" + (log_dir / kSanitizerLogNames[i]).string());
    std::string joined;
    for (const auto& opt : opts) {
      if (!joined.empty()) joined += ':';
      joined += opt;
    }
    env[var] = joined;
  }
}

void ProcessTarget::launch(const std::string& location, const EnvMap& env) {
  if (!closed_) close();

  const fs::path root = options_.log_root.empty() ? temp_root() : options_.log_root;
  logs_ = TempDir(root, "logs_");
  if (!logs_.valid()) {
    throw TargetLaunchError("cannot create log directory: " + logs_.error().message(),
                            ErrorCode::io_error);
  }

  ProcessSpec spec;
  spec.command = options_.binary;
  spec.argv = options_.args;
  spec.argv.push_back(location);
  spec.env = env;
  apply_sanitizer_env(spec.env, logs_.path());
  spec.stdout_path = (logs_.path() / "log_stdout.txt").string();
  spec.stderr_path = (logs_.path() / "log_stderr.txt").string();

  log(LogLevel::debug, "target: launching " + options_.binary + " " + location);
  process_ = std::make_unique<Process>();
  forced_close_ = false;
  std::string error;
  if (!process_->start(spec, &error)) {
    closed_ = true;
    throw TargetLaunchError(error, ErrorCode::spawn_failed);
  }

  const auto settle = ms(std::min(options_.launch_settle_ms, options_.launch_timeout_ms));
  if (process_->wait_for(settle)) {
    closed_ = true;
    throw TargetLaunchError("target exited during launch (status " +
                                std::to_string(process_->status_code()) + ")",
                            ErrorCode::launch_failed);
  }

  closed_ = false;
  relaunch_countdown_ = options_.relaunch;
  iteration_start_ = std::chrono::steady_clock::now();
  log(LogLevel::info, "target: launched pid " + std::to_string(process_->pid()));
}

bool ProcessTarget::has_sanitizer_log() const {
  if (!logs_.valid()) return false;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(logs_.path(), ec)) {
    const std::string name = entry.path().filename().string();
    for (const char* prefix : kSanitizerLogNames) {
      if (name.rfind(std::string(prefix) + ".", 0) == 0 && entry.file_size(ec) > 0) {
        return true;
      }
    }
  }
  return false;
}

FailureResult ProcessTarget::limit_hit(const std::string& issue, const IgnoreSet& ignored) {
  last_issue_ = issue;
  close();
  if (ignored.count(issue)) {
    log(LogLevel::debug, "target: " + issue + " (ignored)");
    return FailureResult::ignored;
  }
  log(LogLevel::info, "target: " + issue);
  return FailureResult::failure;
}

FailureResult ProcessTarget::detect_failure(const IgnoreSet& ignored) {
  last_issue_.reset();
  if (closed_ || !process_) return FailureResult::none;

  if (!process_->running()) {
    closed_ = true;
    forced_close_ = false;
    if (has_sanitizer_log() || process_->term_signal() || process_->status_code() != 0) {
      log(LogLevel::info, "target: process exited with status " +
                              std::to_string(process_->status_code()));
      return FailureResult::failure;
    }
    log(LogLevel::debug, "target: process exited cleanly");
    return FailureResult::none;
  }

  if (options_.log_limit_bytes > 0 && path_size(logs_.path()) > options_.log_limit_bytes) {
    return limit_hit("log-limit", ignored);
  }
  if (options_.memory_limit_bytes > 0 && process_->rss_bytes() > options_.memory_limit_bytes) {
    return limit_hit("memory", ignored);
  }
  const auto now = std::chrono::steady_clock::now();
  if (options_.time_limit_ms > 0 && now - iteration_start_ >= ms(options_.time_limit_ms)) {
    return limit_hit("timeout", ignored);
  }
  iteration_start_ = now;
  return FailureResult::none;
}

void ProcessTarget::close() {
  if (closed_ || !process_) {
    closed_ = true;
    return;
  }
  forced_close_ = process_->terminate();
  closed_ = true;
  log(LogLevel::debug, std::string("target: closed") + (forced_close_ ? " (forced)" : ""));
}

void ProcessTarget::check_relaunch() {
  if (closed_) return;
  if (relaunch_countdown_ > 0) --relaunch_countdown_;
  if (relaunch_countdown_ == 0) {
    log(LogLevel::info, "target: relaunch due");
    close();
  }
}

bool ProcessTarget::save_logs(const fs::path& dst) {
  if (!logs_.valid()) return false;
  std::error_code ec;
  fs::create_directories(dst, ec);
  if (ec) return false;
  fs::copy(logs_.path(), dst,
           fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
  if (ec) {
    log(LogLevel::warn, "target: save_logs failed: " + ec.message());
    return false;
  }
  return true;
}

void ProcessTarget::cleanup() noexcept {
  if (process_ && !closed_) process_->terminate(std::chrono::milliseconds(0));
  closed_ = true;
  process_.reset();
  logs_.remove();
}

}  // namespace reprise
