#pragma once

// reprise/process_target.hpp: Desktop target: a local browser process.
//
// LOGS:
//   Each launch gets a fresh log directory holding log_stdout.txt,
//   log_stderr.txt and whatever the sanitizers write (ASAN_OPTIONS,
//   UBSAN_OPTIONS, TSAN_OPTIONS and MSAN_OPTIONS log_path point into it).
//   save_logs() copies that directory; cleanup() deletes it.
//
// FAILURE DETECTION (one call per iteration):
//   exited, sanitizer log present           -> failure
//   exited by signal or non-zero status     -> failure
//   exited cleanly                          -> none (closed, relaunch next)
//   over time_limit since launch/last check -> "timeout"
//   log directory larger than log_limit     -> "log-limit"
//   resident memory above memory_limit      -> "memory"
//   The three limit issues are ignored when named in the ignore set and
//   are failures otherwise. Any limit hit closes the process.

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "reprise/fsutil.hpp"
#include "reprise/process.hpp"
#include "reprise/target.hpp"

namespace reprise {

struct ProcessTargetOptions {
  std::string binary;
  std::vector<std::string> args;  // placed before the location
  std::uint64_t launch_timeout_ms{300000};
  // A launch counts as ready once the process survives this long.
  std::uint64_t launch_settle_ms{500};
  std::uint64_t time_limit_ms{30000};
  std::uint64_t log_limit_bytes{0};      // 0 = unlimited
  std::uint64_t memory_limit_bytes{0};   // 0 = unlimited; checked against RSS
  std::uint32_t relaunch{1000};
  fs::path log_root;                     // empty = temp_root()
};

class ProcessTarget final : public Target {
 public:
  explicit ProcessTarget(ProcessTargetOptions options);
  ~ProcessTarget() override;

  ProcessTarget(const ProcessTarget&) = delete;
  ProcessTarget& operator=(const ProcessTarget&) = delete;

  void launch(const std::string& location, const EnvMap& env) override;
  FailureResult detect_failure(const IgnoreSet& ignored) override;
  void close() override;
  void check_relaunch() override;
  bool save_logs(const fs::path& dst) override;

  bool closed() const override { return closed_; }
  bool forced_close() const override { return forced_close_; }
  const std::string& binary() const override { return options_.binary; }

  void cleanup() noexcept override;

  const ProcessTargetOptions& options() const { return options_; }
  const fs::path& log_path() const { return logs_.path(); }
  std::uint32_t relaunch_countdown() const { return relaunch_countdown_; }
  // Limit issue found by the last detect_failure(), if any.
  const std::optional<std::string>& last_issue() const { return last_issue_; }

  // Merge sanitizer log settings into `env` (existing options are kept).
  static void apply_sanitizer_env(EnvMap& env, const fs::path& log_dir);

 private:
  bool has_sanitizer_log() const;
  FailureResult limit_hit(const std::string& issue, const IgnoreSet& ignored);

  ProcessTargetOptions options_;
  std::unique_ptr<Process> process_;
  TempDir logs_;
  bool closed_{true};
  bool forced_close_{false};
  std::uint32_t relaunch_countdown_{0};
  std::optional<std::string> last_issue_;
  std::chrono::steady_clock::time_point iteration_start_{};
};

}  // namespace reprise
