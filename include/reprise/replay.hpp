#pragma once

// reprise/replay.hpp: Crash reproduction loop.
//
// DESIGN:
//   ReplayManager drives one Target through up to `repeat` iterations. Each
//   iteration serves the test case sequence through the Server, asks the
//   Target for a FailureResult and, on failure, turns the target's logs into
//   a Report which is then classified:
//
//     any-crash mode    every failure counts; dedup by crash hash.
//     explicit mode     a match counts and is kept in the expected set under
//                       the signature symptom; a non-match is kept in the
//                       other set under its own short signature.
//     bootstrap mode    no signature given: the first failure carrying a
//                       signature becomes the signature for the rest of the
//                       run, then as explicit mode.
//
//   The first report seen for a key is kept; later reports with the same
//   key are released immediately. A key lives in at most one of the two
//   sets.
//
//   A FAILURE whose logs cannot be saved or parsed has no report. In
//   any-crash mode it still counts, under "NO_EVIDENCE"; otherwise it is
//   recorded as a "no_evidence" event and left unclassified.
//
//   run() stops early once `min_results` is reached, or once the remaining
//   budget can no longer reach it. A serve outcome other than all_served
//   ends the run with false. A TargetLaunchError propagates to the caller
//   after the target's logs are kept in the other set under "STARTUP".
//
// HARNESS URLS:
//   /repro_harness        harness page (harness mode, launch location)
//   /repro_next_test      required redirect to the current test's landing page
//   /repro_current_test   launch location without a harness
//
// MEMORY OWNERSHIP:
//   - Server and Target are borrowed and must outlive the manager.
//   - Kept reports and the Status are owned here and released exactly once,
//     by cleanup() or the destructor.
//   - Temporary serve and log directories are scoped to run() / one
//     iteration and removed on every exit path.

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "reprise/report.hpp"
#include "reprise/server.hpp"
#include "reprise/status.hpp"
#include "reprise/target.hpp"
#include "reprise/testcase.hpp"
#include "reprise/types.hpp"

namespace reprise {

struct ReplayOptions {
  std::optional<CrashSignature> signature;
  bool any_crash{false};
  std::optional<std::string> harness;   // harness page; nullopt = no harness
  std::filesystem::path tmp_root;       // empty = temp_root()
  std::filesystem::path status_dir;     // empty = no status record
  ReportFactory report_factory;         // empty = CrashReport::from_path
};

class ReplayManager {
 public:
  static constexpr const char* kHarnessUrl = "repro_harness";
  static constexpr const char* kNextTestUrl = "repro_next_test";
  static constexpr const char* kCurrentTestUrl = "repro_current_test";
  static constexpr const char* kStartupKey = "STARTUP";
  static constexpr const char* kNoEvidenceKey = "NO_EVIDENCE";

  using ReportMap = std::map<std::string, ReportPtr>;

  // Throws std::invalid_argument if both a signature and any_crash are set.
  ReplayManager(IgnoreSet ignore, Server& server, Target& target,
                ReplayOptions options = {});
  ~ReplayManager();

  ReplayManager(const ReplayManager&) = delete;
  ReplayManager& operator=(const ReplayManager&) = delete;

  // Returns true if `min_results` results were found within `repeat`
  // iterations. Throws std::invalid_argument on empty `testcases`,
  // repeat < 1, min_results < 1 or min_results > repeat. Results of a
  // previous run() are released first.
  bool run(const std::vector<TestCase>& testcases, std::uint32_t repeat = 1,
           std::uint32_t min_results = 1);

  // Kept reports by key. Views stay valid until cleanup() or the next run().
  std::map<std::string, const Report*> reports() const;
  std::map<std::string, const Report*> other_reports() const;

  // Transfer kept reports to the caller, leaving the set empty.
  ReportMap take_reports();
  ReportMap take_other_reports();

  // nullptr before the first run() and after cleanup().
  const Status* status() const { return status_.get(); }
  const SignatureState& signature_state() const { return signature_; }

  // Release every kept report and the status. Idempotent.
  void cleanup() noexcept;

  // Export results under `dst`:
  //   dst/reports/<prefix>_logs          one per expected report (moved)
  //   dst/reports/<prefix>-<n>           test case n, dumped per report
  //   dst/other_reports/...              same for other reports
  // Writes nothing when both lists are empty. Returns false on I/O errors.
  static bool report_to_filesystem(const std::filesystem::path& dst,
                                   const std::vector<const Report*>& expected,
                                   const std::vector<const Report*>& other,
                                   const std::vector<TestCase>& tests = {});

  // Built-in harness page: loads /repro_next_test in a child window and
  // moves on after `time_limit_ms`.
  static std::string default_harness(std::uint64_t time_limit_ms);

 private:
  std::string location(const char* url) const;
  void launch_target(const EnvMap& env, const std::string& location);
  // Returns the classification recorded in the replay event.
  std::string classify(ReportPtr report);
  std::string keep(ReportMap& set, const std::string& key, ReportPtr report);
  std::string count_missing_evidence();
  ReportPtr build_report(const std::filesystem::path& log_dir);
  void release_results() noexcept;

  IgnoreSet ignore_;
  Server& server_;
  Target& target_;
  ReplayOptions options_;
  SignatureState initial_signature_;
  SignatureState signature_;
  ReportMap expected_;
  ReportMap other_;
  std::unique_ptr<Status> status_;
};

}  // namespace reprise
