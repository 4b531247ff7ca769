#pragma once

// reprise/report.hpp: Crash evidence and crash signatures.
//
// DESIGN:
//   A Report is the evidence built from one target failure: a directory of
//   logs plus the identity extracted from them (short signature, major and
//   minor stack hashes, crash hash). The replay engine only sees the
//   abstract Report interface; CrashReport is the sanitizer-log parser used
//   in production and tests substitute their own implementations.
//
// MEMORY OWNERSHIP:
//   - A Report owns its log directory and deletes it in cleanup().
//   - ReportPtr is the only owning handle. Its deleter calls cleanup()
//     exactly once before destruction, so dropping a ReportPtr anywhere
//     releases the evidence.
//
// INVARIANTS:
//   - cleanup() is idempotent, noexcept and best-effort.
//   - Accessors stay valid after cleanup(); the directory behind path() is
//     gone.

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace reprise {

class Report {
 public:
  virtual ~Report() = default;

  // Directory holding the log files.
  virtual const std::filesystem::path& path() const = 0;
  // Name prefix used when exporting, unique per report in practice.
  virtual const std::string& prefix() const = 0;
  virtual const std::string& short_signature() const = 0;
  virtual const std::string& major() const = 0;
  virtual const std::string& minor() const = 0;
  virtual const std::string& crash_hash() const = 0;

  virtual void cleanup() noexcept = 0;
};

struct ReportRelease {
  void operator()(Report* report) const noexcept {
    if (!report) return;
    report->cleanup();
    delete report;
  }
};

using ReportPtr = std::unique_ptr<Report, ReportRelease>;

// Build evidence from a directory of target logs. The factory takes
// ownership of the files (moves them) and returns nullptr on failure.
using ReportFactory =
    std::function<ReportPtr(const std::filesystem::path& log_dir,
                            const std::string& binary)>;

// ---------------------------------------------------------------------------
// CrashReport: evidence parsed from sanitizer / assertion output
// ---------------------------------------------------------------------------
class CrashReport final : public Report {
 public:
  static constexpr const char* kNoSignature = "No crash detected";
  static constexpr const char* kNoStack = "NO_STACK";
  static constexpr size_t kMajorDepth = 5;
  static constexpr size_t kMaxFrames = 50;

  // Move the log files out of `log_dir` into a fresh directory under
  // `report_root` (temp_root() when empty) and parse them.
  static ReportPtr from_path(const std::filesystem::path& log_dir,
                             const std::string& binary,
                             const std::filesystem::path& report_root = {});

  // Parsing helpers, exposed for tests.
  static std::vector<std::string> parse_frames(const std::string& log);
  static std::optional<std::string> find_assertion(const std::string& log);
  static bool is_sanitizer_log(const std::filesystem::path& file,
                               const std::string& content);

  const std::filesystem::path& path() const override { return path_; }
  const std::string& prefix() const override { return prefix_; }
  const std::string& short_signature() const override { return short_signature_; }
  const std::string& major() const override { return major_; }
  const std::string& minor() const override { return minor_; }
  const std::string& crash_hash() const override { return crash_hash_; }
  const std::string& binary() const { return binary_; }
  const std::vector<std::string>& frames() const { return frames_; }
  // File the signature was extracted from, empty if none.
  const std::filesystem::path& crash_log() const { return crash_log_; }

  void cleanup() noexcept override;

 private:
  CrashReport() = default;

  std::filesystem::path path_;
  std::filesystem::path crash_log_;
  std::string binary_;
  std::string prefix_;
  std::string short_signature_;
  std::string major_;
  std::string minor_;
  std::string crash_hash_;
  std::vector<std::string> frames_;
  bool released_{false};
};

// ---------------------------------------------------------------------------
// CrashSignature: what counts as "the" crash when reproducing
// ---------------------------------------------------------------------------
struct CrashSignature {
  std::string symptom;                 // compared with Report::short_signature()
  std::optional<std::string> major;    // if set, Report::major() must match too

  bool matches(const Report& report) const;
  std::string to_json() const;

  // Signature with the report's short signature (and no major constraint).
  static CrashSignature from_report(const Report& report);
  // {"symptom": "...", "major": "...", "version": 1}
  static std::optional<CrashSignature> load(const std::filesystem::path& path,
                                            std::string* error = nullptr);
};

// Replay signature state. Transitions at most once per run, from unset to
// bootstrapped, and never out of explicit.
class SignatureState {
 public:
  enum class Kind { unset, explicit_signature, bootstrapped };

  SignatureState() = default;
  explicit SignatureState(CrashSignature sig)
      : kind_(Kind::explicit_signature), signature_(std::move(sig)) {}

  Kind kind() const { return kind_; }
  bool has_signature() const { return kind_ != Kind::unset; }
  // Precondition: has_signature().
  const CrashSignature& signature() const { return *signature_; }

  // Adopt `sig` if unset. Returns true if the state changed.
  bool bootstrap(CrashSignature sig);

 private:
  Kind kind_{Kind::unset};
  std::optional<CrashSignature> signature_;
};

}  // namespace reprise
