#pragma once

// reprise/status.hpp: Run counters and their on-disk record.
//
// DESIGN:
//   One Status per run. The replay engine is the only writer; counters only
//   ever increase. report() persists a snapshot to
//   <db_dir>/<pid>_<start_ms>.json so a separate reporting process can
//   follow progress; writes are rate-limited to one per report_freq unless
//   forced. cleanup() removes the record.
//
// RECORD (version 1):
//   {"version":1,"pid":N,"hostname":"...","start_ms":N,"timestamp_ms":N,
//    "iteration":N,"ignored":N,"results":N,"log_size":N,
//    "result_counts":{"<uid>":N},"result_signatures":{"<uid>":"..."}}

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace reprise {

class Status {
 public:
  static constexpr std::uint64_t REPORT_FREQ_MS = 60000;

  // Empty db_dir disables persistence.
  explicit Status(std::filesystem::path db_dir = {},
                  std::uint64_t report_freq_ms = REPORT_FREQ_MS);
  ~Status();

  Status(const Status&) = delete;
  Status& operator=(const Status&) = delete;

  std::uint64_t iteration{0};
  std::uint64_t ignored{0};
  std::uint64_t results{0};
  std::uint64_t log_size{0};

  // Count one result under `uid` (crash hash or signature key).
  void count_result(const std::string& uid, const std::string& signature);
  const std::map<std::string, std::uint64_t>& result_counts() const { return result_counts_; }
  const std::map<std::string, std::string>& result_signatures() const { return result_signatures_; }

  // Write the record if forced or report_freq has elapsed since the last
  // write. Returns true if a record was written.
  bool report(bool force = false);
  // Remove the record. Idempotent.
  void cleanup() noexcept;

  std::int64_t pid() const { return pid_; }
  const std::string& hostname() const { return hostname_; }
  std::uint64_t start_ms() const { return start_ms_; }
  // Iterations per second since start.
  double rate() const;
  const std::filesystem::path& record_path() const { return record_path_; }
  std::string to_json() const;

 private:
  std::filesystem::path db_dir_;
  std::filesystem::path record_path_;
  std::uint64_t report_freq_ms_;
  std::int64_t pid_;
  std::string hostname_;
  std::uint64_t start_ms_;
  std::uint64_t last_report_ms_{0};
  bool reported_{false};
  bool released_{false};
  std::map<std::string, std::uint64_t> result_counts_;
  std::map<std::string, std::string> result_signatures_;
};

struct StatusRecord {
  std::filesystem::path path;
  std::int64_t pid{0};
  std::string hostname;
  std::uint64_t start_ms{0};
  std::uint64_t timestamp_ms{0};
  std::uint64_t iteration{0};
  std::uint64_t ignored{0};
  std::uint64_t results{0};
  std::uint64_t log_size{0};
  std::map<std::string, std::uint64_t> result_counts;
  std::map<std::string, std::string> result_signatures;
};

// Read every record in `db_dir`. Unreadable or newer-version records are
// skipped and listed in *errors.
std::vector<StatusRecord> load_status_records(const std::filesystem::path& db_dir,
                                              std::vector<std::string>* errors = nullptr);

// Milliseconds since the Unix epoch.
std::uint64_t unix_time_ms();

}  // namespace reprise
