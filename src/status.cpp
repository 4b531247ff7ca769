#include "reprise/status.hpp"

#include <unistd.h>  // getpid, gethostname

#include <algorithm>
#include <chrono>

#include "reprise/fsutil.hpp"
#include "reprise/jsonlite.hpp"
#include "reprise/observability.hpp"
#include "reprise/version.hpp"

namespace reprise {

namespace {

std::string get_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0) return buf;
  return "unknown-host";
}

jsonlite::Value u64(std::uint64_t v) { return jsonlite::Value{v}; }

}  // namespace

std::uint64_t unix_time_ms() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

Status::Status(fs::path db_dir, std::uint64_t report_freq_ms)
    : db_dir_(std::move(db_dir)),
      report_freq_ms_(report_freq_ms),
      pid_(static_cast<std::int64_t>(::getpid())),
      hostname_(get_hostname()),
      start_ms_(unix_time_ms()) {
  if (!db_dir_.empty()) {
    record_path_ = db_dir_ / (std::to_string(pid_) + "_" + std::to_string(start_ms_) + ".json");
  }
}

Status::~Status() { cleanup(); }

void Status::count_result(const std::string& uid, const std::string& signature) {
  ++results;
  ++result_counts_[uid];
  result_signatures_.emplace(uid, signature);
}

double Status::rate() const {
  const std::uint64_t now = unix_time_ms();
  if (now <= start_ms_) return 0.0;
  return static_cast<double>(iteration) * 1000.0 / static_cast<double>(now - start_ms_);
}

std::string Status::to_json() const {
  jsonlite::Object counts;
  for (const auto& [uid, n] : result_counts_) counts[uid] = u64(n);
  jsonlite::Object sigs;
  for (const auto& [uid, sig] : result_signatures_) sigs[uid] = jsonlite::Value{sig};

  jsonlite::Object o;
  o["version"] = u64(version::STATUS_FORMAT_VERSION);
  o["pid"] = u64(static_cast<std::uint64_t>(pid_));
  o["hostname"] = jsonlite::Value{hostname_};
  o["start_ms"] = u64(start_ms_);
  o["timestamp_ms"] = u64(unix_time_ms());
  o["iteration"] = u64(iteration);
  o["ignored"] = u64(ignored);
  o["results"] = u64(results);
  o["log_size"] = u64(log_size);
  o["rate"] = jsonlite::Value{rate()};
  o["result_counts"] = jsonlite::Value{counts};
  o["result_signatures"] = jsonlite::Value{sigs};
  return jsonlite::to_json(o);
}

bool Status::report(bool force) {
  if (released_ || record_path_.empty()) return false;
  const std::uint64_t now = unix_time_ms();
  if (!force && reported_ && now - last_report_ms_ < report_freq_ms_) return false;

  std::error_code ec;
  fs::create_directories(db_dir_, ec);
  // Write then rename so readers never see a partial record.
  const fs::path tmp = record_path_.string() + ".tmp";
  if (ec || !write_file(tmp, to_json() + "\n")) {
    log(LogLevel::warn, "status: cannot write " + tmp.string());
    return false;
  }
  fs::rename(tmp, record_path_, ec);
  if (ec) {
    log(LogLevel::warn, "status: cannot publish " + record_path_.string() + ": " + ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  reported_ = true;
  last_report_ms_ = now;
  return true;
}

void Status::cleanup() noexcept {
  if (released_) return;
  released_ = true;
  if (record_path_.empty()) return;
  std::error_code ec;
  fs::remove(record_path_, ec);
}

std::vector<StatusRecord> load_status_records(const fs::path& db_dir,
                                              std::vector<std::string>* errors) {
  std::vector<StatusRecord> records;
  std::error_code ec;
  if (!fs::is_directory(db_dir, ec)) return records;

  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(db_dir, ec)) {
    if (entry.path().extension() == ".json" && entry.is_regular_file(ec)) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());

  for (const auto& file : files) {
    std::optional<jsonlite::JsonError> err;
    const auto obj = jsonlite::parse(read_file(file), &err);
    if (err) {
      if (errors) errors->push_back(file.string() + ": " + err->message);
      continue;
    }
    if (jsonlite::get_u64(obj, "version", 0) != version::STATUS_FORMAT_VERSION) {
      if (errors) errors->push_back(file.string() + ": unsupported version");
      continue;
    }
    StatusRecord r;
    r.path = file;
    r.pid = static_cast<std::int64_t>(jsonlite::get_u64(obj, "pid"));
    r.hostname = jsonlite::get_string(obj, "hostname");
    r.start_ms = jsonlite::get_u64(obj, "start_ms");
    r.timestamp_ms = jsonlite::get_u64(obj, "timestamp_ms");
    r.iteration = jsonlite::get_u64(obj, "iteration");
    r.ignored = jsonlite::get_u64(obj, "ignored");
    r.results = jsonlite::get_u64(obj, "results");
    r.log_size = jsonlite::get_u64(obj, "log_size");
    for (const auto& [uid, n] : jsonlite::get_u64_map(obj, "result_counts")) {
      r.result_counts[uid] = n;
    }
    r.result_signatures = jsonlite::get_string_map(obj, "result_signatures");
    records.push_back(std::move(r));
  }
  return records;
}

}  // namespace reprise
