#include "reprise/report.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>

#include "reprise/fsutil.hpp"
#include "reprise/hash.hpp"
#include "reprise/jsonlite.hpp"
#include "reprise/observability.hpp"
#include "reprise/version.hpp"

namespace reprise {

namespace {

constexpr const char* kStderrLog = "log_stderr.txt";
constexpr const char* kStdoutLog = "log_stdout.txt";

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

// "foo::bar(int, char) /src/x.cpp:1:2" -> "foo::bar"
std::string frame_function(const std::string& rest) {
  std::string fn;
  int depth = 0;
  for (char c : rest) {
    if (c == '(') ++depth;
    if (c == ')' && depth > 0) --depth;
    if (c == ' ' && depth == 0) break;
    fn.push_back(c);
  }
  // Drop the trailing parameter list.
  if (!fn.empty() && fn.back() == ')') {
    depth = 0;
    for (size_t i = fn.size(); i-- > 0;) {
      if (fn[i] == ')') ++depth;
      if (fn[i] == '(' && --depth == 0) {
        if (i > 0) fn.resize(i);
        break;
      }
    }
  }
  return fn;
}

// "(/usr/lib/libc.so.6+0x2724a)" -> "libc.so.6"
std::string frame_module(const std::string& rest) {
  auto b = rest.find('(');
  auto e = rest.find_first_of("+)", b == std::string::npos ? 0 : b);
  if (b == std::string::npos || e == std::string::npos || e <= b + 1) return "??";
  std::string module = rest.substr(b + 1, e - b - 1);
  const auto slash = module.rfind('/');
  if (slash != std::string::npos) module = module.substr(slash + 1);
  return module.empty() ? "??" : module;
}

std::string timestamp_now() {
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d_%H-%M-%S", &tm);
  return buf;
}

bool has_suffix_token(const std::string& name, const char* token) {
  return name.find(token) != std::string::npos;
}

}  // namespace

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

std::vector<std::string> CrashReport::parse_frames(const std::string& log) {
  std::vector<std::string> frames;
  size_t pos = 0;
  while (pos < log.size() && frames.size() < kMaxFrames) {
    size_t eol = log.find('\n', pos);
    if (eol == std::string::npos) eol = log.size();
    const std::string line = trim(log.substr(pos, eol - pos));
    pos = eol + 1;

    // "#<n> 0x<addr> in <function> ..." or "#<n> 0x<addr> (<module>+0x..)"
    if (line.size() < 2 || line[0] != '#' || !std::isdigit(static_cast<unsigned char>(line[1]))) {
      continue;
    }
    const auto sp = line.find(' ');
    if (sp == std::string::npos) continue;
    const std::string index = line.substr(1, sp - 1);
    if (!std::all_of(index.begin(), index.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
      continue;
    }
    // A second "#0" starts another stack (allocation / free site).
    if (index == "0" && !frames.empty()) break;

    const std::string rest = trim(line.substr(sp + 1));
    if (rest.rfind("0x", 0) != 0) continue;
    const auto in_pos = rest.find(" in ");
    std::string fn = in_pos == std::string::npos ? frame_module(rest)
                                                 : frame_function(rest.substr(in_pos + 4));
    if (fn.empty()) fn = "??";
    frames.push_back(fn);
  }
  return frames;
}

std::optional<std::string> CrashReport::find_assertion(const std::string& log) {
  size_t pos = 0;
  while (pos < log.size()) {
    size_t eol = log.find('\n', pos);
    if (eol == std::string::npos) eol = log.size();
    const std::string line = trim(log.substr(pos, eol - pos));
    pos = eol + 1;

    // Gecko: "Assertion failure: cond (msg), at file.cpp:12"
    const auto gecko = line.find("Assertion failure: ");
    if (gecko != std::string::npos) {
      std::string msg = line.substr(gecko + 19);
      const auto at = msg.rfind(", at ");
      if (at != std::string::npos) msg = msg.substr(0, at);
      return "Assertion failure: " + trim(msg);
    }
    // glibc: "prog: file.c:12: func: Assertion `cond' failed."
    const auto glibc = line.find("Assertion `");
    if (glibc != std::string::npos) {
      std::string msg = line.substr(glibc + 10);
      const auto failed = msg.rfind(" failed.");
      if (failed != std::string::npos) msg = msg.substr(0, failed);
      return "Assertion failure: " + trim(msg);
    }
  }
  return std::nullopt;
}

bool CrashReport::is_sanitizer_log(const fs::path& file, const std::string& content) {
  const std::string name = file.filename().string();
  if (has_suffix_token(name, "asan") || has_suffix_token(name, "ubsan") ||
      has_suffix_token(name, "tsan") || has_suffix_token(name, "msan")) {
    return true;
  }
  return content.find("ERROR: AddressSanitizer") != std::string::npos ||
         content.find("ERROR: ThreadSanitizer") != std::string::npos ||
         content.find("ERROR: MemorySanitizer") != std::string::npos ||
         content.find("runtime error: ") != std::string::npos;
}

// ---------------------------------------------------------------------------
// CrashReport
// ---------------------------------------------------------------------------

ReportPtr CrashReport::from_path(const fs::path& log_dir, const std::string& binary,
                                 const fs::path& report_root) {
  std::error_code ec;
  if (!fs::is_directory(log_dir, ec)) {
    log(LogLevel::error, "report: log directory missing: " + log_dir.string());
    return nullptr;
  }
  const fs::path root = report_root.empty() ? temp_root() : report_root;
  const fs::path dst = make_temp_dir(root, "report_", ec);
  if (ec) {
    log(LogLevel::error, "report: cannot create report directory: " + ec.message());
    return nullptr;
  }

  ReportPtr report(new CrashReport());
  auto* self = static_cast<CrashReport*>(report.get());
  self->path_ = dst;
  self->binary_ = binary;

  // Take ownership of the logs; the caller's directory is left empty.
  std::vector<fs::path> entries;
  for (const auto& entry : fs::directory_iterator(log_dir, ec)) entries.push_back(entry.path());
  std::vector<fs::path> files;
  for (const auto& entry : entries) {
    const fs::path target = dst / entry.filename();
    if (!move_path(entry, target, ec)) {
      log(LogLevel::warn, "report: cannot move " + entry.string() + ": " + ec.message());
      continue;
    }
    if (fs::is_regular_file(target, ec)) files.push_back(target);
  }
  std::sort(files.begin(), files.end());

  // Pick the log that describes the crash.
  fs::path selected;
  std::string selected_text;
  for (const auto& f : files) {
    const std::string text = read_file(f);
    if (is_sanitizer_log(f, text)) {
      selected = f;
      selected_text = text;
      break;
    }
  }
  if (selected.empty()) {
    for (const auto& f : files) {
      if (f.filename() == kStderrLog) {
        selected = f;
        selected_text = read_file(f);
      }
    }
  }

  std::optional<std::string> assertion;
  for (const auto& f : files) {
    const auto name = f.filename();
    if (f == selected || name == kStderrLog || name == kStdoutLog) {
      assertion = find_assertion(f == selected ? selected_text : read_file(f));
      if (assertion) break;
    }
  }

  self->crash_log_ = selected;
  self->frames_ = parse_frames(selected_text);
  if (assertion) {
    self->short_signature_ = *assertion;
  } else if (!self->frames_.empty()) {
    self->short_signature_ = "[@ " + self->frames_.front() + "]";
  } else {
    self->short_signature_ = kNoSignature;
  }

  if (self->frames_.empty()) {
    self->major_ = kNoStack;
    self->minor_ = "0";
  } else {
    const size_t depth = std::min(kMajorDepth, self->frames_.size());
    const std::vector<std::string> top(self->frames_.begin(), self->frames_.begin() + depth);
    self->major_ = hash_frames("major:", top);
    self->minor_ = hash_frames("minor:", self->frames_);
  }

  std::vector<std::string> crash_input{self->short_signature_};
  const size_t depth = std::min(kMajorDepth, self->frames_.size());
  crash_input.insert(crash_input.end(), self->frames_.begin(), self->frames_.begin() + depth);
  self->crash_hash_ = hash_frames("crash:", crash_input).substr(0, 16);

  self->prefix_ = self->minor_.substr(0, 8) + "_" + timestamp_now();
  log(LogLevel::debug, "report: " + self->short_signature_ + " major=" + self->major_.substr(0, 8) +
                           " log=" + selected.filename().string());
  return report;
}

void CrashReport::cleanup() noexcept {
  if (released_) return;
  released_ = true;
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    log(LogLevel::debug, "report: cleanup of " + path_.string() + " failed: " + ec.message());
  }
}

// ---------------------------------------------------------------------------
// CrashSignature
// ---------------------------------------------------------------------------

bool CrashSignature::matches(const Report& report) const {
  if (report.short_signature() != symptom) return false;
  return !major || *major == report.major();
}

std::string CrashSignature::to_json() const {
  jsonlite::Object o;
  o["symptom"] = jsonlite::Value{symptom};
  if (major) o["major"] = jsonlite::Value{*major};
  o["version"] = jsonlite::Value{static_cast<std::uint64_t>(version::SIGNATURE_FORMAT_VERSION)};
  return jsonlite::to_json(o);
}

CrashSignature CrashSignature::from_report(const Report& report) {
  return CrashSignature{report.short_signature(), std::nullopt};
}

std::optional<CrashSignature> CrashSignature::load(const fs::path& path, std::string* error) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    if (error) *error = "signature file not found: " + path.string();
    return std::nullopt;
  }
  std::optional<jsonlite::JsonError> json_err;
  const auto obj = jsonlite::parse(read_file(path), &json_err);
  if (json_err) {
    if (error) *error = path.string() + ": " + json_err->message;
    return std::nullopt;
  }
  if (jsonlite::get_u64(obj, "version", version::SIGNATURE_FORMAT_VERSION) >
      version::SIGNATURE_FORMAT_VERSION) {
    if (error) *error = path.string() + ": unsupported version";
    return std::nullopt;
  }
  CrashSignature sig;
  sig.symptom = jsonlite::get_string(obj, "symptom");
  if (sig.symptom.empty()) {
    if (error) *error = path.string() + ": missing 'symptom'";
    return std::nullopt;
  }
  const std::string major = jsonlite::get_string(obj, "major");
  if (!major.empty()) sig.major = major;
  return sig;
}

bool SignatureState::bootstrap(CrashSignature sig) {
  if (kind_ != Kind::unset) return false;
  kind_ = Kind::bootstrapped;
  signature_ = std::move(sig);
  return true;
}

}  // namespace reprise
