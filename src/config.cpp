#include "reprise/config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>

namespace reprise {

namespace {

bool parse_u64(const std::string& s, std::uint64_t* out) {
  if (s.empty() || !std::all_of(s.begin(), s.end(),
                                [](unsigned char c) { return std::isdigit(c); })) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0') return false;
  *out = v;
  return true;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

ReplayConfig ReplayConfig::from_env() {
  ReplayConfig c;
  if (const char* e = std::getenv("REPRISE_TMP"); e && e[0]) c.tmp_dir = e;
  if (const char* e = std::getenv("REPRISE_STATUS_DIR"); e && e[0]) c.status_dir = e;
  if (const char* e = std::getenv("REPRISE_LOG_LEVEL"); e && e[0]) {
    LogLevel level;
    if (parse_log_level(e, &level)) c.log_level = level;
  }
  return c;
}

std::string replay_usage() {
  return "usage: reprise replay [options] <binary> <testcase> [<testcase> ...]\n"
         "\n"
         "options:\n"
         "  --sig FILE            signature file to reproduce\n"
         "  --any-crash           any crash counts as a result\n"
         "  --repeat N            iterations to perform (default: 1)\n"
         "  --min-crashes N       results required for success (default: 1)\n"
         "  --no-harness          load each test case directly, relaunching between tests\n"
         "  --harness FILE        custom harness page\n"
         "  --ignore LIST         comma separated issues to ignore: log-limit,memory,timeout\n"
         "                        (default: log-limit,timeout)\n"
         "  --launch-timeout S    seconds to wait for launch (default: 300)\n"
         "  --time-limit S        per test time limit (default: 30)\n"
         "  --timeout S           iteration timeout (default: time-limit + 10)\n"
         "  --log-limit MB        target log size limit (default: no limit)\n"
         "  -m, --memory MB       target memory limit (default: no limit)\n"
         "  --relaunch N          iterations before relaunch (default: 1000)\n"
         "  --port N              harness port (default: ephemeral)\n"
         "  --arg ARG             extra argument for the binary (repeatable)\n"
         "  -o, --logs DIR        export results into DIR\n"
         "  --status-dir DIR      status record directory\n"
         "  --tmp-dir DIR         temporary data root\n"
         "  --log-level LEVEL     CRIT, ERROR, WARN, INFO, DEBUG (default: INFO)\n";
}

bool parse_replay_args(const std::vector<std::string>& args, ReplayConfig* config,
                       std::string* error) {
  auto fail = [&](const std::string& msg) {
    if (error) *error = msg;
    return false;
  };
  std::vector<std::string> positional;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (a.rfind("-", 0) != 0 || a == "-") {
      positional.push_back(a);
      continue;
    }

    // Boolean flags.
    if (a == "--any-crash") {
      config->any_crash = true;
      continue;
    }
    if (a == "--no-harness") {
      config->use_harness = false;
      continue;
    }

    if (i + 1 >= args.size()) return fail("missing value for " + a);
    const std::string& v = args[++i];
    std::uint64_t n = 0;

    if (a == "--sig") {
      config->signature_path = v;
    } else if (a == "--harness") {
      config->harness_path = v;
    } else if (a == "--arg") {
      config->binary_args.push_back(v);
    } else if (a == "-o" || a == "--logs") {
      config->output_dir = v;
    } else if (a == "--status-dir") {
      config->status_dir = v;
    } else if (a == "--tmp-dir") {
      config->tmp_dir = v;
    } else if (a == "--log-level") {
      if (!parse_log_level(v, &config->log_level)) return fail("invalid log level: " + v);
    } else if (a == "--ignore") {
      config->ignore.clear();
      size_t pos = 0;
      while (pos <= v.size()) {
        size_t end = v.find(',', pos);
        if (end == std::string::npos) end = v.size();
        if (end > pos) config->ignore.insert(lower(v.substr(pos, end - pos)));
        pos = end + 1;
      }
    } else if (!parse_u64(v, &n)) {
      return fail("invalid value for " + a + ": " + v);
    } else if (a == "--repeat") {
      config->repeat = static_cast<std::uint32_t>(std::min<std::uint64_t>(n, UINT32_MAX));
    } else if (a == "--min-crashes") {
      config->min_results = static_cast<std::uint32_t>(std::min<std::uint64_t>(n, UINT32_MAX));
    } else if (a == "--launch-timeout") {
      config->launch_timeout_s = n;
    } else if (a == "--time-limit") {
      config->time_limit_s = n;
    } else if (a == "--timeout") {
      config->timeout_s = n;
    } else if (a == "--log-limit") {
      config->log_limit_mb = n;
    } else if (a == "-m" || a == "--memory") {
      config->memory_mb = n;
    } else if (a == "--relaunch") {
      config->relaunch = static_cast<std::uint32_t>(std::min<std::uint64_t>(n, UINT32_MAX));
    } else if (a == "--port") {
      if (n > 65535) return fail("invalid port: " + v);
      config->port = static_cast<std::uint16_t>(n);
    } else {
      return fail("unknown option: " + a);
    }
  }

  if (!positional.empty()) {
    config->binary = positional.front();
    config->inputs.assign(positional.begin() + 1, positional.end());
  }
  return true;
}

ConfigValidationResult validate_config(const ReplayConfig& c) {
  namespace fs = std::filesystem;
  ConfigValidationResult r;
  std::error_code ec;

  if (c.binary.empty()) {
    r.errors.push_back("binary: required");
  } else if (!fs::is_regular_file(c.binary, ec)) {
    r.errors.push_back("binary: file not found: " + c.binary);
  }
  if (c.inputs.empty()) r.errors.push_back("testcase: at least one required");
  for (const auto& in : c.inputs) {
    if (!fs::exists(in, ec)) {
      r.errors.push_back("testcase: does not exist: " + in);
    } else if (fs::is_directory(in, ec) && fs::is_empty(in, ec)) {
      r.errors.push_back("testcase: directory is empty: " + in);
    }
  }

  if (c.repeat < 1) r.errors.push_back("--repeat must be >= 1");
  if (c.min_results < 1) r.errors.push_back("--min-crashes must be >= 1");
  if (c.min_results > c.repeat) r.errors.push_back("--min-crashes must be <= --repeat");
  if (c.relaunch < 1) r.errors.push_back("--relaunch must be >= 1");
  if (c.time_limit_s < 1) r.errors.push_back("--time-limit must be at least 1");
  if (c.timeout_s && *c.timeout_s < 1) r.errors.push_back("--timeout must be at least 1");
  if (c.timeout_s && *c.timeout_s < c.time_limit_s) {
    r.warnings.push_back("--timeout is shorter than --time-limit");
  }
  if (c.launch_timeout_s < 1) r.errors.push_back("--launch-timeout must be at least 1");

  for (const auto& issue : c.ignore) {
    if (!ignorable_issues().count(issue)) r.errors.push_back("unrecognized ignore value: " + issue);
  }

  if (!c.signature_path.empty()) {
    if (c.any_crash) r.errors.push_back("--sig and --any-crash are mutually exclusive");
    if (!fs::is_regular_file(c.signature_path, ec)) {
      r.errors.push_back("--sig: file not found: " + c.signature_path);
    }
  }
  if (!c.harness_path.empty()) {
    if (!c.use_harness) r.errors.push_back("--harness and --no-harness are mutually exclusive");
    if (!fs::is_regular_file(c.harness_path, ec)) {
      r.errors.push_back("--harness: file not found: " + c.harness_path);
    }
  }
  if (!c.output_dir.empty() && fs::exists(c.output_dir, ec) && !fs::is_directory(c.output_dir, ec)) {
    r.errors.push_back("--logs: not a directory: " + c.output_dir);
  }
  r.ok = r.errors.empty();
  return r;
}

}  // namespace reprise
