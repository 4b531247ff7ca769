#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "reprise/config.hpp"
#include "reprise/fsutil.hpp"
#include "reprise/hash.hpp"
#include "reprise/jsonlite.hpp"
#include "reprise/observability.hpp"
#include "reprise/process.hpp"
#include "reprise/process_target.hpp"
#include "reprise/replay.hpp"
#include "reprise/report.hpp"
#include "reprise/server.hpp"
#include "reprise/status.hpp"
#include "reprise/testcase.hpp"
#include "reprise/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() /
                     ("reprise_tests_" + name + "_" + std::to_string(::getpid()));
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

size_t count_entries(const fs::path& dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return 0;
  return static_cast<size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
}

reprise::TestCase simple_testcase(const std::string& landing = "index.html") {
  reprise::TestCase tc(landing);
  expect(tc.add_from_data("<html>" + landing + "</html>", landing), "add landing page");
  return tc;
}

// ---------------------------------------------------------------------------
// Fakes
// ---------------------------------------------------------------------------

// Counts Report::cleanup() calls per report id.
struct ReleaseLog {
  std::map<int, int> cleanups;
  int created{0};
};

class FakeReport final : public reprise::Report {
 public:
  FakeReport(int id, const std::string& signature, const fs::path& root, ReleaseLog* log,
             const std::string& prefix = "deadbeef_2024-01-01_00-00-00")
      : id_(id), signature_(signature), prefix_(prefix), log_(log) {
    std::error_code ec;
    path_ = reprise::make_temp_dir(root, "fake_report_", ec);
    expect(!ec, "fake report directory");
    reprise::write_file(path_ / "log_stderr.txt", signature + "\n");
    major_ = "major-" + signature;
    minor_ = "minor-" + signature;
    crash_hash_ = "hash-" + signature;
    ++log_->created;
    log_->cleanups[id_] = 0;
  }

  const fs::path& path() const override { return path_; }
  const std::string& prefix() const override { return prefix_; }
  const std::string& short_signature() const override { return signature_; }
  const std::string& major() const override { return major_; }
  const std::string& minor() const override { return minor_; }
  const std::string& crash_hash() const override { return crash_hash_; }

  void cleanup() noexcept override {
    ++log_->cleanups[id_];
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

 private:
  int id_;
  fs::path path_;
  std::string signature_;
  std::string prefix_;
  std::string major_;
  std::string minor_;
  std::string crash_hash_;
  ReleaseLog* log_;
};

// Hands out reports with scripted signatures; the last one repeats.
struct FakeReportFactory {
  std::vector<std::string> signatures{"[@ crash]"};
  size_t next{0};
  fs::path root;
  ReleaseLog* log{nullptr};
  bool saw_logs{true};

  reprise::ReportFactory fn() {
    return [this](const fs::path& log_dir, const std::string&) -> reprise::ReportPtr {
      if (!fs::exists(log_dir / "log_stderr.txt")) saw_logs = false;
      const std::string sig = signatures[std::min(next, signatures.size() - 1)];
      const int id = static_cast<int>(next++);
      return reprise::ReportPtr(new FakeReport(id, sig, root, log));
    };
  }
};

class FakeTarget final : public reprise::Target {
 public:
  std::vector<reprise::FailureResult> results;  // per detect_failure(); last repeats
  int fail_launch_at{0};                        // 1-based launch that throws
  int launches{0};
  int closes{0};
  int relaunch_checks{0};
  int detects{0};
  int saves{0};
  bool save_ok{true};
  bool forced{false};  // close() had to kill the process
  std::vector<std::string> locations;

  void launch(const std::string& location, const reprise::EnvMap&) override {
    ++launches;
    locations.push_back(location);
    if (launches == fail_launch_at) throw reprise::TargetLaunchError("fake launch failure");
    closed_ = false;
  }
  reprise::FailureResult detect_failure(const reprise::IgnoreSet&) override {
    const size_t i = static_cast<size_t>(detects++);
    if (results.empty()) return reprise::FailureResult::none;
    return results[std::min(i, results.size() - 1)];
  }
  void close() override {
    ++closes;
    closed_ = true;
  }
  void check_relaunch() override { ++relaunch_checks; }
  bool save_logs(const fs::path& dst) override {
    ++saves;
    if (!save_ok) return false;
    fs::create_directories(dst);
    return reprise::write_file(dst / "log_stderr.txt", "fake log\n");
  }
  bool closed() const override { return closed_; }
  bool forced_close() const override { return forced && closed_; }
  const std::string& binary() const override { return binary_; }
  void cleanup() noexcept override { closed_ = true; }

 private:
  bool closed_{true};
  std::string binary_{"fake-browser"};
};

class FakeServer final : public reprise::Server {
 public:
  std::vector<reprise::ServeStatus> statuses;  // per serve_path(); last repeats
  int serves{0};
  bool saw_test_info{true};
  std::vector<std::string> redirect_targets;

  reprise::ServeResult serve_path(const fs::path& path, const std::vector<std::string>&,
                                  const reprise::ServerMap& server_map) override {
    const size_t i = static_cast<size_t>(serves++);
    if (!fs::exists(path / reprise::TestCase::kInfoFile)) saw_test_info = false;
    const auto* r = server_map.redirect(reprise::ReplayManager::kNextTestUrl);
    if (!r) r = server_map.redirect(reprise::ReplayManager::kCurrentTestUrl);
    if (r) redirect_targets.push_back(r->target);

    reprise::ServeResult result;
    result.status = statuses.empty() ? reprise::ServeStatus::all_served
                                     : statuses[std::min(i, statuses.size() - 1)];
    if (result.status != reprise::ServeStatus::none_served) result.served.push_back("index.html");
    return result;
  }
  std::uint16_t port() const override { return 8000; }
};

struct ReplayFixture {
  fs::path root;
  ReleaseLog releases;
  FakeReportFactory factory;
  FakeTarget target;
  FakeServer server;

  explicit ReplayFixture(const std::string& name) : root(fresh_dir(name)) {
    factory.root = root / "tmp";
    factory.log = &releases;
    fs::create_directories(factory.root);
  }
  ~ReplayFixture() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  reprise::ReplayOptions options() {
    reprise::ReplayOptions o;
    o.tmp_root = root / "tmp";
    o.report_factory = factory.fn();
    return o;
  }
};

// ============================================================================
// Hashing & JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(reprise::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(reprise::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_frame_hash_separation() {
  const auto a = reprise::hash_frames("major:", {"ab", "c"});
  const auto b = reprise::hash_frames("major:", {"a", "bc"});
  const auto c = reprise::hash_frames("minor:", {"ab", "c"});
  expect(a.size() == 64, "frame hash is 64 hex chars");
  expect(a != b, "frame boundaries change the hash");
  expect(a != c, "domains change the hash");
  expect(a == reprise::hash_frames("major:", {"ab", "c"}), "frame hash is deterministic");
}

void test_json_duplicate_key_rejected() {
  std::optional<reprise::jsonlite::JsonError> err;
  reprise::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value(), "duplicate key must be rejected");

  err.reset();
  const auto obj = reprise::jsonlite::parse("{\"s\":\"x\\\"y\",\"n\":42,\"m\":{\"k\":\"v\"}}", &err);
  expect(!err, "valid document parses");
  expect(reprise::jsonlite::get_string(obj, "s") == "x\"y", "escaped string");
  expect(reprise::jsonlite::get_u64(obj, "n") == 42, "integer");
  expect(reprise::jsonlite::get_string_map(obj, "m").at("k") == "v", "nested map");
}

void test_json_unicode_escapes() {
  std::optional<reprise::jsonlite::JsonError> err;
  const auto obj = reprise::jsonlite::parse(
      "{\"a\":\"caf\\u00e9\",\"b\":\"\\u20ac\",\"c\":\"\\ud83d\\ude00\",\"d\":\"\\ud800x\"}", &err);
  expect(!err, "escaped document parses");
  expect(reprise::jsonlite::get_string(obj, "a") == "caf\xc3\xa9", "two-byte code point");
  expect(reprise::jsonlite::get_string(obj, "b") == "\xe2\x82\xac", "three-byte code point");
  expect(reprise::jsonlite::get_string(obj, "c") == "\xf0\x9f\x98\x80", "surrogate pair");
  expect(reprise::jsonlite::get_string(obj, "d") == "\xef\xbf\xbd" "x", "lone surrogate replaced");

  err.reset();
  reprise::jsonlite::parse("{\"a\":\"\\u12g4\"}", &err);
  expect(err.has_value(), "invalid hex digits rejected");
}

// ============================================================================
// Test cases
// ============================================================================

void test_testcase_dump_and_load() {
  const auto dir = fresh_dir("testcase");
  reprise::TestCase tc("index.html", "adapter-x");
  expect(tc.add_from_data("<html></html>", "index.html"), "landing");
  expect(tc.add_from_data("var x;", "js/helper.js"), "nested file");
  expect(tc.add_from_data("opt", "optional.bin", false), "optional file");
  tc.set_env("MOZ_FOO", "1");
  expect(tc.dump(dir / "dump"), "dump succeeds");
  expect(fs::exists(dir / "dump" / "js" / "helper.js"), "nested file written");
  expect(fs::exists(dir / "dump" / reprise::TestCase::kInfoFile), "test_info.json written");

  std::string error;
  auto loaded = reprise::TestCase::load(dir / "dump", &error);
  expect(loaded.has_value(), "load succeeds: " + error);
  expect(loaded->landing_page() == "index.html", "landing page survives");
  expect(loaded->adapter_name() == "adapter-x", "adapter survives");
  expect(loaded->env_vars().at("MOZ_FOO") == "1", "env survives");
  expect(loaded->files().size() == 3, "all files loaded");
  expect(loaded->optional() == std::vector<std::string>{"optional.bin"}, "optional set survives");
  fs::remove_all(dir);
}

void test_testcase_rejects_bad_names() {
  reprise::TestCase tc("index.html");
  std::string error;
  expect(!tc.add_from_data("x", "../escape.html", true, &error), "parent traversal rejected");
  expect(!tc.add_from_data("x", "/abs.html", true, &error), "absolute path rejected");
  expect(!tc.add_from_data("x", reprise::TestCase::kInfoFile, true, &error), "info file name reserved");
  expect(tc.add_from_data("x", "index.html", false), "landing page added");
  expect(!tc.add_from_data("x", "index.html"), "duplicate rejected");
  expect(tc.optional().empty(), "landing page is always required");
}

void test_testcase_load_single_file() {
  const auto dir = fresh_dir("testcase_single");
  reprise::write_file(dir / "crash.html", "<html>boom</html>");
  auto tc = reprise::TestCase::load(dir / "crash.html");
  expect(tc.has_value(), "single file loads");
  expect(tc->landing_page() == "crash.html", "file name is the landing page");
  expect(tc->files().front().data == "<html>boom</html>", "contents loaded");

  std::string error;
  expect(!reprise::TestCase::load(dir / "missing", &error), "missing input fails");
  expect(!error.empty(), "error message set");
  fs::remove_all(dir);
}

// ============================================================================
// Crash reports & signatures
// ============================================================================

const char* kAsanLog =
    "==123==ERROR: AddressSanitizer: heap-use-after-free on address 0x602000000010\n"
    "READ of size 4 at 0x602000000010 thread T0\n"
    "    #0 0x4c3a2b in nsFoo::Bar(int, char const*) /src/foo.cpp:12:3\n"
    "    #1 0x4c3b00 in main /src/main.cpp:5:1\n"
    "    #2 0x7f0000 (/lib/x86_64-linux-gnu/libc.so.6+0x2724a)\n"
    "\n"
    "freed by thread T0 here:\n"
    "    #0 0x4b0000 in free\n";

void test_parse_frames() {
  const auto frames = reprise::CrashReport::parse_frames(kAsanLog);
  expect(frames.size() == 3, "first stack only");
  expect(frames[0] == "nsFoo::Bar", "parameter list stripped");
  expect(frames[1] == "main", "plain function");
  expect(frames[2] == "libc.so.6", "module frame");
}

void test_find_assertion() {
  auto a = reprise::CrashReport::find_assertion(
      "noise\nAssertion failure: aFoo != nullptr (must be set), at /src/x.cpp:10\n");
  expect(a && *a == "Assertion failure: aFoo != nullptr (must be set)", "gecko assertion");
  auto b = reprise::CrashReport::find_assertion("prog: x.c:12: main: Assertion `x > 0' failed.\n");
  expect(b && *b == "Assertion failure: `x > 0'", "glibc assertion");
  expect(!reprise::CrashReport::find_assertion("all good\n"), "no assertion");
}

void test_crash_report_from_sanitizer_log() {
  const auto dir = fresh_dir("crash_report");
  fs::create_directories(dir / "logs");
  reprise::write_file(dir / "logs" / "asan.123", kAsanLog);
  reprise::write_file(dir / "logs" / "log_stderr.txt", "stderr noise\n");

  auto report = reprise::CrashReport::from_path(dir / "logs", "firefox", dir / "reports");
  expect(report != nullptr, "report built");
  expect(report->short_signature() == "[@ nsFoo::Bar]", "signature from top frame");
  expect(report->major() == reprise::hash_frames("major:", {"nsFoo::Bar", "main", "libc.so.6"}),
         "major hash over top frames");
  expect(report->minor() == reprise::hash_frames("minor:", {"nsFoo::Bar", "main", "libc.so.6"}),
         "minor hash over all frames");
  expect(report->crash_hash().size() == 16, "crash hash is 16 hex chars");
  expect(report->prefix().rfind(report->minor().substr(0, 8) + "_", 0) == 0, "prefix");
  expect(count_entries(dir / "logs") == 0, "logs moved out of the source directory");
  expect(fs::exists(report->path() / "asan.123"), "logs owned by the report");

  const fs::path owned = report->path();
  report->cleanup();
  report->cleanup();
  expect(!fs::exists(owned), "cleanup removes the report directory");
  fs::remove_all(dir);
}

void test_crash_report_without_stack() {
  const auto dir = fresh_dir("crash_report_empty");
  fs::create_directories(dir / "logs");
  reprise::write_file(dir / "logs" / "log_stderr.txt", "nothing useful\n");
  auto report = reprise::CrashReport::from_path(dir / "logs", "firefox", dir / "reports");
  expect(report != nullptr, "report built");
  expect(report->short_signature() == reprise::CrashReport::kNoSignature, "no signature");
  expect(report->major() == reprise::CrashReport::kNoStack, "major default");
  expect(report->minor() == "0", "minor default");
  report.reset();
  expect(count_entries(dir / "reports") == 0, "dropping the handle releases the report");
  fs::remove_all(dir);
}

void test_signature_match_and_load() {
  ReleaseLog releases;
  const auto dir = fresh_dir("signature");
  FakeReport report(0, "[@ crash]", dir, &releases);

  reprise::CrashSignature sig{"[@ crash]", std::nullopt};
  expect(sig.matches(report), "symptom match");
  sig.major = "major-other";
  expect(!sig.matches(report), "major constraint");
  sig.major = "major-[@ crash]";
  expect(sig.matches(report), "major match");

  reprise::write_file(dir / "sig.json", sig.to_json());
  auto loaded = reprise::CrashSignature::load(dir / "sig.json");
  expect(loaded && loaded->symptom == "[@ crash]" && loaded->major == sig.major, "signature loads");
  reprise::write_file(dir / "bad.json", "{\"major\":\"x\"}");
  std::string error;
  expect(!reprise::CrashSignature::load(dir / "bad.json", &error), "symptom required");
  report.cleanup();
  fs::remove_all(dir);
}

void test_signature_state_transitions_once() {
  reprise::SignatureState state;
  expect(!state.has_signature(), "starts unset");
  expect(state.bootstrap({"A", std::nullopt}), "first bootstrap adopts");
  expect(!state.bootstrap({"B", std::nullopt}), "second bootstrap ignored");
  expect(state.signature().symptom == "A", "first signature kept");
  expect(state.kind() == reprise::SignatureState::Kind::bootstrapped, "bootstrapped");

  reprise::SignatureState fixed(reprise::CrashSignature{"X", std::nullopt});
  expect(!fixed.bootstrap({"Y", std::nullopt}), "explicit never bootstraps");
  expect(fixed.kind() == reprise::SignatureState::Kind::explicit_signature, "explicit");
}

// ============================================================================
// Status
// ============================================================================

void test_status_report_rate_limit_and_cleanup() {
  const auto dir = fresh_dir("status");
  {
    reprise::Status status(dir, 60000);
    status.iteration = 5;
    status.ignored = 1;
    status.count_result("A", "[@ crash]");
    expect(status.report(), "first report writes");
    expect(!status.report(), "second report within the interval is skipped");
    expect(status.report(true), "forced report writes");

    const auto records = reprise::load_status_records(dir);
    expect(records.size() == 1, "one record");
    expect(records[0].pid == static_cast<std::int64_t>(::getpid()), "record keyed by pid");
    expect(records[0].iteration == 5 && records[0].ignored == 1 && records[0].results == 1,
           "counters persisted");
    expect(records[0].result_counts.at("A") == 1, "per-signature counts persisted");

    status.cleanup();
    status.cleanup();
    expect(reprise::load_status_records(dir).empty(), "cleanup removes the record");
    expect(!status.report(true), "no reports after cleanup");
  }
  fs::remove_all(dir);
}

// ============================================================================
// Harness server
// ============================================================================

std::string http_get(std::uint16_t port, const std::string& path) {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(port);
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    ::close(fd);
    return {};
  }
  const std::string req = "GET " + path + " HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n";
  (void)::send(fd, req.data(), req.size(), 0);
  std::string out;
  char buf[512];
  ssize_t n;
  while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) out.append(buf, static_cast<size_t>(n));
  ::close(fd);
  return out;
}

void test_server_map_and_url_decoding() {
  reprise::ServerMap map;
  map.set_redirect("repro_next_test", "index.html");
  map.set_redirect("optional_redirect", "other.html", false);
  map.set_dynamic_response("repro_harness", [] { return std::string("H"); });
  expect(map.redirect("repro_next_test")->target == "index.html", "redirect lookup");
  expect(map.required_redirects() == std::vector<std::string>{"repro_next_test"}, "required only");
  std::string body, mime;
  expect(map.dynamic("repro_harness", &body, &mime) && body == "H" && mime == "text/html",
         "dynamic lookup");
  bool threw = false;
  try {
    map.set_redirect("/bad", "x");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  expect(threw, "leading slash rejected");

  std::string out;
  expect(reprise::decode_url_path("/a%20b.html?x=1", &out) && out == "a b.html", "decode");
  expect(!reprise::decode_url_path("/bad%2", &out), "truncated escape rejected");
}

void test_harness_server_serves_required_files() {
  const auto dir = fresh_dir("server");
  reprise::write_file(dir / "index.html", "<html>landing</html>");
  reprise::write_file(dir / "extra.js", "var x;");
  reprise::write_file(dir / reprise::TestCase::kInfoFile, "{}");

  reprise::HarnessServerOptions options;
  options.timeout_ms = 10000;
  reprise::HarnessServer server(options);
  std::string error;
  expect(server.start(&error), "server starts: " + error);
  const auto port = server.port();
  expect(port != 0, "ephemeral port assigned");

  reprise::ServerMap map;
  map.set_redirect(reprise::ReplayManager::kNextTestUrl, "index.html");
  map.set_dynamic_response(reprise::ReplayManager::kHarnessUrl, [] { return std::string("HARNESS"); });

  std::vector<std::string> responses;
  std::thread client([&] {
    responses.push_back(http_get(port, "/repro_harness"));
    responses.push_back(http_get(port, "/repro_next_test"));
    responses.push_back(http_get(port, "/missing.html"));
    responses.push_back(http_get(port, "/index.html"));
    responses.push_back(http_get(port, "/extra.js"));
  });
  const auto result = server.serve_path(dir, {}, map);
  client.join();

  expect(result.status == reprise::ServeStatus::all_served, "all served");
  expect(result.served == std::vector<std::string>({"index.html", "extra.js"}), "served files");
  expect(responses.size() == 5, "all requests answered");
  expect(responses[0].find("HARNESS") != std::string::npos, "dynamic response");
  expect(responses[1].find("302") != std::string::npos &&
             responses[1].find("Location: /index.html") != std::string::npos,
         "redirect response");
  expect(responses[2].find("404") != std::string::npos, "missing file");
  expect(responses[3].find("<html>landing</html>") != std::string::npos, "file body");
  fs::remove_all(dir);
}

void test_harness_server_partial_and_timeout() {
  const auto dir = fresh_dir("server_partial");
  reprise::write_file(dir / "index.html", "<html></html>");
  reprise::write_file(dir / "extra.js", "var x;");
  reprise::write_file(dir / "optional.js", "var y;");

  reprise::HarnessServerOptions options;
  options.timeout_ms = 500;
  reprise::HarnessServer server(options);
  expect(server.start(), "server starts");
  const auto port = server.port();

  std::thread client([&] { http_get(port, "/index.html"); });
  auto result = server.serve_path(dir, {"optional.js"}, reprise::ServerMap());
  client.join();
  expect(result.status == reprise::ServeStatus::request_served, "partial delivery");

  result = server.serve_path(dir, {}, reprise::ServerMap());
  expect(result.status == reprise::ServeStatus::none_served, "nothing requested");

  options.timeout_ms = 60000;
  options.continue_check = [] { return false; };
  reprise::HarnessServer stopped(options);
  const auto started = std::chrono::steady_clock::now();
  result = stopped.serve_path(dir, {}, reprise::ServerMap());
  expect(result.status == reprise::ServeStatus::none_served, "continue_check stops serving");
  expect(std::chrono::steady_clock::now() - started < std::chrono::seconds(5),
         "continue_check returns promptly");
  fs::remove_all(dir);
}

// ============================================================================
// Process target
// ============================================================================

reprise::ProcessTargetOptions sh_target(const fs::path& root, const std::string& script) {
  reprise::ProcessTargetOptions o;
  o.binary = "/bin/sh";
  o.args = {"-c", script};
  o.launch_settle_ms = 200;
  o.launch_timeout_ms = 5000;
  o.time_limit_ms = 60000;
  o.log_root = root;
  return o;
}

void test_process_target_launch_and_close() {
  const auto root = fresh_dir("target_close");
  reprise::ProcessTarget target(sh_target(root, "sleep 10"));
  expect(target.closed(), "closed before launch");
  target.launch("http://127.0.0.1:1/repro_harness", {});
  expect(!target.closed(), "running after launch");
  expect(target.detect_failure({}) == reprise::FailureResult::none, "no failure while running");
  target.close();
  expect(target.closed() && target.forced_close(), "close terminates the process");
  target.cleanup();
  expect(count_entries(root) == 0, "cleanup removes the log directory");
  fs::remove_all(root);
}

void test_process_target_detects_crash() {
  const auto root = fresh_dir("target_crash");
  reprise::ProcessTarget target(sh_target(root, "echo boom >&2; sleep 1; exit 3"));
  target.launch("loc", {{"REPRISE_TEST_VAR", "1"}});
  std::this_thread::sleep_for(std::chrono::milliseconds(1500));
  expect(target.detect_failure({}) == reprise::FailureResult::failure, "non-zero exit is a failure");
  expect(target.closed() && !target.forced_close(), "exited on its own");
  expect(target.save_logs(root / "saved"), "logs saved");
  expect(reprise::read_file(root / "saved" / "log_stderr.txt").find("boom") != std::string::npos,
         "stderr captured");
  target.cleanup();
  fs::remove_all(root);
}

void test_process_target_launch_errors() {
  const auto root = fresh_dir("target_launch");
  reprise::ProcessTarget dies(sh_target(root, "exit 1"));
  bool threw = false;
  try {
    dies.launch("loc", {});
  } catch (const reprise::TargetLaunchError& e) {
    threw = e.code() == reprise::ErrorCode::launch_failed;
  }
  expect(threw, "exit during launch raises a launch error");
  expect(dies.closed(), "closed after a failed launch");

  auto options = sh_target(root, "");
  options.binary = (root / "does-not-exist").string();
  reprise::ProcessTarget missing(options);
  threw = false;
  try {
    missing.launch("loc", {});
  } catch (const reprise::TargetLaunchError& e) {
    threw = e.code() == reprise::ErrorCode::spawn_failed;
  }
  expect(threw, "missing binary raises a spawn error");
  dies.cleanup();
  missing.cleanup();
  fs::remove_all(root);
}

void test_process_target_time_limit() {
  const auto root = fresh_dir("target_timeout");
  auto options = sh_target(root, "sleep 10");
  options.time_limit_ms = 50;
  reprise::ProcessTarget target(options);
  target.launch("loc", {});
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  expect(target.detect_failure({"timeout"}) == reprise::FailureResult::ignored,
         "ignored timeout");
  expect(target.last_issue() == std::optional<std::string>("timeout"), "issue recorded");
  expect(target.closed(), "hung process closed");

  target.launch("loc", {});
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  expect(target.detect_failure({}) == reprise::FailureResult::failure, "timeout not ignored");
  target.cleanup();
  fs::remove_all(root);
}

void test_process_target_relaunch_countdown() {
  const auto root = fresh_dir("target_relaunch");
  auto options = sh_target(root, "sleep 10");
  options.relaunch = 2;
  reprise::ProcessTarget target(options);
  target.launch("loc", {});
  target.check_relaunch();
  expect(!target.closed(), "still running after one iteration");
  target.check_relaunch();
  expect(target.closed(), "closed when the countdown expires");
  target.cleanup();
  fs::remove_all(root);
}

void test_process_inherits_and_overrides_environment() {
  const auto root = fresh_dir("process_env");
  ::setenv("REPRISE_INHERITED_VAR", "from-parent", 1);
  reprise::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "echo \"$REPRISE_INHERITED_VAR/$REPRISE_OVERRIDE_VAR\""};
  spec.env = {{"REPRISE_OVERRIDE_VAR", "from-spec"}};
  spec.stdout_path = (root / "out.txt").string();
  reprise::Process process;
  std::string error;
  expect(process.start(spec, &error), "spawn: " + error);
  expect(process.wait_for(std::chrono::milliseconds(5000)), "child exits");
  expect(process.status_code() == 0, "clean exit");
  expect(reprise::read_file(root / "out.txt").find("from-parent/from-spec") != std::string::npos,
         "parent environment inherited and overridden");
  ::unsetenv("REPRISE_INHERITED_VAR");
  fs::remove_all(root);
}

void test_process_target_memory_limit() {
  const auto root = fresh_dir("target_memory");
  auto options = sh_target(root, "sleep 10");
  options.memory_limit_bytes = 1;  // any resident process is over the limit
  reprise::ProcessTarget target(options);
  target.launch("loc", {});
  expect(!target.closed(), "memory limit does not prevent startup");
  expect(target.detect_failure({"memory"}) == reprise::FailureResult::ignored,
         "ignored memory limit");
  expect(target.last_issue() == std::optional<std::string>("memory"), "issue recorded");
  expect(target.closed(), "process over the limit closed");

  target.launch("loc", {});
  expect(target.detect_failure({}) == reprise::FailureResult::failure, "memory limit not ignored");
  target.cleanup();
  fs::remove_all(root);
}

void test_sanitizer_env() {
  reprise::EnvMap env{{"ASAN_OPTIONS", "detect_leaks=1:log_path=/elsewhere"}};
  reprise::ProcessTarget::apply_sanitizer_env(env, "/logs");
  const auto& asan = env.at("ASAN_OPTIONS");
  expect(asan.find("detect_leaks=1") != std::string::npos, "existing options kept");
  expect(asan.find("log_path=/logs/asan") != std::string::npos, "log path redirected");
  expect(asan.find("/elsewhere") == std::string::npos, "old log path dropped");
  expect(env.count("UBSAN_OPTIONS") == 1, "ubsan configured");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_parse_and_validate() {
  const auto dir = fresh_dir("config");
  reprise::write_file(dir / "test.html", "<html></html>");

  reprise::ReplayConfig cfg;
  std::string error;
  expect(reprise::parse_replay_args({"--repeat", "5", "--min-crashes", "2", "--ignore",
                                     "Memory,timeout", "--no-harness", "/bin/sh",
                                     (dir / "test.html").string()},
                                    &cfg, &error),
         "parse: " + error);
  expect(cfg.repeat == 5 && cfg.min_results == 2, "counts parsed");
  expect(cfg.ignore == reprise::IgnoreSet({"memory", "timeout"}), "ignore list lowercased");
  expect(!cfg.use_harness, "harness disabled");
  expect(cfg.binary == "/bin/sh" && cfg.inputs.size() == 1, "positionals");
  expect(reprise::validate_config(cfg).ok, "valid config");

  cfg.min_results = 6;
  cfg.ignore.insert("bogus");
  const auto bad = reprise::validate_config(cfg);
  expect(!bad.ok && bad.errors.size() == 2, "all errors reported");

  reprise::ReplayConfig other;
  expect(!reprise::parse_replay_args({"--nope"}, &other, &error), "unknown option");
  expect(!reprise::parse_replay_args({"--repeat", "x"}, &other, &error), "bad number");
  expect(other.effective_timeout_s() == other.time_limit_s + 10, "default timeout");
  fs::remove_all(dir);
}

// ============================================================================
// Replay
// ============================================================================

int g_events_seen = 0;
void count_event(const reprise::ReplayEvent&) { ++g_events_seen; }

void test_replay_no_failure() {
  ReplayFixture fx("replay_none");
  reprise::ReplayManager replay({}, fx.server, fx.target, fx.options());
  expect(!replay.run({simple_testcase()}), "nothing reproduced");
  expect(replay.status()->iteration == 1, "one iteration by default");
  expect(replay.status()->results == 0, "no results");
  expect(replay.reports().empty() && replay.other_reports().empty(), "no evidence");
  expect(fx.target.closes >= 1, "target closed without a harness");
}

void test_replay_any_crash_stops_at_min_results() {
  ReplayFixture fx("replay_any_crash");
  fx.target.results = {reprise::FailureResult::failure};
  auto options = fx.options();
  options.any_crash = true;
  reprise::ReplayManager replay({}, fx.server, fx.target, options);
  expect(replay.run({simple_testcase()}, 10, 3), "reproduced");
  expect(replay.status()->results == 3, "results stop at min_results");
  expect(replay.status()->iteration == 3, "budget not exhausted");
  expect(replay.reports().size() == 1, "dedup by crash hash");
  expect(fx.releases.cleanups[1] == 1 && fx.releases.cleanups[2] == 1, "duplicates released");
  expect(fx.releases.cleanups[0] == 0, "exemplar kept");
  expect(fx.factory.saw_logs, "factory received saved logs");
}

void test_replay_early_exit_when_unreachable() {
  ReplayFixture fx("replay_unreachable");
  reprise::ReplayManager replay({}, fx.server, fx.target, fx.options());
  expect(!replay.run({simple_testcase()}, 4, 3), "not reproduced");
  expect(replay.status()->iteration == 2, "stopped once min_results became unreachable");
}

void test_replay_explicit_signature_classification() {
  ReplayFixture fx("replay_explicit");
  fx.target.results = {reprise::FailureResult::failure};
  fx.factory.signatures = {"A", "A", "B"};
  auto options = fx.options();
  options.signature = reprise::CrashSignature{"A", std::nullopt};
  reprise::ReplayManager replay({}, fx.server, fx.target, options);
  expect(!replay.run({simple_testcase()}, 3, 3), "not enough results");
  expect(replay.status()->results == 2, "two matches counted");

  const auto expected = replay.reports();
  const auto other = replay.other_reports();
  expect(expected.size() == 1 && expected.count("A"), "one expected exemplar");
  expect(other.size() == 1 && other.count("B"), "one other exemplar");
  expect(fx.releases.cleanups[1] == 1, "duplicate match released immediately");
  expect(fx.releases.cleanups[0] == 0 && fx.releases.cleanups[2] == 0, "kept reports alive");

  replay.cleanup();
  replay.cleanup();
  expect(replay.status() == nullptr, "status released");
  for (const auto& [id, n] : fx.releases.cleanups) {
    expect(n == 1, "report " + std::to_string(id) + " released exactly once");
  }
}

void test_replay_repeated_other_crashes_collapse() {
  ReplayFixture fx("replay_other");
  fx.target.results = {reprise::FailureResult::failure};
  fx.factory.signatures = {"B"};
  auto options = fx.options();
  options.signature = reprise::CrashSignature{"A", std::nullopt};
  reprise::ReplayManager replay({}, fx.server, fx.target, options);
  expect(!replay.run({simple_testcase()}, 4, 1), "never matches");
  expect(replay.status()->iteration == 4, "whole budget used");
  expect(replay.other_reports().size() == 1, "unrelated crashes collapse");
  expect(fx.releases.created == 4, "one report per failure");
}

void test_replay_take_reports_transfers_ownership() {
  ReplayFixture fx("replay_take");
  fx.target.results = {reprise::FailureResult::failure};
  fx.factory.signatures = {"A", "B"};
  auto options = fx.options();
  options.signature = reprise::CrashSignature{"A", std::nullopt};
  reprise::ReplayManager::ReportMap taken;
  {
    reprise::ReplayManager replay({}, fx.server, fx.target, options);
    replay.run({simple_testcase()}, 2, 2);
    taken = replay.take_reports();
    expect(taken.size() == 1 && taken.count("A"), "expected report transferred");
    expect(replay.reports().empty(), "manager no longer holds it");
    expect(replay.other_reports().count("B") == 1, "other set untouched");
  }
  expect(fx.releases.cleanups[0] == 0, "transferred report survives the manager");
  expect(fx.releases.cleanups[1] == 1, "other report released with the manager");
  taken.clear();
  expect(fx.releases.cleanups[0] == 1, "released by its new owner");
}

void test_replay_bootstrap_signature() {
  ReplayFixture fx("replay_bootstrap");
  fx.target.results = {reprise::FailureResult::failure};
  fx.factory.signatures = {reprise::CrashReport::kNoSignature, "A", "B", "A"};
  reprise::ReplayManager replay({}, fx.server, fx.target, fx.options());
  expect(replay.run({simple_testcase()}, 4, 2), "reproduced");
  expect(replay.signature_state().kind() == reprise::SignatureState::Kind::bootstrapped,
         "signature bootstrapped");
  expect(replay.signature_state().signature().symptom == "A", "first real signature adopted");
  expect(replay.reports().count("A") == 1, "expected keyed by signature");
  const auto other = replay.other_reports();
  expect(other.size() == 2 && other.count(reprise::CrashReport::kNoSignature) && other.count("B"),
         "unsigned and different crashes kept apart");
}

void test_replay_serve_failure_is_fatal() {
  ReplayFixture fx("replay_serve");
  fx.server.statuses = {reprise::ServeStatus::none_served};
  fx.target.results = {reprise::FailureResult::failure};
  reprise::ReplayManager replay({}, fx.server, fx.target, fx.options());
  expect(!replay.run({simple_testcase()}, 5, 1), "serve failure fails the run");
  expect(replay.status()->iteration == 1, "no further budget consumed");
  expect(replay.status()->results == 0, "no results");
  expect(replay.reports().empty() && replay.other_reports().empty(), "no evidence");
  expect(fx.target.detects == 0, "target not queried");
  expect(fx.target.relaunch_checks == 0, "relaunch not checked");
}

void test_replay_ignored_counts() {
  ReplayFixture fx("replay_ignored");
  fx.target.results = {reprise::FailureResult::ignored};
  reprise::ReplayManager replay({"timeout"}, fx.server, fx.target, fx.options());
  expect(!replay.run({simple_testcase()}, 3, 1), "nothing reproduced");
  expect(replay.status()->ignored == 3, "ignored counted per iteration");
  expect(fx.target.saves == 0, "no logs collected for ignored results");
}

void test_replay_harness_sequence() {
  ReplayFixture fx("replay_harness");
  auto options = fx.options();
  options.harness = "<html>harness</html>";
  reprise::ReplayManager replay({}, fx.server, fx.target, options);
  expect(!replay.run({simple_testcase("a.html"), simple_testcase("b.html")}, 2, 1),
         "nothing reproduced");
  expect(fx.target.launches == 1, "harness keeps the target running");
  expect(fx.target.locations[0] == "http://127.0.0.1:8000/repro_harness", "launched at harness");
  expect(fx.target.detects == 4, "one classification per test case");
  expect(fx.target.relaunch_checks == 2, "relaunch checked once per iteration");
  expect(fx.server.redirect_targets ==
             std::vector<std::string>({"a.html", "b.html", "a.html", "b.html"}),
         "next test redirect follows the sequence");
  expect(fx.server.saw_test_info, "test cases dumped before serving");
}

void test_replay_without_harness_relaunches() {
  ReplayFixture fx("replay_no_harness");
  reprise::ReplayManager replay({}, fx.server, fx.target, fx.options());
  expect(!replay.run({simple_testcase("a.html"), simple_testcase("b.html")}), "nothing reproduced");
  expect(fx.target.launches == 2, "relaunch between test cases");
  expect(fx.target.locations[0] == "http://127.0.0.1:8000/repro_current_test",
         "launched at current test");
  expect(fx.target.closed(), "closed after the iteration");
  expect(fx.target.relaunch_checks == 0, "countdown unused without a harness");
}

void test_replay_failure_stops_sequence() {
  ReplayFixture fx("replay_sequence_failure");
  auto options = fx.options();
  options.harness = "<html>harness</html>";
  fx.target.results = {reprise::FailureResult::failure};
  reprise::ReplayManager replay({}, fx.server, fx.target, options);
  expect(replay.run({simple_testcase("a.html"), simple_testcase("b.html")}), "reproduced");
  expect(fx.server.serves == 1, "failure ends the sequence early");
  expect(fx.target.closed(), "target closed after a failure");
  expect(fx.target.relaunch_checks == 0, "closed target is not counted down");
}

void test_replay_launch_error_releases_everything() {
  ReplayFixture fx("replay_launch_error");
  fx.target.results = {reprise::FailureResult::failure};
  fx.target.fail_launch_at = 2;
  fx.factory.signatures = {"A", "startup"};
  {
    reprise::ReplayManager replay({}, fx.server, fx.target, fx.options());
    bool threw = false;
    try {
      replay.run({simple_testcase()}, 5, 5);
    } catch (const reprise::TargetLaunchError&) {
      threw = true;
    }
    expect(threw, "launch error propagates");
    expect(replay.reports().count("A") == 1, "earlier result retained");
    expect(replay.other_reports().count(reprise::ReplayManager::kStartupKey) == 1,
           "startup logs retained");
  }
  expect(fx.releases.created == 2, "two reports built");
  for (const auto& [id, n] : fx.releases.cleanups) {
    expect(n == 1, "report " + std::to_string(id) + " released exactly once");
  }
  expect(count_entries(fx.root / "tmp") == 0, "no temporary directories leaked");
}

void test_replay_any_crash_counts_unsigned() {
  ReplayFixture fx("replay_any_crash_unsigned");
  fx.target.results = {reprise::FailureResult::failure};
  fx.factory.signatures = {reprise::CrashReport::kNoSignature};
  auto options = fx.options();
  options.any_crash = true;
  reprise::ReplayManager replay({}, fx.server, fx.target, options);
  expect(replay.run({simple_testcase()}), "unsigned crash reproduces in any-crash mode");
  expect(replay.status()->results == 1, "unsigned crash counted");
  expect(replay.reports().size() == 1, "unsigned crash retained as expected");
  expect(replay.other_reports().empty(), "nothing filed as other");
}

void test_replay_any_crash_counts_failure_without_logs() {
  ReplayFixture fx("replay_no_logs_any");
  fx.target.results = {reprise::FailureResult::failure};
  fx.target.save_ok = false;
  auto options = fx.options();
  options.any_crash = true;
  reprise::ReplayManager replay({}, fx.server, fx.target, options);
  expect(replay.run({simple_testcase()}, 3, 1), "failure counts without evidence");
  expect(replay.status()->iteration == 1, "stopped at the first result");
  expect(replay.status()->results == 1, "result counted");
  expect(replay.status()->result_counts().at(reprise::ReplayManager::kNoEvidenceKey) == 1,
         "counted under the no-evidence bucket");
  expect(replay.reports().empty() && replay.other_reports().empty(), "no report retained");
  expect(fx.releases.created == 0, "factory never called");
}

std::vector<reprise::ReplayEvent> g_captured_events;
void capture_event(const reprise::ReplayEvent& ev) { g_captured_events.push_back(ev); }

void test_replay_failure_without_logs_is_recorded() {
  ReplayFixture fx("replay_no_logs");
  fx.target.results = {reprise::FailureResult::failure};
  fx.target.save_ok = false;
  g_captured_events.clear();
  const auto before = reprise::global_replay_stats().no_evidence.load();
  reprise::set_replay_event_hook(capture_event);
  {
    reprise::ReplayManager replay({}, fx.server, fx.target, fx.options());
    expect(!replay.run({simple_testcase()}, 2, 1), "cannot classify without evidence");
    expect(replay.status()->results == 0, "not counted outside any-crash mode");
    expect(!replay.signature_state().has_signature(), "no signature bootstrapped");
  }
  reprise::set_replay_event_hook(nullptr);
  expect(g_captured_events.size() == 2, "one event per iteration");
  for (const auto& ev : g_captured_events) {
    expect(ev.outcome == "failure" && ev.classification == "no_evidence",
           "failure recorded as lacking evidence");
  }
  expect(reprise::global_replay_stats().no_evidence.load() == before + 2, "stats counter");
}

void test_replay_records_forced_close() {
  ReplayFixture fx("replay_forced_close");
  auto options = fx.options();
  options.harness = "<html>harness</html>";
  fx.target.results = {reprise::FailureResult::failure};
  fx.target.forced = true;
  g_captured_events.clear();
  reprise::set_replay_event_hook(capture_event);
  {
    reprise::ReplayManager replay({}, fx.server, fx.target, options);
    replay.run({simple_testcase()});
  }
  fx.target.forced = false;
  {
    reprise::ReplayManager replay({}, fx.server, fx.target, options);
    replay.run({simple_testcase()});
  }
  reprise::set_replay_event_hook(nullptr);
  expect(g_captured_events.size() == 2, "one event per run");
  expect(g_captured_events[0].forced_close, "forced close recorded");
  expect(!g_captured_events[1].forced_close, "clean exit not flagged");
}

void test_replay_rejects_bad_arguments() {
  ReplayFixture fx("replay_args");
  reprise::ReplayManager replay({}, fx.server, fx.target, fx.options());
  int rejected = 0;
  const std::vector<std::pair<std::uint32_t, std::uint32_t>> cases = {{0, 1}, {1, 0}, {2, 3}};
  for (const auto& [repeat, min_results] : cases) {
    try {
      replay.run({simple_testcase()}, repeat, min_results);
    } catch (const std::invalid_argument&) {
      ++rejected;
    }
  }
  try {
    replay.run({}, 1, 1);
  } catch (const std::invalid_argument&) {
    ++rejected;
  }
  expect(rejected == 4, "invalid arguments rejected");
  expect(fx.target.launches == 0, "nothing launched");
}

void test_replay_events_emitted() {
  ReplayFixture fx("replay_events");
  g_events_seen = 0;
  reprise::set_replay_event_hook(count_event);
  {
    reprise::ReplayManager replay({}, fx.server, fx.target, fx.options());
    replay.run({simple_testcase()}, 3, 1);
  }
  reprise::set_replay_event_hook(nullptr);
  expect(g_events_seen == 3, "one event per iteration");
  expect(!reprise::global_replay_stats().recent_events_snapshot().empty(), "events kept for the summary");
}

void test_report_to_filesystem() {
  const auto root = fresh_dir("export");
  ReleaseLog releases;
  fs::create_directories(root / "src");

  const auto tc = simple_testcase();
  expect(reprise::ReplayManager::report_to_filesystem(root / "empty", {}, {}, {tc}),
         "empty export succeeds");
  expect(!fs::exists(root / "empty"), "no output without evidence");

  FakeReport expected(0, "A", root / "src", &releases);
  FakeReport other1(1, "B", root / "src", &releases);
  FakeReport other2(2, "C", root / "src", &releases);
  const fs::path original = expected.path();
  expect(reprise::ReplayManager::report_to_filesystem(root / "out", {&expected},
                                                      {&other1, &other2}, {tc}),
         "export succeeds");

  auto count_suffix = [](const fs::path& dir, const std::string& suffix) {
    size_t n = 0;
    for (const auto& e : fs::directory_iterator(dir)) {
      const auto name = e.path().filename().string();
      if (name.size() >= suffix.size() &&
          name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        ++n;
      }
    }
    return n;
  };
  expect(count_suffix(root / "out" / "reports", "_logs") == 1, "one expected log directory");
  expect(count_suffix(root / "out" / "other_reports", "_logs") == 2,
         "colliding other reports kept apart");

  size_t dumps = 0;
  for (const auto& e : fs::recursive_directory_iterator(root / "out")) {
    if (e.path().filename() == reprise::TestCase::kInfoFile) ++dumps;
  }
  expect(dumps == 3, "test case dumped once per report");
  expect(!fs::exists(original), "report directory relocated");
  fs::remove_all(root);
}

}  // namespace

int main() {
  std::cout << "=== Reprise Test Suite ===\n";
  reprise::set_log_level(reprise::LogLevel::crit);

  std::cout << "\n[Hashing & JSON]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("frame hash separation", test_frame_hash_separation);
  run_test("JSON duplicate key rejected", test_json_duplicate_key_rejected);
  run_test("JSON unicode escapes", test_json_unicode_escapes);

  std::cout << "\n[Test cases]\n";
  run_test("dump and load", test_testcase_dump_and_load);
  run_test("bad names rejected", test_testcase_rejects_bad_names);
  run_test("single file load", test_testcase_load_single_file);

  std::cout << "\n[Crash reports]\n";
  run_test("stack frame parsing", test_parse_frames);
  run_test("assertion parsing", test_find_assertion);
  run_test("report from sanitizer log", test_crash_report_from_sanitizer_log);
  run_test("report without stack", test_crash_report_without_stack);
  run_test("signature match and load", test_signature_match_and_load);
  run_test("signature state transitions once", test_signature_state_transitions_once);

  std::cout << "\n[Status]\n";
  run_test("report rate limit and cleanup", test_status_report_rate_limit_and_cleanup);

  std::cout << "\n[Harness server]\n";
  run_test("server map and URL decoding", test_server_map_and_url_decoding);
  run_test("serves required files", test_harness_server_serves_required_files);
  run_test("partial delivery and timeout", test_harness_server_partial_and_timeout);

  std::cout << "\n[Process target]\n";
  run_test("launch and close", test_process_target_launch_and_close);
  run_test("crash detection", test_process_target_detects_crash);
  run_test("launch errors", test_process_target_launch_errors);
  run_test("time limit", test_process_target_time_limit);
  run_test("relaunch countdown", test_process_target_relaunch_countdown);
  run_test("memory limit", test_process_target_memory_limit);
  run_test("environment inheritance", test_process_inherits_and_overrides_environment);
  run_test("sanitizer environment", test_sanitizer_env);

  std::cout << "\n[Configuration]\n";
  run_test("parse and validate", test_config_parse_and_validate);

  std::cout << "\n[Replay]\n";
  run_test("no failure", test_replay_no_failure);
  run_test("any-crash stops at min_results", test_replay_any_crash_stops_at_min_results);
  run_test("early exit when unreachable", test_replay_early_exit_when_unreachable);
  run_test("explicit signature classification", test_replay_explicit_signature_classification);
  run_test("repeated other crashes collapse", test_replay_repeated_other_crashes_collapse);
  run_test("take reports transfers ownership", test_replay_take_reports_transfers_ownership);
  run_test("bootstrap signature", test_replay_bootstrap_signature);
  run_test("serve failure is fatal", test_replay_serve_failure_is_fatal);
  run_test("ignored counts", test_replay_ignored_counts);
  run_test("harness sequence", test_replay_harness_sequence);
  run_test("relaunch without harness", test_replay_without_harness_relaunches);
  run_test("failure stops the sequence", test_replay_failure_stops_sequence);
  run_test("launch error releases everything", test_replay_launch_error_releases_everything);
  run_test("any-crash counts unsigned crashes", test_replay_any_crash_counts_unsigned);
  run_test("any-crash counts failures without logs",
           test_replay_any_crash_counts_failure_without_logs);
  run_test("failure without logs is recorded", test_replay_failure_without_logs_is_recorded);
  run_test("forced close recorded", test_replay_records_forced_close);
  run_test("bad arguments rejected", test_replay_rejects_bad_arguments);
  run_test("events emitted", test_replay_events_emitted);
  run_test("report export", test_report_to_filesystem);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
