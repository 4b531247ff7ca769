#pragma once

// reprise/server.hpp: HTTP harness that delivers test cases to the target.
//
// DESIGN:
//   serve_path() serves the files of one dumped test case and returns once
//   every required file has been requested, the timeout elapses, or the
//   continue_check callback asks to stop. Required files are every file
//   under the served directory except the optional ones and
//   test_info.json, plus every redirect registered as required.
//
//   Requests are resolved in this order: dynamic response, redirect, file
//   under the served directory, 404. Every response closes the connection.
//
// CONCURRENCY:
//   Single-threaded. Connections are accepted and answered one at a time
//   inside serve_path(); nothing is served between calls, connections
//   simply queue in the listen backlog.

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "reprise/types.hpp"

namespace reprise {

// URL routing for one serve_path() call. URLs are given without the
// leading '/'.
class ServerMap {
 public:
  struct Redirect {
    std::string target;  // file name inside the served directory
    bool required{true};
  };
  using DynamicResponse = std::function<std::string()>;

  void set_redirect(const std::string& url, const std::string& target, bool required = true);
  void set_dynamic_response(const std::string& url, DynamicResponse callback,
                            const std::string& mime_type = "text/html");

  const Redirect* redirect(const std::string& url) const;
  // Returns false if no dynamic response is registered for `url`.
  bool dynamic(const std::string& url, std::string* body, std::string* mime_type) const;

  std::vector<std::string> required_redirects() const;

  static bool valid_url(const std::string& url);

 private:
  struct Dynamic {
    DynamicResponse callback;
    std::string mime_type;
  };
  std::map<std::string, Redirect> redirects_;
  std::map<std::string, Dynamic> dynamic_;
};

struct ServeResult {
  ServeStatus status{ServeStatus::none_served};
  std::vector<std::string> served;  // file names, in request order
};

class Server {
 public:
  virtual ~Server() = default;

  virtual ServeResult serve_path(const std::filesystem::path& path,
                                 const std::vector<std::string>& optional,
                                 const ServerMap& server_map) = 0;
  virtual std::uint16_t port() const = 0;
};

struct HarnessServerOptions {
  std::uint16_t port{0};  // 0 = ephemeral
  std::uint64_t timeout_ms{60000};
  std::uint64_t request_timeout_ms{5000};
  // Polled between connections; returning false ends serve_path() early.
  std::function<bool()> continue_check;
};

class HarnessServer final : public Server {
 public:
  explicit HarnessServer(HarnessServerOptions options = {});
  ~HarnessServer() override;

  HarnessServer(const HarnessServer&) = delete;
  HarnessServer& operator=(const HarnessServer&) = delete;

  // Bind 127.0.0.1 and listen. Returns false and sets *error on failure.
  bool start(std::string* error = nullptr);
  void stop();
  bool listening() const { return listen_fd_ >= 0; }

  ServeResult serve_path(const std::filesystem::path& path,
                         const std::vector<std::string>& optional,
                         const ServerMap& server_map) override;
  std::uint16_t port() const override { return port_; }

  static std::string mime_type(const std::filesystem::path& file);

 private:
  struct ServeState {
    std::filesystem::path root;
    std::set<std::string> pending;  // required files, plus "/<url>" for redirects
    std::vector<std::string> served;
  };

  void handle_connection(int client_fd, const ServerMap& server_map, ServeState& state);

  HarnessServerOptions options_;
  int listen_fd_{-1};
  std::uint16_t port_{0};
};

// Percent-decode a URL path and strip the query string and leading '/'.
// Returns false on malformed escapes.
bool decode_url_path(const std::string& raw, std::string* out);

}  // namespace reprise
