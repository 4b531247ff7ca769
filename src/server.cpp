#include "reprise/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

#include "reprise/fsutil.hpp"
#include "reprise/observability.hpp"
#include "reprise/testcase.hpp"

namespace reprise {

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kMaxRequestHead = 8192;

void send_all(int fd, const std::string& data) {
  size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return;  // client went away
    off += static_cast<size_t>(n);
  }
}

std::string response_head(const std::string& status, const std::string& mime,
                          size_t length, const std::string& extra = "") {
  std::string head = "HTTP/1.1 " + status + "\r\n";
  if (!mime.empty()) head += "Content-Type: " + mime + "\r\n";
  head += "Content-Length: " + std::to_string(length) + "\r\n";
  head += extra;
  head += "Cache-Control: no-cache, no-store\r\nConnection: close\r\n\r\n";
  return head;
}

void send_status(int fd, const std::string& status) {
  send_all(fd, response_head(status, "text/plain", status.size()) + status);
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

// ---------------------------------------------------------------------------
// ServerMap
// ---------------------------------------------------------------------------

bool ServerMap::valid_url(const std::string& url) {
  return !url.empty() && url.front() != '/' &&
         url.find_first_of("?# \r\n") == std::string::npos;
}

void ServerMap::set_redirect(const std::string& url, const std::string& target,
                             bool required) {
  if (!valid_url(url)) throw std::invalid_argument("invalid redirect url: " + url);
  if (target.empty()) throw std::invalid_argument("empty redirect target for " + url);
  dynamic_.erase(url);
  redirects_[url] = Redirect{target, required};
}

void ServerMap::set_dynamic_response(const std::string& url, DynamicResponse callback,
                                     const std::string& mime_type) {
  if (!valid_url(url)) throw std::invalid_argument("invalid dynamic url: " + url);
  if (!callback) throw std::invalid_argument("empty dynamic response for " + url);
  redirects_.erase(url);
  dynamic_[url] = Dynamic{std::move(callback), mime_type};
}

const ServerMap::Redirect* ServerMap::redirect(const std::string& url) const {
  auto it = redirects_.find(url);
  return it == redirects_.end() ? nullptr : &it->second;
}

bool ServerMap::dynamic(const std::string& url, std::string* body,
                        std::string* mime_type) const {
  auto it = dynamic_.find(url);
  if (it == dynamic_.end()) return false;
  if (body) *body = it->second.callback();
  if (mime_type) *mime_type = it->second.mime_type;
  return true;
}

std::vector<std::string> ServerMap::required_redirects() const {
  std::vector<std::string> out;
  for (const auto& [url, r] : redirects_) {
    if (r.required) out.push_back(url);
  }
  return out;
}

bool decode_url_path(const std::string& raw, std::string* out) {
  std::string path = raw.substr(0, raw.find_first_of("?#"));
  std::string decoded;
  decoded.reserve(path.size());
  for (size_t i = 0; i < path.size(); ++i) {
    if (path[i] != '%') {
      decoded.push_back(path[i]);
      continue;
    }
    if (i + 2 >= path.size()) return false;
    const int hi = hex_value(path[i + 1]);
    const int lo = hex_value(path[i + 2]);
    if (hi < 0 || lo < 0) return false;
    decoded.push_back(static_cast<char>(hi * 16 + lo));
    i += 2;
  }
  while (!decoded.empty() && decoded.front() == '/') decoded.erase(0, 1);
  *out = decoded;
  return true;
}

// ---------------------------------------------------------------------------
// HarnessServer
// ---------------------------------------------------------------------------

HarnessServer::HarnessServer(HarnessServerOptions options) : options_(std::move(options)) {}

HarnessServer::~HarnessServer() { stop(); }

bool HarnessServer::start(std::string* error) {
  if (listen_fd_ >= 0) return true;
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ < 0) {
    if (error) *error = std::string("socket: ") + std::strerror(errno);
    return false;
  }
  int one = 1;
  ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(options_.port);
  if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
      ::listen(listen_fd_, 64) != 0) {
    if (error) *error = std::string("bind/listen: ") + std::strerror(errno);
    stop();
    return false;
  }
  socklen_t len = sizeof(addr);
  if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    if (error) *error = std::string("getsockname: ") + std::strerror(errno);
    stop();
    return false;
  }
  port_ = ntohs(addr.sin_port);
  log(LogLevel::debug, "server: listening on 127.0.0.1:" + std::to_string(port_));
  return true;
}

void HarnessServer::stop() {
  if (listen_fd_ >= 0) ::close(listen_fd_);
  listen_fd_ = -1;
}

std::string HarnessServer::mime_type(const fs::path& file) {
  static const std::map<std::string, std::string> kTypes = {
      {".html", "text/html"},      {".htm", "text/html"},
      {".xhtml", "application/xhtml+xml"},
      {".js", "text/javascript"},  {".mjs", "text/javascript"},
      {".css", "text/css"},        {".json", "application/json"},
      {".svg", "image/svg+xml"},   {".xml", "application/xml"},
      {".txt", "text/plain"},      {".png", "image/png"},
      {".jpg", "image/jpeg"},      {".jpeg", "image/jpeg"},
      {".gif", "image/gif"},       {".webp", "image/webp"},
      {".wasm", "application/wasm"}, {".mp4", "video/mp4"},
      {".webm", "video/webm"},     {".wav", "audio/wav"},
  };
  std::string ext = file.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto it = kTypes.find(ext);
  return it == kTypes.end() ? "application/octet-stream" : it->second;
}

ServeResult HarnessServer::serve_path(const fs::path& path,
                                      const std::vector<std::string>& optional,
                                      const ServerMap& server_map) {
  ServeResult result;
  if (listen_fd_ < 0) {
    std::string error;
    if (!start(&error)) {
      log(LogLevel::error, "server: " + error);
      return result;
    }
  }

  ServeState state;
  state.root = path;
  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(path, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    const std::string name = it->path().lexically_relative(path).generic_string();
    if (name == TestCase::kInfoFile) continue;
    if (std::find(optional.begin(), optional.end(), name) != optional.end()) continue;
    state.pending.insert(name);
  }
  for (const auto& url : server_map.required_redirects()) state.pending.insert("/" + url);
  log(LogLevel::debug, "server: serving " + path.string() + " (" +
                           std::to_string(state.pending.size()) + " required)");

  const auto deadline = Clock::now() + std::chrono::milliseconds(options_.timeout_ms);
  while (!state.pending.empty()) {
    if (options_.continue_check && !options_.continue_check()) {
      log(LogLevel::debug, "server: stopped by continue check");
      break;
    }
    const auto now = Clock::now();
    if (now >= deadline) {
      log(LogLevel::info, "server: timeout with " + std::to_string(state.pending.size()) +
                              " required item(s) pending");
      break;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    pollfd pfd{listen_fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, 250)));
    if (ready < 0 && errno != EINTR) {
      log(LogLevel::error, std::string("server: poll: ") + std::strerror(errno));
      break;
    }
    if (ready <= 0) continue;
    const int client = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client < 0) continue;
    handle_connection(client, server_map, state);
    ::close(client);
  }

  result.served = std::move(state.served);
  if (state.pending.empty()) {
    result.status = ServeStatus::all_served;
  } else if (!result.served.empty()) {
    result.status = ServeStatus::request_served;
  } else {
    result.status = ServeStatus::none_served;
  }
  return result;
}

void HarnessServer::handle_connection(int client_fd, const ServerMap& server_map,
                                      ServeState& state) {
  std::string head;
  char buf[1024];
  const auto deadline = Clock::now() + std::chrono::milliseconds(options_.request_timeout_ms);
  while (head.find("\r\n\r\n") == std::string::npos && head.size() < kMaxRequestHead) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                               deadline - Clock::now()).count();
    if (remaining <= 0) return;
    pollfd pfd{client_fd, POLLIN, 0};
    if (::poll(&pfd, 1, static_cast<int>(remaining)) <= 0) return;
    const ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n <= 0) return;
    head.append(buf, static_cast<size_t>(n));
  }

  // "GET /path HTTP/1.1"
  const auto line_end = head.find("\r\n");
  const std::string request_line = head.substr(0, line_end);
  const auto sp1 = request_line.find(' ');
  const auto sp2 = request_line.find(' ', sp1 == std::string::npos ? 0 : sp1 + 1);
  if (sp1 == std::string::npos || sp2 == std::string::npos) {
    send_status(client_fd, "400 Bad Request");
    return;
  }
  const std::string method = request_line.substr(0, sp1);
  if (method != "GET" && method != "HEAD") {
    send_status(client_fd, "405 Method Not Allowed");
    return;
  }
  std::string url;
  if (!decode_url_path(request_line.substr(sp1 + 1, sp2 - sp1 - 1), &url)) {
    send_status(client_fd, "400 Bad Request");
    return;
  }
  const bool head_only = method == "HEAD";

  std::string body;
  std::string mime;
  if (server_map.dynamic(url, &body, &mime)) {
    log(LogLevel::debug, "server: dynamic /" + url);
    send_all(client_fd, response_head("200 OK", mime, body.size()) + (head_only ? "" : body));
    return;
  }
  if (const auto* redirect = server_map.redirect(url)) {
    log(LogLevel::debug, "server: redirect /" + url + " -> " + redirect->target);
    send_all(client_fd, response_head("302 Found", "", 0, "Location: /" + redirect->target + "\r\n"));
    state.pending.erase("/" + url);
    return;
  }

  if (!TestCase::valid_name(url)) {
    send_status(client_fd, "404 Not Found");
    return;
  }
  const fs::path file = state.root / url;
  std::error_code ec;
  if (!fs::is_regular_file(file, ec)) {
    log(LogLevel::debug, "server: 404 /" + url);
    send_status(client_fd, "404 Not Found");
    return;
  }
  body = read_file(file);
  send_all(client_fd, response_head("200 OK", mime_type(file), body.size()) + (head_only ? "" : body));
  if (std::find(state.served.begin(), state.served.end(), url) == state.served.end()) {
    state.served.push_back(url);
  }
  state.pending.erase(url);
}

}  // namespace reprise
