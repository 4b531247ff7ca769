#ifndef _WIN32

#include "reprise/process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <map>
#include <thread>

extern char** environ;

namespace reprise {

namespace {

int open_output(const std::string& path) {
  if (path.empty()) return ::open("/dev/null", O_WRONLY | O_CLOEXEC);
  return ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
}

std::vector<std::string> build_env(const ProcessSpec& spec) {
  std::map<std::string, std::string> merged;
  if (spec.inherit_env) {
    for (char** e = environ; e && *e; ++e) {
      const char* eq = std::strchr(*e, '=');
      if (!eq) continue;
      merged[std::string(*e, static_cast<size_t>(eq - *e))] = eq + 1;
    }
  }
  for (const auto& [k, v] : spec.env) merged[k] = v;
  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto& [k, v] : merged) out.push_back(k + "=" + v);
  return out;
}

}  // namespace

Process::~Process() {
  if (started() && !reaped_) terminate(std::chrono::milliseconds(0));
}

bool Process::start(const ProcessSpec& spec, std::string* error) {
  if (started() && !reaped_) {
    if (error) *error = "process already running";
    return false;
  }
  pid_ = -1;
  reaped_ = false;
  exit_code_.reset();
  term_signal_.reset();

  const int out_fd = open_output(spec.stdout_path);
  const int err_fd = open_output(spec.stderr_path);
  // exec failure is reported back through a close-on-exec pipe.
  int status_pipe[2];
  if (out_fd < 0 || err_fd < 0 || ::pipe2(status_pipe, O_CLOEXEC) != 0) {
    if (error) *error = std::string("spawn_failed: ") + std::strerror(errno);
    if (out_fd >= 0) ::close(out_fd);
    if (err_fd >= 0) ::close(err_fd);
    return false;
  }

  // Everything the child needs is prepared before fork().
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs = build_env(spec);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    if (error) *error = std::string("spawn_failed: ") + std::strerror(errno);
    ::close(out_fd);
    ::close(err_fd);
    ::close(status_pipe[0]);
    ::close(status_pipe[1]);
    return false;
  }

  if (pid == 0) {
    ::setsid();
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(err_fd, STDERR_FILENO);
    const int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) ::dup2(null_fd, STDIN_FILENO);
    ::close(status_pipe[0]);

    int child_errno = 0;
    if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
      child_errno = errno;
    } else {
      ::execve(spec.command.c_str(), argv.data(), envp.data());
      child_errno = errno;
    }
    ssize_t ignored = ::write(status_pipe[1], &child_errno, sizeof(child_errno));
    (void)ignored;
    ::_exit(127);
  }

  ::close(out_fd);
  ::close(err_fd);
  ::close(status_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(status_pipe[0]);

  pid_ = pid;
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    record_status(status);
    if (error) {
      *error = "exec " + spec.command + " failed: " + std::strerror(child_errno);
    }
    return false;
  }
  return true;
}

void Process::record_status(int status) {
  reaped_ = true;
  if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    term_signal_ = WTERMSIG(status);
  }
}

bool Process::running() {
  if (!started() || reaped_) return false;
  int status = 0;
  const pid_t w = ::waitpid(pid_, &status, WNOHANG);
  if (w == pid_) {
    record_status(status);
    return false;
  }
  if (w < 0 && errno == ECHILD) {
    reaped_ = true;
    return false;
  }
  return true;
}

bool Process::wait_for(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (running()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}

bool Process::terminate(std::chrono::milliseconds grace) {
  if (!running()) return false;
  ::kill(-pid_, SIGTERM);
  ::kill(pid_, SIGTERM);
  if (!wait_for(grace)) {
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
    int status = 0;
    if (::waitpid(pid_, &status, 0) == pid_) {
      record_status(status);
    } else {
      reaped_ = true;
    }
  }
  return true;
}

int Process::status_code() const {
  if (term_signal_) return 128 + *term_signal_;
  return exit_code_.value_or(0);
}

std::uint64_t Process::rss_bytes() const {
  if (!started() || reaped_) return 0;
  std::ifstream ifs("/proc/" + std::to_string(pid_) + "/status");
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.rfind("VmRSS:", 0) == 0) {
      // "VmRSS:    123456 kB"
      return std::strtoull(line.c_str() + 6, nullptr, 10) * 1024;
    }
  }
  return 0;
}

}  // namespace reprise

#endif
