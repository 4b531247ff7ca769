#pragma once

// reprise/process.hpp: Long-running child process with file-backed output.
//
// DESIGN:
//   The target is a browser that stays up for many iterations, so unlike a
//   one-shot runner the child is spawned, polled and terminated separately.
//   stdout/stderr go straight to files so logs survive a crash and can be
//   size-checked while the process runs.
//
//   The child runs in its own session (setsid) and terminate() signals the
//   whole process group.
//
// RESOURCE LIMITS:
//   No address-space rlimit is applied: sanitizer runtimes reserve terabytes
//   of shadow memory up front. Memory is bounded by the caller sampling
//   rss_bytes().

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reprise {

struct ProcessSpec {
  std::string command;
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;
  bool inherit_env{true};  // start from the parent environment, then apply `env`
  std::string cwd;
  std::string stdout_path;  // empty = /dev/null
  std::string stderr_path;  // empty = /dev/null
};

class Process {
 public:
  Process() = default;
  ~Process();

  Process(const Process&) = delete;
  Process& operator=(const Process&) = delete;

  // Fork and exec. Returns false and sets *error if the fork or exec failed.
  bool start(const ProcessSpec& spec, std::string* error = nullptr);

  pid_t pid() const { return pid_; }
  bool started() const { return pid_ > 0; }
  // Non-blocking; reaps the child when it has exited.
  bool running();
  // Block up to `timeout` for the child to exit. Returns true once exited.
  bool wait_for(std::chrono::milliseconds timeout);
  // SIGTERM the process group, SIGKILL after `grace`. Returns true if the
  // child was still running when called.
  bool terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(1000));

  // Valid once the child has been reaped.
  std::optional<int> exit_code() const { return exit_code_; }    // WEXITSTATUS
  std::optional<int> term_signal() const { return term_signal_; }  // WTERMSIG
  // 0 clean exit, exit status, or 128 + signal.
  int status_code() const;

  // Resident set size of the child (Linux /proc), 0 if unknown.
  std::uint64_t rss_bytes() const;

 private:
  void record_status(int status);

  pid_t pid_{-1};
  bool reaped_{false};
  std::optional<int> exit_code_;
  std::optional<int> term_signal_;
};

}  // namespace reprise
