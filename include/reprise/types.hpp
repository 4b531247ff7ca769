#pragma once

// reprise/types.hpp: Shared enums, error codes and exceptions.
//
// ERROR MODEL:
//   - Recoverable per-iteration outcomes (FailureResult::none / ignored) are
//     plain values, absorbed by the replay loop and surfaced through Status.
//   - Fallible loaders return std::optional and fill a `std::string* error`.
//   - Exceptions are reserved for two cases: precondition violations on the
//     public API (std::invalid_argument) and TargetLaunchError, which must
//     unwind through ReplayManager::run() to the caller.
//
// MEMORY OWNERSHIP:
//   - Value types only in this header. No borrowed references.

#include <cstdint>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace reprise {

enum class ErrorCode {
  none,
  json_parse_error,
  json_duplicate_key,
  missing_input,
  invalid_testcase,
  invalid_signature,
  spawn_failed,
  launch_failed,
  launch_timeout,
  serve_failed,
  socket_error,
  io_error,
  config_invalid,
};

std::string to_string(ErrorCode code);

// Result of Target::detect_failure(). Exactly one per iteration.
enum class FailureResult {
  none,
  ignored,
  failure,
};

std::string to_string(FailureResult result);

// Outcome of Server::serve_path().
//   all_served     every required file was requested and served.
//   request_served at least one file was served, but not all required.
//   none_served    nothing was requested before the server gave up.
enum class ServeStatus {
  all_served,
  request_served,
  none_served,
};

std::string to_string(ServeStatus status);

// Environment overrides passed to Target::launch().
using EnvMap = std::map<std::string, std::string>;

// Issue types that detect_failure() may downgrade to FailureResult::ignored.
// Valid members: "log-limit", "memory", "timeout".
using IgnoreSet = std::set<std::string>;

const IgnoreSet& ignorable_issues();

// ---------------------------------------------------------------------------
// TargetLaunchError: target failed to reach a ready state.
// ---------------------------------------------------------------------------
class TargetLaunchError : public std::runtime_error {
 public:
  explicit TargetLaunchError(const std::string& what,
                             ErrorCode code = ErrorCode::launch_failed)
      : std::runtime_error(what), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

}  // namespace reprise
