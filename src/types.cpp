#include "reprise/types.hpp"

namespace reprise {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::missing_input: return "missing_input";
    case ErrorCode::invalid_testcase: return "invalid_testcase";
    case ErrorCode::invalid_signature: return "invalid_signature";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::launch_failed: return "launch_failed";
    case ErrorCode::launch_timeout: return "launch_timeout";
    case ErrorCode::serve_failed: return "serve_failed";
    case ErrorCode::socket_error: return "socket_error";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

std::string to_string(FailureResult result) {
  switch (result) {
    case FailureResult::none: return "none";
    case FailureResult::ignored: return "ignored";
    case FailureResult::failure: return "failure";
  }
  return "none";
}

std::string to_string(ServeStatus status) {
  switch (status) {
    case ServeStatus::all_served: return "all_served";
    case ServeStatus::request_served: return "request_served";
    case ServeStatus::none_served: return "none_served";
  }
  return "none_served";
}

const IgnoreSet& ignorable_issues() {
  static const IgnoreSet kIgnorable = {"log-limit", "memory", "timeout"};
  return kIgnorable;
}

}  // namespace reprise
