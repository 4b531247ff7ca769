#pragma once

// reprise/config.hpp: Replay configuration.
//
// Sources, later wins:
//   1. defaults below
//   2. environment: REPRISE_TMP, REPRISE_STATUS_DIR, REPRISE_LOG_LEVEL
//   3. command line flags (parse_replay_args)
//
// validate_config() never throws; it returns every problem found so the CLI
// can print them all at once.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reprise/observability.hpp"
#include "reprise/types.hpp"

namespace reprise {

struct ReplayConfig {
  std::string binary;
  std::vector<std::string> binary_args;
  std::vector<std::string> inputs;       // test case files or directories, in order

  std::string signature_path;            // explicit signature (JSON)
  bool any_crash{false};
  std::uint32_t repeat{1};
  std::uint32_t min_results{1};

  bool use_harness{true};
  std::string harness_path;              // custom harness page, empty = built-in

  IgnoreSet ignore{"log-limit", "timeout"};
  std::uint64_t launch_timeout_s{300};
  std::uint64_t time_limit_s{30};        // per-test duration inside the harness
  std::optional<std::uint64_t> timeout_s;  // iteration timeout, default time_limit + 10
  std::uint64_t log_limit_mb{0};
  std::uint64_t memory_mb{0};
  std::uint32_t relaunch{1000};
  std::uint16_t port{0};

  std::string output_dir;                // result export root, empty = no export
  std::string tmp_dir;                   // REPRISE_TMP
  std::string status_dir;                // REPRISE_STATUS_DIR, empty = <tmp>/status
  LogLevel log_level{LogLevel::info};

  std::uint64_t effective_timeout_s() const { return timeout_s.value_or(time_limit_s + 10); }

  static ReplayConfig from_env();
};

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Parse flags for the "replay" command. Positional arguments are the binary
// followed by one or more test cases. Returns false and sets *error on
// unknown flags or malformed values.
bool parse_replay_args(const std::vector<std::string>& args, ReplayConfig* config,
                       std::string* error);

ConfigValidationResult validate_config(const ReplayConfig& config);

std::string replay_usage();

}  // namespace reprise
