#pragma once

// reprise/observability.hpp: Logging and structured replay events.
//
// DESIGN:
//   Two channels, both fire-and-forget:
//     1. log(): human-readable lines on stderr, filtered by LogLevel.
//        Level comes from set_log_level() or REPRISE_LOG_LEVEL
//        (CRIT, ERROR, WARN, INFO, DEBUG). Default INFO.
//     2. emit_replay_event(): one ReplayEvent per replay iteration. Always
//        recorded in the global ReplayStats; appended as one JSON line to
//        REPRISE_EVENT_LOG when that variable is set; forwarded to a hook
//        instead when one is registered.
//
//   Invariant: neither channel may throw or alter the replay result. Write
//   failures are dropped.

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace reprise {

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------
enum class LogLevel {
  debug = 10,
  info = 20,
  warn = 30,
  error = 40,
  crit = 50,
};

// Parse "DEBUG", "info", "WARN", ... Returns false for unknown names.
bool parse_log_level(const std::string& name, LogLevel* out);
std::string to_string(LogLevel level);

void set_log_level(LogLevel level);
LogLevel log_level();

void log(LogLevel level, const std::string& message);

// ---------------------------------------------------------------------------
// ReplayEvent: per-iteration observable unit
// ---------------------------------------------------------------------------
struct ReplayEvent {
  uint64_t iteration{0};
  std::string outcome;          // "none", "ignored", "failure", "serve_failed", "launch_failed"
  std::string classification;   // "expected", "other", "duplicate", "no_evidence", ""
  std::string short_signature;
  std::string major;
  std::string minor;
  uint64_t results{0};          // Status::results after this iteration
  bool forced_close{false};     // target had to be killed to close it
  uint64_t duration_ns{0};
};

std::string replay_event_to_json(const ReplayEvent& ev);

// ---------------------------------------------------------------------------
// ReplayStats: process-wide aggregate counters
// ---------------------------------------------------------------------------
class ReplayStats {
 public:
  void record(const ReplayEvent& ev);
  std::string to_json() const;

  std::atomic<uint64_t> iterations{0};
  std::atomic<uint64_t> failures{0};
  std::atomic<uint64_t> ignored{0};
  std::atomic<uint64_t> expected{0};
  std::atomic<uint64_t> other{0};
  std::atomic<uint64_t> duplicates{0};
  std::atomic<uint64_t> no_evidence{0};
  std::atomic<uint64_t> forced_closes{0};
  std::atomic<uint64_t> serve_failures{0};
  std::atomic<uint64_t> launch_failures{0};

  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<ReplayEvent> recent_events_snapshot() const;

 private:
  mutable std::mutex ring_mu_;
  std::vector<ReplayEvent> ring_buffer_;
  size_t ring_head_{0};
};

ReplayStats& global_replay_stats();

void emit_replay_event(const ReplayEvent& ev);

using ReplayEventHook = void (*)(const ReplayEvent&);
void set_replay_event_hook(ReplayEventHook hook);

}  // namespace reprise
