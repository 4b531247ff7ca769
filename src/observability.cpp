#include "reprise/observability.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <sstream>

#include "reprise/jsonlite.hpp"

namespace reprise {

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

namespace {

LogLevel level_from_env() {
  const char* env = std::getenv("REPRISE_LOG_LEVEL");
  LogLevel level = LogLevel::info;
  if (env && env[0]) {
    parse_log_level(env, &level);
  }
  return level;
}

std::atomic<int>& level_slot() {
  static std::atomic<int> slot{static_cast<int>(level_from_env())};
  return slot;
}

std::mutex g_log_mu;

}  // namespace

bool parse_log_level(const std::string& name, LogLevel* out) {
  std::string upper;
  for (char c : name) upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  LogLevel level;
  if (upper == "DEBUG") level = LogLevel::debug;
  else if (upper == "INFO") level = LogLevel::info;
  else if (upper == "WARN") level = LogLevel::warn;
  else if (upper == "ERROR") level = LogLevel::error;
  else if (upper == "CRIT") level = LogLevel::crit;
  else return false;
  if (out) *out = level;
  return true;
}

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info: return "INFO";
    case LogLevel::warn: return "WARN";
    case LogLevel::error: return "ERROR";
    case LogLevel::crit: return "CRIT";
  }
  return "INFO";
}

void set_log_level(LogLevel level) {
  level_slot().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(level_slot().load(std::memory_order_relaxed));
}

void log(LogLevel level, const std::string& message) {
  if (static_cast<int>(level) < level_slot().load(std::memory_order_relaxed)) return;

  char stamp[32];
  const std::time_t now = std::time(nullptr);
  std::tm tm_buf{};
  localtime_r(&now, &tm_buf);
  std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm_buf);

  std::lock_guard<std::mutex> lk(g_log_mu);
  std::fprintf(stderr, "[%s] %s %s\n", stamp, to_string(level).c_str(), message.c_str());
}

// ---------------------------------------------------------------------------
// ReplayEvent
// ---------------------------------------------------------------------------

std::string replay_event_to_json(const ReplayEvent& ev) {
  std::string line;
  line.reserve(256);
  line += "{\"iteration\":";
  line += std::to_string(ev.iteration);
  line += ",\"outcome\":\"";
  line += jsonlite::escape(ev.outcome);
  line += "\",\"classification\":\"";
  line += jsonlite::escape(ev.classification);
  line += "\",\"short_signature\":\"";
  line += jsonlite::escape(ev.short_signature);
  line += "\",\"major\":\"";
  line += ev.major;
  line += "\",\"minor\":\"";
  line += ev.minor;
  line += "\",\"results\":";
  line += std::to_string(ev.results);
  line += ",\"forced_close\":";
  line += ev.forced_close ? "true" : "false";
  line += ",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += '}';
  return line;
}

// ---------------------------------------------------------------------------
// ReplayStats
// ---------------------------------------------------------------------------

void ReplayStats::record(const ReplayEvent& ev) {
  iterations.fetch_add(1, std::memory_order_relaxed);
  if (ev.outcome == "failure") failures.fetch_add(1, std::memory_order_relaxed);
  else if (ev.outcome == "ignored") ignored.fetch_add(1, std::memory_order_relaxed);
  else if (ev.outcome == "serve_failed") serve_failures.fetch_add(1, std::memory_order_relaxed);
  else if (ev.outcome == "launch_failed") launch_failures.fetch_add(1, std::memory_order_relaxed);

  if (ev.classification == "expected") expected.fetch_add(1, std::memory_order_relaxed);
  else if (ev.classification == "other") other.fetch_add(1, std::memory_order_relaxed);
  else if (ev.classification == "duplicate") duplicates.fetch_add(1, std::memory_order_relaxed);
  else if (ev.classification == "no_evidence") no_evidence.fetch_add(1, std::memory_order_relaxed);
  if (ev.forced_close) forced_closes.fetch_add(1, std::memory_order_relaxed);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
  }
  ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
}

std::vector<ReplayEvent> ReplayStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  // Full ring: oldest entry sits at ring_head_.
  std::vector<ReplayEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % kMaxRecentEvents]);
  }
  return out;
}

std::string ReplayStats::to_json() const {
  std::ostringstream o;
  o << "{\"iterations\":" << iterations.load(std::memory_order_relaxed)
    << ",\"failures\":" << failures.load(std::memory_order_relaxed)
    << ",\"ignored\":" << ignored.load(std::memory_order_relaxed)
    << ",\"expected\":" << expected.load(std::memory_order_relaxed)
    << ",\"other\":" << other.load(std::memory_order_relaxed)
    << ",\"duplicates\":" << duplicates.load(std::memory_order_relaxed)
    << ",\"no_evidence\":" << no_evidence.load(std::memory_order_relaxed)
    << ",\"forced_closes\":" << forced_closes.load(std::memory_order_relaxed)
    << ",\"serve_failures\":" << serve_failures.load(std::memory_order_relaxed)
    << ",\"launch_failures\":" << launch_failures.load(std::memory_order_relaxed)
    << "}";
  return o.str();
}

ReplayStats& global_replay_stats() {
  static ReplayStats inst;
  return inst;
}

namespace {
std::atomic<ReplayEventHook> g_event_hook{nullptr};
}

void set_replay_event_hook(ReplayEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_replay_event(const ReplayEvent& ev) {
  global_replay_stats().record(ev);

  ReplayEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("REPRISE_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = replay_event_to_json(ev) + "\n";
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace reprise
