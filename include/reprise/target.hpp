#pragma once

// reprise/target.hpp: The process under test, as seen by the replay engine.
//
// DESIGN:
//   The engine never inspects process internals; it launches, asks for one
//   failure classification per iteration, closes, exports logs and lets the
//   target decide when a relaunch is due. Concrete controllers (desktop
//   process, device) implement this interface as separate types.
//
// CONTRACT:
//   - launch() throws TargetLaunchError when the process cannot reach a
//     ready state within its launch timeout.
//   - detect_failure() returns exactly one FailureResult and is bounded by
//     the target's own iteration time limit; it never blocks indefinitely.
//   - save_logs() is only meaningful after close().
//   - cleanup() releases everything (process, log directories) and is
//     idempotent.

#include <filesystem>
#include <string>

#include "reprise/types.hpp"

namespace reprise {

class Target {
 public:
  virtual ~Target() = default;

  virtual void launch(const std::string& location, const EnvMap& env) = 0;
  virtual FailureResult detect_failure(const IgnoreSet& ignored) = 0;
  virtual void close() = 0;
  // Count down toward a scheduled relaunch; closes the target when due.
  virtual void check_relaunch() = 0;
  virtual bool save_logs(const std::filesystem::path& dst) = 0;

  virtual bool closed() const = 0;
  // True if the last close() had to terminate a running process.
  virtual bool forced_close() const = 0;
  virtual const std::string& binary() const = 0;

  virtual void cleanup() noexcept = 0;
};

}  // namespace reprise
