#pragma once

// reprise/version.hpp: Version manifest for every persisted format.
//
// INVARIANT:
//   Any component writing a file another process reads (status records,
//   test_info.json, signature files) stamps the matching constant below and
//   readers reject newer versions instead of guessing.

#include <cstdint>
#include <string>

namespace reprise {
namespace version {

// Status record layout (<status_dir>/<pid>_<start_ms>.json).
constexpr uint32_t STATUS_FORMAT_VERSION = 1;

// test_info.json layout written by TestCase::dump().
constexpr uint32_t TESTCASE_FORMAT_VERSION = 1;

// Signature file layout read by CrashSignature::load().
constexpr uint32_t SIGNATURE_FORMAT_VERSION = 1;

struct VersionManifest {
  uint32_t status_format{STATUS_FORMAT_VERSION};
  uint32_t testcase_format{TESTCASE_FORMAT_VERSION};
  uint32_t signature_format{SIGNATURE_FORMAT_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace reprise
