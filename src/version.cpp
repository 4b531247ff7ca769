#include "reprise/version.hpp"

#include <sstream>

#include "reprise/hash.hpp"

#ifndef REPRISE_VERSION
#define REPRISE_VERSION "0.1.0"
#endif

namespace reprise {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver   = REPRISE_VERSION;
  m.hash_primitive  = hash_runtime_info().primitive;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"status_format\":" << m.status_format
    << ",\"testcase_format\":" << m.testcase_format
    << ",\"signature_format\":" << m.signature_format
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace reprise
