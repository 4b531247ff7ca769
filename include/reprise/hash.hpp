#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace reprise {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Hash an ordered frame list under a domain prefix. Frames are
// newline-joined before hashing so {"ab","c"} and {"a","bc"} produce
// different digests. Domains in use:
//   "major:"  top-of-stack frames (coarse crash bucket)
//   "minor:"  full stack (fine crash bucket)
//   "crash:"  signature + top frames (any-crash dedup)
std::string hash_frames(std::string_view domain,
                        const std::vector<std::string>& frames);

}  // namespace reprise
