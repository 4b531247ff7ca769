#include "reprise/hash.hpp"

// Hash authority for crash bucketing.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive.
//   2. Domain separation: "major:", "minor:", "crash:" prefixes keep the three
//      bucket keys from colliding even when built from the same frames.
//   3. Bucket keys are persisted in exported report names and status records.
//      Changing a domain prefix re-buckets every previously seen crash.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace reprise {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_frames(std::string_view domain,
                        const std::vector<std::string>& frames) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  for (const auto& frame : frames) {
    blake3_hasher_update(&hasher, frame.data(), frame.size());
    blake3_hasher_update(&hasher, "\n", 1);
  }
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace reprise
