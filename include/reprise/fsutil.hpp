#pragma once

// reprise/fsutil.hpp: Temporary directories and file moves.
//
// Every helper here reports failure through std::error_code or a bool and
// never throws, so they are safe to call from destructors and cleanup paths.

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

namespace reprise {

namespace fs = std::filesystem;

// Root for all reprise temporary data: $REPRISE_TMP, else
// <system temp>/reprise. Created on demand.
fs::path temp_root();

// Create a fresh, uniquely named directory "<root>/<prefix>XXXXXX".
// Returns an empty path and sets `ec` on failure.
fs::path make_temp_dir(const fs::path& root, const std::string& prefix,
                       std::error_code& ec);

// Move a file or directory. Falls back to copy + remove when rename() fails
// with EXDEV. Returns false (and sets `ec`) if the source is left in place.
bool move_path(const fs::path& src, const fs::path& dst, std::error_code& ec);

// Recursive size of a file or directory, 0 on error.
std::uintmax_t path_size(const fs::path& path);

std::string read_file(const fs::path& path);
bool write_file(const fs::path& path, const std::string& data);

// ---------------------------------------------------------------------------
// TempDir: owns a temporary directory and removes it on scope exit.
// ---------------------------------------------------------------------------
class TempDir {
 public:
  TempDir() = default;
  TempDir(const fs::path& root, const std::string& prefix);
  ~TempDir() { remove(); }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;
  TempDir(TempDir&& other) noexcept : path_(std::move(other.path_)) { other.path_.clear(); }
  TempDir& operator=(TempDir&& other) noexcept;

  const fs::path& path() const { return path_; }
  bool valid() const { return !path_.empty(); }
  const std::error_code& error() const { return error_; }

  // Remove now. Idempotent, best-effort.
  void remove() noexcept;

 private:
  fs::path path_;
  std::error_code error_;
};

}  // namespace reprise
