#include "reprise/fsutil.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <vector>

#include <stdlib.h>  // mkdtemp

namespace reprise {

fs::path temp_root() {
  std::error_code ec;
  fs::path root;
  const char* env = std::getenv("REPRISE_TMP");
  if (env && env[0]) {
    root = env;
  } else {
    root = fs::temp_directory_path(ec);
    if (ec) root = "/tmp";
    root /= "reprise";
  }
  fs::create_directories(root, ec);
  return root;
}

fs::path make_temp_dir(const fs::path& root, const std::string& prefix,
                       std::error_code& ec) {
  ec.clear();
  fs::create_directories(root, ec);
  if (ec) return {};
  std::string tmpl = (root / (prefix + "XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (::mkdtemp(buf.data()) == nullptr) {
    ec = std::error_code(errno, std::generic_category());
    return {};
  }
  return fs::path(buf.data());
}

bool move_path(const fs::path& src, const fs::path& dst, std::error_code& ec) {
  ec.clear();
  fs::rename(src, dst, ec);
  if (!ec) return true;
  if (ec != std::errc::cross_device_link) return false;

  // Different filesystem: copy, then remove the source.
  ec.clear();
  fs::copy(src, dst, fs::copy_options::recursive, ec);
  if (ec) {
    std::error_code ignore;
    fs::remove_all(dst, ignore);
    return false;
  }
  fs::remove_all(src, ec);
  return !ec;
}

std::uintmax_t path_size(const fs::path& path) {
  std::error_code ec;
  if (fs::is_regular_file(path, ec)) {
    const auto size = fs::file_size(path, ec);
    return ec ? 0 : size;
  }
  std::uintmax_t total = 0;
  for (auto it = fs::recursive_directory_iterator(path, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (it->is_regular_file(ec)) {
      const auto size = it->file_size(ec);
      if (!ec) total += size;
    }
  }
  return total;
}

std::string read_file(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

bool write_file(const fs::path& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) return false;
  ofs << data;
  return static_cast<bool>(ofs);
}

// ---------------------------------------------------------------------------
// TempDir
// ---------------------------------------------------------------------------

TempDir::TempDir(const fs::path& root, const std::string& prefix) {
  path_ = make_temp_dir(root, prefix, error_);
}

TempDir& TempDir::operator=(TempDir&& other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

void TempDir::remove() noexcept {
  if (path_.empty()) return;
  std::error_code ec;
  fs::remove_all(path_, ec);
  path_.clear();
}

}  // namespace reprise
