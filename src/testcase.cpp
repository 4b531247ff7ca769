#include "reprise/testcase.hpp"

#include <algorithm>

#include "reprise/fsutil.hpp"
#include "reprise/jsonlite.hpp"
#include "reprise/version.hpp"

namespace reprise {

namespace {
void set_error(std::string* error, const std::string& msg) {
  if (error) *error = msg;
}
}  // namespace

TestCase::TestCase(std::string landing_page, std::string adapter_name)
    : landing_page_(std::move(landing_page)),
      adapter_name_(std::move(adapter_name)) {}

bool TestCase::valid_name(const std::string& name) {
  if (name.empty() || name.front() == '/' || name.back() == '/') return false;
  if (name == kInfoFile) return false;
  const fs::path p(name);
  if (p.is_absolute()) return false;
  for (const auto& part : p) {
    if (part == ".." || part == ".") return false;
  }
  return true;
}

std::vector<std::string> TestCase::optional() const {
  std::vector<std::string> out;
  for (const auto& f : files_) {
    if (!f.required) out.push_back(f.name);
  }
  return out;
}

bool TestCase::contains(const std::string& name) const {
  return std::any_of(files_.begin(), files_.end(),
                     [&](const TestFile& f) { return f.name == name; });
}

bool TestCase::add_from_data(const std::string& data, const std::string& name,
                             bool required, std::string* error) {
  if (!valid_name(name)) {
    set_error(error, "invalid file name: " + name);
    return false;
  }
  if (contains(name)) {
    set_error(error, "duplicate file name: " + name);
    return false;
  }
  files_.push_back(TestFile{name, data, required || name == landing_page_});
  return true;
}

bool TestCase::add_from_file(const fs::path& src, const std::string& name,
                             bool required, std::string* error) {
  std::error_code ec;
  if (!fs::is_regular_file(src, ec)) {
    set_error(error, "missing file: " + src.string());
    return false;
  }
  return add_from_data(read_file(src), name, required, error);
}

bool TestCase::dump(const fs::path& dir, std::string* error) const {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    set_error(error, "cannot create " + dir.string() + ": " + ec.message());
    return false;
  }
  for (const auto& f : files_) {
    const fs::path dst = dir / f.name;
    if (dst.has_parent_path()) fs::create_directories(dst.parent_path(), ec);
    if (ec || !write_file(dst, f.data)) {
      set_error(error, "cannot write " + dst.string());
      return false;
    }
  }

  jsonlite::Object env;
  for (const auto& [k, v] : env_vars_) env[k] = jsonlite::Value{v};
  jsonlite::Array optional_files;
  for (const auto& name : optional()) optional_files.push_back(jsonlite::Value{name});

  jsonlite::Object info;
  info["version"] = jsonlite::Value{static_cast<std::uint64_t>(version::TESTCASE_FORMAT_VERSION)};
  info["target"] = jsonlite::Value{landing_page_};
  info["adapter"] = jsonlite::Value{adapter_name_};
  info["env"] = jsonlite::Value{env};
  info["optional"] = jsonlite::Value{optional_files};
  if (!write_file(dir / kInfoFile, jsonlite::to_json(info) + "\n")) {
    set_error(error, "cannot write " + (dir / kInfoFile).string());
    return false;
  }
  return true;
}

std::optional<TestCase> TestCase::load(const fs::path& path, std::string* error) {
  std::error_code ec;
  if (fs::is_regular_file(path, ec)) {
    TestCase tc(path.filename().string());
    if (!tc.add_from_file(path, tc.landing_page(), true, error)) return std::nullopt;
    return tc;
  }
  if (!fs::is_directory(path, ec)) {
    set_error(error, "test case not found: " + path.string());
    return std::nullopt;
  }

  const fs::path info_path = path / kInfoFile;
  if (!fs::is_regular_file(info_path, ec)) {
    set_error(error, "missing " + info_path.string());
    return std::nullopt;
  }
  std::optional<jsonlite::JsonError> json_err;
  const auto info = jsonlite::parse(read_file(info_path), &json_err);
  if (json_err) {
    set_error(error, info_path.string() + ": " + json_err->message);
    return std::nullopt;
  }
  if (jsonlite::get_u64(info, "version", version::TESTCASE_FORMAT_VERSION) >
      version::TESTCASE_FORMAT_VERSION) {
    set_error(error, info_path.string() + ": unsupported version");
    return std::nullopt;
  }
  const std::string landing = jsonlite::get_string(info, "target");
  if (!valid_name(landing)) {
    set_error(error, info_path.string() + ": invalid 'target'");
    return std::nullopt;
  }

  TestCase tc(landing, jsonlite::get_string(info, "adapter"));
  for (const auto& [k, v] : jsonlite::get_string_map(info, "env")) tc.set_env(k, v);
  const auto optional_files = jsonlite::get_string_array(info, "optional");

  std::vector<fs::path> entries;
  for (auto it = fs::recursive_directory_iterator(path, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (it->is_regular_file(ec) && it->path() != info_path) entries.push_back(it->path());
  }
  if (ec) {
    set_error(error, "cannot scan " + path.string() + ": " + ec.message());
    return std::nullopt;
  }
  // Directory iteration order is filesystem dependent.
  std::sort(entries.begin(), entries.end());
  for (const auto& entry : entries) {
    const std::string name = entry.lexically_relative(path).generic_string();
    const bool required = std::find(optional_files.begin(), optional_files.end(),
                                    name) == optional_files.end();
    if (!tc.add_from_file(entry, name, required, error)) return std::nullopt;
  }
  if (!tc.contains(landing)) {
    set_error(error, "landing page '" + landing + "' not found in " + path.string());
    return std::nullopt;
  }
  return tc;
}

}  // namespace reprise
