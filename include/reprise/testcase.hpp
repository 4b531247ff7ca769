#pragma once

// reprise/testcase.hpp: A reproducible test case: the files one replay
// iteration serves to the target.
//
// LAYOUT ON DISK (written by dump(), read by load()):
//   <dir>/<landing page>
//   <dir>/<other files, possibly nested>
//   <dir>/test_info.json   {"version":1,"target":"<landing>","env":{...},
//                           "optional":[...],"adapter":"..."}
//
// File names are relative, '/'-separated and may not escape the test case
// directory ("..", absolute paths are rejected).

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "reprise/types.hpp"

namespace reprise {

struct TestFile {
  std::string name;
  std::string data;
  bool required{true};
};

class TestCase {
 public:
  static constexpr const char* kInfoFile = "test_info.json";

  explicit TestCase(std::string landing_page, std::string adapter_name = "");

  const std::string& landing_page() const { return landing_page_; }
  const std::string& adapter_name() const { return adapter_name_; }
  const EnvMap& env_vars() const { return env_vars_; }
  const std::vector<TestFile>& files() const { return files_; }

  void set_env(const std::string& key, const std::string& value) { env_vars_[key] = value; }

  // Names of files that need not be requested for a test to count as served.
  std::vector<std::string> optional() const;

  bool contains(const std::string& name) const;

  // Add a file. The landing page is always required regardless of
  // `required`. Returns false and sets *error on an invalid or duplicate name.
  bool add_from_data(const std::string& data, const std::string& name,
                     bool required = true, std::string* error = nullptr);
  bool add_from_file(const std::filesystem::path& src, const std::string& name,
                     bool required = true, std::string* error = nullptr);

  // Write every file and test_info.json under `dir` (created if missing).
  bool dump(const std::filesystem::path& dir, std::string* error = nullptr) const;

  // Load from a single file (it becomes the landing page) or from a
  // directory holding test_info.json.
  static std::optional<TestCase> load(const std::filesystem::path& path,
                                      std::string* error = nullptr);

  static bool valid_name(const std::string& name);

 private:
  std::string landing_page_;
  std::string adapter_name_;
  EnvMap env_vars_;
  std::vector<TestFile> files_;
};

}  // namespace reprise
