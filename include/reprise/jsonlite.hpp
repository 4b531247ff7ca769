#pragma once

// reprise/jsonlite.hpp: Minimal strict JSON reader/writer.
//
// Used for the small documents reprise reads and writes itself:
// test_info.json, signature files and status records. Objects are
// std::map-backed, so serialization always emits keys in sorted order.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace reprise::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse a document whose top level must be an object. Returns an empty
// object and sets *error on failure. Duplicate keys are rejected.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& value);
std::string to_json(const Object& object);

std::string escape(const std::string& s);

// Type-safe extractors. Return `def` when the key is missing or has a
// different type.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
std::map<std::string, unsigned long long> get_u64_map(const Object& obj, const std::string& key);

}  // namespace reprise::jsonlite
