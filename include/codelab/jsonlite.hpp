#pragma once

// codelab/jsonlite.hpp — Small strict JSON reader/writer.
//
// Used for config files, request/result documents in the CLI and C ABI, and
// the JSONL event log. Objects are std::map, so serialization has sorted keys.
// Duplicate keys and trailing data are parse errors. Non-negative integers
// are held as uint64; every other number is a double.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace codelab::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t n) : v(n) {}
  Value(int n) {
    if (n < 0) v = static_cast<double>(n);
    else v = static_cast<std::uint64_t>(n);
  }
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}
};

// Parse a document whose top level must be an object. On failure returns an
// empty object and fills *error (when error is non-null).
Object parse(const std::string& text, std::optional<JsonError>* error);

// Parse any JSON value.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

std::string to_json(const Value& v);
std::string escape(const std::string& s);

bool has_key(const Object& obj, const std::string& key);
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::optional<std::uint64_t> get_optional_u64(const Object& obj, const std::string& key);
std::optional<std::string> get_optional_string(const Object& obj, const std::string& key);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
Object get_object(const Object& obj, const std::string& key);

}  // namespace codelab::jsonlite
