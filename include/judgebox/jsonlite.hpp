#pragma once

// judgebox/jsonlite.hpp: Small strict JSON codec for task files, config
// documents, event lines and the result wire format.
//
// Parsing (RFC 8259, strict):
//   - duplicate object keys, trailing data, raw control characters inside
//     strings and unknown escapes are rejected;
//   - nesting deeper than kMaxDepth is rejected;
//   - errors carry the byte offset where parsing stopped.
//
// Serialization is deterministic: object keys come out sorted (std::map) and
// doubles go through format_double(). Output is always valid UTF-8: each
// ill-formed byte in a string is written as U+FFFD.
//
// Numbers: non-negative integers are held as uint64; negative integers and
// anything with a fraction or exponent as double.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace judgebox::jsonlite {

inline constexpr std::size_t kMaxDepth = 64;

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;  // includes "at offset N"
};

// Parse a document whose root must be an object. Returns an empty object and
// sets *error on failure.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);

// "%.6f" with trailing zeros trimmed, keeping one digit after the point.
std::string format_double(double d);

// Signed integer as a Value: uint64 when non-negative, double otherwise.
Value integer(std::int64_t n);

// Typed lookups: the default when the key is missing or holds another type.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
// Accepts both integer and floating-point members.
double get_double(const Object& obj, const std::string& key, double def = 0.0);

const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

}  // namespace judgebox::jsonlite
