#pragma once

// strata/jsonlite.hpp — Strict JSON parser and canonical writer.
//
// DETERMINISM:
//   Objects are std::map, so to_json() always emits keys in sorted order. Two documents
//   built from equal values serialize to identical bytes. Doubles are written with
//   format_double() (6 decimals, trailing zeros trimmed).
//
// STRICTNESS:
//   Duplicate keys, trailing data, NaN/Infinity and unterminated strings are errors.
//   Unsigned integers round-trip exactly through std::uint64_t. Negative numbers are
//   stored as double.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata::jsonlite {

struct Value;
using Array = std::vector<Value>;
using Object = std::map<std::string, Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v;
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse any JSON value. On failure returns null and sets *error.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a document whose root must be an object. Returns {} on any failure.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string to_json(const Object& obj);

// Two-space indented rendering for documents meant to be read by people.
std::string to_pretty_json(const Value& v);

// Type-safe extractors. Return `def` when the key is missing or has another type.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);

const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

inline Value make_string(std::string s) { return Value{std::move(s)}; }
inline Value make_u64(std::uint64_t n) { return Value{n}; }
inline Value make_bool(bool b) { return Value{b}; }

Value make_string_array(const std::vector<std::string>& items);

}  // namespace strata::jsonlite
