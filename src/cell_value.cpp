#include "cell_value.h"

#include "common_defs.h"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <functional>
#include <limits>
#include <fast_float/fast_float.h>

namespace typedcsv {

namespace {

// Bounds of the doubles that convert to int64 without overflow: [-2^63, 2^63)
constexpr double kInt64Lower = -9223372036854775808.0;
constexpr double kInt64Upper = 9223372036854775808.0;

bool integral_in_int64_range(double d) {
  return d >= kInt64Lower && d < kInt64Upper && std::trunc(d) == d;
}

std::string format_double(double d) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.15g", d);
  auto back = parse_double(buf);
  if (!back || *back != d) {
    std::snprintf(buf, sizeof(buf), "%.17g", d);
  }
  return buf;
}

ExtractResult<int64_t> double_to_int64(double d) {
  if (!std::isfinite(d)) {
    return {std::nullopt, "Non-finite value cannot be converted to integer"};
  }
  // Round half to even, as the default floating-point rounding mode does
  double r = std::nearbyint(d);
  if (r < kInt64Lower || r >= kInt64Upper) {
    return {std::nullopt, "Value out of range for integer"};
  }
  return {static_cast<int64_t>(r), nullptr};
}

} // namespace

const char* cell_type_to_string(CellType type) {
  switch (type) {
  case CellType::Null:
    return "null";
  case CellType::Bool:
    return "bool";
  case CellType::Int:
    return "int";
  case CellType::Float:
    return "float";
  case CellType::String:
    return "string";
  }
  return "unknown";
}

std::optional<bool> parse_bool(std::string_view text) {
  if (iequals(text, "true")) return true;
  if (iequals(text, "false")) return false;
  return std::nullopt;
}

std::optional<int64_t> parse_int64(std::string_view text) {
  if (text.empty()) return std::nullopt;

  const char* first = text.data();
  const char* last = text.data() + text.size();
  // std::from_chars rejects a leading '+'
  if (*first == '+') {
    ++first;
    if (first == last || *first == '-') return std::nullopt;
  }

  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> parse_double(std::string_view text) {
  if (text.empty()) return std::nullopt;

  const char* first = text.data();
  const char* last = text.data() + text.size();
  // Strip leading '+' that fast_float doesn't accept
  if (*first == '+') {
    ++first;
    if (first == last || *first == '-') return std::nullopt;
  }

  double result = 0.0;
  auto [ptr, ec] = fast_float::from_chars(first, last, result);
  if (ec != std::errc() || ptr != last || !std::isfinite(result)) {
    return std::nullopt;
  }
  return result;
}

CellValue coerce_value(std::string_view text) {
  if (text.empty()) {
    return CellValue::null();
  }

  if (auto b = parse_bool(text)) {
    return CellValue::boolean(*b);
  }

  // Integer first so "42" stays exact; a '.' always means floating point
  if (text.find('.') == std::string_view::npos) {
    if (auto i = parse_int64(text)) {
      return CellValue::integer(*i);
    }
  }

  if (auto d = parse_double(text)) {
    return CellValue::real(*d);
  }

  return CellValue::string(std::string(text));
}

std::optional<double> CellValue::numeric() const {
  if (is_int()) return static_cast<double>(as_int());
  if (is_float()) return as_float();
  return std::nullopt;
}

std::string CellValue::to_string() const {
  switch (type()) {
  case CellType::Null:
    return std::string();
  case CellType::Bool:
    return as_bool() ? "true" : "false";
  case CellType::Int:
    return std::to_string(as_int());
  case CellType::Float:
    return format_double(as_float());
  case CellType::String:
    return as_string();
  }
  return std::string();
}

size_t CellValue::hash() const {
  switch (type()) {
  case CellType::Null:
    return 0x9e3779b97f4a7c15ULL;
  case CellType::Bool:
    return as_bool() ? 0x51ed270b27e0a8d3ULL : 0x2545f4914f6cdd1dULL;
  case CellType::Int:
    return std::hash<int64_t>()(as_int());
  case CellType::Float: {
    double d = as_float();
    // Must agree with the Int hash for values that compare equal to an Int
    if (integral_in_int64_range(d)) {
      return std::hash<int64_t>()(static_cast<int64_t>(d));
    }
    return std::hash<double>()(d);
  }
  case CellType::String:
    return std::hash<std::string>()(as_string());
  }
  return 0;
}

bool CellValue::operator==(const CellValue& other) const {
  if (is_numeric() && other.is_numeric()) {
    if (is_int() && other.is_int()) return as_int() == other.as_int();
    if (is_float() && other.is_float()) return as_float() == other.as_float();
    int64_t i = is_int() ? as_int() : other.as_int();
    double d = is_float() ? as_float() : other.as_float();
    return integral_in_int64_range(d) && static_cast<int64_t>(d) == i;
  }
  return v_ == other.v_;
}

template <> ExtractResult<bool> CellValue::as<bool>() const {
  switch (type()) {
  case CellType::Null:
    return {std::nullopt, nullptr};
  case CellType::Bool:
    return {as_bool(), nullptr};
  case CellType::Int:
    return {as_int() != 0, nullptr};
  case CellType::Float:
    return {as_float() != 0.0, nullptr};
  case CellType::String:
    if (auto b = parse_bool(trim_view(as_string()))) return {*b, nullptr};
    return {std::nullopt, "Invalid boolean value"};
  }
  return {std::nullopt, "Invalid boolean value"};
}

template <> ExtractResult<int64_t> CellValue::as<int64_t>() const {
  switch (type()) {
  case CellType::Null:
    return {std::nullopt, nullptr};
  case CellType::Bool:
    return {as_bool() ? 1 : 0, nullptr};
  case CellType::Int:
    return {as_int(), nullptr};
  case CellType::Float:
    return double_to_int64(as_float());
  case CellType::String: {
    CellValue v = coerce_value(trim_view(as_string()));
    if (v.is_int()) return {v.as_int(), nullptr};
    if (v.is_float()) return double_to_int64(v.as_float());
    return {std::nullopt, "Invalid integer value"};
  }
  }
  return {std::nullopt, "Invalid integer value"};
}

template <> ExtractResult<int> CellValue::as<int>() const {
  auto wide = as<int64_t>();
  if (!wide.ok()) return {std::nullopt, wide.error};
  if (*wide.value < std::numeric_limits<int>::min() ||
      *wide.value > std::numeric_limits<int>::max()) {
    return {std::nullopt, "Value out of range for int"};
  }
  return {static_cast<int>(*wide.value), nullptr};
}

template <> ExtractResult<double> CellValue::as<double>() const {
  switch (type()) {
  case CellType::Null:
    return {std::nullopt, nullptr};
  case CellType::Bool:
    return {as_bool() ? 1.0 : 0.0, nullptr};
  case CellType::Int:
    return {static_cast<double>(as_int()), nullptr};
  case CellType::Float:
    return {as_float(), nullptr};
  case CellType::String: {
    CellValue v = coerce_value(trim_view(as_string()));
    if (auto d = v.numeric()) return {*d, nullptr};
    return {std::nullopt, "Invalid numeric value"};
  }
  }
  return {std::nullopt, "Invalid numeric value"};
}

template <> ExtractResult<std::string> CellValue::as<std::string>() const {
  if (is_null()) return {std::nullopt, nullptr};
  return {to_string(), nullptr};
}

bool is_convertible(const CellValue& v, CellType target) {
  if (v.is_null()) return true;
  switch (target) {
  case CellType::Null:
    return false;
  case CellType::Bool:
    return v.as<bool>().ok();
  case CellType::Int:
    return v.as<int64_t>().ok();
  case CellType::Float:
    return v.as<double>().ok();
  case CellType::String:
    return true;
  }
  return false;
}

} // namespace typedcsv
