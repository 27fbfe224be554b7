/**
 * @file cell_value.h
 * @brief Typed cell values and the text-to-value coercion cascade.
 */

#ifndef TYPEDCSV_CELL_VALUE_H
#define TYPEDCSV_CELL_VALUE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace typedcsv {

enum class CellType : uint8_t {
  Null = 0,
  Bool = 1,
  Int = 2,
  Float = 3,
  String = 4
};

const char* cell_type_to_string(CellType type);

/**
 * Result structure for typed conversions.
 * Contains either a converted value, an NA marker, or an error message.
 */
template <typename T>
struct ExtractResult {
  std::optional<T> value;
  const char* error = nullptr;

  bool ok() const { return value.has_value(); }
  bool is_na() const { return !value.has_value() && error == nullptr; }

  T get() const {
    if (!value.has_value()) {
      throw std::runtime_error(error ? error : "Value is NA");
    }
    return *value;
  }

  T get_or(T default_value) const { return value.value_or(default_value); }
};

/**
 * @brief A coerced cell: Null, Bool, Int (int64), Float (double) or String.
 *
 * Int and Float compare by numeric value (Int 2 == Float 2.0); Bool only
 * equals Bool; strings compare byte-exactly. CellValueHash is consistent with
 * this equality.
 */
class CellValue {
public:
  CellValue() = default;

  static CellValue null() { return CellValue(); }
  static CellValue boolean(bool b) { return CellValue(Storage(std::in_place_index<1>, b)); }
  static CellValue integer(int64_t i) { return CellValue(Storage(std::in_place_index<2>, i)); }
  static CellValue real(double d) { return CellValue(Storage(std::in_place_index<3>, d)); }
  static CellValue string(std::string s) {
    return CellValue(Storage(std::in_place_index<4>, std::move(s)));
  }

  CellType type() const { return static_cast<CellType>(v_.index()); }

  bool is_null() const { return v_.index() == 0; }
  bool is_bool() const { return v_.index() == 1; }
  bool is_int() const { return v_.index() == 2; }
  bool is_float() const { return v_.index() == 3; }
  bool is_string() const { return v_.index() == 4; }
  bool is_numeric() const { return is_int() || is_float(); }

  /// Null, or a String with no characters.
  bool is_null_or_empty() const { return is_null() || (is_string() && std::get<4>(v_).empty()); }

  // Unchecked accessors; throw std::bad_variant_access on type mismatch.
  bool as_bool() const { return std::get<1>(v_); }
  int64_t as_int() const { return std::get<2>(v_); }
  double as_float() const { return std::get<3>(v_); }
  const std::string& as_string() const { return std::get<4>(v_); }

  /// Numeric value of an Int or Float; nullopt for every other type.
  std::optional<double> numeric() const;

  /// Text form: "" for Null, "true"/"false", decimal integers, shortest
  /// round-tripping float text ("42" for 42.0), strings verbatim.
  std::string to_string() const;

  /**
   * @brief Convert to T using the explicit conversion rules.
   *
   * Supported T: bool, int, int64_t, double, std::string. Null converts to
   * NA for every T.
   */
  template <typename T> ExtractResult<T> as() const;

  size_t hash() const;

  bool operator==(const CellValue& other) const;
  bool operator!=(const CellValue& other) const { return !(*this == other); }

private:
  using Storage = std::variant<std::monostate, bool, int64_t, double, std::string>;

  explicit CellValue(Storage v) : v_(std::move(v)) {}

  Storage v_;
};

struct CellValueHash {
  size_t operator()(const CellValue& v) const { return v.hash(); }
};

template <> ExtractResult<bool> CellValue::as<bool>() const;
template <> ExtractResult<int> CellValue::as<int>() const;
template <> ExtractResult<int64_t> CellValue::as<int64_t>() const;
template <> ExtractResult<double> CellValue::as<double>() const;
template <> ExtractResult<std::string> CellValue::as<std::string>() const;

/// true if `v` converts to `target` under CellValue::as (Null always does).
bool is_convertible(const CellValue& v, CellType target);

/**
 * @brief Coerce field text to a CellValue.
 *
 * Cascade: empty -> Null; "true"/"false" (case-insensitive) -> Bool; without
 * a '.', sign + digits -> Int when it fits int64; finite float text -> Float;
 * anything else -> String. Integers that overflow int64 fall through to Float.
 * The caller trims the text first when trimming is enabled.
 */
CellValue coerce_value(std::string_view text);

/// Integer step of the cascade alone. nullopt on non-integer text or overflow.
std::optional<int64_t> parse_int64(std::string_view text);

/// Float step of the cascade alone (locale-invariant, finite only).
std::optional<double> parse_double(std::string_view text);

/// "true"/"false" in any ASCII case.
std::optional<bool> parse_bool(std::string_view text);

} // namespace typedcsv

#endif // TYPEDCSV_CELL_VALUE_H
