/**
 * @file utf8.h
 * @brief UTF-8 helpers: decoding, code point counting, BOM handling and
 *        terminal display width.
 *
 * Display width follows the usual terminal conventions: control characters
 * and combining marks take 0 columns, CJK, fullwidth forms and most emoji
 * take 2, everything else takes 1. Invalid sequences count as one
 * replacement character per offending byte.
 */

#ifndef TYPEDCSV_UTF8_H
#define TYPEDCSV_UTF8_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace typedcsv {

/// Length in bytes of the UTF-8 byte order mark.
constexpr size_t UTF8_BOM_LENGTH = 3;

/// true if `str` starts with EF BB BF.
bool has_utf8_bom(std::string_view str);

/// `str` without a leading UTF-8 BOM.
std::string_view strip_utf8_bom(std::string_view str);

/**
 * @brief Decode one code point starting at `pos`.
 *
 * @param[out] codepoint the decoded code point, 0xFFFD for invalid input
 * @return bytes consumed (1-4), or 0 when `pos` is at or past the end
 */
size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint);

/// Number of code points in `str`.
size_t utf8_length(std::string_view str);

/// Terminal columns occupied by a code point (0, 1 or 2).
int codepoint_width(uint32_t codepoint);

/// Terminal columns occupied by a UTF-8 string.
size_t utf8_display_width(std::string_view str);

/**
 * @brief Truncate to at most `max_width` columns at a code point boundary.
 *
 * When the string is cut and `max_width` leaves room for it, "..." is
 * appended within the limit.
 */
std::string utf8_truncate(std::string_view str, size_t max_width);

/// Truncate, then pad with spaces on the right to exactly `width` columns.
std::string utf8_pad_right(std::string_view str, size_t width);

} // namespace typedcsv

#endif // TYPEDCSV_UTF8_H
