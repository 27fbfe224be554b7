/**
 * @file utf8.cpp
 * @brief Implementation of UTF-8 helpers.
 */

#include "utf8.h"

#include <algorithm>
#include <iterator>

namespace typedcsv {

namespace {

struct CodepointRange {
  uint32_t first;
  uint32_t last;
};

// Zero-width: combining marks, zero-width joiners/spaces and the BOM
constexpr CodepointRange kZeroWidth[] = {
    {0x0300, 0x036F}, {0x1AB0, 0x1AFF}, {0x1DC0, 0x1DFF}, {0x200B, 0x200D},
    {0x2060, 0x2060}, {0x20D0, 0x20FF}, {0xFE20, 0xFE2F}, {0xFEFF, 0xFEFF},
};

// Double-width: CJK blocks, Hangul, fullwidth forms and emoji
constexpr CodepointRange kWide[] = {
    {0x1100, 0x115F},   {0x2E80, 0x303E},   {0x3041, 0x33FF},   {0x3400, 0x4DBF},
    {0x4E00, 0x9FFF},   {0xA000, 0xA4CF},   {0xA960, 0xA97F},   {0xAC00, 0xD7A3},
    {0xF900, 0xFAFF},   {0xFE10, 0xFE19},   {0xFE30, 0xFE6F},   {0xFF00, 0xFF60},
    {0xFFE0, 0xFFE6},   {0x1F300, 0x1F64F}, {0x1F680, 0x1F6FF}, {0x1F900, 0x1F9FF},
    {0x1FA70, 0x1FAFF}, {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD},
};

template <size_t N> bool in_table(const CodepointRange (&table)[N], uint32_t cp) {
  auto it = std::upper_bound(std::begin(table), std::end(table), cp,
                             [](uint32_t v, const CodepointRange& r) { return v < r.first; });
  if (it == std::begin(table)) return false;
  --it;
  return cp <= it->last;
}

} // namespace

bool has_utf8_bom(std::string_view str) {
  return str.size() >= UTF8_BOM_LENGTH && static_cast<uint8_t>(str[0]) == 0xEF &&
         static_cast<uint8_t>(str[1]) == 0xBB && static_cast<uint8_t>(str[2]) == 0xBF;
}

std::string_view strip_utf8_bom(std::string_view str) {
  return has_utf8_bom(str) ? str.substr(UTF8_BOM_LENGTH) : str;
}

size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint) {
  if (pos >= str.size()) {
    codepoint = 0xFFFD;
    return 0;
  }

  uint8_t lead = static_cast<uint8_t>(str[pos]);
  if (lead < 0x80) {
    codepoint = lead;
    return 1;
  }

  size_t len;
  uint32_t cp;
  if ((lead & 0xE0) == 0xC0) {
    len = 2;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    len = 3;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    len = 4;
    cp = lead & 0x07;
  } else {
    codepoint = 0xFFFD;
    return 1;
  }

  if (pos + len > str.size()) {
    codepoint = 0xFFFD;
    return 1;
  }

  for (size_t i = 1; i < len; ++i) {
    uint8_t cont = static_cast<uint8_t>(str[pos + i]);
    if ((cont & 0xC0) != 0x80) {
      codepoint = 0xFFFD;
      return 1;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }

  // Overlong encodings, surrogates and values past U+10FFFF
  static constexpr uint32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < kMinForLength[len] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
    codepoint = 0xFFFD;
    return len;
  }

  codepoint = cp;
  return len;
}

size_t utf8_length(std::string_view str) {
  size_t count = 0;
  size_t pos = 0;
  uint32_t cp;
  while (size_t len = utf8_decode(str, pos, cp)) {
    pos += len;
    ++count;
  }
  return count;
}

int codepoint_width(uint32_t cp) {
  if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) {
    return 0;
  }
  if (cp < 0x300) {
    return 1;
  }
  if (in_table(kZeroWidth, cp)) {
    return 0;
  }
  return in_table(kWide, cp) ? 2 : 1;
}

size_t utf8_display_width(std::string_view str) {
  size_t width = 0;
  size_t pos = 0;
  uint32_t cp;
  while (size_t len = utf8_decode(str, pos, cp)) {
    width += codepoint_width(cp);
    pos += len;
  }
  return width;
}

std::string utf8_truncate(std::string_view str, size_t max_width) {
  if (utf8_display_width(str) <= max_width) {
    return std::string(str);
  }

  constexpr size_t ELLIPSIS_WIDTH = 3;
  const bool ellipsis = max_width > ELLIPSIS_WIDTH;
  const size_t target = ellipsis ? max_width - ELLIPSIS_WIDTH : max_width;

  size_t width = 0;
  size_t pos = 0;
  uint32_t cp;
  while (size_t len = utf8_decode(str, pos, cp)) {
    int w = codepoint_width(cp);
    if (width + w > target) break;
    width += w;
    pos += len;
  }

  std::string out(str.substr(0, pos));
  if (ellipsis) out += "...";
  return out;
}

std::string utf8_pad_right(std::string_view str, size_t width) {
  std::string out = utf8_truncate(str, width);
  size_t used = utf8_display_width(out);
  if (used < width) out.append(width - used, ' ');
  return out;
}

} // namespace typedcsv
