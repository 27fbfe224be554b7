/**
 * @file utf8_test.cpp
 * @brief Tests for UTF-8 utilities (decoding, length, display width).
 */

#include "utf8.h"

#include <gtest/gtest.h>

using namespace typedcsv;

class Utf8Test : public ::testing::Test {};

// =============================================================================
// UTF-8 Decode Tests
// =============================================================================

TEST_F(Utf8Test, DecodeAscii) {
  uint32_t cp;
  std::string_view str = "ABC";

  EXPECT_EQ(utf8_decode(str, 0, cp), 1u);
  EXPECT_EQ(cp, 'A');

  EXPECT_EQ(utf8_decode(str, 2, cp), 1u);
  EXPECT_EQ(cp, 'C');
}

TEST_F(Utf8Test, DecodeMultiByte) {
  uint32_t cp;
  // ñ (U+00F1) is encoded as C3 B1
  EXPECT_EQ(utf8_decode("\xC3\xB1", 0, cp), 2u);
  EXPECT_EQ(cp, 0x00F1u);

  // 日 (U+65E5) is encoded as E6 97 A5
  EXPECT_EQ(utf8_decode("\xE6\x97\xA5", 0, cp), 3u);
  EXPECT_EQ(cp, 0x65E5u);

  // 😀 (U+1F600) is encoded as F0 9F 98 80
  EXPECT_EQ(utf8_decode("\xF0\x9F\x98\x80", 0, cp), 4u);
  EXPECT_EQ(cp, 0x1F600u);
}

TEST_F(Utf8Test, DecodeInvalid) {
  uint32_t cp;
  // Stray continuation byte
  EXPECT_EQ(utf8_decode("\x80", 0, cp), 1u);
  EXPECT_EQ(cp, 0xFFFDu);

  // Truncated sequence
  EXPECT_EQ(utf8_decode("\xE6\x97", 0, cp), 1u);
  EXPECT_EQ(cp, 0xFFFDu);

  // Overlong encoding of '/'
  EXPECT_EQ(utf8_decode("\xC0\xAF", 0, cp), 2u);
  EXPECT_EQ(cp, 0xFFFDu);
}

TEST_F(Utf8Test, DecodePastEnd) {
  uint32_t cp;
  EXPECT_EQ(utf8_decode("a", 1, cp), 0u);
}

// =============================================================================
// Length and BOM Tests
// =============================================================================

TEST_F(Utf8Test, LengthCountsCodePoints) {
  EXPECT_EQ(utf8_length(""), 0u);
  EXPECT_EQ(utf8_length("abc"), 3u);
  EXPECT_EQ(utf8_length("\xC3\xA9t\xC3\xA9"), 3u);
  EXPECT_EQ(utf8_length("\xE6\x97\xA5\xE6\x9C\xAC"), 2u);
}

TEST_F(Utf8Test, Bom) {
  EXPECT_TRUE(has_utf8_bom("\xEF\xBB\xBFx"));
  EXPECT_FALSE(has_utf8_bom("\xEF\xBB"));
  EXPECT_EQ(strip_utf8_bom("\xEF\xBB\xBF" "abc"), "abc");
  EXPECT_EQ(strip_utf8_bom("abc"), "abc");
}

// =============================================================================
// Display Width Tests
// =============================================================================

TEST_F(Utf8Test, CodepointWidth) {
  EXPECT_EQ(codepoint_width('a'), 1);
  EXPECT_EQ(codepoint_width('\t'), 0);
  EXPECT_EQ(codepoint_width(0x0301), 0);   // combining acute accent
  EXPECT_EQ(codepoint_width(0x65E5), 2);   // CJK
  EXPECT_EQ(codepoint_width(0xAC00), 2);   // Hangul
  EXPECT_EQ(codepoint_width(0x1F600), 2);  // emoji
  EXPECT_EQ(codepoint_width(0x00E9), 1);
}

TEST_F(Utf8Test, DisplayWidth) {
  EXPECT_EQ(utf8_display_width("hello"), 5u);
  EXPECT_EQ(utf8_display_width("\xE6\x97\xA5\xE6\x9C\xAC"), 4u);
  EXPECT_EQ(utf8_display_width("e\xCC\x81"), 1u);
}

TEST_F(Utf8Test, TruncateFits) {
  EXPECT_EQ(utf8_truncate("short", 10), "short");
  EXPECT_EQ(utf8_truncate("exact", 5), "exact");
}

TEST_F(Utf8Test, TruncateWithEllipsis) {
  EXPECT_EQ(utf8_truncate("abcdefghij", 6), "abc...");
}

TEST_F(Utf8Test, TruncateNarrowWidth) {
  EXPECT_EQ(utf8_truncate("abcdef", 3), "abc");
}

TEST_F(Utf8Test, TruncateDoesNotSplitWideCharacters) {
  // 日本語 is 6 columns wide; target 5 leaves 2 columns before the ellipsis
  EXPECT_EQ(utf8_truncate("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E", 5), "\xE6\x97\xA5...");
  EXPECT_EQ(utf8_truncate("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E", 3), "\xE6\x97\xA5");
}

TEST_F(Utf8Test, PadRight) {
  EXPECT_EQ(utf8_pad_right("ab", 4), "ab  ");
  EXPECT_EQ(utf8_pad_right("\xE6\x97\xA5", 4), "\xE6\x97\xA5  ");
  EXPECT_EQ(utf8_pad_right("abcdefgh", 6), "abc...");
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
