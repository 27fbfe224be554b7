/**
 * @file error_test.cpp
 * @brief Tests for ParseError formatting, ErrorCollector and exceptions.
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "error.h"

using namespace typedcsv;

TEST(ParseErrorTest, ToString) {
    ParseError err(ErrorCode::UNCLOSED_QUOTE, ErrorSeverity::FATAL, 3, 5, 42,
                   "Quoted field is not closed before end of line", "\"abc");
    EXPECT_EQ(err.to_string(),
              "[FATAL] UNCLOSED_QUOTE at line 3, column 5 (byte 42): "
              "Quoted field is not closed before end of line\n  Context: \"abc");
    EXPECT_EQ(err.row, ParseError::npos);
}

TEST(ParseErrorTest, CodeAndSeverityNames) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::INCONSISTENT_FIELD_COUNT),
                 "INCONSISTENT_FIELD_COUNT");
    EXPECT_STREQ(error_code_to_string(ErrorCode::MISSING_FIELD), "MISSING_FIELD");
    EXPECT_STREQ(error_code_to_string(ErrorCode::IO_ERROR), "IO_ERROR");
    EXPECT_STREQ(error_severity_to_string(ErrorSeverity::WARNING), "WARNING");
    EXPECT_STREQ(error_severity_to_string(ErrorSeverity::FATAL), "FATAL");
}

TEST(ErrorCollectorTest, CountsAndFatal) {
    ErrorCollector errors;
    EXPECT_EQ(errors.error_count(), 0u);
    EXPECT_EQ(errors.first_fatal(), nullptr);

    errors.add_error(ErrorCode::INCONSISTENT_FIELD_COUNT, ErrorSeverity::WARNING, 2, 3, 10,
                     "Expected 3 fields but found 2");
    EXPECT_FALSE(errors.has_fatal_errors());
    EXPECT_EQ(errors.warning_count(), 1u);
    EXPECT_EQ(errors.first_fatal(), nullptr);

    errors.add_error(ErrorCode::UNCLOSED_QUOTE, ErrorSeverity::FATAL, 4, 1, 30, "open quote");
    EXPECT_TRUE(errors.has_fatal_errors());
    ASSERT_NE(errors.first_fatal(), nullptr);
    EXPECT_EQ(errors.first_fatal()->line, 4u);
    EXPECT_EQ(errors.error_count(), 2u);
    EXPECT_EQ(errors.warning_count(), 1u);
}

TEST(ParseExceptionTest, CarriesError) {
    ParseError err(ErrorCode::EMPTY_HEADER, ErrorSeverity::FATAL, 1, 1, 0,
                   "Header line is missing");
    ParseException e(err);
    EXPECT_STREQ(e.what(), "Header line is missing");
    EXPECT_EQ(e.error().code, ErrorCode::EMPTY_HEADER);
    EXPECT_EQ(e.error().line, 1u);
}

TEST(SchemaExceptionTest, Message) {
    SchemaException e("Level", "Range minimum 10 exceeds maximum 1");
    EXPECT_EQ(e.field(), "Level");
    EXPECT_STREQ(e.what(), "Invalid constraint on field 'Level': Range minimum 10 exceeds maximum 1");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
