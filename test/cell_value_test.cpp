/**
 * @file cell_value_test.cpp
 * @brief Tests for value coercion, equality and typed conversion.
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <unordered_set>
#include "cell_value.h"

using namespace typedcsv;

TEST(CoerceValueTest, EmptyIsNull) {
    EXPECT_TRUE(coerce_value("").is_null());
}

TEST(CoerceValueTest, IntegerStaysInteger) {
    CellValue v = coerce_value("42");
    ASSERT_TRUE(v.is_int());
    EXPECT_EQ(v.as_int(), 42);
}

TEST(CoerceValueTest, DecimalPointMeansFloat) {
    CellValue v = coerce_value("42.0");
    ASSERT_TRUE(v.is_float());
    EXPECT_DOUBLE_EQ(v.as_float(), 42.0);
}

TEST(CoerceValueTest, BooleanBeatsNumeric) {
    CellValue t = coerce_value("true");
    ASSERT_TRUE(t.is_bool());
    EXPECT_TRUE(t.as_bool());
    CellValue f = coerce_value("FALSE");
    ASSERT_TRUE(f.is_bool());
    EXPECT_FALSE(f.as_bool());
    EXPECT_TRUE(coerce_value("True").is_bool());
}

TEST(CoerceValueTest, NumericWordsAreNotBooleans) {
    EXPECT_TRUE(coerce_value("1").is_int());
    EXPECT_TRUE(coerce_value("0").is_int());
    EXPECT_TRUE(coerce_value("yes").is_string());
}

TEST(CoerceValueTest, Signs) {
    EXPECT_EQ(coerce_value("-17").as_int(), -17);
    EXPECT_EQ(coerce_value("+17").as_int(), 17);
    EXPECT_DOUBLE_EQ(coerce_value("-2.5").as_float(), -2.5);
    EXPECT_DOUBLE_EQ(coerce_value("+2.5").as_float(), 2.5);
    EXPECT_TRUE(coerce_value("+").is_string());
    EXPECT_TRUE(coerce_value("-").is_string());
    EXPECT_TRUE(coerce_value("+-1").is_string());
}

TEST(CoerceValueTest, ExponentIsFloat) {
    CellValue v = coerce_value("1e3");
    ASSERT_TRUE(v.is_float());
    EXPECT_DOUBLE_EQ(v.as_float(), 1000.0);
    EXPECT_TRUE(coerce_value("2.5E-2").is_float());
}

TEST(CoerceValueTest, Int64Limits) {
    CellValue max = coerce_value("9223372036854775807");
    ASSERT_TRUE(max.is_int());
    EXPECT_EQ(max.as_int(), std::numeric_limits<int64_t>::max());
    CellValue min = coerce_value("-9223372036854775808");
    ASSERT_TRUE(min.is_int());
    EXPECT_EQ(min.as_int(), std::numeric_limits<int64_t>::min());
}

TEST(CoerceValueTest, Int64OverflowBecomesFloat) {
    CellValue v = coerce_value("9223372036854775808");
    ASSERT_TRUE(v.is_float());
    EXPECT_DOUBLE_EQ(v.as_float(), 9223372036854775808.0);
}

TEST(CoerceValueTest, LocaleInvariant) {
    EXPECT_TRUE(coerce_value("1,5").is_string());
    EXPECT_TRUE(coerce_value("1 000").is_string());
    EXPECT_DOUBLE_EQ(coerce_value("1.5").as_float(), 1.5);
}

TEST(CoerceValueTest, NonFiniteSpellingsStayStrings) {
    EXPECT_TRUE(coerce_value("inf").is_string());
    EXPECT_TRUE(coerce_value("NaN").is_string());
    EXPECT_TRUE(coerce_value("1e999").is_string());
}

TEST(CoerceValueTest, UnparseableIsVerbatimString) {
    CellValue v = coerce_value("12abc");
    ASSERT_TRUE(v.is_string());
    EXPECT_EQ(v.as_string(), "12abc");
    EXPECT_TRUE(coerce_value(" 42").is_string());
}

TEST(CellValueTest, ToString) {
    EXPECT_EQ(CellValue::null().to_string(), "");
    EXPECT_EQ(CellValue::boolean(true).to_string(), "true");
    EXPECT_EQ(CellValue::integer(-5).to_string(), "-5");
    EXPECT_EQ(CellValue::real(42.0).to_string(), "42");
    EXPECT_EQ(CellValue::real(2.5).to_string(), "2.5");
    EXPECT_EQ(CellValue::real(0.1).to_string(), "0.1");
    EXPECT_EQ(CellValue::string("abc").to_string(), "abc");
}

TEST(CellValueTest, ToStringRoundTrips) {
    double d = 0.1 + 0.2;
    auto back = parse_double(CellValue::real(d).to_string());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, d);
}

TEST(CellValueTest, NumericEquality) {
    EXPECT_EQ(CellValue::integer(2), CellValue::real(2.0));
    EXPECT_EQ(CellValue::real(2.0), CellValue::integer(2));
    EXPECT_NE(CellValue::integer(2), CellValue::real(2.5));
    EXPECT_NE(CellValue::integer(1), CellValue::boolean(true));
    EXPECT_NE(CellValue::integer(1), CellValue::string("1"));
    EXPECT_EQ(CellValue::null(), CellValue::null());
    EXPECT_NE(CellValue::null(), CellValue::string(""));
}

TEST(CellValueTest, HashConsistentWithEquality) {
    EXPECT_EQ(CellValue::integer(7).hash(), CellValue::real(7.0).hash());

    std::unordered_set<CellValue, CellValueHash> set;
    set.insert(CellValue::integer(3));
    EXPECT_EQ(set.count(CellValue::real(3.0)), 1u);
    EXPECT_EQ(set.count(CellValue::real(3.5)), 0u);
    EXPECT_EQ(set.count(CellValue::string("3")), 0u);
}

TEST(CellValueTest, NullOrEmpty) {
    EXPECT_TRUE(CellValue::null().is_null_or_empty());
    EXPECT_TRUE(CellValue::string("").is_null_or_empty());
    EXPECT_FALSE(CellValue::string(" ").is_null_or_empty());
    EXPECT_FALSE(CellValue::integer(0).is_null_or_empty());
}

TEST(CellValueTest, Numeric) {
    EXPECT_DOUBLE_EQ(*CellValue::integer(4).numeric(), 4.0);
    EXPECT_DOUBLE_EQ(*CellValue::real(4.5).numeric(), 4.5);
    EXPECT_FALSE(CellValue::boolean(true).numeric().has_value());
    EXPECT_FALSE(CellValue::string("4").numeric().has_value());
    EXPECT_FALSE(CellValue::null().numeric().has_value());
}

TEST(ConversionTest, NullIsNa) {
    auto r = CellValue::null().as<int64_t>();
    EXPECT_TRUE(r.is_na());
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.get_or(-1), -1);
    EXPECT_TRUE(CellValue::null().as<std::string>().is_na());
}

TEST(ConversionTest, ToBool) {
    EXPECT_TRUE(CellValue::integer(5).as<bool>().get());
    EXPECT_FALSE(CellValue::real(0.0).as<bool>().get());
    EXPECT_TRUE(CellValue::string("TRUE").as<bool>().get());
    auto bad = CellValue::string("maybe").as<bool>();
    EXPECT_FALSE(bad.ok());
    EXPECT_FALSE(bad.is_na());
    EXPECT_NE(bad.error, nullptr);
}

TEST(ConversionTest, ToInt64) {
    EXPECT_EQ(CellValue::boolean(true).as<int64_t>().get(), 1);
    EXPECT_EQ(CellValue::real(2.5).as<int64_t>().get(), 2);
    EXPECT_EQ(CellValue::real(3.5).as<int64_t>().get(), 4);
    EXPECT_EQ(CellValue::real(-2.5).as<int64_t>().get(), -2);
    EXPECT_EQ(CellValue::string("12").as<int64_t>().get(), 12);
    EXPECT_EQ(CellValue::string("12.6").as<int64_t>().get(), 13);
    EXPECT_FALSE(CellValue::string("abc").as<int64_t>().ok());
    EXPECT_FALSE(CellValue::real(1e300).as<int64_t>().ok());
}

TEST(ConversionTest, ToIntRange) {
    EXPECT_EQ(CellValue::integer(123).as<int>().get(), 123);
    EXPECT_FALSE(CellValue::integer(int64_t(1) << 40).as<int>().ok());
}

TEST(ConversionTest, ToDouble) {
    EXPECT_DOUBLE_EQ(CellValue::integer(3).as<double>().get(), 3.0);
    EXPECT_DOUBLE_EQ(CellValue::boolean(false).as<double>().get(), 0.0);
    EXPECT_DOUBLE_EQ(CellValue::string("1.25").as<double>().get(), 1.25);
    EXPECT_FALSE(CellValue::string("true").as<double>().ok());
}

TEST(ConversionTest, ToStringAlwaysSucceeds) {
    EXPECT_EQ(CellValue::real(42.0).as<std::string>().get(), "42");
    EXPECT_EQ(CellValue::boolean(false).as<std::string>().get(), "false");
}

TEST(ConversionTest, GetThrowsOnError) {
    EXPECT_THROW(CellValue::string("x").as<int64_t>().get(), std::runtime_error);
    EXPECT_THROW(CellValue::null().as<int64_t>().get(), std::runtime_error);
}

TEST(ConversionTest, IsConvertible) {
    EXPECT_TRUE(is_convertible(CellValue::null(), CellType::Int));
    EXPECT_TRUE(is_convertible(CellValue::string("7"), CellType::Int));
    EXPECT_FALSE(is_convertible(CellValue::string("seven"), CellType::Int));
    EXPECT_TRUE(is_convertible(CellValue::integer(7), CellType::Float));
    EXPECT_TRUE(is_convertible(CellValue::string("anything"), CellType::String));
    EXPECT_FALSE(is_convertible(CellValue::string("anything"), CellType::Bool));
}

TEST(ParseHelpersTest, ParseInt64) {
    EXPECT_EQ(*parse_int64("123"), 123);
    EXPECT_FALSE(parse_int64("").has_value());
    EXPECT_FALSE(parse_int64("12.0").has_value());
    EXPECT_FALSE(parse_int64("99999999999999999999").has_value());
}

TEST(ParseHelpersTest, ParseDouble) {
    EXPECT_DOUBLE_EQ(*parse_double("3.25"), 3.25);
    EXPECT_DOUBLE_EQ(*parse_double("+.5"), 0.5);
    EXPECT_FALSE(parse_double("3.25x").has_value());
    EXPECT_FALSE(parse_double("nan").has_value());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
