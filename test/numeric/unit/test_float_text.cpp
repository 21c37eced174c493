/***
 * Name: test_float_text
 * Purpose: Text float parsing and shortest repr formatting.
 */
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "pymarshal/exceptions/malformed_numeric_error.h"
#include "pymarshal/numeric/float_text.h"

using namespace pymarshal::numeric;
using pymarshal::exceptions::MalformedNumericError;

TEST(FloatText, ParsesDecimalForms) {
  EXPECT_DOUBLE_EQ(ParseFloatText("1.5"), 1.5);
  EXPECT_DOUBLE_EQ(ParseFloatText("-0.25"), -0.25);
  EXPECT_DOUBLE_EQ(ParseFloatText("1e10"), 1e10);
  EXPECT_DOUBLE_EQ(ParseFloatText("2.5E-3"), 2.5e-3);
}

TEST(FloatText, ParsesSpecialValues) {
  EXPECT_TRUE(std::isinf(ParseFloatText("inf")));
  EXPECT_LT(ParseFloatText("-Infinity"), 0.0);
  EXPECT_TRUE(std::isinf(ParseFloatText("-Infinity")));
  EXPECT_TRUE(std::isnan(ParseFloatText("nan")));
}

TEST(FloatText, OutOfRangeSaturates) {
  EXPECT_EQ(ParseFloatText("1e400"), std::numeric_limits<double>::infinity());
  EXPECT_EQ(ParseFloatText("1e-400"), 0.0);
}

TEST(FloatText, RejectsGarbage) {
  EXPECT_THROW(ParseFloatText(""), MalformedNumericError);
  EXPECT_THROW(ParseFloatText("abc"), MalformedNumericError);
  EXPECT_THROW(ParseFloatText("1.5x"), MalformedNumericError);
  EXPECT_THROW(ParseFloatText("1e"), MalformedNumericError);
}

TEST(FloatText, FormatsPositional) {
  EXPECT_EQ(FormatFloatText(1.0), "1.0");
  EXPECT_EQ(FormatFloatText(1.5), "1.5");
  EXPECT_EQ(FormatFloatText(0.1), "0.1");
  EXPECT_EQ(FormatFloatText(-2.5), "-2.5");
  EXPECT_EQ(FormatFloatText(0.0001), "0.0001");
  EXPECT_EQ(FormatFloatText(123456789.0), "123456789.0");
  EXPECT_EQ(FormatFloatText(0.0), "0.0");
}

TEST(FloatText, FormatsExponent) {
  EXPECT_EQ(FormatFloatText(1e16), "1e+16");
  EXPECT_EQ(FormatFloatText(1e-05), "1e-05");
  EXPECT_EQ(FormatFloatText(1.5e300), "1.5e+300");
}

TEST(FloatText, FormatsSpecialValues) {
  EXPECT_EQ(FormatFloatText(std::numeric_limits<double>::infinity()), "inf");
  EXPECT_EQ(FormatFloatText(-std::numeric_limits<double>::infinity()), "-inf");
  EXPECT_EQ(FormatFloatText(std::numeric_limits<double>::quiet_NaN()), "nan");
}
