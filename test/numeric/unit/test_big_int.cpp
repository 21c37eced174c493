/***
 * Name: test_big_int
 * Purpose: Arbitrary-precision integer conversions and limb boundaries.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include "pymarshal/exceptions/malformed_numeric_error.h"
#include "pymarshal/numeric/big_int.h"

using pymarshal::numeric::BigInt;
using pymarshal::exceptions::MalformedNumericError;

TEST(BigInt, ZeroIsCanonical) {
  const BigInt zero = BigInt::FromInt64(0);
  EXPECT_TRUE(zero.isZero());
  EXPECT_FALSE(zero.isNegative());
  EXPECT_EQ(zero.toDecimal(), "0");
  EXPECT_EQ(BigInt::FromDecimal("-0"), zero);
  EXPECT_EQ(BigInt::FromLimbs(true, {0, 0}), zero);
}

TEST(BigInt, DecimalRoundTripLargeValue) {
  const char* text = "-123456789012345678901234567890123456789";
  const BigInt value = BigInt::FromDecimal(text);
  EXPECT_TRUE(value.isNegative());
  EXPECT_EQ(value.toDecimal(), text);
}

TEST(BigInt, DecimalChunkBoundary) {
  EXPECT_EQ(BigInt::FromDecimal("1000000000").toDecimal(), "1000000000");
  EXPECT_EQ(BigInt::FromDecimal("+999999999").toDecimal(), "999999999");
  EXPECT_EQ(BigInt::FromDecimal("1000000000000000000").toDecimal(), "1000000000000000000");
}

TEST(BigInt, LimbSplitAt30Bits) {
  const BigInt value = BigInt::FromInt64(std::int64_t{1} << 30);
  ASSERT_EQ(value.limbs().size(), 2u);
  EXPECT_EQ(value.limbs()[0], 0u);
  EXPECT_EQ(value.limbs()[1], 1u);
}

TEST(BigInt, Int64Extremes) {
  std::int64_t out = 0;
  const auto minValue = std::numeric_limits<std::int64_t>::min();
  ASSERT_TRUE(BigInt::FromInt64(minValue).toInt64(out));
  EXPECT_EQ(out, minValue);
  EXPECT_EQ(BigInt::FromInt64(minValue).toDecimal(), "-9223372036854775808");

  ASSERT_TRUE(BigInt::FromDecimal("9223372036854775807").toInt64(out));
  EXPECT_EQ(out, std::numeric_limits<std::int64_t>::max());
  EXPECT_FALSE(BigInt::FromDecimal("9223372036854775808").toInt64(out));
  EXPECT_FALSE(BigInt::FromDecimal("-9223372036854775809").toInt64(out));
}

TEST(BigInt, RejectsNonDecimal) {
  EXPECT_THROW(BigInt::FromDecimal(""), MalformedNumericError);
  EXPECT_THROW(BigInt::FromDecimal("-"), MalformedNumericError);
  EXPECT_THROW(BigInt::FromDecimal("12a"), MalformedNumericError);
  EXPECT_THROW(BigInt::FromDecimal(" 12"), MalformedNumericError);
}
