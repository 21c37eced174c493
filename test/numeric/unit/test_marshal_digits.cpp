/***
 * Name: test_marshal_digits
 * Purpose: 15-bit digit conversion of TYPE_LONG payloads.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <vector>
#include "pymarshal/exceptions/malformed_numeric_error.h"
#include "pymarshal/numeric/marshal_digits.h"

using namespace pymarshal::numeric;
using pymarshal::exceptions::MalformedNumericError;

TEST(MarshalDigits, LastSingleDigitValue) {
  const auto digits = ToMarshalDigits(BigInt::FromInt64(32767));
  EXPECT_EQ(digits, (std::vector<std::uint16_t>{32767}));
}

TEST(MarshalDigits, FirstTwoDigitValue) {
  const auto digits = ToMarshalDigits(BigInt::FromInt64(32768));
  EXPECT_EQ(digits, (std::vector<std::uint16_t>{0, 1}));
  EXPECT_EQ(FromMarshalDigits(false, digits).toDecimal(), "32768");
}

TEST(MarshalDigits, LimbBoundary) {
  const auto digits = ToMarshalDigits(BigInt::FromInt64(std::int64_t{1} << 30));
  EXPECT_EQ(digits, (std::vector<std::uint16_t>{0, 0, 1}));
  EXPECT_EQ(FromMarshalDigits(false, digits).toDecimal(), "1073741824");
}

TEST(MarshalDigits, ZeroHasNoDigits) {
  EXPECT_TRUE(ToMarshalDigits(BigInt::FromInt64(0)).empty());
  EXPECT_TRUE(FromMarshalDigits(true, {}).isZero());
}

TEST(MarshalDigits, SignIsCarriedSeparately) {
  EXPECT_EQ(ToMarshalDigits(BigInt::FromInt64(-5)), (std::vector<std::uint16_t>{5}));
  EXPECT_EQ(FromMarshalDigits(true, {5}).toDecimal(), "-5");
}

TEST(MarshalDigits, LargeValueSurvives) {
  const BigInt value = BigInt::FromDecimal("340282366920938463463374607431768211457");
  EXPECT_EQ(FromMarshalDigits(false, ToMarshalDigits(value)), value);
}

TEST(MarshalDigits, RejectsMalformedDigits) {
  EXPECT_THROW(FromMarshalDigits(false, {0x8000}), MalformedNumericError);
  EXPECT_THROW(FromMarshalDigits(false, {5, 0}), MalformedNumericError);
}
