/***
 * Name: pymarshal::numeric::BigInt
 * Purpose: Arbitrary-precision signed integer for TYPE_LONG payloads.
 * Inputs: int64 values, decimal text, or base-2^30 limbs
 * Outputs: Normalized value with int64/decimal conversions and equality
 * Theory of Operation:
 *   Sign + magnitude. The magnitude is stored little-endian in base 2^30 limbs
 *   (the interpreter's own digit size), so one limb maps onto exactly two marshal
 *   15-bit digits. Normalized form: no most-significant zero limbs; zero has no
 *   limbs and is never negative. Only the operations the codec needs are provided.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pymarshal::numeric {

class BigInt {
 public:
  static constexpr unsigned kLimbBits = 30;
  static constexpr std::uint32_t kLimbMask = (1U << kLimbBits) - 1U;

  BigInt() = default;

  static BigInt FromInt64(std::int64_t value);
  /*** FromDecimal: "[+-]digits"; throws MalformedNumericError on anything else. */
  static BigInt FromDecimal(std::string_view text);
  /*** FromLimbs: Normalizes; every limb must be below 2^30. */
  static BigInt FromLimbs(bool negative, std::vector<std::uint32_t> limbs);

  /*** toInt64: Store the value in out when it fits; return false otherwise. */
  bool toInt64(std::int64_t& out) const;
  std::string toDecimal() const;

  bool isZero() const { return limbs_.empty(); }
  bool isNegative() const { return negative_; }
  const std::vector<std::uint32_t>& limbs() const { return limbs_; }

  bool operator==(const BigInt& other) const { return negative_ == other.negative_ && limbs_ == other.limbs_; }
  bool operator!=(const BigInt& other) const { return !(*this == other); }

 private:
  void normalize();
  void mulSmallAdd(std::uint32_t mul, std::uint32_t add);
  std::uint32_t divSmall(std::uint32_t divisor);

  bool negative_{false};
  std::vector<std::uint32_t> limbs_;
};

}  // namespace pymarshal::numeric
