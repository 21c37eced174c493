/***
 * Name: pymarshal::numeric (marshal digits)
 * Purpose: Convert between BigInt and the TYPE_LONG wire digits.
 * Inputs: BigInt, or sign + 15-bit digits read from the stream
 * Outputs: Digits least-significant first, or the reconstructed BigInt
 * Theory of Operation: The wire count is a signed int32 whose sign is the value's
 *   sign and whose magnitude is the digit count; zero is count 0. Each 2^30 limb
 *   splits into a low and a high 15-bit digit.
 */
#pragma once

#include <cstdint>
#include <vector>

#include "pymarshal/numeric/big_int.h"

namespace pymarshal::numeric {

constexpr unsigned kMarshalDigitBits = 15;
constexpr std::uint32_t kMarshalDigitBase = 1U << kMarshalDigitBits;

/*** ToMarshalDigits: Digits of |value|, no most-significant zero digit. */
std::vector<std::uint16_t> ToMarshalDigits(const BigInt& value);

/*** FromMarshalDigits: Throws MalformedNumericError for a digit >= 2^15 or a zero top digit. */
BigInt FromMarshalDigits(bool negative, const std::vector<std::uint16_t>& digits);

}  // namespace pymarshal::numeric
