/***
 * Name: pymarshal::numeric (marshal digits)
 * Purpose: Split limbs into 15-bit digits and join them back with validation.
 */
#include "pymarshal/numeric/marshal_digits.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "pymarshal/exceptions/malformed_numeric_error.h"

namespace pymarshal::numeric {

std::vector<std::uint16_t> ToMarshalDigits(const BigInt& value) {
  std::vector<std::uint16_t> digits;
  digits.reserve(value.limbs().size() * 2);
  constexpr std::uint32_t kDigitMask = kMarshalDigitBase - 1U;
  for (const auto limb : value.limbs()) {
    digits.push_back(static_cast<std::uint16_t>(limb & kDigitMask));
    digits.push_back(static_cast<std::uint16_t>(limb >> kMarshalDigitBits));
  }
  while (!digits.empty() && digits.back() == 0) {
    digits.pop_back();
  }
  return digits;
}

BigInt FromMarshalDigits(bool negative, const std::vector<std::uint16_t>& digits) {
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (digits[i] >= kMarshalDigitBase) {
      throw exceptions::MalformedNumericError("long digit " + std::to_string(i) + " out of range: " +
                                              std::to_string(digits[i]));
    }
  }
  if (!digits.empty() && digits.back() == 0) {
    throw exceptions::MalformedNumericError("long has a zero most-significant digit");
  }
  std::vector<std::uint32_t> limbs;
  limbs.reserve((digits.size() + 1) / 2);
  for (std::size_t i = 0; i < digits.size(); i += 2) {
    std::uint32_t limb = digits[i];
    if (i + 1 < digits.size()) {
      limb |= static_cast<std::uint32_t>(digits[i + 1]) << kMarshalDigitBits;
    }
    limbs.push_back(limb);
  }
  return BigInt::FromLimbs(negative, std::move(limbs));
}

}  // namespace pymarshal::numeric
