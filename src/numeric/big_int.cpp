/***
 * Name: pymarshal::numeric::BigInt
 * Purpose: Limb arithmetic needed for conversions (multiply-add and divide by a small word).
 * Theory of Operation: Decimal conversion works in chunks of nine digits (10^9 < 2^30)
 *   so every intermediate product fits in 64 bits.
 */
#include "pymarshal/numeric/big_int.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pymarshal/exceptions/malformed_numeric_error.h"

namespace pymarshal::numeric {

namespace {
constexpr std::uint32_t kChunkBase = 1000000000U;
constexpr std::size_t kChunkDigits = 9;
}  // namespace

BigInt BigInt::FromInt64(std::int64_t value) {
  BigInt out;
  std::uint64_t magnitude = 0;
  if (value < 0) {
    out.negative_ = true;
    magnitude = ~static_cast<std::uint64_t>(value) + 1U;
  } else {
    magnitude = static_cast<std::uint64_t>(value);
  }
  while (magnitude != 0) {
    out.limbs_.push_back(static_cast<std::uint32_t>(magnitude & kLimbMask));
    magnitude >>= kLimbBits;
  }
  out.normalize();
  return out;
}

BigInt BigInt::FromDecimal(std::string_view text) {
  const std::string original(text);
  bool negative = false;
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }
  if (text.empty()) {
    throw exceptions::MalformedNumericError("invalid integer literal '" + original + "'");
  }
  for (const char ch : text) {
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      throw exceptions::MalformedNumericError("invalid integer literal '" + original + "'");
    }
  }
  BigInt out;
  // Leading chunk absorbs the remainder so the rest are exactly nine digits.
  std::size_t head = text.size() % kChunkDigits;
  if (head == 0) {
    head = kChunkDigits;
  }
  std::size_t pos = 0;
  std::size_t take = head;
  while (pos < text.size()) {
    std::uint32_t chunk = 0;
    std::uint32_t scale = 1;
    for (std::size_t i = 0; i < take; ++i) {
      chunk = chunk * 10U + static_cast<std::uint32_t>(text[pos + i] - '0');
      scale *= 10U;
    }
    out.mulSmallAdd(scale, chunk);
    pos += take;
    take = kChunkDigits;
  }
  out.negative_ = negative;
  out.normalize();
  return out;
}

BigInt BigInt::FromLimbs(bool negative, std::vector<std::uint32_t> limbs) {
  BigInt out;
  out.negative_ = negative;
  out.limbs_ = std::move(limbs);
  out.normalize();
  return out;
}

bool BigInt::toInt64(std::int64_t& out) const {
  std::uint64_t magnitude = 0;
  for (auto it = limbs_.rbegin(); it != limbs_.rend(); ++it) {
    if (magnitude > (std::numeric_limits<std::uint64_t>::max() >> kLimbBits)) {
      return false;
    }
    magnitude = (magnitude << kLimbBits) | *it;
  }
  constexpr auto kMaxPositive = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  if (negative_) {
    if (magnitude > kMaxPositive + 1U) {
      return false;
    }
    out = magnitude == kMaxPositive + 1U ? std::numeric_limits<std::int64_t>::min()
                                         : -static_cast<std::int64_t>(magnitude);
    return true;
  }
  if (magnitude > kMaxPositive) {
    return false;
  }
  out = static_cast<std::int64_t>(magnitude);
  return true;
}

std::string BigInt::toDecimal() const {
  if (isZero()) {
    return "0";
  }
  BigInt work = *this;
  std::vector<std::uint32_t> chunks;
  while (!work.isZero()) {
    chunks.push_back(work.divSmall(kChunkBase));
  }
  std::string out = negative_ ? "-" : "";
  out += std::to_string(chunks.back());
  for (auto it = chunks.rbegin() + 1; it != chunks.rend(); ++it) {
    const std::string part = std::to_string(*it);
    out.append(kChunkDigits - part.size(), '0');
    out += part;
  }
  return out;
}

void BigInt::normalize() {
  while (!limbs_.empty() && limbs_.back() == 0) {
    limbs_.pop_back();
  }
  if (limbs_.empty()) {
    negative_ = false;
  }
}

void BigInt::mulSmallAdd(std::uint32_t mul, std::uint32_t add) {
  std::uint64_t carry = add;
  for (auto& limb : limbs_) {
    const std::uint64_t product = static_cast<std::uint64_t>(limb) * mul + carry;
    limb = static_cast<std::uint32_t>(product & kLimbMask);
    carry = product >> kLimbBits;
  }
  while (carry != 0) {
    limbs_.push_back(static_cast<std::uint32_t>(carry & kLimbMask));
    carry >>= kLimbBits;
  }
}

std::uint32_t BigInt::divSmall(std::uint32_t divisor) {
  std::uint64_t remainder = 0;
  for (auto it = limbs_.rbegin(); it != limbs_.rend(); ++it) {
    const std::uint64_t current = (remainder << kLimbBits) | *it;
    *it = static_cast<std::uint32_t>(current / divisor);
    remainder = current % divisor;
  }
  const bool wasNegative = negative_;
  normalize();
  if (!limbs_.empty()) {
    negative_ = wasNegative;
  }
  return static_cast<std::uint32_t>(remainder);
}

}  // namespace pymarshal::numeric
