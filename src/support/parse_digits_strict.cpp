/***
 * Name: pymarshal::support::ParseDigitsStrict
 * Purpose: Parse contiguous base-10 digits; allow only whitespace after them.
 * Inputs: text view, out value, optional error string pointer
 * Outputs: value and status; err set on failure
 */
#include "pymarshal/support/parse_util.h"

#include <cctype>
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>

namespace pymarshal {
namespace support {

namespace {
void setError(std::string* err, const char* msg) {
  if (err != nullptr) {
    *err = msg;
  }
}
}  // namespace

auto ParseDigitsStrict(std::string_view text, long long& value, std::string* err) -> bool {
  value = 0;
  constexpr int kBase10 = 10;
  std::size_t index = 0;
  for (; index < text.size(); ++index) {
    const auto digit_char = static_cast<unsigned char>(text[index]);
    if (std::isdigit(digit_char) == 0) {
      break;
    }
    value = (value * kBase10) + (digit_char - '0');
    if (value > std::numeric_limits<int>::max()) {
      setError(err, "integer overflow");
      return false;
    }
  }
  if (index == 0) {
    setError(err, "invalid integer literal");
    return false;
  }
  for (; index < text.size(); ++index) {
    if (std::isspace(static_cast<unsigned char>(text[index])) == 0) {
      setError(err, "invalid character in integer literal");
      return false;
    }
  }
  return true;
}

}  // namespace support
}  // namespace pymarshal
