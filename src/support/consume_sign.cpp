/***
 * Name: pymarshal::support::ConsumeSign
 * Purpose: Consume leading '+' or '-' and set is_negative.
 * Inputs: text (by ref), is_negative (by ref)
 * Outputs: is_negative set; text advanced by one if sign found; returns true when a sign was consumed.
 */
#include "pymarshal/support/parse_util.h"

#include <string_view>

namespace pymarshal {
namespace support {

auto ConsumeSign(std::string_view& text, bool& is_negative) -> bool {
  is_negative = false;
  if (text.empty() || (text.front() != '+' && text.front() != '-')) {
    return false;
  }
  is_negative = text.front() == '-';
  text.remove_prefix(1);
  return true;
}

}  // namespace support
}  // namespace pymarshal
