/***
 * Name: pymarshal::support::TrimLeadingSpaces
 * Purpose: Remove leading ASCII whitespace from a string_view.
 * Inputs: text (by ref)
 * Outputs: text with prefix removed
 */
#include "pymarshal/support/parse_util.h"

#include <cctype>
#include <string_view>

namespace pymarshal {
namespace support {

void TrimLeadingSpaces(std::string_view& text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
}

}  // namespace support
}  // namespace pymarshal
