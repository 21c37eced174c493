/***
 * Name: pymarshal::support::ParseIntLiteralStrict
 * Purpose: Parse a base-10 integer without throwing; fail on extra tokens.
 * Inputs:
 *   - text: string view of the literal
 * Outputs:
 *   - out_val: parsed integer on success
 *   - err: optional error message on failure
 * Theory of Operation: Trim, optional sign, then ParseDigitsStrict which enforces
 *   the int range and rejects trailing garbage.
 */
#include "pymarshal/support/parse.h"

#include <string>
#include <string_view>

#include "pymarshal/support/parse_util.h"

namespace pymarshal::support {

auto ParseIntLiteralStrict(std::string_view text, int& out_val, std::string* err) -> bool {
  TrimLeadingSpaces(text);
  bool is_negative = false;
  ConsumeSign(text, is_negative);
  long long value = 0;
  if (!ParseDigitsStrict(text, value, err)) {
    return false;
  }
  out_val = static_cast<int>(is_negative ? -value : value);
  return true;
}

}  // namespace pymarshal::support
