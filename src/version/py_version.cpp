/***
 * Name: pymarshal::version (py_version)
 * Purpose: Print and parse Python release identifiers.
 * Theory of Operation: "M.m" with both parts parsed by the strict integer helpers;
 *   a patch component ("3.11.4") is rejected because it never selects a dialect.
 */
#include "pymarshal/version/py_version.h"

#include <cstdint>
#include <string>
#include <string_view>

#include "pymarshal/support/parse_util.h"

namespace pymarshal::version {

std::string to_string(PyVersion version) {
  return std::to_string(version.major) + "." + std::to_string(version.minor);
}

bool ParsePyVersion(std::string_view text, PyVersion& out, std::string* err) {
  support::TrimLeadingSpaces(text);
  const auto dot = text.find('.');
  if (dot == std::string_view::npos) {
    if (err != nullptr) {
      *err = "expected <major>.<minor>";
    }
    return false;
  }
  long long major = 0;
  long long minor = 0;
  std::string local;
  if (!support::ParseDigitsStrict(text.substr(0, dot), major, &local) ||
      !support::ParseDigitsStrict(text.substr(dot + 1), minor, &local)) {
    if (err != nullptr) {
      *err = "invalid version '" + std::string(text) + "': " + local;
    }
    return false;
  }
  constexpr long long kMaxPart = 255;
  if (major > kMaxPart || minor > kMaxPart) {
    if (err != nullptr) {
      *err = "version component out of range";
    }
    return false;
  }
  out.major = static_cast<std::uint8_t>(major);
  out.minor = static_cast<std::uint8_t>(minor);
  return true;
}

}  // namespace pymarshal::version
