/***
 * Name: pymarshal::version::PyVersion
 * Purpose: Identify a Python release (major, minor) whose marshal dialect is requested.
 * Inputs: Major and minor release numbers, or text such as "3.11"
 * Outputs: Comparable version value and its printable form
 * Theory of Operation: Plain value type; the patch level never changes the
 *   marshal format so it is not represented.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pymarshal::version {

struct PyVersion {
  std::uint8_t major{3};
  std::uint8_t minor{0};

  bool operator==(const PyVersion& other) const { return major == other.major && minor == other.minor; }
  bool operator!=(const PyVersion& other) const { return !(*this == other); }
  bool operator<(const PyVersion& other) const {
    return major != other.major ? major < other.major : minor < other.minor;
  }
  bool operator<=(const PyVersion& other) const { return !(other < *this); }
};

/*** to_string: Render as "M.m". */
std::string to_string(PyVersion version);

/*** ParsePyVersion: Parse "M.m" without throwing; err receives the reason on failure. */
bool ParsePyVersion(std::string_view text, PyVersion& out, std::string* err = nullptr);

}  // namespace pymarshal::version
