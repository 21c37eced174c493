/***
 * Name: pymarshal::support::ReadFile
 * Purpose: Read the full contents of a binary file into a byte vector.
 * Inputs:
 *   - path: filesystem path to read
 * Outputs:
 *   - out: populated with file contents on success
 *   - err: error message on failure
 * Theory of Operation: Uses std::ifstream in binary mode with exceptions disabled;
 *   checks the stream state after opening and after reading.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "pymarshal/support/fs.h"

#include <cstdint>
#include <fstream>
#include <ios>
#include <iterator>
#include <string>
#include <vector>

namespace pymarshal {
namespace support {

bool ReadFile(const std::string& path, std::vector<std::uint8_t>& out, std::string& err) {
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.good()) {
    err = "failed to open file: " + path;
    return false;
  }
  std::vector<char> raw((std::istreambuf_iterator<char>(file_stream)), std::istreambuf_iterator<char>());
  if (file_stream.bad()) {
    err = "failed to read file: " + path;
    return false;
  }
  out.assign(raw.begin(), raw.end());
  return true;
}

}  // namespace support
}  // namespace pymarshal
