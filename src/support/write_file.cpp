/***
 * Name: pymarshal::support::WriteFile
 * Purpose: Write a byte vector into a file.
 * Inputs:
 *   - path: filesystem path to write
 *   - data: bytes to write
 * Outputs:
 *   - err: error message on failure
 * Theory of Operation: Uses std::ofstream in binary mode and checks .good().
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "pymarshal/support/fs.h"

#include <cstdint>
#include <fstream>
#include <ios>
#include <streambuf>
#include <string>
#include <vector>

namespace pymarshal {
namespace support {

bool WriteFile(const std::string& path, const std::vector<std::uint8_t>& data, std::string& err) {
  std::ofstream file_stream(path, std::ios::binary | std::ios::trunc);
  if (!file_stream.good()) {
    err = "failed to open file for write: " + path;
    return false;
  }
  file_stream.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!file_stream.good()) {
    err = "failed to write file: " + path;
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace pymarshal
