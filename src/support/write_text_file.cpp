/***
 * Name: pymarshal::support::WriteTextFile
 * Purpose: Write a diagnostic text (log, listing) into a file.
 * Inputs:
 *   - path: filesystem path to write
 *   - text: content to write
 * Outputs:
 *   - err: error message on failure
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "pymarshal/support/fs.h"

#include <fstream>
#include <ios>
#include <string>

namespace pymarshal {
namespace support {

bool WriteTextFile(const std::string& path, const std::string& text, std::string& err) {
  std::ofstream file_stream(path, std::ios::trunc);
  if (!file_stream.good()) {
    err = "failed to open file for write: " + path;
    return false;
  }
  file_stream << text;
  if (!file_stream.good()) {
    err = "failed to write file: " + path;
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace pymarshal
