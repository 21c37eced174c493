/***
 * Name: pymarshal::support (fs)
 * Purpose: Minimal file IO helpers for reading and writing binary files and text logs.
 * Inputs: Paths and byte/string buffers
 * Outputs: File contents to/from disk
 * Theory of Operation: Thin wrappers over fstream opened in binary mode to
 *   centralize error handling; no exceptions escape.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pymarshal {
namespace support {

/*** ReadFile: Read entire file into out. Return true on success. */
bool ReadFile(const std::string& path, std::vector<std::uint8_t>& out, std::string& err);

/*** WriteFile: Write all bytes to path, truncating it. Return true on success. */
bool WriteFile(const std::string& path, const std::vector<std::uint8_t>& data, std::string& err);

/*** WriteTextFile: Write a string to path, truncating it. Return true on success. */
bool WriteTextFile(const std::string& path, const std::string& text, std::string& err);

}  // namespace support
}  // namespace pymarshal
