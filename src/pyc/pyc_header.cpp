/***
 * Name: pymarshal::pyc::ParsePycHeader / WritePycHeader
 * Purpose: Header field layout per release family.
 */
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ios>
#include <sstream>
#include <string>
#include <vector>

#include "pymarshal/codec/byte_reader.h"
#include "pymarshal/codec/byte_writer.h"
#include "pymarshal/exceptions/pyc_header_error.h"
#include "pymarshal/pyc/pyc_file.h"

namespace pymarshal::pyc {

namespace {
constexpr std::size_t kMagicSize = 4;
}  // namespace

PycHeader ParsePycHeader(const std::uint8_t* data, std::size_t size) {
  if (size < kMagicSize) {
    throw exceptions::PycHeaderError("pyc header truncated: " + std::to_string(size) + " bytes");
  }
  codec::ByteReader reader(data, size);
  PycHeader header;
  header.magic = static_cast<std::uint32_t>(reader.readI32("pyc magic"));
  const auto version = VersionForMagic(header.magic);
  if (!version) {
    std::ostringstream msg;
    msg << "unknown pyc magic number 0x" << std::hex << header.magic;
    throw exceptions::PycHeaderError(msg.str());
  }
  header.version = *version;
  header.payloadOffset = HeaderSize(header.version);
  if (size < header.payloadOffset) {
    throw exceptions::PycHeaderError("pyc header truncated: Python " + version::to_string(header.version) +
                                     " needs " + std::to_string(header.payloadOffset) + " bytes, have " +
                                     std::to_string(size));
  }
  if (header.payloadOffset == 16) {
    header.flags = static_cast<std::uint32_t>(reader.readI32("pyc flags"));
    if (header.hashBased()) {
      const std::uint8_t* hash = reader.readBytes(header.sourceHash.size(), "pyc source hash");
      std::copy(hash, hash + header.sourceHash.size(), header.sourceHash.begin());
      return header;
    }
  }
  header.mtime = static_cast<std::uint32_t>(reader.readI32("pyc mtime"));
  if (header.payloadOffset >= 12) {
    header.sourceSize = static_cast<std::uint32_t>(reader.readI32("pyc source size"));
  }
  return header;
}

PycHeader ParsePycHeader(const std::vector<std::uint8_t>& bytes) { return ParsePycHeader(bytes.data(), bytes.size()); }

std::vector<std::uint8_t> WritePycHeader(const PycHeader& header) {
  const std::uint32_t magic = header.magic != 0 ? header.magic : MagicForVersion(header.version);
  const auto version = VersionForMagic(magic);
  if (!version) {
    throw exceptions::PycHeaderError("cannot write unknown pyc magic number " + std::to_string(magic));
  }
  const std::size_t size = HeaderSize(*version);
  codec::ByteWriter out;
  out.writeI32(static_cast<std::int32_t>(magic));
  if (size == 16) {
    out.writeI32(static_cast<std::int32_t>(header.flags));
    if (header.hashBased()) {
      out.writeBytes(header.sourceHash.data(), header.sourceHash.size());
      return out.take();
    }
  }
  out.writeI32(static_cast<std::int32_t>(header.mtime));
  if (size >= 12) {
    out.writeI32(static_cast<std::int32_t>(header.sourceSize));
  }
  return out.take();
}

}  // namespace pymarshal::pyc
