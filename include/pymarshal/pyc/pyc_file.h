/***
 * Name: pymarshal::pyc (container codec)
 * Purpose: Read and write the header that precedes marshal data in a .pyc file.
 * Inputs: Raw .pyc bytes, or a PycHeader/PycFile to serialize
 * Outputs: Parsed header and payload offset, decoded module object, or bytes
 * Theory of Operation:
 *   The magic number identifies the release and therefore the header layout:
 *     3.7+    magic, flags, then an 8-byte source hash (flags bit 0) or mtime + size
 *     3.3-3.6 magic, mtime, size
 *     3.0-3.2 magic, mtime
 *   Header parsing knows every release from 3.0; decoding the payload then
 *   applies the codec's own version check.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "pymarshal/codec/options.h"
#include "pymarshal/object/object.h"
#include "pymarshal/object/reference_table.h"
#include "pymarshal/version/py_version.h"

namespace pymarshal::pyc {

constexpr std::uint32_t kFlagHashBased = 0x1U;
constexpr std::uint32_t kFlagCheckSource = 0x2U;

struct PycHeader {
  std::uint32_t magic{0};
  version::PyVersion version;
  std::uint32_t flags{0};
  std::uint32_t mtime{0};
  std::uint32_t sourceSize{0};
  std::array<std::uint8_t, 8> sourceHash{};
  std::size_t payloadOffset{0};

  bool hashBased() const { return (flags & kFlagHashBased) != 0; }
};

struct PycFile {
  PycHeader header;
  object::Object object;
  object::ReferenceTable refs;
  std::size_t payloadSize{0};  // marshal bytes consumed after the header
};

/*** MagicForVersion: Magic of a known release; throws PycHeaderError otherwise. */
std::uint32_t MagicForVersion(version::PyVersion version);
std::optional<version::PyVersion> VersionForMagic(std::uint32_t magic);

/*** HeaderSize: Bytes of header for a release (8, 12 or 16). */
std::size_t HeaderSize(version::PyVersion version);

/*** ParsePycHeader: Throws PycHeaderError on unknown magic or truncated header. */
PycHeader ParsePycHeader(const std::uint8_t* data, std::size_t size);
PycHeader ParsePycHeader(const std::vector<std::uint8_t>& bytes);

/*** WritePycHeader: Serialize; the magic is derived from header.version when zero. */
std::vector<std::uint8_t> WritePycHeader(const PycHeader& header);

/*** LoadPyc: Header + marshal payload; trailing bytes follow options. */
PycFile LoadPyc(const std::vector<std::uint8_t>& bytes, const codec::DecodeOptions& options = codec::DecodeOptions{});

std::vector<std::uint8_t> DumpPyc(const PycFile& file, const codec::EncodeOptions& options = codec::EncodeOptions{});

}  // namespace pymarshal::pyc
