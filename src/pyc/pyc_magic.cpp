/***
 * Name: pymarshal::pyc (magic table)
 * Purpose: Map release <-> magic number and release -> header size.
 * Theory of Operation: Magic values are the little-endian u32 of the first four
 *   bytes of a .pyc, i.e. the interpreter's MAGIC_NUMBER followed by "\r\n".
 */
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "pymarshal/exceptions/pyc_header_error.h"
#include "pymarshal/pyc/pyc_file.h"

namespace pymarshal::pyc {

namespace {

struct MagicRow {
  std::uint32_t magic;
  version::PyVersion version;
};

constexpr std::array<MagicRow, 14> kMagicRows{{
    {0x0A0D0C3BU, {3, 0}},
    {0x0A0D0C4FU, {3, 1}},
    {0x0A0D0C6CU, {3, 2}},
    {0x0A0D0C9EU, {3, 3}},
    {0x0A0D0CEEU, {3, 4}},
    {0x0A0D0D16U, {3, 5}},
    {0x0A0D0D33U, {3, 6}},
    {0x0A0D0D42U, {3, 7}},
    {0x0A0D0D55U, {3, 8}},
    {0x0A0D0D61U, {3, 9}},
    {0x0A0D0D6FU, {3, 10}},
    {0x0A0D0DA7U, {3, 11}},
    {0x0A0D0DCBU, {3, 12}},
    {0x0A0D0DF3U, {3, 13}},
}};

}  // namespace

std::uint32_t MagicForVersion(version::PyVersion version) {
  for (const auto& row : kMagicRows) {
    if (row.version == version) {
      return row.magic;
    }
  }
  throw exceptions::PycHeaderError("no pyc magic number known for Python " + version::to_string(version));
}

std::optional<version::PyVersion> VersionForMagic(std::uint32_t magic) {
  for (const auto& row : kMagicRows) {
    if (row.magic == magic) {
      return row.version;
    }
  }
  return std::nullopt;
}

std::size_t HeaderSize(version::PyVersion version) {
  constexpr std::size_t kModern = 16;
  constexpr std::size_t kWithSize = 12;
  constexpr std::size_t kLegacy = 8;
  if (version::PyVersion{3, 7} <= version) {
    return kModern;
  }
  if (version::PyVersion{3, 3} <= version) {
    return kWithSize;
  }
  return kLegacy;
}

}  // namespace pymarshal::pyc
