/***
 * Name: pymarshal::codec::Decode / Encode
 * Purpose: Version resolution plus a single-use Decoder/Encoder run.
 */
#include "pymarshal/codec/marshal.h"

#include <cstddef>
#include <cstdint>
#include <vector>

#include "pymarshal/codec/decoder.h"
#include "pymarshal/codec/encoder.h"
#include "pymarshal/version/version_table.h"

namespace pymarshal::codec {

DecodeResult Decode(const std::uint8_t* data, std::size_t size, version::PyVersion version,
                    const DecodeOptions& options) {
  const auto& table = version::VersionTable::ForVersion(version);
  Decoder decoder(data, size, table, options);
  return decoder.run();
}

DecodeResult Decode(const std::vector<std::uint8_t>& bytes, version::PyVersion version, const DecodeOptions& options) {
  return Decode(bytes.data(), bytes.size(), version, options);
}

std::vector<std::uint8_t> Encode(const object::Object& root, const object::ReferenceTable& refs,
                                 version::PyVersion version, const EncodeOptions& options) {
  const auto& table = version::VersionTable::ForVersion(version);
  Encoder encoder(refs, table, options);
  return encoder.run(root);
}

}  // namespace pymarshal::codec
