/***
 * Name: pymarshal::pyc::LoadPyc / DumpPyc
 * Purpose: Whole-file codec: header followed by one marshalled code object.
 */
#include "pymarshal/pyc/pyc_file.h"

#include <cstdint>
#include <utility>
#include <vector>

#include "pymarshal/codec/marshal.h"

namespace pymarshal::pyc {

PycFile LoadPyc(const std::vector<std::uint8_t>& bytes, const codec::DecodeOptions& options) {
  PycFile file;
  file.header = ParsePycHeader(bytes);
  codec::DecodeResult decoded = codec::Decode(bytes.data() + file.header.payloadOffset,
                                              bytes.size() - file.header.payloadOffset, file.header.version, options);
  file.object = std::move(decoded.object);
  file.refs = std::move(decoded.refs);
  file.payloadSize = decoded.consumed;
  return file;
}

std::vector<std::uint8_t> DumpPyc(const PycFile& file, const codec::EncodeOptions& options) {
  std::vector<std::uint8_t> out = WritePycHeader(file.header);
  const std::vector<std::uint8_t> payload = codec::Encode(file.object, file.refs, file.header.version, options);
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

}  // namespace pymarshal::pyc
