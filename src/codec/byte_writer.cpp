/***
 * Name: pymarshal::codec::ByteWriter
 * Purpose: Little-endian encoding of fixed-width fields.
 */
#include "pymarshal/codec/byte_writer.h"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pymarshal::codec {

void ByteWriter::writeLE(std::uint64_t value, unsigned width) {
  for (unsigned i = 0; i < width; ++i) {
    out_.push_back(static_cast<std::uint8_t>((value >> (8U * i)) & 0xFFU));
  }
}

void ByteWriter::writeU16(std::uint16_t value) { writeLE(value, 2); }

void ByteWriter::writeI32(std::int32_t value) { writeLE(static_cast<std::uint32_t>(value), 4); }

void ByteWriter::writeI64(std::int64_t value) { writeLE(static_cast<std::uint64_t>(value), 8); }

void ByteWriter::writeF64(double value) { writeLE(std::bit_cast<std::uint64_t>(value), 8); }

void ByteWriter::writeBytes(const std::uint8_t* data, std::size_t n) { out_.insert(out_.end(), data, data + n); }

void ByteWriter::writeString(const std::string& text) { out_.insert(out_.end(), text.begin(), text.end()); }

}  // namespace pymarshal::codec
