/***
 * Name: pymarshal::codec::ByteReader
 * Purpose: Little-endian decoding of fixed-width fields.
 */
#include "pymarshal/codec/byte_reader.h"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>

#include "pymarshal/exceptions/unexpected_eof_error.h"

namespace pymarshal::codec {

namespace {
std::uint64_t loadLE(const std::uint8_t* bytes, unsigned width) {
  std::uint64_t value = 0;
  for (unsigned i = 0; i < width; ++i) {
    value |= static_cast<std::uint64_t>(bytes[i]) << (8U * i);
  }
  return value;
}
}  // namespace

void ByteReader::require(std::size_t n, const char* what) const {
  if (n > remaining()) {
    throw exceptions::UnexpectedEofError("unexpected end of input at offset " + std::to_string(pos_) + " reading " +
                                         what + ": need " + std::to_string(n) + " bytes, have " +
                                         std::to_string(remaining()));
  }
}

std::uint8_t ByteReader::readU8(const char* what) {
  require(1, what);
  return data_[pos_++];
}

std::uint16_t ByteReader::readU16(const char* what) {
  return static_cast<std::uint16_t>(loadLE(readBytes(2, what), 2));
}

std::int32_t ByteReader::readI32(const char* what) {
  return static_cast<std::int32_t>(static_cast<std::uint32_t>(loadLE(readBytes(4, what), 4)));
}

std::int64_t ByteReader::readI64(const char* what) { return static_cast<std::int64_t>(loadLE(readBytes(8, what), 8)); }

double ByteReader::readF64(const char* what) { return std::bit_cast<double>(loadLE(readBytes(8, what), 8)); }

const std::uint8_t* ByteReader::readBytes(std::size_t n, const char* what) {
  require(n, what);
  const std::uint8_t* start = data_ + pos_;
  pos_ += n;
  return start;
}

std::string ByteReader::readString(std::size_t n, const char* what) {
  const auto* start = readBytes(n, what);
  return std::string(reinterpret_cast<const char*>(start), n);
}

}  // namespace pymarshal::codec
