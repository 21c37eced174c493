/***
 * Name: pymarshal::codec::ByteReader
 * Purpose: Bounds-checked little-endian cursor over an input buffer.
 * Inputs: Borrowed pointer and size; the buffer must outlive the reader
 * Outputs: Fixed-width integers, doubles and byte runs
 * Theory of Operation: Every read first checks the remaining length and throws
 *   UnexpectedEofError naming the offset and what was being read.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace pymarshal::codec {

class ByteReader {
 public:
  ByteReader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

  std::size_t offset() const { return pos_; }
  std::size_t remaining() const { return size_ - pos_; }
  bool atEnd() const { return pos_ == size_; }

  std::uint8_t readU8(const char* what);
  std::uint16_t readU16(const char* what);
  std::int32_t readI32(const char* what);
  std::int64_t readI64(const char* what);
  double readF64(const char* what);
  /*** readBytes: Pointer to the next n bytes, advancing past them. */
  const std::uint8_t* readBytes(std::size_t n, const char* what);
  std::string readString(std::size_t n, const char* what);

  /*** require: Throw UnexpectedEofError unless n more bytes are available. */
  void require(std::size_t n, const char* what) const;

 private:
  const std::uint8_t* data_;
  std::size_t size_;
  std::size_t pos_{0};
};

}  // namespace pymarshal::codec
