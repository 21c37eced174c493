/***
 * Name: pymarshal::codec::ByteWriter
 * Purpose: Append-only little-endian output buffer.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace pymarshal::codec {

class ByteWriter {
 public:
  void writeU8(std::uint8_t value) { out_.push_back(value); }
  void writeU16(std::uint16_t value);
  void writeI32(std::int32_t value);
  void writeI64(std::int64_t value);
  void writeF64(double value);
  void writeBytes(const std::uint8_t* data, std::size_t n);
  void writeString(const std::string& text);

  std::size_t size() const { return out_.size(); }
  std::vector<std::uint8_t> take() { return std::move(out_); }

 private:
  void writeLE(std::uint64_t value, unsigned width);
  std::vector<std::uint8_t> out_;
};

}  // namespace pymarshal::codec
