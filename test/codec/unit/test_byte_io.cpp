/***
 * Name: test_byte_io
 * Purpose: Little-endian primitives and EOF reporting.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <string>
#include <vector>
#include "pymarshal/codec/byte_reader.h"
#include "pymarshal/codec/byte_writer.h"
#include "pymarshal/exceptions/unexpected_eof_error.h"

using namespace pymarshal::codec;
using pymarshal::exceptions::UnexpectedEofError;

TEST(ByteIO, WriterIsLittleEndian) {
  ByteWriter out;
  out.writeU16(0x0102);
  out.writeI32(-2);
  out.writeF64(1.0);
  const std::vector<std::uint8_t> expected{0x02, 0x01, 0xFE, 0xFF, 0xFF, 0xFF,
                                           0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF0, 0x3F};
  EXPECT_EQ(out.size(), expected.size());
  EXPECT_EQ(out.take(), expected);
}

TEST(ByteIO, ReaderMirrorsWriter) {
  ByteWriter out;
  out.writeI64(-1234567890123LL);
  out.writeF64(-0.5);
  out.writeString("ok");
  const auto data = out.take();
  ByteReader in(data.data(), data.size());
  EXPECT_EQ(in.readI64("i64"), -1234567890123LL);
  EXPECT_DOUBLE_EQ(in.readF64("f64"), -0.5);
  EXPECT_EQ(in.readString(2, "text"), "ok");
  EXPECT_TRUE(in.atEnd());
}

TEST(ByteIO, ShortReadReportsOffset) {
  const std::vector<std::uint8_t> data{0x01, 0x02, 0x03};
  ByteReader in(data.data(), data.size());
  EXPECT_EQ(in.readU8("first"), 0x01);
  try {
    in.readI32("int32");
    FAIL() << "expected UnexpectedEofError";
  } catch (const UnexpectedEofError& e) {
    EXPECT_NE(std::string(e.what()).find("int32"), std::string::npos);
  }
  EXPECT_THROW(in.require(3, "tail"), UnexpectedEofError);
  EXPECT_NO_THROW(in.require(2, "tail"));
}
