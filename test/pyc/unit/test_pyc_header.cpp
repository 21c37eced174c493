/***
 * Name: test_pyc_header
 * Purpose: Magic numbers, header layouts and whole-file load/dump.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <vector>
#include "pymarshal/codec/marshal.h"
#include "pymarshal/exceptions/errors.h"
#include "pymarshal/pyc/pyc_file.h"

#include "../../util/Fixtures.h"

using namespace pymarshal;
using testutil::bytes;

TEST(PycMagic, KnownReleases) {
  EXPECT_EQ(pyc::MagicForVersion({3, 11}), 0x0A0D0DA7u);
  EXPECT_EQ(pyc::MagicForVersion({3, 10}), 0x0A0D0D6Fu);
  const auto v = pyc::VersionForMagic(0x0A0D0DF3u);
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(*v, (version::PyVersion{3, 13}));
  EXPECT_FALSE(pyc::VersionForMagic(0).has_value());
  EXPECT_THROW(pyc::MagicForVersion({2, 7}), exceptions::PycHeaderError);
}

TEST(PycMagic, HeaderSizes) {
  EXPECT_EQ(pyc::HeaderSize({3, 12}), 16u);
  EXPECT_EQ(pyc::HeaderSize({3, 7}), 16u);
  EXPECT_EQ(pyc::HeaderSize({3, 5}), 12u);
  EXPECT_EQ(pyc::HeaderSize({3, 2}), 8u);
}

TEST(PycHeader, TimestampBased) {
  const auto data = bytes({0xA7, 0x0D, 0x0D, 0x0A, 0x00, 0x00, 0x00, 0x00,
                           0x44, 0x33, 0x22, 0x11, 0x64, 0x00, 0x00, 0x00});
  const pyc::PycHeader header = pyc::ParsePycHeader(data);
  EXPECT_EQ(header.version, (version::PyVersion{3, 11}));
  EXPECT_FALSE(header.hashBased());
  EXPECT_EQ(header.mtime, 0x11223344u);
  EXPECT_EQ(header.sourceSize, 100u);
  EXPECT_EQ(header.payloadOffset, 16u);
  EXPECT_EQ(pyc::WritePycHeader(header), data);
}

TEST(PycHeader, HashBased) {
  const auto data = bytes({0xCB, 0x0D, 0x0D, 0x0A, 0x03, 0x00, 0x00, 0x00,
                           1, 2, 3, 4, 5, 6, 7, 8});
  const pyc::PycHeader header = pyc::ParsePycHeader(data);
  EXPECT_TRUE(header.hashBased());
  EXPECT_EQ(header.flags, pyc::kFlagHashBased | pyc::kFlagCheckSource);
  EXPECT_EQ(header.sourceHash[0], 1);
  EXPECT_EQ(header.sourceHash[7], 8);
  EXPECT_EQ(pyc::WritePycHeader(header), data);
}

TEST(PycHeader, Rejections) {
  EXPECT_THROW(pyc::ParsePycHeader(bytes({0xA7, 0x0D})), exceptions::PycHeaderError);
  EXPECT_THROW(pyc::ParsePycHeader(bytes({0xA7, 0x0D, 0x0D, 0x0A, 0x00})), exceptions::PycHeaderError);
  EXPECT_THROW(pyc::ParsePycHeader(bytes({0x00, 0x00, 0x00, 0x00, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})),
               exceptions::PycHeaderError);
}

TEST(PycHeader, MagicDerivedFromVersionWhenZero) {
  pyc::PycHeader header;
  header.version = {3, 12};
  const auto out = pyc::WritePycHeader(header);
  ASSERT_EQ(out.size(), 16u);
  EXPECT_EQ(out[0], 0xCB);
  EXPECT_EQ(out[3], 0x0A);
}

TEST(PycFile, LoadAndDumpCodeObject) {
  pyc::PycFile file;
  file.header.version = {3, 12};
  file.header.mtime = 1700000000u;
  file.header.sourceSize = 42;
  file.object = object::Object::Code(testutil::makeCode(version::CodeLayout::Py311, "<module>"));
  const auto data = pyc::DumpPyc(file);

  const pyc::PycFile loaded = pyc::LoadPyc(data);
  EXPECT_EQ(loaded.header.version, (version::PyVersion{3, 12}));
  EXPECT_EQ(loaded.header.mtime, 1700000000u);
  EXPECT_EQ(loaded.header.sourceSize, 42u);
  EXPECT_EQ(loaded.object, file.object);
  EXPECT_EQ(loaded.payloadSize + loaded.header.payloadOffset, data.size());
  EXPECT_EQ(pyc::DumpPyc(loaded), data);
}

TEST(PycFile, UnsupportedMarshalReleaseStillRejected) {
  // 3.9 has a magic number but no marshal table.
  auto data = bytes({0x61, 0x0D, 0x0D, 0x0A, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0x4E});
  EXPECT_THROW(pyc::LoadPyc(data), exceptions::UnsupportedVersionError);
}
