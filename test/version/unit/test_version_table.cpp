/***
 * Name: test_version_table
 * Purpose: Per-release tag tables, code layouts and unsupported releases.
 */
#include <gtest/gtest.h>
#include <string>
#include "pymarshal/exceptions/unsupported_version_error.h"
#include "pymarshal/version/type_tag.h"
#include "pymarshal/version/version_table.h"

using namespace pymarshal::version;
using pymarshal::exceptions::UnsupportedVersionError;

TEST(VersionTable, SupportedReleases) {
  const auto& versions = VersionTable::SupportedVersions();
  ASSERT_EQ(versions.size(), 4u);
  EXPECT_EQ(versions.front(), (PyVersion{3, 10}));
  EXPECT_EQ(versions.back(), (PyVersion{3, 13}));
  EXPECT_TRUE(VersionTable::IsSupported({3, 12}));
  EXPECT_FALSE(VersionTable::IsSupported({3, 9}));
}

TEST(VersionTable, UnsupportedReleaseThrows) {
  EXPECT_THROW(VersionTable::ForVersion({3, 9}), UnsupportedVersionError);
  EXPECT_THROW(VersionTable::ForVersion({2, 7}), UnsupportedVersionError);
  EXPECT_THROW(VersionTable::ForVersion({3, 14}), UnsupportedVersionError);
}

TEST(VersionTable, CodeLayoutPerRelease) {
  EXPECT_EQ(VersionTable::ForVersion({3, 10}).codeLayout(), CodeLayout::Py310);
  EXPECT_EQ(VersionTable::ForVersion({3, 11}).codeLayout(), CodeLayout::Py311);
  EXPECT_EQ(VersionTable::ForVersion({3, 13}).codeLayout(), CodeLayout::Py311);
  EXPECT_EQ(VersionTable::ForVersion({3, 12}).marshalFormat(), 4);
}

TEST(VersionTable, LookupKnownTags) {
  const auto& table = VersionTable::ForVersion({3, 11});
  const TagSpec* ref = table.lookup(TypeTag::Ref);
  ASSERT_NE(ref, nullptr);
  EXPECT_EQ(ref->layout, PayloadLayout::RefIndex);
  EXPECT_FALSE(ref->referenceable);

  const TagSpec* smallTuple = table.lookup(static_cast<std::uint8_t>(')'));
  ASSERT_NE(smallTuple, nullptr);
  EXPECT_EQ(smallTuple->layout, PayloadLayout::Sequence8);
  EXPECT_TRUE(smallTuple->referenceable);
  EXPECT_STREQ(smallTuple->name, "TYPE_SMALL_TUPLE");
}

TEST(VersionTable, UnknownTagsHaveNoRow) {
  const auto& table = VersionTable::ForVersion({3, 13});
  EXPECT_EQ(table.lookup(static_cast<std::uint8_t>('?')), nullptr);
  EXPECT_EQ(table.lookup(static_cast<std::uint8_t>(0x01)), nullptr);
  EXPECT_EQ(table.lookup(static_cast<std::uint8_t>(0xFF)), nullptr);
}

TEST(VersionTable, CodeFieldOrder) {
  const auto& py310 = VersionTable::CodeFields(CodeLayout::Py310);
  const auto& py311 = VersionTable::CodeFields(CodeLayout::Py311);
  ASSERT_EQ(py310.size(), 16u);
  ASSERT_EQ(py311.size(), 16u);
  EXPECT_EQ(py310[3].field, CodeField::NLocals);
  EXPECT_EQ(py311[3].field, CodeField::StackSize);
  EXPECT_EQ(py311.back().field, CodeField::ExceptionTable);
  EXPECT_EQ(py311.back().storage, FieldStorage::Object);
  EXPECT_STREQ(to_string(CodeField::QualName), "qualname");
}

TEST(TypeTag, FlagAndNames) {
  EXPECT_EQ(static_cast<unsigned>(tag_byte(TypeTag::List) | kFlagRef), 0xDBu);
  EXPECT_EQ(0xDAu & kTagMask, static_cast<unsigned>('Z'));
  EXPECT_STREQ(to_string(TypeTag::ShortAsciiInterned), "TYPE_SHORT_ASCII_INTERNED");
}
