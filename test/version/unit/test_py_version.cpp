/***
 * Name: test_py_version
 * Purpose: Parse and print Python release identifiers.
 */
#include <gtest/gtest.h>
#include <string>
#include "pymarshal/version/py_version.h"

using namespace pymarshal::version;

TEST(PyVersion, ParsesMajorMinor) {
  PyVersion v;
  ASSERT_TRUE(ParsePyVersion("3.11", v));
  EXPECT_EQ(v.major, 3);
  EXPECT_EQ(v.minor, 11);
  EXPECT_EQ(to_string(v), "3.11");
}

TEST(PyVersion, LeadingSpacesAccepted) {
  PyVersion v;
  ASSERT_TRUE(ParsePyVersion("  3.10", v));
  EXPECT_EQ(v, (PyVersion{3, 10}));
}

TEST(PyVersion, RejectsMalformed) {
  PyVersion v;
  std::string err;
  EXPECT_FALSE(ParsePyVersion("3", v, &err));
  EXPECT_FALSE(err.empty());
  EXPECT_FALSE(ParsePyVersion("3.x", v));
  EXPECT_FALSE(ParsePyVersion("3.11.4", v));
  EXPECT_FALSE(ParsePyVersion(".11", v));
  EXPECT_FALSE(ParsePyVersion("3.256", v, &err));
  EXPECT_EQ(err, "version component out of range");
}

TEST(PyVersion, Ordering) {
  EXPECT_TRUE((PyVersion{3, 4}) < (PyVersion{3, 10}));
  EXPECT_TRUE((PyVersion{3, 13}) <= (PyVersion{3, 13}));
  EXPECT_FALSE((PyVersion{3, 11}) < (PyVersion{3, 10}));
  EXPECT_NE((PyVersion{3, 11}), (PyVersion{3, 12}));
}
