/***
 * Name: test_parseargs_happy
 * Purpose: Happy-path CLI parsing for flags, prefixed options and positionals.
 */
#include <gtest/gtest.h>
#include "cli/CLI.h"

using namespace pymarshal::cli;

TEST(CLI_Happy, HelpAndOutput) {
  const char* argv[] = {"pymarshal", "-h", "-o", "out.bin", "in.bin"};
  Options o;
  ASSERT_TRUE(ParseArgs(5, const_cast<char**>(argv), o));
  EXPECT_TRUE(o.showHelp);
  EXPECT_EQ(o.outputFile, "out.bin");
  ASSERT_EQ(o.inputs.size(), 1u);
  EXPECT_EQ(o.inputs[0], "in.bin");
}

TEST(CLI_Happy, BooleanFlags) {
  const char* argv[] = {"pymarshal", "--pyc", "--dump", "--verify", "--prune-refs", "--allow-trailing",
                        "--metrics", "--metrics-json", "--log-decode", "--log-refs", "m.pyc"};
  Options o;
  ASSERT_TRUE(ParseArgs(11, const_cast<char**>(argv), o));
  EXPECT_TRUE(o.forcePyc);
  EXPECT_TRUE(o.dump);
  EXPECT_TRUE(o.verify);
  EXPECT_TRUE(o.pruneRefs);
  EXPECT_FALSE(o.resolveRefs);
  EXPECT_TRUE(o.allowTrailing);
  EXPECT_TRUE(o.metrics);
  EXPECT_TRUE(o.metricsJson);
  EXPECT_TRUE(o.logDecode);
  EXPECT_TRUE(o.logRefs);
}

TEST(CLI_Happy, PrefixedOptions) {
  const char* argv[] = {"pymarshal", "--py-version=3.12", "--max-depth=64", "--color=never", "--log-path=logs",
                        "raw.bin"};
  Options o;
  ASSERT_TRUE(ParseArgs(6, const_cast<char**>(argv), o));
  ASSERT_TRUE(o.pyVersion.has_value());
  EXPECT_EQ(*o.pyVersion, (pymarshal::version::PyVersion{3, 12}));
  EXPECT_EQ(o.maxDepth, 64u);
  EXPECT_EQ(o.color, ColorMode::Never);
  EXPECT_EQ(o.logPath, "logs");
}

TEST(CLI_Happy, Defaults) {
  const char* argv[] = {"pymarshal", "a.pyc", "b.pyc"};
  Options o;
  ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv), o));
  EXPECT_EQ(o.maxDepth, pymarshal::codec::kDefaultMaxDepth);
  EXPECT_FALSE(o.pyVersion.has_value());
  EXPECT_EQ(o.color, ColorMode::Auto);
  EXPECT_EQ(o.inputs.size(), 2u);
}

TEST(CLI_Happy, EndOfOptions) {
  const char* argv[] = {"pymarshal", "--dump", "--", "-odd.bin", "--verify"};
  Options o;
  ASSERT_TRUE(ParseArgs(5, const_cast<char**>(argv), o));
  EXPECT_TRUE(o.dump);
  EXPECT_FALSE(o.verify);
  ASSERT_EQ(o.inputs.size(), 2u);
  EXPECT_EQ(o.inputs[0], "-odd.bin");
  EXPECT_EQ(o.inputs[1], "--verify");
}

TEST(CLI_Happy, UsageListsOptions) {
  const auto text = Usage();
  EXPECT_NE(text.find("pymarshal [options] file"), std::string::npos);
  EXPECT_NE(text.find("--py-version=<M.m>"), std::string::npos);
  EXPECT_NE(text.find("--resolve-refs"), std::string::npos);
}
