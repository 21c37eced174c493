/***
 * Name: test_object_printer
 * Purpose: Dump format for trees, reference tables and escaped text.
 */
#include <gtest/gtest.h>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include "observability/ObjectPrinter.h"
#include "pymarshal/codec/marshal.h"
#include "pymarshal/exceptions/recursion_limit_error.h"

#include "../../util/Fixtures.h"

using namespace pymarshal;
using object::Object;
using testutil::bytes;

TEST(ObjectPrinter, SharedStringTree) {
  const auto decoded =
      codec::Decode(bytes({0x29, 0x02, 0xDA, 0x03, 'a', 'b', 'c', 0x72, 0x00, 0x00, 0x00, 0x00}), {3, 11});
  obs::ObjectPrinter printer;
  const std::string expected =
      "Tuple len=2 small\n"
      "  StoreRef #0\n"
      "    Str short-ascii-interned \"abc\"\n"
      "  LoadRef #0\n";
  EXPECT_EQ(printer.print(decoded.object), expected);
  EXPECT_EQ(printer.printRefs(decoded.refs), "#0 Str short-ascii-interned \"abc\"\n");
}

TEST(ObjectPrinter, ScalarsAndReservedSlots) {
  obs::ObjectPrinter printer;
  EXPECT_EQ(printer.print(Object::Int(42)), "Long int32 42\n");
  EXPECT_EQ(printer.print(Object::Float(1.5)), "Float binary 1.5\n");
  EXPECT_EQ(printer.print(Object::Bool(false)), "False\n");
  EXPECT_EQ(printer.print(Object::None()), "None\n");

  object::ReferenceTable refs;
  refs.reserve();
  EXPECT_EQ(printer.printRefs(refs), "#0 <unfilled>\n");
}

TEST(ObjectPrinter, CodeFieldsAreNamed) {
  obs::ObjectPrinter printer;
  const std::string out = printer.print(Object::Code(testutil::makeCode(version::CodeLayout::Py311, "f")));
  EXPECT_EQ(out.rfind("Code py311\n", 0), 0u);
  EXPECT_NE(out.find("  argcount=0\n"), std::string::npos);
  EXPECT_NE(out.find("  consts:\n    Tuple len=2 small\n"), std::string::npos);
  EXPECT_NE(out.find("  qualname:\n    Str short-ascii-interned \"f\"\n"), std::string::npos);
}

TEST(ObjectPrinter, EscapesText) {
  EXPECT_EQ(obs::ObjectPrinter::EscapeText("a\nb\"c"), "\"a\\nb\\\"c\"");
  EXPECT_EQ(obs::ObjectPrinter::EscapeText("\xC3\xA9"), "\"\xC3\xA9\"");
  EXPECT_EQ(obs::ObjectPrinter::EscapeText(std::string("\x01", 1)), "\"\\x01\"");
  EXPECT_EQ(obs::ObjectPrinter::EscapeText("\xC2\x85"), "\"\\x85\"");
  EXPECT_EQ(obs::ObjectPrinter::EscapeText("\xFF"), "\"\\xff\"");
  EXPECT_EQ(obs::ObjectPrinter::EscapeBytes("\xFFok"), "\"\\xffok\"");
}

TEST(ObjectPrinter, NestingLimit) {
  Object nested = Object::None();
  for (int i = 0; i < 3; ++i) {
    std::vector<Object> items;
    items.push_back(std::move(nested));
    nested = Object::List(std::move(items));
  }
  obs::ObjectPrinter shallow(2);
  EXPECT_THROW(shallow.print(nested), exceptions::RecursionLimitError);
  obs::ObjectPrinter deep(3);
  EXPECT_NO_THROW(deep.print(nested));
}

TEST(ObjectPrinter, DeepTreeWithRaisedLimit) {
  constexpr int kDepth = 3000;
  Object nested = Object::None();
  for (int i = 0; i < kDepth; ++i) {
    std::vector<Object> items;
    items.push_back(std::move(nested));
    nested = Object::List(std::move(items));
  }
  obs::ObjectPrinter defaults;
  EXPECT_THROW(defaults.print(nested), exceptions::RecursionLimitError);

  obs::ObjectPrinter raised(kDepth);
  const std::string text = raised.print(nested);
  std::size_t lines = 0;
  for (const char ch : text) {
    lines += ch == '\n' ? 1 : 0;
  }
  EXPECT_EQ(lines, static_cast<std::size_t>(kDepth) + 1);
  EXPECT_EQ(text.substr(0, 11), "List len=1\n");
  EXPECT_NE(text.find(std::string(2 * kDepth, ' ') + "None\n"), std::string::npos);
}
