/***
 * Name: test_object_model
 * Purpose: Factories, forms, code field access and the reference table.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <vector>
#include "pymarshal/exceptions/invalid_reference_error.h"
#include "pymarshal/object/object.h"
#include "pymarshal/object/reference_table.h"
#include "pymarshal/object/traverse.h"

#include "../../util/Fixtures.h"

using namespace pymarshal::object;
using pymarshal::exceptions::InvalidReferenceError;
using pymarshal::version::CodeField;
using pymarshal::version::CodeLayout;

TEST(ObjectModel, IntPicksNarrowestForm) {
  EXPECT_EQ(Object::Int(42).as<LongValue>().form, IntForm::Int32);
  EXPECT_EQ(Object::Int(-2147483648LL).as<LongValue>().form, IntForm::Int32);
  EXPECT_EQ(Object::Int(2147483648LL).as<LongValue>().form, IntForm::Long);
}

TEST(ObjectModel, TupleDefaultsToSmallBelow256) {
  EXPECT_TRUE(Object::Tuple(std::vector<Object>(255, Object::None())).as<SequenceValue>().small);
  EXPECT_FALSE(Object::Tuple(std::vector<Object>(256, Object::None())).as<SequenceValue>().small);
}

TEST(ObjectModel, TextFloatKeepsRepr) {
  EXPECT_EQ(Object::Float(0.5, FloatForm::Text).as<FloatValue>().text, "0.5");
  EXPECT_TRUE(Object::Float(0.5).as<FloatValue>().text.empty());
}

TEST(ObjectModel, StrForms) {
  EXPECT_TRUE(IsInterned(StrForm::ShortAsciiInterned));
  EXPECT_FALSE(IsInterned(StrForm::Ascii));
  EXPECT_TRUE(IsAsciiForm(StrForm::ShortAscii));
  EXPECT_FALSE(IsAsciiForm(StrForm::Interned));
  EXPECT_STREQ(to_string(StrForm::AsciiInterned), "ascii-interned");
}

TEST(ObjectModel, CodeFieldAccessFollowsLayout) {
  const CodeValue py310 = testutil::makeCode(CodeLayout::Py310, "f");
  ASSERT_TRUE(py310.intField(CodeField::NLocals).has_value());
  EXPECT_EQ(*py310.intField(CodeField::NLocals), 3);
  EXPECT_EQ(*py310.intField(CodeField::FirstLineNo), 6);
  EXPECT_EQ(py310.objectField(CodeField::QualName), nullptr);

  const CodeValue py311 = testutil::makeCode(CodeLayout::Py311, "g");
  EXPECT_FALSE(py311.intField(CodeField::NLocals).has_value());
  const Object* qualname = py311.objectField(CodeField::QualName);
  ASSERT_NE(qualname, nullptr);
  EXPECT_EQ(qualname->as<StrValue>().data, "g");
}

TEST(ReferenceTable, ReserveThenFill) {
  ReferenceTable refs;
  const auto index = refs.reserve();
  EXPECT_EQ(index, 0u);
  EXPECT_TRUE(refs.contains(0));
  EXPECT_FALSE(refs.isFilled(0));
  EXPECT_EQ(refs.at(0), nullptr);
  const ObjectPtr value = MakeShared(Object::Int(1));
  refs.fill(0, value);
  EXPECT_TRUE(refs.isFilled(0));
  EXPECT_EQ(refs.at(0).get(), value.get());
  EXPECT_EQ(refs.append(MakeShared(Object::None())), 1u);
  EXPECT_EQ(refs.size(), 2u);
}

TEST(ReferenceTable, OutOfRangeThrows) {
  ReferenceTable refs;
  EXPECT_THROW(refs.at(0), InvalidReferenceError);
  EXPECT_THROW(refs.fill(2, MakeShared(Object::None())), InvalidReferenceError);
  refs.reserve();
  refs.clear();
  EXPECT_TRUE(refs.empty());
}

TEST(Traverse, StoreRefExposesTarget) {
  const Object store = Object::StoreRef(0, MakeShared(Object::Str("abc")));
  int visits = 0;
  ForEachChild(store, [&visits](const Object& child) {
    ++visits;
    EXPECT_EQ(child.kind, ObjectKind::Str);
  });
  EXPECT_EQ(visits, 1);

  int dictVisits = 0;
  ForEachChild(Object::Dict({{Object::Int(1), Object::Int(2)}}), [&dictVisits](const Object&) { ++dictVisits; });
  EXPECT_EQ(dictVisits, 2);
}
