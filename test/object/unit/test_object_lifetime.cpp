/***
 * Name: test_object_lifetime
 * Purpose: Copying and destroying trees nested far deeper than the native stack allows.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>
#include "pymarshal/object/object.h"

using namespace pymarshal::object;

namespace {

constexpr int kDeep = 200000;

Object nestedLists(int depth) {
  Object current = Object::None();
  for (int i = 0; i < depth; ++i) {
    std::vector<Object> items;
    items.push_back(std::move(current));
    current = Object::List(std::move(items));
  }
  return current;
}

// Every level is its own StoreRef, so the tree is held together by shared targets.
Object nestedStoreRefs(int depth) {
  Object current = Object::None();
  for (int i = 0; i < depth; ++i) {
    std::vector<Object> items;
    items.push_back(std::move(current));
    current = Object::StoreRef(static_cast<std::uint32_t>(depth - 1 - i), MakeShared(Object::Tuple(std::move(items))));
  }
  return current;
}

}  // namespace

TEST(ObjectLifetime, DeepListTreeIsDestroyed) {
  { const Object deep = nestedLists(kDeep); }
  SUCCEED();
}

TEST(ObjectLifetime, DeepStoreRefChainIsDestroyed) {
  { const Object deep = nestedStoreRefs(kDeep); }
  SUCCEED();
}

TEST(ObjectLifetime, DeepCopyMatchesOriginal) {
  const Object original = nestedLists(kDeep);
  const Object copy = original;
  EXPECT_EQ(copy, original);

  Object assigned = Object::Int(1);
  assigned = original;
  EXPECT_EQ(assigned, original);
}

TEST(ObjectLifetime, CopySharesStoreRefTargets) {
  const ObjectPtr target = MakeShared(Object::Str("abc", StrForm::ShortAsciiInterned));
  const Object original = Object::Tuple({Object::StoreRef(0, target), Object::LoadRef(0)});
  const Object copy = original;
  EXPECT_EQ(copy.as<SequenceValue>().items[0].as<StoreRefValue>().target, target);
  EXPECT_EQ(copy.as<SequenceValue>().items[1].as<LoadRefValue>().index, 0u);
}

TEST(ObjectLifetime, CopyKeepsDictAndCodeChildren) {
  const Object dict = Object::Dict({DictEntry{Object::Str("k"), Object::List({Object::Int(1), Object::None()})}});
  const Object dictCopy = dict;
  EXPECT_EQ(dictCopy, dict);

  CodeValue code;
  code.layout = pymarshal::version::CodeLayout::Py311;
  code.numbers = {1, 2, 3};
  code.objects.push_back(Object::Bytes({0x64, 0x00}));
  code.objects.push_back(Object::Tuple({Object::None()}));
  const Object codeObject = Object::Code(code);
  const Object codeCopy = codeObject;
  EXPECT_EQ(codeCopy, codeObject);
  EXPECT_EQ(codeCopy.as<CodeValue>().numbers, (std::vector<std::int32_t>{1, 2, 3}));
}

TEST(ObjectLifetime, SharedTargetOutlivesTree) {
  ObjectPtr kept;
  {
    const Object tree = nestedStoreRefs(1000);
    kept = tree.as<StoreRefValue>().target;
  }
  ASSERT_NE(kept, nullptr);
  EXPECT_EQ(kept->kind, ObjectKind::Tuple);
  EXPECT_EQ(kept->as<SequenceValue>().items.size(), 1u);
}
