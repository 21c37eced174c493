/***
 * Name: test_ref_passes
 * Purpose: Reference analysis plus the prune-refs and resolve-refs rewrites.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <set>
#include <utility>
#include <vector>
#include "pymarshal/codec/marshal.h"
#include "pymarshal/exceptions/errors.h"
#include "pymarshal/refs/analysis.h"
#include "pymarshal/refs/prune_unused_refs.h"
#include "pymarshal/refs/resolve_refs.h"

#include "../../util/Fixtures.h"

using namespace pymarshal;
using object::Object;
using testutil::bytes;

namespace {
constexpr version::PyVersion kPy312{3, 12};

const std::vector<std::uint8_t> kSharedTuple =
    bytes({0x29, 0x02, 0xDA, 0x03, 'a', 'b', 'c', 0x72, 0x00, 0x00, 0x00, 0x00});
const std::vector<std::uint8_t> kSelfList = bytes({0xDB, 0x01, 0x00, 0x00, 0x00, 0x72, 0x00, 0x00, 0x00, 0x00});

// Level k is a flagged pair (level k-1, ref to level k-1); level 0 is the flagged string "a".
// Inlining every reference doubles the tree at each level.
std::vector<std::uint8_t> doublingChain(std::uint32_t levels) {
  std::vector<std::uint8_t> out;
  for (std::uint32_t k = 0; k < levels; ++k) {
    out.insert(out.end(), {0xA9, 0x02});
  }
  out.insert(out.end(), {0xDA, 0x01, 'a'});
  for (std::uint32_t index = levels; index >= 1; --index) {
    out.insert(out.end(), {0x72, static_cast<std::uint8_t>(index), 0x00, 0x00, 0x00});
  }
  return out;
}

Object nestedLists(int depth) {
  Object nested = Object::None();
  for (int i = 0; i < depth; ++i) {
    std::vector<Object> items;
    items.push_back(std::move(nested));
    nested = Object::List(std::move(items));
  }
  return nested;
}
}  // namespace

TEST(RefAnalysis, UsedAndRecursiveSets) {
  const auto shared = codec::Decode(kSharedTuple, kPy312);
  EXPECT_EQ(refs::CollectUsedRefs(shared.object, shared.refs), (std::set<std::uint32_t>{0}));
  EXPECT_TRUE(refs::FindRecursiveRefs(shared.object, shared.refs).empty());

  const auto self = codec::Decode(kSelfList, kPy312);
  EXPECT_EQ(refs::FindRecursiveRefs(self.object, self.refs), (std::set<std::uint32_t>{0}));
}

TEST(PruneUnusedRefs, KeepsLoadedStores) {
  auto decoded = codec::Decode(kSharedTuple, kPy312);
  refs::PruneUnusedRefs pass;
  EXPECT_EQ(pass.run(decoded.object, decoded.refs), 0u);
  EXPECT_STREQ(pass.name(), "prune-refs");
  EXPECT_EQ(pass.stats().at("stores.dropped"), 0u);
  EXPECT_EQ(codec::Encode(decoded.object, decoded.refs, kPy312), kSharedTuple);
}

TEST(PruneUnusedRefs, DropsUnloadedStoresAndRenumbers) {
  const auto input = bytes({0x29, 0x03, 0xDA, 0x01, 'a', 0xDA, 0x01, 'b', 0x72, 0x01, 0x00, 0x00, 0x00});
  auto decoded = codec::Decode(input, kPy312);
  ASSERT_EQ(decoded.refs.size(), 2u);
  refs::PruneUnusedRefs pass;
  EXPECT_EQ(pass.run(decoded.object, decoded.refs), 1u);
  EXPECT_EQ(decoded.refs.size(), 1u);
  EXPECT_EQ(pass.stats().at("refs.before"), 2u);
  EXPECT_EQ(pass.stats().at("refs.after"), 1u);
  EXPECT_EQ(codec::Encode(decoded.object, decoded.refs, kPy312),
            bytes({0x29, 0x03, 0x5A, 0x01, 'a', 0xDA, 0x01, 'b', 0x72, 0x00, 0x00, 0x00, 0x00}));
}

TEST(ResolveRefs, InlinesNonRecursiveLoads) {
  auto decoded = codec::Decode(kSharedTuple, kPy312);
  refs::ResolveRefs pass;
  EXPECT_EQ(pass.run(decoded.object, decoded.refs), 1u);
  EXPECT_TRUE(decoded.refs.empty());
  EXPECT_EQ(pass.stats().at("loads.inlined"), 1u);
  EXPECT_EQ(pass.stats().at("stores.dropped"), 1u);
  EXPECT_EQ(codec::Encode(decoded.object, decoded.refs, kPy312),
            bytes({0x29, 0x02, 0x5A, 0x03, 'a', 'b', 'c', 0x5A, 0x03, 'a', 'b', 'c'}));
}

TEST(ResolveRefs, KeepsRecursiveStores) {
  auto decoded = codec::Decode(kSelfList, kPy312);
  refs::ResolveRefs pass;
  EXPECT_EQ(pass.run(decoded.object, decoded.refs), 0u);
  EXPECT_EQ(pass.stats().at("refs.recursive"), 1u);
  EXPECT_EQ(decoded.refs.size(), 1u);
  EXPECT_EQ(codec::Encode(decoded.object, decoded.refs, kPy312), kSelfList);
}

TEST(RefPasses, DanglingLoadIsRejected) {
  Object root = Object::Tuple({Object::LoadRef(5)});
  object::ReferenceTable empty;
  refs::PruneUnusedRefs pass;
  EXPECT_THROW(pass.run(root, empty), exceptions::InvalidReferenceError);
}

TEST(RefPasses, RewriteDepthIsBounded) {
  Object nested = nestedLists(20);
  object::ReferenceTable empty;
  refs::ResolveRefs pass(10);
  EXPECT_THROW(pass.run(nested, empty), exceptions::RecursionLimitError);
}

TEST(RefPasses, DeepTreeRewritesWithRaisedBound) {
  constexpr int kDepth = 200000;
  Object nested = nestedLists(kDepth);
  const Object original = nested;
  object::ReferenceTable empty;
  refs::ResolveRefs pass(kDepth);
  EXPECT_EQ(pass.run(nested, empty), 0u);
  EXPECT_EQ(nested, original);
}

TEST(ResolveRefs, DoublingChainStaysWithinBudget) {
  auto decoded = codec::Decode(doublingChain(10), kPy312);
  ASSERT_EQ(decoded.refs.size(), 11u);
  refs::ResolveRefs pass;
  EXPECT_EQ(pass.run(decoded.object, decoded.refs), 11u);
  EXPECT_TRUE(decoded.refs.empty());
  EXPECT_EQ(pass.stats().at("loads.inlined"), 1023u);
}

TEST(ResolveRefs, DoublingChainExceedsBudget) {
  const auto input = doublingChain(40);
  auto decoded = codec::Decode(input, kPy312);
  refs::ResolveRefs pass;
  EXPECT_THROW(pass.run(decoded.object, decoded.refs), exceptions::InvalidObjectError);

  // Keeping the shared levels as references does not grow the tree; only the unused outer flag goes.
  auto again = codec::Decode(input, kPy312);
  refs::PruneUnusedRefs prune;
  EXPECT_EQ(prune.run(again.object, again.refs), 1u);
  const auto encoded = codec::Encode(again.object, again.refs, kPy312);
  EXPECT_EQ(encoded.size(), input.size());
  EXPECT_EQ(encoded.front(), 0x29);
}

TEST(ResolveRefs, SelfInliningTargetIsStopped) {
  // Index 0's table entry is a bare LoadRef(0): no container, so it is not a cycle, and inlining never ends.
  object::ReferenceTable refs;
  refs.append(object::MakeShared(Object::LoadRef(0)));
  Object root = Object::StoreRef(0, nullptr);
  refs::ResolveRefs pass;
  EXPECT_THROW(pass.run(root, refs), exceptions::InvalidObjectError);
}
