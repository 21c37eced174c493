/***
 * Name: pymarshal::refs (analysis)
 * Purpose: Reference-graph queries and the shared rewriting engine of the passes.
 * Inputs: Root object and ReferenceTable as produced by the decoder (or built by hand)
 * Outputs: Index sets, or a rewritten tree with a fresh table
 * Theory of Operation:
 *   Index i's target is the StoreRef(i) target found in the tree, or the table
 *   entry when the tree has none. Edges i -> j exist when j's StoreRef or LoadRef
 *   occurs inside i's target (not looking inside nested StoreRef targets, which
 *   are nodes of their own). i is recursive when it reaches itself.
 *
 *   RewriteRefs keeps the indices in `keep` as references and inlines all
 *   others. The first occurrence of a kept index in the output's pre-order
 *   becomes a StoreRef, later ones LoadRefs, with indices renumbered from 0 in
 *   that order, so the result satisfies the encoder's ordering rules.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <set>

#include "pymarshal/object/object.h"
#include "pymarshal/object/reference_table.h"

namespace pymarshal::refs {

/*** FindRecursiveRefs: Indices whose target reaches the index again. */
std::set<std::uint32_t> FindRecursiveRefs(const object::Object& root, const object::ReferenceTable& refs);

/*** CollectUsedRefs: Indices named by at least one LoadRef in the tree or the table. */
std::set<std::uint32_t> CollectUsedRefs(const object::Object& root, const object::ReferenceTable& refs);

namespace detail {

struct RewriteResult {
  object::Object root;
  object::ReferenceTable refs;
  std::uint64_t inlinedLoads{0};
  std::uint64_t droppedStores{0};
};

/*** RewriteRefs: Throws InvalidReferenceError for a LoadRef without target,
 *   RecursionLimitError when the output nests deeper than maxDepth, and
 *   InvalidObjectError when the output outgrows a node budget proportional to the input. */
RewriteResult RewriteRefs(const object::Object& root, const object::ReferenceTable& refs,
                          const std::set<std::uint32_t>& keep, std::size_t maxDepth);

}  // namespace detail

}  // namespace pymarshal::refs
