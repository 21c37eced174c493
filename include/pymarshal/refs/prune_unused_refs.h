/***
 * Name: pymarshal::refs::PruneUnusedRefs
 * Purpose: Drop the reference flag from every value that is never loaded back.
 * Theory of Operation: keep = CollectUsedRefs; every other StoreRef becomes its
 *   plain target. Remaining indices are renumbered contiguously.
 */
#pragma once

#include <cstddef>

#include "pymarshal/codec/options.h"
#include "pymarshal/refs/pass.h"

namespace pymarshal::refs {

class PruneUnusedRefs : public Pass {
 public:
  explicit PruneUnusedRefs(std::size_t maxDepth = codec::kDefaultMaxDepth) : maxDepth_(maxDepth) {}
  std::size_t run(object::Object& root, object::ReferenceTable& refs) override;
  const char* name() const override { return "prune-refs"; }

 private:
  std::size_t maxDepth_;
};

}  // namespace pymarshal::refs
