/***
 * Name: pymarshal::refs::ResolveRefs
 * Purpose: Replace every non-cyclic LoadRef with a copy of its target.
 * Theory of Operation: keep = FindRecursiveRefs. Shared acyclic values become
 *   independent copies; only references needed to express a cycle survive. For
 *   interpreter output without cycles the table ends empty.
 */
#pragma once

#include <cstddef>

#include "pymarshal/codec/options.h"
#include "pymarshal/refs/pass.h"

namespace pymarshal::refs {

class ResolveRefs : public Pass {
 public:
  explicit ResolveRefs(std::size_t maxDepth = codec::kDefaultMaxDepth) : maxDepth_(maxDepth) {}
  std::size_t run(object::Object& root, object::ReferenceTable& refs) override;
  const char* name() const override { return "resolve-refs"; }

 private:
  std::size_t maxDepth_;
};

}  // namespace pymarshal::refs
