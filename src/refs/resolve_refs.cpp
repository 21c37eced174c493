/***
 * Name: pymarshal::refs::ResolveRefs (impl)
 */
#include "pymarshal/refs/resolve_refs.h"

#include <cstddef>
#include <utility>

#include "pymarshal/refs/analysis.h"

namespace pymarshal::refs {

std::size_t ResolveRefs::run(object::Object& root, object::ReferenceTable& refs) {
  const std::size_t before = refs.size();
  const auto recursive = FindRecursiveRefs(root, refs);
  detail::RewriteResult result = detail::RewriteRefs(root, refs, recursive, maxDepth_);
  root = std::move(result.root);
  refs = std::move(result.refs);
  stats_["refs.before"] = before;
  stats_["refs.after"] = refs.size();
  stats_["refs.recursive"] = recursive.size();
  stats_["loads.inlined"] = result.inlinedLoads;
  stats_["stores.dropped"] = result.droppedStores;
  return before > refs.size() ? before - refs.size() : 0;
}

}  // namespace pymarshal::refs
