/***
 * Name: pymarshal::refs::PruneUnusedRefs (impl)
 */
#include "pymarshal/refs/prune_unused_refs.h"

#include <cstddef>
#include <utility>

#include "pymarshal/refs/analysis.h"

namespace pymarshal::refs {

std::size_t PruneUnusedRefs::run(object::Object& root, object::ReferenceTable& refs) {
  const std::size_t before = refs.size();
  detail::RewriteResult result = detail::RewriteRefs(root, refs, CollectUsedRefs(root, refs), maxDepth_);
  root = std::move(result.root);
  refs = std::move(result.refs);
  stats_["refs.before"] = before;
  stats_["refs.after"] = refs.size();
  stats_["stores.dropped"] = result.droppedStores;
  return before > refs.size() ? before - refs.size() : 0;
}

}  // namespace pymarshal::refs
