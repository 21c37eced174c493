/***
 * Name: pymarshal::obs::ComputeGeometry
 * Purpose: Count nodes, references and container nesting of an object tree.
 * Theory of Operation: Explicit stack of (node, depth); a StoreRef's target sits
 *   at the StoreRef's own depth.
 */
#include "observability/Geometry.h"

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

#include "pymarshal/object/traverse.h"

namespace pymarshal::obs {

ObjectGeometry ComputeGeometry(const object::Object& root) {
  ObjectGeometry geom;
  std::vector<std::pair<const object::Object*, uint64_t>> pending{{&root, 0}};
  while (!pending.empty()) {
    const auto [node, depth] = pending.back();
    pending.pop_back();
    ++geom.nodes;
    uint64_t childDepth = depth;
    switch (node->kind) {
      case object::ObjectKind::StoreRef:
        ++geom.storeRefs;
        break;
      case object::ObjectKind::LoadRef:
        ++geom.loadRefs;
        break;
      case object::ObjectKind::Tuple:
      case object::ObjectKind::List:
      case object::ObjectKind::Set:
      case object::ObjectKind::FrozenSet:
      case object::ObjectKind::Dict:
      case object::ObjectKind::Code:
        childDepth = depth + 1;
        geom.maxDepth = std::max(geom.maxDepth, childDepth);
        break;
      default:
        break;
    }
    object::ForEachChild(*node, [&pending, childDepth](const object::Object& child) {
      pending.emplace_back(&child, childDepth);
    });
  }
  return geom;
}

}  // namespace pymarshal::obs
