/**
 * @file
 * @brief Object tree geometry summary declarations.
 */
#pragma once

#include <cstdint>

#include "pymarshal/object/object.h"

namespace pymarshal::obs {

// nodes counts every Object including StoreRef wrappers; maxDepth counts
// nested containers (a scalar root has depth 0).
struct ObjectGeometry {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
  uint64_t storeRefs{0};
  uint64_t loadRefs{0};
};

ObjectGeometry ComputeGeometry(const object::Object& root);

}  // namespace pymarshal::obs
