/***
 * Name: pymarshal::refs::Pass
 * Purpose: Base interface for rewriting passes over a decoded object graph.
 * Inputs:
 *   - Root object and its ReferenceTable (both mutable)
 * Outputs:
 *   - Number of reference table entries removed; per-pass counters via stats().
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "pymarshal/object/object.h"
#include "pymarshal/object/reference_table.h"

namespace pymarshal::refs {

class Pass {
 public:
  virtual ~Pass() = default;

  virtual std::size_t run(object::Object& root, object::ReferenceTable& refs) = 0;
  virtual const char* name() const = 0;

  const std::unordered_map<std::string, std::uint64_t>& stats() const { return stats_; }

 protected:
  std::unordered_map<std::string, std::uint64_t> stats_{};
};

}  // namespace pymarshal::refs
