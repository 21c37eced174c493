/***
 * Name: pymarshal::object::ReferenceTable
 * Purpose: Ordered index -> object mapping of one decode or encode call.
 * Inputs: Slots reserved and filled by the decoder, or entries appended by callers
 * Outputs: Shared targets looked up by LoadRef/StoreRef indices
 * Theory of Operation:
 *   Indices are dense and assigned from 0. The decoder reserves a slot when it
 *   reads a flagged tag byte, before the payload, and fills it once the value is
 *   complete; a reserved slot is already a valid LoadRef target, which is how
 *   self-references decode. The table is append-only.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "pymarshal/object/object.h"

namespace pymarshal::object {

class ReferenceTable {
 public:
  /*** reserve: Allocate the next index with an empty slot. */
  std::uint32_t reserve();
  /*** fill: Store the completed value of a reserved slot. */
  void fill(std::uint32_t index, ObjectPtr value);
  /*** append: reserve + fill. */
  std::uint32_t append(ObjectPtr value);

  bool contains(std::uint32_t index) const { return index < slots_.size(); }
  bool isFilled(std::uint32_t index) const { return contains(index) && slots_[index] != nullptr; }
  /*** at: Slot content (nullptr while reserved); throws InvalidReferenceError when out of range. */
  const ObjectPtr& at(std::uint32_t index) const;

  std::size_t size() const { return slots_.size(); }
  bool empty() const { return slots_.empty(); }
  void clear() { slots_.clear(); }

 private:
  std::vector<ObjectPtr> slots_;
};

}  // namespace pymarshal::object
