/***
 * Name: pymarshal::object::ReferenceTable
 * Purpose: Slot management for reference indices.
 */
#include "pymarshal/object/reference_table.h"

#include <cstdint>
#include <string>
#include <utility>

#include "pymarshal/exceptions/invalid_reference_error.h"

namespace pymarshal::object {

std::uint32_t ReferenceTable::reserve() {
  slots_.emplace_back();
  return static_cast<std::uint32_t>(slots_.size() - 1);
}

void ReferenceTable::fill(std::uint32_t index, ObjectPtr value) {
  if (!contains(index)) {
    throw exceptions::InvalidReferenceError("cannot fill reference " + std::to_string(index) + ": table has " +
                                            std::to_string(slots_.size()) + " entries");
  }
  slots_[index] = std::move(value);
}

std::uint32_t ReferenceTable::append(ObjectPtr value) {
  const auto index = reserve();
  slots_[index] = std::move(value);
  return index;
}

const ObjectPtr& ReferenceTable::at(std::uint32_t index) const {
  if (!contains(index)) {
    throw exceptions::InvalidReferenceError("reference index " + std::to_string(index) + " out of range (" +
                                            std::to_string(slots_.size()) + " entries)");
  }
  return slots_[index];
}

}  // namespace pymarshal::object
