/***
 * Name: pymarshal::object::ForEachChild
 * Purpose: Visit the direct children of a node in wire order.
 * Theory of Operation: A StoreRef's only child is its target; LoadRef has none.
 *   Callers keep their own stack or depth counter.
 */
#pragma once

#include "pymarshal/object/object.h"

namespace pymarshal::object {

template <typename Fn>
void ForEachChild(const Object& node, Fn&& fn) {
  switch (node.kind) {
    case ObjectKind::Tuple:
    case ObjectKind::List:
    case ObjectKind::Set:
    case ObjectKind::FrozenSet:
      for (const auto& item : node.as<SequenceValue>().items) {
        fn(item);
      }
      break;
    case ObjectKind::Dict:
      for (const auto& entry : node.as<DictValue>().entries) {
        fn(entry.key);
        fn(entry.value);
      }
      break;
    case ObjectKind::Code:
      for (const auto& field : node.as<CodeValue>().objects) {
        fn(field);
      }
      break;
    case ObjectKind::StoreRef:
      if (const auto& target = node.as<StoreRefValue>().target) {
        fn(*target);
      }
      break;
    default:
      break;
  }
}

}  // namespace pymarshal::object
