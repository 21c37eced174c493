/***
 * Name: pymarshal::object::operator==
 * Purpose: Structural comparison of two object trees.
 * Theory of Operation: Pairs still to compare sit on an explicit stack; scalar
 *   payloads are compared in place and children are pushed pairwise.
 */
#include <bit>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "pymarshal/object/object.h"

namespace pymarshal::object {

namespace {

bool sameBits(double lhs, double rhs) { return std::bit_cast<std::uint64_t>(lhs) == std::bit_cast<std::uint64_t>(rhs); }

using Pending = std::vector<std::pair<const Object*, const Object*>>;

bool compareShallow(const Object& lhs, const Object& rhs, Pending& pending) {
  if (lhs.kind != rhs.kind) {
    return false;
  }
  switch (lhs.kind) {
    case ObjectKind::Null:
    case ObjectKind::None:
    case ObjectKind::StopIteration:
    case ObjectKind::Ellipsis:
      return true;
    case ObjectKind::Bool:
      return lhs.as<bool>() == rhs.as<bool>();
    case ObjectKind::Long: {
      const auto& lv = lhs.as<LongValue>();
      const auto& rv = rhs.as<LongValue>();
      return lv.form == rv.form && lv.value == rv.value;
    }
    case ObjectKind::Float: {
      const auto& lv = lhs.as<FloatValue>();
      const auto& rv = rhs.as<FloatValue>();
      return lv.form == rv.form && sameBits(lv.value, rv.value) && lv.text == rv.text;
    }
    case ObjectKind::Complex: {
      const auto& lv = lhs.as<ComplexValue>();
      const auto& rv = rhs.as<ComplexValue>();
      return lv.form == rv.form && sameBits(lv.real, rv.real) && sameBits(lv.imag, rv.imag) &&
             lv.realText == rv.realText && lv.imagText == rv.imagText;
    }
    case ObjectKind::Bytes:
      return lhs.as<BytesValue>().data == rhs.as<BytesValue>().data;
    case ObjectKind::Str: {
      const auto& lv = lhs.as<StrValue>();
      const auto& rv = rhs.as<StrValue>();
      return lv.form == rv.form && lv.data == rv.data;
    }
    case ObjectKind::Tuple:
    case ObjectKind::List:
    case ObjectKind::Set:
    case ObjectKind::FrozenSet: {
      const auto& lv = lhs.as<SequenceValue>();
      const auto& rv = rhs.as<SequenceValue>();
      if (lv.small != rv.small || lv.items.size() != rv.items.size()) {
        return false;
      }
      for (std::size_t i = 0; i < lv.items.size(); ++i) {
        pending.emplace_back(&lv.items[i], &rv.items[i]);
      }
      return true;
    }
    case ObjectKind::Dict: {
      const auto& lv = lhs.as<DictValue>();
      const auto& rv = rhs.as<DictValue>();
      if (lv.entries.size() != rv.entries.size()) {
        return false;
      }
      for (std::size_t i = 0; i < lv.entries.size(); ++i) {
        pending.emplace_back(&lv.entries[i].key, &rv.entries[i].key);
        pending.emplace_back(&lv.entries[i].value, &rv.entries[i].value);
      }
      return true;
    }
    case ObjectKind::Code: {
      const auto& lv = lhs.as<CodeValue>();
      const auto& rv = rhs.as<CodeValue>();
      if (lv.layout != rv.layout || lv.numbers != rv.numbers || lv.objects.size() != rv.objects.size()) {
        return false;
      }
      for (std::size_t i = 0; i < lv.objects.size(); ++i) {
        pending.emplace_back(&lv.objects[i], &rv.objects[i]);
      }
      return true;
    }
    case ObjectKind::LoadRef:
      return lhs.as<LoadRefValue>().index == rhs.as<LoadRefValue>().index;
    case ObjectKind::StoreRef: {
      const auto& lv = lhs.as<StoreRefValue>();
      const auto& rv = rhs.as<StoreRefValue>();
      if (lv.index != rv.index || (lv.target == nullptr) != (rv.target == nullptr)) {
        return false;
      }
      if (lv.target != nullptr && lv.target != rv.target) {
        pending.emplace_back(lv.target.get(), rv.target.get());
      }
      return true;
    }
  }
  return false;
}

}  // namespace

bool operator==(const Object& lhs, const Object& rhs) {
  Pending pending;
  pending.emplace_back(&lhs, &rhs);
  while (!pending.empty()) {
    const auto [left, right] = pending.back();
    pending.pop_back();
    if (left == right) {
      continue;
    }
    if (!compareShallow(*left, *right, pending)) {
      return false;
    }
  }
  return true;
}

}  // namespace pymarshal::object
