/***
 * Name: pymarshal::object::Object (construction)
 * Purpose: Named constructors for every variant and code-field accessors.
 */
#include "pymarshal/object/object.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pymarshal/numeric/float_text.h"

namespace pymarshal::object {

namespace {
constexpr std::size_t kMaxSmallTuple = 255;
}  // namespace

Object Object::Null() { return Object{ObjectKind::Null, std::monostate{}}; }
Object Object::None() { return Object{ObjectKind::None, std::monostate{}}; }
Object Object::Bool(bool value) { return Object{ObjectKind::Bool, value}; }
Object Object::StopIteration() { return Object{ObjectKind::StopIteration, std::monostate{}}; }
Object Object::Ellipsis() { return Object{ObjectKind::Ellipsis, std::monostate{}}; }

Object Object::Int(std::int64_t value) {
  const bool fits32 =
      value >= std::numeric_limits<std::int32_t>::min() && value <= std::numeric_limits<std::int32_t>::max();
  return Long(numeric::BigInt::FromInt64(value), fits32 ? IntForm::Int32 : IntForm::Long);
}

Object Object::Long(numeric::BigInt value, IntForm form) {
  return Object{ObjectKind::Long, LongValue{std::move(value), form}};
}

Object Object::Float(double value, FloatForm form) {
  FloatValue payload{value, form, {}};
  if (form == FloatForm::Text) {
    payload.text = numeric::FormatFloatText(value);
  }
  return Object{ObjectKind::Float, std::move(payload)};
}

Object Object::FloatText(double value, std::string text) {
  return Object{ObjectKind::Float, FloatValue{value, FloatForm::Text, std::move(text)}};
}

Object Object::Complex(double real, double imag, FloatForm form) {
  ComplexValue payload{real, imag, form, {}, {}};
  if (form == FloatForm::Text) {
    payload.realText = numeric::FormatFloatText(real);
    payload.imagText = numeric::FormatFloatText(imag);
  }
  return Object{ObjectKind::Complex, std::move(payload)};
}

Object Object::Bytes(std::vector<std::uint8_t> data) {
  return Object{ObjectKind::Bytes, BytesValue{std::move(data)}};
}

Object Object::Str(std::string data, StrForm form) { return Object{ObjectKind::Str, StrValue{std::move(data), form}}; }

Object Object::Tuple(std::vector<Object> items) {
  const bool small = items.size() <= kMaxSmallTuple;
  return Tuple(std::move(items), small);
}

Object Object::Tuple(std::vector<Object> items, bool small) {
  return Object{ObjectKind::Tuple, SequenceValue{std::move(items), small}};
}

Object Object::List(std::vector<Object> items) {
  return Object{ObjectKind::List, SequenceValue{std::move(items), false}};
}

Object Object::Set(std::vector<Object> items) { return Object{ObjectKind::Set, SequenceValue{std::move(items), false}}; }

Object Object::FrozenSet(std::vector<Object> items) {
  return Object{ObjectKind::FrozenSet, SequenceValue{std::move(items), false}};
}

Object Object::Dict(std::vector<DictEntry> entries) { return Object{ObjectKind::Dict, DictValue{std::move(entries)}}; }

Object Object::Code(CodeValue code) { return Object{ObjectKind::Code, std::move(code)}; }

Object Object::LoadRef(std::uint32_t index) { return Object{ObjectKind::LoadRef, LoadRefValue{index}}; }

Object Object::StoreRef(std::uint32_t index, ObjectPtr target) {
  return Object{ObjectKind::StoreRef, StoreRefValue{index, std::move(target)}};
}

ObjectPtr MakeShared(Object value) { return std::make_shared<const Object>(std::move(value)); }

std::optional<std::int32_t> CodeValue::intField(version::CodeField field) const {
  std::size_t slot = 0;
  for (const auto& spec : version::VersionTable::CodeFields(layout)) {
    if (spec.storage != version::FieldStorage::Int32) {
      continue;
    }
    if (spec.field == field) {
      if (slot < numbers.size()) {
        return numbers[slot];
      }
      return std::nullopt;
    }
    ++slot;
  }
  return std::nullopt;
}

const Object* CodeValue::objectField(version::CodeField field) const {
  std::size_t slot = 0;
  for (const auto& spec : version::VersionTable::CodeFields(layout)) {
    if (spec.storage != version::FieldStorage::Object) {
      continue;
    }
    if (spec.field == field) {
      return slot < objects.size() ? &objects[slot] : nullptr;
    }
    ++slot;
  }
  return nullptr;
}

}  // namespace pymarshal::object
