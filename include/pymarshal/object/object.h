/***
 * Name: pymarshal::object::Object
 * Purpose: In-memory form of one marshalled value.
 * Inputs: Values built by the decoder or by callers preparing an encode
 * Outputs: Closed tagged union walked by the encoder, printers and passes
 * Theory of Operation:
 *   `kind` selects the variant and `payload` carries its data. Containers own
 *   their children by value so the graph is a tree; sharing and cycles are
 *   expressed only by StoreRef(i, target) at the first occurrence and LoadRef(i)
 *   at every later one. A StoreRef holds its target through the same
 *   shared pointer the ReferenceTable stores for index i.
 *
 *   Copying and destroying a tree walk it with explicit stacks, so trees nested
 *   far deeper than the native stack allows can still be copied and freed.
 *
 *   Tuple, List, Set and FrozenSet share SequenceValue; `small` is meaningful
 *   for tuples only. Set members keep wire order.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "pymarshal/numeric/big_int.h"
#include "pymarshal/object/object_kind.h"
#include "pymarshal/version/version_table.h"

namespace pymarshal::object {

struct Object;
struct DictEntry;
using ObjectPtr = std::shared_ptr<const Object>;

struct LongValue {
  numeric::BigInt value;
  IntForm form{IntForm::Long};
};

struct FloatValue {
  double value{0.0};
  FloatForm form{FloatForm::Binary};
  std::string text;  // original decimal text, Text form only
};

struct ComplexValue {
  double real{0.0};
  double imag{0.0};
  FloatForm form{FloatForm::Binary};
  std::string realText;
  std::string imagText;
};

struct BytesValue {
  std::vector<std::uint8_t> data;
};

struct StrValue {
  std::string data;  // bytes exactly as on the wire (UTF-8 for Unicode/Interned)
  StrForm form{StrForm::Unicode};
};

struct SequenceValue {
  std::vector<Object> items;
  bool small{false};
};

struct DictValue {
  std::vector<DictEntry> entries;
};

struct CodeValue {
  version::CodeLayout layout{version::CodeLayout::Py311};
  std::vector<std::int32_t> numbers;  // Int32 fields in layout order
  std::vector<Object> objects;        // Object fields in layout order

  /*** intField: Value of an int32 field, empty when the layout lacks it. */
  std::optional<std::int32_t> intField(version::CodeField field) const;
  /*** objectField: Object field, nullptr when the layout lacks it. */
  const Object* objectField(version::CodeField field) const;
};

struct LoadRefValue {
  std::uint32_t index{0};
};

struct StoreRefValue {
  std::uint32_t index{0};
  ObjectPtr target;
};

using Payload = std::variant<std::monostate, bool, LongValue, FloatValue, ComplexValue, BytesValue, StrValue,
                             SequenceValue, DictValue, CodeValue, LoadRefValue, StoreRefValue>;

struct Object {
  ObjectKind kind{ObjectKind::None};
  Payload payload;

  Object() = default;
  Object(ObjectKind valueKind, Payload value) : kind(valueKind), payload(std::move(value)) {}
  /*** Deep copy and teardown use explicit work lists; nesting depth costs no native stack. */
  Object(const Object& other);
  Object(Object&& other) noexcept = default;
  Object& operator=(const Object& other);
  Object& operator=(Object&& other) noexcept = default;
  ~Object();

  static Object Null();
  static Object None();
  static Object Bool(bool value);
  static Object StopIteration();
  static Object Ellipsis();
  /*** Int: Int32 form when it fits in 32 bits, Long otherwise. */
  static Object Int(std::int64_t value);
  static Object Long(numeric::BigInt value, IntForm form);
  /*** Float: Text form derives its text from the value. */
  static Object Float(double value, FloatForm form = FloatForm::Binary);
  static Object FloatText(double value, std::string text);
  static Object Complex(double real, double imag, FloatForm form = FloatForm::Binary);
  static Object Bytes(std::vector<std::uint8_t> data);
  static Object Str(std::string data, StrForm form = StrForm::Unicode);
  /*** Tuple: small defaults to the interpreter's choice (fewer than 256 items). */
  static Object Tuple(std::vector<Object> items);
  static Object Tuple(std::vector<Object> items, bool small);
  static Object List(std::vector<Object> items);
  static Object Set(std::vector<Object> items);
  static Object FrozenSet(std::vector<Object> items);
  static Object Dict(std::vector<DictEntry> entries);
  static Object Code(CodeValue code);
  static Object LoadRef(std::uint32_t index);
  static Object StoreRef(std::uint32_t index, ObjectPtr target);

  template <typename T>
  const T& as() const {
    return std::get<T>(payload);
  }
  template <typename T>
  T& as() {
    return std::get<T>(payload);
  }

  bool isSequence() const {
    return kind == ObjectKind::Tuple || kind == ObjectKind::List || kind == ObjectKind::Set ||
           kind == ObjectKind::FrozenSet;
  }
  bool isRef() const { return kind == ObjectKind::LoadRef || kind == ObjectKind::StoreRef; }
};

struct DictEntry {
  Object key;
  Object value;
};

/***
 * Structural equality. Floats compare by bit pattern (NaN equals itself, -0.0
 * differs from 0.0) and forms are part of the value. StoreRef compares index
 * and target; LoadRef compares index. Iterative, so deep trees are safe.
 */
bool operator==(const Object& lhs, const Object& rhs);
inline bool operator!=(const Object& lhs, const Object& rhs) { return !(lhs == rhs); }

/*** MakeShared: Move a value into the shared form used by StoreRef and ReferenceTable. */
ObjectPtr MakeShared(Object value);

}  // namespace pymarshal::object
