/***
 * Name: pymarshal::codec::Encoder
 * Purpose: Explicit-stack marshal writer.
 * Inputs: Object tree with provenance, ReferenceTable, VersionTable
 * Outputs: Marshal bytes
 * Theory of Operation:
 *   Tasks are popped from the back of tasks_, so children are pushed in reverse
 *   order. Entering a container pushes a Leave task beneath its children; the
 *   depth counter therefore tracks the number of open containers exactly as the
 *   decoder's frame stack does. Dict keys and set members are checked for
 *   hashability with the decoder's rule before they are queued.
 */
#include "pymarshal/codec/encoder.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <unordered_set>
#include <vector>

#include "pymarshal/exceptions/invalid_object_error.h"
#include "pymarshal/exceptions/invalid_reference_error.h"
#include "pymarshal/exceptions/recursion_limit_error.h"
#include "pymarshal/exceptions/unsupported_version_error.h"
#include "pymarshal/numeric/float_text.h"
#include "pymarshal/numeric/marshal_digits.h"

namespace pymarshal::codec {

using object::Object;
using object::ObjectKind;
using version::TypeTag;

namespace {

constexpr std::size_t kMaxShortLength = 255;
constexpr auto kMaxSize32 = static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max());

TypeTag strTag(object::StrForm form) {
  switch (form) {
    case object::StrForm::Interned: return TypeTag::Interned;
    case object::StrForm::Ascii: return TypeTag::Ascii;
    case object::StrForm::AsciiInterned: return TypeTag::AsciiInterned;
    case object::StrForm::ShortAscii: return TypeTag::ShortAscii;
    case object::StrForm::ShortAsciiInterned: return TypeTag::ShortAsciiInterned;
    case object::StrForm::Unicode: break;
  }
  return TypeTag::Unicode;
}

TypeTag sequenceTag(ObjectKind kind, bool small) {
  switch (kind) {
    case ObjectKind::List: return TypeTag::List;
    case ObjectKind::Set: return TypeTag::Set;
    case ObjectKind::FrozenSet: return TypeTag::FrozenSet;
    default: return small ? TypeTag::SmallTuple : TypeTag::Tuple;
  }
}

}  // namespace

Encoder::Encoder(const object::ReferenceTable& refs, const version::VersionTable& table, EncodeOptions options)
    : refs_(refs), table_(table), options_(options) {}

std::vector<std::uint8_t> Encoder::run(const Object& root) {
  tasks_.push_back(Task{Task::Kind::Value, &root, 0});
  while (!tasks_.empty()) {
    const Task task = tasks_.back();
    tasks_.pop_back();
    switch (task.kind) {
      case Task::Kind::Value:
        emit(*task.value);
        break;
      case Task::Kind::CodeInt:
        out_.writeI32(task.number);
        break;
      case Task::Kind::DictEnd:
        out_.writeU8(version::tag_byte(TypeTag::Null));
        break;
      case Task::Kind::Leave:
        --depth_;
        break;
    }
  }
  return out_.take();
}

void Encoder::emit(const Object& value) {
  const Object* node = &value;
  bool flagged = false;
  if (value.kind == ObjectKind::StoreRef) {
    const auto& store = value.as<object::StoreRefValue>();
    if (store.index != stored_) {
      throw exceptions::InvalidReferenceError("StoreRef index " + std::to_string(store.index) +
                                              " out of order: next index is " + std::to_string(stored_));
    }
    if (!refs_.contains(store.index)) {
      throw exceptions::InvalidReferenceError("StoreRef index " + std::to_string(store.index) +
                                              " missing from reference table of " + std::to_string(refs_.size()) +
                                              " entries");
    }
    const object::ObjectPtr& entry = refs_.at(store.index);
    if (store.target && entry && store.target != entry) {
      throw exceptions::InvalidReferenceError("StoreRef index " + std::to_string(store.index) +
                                              " wraps a different object than its reference table entry");
    }
    node = store.target ? store.target.get() : entry.get();
    if (node == nullptr) {
      throw exceptions::InvalidReferenceError("StoreRef index " + std::to_string(store.index) + " has no target");
    }
    if (node->isRef()) {
      throw exceptions::InvalidReferenceError("StoreRef index " + std::to_string(store.index) +
                                              " targets another reference");
    }
    ++stored_;
    flagged = true;
  }

  switch (node->kind) {
    case ObjectKind::Null:
      throw exceptions::InvalidObjectError("NULL object outside a dict terminator");
    case ObjectKind::None:
      writeTag(TypeTag::None, flagged);
      break;
    case ObjectKind::Bool:
      writeTag(node->as<bool>() ? TypeTag::True : TypeTag::False, flagged);
      break;
    case ObjectKind::StopIteration:
      writeTag(TypeTag::StopIteration, flagged);
      break;
    case ObjectKind::Ellipsis:
      writeTag(TypeTag::Ellipsis, flagged);
      break;
    case ObjectKind::Long:
      emitLong(node->as<object::LongValue>(), flagged);
      break;
    case ObjectKind::Float: {
      const auto& flt = node->as<object::FloatValue>();
      if (flt.form == object::FloatForm::Binary) {
        writeTag(TypeTag::BinaryFloat, flagged);
        out_.writeF64(flt.value);
      } else {
        writeTag(TypeTag::Float, flagged);
        emitFloatText(flt.text.empty() ? numeric::FormatFloatText(flt.value) : flt.text);
      }
      break;
    }
    case ObjectKind::Complex: {
      const auto& cpx = node->as<object::ComplexValue>();
      if (cpx.form == object::FloatForm::Binary) {
        writeTag(TypeTag::BinaryComplex, flagged);
        out_.writeF64(cpx.real);
        out_.writeF64(cpx.imag);
      } else {
        writeTag(TypeTag::Complex, flagged);
        emitFloatText(cpx.realText.empty() ? numeric::FormatFloatText(cpx.real) : cpx.realText);
        emitFloatText(cpx.imagText.empty() ? numeric::FormatFloatText(cpx.imag) : cpx.imagText);
      }
      break;
    }
    case ObjectKind::Bytes: {
      const auto& bytes = node->as<object::BytesValue>().data;
      writeTag(TypeTag::String, flagged);
      writeSize32(bytes.size(), "bytes");
      out_.writeBytes(bytes.data(), bytes.size());
      break;
    }
    case ObjectKind::Str:
      emitStr(node->as<object::StrValue>(), flagged);
      break;
    case ObjectKind::Tuple:
    case ObjectKind::List:
    case ObjectKind::Set:
    case ObjectKind::FrozenSet:
      emitSequence(*node, flagged);
      break;
    case ObjectKind::Dict:
      emitDict(node->as<object::DictValue>(), flagged);
      break;
    case ObjectKind::Code:
      emitCode(node->as<object::CodeValue>(), flagged);
      break;
    case ObjectKind::LoadRef: {
      const std::uint32_t index = node->as<object::LoadRefValue>().index;
      if (index >= stored_) {
        throw exceptions::InvalidReferenceError("LoadRef index " + std::to_string(index) +
                                                " precedes its StoreRef (" + std::to_string(stored_) + " stored)");
      }
      writeTag(TypeTag::Ref, false);
      out_.writeI32(static_cast<std::int32_t>(index));
      break;
    }
    case ObjectKind::StoreRef:
      throw exceptions::InvalidReferenceError("nested StoreRef");
  }
}

void Encoder::writeTag(TypeTag tag, bool flagged) {
  const version::TagSpec* spec = table_.lookup(tag);
  if (spec == nullptr) {
    throw exceptions::UnsupportedVersionError(std::string(version::to_string(tag)) + " is not available in Python " +
                                              version::to_string(table_.version()));
  }
  if (flagged && !spec->referenceable) {
    throw exceptions::InvalidReferenceError(std::string("StoreRef cannot wrap ") + spec->name);
  }
  out_.writeU8(static_cast<std::uint8_t>(version::tag_byte(tag) | (flagged ? version::kFlagRef : 0U)));
}

void Encoder::enterContainer() {
  if (depth_ >= options_.maxDepth) {
    throw exceptions::RecursionLimitError("nesting exceeds maximum depth " + std::to_string(options_.maxDepth));
  }
  ++depth_;
  tasks_.push_back(Task{Task::Kind::Leave, nullptr, 0});
}

void Encoder::emitLong(const object::LongValue& value, bool flagged) {
  switch (value.form) {
    case object::IntForm::Int32: {
      std::int64_t number = 0;
      if (!value.value.toInt64(number) || number < std::numeric_limits<std::int32_t>::min() ||
          number > std::numeric_limits<std::int32_t>::max()) {
        throw exceptions::InvalidObjectError("int " + value.value.toDecimal() + " does not fit TYPE_INT");
      }
      writeTag(TypeTag::Int, flagged);
      out_.writeI32(static_cast<std::int32_t>(number));
      return;
    }
    case object::IntForm::Int64: {
      std::int64_t number = 0;
      if (!value.value.toInt64(number)) {
        throw exceptions::InvalidObjectError("int " + value.value.toDecimal() + " does not fit TYPE_INT64");
      }
      writeTag(TypeTag::Int64, flagged);
      out_.writeI64(number);
      return;
    }
    case object::IntForm::Long:
      break;
  }
  const std::vector<std::uint16_t> digits = numeric::ToMarshalDigits(value.value);
  if (digits.size() > kMaxSize32) {
    throw exceptions::InvalidObjectError("long has too many digits");
  }
  writeTag(TypeTag::Long, flagged);
  const auto count = static_cast<std::int32_t>(digits.size());
  out_.writeI32(value.value.isNegative() ? -count : count);
  for (const auto digit : digits) {
    out_.writeU16(digit);
  }
}

void Encoder::emitFloatText(const std::string& text) {
  if (text.size() > kMaxShortLength) {
    throw exceptions::InvalidObjectError("float text longer than 255 bytes");
  }
  out_.writeU8(static_cast<std::uint8_t>(text.size()));
  out_.writeString(text);
}

void Encoder::emitStr(const object::StrValue& value, bool flagged) {
  const TypeTag tag = strTag(value.form);
  if (tag == TypeTag::ShortAscii || tag == TypeTag::ShortAsciiInterned) {
    if (value.data.size() > kMaxShortLength) {
      throw exceptions::InvalidObjectError("short string of " + std::to_string(value.data.size()) +
                                           " bytes exceeds 255");
    }
    writeTag(tag, flagged);
    out_.writeU8(static_cast<std::uint8_t>(value.data.size()));
  } else {
    writeTag(tag, flagged);
    writeSize32(value.data.size(), "string");
  }
  out_.writeString(value.data);
}

void Encoder::emitSequence(const Object& value, bool flagged) {
  const auto& seq = value.as<object::SequenceValue>();
  const bool small = value.kind == ObjectKind::Tuple && seq.small;
  if (small && seq.items.size() > kMaxShortLength) {
    throw exceptions::InvalidObjectError("small tuple of " + std::to_string(seq.items.size()) +
                                         " items exceeds 255");
  }
  enterContainer();
  writeTag(sequenceTag(value.kind, small), flagged);
  if (small) {
    out_.writeU8(static_cast<std::uint8_t>(seq.items.size()));
  } else {
    writeSize32(seq.items.size(), "sequence");
  }
  const bool members = value.kind == ObjectKind::Set || value.kind == ObjectKind::FrozenSet;
  for (auto it = seq.items.rbegin(); it != seq.items.rend(); ++it) {
    if (members) {
      requireHashable(*it, "set member");
    }
    tasks_.push_back(Task{Task::Kind::Value, &*it, 0});
  }
}

void Encoder::emitDict(const object::DictValue& value, bool flagged) {
  enterContainer();
  writeTag(TypeTag::Dict, flagged);
  tasks_.push_back(Task{Task::Kind::DictEnd, nullptr, 0});
  for (auto it = value.entries.rbegin(); it != value.entries.rend(); ++it) {
    requireHashable(it->key, "dict key");
    tasks_.push_back(Task{Task::Kind::Value, &it->value, 0});
    tasks_.push_back(Task{Task::Kind::Value, &it->key, 0});
  }
}

void Encoder::emitCode(const object::CodeValue& value, bool flagged) {
  if (value.layout != table_.codeLayout()) {
    throw exceptions::UnsupportedVersionError(std::string("code object layout ") + version::to_string(value.layout) +
                                              " cannot be written for Python " +
                                              version::to_string(table_.version()));
  }
  const auto& fields = version::VersionTable::CodeFields(value.layout);
  std::vector<Task> ordered;
  ordered.reserve(fields.size());
  std::size_t nextNumber = 0;
  std::size_t nextObject = 0;
  for (const auto& field : fields) {
    if (field.storage == version::FieldStorage::Int32) {
      if (nextNumber >= value.numbers.size()) {
        throw exceptions::InvalidObjectError(std::string("code object is missing field ") + field.name);
      }
      ordered.push_back(Task{Task::Kind::CodeInt, nullptr, value.numbers[nextNumber++]});
    } else {
      if (nextObject >= value.objects.size()) {
        throw exceptions::InvalidObjectError(std::string("code object is missing field ") + field.name);
      }
      ordered.push_back(Task{Task::Kind::Value, &value.objects[nextObject++], 0});
    }
  }
  if (nextNumber != value.numbers.size() || nextObject != value.objects.size()) {
    throw exceptions::InvalidObjectError("code object has more fields than its layout");
  }
  enterContainer();
  writeTag(TypeTag::Code, flagged);
  tasks_.insert(tasks_.end(), ordered.rbegin(), ordered.rend());
}

void Encoder::requireHashable(const Object& value, const char* role) const {
  std::vector<const Object*> pending{&value};
  std::unordered_set<std::uint32_t> visited;
  while (!pending.empty()) {
    const Object* current = pending.back();
    pending.pop_back();
    switch (current->kind) {
      case ObjectKind::List:
      case ObjectKind::Dict:
      case ObjectKind::Set:
        throw exceptions::InvalidObjectError(std::string("unhashable ") + object::to_string(current->kind) +
                                             " used as " + role);
      case ObjectKind::Tuple:
        for (const auto& item : current->as<object::SequenceValue>().items) {
          pending.push_back(&item);
        }
        break;
      case ObjectKind::StoreRef: {
        const auto& store = current->as<object::StoreRefValue>();
        if (!visited.insert(store.index).second) {
          break;
        }
        if (store.target) {
          pending.push_back(store.target.get());
        } else if (refs_.isFilled(store.index)) {
          pending.push_back(refs_.at(store.index).get());
        }
        break;
      }
      case ObjectKind::LoadRef: {
        const std::uint32_t index = current->as<object::LoadRefValue>().index;
        if (visited.insert(index).second && refs_.isFilled(index)) {
          pending.push_back(refs_.at(index).get());
        }
        break;
      }
      default:
        break;
    }
  }
}

void Encoder::writeSize32(std::size_t size, const char* what) {
  if (size > kMaxSize32) {
    throw exceptions::InvalidObjectError(std::string(what) + " of " + std::to_string(size) +
                                         " elements exceeds int32 size");
  }
  out_.writeI32(static_cast<std::int32_t>(size));
}

}  // namespace pymarshal::codec
