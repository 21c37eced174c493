/***
 * Name: pymarshal::codec::Decoder
 * Purpose: Explicit-stack marshal reader.
 * Inputs: Tag bytes and payloads, see PayloadLayout
 * Outputs: Object tree, ReferenceTable and consumed byte count
 * Theory of Operation:
 *   run() alternates between reading the next tag (readNext) and folding
 *   completed values into the frame on top of the stack (deliver). Frames
 *   complete when their declared item count is reached, when a dict reads its
 *   NULL key, or when a code object has read its last field.
 *
 *   Edge policies:
 *     - NULL is only legal as a dict key (the terminator); anywhere else it is
 *       an InvalidObjectError, including at top level.
 *     - Sizes are validated against the remaining input before any element is
 *       read, so a huge declared count fails fast with UnexpectedEofError.
 *     - 'u' and 't' text must be UTF-8; encoded surrogates are accepted.
 *     - Set members and dict keys must be hashable.
 */
#include "pymarshal/codec/decoder.h"

#include <unicode/umachine.h>
#include <unicode/utf8.h>

#include <cstddef>
#include <cstdint>
#include <ios>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "pymarshal/exceptions/invalid_object_error.h"
#include "pymarshal/exceptions/invalid_reference_error.h"
#include "pymarshal/exceptions/invalid_utf8_error.h"
#include "pymarshal/exceptions/malformed_numeric_error.h"
#include "pymarshal/exceptions/recursion_limit_error.h"
#include "pymarshal/exceptions/trailing_bytes_error.h"
#include "pymarshal/exceptions/unknown_type_tag_error.h"
#include "pymarshal/numeric/float_text.h"
#include "pymarshal/numeric/marshal_digits.h"

namespace pymarshal::codec {

using object::Object;
using object::ObjectKind;
using version::PayloadLayout;
using version::TypeTag;

namespace {

ObjectKind containerKind(TypeTag tag) {
  switch (tag) {
    case TypeTag::List: return ObjectKind::List;
    case TypeTag::Set: return ObjectKind::Set;
    case TypeTag::FrozenSet: return ObjectKind::FrozenSet;
    case TypeTag::Dict: return ObjectKind::Dict;
    case TypeTag::Code: return ObjectKind::Code;
    default: return ObjectKind::Tuple;
  }
}

object::StrForm strForm(TypeTag tag) {
  switch (tag) {
    case TypeTag::Interned: return object::StrForm::Interned;
    case TypeTag::Ascii: return object::StrForm::Ascii;
    case TypeTag::AsciiInterned: return object::StrForm::AsciiInterned;
    case TypeTag::ShortAscii: return object::StrForm::ShortAscii;
    case TypeTag::ShortAsciiInterned: return object::StrForm::ShortAsciiInterned;
    default: return object::StrForm::Unicode;
  }
}

Object singleton(TypeTag tag) {
  switch (tag) {
    case TypeTag::Null: return Object::Null();
    case TypeTag::True: return Object::Bool(true);
    case TypeTag::False: return Object::Bool(false);
    case TypeTag::StopIteration: return Object::StopIteration();
    case TypeTag::Ellipsis: return Object::Ellipsis();
    default: return Object::None();
  }
}

std::string describeTag(std::uint8_t raw) {
  std::ostringstream out;
  out << "0x" << std::hex << static_cast<unsigned>(raw);
  const auto base = static_cast<char>(raw & version::kTagMask);
  if (base >= ' ' && base < '\x7f') {
    out << " ('" << base << "')";
  }
  return out.str();
}

// ED A0..BF 80..BF: a UTF-16 surrogate written with surrogatepass.
bool isEncodedSurrogate(const std::uint8_t* bytes, std::int32_t start, std::int32_t length) {
  return start + 2 < length && bytes[start] == 0xED && bytes[start + 1] >= 0xA0 && bytes[start + 1] <= 0xBF &&
         (bytes[start + 2] & 0xC0U) == 0x80U;
}

}  // namespace

Decoder::Decoder(const std::uint8_t* data, std::size_t size, const version::VersionTable& table,
                 DecodeOptions options)
    : reader_(data, size), table_(table), options_(options) {}

DecodeResult Decoder::run() {
  std::optional<Object> ready = readNext();
  for (;;) {
    if (!ready) {
      if (!stack_.empty() && frameComplete(stack_.back())) {
        ready = completeFrame();
      } else {
        ready = readNext();
      }
      continue;
    }
    if (stack_.empty()) {
      break;
    }
    deliver(std::move(*ready));
    ready.reset();
  }
  if (ready->kind == ObjectKind::Null) {
    throw exceptions::InvalidObjectError("NULL object at top level" + at(0));
  }
  DecodeResult result;
  result.object = std::move(*ready);
  result.consumed = reader_.offset();
  if (!reader_.atEnd() && !options_.allowTrailingBytes) {
    throw exceptions::TrailingBytesError(std::to_string(reader_.remaining()) + " trailing bytes after object" +
                                         at(reader_.offset()));
  }
  result.refs = std::move(refs_);
  return result;
}

std::optional<Object> Decoder::readNext() {
  const std::size_t tagOffset = reader_.offset();
  const std::uint8_t raw = reader_.readU8("type tag");
  const bool flagged = (raw & version::kFlagRef) != 0;
  const version::TagSpec* spec = table_.lookup(static_cast<std::uint8_t>(raw & version::kTagMask));
  if (spec == nullptr) {
    throw exceptions::UnknownTypeTagError("unknown type tag " + describeTag(raw) + " for Python " +
                                          version::to_string(table_.version()) + at(tagOffset));
  }
  if (flagged && !spec->referenceable) {
    throw exceptions::InvalidReferenceError(std::string("reference flag set on ") + spec->name + at(tagOffset));
  }
  std::optional<std::uint32_t> refIndex;
  if (flagged) {
    refIndex = refs_.reserve();
  }

  switch (spec->layout) {
    case PayloadLayout::Sequence32:
    case PayloadLayout::Sequence8: {
      Frame frame;
      frame.kind = containerKind(spec->tag);
      frame.refIndex = refIndex;
      frame.tagOffset = tagOffset;
      frame.small = spec->layout == PayloadLayout::Sequence8;
      frame.expected = frame.small ? reader_.readU8("small tuple size") : readSize32("sequence size", tagOffset);
      reader_.require(frame.expected, "sequence items");
      pushFrame(std::move(frame));
      return std::nullopt;
    }
    case PayloadLayout::DictPairs: {
      Frame frame;
      frame.kind = ObjectKind::Dict;
      frame.refIndex = refIndex;
      frame.tagOffset = tagOffset;
      pushFrame(std::move(frame));
      return std::nullopt;
    }
    case PayloadLayout::CodeFields: {
      Frame frame;
      frame.kind = ObjectKind::Code;
      frame.refIndex = refIndex;
      frame.tagOffset = tagOffset;
      frame.code.layout = table_.codeLayout();
      pushFrame(std::move(frame));
      readCodeInts(stack_.back());
      return std::nullopt;
    }
    default:
      return wrapRef(refIndex, readScalar(*spec, tagOffset));
  }
}

Object Decoder::readScalar(const version::TagSpec& spec, std::size_t tagOffset) {
  switch (spec.layout) {
    case PayloadLayout::Empty:
      return singleton(spec.tag);
    case PayloadLayout::Int32:
      return Object::Long(numeric::BigInt::FromInt64(reader_.readI32("int32")), object::IntForm::Int32);
    case PayloadLayout::Int64:
      return Object::Long(numeric::BigInt::FromInt64(reader_.readI64("int64")), object::IntForm::Int64);
    case PayloadLayout::LongDigits: {
      const std::int32_t count = reader_.readI32("long digit count");
      if (count == std::numeric_limits<std::int32_t>::min()) {
        throw exceptions::MalformedNumericError("long digit count out of range" + at(tagOffset));
      }
      const auto ndigits = static_cast<std::size_t>(count < 0 ? -count : count);
      reader_.require(ndigits * 2, "long digits");
      std::vector<std::uint16_t> digits;
      digits.reserve(ndigits);
      for (std::size_t i = 0; i < ndigits; ++i) {
        digits.push_back(reader_.readU16("long digit"));
      }
      try {
        return Object::Long(numeric::FromMarshalDigits(count < 0, digits), object::IntForm::Long);
      } catch (const exceptions::MalformedNumericError& err) {
        throw exceptions::MalformedNumericError(err.what() + at(tagOffset));
      }
    }
    case PayloadLayout::FloatText: {
      std::string text = reader_.readString(reader_.readU8("float length"), "float text");
      try {
        const double value = numeric::ParseFloatText(text);
        return Object::FloatText(value, std::move(text));
      } catch (const exceptions::MalformedNumericError& err) {
        throw exceptions::MalformedNumericError(err.what() + at(tagOffset));
      }
    }
    case PayloadLayout::FloatBinary:
      return Object::Float(reader_.readF64("binary float"), object::FloatForm::Binary);
    case PayloadLayout::ComplexText: {
      object::ComplexValue value;
      value.form = object::FloatForm::Text;
      value.realText = reader_.readString(reader_.readU8("complex real length"), "complex real text");
      value.imagText = reader_.readString(reader_.readU8("complex imag length"), "complex imag text");
      try {
        value.real = numeric::ParseFloatText(value.realText);
        value.imag = numeric::ParseFloatText(value.imagText);
      } catch (const exceptions::MalformedNumericError& err) {
        throw exceptions::MalformedNumericError(err.what() + at(tagOffset));
      }
      return Object{ObjectKind::Complex, std::move(value)};
    }
    case PayloadLayout::ComplexBinary: {
      const double real = reader_.readF64("complex real");
      const double imag = reader_.readF64("complex imag");
      return Object::Complex(real, imag, object::FloatForm::Binary);
    }
    case PayloadLayout::Bytes32: {
      const std::size_t length = readSize32("bytes length", tagOffset);
      const std::uint8_t* data = reader_.readBytes(length, "bytes");
      return Object::Bytes(std::vector<std::uint8_t>(data, data + length));
    }
    case PayloadLayout::Str32:
      return readStr(spec.tag, readSize32("string length", tagOffset));
    case PayloadLayout::Str8:
      return readStr(spec.tag, reader_.readU8("short string length"));
    case PayloadLayout::RefIndex: {
      const std::int32_t index = reader_.readI32("reference index");
      if (index < 0 || !refs_.contains(static_cast<std::uint32_t>(index))) {
        throw exceptions::InvalidReferenceError("reference index " + std::to_string(index) + " out of range (" +
                                                std::to_string(refs_.size()) + " entries)" + at(tagOffset));
      }
      return Object::LoadRef(static_cast<std::uint32_t>(index));
    }
    default:
      break;
  }
  throw exceptions::InvalidObjectError(std::string("layout ") + version::to_string(spec.layout) +
                                       " is not a scalar" + at(tagOffset));
}

void Decoder::pushFrame(Frame frame) {
  if (stack_.size() >= options_.maxDepth) {
    throw exceptions::RecursionLimitError("nesting exceeds maximum depth " + std::to_string(options_.maxDepth) +
                                          at(frame.tagOffset));
  }
  stack_.push_back(std::move(frame));
}

void Decoder::readCodeInts(Frame& frame) {
  const auto& fields = version::VersionTable::CodeFields(frame.code.layout);
  while (frame.fieldIndex < fields.size() && fields[frame.fieldIndex].storage == version::FieldStorage::Int32) {
    frame.code.numbers.push_back(reader_.readI32(fields[frame.fieldIndex].name));
    ++frame.fieldIndex;
  }
}

bool Decoder::frameComplete(const Frame& frame) const {
  switch (frame.kind) {
    case ObjectKind::Dict: return frame.closed;
    case ObjectKind::Code: return frame.fieldIndex == version::VersionTable::CodeFields(frame.code.layout).size();
    default: return frame.items.size() == frame.expected;
  }
}

Object Decoder::completeFrame() {
  Frame frame = std::move(stack_.back());
  stack_.pop_back();
  Object value;
  switch (frame.kind) {
    case ObjectKind::Tuple: value = Object::Tuple(std::move(frame.items), frame.small); break;
    case ObjectKind::List: value = Object::List(std::move(frame.items)); break;
    case ObjectKind::Set: value = Object::Set(std::move(frame.items)); break;
    case ObjectKind::FrozenSet: value = Object::FrozenSet(std::move(frame.items)); break;
    case ObjectKind::Dict: value = Object::Dict(std::move(frame.entries)); break;
    default: value = Object::Code(std::move(frame.code)); break;
  }
  return wrapRef(frame.refIndex, std::move(value));
}

void Decoder::deliver(Object value) {
  Frame& top = stack_.back();
  if (value.kind == ObjectKind::Null) {
    if (top.kind == ObjectKind::Dict && !top.pendingKey) {
      top.closed = true;
      return;
    }
    throw exceptions::InvalidObjectError(std::string("NULL object inside ") +
                                         (top.kind == ObjectKind::Dict ? "dict value" : object::to_string(top.kind)) +
                                         at(top.tagOffset));
  }
  switch (top.kind) {
    case ObjectKind::Dict:
      if (!top.pendingKey) {
        requireHashable(value, "dict key");
        top.pendingKey = std::move(value);
      } else {
        top.entries.push_back(object::DictEntry{std::move(*top.pendingKey), std::move(value)});
        top.pendingKey.reset();
      }
      break;
    case ObjectKind::Code:
      top.code.objects.push_back(std::move(value));
      ++top.fieldIndex;
      readCodeInts(top);
      break;
    case ObjectKind::Set:
    case ObjectKind::FrozenSet:
      requireHashable(value, "set member");
      top.items.push_back(std::move(value));
      break;
    default:
      top.items.push_back(std::move(value));
      break;
  }
}

Object Decoder::wrapRef(std::optional<std::uint32_t> refIndex, Object value) {
  if (!refIndex) {
    return value;
  }
  object::ObjectPtr shared = object::MakeShared(std::move(value));
  refs_.fill(*refIndex, shared);
  return Object::StoreRef(*refIndex, std::move(shared));
}

std::size_t Decoder::readSize32(const char* what, std::size_t tagOffset) {
  const std::int32_t size = reader_.readI32(what);
  if (size < 0) {
    throw exceptions::InvalidObjectError(std::string("negative ") + what + " " + std::to_string(size) +
                                         at(tagOffset));
  }
  reader_.require(static_cast<std::size_t>(size), what);
  return static_cast<std::size_t>(size);
}

Object Decoder::readStr(TypeTag tag, std::size_t length) {
  const std::size_t dataOffset = reader_.offset();
  std::string text = reader_.readString(length, "string data");
  const object::StrForm form = strForm(tag);
  if (!object::IsAsciiForm(form)) {
    validateUtf8(text, dataOffset);
  }
  return Object::Str(std::move(text), form);
}

void Decoder::validateUtf8(const std::string& text, std::size_t dataOffset) const {
  const auto* bytes = reinterpret_cast<const std::uint8_t*>(text.data());
  const auto length = static_cast<std::int32_t>(text.size());
  std::int32_t index = 0;
  while (index < length) {
    const std::int32_t start = index;
    UChar32 codePoint = 0;
    U8_NEXT(bytes, index, length, codePoint);
    if (codePoint >= 0) {
      continue;
    }
    if (isEncodedSurrogate(bytes, start, length)) {
      index = start + 3;
      continue;
    }
    throw exceptions::InvalidUtf8Error("invalid UTF-8 sequence" + at(dataOffset + static_cast<std::size_t>(start)));
  }
}

void Decoder::requireHashable(const Object& value, const char* role) const {
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
                                             " used as " + role + at(reader_.offset()));
      case ObjectKind::Tuple:
        for (const auto& item : current->as<object::SequenceValue>().items) {
          pending.push_back(&item);
        }
        break;
      case ObjectKind::StoreRef: {
        const auto& ref = current->as<object::StoreRefValue>();
        if (visited.insert(ref.index).second && ref.target) {
          pending.push_back(ref.target.get());
        }
        break;
      }
      case ObjectKind::LoadRef: {
        const std::uint32_t index = current->as<object::LoadRefValue>().index;
        if (!visited.insert(index).second) {
          break;
        }
        if (const auto& slot = refs_.at(index)) {
          pending.push_back(slot.get());
          break;
        }
        // Reserved but unfilled: the target is a container still open on the stack.
        for (const auto& frame : stack_) {
          if (frame.refIndex == index && (frame.kind == ObjectKind::List || frame.kind == ObjectKind::Dict ||
                                          frame.kind == ObjectKind::Set)) {
            throw exceptions::InvalidObjectError(std::string("unhashable ") + object::to_string(frame.kind) +
                                                 " used as " + role + at(reader_.offset()));
          }
        }
        break;
      }
      default:
        break;
    }
  }
}

std::string Decoder::at(std::size_t offset) const { return " at offset " + std::to_string(offset); }

}  // namespace pymarshal::codec
