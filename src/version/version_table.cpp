/***
 * Name: pymarshal::version::VersionTable
 * Purpose: Materialise the per-release tag tables from the shared row list.
 * Inputs: PyVersion
 * Outputs: Immutable VersionTable instances, one per supported release
 * Theory of Operation:
 *   kTagRows lists every tag with the release range in which it is legal. The
 *   tables are built once on first use (function-local static, thread-safe
 *   initialisation) and never mutated afterwards. TYPE_UNKNOWN has no row: it
 *   is never legal on the wire.
 */
#include "pymarshal/version/version_table.h"

#include <array>
#include <cstddef>
#include <initializer_list>
#include <vector>

#include "pymarshal/exceptions/unsupported_version_error.h"

namespace pymarshal::version {

namespace {

struct TagRow {
  TagSpec spec;
  PyVersion first;
  PyVersion last;
};

constexpr PyVersion kPy30{3, 0};
constexpr PyVersion kPy34{3, 4};
constexpr PyVersion kLatest{3, 13};

// The reference flag, TYPE_REF and the ASCII/short-tuple tags arrived with marshal format 3 (3.4).
constexpr std::array<TagRow, 28> kTagRows{{
    {{TypeTag::Null, PayloadLayout::Empty, false, "TYPE_NULL"}, kPy30, kLatest},
    {{TypeTag::None, PayloadLayout::Empty, false, "TYPE_NONE"}, kPy30, kLatest},
    {{TypeTag::False, PayloadLayout::Empty, false, "TYPE_FALSE"}, kPy30, kLatest},
    {{TypeTag::True, PayloadLayout::Empty, false, "TYPE_TRUE"}, kPy30, kLatest},
    {{TypeTag::StopIteration, PayloadLayout::Empty, false, "TYPE_STOPITER"}, kPy30, kLatest},
    {{TypeTag::Ellipsis, PayloadLayout::Empty, false, "TYPE_ELLIPSIS"}, kPy30, kLatest},
    {{TypeTag::Int, PayloadLayout::Int32, true, "TYPE_INT"}, kPy30, kLatest},
    {{TypeTag::Int64, PayloadLayout::Int64, true, "TYPE_INT64"}, kPy30, kLatest},
    {{TypeTag::Float, PayloadLayout::FloatText, true, "TYPE_FLOAT"}, kPy30, kLatest},
    {{TypeTag::BinaryFloat, PayloadLayout::FloatBinary, true, "TYPE_BINARY_FLOAT"}, kPy30, kLatest},
    {{TypeTag::Complex, PayloadLayout::ComplexText, true, "TYPE_COMPLEX"}, kPy30, kLatest},
    {{TypeTag::BinaryComplex, PayloadLayout::ComplexBinary, true, "TYPE_BINARY_COMPLEX"}, kPy30, kLatest},
    {{TypeTag::Long, PayloadLayout::LongDigits, true, "TYPE_LONG"}, kPy30, kLatest},
    {{TypeTag::String, PayloadLayout::Bytes32, true, "TYPE_STRING"}, kPy30, kLatest},
    {{TypeTag::Interned, PayloadLayout::Str32, true, "TYPE_INTERNED"}, kPy30, kLatest},
    {{TypeTag::Ref, PayloadLayout::RefIndex, false, "TYPE_REF"}, kPy34, kLatest},
    {{TypeTag::Tuple, PayloadLayout::Sequence32, true, "TYPE_TUPLE"}, kPy30, kLatest},
    {{TypeTag::List, PayloadLayout::Sequence32, true, "TYPE_LIST"}, kPy30, kLatest},
    {{TypeTag::Dict, PayloadLayout::DictPairs, true, "TYPE_DICT"}, kPy30, kLatest},
    {{TypeTag::Code, PayloadLayout::CodeFields, true, "TYPE_CODE"}, kPy30, kLatest},
    {{TypeTag::Unicode, PayloadLayout::Str32, true, "TYPE_UNICODE"}, kPy30, kLatest},
    {{TypeTag::Set, PayloadLayout::Sequence32, true, "TYPE_SET"}, kPy30, kLatest},
    {{TypeTag::FrozenSet, PayloadLayout::Sequence32, true, "TYPE_FROZENSET"}, kPy30, kLatest},
    {{TypeTag::Ascii, PayloadLayout::Str32, true, "TYPE_ASCII"}, kPy34, kLatest},
    {{TypeTag::AsciiInterned, PayloadLayout::Str32, true, "TYPE_ASCII_INTERNED"}, kPy34, kLatest},
    {{TypeTag::SmallTuple, PayloadLayout::Sequence8, true, "TYPE_SMALL_TUPLE"}, kPy34, kLatest},
    {{TypeTag::ShortAscii, PayloadLayout::Str8, true, "TYPE_SHORT_ASCII"}, kPy34, kLatest},
    {{TypeTag::ShortAsciiInterned, PayloadLayout::Str8, true, "TYPE_SHORT_ASCII_INTERNED"}, kPy34, kLatest},
}};

constexpr int kMarshalFormat = 4;

const std::vector<CodeFieldSpec>& py310Fields() {
  static const std::vector<CodeFieldSpec> fields{
      {CodeField::ArgCount, FieldStorage::Int32, "argcount"},
      {CodeField::PosOnlyArgCount, FieldStorage::Int32, "posonlyargcount"},
      {CodeField::KwOnlyArgCount, FieldStorage::Int32, "kwonlyargcount"},
      {CodeField::NLocals, FieldStorage::Int32, "nlocals"},
      {CodeField::StackSize, FieldStorage::Int32, "stacksize"},
      {CodeField::Flags, FieldStorage::Int32, "flags"},
      {CodeField::Code, FieldStorage::Object, "code"},
      {CodeField::Consts, FieldStorage::Object, "consts"},
      {CodeField::Names, FieldStorage::Object, "names"},
      {CodeField::VarNames, FieldStorage::Object, "varnames"},
      {CodeField::FreeVars, FieldStorage::Object, "freevars"},
      {CodeField::CellVars, FieldStorage::Object, "cellvars"},
      {CodeField::Filename, FieldStorage::Object, "filename"},
      {CodeField::Name, FieldStorage::Object, "name"},
      {CodeField::FirstLineNo, FieldStorage::Int32, "firstlineno"},
      {CodeField::LineTable, FieldStorage::Object, "linetable"},
  };
  return fields;
}

const std::vector<CodeFieldSpec>& py311Fields() {
  static const std::vector<CodeFieldSpec> fields{
      {CodeField::ArgCount, FieldStorage::Int32, "argcount"},
      {CodeField::PosOnlyArgCount, FieldStorage::Int32, "posonlyargcount"},
      {CodeField::KwOnlyArgCount, FieldStorage::Int32, "kwonlyargcount"},
      {CodeField::StackSize, FieldStorage::Int32, "stacksize"},
      {CodeField::Flags, FieldStorage::Int32, "flags"},
      {CodeField::Code, FieldStorage::Object, "code"},
      {CodeField::Consts, FieldStorage::Object, "consts"},
      {CodeField::Names, FieldStorage::Object, "names"},
      {CodeField::LocalsPlusNames, FieldStorage::Object, "localsplusnames"},
      {CodeField::LocalsPlusKinds, FieldStorage::Object, "localspluskinds"},
      {CodeField::Filename, FieldStorage::Object, "filename"},
      {CodeField::Name, FieldStorage::Object, "name"},
      {CodeField::QualName, FieldStorage::Object, "qualname"},
      {CodeField::FirstLineNo, FieldStorage::Int32, "firstlineno"},
      {CodeField::LineTable, FieldStorage::Object, "linetable"},
      {CodeField::ExceptionTable, FieldStorage::Object, "exceptiontable"},
  };
  return fields;
}

}  // namespace

VersionTable::VersionTable(PyVersion version, CodeLayout layout, int marshalFormat)
    : version_(version), codeLayout_(layout), marshalFormat_(marshalFormat) {
  for (const auto& row : kTagRows) {
    if (row.first <= version && version <= row.last) {
      tags_[tag_byte(row.spec.tag)] = &row.spec;
    }
  }
}

const std::vector<PyVersion>& VersionTable::SupportedVersions() {
  static const std::vector<PyVersion> versions{{3, 10}, {3, 11}, {3, 12}, {3, 13}};
  return versions;
}

bool VersionTable::IsSupported(PyVersion version) {
  for (const auto& supported : SupportedVersions()) {
    if (supported == version) {
      return true;
    }
  }
  return false;
}

const VersionTable& VersionTable::ForVersion(PyVersion version) {
  static const std::array<VersionTable, 4> tables{{
      VersionTable({3, 10}, CodeLayout::Py310, kMarshalFormat),
      VersionTable({3, 11}, CodeLayout::Py311, kMarshalFormat),
      VersionTable({3, 12}, CodeLayout::Py311, kMarshalFormat),
      VersionTable({3, 13}, CodeLayout::Py311, kMarshalFormat),
  }};
  for (const auto& table : tables) {
    if (table.version() == version) {
      return table;
    }
  }
  throw exceptions::UnsupportedVersionError("unsupported Python version " + to_string(version) +
                                            " (supported: 3.10, 3.11, 3.12, 3.13)");
}

const std::vector<CodeFieldSpec>& VersionTable::CodeFields(CodeLayout layout) {
  return layout == CodeLayout::Py310 ? py310Fields() : py311Fields();
}

const TagSpec* VersionTable::lookup(std::uint8_t baseTag) const {
  if (baseTag > kTagMask) {
    return nullptr;
  }
  return tags_[baseTag];
}

const char* to_string(PayloadLayout layout) {
  switch (layout) {
    case PayloadLayout::Empty: return "Empty";
    case PayloadLayout::Int32: return "Int32";
    case PayloadLayout::Int64: return "Int64";
    case PayloadLayout::LongDigits: return "LongDigits";
    case PayloadLayout::FloatText: return "FloatText";
    case PayloadLayout::FloatBinary: return "FloatBinary";
    case PayloadLayout::ComplexText: return "ComplexText";
    case PayloadLayout::ComplexBinary: return "ComplexBinary";
    case PayloadLayout::Bytes32: return "Bytes32";
    case PayloadLayout::Str32: return "Str32";
    case PayloadLayout::Str8: return "Str8";
    case PayloadLayout::Sequence32: return "Sequence32";
    case PayloadLayout::Sequence8: return "Sequence8";
    case PayloadLayout::DictPairs: return "DictPairs";
    case PayloadLayout::CodeFields: return "CodeFields";
    case PayloadLayout::RefIndex: return "RefIndex";
  }
  return "?";
}

const char* to_string(CodeLayout layout) { return layout == CodeLayout::Py310 ? "py310" : "py311"; }

const char* to_string(CodeField field) {
  for (const auto layout : {CodeLayout::Py310, CodeLayout::Py311}) {
    for (const auto& spec : VersionTable::CodeFields(layout)) {
      if (spec.field == field) {
        return spec.name;
      }
    }
  }
  return "?";
}

}  // namespace pymarshal::version
