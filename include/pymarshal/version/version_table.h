/***
 * Name: pymarshal::version::VersionTable
 * Purpose: Static, data-driven description of the marshal dialect of one Python release.
 * Inputs: PyVersion requested by the caller; tag bytes read from or written to a stream
 * Outputs: Tag specifications (payload layout, referenceability) and the code-object
 *   field list of the release
 * Theory of Operation:
 *   A single row list describes every tag together with the first and last
 *   release in which it carries that meaning. One table per supported release is
 *   materialised from those rows, indexed by the 7-bit base tag, so a byte that
 *   changes meaning between releases is disambiguated by the version alone.
 *   Decoder and Encoder are generic loops over PayloadLayout; nothing else in
 *   the codec branches on the version.
 */
#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "pymarshal/version/py_version.h"
#include "pymarshal/version/type_tag.h"

namespace pymarshal::version {

// Bytes consumed after the tag byte.
enum class PayloadLayout : std::uint8_t {
  Empty,          // singletons and the NULL terminator
  Int32,          // 4-byte signed little-endian
  Int64,          // 8-byte signed little-endian
  LongDigits,     // int32 signed digit count, then 15-bit digits as uint16
  FloatText,      // 1-byte length + ASCII decimal
  FloatBinary,    // 8-byte IEEE-754 little-endian
  ComplexText,    // two FloatText
  ComplexBinary,  // two FloatBinary
  Bytes32,        // int32 length + raw bytes
  Str32,          // int32 length + text bytes
  Str8,           // 1-byte length + text bytes
  Sequence32,     // int32 count + elements
  Sequence8,      // 1-byte count + elements
  DictPairs,      // key/value pairs until a NULL key
  CodeFields,     // version-specific ordered field list
  RefIndex        // int32 index into the reference table
};

enum class CodeLayout : std::uint8_t { Py310, Py311 };

enum class CodeField : std::uint8_t {
  ArgCount,
  PosOnlyArgCount,
  KwOnlyArgCount,
  NLocals,
  StackSize,
  Flags,
  Code,
  Consts,
  Names,
  VarNames,
  FreeVars,
  CellVars,
  LocalsPlusNames,
  LocalsPlusKinds,
  Filename,
  Name,
  QualName,
  FirstLineNo,
  LineTable,
  ExceptionTable
};

enum class FieldStorage : std::uint8_t { Int32, Object };

struct CodeFieldSpec {
  CodeField field;
  FieldStorage storage;
  const char* name;
};

struct TagSpec {
  TypeTag tag;
  PayloadLayout layout;
  bool referenceable;  // may carry kFlagRef
  const char* name;
};

class VersionTable {
 public:
  /*** ForVersion: Table of a supported release; throws UnsupportedVersionError otherwise. */
  static const VersionTable& ForVersion(PyVersion version);
  static const std::vector<PyVersion>& SupportedVersions();
  static bool IsSupported(PyVersion version);

  /*** CodeFields: Ordered wire fields of a code object with the given layout. */
  static const std::vector<CodeFieldSpec>& CodeFields(CodeLayout layout);

  /*** lookup: Spec of a base tag (flag bit stripped), nullptr if illegal in this release. */
  const TagSpec* lookup(std::uint8_t baseTag) const;
  const TagSpec* lookup(TypeTag tag) const { return lookup(tag_byte(tag)); }

  PyVersion version() const { return version_; }
  CodeLayout codeLayout() const { return codeLayout_; }
  int marshalFormat() const { return marshalFormat_; }

 private:
  VersionTable(PyVersion version, CodeLayout layout, int marshalFormat);

  PyVersion version_;
  CodeLayout codeLayout_;
  int marshalFormat_;
  std::array<const TagSpec*, kTagMask + 1U> tags_{};
};

const char* to_string(PayloadLayout layout);
const char* to_string(CodeLayout layout);
const char* to_string(CodeField field);

}  // namespace pymarshal::version
