/***
 * Name: pymarshal::version::TypeTag
 * Purpose: Name the marshal type tag bytes.
 * Inputs: Low seven bits of a tag byte read from or written to a stream
 * Outputs: Enumerated tag and its diagnostic name
 * Theory of Operation: Enumerator values are the ASCII codes used on the wire;
 *   the top bit (kFlagRef) is carried separately and never part of a TypeTag.
 */
#pragma once

#include <cstdint>

namespace pymarshal::version {

enum class TypeTag : std::uint8_t {
  Null = '0',
  None = 'N',
  False = 'F',
  True = 'T',
  StopIteration = 'S',
  Ellipsis = '.',
  Int = 'i',
  Int64 = 'I',
  Float = 'f',
  BinaryFloat = 'g',
  Complex = 'x',
  BinaryComplex = 'y',
  Long = 'l',
  String = 's',
  Interned = 't',
  Ref = 'r',
  Tuple = '(',
  List = '[',
  Dict = '{',
  Code = 'c',
  Unicode = 'u',
  Unknown = '?',
  Set = '<',
  FrozenSet = '>',
  Ascii = 'a',
  AsciiInterned = 'A',
  SmallTuple = ')',
  ShortAscii = 'z',
  ShortAsciiInterned = 'Z'
};

constexpr std::uint8_t kFlagRef = 0x80U;
constexpr std::uint8_t kTagMask = 0x7FU;

constexpr std::uint8_t tag_byte(TypeTag tag) { return static_cast<std::uint8_t>(tag); }

/*** to_string: Diagnostic name such as "TYPE_SMALL_TUPLE". */
const char* to_string(TypeTag tag);

}  // namespace pymarshal::version
