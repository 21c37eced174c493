/***
 * Name: pymarshal::object (kinds and forms)
 * Purpose: Enumerate Object variants and the wire provenance recorded on them.
 * Theory of Operation: A form is the exact tag a value was read with (or is to be
 *   written with); the encoder replays it instead of choosing an encoding.
 */
#pragma once

#include <cstdint>

namespace pymarshal::object {

enum class ObjectKind : std::uint8_t {
  Null,
  None,
  Bool,
  StopIteration,
  Ellipsis,
  Long,
  Float,
  Complex,
  Bytes,
  Str,
  Tuple,
  List,
  Dict,
  Set,
  FrozenSet,
  Code,
  LoadRef,
  StoreRef
};

enum class IntForm : std::uint8_t { Int32, Int64, Long };

enum class FloatForm : std::uint8_t { Binary, Text };

enum class StrForm : std::uint8_t { Unicode, Interned, Ascii, AsciiInterned, ShortAscii, ShortAsciiInterned };

const char* to_string(ObjectKind kind);
const char* to_string(IntForm form);
const char* to_string(FloatForm form);
const char* to_string(StrForm form);

/*** IsInterned: Interned and AsciiInterned variants. */
bool IsInterned(StrForm form);
/*** IsAsciiForm: Forms whose bytes are not UTF-8 validated. */
bool IsAsciiForm(StrForm form);

}  // namespace pymarshal::object
