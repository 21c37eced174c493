/***
 * Name: pymarshal::version::to_string(TypeTag)
 * Purpose: Map a tag to the name CPython uses for it.
 */
#include "pymarshal/version/type_tag.h"

namespace pymarshal::version {

const char* to_string(TypeTag tag) {
  switch (tag) {
    case TypeTag::Null: return "TYPE_NULL";
    case TypeTag::None: return "TYPE_NONE";
    case TypeTag::False: return "TYPE_FALSE";
    case TypeTag::True: return "TYPE_TRUE";
    case TypeTag::StopIteration: return "TYPE_STOPITER";
    case TypeTag::Ellipsis: return "TYPE_ELLIPSIS";
    case TypeTag::Int: return "TYPE_INT";
    case TypeTag::Int64: return "TYPE_INT64";
    case TypeTag::Float: return "TYPE_FLOAT";
    case TypeTag::BinaryFloat: return "TYPE_BINARY_FLOAT";
    case TypeTag::Complex: return "TYPE_COMPLEX";
    case TypeTag::BinaryComplex: return "TYPE_BINARY_COMPLEX";
    case TypeTag::Long: return "TYPE_LONG";
    case TypeTag::String: return "TYPE_STRING";
    case TypeTag::Interned: return "TYPE_INTERNED";
    case TypeTag::Ref: return "TYPE_REF";
    case TypeTag::Tuple: return "TYPE_TUPLE";
    case TypeTag::List: return "TYPE_LIST";
    case TypeTag::Dict: return "TYPE_DICT";
    case TypeTag::Code: return "TYPE_CODE";
    case TypeTag::Unicode: return "TYPE_UNICODE";
    case TypeTag::Unknown: return "TYPE_UNKNOWN";
    case TypeTag::Set: return "TYPE_SET";
    case TypeTag::FrozenSet: return "TYPE_FROZENSET";
    case TypeTag::Ascii: return "TYPE_ASCII";
    case TypeTag::AsciiInterned: return "TYPE_ASCII_INTERNED";
    case TypeTag::SmallTuple: return "TYPE_SMALL_TUPLE";
    case TypeTag::ShortAscii: return "TYPE_SHORT_ASCII";
    case TypeTag::ShortAsciiInterned: return "TYPE_SHORT_ASCII_INTERNED";
  }
  return "TYPE_?";
}

}  // namespace pymarshal::version
