/***
 * Name: pymarshal::object (kind names)
 * Purpose: Diagnostic names for kinds and forms.
 */
#include "pymarshal/object/object_kind.h"

namespace pymarshal::object {

const char* to_string(ObjectKind kind) {
  switch (kind) {
    case ObjectKind::Null: return "Null";
    case ObjectKind::None: return "None";
    case ObjectKind::Bool: return "Bool";
    case ObjectKind::StopIteration: return "StopIteration";
    case ObjectKind::Ellipsis: return "Ellipsis";
    case ObjectKind::Long: return "Long";
    case ObjectKind::Float: return "Float";
    case ObjectKind::Complex: return "Complex";
    case ObjectKind::Bytes: return "Bytes";
    case ObjectKind::Str: return "Str";
    case ObjectKind::Tuple: return "Tuple";
    case ObjectKind::List: return "List";
    case ObjectKind::Dict: return "Dict";
    case ObjectKind::Set: return "Set";
    case ObjectKind::FrozenSet: return "FrozenSet";
    case ObjectKind::Code: return "Code";
    case ObjectKind::LoadRef: return "LoadRef";
    case ObjectKind::StoreRef: return "StoreRef";
  }
  return "?";
}

const char* to_string(IntForm form) {
  switch (form) {
    case IntForm::Int32: return "int32";
    case IntForm::Int64: return "int64";
    case IntForm::Long: return "long";
  }
  return "?";
}

const char* to_string(FloatForm form) { return form == FloatForm::Binary ? "binary" : "text"; }

const char* to_string(StrForm form) {
  switch (form) {
    case StrForm::Unicode: return "unicode";
    case StrForm::Interned: return "interned";
    case StrForm::Ascii: return "ascii";
    case StrForm::AsciiInterned: return "ascii-interned";
    case StrForm::ShortAscii: return "short-ascii";
    case StrForm::ShortAsciiInterned: return "short-ascii-interned";
  }
  return "?";
}

bool IsInterned(StrForm form) {
  return form == StrForm::Interned || form == StrForm::AsciiInterned || form == StrForm::ShortAsciiInterned;
}

bool IsAsciiForm(StrForm form) { return form != StrForm::Unicode && form != StrForm::Interned; }

}  // namespace pymarshal::object
