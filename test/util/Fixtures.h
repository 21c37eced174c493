// Utility: small builders shared by the codec, refs and tool tests
#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

#include "pymarshal/object/object.h"
#include "pymarshal/version/version_table.h"

namespace testutil {

inline std::vector<std::uint8_t> bytes(std::initializer_list<int> values) {
  std::vector<std::uint8_t> out;
  out.reserve(values.size());
  for (const int v : values) { out.push_back(static_cast<std::uint8_t>(v)); }
  return out;
}

// Minimal code object for a layout: every int field holds its position, objects are small constants.
inline pymarshal::object::CodeValue makeCode(pymarshal::version::CodeLayout layout, const std::string& name) {
  using pymarshal::object::Object;
  using pymarshal::object::StrForm;
  pymarshal::object::CodeValue code;
  code.layout = layout;
  std::int32_t position = 0;
  for (const auto& field : pymarshal::version::VersionTable::CodeFields(layout)) {
    if (field.storage == pymarshal::version::FieldStorage::Int32) {
      code.numbers.push_back(position++);
      continue;
    }
    switch (field.field) {
      case pymarshal::version::CodeField::Code:
        code.objects.push_back(Object::Bytes({0x64, 0x00, 0x53, 0x00}));
        break;
      case pymarshal::version::CodeField::Consts:
        code.objects.push_back(Object::Tuple({Object::None(), Object::Int(7)}));
        break;
      case pymarshal::version::CodeField::Name:
      case pymarshal::version::CodeField::QualName:
        code.objects.push_back(Object::Str(name, StrForm::ShortAsciiInterned));
        break;
      case pymarshal::version::CodeField::Filename:
        code.objects.push_back(Object::Str("mod.py", StrForm::ShortAscii));
        break;
      case pymarshal::version::CodeField::LineTable:
      case pymarshal::version::CodeField::ExceptionTable:
      case pymarshal::version::CodeField::LocalsPlusKinds:
        code.objects.push_back(Object::Bytes({}));
        break;
      default:
        code.objects.push_back(Object::Tuple({}));
        break;
    }
  }
  return code;
}

} // namespace testutil
