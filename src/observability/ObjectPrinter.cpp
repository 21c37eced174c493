/***
 * Name: pymarshal::obs::ObjectPrinter (impl)
 * Purpose: Render object trees line by line with escaped text.
 */
#include "observability/ObjectPrinter.h"

#include <unicode/uchar.h>
#include <unicode/umachine.h>
#include <unicode/utf8.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "pymarshal/exceptions/recursion_limit_error.h"
#include "pymarshal/numeric/float_text.h"
#include "pymarshal/version/version_table.h"

namespace pymarshal::obs {

using object::Object;
using object::ObjectKind;

namespace {

void appendHex(std::string& out, char kind, std::uint32_t value, int width) {
  static constexpr char kDigits[] = "0123456789abcdef";
  out += '\\';
  out += kind;
  for (int shift = (width - 1) * 4; shift >= 0; shift -= 4) {
    out += kDigits[(value >> static_cast<unsigned>(shift)) & 0xFU];
  }
}

bool appendSimpleEscape(std::string& out, std::uint32_t ch) {
  switch (ch) {
    case '\\': out += "\\\\"; return true;
    case '"': out += "\\\""; return true;
    case '\n': out += "\\n"; return true;
    case '\r': out += "\\r"; return true;
    case '\t': out += "\\t"; return true;
    default: return false;
  }
}

std::string describe(const Object& value) {
  switch (value.kind) {
    case ObjectKind::Bool:
      return value.as<bool>() ? "True" : "False";
    case ObjectKind::Long: {
      const auto& lng = value.as<object::LongValue>();
      return std::string("Long ") + object::to_string(lng.form) + " " + lng.value.toDecimal();
    }
    case ObjectKind::Float: {
      const auto& flt = value.as<object::FloatValue>();
      if (flt.form == object::FloatForm::Text) {
        return "Float text " + flt.text;
      }
      return "Float binary " + numeric::FormatFloatText(flt.value);
    }
    case ObjectKind::Complex: {
      const auto& cpx = value.as<object::ComplexValue>();
      if (cpx.form == object::FloatForm::Text) {
        return "Complex text " + cpx.realText + " " + cpx.imagText;
      }
      return "Complex binary " + numeric::FormatFloatText(cpx.real) + " " + numeric::FormatFloatText(cpx.imag);
    }
    case ObjectKind::Bytes: {
      const auto& data = value.as<object::BytesValue>().data;
      return "Bytes len=" + std::to_string(data.size()) + " b" +
             ObjectPrinter::EscapeBytes(std::string(data.begin(), data.end()));
    }
    case ObjectKind::Str: {
      const auto& str = value.as<object::StrValue>();
      const std::string quoted =
          object::IsAsciiForm(str.form) ? ObjectPrinter::EscapeBytes(str.data) : ObjectPrinter::EscapeText(str.data);
      return std::string("Str ") + object::to_string(str.form) + " " + quoted;
    }
    case ObjectKind::Tuple:
    case ObjectKind::List:
    case ObjectKind::Set:
    case ObjectKind::FrozenSet: {
      const auto& seq = value.as<object::SequenceValue>();
      std::string text = std::string(object::to_string(value.kind)) + " len=" + std::to_string(seq.items.size());
      if (value.kind == ObjectKind::Tuple && seq.small) {
        text += " small";
      }
      return text;
    }
    case ObjectKind::Dict:
      return "Dict len=" + std::to_string(value.as<object::DictValue>().entries.size());
    case ObjectKind::Code:
      return std::string("Code ") + version::to_string(value.as<object::CodeValue>().layout);
    case ObjectKind::LoadRef:
      return "LoadRef #" + std::to_string(value.as<object::LoadRefValue>().index);
    case ObjectKind::StoreRef: {
      const auto& store = value.as<object::StoreRefValue>();
      return "StoreRef #" + std::to_string(store.index) + (store.target ? "" : " <no target>");
    }
    default:
      return object::to_string(value.kind);
  }
}

}  // namespace

std::string ObjectPrinter::print(const Object& root) {
  ss_.str("");
  ss_.clear();
  node(root);
  return ss_.str();
}

std::string ObjectPrinter::printRefs(const object::ReferenceTable& refs) {
  ss_.str("");
  ss_.clear();
  for (std::uint32_t i = 0; i < refs.size(); ++i) {
    const auto& entry = refs.at(i);
    line("#" + std::to_string(i) + " " + (entry ? describe(*entry) : std::string("<unfilled>")), 0);
  }
  return ss_.str();
}

void ObjectPrinter::node(const Object& root) {
  // Work items pop from the back: a node, or a literal line such as a code field label.
  struct Item {
    const Object* value{nullptr};
    std::string text;
    std::size_t depth{0};
    std::size_t nesting{0};
  };
  std::vector<Item> pending{Item{&root, {}, 0, 0}};
  std::vector<Item> children;
  while (!pending.empty()) {
    Item item = std::move(pending.back());
    pending.pop_back();
    if (item.value == nullptr) {
      line(item.text, item.depth);
      continue;
    }
    const Object& value = *item.value;
    if (item.nesting > maxDepth_) {
      throw exceptions::RecursionLimitError("object printer exceeds maximum depth " + std::to_string(maxDepth_));
    }
    line(describe(value), item.depth);
    const std::size_t depth = item.depth;
    const std::size_t nesting = item.nesting;
    children.clear();
    switch (value.kind) {
      case ObjectKind::Tuple:
      case ObjectKind::List:
      case ObjectKind::Set:
      case ObjectKind::FrozenSet:
        for (const auto& child : value.as<object::SequenceValue>().items) {
          children.push_back(Item{&child, {}, depth + 1, nesting + 1});
        }
        break;
      case ObjectKind::Dict:
        for (const auto& entry : value.as<object::DictValue>().entries) {
          children.push_back(Item{&entry.key, {}, depth + 1, nesting + 1});
          children.push_back(Item{&entry.value, {}, depth + 2, nesting + 1});
        }
        break;
      case ObjectKind::Code: {
        const auto& code = value.as<object::CodeValue>();
        std::size_t nextNumber = 0;
        std::size_t nextObject = 0;
        for (const auto& field : version::VersionTable::CodeFields(code.layout)) {
          if (field.storage == version::FieldStorage::Int32) {
            if (nextNumber < code.numbers.size()) {
              children.push_back(Item{nullptr, std::string(field.name) + "=" +
                                                   std::to_string(code.numbers[nextNumber++]),
                                      depth + 1, nesting});
            }
          } else if (nextObject < code.objects.size()) {
            children.push_back(Item{nullptr, std::string(field.name) + ":", depth + 1, nesting});
            children.push_back(Item{&code.objects[nextObject++], {}, depth + 2, nesting + 1});
          }
        }
        break;
      }
      case ObjectKind::StoreRef:
        if (const auto& target = value.as<object::StoreRefValue>().target) {
          children.push_back(Item{target.get(), {}, depth + 1, nesting});
        }
        break;
      default:
        break;
    }
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      pending.push_back(std::move(*it));
    }
  }
}

void ObjectPrinter::line(const std::string& text, std::size_t depth) {
  for (std::size_t i = 0; i < depth; ++i) {
    ss_ << "  ";
  }
  ss_ << text << "\n";
}

std::string ObjectPrinter::EscapeText(const std::string& text) {
  std::string out = "\"";
  const auto* bytes = reinterpret_cast<const std::uint8_t*>(text.data());
  const auto length = static_cast<std::int32_t>(text.size());
  std::int32_t index = 0;
  while (index < length) {
    const std::int32_t start = index;
    UChar32 ch = 0;
    U8_NEXT(bytes, index, length, ch);
    if (ch < 0) {
      appendHex(out, 'x', bytes[start], 2);
      index = start + 1;
      continue;
    }
    const auto code = static_cast<std::uint32_t>(ch);
    if (appendSimpleEscape(out, code)) {
      continue;
    }
    if (u_isprint(ch) != 0) {
      out.append(text, static_cast<std::size_t>(start), static_cast<std::size_t>(index - start));
    } else if (code < 0x100U) {
      appendHex(out, 'x', code, 2);
    } else if (code < 0x10000U) {
      appendHex(out, 'u', code, 4);
    } else {
      appendHex(out, 'U', code, 8);
    }
  }
  out += '"';
  return out;
}

std::string ObjectPrinter::EscapeBytes(const std::string& bytes) {
  std::string out = "\"";
  for (const char raw : bytes) {
    const auto byte = static_cast<unsigned char>(raw);
    if (appendSimpleEscape(out, byte)) {
      continue;
    }
    if (byte >= 0x20U && byte < 0x7FU) {
      out += raw;
    } else {
      appendHex(out, 'x', byte, 2);
    }
  }
  out += '"';
  return out;
}

}  // namespace pymarshal::obs
