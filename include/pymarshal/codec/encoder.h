/***
 * Name: pymarshal::codec::Encoder
 * Purpose: Serialize an Object tree back to marshal bytes for one release.
 * Inputs: Root object, caller-supplied ReferenceTable, VersionTable, EncodeOptions
 * Outputs: Byte vector; throws a MarshalException subclass on unencodable input
 * Theory of Operation:
 *   Replays the provenance stored on every node (int form, float form, string
 *   form, small tuple) so a decoded tree re-encodes byte for byte. Work is an
 *   explicit stack of tasks: emitting a value, writing a code object's int32
 *   field, writing the dict terminator, or leaving a container. StoreRef must
 *   appear in index order and LoadRef may only name an index already stored,
 *   which is exactly what the decoder accepts. A StoreRef's target must be the
 *   table's own entry for its index. Single-use.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pymarshal/codec/byte_writer.h"
#include "pymarshal/codec/options.h"
#include "pymarshal/object/object.h"
#include "pymarshal/object/reference_table.h"
#include "pymarshal/version/version_table.h"

namespace pymarshal::codec {

class Encoder {
 public:
  Encoder(const object::ReferenceTable& refs, const version::VersionTable& table, EncodeOptions options);

  std::vector<std::uint8_t> run(const object::Object& root);

 private:
  struct Task {
    enum class Kind { Value, CodeInt, DictEnd, Leave };
    Kind kind{Kind::Value};
    const object::Object* value{nullptr};
    std::int32_t number{0};
  };

  void emit(const object::Object& value);
  void writeTag(version::TypeTag tag, bool flagged);
  void enterContainer();
  void emitLong(const object::LongValue& value, bool flagged);
  void emitFloatText(const std::string& text);
  void emitStr(const object::StrValue& value, bool flagged);
  void emitSequence(const object::Object& value, bool flagged);
  void emitDict(const object::DictValue& value, bool flagged);
  void emitCode(const object::CodeValue& value, bool flagged);
  void requireHashable(const object::Object& value, const char* role) const;
  void writeSize32(std::size_t size, const char* what);

  const object::ReferenceTable& refs_;
  const version::VersionTable& table_;
  EncodeOptions options_;
  ByteWriter out_;
  std::vector<Task> tasks_;
  std::size_t depth_{0};
  std::uint32_t stored_{0};
};

}  // namespace pymarshal::codec
