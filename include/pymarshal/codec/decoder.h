/***
 * Name: pymarshal::codec::Decoder
 * Purpose: Turn a marshal byte stream into an Object tree and its ReferenceTable.
 * Inputs: Borrowed buffer, VersionTable of the active release, DecodeOptions
 * Outputs: DecodeResult; throws a MarshalException subclass on malformed input
 * Theory of Operation:
 *   A byte cursor plus an explicit stack of partially built containers. Each
 *   step reads one tag: scalars complete immediately, containers push a Frame.
 *   A completed value is handed to the frame below it, which may then complete
 *   in turn; the first value completed with an empty stack is the result.
 *   Native recursion is never used, so nesting is bounded only by maxDepth.
 *
 *   Flagged tags reserve their reference index as soon as the tag byte is read,
 *   so indices follow pre-order of tag bytes and a container may refer to
 *   itself before it is complete. Single-use: construct, run() once.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pymarshal/codec/byte_reader.h"
#include "pymarshal/codec/options.h"
#include "pymarshal/object/object.h"
#include "pymarshal/object/reference_table.h"
#include "pymarshal/version/version_table.h"

namespace pymarshal::codec {

class Decoder {
 public:
  Decoder(const std::uint8_t* data, std::size_t size, const version::VersionTable& table, DecodeOptions options);

  DecodeResult run();

 private:
  struct Frame {
    object::ObjectKind kind{object::ObjectKind::List};
    std::optional<std::uint32_t> refIndex;
    std::size_t tagOffset{0};
    std::size_t expected{0};  // sequences: item count
    bool small{false};
    std::vector<object::Object> items;
    // Dict state
    std::vector<object::DictEntry> entries;
    std::optional<object::Object> pendingKey;
    bool closed{false};
    // Code state
    object::CodeValue code;
    std::size_t fieldIndex{0};
  };

  /*** readNext: Read one tag; return the value if complete, else push a frame and return nullopt. */
  std::optional<object::Object> readNext();
  object::Object readScalar(const version::TagSpec& spec, std::size_t tagOffset);
  void pushFrame(Frame frame);
  void readCodeInts(Frame& frame);
  bool frameComplete(const Frame& frame) const;
  object::Object completeFrame();
  void deliver(object::Object value);
  object::Object wrapRef(std::optional<std::uint32_t> refIndex, object::Object value);

  std::size_t readSize32(const char* what, std::size_t tagOffset);
  object::Object readStr(version::TypeTag tag, std::size_t length);
  void validateUtf8(const std::string& text, std::size_t dataOffset) const;
  void requireHashable(const object::Object& value, const char* role) const;
  std::string at(std::size_t offset) const;

  ByteReader reader_;
  const version::VersionTable& table_;
  DecodeOptions options_;
  object::ReferenceTable refs_;
  std::vector<Frame> stack_;
};

}  // namespace pymarshal::codec
