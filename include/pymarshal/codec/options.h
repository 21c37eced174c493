/***
 * Name: pymarshal::codec (options and results)
 * Purpose: Per-call knobs of Decode/Encode and the decode result bundle.
 * Theory of Operation: kDefaultMaxDepth matches the interpreter's own marshal
 *   nesting limit, so any stream it can write we can read.
 */
#pragma once

#include <cstddef>

#include "pymarshal/object/object.h"
#include "pymarshal/object/reference_table.h"

namespace pymarshal::codec {

constexpr std::size_t kDefaultMaxDepth = 2000;

struct DecodeOptions {
  std::size_t maxDepth{kDefaultMaxDepth};
  bool allowTrailingBytes{false};
};

struct EncodeOptions {
  std::size_t maxDepth{kDefaultMaxDepth};
};

struct DecodeResult {
  object::Object object;
  object::ReferenceTable refs;
  std::size_t consumed{0};  // bytes used by the top-level value
};

}  // namespace pymarshal::codec
