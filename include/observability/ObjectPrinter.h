/***
 * Name: pymarshal::obs::ObjectPrinter
 * Purpose: Indented tree printer for decoded objects and reference tables.
 * Inputs:
 *   - object::Object (and optionally its ReferenceTable)
 * Outputs:
 *   - One line per node with its kind, wire form and salient value.
 * Theory of Operation:
 *   Walks the tree with an explicit stack, indenting by container depth. Text is
 *   escaped per code point: printable characters (ICU u_isprint) are kept,
 *   everything else becomes a Python-style escape. Container nesting is
 *   checked against maxDepth and exceeding it raises RecursionLimitError.
 */
#pragma once

#include <cstddef>
#include <sstream>
#include <string>

#include "pymarshal/codec/options.h"
#include "pymarshal/object/object.h"
#include "pymarshal/object/reference_table.h"

namespace pymarshal::obs {

class ObjectPrinter {
 public:
  explicit ObjectPrinter(std::size_t maxDepth = codec::kDefaultMaxDepth) : maxDepth_(maxDepth) {}

  std::string print(const object::Object& root);
  /*** printRefs: "#i <kind>" per table slot; reserved slots show as "<unfilled>". */
  std::string printRefs(const object::ReferenceTable& refs);

  /*** EscapeText: Quote UTF-8 text, escaping non-printable code points. */
  static std::string EscapeText(const std::string& text);
  /*** EscapeBytes: Quote raw bytes, escaping everything outside printable ASCII. */
  static std::string EscapeBytes(const std::string& bytes);

 private:
  void node(const object::Object& root);
  void line(const std::string& text, std::size_t depth);

  std::ostringstream ss_{};
  std::size_t maxDepth_;
};

}  // namespace pymarshal::obs
