/**
 * @file
 * @brief Declarations for pymarshal CLI argument parsing helpers.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "cli/ColorMode.h"
#include "cli/Options.h"

namespace pymarshal::cli::detail {

/** Return true if `arg` exactly matches the `flag`. */
bool isFlag(std::string_view arg, std::string_view flag);

/** Parse `--color=<value>`; empty when the value is not always|never|auto. */
std::optional<ColorMode> parseColorValue(std::string_view value);

/** Parse a positive nesting limit for `--max-depth=` / PYMARSHAL_MAX_DEPTH. */
bool parseMaxDepthValue(std::string_view value, std::size_t& out, std::string& err);

/** Collect remaining argv items as input paths starting at index. */
void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out);

/** Detect unknown option-like arguments beginning with '-' that aren't supported. */
bool isUnknownOptionArg(std::string_view arg);

/** Validate incompatible modes (--prune-refs with --resolve-refs). */
bool hasConflictingModes(const Options& opts);

/** Handle boolean, flag-only options like -h, --dump, --metrics, etc. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options; err is set when the value is invalid. */
bool applyPrefixedOptions(std::string_view arg, Options& out, std::string& err);

/** Handle `-o <file>` output flag by consuming the next argv item. */
bool handleOutputFileFlag(int& idx, int argc, char** argv, Options& out);

} // namespace pymarshal::cli::detail
