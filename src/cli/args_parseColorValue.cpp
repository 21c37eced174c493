#include "cli/ParseArgsInternals.h"

namespace pymarshal::cli::detail {
    /***
     * Name: pymarshal::cli::detail::parseColorValue
     * Purpose: Parse color mode value for --color=.
     * Outputs: ColorMode, or nothing for an unrecognized value.
     */
    std::optional<ColorMode> parseColorValue(const std::string_view value) {
        if (value == "always") { return ColorMode::Always; }
        if (value == "never") { return ColorMode::Never; }
        if (value == "auto") { return ColorMode::Auto; }
        return std::nullopt;
    }
} // namespace pymarshal::cli::detail
