#include "cli/ParseArgsInternals.h"

namespace pymarshal::cli::detail {
    /***
     * Name: pymarshal::cli::detail::isFlag
     * Purpose: Check if an argument exactly matches a flag.
     */
    bool isFlag(const std::string_view arg, const std::string_view flag) {
        return arg == flag;
    }
} // namespace pymarshal::cli::detail
