#include "cli/ParseArgsInternals.h"

#include "pymarshal/support/parse.h"

namespace pymarshal::cli::detail {
    /***
     * Name: pymarshal::cli::detail::parseMaxDepthValue
     * Purpose: Parse the container nesting limit.
     * Inputs: Decimal text; must be a positive int.
     * Outputs: true and out set on success; false with err otherwise.
     */
    bool parseMaxDepthValue(const std::string_view value, std::size_t &out, std::string &err) {
        int parsed = 0;
        std::string parseErr;
        if (!support::ParseIntLiteralStrict(value, parsed, &parseErr)) {
            err = "invalid max depth '" + std::string(value) + "': " + parseErr;
            return false;
        }
        if (parsed < 1) {
            err = "max depth must be at least 1";
            return false;
        }
        out = static_cast<std::size_t>(parsed);
        return true;
    }
} // namespace pymarshal::cli::detail
