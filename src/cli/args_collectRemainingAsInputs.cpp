#include "cli/ParseArgsInternals.h"

namespace pymarshal::cli::detail {

/***
 * Name: pymarshal::cli::detail::collectRemainingAsInputs
 * Purpose: Gather remaining argv entries as positional input paths.
 */
void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out) {
    for (int j = static_cast<int>(startIndex); j < argc; ++j) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.inputs.emplace_back(argv[j]);
    }
}

} // namespace pymarshal::cli::detail
