#include "cli/ParseArgsInternals.h"

namespace pymarshal::cli::detail {
    /***
     * Name: pymarshal::cli::detail::hasConflictingModes
     * Purpose: Both reference passes rewrite the same table; only one may run.
     */
    bool hasConflictingModes(const Options &opts) {
        return opts.pruneRefs && opts.resolveRefs;
    }
} // namespace pymarshal::cli::detail
