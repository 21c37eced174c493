#include "cli/ParseArgsInternals.h"

namespace pymarshal::cli::detail {
    /***
     * Name: pymarshal::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, "-h") || isFlag(arg, "--help")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--pyc")) {
            out.forcePyc = true;
            return true;
        }
        if (isFlag(arg, "--dump")) {
            out.dump = true;
            return true;
        }
        if (isFlag(arg, "--verify")) {
            out.verify = true;
            return true;
        }
        if (isFlag(arg, "--prune-refs")) {
            out.pruneRefs = true;
            return true;
        }
        if (isFlag(arg, "--resolve-refs")) {
            out.resolveRefs = true;
            return true;
        }
        if (isFlag(arg, "--allow-trailing")) {
            out.allowTrailing = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, "--metrics-json")) {
            out.metricsJson = true;
            return true;
        }
        if (isFlag(arg, "--log-decode")) {
            out.logDecode = true;
            return true;
        }
        if (isFlag(arg, "--log-refs")) {
            out.logRefs = true;
            return true;
        }
        return false;
    }
} // namespace pymarshal::cli::detail
