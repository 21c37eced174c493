#include "cli/ParseArgs.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "cli/ParseArgsInternals.h"
#include <cstdlib>
#include <iostream>

namespace pymarshal::cli {
    /***
     * Name: pymarshal::cli::ParseArgs
     * Purpose: Minimal GCC-like CLI argument parser for pymarshal.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        for (int i = 1; i < argc; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const std::string_view arg{argv[i]};
            if (detail::isFlag(arg, "--")) {
                detail::collectRemainingAsInputs(i + 1, argc, argv, out);
                break;
            }
            if (detail::handleOutputFileFlag(i, argc, argv, out)) { continue; }
            if (detail::isFlag(arg, "-o")) {
                std::cerr << "pymarshal: -o requires a file name\n";
                return false;
            }
            if (detail::applySimpleBoolFlags(arg, out)) { continue; }
            std::string err;
            if (detail::applyPrefixedOptions(arg, out, err)) {
                if (!err.empty()) {
                    std::cerr << "pymarshal: " << err << "\n";
                    return false;
                }
                continue;
            }

            // Positional
            if (detail::isUnknownOptionArg(arg)) {
                std::cerr << "pymarshal: unknown option '" << arg << "'\n";
                return false;
            }
            out.inputs.emplace_back(std::string(arg));
        }

        if (detail::hasConflictingModes(out)) {
            std::cerr << "pymarshal: cannot use --prune-refs and --resolve-refs together\n";
            return false;
        }
        if (!out.outputFile.empty() && out.inputs.size() > 1) {
            std::cerr << "pymarshal: -o cannot be used with multiple inputs\n";
            return false;
        }

        return true;
    }

    /***
     * Name: pymarshal::cli::ApplyEnvironment
     * Purpose: Seed options from PYMARSHAL_MAX_DEPTH when it is set.
     */
    bool ApplyEnvironment(Options &out, std::string &err) {
        const char *depth = std::getenv("PYMARSHAL_MAX_DEPTH");
        if (depth == nullptr || *depth == '\0') { return true; }
        if (!detail::parseMaxDepthValue(depth, out.maxDepth, err)) {
            err = "PYMARSHAL_MAX_DEPTH: " + err;
            return false;
        }
        return true;
    }
} // namespace pymarshal::cli
