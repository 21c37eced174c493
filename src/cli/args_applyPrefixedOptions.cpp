#include "cli/ParseArgsInternals.h"

#include <string>

#include "pymarshal/version/py_version.h"

namespace pymarshal::cli::detail {
    /***
     * Name: pymarshal::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options like py-version/max-depth/color.
     * Outputs: true when the argument was one of ours; err non-empty if its value was rejected.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out, std::string &err) {
        if (constexpr std::string_view versionPrefix{"--py-version="}; arg.rfind(versionPrefix, 0) == 0) {
            version::PyVersion v;
            std::string parseErr;
            if (!version::ParsePyVersion(arg.substr(versionPrefix.size()), v, &parseErr)) {
                err = "invalid --py-version: " + parseErr;
                return true;
            }
            out.pyVersion = v;
            return true;
        }

        if (constexpr std::string_view depthPrefix{"--max-depth="}; arg.rfind(depthPrefix, 0) == 0) {
            parseMaxDepthValue(arg.substr(depthPrefix.size()), out.maxDepth, err);
            return true;
        }

        if (constexpr std::string_view logPathPrefix{"--log-path="}; arg.rfind(logPathPrefix, 0) == 0) {
            out.logPath = std::string(arg.substr(logPathPrefix.size()));
            if (out.logPath.empty()) { err = "--log-path requires a directory"; }
            return true;
        }

        if (constexpr std::string_view colorPrefix{"--color="}; arg.rfind(colorPrefix, 0) == 0) {
            const auto mode = parseColorValue(arg.substr(colorPrefix.size()));
            if (!mode) {
                err = "invalid --color value '" + std::string(arg.substr(colorPrefix.size())) + "'";
                return true;
            }
            out.color = *mode;
            return true;
        }
        return false;
    }
} // namespace pymarshal::cli::detail
