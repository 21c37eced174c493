#ifndef PYMARSHAL_TOOL_TOOL_H
#define PYMARSHAL_TOOL_TOOL_H

/***
 * Name: pymarshal::Tool
 * Purpose: Orchestrate the command line pipeline over each input file.
 * Inputs:
 *   - CLI options
 * Outputs:
 *   - Dumps, logs and re-encoded artifacts written to disk; exit code
 * Theory of Operation:
 *   Reads the input, decodes it as raw marshal or .pyc, computes geometry,
 *   runs the optional reference passes, then dumps, verifies and re-encodes
 *   as requested while recording metrics for each stage.
 */

#include <string>

// Forward declarations to reduce header coupling
namespace pymarshal { namespace cli { struct Options; } }

namespace pymarshal {
    class Tool {
    public:
        static int run(const cli::Options &opts);

        static bool use_env_color();

        static void print_error(const std::string &file, const std::string &message, bool color);
    };
} // namespace pymarshal

#endif // PYMARSHAL_TOOL_TOOL_H
