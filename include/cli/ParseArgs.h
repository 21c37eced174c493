#pragma once

#include <string>
#include <vector>

#include "ColorMode.h"
#include "Options.h"

namespace pymarshal::cli {

    // Parse argv into Options. Returns false on fatal parse error.
    bool ParseArgs(int argc, char** argv, Options& out);

    // Apply PYMARSHAL_MAX_DEPTH; call before ParseArgs so flags win. Returns false on a bad value.
    bool ApplyEnvironment(Options& out, std::string& err);

} // namespace pymarshal::cli
