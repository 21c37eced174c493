#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ColorMode.h"
#include "pymarshal/codec/options.h"
#include "pymarshal/version/py_version.h"

namespace pymarshal::cli {

    struct Options {
        bool showHelp{false};
        bool forcePyc{false};         // --pyc
        bool dump{false};             // --dump
        bool verify{false};           // --verify
        bool pruneRefs{false};        // --prune-refs
        bool resolveRefs{false};      // --resolve-refs
        bool allowTrailing{false};    // --allow-trailing
        bool metrics{false};          // --metrics
        bool metricsJson{false};      // --metrics-json
        bool logDecode{false};        // --log-decode
        bool logRefs{false};          // --log-refs
        std::optional<version::PyVersion> pyVersion{}; // --py-version=M.m
        std::size_t maxDepth{codec::kDefaultMaxDepth}; // --max-depth=N or PYMARSHAL_MAX_DEPTH
        std::string outputFile{};     // -o <file>; nothing is written when empty
        std::vector<std::string> inputs{};
        ColorMode color{ColorMode::Auto};
        std::string logPath{};        // --log-path=<dir>; file logs are off when empty
    };

} // namespace pymarshal::cli
