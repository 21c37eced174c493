#pragma once

namespace pymarshal::cli {

    enum class ColorMode {
        Auto,
        Always,
        Never
    };

} // namespace pymarshal::cli
