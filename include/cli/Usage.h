#pragma once

#include <string>

namespace pymarshal::cli {

    std::string Usage();

} // namespace pymarshal::cli
