#include "tool/Tool.h"
#include <string>
#include <string_view>
#include <unistd.h>

namespace pymarshal {
    // Short writes to stderr are not retried; diagnostics are best effort.
    static void write_str(const std::string_view strView) {
        const ssize_t written = ::write(STDERR_FILENO, strView.data(), strView.size());
        static_cast<void>(written);
    }

    // ANSI fragments
    static constexpr std::string_view kRed = "\033[31m";
    static constexpr std::string_view kBold = "\033[1m";
    static constexpr std::string_view kReset = "\033[0m";

    static void print_header(const std::string &file, const bool color) {
        if (file.empty()) { return; }
        if (color) { write_str(kBold); }
        write_str(file);
        write_str(": ");
        if (color) { write_str(kReset); }
    }

    static void print_label(const bool color) {
        if (color) {
            write_str(kRed);
            write_str("error: ");
            write_str(kReset);
        } else { write_str("error: "); }
    }

    void Tool::print_error(const std::string &file, const std::string &message, const bool color) {
        print_header(file, color);
        print_label(color);
        write_str(message);
        write_str("\n");
    }
} // namespace pymarshal
