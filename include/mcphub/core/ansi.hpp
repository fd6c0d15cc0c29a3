#pragma once

#include <string>
#include <string_view>

namespace mcphub {
namespace ansi {

constexpr const char* kReset  = "\033[0m";
constexpr const char* kBold   = "\033[1m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kGreen  = "\033[1;32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";

// Wrap `text` in `code` ... kReset, or return it unchanged when disabled.
inline std::string Paint(const char* code, std::string_view text, bool enabled = true) {
    if (!enabled) {
        return std::string(text);
    }
    return std::string(code) + std::string(text) + kReset;
}

} // namespace ansi
} // namespace mcphub
