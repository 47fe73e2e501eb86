#pragma once

// Terminal helpers for exflow reports: ANSI styling and count phrasing.

#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include <unistd.h>

namespace exflow::cli::ui {

struct Ansi {
    static constexpr const char* RESET = "\x1b[0m";
    static constexpr const char* BOLD = "\x1b[1m";
    static constexpr const char* DIM = "\x1b[2m";
    static constexpr const char* RED = "\x1b[31m";
    static constexpr const char* GREEN = "\x1b[32m";
    static constexpr const char* YELLOW = "\x1b[33m";
    static constexpr const char* BLUE = "\x1b[34m";
    static constexpr const char* CYAN = "\x1b[36m";
};

namespace detail {
inline std::optional<bool>& colorOverride() {
    static std::optional<bool> forced;
    return forced;
}
} // namespace detail

// --color / --no-color win over environment detection for the rest of the process.
inline void set_colors_enabled_override(bool enabled) {
    detail::colorOverride() = enabled;
}

// Without an override, styling needs a TTY on stdout, no NO_COLOR
// (https://no-color.org/) and a TERM other than "dumb".
inline bool colors_enabled() {
    if (auto forced = detail::colorOverride())
        return *forced;
    if (std::getenv("NO_COLOR"))
        return false;
    if (const char* term = std::getenv("TERM"); term && std::string_view(term) == "dumb")
        return false;
    return isatty(fileno(stdout)) != 0;
}

inline std::string colorize(std::string_view s, const char* code, bool enabled) {
    if (!enabled || code == nullptr || *code == '\0')
        return std::string(s);
    std::string out(code);
    out.append(s);
    out.append(Ansi::RESET);
    return out;
}

inline std::string colorize(std::string_view s, const char* code) {
    return colorize(s, code, colors_enabled());
}

// "1 endpoint", "2 endpoints"
inline std::string pluralize(size_t n, std::string_view singular, std::string_view plural) {
    return std::to_string(n) + " " + std::string(n == 1 ? singular : plural);
}

} // namespace exflow::cli::ui
