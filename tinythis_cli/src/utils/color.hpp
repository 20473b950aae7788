#ifndef TINYTHIS_COLOR_HPP
#define TINYTHIS_COLOR_HPP

// ANSI escape sequences used by the console output and the TUI
inline constexpr const char* RESET  = "\033[0m";
inline constexpr const char* BOLD   = "\033[1m";
inline constexpr const char* DIM    = "\033[2m";
inline constexpr const char* RED    = "\033[1;31m";
inline constexpr const char* GREEN  = "\033[1;32m";
inline constexpr const char* YELLOW = "\033[1;33m";
inline constexpr const char* CYAN   = "\033[1;36m";
inline constexpr const char* REVERSE = "\033[7m";

#endif // TINYTHIS_COLOR_HPP
