#pragma once
#include <string>
#include <unistd.h>

/**
 * Minimal ANSI terminal helper.
 *
 * Provides:
 *   - color escape sequences
 *   - screen/cursor control for the live monitor table
 *   - automatic disabling via term::g_enabled
 */

namespace term {

inline bool g_enabled = true;

inline const char* reset()   { return g_enabled ? "\x1b[0m"  : ""; }
inline const char* bold()    { return g_enabled ? "\x1b[1m"  : ""; }
inline const char* dim()     { return g_enabled ? "\x1b[2m"  : ""; }
inline const char* red()     { return g_enabled ? "\x1b[31m" : ""; }
inline const char* green()   { return g_enabled ? "\x1b[32m" : ""; }
inline const char* yellow()  { return g_enabled ? "\x1b[33m" : ""; }
inline const char* cyan()    { return g_enabled ? "\x1b[36m" : ""; }
inline const char* gray()    { return g_enabled ? "\x1b[90m" : ""; }

// Cursor home + clear to end of screen; redraws without scrolling
inline const char* home_clear() { return g_enabled ? "\x1b[H\x1b[J" : "\n"; }

/**
 * Disable colors when stdout is not a terminal (pipes, redirects).
 */
inline void detect() {
    if (!::isatty(STDOUT_FILENO)) g_enabled = false;
}

inline std::string colorize(const std::string& s, const char* color) {
    if (!g_enabled) return s;
    return std::string(color) + s + reset();
}

/**
 * Color for a target status label ("OK", "Recovered", "Down", "").
 */
inline const char* status_color(const std::string& label) {
    if (label == "Down") return red();
    if (label == "Recovered") return yellow();
    if (label == "OK") return green();
    return gray();
}

} // namespace term
