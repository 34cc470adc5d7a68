#pragma once

#include <string>

namespace ansi {

namespace color {
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BLUE      = "\033[94m";
    const std::string PURPLE    = "\033[95m";
    const std::string CYAN      = "\033[96m";
    const std::string RESET     = "\033[0m";
}

// Escape code for a color name ("red", "green", "yellow", "blue",
// "purple", "cyan"). Unknown names map to the empty string.
inline std::string code(const std::string& name) {
    if (name == "red")    return color::RED;
    if (name == "green")  return color::GREEN;
    if (name == "yellow") return color::YELLOW;
    if (name == "blue")   return color::BLUE;
    if (name == "purple") return color::PURPLE;
    if (name == "cyan")   return color::CYAN;
    return "";
}

// Wrap text in a color and reset afterwards.
inline std::string in_color(const std::string& name, const std::string& text) {
    return code(name) + text + color::RESET;
}

// Shorthand wrappers
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }
inline std::string blue(const std::string& s)    { return color::BLUE + s + color::RESET; }

} // namespace ansi
