#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

struct Arguments {
    std::optional<std::string> theme;
    std::optional<std::string> config_file;
    std::optional<std::string> color_depth;
    std::optional<std::string> autohide;    // "autohide" or "no_autohide"
    bool list_themes = false;
    bool debug = false;
    bool profile = false;
    bool explore = false;
    bool version = false;
    bool help = false;
};

// Parse argv (without the program name). Failures are ErrorKind::ParseError
// with an argparse-style message, e.g.
//   "argument --no-autohide: not allowed with argument --autohide"
Result<Arguments> parse_args(const std::vector<std::string>& args);

std::string usage_line();
std::string help_text();
