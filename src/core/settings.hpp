#pragma once

#include <string>
#include <vector>
#include <optional>
#include "types.hpp"

// Text used in "specified {}" diagnostics.
const char* provenance_text(Provenance p);

std::string to_string(Autohide v);
std::string to_string(Footlinks v);
std::string to_string(ColorDepth v);

// Parse the textual forms accepted in the zuliprc and on the command line.
std::optional<Autohide> parse_autohide(const std::string& s);
std::optional<Footlinks> parse_footlinks(const std::string& s);
std::optional<ColorDepth> parse_color_depth(const std::string& s);

// Accepted spellings, in the order they are listed to the user.
const std::vector<std::string>& autohide_options();
const std::vector<std::string>& footlinks_options();
const std::vector<std::string>& color_depth_options();
