#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "theme_registry.hpp"

// Register user themes from a YAML file:
//
//   my_theme:
//     selected: [white, dark blue]     # [foreground, background]
//     content: white                   # foreground only
//
// Themes are added after the existing ones (a built-in of the same name is
// replaced in place). Returns the names registered.
// Errors: NotFound, Malformed.
Result<std::vector<std::string>> load_theme_file(const std::filesystem::path& path,
                                                 ThemeRegistry& registry);
