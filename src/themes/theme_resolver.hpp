#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "theme_registry.hpp"

struct ThemeClassification {
    std::vector<std::string> complete;    // registry order
    std::vector<std::string> incomplete;  // registry order
};

// Partition the registry by required-style coverage. Recomputed each call.
ThemeClassification classify_themes(const ThemeRegistry& registry);

struct ThemeChoice {
    std::string theme;
    std::vector<std::string> warnings;
};

// The requested theme is always the one chosen. An incomplete theme gets a
// warning suggesting up to two complete themes, in registry order.
ThemeChoice resolve_theme(const std::string& requested,
                          Provenance provenance,
                          const ThemeRegistry& registry);
