#pragma once

#include <string>
#include <vector>
#include <utility>

struct StyleSpec {
    std::string key;
    std::string foreground;
    std::string background;
};

using ThemeStyles = std::vector<StyleSpec>;

// Named themes in insertion order. Built once at startup (built-ins plus any
// user themes) and only read afterwards.
class ThemeRegistry {
public:
    // Adds a theme, or replaces the styles of an existing one in place
    // (keeping its position).
    void add(const std::string& name, ThemeStyles styles);

    bool contains(const std::string& name) const;
    const ThemeStyles* find(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const { return themes_.size(); }

    auto begin() const { return themes_.begin(); }
    auto end() const { return themes_.end(); }

private:
    std::vector<std::pair<std::string, ThemeStyles>> themes_;
};

// Style keys the renderer looks up. A theme defining all of them is complete.
const std::vector<std::string>& required_styles();

// zt_dark, gruvbox, zt_light, zt_blue
ThemeRegistry builtin_themes();
