#include "theme_registry.hpp"
#include <algorithm>

void ThemeRegistry::add(const std::string& name, ThemeStyles styles) {
    auto it = std::find_if(themes_.begin(), themes_.end(),
                           [&](const auto& t) { return t.first == name; });
    if (it != themes_.end()) {
        it->second = std::move(styles);
    } else {
        themes_.emplace_back(name, std::move(styles));
    }
}

bool ThemeRegistry::contains(const std::string& name) const {
    return find(name) != nullptr;
}

const ThemeStyles* ThemeRegistry::find(const std::string& name) const {
    for (const auto& t : themes_) {
        if (t.first == name) return &t.second;
    }
    return nullptr;
}

std::vector<std::string> ThemeRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(themes_.size());
    for (const auto& t : themes_) out.push_back(t.first);
    return out;
}

const std::vector<std::string>& required_styles() {
    static const std::vector<std::string> keys = {
        "default", "selected", "msg_selected", "header", "custom", "content",
        "name", "unread", "active", "idle", "offline", "inactive", "title",
        "time", "bar", "help", "emoji", "span", "link", "blockquote", "code",
        "bold", "footer", "starred", "category", "popup_border",
        "area:help", "area:msg", "area:stream", "area:error",
        "task:success", "task:error", "task:warning",
    };
    return keys;
}

// ── Built-in palettes ───────────────────────────────────────
// Colors are urwid names; "foreground, attr" pairs are comma-joined.

static ThemeStyles zt_dark() {
    return {
        {"default",      "",                      ""},
        {"selected",     "white",                 "dark blue"},
        {"msg_selected", "light green",           "black"},
        {"header",       "dark cyan",             "dark blue"},
        {"custom",       "white",                 "dark blue"},
        {"content",      "white",                 "black"},
        {"name",         "yellow, bold",          "black"},
        {"unread",       "dark blue",             "black"},
        {"active",       "light green",           "black"},
        {"idle",         "yellow",                "black"},
        {"offline",      "white",                 "black"},
        {"inactive",     "white",                 "black"},
        {"title",        "white, bold",           "black"},
        {"time",         "light blue",            "black"},
        {"bar",          "white",                 "dark gray"},
        {"help",         "white",                 "dark gray"},
        {"emoji",        "light magenta",         "black"},
        {"span",         "light red, bold",       "black"},
        {"link",         "light blue",            "black"},
        {"blockquote",   "brown",                 "black"},
        {"code",         "black",                 "white"},
        {"bold",         "white, bold",           "black"},
        {"footer",       "black",                 "light gray"},
        {"starred",      "light red, bold",       "black"},
        {"category",     "light blue, bold",      "black"},
        {"popup_border", "white",                 "black"},
        {"area:help",    "white",                 "dark green"},
        {"area:msg",     "white",                 "brown"},
        {"area:stream",  "white",                 "dark cyan"},
        {"area:error",   "white",                 "dark red"},
        {"task:success", "white",                 "dark green"},
        {"task:error",   "white",                 "dark red"},
        {"task:warning", "white",                 "brown"},
    };
}

static ThemeStyles gruvbox() {
    return {
        {"default",      "#ebdbb2",               "#282828"},
        {"selected",     "#282828",               "#ebdbb2"},
        {"msg_selected", "#282828",               "#ebdbb2"},
        {"header",       "#458588",               "#282828"},
        {"custom",       "#282828",               "#458588"},
        {"content",      "#ebdbb2",               "#282828"},
        {"name",         "#fabd2f",               "#282828"},
        {"unread",       "#b16286",               "#282828"},
        {"active",       "#b8bb26",               "#282828"},
        {"idle",         "#d79921",               "#282828"},
        {"offline",      "#ebdbb2",               "#282828"},
        {"inactive",     "#ebdbb2",               "#282828"},
        {"title",        "#ebdbb2, bold",         "#282828"},
        {"time",         "#83a598",               "#282828"},
        {"bar",          "#ebdbb2",               "#928374"},
        {"help",         "#282828",               "#ebdbb2"},
        {"emoji",        "#d3869b",               "#282828"},
        {"span",         "#fb4934",               "#282828"},
        {"link",         "#83a598",               "#282828"},
        {"blockquote",   "#d79921",               "#282828"},
        {"code",         "#282828",               "#ebdbb2"},
        {"bold",         "#ebdbb2, bold",         "#282828"},
        {"footer",       "#282828",               "#ebdbb2"},
        {"starred",      "#fb4934, bold",         "#282828"},
        {"category",     "#83a598, bold",         "#282828"},
        {"popup_border", "#ebdbb2",               "#282828"},
        {"area:help",    "#282828",               "#b8bb26"},
        {"area:msg",     "#282828",               "#d79921"},
        {"area:stream",  "#282828",               "#458588"},
        {"area:error",   "#282828",               "#fb4934"},
        {"task:success", "#282828",               "#b8bb26"},
        {"task:error",   "#282828",               "#fb4934"},
        {"task:warning", "#282828",               "#d79921"},
    };
}

static ThemeStyles zt_light() {
    return {
        {"default",      "",                      ""},
        {"selected",     "white",                 "dark blue"},
        {"msg_selected", "dark blue",             "light gray"},
        {"header",       "white",                 "dark blue"},
        {"custom",       "white",                 "dark blue"},
        {"content",      "black",                 "white"},
        {"name",         "dark green",            "white"},
        {"unread",       "dark gray",             "light gray"},
        {"active",       "dark green",            "white"},
        {"idle",         "dark blue",             "white"},
        {"offline",      "black",                 "white"},
        {"inactive",     "black",                 "white"},
        {"title",        "white, bold",           "dark gray"},
        {"time",         "dark blue",             "white"},
        {"bar",          "white",                 "dark gray"},
        {"help",         "white",                 "dark gray"},
        {"emoji",        "dark magenta",          "white"},
        {"span",         "dark red, bold",        "white"},
        {"link",         "dark blue",             "white"},
        {"blockquote",   "brown",                 "white"},
        {"code",         "white",                 "black"},
        {"bold",         "black, bold",           "white"},
        {"footer",       "white",                 "dark gray"},
        {"starred",      "dark red, bold",        "white"},
        {"category",     "dark gray, bold",       "light gray"},
        {"popup_border", "black",                 "white"},
        {"area:help",    "black",                 "light green"},
        {"area:msg",     "black",                 "yellow"},
        {"area:stream",  "black",                 "light blue"},
        {"area:error",   "black",                 "light red"},
        {"task:success", "black",                 "light green"},
        {"task:error",   "black",                 "light red"},
        {"task:warning", "black",                 "yellow"},
    };
}

static ThemeStyles zt_blue() {
    return {
        {"default",      "black",                 "light blue"},
        {"selected",     "black",                 "light gray"},
        {"msg_selected", "black",                 "light gray"},
        {"header",       "black",                 "dark blue"},
        {"custom",       "white",                 "dark blue"},
        {"content",      "black",                 "light blue"},
        {"name",         "dark red",              "light blue"},
        {"unread",       "light gray",            "light blue"},
        {"active",       "light green, bold",     "light blue"},
        {"idle",         "yellow",                "light blue"},
        {"offline",      "white",                 "light blue"},
        {"inactive",     "white",                 "light blue"},
        {"title",        "white, bold",           "dark blue"},
        {"time",         "dark blue",             "light blue"},
        {"bar",          "white",                 "dark blue"},
        {"help",         "white",                 "dark gray"},
        {"emoji",        "dark magenta",          "light blue"},
        {"span",         "dark red, bold",        "light blue"},
        {"link",         "dark blue",             "light gray"},
        {"blockquote",   "gray",                  "light blue"},
        {"code",         "dark gray",             "white"},
        {"bold",         "white, bold",           "dark blue"},
        {"footer",       "white",                 "dark red"},
        {"starred",      "light red, bold",       "dark blue"},
        {"category",     "light gray, bold",      "dark blue"},
        {"popup_border", "white",                 "dark blue"},
        {"area:help",    "white",                 "dark green"},
        {"area:msg",     "white",                 "brown"},
        {"area:stream",  "white",                 "dark cyan"},
        {"area:error",   "white",                 "dark red"},
        {"task:success", "white",                 "dark green"},
        {"task:error",   "white",                 "dark red"},
        {"task:warning", "white",                 "brown"},
    };
}

ThemeRegistry builtin_themes() {
    ThemeRegistry registry;
    registry.add("zt_dark", zt_dark());
    registry.add("gruvbox", gruvbox());
    registry.add("zt_light", zt_light());
    registry.add("zt_blue", zt_blue());
    return registry;
}
