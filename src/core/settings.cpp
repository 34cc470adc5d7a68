#include "settings.hpp"

const char* provenance_text(Provenance p) {
    switch (p) {
        case Provenance::CommandLine: return "on command line";
        case Provenance::ConfigFile:  return "in config file";
        case Provenance::Default:     return "with no config";
    }
    return "with no config";
}

std::string to_string(Autohide v) {
    return v == Autohide::Autohide ? "autohide" : "no_autohide";
}

std::string to_string(Footlinks v) {
    return v == Footlinks::Enabled ? "enabled" : "disabled";
}

std::string to_string(ColorDepth v) {
    switch (v) {
        case ColorDepth::Mono:      return "1";
        case ColorDepth::Colors16:  return "16";
        case ColorDepth::Colors256: return "256";
        case ColorDepth::TrueColor: return "24bit";
    }
    return "256";
}

std::optional<Autohide> parse_autohide(const std::string& s) {
    if (s == "autohide") return Autohide::Autohide;
    if (s == "no_autohide") return Autohide::NoAutohide;
    return std::nullopt;
}

std::optional<Footlinks> parse_footlinks(const std::string& s) {
    if (s == "enabled") return Footlinks::Enabled;
    if (s == "disabled") return Footlinks::Disabled;
    return std::nullopt;
}

std::optional<ColorDepth> parse_color_depth(const std::string& s) {
    if (s == "1") return ColorDepth::Mono;
    if (s == "16") return ColorDepth::Colors16;
    if (s == "256") return ColorDepth::Colors256;
    if (s == "24bit") return ColorDepth::TrueColor;
    return std::nullopt;
}

const std::vector<std::string>& autohide_options() {
    static const std::vector<std::string> opts = {"autohide", "no_autohide"};
    return opts;
}

const std::vector<std::string>& footlinks_options() {
    static const std::vector<std::string> opts = {"enabled", "disabled"};
    return opts;
}

const std::vector<std::string>& color_depth_options() {
    static const std::vector<std::string> opts = {"1", "16", "256", "24bit"};
    return opts;
}
