#include "arguments.hpp"
#include <core/constants.hpp>
#include <core/settings.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace {

enum class Opt {
    Help, Version, ConfigFile, Theme, ListThemes, ColorDepth,
    Explore, Autohide, NoAutohide, Debug, Profile,
};

struct OptionDef {
    Opt id;
    char short_flag;            // '\0' when there is none
    const char* long_flag;
    bool takes_value;
    const char* display;        // as named in error messages
};

const std::vector<OptionDef>& option_table() {
    static const std::vector<OptionDef> table = {
        {Opt::Help,        'h',  "--help",        false, "-h/--help"},
        {Opt::Version,     'v',  "--version",     false, "-v/--version"},
        {Opt::ConfigFile,  'c',  "--config-file", true,  "--config-file/-c"},
        {Opt::Theme,       't',  "--theme",       true,  "--theme/-t"},
        {Opt::ListThemes,  '\0', "--list-themes", false, "--list-themes"},
        {Opt::ColorDepth,  '\0', "--color-depth", true,  "--color-depth"},
        {Opt::Explore,     'e',  "--explore",     false, "-e/--explore"},
        {Opt::Autohide,    '\0', "--autohide",    false, "--autohide"},
        {Opt::NoAutohide,  '\0', "--no-autohide", false, "--no-autohide"},
        {Opt::Debug,       'd',  "--debug",       false, "-d/--debug"},
        {Opt::Profile,     '\0', "--profile",     false, "--profile"},
    };
    return table;
}

const OptionDef* find_short(char c) {
    for (const auto& def : option_table()) {
        if (def.short_flag == c) return &def;
    }
    return nullptr;
}

// Exact long name, else a unique prefix of one. Ambiguity is a ParseError.
Result<const OptionDef*> find_long(const std::string& name) {
    std::vector<const OptionDef*> matches;
    for (const auto& def : option_table()) {
        if (name == def.long_flag) return Result<const OptionDef*>::Ok(&def);
        if (std::string(def.long_flag).rfind(name, 0) == 0) matches.push_back(&def);
    }
    if (matches.size() > 1) {
        std::vector<std::string> names;
        for (const auto* def : matches) names.push_back(def->long_flag);
        return Result<const OptionDef*>::Err(ErrorKind::ParseError,
            fmt::format("ambiguous option: {} could match {}", name, fmt::join(names, ", ")));
    }
    return Result<const OptionDef*>::Ok(matches.empty() ? nullptr : matches.front());
}

bool looks_like_option(const std::string& s) {
    return s.size() > 1 && s[0] == '-';
}

} // namespace

Result<Arguments> parse_args(const std::vector<std::string>& args) {
    Arguments out;
    std::vector<std::string> unrecognized;
    const OptionDef* autohide_flag = nullptr;  // first of --autohide/--no-autohide seen
    size_t i = 0;

    // Apply one option. `attached` is a value given in the same argument
    // ("--theme=x", "-tx"); otherwise valued options take the next argument.
    auto apply = [&](const OptionDef& def,
                     const std::optional<std::string>& attached) -> Result<void> {
        if (!def.takes_value && attached) {
            return Result<void>::Err(ErrorKind::ParseError,
                fmt::format("argument {}: ignored explicit argument '{}'",
                            def.display, *attached));
        }

        std::string value;
        if (def.takes_value) {
            if (attached) {
                value = *attached;
            } else if (i + 1 >= args.size() || looks_like_option(args[i + 1])) {
                return Result<void>::Err(ErrorKind::ParseError,
                    fmt::format("argument {}: expected one argument", def.display));
            } else {
                value = args[++i];
            }
        }

        switch (def.id) {
            case Opt::Help:        out.help = true; break;
            case Opt::Version:     out.version = true; break;
            case Opt::ConfigFile:  out.config_file = value; break;
            case Opt::Theme:       out.theme = value; break;
            case Opt::ListThemes:  out.list_themes = true; break;
            case Opt::Explore:     out.explore = true; break;
            case Opt::Debug:       out.debug = true; break;
            case Opt::Profile:     out.profile = true; break;
            case Opt::ColorDepth: {
                if (!parse_color_depth(value)) {
                    std::vector<std::string> quoted;
                    for (const auto& c : color_depth_options()) quoted.push_back("'" + c + "'");
                    return Result<void>::Err(ErrorKind::ParseError,
                        fmt::format("argument --color-depth: invalid choice: '{}' (choose from {})",
                                    value, fmt::join(quoted, ", ")));
                }
                out.color_depth = value;
                break;
            }
            case Opt::Autohide:
            case Opt::NoAutohide: {
                if (autohide_flag && autohide_flag->id != def.id) {
                    return Result<void>::Err(ErrorKind::ParseError,
                        fmt::format("argument {}: not allowed with argument {}",
                                    def.display, autohide_flag->display));
                }
                autohide_flag = &def;
                out.autohide = (def.id == Opt::Autohide) ? "autohide" : "no_autohide";
                break;
            }
        }
        return Result<void>::Ok();
    };

    for (; i < args.size(); i++) {
        const std::string& arg = args[i];
        Result<void> applied = Result<void>::Ok();

        if (arg.size() > 2 && arg.rfind("--", 0) == 0) {
            // --name, --name=value, or an unambiguous prefix of either
            auto eq = arg.find('=');
            std::string name = arg.substr(0, eq);
            std::optional<std::string> attached;
            if (eq != std::string::npos) attached = arg.substr(eq + 1);

            auto def = find_long(name);
            if (def.is_err()) return Result<Arguments>::Err(def.kind, def.error);
            if (!def.value) {
                unrecognized.push_back(arg);
                continue;
            }
            applied = apply(*def.value, attached);
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-') {
            // Short flags, possibly clustered: -de, -dtgruvbox, -c/path
            const OptionDef* prev = nullptr;
            for (size_t j = 1; j < arg.size() && applied.is_ok(); j++) {
                const OptionDef* def = find_short(arg[j]);
                if (!def) {
                    if (!prev) {
                        unrecognized.push_back(arg);
                    } else {
                        applied = Result<void>::Err(ErrorKind::ParseError,
                            fmt::format("argument {}: ignored explicit argument '{}'",
                                        prev->display, arg.substr(j)));
                    }
                    break;
                }
                if (def->takes_value) {
                    std::optional<std::string> attached;
                    if (j + 1 < arg.size()) attached = arg.substr(j + 1);
                    applied = apply(*def, attached);
                    break;
                }
                applied = apply(*def, std::nullopt);
                prev = def;
            }
        } else {
            unrecognized.push_back(arg);
            continue;
        }

        if (applied.is_err()) return Result<Arguments>::Err(applied.kind, applied.error);

        // Help wins over anything not yet parsed, including stray arguments
        if (out.help) return Result<Arguments>::Ok(out);
    }

    if (!unrecognized.empty()) {
        return Result<Arguments>::Err(ErrorKind::ParseError,
            fmt::format("unrecognized arguments: {}", fmt::join(unrecognized, " ")));
    }
    return Result<Arguments>::Ok(out);
}

std::string usage_line() {
    return fmt::format(
        "usage: {} [-h] [-v] [--config-file CONFIG_FILE] [--theme THEME]\n"
        "       [--list-themes] [--color-depth {{1,16,256,24bit}}] [-e]\n"
        "       [--autohide | --no-autohide] [-d] [--profile]",
        ZT_PROGRAM);
}

std::string help_text() {
    return usage_line() + "\n\n"
        "Starts Zulip-Terminal.\n\n"
        "optional arguments:\n"
        "  -h, --help            show this help message and exit\n"
        "  -v, --version         Print zulip-terminal version and exit\n"
        "  --config-file CONFIG_FILE, -c CONFIG_FILE\n"
        "                        config file downloaded from your zulip\n"
        "                        organization (default: ~/zuliprc)\n"
        "  --theme THEME, -t THEME\n"
        "                        choose color theme (default: zt_dark)\n"
        "  --list-themes         list all the color themes\n"
        "  --color-depth {1,16,256,24bit}\n"
        "                        Force the color depth (default 256)\n"
        "  -e, --explore         do not mark messages as read in the session\n"
        "  --autohide            autohide list of users and streams\n"
        "  --no-autohide         don't autohide list of users and streams\n"
        "  -d, --debug           Start zulip terminal in debug mode.\n"
        "  --profile             Profile runtime.\n";
}
