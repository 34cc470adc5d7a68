#include "theme_file.hpp"
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

static Result<StyleSpec> parse_style(const std::string& key, const YAML::Node& node) {
    StyleSpec spec;
    spec.key = key;

    if (node.IsScalar()) {
        spec.foreground = node.as<std::string>("");
    } else if (node.IsSequence() && node.size() >= 1 && node.size() <= 2) {
        spec.foreground = node[0].as<std::string>("");
        if (node.size() == 2) spec.background = node[1].as<std::string>("");
    } else if (node.IsNull()) {
        // "key:" with no value still defines the key
    } else {
        return Result<StyleSpec>::Err(ErrorKind::Malformed,
            fmt::format("style '{}' must be a color or [foreground, background]", key));
    }
    return Result<StyleSpec>::Ok(spec);
}

Result<std::vector<std::string>> load_theme_file(const fs::path& path,
                                                 ThemeRegistry& registry) {
    if (!fs::exists(path)) {
        return Result<std::vector<std::string>>::Err(ErrorKind::NotFound,
            fmt::format("themes file not found at {}", path.string()));
    }

    std::vector<std::pair<std::string, ThemeStyles>> loaded;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            return Result<std::vector<std::string>>::Err(ErrorKind::Malformed,
                "top level of a themes file must map theme names to styles");
        }

        for (const auto& theme_kv : root) {
            std::string name = theme_kv.first.as<std::string>();
            if (!theme_kv.second.IsMap()) {
                return Result<std::vector<std::string>>::Err(ErrorKind::Malformed,
                    fmt::format("theme '{}' must map style keys to colors", name));
            }

            ThemeStyles styles;
            for (const auto& style_kv : theme_kv.second) {
                auto spec = parse_style(style_kv.first.as<std::string>(), style_kv.second);
                if (spec.is_err()) {
                    return Result<std::vector<std::string>>::Err(spec.kind,
                        fmt::format("theme '{}': {}", name, spec.error));
                }
                styles.push_back(spec.value);
            }
            loaded.emplace_back(name, std::move(styles));
        }
    } catch (const YAML::Exception& e) {
        return Result<std::vector<std::string>>::Err(ErrorKind::Malformed,
            std::string("Failed to parse themes file: ") + e.what());
    }

    // Only touch the registry once the whole file parsed
    std::vector<std::string> names;
    for (auto& [name, styles] : loaded) {
        zt_log(fmt::format("Registering theme '{}' ({} styles) from {}",
                           name, styles.size(), path.string()));
        registry.add(name, std::move(styles));
        names.push_back(name);
    }
    return Result<std::vector<std::string>>::Ok(names);
}
