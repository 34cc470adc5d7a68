#include "theme_resolver.hpp"
#include <core/settings.hpp>
#include <core/log.hpp>
#include <algorithm>
#include <set>
#include <fmt/format.h>
#include <fmt/ranges.h>

constexpr size_t MAX_THEME_SUGGESTIONS = 2;

ThemeClassification classify_themes(const ThemeRegistry& registry) {
    const auto& required = required_styles();
    ThemeClassification result;

    for (const auto& [name, styles] : registry) {
        std::set<std::string> defined;
        for (const auto& s : styles) defined.insert(s.key);

        bool complete = std::all_of(required.begin(), required.end(),
            [&](const std::string& key) { return defined.count(key) > 0; });
        (complete ? result.complete : result.incomplete).push_back(name);
    }
    return result;
}

ThemeChoice resolve_theme(const std::string& requested,
                          Provenance provenance,
                          const ThemeRegistry& registry) {
    ThemeChoice choice;
    choice.theme = requested;

    auto classes = classify_themes(registry);
    bool incomplete = std::find(classes.incomplete.begin(), classes.incomplete.end(),
                                requested) != classes.incomplete.end();
    if (!incomplete) return choice;

    zt_log(fmt::format("Theme '{}' ({}) is incomplete", requested,
                       provenance_text(provenance)));

    std::string warning = "   WARNING: Incomplete theme; results may vary!";
    if (!classes.complete.empty()) {
        size_t n = std::min(classes.complete.size(), MAX_THEME_SUGGESTIONS);
        std::vector<std::string> suggestions(classes.complete.begin(),
                                             classes.complete.begin() + n);
        warning += fmt::format("\n      (you could try: {})", fmt::join(suggestions, ", "));
    }
    choice.warnings.push_back(warning);
    return choice;
}
