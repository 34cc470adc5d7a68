#include "bootstrap.hpp"
#include "ansi.hpp"
#include "profiler.hpp"
#include <auth/login.hpp>
#include <net/server_api.hpp>
#include <themes/theme_file.hpp>
#include <themes/theme_resolver.hpp>
#include <core/constants.hpp>
#include <core/settings.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <algorithm>
#include <fmt/format.h>

namespace fs = std::filesystem;

int exit_with_error(std::ostream& out, const std::string& message,
                    const std::string& helper, int code) {
    out << ansi::red(message) << "\n";
    if (!helper.empty()) {
        out << helper << "\n";
    }
    out.flush();
    return code;
}

Setting<std::string> layer_setting(const std::optional<std::string>& cli_value,
                                   const std::map<std::string, std::string>& zterm,
                                   const std::string& key,
                                   const std::string& fallback) {
    if (cli_value) return {*cli_value, Provenance::CommandLine};

    auto it = zterm.find(key);
    if (it != zterm.end()) return {it->second, Provenance::ConfigFile};

    return {fallback, Provenance::Default};
}

SessionBootstrap::SessionBootstrap(ServerApi& api, SessionFactory make_session,
                                   ThemeRegistry themes, BootstrapIO io)
    : api_(api), make_session_(std::move(make_session)),
      themes_(std::move(themes)), io_(std::move(io)) {}

int SessionBootstrap::fail(const std::string& message, const std::string& helper) {
    state_ = BootstrapState::Failed;
    zt_log("Bootstrap failed: " + message);
    return exit_with_error(io_.out, message, helper, 1);
}

int SessionBootstrap::run(const std::vector<std::string>& argv) {
    // ── ParseArguments ──────────────────────────────────
    state_ = BootstrapState::ParseArguments;
    auto parsed = parse_args(argv);
    if (parsed.is_err()) {
        state_ = BootstrapState::Failed;
        io_.err << usage_line() << "\n"
                << ZT_PROGRAM << ": error: " << parsed.error << "\n";
        io_.err.flush();
        return 2;
    }
    const Arguments& args = parsed.value;

    if (args.help) {
        io_.out << help_text();
        state_ = BootstrapState::Succeeded;
        return 0;
    }
    if (args.version) {
        io_.out << "Zulip Terminal " << ZT_VERSION << "\n";
        state_ = BootstrapState::Succeeded;
        return 0;
    }

    config_path_ = args.config_file ? fs::path(expand_user(*args.config_file))
                                    : CredentialStore::default_path();

    if (args.list_themes) {
        // User themes are listed too, when a readable zuliprc names a themes file.
        // No login is started here.
        auto loaded = CredentialStore::load(config_path_);
        if (loaded.is_ok() && !load_user_themes(loaded.value.zterm)) return 1;
        list_themes();
        state_ = BootstrapState::Succeeded;
        return 0;
    }

    if (args.debug) {
        enable_zt_log(API_CALL_LOG_FILENAME);
        io_.out << "NOTE: Debug mode enabled; API calls being logged to "
                << ansi::blue(API_CALL_LOG_FILENAME) << ".\n";
    }

    Profiler profiler(args.profile, PROFILE_FILENAME);
    profiler.mark("parse_arguments");

    // ── EnsureCredentials ───────────────────────────────
    state_ = BootstrapState::EnsureCredentials;
    if (!ensure_credentials()) return 1;
    profiler.mark("ensure_credentials");

    // ── ParseConfig ─────────────────────────────────────
    state_ = BootstrapState::ParseConfig;
    if (!resolve_settings(args)) return 1;
    profiler.mark("parse_config");

    // ── PrintDiagnostics ────────────────────────────────
    state_ = BootstrapState::PrintDiagnostics;
    print_diagnostics();
    profiler.mark("print_diagnostics");

    // ── StartSession ────────────────────────────────────
    state_ = BootstrapState::StartSession;
    return start_session(args, profiler);
}

void SessionBootstrap::list_themes() {
    auto classes = classify_themes(themes_);
    io_.out << "The following themes are available:\n";
    for (const auto& name : themes_.names()) {
        std::string suffix;
        if (name == DEFAULT_THEME) suffix += " (default)";
        if (std::find(classes.incomplete.begin(), classes.incomplete.end(), name)
                != classes.incomplete.end()) {
            suffix += " (incomplete)";
        }
        io_.out << "   " << name << suffix << "\n";
    }
    io_.out << "Specify theme with --theme <theme_name>\n";
}

// ── EnsureCredentials ───────────────────────────────────

bool SessionBootstrap::ensure_credentials() {
    auto loaded = CredentialStore::load(config_path_);

    if (loaded.is_err() && loaded.kind == ErrorKind::NotFound) {
        if (!run_login()) return false;
        loaded = CredentialStore::load(config_path_);
    }

    if (loaded.is_ok()) {
        stored_ = loaded.value;
        return true;
    }

    const std::string path = config_path_.string();
    switch (loaded.kind) {
        case ErrorKind::InsecurePermissions:
            fail(fmt::format(
                "ERROR: Please ensure your zuliprc is NOT publicly accessible:\n"
                "  {0}\n"
                "(it currently has permissions '{1}')\n"
                "This can often be achieved with a command such as:\n"
                "  chmod og-rwx {0}\n"
                "Consider regenerating the [api] part of your zuliprc to ensure "
                "your account is secure.",
                path, loaded.value.insecure_mode));
            return false;
        case ErrorKind::Malformed:
        case ErrorKind::NotFound:
        case ErrorKind::IoError:
        default:
            fail(fmt::format("Could not access zuliprc file at {}", path), loaded.error);
            return false;
    }
}

bool SessionBootstrap::run_login() {
    const std::string path = config_path_.string();

    io_.out << ansi::red("zuliprc file was not found at " + path) << "\n"
            << "Please enter your credentials to login into your Zulip organization.\n"
            << "\n"
            << "NOTE: The Zulip URL is where you would go in a web browser to log in to Zulip.\n"
            << "It often looks like one of the following:\n"
            << ansi::green("   your-org.zulipchat.com (Zulip cloud)") << "\n"
            << ansi::green("   zulip.your-org.com (self-hosted servers)") << "\n"
            << ansi::green("   chat.zulip.org (the Zulip community server)") << "\n";
    io_.out.flush();

    std::string entered = io_.read_line("Zulip URL: ");
    trim(entered);
    if (entered.empty()) {
        fail("No Zulip URL was entered.");
        return false;
    }
    std::string server_url = normalize_server_url(entered);
    zt_log("Logging in to " + server_url);

    auto login_id = prompt_login_id(api_, server_url, io_.read_line);
    if (login_id.is_err()) {
        fail(fmt::format("Error connecting to Zulip server: {}.", login_id.error));
        return false;
    }

    std::string password = io_.read_secret("Password: ");

    auto api_key = api_.fetch_api_key(server_url, login_id.value, password);
    if (api_key.is_err()) {
        switch (api_key.kind) {
            case ErrorKind::AuthenticationFailed:
                fail(api_key.error);
                break;
            case ErrorKind::ConnectionFailure:
            default:
                fail(fmt::format("Error connecting to Zulip server: {}.", api_key.error));
                break;
        }
        return false;
    }

    CredentialRecord record{login_id.value, api_key.value, server_url};
    auto created = CredentialStore::create(config_path_, record);
    if (created.is_err()) {
        // AlreadyExists, PermissionDenied, PathNotFound, IoError: text is final
        fail(created.error);
        return false;
    }

    io_.out << "Generated API key saved at " << path << "\n";
    return true;
}

// ── ParseConfig ─────────────────────────────────────────

bool SessionBootstrap::check_choice(const Setting<std::string>& setting, bool valid,
                                    const std::string& what,
                                    const std::vector<std::string>& options,
                                    const std::string& hint) {
    if (valid) return true;

    std::string helper = "The following options are available:\n";
    for (const auto& opt : options) helper += "   " + opt + "\n";
    helper += hint;
    fail(fmt::format("Invalid {} '{}' was specified {}.", what, setting.value,
                     provenance_text(setting.source)),
         helper);
    return false;
}

bool SessionBootstrap::load_user_themes(const std::map<std::string, std::string>& zterm) {
    auto themes_file = zterm.find("themes-file");
    if (themes_file == zterm.end()) return true;

    auto added = load_theme_file(expand_user(themes_file->second), themes_);
    if (added.is_err()) {
        fail(fmt::format("Could not load themes file {}", themes_file->second), added.error);
        return false;
    }
    return true;
}

bool SessionBootstrap::resolve_settings(const Arguments& args) {
    const auto& zterm = stored_.zterm;
    if (!load_user_themes(zterm)) return false;

    auto theme = layer_setting(args.theme, zterm, "theme", DEFAULT_THEME);
    if (!themes_.contains(theme.value)) {
        std::string helper = "The following themes are available:\n";
        for (const auto& name : themes_.names()) helper += "   " + name + "\n";
        helper += "Specify theme in zuliprc file or override using -t/--theme "
                  "options on command line.";
        fail(fmt::format("Invalid theme '{}' was specified {}.", theme.value,
                         provenance_text(theme.source)),
             helper);
        return false;
    }

    auto autohide = layer_setting(args.autohide, zterm, "autohide", DEFAULT_AUTOHIDE);
    auto autohide_value = parse_autohide(autohide.value);
    if (!check_choice(autohide, autohide_value.has_value(), "autohide setting",
                      autohide_options(), "Specify the autohide option in zuliprc file.")) {
        return false;
    }

    auto footlinks = layer_setting(std::nullopt, zterm, "footlinks", DEFAULT_FOOTLINKS);
    auto footlinks_value = parse_footlinks(footlinks.value);
    if (!check_choice(footlinks, footlinks_value.has_value(), "footlinks setting",
                      footlinks_options(), "Specify the footlinks option in zuliprc file.")) {
        return false;
    }

    auto depth = layer_setting(args.color_depth, zterm, "color-depth", DEFAULT_COLOR_DEPTH);
    auto depth_value = parse_color_depth(depth.value);
    if (!check_choice(depth, depth_value.has_value(), "color depth setting",
                      color_depth_options(),
                      "Specify the color depth in zuliprc file or override using "
                      "--color-depth on command line.")) {
        return false;
    }

    auto choice = resolve_theme(theme.value, theme.source, themes_);

    ResolvedSettings settings;
    settings.theme = {choice.theme, theme.source};
    settings.theme_warnings = choice.warnings;
    settings.autohide = {*autohide_value, autohide.source};
    settings.footlinks = {*footlinks_value, footlinks.source};
    settings.color_depth = {*depth_value, depth.source};
    settings_ = settings;
    return true;
}

// ── PrintDiagnostics ────────────────────────────────────

void SessionBootstrap::print_diagnostics() {
    const auto& s = *settings_;
    auto& out = io_.out;

    out << "Loading with:\n";
    out << fmt::format("   theme '{}' specified {}.\n",
                       s.theme.value, provenance_text(s.theme.source));
    for (const auto& warning : s.theme_warnings) {
        out << ansi::yellow(warning) << "\n";
    }
    out << fmt::format("   autohide setting '{}' specified {}.\n",
                       to_string(s.autohide.value), provenance_text(s.autohide.source));
    out << fmt::format("   footlinks setting '{}' specified {}.\n",
                       to_string(s.footlinks.value), provenance_text(s.footlinks.source));
    out << fmt::format("   color depth setting '{}' specified {}.\n",
                       to_string(s.color_depth.value), provenance_text(s.color_depth.source));
    out.flush();
}

// ── StartSession ────────────────────────────────────────

int SessionBootstrap::start_session(const Arguments& args, Profiler& profiler) {
    SessionOptions options;
    options.credentials = stored_.credentials;
    options.settings = *settings_;
    options.config_path = config_path_;
    options.explore = args.explore;
    options.debug = args.debug;

    std::unique_ptr<ChatSession> session;
    try {
        session = make_session_(options);
    } catch (const ServerConnectionFailure& e) {
        return fail(fmt::format("\nError connecting to Zulip server: {}.", e.what()));
    }
    profiler.mark("connect");

    // Control belongs to the session from here on
    state_ = BootstrapState::Succeeded;
    session->run();
    profiler.mark("session");
    return 0;
}
