#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <ostream>
#include <filesystem>
#include <core/types.hpp>
#include <core/credentials.hpp>
#include <themes/theme_registry.hpp>
#include <session/session.hpp>
#include "arguments.hpp"

class ServerApi;
class Profiler;

// Linear; each step either advances or moves to Failed.
enum class BootstrapState {
    ParseArguments,
    EnsureCredentials,
    ParseConfig,
    PrintDiagnostics,
    StartSession,
    Succeeded,
    Failed,
};

// Terminal I/O the bootstrap talks through. Diagnostics go to `out`;
// only argument-parse errors go to `err`.
struct BootstrapIO {
    std::ostream& out;
    std::ostream& err;
    PromptFn read_line;
    PromptFn read_secret;
};

// Print `message` in red, then `helper` (if any) uncolored.
// Returns `code` so callers can `return exit_with_error(...)`.
int exit_with_error(std::ostream& out, const std::string& message,
                    const std::string& helper = "", int code = 1);

// One setting through the layers: default < config file < command line.
Setting<std::string> layer_setting(const std::optional<std::string>& cli_value,
                                   const std::map<std::string, std::string>& zterm,
                                   const std::string& key,
                                   const std::string& fallback);

class SessionBootstrap {
public:
    SessionBootstrap(ServerApi& api, SessionFactory make_session,
                     ThemeRegistry themes, BootstrapIO io);

    // Run to Succeeded or Failed. Returns the process exit code:
    // 0 success / --help / --version / --list-themes, 1 bootstrap failure,
    // 2 argument error.
    int run(const std::vector<std::string>& args);

    BootstrapState state() const { return state_; }
    const std::optional<ResolvedSettings>& settings() const { return settings_; }
    const std::filesystem::path& config_path() const { return config_path_; }

private:
    int fail(const std::string& message, const std::string& helper = "");

    void list_themes();
    bool ensure_credentials();
    bool run_login();
    bool load_user_themes(const std::map<std::string, std::string>& zterm);
    bool resolve_settings(const Arguments& args);
    bool check_choice(const Setting<std::string>& setting, bool valid,
                      const std::string& what, const std::vector<std::string>& options,
                      const std::string& hint);
    void print_diagnostics();
    int start_session(const Arguments& args, Profiler& profiler);

    ServerApi& api_;
    SessionFactory make_session_;
    ThemeRegistry themes_;
    BootstrapIO io_;

    BootstrapState state_ = BootstrapState::ParseArguments;
    std::filesystem::path config_path_;
    StoredConfig stored_;
    std::optional<ResolvedSettings> settings_;
};
