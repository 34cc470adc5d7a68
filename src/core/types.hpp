#pragma once

#include <string>
#include <vector>
#include <functional>

// Failure categories carried by Result. Callers switch over these.
enum class ErrorKind {
    None,
    ParseError,
    NotFound,
    InsecurePermissions,
    AlreadyExists,
    PermissionDenied,
    PathNotFound,
    IoError,
    Malformed,
    ConnectionFailure,
    AuthenticationFailed,
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// One stored identity from the [api] section of a zuliprc
struct CredentialRecord {
    std::string login_id;
    std::string api_key;
    std::string server_url;
};

// Login-related flags advertised by /api/v1/server_settings.
// Missing fields in the response are treated as false.
struct ServerCapabilities {
    bool email_auth_enabled = false;
    bool require_email_format_usernames = false;
};

// ── Presentation settings ───────────────────────────────

enum class Provenance {
    Default,
    ConfigFile,
    CommandLine,
};

enum class Autohide { Autohide, NoAutohide };
enum class Footlinks { Enabled, Disabled };
enum class ColorDepth { Mono, Colors16, Colors256, TrueColor };

template <typename T>
struct Setting {
    T value;
    Provenance source = Provenance::Default;
};

struct ResolvedSettings {
    Setting<std::string> theme;
    std::vector<std::string> theme_warnings;
    Setting<Autohide> autohide;
    Setting<Footlinks> footlinks;
    Setting<ColorDepth> color_depth;
};

// Blocking line prompt: takes the label, returns what the user typed.
using PromptFn = std::function<std::string(const std::string&)>;
