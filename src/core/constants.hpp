#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* ZT_VERSION = "0.5.2";
constexpr const char* ZT_PROGRAM = "zulip-term";

// ── Files ───────────────────────────────────────────────────
constexpr const char* ZULIPRC_FILENAME       = "zuliprc";
constexpr const char* API_CALL_LOG_FILENAME  = "zulip-terminal-API-requests.log";
constexpr const char* PROFILE_FILENAME       = "zulip-terminal.prof";

// Owner read/write only. Anything in 077 is a violation.
constexpr unsigned ZULIPRC_MODE              = 0600;
constexpr unsigned GROUP_OTHER_MASK          = 0077;

// ── Remote endpoints (appended to the server URL) ───────────
constexpr const char* SERVER_SETTINGS_PATH   = "/api/v1/server_settings";
constexpr const char* FETCH_API_KEY_PATH     = "/api/v1/fetch_api_key";
constexpr const char* OWN_USER_PATH          = "/api/v1/users/me";

// ── Timeouts ────────────────────────────────────────────────
constexpr long HTTP_TIMEOUT_SECS             = 30;
constexpr long HTTP_CONNECT_TIMEOUT_SECS     = 10;

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_THEME          = "zt_dark";
constexpr const char* DEFAULT_AUTOHIDE       = "no_autohide";
constexpr const char* DEFAULT_FOOTLINKS      = "enabled";
constexpr const char* DEFAULT_COLOR_DEPTH    = "256";

constexpr const char* BUG_REPORT_URL = "https://github.com/zulip/zulip-terminal/issues";
