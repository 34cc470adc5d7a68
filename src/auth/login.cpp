#include "login.hpp"
#include <net/server_api.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

std::string resolve_login_label(const ServerCapabilities& caps) {
    if (caps.require_email_format_usernames) return "Email";
    if (caps.email_auth_enabled) return "Email or Username";
    return "Username";
}

Result<std::string> prompt_login_id(ServerApi& api,
                                    const std::string& server_url,
                                    const PromptFn& prompt) {
    auto caps = api.server_settings(server_url);
    if (caps.is_err()) {
        zt_log(fmt::format("server_settings for {} failed: {}", server_url, caps.error));
        return Result<std::string>::Err(ErrorKind::ConnectionFailure, caps.error);
    }

    std::string label = resolve_login_label(caps.value);
    return Result<std::string>::Ok(prompt(label + ": "));
}
