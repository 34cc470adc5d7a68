#pragma once

#include <string>
#include <core/types.hpp>

class ServerApi;

// Which identifier the server lets users log in with:
//   require_email_format_usernames        -> "Email"
//   otherwise email_auth_enabled          -> "Email or Username"
//   otherwise                             -> "Username"
std::string resolve_login_label(const ServerCapabilities& caps);

// Fetch the server's capabilities, then ask for the identifier once with a
// "{label}: " prompt. A failed capability fetch is returned as-is
// (ConnectionFailure); nothing is retried.
Result<std::string> prompt_login_id(ServerApi& api,
                                    const std::string& server_url,
                                    const PromptFn& prompt);
