#include "server_api.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

// Response bodies are JSON, which yaml-cpp reads as flow-style YAML.
static Result<YAML::Node> parse_body(const std::string& body) {
    try {
        YAML::Node root = YAML::Load(body);
        if (!root.IsMap()) {
            return Result<YAML::Node>::Err(ErrorKind::ConnectionFailure,
                                           "unexpected response from server");
        }
        return Result<YAML::Node>::Ok(root);
    } catch (const YAML::Exception& e) {
        return Result<YAML::Node>::Err(ErrorKind::ConnectionFailure,
            std::string("invalid response from server: ") + e.what());
    }
}

// Server-provided "msg" field, if any
static std::string server_msg(const std::string& body) {
    auto parsed = parse_body(body);
    if (parsed.is_err() || !parsed.value["msg"]) return "";
    try {
        return parsed.value["msg"].as<std::string>("");
    } catch (const YAML::Exception&) {
        return "";
    }
}

Result<ServerCapabilities> parse_server_settings(const std::string& body) {
    auto parsed = parse_body(body);
    if (parsed.is_err()) {
        return Result<ServerCapabilities>::Err(parsed.kind, parsed.error);
    }

    ServerCapabilities caps;
    try {
        caps.email_auth_enabled = parsed.value["email_auth_enabled"].as<bool>(false);
        caps.require_email_format_usernames =
            parsed.value["require_email_format_usernames"].as<bool>(false);
    } catch (const YAML::Exception& e) {
        return Result<ServerCapabilities>::Err(ErrorKind::ConnectionFailure,
            std::string("invalid server settings: ") + e.what());
    }
    return Result<ServerCapabilities>::Ok(caps);
}

Result<std::string> parse_api_key(const std::string& body) {
    auto parsed = parse_body(body);
    if (parsed.is_err()) {
        return Result<std::string>::Err(parsed.kind, parsed.error);
    }

    std::string key;
    try {
        key = parsed.value["api_key"].as<std::string>("");
    } catch (const YAML::Exception& e) {
        return Result<std::string>::Err(ErrorKind::ConnectionFailure,
            std::string("invalid api key response: ") + e.what());
    }
    if (key.empty()) {
        return Result<std::string>::Err(ErrorKind::ConnectionFailure,
                                        "server returned no api key");
    }
    return Result<std::string>::Ok(key);
}

Result<ServerCapabilities> ZulipServerApi::server_settings(const std::string& server_url) {
    auto resp = http_.get(server_url + SERVER_SETTINGS_PATH);
    if (resp.is_err()) {
        return Result<ServerCapabilities>::Err(resp.kind, resp.error);
    }
    if (resp.value.status != 200) {
        return Result<ServerCapabilities>::Err(ErrorKind::ConnectionFailure,
            fmt::format("server settings request returned HTTP {}", resp.value.status));
    }
    return parse_server_settings(resp.value.body);
}

Result<std::string> ZulipServerApi::fetch_api_key(const std::string& server_url,
                                                  const std::string& login_id,
                                                  const std::string& password) {
    auto resp = http_.post_form(server_url + FETCH_API_KEY_PATH,
                                {{"username", login_id}, {"password", password}});
    if (resp.is_err()) {
        return Result<std::string>::Err(resp.kind, resp.error);
    }

    switch (resp.value.status) {
        case 200:
            return parse_api_key(resp.value.body);
        case 401:
        case 403: {
            zt_log(fmt::format("fetch_api_key rejected: {}", server_msg(resp.value.body)));
            return Result<std::string>::Err(ErrorKind::AuthenticationFailed,
                                            "Incorrect Email(or Username) or Password!");
        }
        default: {
            std::string msg = server_msg(resp.value.body);
            return Result<std::string>::Err(ErrorKind::ConnectionFailure,
                msg.empty() ? fmt::format("api key request returned HTTP {}", resp.value.status)
                            : msg);
        }
    }
}

Result<void> ZulipServerApi::verify_credentials(const CredentialRecord& creds) {
    if (creds.server_url.empty()) {
        return Result<void>::Err(ErrorKind::ConnectionFailure, "no site given in zuliprc");
    }

    auto resp = http_.get(creds.server_url + OWN_USER_PATH,
                          creds.login_id + ":" + creds.api_key);
    if (resp.is_err()) {
        return Result<void>::Err(resp.kind, resp.error);
    }
    if (resp.value.status == 401) {
        return Result<void>::Err(ErrorKind::AuthenticationFailed,
                                 "invalid API key in zuliprc");
    }
    if (resp.value.status != 200) {
        std::string msg = server_msg(resp.value.body);
        return Result<void>::Err(ErrorKind::ConnectionFailure,
            msg.empty() ? fmt::format("HTTP {}", resp.value.status) : msg);
    }
    return Result<void>::Ok();
}
