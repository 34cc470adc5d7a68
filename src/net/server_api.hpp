#pragma once

#include <string>
#include <core/types.hpp>
#include "http_client.hpp"

// The remote calls the bootstrap makes before handing off to the session.
// Errors: ConnectionFailure (transport / unexpected status / bad body),
// AuthenticationFailed (server rejected the login).
class ServerApi {
public:
    virtual ~ServerApi() = default;

    // GET {server_url}/api/v1/server_settings
    virtual Result<ServerCapabilities> server_settings(const std::string& server_url) = 0;

    // POST {server_url}/api/v1/fetch_api_key, returns the API key
    virtual Result<std::string> fetch_api_key(const std::string& server_url,
                                              const std::string& login_id,
                                              const std::string& password) = 0;

    // GET {server_url}/api/v1/users/me with the stored credentials
    virtual Result<void> verify_credentials(const CredentialRecord& creds) = 0;
};

class ZulipServerApi : public ServerApi {
public:
    Result<ServerCapabilities> server_settings(const std::string& server_url) override;
    Result<std::string> fetch_api_key(const std::string& server_url,
                                      const std::string& login_id,
                                      const std::string& password) override;
    Result<void> verify_credentials(const CredentialRecord& creds) override;

private:
    HttpClient http_;
};

// Response decoding, exposed for tests.
Result<ServerCapabilities> parse_server_settings(const std::string& body);
Result<std::string> parse_api_key(const std::string& body);
