#pragma once

#include <string>
#include <memory>
#include <functional>
#include <stdexcept>
#include <ostream>
#include <filesystem>
#include <core/types.hpp>

class ServerApi;

// Thrown by a session constructor when the server cannot be reached or
// refuses the stored credentials.
class ServerConnectionFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Everything the interactive session gets from the bootstrap.
struct SessionOptions {
    CredentialRecord credentials;
    ResolvedSettings settings;
    std::filesystem::path config_path;
    bool explore = false;   // do not mark messages as read
    bool debug = false;
};

class ChatSession {
public:
    virtual ~ChatSession() = default;

    // Takes over the terminal until the user quits.
    virtual void run() = 0;
};

using SessionFactory =
    std::function<std::unique_ptr<ChatSession>(const SessionOptions&)>;

// Session against a live server. The constructor checks the stored
// credentials against /api/v1/users/me and throws ServerConnectionFailure
// if that fails.
class RemoteChatSession : public ChatSession {
public:
    RemoteChatSession(ServerApi& api, SessionOptions options, std::ostream& out);

    void run() override;

    const SessionOptions& options() const { return options_; }

private:
    ServerApi& api_;
    SessionOptions options_;
    std::ostream& out_;
};

// Factory producing RemoteChatSession instances.
SessionFactory remote_session_factory(ServerApi& api, std::ostream& out);
