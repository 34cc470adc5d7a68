#include "session.hpp"
#include <net/server_api.hpp>
#include <core/settings.hpp>
#include <core/log.hpp>
#include <cli/ansi.hpp>
#include <fmt/format.h>

RemoteChatSession::RemoteChatSession(ServerApi& api, SessionOptions options, std::ostream& out)
    : api_(api), options_(std::move(options)), out_(out) {
    auto verified = api_.verify_credentials(options_.credentials);
    if (verified.is_err()) {
        zt_log(fmt::format("Session construction failed ({}): {}",
                           error_kind_name(verified.kind), verified.error));
        throw ServerConnectionFailure(verified.error);
    }
}

void RemoteChatSession::run() {
    const auto& s = options_.settings;
    zt_log(fmt::format("Session start: site={} theme={} autohide={} footlinks={} "
                       "color_depth={} explore={}",
                       options_.credentials.server_url, s.theme.value,
                       to_string(s.autohide.value), to_string(s.footlinks.value),
                       to_string(s.color_depth.value), options_.explore));

    out_ << ansi::green(fmt::format("Connected to {} as {}.",
                                    options_.credentials.server_url,
                                    options_.credentials.login_id)) << "\n";
    if (options_.explore) {
        out_ << "Exploring: messages will not be marked as read.\n";
    }
    out_.flush();
}

SessionFactory remote_session_factory(ServerApi& api, std::ostream& out) {
    return [&api, &out](const SessionOptions& options) -> std::unique_ptr<ChatSession> {
        return std::make_unique<RemoteChatSession>(api, options, out);
    };
}
