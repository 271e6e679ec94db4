#include "nimbus/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "nimbus/server/store_error.hpp"

namespace nimbus::server
{

    namespace
    {
        protocol::SessionGrant make_grant(const IssuedToken &token, const UserRecord &user)
        {
            return protocol::SessionGrant{
                .user_id = user.user_id,
                .session_token = token.token,
                .expires_at = static_cast<std::uint64_t>(
                    std::chrono::duration_cast<std::chrono::seconds>(token.expires_at.time_since_epoch()).count()),
                .salt = user.salt,
                .wrapped_master_key = user.wrapped_master_key,
                .opslimit = user.opslimit,
                .memlimit = user.memlimit,
            };
        }
    } // namespace

    void Session::handle_authenticate(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::AuthenticateRequest>();
        if (request.username.empty())
        {
            throw StoreError(ErrorCode::InvalidPayload, "Username is required");
        }
        const auto user = services_.users.authenticate(request.username, request.password);
        if (!user)
        {
            spdlog::warn("Failed login for {} from {}", request.username, remote_endpoint());
            throw StoreError(ErrorCode::AuthenticationFailed, "Invalid credentials");
        }
        services_.nodes.root_of(user->user_id);
        const auto token = services_.tokens.issue(user->user_id);
        spdlog::info("{} authenticated from {}", request.username, remote_endpoint());
        send_ok(make_grant(token, *user), envelope.request_id);
    }

    void Session::handle_register(const protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<protocol::RegisterRequest>();
        const auto user = services_.users.register_user(request.username, request.password, request.salt,
                                                        request.wrapped_master_key, request.opslimit,
                                                        request.memlimit);
        services_.nodes.root_of(user.user_id);
        const auto token = services_.tokens.issue(user.user_id);
        spdlog::info("Registered {} from {}", request.username, remote_endpoint());
        send_ok(make_grant(token, user), envelope.request_id);
    }

    void Session::handle_refresh(const protocol::RequestEnvelope &envelope)
    {
        require_user(envelope);
        const auto token = services_.tokens.refresh(*envelope.session_token);
        const auto user = services_.users.find_by_id(token.user_id);
        if (!user)
        {
            services_.tokens.revoke(token.token);
            throw StoreError(ErrorCode::AuthenticationRequired, "Account no longer exists");
        }
        send_ok(make_grant(token, *user), envelope.request_id);
    }

    void Session::handle_logout(const protocol::RequestEnvelope &envelope)
    {
        const auto user_id = require_user(envelope);
        services_.tokens.revoke(*envelope.session_token);
        spdlog::info("User {} logged out", user_id);
        send_ok(nlohmann::json::object(), envelope.request_id);
    }

} // namespace nimbus::server
