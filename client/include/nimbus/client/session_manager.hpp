/**
 * Nimbus - Authentication state of one client instance.
 *
 * At most one session is alive at a time. A login issued while a session
 * exists, or while another login is still in flight, fails with
 * AuthError(AlreadyAuthenticated).
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "nimbus/client/config.hpp"
#include "nimbus/client/crypto_context.hpp"
#include "nimbus/client/logger.hpp"
#include "nimbus/client/remote_authority.hpp"

namespace nimbus::client
{

    struct Session
    {
        std::string user_id;
        std::string token;
        std::chrono::system_clock::time_point expires_at{};
        std::shared_ptr<const CryptoContext> crypto;
    };

    class SessionManager
    {
    public:
        using LoginHook = std::function<void(const Session &)>;

        SessionManager(RemoteAuthority &authority, Logger logger, RetryPolicy retry,
                       std::chrono::seconds refresh_margin);

        SessionManager(const SessionManager &) = delete;
        SessionManager &operator=(const SessionManager &) = delete;

        // Hooks run after every successful login, outside the manager's lock.
        void on_login(LoginHook hook);

        Session login(const Credentials &credentials);

        // Creates the account with a fresh master key, then logs in.
        Session register_account(const Credentials &credentials,
                                 const crypto::KdfLimits &limits = crypto::KdfLimits::interactive());

        Session refresh();

        void logout();

        bool logged_in() const;

        // Throws AuthError(NotAuthenticated) when no session is alive.
        Session current() const;

        // Current token, refreshed first when the session is within the refresh margin of expiry.
        std::string token();

        std::shared_ptr<const CryptoContext> crypto() const;

    private:
        enum class State
        {
            LoggedOut,
            LoggingIn,
            LoggedIn
        };

        void begin_login();
        Session establish(const AuthGrant &grant, const std::string &password);
        // Caller holds refresh_mutex_.
        Session refresh_locked(const Session &existing);
        bool near_expiry(const Session &session) const;
        void drop_session() noexcept;

        RemoteAuthority &authority_;
        Logger logger_;
        RetryPolicy retry_;
        std::chrono::seconds refresh_margin_;

        mutable std::mutex mutex_;
        std::mutex refresh_mutex_;
        State state_{State::LoggedOut};
        std::optional<Session> session_;
        std::vector<LoginHook> hooks_;
    };

} // namespace nimbus::client
