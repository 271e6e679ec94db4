#include "nimbus/client/session_manager.hpp"

#include <utility>

#include "nimbus/client/errors.hpp"
#include "nimbus/client/retry.hpp"
#include "nimbus/encoding/base64.hpp"

namespace nimbus::client
{

    SessionManager::SessionManager(RemoteAuthority &authority, Logger logger, RetryPolicy retry,
                                   std::chrono::seconds refresh_margin)
        : authority_(authority),
          logger_(std::move(logger)),
          retry_(retry),
          refresh_margin_(refresh_margin) {}

    void SessionManager::on_login(LoginHook hook)
    {
        std::lock_guard lock(mutex_);
        hooks_.push_back(std::move(hook));
    }

    void SessionManager::begin_login()
    {
        std::lock_guard lock(mutex_);
        if (state_ == State::LoggedIn)
        {
            throw AuthError(AuthError::Reason::AlreadyAuthenticated, "A session is already established");
        }
        if (state_ == State::LoggingIn)
        {
            throw AuthError(AuthError::Reason::AlreadyAuthenticated, "Another login is in progress");
        }
        state_ = State::LoggingIn;
    }

    void SessionManager::drop_session() noexcept
    {
        std::lock_guard lock(mutex_);
        state_ = State::LoggedOut;
        session_.reset();
    }

    Session SessionManager::login(const Credentials &credentials)
    {
        begin_login();
        try
        {
            const auto grant = with_retry(
                retry_, [&]()
                { return authority_.authenticate(credentials); },
                [&](std::size_t attempt, const NetworkError &error)
                { logger_.warn("session", "login attempt ", attempt, " failed: ", error.what()); });
            return establish(grant, credentials.password);
        }
        catch (...)
        {
            drop_session();
            throw;
        }
    }

    Session SessionManager::register_account(const Credentials &credentials, const crypto::KdfLimits &limits)
    {
        begin_login();
        try
        {
            const auto master_key = crypto::SecretKey::random();
            const auto salt = crypto::random_bytes(crypto::kSaltBytes);
            const auto password_key = crypto::derive_password_key(credentials.password, salt, limits);

            Registration registration{
                .credentials = credentials,
                .salt = encoding::encode_base64(salt),
                .wrapped_master_key = encoding::encode_base64(crypto::wrap_key(password_key, master_key)),
                .limits = limits,
            };
            const auto grant = authority_.register_account(registration);
            logger_.log("session", "registered account ", credentials.username);
            return establish(grant, credentials.password);
        }
        catch (...)
        {
            drop_session();
            throw;
        }
    }

    Session SessionManager::establish(const AuthGrant &grant, const std::string &password)
    {
        std::shared_ptr<const CryptoContext> context;
        try
        {
            context = std::make_shared<const CryptoContext>(CryptoContext::unlock(password, grant));
        }
        catch (const AuthError &)
        {
            try
            {
                authority_.logout(grant.session_token);
            }
            catch (const Error &ex)
            {
                logger_.warn("session", "could not release rejected session: ", ex.what());
            }
            throw;
        }

        Session session{
            .user_id = grant.user_id,
            .token = grant.session_token,
            .expires_at = grant.expires_at,
            .crypto = std::move(context),
        };

        std::vector<LoginHook> hooks;
        {
            std::lock_guard lock(mutex_);
            state_ = State::LoggedIn;
            session_ = session;
            hooks = hooks_;
        }
        logger_.log("session", "logged in as user ", session.user_id);
        for (const auto &hook : hooks)
        {
            hook(session);
        }
        return session;
    }

    Session SessionManager::refresh()
    {
        std::lock_guard refresh_lock(refresh_mutex_);
        return refresh_locked(current());
    }

    Session SessionManager::refresh_locked(const Session &existing)
    {
        AuthGrant grant;
        try
        {
            grant = with_retry(
                retry_, [&]()
                { return authority_.refresh(existing.token); },
                [&](std::size_t attempt, const NetworkError &error)
                { logger_.warn("session", "refresh attempt ", attempt, " failed: ", error.what()); });
        }
        catch (const AuthError &ex)
        {
            logger_.warn("session", "refresh rejected: ", ex.what());
            drop_session();
            throw AuthError(AuthError::Reason::SessionExpired, std::string("Session could not be refreshed: ") + ex.what());
        }

        std::lock_guard lock(mutex_);
        if (!session_ || session_->token != existing.token)
        {
            throw AuthError(AuthError::Reason::NotAuthenticated, "Session ended during refresh");
        }
        session_->token = grant.session_token;
        session_->expires_at = grant.expires_at;
        logger_.debug("session", "token refreshed");
        return *session_;
    }

    void SessionManager::logout()
    {
        std::optional<Session> ended;
        {
            std::lock_guard lock(mutex_);
            if (state_ != State::LoggedIn)
            {
                return;
            }
            ended = std::move(session_);
            session_.reset();
            state_ = State::LoggedOut;
        }
        try
        {
            authority_.logout(ended->token);
        }
        catch (const NetworkError &ex)
        {
            logger_.warn("session", "logout notification failed: ", ex.what());
        }
        catch (const AuthError &ex)
        {
            logger_.debug("session", "session already gone on logout: ", ex.what());
        }
        logger_.log("session", "logged out user ", ended->user_id);
    }

    bool SessionManager::logged_in() const
    {
        std::lock_guard lock(mutex_);
        return state_ == State::LoggedIn;
    }

    Session SessionManager::current() const
    {
        std::lock_guard lock(mutex_);
        if (state_ != State::LoggedIn || !session_)
        {
            throw AuthError(AuthError::Reason::NotAuthenticated, "Not logged in");
        }
        return *session_;
    }

    bool SessionManager::near_expiry(const Session &session) const
    {
        return std::chrono::system_clock::now() + refresh_margin_ >= session.expires_at;
    }

    std::string SessionManager::token()
    {
        const auto seen = current();
        if (!near_expiry(seen))
        {
            return seen.token;
        }
        std::lock_guard refresh_lock(refresh_mutex_);
        // A concurrent caller may have refreshed while this one waited. Refreshing
        // again would revoke the token it handed out.
        const auto latest = current();
        if (latest.token != seen.token || !near_expiry(latest))
        {
            return latest.token;
        }
        return refresh_locked(latest).token;
    }

    std::shared_ptr<const CryptoContext> SessionManager::crypto() const
    {
        return current().crypto;
    }

} // namespace nimbus::client
