#include "nimbus/server/token_registry.hpp"

#include "nimbus/crypto.hpp"
#include "nimbus/server/store_error.hpp"

namespace nimbus::server
{

    TokenRegistry::TokenRegistry(std::chrono::seconds ttl)
        : ttl_(ttl) {}

    IssuedToken TokenRegistry::issue(const std::string &user_id)
    {
        const auto now = std::chrono::system_clock::now();
        IssuedToken issued{
            .token = crypto::random_id(32),
            .user_id = user_id,
            .expires_at = now + ttl_,
        };
        std::lock_guard lock(mutex_);
        purge_expired_locked(now);
        tokens_[issued.token] = issued;
        return issued;
    }

    std::string TokenRegistry::validate(const std::string &token)
    {
        std::lock_guard lock(mutex_);
        auto it = tokens_.find(token);
        if (it == tokens_.end())
        {
            throw StoreError(ErrorCode::AuthenticationRequired, "Unknown or revoked session");
        }
        if (it->second.expires_at <= std::chrono::system_clock::now())
        {
            tokens_.erase(it);
            throw StoreError(ErrorCode::SessionExpired, "Session expired");
        }
        return it->second.user_id;
    }

    IssuedToken TokenRegistry::refresh(const std::string &token)
    {
        const auto user_id = validate(token);
        revoke(token);
        return issue(user_id);
    }

    void TokenRegistry::revoke(const std::string &token)
    {
        std::lock_guard lock(mutex_);
        tokens_.erase(token);
    }

    std::size_t TokenRegistry::active() const
    {
        std::lock_guard lock(mutex_);
        return tokens_.size();
    }

    void TokenRegistry::purge_expired_locked(std::chrono::system_clock::time_point now)
    {
        std::erase_if(tokens_, [now](const auto &item)
                      { return item.second.expires_at <= now; });
    }

} // namespace nimbus::server
