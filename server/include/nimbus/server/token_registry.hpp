#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace nimbus::server
{

    struct IssuedToken
    {
        std::string token;
        std::string user_id;
        std::chrono::system_clock::time_point expires_at{};
    };

    // Bearer tokens handed out at login. Held in memory only: a restart logs everybody out.
    class TokenRegistry
    {
    public:
        explicit TokenRegistry(std::chrono::seconds ttl);

        IssuedToken issue(const std::string &user_id);

        // Returns the owning user id. Throws StoreError(AuthenticationRequired) for unknown tokens
        // and StoreError(SessionExpired) for expired ones.
        std::string validate(const std::string &token);

        // Revokes token and issues a fresh one for the same user.
        IssuedToken refresh(const std::string &token);

        void revoke(const std::string &token);

        std::size_t active() const;

    private:
        void purge_expired_locked(std::chrono::system_clock::time_point now);

        std::chrono::seconds ttl_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, IssuedToken> tokens_;
    };

} // namespace nimbus::server
