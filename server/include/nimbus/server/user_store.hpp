#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace nimbus::server
{

    struct UserRecord
    {
        std::string username;
        std::string user_id;
        std::string password_hash;
        // Opaque to the server: the client's master key wrapped by its password key.
        std::string salt;
        std::string wrapped_master_key;
        std::uint64_t opslimit{};
        std::uint64_t memlimit{};
    };

    class UserStore
    {
    public:
        explicit UserStore(std::filesystem::path root_directory);

        std::optional<UserRecord> authenticate(const std::string &username, const std::string &password) const;

        // Throws StoreError(AlreadyExists) for a taken name and StoreError(InvalidPayload) for missing fields.
        UserRecord register_user(const std::string &username, const std::string &password, const std::string &salt,
                                 const std::string &wrapped_master_key, std::uint64_t opslimit,
                                 std::uint64_t memlimit);

        std::optional<UserRecord> find_by_id(const std::string &user_id) const;

    private:
        void load_locked() const;
        void persist_locked() const;

        std::filesystem::path database_path_;

        mutable std::mutex mutex_;
        mutable bool loaded_{false};
        mutable std::unordered_map<std::string, UserRecord> users_; // by username
    };

} // namespace nimbus::server
