#include "nimbus/server/user_store.hpp"

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "nimbus/crypto.hpp"
#include "nimbus/server/store_error.hpp"

namespace nimbus::server
{

    namespace
    {
        constexpr auto kMetadataDir = ".nimbus";
        constexpr auto kUsersFile = "users.json";
    } // namespace

    UserStore::UserStore(std::filesystem::path root_directory)
        : database_path_(root_directory / kMetadataDir / kUsersFile)
    {
        std::filesystem::create_directories(database_path_.parent_path());
    }

    std::optional<UserRecord> UserStore::authenticate(const std::string &username, const std::string &password) const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        const auto it = users_.find(username);
        if (it == users_.end() || !crypto::verify_password(password, it->second.password_hash))
        {
            return std::nullopt;
        }
        return it->second;
    }

    UserRecord UserStore::register_user(const std::string &username, const std::string &password,
                                        const std::string &salt, const std::string &wrapped_master_key,
                                        std::uint64_t opslimit, std::uint64_t memlimit)
    {
        if (username.empty() || password.empty())
        {
            throw StoreError(ErrorCode::InvalidPayload, "Username and password are required");
        }
        if (salt.empty() || wrapped_master_key.empty())
        {
            throw StoreError(ErrorCode::InvalidPayload, "Registration must carry the wrapped master key");
        }
        std::lock_guard lock(mutex_);
        load_locked();
        if (users_.contains(username))
        {
            throw StoreError(ErrorCode::AlreadyExists, "User already exists");
        }
        UserRecord record{
            .username = username,
            .user_id = crypto::random_id(),
            .password_hash = crypto::hash_password(password),
            .salt = salt,
            .wrapped_master_key = wrapped_master_key,
            .opslimit = opslimit,
            .memlimit = memlimit,
        };
        users_.emplace(username, record);
        persist_locked();
        return record;
    }

    std::optional<UserRecord> UserStore::find_by_id(const std::string &user_id) const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        for (const auto &[name, record] : users_)
        {
            if (record.user_id == user_id)
            {
                return record;
            }
        }
        return std::nullopt;
    }

    void UserStore::load_locked() const
    {
        if (loaded_)
        {
            return;
        }
        users_.clear();
        if (std::filesystem::exists(database_path_))
        {
            std::ifstream in(database_path_);
            if (!in.is_open())
            {
                throw std::runtime_error("Cannot read user database " + database_path_.string());
            }
            nlohmann::json json;
            in >> json;
            if (json.is_object())
            {
                for (const auto &[key, value] : json.items())
                {
                    users_[key] = UserRecord{
                        .username = key,
                        .user_id = value.at("id").get<std::string>(),
                        .password_hash = value.at("hash").get<std::string>(),
                        .salt = value.value("salt", std::string{}),
                        .wrapped_master_key = value.value("master_key", std::string{}),
                        .opslimit = value.value("opslimit", std::uint64_t{0}),
                        .memlimit = value.value("memlimit", std::uint64_t{0}),
                    };
                }
            }
        }
        loaded_ = true;
    }

    void UserStore::persist_locked() const
    {
        nlohmann::json json = nlohmann::json::object();
        for (const auto &[user, record] : users_)
        {
            json[user] = {
                {"id", record.user_id},
                {"hash", record.password_hash},
                {"salt", record.salt},
                {"master_key", record.wrapped_master_key},
                {"opslimit", record.opslimit},
                {"memlimit", record.memlimit},
            };
        }
        const auto temp = database_path_.string() + ".tmp";
        {
            std::ofstream out(temp, std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Cannot write user database " + temp);
            }
            out << json.dump(2);
        }
        std::filesystem::rename(temp, database_path_);
    }

} // namespace nimbus::server
