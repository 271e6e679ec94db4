#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "nimbus/client/remote_authority.hpp"

namespace nimbus::testing
{

    // In-memory authority that behaves like the server: it stores only
    // ciphertext and opaque key material, and reports failures with the same
    // exception types as NetworkAuthority. Faults can be injected per test.
    class FakeAuthority : public client::RemoteAuthority
    {
    public:
        using ChunkHook = std::function<void(std::size_t)>;

        FakeAuthority() = default;

        void connect() override;
        void disconnect() noexcept override;

        client::AuthGrant authenticate(const client::Credentials &credentials) override;
        client::AuthGrant register_account(const client::Registration &registration) override;
        client::AuthGrant refresh(const std::string &token) override;
        void logout(const std::string &token) override;

        client::Node fetch_root(const std::string &token) override;
        std::vector<client::Node> fetch_children(const std::string &token, const std::string &folder_id) override;
        client::Node create_folder(const std::string &token, const std::string &parent_id,
                                   const std::string &name) override;
        void remove(const std::string &token, const std::string &node_id) override;
        client::Node move(const std::string &token, const std::string &node_id, const std::string &new_parent_id,
                          const std::optional<std::string> &new_name) override;
        client::Node copy(const std::string &token, const std::string &node_id, const std::string &new_parent_id,
                          const std::optional<std::string> &new_name) override;

        client::UploadTarget request_upload_target(const std::string &token,
                                                   const client::UploadRequest &request) override;
        void upload_chunk(const std::string &token, const std::string &upload_id, std::uint64_t encrypted_offset,
                          std::span<const std::byte> ciphertext, std::chrono::milliseconds timeout) override;
        client::Node commit_upload(const std::string &token, const std::string &upload_id,
                                   const std::string &wrapped_key, const std::string &mac) override;

        client::DownloadTicket request_download(const std::string &token, const std::string &node_id) override;
        std::vector<std::byte> download_chunk(const std::string &token, const std::string &download_id,
                                              std::uint64_t encrypted_offset, std::uint64_t length,
                                              std::chrono::milliseconds timeout) override;

        client::Quota quota(const std::string &token) override;

        // The next count chunk calls (either direction) throw NetworkError.
        void fail_next_chunks(std::size_t count) { failing_chunks_.store(count); }
        // Called after every served download chunk with the running count.
        void on_download_chunk(ChunkHook hook);
        // Called after every stored upload chunk with the running count of stored chunks.
        void on_upload_chunk(ChunkHook hook);
        // Flips one byte of the stored ciphertext of a file.
        void corrupt(const std::string &node_id, std::uint64_t encrypted_offset);
        // Replaces the declared MAC of a file.
        void set_declared_mac(const std::string &node_id, std::string mac);
        void set_listing_delay(std::chrono::milliseconds delay) { listing_delay_ = delay; }
        void set_token_lifetime(std::chrono::seconds lifetime) { token_lifetime_ = lifetime; }
        void set_quota(std::uint64_t total_bytes) { quota_bytes_ = total_bytes; }
        // Drops every issued token, as a server restart would.
        void revoke_all_tokens();

        std::size_t authenticate_calls() const noexcept { return authenticate_calls_.load(); }
        std::size_t root_calls() const noexcept { return root_calls_.load(); }
        std::size_t refresh_calls() const noexcept { return refresh_calls_.load(); }
        std::size_t listing_calls() const noexcept { return listing_calls_.load(); }
        std::size_t download_chunk_calls() const noexcept { return download_chunk_calls_.load(); }
        std::size_t upload_chunk_calls() const noexcept { return upload_chunk_calls_.load(); }
        std::size_t active_tokens() const;

    private:
        struct Account
        {
            std::string user_id;
            std::string password;
            std::string salt;
            std::string wrapped_master_key;
            crypto::KdfLimits limits;
        };

        struct StoredFile
        {
            std::vector<std::byte> ciphertext;
            std::uint64_t chunk_size{};
            std::string mac;
        };

        struct PendingUpload
        {
            std::string user_id;
            client::UploadRequest request;
            std::vector<std::byte> ciphertext;
            std::map<std::uint64_t, std::uint64_t> received;
        };

        struct Owned
        {
            std::string owner;
            client::Node node;
        };

        std::string user_of_locked(const std::string &token) const;
        client::AuthGrant grant_locked(const Account &account);
        Owned &node_locked(const std::string &user_id, const std::string &node_id);
        void check_chunk_fault();
        std::uint64_t used_locked(const std::string &user_id) const;

        mutable std::mutex mutex_;
        std::map<std::string, Account> accounts_; // by username
        std::map<std::string, std::pair<std::string, std::chrono::system_clock::time_point>> tokens_;
        std::map<std::string, Owned> nodes_;
        std::map<std::string, std::string> roots_;
        std::map<std::string, StoredFile> files_;
        std::map<std::string, PendingUpload> uploads_;
        std::map<std::string, std::pair<std::string, std::string>> downloads_; // id -> (user, node)
        ChunkHook download_hook_;
        ChunkHook upload_hook_;

        std::chrono::milliseconds listing_delay_{0};
        std::chrono::seconds token_lifetime_{3600};
        std::uint64_t quota_bytes_{1ULL << 30};

        std::atomic<std::size_t> failing_chunks_{0};
        std::atomic<std::size_t> authenticate_calls_{0};
        std::atomic<std::size_t> root_calls_{0};
        std::atomic<std::size_t> stored_chunks_{0};
        std::atomic<std::size_t> refresh_calls_{0};
        std::atomic<std::size_t> listing_calls_{0};
        std::atomic<std::size_t> download_chunk_calls_{0};
        std::atomic<std::size_t> upload_chunk_calls_{0};
    };

} // namespace nimbus::testing
