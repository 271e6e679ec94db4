/**
 * Nimbus - Capability interface of the remote storage authority.
 *
 * The client core only talks to the authority through this interface.
 * NetworkAuthority implements it over the wire protocol; tests plug in an
 * in-memory implementation. Implementations report failures with the
 * exception types from errors.hpp and must be safe to call from several
 * threads at once.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "nimbus/client/node.hpp"
#include "nimbus/crypto.hpp"

namespace nimbus::client
{

    struct Credentials
    {
        std::string username;
        std::string password;
    };

    struct AuthGrant
    {
        std::string user_id;
        std::string session_token;
        std::chrono::system_clock::time_point expires_at{};
        std::string salt;               // base64
        std::string wrapped_master_key; // base64
        crypto::KdfLimits limits{};
    };

    // Key material sent along with a new account.
    struct Registration
    {
        Credentials credentials;
        std::string salt;
        std::string wrapped_master_key;
        crypto::KdfLimits limits{};
    };

    struct UploadRequest
    {
        std::string parent_id;
        std::string name;
        std::uint64_t size{};
        std::uint64_t encrypted_size{};
        std::uint64_t chunk_size{};
        std::optional<std::string> resume_id;
    };

    struct UploadTarget
    {
        std::string upload_id;
        std::uint64_t chunk_size{};
        bool resumed{};
    };

    struct DownloadTicket
    {
        std::string download_id;
        std::string node_id;
        std::uint64_t size{};
        std::uint64_t encrypted_size{};
        std::uint64_t chunk_size{}; // encryption segment size fixed at upload
        std::string content_key;
        std::string content_mac;
    };

    struct Quota
    {
        std::uint64_t used_bytes{};
        std::uint64_t total_bytes{};

        std::uint64_t free_bytes() const noexcept { return used_bytes >= total_bytes ? 0 : total_bytes - used_bytes; }
    };

    class RemoteAuthority
    {
    public:
        virtual ~RemoteAuthority() = default;

        virtual void connect() = 0;
        virtual void disconnect() noexcept = 0;

        virtual AuthGrant authenticate(const Credentials &credentials) = 0;
        virtual AuthGrant register_account(const Registration &registration) = 0;
        virtual AuthGrant refresh(const std::string &token) = 0;
        virtual void logout(const std::string &token) = 0;

        virtual Node fetch_root(const std::string &token) = 0;
        virtual std::vector<Node> fetch_children(const std::string &token, const std::string &folder_id) = 0;
        virtual Node create_folder(const std::string &token, const std::string &parent_id, const std::string &name) = 0;
        virtual void remove(const std::string &token, const std::string &node_id) = 0;
        virtual Node move(const std::string &token, const std::string &node_id, const std::string &new_parent_id,
                          const std::optional<std::string> &new_name) = 0;
        // Duplicates a file, or a folder with everything below it, and returns the new top node.
        virtual Node copy(const std::string &token, const std::string &node_id, const std::string &new_parent_id,
                          const std::optional<std::string> &new_name) = 0;

        virtual UploadTarget request_upload_target(const std::string &token, const UploadRequest &request) = 0;
        virtual void upload_chunk(const std::string &token, const std::string &upload_id, std::uint64_t encrypted_offset,
                                  std::span<const std::byte> ciphertext, std::chrono::milliseconds timeout) = 0;
        virtual Node commit_upload(const std::string &token, const std::string &upload_id,
                                   const std::string &wrapped_key, const std::string &mac) = 0;

        virtual DownloadTicket request_download(const std::string &token, const std::string &node_id) = 0;
        virtual std::vector<std::byte> download_chunk(const std::string &token, const std::string &download_id,
                                                      std::uint64_t encrypted_offset, std::uint64_t length,
                                                      std::chrono::milliseconds timeout) = 0;

        virtual Quota quota(const std::string &token) = 0;
    };

} // namespace nimbus::client
