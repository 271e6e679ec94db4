/**
 * Nimbus - RemoteAuthority over the framed JSON wire protocol.
 *
 * Requests are written as length-prefixed JSON frames on plain TCP
 * connections. A small pool of connections lets chunk workers talk to the
 * server concurrently; each connection serves one request at a time. Every
 * exchange runs under a deadline, and a connection that timed out or failed
 * is closed and reopened on next use.
 */
#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nimbus/client/logger.hpp"
#include "nimbus/client/remote_authority.hpp"
#include "nimbus/protocol.hpp"

namespace nimbus::client
{

    struct NetworkOptions
    {
        std::string host;
        std::uint16_t port{};
        std::size_t max_connections{4};
        std::chrono::milliseconds request_timeout{15000};
    };

    class NetworkAuthority : public RemoteAuthority
    {
    public:
        NetworkAuthority(NetworkOptions options, Logger logger);
        ~NetworkAuthority() override;

        void connect() override;
        void disconnect() noexcept override;

        AuthGrant authenticate(const Credentials &credentials) override;
        AuthGrant register_account(const Registration &registration) override;
        AuthGrant refresh(const std::string &token) override;
        void logout(const std::string &token) override;

        Node fetch_root(const std::string &token) override;
        std::vector<Node> fetch_children(const std::string &token, const std::string &folder_id) override;
        Node create_folder(const std::string &token, const std::string &parent_id, const std::string &name) override;
        void remove(const std::string &token, const std::string &node_id) override;
        Node move(const std::string &token, const std::string &node_id, const std::string &new_parent_id,
                  const std::optional<std::string> &new_name) override;
        Node copy(const std::string &token, const std::string &node_id, const std::string &new_parent_id,
                  const std::optional<std::string> &new_name) override;

        UploadTarget request_upload_target(const std::string &token, const UploadRequest &request) override;
        void upload_chunk(const std::string &token, const std::string &upload_id, std::uint64_t encrypted_offset,
                          std::span<const std::byte> ciphertext, std::chrono::milliseconds timeout) override;
        Node commit_upload(const std::string &token, const std::string &upload_id, const std::string &wrapped_key,
                           const std::string &mac) override;

        DownloadTicket request_download(const std::string &token, const std::string &node_id) override;
        std::vector<std::byte> download_chunk(const std::string &token, const std::string &download_id,
                                              std::uint64_t encrypted_offset, std::uint64_t length,
                                              std::chrono::milliseconds timeout) override;

        Quota quota(const std::string &token) override;

    private:
        struct Connection
        {
            asio::io_context io;
            asio::ip::tcp::socket socket{io};
        };

        // Sends one request and returns the payload of a successful response.
        // Error responses are rethrown through throw_for_error.
        nlohmann::json rpc(protocol::Command command, const nlohmann::json &payload,
                           const std::optional<std::string> &token,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

        protocol::ResponseEnvelope exchange(Connection &connection, const std::vector<std::uint8_t> &frame,
                                            std::chrono::milliseconds timeout);
        void open(Connection &connection, std::chrono::milliseconds timeout);
        void run_until(Connection &connection, bool &done, std::chrono::milliseconds timeout, const char *what);

        std::unique_ptr<Connection> acquire();
        void release(std::unique_ptr<Connection> connection);

        std::string next_request_id();

        NetworkOptions options_;
        Logger logger_;

        std::mutex mutex_;
        std::condition_variable available_;
        std::vector<std::unique_ptr<Connection>> idle_;
        std::size_t open_count_{0};
        std::atomic<std::uint64_t> request_counter_{0};
    };

} // namespace nimbus::client
