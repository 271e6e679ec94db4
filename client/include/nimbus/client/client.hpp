/**
 * Nimbus - Client facade.
 *
 * Composes the session manager, the remote tree cache and the transfer engine
 * behind one object. Every public operation validates its input on the calling
 * thread and then runs on the client's I/O pool, returning a std::future.
 * ClientScope ties the transport to a lexical scope.
 */
#pragma once

#include <asio/thread_pool.hpp>

#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "nimbus/client/config.hpp"
#include "nimbus/client/logger.hpp"
#include "nimbus/client/node.hpp"
#include "nimbus/client/remote_authority.hpp"
#include "nimbus/client/session_manager.hpp"
#include "nimbus/client/transfer.hpp"
#include "nimbus/client/transfer_engine.hpp"
#include "nimbus/client/transfer_state_store.hpp"
#include "nimbus/client/tree_cache.hpp"

namespace nimbus::client
{

    class Client
    {
    public:
        // Talks to config.host:config.port through a NetworkAuthority.
        explicit Client(ClientConfig config);
        Client(ClientConfig config, std::unique_ptr<RemoteAuthority> authority, Logger logger);
        ~Client();

        Client(const Client &) = delete;
        Client &operator=(const Client &) = delete;

        void connect();
        // Cancels and joins transfers, logs out and closes the transport. Safe to call twice.
        void disconnect() noexcept;

        std::future<Session> login(Credentials credentials);
        std::future<Session> register_account(Credentials credentials,
                                              crypto::KdfLimits limits = crypto::KdfLimits::interactive());
        std::future<void> logout();

        std::future<std::vector<Node>> list(std::string path);
        std::future<Node> stat(std::string path);
        // Drops the cached listing of the folder at path and fetches it again.
        std::future<void> refresh(std::string path);
        std::future<Node> create_folder(std::string path);
        std::future<void> remove(std::string path);
        std::future<Node> move(std::string path, std::string new_parent_path,
                               std::optional<std::string> new_name = std::nullopt);
        // Copies a file, or a folder and its contents, into new_parent_path.
        std::future<Node> copy(std::string path, std::string new_parent_path,
                               std::optional<std::string> new_name = std::nullopt);

        // The future resolves once the transfer is scheduled; wait on the Transfer for its outcome.
        std::future<std::shared_ptr<Transfer>> download_file(std::string remote_path,
                                                             std::filesystem::path local_path,
                                                             ProgressCallback progress = {});
        // Delivers limit bytes of the file from offset, in order, to sink instead of a local file.
        std::future<std::shared_ptr<Transfer>> stream_file(std::string remote_path, TransferEngine::StreamSink sink,
                                                           std::uint64_t offset = 0,
                                                           std::optional<std::uint64_t> limit = std::nullopt,
                                                           ProgressCallback progress = {});
        std::future<std::shared_ptr<Transfer>> upload_file(std::filesystem::path local_path,
                                                           std::string remote_path,
                                                           ProgressCallback progress = {});

        std::future<std::uint64_t> free_space();
        std::future<Quota> account_details();

        bool is_logged_in() const;
        // Completes once the tree cache has been primed after the latest login.
        // Throws AuthError(NotAuthenticated) before the first login.
        std::shared_future<void> ready() const;

        // Resume records left by interrupted transfers of the logged in user.
        std::vector<TransferStateStore::Record> pending_transfers() const;
        void discard_pending_transfers();

        TransferEngine &transfers() noexcept { return *engine_; }
        const ClientConfig &config() const noexcept { return config_; }
        Logger &logger() noexcept { return logger_; }

    private:
        template <typename Fn>
        auto submit(Fn fn) -> std::future<decltype(fn())>;

        void on_login(const Session &session);
        Node resolve_folder(const std::string &path);

        ClientConfig config_;
        Logger logger_;
        std::unique_ptr<RemoteAuthority> authority_;
        SessionManager sessions_;
        RemoteTreeCache cache_;
        std::shared_ptr<TransferStateStore> state_store_;
        std::unique_ptr<TransferEngine> engine_;

        mutable std::mutex mutex_;
        std::optional<std::shared_future<void>> ready_;
        bool connected_{false};

        asio::thread_pool io_;
    };

    // Connects on construction and disconnects on every exit path.
    class ClientScope
    {
    public:
        explicit ClientScope(Client &client);
        ~ClientScope();

        ClientScope(const ClientScope &) = delete;
        ClientScope &operator=(const ClientScope &) = delete;

        Client &client() noexcept { return client_; }
        Client *operator->() noexcept { return &client_; }

    private:
        Client &client_;
    };

} // namespace nimbus::client
