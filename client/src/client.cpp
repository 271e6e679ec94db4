#include "nimbus/client/client.hpp"

#include <asio/post.hpp>

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

#include "nimbus/client/errors.hpp"
#include "nimbus/client/network_authority.hpp"

namespace nimbus::client
{

    namespace
    {
        void require_path(const std::string &path, const char *what)
        {
            if (path.empty())
            {
                throw std::invalid_argument(std::string(what) + " must not be empty");
            }
        }

        std::string parent_path_of(const std::vector<std::string> &segments)
        {
            std::string parent = "/";
            for (std::size_t i = 0; i + 1 < segments.size(); ++i)
            {
                parent += segments[i] + "/";
            }
            return parent;
        }

        std::size_t connection_budget(const ClientConfig &config)
        {
            const auto workers = config.transfers.parallelism == 0
                                     ? std::max(1u, std::thread::hardware_concurrency())
                                     : config.transfers.parallelism;
            return workers + config.io_threads;
        }

        std::shared_ptr<TransferStateStore> make_state_store(const ClientConfig &config, const Logger &logger)
        {
            if (!config.transfers.resume)
            {
                return nullptr;
            }
            return std::make_shared<TransferStateStore>(config.state_path, logger);
        }
    } // namespace

    Client::Client(ClientConfig config)
        : Client(config,
                 std::make_unique<NetworkAuthority>(
                     NetworkOptions{
                         .host = config.host,
                         .port = config.port,
                         .max_connections = connection_budget(config),
                         .request_timeout = config.request_timeout,
                     },
                     Logger(config.log_path, config.verbose)),
                 Logger(config.log_path, config.verbose)) {}

    Client::Client(ClientConfig config, std::unique_ptr<RemoteAuthority> authority, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          authority_(std::move(authority)),
          sessions_(*authority_, logger_, config_.session_retry, config_.refresh_margin),
          cache_(*authority_, [this]()
                 { return sessions_.token(); }, logger_, config_.cache_ttl),
          state_store_(make_state_store(config_, logger_)),
          engine_(std::make_unique<TransferEngine>(*authority_, sessions_, config_.transfers, logger_, state_store_)),
          io_(std::max<std::size_t>(1, config_.io_threads))
    {
        sessions_.on_login([this](const Session &session)
                           { on_login(session); });
        engine_->on_upload_committed([this](const Node &node)
                                     { cache_.apply(NodeEvent{.kind = NodeEventKind::Added, .node = node}); });
    }

    Client::~Client()
    {
        disconnect();
        io_.join();
    }

    void Client::connect()
    {
        std::lock_guard lock(mutex_);
        if (connected_)
        {
            return;
        }
        authority_->connect();
        connected_ = true;
    }

    void Client::disconnect() noexcept
    {
        {
            std::lock_guard lock(mutex_);
            if (!connected_)
            {
                return;
            }
            connected_ = false;
        }
        engine_->cancel_all();
        engine_->wait_all();
        try
        {
            sessions_.logout();
        }
        catch (const std::exception &ex)
        {
            logger_.warn("client", "logout during disconnect failed: ", ex.what());
        }
        cache_.clear();
        {
            std::lock_guard lock(mutex_);
            ready_.reset();
        }
        authority_->disconnect();
        logger_.log("client", "disconnected");
    }

    template <typename Fn>
    auto Client::submit(Fn fn) -> std::future<decltype(fn())>
    {
        using Result = decltype(fn());
        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        auto future = task->get_future();
        asio::post(io_, [task]()
                   { (*task)(); });
        return future;
    }

    std::future<Session> Client::login(Credentials credentials)
    {
        require_path(credentials.username, "Username");
        return submit([this, credentials = std::move(credentials)]()
                      {
            auto session = sessions_.login(credentials);
            logger_.log("client", "logged in as ", credentials.username, " (", session.user_id, ")");
            return session; });
    }

    std::future<Session> Client::register_account(Credentials credentials, crypto::KdfLimits limits)
    {
        require_path(credentials.username, "Username");
        if (credentials.password.empty())
        {
            throw std::invalid_argument("Password must not be empty");
        }
        return submit([this, credentials = std::move(credentials), limits]()
                      { return sessions_.register_account(credentials, limits); });
    }

    std::future<void> Client::logout()
    {
        return submit([this]()
                      {
            engine_->cancel_all();
            engine_->wait_all();
            sessions_.logout();
            cache_.clear();
            std::lock_guard lock(mutex_);
            ready_.reset(); });
    }

    std::future<std::vector<Node>> Client::list(std::string path)
    {
        require_path(path, "Path");
        return submit([this, path = std::move(path)]()
                      { return cache_.list(cache_.resolve(path)); });
    }

    std::future<Node> Client::stat(std::string path)
    {
        require_path(path, "Path");
        return submit([this, path = std::move(path)]()
                      { return cache_.resolve(path); });
    }

    std::future<void> Client::refresh(std::string path)
    {
        require_path(path, "Path");
        return submit([this, path = std::move(path)]()
                      { cache_.refresh(path); });
    }

    std::future<Node> Client::create_folder(std::string path)
    {
        require_path(path, "Path");
        const auto segments = RemoteTreeCache::split_path(path);
        if (segments.empty())
        {
            throw std::invalid_argument("Cannot create the root folder");
        }
        return submit([this, segments]()
                      {
            const auto parent = resolve_folder(parent_path_of(segments));
            auto folder = authority_->create_folder(sessions_.token(), parent.id, segments.back());
            cache_.apply(NodeEvent{.kind = NodeEventKind::Added, .node = folder});
            logger_.log("client", "created folder ", folder.name, " (", folder.id, ")");
            return folder; });
    }

    std::future<void> Client::remove(std::string path)
    {
        require_path(path, "Path");
        if (RemoteTreeCache::split_path(path).empty())
        {
            throw std::invalid_argument("Cannot remove the root folder");
        }
        return submit([this, path = std::move(path)]()
                      {
            const auto node = cache_.resolve(path);
            authority_->remove(sessions_.token(), node.id);
            cache_.apply(NodeEvent{.kind = NodeEventKind::Removed, .node = node, .cascade = true});
            logger_.log("client", "removed ", path); });
    }

    std::future<Node> Client::move(std::string path, std::string new_parent_path, std::optional<std::string> new_name)
    {
        require_path(path, "Path");
        require_path(new_parent_path, "Destination folder");
        if (new_name && new_name->empty())
        {
            throw std::invalid_argument("New name must not be empty");
        }
        return submit([this, path = std::move(path), new_parent_path = std::move(new_parent_path),
                       new_name = std::move(new_name)]()
                      {
            const auto node = cache_.resolve(path);
            const auto parent = resolve_folder(new_parent_path);
            auto moved = authority_->move(sessions_.token(), node.id, parent.id, new_name);
            cache_.apply(NodeEvent{.kind = NodeEventKind::Updated, .node = moved});
            return moved; });
    }

    std::future<Node> Client::copy(std::string path, std::string new_parent_path, std::optional<std::string> new_name)
    {
        require_path(path, "Path");
        require_path(new_parent_path, "Destination folder");
        if (new_name && new_name->empty())
        {
            throw std::invalid_argument("New name must not be empty");
        }
        return submit([this, path = std::move(path), new_parent_path = std::move(new_parent_path),
                       new_name = std::move(new_name)]()
                      {
            const auto node = cache_.resolve(path);
            const auto parent = resolve_folder(new_parent_path);
            auto copied = authority_->copy(sessions_.token(), node.id, parent.id, new_name);
            cache_.apply(NodeEvent{.kind = NodeEventKind::Added, .node = copied});
            logger_.log("client", "copied ", path, " to ", copied.name, " (", copied.id, ")");
            return copied; });
    }

    std::future<std::shared_ptr<Transfer>> Client::stream_file(std::string remote_path, TransferEngine::StreamSink sink,
                                                               std::uint64_t offset, std::optional<std::uint64_t> limit,
                                                               ProgressCallback progress)
    {
        require_path(remote_path, "Remote path");
        if (!sink)
        {
            throw std::invalid_argument("A stream needs a sink");
        }
        return submit([this, remote_path = std::move(remote_path), sink = std::move(sink), offset, limit,
                       progress = std::move(progress)]()
                      {
            const auto node = cache_.resolve(remote_path);
            if (node.is_folder())
            {
                throw std::invalid_argument("Cannot stream a folder: " + remote_path);
            }
            return engine_->stream(node, sink, offset, limit, progress); });
    }

    std::future<std::shared_ptr<Transfer>> Client::download_file(std::string remote_path,
                                                                 std::filesystem::path local_path,
                                                                 ProgressCallback progress)
    {
        require_path(remote_path, "Remote path");
        if (local_path.empty())
        {
            throw std::invalid_argument("Local path must not be empty");
        }
        return submit([this, remote_path = std::move(remote_path), local_path = std::move(local_path),
                       progress = std::move(progress)]()
                      {
            const auto node = cache_.resolve(remote_path);
            if (node.is_folder())
            {
                throw std::invalid_argument("Cannot download a folder: " + remote_path);
            }
            auto destination = local_path;
            if (std::filesystem::is_directory(destination))
            {
                destination /= node.name;
            }
            return engine_->download(node, destination, progress); });
    }

    std::future<std::shared_ptr<Transfer>> Client::upload_file(std::filesystem::path local_path,
                                                               std::string remote_path, ProgressCallback progress)
    {
        if (local_path.empty())
        {
            throw std::invalid_argument("Local path must not be empty");
        }
        require_path(remote_path, "Remote path");
        if (!std::filesystem::is_regular_file(local_path))
        {
            throw std::invalid_argument("Not a regular file: " + local_path.string());
        }
        return submit([this, local_path = std::move(local_path), remote_path = std::move(remote_path),
                       progress = std::move(progress)]()
                      {
            const auto segments = RemoteTreeCache::split_path(remote_path);
            std::optional<Node> existing;
            try
            {
                existing = cache_.resolve(remote_path);
            }
            catch (const NotFoundError &)
            {
                // New file name.
            }
            if (existing && existing->is_folder())
            {
                return engine_->upload(local_path, *existing, progress);
            }
            // A new name, or a replacement of an existing file, inside the parent folder.
            const auto parent = resolve_folder(parent_path_of(segments));
            return engine_->upload(local_path, parent, progress, std::nullopt, segments.back()); });
    }

    std::future<std::uint64_t> Client::free_space()
    {
        return submit([this]()
                      { return authority_->quota(sessions_.token()).free_bytes(); });
    }

    std::future<Quota> Client::account_details()
    {
        return submit([this]()
                      { return authority_->quota(sessions_.token()); });
    }

    bool Client::is_logged_in() const
    {
        return sessions_.logged_in();
    }

    std::shared_future<void> Client::ready() const
    {
        std::lock_guard lock(mutex_);
        if (!ready_)
        {
            throw AuthError(AuthError::Reason::NotAuthenticated, "Not logged in");
        }
        return *ready_;
    }

    std::vector<TransferStateStore::Record> Client::pending_transfers() const
    {
        if (!state_store_)
        {
            return {};
        }
        return state_store_->pending_for_identity(sessions_.current().user_id);
    }

    void Client::discard_pending_transfers()
    {
        if (state_store_)
        {
            state_store_->discard_identity(sessions_.current().user_id);
        }
    }

    void Client::on_login(const Session &session)
    {
        auto primed = std::make_shared<std::promise<void>>();
        {
            std::lock_guard lock(mutex_);
            ready_ = primed->get_future().share();
        }
        logger_.debug("client", "priming tree cache for ", session.user_id);
        asio::post(io_, [this, primed]()
                   {
            try
            {
                cache_.prime();
                primed->set_value();
            }
            catch (const std::exception &ex)
            {
                logger_.warn("client", "tree cache priming failed: ", ex.what());
                primed->set_exception(std::current_exception());
            } });
    }

    Node Client::resolve_folder(const std::string &path)
    {
        auto node = cache_.resolve(path);
        if (!node.is_folder())
        {
            throw NotFoundError("Not a folder: " + path);
        }
        return node;
    }

    ClientScope::ClientScope(Client &client)
        : client_(client)
    {
        client_.connect();
    }

    ClientScope::~ClientScope()
    {
        client_.disconnect();
    }

} // namespace nimbus::client
