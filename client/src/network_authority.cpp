#include "nimbus/client/network_authority.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <stdexcept>
#include <utility>

#include "nimbus/client/errors.hpp"
#include "nimbus/encoding/base64.hpp"
#include "nimbus/framing.hpp"

namespace nimbus::client
{

    namespace
    {
        AuthGrant grant_from_wire(const protocol::SessionGrant &grant)
        {
            return AuthGrant{
                .user_id = grant.user_id,
                .session_token = grant.session_token,
                .expires_at = std::chrono::system_clock::time_point(std::chrono::seconds(grant.expires_at)),
                .salt = grant.salt,
                .wrapped_master_key = grant.wrapped_master_key,
                .limits = crypto::KdfLimits{.opslimit = grant.opslimit,
                                            .memlimit = static_cast<std::size_t>(grant.memlimit)},
            };
        }

        std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline)
        {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            return left.count() > 0 ? left : std::chrono::milliseconds(0);
        }
    } // namespace

    NetworkAuthority::NetworkAuthority(NetworkOptions options, Logger logger)
        : options_(std::move(options)),
          logger_(std::move(logger))
    {
        if (options_.max_connections == 0)
        {
            options_.max_connections = 1;
        }
    }

    NetworkAuthority::~NetworkAuthority()
    {
        disconnect();
    }

    void NetworkAuthority::connect()
    {
        rpc(protocol::Command::Ping, nlohmann::json::object(), std::nullopt);
        logger_.log("net", "connected to ", options_.host, ':', options_.port);
    }

    void NetworkAuthority::disconnect() noexcept
    {
        std::vector<std::unique_ptr<Connection>> idle;
        {
            std::lock_guard lock(mutex_);
            idle.swap(idle_);
            open_count_ -= idle.size();
        }
        for (auto &connection : idle)
        {
            std::error_code ec;
            connection->socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            connection->socket.close(ec);
        }
        available_.notify_all();
    }

    AuthGrant NetworkAuthority::authenticate(const Credentials &credentials)
    {
        const protocol::AuthenticateRequest request{.username = credentials.username,
                                                    .password = credentials.password};
        return grant_from_wire(
            rpc(protocol::Command::Authenticate, request, std::nullopt).get<protocol::SessionGrant>());
    }

    AuthGrant NetworkAuthority::register_account(const Registration &registration)
    {
        const protocol::RegisterRequest request{
            .username = registration.credentials.username,
            .password = registration.credentials.password,
            .salt = registration.salt,
            .wrapped_master_key = registration.wrapped_master_key,
            .opslimit = registration.limits.opslimit,
            .memlimit = registration.limits.memlimit,
        };
        return grant_from_wire(rpc(protocol::Command::Register, request, std::nullopt).get<protocol::SessionGrant>());
    }

    AuthGrant NetworkAuthority::refresh(const std::string &token)
    {
        return grant_from_wire(
            rpc(protocol::Command::RefreshSession, nlohmann::json::object(), token).get<protocol::SessionGrant>());
    }

    void NetworkAuthority::logout(const std::string &token)
    {
        rpc(protocol::Command::Logout, nlohmann::json::object(), token);
    }

    Node NetworkAuthority::fetch_root(const std::string &token)
    {
        return node_from_record(
            rpc(protocol::Command::FetchRoot, nlohmann::json::object(), token).get<protocol::NodeRecord>());
    }

    std::vector<Node> NetworkAuthority::fetch_children(const std::string &token, const std::string &folder_id)
    {
        const auto response = rpc(protocol::Command::ListChildren, protocol::NodeRequest{.node_id = folder_id}, token)
                                  .get<protocol::ListChildrenResponse>();
        std::vector<Node> children;
        children.reserve(response.entries.size());
        for (const auto &record : response.entries)
        {
            children.push_back(node_from_record(record));
        }
        return children;
    }

    Node NetworkAuthority::create_folder(const std::string &token, const std::string &parent_id,
                                         const std::string &name)
    {
        const protocol::CreateFolderRequest request{.parent_id = parent_id, .name = name};
        return node_from_record(rpc(protocol::Command::CreateFolder, request, token).get<protocol::NodeRecord>());
    }

    void NetworkAuthority::remove(const std::string &token, const std::string &node_id)
    {
        rpc(protocol::Command::Remove, protocol::NodeRequest{.node_id = node_id}, token);
    }

    Node NetworkAuthority::move(const std::string &token, const std::string &node_id,
                                const std::string &new_parent_id, const std::optional<std::string> &new_name)
    {
        const protocol::MoveRequest request{.node_id = node_id, .new_parent_id = new_parent_id, .new_name = new_name};
        return node_from_record(rpc(protocol::Command::Move, request, token).get<protocol::NodeRecord>());
    }

    Node NetworkAuthority::copy(const std::string &token, const std::string &node_id,
                                const std::string &new_parent_id, const std::optional<std::string> &new_name)
    {
        const protocol::CopyRequest request{.node_id = node_id, .new_parent_id = new_parent_id, .new_name = new_name};
        return node_from_record(rpc(protocol::Command::Copy, request, token).get<protocol::NodeRecord>());
    }

    UploadTarget NetworkAuthority::request_upload_target(const std::string &token, const UploadRequest &request)
    {
        const protocol::UploadInitRequest wire{
            .parent_id = request.parent_id,
            .name = request.name,
            .size = request.size,
            .encrypted_size = request.encrypted_size,
            .chunk_size = request.chunk_size,
            .resume_id = request.resume_id,
        };
        const auto target = rpc(protocol::Command::UploadInit, wire, token).get<protocol::UploadTarget>();
        return UploadTarget{.upload_id = target.upload_id, .chunk_size = target.chunk_size, .resumed = target.resumed};
    }

    void NetworkAuthority::upload_chunk(const std::string &token, const std::string &upload_id,
                                        std::uint64_t encrypted_offset, std::span<const std::byte> ciphertext,
                                        std::chrono::milliseconds timeout)
    {
        const protocol::UploadChunkRequest request{
            .upload_id = upload_id,
            .offset = encrypted_offset,
            .data_base64 = encoding::encode_base64(ciphertext),
        };
        rpc(protocol::Command::UploadChunk, request, token, timeout);
    }

    Node NetworkAuthority::commit_upload(const std::string &token, const std::string &upload_id,
                                         const std::string &wrapped_key, const std::string &mac)
    {
        const protocol::UploadCommitRequest request{.upload_id = upload_id, .content_key = wrapped_key,
                                                    .content_mac = mac};
        return node_from_record(rpc(protocol::Command::UploadCommit, request, token).get<protocol::NodeRecord>());
    }

    DownloadTicket NetworkAuthority::request_download(const std::string &token, const std::string &node_id)
    {
        const auto ticket = rpc(protocol::Command::DownloadInit, protocol::NodeRequest{.node_id = node_id}, token)
                                .get<protocol::DownloadTicket>();
        return DownloadTicket{
            .download_id = ticket.download_id,
            .node_id = ticket.node_id,
            .size = ticket.size,
            .encrypted_size = ticket.encrypted_size,
            .chunk_size = ticket.chunk_size,
            .content_key = ticket.content_key,
            .content_mac = ticket.content_mac,
        };
    }

    std::vector<std::byte> NetworkAuthority::download_chunk(const std::string &token, const std::string &download_id,
                                                            std::uint64_t encrypted_offset, std::uint64_t length,
                                                            std::chrono::milliseconds timeout)
    {
        const protocol::DownloadChunkRequest request{.download_id = download_id, .offset = encrypted_offset,
                                                     .length = length};
        const auto response =
            rpc(protocol::Command::DownloadChunk, request, token, timeout).get<protocol::DownloadChunkResponse>();
        if (response.offset != encrypted_offset)
        {
            throw IntegrityError("Server answered offset " + std::to_string(response.offset) + " for a request at " +
                                 std::to_string(encrypted_offset));
        }
        try
        {
            return encoding::decode_base64(response.data_base64);
        }
        catch (const std::invalid_argument &ex)
        {
            throw IntegrityError(std::string("Malformed chunk data: ") + ex.what());
        }
    }

    Quota NetworkAuthority::quota(const std::string &token)
    {
        const auto response = rpc(protocol::Command::Quota, nlohmann::json::object(), token)
                                  .get<protocol::QuotaResponse>();
        return Quota{.used_bytes = response.used_bytes, .total_bytes = response.total_bytes};
    }

    nlohmann::json NetworkAuthority::rpc(protocol::Command command, const nlohmann::json &payload,
                                         const std::optional<std::string> &token,
                                         std::optional<std::chrono::milliseconds> timeout)
    {
        protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();
        envelope.session_token = token;

        std::vector<std::uint8_t> frame;
        try
        {
            frame = protocol::encode_frame(nlohmann::json(envelope));
        }
        catch (const std::length_error &ex)
        {
            throw RequestError(ErrorCode::InvalidPayload, ex.what());
        }

        auto connection = acquire();
        protocol::ResponseEnvelope response;
        try
        {
            response = exchange(*connection, frame, timeout.value_or(options_.request_timeout));
        }
        catch (const NetworkError &ex)
        {
            logger_.warn("rpc", protocol::to_string(command), " ", *envelope.request_id, " failed: ", ex.what());
            release(nullptr);
            throw;
        }
        catch (...)
        {
            release(nullptr);
            throw;
        }
        release(std::move(connection));

        if (response.request_id && *response.request_id != *envelope.request_id)
        {
            throw NetworkError("Response " + *response.request_id + " does not answer request " +
                                   *envelope.request_id,
                               ErrorCode::InternalError);
        }
        if (response.kind == protocol::ResponseKind::Error)
        {
            logger_.debug("rpc", protocol::to_string(command), " error=", to_string(response.error), " msg=",
                          response.message);
            throw_for_error(response.error, response.message);
        }
        logger_.debug("rpc", "success cmd=", protocol::to_string(command));
        return std::move(response.payload);
    }

    protocol::ResponseEnvelope NetworkAuthority::exchange(Connection &connection, const std::vector<std::uint8_t> &frame,
                                                          std::chrono::milliseconds timeout)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        if (!connection.socket.is_open())
        {
            open(connection, timeout);
        }

        std::error_code error;
        bool done = false;
        asio::async_write(connection.socket, asio::buffer(frame), [&](const std::error_code &ec, std::size_t)
                          { error = ec; done = true; });
        run_until(connection, done, remaining(deadline), "write");
        if (error)
        {
            throw NetworkError("Send failed: " + error.message());
        }

        std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
        done = false;
        asio::async_read(connection.socket, asio::buffer(header), [&](const std::error_code &ec, std::size_t)
                         { error = ec; done = true; });
        run_until(connection, done, remaining(deadline), "read");
        if (error)
        {
            throw NetworkError("Receive failed: " + error.message());
        }

        std::uint32_t size = 0;
        try
        {
            size = protocol::decode_frame_size(header);
        }
        catch (const std::length_error &ex)
        {
            throw NetworkError(ex.what(), ErrorCode::InternalError);
        }
        std::vector<char> buffer(size);
        done = false;
        asio::async_read(connection.socket, asio::buffer(buffer), [&](const std::error_code &ec, std::size_t)
                         { error = ec; done = true; });
        run_until(connection, done, remaining(deadline), "read");
        if (error)
        {
            throw NetworkError("Receive failed: " + error.message());
        }

        try
        {
            return nlohmann::json::parse(buffer.begin(), buffer.end()).get<protocol::ResponseEnvelope>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.warn("rpc", "parse_error size=", size, " msg=", ex.what());
            throw NetworkError("Failed to decode server response", ErrorCode::InternalError);
        }
    }

    void NetworkAuthority::open(Connection &connection, std::chrono::milliseconds timeout)
    {
        asio::ip::tcp::resolver resolver(connection.io);
        asio::ip::tcp::resolver::results_type endpoints;
        try
        {
            endpoints = resolver.resolve(options_.host, std::to_string(options_.port));
        }
        catch (const asio::system_error &ex)
        {
            throw NetworkError("Cannot resolve " + options_.host + ": " + ex.what());
        }

        std::error_code error;
        bool done = false;
        asio::async_connect(connection.socket, endpoints,
                            [&](const std::error_code &ec, const asio::ip::tcp::endpoint &)
                            { error = ec; done = true; });
        run_until(connection, done, timeout, "connect");
        if (error)
        {
            std::error_code ignored;
            connection.socket.close(ignored);
            throw NetworkError("Cannot connect to " + options_.host + ":" + std::to_string(options_.port) + ": " +
                               error.message());
        }
        connection.socket.set_option(asio::ip::tcp::no_delay(true), error);
        logger_.debug("net", "opened connection to ", options_.host, ':', options_.port);
    }

    void NetworkAuthority::run_until(Connection &connection, bool &done, std::chrono::milliseconds timeout,
                                     const char *what)
    {
        connection.io.restart();
        connection.io.run_for(timeout);
        if (done)
        {
            return;
        }
        // Abort the pending operation and let its handler run before the stack frame goes away.
        std::error_code ignored;
        connection.socket.close(ignored);
        connection.io.restart();
        connection.io.run();
        throw NetworkError(std::string("Timed out during ") + what, ErrorCode::Timeout);
    }

    std::unique_ptr<NetworkAuthority::Connection> NetworkAuthority::acquire()
    {
        std::unique_lock lock(mutex_);
        available_.wait(lock, [this]()
                        { return !idle_.empty() || open_count_ < options_.max_connections; });
        if (!idle_.empty())
        {
            auto connection = std::move(idle_.back());
            idle_.pop_back();
            return connection;
        }
        ++open_count_;
        return std::make_unique<Connection>();
    }

    void NetworkAuthority::release(std::unique_ptr<Connection> connection)
    {
        {
            std::lock_guard lock(mutex_);
            if (connection && connection->socket.is_open())
            {
                idle_.push_back(std::move(connection));
            }
            else
            {
                --open_count_;
            }
        }
        available_.notify_one();
    }

    std::string NetworkAuthority::next_request_id()
    {
        return "req-" + std::to_string(++request_counter_);
    }

} // namespace nimbus::client
