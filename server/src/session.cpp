#include "nimbus/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <span>
#include <stdexcept>
#include <string>

#include "nimbus/framing.hpp"
#include "nimbus/server/store_error.hpp"

namespace nimbus::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services) {}

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = protocol::decode_frame_size(
                                     std::span<const std::uint8_t, protocol::kFrameHeaderSize>(header_buffer_));
                             }
                             catch (const std::length_error &ex)
                             {
                                 spdlog::warn("{} sent an oversized frame: {}", remote_endpoint(), ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             nlohmann::json json;
                             try
                             {
                                 const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
                                 json = nlohmann::json::parse(payload);
                             }
                             catch (const nlohmann::json::exception &ex)
                             {
                                 send_error(ErrorCode::InvalidPayload, ex.what());
                                 return;
                             }
                             process_message(json);
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            std::optional<std::string> request_id;
            if (json.is_object() && json.contains("id") && json["id"].is_string())
            {
                request_id = json["id"].get<std::string>();
            }
            send_error(ErrorCode::InvalidCommand, ex.what(), request_id);
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), protocol::to_string(envelope.command));

        try
        {
            dispatch(envelope);
        }
        catch (const StoreError &ex)
        {
            spdlog::debug("{} {} failed: {}", remote_endpoint(), protocol::to_string(envelope.command), ex.what());
            send_error(ex.code(), ex.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::invalid_argument &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} {} failed: {}", remote_endpoint(), protocol::to_string(envelope.command), ex.what());
            send_error(ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::dispatch(const protocol::RequestEnvelope &envelope)
    {
        switch (envelope.command)
        {
        case protocol::Command::Ping:
            send_ok(nlohmann::json::object(), envelope.request_id);
            break;
        case protocol::Command::Authenticate:
            handle_authenticate(envelope);
            break;
        case protocol::Command::Register:
            handle_register(envelope);
            break;
        case protocol::Command::RefreshSession:
            handle_refresh(envelope);
            break;
        case protocol::Command::Logout:
            handle_logout(envelope);
            break;
        case protocol::Command::FetchRoot:
            handle_fetch_root(envelope);
            break;
        case protocol::Command::ListChildren:
            handle_list_children(envelope);
            break;
        case protocol::Command::CreateFolder:
            handle_create_folder(envelope);
            break;
        case protocol::Command::Remove:
            handle_remove(envelope);
            break;
        case protocol::Command::Move:
            handle_move(envelope);
            break;
        case protocol::Command::Copy:
            handle_copy(envelope);
            break;
        case protocol::Command::Quota:
            handle_quota(envelope);
            break;
        case protocol::Command::UploadInit:
            handle_upload_init(envelope);
            break;
        case protocol::Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case protocol::Command::UploadCommit:
            handle_upload_commit(envelope);
            break;
        case protocol::Command::DownloadInit:
            handle_download_init(envelope);
            break;
        case protocol::Command::DownloadChunk:
            handle_download_chunk(envelope);
            break;
        default:
            send_error(ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    // The next request is read only once the response is on the wire, so a
    // connection never has two writes in flight.
    void Session::send_response(const protocol::ResponseEnvelope &envelope)
    {
        auto frame = std::make_shared<std::vector<std::uint8_t>>(protocol::encode_frame(nlohmann::json(envelope)));
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              read_frame_header();
                          });
    }

    void Session::send_ok(nlohmann::json payload, const std::optional<std::string> &request_id)
    {
        protocol::ResponseEnvelope envelope;
        envelope.kind = protocol::ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.request_id = request_id;
        send_response(envelope);
    }

    void Session::send_error(ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        protocol::ResponseEnvelope envelope;
        envelope.kind = protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    std::string Session::require_user(const protocol::RequestEnvelope &envelope)
    {
        if (!envelope.session_token || envelope.session_token->empty())
        {
            throw StoreError(ErrorCode::AuthenticationRequired, "Authentication required");
        }
        return services_.tokens.validate(*envelope.session_token);
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "<unknown>";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace nimbus::server
