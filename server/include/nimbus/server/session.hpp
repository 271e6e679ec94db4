#pragma once

#include <asio/ip/tcp.hpp>

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nimbus/error_codes.hpp"
#include "nimbus/protocol.hpp"
#include "nimbus/server/node_store.hpp"
#include "nimbus/server/token_registry.hpp"
#include "nimbus/server/transfer_registry.hpp"
#include "nimbus/server/user_store.hpp"

namespace nimbus::server
{

    struct ServerServices
    {
        NodeStore &nodes;
        TokenRegistry &tokens;
        UserStore &users;
        TransferRegistry &transfers;
        std::chrono::seconds upload_timeout;
    };

    // One client connection. Requests are served one at a time; each carries its own session token.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void dispatch(const protocol::RequestEnvelope &envelope);
        void send_response(const protocol::ResponseEnvelope &envelope);
        void send_ok(nlohmann::json payload, const std::optional<std::string> &request_id);
        void send_error(ErrorCode code, std::string message, std::optional<std::string> request_id = std::nullopt);

        // Returns the user id behind the envelope's token.
        std::string require_user(const protocol::RequestEnvelope &envelope);

        void handle_authenticate(const protocol::RequestEnvelope &envelope);
        void handle_register(const protocol::RequestEnvelope &envelope);
        void handle_refresh(const protocol::RequestEnvelope &envelope);
        void handle_logout(const protocol::RequestEnvelope &envelope);

        void handle_fetch_root(const protocol::RequestEnvelope &envelope);
        void handle_list_children(const protocol::RequestEnvelope &envelope);
        void handle_create_folder(const protocol::RequestEnvelope &envelope);
        void handle_remove(const protocol::RequestEnvelope &envelope);
        void handle_move(const protocol::RequestEnvelope &envelope);
        void handle_copy(const protocol::RequestEnvelope &envelope);
        void handle_quota(const protocol::RequestEnvelope &envelope);

        void handle_upload_init(const protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const protocol::RequestEnvelope &envelope);
        void handle_upload_commit(const protocol::RequestEnvelope &envelope);
        void handle_download_init(const protocol::RequestEnvelope &envelope);
        void handle_download_chunk(const protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;

        std::array<std::uint8_t, 4> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        bool stopped_{false};
    };

} // namespace nimbus::server
