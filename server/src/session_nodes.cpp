#include "nimbus/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace nimbus::server
{

    void Session::handle_fetch_root(const protocol::RequestEnvelope &envelope)
    {
        const auto user_id = require_user(envelope);
        send_ok(services_.nodes.root_of(user_id), envelope.request_id);
    }

    void Session::handle_list_children(const protocol::RequestEnvelope &envelope)
    {
        const auto user_id = require_user(envelope);
        const auto request = envelope.payload.get<protocol::NodeRequest>();
        protocol::ListChildrenResponse response{.entries = services_.nodes.children(user_id, request.node_id)};
        send_ok(response, envelope.request_id);
    }

    void Session::handle_create_folder(const protocol::RequestEnvelope &envelope)
    {
        const auto user_id = require_user(envelope);
        const auto request = envelope.payload.get<protocol::CreateFolderRequest>();
        const auto folder = services_.nodes.create_folder(user_id, request.parent_id, request.name);
        spdlog::debug("User {} created folder {}", user_id, folder.id);
        send_ok(folder, envelope.request_id);
    }

    void Session::handle_remove(const protocol::RequestEnvelope &envelope)
    {
        const auto user_id = require_user(envelope);
        const auto request = envelope.payload.get<protocol::NodeRequest>();
        services_.nodes.remove(user_id, request.node_id);
        spdlog::debug("User {} removed {}", user_id, request.node_id);
        send_ok(nlohmann::json::object(), envelope.request_id);
    }

    void Session::handle_move(const protocol::RequestEnvelope &envelope)
    {
        const auto user_id = require_user(envelope);
        const auto request = envelope.payload.get<protocol::MoveRequest>();
        send_ok(services_.nodes.move(user_id, request.node_id, request.new_parent_id, request.new_name),
                envelope.request_id);
    }

    void Session::handle_copy(const protocol::RequestEnvelope &envelope)
    {
        const auto user_id = require_user(envelope);
        const auto request = envelope.payload.get<protocol::CopyRequest>();
        const auto copy = services_.nodes.copy(user_id, request.node_id, request.new_parent_id, request.new_name);
        spdlog::debug("User {} copied {} to {}", user_id, request.node_id, copy.id);
        send_ok(copy, envelope.request_id);
    }

    void Session::handle_quota(const protocol::RequestEnvelope &envelope)
    {
        const auto user_id = require_user(envelope);
        protocol::QuotaResponse response{
            .used_bytes = services_.nodes.used_bytes(user_id),
            .total_bytes = services_.nodes.quota_bytes(),
        };
        send_ok(response, envelope.request_id);
    }

} // namespace nimbus::server
