#include "nimbus/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "nimbus/encoding/base64.hpp"
#include "nimbus/server/store_error.hpp"

namespace nimbus::server
{

    void Session::handle_download_init(const protocol::RequestEnvelope &envelope)
    {
        const auto user_id = require_user(envelope);
        services_.transfers.cleanup_expired(services_.upload_timeout);
        const auto request = envelope.payload.get<protocol::NodeRequest>();
        const auto node = services_.nodes.get(user_id, request.node_id);
        if (node.record.kind != protocol::NodeKind::File)
        {
            throw StoreError(ErrorCode::InvalidPayload, "Not a file: " + node.record.name);
        }
        const auto state = services_.transfers.open_download(user_id, node.record.id,
                                                             services_.nodes.blob_path(node.record.id),
                                                             node.encrypted_size);
        protocol::DownloadTicket ticket{
            .download_id = state.download_id,
            .node_id = node.record.id,
            .size = node.record.size,
            .encrypted_size = node.encrypted_size,
            .chunk_size = node.chunk_size,
            .content_key = node.record.content_key,
            .content_mac = node.content_mac,
        };
        spdlog::debug("User {} opened download {} for {}", user_id, state.download_id, node.record.id);
        send_ok(ticket, envelope.request_id);
    }

    void Session::handle_download_chunk(const protocol::RequestEnvelope &envelope)
    {
        const auto user_id = require_user(envelope);
        const auto request = envelope.payload.get<protocol::DownloadChunkRequest>();
        const auto data = services_.transfers.read_chunk(user_id, request.download_id, request.offset, request.length);
        protocol::DownloadChunkResponse response{
            .download_id = request.download_id,
            .offset = request.offset,
            .data_base64 = encoding::encode_base64(data),
        };
        send_ok(response, envelope.request_id);
    }

} // namespace nimbus::server
