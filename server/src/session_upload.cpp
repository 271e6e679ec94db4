#include "nimbus/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "nimbus/encoding/base64.hpp"
#include "nimbus/server/store_error.hpp"

namespace nimbus::server
{

    void Session::handle_upload_init(const protocol::RequestEnvelope &envelope)
    {
        const auto user_id = require_user(envelope);
        services_.transfers.cleanup_expired(services_.upload_timeout);
        const auto request = envelope.payload.get<protocol::UploadInitRequest>();
        NodeStore::validate_name(request.name);

        // A file of the same name is replaced on commit, so its bytes do not count against the quota.
        std::uint64_t replaced_bytes = 0;
        for (const auto &child : services_.nodes.children(user_id, request.parent_id))
        {
            if (child.name != request.name)
            {
                continue;
            }
            if (child.kind != protocol::NodeKind::File)
            {
                throw StoreError(ErrorCode::Conflict, "A folder named " + request.name + " already exists");
            }
            replaced_bytes = services_.nodes.get(user_id, child.id).encrypted_size;
        }
        services_.nodes.reserve(user_id, request.encrypted_size, replaced_bytes);

        const auto info = services_.transfers.create_or_resume(user_id, UploadSpec{
                                                                            .parent_id = request.parent_id,
                                                                            .name = request.name,
                                                                            .size = request.size,
                                                                            .encrypted_size = request.encrypted_size,
                                                                            .chunk_size = request.chunk_size,
                                                                            .resume_id = request.resume_id,
                                                                        });
        spdlog::info("User {} {} upload {} of {} ({} bytes)", user_id, info.resumed ? "resumed" : "started",
                     info.state.upload_id, request.name, request.size);
        protocol::UploadTarget target{
            .upload_id = info.state.upload_id,
            .chunk_size = info.state.chunk_size,
            .resumed = info.resumed,
        };
        send_ok(target, envelope.request_id);
    }

    void Session::handle_upload_chunk(const protocol::RequestEnvelope &envelope)
    {
        const auto user_id = require_user(envelope);
        const auto request = envelope.payload.get<protocol::UploadChunkRequest>();
        const auto data = encoding::decode_base64(request.data_base64);
        services_.transfers.write_chunk(user_id, request.upload_id, request.offset, data);
        nlohmann::json payload;
        payload["bytes"] = data.size();
        send_ok(std::move(payload), envelope.request_id);
    }

    void Session::handle_upload_commit(const protocol::RequestEnvelope &envelope)
    {
        const auto user_id = require_user(envelope);
        const auto request = envelope.payload.get<protocol::UploadCommitRequest>();
        if (request.content_key.empty() || request.content_mac.empty())
        {
            throw StoreError(ErrorCode::InvalidPayload, "content_key and content_mac are required");
        }
        const auto state = services_.transfers.finish(user_id, request.upload_id);
        protocol::NodeRecord record;
        try
        {
            record = services_.nodes.commit_file(user_id, FileCommit{
                                                              .parent_id = state.parent_id,
                                                              .name = state.name,
                                                              .size = state.size,
                                                              .encrypted_size = state.encrypted_size,
                                                              .chunk_size = state.chunk_size,
                                                              .content_key = request.content_key,
                                                              .content_mac = request.content_mac,
                                                              .staged_blob = state.temp_path,
                                                          });
        }
        catch (const StoreError &)
        {
            std::error_code ec;
            std::filesystem::remove(state.temp_path, ec);
            throw;
        }
        spdlog::info("User {} committed {} as {}", user_id, state.name, record.id);
        send_ok(record, envelope.request_id);
    }

} // namespace nimbus::server
