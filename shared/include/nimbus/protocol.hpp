/**
 * Nimbus - Wire protocol schema and serialization helpers.
 *
 * Every request travels in a RequestEnvelope carrying the command label, the
 * command payload and, once authenticated, the session token. Binary data is
 * base64 encoded. Offsets in chunk requests are offsets into the encrypted
 * representation of a file.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "nimbus/error_codes.hpp"

namespace nimbus::protocol
{

    enum class Command : std::uint8_t
    {
        Authenticate,
        Register,
        RefreshSession,
        Logout,
        FetchRoot,
        ListChildren,
        CreateFolder,
        Remove,
        Move,
        Copy,
        UploadInit,
        UploadChunk,
        UploadCommit,
        DownloadInit,
        DownloadChunk,
        Quota,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
        std::optional<std::string> session_token{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    enum class NodeKind : std::uint8_t
    {
        File,
        Folder,
        Root
    };

    std::string_view to_string(NodeKind kind) noexcept;
    std::optional<NodeKind> node_kind_from_string(std::string_view value) noexcept;

    struct NodeRecord
    {
        std::string id;
        std::optional<std::string> parent_id{};
        std::string name;
        NodeKind kind{NodeKind::File};
        std::uint64_t size{};
        std::string content_key{};
        std::uint64_t modified_time{};
    };

    void to_json(nlohmann::json &json, const NodeRecord &record);
    void from_json(const nlohmann::json &json, NodeRecord &record);

    struct AuthenticateRequest
    {
        std::string username;
        std::string password;
    };

    void to_json(nlohmann::json &json, const AuthenticateRequest &request);
    void from_json(const nlohmann::json &json, AuthenticateRequest &request);

    struct RegisterRequest
    {
        std::string username;
        std::string password;
        std::string salt;
        std::string wrapped_master_key;
        std::uint64_t opslimit{};
        std::uint64_t memlimit{};
    };

    void to_json(nlohmann::json &json, const RegisterRequest &request);
    void from_json(const nlohmann::json &json, RegisterRequest &request);

    struct SessionGrant
    {
        std::string user_id;
        std::string session_token;
        std::uint64_t expires_at{};
        std::string salt;
        std::string wrapped_master_key;
        std::uint64_t opslimit{};
        std::uint64_t memlimit{};
    };

    void to_json(nlohmann::json &json, const SessionGrant &grant);
    void from_json(const nlohmann::json &json, SessionGrant &grant);

    struct NodeRequest
    {
        std::string node_id;
    };

    void to_json(nlohmann::json &json, const NodeRequest &request);
    void from_json(const nlohmann::json &json, NodeRequest &request);

    struct ListChildrenResponse
    {
        std::vector<NodeRecord> entries;
    };

    void to_json(nlohmann::json &json, const ListChildrenResponse &response);
    void from_json(const nlohmann::json &json, ListChildrenResponse &response);

    struct CreateFolderRequest
    {
        std::string parent_id;
        std::string name;
    };

    void to_json(nlohmann::json &json, const CreateFolderRequest &request);
    void from_json(const nlohmann::json &json, CreateFolderRequest &request);

    struct MoveRequest
    {
        std::string node_id;
        std::string new_parent_id;
        std::optional<std::string> new_name{};
    };

    void to_json(nlohmann::json &json, const MoveRequest &request);
    void from_json(const nlohmann::json &json, MoveRequest &request);

    // Same fields as a move: the source node, the destination folder and an optional new name.
    using CopyRequest = MoveRequest;

    struct UploadInitRequest
    {
        std::string parent_id;
        std::string name;
        std::uint64_t size{};
        std::uint64_t encrypted_size{};
        std::uint64_t chunk_size{};
        std::optional<std::string> resume_id{};
    };

    void to_json(nlohmann::json &json, const UploadInitRequest &request);
    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadTarget
    {
        std::string upload_id;
        std::uint64_t chunk_size{};
        bool resumed{};
    };

    void to_json(nlohmann::json &json, const UploadTarget &target);
    void from_json(const nlohmann::json &json, UploadTarget &target);

    struct UploadChunkRequest
    {
        std::string upload_id;
        std::uint64_t offset{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadCommitRequest
    {
        std::string upload_id;
        std::string content_key;
        std::string content_mac;
    };

    void to_json(nlohmann::json &json, const UploadCommitRequest &request);
    void from_json(const nlohmann::json &json, UploadCommitRequest &request);

    struct DownloadTicket
    {
        std::string download_id;
        std::string node_id;
        std::uint64_t size{};
        std::uint64_t encrypted_size{};
        std::uint64_t chunk_size{};
        std::string content_key;
        std::string content_mac;
    };

    void to_json(nlohmann::json &json, const DownloadTicket &ticket);
    void from_json(const nlohmann::json &json, DownloadTicket &ticket);

    struct DownloadChunkRequest
    {
        std::string download_id;
        std::uint64_t offset{};
        std::uint64_t length{};
    };

    void to_json(nlohmann::json &json, const DownloadChunkRequest &request);
    void from_json(const nlohmann::json &json, DownloadChunkRequest &request);

    struct DownloadChunkResponse
    {
        std::string download_id;
        std::uint64_t offset{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const DownloadChunkResponse &response);
    void from_json(const nlohmann::json &json, DownloadChunkResponse &response);

    struct QuotaResponse
    {
        std::uint64_t used_bytes{};
        std::uint64_t total_bytes{};
    };

    void to_json(nlohmann::json &json, const QuotaResponse &response);
    void from_json(const nlohmann::json &json, QuotaResponse &response);

} // namespace nimbus::protocol
