#include "nimbus/protocol.hpp"

#include <array>
#include <stdexcept>

namespace nimbus::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 17> kCommandMappings{{
            {Command::Authenticate, "AUTHENTICATE"},
            {Command::Register, "REGISTER"},
            {Command::RefreshSession, "REFRESH_SESSION"},
            {Command::Logout, "LOGOUT"},
            {Command::FetchRoot, "FETCH_ROOT"},
            {Command::ListChildren, "LIST_CHILDREN"},
            {Command::CreateFolder, "CREATE_FOLDER"},
            {Command::Remove, "REMOVE"},
            {Command::Move, "MOVE"},
            {Command::Copy, "COPY"},
            {Command::UploadInit, "UPLOAD_INIT"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadCommit, "UPLOAD_COMMIT"},
            {Command::DownloadInit, "DOWNLOAD_INIT"},
            {Command::DownloadChunk, "DOWNLOAD_CHUNK"},
            {Command::Quota, "QUOTA"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        struct NodeKindMapping
        {
            NodeKind kind;
            std::string_view label;
        };

        constexpr std::array<NodeKindMapping, 3> kNodeKindMappings{{
            {NodeKind::File, "FILE"},
            {NodeKind::Folder, "FOLDER"},
            {NodeKind::Root, "ROOT"},
        }};

        void read_optional(const nlohmann::json &json, const char *key, std::optional<std::string> &target)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                target = it->get<std::string>();
            }
            else
            {
                target.reset();
            }
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(NodeKind kind) noexcept
    {
        for (const auto &mapping : kNodeKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<NodeKind> node_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kNodeKindMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
        if (envelope.session_token)
        {
            json["token"] = *envelope.session_token;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_optional(json, "id", envelope.request_id);
        read_optional(json, "token", envelope.session_token);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_optional(json, "id", envelope.request_id);
    }

    void to_json(nlohmann::json &json, const NodeRecord &record)
    {
        json = {
            {"id", record.id},
            {"name", record.name},
            {"kind", to_string(record.kind)},
            {"size", record.size},
            {"mtime", record.modified_time},
        };
        if (record.parent_id)
        {
            json["parent"] = *record.parent_id;
        }
        if (!record.content_key.empty())
        {
            json["key"] = record.content_key;
        }
    }

    void from_json(const nlohmann::json &json, NodeRecord &record)
    {
        record.id = json.at("id").get<std::string>();
        record.name = json.value("name", std::string{});
        const auto kind_label = json.at("kind").get<std::string>();
        auto kind = node_kind_from_string(kind_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown node kind: " + kind_label);
        }
        record.kind = *kind;
        record.size = json.value("size", 0ULL);
        record.modified_time = json.value("mtime", 0ULL);
        read_optional(json, "parent", record.parent_id);
        record.content_key = json.value("key", std::string{});
    }

    void to_json(nlohmann::json &json, const AuthenticateRequest &request)
    {
        json = {
            {"username", request.username},
            {"password", request.password},
        };
    }

    void from_json(const nlohmann::json &json, AuthenticateRequest &request)
    {
        request.username = json.value("username", std::string{});
        request.password = json.value("password", std::string{});
    }

    void to_json(nlohmann::json &json, const RegisterRequest &request)
    {
        json = {
            {"username", request.username},
            {"password", request.password},
            {"salt", request.salt},
            {"master_key", request.wrapped_master_key},
            {"opslimit", request.opslimit},
            {"memlimit", request.memlimit},
        };
    }

    void from_json(const nlohmann::json &json, RegisterRequest &request)
    {
        request.username = json.value("username", std::string{});
        request.password = json.value("password", std::string{});
        request.salt = json.at("salt").get<std::string>();
        request.wrapped_master_key = json.at("master_key").get<std::string>();
        request.opslimit = json.value("opslimit", 0ULL);
        request.memlimit = json.value("memlimit", 0ULL);
    }

    void to_json(nlohmann::json &json, const SessionGrant &grant)
    {
        json = {
            {"user_id", grant.user_id},
            {"token", grant.session_token},
            {"expires_at", grant.expires_at},
            {"salt", grant.salt},
            {"master_key", grant.wrapped_master_key},
            {"opslimit", grant.opslimit},
            {"memlimit", grant.memlimit},
        };
    }

    void from_json(const nlohmann::json &json, SessionGrant &grant)
    {
        grant.user_id = json.at("user_id").get<std::string>();
        grant.session_token = json.at("token").get<std::string>();
        grant.expires_at = json.value("expires_at", 0ULL);
        grant.salt = json.value("salt", std::string{});
        grant.wrapped_master_key = json.value("master_key", std::string{});
        grant.opslimit = json.value("opslimit", 0ULL);
        grant.memlimit = json.value("memlimit", 0ULL);
    }

    void to_json(nlohmann::json &json, const NodeRequest &request)
    {
        json = {{"node", request.node_id}};
    }

    void from_json(const nlohmann::json &json, NodeRequest &request)
    {
        request.node_id = json.at("node").get<std::string>();
    }

    void to_json(nlohmann::json &json, const ListChildrenResponse &response)
    {
        json = {{"entries", response.entries}};
    }

    void from_json(const nlohmann::json &json, ListChildrenResponse &response)
    {
        response.entries = json.value("entries", std::vector<NodeRecord>{});
    }

    void to_json(nlohmann::json &json, const CreateFolderRequest &request)
    {
        json = {
            {"parent", request.parent_id},
            {"name", request.name},
        };
    }

    void from_json(const nlohmann::json &json, CreateFolderRequest &request)
    {
        request.parent_id = json.at("parent").get<std::string>();
        request.name = json.at("name").get<std::string>();
    }

    void to_json(nlohmann::json &json, const MoveRequest &request)
    {
        json = {
            {"node", request.node_id},
            {"parent", request.new_parent_id},
        };
        if (request.new_name)
        {
            json["name"] = *request.new_name;
        }
    }

    void from_json(const nlohmann::json &json, MoveRequest &request)
    {
        request.node_id = json.at("node").get<std::string>();
        request.new_parent_id = json.at("parent").get<std::string>();
        read_optional(json, "name", request.new_name);
    }

    void to_json(nlohmann::json &json, const UploadInitRequest &request)
    {
        json = {
            {"parent", request.parent_id},
            {"name", request.name},
            {"size", request.size},
            {"encrypted_size", request.encrypted_size},
            {"chunk_size", request.chunk_size},
        };
        if (request.resume_id)
        {
            json["resume"] = *request.resume_id;
        }
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        request.parent_id = json.at("parent").get<std::string>();
        request.name = json.at("name").get<std::string>();
        request.size = json.value("size", 0ULL);
        request.encrypted_size = json.value("encrypted_size", 0ULL);
        request.chunk_size = json.value("chunk_size", 0ULL);
        read_optional(json, "resume", request.resume_id);
    }

    void to_json(nlohmann::json &json, const UploadTarget &target)
    {
        json = {
            {"upload_id", target.upload_id},
            {"chunk_size", target.chunk_size},
            {"resumed", target.resumed},
        };
    }

    void from_json(const nlohmann::json &json, UploadTarget &target)
    {
        target.upload_id = json.at("upload_id").get<std::string>();
        target.chunk_size = json.value("chunk_size", 0ULL);
        target.resumed = json.value("resumed", false);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"upload_id", request.upload_id},
            {"offset", request.offset},
            {"data", request.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
        request.offset = json.value("offset", 0ULL);
        request.data_base64 = json.value("data", std::string{});
    }

    void to_json(nlohmann::json &json, const UploadCommitRequest &request)
    {
        json = {
            {"upload_id", request.upload_id},
            {"key", request.content_key},
            {"mac", request.content_mac},
        };
    }

    void from_json(const nlohmann::json &json, UploadCommitRequest &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
        request.content_key = json.at("key").get<std::string>();
        request.content_mac = json.at("mac").get<std::string>();
    }

    void to_json(nlohmann::json &json, const DownloadTicket &ticket)
    {
        json = {
            {"download_id", ticket.download_id},
            {"node", ticket.node_id},
            {"size", ticket.size},
            {"encrypted_size", ticket.encrypted_size},
            {"chunk_size", ticket.chunk_size},
            {"key", ticket.content_key},
            {"mac", ticket.content_mac},
        };
    }

    void from_json(const nlohmann::json &json, DownloadTicket &ticket)
    {
        ticket.download_id = json.at("download_id").get<std::string>();
        ticket.node_id = json.value("node", std::string{});
        ticket.size = json.value("size", 0ULL);
        ticket.encrypted_size = json.value("encrypted_size", 0ULL);
        ticket.chunk_size = json.value("chunk_size", 0ULL);
        ticket.content_key = json.value("key", std::string{});
        ticket.content_mac = json.value("mac", std::string{});
    }

    void to_json(nlohmann::json &json, const DownloadChunkRequest &request)
    {
        json = {
            {"download_id", request.download_id},
            {"offset", request.offset},
            {"length", request.length},
        };
    }

    void from_json(const nlohmann::json &json, DownloadChunkRequest &request)
    {
        request.download_id = json.at("download_id").get<std::string>();
        request.offset = json.value("offset", 0ULL);
        request.length = json.value("length", 0ULL);
    }

    void to_json(nlohmann::json &json, const DownloadChunkResponse &response)
    {
        json = {
            {"download_id", response.download_id},
            {"offset", response.offset},
            {"data", response.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, DownloadChunkResponse &response)
    {
        response.download_id = json.value("download_id", std::string{});
        response.offset = json.value("offset", 0ULL);
        response.data_base64 = json.value("data", std::string{});
    }

    void to_json(nlohmann::json &json, const QuotaResponse &response)
    {
        json = {
            {"used", response.used_bytes},
            {"total", response.total_bytes},
        };
    }

    void from_json(const nlohmann::json &json, QuotaResponse &response)
    {
        response.used_bytes = json.value("used", 0ULL);
        response.total_bytes = json.value("total", 0ULL);
    }

} // namespace nimbus::protocol
