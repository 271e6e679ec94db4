#include "nimbus/client/node.hpp"

namespace nimbus::client
{

    namespace
    {
        NodeType from_kind(protocol::NodeKind kind) noexcept
        {
            switch (kind)
            {
            case protocol::NodeKind::Folder:
                return NodeType::Folder;
            case protocol::NodeKind::Root:
                return NodeType::Root;
            case protocol::NodeKind::File:
                break;
            }
            return NodeType::File;
        }

        protocol::NodeKind to_kind(NodeType type) noexcept
        {
            switch (type)
            {
            case NodeType::Folder:
                return protocol::NodeKind::Folder;
            case NodeType::Root:
                return protocol::NodeKind::Root;
            case NodeType::File:
                break;
            }
            return protocol::NodeKind::File;
        }
    } // namespace

    std::string_view to_string(NodeType type) noexcept
    {
        switch (type)
        {
        case NodeType::File:
            return "file";
        case NodeType::Folder:
            return "folder";
        case NodeType::Root:
            return "root";
        }
        return "unknown";
    }

    Node node_from_record(const protocol::NodeRecord &record)
    {
        return Node{
            .id = record.id,
            .parent_id = record.parent_id,
            .name = record.name,
            .type = from_kind(record.kind),
            .size = record.size,
            .content_key = record.content_key,
            .modification_time = record.modified_time,
        };
    }

    protocol::NodeRecord to_record(const Node &node)
    {
        return protocol::NodeRecord{
            .id = node.id,
            .parent_id = node.parent_id,
            .name = node.name,
            .kind = to_kind(node.type),
            .size = node.size,
            .content_key = node.content_key,
            .modified_time = node.modification_time,
        };
    }

} // namespace nimbus::client
