#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "nimbus/protocol.hpp"

namespace nimbus::client
{

    enum class NodeType
    {
        File,
        Folder,
        Root
    };

    std::string_view to_string(NodeType type) noexcept;

    // A remote filesystem entry. parent_id is a lookup key, never an owning edge.
    struct Node
    {
        std::string id;
        std::optional<std::string> parent_id;
        std::string name;
        NodeType type{NodeType::File};
        std::uint64_t size{};
        std::string content_key; // base64 of the file key wrapped by the master key
        std::uint64_t modification_time{};

        bool is_folder() const noexcept { return type != NodeType::File; }
    };

    Node node_from_record(const protocol::NodeRecord &record);

    protocol::NodeRecord to_record(const Node &node);

} // namespace nimbus::client
