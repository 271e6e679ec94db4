/**
 * Nimbus - Per-user node tree and encrypted blob storage.
 *
 * The tree is an index of NodeRecords persisted as one JSON document; file
 * contents live as ciphertext blobs named after their node id. The server
 * never sees plaintext or unwrapped keys.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "nimbus/protocol.hpp"

namespace nimbus::server
{

    struct StoredNode
    {
        protocol::NodeRecord record;
        std::string owner;
        std::uint64_t encrypted_size{};
        std::uint64_t chunk_size{};
        std::string content_mac;
    };

    // What a committed upload contributes to the tree.
    struct FileCommit
    {
        std::string parent_id;
        std::string name;
        std::uint64_t size{};
        std::uint64_t encrypted_size{};
        std::uint64_t chunk_size{};
        std::string content_key;
        std::string content_mac;
        std::filesystem::path staged_blob;
    };

    class NodeStore
    {
    public:
        NodeStore(std::filesystem::path root_directory, std::uint64_t quota_bytes);

        // Creates the user's root folder on first use.
        protocol::NodeRecord root_of(const std::string &user_id);

        std::vector<protocol::NodeRecord> children(const std::string &user_id, const std::string &folder_id) const;

        StoredNode get(const std::string &user_id, const std::string &node_id) const;

        protocol::NodeRecord create_folder(const std::string &user_id, const std::string &parent_id,
                                           const std::string &name);

        // Removes the node and everything below it, blobs included.
        void remove(const std::string &user_id, const std::string &node_id);

        protocol::NodeRecord move(const std::string &user_id, const std::string &node_id,
                                  const std::string &new_parent_id, const std::optional<std::string> &new_name);

        // Duplicates the node, and a folder's whole subtree, under new_parent_id. File blobs are
        // copied byte for byte, so the wrapped content keys stay valid. Counts against the quota.
        protocol::NodeRecord copy(const std::string &user_id, const std::string &node_id,
                                  const std::string &new_parent_id, const std::optional<std::string> &new_name);

        // Moves the staged blob into place. An existing file of the same name is replaced.
        protocol::NodeRecord commit_file(const std::string &user_id, const FileCommit &commit);

        std::filesystem::path blob_path(const std::string &node_id) const;

        std::uint64_t used_bytes(const std::string &user_id) const;
        std::uint64_t quota_bytes() const noexcept { return quota_bytes_; }

        // Throws StoreError(QuotaExceeded) when adding bytes would exceed the user's quota.
        void reserve(const std::string &user_id, std::uint64_t bytes, std::uint64_t replaced_bytes = 0) const;

        static void validate_name(const std::string &name);

    private:
        StoredNode &require_locked(const std::string &user_id, const std::string &node_id);
        const StoredNode &require_locked(const std::string &user_id, const std::string &node_id) const;
        StoredNode &require_folder_locked(const std::string &user_id, const std::string &node_id);
        std::optional<std::string> child_named_locked(const std::string &parent_id, const std::string &name) const;
        bool is_descendant_locked(const std::string &candidate, const std::string &ancestor) const;
        std::uint64_t used_bytes_locked(const std::string &user_id) const;
        void erase_subtree_locked(const std::string &node_id);
        std::vector<std::string> subtree_locked(const std::string &node_id) const;
        void load();
        void persist_locked() const;

        std::filesystem::path index_path_;
        std::filesystem::path blob_dir_;
        std::uint64_t quota_bytes_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, StoredNode> nodes_;
        std::unordered_map<std::string, std::string> roots_; // user id -> root node id
    };

} // namespace nimbus::server
