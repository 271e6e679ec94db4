#include "nimbus/server/node_store.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "nimbus/crypto.hpp"
#include "nimbus/server/store_error.hpp"

namespace nimbus::server
{

    namespace
    {
        constexpr auto kMetadataDir = ".nimbus";
        constexpr auto kIndexFile = "nodes.json";
        constexpr auto kBlobDir = "blobs";
        constexpr std::size_t kMaxNameLength = 255;

        std::uint64_t now_seconds()
        {
            return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                                                  std::chrono::system_clock::now().time_since_epoch())
                                                  .count());
        }
    } // namespace

    NodeStore::NodeStore(std::filesystem::path root_directory, std::uint64_t quota_bytes)
        : index_path_(root_directory / kMetadataDir / kIndexFile),
          blob_dir_(root_directory / kBlobDir),
          quota_bytes_(quota_bytes)
    {
        std::filesystem::create_directories(index_path_.parent_path());
        std::filesystem::create_directories(blob_dir_);
        load();
    }

    void NodeStore::validate_name(const std::string &name)
    {
        if (name.empty() || name == "." || name == ".." || name.size() > kMaxNameLength ||
            name.find('/') != std::string::npos || name.find('\0') != std::string::npos)
        {
            throw StoreError(ErrorCode::InvalidPayload, "Invalid node name: " + name);
        }
    }

    protocol::NodeRecord NodeStore::root_of(const std::string &user_id)
    {
        std::lock_guard lock(mutex_);
        if (auto it = roots_.find(user_id); it != roots_.end())
        {
            return nodes_.at(it->second).record;
        }
        StoredNode root{
            .record = protocol::NodeRecord{
                .id = crypto::random_id(),
                .parent_id = std::nullopt,
                .name = "",
                .kind = protocol::NodeKind::Root,
                .size = 0,
                .content_key = {},
                .modified_time = now_seconds(),
            },
            .owner = user_id,
        };
        roots_[user_id] = root.record.id;
        nodes_[root.record.id] = root;
        persist_locked();
        spdlog::info("Created root folder for user {}", user_id);
        return root.record;
    }

    std::vector<protocol::NodeRecord> NodeStore::children(const std::string &user_id,
                                                          const std::string &folder_id) const
    {
        std::lock_guard lock(mutex_);
        const auto &folder = require_locked(user_id, folder_id);
        if (folder.record.kind == protocol::NodeKind::File)
        {
            throw StoreError(ErrorCode::InvalidPayload, "Not a folder: " + folder.record.name);
        }
        std::vector<protocol::NodeRecord> result;
        for (const auto &[id, node] : nodes_)
        {
            if (node.record.parent_id == folder_id)
            {
                result.push_back(node.record);
            }
        }
        std::sort(result.begin(), result.end(), [](const auto &lhs, const auto &rhs)
                  { return lhs.name < rhs.name; });
        return result;
    }

    StoredNode NodeStore::get(const std::string &user_id, const std::string &node_id) const
    {
        std::lock_guard lock(mutex_);
        return require_locked(user_id, node_id);
    }

    protocol::NodeRecord NodeStore::create_folder(const std::string &user_id, const std::string &parent_id,
                                                  const std::string &name)
    {
        validate_name(name);
        std::lock_guard lock(mutex_);
        require_folder_locked(user_id, parent_id);
        if (child_named_locked(parent_id, name))
        {
            throw StoreError(ErrorCode::AlreadyExists, "Name already taken: " + name);
        }
        StoredNode folder{
            .record = protocol::NodeRecord{
                .id = crypto::random_id(),
                .parent_id = parent_id,
                .name = name,
                .kind = protocol::NodeKind::Folder,
                .size = 0,
                .content_key = {},
                .modified_time = now_seconds(),
            },
            .owner = user_id,
        };
        nodes_[folder.record.id] = folder;
        persist_locked();
        return folder.record;
    }

    void NodeStore::remove(const std::string &user_id, const std::string &node_id)
    {
        std::lock_guard lock(mutex_);
        const auto &node = require_locked(user_id, node_id);
        if (node.record.kind == protocol::NodeKind::Root)
        {
            throw StoreError(ErrorCode::Conflict, "Cannot remove the root folder");
        }
        erase_subtree_locked(node_id);
        persist_locked();
    }

    protocol::NodeRecord NodeStore::move(const std::string &user_id, const std::string &node_id,
                                         const std::string &new_parent_id, const std::optional<std::string> &new_name)
    {
        std::lock_guard lock(mutex_);
        auto &node = require_locked(user_id, node_id);
        if (node.record.kind == protocol::NodeKind::Root)
        {
            throw StoreError(ErrorCode::Conflict, "Cannot move the root folder");
        }
        require_folder_locked(user_id, new_parent_id);
        if (new_parent_id == node_id || is_descendant_locked(new_parent_id, node_id))
        {
            throw StoreError(ErrorCode::Conflict, "Cannot move a folder into itself");
        }
        const auto name = new_name.value_or(node.record.name);
        validate_name(name);
        if (auto clash = child_named_locked(new_parent_id, name); clash && *clash != node_id)
        {
            throw StoreError(ErrorCode::AlreadyExists, "Name already taken: " + name);
        }
        node.record.parent_id = new_parent_id;
        node.record.name = name;
        node.record.modified_time = now_seconds();
        persist_locked();
        return node.record;
    }

    protocol::NodeRecord NodeStore::copy(const std::string &user_id, const std::string &node_id,
                                         const std::string &new_parent_id, const std::optional<std::string> &new_name)
    {
        std::lock_guard lock(mutex_);
        const auto &source = require_locked(user_id, node_id);
        if (source.record.kind == protocol::NodeKind::Root)
        {
            throw StoreError(ErrorCode::Conflict, "Cannot copy the root folder");
        }
        require_folder_locked(user_id, new_parent_id);
        if (new_parent_id == node_id || is_descendant_locked(new_parent_id, node_id))
        {
            throw StoreError(ErrorCode::Conflict, "Cannot copy a folder into itself");
        }
        const auto name = new_name.value_or(source.record.name);
        validate_name(name);
        if (child_named_locked(new_parent_id, name))
        {
            throw StoreError(ErrorCode::AlreadyExists, "Name already taken: " + name);
        }

        // Parents come before their children.
        const auto ids = subtree_locked(node_id);
        std::uint64_t added = 0;
        for (const auto &id : ids)
        {
            added += nodes_.at(id).encrypted_size;
        }
        if (used_bytes_locked(user_id) + added > quota_bytes_)
        {
            throw StoreError(ErrorCode::QuotaExceeded, "Storage quota exceeded");
        }

        std::unordered_map<std::string, std::string> renamed;
        std::vector<std::pair<std::string, StoredNode>> copies; // source id, copy
        copies.reserve(ids.size());
        const auto modified = now_seconds();
        for (const auto &id : ids)
        {
            auto copy = nodes_.at(id);
            copy.record.id = crypto::random_id();
            copy.record.modified_time = modified;
            if (id == node_id)
            {
                copy.record.parent_id = new_parent_id;
                copy.record.name = name;
            }
            else
            {
                copy.record.parent_id = renamed.at(*copy.record.parent_id);
            }
            renamed[id] = copy.record.id;
            copies.emplace_back(id, std::move(copy));
        }

        std::vector<std::filesystem::path> written;
        for (const auto &[source_id, copy] : copies)
        {
            if (copy.record.kind != protocol::NodeKind::File)
            {
                continue;
            }
            std::error_code ec;
            std::filesystem::copy_file(blob_path(source_id), blob_path(copy.record.id), ec);
            if (ec)
            {
                for (const auto &path : written)
                {
                    std::error_code ignored;
                    std::filesystem::remove(path, ignored);
                }
                spdlog::error("Failed to copy blob {}: {}", source_id, ec.message());
                throw StoreError(ErrorCode::InternalError, "Failed to copy file content");
            }
            written.push_back(blob_path(copy.record.id));
        }

        for (auto &[source_id, copy] : copies)
        {
            nodes_[copy.record.id] = std::move(copy);
        }
        persist_locked();
        return nodes_.at(renamed.at(node_id)).record;
    }

    protocol::NodeRecord NodeStore::commit_file(const std::string &user_id, const FileCommit &commit)
    {
        validate_name(commit.name);
        std::lock_guard lock(mutex_);
        require_folder_locked(user_id, commit.parent_id);

        std::uint64_t replaced_bytes = 0;
        const auto existing = child_named_locked(commit.parent_id, commit.name);
        if (existing)
        {
            const auto &old = nodes_.at(*existing);
            if (old.record.kind != protocol::NodeKind::File)
            {
                throw StoreError(ErrorCode::Conflict, "A folder named " + commit.name + " already exists");
            }
            replaced_bytes = old.encrypted_size;
        }
        if (used_bytes_locked(user_id) + commit.encrypted_size > quota_bytes_ + replaced_bytes)
        {
            throw StoreError(ErrorCode::QuotaExceeded, "Storage quota exceeded");
        }

        StoredNode file{
            .record = protocol::NodeRecord{
                .id = crypto::random_id(),
                .parent_id = commit.parent_id,
                .name = commit.name,
                .kind = protocol::NodeKind::File,
                .size = commit.size,
                .content_key = commit.content_key,
                .modified_time = now_seconds(),
            },
            .owner = user_id,
            .encrypted_size = commit.encrypted_size,
            .chunk_size = commit.chunk_size,
            .content_mac = commit.content_mac,
        };
        std::filesystem::rename(commit.staged_blob, blob_path(file.record.id));
        if (existing)
        {
            erase_subtree_locked(*existing);
        }
        nodes_[file.record.id] = file;
        persist_locked();
        return file.record;
    }

    std::filesystem::path NodeStore::blob_path(const std::string &node_id) const
    {
        return blob_dir_ / node_id;
    }

    std::uint64_t NodeStore::used_bytes(const std::string &user_id) const
    {
        std::lock_guard lock(mutex_);
        return used_bytes_locked(user_id);
    }

    void NodeStore::reserve(const std::string &user_id, std::uint64_t bytes, std::uint64_t replaced_bytes) const
    {
        std::lock_guard lock(mutex_);
        if (used_bytes_locked(user_id) + bytes > quota_bytes_ + replaced_bytes)
        {
            throw StoreError(ErrorCode::QuotaExceeded, "Storage quota exceeded");
        }
    }

    StoredNode &NodeStore::require_locked(const std::string &user_id, const std::string &node_id)
    {
        auto it = nodes_.find(node_id);
        if (it == nodes_.end() || it->second.owner != user_id)
        {
            throw StoreError(ErrorCode::NotFound, "No such node: " + node_id);
        }
        return it->second;
    }

    const StoredNode &NodeStore::require_locked(const std::string &user_id, const std::string &node_id) const
    {
        auto it = nodes_.find(node_id);
        if (it == nodes_.end() || it->second.owner != user_id)
        {
            throw StoreError(ErrorCode::NotFound, "No such node: " + node_id);
        }
        return it->second;
    }

    StoredNode &NodeStore::require_folder_locked(const std::string &user_id, const std::string &node_id)
    {
        auto &node = require_locked(user_id, node_id);
        if (node.record.kind == protocol::NodeKind::File)
        {
            throw StoreError(ErrorCode::InvalidPayload, "Not a folder: " + node.record.name);
        }
        return node;
    }

    std::optional<std::string> NodeStore::child_named_locked(const std::string &parent_id,
                                                             const std::string &name) const
    {
        for (const auto &[id, node] : nodes_)
        {
            if (node.record.parent_id == parent_id && node.record.name == name)
            {
                return id;
            }
        }
        return std::nullopt;
    }

    bool NodeStore::is_descendant_locked(const std::string &candidate, const std::string &ancestor) const
    {
        auto current = nodes_.find(candidate);
        while (current != nodes_.end() && current->second.record.parent_id)
        {
            if (*current->second.record.parent_id == ancestor)
            {
                return true;
            }
            current = nodes_.find(*current->second.record.parent_id);
        }
        return false;
    }

    std::uint64_t NodeStore::used_bytes_locked(const std::string &user_id) const
    {
        std::uint64_t used = 0;
        for (const auto &[id, node] : nodes_)
        {
            if (node.owner == user_id)
            {
                used += node.encrypted_size;
            }
        }
        return used;
    }

    void NodeStore::erase_subtree_locked(const std::string &node_id)
    {
        std::vector<std::string> pending{node_id};
        while (!pending.empty())
        {
            const auto id = pending.back();
            pending.pop_back();
            for (const auto &[child_id, child] : nodes_)
            {
                if (child.record.parent_id == id)
                {
                    pending.push_back(child_id);
                }
            }
            auto it = nodes_.find(id);
            if (it == nodes_.end())
            {
                continue;
            }
            if (it->second.record.kind == protocol::NodeKind::File)
            {
                std::error_code ec;
                std::filesystem::remove(blob_path(id), ec);
                if (ec)
                {
                    spdlog::warn("Failed to remove blob {}: {}", id, ec.message());
                }
            }
            nodes_.erase(it);
        }
    }

    std::vector<std::string> NodeStore::subtree_locked(const std::string &node_id) const
    {
        std::vector<std::string> ordered{node_id};
        for (std::size_t next = 0; next < ordered.size(); ++next)
        {
            for (const auto &[child_id, child] : nodes_)
            {
                if (child.record.parent_id == ordered[next])
                {
                    ordered.push_back(child_id);
                }
            }
        }
        return ordered;
    }

    void NodeStore::load()
    {
        std::lock_guard lock(mutex_);
        nodes_.clear();
        roots_.clear();
        if (!std::filesystem::exists(index_path_))
        {
            return;
        }
        std::ifstream in(index_path_);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot read node index " + index_path_.string());
        }
        nlohmann::json json;
        in >> json;
        for (const auto &item : json.value("nodes", nlohmann::json::array()))
        {
            StoredNode node{
                .record = item.at("record").get<protocol::NodeRecord>(),
                .owner = item.at("owner").get<std::string>(),
                .encrypted_size = item.value("encrypted_size", std::uint64_t{0}),
                .chunk_size = item.value("chunk_size", std::uint64_t{0}),
                .content_mac = item.value("mac", std::string{}),
            };
            if (node.record.kind == protocol::NodeKind::Root)
            {
                roots_[node.owner] = node.record.id;
            }
            nodes_[node.record.id] = std::move(node);
        }
        spdlog::info("Loaded {} nodes for {} users", nodes_.size(), roots_.size());
    }

    void NodeStore::persist_locked() const
    {
        nlohmann::json nodes = nlohmann::json::array();
        for (const auto &[id, node] : nodes_)
        {
            nodes.push_back({
                {"record", node.record},
                {"owner", node.owner},
                {"encrypted_size", node.encrypted_size},
                {"chunk_size", node.chunk_size},
                {"mac", node.content_mac},
            });
        }
        const auto temp = index_path_.string() + ".tmp";
        {
            std::ofstream out(temp, std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Cannot write node index " + temp);
            }
            out << nlohmann::json{{"nodes", nodes}}.dump(2);
        }
        std::filesystem::rename(temp, index_path_);
    }

} // namespace nimbus::server
