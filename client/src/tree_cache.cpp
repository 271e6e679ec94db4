#include "nimbus/client/tree_cache.hpp"

#include <algorithm>
#include <filesystem>
#include <unordered_set>
#include <utility>

#include "nimbus/client/errors.hpp"

namespace nimbus::client
{

    namespace
    {
        constexpr const char *kRootKey = "/";
    } // namespace

    RemoteTreeCache::RemoteTreeCache(RemoteAuthority &authority, TokenProvider token, Logger logger,
                                     std::chrono::seconds ttl)
        : authority_(authority),
          token_(std::move(token)),
          logger_(std::move(logger)),
          ttl_(ttl) {}

    std::vector<std::string> RemoteTreeCache::split_path(const std::string &path)
    {
        const auto normalized = std::filesystem::path(path).lexically_normal().generic_string();
        std::vector<std::string> segments;
        std::size_t start = 0;
        while (start <= normalized.size())
        {
            const auto end = std::min(normalized.find('/', start), normalized.size());
            auto segment = normalized.substr(start, end - start);
            if (!segment.empty() && segment != ".")
            {
                segments.push_back(std::move(segment));
            }
            start = end + 1;
        }
        return segments;
    }

    Node RemoteTreeCache::root()
    {
        {
            std::lock_guard lock(mutex_);
            if (root_id_)
            {
                if (auto it = nodes_.find(*root_id_); it != nodes_.end())
                {
                    return it->second.node;
                }
            }
        }
        return root_flight_.run(kRootKey, [this]()
                                { return fetch_root_node(); });
    }

    Node RemoteTreeCache::fetch_root_node()
    {
        std::uint64_t generation = 0;
        {
            std::lock_guard lock(mutex_);
            if (root_id_)
            {
                if (auto it = nodes_.find(*root_id_); it != nodes_.end())
                {
                    return it->second.node;
                }
            }
            generation = generation_;
        }
        logger_.debug("cache", "fetching root");
        auto node = authority_.fetch_root(token_());
        std::lock_guard lock(mutex_);
        if (generation == generation_)
        {
            root_id_ = node.id;
            nodes_[node.id].node = node;
        }
        return node;
    }

    Node RemoteTreeCache::resolve(const std::string &path)
    {
        const auto segments = split_path(path);
        auto current = root();
        std::string walked;
        for (const auto &segment : segments)
        {
            walked += "/" + segment;
            if (segment == "..")
            {
                throw NotFoundError("Path escapes the root: " + path);
            }
            if (!current.is_folder())
            {
                throw NotFoundError("Not a folder: " + walked.substr(0, walked.size() - segment.size() - 1));
            }
            const auto children = children_of(current.id);
            auto it = std::find_if(children.begin(), children.end(), [&](const Node &child)
                                   { return child.name == segment; });
            if (it == children.end())
            {
                throw NotFoundError("No such file or folder: " + walked);
            }
            current = *it;
        }
        return current;
    }

    std::vector<Node> RemoteTreeCache::list(const Node &folder)
    {
        if (!folder.is_folder())
        {
            throw NotFoundError("Not a folder: " + folder.name);
        }
        return children_of(folder.id);
    }

    void RemoteTreeCache::refresh(const std::string &path)
    {
        const auto node = resolve(path);
        if (!node.is_folder())
        {
            throw NotFoundError("Not a folder: " + path);
        }
        {
            std::lock_guard lock(mutex_);
            if (auto it = nodes_.find(node.id); it != nodes_.end())
            {
                it->second.stale = true;
            }
        }
        children_of(node.id);
    }

    void RemoteTreeCache::refresh()
    {
        std::lock_guard lock(mutex_);
        for (auto &[id, entry] : nodes_)
        {
            entry.stale = true;
        }
    }

    void RemoteTreeCache::prime()
    {
        const auto root_node = root();
        const auto children = children_of(root_node.id);
        logger_.log("cache", "primed root with ", children.size(), " entries");
    }

    void RemoteTreeCache::apply(const NodeEvent &event)
    {
        std::lock_guard lock(mutex_);
        const auto &node = event.node;
        switch (event.kind)
        {
        case NodeEventKind::Added:
        {
            nodes_[node.id].node = node;
            attach_to_parent(node);
            break;
        }
        case NodeEventKind::Updated:
        {
            auto it = nodes_.find(node.id);
            if (it == nodes_.end())
            {
                nodes_[node.id].node = node;
                attach_to_parent(node);
                break;
            }
            if (node.parent_id && (*node.parent_id == node.id || is_descendant(*node.parent_id, node.id)))
            {
                throw RequestError(ErrorCode::Conflict, "Moving " + node.name + " under itself would create a cycle");
            }
            const auto previous = it->second.node;
            if (previous.parent_id != node.parent_id || previous.name != node.name)
            {
                detach_from_parent(previous);
                it->second.node = node;
                attach_to_parent(node);
            }
            else
            {
                it->second.node = node;
            }
            break;
        }
        case NodeEventKind::Removed:
        {
            auto it = nodes_.find(node.id);
            if (it == nodes_.end())
            {
                break;
            }
            detach_from_parent(it->second.node);
            if (event.cascade)
            {
                erase_subtree(node.id);
            }
            else
            {
                nodes_.erase(it);
            }
            if (root_id_ && *root_id_ == node.id)
            {
                root_id_.reset();
            }
            break;
        }
        }
    }

    void RemoteTreeCache::clear()
    {
        std::lock_guard lock(mutex_);
        nodes_.clear();
        root_id_.reset();
        ++generation_;
    }

    std::optional<Node> RemoteTreeCache::find(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        if (auto it = nodes_.find(id); it != nodes_.end())
        {
            return it->second.node;
        }
        return std::nullopt;
    }

    std::vector<Node> RemoteTreeCache::children_of(const std::string &folder_id)
    {
        if (auto cached = cached_listing(folder_id))
        {
            return std::move(*cached);
        }
        return listing_flight_.run(folder_id, [this, &folder_id]()
                                   { return fetch_listing(folder_id); });
    }

    std::optional<std::vector<Node>> RemoteTreeCache::cached_listing(const std::string &folder_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(folder_id);
        if (it == nodes_.end() || !listing_fresh(it->second, Clock::now()))
        {
            return std::nullopt;
        }
        return collect_children(it->second);
    }

    std::vector<Node> RemoteTreeCache::fetch_listing(const std::string &folder_id)
    {
        // A caller that lost the race to a finished fetch finds the listing already stored.
        if (auto cached = cached_listing(folder_id))
        {
            return std::move(*cached);
        }
        std::uint64_t generation = 0;
        {
            std::lock_guard lock(mutex_);
            generation = generation_;
        }
        logger_.debug("cache", "fetching listing of ", folder_id);
        auto children = authority_.fetch_children(token_(), folder_id);
        store_listing(generation, folder_id, children);
        return children;
    }

    bool RemoteTreeCache::listing_fresh(const Entry &entry, Clock::time_point now) const
    {
        if (!entry.children || entry.stale)
        {
            return false;
        }
        return ttl_.count() == 0 || now - entry.fetched_at < ttl_;
    }

    std::vector<Node> RemoteTreeCache::collect_children(const Entry &entry) const
    {
        std::vector<Node> result;
        if (!entry.children)
        {
            return result;
        }
        result.reserve(entry.children->size());
        for (const auto &id : *entry.children)
        {
            if (auto it = nodes_.find(id); it != nodes_.end())
            {
                result.push_back(it->second.node);
            }
        }
        return result;
    }

    void RemoteTreeCache::store_listing(std::uint64_t generation, const std::string &folder_id,
                                        const std::vector<Node> &children)
    {
        std::lock_guard lock(mutex_);
        if (generation != generation_)
        {
            return;
        }
        auto folder = nodes_.find(folder_id);
        if (folder == nodes_.end())
        {
            return;
        }

        std::unordered_set<std::string> listed;
        std::vector<std::string> ids;
        ids.reserve(children.size());
        for (const auto &child : children)
        {
            listed.insert(child.id);
            ids.push_back(child.id);
        }

        if (folder->second.children)
        {
            const auto previous = *folder->second.children;
            for (const auto &id : previous)
            {
                auto it = nodes_.find(id);
                if (!listed.contains(id) && it != nodes_.end() && it->second.node.parent_id == folder_id)
                {
                    erase_subtree(id);
                }
            }
        }

        for (const auto &child : children)
        {
            auto &slot = nodes_[child.id];
            if (!slot.node.id.empty() && slot.node.parent_id != child.parent_id)
            {
                detach_from_parent(slot.node);
            }
            slot.node = child;
        }

        auto &entry = nodes_.at(folder_id);
        entry.children = std::move(ids);
        entry.fetched_at = Clock::now();
        entry.stale = false;
    }

    void RemoteTreeCache::erase_subtree(const std::string &id)
    {
        std::vector<std::string> pending{id};
        while (!pending.empty())
        {
            const auto current = std::move(pending.back());
            pending.pop_back();
            for (const auto &[child_id, entry] : nodes_)
            {
                if (entry.node.parent_id && *entry.node.parent_id == current)
                {
                    pending.push_back(child_id);
                }
            }
            nodes_.erase(current);
        }
    }

    void RemoteTreeCache::detach_from_parent(const Node &node)
    {
        if (!node.parent_id)
        {
            return;
        }
        auto parent = nodes_.find(*node.parent_id);
        if (parent == nodes_.end() || !parent->second.children)
        {
            return;
        }
        auto &children = *parent->second.children;
        children.erase(std::remove(children.begin(), children.end(), node.id), children.end());
    }

    void RemoteTreeCache::attach_to_parent(const Node &node)
    {
        if (!node.parent_id)
        {
            return;
        }
        auto parent = nodes_.find(*node.parent_id);
        if (parent == nodes_.end() || !parent->second.children)
        {
            return;
        }
        auto children = *parent->second.children;
        for (const auto &sibling_id : children)
        {
            if (sibling_id == node.id)
            {
                continue;
            }
            auto sibling = nodes_.find(sibling_id);
            if (sibling != nodes_.end() && sibling->second.node.name == node.name &&
                sibling->second.node.type == NodeType::File && node.type == NodeType::File)
            {
                erase_subtree(sibling_id);
                auto &list = *nodes_.at(*node.parent_id).children;
                list.erase(std::remove(list.begin(), list.end(), sibling_id), list.end());
            }
        }
        auto &list = *nodes_.at(*node.parent_id).children;
        if (std::find(list.begin(), list.end(), node.id) == list.end())
        {
            list.push_back(node.id);
        }
    }

    bool RemoteTreeCache::is_descendant(const std::string &candidate, const std::string &ancestor) const
    {
        auto current = candidate;
        for (std::size_t steps = 0; steps <= nodes_.size(); ++steps)
        {
            auto it = nodes_.find(current);
            if (it == nodes_.end() || !it->second.node.parent_id)
            {
                return false;
            }
            current = *it->second.node.parent_id;
            if (current == ancestor)
            {
                return true;
            }
        }
        return false;
    }

} // namespace nimbus::client
