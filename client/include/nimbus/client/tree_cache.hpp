/**
 * Nimbus - In-memory mirror of the remote node hierarchy.
 *
 * Nodes live in one table keyed by id; a folder entry additionally holds the
 * ids of its children once its listing has been fetched. Listings are loaded
 * lazily, expire after the configured TTL and are fetched through a
 * single-flight gate so concurrent readers of a cold folder share one remote
 * call.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "nimbus/client/logger.hpp"
#include "nimbus/client/node.hpp"
#include "nimbus/client/remote_authority.hpp"
#include "nimbus/client/single_flight.hpp"

namespace nimbus::client
{

    enum class NodeEventKind
    {
        Added,
        Updated,
        Removed
    };

    struct NodeEvent
    {
        NodeEventKind kind{NodeEventKind::Added};
        Node node;
        bool cascade{true}; // Removed only: drop cached descendants as well
    };

    class RemoteTreeCache
    {
    public:
        using TokenProvider = std::function<std::string()>;
        using Clock = std::chrono::steady_clock;

        RemoteTreeCache(RemoteAuthority &authority, TokenProvider token, Logger logger, std::chrono::seconds ttl);

        RemoteTreeCache(const RemoteTreeCache &) = delete;
        RemoteTreeCache &operator=(const RemoteTreeCache &) = delete;

        Node root();

        // Throws NotFoundError at the first missing segment, or when a segment descends through a file.
        Node resolve(const std::string &path);

        std::vector<Node> list(const Node &folder);

        // Marks the listing of the folder at path stale and fetches it again.
        void refresh(const std::string &path);

        // Marks every cached listing stale. Listings are fetched again on next access.
        void refresh();

        // Loads the root and its immediate children.
        void prime();

        void apply(const NodeEvent &event);

        void clear();

        std::optional<Node> find(const std::string &id) const;

        static std::vector<std::string> split_path(const std::string &path);

    private:
        struct Entry
        {
            Node node;
            std::optional<std::vector<std::string>> children;
            Clock::time_point fetched_at{};
            bool stale{false};
        };

        Node fetch_root_node();
        std::vector<Node> children_of(const std::string &folder_id);
        std::vector<Node> fetch_listing(const std::string &folder_id);
        std::optional<std::vector<Node>> cached_listing(const std::string &folder_id) const;
        bool listing_fresh(const Entry &entry, Clock::time_point now) const;
        std::vector<Node> collect_children(const Entry &entry) const;
        void store_listing(std::uint64_t generation, const std::string &folder_id, const std::vector<Node> &children);
        void erase_subtree(const std::string &id);
        void detach_from_parent(const Node &node);
        void attach_to_parent(const Node &node);
        bool is_descendant(const std::string &candidate, const std::string &ancestor) const;

        RemoteAuthority &authority_;
        TokenProvider token_;
        Logger logger_;
        std::chrono::seconds ttl_;

        mutable std::mutex mutex_;
        std::optional<std::string> root_id_;
        std::unordered_map<std::string, Entry> nodes_;
        std::uint64_t generation_{0};

        SingleFlight<std::string, Node> root_flight_;
        SingleFlight<std::string, std::vector<Node>> listing_flight_;
    };

} // namespace nimbus::client
