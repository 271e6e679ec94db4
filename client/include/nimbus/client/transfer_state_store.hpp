#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "nimbus/client/logger.hpp"

namespace nimbus::client
{

    // JSON ledger of unfinished transfers. Each record remembers which chunks are
    // already done, with the AEAD tags needed to compute the final MAC.
    //
    // Record changes are written through. Chunk completions are batched and hit
    // the disk every kFlushEvery chunks or kFlushInterval, whichever comes first;
    // completions lost in a crash are only transferred again.
    class TransferStateStore
    {
    public:
        static constexpr std::size_t kFlushEvery = 64;
        static constexpr std::chrono::seconds kFlushInterval{2};

        struct Record
        {
            std::string direction; // "upload" or "download"
            std::string identity;  // user id
            std::filesystem::path local_path;
            std::string remote;      // node id for downloads, "<parent id>/<name>" for uploads
            std::string fingerprint; // content MAC for downloads, size and mtime for uploads
            std::uint64_t total_size{};
            std::uint64_t chunk_size{};
            std::string upload_id;
            std::string wrapped_key;
            std::map<std::uint64_t, std::string> completed; // chunk index -> hex tags
        };

        explicit TransferStateStore(std::optional<std::filesystem::path> state_path = std::nullopt,
                                    Logger logger = Logger{});
        ~TransferStateStore();

        TransferStateStore(const TransferStateStore &) = delete;
        TransferStateStore &operator=(const TransferStateStore &) = delete;

        std::optional<Record> find(const std::string &direction, const std::string &identity,
                                   const std::filesystem::path &local_path, const std::string &remote) const;

        std::vector<Record> pending_for_identity(const std::string &identity) const;

        void upsert(Record record);

        void mark_chunk(const std::string &direction, const std::string &identity,
                        const std::filesystem::path &local_path, const std::string &remote, std::uint64_t index,
                        const std::string &tags_hex);

        void remove(const std::string &direction, const std::string &identity, const std::filesystem::path &local_path,
                    const std::string &remote);

        void discard_identity(const std::string &identity);

        // Writes batched chunk completions to disk.
        void flush();

        const std::filesystem::path &state_path() const noexcept { return state_path_; }

        static std::filesystem::path default_state_path();

    private:
        void load();
        nlohmann::json snapshot_locked() const;
        void write(const nlohmann::json &snapshot, std::uint64_t generation);
        std::vector<Record>::iterator find_record(const std::string &direction, const std::string &identity,
                                                  const std::filesystem::path &local_path, const std::string &remote);
        static std::filesystem::path normalize_path(const std::filesystem::path &path);

        std::filesystem::path state_path_;
        Logger logger_;

        mutable std::mutex mutex_;
        std::vector<Record> records_;
        std::size_t unflushed_{0};
        std::chrono::steady_clock::time_point last_flush_{std::chrono::steady_clock::now()};
        std::uint64_t generation_{0};

        std::mutex file_mutex_;
        std::uint64_t written_generation_{0};
    };

} // namespace nimbus::client
