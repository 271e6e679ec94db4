#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace nimbus::server
{

    struct UploadState
    {
        std::string upload_id;
        std::string user_id;
        std::string parent_id;
        std::string name;
        std::uint64_t size{};
        std::uint64_t encrypted_size{};
        std::uint64_t chunk_size{};
        std::filesystem::path temp_path;
        std::map<std::uint64_t, std::uint64_t> received; // encrypted offset -> length
        std::chrono::system_clock::time_point last_update{};

        std::uint64_t received_bytes() const noexcept;
    };

    struct ResumeInfo
    {
        UploadState state;
        bool resumed{};
    };

    struct UploadSpec
    {
        std::string parent_id;
        std::string name;
        std::uint64_t size{};
        std::uint64_t encrypted_size{};
        std::uint64_t chunk_size{};
        std::optional<std::string> resume_id;
    };

    struct DownloadState
    {
        std::string download_id;
        std::string user_id;
        std::string node_id;
        std::filesystem::path blob_path;
        std::uint64_t encrypted_size{};
        std::chrono::system_clock::time_point last_access{};
    };

    // Upload sessions (persisted, so a restarted server can resume them) and
    // download tickets (in memory). Chunks may arrive in any order.
    class TransferRegistry
    {
    public:
        explicit TransferRegistry(std::filesystem::path storage_root);

        ResumeInfo create_or_resume(const std::string &user_id, const UploadSpec &spec);

        // Writes data at its encrypted offset. A chunk may be sent again, but must not straddle another one.
        void write_chunk(const std::string &user_id, const std::string &upload_id, std::uint64_t offset,
                         std::span<const std::byte> data);

        // Checks the upload is complete and forgets it. The caller takes ownership of temp_path.
        UploadState finish(const std::string &user_id, const std::string &upload_id);

        std::optional<UploadState> find(const std::string &upload_id) const;

        DownloadState open_download(const std::string &user_id, const std::string &node_id,
                                    const std::filesystem::path &blob_path, std::uint64_t encrypted_size);

        std::vector<std::byte> read_chunk(const std::string &user_id, const std::string &download_id,
                                          std::uint64_t offset, std::uint64_t length);

        void cleanup_expired(std::chrono::seconds max_age);

    private:
        UploadState &require_upload_locked(const std::string &user_id, const std::string &upload_id);
        std::filesystem::path metadata_path(const std::string &upload_id) const;

        void load_existing();
        void persist_state(const UploadState &state) const;
        void remove_state(const std::string &upload_id);

        std::filesystem::path registry_dir_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, UploadState> uploads_;
        std::unordered_map<std::string, DownloadState> downloads_;
    };

} // namespace nimbus::server
