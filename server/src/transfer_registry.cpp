#include "nimbus/server/transfer_registry.hpp"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "nimbus/crypto.hpp"
#include "nimbus/framing.hpp"
#include "nimbus/server/store_error.hpp"

namespace nimbus::server
{

    namespace
    {
        constexpr auto kMetadataDir = ".nimbus/uploads";

        nlohmann::json to_json(const UploadState &state)
        {
            nlohmann::json received = nlohmann::json::array();
            for (const auto &[offset, length] : state.received)
            {
                received.push_back({offset, length});
            }
            return {
                {"upload_id", state.upload_id},
                {"user_id", state.user_id},
                {"parent_id", state.parent_id},
                {"name", state.name},
                {"size", state.size},
                {"encrypted_size", state.encrypted_size},
                {"chunk_size", state.chunk_size},
                {"temp_path", state.temp_path.generic_string()},
                {"received", received},
                {"last_update", std::chrono::duration_cast<std::chrono::seconds>(state.last_update.time_since_epoch()).count()},
            };
        }

        UploadState state_from_json(const nlohmann::json &json)
        {
            UploadState state{};
            state.upload_id = json.at("upload_id").get<std::string>();
            state.user_id = json.at("user_id").get<std::string>();
            state.parent_id = json.at("parent_id").get<std::string>();
            state.name = json.at("name").get<std::string>();
            state.size = json.value("size", 0ULL);
            state.encrypted_size = json.value("encrypted_size", 0ULL);
            state.chunk_size = json.value("chunk_size", 0ULL);
            state.temp_path = json.at("temp_path").get<std::string>();
            for (const auto &range : json.value("received", nlohmann::json::array()))
            {
                state.received[range.at(0).get<std::uint64_t>()] = range.at(1).get<std::uint64_t>();
            }
            const auto seconds = json.value("last_update", 0LL);
            state.last_update = std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
            return state;
        }

        bool same_upload(const UploadState &state, const std::string &user_id, const UploadSpec &spec)
        {
            return state.user_id == user_id && state.parent_id == spec.parent_id && state.name == spec.name &&
                   state.size == spec.size && state.encrypted_size == spec.encrypted_size &&
                   state.chunk_size == spec.chunk_size;
        }

    } // namespace

    std::uint64_t UploadState::received_bytes() const noexcept
    {
        std::uint64_t total = 0;
        for (const auto &[offset, length] : received)
        {
            total += length;
        }
        return total;
    }

    TransferRegistry::TransferRegistry(std::filesystem::path storage_root)
        : registry_dir_(std::move(storage_root) / kMetadataDir)
    {
        std::filesystem::create_directories(registry_dir_);
        load_existing();
    }

    ResumeInfo TransferRegistry::create_or_resume(const std::string &user_id, const UploadSpec &spec)
    {
        if (spec.chunk_size == 0 || spec.chunk_size > protocol::kMaxChunkSize)
        {
            throw StoreError(ErrorCode::InvalidPayload,
                             "chunk_size must be between 1 and " + std::to_string(protocol::kMaxChunkSize));
        }
        if (spec.encrypted_size < spec.size)
        {
            throw StoreError(ErrorCode::InvalidPayload, "encrypted_size is smaller than size");
        }

        std::lock_guard lock(mutex_);
        const auto now = std::chrono::system_clock::now();

        if (spec.resume_id)
        {
            auto it = uploads_.find(*spec.resume_id);
            if (it != uploads_.end() && same_upload(it->second, user_id, spec))
            {
                it->second.last_update = now;
                persist_state(it->second);
                spdlog::info("Resuming upload {} at {} / {} bytes", it->first, it->second.received_bytes(),
                             it->second.encrypted_size);
                return {.state = it->second, .resumed = true};
            }
            if (it != uploads_.end() && it->second.user_id == user_id)
            {
                // Parameters changed since the upload started.
                std::error_code ec;
                std::filesystem::remove(it->second.temp_path, ec);
                remove_state(it->first);
                uploads_.erase(it);
            }
        }

        UploadState state{};
        state.upload_id = crypto::random_id();
        state.user_id = user_id;
        state.parent_id = spec.parent_id;
        state.name = spec.name;
        state.size = spec.size;
        state.encrypted_size = spec.encrypted_size;
        state.chunk_size = spec.chunk_size;
        state.temp_path = registry_dir_ / (state.upload_id + ".part");
        state.last_update = now;

        std::ofstream file(state.temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
        {
            throw StoreError(ErrorCode::InternalError, "Cannot create staging file");
        }
        file.close();

        uploads_[state.upload_id] = state;
        persist_state(state);
        return {.state = state, .resumed = false};
    }

    void TransferRegistry::write_chunk(const std::string &user_id, const std::string &upload_id, std::uint64_t offset,
                                       std::span<const std::byte> data)
    {
        std::lock_guard lock(mutex_);
        auto &state = require_upload_locked(user_id, upload_id);
        const auto length = static_cast<std::uint64_t>(data.size());
        if (length == 0)
        {
            throw StoreError(ErrorCode::InvalidPayload, "Empty chunk");
        }
        if (offset > state.encrypted_size || length > state.encrypted_size - offset)
        {
            throw StoreError(ErrorCode::InvalidPayload, "Chunk exceeds declared size");
        }

        auto next = state.received.lower_bound(offset);
        const bool resent = next != state.received.end() && next->first == offset && next->second == length;
        if (!resent)
        {
            if (next != state.received.end() && next->first < offset + length)
            {
                throw StoreError(ErrorCode::InvalidPayload, "Chunk overlaps a received chunk");
            }
            if (next != state.received.begin())
            {
                const auto previous = std::prev(next);
                if (previous->first + previous->second > offset)
                {
                    throw StoreError(ErrorCode::InvalidPayload, "Chunk overlaps a received chunk");
                }
            }
        }

        std::fstream file(state.temp_path, std::ios::binary | std::ios::in | std::ios::out);
        if (!file.is_open())
        {
            throw StoreError(ErrorCode::InternalError, "Staging file is missing");
        }
        file.seekp(static_cast<std::streamoff>(offset));
        file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file)
        {
            throw StoreError(ErrorCode::InternalError, "Failed to write chunk");
        }

        state.received[offset] = length;
        state.last_update = std::chrono::system_clock::now();
        persist_state(state);
    }

    UploadState TransferRegistry::finish(const std::string &user_id, const std::string &upload_id)
    {
        std::lock_guard lock(mutex_);
        auto state = require_upload_locked(user_id, upload_id);
        if (state.received_bytes() != state.encrypted_size)
        {
            throw StoreError(ErrorCode::InvalidPayload, "Upload incomplete: " + std::to_string(state.received_bytes()) +
                                                            " of " + std::to_string(state.encrypted_size) + " bytes");
        }
        std::error_code ec;
        const auto on_disk = std::filesystem::file_size(state.temp_path, ec);
        if (ec || on_disk != state.encrypted_size)
        {
            throw StoreError(ErrorCode::IntegrityMismatch, "Staged upload has the wrong size");
        }
        remove_state(upload_id);
        uploads_.erase(upload_id);
        return state;
    }

    std::optional<UploadState> TransferRegistry::find(const std::string &upload_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it != uploads_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    DownloadState TransferRegistry::open_download(const std::string &user_id, const std::string &node_id,
                                                  const std::filesystem::path &blob_path, std::uint64_t encrypted_size)
    {
        DownloadState state{
            .download_id = crypto::random_id(),
            .user_id = user_id,
            .node_id = node_id,
            .blob_path = blob_path,
            .encrypted_size = encrypted_size,
            .last_access = std::chrono::system_clock::now(),
        };
        std::lock_guard lock(mutex_);
        downloads_[state.download_id] = state;
        return state;
    }

    std::vector<std::byte> TransferRegistry::read_chunk(const std::string &user_id, const std::string &download_id,
                                                        std::uint64_t offset, std::uint64_t length)
    {
        if (length > protocol::kMaxChunkPayload)
        {
            throw StoreError(ErrorCode::InvalidPayload, "Chunk length exceeds " + std::to_string(protocol::kMaxChunkPayload));
        }
        std::filesystem::path blob;
        std::uint64_t available = 0;
        {
            std::lock_guard lock(mutex_);
            auto it = downloads_.find(download_id);
            if (it == downloads_.end() || it->second.user_id != user_id)
            {
                throw StoreError(ErrorCode::NotFound, "Unknown download");
            }
            if (offset > it->second.encrypted_size)
            {
                throw StoreError(ErrorCode::InvalidPayload, "Offset beyond end of file");
            }
            it->second.last_access = std::chrono::system_clock::now();
            blob = it->second.blob_path;
            available = std::min(length, it->second.encrypted_size - offset);
        }

        std::vector<std::byte> buffer(static_cast<std::size_t>(available));
        if (buffer.empty())
        {
            return buffer;
        }
        std::ifstream in(blob, std::ios::binary);
        if (!in.is_open())
        {
            throw StoreError(ErrorCode::NotFound, "File content is gone");
        }
        in.seekg(static_cast<std::streamoff>(offset));
        in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (static_cast<std::uint64_t>(in.gcount()) != available)
        {
            throw StoreError(ErrorCode::InternalError, "Short read from blob");
        }
        return buffer;
    }

    void TransferRegistry::cleanup_expired(std::chrono::seconds max_age)
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::system_clock::now();
        for (auto it = uploads_.begin(); it != uploads_.end();)
        {
            if (now - it->second.last_update > max_age)
            {
                spdlog::info("Dropping stale upload {}", it->first);
                std::error_code ec;
                std::filesystem::remove(it->second.temp_path, ec);
                remove_state(it->first);
                it = uploads_.erase(it);
            }
            else
            {
                ++it;
            }
        }
        std::erase_if(downloads_, [&](const auto &item)
                      { return now - item.second.last_access > max_age; });
    }

    UploadState &TransferRegistry::require_upload_locked(const std::string &user_id, const std::string &upload_id)
    {
        auto it = uploads_.find(upload_id);
        if (it == uploads_.end() || it->second.user_id != user_id)
        {
            throw StoreError(ErrorCode::NotFound, "Unknown upload");
        }
        return it->second;
    }

    std::filesystem::path TransferRegistry::metadata_path(const std::string &upload_id) const
    {
        return registry_dir_ / (upload_id + ".json");
    }

    void TransferRegistry::load_existing()
    {
        for (const auto &entry : std::filesystem::directory_iterator(registry_dir_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
            {
                continue;
            }
            try
            {
                std::ifstream in(entry.path());
                nlohmann::json json;
                in >> json;
                auto state = state_from_json(json);
                if (!std::filesystem::exists(state.temp_path))
                {
                    std::filesystem::remove(entry.path());
                    continue;
                }
                uploads_[state.upload_id] = std::move(state);
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::warn("Ignoring unreadable upload state {}: {}", entry.path().string(), ex.what());
            }
        }
        if (!uploads_.empty())
        {
            spdlog::info("Restored {} pending uploads", uploads_.size());
        }
    }

    void TransferRegistry::persist_state(const UploadState &state) const
    {
        std::ofstream out(metadata_path(state.upload_id), std::ios::trunc);
        if (!out.is_open())
        {
            throw StoreError(ErrorCode::InternalError, "Cannot persist upload state");
        }
        out << to_json(state).dump(2);
    }

    void TransferRegistry::remove_state(const std::string &upload_id)
    {
        std::error_code ec;
        std::filesystem::remove(metadata_path(upload_id), ec);
    }

} // namespace nimbus::server
