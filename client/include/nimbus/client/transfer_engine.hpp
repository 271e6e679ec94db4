/**
 * Nimbus - Chunked, encrypted, resumable transfers.
 *
 * A transfer is split into a ChunkPlan whose chunks run on a bounded worker
 * pool. Each chunk task encrypts or decrypts its own byte range through the
 * session's CryptoContext and touches only its region of the local file.
 * Transient chunk failures are retried with backoff; the last task to finish
 * verifies (download) or declares (upload) the aggregate MAC and settles the
 * transfer through the progress dispatcher, after every progress notification.
 */
#pragma once

#include <asio/thread_pool.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "nimbus/client/config.hpp"
#include "nimbus/client/logger.hpp"
#include "nimbus/client/node.hpp"
#include "nimbus/client/progress_dispatcher.hpp"
#include "nimbus/client/remote_authority.hpp"
#include "nimbus/client/session_manager.hpp"
#include "nimbus/client/transfer.hpp"
#include "nimbus/client/transfer_state_store.hpp"

namespace nimbus::client
{

    // Aggregate byte-rate cap shared by every worker moving data in one direction.
    class RateLimiter
    {
    public:
        explicit RateLimiter(std::optional<std::size_t> bytes_per_second);

        // Blocks until moving bytes keeps the aggregate rate under the cap.
        void acquire(std::uint64_t bytes);

    private:
        std::optional<std::size_t> rate_;
        std::mutex mutex_;
        std::chrono::steady_clock::time_point next_free_{};
    };

    class TransferEngine
    {
    public:
        using UploadCommitted = std::function<void(const Node &)>;
        // Receives decrypted bytes of a streamed file, in file order, on a worker thread.
        using StreamSink = std::function<void(std::span<const std::byte>)>;

        TransferEngine(RemoteAuthority &authority, SessionManager &sessions, TransferOptions options, Logger logger,
                       std::shared_ptr<TransferStateStore> state_store = nullptr);
        ~TransferEngine();

        TransferEngine(const TransferEngine &) = delete;
        TransferEngine &operator=(const TransferEngine &) = delete;

        std::shared_ptr<Transfer> download(const Node &node, const std::filesystem::path &destination,
                                           ProgressCallback progress,
                                           std::optional<std::uint64_t> chunk_size = std::nullopt);

        // Uploads into destination_folder under name, or the local file name when name is empty.
        std::shared_ptr<Transfer> upload(const std::filesystem::path &local_path, const Node &destination_folder,
                                         ProgressCallback progress,
                                         std::optional<std::uint64_t> chunk_size = std::nullopt,
                                         std::string name = {});

        // Reads limit bytes from offset (to the end of the file when limit is empty) one chunk
        // at a time and hands them to sink. The aggregate MAC is checked when the whole file is read.
        std::shared_ptr<Transfer> stream(const Node &node, StreamSink sink, std::uint64_t offset = 0,
                                         std::optional<std::uint64_t> limit = std::nullopt,
                                         ProgressCallback progress = {},
                                         std::optional<std::uint64_t> chunk_size = std::nullopt);

        void on_upload_committed(UploadCommitted hook);

        void cancel_all();
        void wait_all();
        std::size_t active() const;

    private:
        struct Job;

        std::shared_ptr<Transfer> track(std::shared_ptr<Transfer> transfer);
        void start_download(const std::shared_ptr<Job> &job, Node node, std::uint64_t requested_chunk);
        void start_upload(const std::shared_ptr<Job> &job, std::string parent_id, std::string name);
        void run_stream(const std::shared_ptr<Job> &job, Node node, StreamSink sink, std::uint64_t offset,
                        std::uint64_t length, std::uint64_t requested_chunk);
        DownloadTicket open_ticket(const std::shared_ptr<Job> &job, const Node &node, std::uint64_t requested_chunk);
        // Empty when the job stopped before the range arrived.
        std::optional<std::vector<std::byte>> fetch_range(const std::shared_ptr<Job> &job, const ChunkSpec &chunk);
        std::vector<std::byte> open_segments(const std::shared_ptr<Job> &job, const ChunkSpec &chunk,
                                             std::span<const std::byte> ciphertext);
        void schedule(const std::shared_ptr<Job> &job);
        void run_download_chunk(const std::shared_ptr<Job> &job, const ChunkSpec &chunk);
        void run_upload_chunk(const std::shared_ptr<Job> &job, const ChunkSpec &chunk);
        void run_chunk(const std::shared_ptr<Job> &job, const ChunkSpec &chunk);
        void complete_chunk(const std::shared_ptr<Job> &job, const ChunkSpec &chunk, const std::string &tags_hex);
        void finish_task(const std::shared_ptr<Job> &job);
        void finalize(const std::shared_ptr<Job> &job);
        void finalize_download(const std::shared_ptr<Job> &job);
        void finalize_upload(const std::shared_ptr<Job> &job);
        void fail(const std::shared_ptr<Job> &job, std::exception_ptr error);
        void settle(const std::shared_ptr<Job> &job, TransferState state, std::exception_ptr error,
                    std::optional<Node> result = std::nullopt);
        void report_progress(const std::shared_ptr<Job> &job);
        std::uint64_t chunk_size_or_default(std::optional<std::uint64_t> chunk_size) const;

        RemoteAuthority &authority_;
        SessionManager &sessions_;
        TransferOptions options_;
        Logger logger_;
        std::shared_ptr<TransferStateStore> state_store_;

        RateLimiter upload_limiter_;
        RateLimiter download_limiter_;

        mutable std::mutex mutex_;
        std::vector<std::shared_ptr<Transfer>> transfers_;
        std::vector<UploadCommitted> commit_hooks_;

        ProgressDispatcher dispatcher_;
        asio::thread_pool workers_;
    };

} // namespace nimbus::client
