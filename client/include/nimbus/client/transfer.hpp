/**
 * Nimbus - Observable state of one upload or download.
 *
 * Pending -> Running -> {Completed, Failed, Cancelled}. The three right-hand
 * states are terminal. Only the TransferEngine moves a transfer between states;
 * callers observe it and may request cancellation.
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "nimbus/client/chunk_plan.hpp"
#include "nimbus/client/node.hpp"

namespace nimbus::client
{

    enum class TransferState
    {
        Pending,
        Running,
        Completed,
        Failed,
        Cancelled
    };

    enum class TransferDirection
    {
        Upload,
        Download
    };

    std::string_view to_string(TransferState state) noexcept;
    std::string_view to_string(TransferDirection direction) noexcept;

    // (transferred_bytes, total_bytes, bytes_per_second)
    using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t, double)>;

    class Transfer
    {
    public:
        Transfer(std::string id, TransferDirection direction, std::filesystem::path local_path, std::string node_ref,
                 std::uint64_t total_bytes);

        Transfer(const Transfer &) = delete;
        Transfer &operator=(const Transfer &) = delete;

        const std::string &id() const noexcept { return id_; }
        TransferDirection direction() const noexcept { return direction_; }
        const std::filesystem::path &local_path() const noexcept { return local_path_; }
        std::uint64_t total_bytes() const noexcept { return total_bytes_; }
        std::uint64_t transferred_bytes() const noexcept { return transferred_.load(); }

        // Remote node id: the source for downloads, the committed node once an upload completes.
        std::string node_ref() const;
        TransferState state() const;
        ChunkPlan plan() const;
        std::size_t chunks_completed() const noexcept { return chunks_completed_.load(); }

        // Cooperative: chunks already in flight finish, no new chunk request is issued.
        void cancel() noexcept;
        bool cancel_requested() const noexcept { return cancel_requested_.load(); }

        // Blocks until the transfer is terminal. Rethrows the failure of a Failed transfer.
        TransferState wait() const;

        // Blocks until the transfer is terminal without rethrowing.
        TransferState wait_settled() const;

        std::exception_ptr error() const;

        // The node created by a completed upload.
        std::optional<Node> result() const;

    private:
        friend class TransferEngine;

        void set_plan(ChunkPlan plan);
        bool start();
        std::uint64_t add_transferred(std::uint64_t bytes) noexcept;
        void settle(TransferState state, std::exception_ptr error, std::optional<Node> result);

        const std::string id_;
        const TransferDirection direction_;
        const std::filesystem::path local_path_;
        const std::uint64_t total_bytes_;

        std::atomic<std::uint64_t> transferred_{0};
        std::atomic<std::size_t> chunks_completed_{0};
        std::atomic<bool> cancel_requested_{false};

        mutable std::mutex mutex_;
        mutable std::condition_variable settled_;
        std::string node_ref_;
        TransferState state_{TransferState::Pending};
        ChunkPlan plan_;
        std::exception_ptr error_;
        std::optional<Node> result_;
    };

} // namespace nimbus::client
