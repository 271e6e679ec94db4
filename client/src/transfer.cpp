#include "nimbus/client/transfer.hpp"

#include <utility>

namespace nimbus::client
{

    namespace
    {
        bool is_terminal(TransferState state) noexcept
        {
            return state == TransferState::Completed || state == TransferState::Failed ||
                   state == TransferState::Cancelled;
        }
    } // namespace

    std::string_view to_string(TransferState state) noexcept
    {
        switch (state)
        {
        case TransferState::Pending:
            return "pending";
        case TransferState::Running:
            return "running";
        case TransferState::Completed:
            return "completed";
        case TransferState::Failed:
            return "failed";
        case TransferState::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    std::string_view to_string(TransferDirection direction) noexcept
    {
        return direction == TransferDirection::Upload ? "upload" : "download";
    }

    Transfer::Transfer(std::string id, TransferDirection direction, std::filesystem::path local_path,
                       std::string node_ref, std::uint64_t total_bytes)
        : id_(std::move(id)),
          direction_(direction),
          local_path_(std::move(local_path)),
          total_bytes_(total_bytes),
          node_ref_(std::move(node_ref)) {}

    std::string Transfer::node_ref() const
    {
        std::lock_guard lock(mutex_);
        return node_ref_;
    }

    TransferState Transfer::state() const
    {
        std::lock_guard lock(mutex_);
        return state_;
    }

    ChunkPlan Transfer::plan() const
    {
        std::lock_guard lock(mutex_);
        return plan_;
    }

    void Transfer::cancel() noexcept
    {
        cancel_requested_.store(true);
    }

    TransferState Transfer::wait() const
    {
        std::unique_lock lock(mutex_);
        settled_.wait(lock, [this]()
                      { return is_terminal(state_); });
        if (state_ == TransferState::Failed && error_)
        {
            std::rethrow_exception(error_);
        }
        return state_;
    }

    TransferState Transfer::wait_settled() const
    {
        std::unique_lock lock(mutex_);
        settled_.wait(lock, [this]()
                      { return is_terminal(state_); });
        return state_;
    }

    std::exception_ptr Transfer::error() const
    {
        std::lock_guard lock(mutex_);
        return error_;
    }

    std::optional<Node> Transfer::result() const
    {
        std::lock_guard lock(mutex_);
        return result_;
    }

    void Transfer::set_plan(ChunkPlan plan)
    {
        std::lock_guard lock(mutex_);
        plan_ = std::move(plan);
    }

    bool Transfer::start()
    {
        std::lock_guard lock(mutex_);
        if (state_ != TransferState::Pending)
        {
            return false;
        }
        state_ = TransferState::Running;
        return true;
    }

    std::uint64_t Transfer::add_transferred(std::uint64_t bytes) noexcept
    {
        chunks_completed_.fetch_add(1);
        return transferred_.fetch_add(bytes) + bytes;
    }

    void Transfer::settle(TransferState state, std::exception_ptr error, std::optional<Node> result)
    {
        {
            std::lock_guard lock(mutex_);
            if (is_terminal(state_))
            {
                return;
            }
            state_ = state;
            error_ = std::move(error);
            if (result)
            {
                node_ref_ = result->id;
            }
            result_ = std::move(result);
        }
        settled_.notify_all();
    }

} // namespace nimbus::client
