#pragma once

#include <asio/strand.hpp>
#include <asio/thread_pool.hpp>

#include <functional>

#include "nimbus/client/logger.hpp"

namespace nimbus::client
{

    // Runs notifications one at a time, in posting order, on a dedicated thread,
    // so a slow progress callback never stalls a transfer worker.
    class ProgressDispatcher
    {
    public:
        explicit ProgressDispatcher(Logger logger);
        ~ProgressDispatcher();

        ProgressDispatcher(const ProgressDispatcher &) = delete;
        ProgressDispatcher &operator=(const ProgressDispatcher &) = delete;

        void post(std::function<void()> notification);

        // Blocks until every notification posted so far has run.
        void drain();

    private:
        Logger logger_;
        asio::thread_pool pool_;
        asio::strand<asio::thread_pool::executor_type> strand_;
    };

} // namespace nimbus::client
