#include "nimbus/client/progress_dispatcher.hpp"

#include <asio/post.hpp>

#include <exception>
#include <future>
#include <utility>

namespace nimbus::client
{

    ProgressDispatcher::ProgressDispatcher(Logger logger)
        : logger_(std::move(logger)), pool_(1), strand_(asio::make_strand(pool_.get_executor())) {}

    ProgressDispatcher::~ProgressDispatcher()
    {
        pool_.join();
    }

    void ProgressDispatcher::post(std::function<void()> notification)
    {
        asio::post(strand_, [this, notification = std::move(notification)]()
                   {
            try
            {
                notification();
            }
            catch (const std::exception &ex)
            {
                logger_.error("progress", "notification threw: ", ex.what());
            } });
    }

    void ProgressDispatcher::drain()
    {
        std::promise<void> done;
        auto finished = done.get_future();
        asio::post(strand_, [&done]()
                   { done.set_value(); });
        finished.wait();
    }

} // namespace nimbus::client
