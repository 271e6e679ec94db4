#pragma once

#include <future>
#include <map>
#include <mutex>
#include <utility>

namespace nimbus::client
{

    // Coalesces concurrent calls that share a key into one execution of the work.
    // Every caller of the same in-flight key receives the same result or exception.
    // The key is released once the work settles, so the next call starts afresh.
    template <typename Key, typename Value>
    class SingleFlight
    {
    public:
        template <typename Work>
        Value run(const Key &key, Work &&work)
        {
            std::shared_future<Value> pending;
            std::promise<Value> promise;
            bool leader = false;
            {
                std::lock_guard lock(mutex_);
                auto it = in_flight_.find(key);
                if (it == in_flight_.end())
                {
                    pending = promise.get_future().share();
                    in_flight_.emplace(key, pending);
                    leader = true;
                }
                else
                {
                    pending = it->second;
                }
            }

            if (leader)
            {
                try
                {
                    promise.set_value(work());
                }
                catch (...)
                {
                    promise.set_exception(std::current_exception());
                }
                std::lock_guard lock(mutex_);
                in_flight_.erase(key);
            }
            return pending.get();
        }

        std::size_t in_flight() const
        {
            std::lock_guard lock(mutex_);
            return in_flight_.size();
        }

    private:
        mutable std::mutex mutex_;
        std::map<Key, std::shared_future<Value>> in_flight_;
    };

} // namespace nimbus::client
