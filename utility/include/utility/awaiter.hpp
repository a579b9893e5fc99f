#pragma once

#include <atomic>
#include <chrono>
#include <future>

namespace Utility
{
    /**
     * @brief Lets a test thread wait until other threads arrived a given number of times.
     */
    class Awaiter
    {
      public:
        explicit Awaiter(int maxCount = 1)
            : maxCount_(maxCount)
            , future_{promise_.get_future()}
        {}

        bool waitFor(std::chrono::milliseconds const& duration = std::chrono::seconds{1})
        {
            return future_.wait_for(duration) == std::future_status::ready;
        }

        void wait()
        {
            future_.wait();
        }

        void arrive()
        {
            if (++counter_ == maxCount_)
                promise_.set_value();
        }

        int arrivals() const
        {
            return counter_;
        }

      private:
        const int maxCount_{0};
        std::atomic_int counter_ = 0;
        std::promise<void> promise_{};
        std::shared_future<void> future_;
    };
}
