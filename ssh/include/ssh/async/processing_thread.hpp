#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>

namespace SecureShell
{
    /**
     * @brief A processing thread that can be used to execute tasks sequentially in a separate thread.
     * All libssh calls of one session happen on this thread, since a session must not be used concurrently.
     */
    class ProcessingThread
    {
      public:
        constexpr static unsigned int maximumTasksProcessableAtOnce = 100;

        ProcessingThread();
        ~ProcessingThread();
        ProcessingThread(ProcessingThread const&) = delete;
        ProcessingThread& operator=(ProcessingThread const&) = delete;
        ProcessingThread(ProcessingThread&&) = delete;
        ProcessingThread& operator=(ProcessingThread&&) = delete;

        /**
         * @brief Starts the processing thread.
         *
         * @param waitCycleTimeout The time to wait for a task to become available before checking if the thread should
         * stop.
         */
        void start(std::chrono::milliseconds const& waitCycleTimeout = std::chrono::seconds{1});

        /**
         * @brief Stops the processing thread. Executes all pending tasks.
         */
        void stop();

        /**
         * @brief Returns true if the processing thread is running.
         *
         * @return true If the processing thread is running.
         * @return false If the processing thread is not running.
         */
        bool isRunning() const;

        /**
         * @brief Pushes a task to the processing thread.
         *
         * @param task The task to push.
         * @return true If the task was pushed.
         * @return false If the processing thread is shutting down.
         * @throws std::invalid_argument If the task is empty.
         */
        bool pushTask(std::function<void()> task);

        /**
         * @brief Pushes a task that has a return value to the processing thread.
         * The return value is then accessible through the returned future.
         *
         * @param func The function to execute.
         * @return std::future<std::invoke_result_t<std::decay_t<Func>>> The future that will contain the return value.
         */
        template <typename Func>
        auto pushPromiseTask(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
        {
            using ReturnType = std::invoke_result_t<std::decay_t<Func>>;
            auto promise = std::make_shared<std::promise<ReturnType>>();
            auto future = promise->get_future();
            pushTask([promise, func = std::forward<Func>(func)]() mutable {
                if constexpr (std::is_void_v<ReturnType>)
                {
                    func();
                    promise->set_value();
                }
                else
                {
                    promise->set_value(func());
                }
            });
            return future;
        }

        /**
         * @brief Waits for a cycle to complete.
         *
         * @param maxWait The maximum time to wait for a cycle.
         * @return true If a cycle was completed.
         * @return false If the maximum wait time was reached or the thread is not running.
         */
        bool awaitCycle(std::chrono::milliseconds maxWait = std::chrono::seconds{5});

        bool withinProcessingThread() const
        {
            return processingThreadId_ == std::this_thread::get_id();
        }

      private:
        void run(std::chrono::milliseconds const& waitCycleTimeout);
        std::deque<std::function<void()>> takeTasks(std::size_t maximum);

      private:
        std::thread thread_{};
        mutable std::mutex taskMutex_{};
        std::condition_variable taskCondition_{};
        std::atomic<bool> running_ = false;
        std::atomic<bool> shuttingDown_ = false;
        std::atomic<std::thread::id> processingThreadId_{};
        std::deque<std::function<void()>> tasks_{};
    };
}
