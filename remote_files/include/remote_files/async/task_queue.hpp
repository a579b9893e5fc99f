#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <type_traits>

namespace RemoteFiles
{
    /**
     * @brief A cooperative task queue. Tasks run only when the owner drives the queue via runOnce or runUntilIdle,
     * always on the driving thread. Pushing is thread safe, so completions from other threads can be posted back.
     */
    class TaskQueue
    {
      public:
        constexpr static std::size_t maximumTasksProcessableAtOnce = 100;

        TaskQueue() = default;
        ~TaskQueue() = default;
        TaskQueue(TaskQueue const&) = delete;
        TaskQueue& operator=(TaskQueue const&) = delete;
        TaskQueue(TaskQueue&&) = delete;
        TaskQueue& operator=(TaskQueue&&) = delete;

        /**
         * @brief Pushes a task to the queue.
         *
         * @param task The task to push.
         * @return true If the task was pushed.
         * @return false If the queue has been shut down.
         * @throws std::invalid_argument If the task is empty.
         */
        bool pushTask(std::function<void()> task);

        /**
         * @brief Pushes a task that has a return value.
         * The return value is then accessible through the returned future once the task ran.
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
            const bool pushed = pushTask([promise, func = std::forward<Func>(func)]() mutable {
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
            if (!pushed)
                promise->set_exception(std::make_exception_ptr(std::runtime_error("Task queue is shut down.")));
            return future;
        }

        /**
         * @brief Runs the tasks that were queued when the call started, but at most maximumTasksProcessableAtOnce.
         * Tasks pushed by running tasks wait for the next cycle.
         *
         * @return std::size_t The number of tasks that ran.
         */
        std::size_t runOnce();

        /**
         * @brief Calls runOnce until no task is pending or maxCycles is reached.
         *
         * @return std::size_t The number of tasks that ran.
         */
        std::size_t runUntilIdle(std::size_t maxCycles = 10'000);

        std::size_t pending() const;

        /**
         * @brief Rejects all further pushes. Pending tasks are discarded.
         */
        void shutdown();

        bool isShutDown() const
        {
            return shutDown_;
        }

      private:
        mutable std::mutex taskMutex_{};
        std::deque<std::function<void()>> tasks_{};
        std::atomic_bool shutDown_{false};
    };
}
