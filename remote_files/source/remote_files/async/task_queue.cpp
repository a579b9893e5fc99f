#include <remote_files/async/task_queue.hpp>

#include <log/log.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace RemoteFiles
{
    bool TaskQueue::pushTask(std::function<void()> task)
    {
        if (!task)
            throw std::invalid_argument("Task must not be empty.");

        std::lock_guard lock{taskMutex_};
        if (shutDown_)
            return false;
        tasks_.push_back(std::move(task));
        return true;
    }

    std::size_t TaskQueue::runOnce()
    {
        std::vector<std::function<void()>> tasks{};
        {
            std::lock_guard lock{taskMutex_};
            const auto count = std::min(tasks_.size(), maximumTasksProcessableAtOnce);
            tasks.reserve(count);
            std::move(tasks_.begin(), tasks_.begin() + static_cast<std::ptrdiff_t>(count), std::back_inserter(tasks));
            tasks_.erase(tasks_.begin(), tasks_.begin() + static_cast<std::ptrdiff_t>(count));
        }

        for (auto const& task : tasks)
        {
            try
            {
                task();
            }
            catch (std::exception const& exc)
            {
                Log::error("Task queue: Task threw an exception: {}", exc.what());
            }
        }

        return tasks.size();
    }

    std::size_t TaskQueue::runUntilIdle(std::size_t maxCycles)
    {
        std::size_t total = 0;
        for (std::size_t cycle = 0; cycle != maxCycles && pending() > 0; ++cycle)
            total += runOnce();
        return total;
    }

    std::size_t TaskQueue::pending() const
    {
        std::lock_guard lock{taskMutex_};
        return tasks_.size();
    }

    void TaskQueue::shutdown()
    {
        std::deque<std::function<void()>> discarded{};
        {
            std::lock_guard lock{taskMutex_};
            shutDown_ = true;
            discarded = std::move(tasks_);
            tasks_ = {};
        }
    }
}
