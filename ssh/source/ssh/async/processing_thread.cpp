#include <ssh/async/processing_thread.hpp>

#include <log/log.hpp>

#include <algorithm>
#include <exception>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace SecureShell
{
    ProcessingThread::ProcessingThread()
    {}
    ProcessingThread::~ProcessingThread()
    {
        stop();
    }
    bool ProcessingThread::isRunning() const
    {
        return running_;
    }
    void ProcessingThread::start(std::chrono::milliseconds const& waitCycleTimeout)
    {
        if (running_)
            return;

        {
            std::lock_guard lock{taskMutex_};
            running_ = true;
        }
        shuttingDown_ = false;
        std::promise<void> awaitThreadStart{};
        thread_ = std::thread([this, &awaitThreadStart, waitCycleTimeout] {
            processingThreadId_.store(std::this_thread::get_id());
            awaitThreadStart.set_value();
            run(waitCycleTimeout);
        });
        awaitThreadStart.get_future().wait();
    }
    void ProcessingThread::stop()
    {
        shuttingDown_ = true;
        {
            std::lock_guard lock{taskMutex_};
            running_ = false;
        }
        taskCondition_.notify_all();
        if (thread_.joinable())
        {
            // Stopped from one of its own tasks.
            if (thread_.get_id() == std::this_thread::get_id())
                thread_.detach();
            else
                thread_.join();
        }
        processingThreadId_.store(std::this_thread::get_id());

        // execute all pending tasks:
        for (auto tasks = takeTasks(std::numeric_limits<std::size_t>::max()); !tasks.empty();
             tasks = takeTasks(std::numeric_limits<std::size_t>::max()))
        {
            for (auto const& task : tasks)
                task();
        }
        processingThreadId_.store(std::thread::id{});
        shuttingDown_ = false;
    }
    bool ProcessingThread::pushTask(std::function<void()> task)
    {
        if (!task)
        {
            throw std::invalid_argument("Task must not be empty.");
        }

        if (shuttingDown_)
        {
            return false;
        }

        {
            std::lock_guard lock{taskMutex_};
            tasks_.push_back(std::move(task));
        }
        taskCondition_.notify_one();
        return true;
    }
    std::deque<std::function<void()>> ProcessingThread::takeTasks(std::size_t maximum)
    {
        std::lock_guard lock{taskMutex_};
        const auto count = std::min(tasks_.size(), maximum);
        std::deque<std::function<void()>> tasks{};
        std::move(tasks_.begin(), tasks_.begin() + static_cast<std::ptrdiff_t>(count), std::back_inserter(tasks));
        tasks_.erase(tasks_.begin(), tasks_.begin() + static_cast<std::ptrdiff_t>(count));
        return tasks;
    }
    void ProcessingThread::run(std::chrono::milliseconds const& waitCycleTimeout)
    {
        try
        {
            while (running_)
            {
                {
                    std::unique_lock lock{taskMutex_};
                    taskCondition_.wait_for(lock, waitCycleTimeout, [this] {
                        return !tasks_.empty() || !running_;
                    });
                }

                for (auto const& task : takeTasks(maximumTasksProcessableAtOnce))
                {
                    task();
                }
            }
        }
        catch (std::exception const& exc)
        {
            Log::error("Processing thread terminated by exception: {}", exc.what());
            std::lock_guard lock{taskMutex_};
            running_ = false;
        }
    }
    bool ProcessingThread::awaitCycle(std::chrono::milliseconds maxWait)
    {
        if (!withinProcessingThread() && running_)
        {
            return pushPromiseTask([]() {
                       return true;
                   }).wait_for(maxWait) == std::future_status::ready;
        }
        return false;
    }
}
