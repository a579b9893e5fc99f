#pragma once

#include <remote_files/async/task_queue.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace RemoteFiles::Test
{
    TEST(TaskQueueTests, TasksDoNotRunBeforeTheQueueIsDriven)
    {
        TaskQueue queue;
        bool ran = false;
        EXPECT_TRUE(queue.pushTask([&ran] {
            ran = true;
        }));
        EXPECT_FALSE(ran);
        EXPECT_EQ(queue.pending(), 1);
        EXPECT_EQ(queue.runOnce(), 1);
        EXPECT_TRUE(ran);
        EXPECT_EQ(queue.pending(), 0);
    }

    TEST(TaskQueueTests, EmptyTaskIsRejected)
    {
        TaskQueue queue;
        EXPECT_THROW(queue.pushTask(std::function<void()>{}), std::invalid_argument);
    }

    TEST(TaskQueueTests, TasksRunInPushOrder)
    {
        TaskQueue queue;
        std::vector<int> order;
        for (int i = 0; i != 5; ++i)
        {
            queue.pushTask([&order, i] {
                order.push_back(i);
            });
        }
        queue.runUntilIdle();
        EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
    }

    TEST(TaskQueueTests, TasksPushedWhileRunningWaitForTheNextCycle)
    {
        TaskQueue queue;
        int counter = 0;
        queue.pushTask([&queue, &counter] {
            ++counter;
            queue.pushTask([&counter] {
                ++counter;
            });
        });
        EXPECT_EQ(queue.runOnce(), 1);
        EXPECT_EQ(counter, 1);
        EXPECT_EQ(queue.runOnce(), 1);
        EXPECT_EQ(counter, 2);
    }

    TEST(TaskQueueTests, RunOnceIsLimited)
    {
        TaskQueue queue;
        for (std::size_t i = 0; i != TaskQueue::maximumTasksProcessableAtOnce + 5; ++i)
            queue.pushTask([] {});
        EXPECT_EQ(queue.runOnce(), TaskQueue::maximumTasksProcessableAtOnce);
        EXPECT_EQ(queue.pending(), 5);
        EXPECT_EQ(queue.runUntilIdle(), 5);
    }

    TEST(TaskQueueTests, ThrowingTaskDoesNotDropTheRestOfItsBatch)
    {
        TaskQueue queue;
        bool secondRan = false;
        queue.pushTask([] {
            throw std::runtime_error("task failed");
        });
        queue.pushTask([&secondRan] {
            secondRan = true;
        });
        EXPECT_NO_THROW(EXPECT_EQ(queue.runOnce(), 2));
        EXPECT_TRUE(secondRan);
        EXPECT_EQ(queue.pending(), 0);
    }

    TEST(TaskQueueTests, PromiseTaskDeliversValue)
    {
        TaskQueue queue;
        auto future = queue.pushPromiseTask([] {
            return 42;
        });
        EXPECT_NE(future.wait_for(0s), std::future_status::ready);
        queue.runOnce();
        ASSERT_EQ(future.wait_for(0s), std::future_status::ready);
        EXPECT_EQ(future.get(), 42);
    }

    TEST(TaskQueueTests, ShutdownRejectsAndDiscards)
    {
        TaskQueue queue;
        bool ran = false;
        queue.pushTask([&ran] {
            ran = true;
        });
        queue.shutdown();
        EXPECT_TRUE(queue.isShutDown());
        EXPECT_EQ(queue.pending(), 0);
        EXPECT_FALSE(queue.pushTask([] {}));
        queue.runUntilIdle();
        EXPECT_FALSE(ran);

        auto future = queue.pushPromiseTask([] {
            return 1;
        });
        EXPECT_THROW(future.get(), std::runtime_error);
    }

    TEST(TaskQueueTests, TasksCanBePushedFromOtherThreads)
    {
        TaskQueue queue;
        int counter = 0;
        std::thread pusher{[&queue, &counter] {
            for (int i = 0; i != 50; ++i)
            {
                queue.pushTask([&counter] {
                    ++counter;
                });
            }
        }};
        pusher.join();
        queue.runUntilIdle();
        EXPECT_EQ(counter, 50);
    }
}
