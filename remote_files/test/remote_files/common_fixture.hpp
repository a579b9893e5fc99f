#pragma once

#include <remote_files/async/task_queue.hpp>
#include <remote_files/mocks/reporter_mocks.hpp>
#include <remote_files/transfer_session.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <expected>
#include <future>
#include <stdexcept>

namespace RemoteFiles::Test
{
    class CommonFixture : public ::testing::Test
    {
      protected:
        template <typename T>
        std::expected<T, RemoteError> await(std::future<std::expected<T, RemoteError>>& future)
        {
            queue_.runUntilIdle();
            if (future.wait_for(std::chrono::seconds{0}) != std::future_status::ready)
                throw std::runtime_error("Operation did not finish.");
            return future.get();
        }

        template <typename T>
        std::expected<T, RemoteError> await(std::future<std::expected<T, RemoteError>>&& future)
        {
            return await(future);
        }

        static SessionOptions utf8WireOptions()
        {
            return SessionOptions{
                .charset = CharsetOptions{.wireCharset = "UTF-8", .hostCharset = "UTF-8"},
            };
        }

      protected:
        TaskQueue queue_{};
        ::testing::NiceMock<StatusIndicatorMock> indicator_{};
        ::testing::NiceMock<LogSinkMock> logSink_{};
    };
}
