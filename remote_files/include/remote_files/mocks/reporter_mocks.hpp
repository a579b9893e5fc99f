#pragma once

#include <remote_files/operation_reporter.hpp>

#include <gmock/gmock.h>

#include <string>

namespace RemoteFiles::Test
{
    class StatusIndicatorMock : public RemoteFiles::StatusIndicator
    {
      public:
        MOCK_METHOD(void, announce, (std::string const&), (override));
        MOCK_METHOD(void, settle, (), (override));
    };

    class LogSinkMock : public RemoteFiles::LogSink
    {
      public:
        MOCK_METHOD(void, message, (std::string const&), (override));
    };
}
