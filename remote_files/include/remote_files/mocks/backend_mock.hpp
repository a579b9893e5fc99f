#pragma once

#include <remote_files/backend.hpp>

#include <gmock/gmock.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace RemoteFiles::Test
{
    class BackendMock : public RemoteFiles::Backend
    {
      public:
        MOCK_METHOD(void, connect, (std::optional<std::string> const&, Completion<void>), (override));
        MOCK_METHOD(void, disconnect, (), (override));
        MOCK_METHOD(void, terminate, (), (override));
        MOCK_METHOD(bool, connected, (), (const, override));
        MOCK_METHOD(void, pwd, (Completion<std::string>), (override));
        MOCK_METHOD(void, mkdir, (std::string const&, bool, Completion<void>), (override));
        MOCK_METHOD(void, rmdir, (std::string const&, bool, Completion<void>), (override));
        MOCK_METHOD(void, remove, (std::string const&, Completion<void>), (override));
        MOCK_METHOD(void, put, (LocalFile const&, std::string const&, Completion<void>), (override));
        MOCK_METHOD(void, write, (std::string const&, std::string const&, Completion<void>), (override));
        MOCK_METHOD(void, get, (std::string const&, Completion<std::shared_ptr<ReadStream>>), (override));
        MOCK_METHOD(void, list, (std::string const&, Completion<std::vector<FileEntry>>), (override));
        MOCK_METHOD(void, readlink, (FileEntry const&, std::string const&, Completion<std::string>), (override));
        MOCK_METHOD(void, rename, (std::string const&, std::string const&, Completion<void>), (override));
    };
}
