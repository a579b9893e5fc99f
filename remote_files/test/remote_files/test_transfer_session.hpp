#pragma once

#include "common_fixture.hpp"
#include "utility/scripted_read_stream.hpp"

#include <remote_files/mocks/backend_mock.hpp>
#include <remote_files/transfer_session.hpp>
#include <utility/temporary_directory.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::string_literals;

extern std::filesystem::path programDirectory;

namespace RemoteFiles::Test
{
    using ::testing::_;
    using ::testing::AnyNumber;
    using ::testing::HasSubstr;
    using ::testing::StrictMock;
    using ::testing::WithArg;

    class TransferSessionTests : public CommonFixture
    {
      protected:
        void SetUp() override
        {
            makeSession(SessionOptions{});
            ON_CALL(logSink_, message(_)).WillByDefault([this](std::string const& text) {
                logLines_.push_back(text);
            });
        }

        void makeSession(SessionOptions options)
        {
            auto backend = std::make_unique<StrictMock<BackendMock>>();
            backend_ = backend.get();
            session_ =
                std::make_unique<TransferSession>(std::move(backend), queue_, std::move(options), indicator_, logSink_);
        }

        // Completes the backend call in a later task with the given result.
        template <typename T>
        auto completeLater(std::expected<T, RemoteError> result)
        {
            return [this, result](Completion<T> onComplete) {
                queue_.pushTask([onComplete, result]() {
                    onComplete(result);
                });
            };
        }

        auto streamLater(std::shared_ptr<ReadStream> stream)
        {
            return completeLater<std::shared_ptr<ReadStream>>(std::move(stream));
        }

        std::vector<std::string> failLines() const
        {
            std::vector<std::string> result;
            for (auto const& line : logLines_)
            {
                if (line.find(" fail: ") != std::string::npos)
                    result.push_back(line);
            }
            return result;
        }

        static FileEntry symlinkEntry(std::string name)
        {
            return FileEntry{.name = std::move(name), .type = FileType::Symlink};
        }

        static std::string readLocal(std::filesystem::path const& path)
        {
            std::ifstream file{path, std::ios_base::binary};
            std::stringstream buffer;
            buffer << file.rdbuf();
            return buffer.str();
        }

      protected:
        StrictMock<BackendMock>* backend_{nullptr};
        std::unique_ptr<TransferSession> session_{};
        std::vector<std::string> logLines_{};
    };

    TEST_F(TransferSessionTests, RmdirIsRecursiveAndSwallowsNotFound)
    {
        EXPECT_CALL(*backend_, rmdir("/a/b", true, _))
            .WillOnce(WithArg<2>(completeLater<void>(std::unexpected(makeError(ErrorKind::NotFound, "gone", 2)))));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->rmdir("/a/b"));
        EXPECT_TRUE(result.has_value());
        EXPECT_TRUE(failLines().empty());
    }

    TEST_F(TransferSessionTests, RemoveSwallowsNotFound)
    {
        EXPECT_CALL(*backend_, remove("/a/file", _))
            .WillOnce(WithArg<1>(completeLater<void>(std::unexpected(makeError(ErrorKind::NotFound, "gone", 550)))));
        EXPECT_CALL(indicator_, settle()).Times(1);

        EXPECT_TRUE(await(session_->remove("/a/file")).has_value());
        EXPECT_TRUE(failLines().empty());
    }

    TEST_F(TransferSessionTests, RmdirPropagatesOtherFailuresUnchanged)
    {
        const auto error = makeError(ErrorKind::Unclassified, "permission denied", 3);
        EXPECT_CALL(*backend_, rmdir("/a", true, _)).WillOnce(WithArg<2>(completeLater<void>(std::unexpected(error))));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->rmdir("/a"));
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::Unclassified);
        EXPECT_EQ(result.error().message, "permission denied");
        EXPECT_EQ(result.error().code, 3);
        EXPECT_EQ(failLines(), (std::vector<std::string>{"rmdir fail: /a, permission denied"}));
    }

    TEST_F(TransferSessionTests, MkdirSwallowsAlreadyExistsOnly)
    {
        EXPECT_CALL(*backend_, mkdir("/exists", true, _))
            .WillOnce(
                WithArg<2>(completeLater<void>(std::unexpected(makeError(ErrorKind::AlreadyExists, "exists", 11)))));
        EXPECT_CALL(*backend_, mkdir("/missing/parent", true, _))
            .WillOnce(WithArg<2>(completeLater<void>(std::unexpected(makeError(ErrorKind::NotFound, "no parent", 2)))));
        EXPECT_CALL(indicator_, settle()).Times(2);

        EXPECT_TRUE(await(session_->mkdir("/exists")).has_value());

        auto failed = await(session_->mkdir("/missing/parent"));
        ASSERT_FALSE(failed.has_value());
        EXPECT_EQ(failed.error().kind, ErrorKind::NotFound);
        EXPECT_EQ(failLines().size(), 1);
    }

    TEST_F(TransferSessionTests, SuccessfulOperationSettlesOnceAndAnnouncesOnce)
    {
        EXPECT_CALL(*backend_, write("content", "/f.txt", _)).WillOnce(WithArg<2>(completeLater<void>({})));
        EXPECT_CALL(indicator_, announce("write /f.txt")).Times(1);
        EXPECT_CALL(indicator_, settle()).Times(1);

        EXPECT_TRUE(await(session_->write("/f.txt", "content")).has_value());
    }

    TEST_F(TransferSessionTests, IndicatorIsSettledBeforeTheResultIsVisible)
    {
        std::future<std::expected<void, RemoteError>> future;
        EXPECT_CALL(*backend_, write(_, "/f", _))
            .WillOnce(WithArg<2>(completeLater<void>(std::unexpected(makeError(ErrorKind::Unclassified, "x")))));
        EXPECT_CALL(indicator_, settle()).WillOnce([&future]() {
            EXPECT_NE(future.wait_for(std::chrono::seconds{0}), std::future_status::ready);
        });

        future = session_->write("/f", "");
        EXPECT_FALSE(await(future).has_value());
    }

    TEST_F(TransferSessionTests, DisplayNamePrefixesAnnouncementsAndFailures)
    {
        makeSession(SessionOptions{.displayName = "prod"});
        EXPECT_CALL(*backend_, rename("/a", "/b", _))
            .WillOnce(WithArg<2>(completeLater<void>(std::unexpected(makeError(ErrorKind::NotFound, "no a")))));
        EXPECT_CALL(indicator_, announce("prod> rename /a /b")).Times(1);
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->rename("/a", "/b"));
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(failLines(), (std::vector<std::string>{"prod> rename fail: /a /b, no a"}));
    }

    TEST_F(TransferSessionTests, UploadFailureLogsOverrideMessage)
    {
        EXPECT_CALL(*backend_, put(_, "/remote.txt", _))
            .WillOnce(WithArg<2>(completeLater<void>(std::unexpected(makeError(ErrorKind::NeedsMkdir, "no dir", 2)))));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->upload("/remote.txt", LocalFile{"local.txt"}, "custom reason"));
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::NeedsMkdir);
        EXPECT_EQ(failLines(), (std::vector<std::string>{"upload fail: /remote.txt, custom reason"}));
    }

    TEST_F(TransferSessionTests, UploadPassesLocalFileToBackend)
    {
        EXPECT_CALL(*backend_, put(_, "/remote.txt", _))
            .WillOnce([this](LocalFile const& local, std::string const&, Completion<void> onComplete) {
                EXPECT_EQ(local.path(), std::filesystem::path{"local.txt"});
                completeLater<void>({})(std::move(onComplete));
            });
        EXPECT_TRUE(await(session_->upload("/remote.txt", LocalFile{"local.txt"})).has_value());
    }

    TEST_F(TransferSessionTests, ThrowingBackendIsReportedAsFailure)
    {
        EXPECT_CALL(*backend_, mkdir("/a", true, _)).WillOnce([](auto const&, bool, Completion<void> const&) {
            throw std::runtime_error("boom");
        });
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->mkdir("/a"));
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().wrapperError, WrapperErrors::BackendThrew);
        EXPECT_EQ(result.error().kind, ErrorKind::Unclassified);
        EXPECT_EQ(failLines(), (std::vector<std::string>{"mkdir fail: /a, boom"}));
    }

    TEST_F(TransferSessionTests, ReadlinkOnNonSymlinkNeverContactsBackend)
    {
        EXPECT_CALL(*backend_, readlink(_, _, _)).Times(0);
        EXPECT_CALL(indicator_, settle()).Times(1);

        FileEntry entry{.name = "file", .type = FileType::Regular};
        auto future = session_->readlink(entry, "/a/file");
        ASSERT_EQ(future.wait_for(std::chrono::seconds{0}), std::future_status::ready);

        auto result = future.get();
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().wrapperError, WrapperErrors::NotSymlink);
        EXPECT_FALSE(entry.link.has_value());
        EXPECT_EQ(queue_.pending(), 0);
    }

    TEST_F(TransferSessionTests, ReadlinkResolvesRelativeTargetAgainstParent)
    {
        EXPECT_CALL(*backend_, readlink(_, "/a/b/link", _)).WillOnce(WithArg<2>(completeLater<std::string>("c"s)));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto entry = symlinkEntry("link");
        auto result = await(session_->readlink(entry, "/a/b/link"));
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, "/a/b/c");
        EXPECT_EQ(entry.link, "/a/b/c");
    }

    TEST_F(TransferSessionTests, ReadlinkNormalizesAbsoluteTarget)
    {
        EXPECT_CALL(*backend_, readlink(_, "/a/b/link", _))
            .WillOnce(WithArg<2>(completeLater<std::string>("/x//y/./"s)));

        auto entry = symlinkEntry("link");
        auto result = await(session_->readlink(entry, "/a/b/link"));
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, "/x/y");
        EXPECT_EQ(entry.link, "/x/y");
    }

    TEST_F(TransferSessionTests, ReadlinkResolvesParentSegmentsInTarget)
    {
        EXPECT_CALL(*backend_, readlink(_, "/a/b/link", _))
            .WillOnce(WithArg<2>(completeLater<std::string>("../../etc/conf"s)));

        auto entry = symlinkEntry("link");
        auto result = await(session_->readlink(entry, "/a/b/link"));
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, "/etc/conf");
    }

    TEST_F(TransferSessionTests, ReadlinkFailureLogsEntryName)
    {
        EXPECT_CALL(*backend_, readlink(_, "/a/link", _))
            .WillOnce(
                WithArg<2>(completeLater<std::string>(std::unexpected(makeError(ErrorKind::NotFound, "dangling")))));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto entry = symlinkEntry("link");
        EXPECT_FALSE(await(session_->readlink(entry, "/a/link")).has_value());
        EXPECT_EQ(failLines(), (std::vector<std::string>{"readlink fail: link, dangling"}));
    }

    TEST_F(TransferSessionTests, ListOfEmptyPathListsCurrentDirectory)
    {
        const std::vector<FileEntry> entries{FileEntry{.name = "a", .type = FileType::Regular, .size = 3}};
        EXPECT_CALL(*backend_, list(".", _))
            .Times(2)
            .WillRepeatedly(WithArg<1>(completeLater<std::vector<FileEntry>>(entries)));
        EXPECT_CALL(indicator_, announce("list .")).Times(2);

        auto fromEmpty = await(session_->list(""));
        auto fromDot = await(session_->list("."));
        ASSERT_TRUE(fromEmpty.has_value());
        ASSERT_TRUE(fromDot.has_value());
        EXPECT_EQ(*fromEmpty, *fromDot);
    }

    TEST_F(TransferSessionTests, ListTranscodesEveryNameToHostCharset)
    {
        const std::vector<FileEntry> entries{
            FileEntry{.name = "caf\xE9", .type = FileType::Regular},
            FileEntry{.name = "plain", .type = FileType::Directory},
        };
        EXPECT_CALL(*backend_, list("/d\xE9j\xE0", _))
            .WillOnce(WithArg<1>(completeLater<std::vector<FileEntry>>(entries)));

        auto result = await(session_->list("/d\xC3\xA9j\xC3\xA0"));
        ASSERT_TRUE(result.has_value());
        ASSERT_EQ(result->size(), 2);
        EXPECT_EQ((*result)[0].name, "caf\xC3\xA9");
        EXPECT_EQ((*result)[1].name, "plain");
        EXPECT_TRUE((*result)[1].isDirectory());
    }

    TEST_F(TransferSessionTests, SuspectNamesAreReportedOnceAfterListReturned)
    {
        makeSession(utf8WireOptions());
        const std::vector<FileEntry> entries{
            FileEntry{.name = "good"},
            FileEntry{.name = "bad\xFF"},
            FileEntry{.name = "also?fine"},
        };
        EXPECT_CALL(*backend_, list("/dir", _)).WillOnce(WithArg<1>(completeLater<std::vector<FileEntry>>(entries)));

        int calls = 0;
        std::vector<std::string> reported;
        session_->setInvalidEncodingHandler([&](std::vector<std::string> const& names) {
            ++calls;
            reported = names;
        });

        auto future = session_->list("/dir");
        queue_.runOnce();
        ASSERT_EQ(future.wait_for(std::chrono::seconds{0}), std::future_status::ready);
        EXPECT_EQ(calls, 0);

        auto result = future.get();
        ASSERT_TRUE(result.has_value());
        queue_.runUntilIdle();
        EXPECT_EQ(calls, 1);
        EXPECT_EQ(reported, (std::vector<std::string>{"bad\xEF\xBF\xBD"}));
        EXPECT_EQ((*result)[1].name, "bad\xEF\xBF\xBD");
    }

    TEST_F(TransferSessionTests, ToleratedEncodingErrorsAreNotReported)
    {
        auto options = utf8WireOptions();
        options.tolerateEncodingErrors = true;
        makeSession(options);
        EXPECT_CALL(*backend_, list("/dir", _))
            .WillOnce(WithArg<1>(completeLater<std::vector<FileEntry>>(std::vector<FileEntry>{{.name = "bad\xFF"}})));

        int calls = 0;
        session_->setInvalidEncodingHandler([&calls](std::vector<std::string> const&) {
            ++calls;
        });

        auto result = await(session_->list("/dir"));
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ((*result)[0].name, "bad\xEF\xBF\xBD");
        EXPECT_EQ(calls, 0);
    }

    TEST_F(TransferSessionTests, CleanListingDoesNotCallHandler)
    {
        makeSession(utf8WireOptions());
        EXPECT_CALL(*backend_, list("/dir", _))
            .WillOnce(WithArg<1>(completeLater<std::vector<FileEntry>>(std::vector<FileEntry>{{.name = "fine"}})));

        int calls = 0;
        session_->setInvalidEncodingHandler([&calls](std::vector<std::string> const&) {
            ++calls;
        });
        EXPECT_TRUE(await(session_->list("/dir")).has_value());
        EXPECT_EQ(calls, 0);
    }

    TEST_F(TransferSessionTests, HandlerInstalledAtListTimeReceivesNames)
    {
        makeSession(utf8WireOptions());
        EXPECT_CALL(*backend_, list("/dir", _))
            .WillOnce(WithArg<1>(completeLater<std::vector<FileEntry>>(std::vector<FileEntry>{{.name = "\xFE"}})));

        int first = 0;
        int second = 0;
        session_->setInvalidEncodingHandler([&first](std::vector<std::string> const&) {
            ++first;
        });
        auto future = session_->list("/dir");
        session_->setInvalidEncodingHandler([&second](std::vector<std::string> const&) {
            ++second;
        });

        EXPECT_TRUE(await(future).has_value());
        EXPECT_EQ(first, 1);
        EXPECT_EQ(second, 0);
    }

    TEST_F(TransferSessionTests, ListFailureLogsPathAndMessage)
    {
        EXPECT_CALL(*backend_, list("/nope", _))
            .WillOnce(WithArg<1>(
                completeLater<std::vector<FileEntry>>(std::unexpected(makeError(ErrorKind::NotFound, "missing", 2)))));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->list("/nope"));
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
        EXPECT_EQ(failLines(), (std::vector<std::string>{"list fail: /nope, missing"}));
    }

    TEST_F(TransferSessionTests, ViewConcatenatesChunksInArrivalOrder)
    {
        EXPECT_CALL(*backend_, get("/f", _))
            .WillOnce(WithArg<1>(
                streamLater(std::make_shared<ScriptedReadStream>(queue_, std::vector<std::string>{"ab", "", "cd", "e"}))));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->view("/f"));
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, "abcde");
    }

    TEST_F(TransferSessionTests, ViewOfEmptyFileIsEmpty)
    {
        EXPECT_CALL(*backend_, get("/empty", _))
            .WillOnce(WithArg<1>(streamLater(std::make_shared<ScriptedReadStream>(queue_, std::vector<std::string>{}))));

        auto result = await(session_->view("/empty"));
        ASSERT_TRUE(result.has_value());
        EXPECT_TRUE(result->empty());
    }

    TEST_F(TransferSessionTests, StreamErrorFollowedByCloseSettlesOnceAndFails)
    {
        const auto error = makeError(ErrorKind::NeedsReconnectOnce, "connection lost", 7);
        EXPECT_CALL(*backend_, get("/f", _))
            .WillOnce(WithArg<1>(streamLater(std::make_shared<ScriptedReadStream>(
                queue_, std::vector<std::string>{"part"}, error, ScriptedReadStream::Ending::ErrorThenClose))));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->view("/f"));
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::NeedsReconnectOnce);
        EXPECT_EQ(failLines(), (std::vector<std::string>{"view fail: /f, connection lost"}));
    }

    TEST_F(TransferSessionTests, GetFailureOfViewIsPropagated)
    {
        EXPECT_CALL(*backend_, get("/f", _))
            .WillOnce(WithArg<1>(completeLater<std::shared_ptr<ReadStream>>(
                std::unexpected(makeError(ErrorKind::NotFound, "no such file", 2)))));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->view("/f"));
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
    }

    TEST_F(TransferSessionTests, DownloadWritesChunksToLocalFile)
    {
        Utility::TemporaryDirectory directory{programDirectory / "temp", true};
        const auto local = directory.path() / "f.txt";
        EXPECT_CALL(*backend_, get("/f", _))
            .WillOnce(WithArg<1>(
                streamLater(std::make_shared<ScriptedReadStream>(queue_, std::vector<std::string>{"ab", "cd"}))));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->download(LocalFile{local}, "/f"));
        ASSERT_TRUE(result.has_value()) << result.error().toString();
        EXPECT_EQ(readLocal(local), "abcd");
        EXPECT_TRUE(failLines().empty());
    }

    TEST_F(TransferSessionTests, DownloadStreamErrorFollowedByCloseFailsOnceAndClosesLocalFile)
    {
        Utility::TemporaryDirectory directory{programDirectory / "temp", true};
        const auto local = directory.path() / "f.txt";
        const auto error = makeError(ErrorKind::NeedsReconnectOnce, "connection lost", 7);
        auto stream = std::make_shared<ScriptedReadStream>(
            queue_, std::vector<std::string>{"part"}, error, ScriptedReadStream::Ending::ErrorThenClose);
        EXPECT_CALL(*backend_, get("/f", _)).WillOnce(WithArg<1>(streamLater(stream)));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->download(LocalFile{local}, "/f"));
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::NeedsReconnectOnce);
        EXPECT_EQ(failLines(), (std::vector<std::string>{"download fail: /f, connection lost"}));

        // The stream still holds the handlers, so the data is only on disk if the local file was closed.
        EXPECT_EQ(readLocal(local), "part");
    }

    TEST_F(TransferSessionTests, DownloadCloseFollowedByStreamErrorSucceeds)
    {
        Utility::TemporaryDirectory directory{programDirectory / "temp", true};
        const auto local = directory.path() / "f.txt";
        const auto error = makeError(ErrorKind::NeedsReconnectOnce, "connection lost", 7);
        EXPECT_CALL(*backend_, get("/f", _))
            .WillOnce(WithArg<1>(streamLater(std::make_shared<ScriptedReadStream>(
                queue_, std::vector<std::string>{"all"}, error, ScriptedReadStream::Ending::CloseThenError))));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->download(LocalFile{local}, "/f"));
        ASSERT_TRUE(result.has_value()) << result.error().toString();
        EXPECT_EQ(readLocal(local), "all");
        EXPECT_TRUE(failLines().empty());
    }

    TEST_F(TransferSessionTests, DownloadGetFailureLeavesNoLocalFile)
    {
        Utility::TemporaryDirectory directory{programDirectory / "temp", true};
        const auto local = directory.path() / "f.txt";
        EXPECT_CALL(*backend_, get("/f", _))
            .WillOnce(WithArg<1>(completeLater<std::shared_ptr<ReadStream>>(
                std::unexpected(makeError(ErrorKind::NotFound, "no such file", 2)))));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->download(LocalFile{local}, "/f"));
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
        EXPECT_EQ(failLines(), (std::vector<std::string>{"download fail: /f, no such file"}));
        EXPECT_FALSE(std::filesystem::exists(local));
    }

    TEST_F(TransferSessionTests, DownloadLocalWriteFailurePartwayFailsOnce)
    {
        const std::filesystem::path full{"/dev/full"};
        if (!std::filesystem::exists(full))
            GTEST_SKIP() << "No device that fails writes.";

        // Larger than the file buffer, so the write reaches the device right away.
        const std::string bigChunk(256 * 1024, 'x');
        const auto error = makeError(ErrorKind::NeedsReconnectOnce, "connection lost", 7);
        EXPECT_CALL(*backend_, get("/f", _))
            .WillOnce(WithArg<1>(streamLater(std::make_shared<ScriptedReadStream>(
                queue_,
                std::vector<std::string>{"head", bigChunk, "tail"},
                error,
                ScriptedReadStream::Ending::ErrorThenClose))));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->download(LocalFile{full}, "/f"));
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().wrapperError, WrapperErrors::LocalFileFailure);
        EXPECT_EQ(failLines(), (std::vector<std::string>{"download fail: /f, Failed writing /dev/full"}));
    }

    TEST_F(TransferSessionTests, PwdIsTranscodedToHost)
    {
        EXPECT_CALL(*backend_, pwd(_)).WillOnce(WithArg<0>(completeLater<std::string>("/home/j\xF6rg"s)));

        auto result = await(session_->pwd());
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, "/home/j\xC3\xB6rg");
    }

    TEST_F(TransferSessionTests, ConnectFailureIsLoggedWithMessage)
    {
        EXPECT_CALL(*backend_, connect(std::optional<std::string>{"secret"}, _))
            .WillOnce(WithArg<1>(completeLater<void>(std::unexpected(makeError(ErrorKind::AuthFailed, "denied", 530)))));
        EXPECT_CALL(indicator_, settle()).Times(1);

        auto result = await(session_->connect("secret"));
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::AuthFailed);
        EXPECT_EQ(failLines(), (std::vector<std::string>{"connect fail: denied"}));
    }

    TEST_F(TransferSessionTests, LifecycleIsForwardedToBackend)
    {
        EXPECT_CALL(*backend_, connected()).WillOnce(::testing::Return(true));
        EXPECT_CALL(*backend_, disconnect()).Times(1);
        EXPECT_CALL(*backend_, terminate()).Times(1);

        EXPECT_TRUE(session_->connected());
        session_->disconnect();
        session_->terminate();
    }
}
