#pragma once

#include <remote_files/local_file.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

extern std::filesystem::path programDirectory;

namespace RemoteFiles::Test
{
    class LocalFileTests : public ::testing::Test
    {
      protected:
        std::string readAll(std::filesystem::path const& path)
        {
            std::ifstream file{path, std::ios_base::binary};
            std::stringstream buffer;
            buffer << file.rdbuf();
            return buffer.str();
        }

      protected:
        Utility::TemporaryDirectory directory_{programDirectory / "temp", true};
        TaskQueue queue_{};
    };

    TEST_F(LocalFileTests, ReadStreamDeliversAllChunksThenCloses)
    {
        const auto path = directory_.path() / "source.bin";
        std::ofstream{path, std::ios_base::binary} << "0123456789";

        auto stream = LocalFile{path}.openReadStream(queue_, 3);
        ASSERT_TRUE(stream.has_value());

        std::string received;
        int chunks = 0;
        bool closed = false;
        (*stream)->start(ReadStream::Handlers{
            .onData =
                [&](std::string_view data) {
                    received.append(data);
                    ++chunks;
                },
            .onClose =
                [&]() {
                    closed = true;
                },
            .onError =
                [](RemoteError const& error) {
                    ADD_FAILURE() << error.toString();
                },
        });
        stream->reset();
        EXPECT_FALSE(closed);

        queue_.runUntilIdle();
        EXPECT_TRUE(closed);
        EXPECT_EQ(received, "0123456789");
        EXPECT_EQ(chunks, 4);
    }

    TEST_F(LocalFileTests, OpeningMissingFileForReadingFails)
    {
        auto stream = LocalFile{directory_.path() / "missing"}.openReadStream(queue_);
        ASSERT_FALSE(stream.has_value());
        EXPECT_EQ(stream.error().wrapperError, WrapperErrors::LocalFileFailure);
    }

    TEST_F(LocalFileTests, WriteStreamTruncatesAndWrites)
    {
        const auto path = directory_.path() / "target.bin";
        std::ofstream{path, std::ios_base::binary} << "old content that is long";

        auto stream = LocalFile{path}.openWriteStream();
        ASSERT_TRUE(stream.has_value());
        EXPECT_TRUE((*stream)->write("new ").has_value());
        EXPECT_TRUE((*stream)->write("data").has_value());

        bool closed = false;
        (*stream)->close([&closed](std::expected<void, RemoteError> result) {
            closed = result.has_value();
        });
        EXPECT_TRUE(closed);
        EXPECT_EQ(readAll(path), "new data");
    }

    TEST_F(LocalFileTests, OpeningWriteStreamInMissingDirectoryFails)
    {
        auto stream = LocalFile{directory_.path() / "no" / "such" / "dir" / "file"}.openWriteStream();
        ASSERT_FALSE(stream.has_value());
        EXPECT_EQ(stream.error().wrapperError, WrapperErrors::LocalFileFailure);
    }
}
