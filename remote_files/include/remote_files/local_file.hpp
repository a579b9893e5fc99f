#pragma once

#include <remote_files/byte_stream.hpp>
#include <remote_files/async/task_queue.hpp>

#include <expected>
#include <filesystem>
#include <memory>

namespace RemoteFiles
{
    /**
     * @brief A file on the local machine that transfers read from or write into.
     */
    class LocalFile
    {
      public:
        constexpr static std::size_t defaultChunkSize = 64 * 1024;

        explicit LocalFile(std::filesystem::path path)
            : path_{std::move(path)}
        {}

        std::filesystem::path const& path() const
        {
            return path_;
        }

        /**
         * @brief Opens the file for reading. Each chunk is read in its own task on the queue.
         */
        std::expected<std::shared_ptr<ReadStream>, RemoteError>
        openReadStream(TaskQueue& queue, std::size_t chunkSize = defaultChunkSize) const;

        /**
         * @brief Creates or truncates the file.
         */
        std::expected<std::unique_ptr<WriteStream>, RemoteError> openWriteStream() const;

      private:
        std::filesystem::path path_;
    };
}
