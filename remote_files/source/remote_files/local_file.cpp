#include <remote_files/local_file.hpp>

#include <log/log.hpp>

#include <algorithm>
#include <fstream>
#include <string>

namespace RemoteFiles
{
    namespace
    {
        class FileReadStream
            : public ReadStream
            , public std::enable_shared_from_this<FileReadStream>
        {
          public:
            FileReadStream(TaskQueue& queue, std::ifstream file, std::filesystem::path path, std::size_t chunkSize)
                : queue_{&queue}
                , file_{std::move(file)}
                , path_{std::move(path)}
                , buffer_(std::max<std::size_t>(chunkSize, 1), '\0')
            {}

            void start(Handlers handlers) override
            {
                handlers_ = std::move(handlers);
                scheduleRead();
            }

          private:
            void scheduleRead()
            {
                const bool pushed = queue_->pushTask([self = shared_from_this()]() {
                    self->readOnce();
                });
                if (!pushed)
                {
                    handlers_.onError(
                        makeWrapperError(WrapperErrors::StreamFailure, "Task queue shut down while reading"));
                }
            }

            void readOnce()
            {
                file_.read(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
                const auto readAmount = static_cast<std::size_t>(file_.gcount());

                if (file_.bad())
                {
                    handlers_.onError(
                        makeWrapperError(WrapperErrors::LocalFileFailure, "Failed reading " + path_.string()));
                    return;
                }

                if (readAmount > 0)
                    handlers_.onData(std::string_view{buffer_.data(), readAmount});

                if (file_.eof())
                {
                    file_.close();
                    handlers_.onClose();
                    return;
                }
                scheduleRead();
            }

          private:
            TaskQueue* queue_;
            std::ifstream file_;
            std::filesystem::path path_;
            std::string buffer_;
            Handlers handlers_{};
        };

        class FileWriteStream : public WriteStream
        {
          public:
            FileWriteStream(std::ofstream file, std::filesystem::path path)
                : file_{std::move(file)}
                , path_{std::move(path)}
            {}

            std::expected<void, RemoteError> write(std::string_view data) override
            {
                file_.write(data.data(), static_cast<std::streamsize>(data.size()));
                if (!file_.good())
                {
                    return std::unexpected(
                        makeWrapperError(WrapperErrors::LocalFileFailure, "Failed writing " + path_.string()));
                }
                return {};
            }

            void close(std::function<void(std::expected<void, RemoteError>)> onClosed) override
            {
                if (!file_.is_open())
                    return onClosed({});
                file_.flush();
                const bool good = file_.good();
                file_.close();
                if (!good || file_.fail())
                {
                    onClosed(std::unexpected(
                        makeWrapperError(WrapperErrors::LocalFileFailure, "Failed closing " + path_.string())));
                    return;
                }
                onClosed({});
            }

          private:
            std::ofstream file_;
            std::filesystem::path path_;
        };
    }

    std::expected<std::shared_ptr<ReadStream>, RemoteError>
    LocalFile::openReadStream(TaskQueue& queue, std::size_t chunkSize) const
    {
        std::ifstream file{path_, std::ios_base::binary};
        if (!file.is_open())
        {
            Log::debug("LocalFile: Cannot open '{}' for reading.", path_.string());
            return std::unexpected(makeWrapperError(WrapperErrors::LocalFileFailure, "Cannot open " + path_.string()));
        }
        return std::make_shared<FileReadStream>(queue, std::move(file), path_, chunkSize);
    }

    std::expected<std::unique_ptr<WriteStream>, RemoteError> LocalFile::openWriteStream() const
    {
        std::ofstream file{path_, std::ios_base::binary | std::ios_base::trunc};
        if (!file.is_open())
        {
            Log::debug("LocalFile: Cannot open '{}' for writing.", path_.string());
            return std::unexpected(makeWrapperError(WrapperErrors::LocalFileFailure, "Cannot open " + path_.string()));
        }
        return std::make_unique<FileWriteStream>(std::move(file), path_);
    }
}
