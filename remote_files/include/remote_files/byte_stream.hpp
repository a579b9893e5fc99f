#pragma once

#include <remote_files/remote_error.hpp>

#include <expected>
#include <functional>
#include <string_view>

namespace RemoteFiles
{
    /**
     * @brief A source of bytes. After start, onData fires for every chunk in order, then exactly one of onClose or
     * onError.
     */
    class ReadStream
    {
      public:
        struct Handlers
        {
            std::function<void(std::string_view data)> onData = [](std::string_view) {};
            std::function<void()> onClose = []() {};
            std::function<void(RemoteError const& error)> onError = [](RemoteError const&) {};
        };

        ReadStream() = default;
        virtual ~ReadStream() = default;
        ReadStream(ReadStream const&) = delete;
        ReadStream& operator=(ReadStream const&) = delete;
        ReadStream(ReadStream&&) = delete;
        ReadStream& operator=(ReadStream&&) = delete;

        /**
         * @brief Starts the flow of data. Must only be called once.
         * The stream keeps itself alive until it closed or failed.
         */
        virtual void start(Handlers handlers) = 0;
    };

    class WriteStream
    {
      public:
        WriteStream() = default;
        virtual ~WriteStream() = default;
        WriteStream(WriteStream const&) = delete;
        WriteStream& operator=(WriteStream const&) = delete;
        WriteStream(WriteStream&&) = delete;
        WriteStream& operator=(WriteStream&&) = delete;

        virtual std::expected<void, RemoteError> write(std::string_view data) = 0;

        /**
         * @brief Flushes and closes the stream, then calls onClosed with the outcome.
         */
        virtual void close(std::function<void(std::expected<void, RemoteError>)> onClosed) = 0;
    };
}
