#pragma once

#include <remote_files/async/task_queue.hpp>
#include <remote_files/backend.hpp>
#include <remote_files/charset_transcoder.hpp>
#include <remote_files/error_classifier.hpp>
#include <remote_files/file_entry.hpp>
#include <remote_files/local_file.hpp>
#include <remote_files/operation_reporter.hpp>
#include <remote_files/remote_error.hpp>
#include <remote_files/session_options.hpp>

#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace RemoteFiles
{
    /**
     * @brief The protocol agnostic operation set of one remote endpoint.
     *
     * Takes remote paths in the host charset, talks to the backend in the wire charset and reports every operation
     * through the reporter. All futures become ready while the task queue is driven, never by a call on this class.
     * The session must outlive all futures it returned.
     */
    class TransferSession
    {
      public:
        using InvalidEncodingHandler = std::function<void(std::vector<std::string> const& names)>;

        /**
         * @throws std::invalid_argument if the configured charsets are not supported.
         */
        TransferSession(
            std::unique_ptr<Backend> backend,
            TaskQueue& queue,
            SessionOptions options,
            StatusIndicator& indicator,
            LogSink& logSink);
        ~TransferSession() = default;
        TransferSession(TransferSession const&) = delete;
        TransferSession& operator=(TransferSession const&) = delete;
        TransferSession(TransferSession&&) = delete;
        TransferSession& operator=(TransferSession&&) = delete;

        std::future<std::expected<void, RemoteError>> connect(std::optional<std::string> const& password = std::nullopt);
        void disconnect();

        /**
         * @brief Aborts the connection. In-flight operations fail, settle and report.
         */
        void terminate();
        bool connected() const;

        std::future<std::expected<std::string, RemoteError>> pwd();

        /**
         * @param failMessage Replaces the backend message in the failure log line if set.
         */
        std::future<std::expected<void, RemoteError>> upload(
            std::string const& remotePath,
            LocalFile const& local,
            std::optional<std::string> failMessage = std::nullopt);

        /**
         * @brief Streams the remote file into the local file. Ready once the local file is closed.
         */
        std::future<std::expected<void, RemoteError>> download(LocalFile const& local, std::string const& remotePath);

        /**
         * @brief Reads the whole remote file into memory.
         */
        std::future<std::expected<std::string, RemoteError>> view(std::string const& remotePath);

        std::future<std::expected<void, RemoteError>> write(std::string const& remotePath, std::string data);

        /**
         * @brief Lists a directory. An empty path lists ".". Names are returned in the host charset.
         * Names that did not survive transcoding are passed to the invalid encoding handler in a later task.
         */
        std::future<std::expected<std::vector<FileEntry>, RemoteError>> list(std::string remotePath);

        /**
         * @brief Recursively removes a directory. A missing directory is success.
         */
        std::future<std::expected<void, RemoteError>> rmdir(std::string const& remotePath);

        /**
         * @brief Removes a file. A missing file is success.
         */
        std::future<std::expected<void, RemoteError>> remove(std::string const& remotePath);

        /**
         * @brief Recursively creates a directory. An already existing directory is success.
         */
        std::future<std::expected<void, RemoteError>> mkdir(std::string const& remotePath);

        /**
         * @brief Resolves a symlink to an absolute normalized path and stores it in entry.link.
         * Fails with WrapperErrors::NotSymlink without contacting the backend if the entry is no symlink.
         * The entry must stay alive until the returned future is ready.
         */
        std::future<std::expected<std::string, RemoteError>> readlink(FileEntry& entry, std::string const& remotePath);

        std::future<std::expected<void, RemoteError>> rename(std::string const& fromPath, std::string const& toPath);

        void setInvalidEncodingHandler(InvalidEncodingHandler handler);

        CharsetTranscoder const& transcoder() const
        {
            return transcoder_;
        }
        SessionOptions const& options() const
        {
            return options_;
        }

      private:
        template <typename T>
        std::future<std::expected<T, RemoteError>> callWithName(
            std::string const& name,
            std::string const& remotePath,
            std::optional<ErrorKind> swallowedKind,
            std::function<void(std::string const& wirePath, Completion<T>)> call);

        template <typename T>
        void invokeBackend(std::string const& name, std::function<void(Completion<T>)> const& call, Completion<T> onComplete);

      private:
        std::unique_ptr<Backend> backend_;
        TaskQueue* queue_;
        SessionOptions options_;
        CharsetTranscoder transcoder_;
        OperationReporter reporter_;
        InvalidEncodingHandler onInvalidEncoding_;
    };
}
