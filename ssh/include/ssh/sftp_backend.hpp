#pragma once

#include <persistence/state/remote_options.hpp>
#include <remote_files/async/task_queue.hpp>
#include <remote_files/backend.hpp>
#include <remote_files/error_classifier.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace SecureShell
{
    /**
     * @brief The SFTP variant of the backend contract on top of libssh.
     *
     * Blocking libssh calls run on an internal processing thread, completions are posted back to the task queue.
     * The task queue must outlive the backend.
     */
    class SftpBackend : public RemoteFiles::Backend
    {
      public:
        // Fallback if the server does not announce its limits.
        constexpr static std::size_t defaultTransferChunkSize = 32 * 1024;

        SftpBackend(RemoteFiles::TaskQueue& queue, Persistence::RemoteOptions options);
        ~SftpBackend() override;
        SftpBackend(SftpBackend const&) = delete;
        SftpBackend& operator=(SftpBackend const&) = delete;
        SftpBackend(SftpBackend&&) = delete;
        SftpBackend& operator=(SftpBackend&&) = delete;

        /**
         * @brief Connects and authenticates. A private key from the options takes precedence over a password.
         * The password argument overrides the configured password.
         */
        void connect(std::optional<std::string> const& password, RemoteFiles::Completion<void> onComplete) override;
        void disconnect() override;

        /**
         * @brief Drops the connection without an SFTP shutdown and without waiting for the call in flight.
         * The socket is shut down from the calling thread, so blocked libssh calls return at once. The backend can
         * connect again afterwards.
         */
        void terminate() override;
        bool connected() const override;

        void pwd(RemoteFiles::Completion<std::string> onComplete) override;
        void mkdir(std::string const& path, bool recursive, RemoteFiles::Completion<void> onComplete) override;
        void rmdir(std::string const& path, bool recursive, RemoteFiles::Completion<void> onComplete) override;
        void remove(std::string const& path, RemoteFiles::Completion<void> onComplete) override;
        void put(
            RemoteFiles::LocalFile const& local,
            std::string const& path,
            RemoteFiles::Completion<void> onComplete) override;
        void write(std::string const& data, std::string const& path, RemoteFiles::Completion<void> onComplete) override;
        void get(
            std::string const& path,
            RemoteFiles::Completion<std::shared_ptr<RemoteFiles::ReadStream>> onComplete) override;
        void list(std::string const& path, RemoteFiles::Completion<std::vector<RemoteFiles::FileEntry>> onComplete)
            override;
        void readlink(
            RemoteFiles::FileEntry const& entry,
            std::string const& path,
            RemoteFiles::Completion<std::string> onComplete) override;
        void rename(std::string const& from, std::string const& to, RemoteFiles::Completion<void> onComplete)
            override;

        // Shared with the read streams the backend opened.
        struct Context;

      private:
        template <typename T, typename FunctionT>
        void perform(RemoteFiles::Primitive primitive, RemoteFiles::Completion<T> onComplete, FunctionT&& work);

      private:
        std::shared_ptr<Context> context_;
    };
}
