#pragma once

#include <remote_files/byte_stream.hpp>
#include <remote_files/file_entry.hpp>
#include <remote_files/local_file.hpp>
#include <remote_files/remote_error.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace RemoteFiles
{
    template <typename T>
    using Completion = std::function<void(std::expected<T, RemoteError>)>;

    /**
     * @brief The primitives a protocol driver provides. All paths are in the wire charset.
     *
     * Every completion is called exactly once and never from inside the call that received it.
     * Failures carry an ErrorKind assigned by the backend where the failure happened.
     */
    class Backend
    {
      public:
        virtual ~Backend() = default;

        virtual void connect(std::optional<std::string> const& password, Completion<void> onComplete) = 0;
        virtual void disconnect() = 0;

        /**
         * @brief Hard abort. In-flight primitives complete with an error.
         */
        virtual void terminate() = 0;
        virtual bool connected() const = 0;

        virtual void pwd(Completion<std::string> onComplete) = 0;
        virtual void mkdir(std::string const& path, bool recursive, Completion<void> onComplete) = 0;
        virtual void rmdir(std::string const& path, bool recursive, Completion<void> onComplete) = 0;
        virtual void remove(std::string const& path, Completion<void> onComplete) = 0;
        virtual void put(LocalFile const& local, std::string const& path, Completion<void> onComplete) = 0;
        virtual void write(std::string const& data, std::string const& path, Completion<void> onComplete) = 0;

        /**
         * @brief Opens the remote file. The returned stream does not flow before start is called on it.
         */
        virtual void get(std::string const& path, Completion<std::shared_ptr<ReadStream>> onComplete) = 0;
        virtual void list(std::string const& path, Completion<std::vector<FileEntry>> onComplete) = 0;

        /**
         * @brief Returns the raw, unresolved link target in the wire charset.
         */
        virtual void
        readlink(FileEntry const& entry, std::string const& path, Completion<std::string> onComplete) = 0;
        virtual void rename(std::string const& from, std::string const& to, Completion<void> onComplete) = 0;
    };
}
