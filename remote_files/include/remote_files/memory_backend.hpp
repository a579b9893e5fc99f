#pragma once

#include <remote_files/async/task_queue.hpp>
#include <remote_files/backend.hpp>
#include <remote_files/error_classifier.hpp>

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace RemoteFiles
{
    /**
     * @brief A backend over an in memory file tree. Every primitive completes in a later task of the queue.
     * Failures carry the kinds an SFTP server would produce.
     */
    class MemoryBackend : public Backend
    {
      public:
        struct Options
        {
            // Bytes per data event of a get stream.
            std::size_t chunkSize = 4096;
            // Directory relative paths are resolved against.
            std::string homeDirectory = "/";
            // If set, connect fails with auth-failed for other passwords.
            std::optional<std::string> password = std::nullopt;
        };

        explicit MemoryBackend(TaskQueue& queue);
        MemoryBackend(TaskQueue& queue, Options options);
        ~MemoryBackend() override = default;
        MemoryBackend(MemoryBackend const&) = delete;
        MemoryBackend& operator=(MemoryBackend const&) = delete;
        MemoryBackend(MemoryBackend&&) = delete;
        MemoryBackend& operator=(MemoryBackend&&) = delete;

        // Tree setup and inspection, paths in the wire charset. Missing parents are created.
        void addDirectory(std::string const& path);
        void addFile(std::string const& path, std::string content);
        void addSymlink(std::string const& path, std::string target);
        bool exists(std::string const& path) const;
        std::optional<std::string> fileContent(std::string const& path) const;

        /**
         * @brief The next call of the primitive fails with the given error instead of running.
         */
        void failNext(Primitive primitive, RemoteError error);

        std::size_t callCount(Primitive primitive) const;

        void connect(std::optional<std::string> const& password, Completion<void> onComplete) override;
        void disconnect() override;
        void terminate() override;
        bool connected() const override;

        void pwd(Completion<std::string> onComplete) override;
        void mkdir(std::string const& path, bool recursive, Completion<void> onComplete) override;
        void rmdir(std::string const& path, bool recursive, Completion<void> onComplete) override;
        void remove(std::string const& path, Completion<void> onComplete) override;
        void put(LocalFile const& local, std::string const& path, Completion<void> onComplete) override;
        void write(std::string const& data, std::string const& path, Completion<void> onComplete) override;
        void get(std::string const& path, Completion<std::shared_ptr<ReadStream>> onComplete) override;
        void list(std::string const& path, Completion<std::vector<FileEntry>> onComplete) override;
        void readlink(FileEntry const& entry, std::string const& path, Completion<std::string> onComplete) override;
        void rename(std::string const& from, std::string const& to, Completion<void> onComplete) override;

      public:
        struct Node
        {
            FileType type{FileType::Regular};
            std::string content{};
            std::string linkTarget{};
            std::uint64_t mtime{0};
        };

        struct State
        {
            std::map<std::string, Node> nodes{};
            bool connected{false};
            // Incremented by terminate. Work started in an older generation fails.
            std::size_t generation{0};
        };

      private:
        template <typename T, typename Work>
        void defer(Primitive primitive, Completion<T> onComplete, Work&& work);

        std::string absolute(std::string const& path) const;

      private:
        TaskQueue* queue_;
        Options options_;
        std::shared_ptr<State> state_;
        std::map<Primitive, std::deque<RemoteError>> injectedErrors_;
        std::map<Primitive, std::size_t> callCounts_;
    };
}
