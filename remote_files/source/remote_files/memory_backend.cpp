#include <remote_files/memory_backend.hpp>
#include <remote_files/remote_path.hpp>

#include <log/log.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace RemoteFiles
{
    namespace
    {
        // SSH_FX_* status codes the backend reports with.
        constexpr int statusFailure = 4;
        constexpr int statusNoSuchFile = 2;
        constexpr int statusNoConnection = 6;
        constexpr int statusFileAlreadyExists = 11;

        std::uint64_t now()
        {
            return static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
                    .count());
        }

        RemoteError missing(Primitive primitive, std::string const& path)
        {
            return makeError(classifySftpStatus(statusNoSuchFile, primitive), "No such file: " + path, statusNoSuchFile);
        }

        RemoteError alreadyExists(Primitive primitive, std::string const& path)
        {
            return makeError(
                classifySftpStatus(statusFileAlreadyExists, primitive),
                "File already exists: " + path,
                statusFileAlreadyExists);
        }

        RemoteError failure(Primitive primitive, std::string message)
        {
            return makeError(classifySftpStatus(statusFailure, primitive), std::move(message), statusFailure);
        }

        RemoteError notConnected(Primitive primitive)
        {
            auto error = makeError(classifySftpStatus(statusNoConnection, primitive), "Not connected", statusNoConnection);
            error.wrapperError = WrapperErrors::NotConnected;
            return error;
        }

        RemoteError terminated()
        {
            auto error = makeError(ErrorKind::NeedsReconnect, "Connection terminated", statusNoConnection);
            error.wrapperError = WrapperErrors::Terminated;
            return error;
        }

        std::string parentOf(std::string const& path)
        {
            const auto pos = path.find_last_of('/');
            if (pos == std::string::npos || pos == 0)
                return "/";
            return path.substr(0, pos);
        }

        std::string childPrefix(std::string const& directory)
        {
            if (directory == "/")
                return directory;
            return directory + "/";
        }

        bool isDirectory(MemoryBackend::State const& state, std::string const& path)
        {
            const auto iter = state.nodes.find(path);
            return iter != std::end(state.nodes) && iter->second.type == FileType::Directory;
        }

        // Calls func(path, node) for every node strictly below the directory.
        template <typename Func>
        void forEachDescendant(MemoryBackend::State& state, std::string const& directory, Func&& func)
        {
            const auto prefix = childPrefix(directory);
            for (auto iter = state.nodes.lower_bound(prefix);
                 iter != std::end(state.nodes) && iter->first.starts_with(prefix);
                 ++iter)
            {
                if (iter->first != directory)
                    func(iter->first, iter->second);
            }
        }

        bool hasChildren(MemoryBackend::State& state, std::string const& directory)
        {
            bool found = false;
            forEachDescendant(state, directory, [&found](auto const&, auto const&) {
                found = true;
            });
            return found;
        }

        void eraseSubtree(MemoryBackend::State& state, std::string const& path)
        {
            std::vector<std::string> doomed{path};
            if (isDirectory(state, path))
            {
                forEachDescendant(state, path, [&doomed](std::string const& descendant, auto const&) {
                    doomed.push_back(descendant);
                });
            }
            for (auto const& victim : doomed)
                state.nodes.erase(victim);
        }

        // Returns false if a non directory is in the way.
        bool createDirectories(MemoryBackend::State& state, std::string const& path)
        {
            if (path == "/")
                return true;
            if (auto iter = state.nodes.find(path); iter != std::end(state.nodes))
                return iter->second.type == FileType::Directory;
            if (!createDirectories(state, parentOf(path)))
                return false;
            state.nodes[path] = MemoryBackend::Node{.type = FileType::Directory, .mtime = now()};
            return true;
        }

        class MemoryReadStream
            : public ReadStream
            , public std::enable_shared_from_this<MemoryReadStream>
        {
          public:
            MemoryReadStream(
                TaskQueue& queue,
                std::shared_ptr<MemoryBackend::State> state,
                std::string content,
                std::size_t chunkSize)
                : queue_{&queue}
                , state_{std::move(state)}
                , generation_{state_->generation}
                , content_{std::move(content)}
                , chunkSize_{std::max<std::size_t>(chunkSize, 1)}
            {}

            void start(Handlers handlers) override
            {
                handlers_ = std::move(handlers);
                scheduleChunk();
            }

          private:
            void scheduleChunk()
            {
                const bool pushed = queue_->pushTask([self = shared_from_this()]() {
                    self->emitChunk();
                });
                if (!pushed)
                    handlers_.onError(makeWrapperError(WrapperErrors::StreamFailure, "Task queue is shut down."));
            }

            void emitChunk()
            {
                if (state_->generation != generation_)
                    return handlers_.onError(terminated());

                if (offset_ < content_.size())
                {
                    const auto amount = std::min(chunkSize_, content_.size() - offset_);
                    handlers_.onData(std::string_view{content_}.substr(offset_, amount));
                    offset_ += amount;
                }

                if (offset_ >= content_.size())
                    return handlers_.onClose();
                scheduleChunk();
            }

          private:
            TaskQueue* queue_;
            std::shared_ptr<MemoryBackend::State> state_;
            std::size_t generation_;
            std::string content_;
            std::size_t chunkSize_;
            std::size_t offset_{0};
            Handlers handlers_{};
        };
    }

    MemoryBackend::MemoryBackend(TaskQueue& queue)
        : MemoryBackend{queue, Options{}}
    {}

    MemoryBackend::MemoryBackend(TaskQueue& queue, Options options)
        : queue_{&queue}
        , options_{std::move(options)}
        , state_{std::make_shared<State>()}
        , injectedErrors_{}
        , callCounts_{}
    {
        state_->nodes["/"] = Node{.type = FileType::Directory, .mtime = now()};
        options_.homeDirectory = RemotePath::normalize(RemotePath::join("/", options_.homeDirectory));
        createDirectories(*state_, options_.homeDirectory);
    }

    std::string MemoryBackend::absolute(std::string const& path) const
    {
        return RemotePath::normalize(RemotePath::join(options_.homeDirectory, path));
    }

    void MemoryBackend::addDirectory(std::string const& path)
    {
        if (!createDirectories(*state_, absolute(path)))
            throw std::invalid_argument("MemoryBackend: A file is in the way of " + path);
    }

    void MemoryBackend::addFile(std::string const& path, std::string content)
    {
        const auto full = absolute(path);
        addDirectory(parentOf(full));
        state_->nodes[full] = Node{.type = FileType::Regular, .content = std::move(content), .mtime = now()};
    }

    void MemoryBackend::addSymlink(std::string const& path, std::string target)
    {
        const auto full = absolute(path);
        addDirectory(parentOf(full));
        state_->nodes[full] = Node{.type = FileType::Symlink, .linkTarget = std::move(target), .mtime = now()};
    }

    bool MemoryBackend::exists(std::string const& path) const
    {
        return state_->nodes.contains(absolute(path));
    }

    std::optional<std::string> MemoryBackend::fileContent(std::string const& path) const
    {
        const auto iter = state_->nodes.find(absolute(path));
        if (iter == std::end(state_->nodes) || iter->second.type != FileType::Regular)
            return std::nullopt;
        return iter->second.content;
    }

    void MemoryBackend::failNext(Primitive primitive, RemoteError error)
    {
        injectedErrors_[primitive].push_back(std::move(error));
    }

    std::size_t MemoryBackend::callCount(Primitive primitive) const
    {
        const auto iter = callCounts_.find(primitive);
        if (iter == std::end(callCounts_))
            return 0;
        return iter->second;
    }

    template <typename T, typename Work>
    void MemoryBackend::defer(Primitive primitive, Completion<T> onComplete, Work&& work)
    {
        ++callCounts_[primitive];

        std::optional<RemoteError> injected{std::nullopt};
        if (auto iter = injectedErrors_.find(primitive); iter != std::end(injectedErrors_) && !iter->second.empty())
        {
            injected = std::move(iter->second.front());
            iter->second.pop_front();
        }

        const bool pushed = queue_->pushTask([state = state_,
                                              generation = state_->generation,
                                              primitive,
                                              injected = std::move(injected),
                                              onComplete = std::move(onComplete),
                                              work = std::forward<Work>(work)]() mutable {
            if (state->generation != generation)
                return onComplete(std::unexpected(terminated()));
            if (injected)
                return onComplete(std::unexpected(*injected));
            if (primitive != Primitive::Connect && !state->connected)
                return onComplete(std::unexpected(notConnected(primitive)));
            onComplete(work(*state));
        });
        if (!pushed)
            throw std::runtime_error("MemoryBackend: Task queue is shut down.");
    }

    void MemoryBackend::connect(std::optional<std::string> const& password, Completion<void> onComplete)
    {
        defer<void>(
            Primitive::Connect,
            std::move(onComplete),
            [requiredPassword = options_.password, password](State& state) -> std::expected<void, RemoteError> {
                if (requiredPassword && password != requiredPassword)
                    return std::unexpected(makeError(ErrorKind::AuthFailed, "Authentication failed"));
                state.connected = true;
                return {};
            });
    }

    void MemoryBackend::disconnect()
    {
        state_->connected = false;
    }

    void MemoryBackend::terminate()
    {
        Log::debug("MemoryBackend: Terminating generation {}.", state_->generation);
        state_->connected = false;
        ++state_->generation;
    }

    bool MemoryBackend::connected() const
    {
        return state_->connected;
    }

    void MemoryBackend::pwd(Completion<std::string> onComplete)
    {
        defer<std::string>(
            Primitive::Pwd, std::move(onComplete), [home = options_.homeDirectory](State&) -> std::expected<std::string, RemoteError> {
                return home;
            });
    }

    void MemoryBackend::mkdir(std::string const& path, bool recursive, Completion<void> onComplete)
    {
        defer<void>(
            Primitive::Mkdir,
            std::move(onComplete),
            [full = absolute(path), path, recursive](State& state) -> std::expected<void, RemoteError> {
                if (state.nodes.contains(full))
                {
                    if (isDirectory(state, full))
                        return std::unexpected(alreadyExists(Primitive::Mkdir, path));
                    return std::unexpected(failure(Primitive::Mkdir, "Not a directory: " + path));
                }
                if (!recursive && !isDirectory(state, parentOf(full)))
                    return std::unexpected(missing(Primitive::Mkdir, parentOf(full)));
                if (!createDirectories(state, full))
                    return std::unexpected(failure(Primitive::Mkdir, "Not a directory: " + path));
                return {};
            });
    }

    void MemoryBackend::rmdir(std::string const& path, bool recursive, Completion<void> onComplete)
    {
        defer<void>(
            Primitive::Rmdir,
            std::move(onComplete),
            [full = absolute(path), path, recursive](State& state) -> std::expected<void, RemoteError> {
                if (!state.nodes.contains(full))
                    return std::unexpected(missing(Primitive::Rmdir, path));
                if (!isDirectory(state, full))
                    return std::unexpected(failure(Primitive::Rmdir, "Not a directory: " + path));
                if (full == "/")
                    return std::unexpected(failure(Primitive::Rmdir, "Cannot remove the root directory"));
                if (!recursive && hasChildren(state, full))
                    return std::unexpected(failure(Primitive::Rmdir, "Directory not empty: " + path));
                eraseSubtree(state, full);
                return {};
            });
    }

    void MemoryBackend::remove(std::string const& path, Completion<void> onComplete)
    {
        defer<void>(
            Primitive::Delete,
            std::move(onComplete),
            [full = absolute(path), path](State& state) -> std::expected<void, RemoteError> {
                const auto iter = state.nodes.find(full);
                if (iter == std::end(state.nodes))
                    return std::unexpected(missing(Primitive::Delete, path));
                if (iter->second.type == FileType::Directory)
                    return std::unexpected(failure(Primitive::Delete, "Is a directory: " + path));
                state.nodes.erase(iter);
                return {};
            });
    }

    void MemoryBackend::put(LocalFile const& local, std::string const& path, Completion<void> onComplete)
    {
        defer<void>(
            Primitive::Put,
            std::move(onComplete),
            [full = absolute(path), path, localPath = local.path()](State& state) -> std::expected<void, RemoteError> {
                std::ifstream file{localPath, std::ios_base::binary};
                if (!file.is_open())
                {
                    return std::unexpected(
                        makeWrapperError(WrapperErrors::LocalFileFailure, "Cannot open " + localPath.string()));
                }
                std::stringstream content;
                content << file.rdbuf();

                if (!isDirectory(state, parentOf(full)))
                    return std::unexpected(missing(Primitive::Put, path));
                if (isDirectory(state, full))
                    return std::unexpected(failure(Primitive::Put, "Is a directory: " + path));
                state.nodes[full] = Node{.type = FileType::Regular, .content = content.str(), .mtime = now()};
                return {};
            });
    }

    void MemoryBackend::write(std::string const& data, std::string const& path, Completion<void> onComplete)
    {
        defer<void>(
            Primitive::Write,
            std::move(onComplete),
            [full = absolute(path), path, data](State& state) -> std::expected<void, RemoteError> {
                if (!isDirectory(state, parentOf(full)))
                    return std::unexpected(missing(Primitive::Write, path));
                if (isDirectory(state, full))
                    return std::unexpected(failure(Primitive::Write, "Is a directory: " + path));
                state.nodes[full] = Node{.type = FileType::Regular, .content = data, .mtime = now()};
                return {};
            });
    }

    void MemoryBackend::get(std::string const& path, Completion<std::shared_ptr<ReadStream>> onComplete)
    {
        defer<std::shared_ptr<ReadStream>>(
            Primitive::Get,
            std::move(onComplete),
            [queue = queue_, shared = state_, chunkSize = options_.chunkSize, full = absolute(path), path](
                State& state) -> std::expected<std::shared_ptr<ReadStream>, RemoteError> {
                const auto iter = state.nodes.find(full);
                if (iter == std::end(state.nodes))
                    return std::unexpected(missing(Primitive::Get, path));
                if (iter->second.type != FileType::Regular)
                    return std::unexpected(failure(Primitive::Get, "Not a regular file: " + path));
                return std::make_shared<MemoryReadStream>(*queue, shared, iter->second.content, chunkSize);
            });
    }

    void MemoryBackend::list(std::string const& path, Completion<std::vector<FileEntry>> onComplete)
    {
        defer<std::vector<FileEntry>>(
            Primitive::List,
            std::move(onComplete),
            [full = absolute(path), path](State& state) -> std::expected<std::vector<FileEntry>, RemoteError> {
                if (!state.nodes.contains(full))
                    return std::unexpected(missing(Primitive::List, path));
                if (!isDirectory(state, full))
                    return std::unexpected(failure(Primitive::List, "Not a directory: " + path));

                std::vector<FileEntry> entries;
                const auto prefix = childPrefix(full);
                forEachDescendant(state, full, [&entries, &prefix](std::string const& descendant, Node const& node) {
                    const auto name = descendant.substr(prefix.size());
                    if (name.find('/') != std::string::npos)
                        return;
                    entries.push_back(FileEntry{
                        .name = name,
                        .type = node.type,
                        .size = node.type == FileType::Symlink ? node.linkTarget.size() : node.content.size(),
                        .mtime = node.mtime,
                    });
                });
                return entries;
            });
    }

    void MemoryBackend::readlink(FileEntry const&, std::string const& path, Completion<std::string> onComplete)
    {
        defer<std::string>(
            Primitive::Readlink,
            std::move(onComplete),
            [full = absolute(path), path](State& state) -> std::expected<std::string, RemoteError> {
                const auto iter = state.nodes.find(full);
                if (iter == std::end(state.nodes))
                    return std::unexpected(missing(Primitive::Readlink, path));
                if (iter->second.type != FileType::Symlink)
                    return std::unexpected(failure(Primitive::Readlink, "Not a symlink: " + path));
                return iter->second.linkTarget;
            });
    }

    void MemoryBackend::rename(std::string const& from, std::string const& to, Completion<void> onComplete)
    {
        defer<void>(
            Primitive::Rename,
            std::move(onComplete),
            [fullFrom = absolute(from), fullTo = absolute(to), from, to](State& state) -> std::expected<void, RemoteError> {
                if (!state.nodes.contains(fullFrom))
                    return std::unexpected(missing(Primitive::Rename, from));
                if (!isDirectory(state, parentOf(fullTo)))
                    return std::unexpected(missing(Primitive::Rename, to));
                if (fullFrom == fullTo)
                    return {};
                if (fullTo.starts_with(childPrefix(fullFrom)))
                    return std::unexpected(failure(Primitive::Rename, "Cannot move " + from + " into itself"));
                if (state.nodes.contains(fullTo))
                    return std::unexpected(alreadyExists(Primitive::Rename, to));

                std::vector<std::pair<std::string, Node>> moved;
                moved.emplace_back(fullTo, state.nodes[fullFrom]);
                if (isDirectory(state, fullFrom))
                {
                    forEachDescendant(state, fullFrom, [&](std::string const& descendant, Node const& node) {
                        moved.emplace_back(fullTo + descendant.substr(fullFrom.size()), node);
                    });
                }
                eraseSubtree(state, fullFrom);
                for (auto& [key, node] : moved)
                    state.nodes[key] = std::move(node);
                return {};
            });
    }
}
