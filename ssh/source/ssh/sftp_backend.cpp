#include <ssh/sftp_backend.hpp>
#include <ssh/async/processing_thread.hpp>
#include <ssh/sequential.hpp>

#include <remote_files/error_classifier.hpp>
#include <remote_files/remote_path.hpp>
#include <log/log.hpp>

#include <libssh/libsshpp.hpp>
#include <libssh/sftp.h>

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <fcntl.h>
#include <fstream>
#include <functional>
#include <mutex>
#include <set>
#include <stdexcept>
#include <system_error>
#include <utility>

#ifdef _WIN32
#    include <winsock2.h>
#else
#    include <sys/socket.h>
#endif

namespace SecureShell
{
    using namespace RemoteFiles;

    namespace
    {
        std::string_view sftpStatusToString(int status)
        {
            switch (status)
            {
                case SSH_FX_OK:
                    return "ok";
                case SSH_FX_EOF:
                    return "end of file";
                case SSH_FX_NO_SUCH_FILE:
                    return "no such file";
                case SSH_FX_PERMISSION_DENIED:
                    return "permission denied";
                case SSH_FX_FAILURE:
                    return "failure";
                case SSH_FX_BAD_MESSAGE:
                    return "bad message";
                case SSH_FX_NO_CONNECTION:
                    return "no connection";
                case SSH_FX_CONNECTION_LOST:
                    return "connection lost";
                case SSH_FX_OP_UNSUPPORTED:
                    return "operation unsupported";
                case SSH_FX_INVALID_HANDLE:
                    return "invalid handle";
                case SSH_FX_NO_SUCH_PATH:
                    return "no such path";
                case SSH_FX_FILE_ALREADY_EXISTS:
                    return "file already exists";
                case SSH_FX_WRITE_PROTECT:
                    return "write protected";
                case SSH_FX_NO_MEDIA:
                    return "no media";
                default:
                    return "unknown status";
            }
        }

        RemoteError terminated()
        {
            auto error = makeError(ErrorKind::NeedsReconnect, "Connection terminated", SSH_FX_NO_CONNECTION);
            error.wrapperError = WrapperErrors::Terminated;
            return error;
        }

        RemoteError notConnected(Primitive primitive)
        {
            auto error =
                makeError(classifySftpStatus(SSH_FX_NO_CONNECTION, primitive), "Not connected", SSH_FX_NO_CONNECTION);
            error.wrapperError = WrapperErrors::NotConnected;
            return error;
        }

        FileType fileTypeFromSftp(std::uint8_t type)
        {
            switch (type)
            {
                case SSH_FILEXFER_TYPE_REGULAR:
                    return FileType::Regular;
                case SSH_FILEXFER_TYPE_DIRECTORY:
                    return FileType::Directory;
                case SSH_FILEXFER_TYPE_SYMLINK:
                    return FileType::Symlink;
                default:
                    return FileType::Other;
            }
        }

        std::string joinChild(std::string const& directory, std::string const& name)
        {
            if (directory.empty() || directory.back() == '/')
                return directory + name;
            return directory + "/" + name;
        }
    }

    struct SftpBackend::Context
    {
        TaskQueue* queue;
        Persistence::RemoteOptions options;
        std::shared_ptr<std::atomic<std::uint64_t>> generation = std::make_shared<std::atomic<std::uint64_t>>(0);
        std::atomic_bool connected{false};

        // Guards creation and teardown of the session, so abortConnection can reach its socket.
        std::mutex sessionMutex{};

        // Only touched on the processing thread:
        std::unique_ptr<ssh::Session> session{};
        sftp_session sftp{nullptr};
        std::set<sftp_file> openFiles{};

        // Declared last, so pending tasks run while the rest is still alive.
        ProcessingThread processingThread{};

        Context(TaskQueue& queue, Persistence::RemoteOptions options)
            : queue{&queue}
            , options{std::move(options)}
        {
            if (!this->options.protocol)
                this->options.protocol = Persistence::Protocol::Sftp;
            processingThread.start(std::chrono::milliseconds{100});
        }

        ~Context()
        {
            processingThread.stop();
            closeSession(false);
        }

        Context(Context const&) = delete;
        Context& operator=(Context const&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

        bool isCurrent(std::uint64_t expected) const
        {
            return generation->load() == expected;
        }

        template <typename T>
        void complete(std::uint64_t expected, Completion<T> onComplete, std::expected<T, RemoteError> result)
        {
            const bool pushed = queue->pushTask([generation = generation,
                                                 expected,
                                                 onComplete = std::move(onComplete),
                                                 result = std::move(result)]() mutable {
                if (generation->load() != expected)
                    return onComplete(std::unexpected(terminated()));
                onComplete(std::move(result));
            });
            if (!pushed)
                Log::warn("SftpBackend: Task queue is shut down, dropping completion.");
        }

        RemoteError lastError(Primitive primitive, std::string_view what) const
        {
            if (!session)
                return notConnected(primitive);

            const int status = sftp ? sftp_get_error(sftp) : SSH_FX_OK;
            if (status != SSH_FX_OK)
            {
                return makeError(
                    classifySftpStatus(status, primitive),
                    fmt::format("{}: {}", what, sftpStatusToString(status)),
                    status);
            }

            const std::string sshMessage = ssh_get_error(session->getCSession());
            const int sshCode = ssh_get_error_code(session->getCSession());
            if (ssh_is_connected(session->getCSession()) == 0)
            {
                auto error = makeError(
                    ErrorKind::NeedsReconnect, fmt::format("{}: connection lost: {}", what, sshMessage), sshCode);
                error.wrapperError = WrapperErrors::NotConnected;
                return error;
            }
            return makeError(ErrorKind::Unclassified, fmt::format("{}: {}", what, sshMessage), sshCode);
        }

        std::size_t transferChunkSize(bool forReading) const
        {
            std::unique_ptr<sftp_limits_struct, decltype(&sftp_limits_free)> limits{sftp_limits(sftp), sftp_limits_free};
            if (!limits)
                return defaultTransferChunkSize;
            const auto size = forReading ? limits->max_read_length : limits->max_write_length;
            return size == 0 ? defaultTransferChunkSize : static_cast<std::size_t>(size);
        }

        std::expected<void, RemoteError> open(std::optional<std::string> const& password)
        {
            closeSession(false);
            {
                std::lock_guard lock{sessionMutex};
                session = std::make_unique<ssh::Session>();
            }
            auto& sshSession = *session;

            auto result = Detail::sequential(
                [&] {
                    return sshSession.setOption(SSH_OPTIONS_HOST, options.host.c_str());
                },
                [&] {
                    int port = options.portOrDefault();
                    return sshSession.setOption(SSH_OPTIONS_PORT, &port);
                },
                [&] {
                    if (options.username.has_value())
                        return sshSession.setOption(SSH_OPTIONS_USER, options.username->c_str());
                    return 0;
                },
                [&] {
                    const auto timeout = options.connectionTimeoutOrDefault();
                    long seconds = static_cast<long>(timeout.count() / 1000);
                    return sshSession.setOption(SSH_OPTIONS_TIMEOUT, &seconds);
                },
                [&] {
                    long microseconds = static_cast<long>((options.connectionTimeoutOrDefault().count() % 1000) * 1000);
                    return sshSession.setOption(SSH_OPTIONS_TIMEOUT_USEC, &microseconds);
                });
            if (!result.success())
            {
                auto error = makeError(
                    ErrorKind::Unclassified,
                    fmt::format("Failed to set ssh option {}: {}", result.index, sshSession.getError()),
                    result.result);
                closeSession(false);
                return std::unexpected(std::move(error));
            }

            errno = 0;
            if (sshSession.connect() != SSH_OK)
            {
                const std::error_code systemError{errno, std::generic_category()};
                auto error = makeError(
                    classifySystemError(systemError, Primitive::Connect),
                    fmt::format("Failed to connect to {}: {}", options.host, sshSession.getError()),
                    systemError.value() != 0 ? systemError.value() : sshSession.getErrorCode());
                closeSession(false);
                return std::unexpected(std::move(error));
            }

            if (auto authenticated = authenticate(password); !authenticated)
            {
                closeSession(false);
                return std::unexpected(std::move(authenticated).error());
            }

            sftp = sftp_new(sshSession.getCSession());
            if (sftp == nullptr)
            {
                auto error = makeError(
                    ErrorKind::Unclassified,
                    fmt::format("Failed to create sftp session: {}", sshSession.getError()),
                    sshSession.getErrorCode());
                closeSession(false);
                return std::unexpected(std::move(error));
            }

            if (const auto initResult = sftp_init(sftp); initResult != SSH_OK)
            {
                auto error = makeError(
                    ErrorKind::Unclassified,
                    fmt::format("Failed to initialize sftp session: {}", sshSession.getError()),
                    sftp_get_error(sftp));
                closeSession(false);
                return std::unexpected(std::move(error));
            }

            return {};
        }

        std::expected<void, RemoteError> authenticate(std::optional<std::string> const& password)
        {
            auto& sshSession = *session;
            int authResult = SSH_AUTH_DENIED;

            if (options.privateKey.has_value())
            {
                ssh_key key = nullptr;
                const auto importResult = ssh_pki_import_privkey_file(
                    options.privateKey->c_str(),
                    options.passphrase ? options.passphrase->c_str() : nullptr,
                    nullptr,
                    nullptr,
                    &key);
                if (importResult != SSH_OK)
                {
                    return std::unexpected(makeError(
                        ErrorKind::AuthFailed,
                        fmt::format("Failed to import private key '{}'", *options.privateKey),
                        importResult));
                }
                authResult = sshSession.userauthPublickey(key);
                ssh_key_free(key);
            }
            else if (password.has_value() || options.password.has_value())
            {
                const auto& usedPassword = password.has_value() ? *password : *options.password;
                authResult = sshSession.userauthPassword(usedPassword.c_str());
            }
            else
            {
                authResult = sshSession.userauthPublickeyAuto();
            }

            switch (authResult)
            {
                case SSH_AUTH_SUCCESS:
                    return {};
                case SSH_AUTH_DENIED:
                    Log::error("Authentication denied");
                    return std::unexpected(makeError(ErrorKind::AuthFailed, "Authentication denied", authResult));
                case SSH_AUTH_PARTIAL:
                    Log::error("Partial authentication");
                    return std::unexpected(
                        makeError(ErrorKind::AuthFailed, "Authentication incomplete", authResult));
                default:
                    Log::error("Authentication error");
                    return std::unexpected(makeError(
                        ErrorKind::AuthFailed,
                        fmt::format("Authentication error: {}", sshSession.getError()),
                        authResult));
            }
        }

        void closeFile(sftp_file file)
        {
            if (openFiles.erase(file) > 0)
                sftp_close(file);
        }

        void closeSession(bool graceful)
        {
            for (auto file : openFiles)
                sftp_close(file);
            openFiles.clear();

            if (sftp != nullptr)
            {
                sftp_free(sftp);
                sftp = nullptr;
            }
            std::lock_guard lock{sessionMutex};
            if (session)
            {
                if (graceful)
                    session->disconnect();
                else
                    ssh_silent_disconnect(session->getCSession());
                session.reset();
            }
        }

        /**
         * @brief Called from outside the processing thread. Shuts the socket down, so a libssh call blocked on it
         * returns with an error right away. The session itself is torn down later on the processing thread.
         */
        void abortConnection()
        {
            std::lock_guard lock{sessionMutex};
            if (!session)
                return;
            const auto fd = ssh_get_fd(session->getCSession());
            if (fd == SSH_INVALID_SOCKET)
                return;
#ifdef _WIN32
            ::shutdown(fd, SD_BOTH);
#else
            ::shutdown(fd, SHUT_RDWR);
#endif
        }

        bool isDirectory(std::string const& path) const
        {
            std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> attributes{
                sftp_stat(sftp, path.c_str()), sftp_attributes_free};
            return attributes != nullptr && attributes->type == SSH_FILEXFER_TYPE_DIRECTORY;
        }

        std::expected<std::vector<FileEntry>, RemoteError> listDirectory(std::string const& path, Primitive primitive)
        {
            std::vector<FileEntry> entries{};
            int closeResult = SSH_OK;
            {
                std::unique_ptr<sftp_dir_struct, std::function<void(sftp_dir_struct*)>> dir{
                    sftp_opendir(sftp, path.c_str()), [&](sftp_dir_struct* dir) {
                        if (dir != nullptr)
                            closeResult = sftp_closedir(dir);
                    }};
                if (dir == nullptr)
                    return std::unexpected(lastError(primitive, fmt::format("Failed to open directory '{}'", path)));

                std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> entry{
                    sftp_readdir(sftp, dir.get()), sftp_attributes_free};
                for (; entry != nullptr; entry.reset(sftp_readdir(sftp, dir.get())))
                {
                    if (entry->name == nullptr)
                        continue;
                    std::string name{entry->name};
                    if (name == "." || name == "..")
                        continue;
                    entries.push_back(FileEntry{
                        .name = std::move(name),
                        .type = fileTypeFromSftp(entry->type),
                        .size = entry->size,
                        .mtime = entry->mtime,
                    });
                }

                if (!sftp_dir_eof(dir.get()))
                    return std::unexpected(lastError(primitive, fmt::format("Failed to read directory '{}'", path)));
            }
            if (closeResult != SSH_OK)
                return std::unexpected(lastError(primitive, fmt::format("Failed to close directory '{}'", path)));
            return entries;
        }

        std::expected<void, RemoteError> makeDirectory(std::string const& path, bool recursive)
        {
            if (recursive)
            {
                const bool absolute = RemotePath::isAbsolute(path);
                const auto normalized = RemotePath::normalize(path);
                std::string prefix = absolute ? "" : ".";
                std::string_view rest{normalized};
                if (absolute)
                    rest.remove_prefix(1);

                // Every parent, the path itself is created below.
                for (auto slash = rest.find('/'); slash != std::string_view::npos; slash = rest.find('/'))
                {
                    prefix += "/";
                    prefix += rest.substr(0, slash);
                    rest.remove_prefix(slash + 1);
                    if (sftp_mkdir(sftp, prefix.c_str(), 0755) != SSH_OK)
                    {
                        auto error = lastError(Primitive::Mkdir, fmt::format("Failed to create directory '{}'", prefix));
                        if (!isDirectory(prefix))
                            return std::unexpected(std::move(error));
                    }
                }
            }

            if (sftp_mkdir(sftp, path.c_str(), 0755) != SSH_OK)
            {
                auto error = lastError(Primitive::Mkdir, fmt::format("Failed to create directory '{}'", path));
                if (isDirectory(path))
                {
                    return std::unexpected(makeError(
                        ErrorKind::AlreadyExists,
                        fmt::format("Directory already exists: '{}'", path),
                        SSH_FX_FILE_ALREADY_EXISTS));
                }
                // Something else occupies the path.
                if (error.kind == ErrorKind::AlreadyExists)
                {
                    return std::unexpected(makeError(
                        ErrorKind::Unclassified,
                        fmt::format("Not a directory: '{}'", path),
                        SSH_FX_FILE_ALREADY_EXISTS));
                }
                return std::unexpected(std::move(error));
            }
            return {};
        }

        std::expected<void, RemoteError> removeDirectory(std::string const& path, bool recursive)
        {
            if (recursive)
            {
                auto entries = listDirectory(path, Primitive::Rmdir);
                if (!entries)
                    return std::unexpected(std::move(entries).error());

                for (auto const& entry : *entries)
                {
                    const auto child = joinChild(path, entry.name);
                    if (entry.isDirectory())
                    {
                        if (auto removed = removeDirectory(child, true); !removed)
                            return removed;
                    }
                    else if (sftp_unlink(sftp, child.c_str()) != SSH_OK)
                    {
                        return std::unexpected(lastError(Primitive::Rmdir, fmt::format("Failed to remove '{}'", child)));
                    }
                }
            }

            if (sftp_rmdir(sftp, path.c_str()) != SSH_OK)
                return std::unexpected(
                    lastError(Primitive::Rmdir, fmt::format("Failed to remove directory '{}'", path)));
            return {};
        }

        /**
         * @brief Creates or truncates the remote file and writes everything the reader hands out.
         * The reader fills the buffer and returns the amount, 0 at the end, or an error.
         */
        template <typename ReaderT>
        std::expected<void, RemoteError> upload(std::string const& path, Primitive primitive, ReaderT&& reader)
        {
            std::unique_ptr<sftp_file_struct, std::function<void(sftp_file_struct*)>> file{
                sftp_open(sftp, path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644), [](sftp_file_struct* file) {
                    if (file != nullptr)
                        sftp_close(file);
                }};
            if (!file)
                return std::unexpected(lastError(primitive, fmt::format("Failed to open '{}' for writing", path)));

            std::string buffer(transferChunkSize(false), '\0');
            while (true)
            {
                auto amount = reader(buffer);
                if (!amount)
                    return std::unexpected(std::move(amount).error());
                if (*amount == 0)
                    break;

                std::string_view toWrite{buffer.data(), *amount};
                while (!toWrite.empty())
                {
                    const auto written = sftp_write(file.get(), toWrite.data(), toWrite.size());
                    if (written < 0)
                        return std::unexpected(lastError(primitive, fmt::format("Failed to write '{}'", path)));
                    if (written == 0)
                    {
                        auto error = makeError(ErrorKind::Unclassified, fmt::format("Short write on '{}'", path));
                        error.wrapperError = WrapperErrors::StreamFailure;
                        return std::unexpected(std::move(error));
                    }
                    toWrite.remove_prefix(static_cast<std::size_t>(written));
                }
            }
            return {};
        }
    };

    namespace
    {
        /**
         * @brief Reads a remote file chunk by chunk on the processing thread and hands the chunks to the queue.
         */
        class SftpReadStream : public ReadStream
        {
          public:
            struct ReadState
            {
                SftpBackend::Context* context;
                std::shared_ptr<std::atomic<std::uint64_t>> generation;
                std::uint64_t expectedGeneration;
                TaskQueue* queue;
                sftp_file file;
                std::size_t chunkSize;
                Handlers handlers{};
                // Queue side only.
                bool finished = false;
            };

            SftpReadStream(std::shared_ptr<SftpBackend::Context> context, std::shared_ptr<ReadState> state)
                : context_{std::move(context)}
                , state_{std::move(state)}
            {}

            ~SftpReadStream() override
            {
                if (started_)
                    return;
                const bool pushed = context_->processingThread.pushTask([context = context_.get(), state = state_]() {
                    if (state->generation->load() == state->expectedGeneration)
                        context->closeFile(state->file);
                });
                // Otherwise the session shuts down and closes the file with it.
                if (!pushed)
                    Log::debug("SftpReadStream: Unstarted stream not closed, processing thread is stopping.");
            }

            void start(Handlers handlers) override
            {
                if (started_)
                    throw std::logic_error("SftpReadStream was already started.");
                started_ = true;
                state_->handlers = std::move(handlers);
                if (!context_->processingThread.pushTask([state = state_]() {
                        readNext(state);
                    }))
                {
                    deliverError(state_, terminated());
                }
            }

          private:
            static void deliver(std::shared_ptr<ReadState> const& state, std::function<void(ReadState&)> event)
            {
                const bool pushed = state->queue->pushTask([state, event = std::move(event)]() {
                    if (state->finished)
                        return;
                    if (state->generation->load() != state->expectedGeneration)
                    {
                        state->finished = true;
                        return state->handlers.onError(terminated());
                    }
                    event(*state);
                });
                if (!pushed)
                    Log::warn("SftpReadStream: Task queue is shut down, dropping stream event.");
            }

            static void deliverError(std::shared_ptr<ReadState> const& state, RemoteError error)
            {
                deliver(state, [error = std::move(error)](ReadState& readState) {
                    readState.finished = true;
                    readState.handlers.onError(error);
                });
            }

            // Processing thread.
            static void readNext(std::shared_ptr<ReadState> const& state)
            {
                if (state->generation->load() != state->expectedGeneration)
                    return deliverError(state, terminated());

                std::string buffer(state->chunkSize, '\0');
                const auto amount = sftp_read(state->file, buffer.data(), buffer.size());
                if (amount < 0)
                {
                    auto error = state->context->lastError(Primitive::Get, "Failed to read remote file");
                    error.wrapperError = WrapperErrors::StreamFailure;
                    state->context->closeFile(state->file);
                    return deliverError(state, std::move(error));
                }
                if (amount == 0)
                {
                    state->context->closeFile(state->file);
                    return deliver(state, [](ReadState& readState) {
                        readState.finished = true;
                        readState.handlers.onClose();
                    });
                }

                buffer.resize(static_cast<std::size_t>(amount));
                deliver(state, [data = std::move(buffer)](ReadState& readState) {
                    readState.handlers.onData(data);
                });
                if (!state->context->processingThread.pushTask([state]() {
                        readNext(state);
                    }))
                {
                    deliverError(state, terminated());
                }
            }

          private:
            std::shared_ptr<SftpBackend::Context> context_;
            std::shared_ptr<ReadState> state_;
            bool started_ = false;
        };
    }

    SftpBackend::SftpBackend(TaskQueue& queue, Persistence::RemoteOptions options)
        : context_{std::make_shared<Context>(queue, std::move(options))}
    {}

    SftpBackend::~SftpBackend()
    {
        ++*context_->generation;
        context_->connected = false;
        context_->processingThread.pushTask([context = context_.get()]() {
            context->closeSession(true);
        });
    }

    template <typename T, typename FunctionT>
    void SftpBackend::perform(Primitive primitive, Completion<T> onComplete, FunctionT&& work)
    {
        const auto generation = context_->generation->load();
        const bool pushed = context_->processingThread.pushTask(
            [context = context_.get(), generation, primitive, onComplete, work = std::forward<FunctionT>(work)]() mutable {
                if (!context->isCurrent(generation))
                    return context->complete<T>(generation, std::move(onComplete), std::unexpected(terminated()));
                if (primitive != Primitive::Connect && context->sftp == nullptr)
                    return context->complete<T>(
                        generation, std::move(onComplete), std::unexpected(notConnected(primitive)));
                context->complete<T>(generation, std::move(onComplete), work(*context));
            });
        if (!pushed)
            context_->complete<T>(generation, std::move(onComplete), std::unexpected(terminated()));
    }

    void SftpBackend::connect(std::optional<std::string> const& password, Completion<void> onComplete)
    {
        perform<void>(Primitive::Connect, std::move(onComplete), [password](Context& context) {
            Log::info("SftpBackend: Connecting to {}:{}.", context.options.host, context.options.portOrDefault());
            const auto generation = context.generation->load();
            auto result = context.open(password);
            if (context.isCurrent(generation))
                context.connected = result.has_value();
            if (!result)
                Log::error("SftpBackend: {}", result.error().toString());
            return result;
        });
    }

    void SftpBackend::disconnect()
    {
        context_->connected = false;
        context_->processingThread.pushTask([context = context_.get()]() {
            context->closeSession(true);
        });
    }

    void SftpBackend::terminate()
    {
        Log::debug("SftpBackend: Terminating generation {}.", context_->generation->load());
        ++*context_->generation;
        context_->connected = false;
        context_->abortConnection();
        // Runs once the call in flight returned, its result is rejected by the generation check.
        if (!context_->processingThread.pushTask([context = context_.get()]() {
                context->closeSession(false);
            }))
        {
            Log::warn("SftpBackend: Processing thread is stopping, session is closed on shutdown.");
        }
    }

    bool SftpBackend::connected() const
    {
        return context_->connected;
    }

    void SftpBackend::pwd(Completion<std::string> onComplete)
    {
        perform<std::string>(Primitive::Pwd, std::move(onComplete), [](Context& context) -> std::expected<std::string, RemoteError> {
            std::unique_ptr<char, decltype(&ssh_string_free_char)> path{
                sftp_canonicalize_path(context.sftp, "."), ssh_string_free_char};
            if (!path)
                return std::unexpected(context.lastError(Primitive::Pwd, "Failed to resolve working directory"));
            return std::string{path.get()};
        });
    }

    void SftpBackend::mkdir(std::string const& path, bool recursive, Completion<void> onComplete)
    {
        perform<void>(Primitive::Mkdir, std::move(onComplete), [path, recursive](Context& context) {
            return context.makeDirectory(path, recursive);
        });
    }

    void SftpBackend::rmdir(std::string const& path, bool recursive, Completion<void> onComplete)
    {
        perform<void>(Primitive::Rmdir, std::move(onComplete), [path, recursive](Context& context) {
            return context.removeDirectory(path, recursive);
        });
    }

    void SftpBackend::remove(std::string const& path, Completion<void> onComplete)
    {
        perform<void>(Primitive::Delete, std::move(onComplete), [path](Context& context) -> std::expected<void, RemoteError> {
            if (sftp_unlink(context.sftp, path.c_str()) != SSH_OK)
                return std::unexpected(context.lastError(Primitive::Delete, fmt::format("Failed to remove '{}'", path)));
            return {};
        });
    }

    void SftpBackend::put(LocalFile const& local, std::string const& path, Completion<void> onComplete)
    {
        perform<void>(Primitive::Put, std::move(onComplete), [localPath = local.path(), path](Context& context) {
            std::ifstream reader{localPath, std::ios::binary};
            if (!reader)
            {
                return std::expected<void, RemoteError>{std::unexpected(makeWrapperError(
                    WrapperErrors::LocalFileFailure,
                    fmt::format("Failed to open local file '{}'", localPath.string())))};
            }

            return context.upload(
                path, Primitive::Put, [&reader, &localPath](std::string& buffer) -> std::expected<std::size_t, RemoteError> {
                    reader.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                    if (reader.bad())
                    {
                        return std::unexpected(makeWrapperError(
                            WrapperErrors::LocalFileFailure,
                            fmt::format("Failed to read local file '{}'", localPath.string())));
                    }
                    return static_cast<std::size_t>(reader.gcount());
                });
        });
    }

    void SftpBackend::write(std::string const& data, std::string const& path, Completion<void> onComplete)
    {
        perform<void>(Primitive::Write, std::move(onComplete), [data, path](Context& context) {
            std::string_view remaining{data};
            return context.upload(path, Primitive::Write, [&remaining](std::string& buffer) -> std::expected<std::size_t, RemoteError> {
                const auto amount = std::min(buffer.size(), remaining.size());
                std::copy_n(remaining.data(), amount, buffer.data());
                remaining.remove_prefix(amount);
                return amount;
            });
        });
    }

    void SftpBackend::get(std::string const& path, Completion<std::shared_ptr<ReadStream>> onComplete)
    {
        perform<std::shared_ptr<ReadStream>>(
            Primitive::Get,
            std::move(onComplete),
            [path, owner = std::weak_ptr<Context>{context_}](
                Context& context) -> std::expected<std::shared_ptr<ReadStream>, RemoteError> {
                auto file = sftp_open(context.sftp, path.c_str(), O_RDONLY, 0);
                if (file == nullptr)
                    return std::unexpected(context.lastError(Primitive::Get, fmt::format("Failed to open '{}'", path)));
                context.openFiles.insert(file);

                auto shared = owner.lock();
                if (!shared)
                {
                    context.closeFile(file);
                    return std::unexpected(terminated());
                }

                auto state = std::make_shared<SftpReadStream::ReadState>(SftpReadStream::ReadState{
                    .context = &context,
                    .generation = context.generation,
                    .expectedGeneration = context.generation->load(),
                    .queue = context.queue,
                    .file = file,
                    .chunkSize = context.transferChunkSize(true),
                });
                return std::make_shared<SftpReadStream>(std::move(shared), std::move(state));
            });
    }

    void SftpBackend::list(std::string const& path, Completion<std::vector<FileEntry>> onComplete)
    {
        perform<std::vector<FileEntry>>(Primitive::List, std::move(onComplete), [path](Context& context) {
            return context.listDirectory(path, Primitive::List);
        });
    }

    void SftpBackend::readlink(FileEntry const&, std::string const& path, Completion<std::string> onComplete)
    {
        perform<std::string>(
            Primitive::Readlink, std::move(onComplete), [path](Context& context) -> std::expected<std::string, RemoteError> {
                std::unique_ptr<char, decltype(&ssh_string_free_char)> target{
                    sftp_readlink(context.sftp, path.c_str()), ssh_string_free_char};
                if (!target)
                    return std::unexpected(
                        context.lastError(Primitive::Readlink, fmt::format("Failed to read link '{}'", path)));
                return std::string{target.get()};
            });
    }

    void SftpBackend::rename(std::string const& from, std::string const& to, Completion<void> onComplete)
    {
        perform<void>(Primitive::Rename, std::move(onComplete), [from, to](Context& context) -> std::expected<void, RemoteError> {
            if (sftp_rename(context.sftp, from.c_str(), to.c_str()) != SSH_OK)
                return std::unexpected(
                    context.lastError(Primitive::Rename, fmt::format("Failed to rename '{}' to '{}'", from, to)));
            return {};
        });
    }
}
