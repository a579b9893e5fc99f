#include <remote_files/transfer_session.hpp>
#include <remote_files/remote_path.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

#include <exception>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace RemoteFiles
{
    namespace
    {
        /**
         * @brief One running operation. The first resolve or fail wins, later calls are ignored.
         * The indicator is settled before the result becomes visible.
         */
        template <typename T>
        class PendingOperation
        {
          public:
            PendingOperation(OperationReporter& reporter, std::string const& message)
                : reporter_{&reporter}
                , scope_{reporter, message}
            {}

            std::future<std::expected<T, RemoteError>> future()
            {
                return promise_.get_future();
            }

            bool finished() const
            {
                return finished_;
            }

            void resolve(std::expected<T, RemoteError> result)
            {
                if (finished_)
                    return;
                finished_ = true;
                scope_.settle();
                promise_.set_value(std::move(result));
            }

            void fail(RemoteError error, std::string const& logLine)
            {
                if (finished_)
                    return;
                finished_ = true;
                scope_.settle();
                reporter_->log(logLine);
                Log::debug("TransferSession: {}", error.toString());
                promise_.set_value(std::unexpected(std::move(error)));
            }

          private:
            OperationReporter* reporter_;
            OperationScope scope_;
            std::promise<std::expected<T, RemoteError>> promise_{};
            bool finished_{false};
        };

        std::string failLine(std::string const& name, std::string const& subject, std::string const& message)
        {
            if (message.empty())
                return fmt::format("{} fail: {}", name, subject);
            return fmt::format("{} fail: {}, {}", name, subject, message);
        }

        std::string resolveLinkTarget(std::string const& remotePath, std::string const& rawTarget)
        {
            if (!rawTarget.empty() && rawTarget.front() == '/')
                return RemotePath::normalize(rawTarget);
            return RemotePath::normalize(remotePath + "/../" + rawTarget);
        }
    }

    TransferSession::TransferSession(
        std::unique_ptr<Backend> backend,
        TaskQueue& queue,
        SessionOptions options,
        StatusIndicator& indicator,
        LogSink& logSink)
        : backend_{std::move(backend)}
        , queue_{&queue}
        , options_{std::move(options)}
        , transcoder_{options_.charset}
        , reporter_{indicator, logSink, options_.displayName}
        , onInvalidEncoding_{[](std::vector<std::string> const&) {}}
    {
        if (!backend_)
            throw std::invalid_argument("TransferSession needs a backend.");
    }

    template <typename T>
    void TransferSession::invokeBackend(
        std::string const& name,
        std::function<void(Completion<T>)> const& call,
        Completion<T> onComplete)
    {
        try
        {
            call(onComplete);
        }
        catch (std::exception const& exc)
        {
            Log::error("TransferSession: Backend threw during {}: {}", name, exc.what());
            onComplete(std::unexpected(makeWrapperError(WrapperErrors::BackendThrew, exc.what())));
        }
    }

    template <typename T>
    std::future<std::expected<T, RemoteError>> TransferSession::callWithName(
        std::string const& name,
        std::string const& remotePath,
        std::optional<ErrorKind> swallowedKind,
        std::function<void(std::string const& wirePath, Completion<T>)> call)
    {
        auto pending = std::make_shared<PendingOperation<T>>(reporter_, name + " " + remotePath);
        auto future = pending->future();
        const auto wirePath = transcoder_.toWire(remotePath);

        invokeBackend<T>(
            name,
            [&call, &wirePath](Completion<T> onComplete) {
                call(wirePath, std::move(onComplete));
            },
            [pending, name, remotePath, swallowedKind](std::expected<T, RemoteError> result) {
                if (result)
                    return pending->resolve(std::move(result));

                if (isSwallowed(result.error(), swallowedKind))
                {
                    Log::debug("TransferSession: {} {} ignored: {}", name, remotePath, result.error().message);
                    if constexpr (std::is_void_v<T>)
                        return pending->resolve({});
                    else
                        return pending->resolve(T{});
                }

                const auto line = failLine(name, remotePath, result.error().message);
                pending->fail(std::move(result).error(), line);
            });
        return future;
    }

    std::future<std::expected<void, RemoteError>> TransferSession::connect(std::optional<std::string> const& password)
    {
        auto pending = std::make_shared<PendingOperation<void>>(reporter_, "connect");
        auto future = pending->future();
        invokeBackend<void>(
            "connect",
            [this, &password](Completion<void> onComplete) {
                backend_->connect(password, std::move(onComplete));
            },
            [pending](std::expected<void, RemoteError> result) {
                if (result)
                    return pending->resolve({});
                const auto line = "connect fail: " + result.error().message;
                pending->fail(std::move(result).error(), line);
            });
        return future;
    }

    void TransferSession::disconnect()
    {
        reporter_.log("disconnect");
        backend_->disconnect();
    }

    void TransferSession::terminate()
    {
        reporter_.log("terminate");
        backend_->terminate();
    }

    bool TransferSession::connected() const
    {
        return backend_->connected();
    }

    std::future<std::expected<std::string, RemoteError>> TransferSession::pwd()
    {
        auto pending = std::make_shared<PendingOperation<std::string>>(reporter_, "pwd");
        auto future = pending->future();
        invokeBackend<std::string>(
            "pwd",
            [this](Completion<std::string> onComplete) {
                backend_->pwd(std::move(onComplete));
            },
            [this, pending](std::expected<std::string, RemoteError> result) {
                if (result)
                    return pending->resolve(transcoder_.toHost(*result));
                const auto line = "pwd fail: " + result.error().message;
                pending->fail(std::move(result).error(), line);
            });
        return future;
    }

    std::future<std::expected<void, RemoteError>> TransferSession::upload(
        std::string const& remotePath,
        LocalFile const& local,
        std::optional<std::string> failMessage)
    {
        auto pending = std::make_shared<PendingOperation<void>>(reporter_, "upload " + remotePath);
        auto future = pending->future();
        const auto wirePath = transcoder_.toWire(remotePath);

        invokeBackend<void>(
            "upload",
            [this, &local, &wirePath](Completion<void> onComplete) {
                backend_->put(local, wirePath, std::move(onComplete));
            },
            [pending, remotePath, failMessage = std::move(failMessage)](std::expected<void, RemoteError> result) {
                if (result)
                    return pending->resolve({});
                const auto line = failLine("upload", remotePath, failMessage.value_or(result.error().message));
                pending->fail(std::move(result).error(), line);
            });
        return future;
    }

    std::future<std::expected<void, RemoteError>>
    TransferSession::download(LocalFile const& local, std::string const& remotePath)
    {
        auto pending = std::make_shared<PendingOperation<void>>(reporter_, "download " + remotePath);
        auto future = pending->future();
        const auto wirePath = transcoder_.toWire(remotePath);

        invokeBackend<std::shared_ptr<ReadStream>>(
            "download",
            [this, &wirePath](Completion<std::shared_ptr<ReadStream>> onComplete) {
                backend_->get(wirePath, std::move(onComplete));
            },
            [pending, local, remotePath](std::expected<std::shared_ptr<ReadStream>, RemoteError> result) {
                if (!result)
                {
                    const auto line = failLine("download", remotePath, result.error().message);
                    return pending->fail(std::move(result).error(), line);
                }

                auto writeStream = local.openWriteStream();
                if (!writeStream)
                {
                    const auto line = failLine("download", remotePath, writeStream.error().message);
                    return pending->fail(std::move(writeStream).error(), line);
                }

                std::shared_ptr<WriteStream> sink = std::move(writeStream).value();
                // The download already failed, only the local file is released.
                auto release = [sink, remotePath]() {
                    sink->close([remotePath](std::expected<void, RemoteError> closed) {
                        if (!closed)
                        {
                            Log::debug(
                                "TransferSession: Closing local file of {} failed: {}",
                                remotePath,
                                closed.error().toString());
                        }
                    });
                };
                auto stream = std::move(result).value();
                stream->start(ReadStream::Handlers{
                    .onData =
                        [pending, sink, remotePath, release](std::string_view data) {
                            if (pending->finished())
                                return;
                            auto written = sink->write(data);
                            if (!written)
                            {
                                const auto line = failLine("download", remotePath, written.error().message);
                                pending->fail(std::move(written).error(), line);
                                release();
                            }
                        },
                    .onClose =
                        [pending, sink, remotePath]() {
                            if (pending->finished())
                                return;
                            sink->close([pending, remotePath](std::expected<void, RemoteError> closed) {
                                if (closed)
                                    return pending->resolve({});
                                const auto line = failLine("download", remotePath, closed.error().message);
                                pending->fail(std::move(closed).error(), line);
                            });
                        },
                    .onError =
                        [pending, remotePath, release](RemoteError const& error) {
                            if (pending->finished())
                                return;
                            pending->fail(error, failLine("download", remotePath, error.message));
                            release();
                        },
                });
            });
        return future;
    }

    std::future<std::expected<std::string, RemoteError>> TransferSession::view(std::string const& remotePath)
    {
        auto pending = std::make_shared<PendingOperation<std::string>>(reporter_, "view " + remotePath);
        auto future = pending->future();
        const auto wirePath = transcoder_.toWire(remotePath);

        invokeBackend<std::shared_ptr<ReadStream>>(
            "view",
            [this, &wirePath](Completion<std::shared_ptr<ReadStream>> onComplete) {
                backend_->get(wirePath, std::move(onComplete));
            },
            [pending, remotePath](std::expected<std::shared_ptr<ReadStream>, RemoteError> result) {
                if (!result)
                {
                    const auto line = failLine("view", remotePath, result.error().message);
                    return pending->fail(std::move(result).error(), line);
                }

                auto buffer = std::make_shared<std::string>();
                auto stream = std::move(result).value();
                stream->start(ReadStream::Handlers{
                    .onData =
                        [buffer](std::string_view data) {
                            buffer->append(data);
                        },
                    .onClose =
                        [pending, buffer]() {
                            pending->resolve(std::move(*buffer));
                        },
                    .onError =
                        [pending, remotePath](RemoteError const& error) {
                            pending->fail(error, failLine("view", remotePath, error.message));
                        },
                });
            });
        return future;
    }

    std::future<std::expected<void, RemoteError>> TransferSession::write(std::string const& remotePath, std::string data)
    {
        return callWithName<void>(
            "write",
            remotePath,
            std::nullopt,
            [this, data = std::move(data)](std::string const& wirePath, Completion<void> onComplete) {
                backend_->write(data, wirePath, std::move(onComplete));
            });
    }

    std::future<std::expected<std::vector<FileEntry>, RemoteError>> TransferSession::list(std::string remotePath)
    {
        if (remotePath.empty())
            remotePath = ".";

        auto pending = std::make_shared<PendingOperation<std::vector<FileEntry>>>(reporter_, "list " + remotePath);
        auto future = pending->future();
        const auto wirePath = transcoder_.toWire(remotePath);

        invokeBackend<std::vector<FileEntry>>(
            "list",
            [this, &wirePath](Completion<std::vector<FileEntry>> onComplete) {
                backend_->list(wirePath, std::move(onComplete));
            },
            [this, pending, remotePath, handler = onInvalidEncoding_](
                std::expected<std::vector<FileEntry>, RemoteError> result) {
                if (!result)
                {
                    const auto line = failLine("list", remotePath, result.error().message);
                    return pending->fail(std::move(result).error(), line);
                }

                std::vector<std::string> suspectNames;
                for (auto& entry : *result)
                {
                    auto hostName = transcoder_.toHost(entry.name);
                    if (!options_.tolerateEncodingErrors && transcoder_.isSuspect(entry.name, hostName))
                        suspectNames.push_back(hostName);
                    entry.name = std::move(hostName);
                }

                pending->resolve(std::move(result));

                if (suspectNames.empty())
                    return;

                Log::debug("TransferSession: {} names with invalid encoding in '{}'.", suspectNames.size(), remotePath);
                const bool pushed = queue_->pushTask([handler, names = std::move(suspectNames)]() {
                    handler(names);
                });
                if (!pushed)
                    Log::warn("TransferSession: Could not schedule invalid encoding notification, queue is shut down.");
            });
        return future;
    }

    std::future<std::expected<void, RemoteError>> TransferSession::rmdir(std::string const& remotePath)
    {
        return callWithName<void>(
            "rmdir", remotePath, ErrorKind::NotFound, [this](std::string const& wirePath, Completion<void> onComplete) {
                backend_->rmdir(wirePath, true, std::move(onComplete));
            });
    }

    std::future<std::expected<void, RemoteError>> TransferSession::remove(std::string const& remotePath)
    {
        return callWithName<void>(
            "delete", remotePath, ErrorKind::NotFound, [this](std::string const& wirePath, Completion<void> onComplete) {
                backend_->remove(wirePath, std::move(onComplete));
            });
    }

    std::future<std::expected<void, RemoteError>> TransferSession::mkdir(std::string const& remotePath)
    {
        return callWithName<void>(
            "mkdir",
            remotePath,
            ErrorKind::AlreadyExists,
            [this](std::string const& wirePath, Completion<void> onComplete) {
                backend_->mkdir(wirePath, true, std::move(onComplete));
            });
    }

    std::future<std::expected<std::string, RemoteError>>
    TransferSession::readlink(FileEntry& entry, std::string const& remotePath)
    {
        auto pending = std::make_shared<PendingOperation<std::string>>(reporter_, "readlink " + entry.name);
        auto future = pending->future();
        if (!entry.isSymlink())
        {
            pending->fail(
                makeWrapperError(WrapperErrors::NotSymlink, remotePath + " is not symlink"),
                failLine("readlink", entry.name, remotePath + " is not symlink"));
            return future;
        }

        const auto wirePath = transcoder_.toWire(remotePath);

        invokeBackend<std::string>(
            "readlink",
            [this, &entry, &wirePath](Completion<std::string> onComplete) {
                auto wireEntry = entry;
                wireEntry.name = transcoder_.toWire(entry.name);
                backend_->readlink(wireEntry, wirePath, std::move(onComplete));
            },
            [this, pending, &entry, remotePath](std::expected<std::string, RemoteError> result) {
                if (!result)
                {
                    const auto line = failLine("readlink", entry.name, result.error().message);
                    return pending->fail(std::move(result).error(), line);
                }
                auto resolved = resolveLinkTarget(remotePath, transcoder_.toHost(*result));
                entry.link = resolved;
                pending->resolve(std::move(resolved));
            });
        return future;
    }

    std::future<std::expected<void, RemoteError>>
    TransferSession::rename(std::string const& fromPath, std::string const& toPath)
    {
        auto pending = std::make_shared<PendingOperation<void>>(reporter_, "rename " + fromPath + " " + toPath);
        auto future = pending->future();
        const auto wireFrom = transcoder_.toWire(fromPath);
        const auto wireTo = transcoder_.toWire(toPath);

        invokeBackend<void>(
            "rename",
            [this, &wireFrom, &wireTo](Completion<void> onComplete) {
                backend_->rename(wireFrom, wireTo, std::move(onComplete));
            },
            [pending, fromPath, toPath](std::expected<void, RemoteError> result) {
                if (result)
                    return pending->resolve({});
                const auto line = failLine("rename", fromPath + " " + toPath, result.error().message);
                pending->fail(std::move(result).error(), line);
            });
        return future;
    }

    void TransferSession::setInvalidEncodingHandler(InvalidEncodingHandler handler)
    {
        if (!handler)
            handler = [](std::vector<std::string> const&) {};
        onInvalidEncoding_ = std::move(handler);
    }
}
