#pragma once

#include <fmt/format.h>

#include <string>
#include <string_view>

namespace RemoteFiles
{
    /**
     * @brief The semantic outcome of a failed backend call. Numeric values are stable.
     */
    enum class ErrorKind : int
    {
        // The neutral code: the requested state already holds (e.g. mkdir of an existing directory).
        AlreadyExists = 0,
        NeedsMkdir = 1,
        NotFound = 2,
        // Reconnect and retry the same call.
        NeedsReconnect = 3,
        // Reconnect and retry exactly once, then surface the failure.
        NeedsReconnectOnce = 4,
        ConnectionRefused = 5,
        AuthFailed = 6,
        Unclassified = 7,
    };

    std::string_view errorKindToString(ErrorKind kind);

    /**
     * @brief Failures raised by the remote files layer itself rather than by a backend.
     */
    enum class WrapperErrors
    {
        None,
        NotSymlink,
        StreamFailure,
        BackendThrew,
        NotConnected,
        LocalFileFailure,
        Terminated,
    };

    std::string_view wrapperErrorToString(WrapperErrors error);

    struct RemoteError
    {
        ErrorKind kind = ErrorKind::Unclassified;
        std::string message{};
        // FTP reply code, SFTP status, errno or library error code. 0 if there is none.
        int code = 0;
        WrapperErrors wrapperError = WrapperErrors::None;

        std::string toString() const
        {
            return fmt::format(
                "RemoteError: kind: {}, message: {}, code: {}, wrapperError: {}",
                errorKindToString(kind),
                message,
                code,
                wrapperErrorToString(wrapperError));
        }
    };

    /**
     * @brief Builds a tagged error at the point of failure.
     */
    inline RemoteError makeError(ErrorKind kind, std::string message, int code = 0)
    {
        return RemoteError{
            .kind = kind,
            .message = std::move(message),
            .code = code,
        };
    }

    inline RemoteError makeWrapperError(WrapperErrors wrapperError, std::string message)
    {
        return RemoteError{
            .kind = ErrorKind::Unclassified,
            .message = std::move(message),
            .wrapperError = wrapperError,
        };
    }
}
