#pragma once

#include <remote_files/remote_error.hpp>

#include <optional>
#include <system_error>

namespace RemoteFiles
{
    /**
     * @brief The backend primitive a raw failure code came from.
     * Some codes mean different things depending on the request, e.g. a missing path on upload
     * means the parent directory has to be created.
     */
    enum class Primitive
    {
        Connect,
        Pwd,
        Mkdir,
        Rmdir,
        Delete,
        Put,
        Write,
        Get,
        List,
        Readlink,
        Rename,
    };

    /**
     * @brief Returns the semantic kind of a backend failure. A pure function of the error.
     */
    inline ErrorKind classify(RemoteError const& error)
    {
        return error.kind;
    }

    /**
     * @brief Decides whether a failed call is benign for the call site.
     *
     * @param error The failure.
     * @param ignoredKind The single kind the call site treats as success, if any.
     * @return true if the failure should be swallowed into the call site's default value.
     */
    inline bool isSwallowed(RemoteError const& error, std::optional<ErrorKind> ignoredKind)
    {
        return ignoredKind.has_value() && classify(error) == *ignoredKind;
    }

    ErrorKind classifyFtpReply(int replyCode, Primitive primitive);

    // Status codes as defined by draft-ietf-secsh-filexfer (SSH_FX_*).
    ErrorKind classifySftpStatus(int status, Primitive primitive);

    ErrorKind classifySystemError(std::error_code const& error, Primitive primitive);
}
