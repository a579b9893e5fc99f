#include <remote_files/error_classifier.hpp>

namespace RemoteFiles
{
    namespace
    {
        constexpr int sftpNoSuchFile = 2;
        constexpr int sftpNoConnection = 6;
        constexpr int sftpConnectionLost = 7;
        constexpr int sftpNoSuchPath = 10;
        constexpr int sftpFileAlreadyExists = 11;

        bool isUpload(Primitive primitive)
        {
            return primitive == Primitive::Put || primitive == Primitive::Write;
        }

        ErrorKind missingPathKind(Primitive primitive)
        {
            return isUpload(primitive) ? ErrorKind::NeedsMkdir : ErrorKind::NotFound;
        }
    }

    ErrorKind classifyFtpReply(int replyCode, Primitive primitive)
    {
        switch (replyCode)
        {
            case 421:
                return ErrorKind::NeedsReconnect;
            case 425:
            case 426:
                return ErrorKind::NeedsReconnectOnce;
            case 521:
                if (primitive == Primitive::Mkdir)
                    return ErrorKind::AlreadyExists;
                return ErrorKind::Unclassified;
            case 530:
                return ErrorKind::AuthFailed;
            case 550:
                return missingPathKind(primitive);
            case 553:
                return ErrorKind::NeedsMkdir;
            default:
                return ErrorKind::Unclassified;
        }
    }

    ErrorKind classifySftpStatus(int status, Primitive primitive)
    {
        switch (status)
        {
            case sftpNoSuchFile:
            case sftpNoSuchPath:
                return missingPathKind(primitive);
            case sftpFileAlreadyExists:
                return ErrorKind::AlreadyExists;
            case sftpNoConnection:
                return ErrorKind::NeedsReconnect;
            case sftpConnectionLost:
                return ErrorKind::NeedsReconnectOnce;
            default:
                return ErrorKind::Unclassified;
        }
    }

    ErrorKind classifySystemError(std::error_code const& error, Primitive primitive)
    {
        if (error == std::errc::connection_refused)
            return ErrorKind::ConnectionRefused;
        if (error == std::errc::connection_reset || error == std::errc::broken_pipe ||
            error == std::errc::connection_aborted)
            return ErrorKind::NeedsReconnectOnce;
        if (error == std::errc::timed_out || error == std::errc::not_connected)
            return ErrorKind::NeedsReconnect;
        if (error == std::errc::no_such_file_or_directory)
            return missingPathKind(primitive);
        if (error == std::errc::file_exists)
            return ErrorKind::AlreadyExists;
        return ErrorKind::Unclassified;
    }
}
