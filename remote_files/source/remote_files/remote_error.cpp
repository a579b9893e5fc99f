#include <remote_files/remote_error.hpp>

namespace RemoteFiles
{
    std::string_view errorKindToString(ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::AlreadyExists:
                return "AlreadyExists";
            case ErrorKind::NeedsMkdir:
                return "NeedsMkdir";
            case ErrorKind::NotFound:
                return "NotFound";
            case ErrorKind::NeedsReconnect:
                return "NeedsReconnect";
            case ErrorKind::NeedsReconnectOnce:
                return "NeedsReconnectOnce";
            case ErrorKind::ConnectionRefused:
                return "ConnectionRefused";
            case ErrorKind::AuthFailed:
                return "AuthFailed";
            case ErrorKind::Unclassified:
                return "Unclassified";
        }
        return "INVALID_ENUM_VALUE";
    }

    std::string_view wrapperErrorToString(WrapperErrors error)
    {
        switch (error)
        {
            case WrapperErrors::None:
                return "None";
            case WrapperErrors::NotSymlink:
                return "NotSymlink";
            case WrapperErrors::StreamFailure:
                return "StreamFailure";
            case WrapperErrors::BackendThrew:
                return "BackendThrew";
            case WrapperErrors::NotConnected:
                return "NotConnected";
            case WrapperErrors::LocalFileFailure:
                return "LocalFileFailure";
            case WrapperErrors::Terminated:
                return "Terminated";
        }
        return "INVALID_ENUM_VALUE";
    }
}
