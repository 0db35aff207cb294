#include <ssh/error.hpp>

#include <log/log.hpp>
#include <utility/enum_string_convert.hpp>

#include <libssh/sftp.h>
#include <fmt/format.h>

#include <utility>

namespace SecureShell
{
    std::string Error::toString() const
    {
        std::string result = fmt::format("{}: {}", Utility::enumToString(kind), message);
        if (path)
            result += fmt::format(" (path: '{}')", *path);
        if (sftpError)
            result += fmt::format(". {}", sftpError->toString());
        return result;
    }

    ErrorKind classifySftpError(SftpError const& error, ErrorKind fallback)
    {
        switch (error.sftpError)
        {
            case SSH_FX_NO_SUCH_FILE:
            case SSH_FX_NO_SUCH_PATH:
                return ErrorKind::NotFoundError;
            case SSH_FX_PERMISSION_DENIED:
            case SSH_FX_WRITE_PROTECT:
                return ErrorKind::PermissionError;
            case SSH_FX_NO_CONNECTION:
            case SSH_FX_CONNECTION_LOST:
                return ErrorKind::TransportError;
            case SSH_FX_OK:
            {
                if (error.sshError != SSH_NO_ERROR && error.wrapperError == WrapperErrors::None)
                    return ErrorKind::TransportError;
                return fallback;
            }
            default:
                return fallback;
        }
    }

    Error makeSftpError(SftpError const& error, ErrorKind fallback, std::string message, std::optional<std::string> path)
    {
        Error result{
            .kind = classifySftpError(error, fallback),
            .message = std::move(message),
            .path = std::move(path),
            .sftpError = error,
        };
        Log::error("{}", result.toString());
        return result;
    }

    Error makeError(ErrorKind kind, std::string message, std::optional<std::string> path)
    {
        Error result{
            .kind = kind,
            .message = std::move(message),
            .path = std::move(path),
        };
        if (kind == ErrorKind::Cancelled)
            Log::info("{}", result.toString());
        else
            Log::error("{}", result.toString());
        return result;
    }
}
