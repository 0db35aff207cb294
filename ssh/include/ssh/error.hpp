#pragma once

#include <ssh/sftp_error.hpp>
#include <utility/describe.hpp>

#include <optional>
#include <string>

namespace SecureShell
{
    BOOST_DEFINE_ENUM_CLASS(
        ErrorKind,
        ConfigurationError,
        AuthMaterialError,
        AuthenticationError,
        TransportError,
        ConnectionError,
        PathError,
        NotFoundError,
        PermissionError,
        IOError,
        Cancelled,
        DirectoryCreationError)

    /**
     * @brief The error type returned by all engine operations.
     */
    struct Error
    {
        ErrorKind kind;
        std::string message{};
        std::optional<std::string> path{std::nullopt};
        std::optional<SftpError> sftpError{std::nullopt};

        std::string toString() const;
    };

    /**
     * @brief Maps a libssh/sftp error onto the error taxonomy.
     *
     * Missing files map to NotFoundError, denied access to PermissionError and lost connections as well as ssh
     * level errors without an sftp status to TransportError. Everything else gets the fallback kind.
     *
     * @param error The raw error.
     * @param fallback The kind chosen by the calling operation.
     */
    ErrorKind classifySftpError(SftpError const& error, ErrorKind fallback);

    /**
     * @brief Builds an Error from a raw sftp error and logs it.
     */
    Error
    makeSftpError(SftpError const& error, ErrorKind fallback, std::string message, std::optional<std::string> path = {});

    /**
     * @brief Builds an Error and logs it.
     */
    Error makeError(ErrorKind kind, std::string message, std::optional<std::string> path = {});
}
