#pragma once

#include <ssh/file_information.hpp>
#include <ssh/file_stream_interface.hpp>
#include <ssh/sftp_error.hpp>

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <fcntl.h>

namespace SecureShell
{
    enum class OpenType : int
    {
        Read = O_RDONLY,
        Write = O_WRONLY,
        ReadWrite = O_RDWR,
        Create = O_CREAT,
        Truncate = O_TRUNC,
        Exclusive = O_EXCL,
    };

    constexpr OpenType operator|(OpenType lhs, OpenType rhs)
    {
        return static_cast<OpenType>(static_cast<int>(lhs) | static_cast<int>(rhs));
    }

    /**
     * @brief An initialized sftp subsystem on top of an authenticated transport.
     * Remote paths are plain strings using '/'.
     */
    class ISftpSession
    {
      public:
        using Error = SftpError;

        ISftpSession() = default;
        virtual ~ISftpSession() = default;
        ISftpSession(ISftpSession const&) = delete;
        ISftpSession& operator=(ISftpSession const&) = delete;
        ISftpSession(ISftpSession&&) = delete;
        ISftpSession& operator=(ISftpSession&&) = delete;

        /**
         * @brief Lists the contents of a directory, including "." and ".." if the server sends them.
         *
         * @param path
         * @return std::expected<std::vector<FileInformation>, Error>
         */
        virtual std::expected<std::vector<FileInformation>, Error> listDirectory(std::string const& path) = 0;

        /**
         * @brief Gets the attributes of a file or directory. Follows symlinks.
         *
         * @param path
         * @return std::expected<FileInformation, Error>
         */
        virtual std::expected<FileInformation, Error> stat(std::string const& path) = 0;

        /**
         * @brief Opens a remote file.
         */
        virtual std::expected<std::unique_ptr<IFileStream>, Error>
        openFile(std::string const& path, OpenType openType, std::filesystem::perms permissions) = 0;

        /**
         * @brief Create a directory.
         *
         * @param path
         * @param permissions
         * @return std::expected<void, Error>
         */
        virtual std::expected<void, Error> createDirectory(std::string const& path, std::filesystem::perms permissions) = 0;

        virtual std::expected<void, Error> removeFile(std::string const& path) = 0;
        virtual std::expected<void, Error> removeDirectory(std::string const& path) = 0;

        /**
         * @brief Move a file or directory.
         */
        virtual std::expected<void, Error> rename(std::string const& source, std::string const& destination) = 0;

        /**
         * @brief Asks the server for the absolute form of path. "." yields the home directory.
         */
        virtual std::expected<std::string, Error> canonicalize(std::string const& path) = 0;

        /**
         * @brief Releases the sftp channel, then the transport. Idempotent.
         */
        virtual void close() = 0;
    };
}
