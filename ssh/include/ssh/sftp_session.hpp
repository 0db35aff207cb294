#pragma once

#include <ssh/sftp_session_interface.hpp>
#include <ssh/file_stream.hpp>
#include <ssh/sftp_error.hpp>

#include <libssh/libsshpp.hpp>
#include <libssh/sftp.h>

#include <memory>
#include <expected>
#include <filesystem>

namespace SecureShell
{
    /**
     * @brief Retrieves the last error that occurred on the given sftp session. May contain success.
     */
    SftpError lastSftpError(sftp_session session);

    class SftpSession : public ISftpSession
    {
      public:
        /**
         * @brief Takes ownership of an connected transport and the sftp session that was initialized on it.
         */
        SftpSession(std::unique_ptr<ssh::Session> transport, sftp_session session);
        ~SftpSession() override;

        std::expected<std::vector<FileInformation>, Error> listDirectory(std::string const& path) override;
        std::expected<FileInformation, Error> stat(std::string const& path) override;
        std::expected<std::unique_ptr<IFileStream>, Error>
        openFile(std::string const& path, OpenType openType, std::filesystem::perms permissions) override;
        std::expected<void, Error> createDirectory(std::string const& path, std::filesystem::perms permissions) override;
        std::expected<void, Error> removeFile(std::string const& path) override;
        std::expected<void, Error> removeDirectory(std::string const& path) override;
        std::expected<void, Error> rename(std::string const& source, std::string const& destination) override;
        std::expected<std::string, Error> canonicalize(std::string const& path) override;
        void close() override;

      private:
        SftpError lastError() const;

      private:
        std::unique_ptr<ssh::Session> transport_;
        sftp_session session_;
    };
}
