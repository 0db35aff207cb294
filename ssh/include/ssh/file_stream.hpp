#pragma once

#include <ssh/file_stream_interface.hpp>
#include <ssh/sftp_error.hpp>
#include <ssh/file_information.hpp>

#include <libssh/sftp.h>

#include <memory>
#include <expected>

namespace SecureShell
{
    /**
     * @brief An open remote file. Owned by whoever opened it, must not outlive the SftpSession.
     */
    class FileStream : public IFileStream
    {
      public:
        FileStream(sftp_session sftp, sftp_file file, std::size_t readLimit, std::size_t writeLimit);
        ~FileStream() override;
        FileStream(FileStream const&) = delete;
        FileStream& operator=(FileStream const&) = delete;
        FileStream(FileStream&&);
        FileStream& operator=(FileStream&&);

        std::expected<FileInformation, SftpError> stat() override;
        std::expected<std::size_t, SftpError> readSome(char* buffer, std::size_t bufferSize) override;
        std::expected<void, SftpError> write(std::string_view data) override;
        std::size_t writeLengthLimit() const override;
        std::size_t readLengthLimit() const override;
        std::expected<void, SftpError> close() override;

      private:
        struct FileDeleter
        {
            void operator()(sftp_file file) const;
        };

        SftpError lastError() const;

      private:
        sftp_session sftp_;
        std::unique_ptr<sftp_file_struct, FileDeleter> file_;
        std::size_t readLimit_;
        std::size_t writeLimit_;
    };
}
