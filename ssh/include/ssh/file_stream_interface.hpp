#pragma once

#include <ssh/sftp_error.hpp>
#include <ssh/file_information.hpp>

#include <cstddef>
#include <expected>
#include <string_view>

namespace SecureShell
{
    class IFileStream
    {
      public:
        IFileStream() = default;
        virtual ~IFileStream() = default;
        IFileStream(IFileStream const&) = default;
        IFileStream& operator=(IFileStream const&) = default;
        IFileStream(IFileStream&&) = default;
        IFileStream& operator=(IFileStream&&) = default;

        /**
         * @brief Retrieves information about the file.
         *
         * @return std::expected<FileInformation, SftpError>
         */
        virtual std::expected<FileInformation, SftpError> stat() = 0;

        /**
         * @brief Reads some bytes from the file. Not necessarily fills the buffer. bufferSize MUST be less than or
         * equal to the read limit.
         *
         * @param buffer
         * @param bufferSize
         * @return std::expected<std::size_t, SftpError> The amount read, 0 at the end of the file.
         */
        virtual std::expected<std::size_t, SftpError> readSome(char* buffer, std::size_t bufferSize) = 0;

        /**
         * @brief Writes all of data to the file.
         * Data larger than the write limit is broken into smaller parts.
         *
         * @param data
         * @return std::expected<void, SftpError>
         */
        virtual std::expected<void, SftpError> write(std::string_view data) = 0;

        /**
         * @brief Returns the maximum number of bytes that can be written in a single pure write operation.
         * This limit is not necessary to uphold for the write function of this class.
         *
         * @return std::size_t
         */
        virtual std::size_t writeLengthLimit() const = 0;

        /**
         * @brief Returns the maximum number of bytes that can be read in a single pure read operation.
         *
         * @return std::size_t
         */
        virtual std::size_t readLengthLimit() const = 0;

        /**
         * @brief Closes the file. Further operations fail.
         * Servers may only report write errors at this point.
         *
         * @return std::expected<void, SftpError>
         */
        virtual std::expected<void, SftpError> close() = 0;
    };
}
