#include <ssh/file_stream.hpp>
#include <ssh/sftp_session.hpp>

#include <log/log.hpp>

#include <algorithm>
#include <utility>

namespace SecureShell
{
#define VERIFY_FILE_STREAM() \
    if (!file_) \
    return std::unexpected(SftpError{.message = "File is null", .wrapperError = WrapperErrors::FileNull})

    void FileStream::FileDeleter::operator()(sftp_file file) const
    {
        if (file != nullptr && sftp_close(file) != SSH_NO_ERROR)
            Log::warn("FileStream: Closing remote file reported an error.");
    }

    FileStream::FileStream(sftp_session sftp, sftp_file file, std::size_t readLimit, std::size_t writeLimit)
        : sftp_{sftp}
        , file_{file}
        , readLimit_{readLimit}
        , writeLimit_{writeLimit}
    {}
    FileStream::~FileStream() = default;
    FileStream::FileStream(FileStream&& other)
        : sftp_{std::exchange(other.sftp_, nullptr)}
        , file_{std::move(other.file_)}
        , readLimit_{other.readLimit_}
        , writeLimit_{other.writeLimit_}
    {}
    FileStream& FileStream::operator=(FileStream&& other)
    {
        if (this != &other)
        {
            sftp_ = std::exchange(other.sftp_, nullptr);
            file_ = std::move(other.file_);
            readLimit_ = other.readLimit_;
            writeLimit_ = other.writeLimit_;
        }
        return *this;
    }
    std::expected<void, SftpError> FileStream::close()
    {
        VERIFY_FILE_STREAM();
        if (sftp_close(file_.release()) != SSH_NO_ERROR)
            return std::unexpected(lastError());
        return {};
    }
    SftpError FileStream::lastError() const
    {
        if (sftp_ == nullptr)
            return SftpError{.message = "Sftp session is null", .wrapperError = WrapperErrors::SessionNull};
        return lastSftpError(sftp_);
    }
    std::expected<FileInformation, SftpError> FileStream::stat()
    {
        VERIFY_FILE_STREAM();
        std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> attributes{
            sftp_fstat(file_.get()), sftp_attributes_free};
        if (attributes == nullptr)
            return std::unexpected(lastError());
        return fromSftpAttributes(attributes.get());
    }
    std::expected<std::size_t, SftpError> FileStream::readSome(char* buffer, std::size_t bufferSize)
    {
        VERIFY_FILE_STREAM();
        const auto result = sftp_read(file_.get(), buffer, std::min(bufferSize, readLengthLimit()));
        if (result < 0)
            return std::unexpected(lastError());
        return static_cast<std::size_t>(result);
    }
    std::expected<void, SftpError> FileStream::write(std::string_view data)
    {
        VERIFY_FILE_STREAM();
        while (!data.empty())
        {
            const auto written = sftp_write(file_.get(), data.data(), std::min(data.size(), writeLengthLimit()));
            if (written < 0)
                return std::unexpected(lastError());
            if (written == 0)
            {
                return std::unexpected(SftpError{
                    .message = "Failed to write any data",
                    .wrapperError = WrapperErrors::ShortWrite,
                });
            }
            data.remove_prefix(static_cast<std::size_t>(written));
        }
        return {};
    }
    std::size_t FileStream::writeLengthLimit() const
    {
        return writeLimit_;
    }
    std::size_t FileStream::readLengthLimit() const
    {
        return readLimit_;
    }
}
