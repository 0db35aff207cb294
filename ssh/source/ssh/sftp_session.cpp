#include <ssh/sftp_session.hpp>

#include <log/log.hpp>

#include <functional>
#include <utility>

namespace SecureShell
{
    namespace
    {
        // Used when the server does not support the limits extension.
        constexpr std::size_t defaultTransferLimit = 32768;
    }

#define VERIFY_SFTP_SESSION() \
    if (session_ == nullptr) \
    return std::unexpected(SftpError{.message = "Sftp session is closed", .wrapperError = WrapperErrors::SessionNull})

    SftpError lastSftpError(sftp_session session)
    {
        return SftpError{
            .message = ssh_get_error(session->session),
            .sshError = ssh_get_error_code(session->session),
            .sftpError = sftp_get_error(session),
        };
    }

    SftpSession::SftpSession(std::unique_ptr<ssh::Session> transport, sftp_session session)
        : transport_{std::move(transport)}
        , session_{session}
    {}
    SftpSession::~SftpSession()
    {
        close();
    }
    void SftpSession::close()
    {
        if (session_ != nullptr)
        {
            sftp_free(session_);
            session_ = nullptr;
        }
        if (transport_)
        {
            transport_->disconnect();
            transport_.reset();
            Log::info("SftpSession: Transport closed.");
        }
    }
    SftpError SftpSession::lastError() const
    {
        return lastSftpError(session_);
    }

    std::expected<std::vector<FileInformation>, SftpSession::Error>
    SftpSession::listDirectory(std::string const& path)
    {
        VERIFY_SFTP_SESSION();

        int closeResult = 0;
        std::vector<FileInformation> entries{};

        {
            std::unique_ptr<sftp_dir_struct, std::function<void(sftp_dir_struct*)>> dir{
                sftp_opendir(session_, path.c_str()), [&](sftp_dir_struct* dir) {
                    if (dir != nullptr)
                    {
                        closeResult = sftp_closedir(dir);
                    }
                }};
            if (dir == nullptr)
                return std::unexpected(lastError());

            {
                std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> entry{
                    sftp_readdir(session_, dir.get()), sftp_attributes_free};

                for (; entry != nullptr; entry.reset(sftp_readdir(session_, dir.get())))
                {
                    entries.push_back(fromSftpAttributes(entry.get()));
                }
            }

            if (!sftp_dir_eof(dir.get()))
                return std::unexpected(lastError());
        }
        if (closeResult != SSH_OK)
        {
            auto error = lastError();
            error.sshError = closeResult;
            return std::unexpected(error);
        }

        return entries;
    }

    std::expected<FileInformation, SftpSession::Error> SftpSession::stat(std::string const& path)
    {
        VERIFY_SFTP_SESSION();
        std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> attributes{
            sftp_stat(session_, path.c_str()), sftp_attributes_free};
        if (attributes == nullptr)
            return std::unexpected(lastError());

        auto information = fromSftpAttributes(attributes.get());
        // sftp_stat does not fill in the name.
        if (information.name.empty())
        {
            const auto slash = path.find_last_of('/');
            information.name = slash == std::string::npos ? path : path.substr(slash + 1);
        }
        return information;
    }

    std::expected<std::unique_ptr<IFileStream>, SftpSession::Error>
    SftpSession::openFile(std::string const& path, OpenType openType, std::filesystem::perms permissions)
    {
        VERIFY_SFTP_SESSION();
        std::unique_ptr<sftp_file_struct, std::function<void(sftp_file_struct*)>> file{
            sftp_open(
                session_,
                path.c_str(),
                static_cast<int>(openType),
                static_cast<mode_t>(permissions & std::filesystem::perms::mask)),
            [](sftp_file_struct* file) {
                if (file != nullptr)
                {
                    sftp_close(file);
                }
            }};

        if (!file)
            return std::unexpected(lastError());

        std::size_t readLimit = defaultTransferLimit;
        std::size_t writeLimit = defaultTransferLimit;
        if (std::unique_ptr<sftp_limits_struct, decltype(&sftp_limits_free)> limits{sftp_limits(session_), sftp_limits_free};
            limits != nullptr)
        {
            if (limits->max_read_length != 0)
                readLimit = static_cast<std::size_t>(limits->max_read_length);
            if (limits->max_write_length != 0)
                writeLimit = static_cast<std::size_t>(limits->max_write_length);
        }

        return std::make_unique<FileStream>(session_, file.release(), readLimit, writeLimit);
    }

    std::expected<void, SftpSession::Error>
    SftpSession::createDirectory(std::string const& path, std::filesystem::perms permissions)
    {
        VERIFY_SFTP_SESSION();
        auto result =
            sftp_mkdir(session_, path.c_str(), static_cast<mode_t>(permissions & std::filesystem::perms::mask));
        if (result != SSH_OK)
            return std::unexpected(lastError());
        return {};
    }

    std::expected<void, SftpSession::Error> SftpSession::removeFile(std::string const& path)
    {
        VERIFY_SFTP_SESSION();
        auto result = sftp_unlink(session_, path.c_str());
        if (result != SSH_OK)
            return std::unexpected(lastError());
        return {};
    }

    std::expected<void, SftpSession::Error> SftpSession::removeDirectory(std::string const& path)
    {
        VERIFY_SFTP_SESSION();
        auto result = sftp_rmdir(session_, path.c_str());
        if (result != SSH_OK)
            return std::unexpected(lastError());
        return {};
    }

    std::expected<void, SftpSession::Error>
    SftpSession::rename(std::string const& source, std::string const& destination)
    {
        VERIFY_SFTP_SESSION();
        auto result = sftp_rename(session_, source.c_str(), destination.c_str());
        if (result != SSH_OK)
            return std::unexpected(lastError());
        return {};
    }

    std::expected<std::string, SftpSession::Error> SftpSession::canonicalize(std::string const& path)
    {
        VERIFY_SFTP_SESSION();
        std::unique_ptr<char, decltype(&ssh_string_free_char)> canonical{
            sftp_canonicalize_path(session_, path.c_str()), ssh_string_free_char};
        if (canonical == nullptr)
            return std::unexpected(lastError());
        return std::string{canonical.get()};
    }
}
