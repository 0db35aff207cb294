#pragma once

#include <ssh/sftp_session_interface.hpp>

#include <gmock/gmock.h>

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace SecureShell::Test
{
    class SftpSessionMock : public SecureShell::ISftpSession
    {
      public:
        MOCK_METHOD((std::expected<std::vector<FileInformation>, SftpError>), listDirectory, (std::string const&), (override));
        MOCK_METHOD((std::expected<FileInformation, SftpError>), stat, (std::string const&), (override));
        MOCK_METHOD(
            (std::expected<std::unique_ptr<IFileStream>, SftpError>),
            openFile,
            (std::string const&, OpenType, std::filesystem::perms),
            (override));
        MOCK_METHOD(
            (std::expected<void, SftpError>),
            createDirectory,
            (std::string const&, std::filesystem::perms),
            (override));
        MOCK_METHOD((std::expected<void, SftpError>), removeFile, (std::string const&), (override));
        MOCK_METHOD((std::expected<void, SftpError>), removeDirectory, (std::string const&), (override));
        MOCK_METHOD((std::expected<void, SftpError>), rename, (std::string const&, std::string const&), (override));
        MOCK_METHOD((std::expected<std::string, SftpError>), canonicalize, (std::string const&), (override));
        MOCK_METHOD(void, close, (), (override));
    };
}
