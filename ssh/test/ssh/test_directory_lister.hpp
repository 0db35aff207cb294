#pragma once

#include "common_fixture.hpp"

#include <ssh/directory_lister.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <unistd.h>

using ::testing::_;
using ::testing::Return;

namespace SecureShell::Test
{
    class DirectoryListerTests : public CommonFixture
    {
      protected:
        static std::vector<std::string> names(std::vector<SharedData::DirectoryEntry> const& entries)
        {
            std::vector<std::string> result;
            for (auto const& entry : entries)
                result.push_back(entry.name);
            return result;
        }

        void populateLocalDirectory()
        {
            std::filesystem::create_directory(isolateDirectory_.path() / "zdir");
            std::filesystem::create_directory(isolateDirectory_.path() / "Adir");
            writeFile(isolateDirectory_.path() / "b.txt", "bbb");
            writeFile(isolateDirectory_.path() / "A.txt", "a");
            writeFile(isolateDirectory_.path() / ".hidden", "secret");
        }
    };

    TEST_F(DirectoryListerTests, RemoteListingRequiresConnection)
    {
        createMockedSession();
        const auto result = listRemoteDirectory(*session_, "/");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::ConnectionError);
    }

    TEST_F(DirectoryListerTests, RemoteListingPutsDirectoriesFirst)
    {
        connectMockedSession();
        EXPECT_CALL(*sftp_, listDirectory("/pub"))
            .WillOnce(Return(std::expected<std::vector<FileInformation>, SftpError>{std::vector<FileInformation>{
                remoteFile("readme.txt", 405),
                remoteDirectory("."),
                remoteDirectory("example"),
                remoteFile("Archive.zip", 10),
                remoteDirectory(".."),
                remoteDirectory("Backup"),
            }}));

        const auto result = listRemoteDirectory(*session_, "/pub");
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(names(*result), (std::vector<std::string>{"Backup", "example", "Archive.zip", "readme.txt"}));
        for (auto const& entry : *result)
            EXPECT_EQ(entry.origin, SharedData::EntryOrigin::Remote);
    }

    TEST_F(DirectoryListerTests, RemoteListingDefaultsToCursor)
    {
        connectMockedSession("/home/demo");
        EXPECT_CALL(*sftp_, listDirectory("/home/demo"))
            .WillOnce(Return(std::expected<std::vector<FileInformation>, SftpError>{std::vector<FileInformation>{}}));

        const auto result = listRemoteDirectory(*session_);
        ASSERT_TRUE(result.has_value());
        EXPECT_TRUE(result->empty());
    }

    TEST_F(DirectoryListerTests, MissingRemoteDirectoryIsPathError)
    {
        connectMockedSession();
        EXPECT_CALL(*sftp_, listDirectory("/missing"))
            .WillOnce(Return(std::unexpected(sftpStatus(SSH_FX_NO_SUCH_FILE))));

        const auto result = listRemoteDirectory(*session_, "/missing");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::PathError);
    }

    TEST_F(DirectoryListerTests, DeniedRemoteListingIsPermissionError)
    {
        connectMockedSession();
        EXPECT_CALL(*sftp_, listDirectory("/root"))
            .WillOnce(Return(std::unexpected(sftpStatus(SSH_FX_PERMISSION_DENIED))));

        EXPECT_EQ(listRemoteDirectory(*session_, "/root").error().kind, ErrorKind::PermissionError);
    }

    TEST_F(DirectoryListerTests, RemoteEntriesConvertFromSftpAttributes)
    {
        sftp_attributes_struct attributes{};
        char name[] = "notes.txt";
        attributes.name = name;
        attributes.size = 1234;
        attributes.permissions = 0100640;
        attributes.mtime = 1700000000;

        const auto entry = fromSftpAttributes(&attributes);
        EXPECT_EQ(entry.name, "notes.txt");
        EXPECT_EQ(entry.size, 1234u);
        EXPECT_EQ(entry.permissions, "-rw-r-----");
        EXPECT_TRUE(entry.isRegularFile());
        ASSERT_TRUE(entry.modified.has_value());
        EXPECT_EQ(entry.modified->time_since_epoch().count(), 1700000000);
    }

    TEST_F(DirectoryListerTests, RemoteDirectoriesHaveNoSizeAndTypeFallback)
    {
        sftp_attributes_struct attributes{};
        char name[] = "folder";
        attributes.name = name;
        attributes.size = 4096;
        attributes.type = SSH_FILEXFER_TYPE_DIRECTORY;

        const auto entry = fromSftpAttributes(&attributes);
        EXPECT_TRUE(entry.isDirectory());
        EXPECT_EQ(entry.size, 0u);
        EXPECT_EQ(entry.permissions, "d---------");
        EXPECT_FALSE(entry.modified.has_value());
    }

    TEST_F(DirectoryListerTests, RemotePermissionStringUsesFallbackType)
    {
        sftp_attributes_struct attributes{};
        char name[] = "folder";
        attributes.name = name;
        attributes.permissions = 0755;
        attributes.type = SSH_FILEXFER_TYPE_DIRECTORY;

        const auto entry = fromSftpAttributes(&attributes);
        EXPECT_TRUE(entry.isDirectory());
        EXPECT_EQ(entry.permissions, "drwxr-xr-x");
        EXPECT_EQ(entry.mode, 0755u);
    }

    TEST_F(DirectoryListerTests, LocalListingPutsDirectoriesFirst)
    {
        populateLocalDirectory();

        const auto result = listLocalDirectory(isolateDirectory_.path());
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(names(*result), (std::vector<std::string>{"Adir", "zdir", ".hidden", "A.txt", "b.txt"}));
    }

    TEST_F(DirectoryListerTests, LocalListingCanHideDotFiles)
    {
        populateLocalDirectory();

        const auto result = listLocalDirectory(isolateDirectory_.path(), {.showHidden = false});
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(names(*result), (std::vector<std::string>{"Adir", "zdir", "A.txt", "b.txt"}));
    }

    TEST_F(DirectoryListerTests, LocalEntriesAreNormalized)
    {
        populateLocalDirectory();

        const auto result = listLocalDirectory(isolateDirectory_.path());
        ASSERT_TRUE(result.has_value());

        auto const& directory = result->front();
        EXPECT_TRUE(directory.isDirectory());
        EXPECT_FALSE(directory.isRegularFile());
        EXPECT_EQ(directory.size, 0u);
        EXPECT_EQ(directory.permissions.front(), 'd');
        EXPECT_EQ(directory.origin, SharedData::EntryOrigin::Local);

        auto const& file = result->back();
        EXPECT_EQ(file.name, "b.txt");
        EXPECT_TRUE(file.isRegularFile());
        EXPECT_EQ(file.size, 3u);
        EXPECT_EQ(file.permissions.front(), '-');
        EXPECT_TRUE(file.modified.has_value());
    }

    TEST_F(DirectoryListerTests, MissingLocalDirectoryIsPathError)
    {
        const auto result = listLocalDirectory(isolateDirectory_.path() / "missing");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::PathError);
    }

    TEST_F(DirectoryListerTests, ListingAFileIsPathError)
    {
        writeFile(isolateDirectory_.path() / "file.txt", "x");
        EXPECT_EQ(listLocalDirectory(isolateDirectory_.path() / "file.txt").error().kind, ErrorKind::PathError);
    }

    TEST_F(DirectoryListerTests, UnreadableLocalDirectoryIsPermissionError)
    {
        if (::geteuid() == 0)
            GTEST_SKIP() << "Permissions are not enforced for root.";

        const auto locked = isolateDirectory_.path() / "locked";
        std::filesystem::create_directory(locked);
        std::filesystem::permissions(locked, std::filesystem::perms::none);

        const auto result = listLocalDirectory(locked);
        std::filesystem::permissions(locked, std::filesystem::perms::owner_all);

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::PermissionError);
    }

    TEST_F(DirectoryListerTests, ChangeLocalDirectoryResolvesTokens)
    {
        populateLocalDirectory();
        const auto base = std::filesystem::canonical(isolateDirectory_.path());

        const auto child = changeLocalDirectory(base, "zdir");
        ASSERT_TRUE(child.has_value());
        EXPECT_EQ(*child, base / "zdir");

        const auto parent = changeLocalDirectory(*child, "..");
        ASSERT_TRUE(parent.has_value());
        EXPECT_EQ(*parent, base);
    }

    TEST_F(DirectoryListerTests, ChangeLocalDirectoryIntoFileIsPathError)
    {
        populateLocalDirectory();
        const auto result = changeLocalDirectory(isolateDirectory_.path(), "b.txt");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::PathError);
    }
}
