#pragma once

#include <ssh/directory_lister.hpp>
#include <ssh/path_resolver.hpp>
#include <ssh/session.hpp>
#include <ssh/transfer_engine.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

extern std::filesystem::path programDirectory;

namespace SecureShell::Test
{
    /**
     * @brief Runs against the public test.rebex.net read-only server.
     * Only enabled when SFTP_COMMANDER_ONLINE_TESTS is set in the environment.
     */
    class OnlineTests : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            if (std::getenv("SFTP_COMMANDER_ONLINE_TESTS") == nullptr)
                GTEST_SKIP() << "Set SFTP_COMMANDER_ONLINE_TESTS to run tests against test.rebex.net.";

            auto session = makeSession(
                ConnectionParameters{
                    .host = "test.rebex.net",
                    .port = 22,
                    .username = "demo",
                    .hostKeyPolicy = HostKeyPolicy::AcceptAll,
                },
                Credential{.password = "password"},
                std::make_shared<NotificationChannel>());
            ASSERT_TRUE(session.has_value()) << session.error().toString();
            session_ = std::move(session).value();
        }

      protected:
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp", false};
        std::unique_ptr<Session> session_{};
    };

    TEST_F(OnlineTests, ListsThePubDirectory)
    {
        const auto entries = listRemoteDirectory(*session_, "/pub");
        ASSERT_TRUE(entries.has_value()) << entries.error().toString();
        EXPECT_TRUE(std::any_of(entries->begin(), entries->end(), [](auto const& entry) {
            return entry.name == "example" && entry.isDirectory();
        }));
    }

    TEST_F(OnlineTests, CursorStartsInReportedHome)
    {
        const auto home = session_->withSftp([](ISftpSession& sftp) -> std::expected<std::string, Error> {
            auto canonical = sftp.canonicalize(".");
            if (!canonical)
                return std::unexpected(makeSftpError(canonical.error(), ErrorKind::IOError, "Cannot resolve home"));
            return std::move(canonical).value();
        });
        ASSERT_TRUE(home.has_value()) << home.error().toString();
        EXPECT_EQ(session_->cursor(), normalizeRemotePath(*home));
    }

    TEST_F(OnlineTests, RootListingPutsDirectoriesFirst)
    {
        const auto entries = listRemoteDirectory(*session_, "/");
        ASSERT_TRUE(entries.has_value()) << entries.error().toString();
        ASSERT_FALSE(entries->empty());

        const auto firstNonDirectory = std::find_if(entries->begin(), entries->end(), [](auto const& entry) {
            return !entry.isDirectory();
        });
        EXPECT_NE(firstNonDirectory, entries->begin());
        EXPECT_TRUE(std::none_of(firstNonDirectory, entries->end(), [](auto const& entry) {
            return entry.isDirectory();
        }));
        EXPECT_TRUE(std::any_of(entries->begin(), firstNonDirectory, [](auto const& entry) {
            return entry.name == "pub";
        }));
    }

    TEST_F(OnlineTests, DownloadsReadme)
    {
        const auto target = isolateDirectory_.path() / "download" / "readme.txt";
        const auto result = download(*session_, "/readme.txt", target);
        ASSERT_TRUE(result.has_value()) << result.error().toString();
        EXPECT_EQ(result->transferredBytes, result->totalBytes);
        EXPECT_EQ(std::filesystem::file_size(target), result->totalBytes);
    }

    TEST_F(OnlineTests, WrongPasswordIsAuthenticationError)
    {
        Session session{std::make_shared<NotificationChannel>()};
        const auto result = session.connect(
            ConnectionParameters{
                .host = "test.rebex.net",
                .username = "demo",
                .hostKeyPolicy = HostKeyPolicy::AcceptAll,
            },
            Credential{.password = "wrong"});
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::AuthenticationError);
        EXPECT_EQ(session.state(), ConnectionState::Failed);
    }
}
