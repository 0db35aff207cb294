#pragma once

#include <persistence/state_holder.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

extern std::filesystem::path programDirectory;

namespace Persistence::Test
{
    class StateHolderTests : public ::testing::Test
    {
      protected:
        std::filesystem::path configPath() const
        {
            return isolateDirectory_.path() / "config" / "config.json";
        }

        static void writeFile(std::filesystem::path const& path, std::string const& content)
        {
            std::filesystem::create_directories(path.parent_path());
            std::ofstream file{path, std::ios_base::binary};
            file << content;
        }

        static std::string readFile(std::filesystem::path const& path)
        {
            std::ifstream file{path, std::ios_base::binary};
            return std::string{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
        }

        std::vector<std::filesystem::path> backups() const
        {
            std::vector<std::filesystem::path> result;
            for (auto const& entry : std::filesystem::directory_iterator{configPath().parent_path()})
            {
                if (entry.path().filename().string().starts_with("config.json.backup_"))
                    result.push_back(entry.path());
            }
            return result;
        }

        static ConnectionProfile rebexProfile()
        {
            return ConnectionProfile{
                .host = "test.rebex.net",
                .port = 22,
                .user = "demo",
                .description = "Public test server",
                .defaultDirectory = "/pub",
                .sshOptions = {.hostKeyPolicy = SecureShell::HostKeyPolicy::AcceptAll},
            };
        }

      protected:
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp", false};
    };

    TEST_F(StateHolderTests, MissingFileYieldsDefaultsAndIsWrittenBack)
    {
        StateHolder holder{configPath()};
        ASSERT_TRUE(holder.load());

        ASSERT_TRUE(std::filesystem::exists(configPath()));
        const auto json = nlohmann::json::parse(readFile(configPath()));
        EXPECT_EQ(json.at("transferChunkSize").get<std::size_t>(), 32u * 1024u);
        EXPECT_EQ(json.at("logLevel").get<std::string>(), "info");
        EXPECT_TRUE(json.at("profiles").empty());
        EXPECT_TRUE(holder.stateCache().profiles.empty());
    }

    TEST_F(StateHolderTests, UnparsableFileIsBackedUpAndReplaced)
    {
        writeFile(configPath(), "{ this is not json");

        StateHolder holder{configPath()};
        ASSERT_TRUE(holder.load());

        const auto backupFiles = backups();
        ASSERT_EQ(backupFiles.size(), 1u);
        EXPECT_EQ(readFile(backupFiles.front()), "{ this is not json");
        EXPECT_NO_THROW(static_cast<void>(nlohmann::json::parse(readFile(configPath()))));
    }

    TEST_F(StateHolderTests, InvalidContentsAreBackedUp)
    {
        writeFile(configPath(), R"({"profiles": {"x": {"host": "h", "sshOptions": {"hostKeyPolicy": "Sometimes"}}}})");

        StateHolder holder{configPath()};
        ASSERT_TRUE(holder.load());

        EXPECT_EQ(backups().size(), 1u);
        EXPECT_TRUE(holder.stateCache().profiles.empty());
    }

    TEST_F(StateHolderTests, CommentsAreAllowed)
    {
        writeFile(configPath(), R"({
            // Remembered servers
            "showHiddenFiles": true,
            "profiles": {
                "rebex": { "host": "test.rebex.net", "user": "demo" } /* no port */
            }
        })");

        StateHolder holder{configPath()};
        ASSERT_TRUE(holder.load());

        EXPECT_TRUE(holder.stateCache().showHiddenFiles);
        const auto profile = holder.profile("rebex");
        ASSERT_TRUE(profile.has_value());
        EXPECT_EQ(profile->host, "test.rebex.net");
        EXPECT_EQ(profile->user, "demo");
        EXPECT_FALSE(profile->port.has_value());
        EXPECT_TRUE(backups().empty());
    }

    TEST_F(StateHolderTests, SavedStateIsLoadedAgain)
    {
        {
            StateHolder holder{configPath()};
            ASSERT_TRUE(holder.load());
            holder.stateCache().logLevel = Log::Level::Debug;
            holder.stateCache().transferChunkSize = 4096;
            holder.stateCache().lastLocalDirectory = "/tmp";
            holder.addProfile("rebex", rebexProfile());
            holder.save();
        }

        StateHolder holder{configPath()};
        ASSERT_TRUE(holder.load());
        EXPECT_EQ(holder.stateCache().logLevel, Log::Level::Debug);
        EXPECT_EQ(holder.stateCache().transferChunkSize, 4096u);
        EXPECT_EQ(holder.stateCache().lastLocalDirectory, std::filesystem::path{"/tmp"});
        EXPECT_EQ(holder.profile("rebex"), rebexProfile());
    }

    TEST_F(StateHolderTests, ProfilesCanBeAddedReplacedAndRemoved)
    {
        StateHolder holder{configPath()};
        holder.addProfile("zeta", ConnectionProfile{.host = "zeta.example.com"});
        holder.addProfile("alpha", ConnectionProfile{.host = "alpha.example.com"});
        holder.addProfile("zeta", ConnectionProfile{.host = "new-zeta.example.com"});

        EXPECT_EQ(holder.profileNames(), (std::vector<std::string>{"alpha", "zeta"}));
        EXPECT_EQ(holder.profile("zeta")->host, "new-zeta.example.com");

        EXPECT_TRUE(holder.removeProfile("alpha"));
        EXPECT_FALSE(holder.removeProfile("alpha"));
        EXPECT_FALSE(holder.profile("alpha").has_value());
    }

    TEST_F(StateHolderTests, ExportedProfilesCanBeImported)
    {
        StateHolder source{configPath()};
        source.addProfile("rebex", rebexProfile());
        source.addProfile("other", ConnectionProfile{.host = "other.example.com"});

        const auto exportFile = isolateDirectory_.path() / "export" / "profiles.json";
        const auto exported = source.exportProfiles(exportFile, {"rebex"});
        ASSERT_TRUE(exported.has_value());
        EXPECT_EQ(*exported, 1u);

        StateHolder target{isolateDirectory_.path() / "target.json"};
        const auto imported = target.importProfiles(exportFile, false);
        ASSERT_TRUE(imported.has_value());
        EXPECT_EQ(*imported, 1u);
        EXPECT_EQ(target.profileNames(), (std::vector<std::string>{"rebex"}));
        EXPECT_EQ(target.profile("rebex"), rebexProfile());
    }

    TEST_F(StateHolderTests, ImportKeepsExistingProfilesUnlessOverwriting)
    {
        StateHolder source{configPath()};
        source.addProfile("rebex", rebexProfile());
        const auto exportFile = isolateDirectory_.path() / "profiles.json";
        ASSERT_TRUE(source.exportProfiles(exportFile).has_value());

        StateHolder target{isolateDirectory_.path() / "target.json"};
        target.addProfile("rebex", ConnectionProfile{.host = "mine.example.com"});

        EXPECT_EQ(target.importProfiles(exportFile, false).value(), 0u);
        EXPECT_EQ(target.profile("rebex")->host, "mine.example.com");

        EXPECT_EQ(target.importProfiles(exportFile, true).value(), 1u);
        EXPECT_EQ(target.profile("rebex")->host, "test.rebex.net");
    }

    TEST_F(StateHolderTests, ExportOfUnknownProfileIsConfigurationError)
    {
        StateHolder holder{configPath()};
        const auto result = holder.exportProfiles(isolateDirectory_.path() / "profiles.json", {"missing"});
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, SecureShell::ErrorKind::ConfigurationError);
        EXPECT_FALSE(std::filesystem::exists(isolateDirectory_.path() / "profiles.json"));
    }

    TEST_F(StateHolderTests, ImportOfMissingFileIsNotFound)
    {
        StateHolder holder{configPath()};
        const auto result = holder.importProfiles(isolateDirectory_.path() / "missing.json", false);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, SecureShell::ErrorKind::NotFoundError);
    }

    TEST_F(StateHolderTests, ImportOfMalformedFileIsConfigurationError)
    {
        writeFile(isolateDirectory_.path() / "broken.json", R"({"notProfiles": 1})");

        StateHolder holder{configPath()};
        const auto result = holder.importProfiles(isolateDirectory_.path() / "broken.json", false);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, SecureShell::ErrorKind::ConfigurationError);
    }

    TEST_F(StateHolderTests, DefaultPathFollowsXdgConfigHome)
    {
        char const* previous = std::getenv("XDG_CONFIG_HOME");
        const std::optional<std::string> saved = previous ? std::optional<std::string>{previous} : std::nullopt;

        ::setenv("XDG_CONFIG_HOME", "/xdg/config", 1);
        EXPECT_EQ(defaultConfigurationPath(), std::filesystem::path{"/xdg/config/sftp-commander/config.json"});

        if (saved)
            ::setenv("XDG_CONFIG_HOME", saved->c_str(), 1);
        else
            ::unsetenv("XDG_CONFIG_HOME");
    }
}
