#pragma once

#include <shared_data/directory_entry.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace SharedData::Test
{
    namespace
    {
        DirectoryEntry makeEntry(std::string name, FileType type)
        {
            return DirectoryEntry{
                .name = std::move(name),
                .type = type,
            };
        }

        std::vector<std::string> names(std::vector<DirectoryEntry> const& entries)
        {
            std::vector<std::string> result;
            for (auto const& entry : entries)
                result.push_back(entry.name);
            return result;
        }
    }

    TEST(DirectoryEntryTests, FileTypeIsDerivedFromModeBits)
    {
        EXPECT_EQ(fileTypeFromMode(0100644), FileType::Regular);
        EXPECT_EQ(fileTypeFromMode(0040755), FileType::Directory);
        EXPECT_EQ(fileTypeFromMode(0120777), FileType::Symlink);
        EXPECT_EQ(fileTypeFromMode(0010644), FileType::Special);
        EXPECT_EQ(fileTypeFromMode(0), FileType::Unknown);
    }

    TEST(DirectoryEntryTests, PermissionStringLooksLikeLsOutput)
    {
        EXPECT_EQ(permissionString(0040755), "drwxr-xr-x");
        EXPECT_EQ(permissionString(0100644), "-rw-r--r--");
        EXPECT_EQ(permissionString(0120777), "lrwxrwxrwx");
        EXPECT_EQ(permissionString(0104755), "-rwsr-xr-x");
        EXPECT_EQ(permissionString(0041777), "drwxrwxrwt");
    }

    TEST(DirectoryEntryTests, UnknownModeRendersDashes)
    {
        EXPECT_EQ(permissionString(0), "---------");
        EXPECT_EQ(DirectoryEntry{}.permissions, "---------");
    }

    TEST(DirectoryEntryTests, DirectoryAndRegularFileAreExclusive)
    {
        auto dir = makeEntry("a", FileType::Directory);
        auto file = makeEntry("b", FileType::Regular);
        EXPECT_TRUE(dir.isDirectory());
        EXPECT_FALSE(dir.isRegularFile());
        EXPECT_TRUE(file.isRegularFile());
        EXPECT_FALSE(file.isDirectory());
    }

    TEST(DirectoryEntryTests, SortPutsDirectoriesFirst)
    {
        std::vector<DirectoryEntry> entries{
            makeEntry("zeta.txt", FileType::Regular),
            makeEntry("beta", FileType::Directory),
            makeEntry("alpha.txt", FileType::Regular),
            makeEntry("Alpha", FileType::Directory),
        };
        sortEntries(entries);
        EXPECT_EQ(names(entries), (std::vector<std::string>{"Alpha", "beta", "alpha.txt", "zeta.txt"}));
    }

    TEST(DirectoryEntryTests, SortIgnoresCaseWithinGroup)
    {
        std::vector<DirectoryEntry> entries{
            makeEntry("b.txt", FileType::Regular),
            makeEntry("C.txt", FileType::Regular),
            makeEntry("A.txt", FileType::Regular),
        };
        sortEntries(entries);
        EXPECT_EQ(names(entries), (std::vector<std::string>{"A.txt", "b.txt", "C.txt"}));
    }

    TEST(DirectoryEntryTests, SymlinksSortWithFiles)
    {
        std::vector<DirectoryEntry> entries{
            makeEntry("link", FileType::Symlink),
            makeEntry("zdir", FileType::Directory),
        };
        sortEntries(entries);
        EXPECT_EQ(names(entries), (std::vector<std::string>{"zdir", "link"}));
    }

    TEST(DirectoryEntryTests, CanBeSerializedToJson)
    {
        DirectoryEntry entry{
            .name = "readme.txt",
            .size = 405,
            .modified = TimePoint{std::chrono::seconds{1700000000}},
            .permissions = permissionString(0100644),
            .mode = 0100644,
            .type = FileType::Regular,
            .origin = EntryOrigin::Remote,
        };

        const nlohmann::json j = entry;
        EXPECT_EQ(j["name"].get<std::string>(), "readme.txt");
        EXPECT_EQ(j["size"].get<std::uint64_t>(), 405u);
        EXPECT_EQ(j["modified"].get<std::int64_t>(), 1700000000);
        EXPECT_EQ(j["type"].get<std::string>(), "Regular");
        EXPECT_EQ(j["origin"].get<std::string>(), "Remote");

        EXPECT_EQ(j.get<DirectoryEntry>(), entry);
    }

    TEST(DirectoryEntryTests, MissingTimestampIsOmittedFromJson)
    {
        const nlohmann::json j = makeEntry("dir", FileType::Directory);
        EXPECT_FALSE(j.contains("modified"));
        EXPECT_FALSE(j.get<DirectoryEntry>().modified.has_value());
    }
}
