#pragma once

#include <shared_data/shared_data.hpp>
#include <shared_data/time_point.hpp>
#include <utility/describe.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(FileType, Unknown, Regular, Directory, Symlink, Special)
    BOOST_DEFINE_ENUM_CLASS(EntryOrigin, Local, Remote)

    /**
     * @brief A normalized file or directory entry, produced for local and remote listings alike.
     */
    struct DirectoryEntry
    {
        using FileType = SharedData::FileType;

        /// Leaf name, never contains a separator.
        std::string name{};
        /// Size in bytes. Always 0 for directories.
        std::uint64_t size{0};
        std::optional<TimePoint> modified{std::nullopt};
        /// Permission string in "rwxr-xr-x" style, prefixed by the type character.
        std::string permissions{"---------"};
        /// Raw posix mode bits, 0 when unknown.
        std::uint32_t mode{0};
        FileType type{FileType::Unknown};
        EntryOrigin origin{EntryOrigin::Local};

        bool isDirectory() const
        {
            return type == FileType::Directory;
        }
        bool isRegularFile() const
        {
            return type == FileType::Regular;
        }
        bool isSymlink() const
        {
            return type == FileType::Symlink;
        }
        bool isSpecial() const
        {
            return type == FileType::Special;
        }
        bool isHidden() const
        {
            return !name.empty() && name.front() == '.';
        }

        friend bool operator==(DirectoryEntry const&, DirectoryEntry const&) = default;
    };
    BOOST_DESCRIBE_STRUCT(DirectoryEntry, (), (name, size, modified, permissions, mode, type, origin))

    /**
     * @brief Derives the file type from posix mode bits (S_IFMT part).
     */
    FileType fileTypeFromMode(std::uint32_t mode);

    /**
     * @brief Renders mode bits like "ls -l" does, e.g. "drwxr-xr-x".
     * A mode of 0 renders as "---------".
     */
    std::string permissionString(std::uint32_t mode);

    /**
     * @brief Sorts directories first, then everything else. Both groups ascending by case insensitive name.
     */
    void sortEntries(std::vector<DirectoryEntry>& entries);

    /**
     * @brief The comparator used by sortEntries.
     */
    bool entryOrderLess(DirectoryEntry const& lhs, DirectoryEntry const& rhs);
}
