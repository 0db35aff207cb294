#include <shared_data/directory_entry.hpp>
#include <utility/algorithm/case_convert.hpp>

#include <algorithm>
#include <array>

namespace SharedData
{
    namespace
    {
        constexpr std::uint32_t typeMask = 0170000;
        constexpr std::uint32_t socketBits = 0140000;
        constexpr std::uint32_t symlinkBits = 0120000;
        constexpr std::uint32_t regularBits = 0100000;
        constexpr std::uint32_t blockDeviceBits = 0060000;
        constexpr std::uint32_t directoryBits = 0040000;
        constexpr std::uint32_t charDeviceBits = 0020000;
        constexpr std::uint32_t fifoBits = 0010000;

        char typeCharacter(std::uint32_t mode)
        {
            switch (mode & typeMask)
            {
                case directoryBits:
                    return 'd';
                case symlinkBits:
                    return 'l';
                case socketBits:
                    return 's';
                case blockDeviceBits:
                    return 'b';
                case charDeviceBits:
                    return 'c';
                case fifoBits:
                    return 'p';
                default:
                    return '-';
            }
        }
    }

    FileType fileTypeFromMode(std::uint32_t mode)
    {
        switch (mode & typeMask)
        {
            case regularBits:
                return FileType::Regular;
            case directoryBits:
                return FileType::Directory;
            case symlinkBits:
                return FileType::Symlink;
            case socketBits:
            case blockDeviceBits:
            case charDeviceBits:
            case fifoBits:
                return FileType::Special;
            default:
                return FileType::Unknown;
        }
    }

    std::string permissionString(std::uint32_t mode)
    {
        if (mode == 0)
            return "---------";

        constexpr std::array<char, 3> rwx{'r', 'w', 'x'};

        std::string result{};
        result.reserve(10);
        result.push_back(typeCharacter(mode));
        for (int i = 8; i >= 0; --i)
        {
            const bool set = (mode & (1u << i)) != 0;
            result.push_back(set ? rwx[static_cast<std::size_t>(2 - i % 3)] : '-');
        }

        // setuid, setgid and sticky replace the execute characters.
        if (mode & 04000)
            result[3] = result[3] == 'x' ? 's' : 'S';
        if (mode & 02000)
            result[6] = result[6] == 'x' ? 's' : 'S';
        if (mode & 01000)
            result[9] = result[9] == 'x' ? 't' : 'T';

        return result;
    }

    bool entryOrderLess(DirectoryEntry const& lhs, DirectoryEntry const& rhs)
    {
        if (lhs.isDirectory() != rhs.isDirectory())
            return lhs.isDirectory();
        return Utility::Algorithm::lessCaseInsensitive(lhs.name, rhs.name);
    }

    void sortEntries(std::vector<DirectoryEntry>& entries)
    {
        std::sort(entries.begin(), entries.end(), entryOrderLess);
    }
}
