#include <ssh/file_information.hpp>

#include <chrono>

namespace SecureShell
{
    namespace
    {
        constexpr std::uint32_t typeMask = 0170000;

        SharedData::FileType fileTypeFromSftpType(std::uint8_t type)
        {
            switch (type)
            {
                case SSH_FILEXFER_TYPE_REGULAR:
                    return SharedData::FileType::Regular;
                case SSH_FILEXFER_TYPE_DIRECTORY:
                    return SharedData::FileType::Directory;
                case SSH_FILEXFER_TYPE_SYMLINK:
                    return SharedData::FileType::Symlink;
                case SSH_FILEXFER_TYPE_SPECIAL:
                    return SharedData::FileType::Special;
                default:
                    return SharedData::FileType::Unknown;
            }
        }

        std::uint32_t typeBitsFromFileType(SharedData::FileType type)
        {
            switch (type)
            {
                case SharedData::FileType::Regular:
                    return 0100000;
                case SharedData::FileType::Directory:
                    return 0040000;
                case SharedData::FileType::Symlink:
                    return 0120000;
                default:
                    return 0;
            }
        }
    }

    FileInformation fromSftpAttributes(sftp_attributes attributes)
    {
        FileInformation entry{
            .name = attributes->name ? std::string{attributes->name} : std::string{},
            .mode = attributes->permissions,
            .origin = SharedData::EntryOrigin::Remote,
        };

        // Some servers only deliver the permission bits, others only the type.
        if ((entry.mode & typeMask) != 0)
        {
            entry.type = SharedData::fileTypeFromMode(entry.mode);
            entry.permissions = SharedData::permissionString(entry.mode);
        }
        else
        {
            entry.type = fileTypeFromSftpType(attributes->type);
            entry.permissions = SharedData::permissionString(entry.mode | typeBitsFromFileType(entry.type));
        }
        entry.size = entry.isDirectory() ? 0 : attributes->size;

        if (attributes->mtime != 0)
            entry.modified = SharedData::TimePoint{std::chrono::seconds{attributes->mtime}};

        return entry;
    }
}
