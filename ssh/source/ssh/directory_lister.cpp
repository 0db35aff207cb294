#include <ssh/directory_lister.hpp>
#include <ssh/path_resolver.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <system_error>

namespace SecureShell
{
    namespace
    {
        std::uint32_t typeBits(std::filesystem::file_type type)
        {
            switch (type)
            {
                case std::filesystem::file_type::regular:
                    return 0100000;
                case std::filesystem::file_type::directory:
                    return 0040000;
                case std::filesystem::file_type::symlink:
                    return 0120000;
                case std::filesystem::file_type::block:
                    return 0060000;
                case std::filesystem::file_type::character:
                    return 0020000;
                case std::filesystem::file_type::fifo:
                    return 0010000;
                case std::filesystem::file_type::socket:
                    return 0140000;
                default:
                    return 0;
            }
        }

        ErrorKind kindFromErrorCode(std::error_code const& ec)
        {
            if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
                return ErrorKind::PermissionError;
            return ErrorKind::PathError;
        }

        SharedData::DirectoryEntry localEntry(std::filesystem::directory_entry const& directoryEntry)
        {
            SharedData::DirectoryEntry entry{
                .name = directoryEntry.path().filename().string(),
                .origin = SharedData::EntryOrigin::Local,
            };

            std::error_code ec;
            const auto status = directoryEntry.symlink_status(ec);
            if (ec)
            {
                Log::warn("Cannot stat '{}': {}", directoryEntry.path().string(), ec.message());
                return entry;
            }

            if (status.permissions() != std::filesystem::perms::unknown)
                entry.mode = typeBits(status.type()) |
                    static_cast<std::uint32_t>(status.permissions() & std::filesystem::perms::mask);
            entry.type = SharedData::fileTypeFromMode(typeBits(status.type()));
            entry.permissions = SharedData::permissionString(entry.mode);

            if (entry.isRegularFile())
            {
                const auto size = directoryEntry.file_size(ec);
                entry.size = ec ? 0 : size;
            }

            const auto lastWrite = directoryEntry.last_write_time(ec);
            if (!ec)
            {
                entry.modified = std::chrono::time_point_cast<std::chrono::seconds>(
                    std::chrono::file_clock::to_sys(lastWrite));
            }
            return entry;
        }
    }

    std::expected<std::vector<SharedData::DirectoryEntry>, Error>
    listRemoteDirectory(Session& session, std::string const& path)
    {
        const auto target = resolvePath(session.cursor(), path, AddressSpace::Remote);

        return session.withSftp(
            [&target](ISftpSession& sftp) -> std::expected<std::vector<SharedData::DirectoryEntry>, Error> {
                auto listing = sftp.listDirectory(target);
                if (!listing)
                {
                    auto error = makeSftpError(listing.error(), ErrorKind::PathError, "Cannot list directory", target);
                    if (error.kind == ErrorKind::NotFoundError)
                        error.kind = ErrorKind::PathError;
                    return std::unexpected(error);
                }

                auto entries = std::move(listing).value();
                std::erase_if(entries, [](SharedData::DirectoryEntry const& entry) {
                    return entry.name == "." || entry.name == ".." || entry.name.empty();
                });
                SharedData::sortEntries(entries);

                Log::debug("Listed {} entries in remote directory '{}'.", entries.size(), target);
                return entries;
            });
    }

    std::expected<std::vector<SharedData::DirectoryEntry>, Error>
    listLocalDirectory(std::filesystem::path const& path, LocalListingOptions const& options)
    {
        std::error_code ec;
        const auto status = std::filesystem::status(path, ec);
        if (ec || !std::filesystem::exists(status))
            return std::unexpected(
                makeError(ec ? kindFromErrorCode(ec) : ErrorKind::PathError, "Path does not exist", path.string()));
        if (!std::filesystem::is_directory(status))
            return std::unexpected(makeError(ErrorKind::PathError, "Not a directory", path.string()));

        std::filesystem::directory_iterator iterator{path, ec};
        if (ec)
        {
            return std::unexpected(makeError(
                kindFromErrorCode(ec), fmt::format("Cannot list directory: {}", ec.message()), path.string()));
        }

        std::vector<SharedData::DirectoryEntry> entries{};
        for (; iterator != std::filesystem::directory_iterator{}; iterator.increment(ec))
        {
            if (ec)
                break;

            auto entry = localEntry(*iterator);
            if (!options.showHidden && entry.isHidden())
                continue;
            entries.push_back(std::move(entry));
        }
        if (ec)
        {
            return std::unexpected(makeError(
                kindFromErrorCode(ec), fmt::format("Listing directory failed: {}", ec.message()), path.string()));
        }

        SharedData::sortEntries(entries);
        Log::debug("Listed {} entries in local directory '{}'.", entries.size(), path.string());
        return entries;
    }

    std::expected<std::filesystem::path, Error>
    changeLocalDirectory(std::filesystem::path const& cursor, std::string const& token)
    {
        const std::filesystem::path target = resolvePath(cursor.string(), token, AddressSpace::Local);

        std::error_code ec;
        if (!std::filesystem::is_directory(target, ec))
            return std::unexpected(makeError(ErrorKind::PathError, "Not a directory", target.string()));

        auto canonical = std::filesystem::canonical(target, ec);
        if (ec)
        {
            return std::unexpected(makeError(
                kindFromErrorCode(ec), fmt::format("Cannot resolve directory: {}", ec.message()), target.string()));
        }
        return canonical;
    }
}
