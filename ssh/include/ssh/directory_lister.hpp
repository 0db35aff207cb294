#pragma once

#include <ssh/error.hpp>
#include <ssh/session.hpp>
#include <shared_data/directory_entry.hpp>

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace SecureShell
{
    struct LocalListingOptions
    {
        /// Include entries whose name starts with a '.'.
        bool showHidden{true};
    };

    /**
     * @brief Lists a remote directory with a single listing request.
     *
     * "." and ".." are omitted, directories come first, each group sorted case insensitively.
     *
     * @param session A connected session.
     * @param path Absolute or relative to the session cursor. Empty lists the cursor.
     * @return PathError if the path is missing or not a directory, PermissionError if listing is denied.
     */
    std::expected<std::vector<SharedData::DirectoryEntry>, Error>
    listRemoteDirectory(Session& session, std::string const& path = {});

    /**
     * @brief Lists a local directory in the same order and representation as listRemoteDirectory.
     */
    std::expected<std::vector<SharedData::DirectoryEntry>, Error>
    listLocalDirectory(std::filesystem::path const& path, LocalListingOptions const& options = {});

    /**
     * @brief Resolves token against a local cursor and verifies the result is a directory.
     *
     * @return std::expected<std::filesystem::path, Error> The canonical new cursor or a PathError.
     */
    std::expected<std::filesystem::path, Error>
    changeLocalDirectory(std::filesystem::path const& cursor, std::string const& token);
}
