#pragma once

#include <utility/describe.hpp>

#include <string>
#include <string_view>

namespace SecureShell
{
    BOOST_DEFINE_ENUM_CLASS(AddressSpace, Local, Remote)

    /**
     * @brief Computes the directory a navigation token leads to, starting from cursor.
     *
     * ".." strips the last segment (the root stays the root), an absolute token replaces the cursor, "." or an
     * empty token keeps it and anything else is appended as a new segment. The result is normalized: duplicate
     * and trailing separators are removed, "." and ".." segments are resolved lexically.
     * No filesystem or network access happens here.
     *
     * @param cursor The current directory. Must be absolute.
     * @param token What the user entered or clicked.
     * @param addressSpace Remote paths always use '/', local paths follow the platform.
     * @return std::string The new absolute path.
     */
    std::string resolvePath(std::string_view cursor, std::string_view token, AddressSpace addressSpace);

    /**
     * @brief Normalizes an absolute remote path. Relative paths are taken as relative to the root.
     */
    std::string normalizeRemotePath(std::string_view path);

    /**
     * @brief Returns the last segment of a remote path, empty for the root.
     */
    std::string remoteFileName(std::string_view path);
}
