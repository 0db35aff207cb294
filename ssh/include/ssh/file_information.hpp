#pragma once

#include <shared_data/directory_entry.hpp>

#include <libssh/sftp.h>

namespace SecureShell
{
    using FileInformation = SharedData::DirectoryEntry;

    /**
     * @brief Converts libssh attributes into a remote DirectoryEntry.
     * The modification time is left empty when the server reports none.
     */
    FileInformation fromSftpAttributes(sftp_attributes attributes);
}
