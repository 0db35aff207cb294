#pragma once

#include <ssh/error.hpp>
#include <ssh/session.hpp>
#include <utility/describe.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>

namespace SecureShell
{
    BOOST_DEFINE_ENUM_CLASS(TransferDirection, Upload, Download)
    BOOST_DEFINE_ENUM_CLASS(TransferState, Pending, Running, Completed, Cancelled, Failed)

    /**
     * @brief Bookkeeping of one single file transfer.
     */
    struct TransferTask
    {
        TransferDirection direction{TransferDirection::Upload};
        std::string source{};
        std::string destination{};
        std::uint64_t totalBytes{0};
        std::uint64_t transferredBytes{0};
        TransferState state{TransferState::Pending};

        bool isTerminal() const
        {
            return state == TransferState::Completed || state == TransferState::Cancelled ||
                state == TransferState::Failed;
        }

        /**
         * @brief Adds amount to the transferred bytes.
         * A known total is raised when the transferred bytes exceed it, an unknown total (0) stays 0.
         * Does nothing once the task has reached a terminal state.
         *
         * @return true if the transferred bytes changed.
         */
        bool advance(std::uint64_t amount);
    };

    struct TransferOptions
    {
        using ProgressCallback = std::function<void(std::uint64_t transferred, std::uint64_t total)>;

        /// Called after every chunk. Falls back to the progress observer of the session's notification channel.
        ProgressCallback progress{};
        /// Checked between chunks.
        std::stop_token stopToken{};
        /// Upper bound of bytes per request, further bounded by the server limits.
        std::size_t chunkSize{32 * 1024};
    };

    /**
     * @brief Uploads a local regular file.
     *
     * The local file is checked before anything is sent to the server. A cancelled or failed upload leaves the
     * partial remote file in place.
     *
     * @return The completed task, or NotFoundError, PermissionError, TransportError, IOError, Cancelled or
     * ConnectionError. Failing to read the local file is an IOError.
     */
    std::expected<TransferTask, Error> upload(
        Session& session,
        std::filesystem::path const& localPath,
        std::string const& remotePath,
        TransferOptions const& options = {});

    /**
     * @brief Downloads a remote file, creating missing local parent directories.
     *
     * A cancelled or failed download leaves the partial local file in place.
     *
     * @return The completed task, or DirectoryCreationError, NotFoundError, PermissionError, TransportError,
     * IOError, Cancelled or ConnectionError.
     */
    std::expected<TransferTask, Error> download(
        Session& session,
        std::string const& remotePath,
        std::filesystem::path const& localPath,
        TransferOptions const& options = {});
}
