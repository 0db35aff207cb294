#include <ssh/transfer_engine.hpp>
#include <ssh/path_resolver.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

namespace SecureShell
{
    namespace
    {
        constexpr std::size_t defaultChunkSize = 32 * 1024;

        class ProgressReporter
        {
          public:
            ProgressReporter(TransferOptions const& options, NotificationChannel const& notifications)
                : callback_{options.progress}
                , notifications_{notifications}
            {}

            void operator()(TransferTask const& task) const
            {
                if (callback_)
                    callback_(task.transferredBytes, task.totalBytes);
                else
                    notifications_.notifyProgress(task.transferredBytes, task.totalBytes);
            }

          private:
            TransferOptions::ProgressCallback const& callback_;
            NotificationChannel const& notifications_;
        };

        std::size_t effectiveChunkSize(std::size_t requested, std::size_t serverLimit)
        {
            auto chunkSize = requested == 0 ? defaultChunkSize : requested;
            if (serverLimit != 0)
                chunkSize = std::min(chunkSize, serverLimit);
            return chunkSize;
        }

        std::expected<TransferTask, Error> fail(TransferTask& task, Error error)
        {
            task.state = error.kind == ErrorKind::Cancelled ? TransferState::Cancelled : TransferState::Failed;
            return std::unexpected(std::move(error));
        }

        std::expected<TransferTask, Error> cancelled(TransferTask& task)
        {
            return fail(
                task,
                makeError(
                    ErrorKind::Cancelled,
                    fmt::format(
                        "Transfer cancelled after {} of {} bytes", task.transferredBytes, task.totalBytes),
                    task.source));
        }
    }

    bool TransferTask::advance(std::uint64_t amount)
    {
        if (isTerminal())
            return false;

        if (amount == 0)
            return false;

        transferredBytes += amount;
        // The file grew since its size was taken.
        if (totalBytes != 0 && transferredBytes > totalBytes)
            totalBytes = transferredBytes;
        return true;
    }

    std::expected<TransferTask, Error> upload(
        Session& session,
        std::filesystem::path const& localPath,
        std::string const& remotePath,
        TransferOptions const& options)
    {
        if (!session.isConnected())
            return std::unexpected(makeError(ErrorKind::ConnectionError, "Not connected", remotePath));

        TransferTask task{
            .direction = TransferDirection::Upload,
            .source = localPath.string(),
            .destination = resolvePath(session.cursor(), remotePath, AddressSpace::Remote),
        };

        std::error_code ec;
        if (!std::filesystem::is_regular_file(localPath, ec))
            return fail(task, makeError(ErrorKind::NotFoundError, "Local file does not exist", task.source));

        task.totalBytes = std::filesystem::file_size(localPath, ec);
        if (ec)
        {
            return fail(
                task, makeError(ErrorKind::IOError, fmt::format("Cannot determine size: {}", ec.message()), task.source));
        }

        std::ifstream localFile{localPath, std::ios_base::binary};
        if (!localFile.is_open())
            return fail(task, makeError(ErrorKind::IOError, "Cannot open local file", task.source));

        const ProgressReporter report{options, session.notifications()};

        return session.withSftp([&](ISftpSession& sftp) -> std::expected<TransferTask, Error> {
            auto stream = sftp.openFile(
                task.destination,
                OpenType::Write | OpenType::Create | OpenType::Truncate,
                std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
                    std::filesystem::perms::group_read | std::filesystem::perms::others_read);
            if (!stream)
            {
                return fail(
                    task,
                    makeSftpError(stream.error(), ErrorKind::IOError, "Cannot open remote file", task.destination));
            }

            Log::info("Upload: '{}' -> '{}' ({} bytes).", task.source, task.destination, task.totalBytes);
            task.state = TransferState::Running;

            std::vector<char> buffer(effectiveChunkSize(options.chunkSize, (*stream)->writeLengthLimit()));
            while (true)
            {
                if (options.stopToken.stop_requested())
                    return cancelled(task);

                localFile.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto readAmount = static_cast<std::size_t>(localFile.gcount());
                if (localFile.bad())
                    return fail(task, makeError(ErrorKind::IOError, "Reading local file failed", task.source));
                if (readAmount == 0)
                    break;

                if (auto written = (*stream)->write({buffer.data(), readAmount}); !written)
                {
                    return fail(
                        task,
                        makeSftpError(written.error(), ErrorKind::IOError, "Writing remote file failed", task.destination));
                }

                task.advance(readAmount);
                report(task);
            }

            if (auto closed = (*stream)->close(); !closed)
            {
                return fail(
                    task,
                    makeSftpError(closed.error(), ErrorKind::IOError, "Closing remote file failed", task.destination));
            }

            task.state = TransferState::Completed;
            Log::info("Upload: '{}' completed.", task.destination);
            return task;
        });
    }

    std::expected<TransferTask, Error> download(
        Session& session,
        std::string const& remotePath,
        std::filesystem::path const& localPath,
        TransferOptions const& options)
    {
        if (!session.isConnected())
            return std::unexpected(makeError(ErrorKind::ConnectionError, "Not connected", remotePath));

        TransferTask task{
            .direction = TransferDirection::Download,
            .source = resolvePath(session.cursor(), remotePath, AddressSpace::Remote),
            .destination = localPath.string(),
        };

        const auto parent = localPath.parent_path();
        if (!parent.empty())
        {
            std::error_code ec;
            if (!std::filesystem::exists(parent, ec))
            {
                std::filesystem::create_directories(parent, ec);
                if (ec)
                {
                    return fail(
                        task,
                        makeError(
                            ErrorKind::DirectoryCreationError,
                            fmt::format("Cannot create local directory: {}", ec.message()),
                            parent.string()));
                }
                Log::info("Download: Created local directory '{}'.", parent.string());
            }
            else if (!std::filesystem::is_directory(parent, ec))
            {
                return fail(
                    task,
                    makeError(ErrorKind::DirectoryCreationError, "Local parent is not a directory", parent.string()));
            }
        }

        const ProgressReporter report{options, session.notifications()};

        return session.withSftp([&](ISftpSession& sftp) -> std::expected<TransferTask, Error> {
            const auto information = sftp.stat(task.source);
            if (!information)
            {
                return fail(
                    task, makeSftpError(information.error(), ErrorKind::IOError, "Cannot stat remote file", task.source));
            }
            if (information->isDirectory())
                return fail(task, makeError(ErrorKind::IOError, "Remote path is a directory", task.source));
            task.totalBytes = information->size;

            auto stream = sftp.openFile(task.source, OpenType::Read, std::filesystem::perms::none);
            if (!stream)
            {
                return fail(
                    task, makeSftpError(stream.error(), ErrorKind::IOError, "Cannot open remote file", task.source));
            }

            std::ofstream localFile{localPath, std::ios_base::binary | std::ios_base::trunc};
            if (!localFile.is_open())
                return fail(task, makeError(ErrorKind::IOError, "Cannot open local file", task.destination));

            Log::info("Download: '{}' -> '{}' ({} bytes).", task.source, task.destination, task.totalBytes);
            task.state = TransferState::Running;

            std::vector<char> buffer(effectiveChunkSize(options.chunkSize, (*stream)->readLengthLimit()));
            while (true)
            {
                if (options.stopToken.stop_requested())
                    return cancelled(task);

                const auto readResult = (*stream)->readSome(buffer.data(), buffer.size());
                if (!readResult)
                {
                    return fail(
                        task,
                        makeSftpError(readResult.error(), ErrorKind::IOError, "Reading remote file failed", task.source));
                }
                if (readResult.value() == 0)
                    break;

                localFile.write(buffer.data(), static_cast<std::streamsize>(readResult.value()));
                if (!localFile.good())
                    return fail(task, makeError(ErrorKind::IOError, "Writing local file failed", task.destination));

                task.advance(readResult.value());
                report(task);
            }

            localFile.flush();
            localFile.close();
            if (localFile.fail())
                return fail(task, makeError(ErrorKind::IOError, "Writing local file failed", task.destination));

            if (auto closed = (*stream)->close(); !closed)
            {
                return fail(
                    task, makeSftpError(closed.error(), ErrorKind::IOError, "Closing remote file failed", task.source));
            }

            task.state = TransferState::Completed;
            Log::info("Download: '{}' completed.", task.destination);
            return task;
        });
    }
}
