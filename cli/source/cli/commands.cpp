#include <cli/commands.hpp>
#include <ssh/directory_lister.hpp>
#include <ssh/path_resolver.hpp>
#include <ssh/transfer_engine.hpp>
#include <utility/enum_string_convert.hpp>
#include <utility/format_bytes.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <cstdio>
#include <string>

namespace Cli
{
    namespace
    {
        using CommandResult = std::expected<std::optional<std::filesystem::path>, SecureShell::Error>;

        std::string formatModified(std::optional<SharedData::TimePoint> const& modified)
        {
            if (!modified)
                return std::string(16, ' ');
            return fmt::format("{:%Y-%m-%d %H:%M}", fmt::localtime(std::chrono::system_clock::to_time_t(*modified)));
        }

        SecureShell::TransferOptions transferOptions(CommandContext const& context)
        {
            return SecureShell::TransferOptions{
                .progress =
                    [](std::uint64_t transferred, std::uint64_t total) {
                        fmt::print(stderr, "\r{}", Utility::formatProgress(transferred, total));
                        std::fflush(stderr);
                    },
                .stopToken = context.stopToken,
                .chunkSize = context.state.transferChunkSize,
            };
        }

        CommandResult list(Arguments const& arguments, CommandContext const& context)
        {
            const auto entries =
                SecureShell::listRemoteDirectory(context.session, arguments.operands.empty() ? "" : arguments.operands[0]);
            if (!entries)
                return std::unexpected(entries.error());

            for (auto const& entry : *entries)
            {
                if (!context.state.showHiddenFiles && entry.isHidden())
                    continue;

                fmt::print(
                    "{:<10} {:>12} {} {}{}\n",
                    entry.permissions,
                    entry.isDirectory() ? std::string{} : Utility::formatBytes(entry.size),
                    formatModified(entry.modified),
                    entry.name,
                    entry.isDirectory() ? "/" : "");
            }
            return std::nullopt;
        }

        CommandResult stat(Arguments const& arguments, CommandContext const& context)
        {
            const auto information = context.session.stat(arguments.operands[0]);
            if (!information)
                return std::unexpected(information.error());

            fmt::print("Name:        {}\n", information->name);
            fmt::print("Type:        {}\n", Utility::enumToString(information->type));
            fmt::print("Size:        {} ({} bytes)\n", Utility::formatBytes(information->size), information->size);
            fmt::print("Permissions: {}\n", information->permissions);
            fmt::print("Modified:    {}\n", formatModified(information->modified));
            return std::nullopt;
        }

        CommandResult get(Arguments const& arguments, CommandContext const& context)
        {
            auto const& remotePath = arguments.operands[0];
            const auto localPath = arguments.operands.size() > 1 ? std::filesystem::path{arguments.operands[1]}
                                                                 : defaultDownloadPath(remotePath, context.state);

            const auto task = SecureShell::download(context.session, remotePath, localPath, transferOptions(context));
            fmt::print(stderr, "\n");
            if (!task)
                return std::unexpected(task.error());

            fmt::print("{} -> {} ({})\n", task->source, task->destination, Utility::formatBytes(task->totalBytes));
            return localPath;
        }

        CommandResult put(Arguments const& arguments, CommandContext const& context)
        {
            const std::filesystem::path localPath{arguments.operands[0]};
            const auto remotePath =
                arguments.operands.size() > 1 ? arguments.operands[1] : localPath.filename().string();

            const auto task = SecureShell::upload(context.session, localPath, remotePath, transferOptions(context));
            fmt::print(stderr, "\n");
            if (!task)
                return std::unexpected(task.error());

            fmt::print("{} -> {} ({})\n", task->source, task->destination, Utility::formatBytes(task->totalBytes));
            return localPath;
        }

        CommandResult fromVoid(std::expected<void, SecureShell::Error> const& result)
        {
            if (!result)
                return std::unexpected(result.error());
            return std::nullopt;
        }
    }

    std::filesystem::path defaultDownloadPath(std::string const& remotePath, Persistence::State const& state)
    {
        const auto directory = state.lastLocalDirectory.value_or(std::filesystem::current_path());
        return directory / SecureShell::remoteFileName(remotePath);
    }

    std::expected<std::optional<std::filesystem::path>, SecureShell::Error>
    runCommand(Arguments const& arguments, CommandContext const& context)
    {
        switch (arguments.command)
        {
            case CommandKind::List:
                return list(arguments, context);
            case CommandKind::Get:
                return get(arguments, context);
            case CommandKind::Put:
                return put(arguments, context);
            case CommandKind::MakeDirectory:
                return fromVoid(context.session.createDirectory(arguments.operands[0]));
            case CommandKind::RemoveFile:
                return fromVoid(context.session.removeFile(arguments.operands[0]));
            case CommandKind::RemoveDirectory:
                return fromVoid(context.session.removeDirectory(arguments.operands[0]));
            case CommandKind::Stat:
                return stat(arguments, context);
        }
        return std::unexpected(SecureShell::makeError(SecureShell::ErrorKind::ConfigurationError, "Unknown command"));
    }
}
