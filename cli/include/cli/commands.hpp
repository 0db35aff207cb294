#pragma once

#include <cli/arguments.hpp>
#include <persistence/state/state.hpp>
#include <ssh/error.hpp>
#include <ssh/session.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>

namespace Cli
{
    struct CommandContext
    {
        SecureShell::Session& session;
        Persistence::State const& state;
        std::stop_token stopToken{};
    };

    /**
     * @brief Where a download lands when no local path is given.
     */
    std::filesystem::path defaultDownloadPath(std::string const& remotePath, Persistence::State const& state);

    /**
     * @brief Executes one command on a connected session and prints its result to stdout.
     *
     * @return The local file written or read by get and put, nothing for the other commands.
     */
    std::expected<std::optional<std::filesystem::path>, SecureShell::Error>
    runCommand(Arguments const& arguments, CommandContext const& context);
}
