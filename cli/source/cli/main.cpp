#include <cli/arguments.hpp>
#include <cli/commands.hpp>
#include <cli/interrupt.hpp>
#include <log/log.hpp>
#include <persistence/connection_parameters.hpp>
#include <persistence/state_holder.hpp>
#include <ssh/session.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace
{
    constexpr int exitUsage = 2;
    constexpr int exitInterrupted = 130;

    std::optional<std::string> environment(char const* name)
    {
        if (char const* value = std::getenv(name); value != nullptr)
            return std::string{value};
        return std::nullopt;
    }

    std::expected<Persistence::ConnectionProfile, SecureShell::Error>
    resolveTarget(std::string const& target, Persistence::State const& state)
    {
        if (auto profile = state.resolveProfile(target))
        {
            Log::info("Using profile '{}'.", target);
            return *profile;
        }

        const auto parsed = Cli::parseTarget(target);
        if (!parsed)
            return std::unexpected(parsed.error());

        return Persistence::ConnectionProfile{
            .host = parsed->host,
            .port = parsed->port,
            .user = parsed->user ? parsed->user : environment("USER"),
        };
    }
}

int main(int argc, char** argv)
{
    const auto arguments = Cli::parseArguments(std::vector<std::string>(argv + 1, argv + argc));
    if (!arguments)
    {
        fmt::print(stderr, "{}\n\n{}", arguments.error().message, Cli::usage());
        return exitUsage;
    }
    if (arguments->help)
    {
        fmt::print("{}", Cli::usage());
        return EXIT_SUCCESS;
    }

    Log::setLevel(Log::Level::Warning);
    Persistence::StateHolder stateHolder{arguments->configFile.value_or(Persistence::defaultConfigurationPath())};
    if (!stateHolder.load())
        fmt::print(stderr, "Could not write configuration file '{}'.\n", stateHolder.path().string());

    auto const& state = stateHolder.stateCache();
    Log::setup(Log::LogOptions{.level = state.logLevel, .directory = state.logDirectory});

    const auto profile = resolveTarget(arguments->target, state);
    if (!profile)
    {
        fmt::print(stderr, "{}\n", profile.error().message);
        return exitUsage;
    }

    SecureShell::Credential credential{
        .password = environment("SFTP_COMMANDER_PASSWORD"),
        .passphrase = environment("SFTP_COMMANDER_PASSPHRASE"),
    };
    if (arguments->key)
        credential.privateKeyFile = *arguments->key;
    else if (profile->sshKey)
        credential.privateKeyFile = *profile->sshKey;

    auto notifications = std::make_shared<SecureShell::NotificationChannel>();
    notifications->setStatusObserver([](std::string const& status) {
        fmt::print(stderr, "{}\n", status);
    });

    auto session = SecureShell::makeSession(
        Persistence::toConnectionParameters(*profile, state), credential, std::move(notifications));
    if (!session)
    {
        fmt::print(stderr, "{}\n", session.error().toString());
        Log::flush();
        return EXIT_FAILURE;
    }

    if (profile->defaultDirectory)
    {
        if (auto moved = (*session)->changeDirectory(*profile->defaultDirectory); !moved)
            Log::warn("Cannot enter default directory: {}", moved.error().toString());
    }

    const auto result = [&] {
        const Cli::InterruptForwarder interruption{};
        return Cli::runCommand(
            *arguments,
            Cli::CommandContext{
                .session = **session,
                .state = state,
                .stopToken = interruption.token(),
            });
    }();
    (*session)->disconnect();

    if (!result)
    {
        fmt::print(stderr, "{}\n", result.error().toString());
        Log::flush();
        return result.error().kind == SecureShell::ErrorKind::Cancelled ? exitInterrupted : EXIT_FAILURE;
    }

    if (arguments->command == Cli::CommandKind::Get && *result)
    {
        std::error_code ec;
        const auto directory = std::filesystem::absolute(**result, ec).parent_path();
        if (!ec && stateHolder.stateCache().lastLocalDirectory != directory)
        {
            stateHolder.stateCache().lastLocalDirectory = directory;
            try
            {
                stateHolder.save();
            }
            catch (std::exception const& e)
            {
                Log::warn("Could not remember the download directory: {}", e.what());
            }
        }
    }

    Log::flush();
    return EXIT_SUCCESS;
}
