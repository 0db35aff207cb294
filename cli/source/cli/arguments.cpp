#include <cli/arguments.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <utility>

namespace Cli
{
    namespace
    {
        struct CommandSyntax
        {
            std::string_view name;
            CommandKind kind;
            std::size_t minOperands;
            std::size_t maxOperands;
        };

        constexpr CommandSyntax commandSyntax[] = {
            {"ls", CommandKind::List, 0, 1},
            {"get", CommandKind::Get, 1, 2},
            {"put", CommandKind::Put, 1, 2},
            {"mkdir", CommandKind::MakeDirectory, 1, 1},
            {"rm", CommandKind::RemoveFile, 1, 1},
            {"rmdir", CommandKind::RemoveDirectory, 1, 1},
            {"stat", CommandKind::Stat, 1, 1},
        };

        std::unexpected<SecureShell::Error> usageError(std::string message)
        {
            return std::unexpected(SecureShell::Error{
                .kind = SecureShell::ErrorKind::ConfigurationError,
                .message = std::move(message),
            });
        }

        std::optional<int> parsePort(std::string_view text)
        {
            if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) {
                    return std::isdigit(c);
                }))
            {
                return std::nullopt;
            }

            int port = 0;
            const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
            if (ec != std::errc{} || end != text.data() + text.size())
                return std::nullopt;
            return port;
        }
    }

    std::expected<Target, SecureShell::Error> parseTarget(std::string_view text)
    {
        Target target{};

        if (const auto at = text.rfind('@'); at != std::string_view::npos)
        {
            if (at == 0)
                return usageError(fmt::format("Empty user name in '{}'", text));
            target.user = std::string{text.substr(0, at)};
            text.remove_prefix(at + 1);
        }

        std::string_view portText{};
        if (text.starts_with('['))
        {
            const auto close = text.find(']');
            if (close == std::string_view::npos)
                return usageError(fmt::format("Unterminated '[' in '{}'", text));
            target.host = std::string{text.substr(1, close - 1)};
            const auto rest = text.substr(close + 1);
            if (!rest.empty())
            {
                if (!rest.starts_with(':'))
                    return usageError(fmt::format("Unexpected '{}' after host", rest));
                portText = rest.substr(1);
                if (portText.empty())
                    return usageError("Empty port");
            }
        }
        else if (const auto colon = text.find(':'); colon != std::string_view::npos && text.rfind(':') == colon)
        {
            target.host = std::string{text.substr(0, colon)};
            portText = text.substr(colon + 1);
            if (portText.empty())
                return usageError("Empty port");
        }
        else
        {
            target.host = std::string{text};
        }

        if (target.host.empty())
            return usageError("Empty host name");

        if (!portText.empty())
        {
            target.port = parsePort(portText);
            if (!target.port)
                return usageError(fmt::format("Invalid port '{}'", portText));
        }
        return target;
    }

    std::expected<Arguments, SecureShell::Error> parseArguments(std::vector<std::string> const& args)
    {
        Arguments arguments{};
        std::vector<std::string> positionals{};

        for (std::size_t i = 0; i < args.size(); ++i)
        {
            auto const& arg = args[i];
            if (arg == "-h" || arg == "--help")
            {
                arguments.help = true;
                return arguments;
            }
            if (arg == "--config" || arg == "--key")
            {
                if (i + 1 >= args.size())
                    return usageError(fmt::format("Option '{}' needs a value", arg));
                if (arg == "--config")
                    arguments.configFile = args[++i];
                else
                    arguments.key = args[++i];
                continue;
            }
            if (arg.starts_with("--") && positionals.empty())
                return usageError(fmt::format("Unknown option '{}'", arg));
            positionals.push_back(arg);
        }

        if (positionals.size() < 2)
            return usageError("Expected a target and a command");

        arguments.target = positionals[0];
        const auto syntax = std::find_if(std::begin(commandSyntax), std::end(commandSyntax), [&](auto const& candidate) {
            return candidate.name == positionals[1];
        });
        if (syntax == std::end(commandSyntax))
            return usageError(fmt::format("Unknown command '{}'", positionals[1]));

        arguments.command = syntax->kind;
        arguments.operands.assign(positionals.begin() + 2, positionals.end());
        if (arguments.operands.size() < syntax->minOperands || arguments.operands.size() > syntax->maxOperands)
            return usageError(fmt::format("Wrong number of arguments for '{}'", syntax->name));

        return arguments;
    }

    std::string usage()
    {
        return "Usage: sftp-commander [--config FILE] [--key KEY] <profile|[user@]host[:port]> <command> [args]\n"
               "\n"
               "Commands:\n"
               "  ls [PATH]              List a remote directory.\n"
               "  get REMOTE [LOCAL]     Download a file.\n"
               "  put LOCAL [REMOTE]     Upload a file.\n"
               "  mkdir PATH             Create a remote directory.\n"
               "  rm PATH                Remove a remote file.\n"
               "  rmdir PATH             Remove an empty remote directory.\n"
               "  stat PATH              Show information about a remote path.\n"
               "\n"
               "Environment:\n"
               "  SFTP_COMMANDER_PASSWORD    Password for password authentication.\n"
               "  SFTP_COMMANDER_PASSPHRASE  Passphrase of the private key.\n";
    }
}
