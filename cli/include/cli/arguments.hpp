#pragma once

#include <ssh/error.hpp>
#include <utility/describe.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Cli
{
    BOOST_DEFINE_ENUM_CLASS(CommandKind, List, Get, Put, MakeDirectory, RemoveFile, RemoveDirectory, Stat)

    /**
     * @brief A server given as "[user@]host[:port]" on the command line.
     */
    struct Target
    {
        std::optional<std::string> user{std::nullopt};
        std::string host{};
        std::optional<int> port{std::nullopt};
    };

    struct Arguments
    {
        std::optional<std::filesystem::path> configFile{std::nullopt};
        std::optional<std::filesystem::path> key{std::nullopt};
        /// Profile name or "[user@]host[:port]".
        std::string target{};
        CommandKind command{CommandKind::List};
        std::vector<std::string> operands{};
        bool help{false};
    };

    /**
     * @brief Parses "[user@]host[:port]". IPv6 hosts have to be bracketed when a port is given: "[::1]:22".
     */
    std::expected<Target, SecureShell::Error> parseTarget(std::string_view text);

    /**
     * @brief Parses the arguments following the program name.
     *
     * @return ConfigurationError for unknown options, unknown commands or a wrong number of operands.
     */
    std::expected<Arguments, SecureShell::Error> parseArguments(std::vector<std::string> const& args);

    std::string usage();
}
