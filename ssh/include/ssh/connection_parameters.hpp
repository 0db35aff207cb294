#pragma once

#include <ssh/error.hpp>
#include <utility/describe.hpp>

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace SecureShell
{
    BOOST_DEFINE_ENUM_CLASS(HostKeyPolicy, AcceptAll, AcceptNew, Strict)

    struct ConnectionParameters
    {
        std::string host{};
        int port{22};
        std::string username{};
        std::chrono::seconds timeout{30};
        /// Unknown keys are accepted and recorded by default, changed keys are always rejected except with AcceptAll.
        HostKeyPolicy hostKeyPolicy{HostKeyPolicy::AcceptNew};
        std::optional<std::filesystem::path> knownHostsFile{std::nullopt};
        /// libssh log verbosity, e.g. "warn" or "trace".
        std::optional<std::string> logVerbosity{std::nullopt};
    };

    /**
     * @brief Secrets used for one connection attempt. Never persisted.
     */
    struct Credential
    {
        std::optional<std::string> password{std::nullopt};
        std::optional<std::filesystem::path> privateKeyFile{std::nullopt};
        /// In memory PEM or OpenSSH formatted private key. Takes precedence over privateKeyFile.
        std::optional<std::string> privateKeyData{std::nullopt};
        std::optional<std::string> passphrase{std::nullopt};

        bool hasKey() const
        {
            return privateKeyFile.has_value() || privateKeyData.has_value();
        }
    };

    /**
     * @brief Checks parameters and credential before any network activity happens.
     *
     * @return A ConfigurationError for an empty host or username, a port outside 1..65535 or a credential without
     * key and password.
     */
    std::expected<void, Error> validate(ConnectionParameters const& parameters, Credential const& credential);
}
