#pragma once

#include <persistence/state_core.hpp>
#include <ssh/connection_parameters.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace Persistence
{
    /**
     * @brief Connection tuning that can be set globally and overridden per profile.
     */
    struct SshOptions
    {
        std::optional<std::filesystem::path> knownHostsFile{std::nullopt};
        std::optional<SecureShell::HostKeyPolicy> hostKeyPolicy{std::nullopt};
        std::optional<std::string> logVerbosity{std::nullopt};
        std::optional<int> connectTimeoutSeconds{std::nullopt};

        void useDefaultsFrom(SshOptions const& other);

        friend bool operator==(SshOptions const&, SshOptions const&) = default;
    };
    void to_json(nlohmann::json& j, SshOptions const& options);
    void from_json(nlohmann::json const& j, SshOptions& options);
}
