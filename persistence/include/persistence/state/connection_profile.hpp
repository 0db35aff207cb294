#pragma once

#include <persistence/state_core.hpp>
#include <persistence/state/ssh_options.hpp>

#include <optional>
#include <string>

namespace Persistence
{
    /**
     * @brief A named, reusable set of connection settings. Passwords are never stored.
     */
    struct ConnectionProfile
    {
        std::string host{};
        std::optional<int> port{std::nullopt};
        std::optional<std::string> user{std::nullopt};
        std::optional<std::string> sshKey{std::nullopt};
        std::optional<std::string> description{std::nullopt};
        std::optional<std::string> defaultDirectory{std::nullopt};
        SshOptions sshOptions{};

        void useDefaultsFrom(ConnectionProfile const& other);

        friend bool operator==(ConnectionProfile const&, ConnectionProfile const&) = default;
    };
    void to_json(nlohmann::json& j, ConnectionProfile const& profile);
    void from_json(nlohmann::json const& j, ConnectionProfile& profile);
}
