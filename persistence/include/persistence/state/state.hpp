#pragma once

#include <log/level.hpp>
#include <persistence/state_core.hpp>
#include <persistence/state/connection_profile.hpp>
#include <persistence/state/ssh_options.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace Persistence
{
    struct State
    {
        Log::Level logLevel{Log::Level::Info};
        std::optional<std::filesystem::path> logDirectory{std::nullopt};
        bool showHiddenFiles{false};
        std::size_t transferChunkSize{32 * 1024};
        int connectTimeoutSeconds{30};
        std::optional<std::filesystem::path> lastLocalDirectory{std::nullopt};
        /// Defaults for every profile that does not set an option itself.
        SshOptions sshOptions{};
        std::map<std::string, ConnectionProfile> profiles{};

        /**
         * @brief Returns the named profile with the global ssh options filled in.
         */
        std::optional<ConnectionProfile> resolveProfile(std::string const& name) const;
    };

    void to_json(nlohmann::json& j, State const& state);
    void from_json(nlohmann::json const& j, State& state);
}
