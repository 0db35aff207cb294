#include <persistence/state/state.hpp>
#include <nlohmann/json.hpp>

namespace Persistence
{
    void to_json(nlohmann::json& j, State const& state)
    {
        j = nlohmann::json::object();

        j["logLevel"] = Log::levelToString(state.logLevel);
        TO_JSON_OPTIONAL(j, state, logDirectory);
        j["showHiddenFiles"] = state.showHiddenFiles;
        j["transferChunkSize"] = state.transferChunkSize;
        j["connectTimeoutSeconds"] = state.connectTimeoutSeconds;
        TO_JSON_OPTIONAL(j, state, lastLocalDirectory);
        j["sshOptions"] = state.sshOptions;
        j["profiles"] = state.profiles;
    }
    void from_json(nlohmann::json const& j, State& state)
    {
        state = {};

        if (j.contains("logLevel"))
            state.logLevel = Log::levelFromString(j.at("logLevel").get<std::string>());

        FROM_JSON_OPTIONAL(j, state, logDirectory);

        if (j.contains("showHiddenFiles"))
            j.at("showHiddenFiles").get_to(state.showHiddenFiles);

        if (j.contains("transferChunkSize"))
            j.at("transferChunkSize").get_to(state.transferChunkSize);

        if (j.contains("connectTimeoutSeconds"))
            j.at("connectTimeoutSeconds").get_to(state.connectTimeoutSeconds);

        FROM_JSON_OPTIONAL(j, state, lastLocalDirectory);

        if (j.contains("sshOptions"))
            j.at("sshOptions").get_to(state.sshOptions);

        if (j.contains("profiles"))
            j.at("profiles").get_to(state.profiles);
    }

    std::optional<ConnectionProfile> State::resolveProfile(std::string const& name) const
    {
        const auto iter = profiles.find(name);
        if (iter == profiles.end())
            return std::nullopt;

        ConnectionProfile resolved{iter->second};
        resolved.sshOptions.useDefaultsFrom(sshOptions);
        if (!resolved.sshOptions.connectTimeoutSeconds)
            resolved.sshOptions.connectTimeoutSeconds = connectTimeoutSeconds;
        return resolved;
    }
}
