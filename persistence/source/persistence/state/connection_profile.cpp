#include <persistence/state/connection_profile.hpp>

namespace Persistence
{
    void ConnectionProfile::useDefaultsFrom(ConnectionProfile const& other)
    {
        if (host.empty())
            host = other.host;
        if (!port.has_value())
            port = other.port;
        if (!user.has_value())
            user = other.user;
        if (!sshKey.has_value())
            sshKey = other.sshKey;
        if (!description.has_value())
            description = other.description;
        if (!defaultDirectory.has_value())
            defaultDirectory = other.defaultDirectory;

        sshOptions.useDefaultsFrom(other.sshOptions);
    }

    void to_json(nlohmann::json& j, ConnectionProfile const& profile)
    {
        j = {{"host", profile.host}};

        TO_JSON_OPTIONAL(j, profile, port);
        TO_JSON_OPTIONAL(j, profile, user);
        TO_JSON_OPTIONAL(j, profile, sshKey);
        TO_JSON_OPTIONAL(j, profile, description);
        TO_JSON_OPTIONAL(j, profile, defaultDirectory);
        j["sshOptions"] = profile.sshOptions;
    }
    void from_json(nlohmann::json const& j, ConnectionProfile& profile)
    {
        profile = {};

        FROM_JSON_OPTIONAL(j, profile, port);
        FROM_JSON_OPTIONAL(j, profile, user);
        FROM_JSON_OPTIONAL(j, profile, sshKey);
        FROM_JSON_OPTIONAL(j, profile, description);
        FROM_JSON_OPTIONAL(j, profile, defaultDirectory);
        if (j.contains("host"))
            j.at("host").get_to(profile.host);
        if (j.contains("sshOptions"))
            j.at("sshOptions").get_to(profile.sshOptions);
    }
}
