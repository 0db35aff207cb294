#include <persistence/state/ssh_options.hpp>
#include <utility/enum_string_convert.hpp>

namespace Persistence
{
    void to_json(nlohmann::json& j, SshOptions const& options)
    {
        j = nlohmann::json::object();

        TO_JSON_OPTIONAL(j, options, knownHostsFile);
        if (options.hostKeyPolicy)
            j["hostKeyPolicy"] = Utility::enumToString(*options.hostKeyPolicy);
        TO_JSON_OPTIONAL(j, options, logVerbosity);
        TO_JSON_OPTIONAL(j, options, connectTimeoutSeconds);
    }
    void from_json(nlohmann::json const& j, SshOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, knownHostsFile);
        if (j.contains("hostKeyPolicy"))
        {
            options.hostKeyPolicy =
                Utility::enumFromString<SecureShell::HostKeyPolicy>(j.at("hostKeyPolicy").get<std::string>());
        }
        else
            options.hostKeyPolicy = std::nullopt;
        FROM_JSON_OPTIONAL(j, options, logVerbosity);
        FROM_JSON_OPTIONAL(j, options, connectTimeoutSeconds);
    }

    void SshOptions::useDefaultsFrom(SshOptions const& other)
    {
        if (!knownHostsFile.has_value())
            knownHostsFile = other.knownHostsFile;
        if (!hostKeyPolicy.has_value())
            hostKeyPolicy = other.hostKeyPolicy;
        if (!logVerbosity.has_value())
            logVerbosity = other.logVerbosity;
        if (!connectTimeoutSeconds.has_value())
            connectTimeoutSeconds = other.connectTimeoutSeconds;
    }
}
