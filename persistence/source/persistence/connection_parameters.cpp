#include <persistence/connection_parameters.hpp>

#include <chrono>

namespace Persistence
{
    SecureShell::ConnectionParameters toConnectionParameters(ConnectionProfile const& profile, State const& state)
    {
        SshOptions options{profile.sshOptions};
        options.useDefaultsFrom(state.sshOptions);

        SecureShell::ConnectionParameters parameters{};
        parameters.host = profile.host;
        parameters.port = profile.port.value_or(parameters.port);
        parameters.username = profile.user.value_or("");
        parameters.timeout = std::chrono::seconds{options.connectTimeoutSeconds.value_or(state.connectTimeoutSeconds)};
        parameters.hostKeyPolicy = options.hostKeyPolicy.value_or(parameters.hostKeyPolicy);
        parameters.knownHostsFile = options.knownHostsFile;
        parameters.logVerbosity = options.logVerbosity;
        return parameters;
    }
}
