#include <ssh/connection_parameters.hpp>

#include <fmt/format.h>

namespace SecureShell
{
    std::expected<void, Error> validate(ConnectionParameters const& parameters, Credential const& credential)
    {
        if (parameters.host.empty())
            return std::unexpected(makeError(ErrorKind::ConfigurationError, "No host given"));
        if (parameters.username.empty())
            return std::unexpected(makeError(ErrorKind::ConfigurationError, "No username given"));
        if (parameters.port < 1 || parameters.port > 65535)
            return std::unexpected(
                makeError(ErrorKind::ConfigurationError, fmt::format("Port {} is out of range", parameters.port)));
        if (parameters.timeout.count() < 0)
            return std::unexpected(makeError(ErrorKind::ConfigurationError, "Timeout must not be negative"));
        if (!credential.hasKey() && !credential.password)
            return std::unexpected(
                makeError(ErrorKind::ConfigurationError, "Neither a private key nor a password was given"));
        return {};
    }
}
