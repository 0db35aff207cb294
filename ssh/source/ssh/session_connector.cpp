#include <ssh/session_connector.hpp>
#include <ssh/authenticator.hpp>
#include <ssh/host_key_policy.hpp>
#include <ssh/sequential.hpp>
#include <ssh/sftp_session.hpp>

#include <log/log.hpp>
#include <utility/enum_string_convert.hpp>

#include <libssh/libsshpp.hpp>
#include <libssh/sftp.h>
#include <fmt/format.h>

#include <utility>

namespace SecureShell
{
    namespace
    {
        KnownHostState knownHostState(ssh_session session)
        {
            switch (ssh_session_is_known_server(session))
            {
                case SSH_KNOWN_HOSTS_OK:
                    return KnownHostState::Known;
                case SSH_KNOWN_HOSTS_NOT_FOUND:
                case SSH_KNOWN_HOSTS_UNKNOWN:
                    return KnownHostState::Unknown;
                case SSH_KNOWN_HOSTS_CHANGED:
                case SSH_KNOWN_HOSTS_OTHER:
                    return KnownHostState::Changed;
                default:
                    return KnownHostState::Error;
            }
        }

        std::expected<void, Error> verifyHostKey(ssh::Session& session, ConnectionParameters const& parameters)
        {
            const auto state = knownHostState(session.getCSession());
            switch (decideHostKey(parameters.hostKeyPolicy, state))
            {
                case HostKeyDecision::Accept:
                {
                    if (state != KnownHostState::Known)
                        Log::warn(
                            "Accepting host key of '{}' in state {}.", parameters.host, Utility::enumToString(state));
                    return {};
                }
                case HostKeyDecision::AcceptAndRecord:
                {
                    Log::info("Recording new host key of '{}'.", parameters.host);
                    if (ssh_session_update_known_hosts(session.getCSession()) != SSH_OK)
                        Log::warn("Could not record host key: {}", session.getError());
                    return {};
                }
                case HostKeyDecision::Reject:
                    break;
            }
            return std::unexpected(makeError(
                ErrorKind::TransportError,
                fmt::format(
                    "Host key of '{}' rejected ({}, policy {})",
                    parameters.host,
                    Utility::enumToString(state),
                    Utility::enumToString(parameters.hostKeyPolicy))));
        }

        Error transportError(ssh::Session& session, std::string const& what)
        {
            return makeError(ErrorKind::TransportError, fmt::format("{}: {}", what, session.getError()));
        }
    }

    std::expected<std::unique_ptr<ISftpSession>, Error>
    LibsshConnector::open(ConnectionParameters const& parameters, Credential const& credential)
    {
        auto session = std::make_unique<ssh::Session>();

        const auto optionsResult = Detail::sequential(
            [&] {
                if (parameters.logVerbosity)
                    return session->setOption(SSH_OPTIONS_LOG_VERBOSITY_STR, parameters.logVerbosity.value().c_str());
                return 0;
            },
            [&] {
                int port = parameters.port;
                return session->setOption(SSH_OPTIONS_PORT, &port);
            },
            [&] {
                return session->setOption(SSH_OPTIONS_HOST, parameters.host.c_str());
            },
            [&] {
                return session->setOption(SSH_OPTIONS_USER, parameters.username.c_str());
            },
            [&] {
                if (parameters.knownHostsFile.has_value())
                    return session->setOption(
                        SSH_OPTIONS_KNOWNHOSTS, parameters.knownHostsFile.value().generic_string().c_str());
                return 0;
            },
            [&] {
                long timeout = static_cast<long>(parameters.timeout.count());
                return session->setOption(SSH_OPTIONS_TIMEOUT, &timeout);
            });

        if (!optionsResult.success())
        {
            return std::unexpected(makeError(
                ErrorKind::ConfigurationError,
                fmt::format("Setting ssh option {} failed: {}", optionsResult.index, session->getError())));
        }

        Log::info("Connecting to {}:{} as '{}'.", parameters.host, parameters.port, parameters.username);
        if (session->connect() != SSH_OK)
            return std::unexpected(transportError(*session, "Connection failed"));

        if (auto hostKey = verifyHostKey(*session, parameters); !hostKey)
        {
            session->disconnect();
            return std::unexpected(hostKey.error());
        }

        {
            LibsshAuthenticationBackend backend{session->getCSession()};
            if (auto authenticated = authenticate(backend, credential); !authenticated)
            {
                session->disconnect();
                return std::unexpected(authenticated.error());
            }
        }

        auto sftp = sftp_new(session->getCSession());
        if (sftp == nullptr)
        {
            auto error = transportError(*session, "Creating the sftp session failed");
            session->disconnect();
            return std::unexpected(error);
        }

        if (sftp_init(sftp) != SSH_OK)
        {
            auto error = makeSftpError(
                SftpError{
                    .message = session->getError(),
                    .sshError = session->getErrorCode(),
                    .sftpError = sftp_get_error(sftp),
                },
                ErrorKind::TransportError,
                "Initializing the sftp subsystem failed");
            sftp_free(sftp);
            session->disconnect();
            return std::unexpected(error);
        }

        Log::info("Sftp session to {} established.", parameters.host);
        return std::make_unique<SftpSession>(std::move(session), sftp);
    }
}
