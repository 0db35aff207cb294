#pragma once

#include <ssh/connection_parameters.hpp>
#include <ssh/error.hpp>
#include <ssh/sftp_session_interface.hpp>

#include <expected>
#include <memory>

namespace SecureShell
{
    /**
     * @brief Opens an authenticated sftp session. The seam between Session and the network.
     */
    class ISessionConnector
    {
      public:
        ISessionConnector() = default;
        virtual ~ISessionConnector() = default;
        ISessionConnector(ISessionConnector const&) = delete;
        ISessionConnector& operator=(ISessionConnector const&) = delete;
        ISessionConnector(ISessionConnector&&) = delete;
        ISessionConnector& operator=(ISessionConnector&&) = delete;

        /**
         * @brief Connects, verifies the host key, authenticates and initializes the sftp subsystem.
         * Nothing is left open when this fails.
         */
        virtual std::expected<std::unique_ptr<ISftpSession>, Error>
        open(ConnectionParameters const& parameters, Credential const& credential) = 0;
    };

    class LibsshConnector : public ISessionConnector
    {
      public:
        std::expected<std::unique_ptr<ISftpSession>, Error>
        open(ConnectionParameters const& parameters, Credential const& credential) override;
    };
}
