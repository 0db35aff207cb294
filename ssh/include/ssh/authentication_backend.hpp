#pragma once

#include <ssh/connection_parameters.hpp>
#include <utility/describe.hpp>

#include <libssh/libssh.h>

#include <memory>
#include <string>

namespace SecureShell
{
    BOOST_DEFINE_ENUM_CLASS(KeyImportResult, Imported, PassphraseRequired, PassphraseRejected, Unreadable)
    BOOST_DEFINE_ENUM_CLASS(AuthenticationResult, Success, Denied, Failed)

    /**
     * @brief The authentication primitives of an ssh transport.
     */
    class IAuthenticationBackend
    {
      public:
        IAuthenticationBackend() = default;
        virtual ~IAuthenticationBackend() = default;
        IAuthenticationBackend(IAuthenticationBackend const&) = delete;
        IAuthenticationBackend& operator=(IAuthenticationBackend const&) = delete;
        IAuthenticationBackend(IAuthenticationBackend&&) = delete;
        IAuthenticationBackend& operator=(IAuthenticationBackend&&) = delete;

        /**
         * @brief Loads the private key of the credential and keeps it for authenticateWithKey.
         */
        virtual KeyImportResult importKey(Credential const& credential) = 0;

        /**
         * @brief Offers the imported key to the server.
         */
        virtual AuthenticationResult authenticateWithKey() = 0;

        virtual AuthenticationResult authenticateWithPassword(std::string const& password) = 0;

        /**
         * @brief Human readable description of the last failure.
         */
        virtual std::string lastError() const = 0;
    };

    class LibsshAuthenticationBackend : public IAuthenticationBackend
    {
      public:
        /**
         * @param session A connected session, not owned.
         */
        explicit LibsshAuthenticationBackend(ssh_session session);

        KeyImportResult importKey(Credential const& credential) override;
        AuthenticationResult authenticateWithKey() override;
        AuthenticationResult authenticateWithPassword(std::string const& password) override;
        std::string lastError() const override;

      private:
        ssh_session session_;
        std::unique_ptr<ssh_key_struct, decltype(&ssh_key_free)> key_;
        std::string lastError_;
    };
}
