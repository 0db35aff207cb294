#pragma once

#include <ssh/authentication_backend.hpp>
#include <ssh/connection_parameters.hpp>
#include <ssh/error.hpp>
#include <utility/describe.hpp>

#include <expected>

namespace SecureShell
{
    /**
     * @brief Classified outcome of the key authentication step.
     */
    BOOST_DEFINE_ENUM_CLASS(KeyOutcome, NoKey, Authenticated, PassphraseMissing, PassphraseRejected, KeyUnusable, KeyRefused)

    /**
     * @brief Runs the key authentication step, if the credential carries a key.
     */
    KeyOutcome tryKeyAuthentication(IAuthenticationBackend& backend, Credential const& credential);

    /**
     * @brief Authenticates a connected transport.
     *
     * A key is tried first when the credential has one. A key that needs a passphrase which was not given is a
     * AuthMaterialError without fallback. An unreadable key falls back to the password, or is an AuthMaterialError
     * without one. A key refused by the server falls back to the password, or is an AuthenticationError without one.
     * A rejected password is an AuthenticationError.
     */
    std::expected<void, Error> authenticate(IAuthenticationBackend& backend, Credential const& credential);
}
