#include <ssh/authenticator.hpp>

#include <log/log.hpp>
#include <utility/enum_string_convert.hpp>

namespace SecureShell
{
    KeyOutcome tryKeyAuthentication(IAuthenticationBackend& backend, Credential const& credential)
    {
        if (!credential.hasKey())
            return KeyOutcome::NoKey;

        switch (backend.importKey(credential))
        {
            case KeyImportResult::PassphraseRequired:
                return KeyOutcome::PassphraseMissing;
            case KeyImportResult::PassphraseRejected:
                return KeyOutcome::PassphraseRejected;
            case KeyImportResult::Unreadable:
                return KeyOutcome::KeyUnusable;
            case KeyImportResult::Imported:
                break;
        }

        if (backend.authenticateWithKey() == AuthenticationResult::Success)
            return KeyOutcome::Authenticated;
        return KeyOutcome::KeyRefused;
    }

    std::expected<void, Error> authenticate(IAuthenticationBackend& backend, Credential const& credential)
    {
        using enum KeyOutcome;

        const auto keyOutcome = tryKeyAuthentication(backend, credential);
        Log::debug("Key authentication outcome: {}", Utility::enumToString(keyOutcome));

        switch (keyOutcome)
        {
            case Authenticated:
                return {};
            case PassphraseMissing:
            case PassphraseRejected:
                return std::unexpected(makeError(ErrorKind::AuthMaterialError, backend.lastError()));
            case KeyUnusable:
            {
                if (!credential.password)
                    return std::unexpected(makeError(ErrorKind::AuthMaterialError, backend.lastError()));
                Log::warn("Private key is unusable, falling back to password: {}", backend.lastError());
                break;
            }
            case KeyRefused:
            {
                if (!credential.password)
                    return std::unexpected(
                        makeError(ErrorKind::AuthenticationError, "Key authentication failed: " + backend.lastError()));
                Log::warn("Key authentication failed, falling back to password: {}", backend.lastError());
                break;
            }
            case NoKey:
                break;
        }

        if (!credential.password)
            return std::unexpected(makeError(ErrorKind::AuthMaterialError, "No password given"));

        switch (backend.authenticateWithPassword(*credential.password))
        {
            case AuthenticationResult::Success:
                return {};
            case AuthenticationResult::Denied:
                return std::unexpected(makeError(ErrorKind::AuthenticationError, "Password authentication denied"));
            case AuthenticationResult::Failed:
                break;
        }
        return std::unexpected(
            makeError(ErrorKind::TransportError, "Password authentication failed: " + backend.lastError()));
    }
}
