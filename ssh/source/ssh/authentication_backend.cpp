#include <ssh/authentication_backend.hpp>

#include <fmt/format.h>

#include <cstring>
#include <filesystem>
#include <optional>
#include <system_error>

namespace SecureShell
{
    namespace
    {
        struct PassphraseRequest
        {
            std::optional<std::string> passphrase{std::nullopt};
            bool requested{false};
        };

        // libssh asks for the passphrase through this callback only when the key is encrypted.
        int providePassphrase(char const*, char* buffer, std::size_t length, int, int, void* userdata)
        {
            auto* request = static_cast<PassphraseRequest*>(userdata);
            request->requested = true;
            if (!request->passphrase || request->passphrase->size() + 1 > length)
                return -1;

            std::memcpy(buffer, request->passphrase->c_str(), request->passphrase->size() + 1);
            return 0;
        }

        AuthenticationResult toAuthenticationResult(int result)
        {
            switch (result)
            {
                case SSH_AUTH_SUCCESS:
                    return AuthenticationResult::Success;
                case SSH_AUTH_DENIED:
                case SSH_AUTH_PARTIAL:
                    return AuthenticationResult::Denied;
                default:
                    return AuthenticationResult::Failed;
            }
        }
    }

    LibsshAuthenticationBackend::LibsshAuthenticationBackend(ssh_session session)
        : session_{session}
        , key_{nullptr, ssh_key_free}
        , lastError_{}
    {}

    KeyImportResult LibsshAuthenticationBackend::importKey(Credential const& credential)
    {
        PassphraseRequest request{.passphrase = credential.passphrase};
        ssh_key key{nullptr};
        int result = SSH_ERROR;

        if (credential.privateKeyData)
        {
            result =
                ssh_pki_import_privkey_base64(credential.privateKeyData->c_str(), nullptr, providePassphrase, &request, &key);
        }
        else if (credential.privateKeyFile)
        {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(*credential.privateKeyFile, ec))
            {
                lastError_ = fmt::format("Private key file '{}' does not exist", credential.privateKeyFile->string());
                return KeyImportResult::Unreadable;
            }
            result = ssh_pki_import_privkey_file(
                credential.privateKeyFile->string().c_str(), nullptr, providePassphrase, &request, &key);
        }
        else
        {
            lastError_ = "No private key given";
            return KeyImportResult::Unreadable;
        }

        if (result == SSH_OK)
        {
            key_.reset(key);
            return KeyImportResult::Imported;
        }

        if (request.requested && !request.passphrase)
        {
            lastError_ = "The private key is protected by a passphrase, but none was given";
            return KeyImportResult::PassphraseRequired;
        }
        if (request.requested)
        {
            lastError_ = "The private key could not be decrypted with the given passphrase";
            return KeyImportResult::PassphraseRejected;
        }

        lastError_ = "The private key could not be read or has an unsupported format";
        return KeyImportResult::Unreadable;
    }

    AuthenticationResult LibsshAuthenticationBackend::authenticateWithKey()
    {
        if (!key_)
        {
            lastError_ = "No private key imported";
            return AuthenticationResult::Failed;
        }

        const auto result = toAuthenticationResult(ssh_userauth_publickey(session_, nullptr, key_.get()));
        if (result != AuthenticationResult::Success)
            lastError_ = ssh_get_error(session_);
        return result;
    }

    AuthenticationResult LibsshAuthenticationBackend::authenticateWithPassword(std::string const& password)
    {
        const auto result = toAuthenticationResult(ssh_userauth_password(session_, nullptr, password.c_str()));
        if (result != AuthenticationResult::Success)
            lastError_ = ssh_get_error(session_);
        return result;
    }

    std::string LibsshAuthenticationBackend::lastError() const
    {
        return lastError_;
    }
}
