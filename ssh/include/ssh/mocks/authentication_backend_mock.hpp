#pragma once

#include <ssh/authentication_backend.hpp>

#include <gmock/gmock.h>

#include <string>

namespace SecureShell::Test
{
    class AuthenticationBackendMock : public SecureShell::IAuthenticationBackend
    {
      public:
        MOCK_METHOD(KeyImportResult, importKey, (Credential const&), (override));
        MOCK_METHOD(AuthenticationResult, authenticateWithKey, (), (override));
        MOCK_METHOD(AuthenticationResult, authenticateWithPassword, (std::string const&), (override));
        MOCK_METHOD(std::string, lastError, (), (const, override));
    };
}
