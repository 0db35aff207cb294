#pragma once

#include <ssh/session_connector.hpp>

#include <gmock/gmock.h>

#include <expected>
#include <memory>

namespace SecureShell::Test
{
    class SessionConnectorMock : public SecureShell::ISessionConnector
    {
      public:
        MOCK_METHOD(
            (std::expected<std::unique_ptr<ISftpSession>, Error>),
            open,
            (ConnectionParameters const&, Credential const&),
            (override));
    };
}
