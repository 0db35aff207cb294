#pragma once

#include <persistence/state/connection_profile.hpp>
#include <persistence/state/state.hpp>
#include <ssh/connection_parameters.hpp>

namespace Persistence
{
    /**
     * @brief Builds the engine's connection parameters from a profile.
     * Options the profile does not set come from the global settings, then from the engine defaults.
     */
    SecureShell::ConnectionParameters toConnectionParameters(ConnectionProfile const& profile, State const& state);
}
