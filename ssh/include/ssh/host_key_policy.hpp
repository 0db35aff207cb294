#pragma once

#include <ssh/connection_parameters.hpp>
#include <utility/describe.hpp>

namespace SecureShell
{
    BOOST_DEFINE_ENUM_CLASS(KnownHostState, Known, Unknown, Changed, Error)
    BOOST_DEFINE_ENUM_CLASS(HostKeyDecision, Accept, AcceptAndRecord, Reject)

    /**
     * @brief Decides what to do with a server key given its state in the known hosts file.
     */
    HostKeyDecision decideHostKey(HostKeyPolicy policy, KnownHostState state);
}
