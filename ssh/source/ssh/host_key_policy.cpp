#include <ssh/host_key_policy.hpp>

namespace SecureShell
{
    HostKeyDecision decideHostKey(HostKeyPolicy policy, KnownHostState state)
    {
        using enum KnownHostState;

        switch (policy)
        {
            case HostKeyPolicy::AcceptAll:
                return HostKeyDecision::Accept;
            case HostKeyPolicy::AcceptNew:
            {
                if (state == Known)
                    return HostKeyDecision::Accept;
                if (state == Unknown)
                    return HostKeyDecision::AcceptAndRecord;
                return HostKeyDecision::Reject;
            }
            case HostKeyPolicy::Strict:
                return state == Known ? HostKeyDecision::Accept : HostKeyDecision::Reject;
        }
        return HostKeyDecision::Reject;
    }
}
