#pragma once

#include "common/models.hpp"

namespace patchfleet {

// Decides whether privileged provider commands may run unattended. Consulted
// before a command is built, never from transport code.
class SudoPolicyResolver
{
public:
    static SudoPolicy effectivePolicy(const HostConfig &host, SudoPolicy globalDefault);

    // Whether the provider statically needs elevation for this operation.
    static bool requiresElevation(ProviderKind provider, ProviderOperation operation);

    static bool isPermitted(SudoPolicy policy, ProviderKind provider, ProviderOperation operation);

    static bool canSync(SudoPolicy policy, ProviderKind provider);
    static bool canRefresh(SudoPolicy policy, ProviderKind provider);
};

} // namespace patchfleet
