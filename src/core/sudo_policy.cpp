#include "core/sudo_policy.hpp"

namespace patchfleet {

SudoPolicy SudoPolicyResolver::effectivePolicy(const HostConfig &host, SudoPolicy globalDefault)
{
    return host.sudoPolicy.value_or(globalDefault);
}

bool SudoPolicyResolver::requiresElevation(ProviderKind provider, ProviderOperation operation)
{
    // Only repository metadata syncs write system state. Apt and FreeBSD pkg
    // need root for that; dnf/yum keep a per-user cache and OpenBSD has
    // nothing to sync.
    if (operation != ProviderOperation::SyncRepositories) {
        return false;
    }

    switch (provider) {
    case ProviderKind::Apt:
    case ProviderKind::Pkg:
        return true;
    case ProviderKind::Dnf:
    case ProviderKind::Yum:
    case ProviderKind::PkgAdd:
    case ProviderKind::None:
        return false;
    }
    return false;
}

bool SudoPolicyResolver::isPermitted(SudoPolicy policy,
                                     ProviderKind provider,
                                     ProviderOperation operation)
{
    if (!requiresElevation(provider, operation)) {
        return true;
    }
    return policy == SudoPolicy::Nopasswd;
}

bool SudoPolicyResolver::canSync(SudoPolicy policy, ProviderKind provider)
{
    return isPermitted(policy, provider, ProviderOperation::SyncRepositories);
}

bool SudoPolicyResolver::canRefresh(SudoPolicy policy, ProviderKind provider)
{
    return isPermitted(policy, provider, ProviderOperation::FetchUpdates)
        && isPermitted(policy, provider, ProviderOperation::FetchSecurityUpdates);
}

} // namespace patchfleet
