#pragma once

namespace patchfleet {

// Discovering, like the refreshing marker on a host, is transient and is
// never persisted.
enum class DiscoveryState {
    Unknown,
    Discovering,
    Discovered,
    Unsupported
};

// Closed set of package managers; selected once at discovery time.
enum class ProviderKind {
    None,
    Apt,
    Dnf,
    Yum,
    Pkg,
    PkgAdd
};

enum class SudoPolicy {
    Skip,
    Nopasswd
};

enum class ProviderOperation {
    SyncRepositories,
    FetchUpdates,
    FetchSecurityUpdates
};

enum class ErrorKind {
    None,
    Connection,
    Authentication,
    UnsupportedPlatform,
    Privilege,
    Parse,
    CacheCorruption,
    OperationNotSupported,
    CommandFailed,
    Busy,
    Superseded,
    Cancelled,
    UnknownHost,
    Internal
};

} // namespace patchfleet
