#pragma once

#include <chrono>
#include <string>

#include "common/models.hpp"
#include "transport/transport.hpp"

namespace patchfleet {

struct PlatformInfo {
    OsDescriptor os;
    // None means a POSIX system we have no provider for.
    ProviderKind provider = ProviderKind::None;
    std::string unsupportedReason;
};

/**
 * Identify the remote platform over an open session.
 *
 * Runs `uname -s`, then on Linux the ID, ID_LIKE and VERSION_ID lines of
 * /etc/os-release (and `command -v` to pick dnf or yum), on the BSDs
 * `uname -r`.
 *
 * Throws UnsupportedPlatformError when the host does not answer like a POSIX
 * system at all. Transport errors propagate unchanged.
 */
PlatformInfo detectPlatform(Transport &transport, std::chrono::milliseconds timeout);

// Value of a KEY=value os-release line with quotes removed, lowercased.
std::string osReleaseValue(const std::string &line);

} // namespace patchfleet
