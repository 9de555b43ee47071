#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/enums.hpp"

namespace patchfleet {

struct OsDescriptor {
    std::string kind;
    std::string flavor;
    std::string version;

    bool operator==(const OsDescriptor &other) const = default;
};

// A single pending package change. Immutable: a refresh replaces the whole
// list for a host instead of editing entries.
class Update {
public:
    Update(std::string packageName,
           std::optional<std::string> currentVersion,
           std::string newVersion,
           bool security,
           std::string source)
        : m_packageName(std::move(packageName))
        , m_currentVersion(std::move(currentVersion))
        , m_newVersion(std::move(newVersion))
        , m_security(security)
        , m_source(std::move(source))
    {
    }

    const std::string &packageName() const { return m_packageName; }
    // nullopt means the package is newly introduced, not that the version is unknown.
    const std::optional<std::string> &currentVersion() const { return m_currentVersion; }
    const std::string &newVersion() const { return m_newVersion; }
    bool security() const { return m_security; }
    const std::string &source() const { return m_source; }

    bool isNewPackage() const { return !m_currentVersion.has_value(); }

    Update withSecurity(bool security) const
    {
        return Update(m_packageName, m_currentVersion, m_newVersion, security, m_source);
    }

    bool operator==(const Update &other) const = default;

private:
    std::string m_packageName;
    std::optional<std::string> m_currentVersion;
    std::string m_newVersion;
    bool m_security = false;
    std::string m_source;
};

// Static, configuration-derived identity of a host.
struct HostConfig {
    std::string name;
    std::string address;
    int port = 22;
    std::string username;
    std::string description;
    std::optional<SudoPolicy> sudoPolicy;
    std::optional<std::chrono::milliseconds> connectTimeout;
    std::optional<std::chrono::milliseconds> commandTimeout;

    bool operator==(const HostConfig &other) const = default;
};

// Persisted form of a host. Only stable states (Unknown, Discovered,
// Unsupported) ever appear here.
struct HostState {
    std::string name;
    std::string address;
    int port = 22;
    std::string username;
    std::string description;

    DiscoveryState state = DiscoveryState::Unknown;
    std::optional<OsDescriptor> os;
    ProviderKind provider = ProviderKind::None;
    bool online = false;
    std::optional<std::chrono::system_clock::time_point> lastRefresh;
    std::vector<Update> updates;

    std::string unsupportedReason;
    bool nonPosix = false;

    bool operator==(const HostState &other) const = default;
};

constexpr int kCurrentSchemaVersion = 2;

struct InventorySnapshot {
    int schemaVersion = kCurrentSchemaVersion;
    std::chrono::system_clock::time_point snapshotTime;
    std::vector<HostState> hosts;

    bool operator==(const InventorySnapshot &other) const = default;
};

// Timestamps are kept at millisecond precision so they survive the ISO-8601
// encoding used by the cache unchanged.
inline std::chrono::system_clock::time_point nowUtc()
{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

} // namespace patchfleet
