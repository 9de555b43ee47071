#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace patchfleet {

using Ticket = std::uint64_t;

// One managed host and its discovery/refresh state machine.
//
// Every begin*() hands out a ticket from a per-host, monotonically increasing
// counter. A commit is applied only while its ticket is still the current one
// for that transition, so results arriving after an abort or a newer attempt
// are discarded. Host does no locking of its own; Inventory serializes access.
class Host {
public:
    explicit Host(HostConfig config);

    const HostConfig &config() const { return m_config; }
    const std::string &name() const { return m_config.name; }

    // Reports Discovering while a discovery is in flight, otherwise the last
    // committed state.
    DiscoveryState state() const;
    DiscoveryState stableState() const { return m_state; }
    bool isRefreshing() const { return m_refreshTicket != 0; }
    bool isDiscovering() const { return m_discoveryTicket != 0; }

    bool online() const { return m_online; }
    const std::optional<OsDescriptor> &os() const { return m_os; }
    ProviderKind provider() const { return m_provider; }
    const std::optional<std::chrono::system_clock::time_point> &lastRefresh() const
    {
        return m_lastRefresh;
    }
    const std::vector<Update> &updates() const { return m_updates; }
    std::vector<Update> securityUpdates() const;
    const std::string &unsupportedReason() const { return m_unsupportedReason; }
    bool nonPosix() const { return m_nonPosix; }

    // A host that has never been refreshed is always stale.
    bool isStale(std::chrono::system_clock::time_point now,
                 std::chrono::seconds threshold) const;

    // Throws BusyError while a refresh is in flight. A second discovery
    // supersedes the first.
    Ticket beginDiscovery();
    bool commitDiscovery(Ticket ticket, const OsDescriptor &os, ProviderKind provider);
    bool markUnsupported(Ticket ticket,
                         const std::optional<OsDescriptor> &os,
                         const std::string &reason,
                         bool nonPosix);
    void abortDiscovery(Ticket ticket);

    // Throws OperationNotSupportedError unless Discovered, BusyError when a
    // refresh or discovery is already running.
    Ticket beginRefresh();
    bool commitRefresh(Ticket ticket,
                       std::vector<Update> updates,
                       std::chrono::system_clock::time_point refreshedAt);
    void abortRefresh(Ticket ticket);

    void setOnline(bool online) { m_online = online; }

    HostState persistedState() const;

    // Loads committed state from the cache. Identity always comes from the
    // configuration, never from the cached entry.
    void restore(const HostState &state);

private:
    HostConfig m_config;

    DiscoveryState m_state = DiscoveryState::Unknown;
    std::optional<OsDescriptor> m_os;
    ProviderKind m_provider = ProviderKind::None;
    bool m_online = false;
    std::optional<std::chrono::system_clock::time_point> m_lastRefresh;
    std::vector<Update> m_updates;
    std::string m_unsupportedReason;
    bool m_nonPosix = false;

    Ticket m_nextTicket = 1;
    Ticket m_discoveryTicket = 0;
    Ticket m_refreshTicket = 0;
};

} // namespace patchfleet
