#include "core/host.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "common/errors.hpp"

namespace patchfleet {

Host::Host(HostConfig config)
    : m_config(std::move(config))
{
}

DiscoveryState Host::state() const
{
    if (isDiscovering()) {
        return DiscoveryState::Discovering;
    }
    return m_state;
}

std::vector<Update> Host::securityUpdates() const
{
    std::vector<Update> result;
    std::copy_if(m_updates.begin(), m_updates.end(), std::back_inserter(result),
                 [](const Update &update) { return update.security(); });
    return result;
}

bool Host::isStale(std::chrono::system_clock::time_point now,
                   std::chrono::seconds threshold) const
{
    if (!m_lastRefresh.has_value()) {
        return true;
    }
    return (now - *m_lastRefresh) > threshold;
}

Ticket Host::beginDiscovery()
{
    if (isRefreshing()) {
        throw BusyError("host '" + name() + "' is refreshing");
    }
    m_discoveryTicket = m_nextTicket++;
    return m_discoveryTicket;
}

bool Host::commitDiscovery(Ticket ticket, const OsDescriptor &os, ProviderKind provider)
{
    if (ticket == 0 || ticket != m_discoveryTicket) {
        return false;
    }

    // Updates gathered by a different package manager no longer describe
    // this host.
    if (m_provider != provider) {
        m_updates.clear();
        m_lastRefresh.reset();
    }

    m_state = DiscoveryState::Discovered;
    m_os = os;
    m_provider = provider;
    m_online = true;
    m_unsupportedReason.clear();
    m_nonPosix = false;
    m_discoveryTicket = 0;
    return true;
}

bool Host::markUnsupported(Ticket ticket,
                           const std::optional<OsDescriptor> &os,
                           const std::string &reason,
                           bool nonPosix)
{
    if (ticket == 0 || ticket != m_discoveryTicket) {
        return false;
    }

    m_state = DiscoveryState::Unsupported;
    m_os = os;
    m_provider = ProviderKind::None;
    m_online = true;
    m_updates.clear();
    m_lastRefresh.reset();
    m_unsupportedReason = reason;
    m_nonPosix = nonPosix;
    m_discoveryTicket = 0;
    return true;
}

void Host::abortDiscovery(Ticket ticket)
{
    if (ticket != 0 && ticket == m_discoveryTicket) {
        m_discoveryTicket = 0;
    }
}

Ticket Host::beginRefresh()
{
    if (isDiscovering()) {
        throw BusyError("host '" + name() + "' is being discovered");
    }
    if (m_state != DiscoveryState::Discovered) {
        throw OperationNotSupportedError("host '" + name() + "' has not been discovered"
                                         " with a supported package manager");
    }
    if (isRefreshing()) {
        throw BusyError("host '" + name() + "' is already refreshing");
    }
    m_refreshTicket = m_nextTicket++;
    return m_refreshTicket;
}

bool Host::commitRefresh(Ticket ticket,
                         std::vector<Update> updates,
                         std::chrono::system_clock::time_point refreshedAt)
{
    if (ticket == 0 || ticket != m_refreshTicket) {
        return false;
    }
    m_updates = std::move(updates);
    m_lastRefresh = refreshedAt;
    m_online = true;
    m_refreshTicket = 0;
    return true;
}

void Host::abortRefresh(Ticket ticket)
{
    if (ticket != 0 && ticket == m_refreshTicket) {
        m_refreshTicket = 0;
    }
}

HostState Host::persistedState() const
{
    HostState state;
    state.name = m_config.name;
    state.address = m_config.address;
    state.port = m_config.port;
    state.username = m_config.username;
    state.description = m_config.description;
    state.state = m_state;
    state.os = m_os;
    state.provider = m_provider;
    state.online = m_online;
    state.lastRefresh = m_lastRefresh;
    state.updates = m_updates;
    state.unsupportedReason = m_unsupportedReason;
    state.nonPosix = m_nonPosix;
    return state;
}

void Host::restore(const HostState &state)
{
    m_state = state.state == DiscoveryState::Discovering ? DiscoveryState::Unknown
                                                         : state.state;
    m_os = state.os;
    m_provider = state.provider;
    m_online = state.online;
    m_lastRefresh = state.lastRefresh;
    m_updates = m_lastRefresh.has_value() ? state.updates : std::vector<Update>{};
    m_unsupportedReason = state.unsupportedReason;
    m_nonPosix = state.nonPosix;
    m_discoveryTicket = 0;
    m_refreshTicket = 0;
}

} // namespace patchfleet
