#include "core/inventory.hpp"

#include <unordered_set>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace patchfleet {

Inventory::Inventory(const std::vector<HostConfig> &hosts)
{
    m_hosts.reserve(hosts.size());
    for (const HostConfig &config : hosts) {
        if (m_index.contains(config.name)) {
            throw ConfigError("Duplicate host name in inventory: " + config.name);
        }
        auto host = std::make_unique<Host>(config);
        m_index.emplace(config.name, host.get());
        m_hosts.push_back(std::move(host));
    }
}

Host &Inventory::hostLocked(const std::string &name) const
{
    auto it = m_index.find(name);
    if (it == m_index.end()) {
        throw UnknownHostError(name);
    }
    return *it->second;
}

size_t Inventory::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hosts.size();
}

bool Inventory::contains(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.contains(name);
}

std::vector<std::string> Inventory::hostNames() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_hosts.size());
    for (const auto &host : m_hosts) {
        names.push_back(host->name());
    }
    return names;
}

HostSelection Inventory::select(const std::vector<std::string> &names) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    HostSelection selection;

    if (names.empty()) {
        for (const auto &host : m_hosts) {
            selection.hosts.push_back(host->name());
        }
        return selection;
    }

    std::unordered_set<std::string> requested;
    std::unordered_set<std::string> seenUnknown;
    for (const std::string &name : names) {
        if (m_index.contains(name)) {
            requested.insert(name);
        } else if (seenUnknown.insert(name).second) {
            selection.unknown.push_back(name);
        }
    }

    for (const auto &host : m_hosts) {
        if (requested.contains(host->name())) {
            selection.hosts.push_back(host->name());
        }
    }
    return selection;
}

HostConfig Inventory::config(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return hostLocked(name).config();
}

HostState Inventory::hostState(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return hostLocked(name).persistedState();
}

std::vector<HostState> Inventory::hosts() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<HostState> states;
    states.reserve(m_hosts.size());
    for (const auto &host : m_hosts) {
        states.push_back(host->persistedState());
    }
    return states;
}

DiscoveryState Inventory::state(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return hostLocked(name).state();
}

bool Inventory::isStale(const std::string &name,
                        std::chrono::system_clock::time_point now,
                        std::chrono::seconds threshold) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return hostLocked(name).isStale(now, threshold);
}

Ticket Inventory::beginDiscovery(const std::string &name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return hostLocked(name).beginDiscovery();
}

bool Inventory::commitDiscovery(const std::string &name,
                                Ticket ticket,
                                const OsDescriptor &os,
                                ProviderKind provider)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return hostLocked(name).commitDiscovery(ticket, os, provider);
}

bool Inventory::markUnsupported(const std::string &name,
                                Ticket ticket,
                                const std::optional<OsDescriptor> &os,
                                const std::string &reason,
                                bool nonPosix)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return hostLocked(name).markUnsupported(ticket, os, reason, nonPosix);
}

void Inventory::abortDiscovery(const std::string &name, Ticket ticket)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    hostLocked(name).abortDiscovery(ticket);
}

std::pair<Ticket, ProviderKind> Inventory::beginRefresh(const std::string &name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Host &host = hostLocked(name);
    const Ticket ticket = host.beginRefresh();
    return {ticket, host.provider()};
}

bool Inventory::commitRefresh(const std::string &name,
                              Ticket ticket,
                              std::vector<Update> updates,
                              std::chrono::system_clock::time_point refreshedAt)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return hostLocked(name).commitRefresh(ticket, std::move(updates), refreshedAt);
}

void Inventory::abortRefresh(const std::string &name, Ticket ticket)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    hostLocked(name).abortRefresh(ticket);
}

void Inventory::setOnline(const std::string &name, bool online)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    hostLocked(name).setOnline(online);
}

InventorySnapshot Inventory::snapshot(std::chrono::system_clock::time_point now) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    InventorySnapshot snapshot;
    snapshot.schemaVersion = kCurrentSchemaVersion;
    snapshot.snapshotTime = now;
    snapshot.hosts.reserve(m_hosts.size());
    for (const auto &host : m_hosts) {
        snapshot.hosts.push_back(host->persistedState());
    }
    return snapshot;
}

void Inventory::restore(const InventorySnapshot &snapshot)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    int restored = 0;
    for (const HostState &state : snapshot.hosts) {
        auto it = m_index.find(state.name);
        if (it == m_index.end()) {
            PFLOG_INFO(QStringLiteral("Inventory"),
                       QStringLiteral("Inventory::restore"),
                       QStringLiteral("cached_host_pruned"),
                       QStringLiteral("host_removed_from_config"),
                       QStringLiteral("name_lookup"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"host", state.name}}));
            continue;
        }
        it->second->restore(state);
        ++restored;
    }

    PFLOG_DEBUG(QStringLiteral("Inventory"),
                QStringLiteral("Inventory::restore"),
                QStringLiteral("cache_applied"),
                QStringLiteral("startup"),
                QStringLiteral("snapshot_restore"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{
                    {"restored", restored},
                    {"cached", snapshot.hosts.size()},
                    {"configured", m_hosts.size()}
                }));
}

} // namespace patchfleet
