#include "store/snapshot_view.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "common/errors.hpp"
#include "common/json_utils.hpp"

namespace patchfleet {

namespace {

size_t countSecurity(const std::vector<Update> &updates)
{
    return static_cast<size_t>(std::count_if(updates.begin(), updates.end(),
                                             [](const Update &u) { return u.security(); }));
}

} // namespace

SnapshotView::SnapshotView(InventorySnapshot snapshot,
                           std::chrono::seconds staleThreshold,
                           std::chrono::system_clock::time_point now)
    : m_snapshot(std::move(snapshot))
    , m_staleThreshold(staleThreshold)
    , m_now(now)
{
}

const HostState &SnapshotView::find(const std::string &name) const
{
    for (const HostState &host : m_snapshot.hosts) {
        if (host.name == name) {
            return host;
        }
    }
    throw UnknownHostError(name);
}

HostSummary SnapshotView::summarize(const HostState &host) const
{
    HostSummary summary;
    summary.name = host.name;
    summary.address = host.address;
    summary.description = host.description;
    summary.state = host.state;
    summary.os = host.os;
    summary.provider = host.provider;
    summary.online = host.online;
    summary.lastRefresh = host.lastRefresh;
    summary.stale = !host.lastRefresh.has_value()
        || (m_now - *host.lastRefresh) > m_staleThreshold;
    summary.updateCount = host.updates.size();
    summary.securityCount = countSecurity(host.updates);
    return summary;
}

std::vector<HostSummary> SnapshotView::hosts() const
{
    std::vector<HostSummary> result;
    result.reserve(m_snapshot.hosts.size());
    for (const HostState &host : m_snapshot.hosts) {
        result.push_back(summarize(host));
    }
    return result;
}

std::optional<HostSummary> SnapshotView::host(const std::string &name) const
{
    for (const HostState &host : m_snapshot.hosts) {
        if (host.name == name) {
            return summarize(host);
        }
    }
    return std::nullopt;
}

std::vector<Update> SnapshotView::updatesFor(const std::string &name, UpdateFilter filter) const
{
    const HostState &host = find(name);
    if (filter == UpdateFilter::All) {
        return host.updates;
    }

    std::vector<Update> result;
    std::copy_if(host.updates.begin(), host.updates.end(), std::back_inserter(result),
                 [](const Update &update) { return update.security(); });
    return result;
}

size_t SnapshotView::securityCount(const std::string &name) const
{
    return countSecurity(find(name).updates);
}

size_t SnapshotView::totalUpdates() const
{
    size_t total = 0;
    for (const HostState &host : m_snapshot.hosts) {
        total += host.updates.size();
    }
    return total;
}

size_t SnapshotView::totalSecurityUpdates() const
{
    size_t total = 0;
    for (const HostState &host : m_snapshot.hosts) {
        total += countSecurity(host.updates);
    }
    return total;
}

nlohmann::json SnapshotView::toJson() const
{
    nlohmann::json hosts = nlohmann::json::array();
    for (const HostState &host : m_snapshot.hosts) {
        const HostSummary summary = summarize(host);

        nlohmann::json updates = nlohmann::json::array();
        for (const Update &update : host.updates) {
            updates.push_back(update);
        }

        hosts.push_back(nlohmann::json{
            {"name", summary.name},
            {"address", summary.address},
            {"description", summary.description},
            {"state", toStateString(summary.state)},
            {"os", summary.os.has_value() ? nlohmann::json(*summary.os) : nlohmann::json(nullptr)},
            {"provider", toProviderString(summary.provider)},
            {"online", summary.online},
            {"last_refresh", summary.lastRefresh.has_value()
                 ? nlohmann::json(toIso8601Utc(*summary.lastRefresh))
                 : nlohmann::json(nullptr)},
            {"stale", summary.stale},
            {"update_count", summary.updateCount},
            {"security_count", summary.securityCount},
            {"updates", updates}
        });
    }

    return nlohmann::json{
        {"snapshot_time", toIso8601Utc(m_snapshot.snapshotTime)},
        {"total_updates", totalUpdates()},
        {"total_security_updates", totalSecurityUpdates()},
        {"hosts", hosts}
    };
}

} // namespace patchfleet
