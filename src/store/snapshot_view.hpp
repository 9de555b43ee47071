#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace patchfleet {

enum class UpdateFilter {
    All,
    SecurityOnly
};

struct HostSummary {
    std::string name;
    std::string address;
    std::string description;
    DiscoveryState state = DiscoveryState::Unknown;
    std::optional<OsDescriptor> os;
    ProviderKind provider = ProviderKind::None;
    bool online = false;
    std::optional<std::chrono::system_clock::time_point> lastRefresh;
    bool stale = true;
    size_t updateCount = 0;
    size_t securityCount = 0;
};

// Read-only view of a cached snapshot for report consumers. Never touches
// the network; staleness is judged against the reference time given here.
class SnapshotView
{
public:
    SnapshotView(InventorySnapshot snapshot,
                 std::chrono::seconds staleThreshold,
                 std::chrono::system_clock::time_point now);

    const InventorySnapshot &snapshot() const { return m_snapshot; }

    std::vector<HostSummary> hosts() const;
    std::optional<HostSummary> host(const std::string &name) const;

    // Throws UnknownHostError for names not in the snapshot.
    std::vector<Update> updatesFor(const std::string &name,
                                   UpdateFilter filter = UpdateFilter::All) const;
    size_t securityCount(const std::string &name) const;

    size_t totalUpdates() const;
    size_t totalSecurityUpdates() const;

    nlohmann::json toJson() const;

private:
    const HostState &find(const std::string &name) const;
    HostSummary summarize(const HostState &host) const;

    InventorySnapshot m_snapshot;
    std::chrono::seconds m_staleThreshold;
    std::chrono::system_clock::time_point m_now;
};

} // namespace patchfleet
