#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "common/models.hpp"
#include "core/host.hpp"

namespace patchfleet {

struct HostSelection {
    // Known hosts, in inventory order.
    std::vector<std::string> hosts;
    // Requested names with no host, in request order.
    std::vector<std::string> unknown;
};

// Owns every Host. All reads hand out copies and all writes go through the
// methods below, serialized by one mutex, so scheduler workers never touch a
// Host directly. Unknown names throw UnknownHostError.
class Inventory
{
public:
    // Throws ConfigError on duplicate names.
    explicit Inventory(const std::vector<HostConfig> &hosts);

    Inventory(const Inventory &) = delete;
    Inventory &operator=(const Inventory &) = delete;

    size_t size() const;
    bool contains(const std::string &name) const;
    std::vector<std::string> hostNames() const;

    // Empty request selects every host.
    HostSelection select(const std::vector<std::string> &names) const;

    HostConfig config(const std::string &name) const;
    HostState hostState(const std::string &name) const;
    std::vector<HostState> hosts() const;
    DiscoveryState state(const std::string &name) const;
    bool isStale(const std::string &name,
                 std::chrono::system_clock::time_point now,
                 std::chrono::seconds threshold) const;

    Ticket beginDiscovery(const std::string &name);
    bool commitDiscovery(const std::string &name,
                         Ticket ticket,
                         const OsDescriptor &os,
                         ProviderKind provider);
    bool markUnsupported(const std::string &name,
                         Ticket ticket,
                         const std::optional<OsDescriptor> &os,
                         const std::string &reason,
                         bool nonPosix);
    void abortDiscovery(const std::string &name, Ticket ticket);

    // Returns the ticket and the provider bound at discovery.
    std::pair<Ticket, ProviderKind> beginRefresh(const std::string &name);
    bool commitRefresh(const std::string &name,
                       Ticket ticket,
                       std::vector<Update> updates,
                       std::chrono::system_clock::time_point refreshedAt);
    void abortRefresh(const std::string &name, Ticket ticket);

    void setOnline(const std::string &name, bool online);

    InventorySnapshot snapshot(std::chrono::system_clock::time_point now) const;

    // Applies cached state to configured hosts. Cached hosts that are no
    // longer configured are dropped and disappear on the next save.
    void restore(const InventorySnapshot &snapshot);

private:
    Host &hostLocked(const std::string &name) const;

    mutable std::mutex m_mutex;
    std::vector<std::unique_ptr<Host>> m_hosts;
    std::unordered_map<std::string, Host *> m_index;
};

} // namespace patchfleet
