#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <QString>

#include "common/config.hpp"
#include "common/models.hpp"
#include "core/host.hpp"
#include "core/inventory.hpp"
#include "transport/transport.hpp"

class QThreadPool;

namespace patchfleet {

struct HostResult {
    std::string host;
    ErrorKind error = ErrorKind::None;
    std::string message;
    std::vector<std::string> warnings;

    bool ok() const { return error == ErrorKind::None; }
};

struct OperationReport {
    std::string operation;
    std::string correlationId;
    bool cancelled = false;
    // Inventory order, then unknown names in request order.
    std::vector<HostResult> results;

    size_t successCount() const;
    size_t failureCount() const;
    const HostResult *find(const std::string &host) const;
};

// Fans discovery, refresh and ping out over a bounded QThreadPool.
//
// Each host is handled by one task; a failure is caught at the task boundary
// and becomes that host's HostResult. Operations block until every task has
// reported or, after cancel(), until the grace period runs out.
class RefreshScheduler
{
public:
    RefreshScheduler(Inventory &inventory, TransportFactory &transports, RunContext context);
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler &) = delete;
    RefreshScheduler &operator=(const RefreshScheduler &) = delete;

    // Empty host list means every host; "every host" leaves out hosts that
    // already answered like a non-POSIX system.
    OperationReport discover(const std::vector<std::string> &hosts = {});
    OperationReport refresh(const std::vector<std::string> &hosts = {}, bool syncRepositories = false);
    OperationReport ping(const std::vector<std::string> &hosts = {});

    // Only stores a flag, so it may be called from a signal handler.
    void cancel() noexcept;
    bool isCancelled() const noexcept;
    void resetCancellation() noexcept;

    const RunContext &context() const { return m_context; }

private:
    struct OperationState;
    using HostTask = std::function<void(const std::shared_ptr<OperationState> &, size_t)>;
    using AbandonFn = std::function<void(const std::string &, Ticket)>;

    OperationReport runOperation(const QString &operation,
                                 const std::vector<std::string> &hosts,
                                 const std::vector<std::string> &unknown,
                                 const HostTask &task,
                                 const AbandonFn &abandon);

    void discoverHost(const std::shared_ptr<OperationState> &state, size_t index);
    void refreshHost(const std::shared_ptr<OperationState> &state, size_t index, bool sync);
    void pingHost(const std::shared_ptr<OperationState> &state, size_t index);

    Inventory &m_inventory;
    TransportFactory &m_transports;
    RunContext m_context;
    std::unique_ptr<QThreadPool> m_pool;
    std::atomic<bool> m_cancelled{false};
};

} // namespace patchfleet
