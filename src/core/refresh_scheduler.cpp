#include "core/refresh_scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdexcept>

#include <QRunnable>
#include <QThreadPool>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/platform_detector.hpp"
#include "core/sudo_policy.hpp"
#include "providers/provider.hpp"

namespace patchfleet {

namespace {

constexpr std::chrono::milliseconds kPollInterval{50};

HostResult cancelledResult(const std::string &host, const std::string &message)
{
    HostResult result;
    result.host = host;
    result.error = ErrorKind::Cancelled;
    result.message = message;
    return result;
}

// Failures that say something about reachability rather than about the
// commands we ran.
bool isReachabilityFailure(ErrorKind kind)
{
    return kind == ErrorKind::Connection || kind == ErrorKind::Authentication;
}

ErrorKind kindOf(const std::exception &ex)
{
    if (const auto *error = dynamic_cast<const Error *>(&ex)) {
        return error->kind();
    }
    return ErrorKind::Internal;
}

} // namespace

// Shared between the waiting caller and the pool tasks of one operation.
// Tasks may outlive the operation after a cancellation, so it is reference
// counted. Lock order is state mutex first, then the Inventory mutex.
struct RefreshScheduler::OperationState {
    struct Slot {
        std::string host;
        std::optional<HostResult> result;
        Ticket ticket = 0;
        bool started = false;
        bool abandoned = false;
    };

    QString correlationId;
    std::mutex mutex;
    std::condition_variable done;
    std::vector<Slot> slots;
    size_t remaining = 0;

    const std::string &host(size_t index) const { return slots[index].host; }

    bool start(size_t index)
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (slots[index].abandoned) {
            return false;
        }
        slots[index].started = true;
        return true;
    }

    // False when the slot was abandoned before the ticket could be recorded;
    // the caller then owns releasing the ticket.
    bool setTicket(size_t index, Ticket ticket)
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (slots[index].abandoned) {
            return false;
        }
        slots[index].ticket = ticket;
        return true;
    }

    // Applies the state change and records the result in one step, unless the
    // caller has already given up on this host. apply returns false when the
    // Host rejected the commit because a newer attempt owns it.
    void finish(size_t index, HostResult result, const std::function<bool()> &apply)
    {
        std::lock_guard<std::mutex> lock(mutex);
        Slot &slot = slots[index];
        if (slot.abandoned || slot.result.has_value()) {
            return;
        }
        if (apply && !apply()) {
            result.error = ErrorKind::Superseded;
            result.message = "a newer attempt for this host replaced the result";
        }
        slot.result = std::move(result);
        --remaining;
        done.notify_all();
    }
};

size_t OperationReport::successCount() const
{
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                             [](const HostResult &r) { return r.ok(); }));
}

size_t OperationReport::failureCount() const
{
    return results.size() - successCount();
}

const HostResult *OperationReport::find(const std::string &host) const
{
    for (const auto &result : results) {
        if (result.host == host) {
            return &result;
        }
    }
    return nullptr;
}

RefreshScheduler::RefreshScheduler(Inventory &inventory,
                                   TransportFactory &transports,
                                   RunContext context)
    : m_inventory(inventory)
    , m_transports(transports)
    , m_context(std::move(context))
    , m_pool(std::make_unique<QThreadPool>())
{
    m_pool->setMaxThreadCount(std::max(1, m_context.maxWorkers));
}

RefreshScheduler::~RefreshScheduler()
{
    m_pool->clear();
    m_pool->waitForDone();
}

void RefreshScheduler::cancel() noexcept
{
    m_cancelled.store(true);
}

bool RefreshScheduler::isCancelled() const noexcept
{
    return m_cancelled.load();
}

void RefreshScheduler::resetCancellation() noexcept
{
    m_cancelled.store(false);
}

OperationReport RefreshScheduler::discover(const std::vector<std::string> &hosts)
{
    HostSelection selection = m_inventory.select(hosts);

    if (hosts.empty()) {
        // A host that answered like a non-POSIX system is only retried when
        // it is named explicitly.
        std::vector<std::string> eligible;
        for (const std::string &name : selection.hosts) {
            const HostState state = m_inventory.hostState(name);
            if (state.state == DiscoveryState::Unsupported && state.nonPosix) {
                PFLOG_INFO(QStringLiteral("RefreshScheduler"),
                           QStringLiteral("RefreshScheduler::discover"),
                           QStringLiteral("non_posix_host_skipped"),
                           QStringLiteral("discover_all"),
                           QStringLiteral("selection_filter"),
                           logging::defaultWho(),
                           logging::currentCorrelationId(),
                           (nlohmann::json{{"host", name}}));
                continue;
            }
            eligible.push_back(name);
        }
        selection.hosts = std::move(eligible);
    }

    return runOperation(
        QStringLiteral("discover"), selection.hosts, selection.unknown,
        [this](const std::shared_ptr<OperationState> &state, size_t index) {
            discoverHost(state, index);
        },
        [this](const std::string &host, Ticket ticket) {
            m_inventory.abortDiscovery(host, ticket);
        });
}

OperationReport RefreshScheduler::refresh(const std::vector<std::string> &hosts,
                                          bool syncRepositories)
{
    const HostSelection selection = m_inventory.select(hosts);
    return runOperation(
        syncRepositories ? QStringLiteral("refresh_sync") : QStringLiteral("refresh"),
        selection.hosts, selection.unknown,
        [this, syncRepositories](const std::shared_ptr<OperationState> &state, size_t index) {
            refreshHost(state, index, syncRepositories);
        },
        [this](const std::string &host, Ticket ticket) {
            m_inventory.abortRefresh(host, ticket);
        });
}

OperationReport RefreshScheduler::ping(const std::vector<std::string> &hosts)
{
    const HostSelection selection = m_inventory.select(hosts);
    return runOperation(
        QStringLiteral("ping"), selection.hosts, selection.unknown,
        [this](const std::shared_ptr<OperationState> &state, size_t index) {
            pingHost(state, index);
        },
        AbandonFn());
}

OperationReport RefreshScheduler::runOperation(const QString &operation,
                                               const std::vector<std::string> &hosts,
                                               const std::vector<std::string> &unknown,
                                               const HostTask &task,
                                               const AbandonFn &abandon)
{
    const QString corrId = logging::newCorrelationId();
    logging::CorrelationScope scope(corrId);

    auto state = std::make_shared<OperationState>();
    state->correlationId = corrId;
    state->slots.resize(hosts.size());
    for (size_t i = 0; i < hosts.size(); ++i) {
        state->slots[i].host = hosts[i];
    }
    state->remaining = hosts.size();

    PFLOG_INFO(QStringLiteral("RefreshScheduler"),
               QStringLiteral("RefreshScheduler::runOperation"),
               QStringLiteral("operation_start"),
               operation,
               QStringLiteral("thread_pool"),
               logging::defaultWho(),
               corrId,
               (nlohmann::json{
                   {"hosts", hosts},
                   {"unknown", unknown},
                   {"workers", m_pool->maxThreadCount()}
               }));

    for (size_t i = 0; i < hosts.size() && !isCancelled(); ++i) {
        m_pool->start(QRunnable::create([state, i, task]() {
            logging::CorrelationScope taskScope(state->correlationId);
            try {
                task(state, i);
            } catch (const std::exception &ex) {
                HostResult result;
                result.host = state->host(i);
                result.error = ErrorKind::Internal;
                result.message = ex.what();
                state->finish(i, std::move(result), {});
            }
        }));
    }

    OperationReport report;
    report.operation = operation.toStdString();
    report.correlationId = corrId.toStdString();

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        std::optional<std::chrono::steady_clock::time_point> deadline;

        while (state->remaining > 0) {
            if (!deadline.has_value() && isCancelled()) {
                report.cancelled = true;
                m_pool->clear();
                for (auto &slot : state->slots) {
                    if (!slot.started && !slot.result.has_value()) {
                        slot.abandoned = true;
                        slot.result = cancelledResult(slot.host,
                                                      "operation cancelled before this host started");
                        --state->remaining;
                    }
                }
                deadline = std::chrono::steady_clock::now() + m_context.cancelGracePeriod;

                PFLOG_WARN(QStringLiteral("RefreshScheduler"),
                           QStringLiteral("RefreshScheduler::runOperation"),
                           QStringLiteral("operation_cancel_requested"),
                           operation,
                           QStringLiteral("grace_period"),
                           logging::defaultWho(),
                           corrId,
                           (nlohmann::json{
                               {"inFlight", state->remaining},
                               {"graceMs", m_context.cancelGracePeriod.count()}
                           }));
                continue;
            }
            if (deadline.has_value() && std::chrono::steady_clock::now() >= *deadline) {
                break;
            }
            state->done.wait_for(lock, kPollInterval);
        }

        // Whatever is still running lost its chance to commit.
        for (auto &slot : state->slots) {
            if (slot.result.has_value()) {
                continue;
            }
            slot.abandoned = true;
            slot.result = cancelledResult(slot.host,
                                          "host did not finish within the cancellation grace period");
            if (slot.ticket != 0 && abandon) {
                abandon(slot.host, slot.ticket);
            }
        }

        report.results.reserve(state->slots.size() + unknown.size());
        for (const auto &slot : state->slots) {
            report.results.push_back(*slot.result);
        }
    }

    for (const std::string &name : unknown) {
        HostResult result;
        result.host = name;
        result.error = ErrorKind::UnknownHost;
        result.message = "no host named '" + name + "' in inventory";
        report.results.push_back(std::move(result));
    }

    for (const HostResult &result : report.results) {
        if (result.ok()) {
            continue;
        }
        PFLOG_WARN(QStringLiteral("RefreshScheduler"),
                   QStringLiteral("RefreshScheduler::runOperation"),
                   QStringLiteral("host_failed"),
                   operation,
                   QString::fromStdString(toErrorKindString(result.error)),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{
                       {"host", result.host},
                       {"message", result.message}
                   }));
    }

    PFLOG_INFO(QStringLiteral("RefreshScheduler"),
               QStringLiteral("RefreshScheduler::runOperation"),
               QStringLiteral("operation_end"),
               operation,
               QStringLiteral("thread_pool"),
               logging::defaultWho(),
               corrId,
               (nlohmann::json{
                   {"succeeded", report.successCount()},
                   {"failed", report.failureCount()},
                   {"cancelled", report.cancelled}
               }));

    return report;
}

void RefreshScheduler::discoverHost(const std::shared_ptr<OperationState> &state, size_t index)
{
    const std::string name = state->host(index);
    if (!state->start(index)) {
        return;
    }
    if (isCancelled()) {
        state->finish(index, cancelledResult(name, "operation cancelled before this host started"), {});
        return;
    }

    HostResult result;
    result.host = name;
    Ticket ticket = 0;

    try {
        ticket = m_inventory.beginDiscovery(name);
        if (!state->setTicket(index, ticket)) {
            m_inventory.abortDiscovery(name, ticket);
            return;
        }

        const HostConfig config = m_inventory.config(name);
        TransportSession session(m_transports, config, m_context.connectTimeoutFor(config));

        PlatformInfo info;
        try {
            info = detectPlatform(session.transport(), m_context.commandTimeoutFor(config));
        } catch (const UnsupportedPlatformError &ex) {
            result.error = ex.kind();
            result.message = ex.what();
            const std::string reason = ex.what();
            state->finish(index, std::move(result), [&]() {
                return m_inventory.markUnsupported(name, ticket, std::nullopt, reason, true);
            });
            return;
        }

        if (info.provider == ProviderKind::None) {
            result.warnings.push_back(info.unsupportedReason);
            state->finish(index, std::move(result), [&]() {
                return m_inventory.markUnsupported(name, ticket, info.os,
                                                   info.unsupportedReason, false);
            });
            return;
        }

        state->finish(index, std::move(result), [&]() {
            return m_inventory.commitDiscovery(name, ticket, info.os, info.provider);
        });
    } catch (const std::exception &ex) {
        HostResult failure;
        failure.host = name;
        failure.error = kindOf(ex);
        failure.message = ex.what();
        const bool unreachable = isReachabilityFailure(failure.error);
        state->finish(index, std::move(failure), [&]() {
            m_inventory.abortDiscovery(name, ticket);
            if (unreachable) {
                m_inventory.setOnline(name, false);
            }
            return true;
        });
    }
}

void RefreshScheduler::refreshHost(const std::shared_ptr<OperationState> &state,
                                   size_t index,
                                   bool sync)
{
    const std::string name = state->host(index);
    if (!state->start(index)) {
        return;
    }
    if (isCancelled()) {
        state->finish(index, cancelledResult(name, "operation cancelled before this host started"), {});
        return;
    }

    HostResult result;
    result.host = name;
    Ticket ticket = 0;

    try {
        const auto begun = m_inventory.beginRefresh(name);
        ticket = begun.first;
        if (!state->setTicket(index, ticket)) {
            m_inventory.abortRefresh(name, ticket);
            return;
        }

        const HostConfig config = m_inventory.config(name);
        const SudoPolicy policy =
            SudoPolicyResolver::effectivePolicy(config, m_context.defaultSudoPolicy);
        std::unique_ptr<Provider> provider = createProvider(begun.second);

        TransportSession session(m_transports, config, m_context.connectTimeoutFor(config));
        CommandContext command(session.transport(), policy,
                               m_context.commandTimeoutFor(config), name);

        if (sync) {
            const SyncResult synced = provider->syncRepositories(command);
            if (synced.status == StepStatus::SkippedPrivileged) {
                result.warnings.push_back(synced.message);
            }
        }

        if (isCancelled()) {
            state->finish(index, cancelledResult(name, "operation cancelled between refresh steps"),
                          [&]() {
                              m_inventory.abortRefresh(name, ticket);
                              return true;
                          });
            return;
        }

        FetchResult fetched = provider->fetchUpdates(command);
        if (fetched.status == StepStatus::SkippedPrivileged) {
            throw PrivilegeError(fetched.message);
        }

        const auto refreshedAt = nowUtc();
        state->finish(index, std::move(result), [&]() {
            return m_inventory.commitRefresh(name, ticket, std::move(fetched.updates), refreshedAt);
        });
    } catch (const std::exception &ex) {
        HostResult failure;
        failure.host = name;
        failure.error = kindOf(ex);
        failure.message = ex.what();
        failure.warnings = result.warnings;
        const bool unreachable = isReachabilityFailure(failure.error);
        state->finish(index, std::move(failure), [&]() {
            m_inventory.abortRefresh(name, ticket);
            if (unreachable) {
                m_inventory.setOnline(name, false);
            }
            return true;
        });
    }
}

void RefreshScheduler::pingHost(const std::shared_ptr<OperationState> &state, size_t index)
{
    const std::string name = state->host(index);
    if (!state->start(index)) {
        return;
    }
    if (isCancelled()) {
        state->finish(index, cancelledResult(name, "operation cancelled before this host started"), {});
        return;
    }

    HostResult result;
    result.host = name;

    try {
        const HostConfig config = m_inventory.config(name);
        TransportSession session(m_transports, config, m_context.pingTimeout);
        const CommandResult answer = session.run("true", m_context.pingTimeout);
        if (!answer.ok()) {
            throw CommandFailedError("`true` exited with status " + std::to_string(answer.exitCode),
                                     answer.exitCode, answer.stderrText);
        }
        state->finish(index, std::move(result), [&]() {
            m_inventory.setOnline(name, true);
            return true;
        });
    } catch (const std::exception &ex) {
        HostResult failure;
        failure.host = name;
        failure.error = kindOf(ex);
        failure.message = ex.what();
        state->finish(index, std::move(failure), [&]() {
            m_inventory.setOnline(name, false);
            return true;
        });
    }
}

} // namespace patchfleet
