#include <QCoreApplication>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/inventory.hpp"
#include "core/refresh_scheduler.hpp"
#include "store/cache_store.hpp"
#include "store/snapshot_view.hpp"
#include "transport/openssh_transport.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitHostFailures = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

// Set only while an operation is running. Read from the SIGINT handler.
std::atomic<patchfleet::RefreshScheduler *> g_activeScheduler{nullptr};
static_assert(std::atomic<patchfleet::RefreshScheduler *>::is_always_lock_free);

extern "C" void handleInterrupt(int)
{
    if (patchfleet::RefreshScheduler *scheduler = g_activeScheduler.load()) {
        scheduler->cancel();
    }
}

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  patchfleet [--config PATH] [--trace] [--reset-cache] discover [HOST...]\n"
        "  patchfleet [--config PATH] [--trace] [--reset-cache] refresh [--sync] [HOST...]\n"
        "  patchfleet [--config PATH] [--trace] [--reset-cache] ping [HOST...]\n"
        "  patchfleet [--config PATH] [--trace] status [--json] [HOST...]\n"
        "  patchfleet [--config PATH] [--trace] cache-reset\n");
}

struct Invocation {
    std::string configPath;
    bool resetCache = false;
    bool sync = false;
    bool json = false;
    std::string command;
    std::vector<std::string> hosts;
};

std::optional<Invocation> parseArguments(const QStringList &args)
{
    Invocation invocation;
    invocation.configPath = patchfleet::defaultConfigFilePath();

    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == QStringLiteral("--trace")) {
            continue;
        }
        if (arg == QStringLiteral("--config")) {
            if (i + 1 >= args.size()) {
                return std::nullopt;
            }
            invocation.configPath = args.at(++i).toStdString();
        } else if (arg == QStringLiteral("--reset-cache")) {
            invocation.resetCache = true;
        } else if (arg == QStringLiteral("--sync") && invocation.command == "refresh") {
            invocation.sync = true;
        } else if (arg == QStringLiteral("--json") && invocation.command == "status") {
            invocation.json = true;
        } else if (arg.startsWith(QStringLiteral("--"))) {
            return std::nullopt;
        } else if (invocation.command.empty()) {
            invocation.command = arg.toStdString();
        } else {
            invocation.hosts.push_back(arg.toStdString());
        }
    }

    const std::vector<std::string> commands{"discover", "refresh", "ping", "status", "cache-reset"};
    if (std::find(commands.begin(), commands.end(), invocation.command) == commands.end()) {
        return std::nullopt;
    }
    if (invocation.command == "cache-reset" && !invocation.hosts.empty()) {
        return std::nullopt;
    }
    return invocation;
}

// Loads the cache into the inventory. A corrupt cache is fatal unless the
// caller asked to start over.
bool restoreCache(patchfleet::CacheStore &store,
                  patchfleet::Inventory &inventory,
                  bool resetCache)
{
    try {
        if (auto snapshot = store.load()) {
            inventory.restore(*snapshot);
        }
        return true;
    } catch (const patchfleet::CacheCorruptionError &ex) {
        if (!resetCache) {
            std::cerr << "error: " << ex.what() << "\n";
            return false;
        }
        PFLOG_WARN(QStringLiteral("main"),
                   QStringLiteral("restoreCache"),
                   QStringLiteral("corrupt_cache_discarded"),
                   QStringLiteral("user_requested_reset"),
                   QStringLiteral("cache_reset"),
                   patchfleet::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", store.path()}, {"error", ex.what()}}));
        store.reset();
        return true;
    }
}

void printReport(const patchfleet::OperationReport &report)
{
    for (const auto &result : report.results) {
        if (result.ok()) {
            std::cout << result.host << ": ok\n";
        } else {
            std::cout << result.host << ": " << patchfleet::toErrorKindString(result.error);
            if (!result.message.empty()) {
                std::cout << ": " << result.message;
            }
            std::cout << "\n";
        }
        for (const auto &warning : result.warnings) {
            std::cout << "  warning: " << warning << "\n";
        }
    }
    std::cout << report.operation << ": " << report.successCount() << " succeeded, "
              << report.failureCount() << " failed";
    if (report.cancelled) {
        std::cout << " (cancelled)";
    }
    std::cout << "\n";
}

void printSummary(const patchfleet::HostSummary &host)
{
    std::cout << host.name << " (" << host.address << ")"
              << " state=" << patchfleet::toStateString(host.state)
              << " provider=" << patchfleet::toProviderString(host.provider)
              << " online=" << (host.online ? "yes" : "no");
    if (host.os.has_value()) {
        std::cout << " os=" << host.os->flavor << " " << host.os->version;
    }
    std::cout << "\n  updates=" << host.updateCount
              << " security=" << host.securityCount
              << " last_refresh="
              << (host.lastRefresh.has_value() ? patchfleet::toIso8601Utc(*host.lastRefresh)
                                               : std::string("never"));
    if (host.stale) {
        std::cout << " [stale]";
    }
    std::cout << "\n";
}

int runStatus(const Invocation &invocation, const patchfleet::AppConfig &config)
{
    patchfleet::CacheStore store(config.context.cacheFile);
    std::optional<patchfleet::InventorySnapshot> snapshot;
    try {
        snapshot = store.load();
    } catch (const patchfleet::CacheCorruptionError &ex) {
        std::cerr << "error: " << ex.what() << "\n";
        return kExitUsage;
    }
    if (!snapshot.has_value()) {
        std::cout << "No cached state yet; run 'patchfleet discover' first.\n";
        return kExitOk;
    }

    const patchfleet::SnapshotView view(*snapshot,
                                        config.context.staleThreshold,
                                        std::chrono::system_clock::now());
    if (invocation.json) {
        std::cout << view.toJson().dump(2) << std::endl;
        return kExitOk;
    }

    int exitCode = kExitOk;
    if (invocation.hosts.empty()) {
        for (const auto &host : view.hosts()) {
            printSummary(host);
        }
    } else {
        for (const auto &name : invocation.hosts) {
            const auto host = view.host(name);
            if (!host.has_value()) {
                std::cout << name << ": "
                          << patchfleet::toErrorKindString(patchfleet::ErrorKind::UnknownHost) << "\n";
                exitCode = kExitHostFailures;
                continue;
            }
            printSummary(*host);
            for (const auto &update : view.updatesFor(name)) {
                std::cout << "  - " << update.packageName() << " "
                          << update.currentVersion().value_or("(new)") << " -> "
                          << update.newVersion() << " [" << update.source() << "]"
                          << (update.security() ? " security" : "") << "\n";
            }
        }
    }
    std::cout << "Total: " << view.totalUpdates() << " updates, "
              << view.totalSecurityUpdates() << " security\n";
    return exitCode;
}

int runOperation(const Invocation &invocation, const patchfleet::AppConfig &config)
{
    patchfleet::Inventory inventory(config.hosts);
    patchfleet::CacheStore store(config.context.cacheFile);
    if (!restoreCache(store, inventory, invocation.resetCache)) {
        std::cerr << "hint: rerun with --reset-cache to discard the cache\n";
        return kExitUsage;
    }

    patchfleet::OpenSshTransportFactory transports(config.context.sshBinary);
    patchfleet::RefreshScheduler scheduler(inventory, transports, config.context);

    g_activeScheduler.store(&scheduler);
    std::signal(SIGINT, handleInterrupt);

    patchfleet::OperationReport report;
    if (invocation.command == "discover") {
        report = scheduler.discover(invocation.hosts);
    } else if (invocation.command == "refresh") {
        report = scheduler.refresh(invocation.hosts, invocation.sync);
    } else {
        report = scheduler.ping(invocation.hosts);
    }

    std::signal(SIGINT, SIG_DFL);
    g_activeScheduler.store(nullptr);

    printReport(report);

    try {
        store.save(inventory.snapshot(std::chrono::system_clock::now()));
    } catch (const std::runtime_error &ex) {
        std::cerr << "error: " << ex.what() << "\n";
        return kExitHostFailures;
    }

    if (report.cancelled) {
        return kExitCancelled;
    }
    return report.failureCount() == 0 ? kExitOk : kExitHostFailures;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("patchfleet"));

    const QStringList args = QCoreApplication::arguments();
    bool trace = qEnvironmentVariableIntValue("PATCHFLEET_TRACE") == 1;
    if (args.contains(QStringLiteral("--trace"))) {
        trace = true;
    }
    patchfleet::logging::initLogging(QStringLiteral("patchfleet"), trace);
    PFLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               patchfleet::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", args.size()}}));

    const auto invocation = parseArguments(args);
    if (!invocation.has_value()) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    patchfleet::AppConfig config;
    try {
        config = patchfleet::loadConfigFile(invocation->configPath);
    } catch (const patchfleet::ConfigError &ex) {
        std::cerr << "error: " << ex.what() << "\n";
        return kExitUsage;
    }

    try {
        if (invocation->command == "cache-reset") {
            patchfleet::CacheStore(config.context.cacheFile).reset();
            std::cout << "Cache cleared: " << config.context.cacheFile << "\n";
            return kExitOk;
        }
        if (invocation->command == "status") {
            return runStatus(*invocation, config);
        }
        return runOperation(*invocation, config);
    } catch (const patchfleet::ConfigError &ex) {
        std::cerr << "error: " << ex.what() << "\n";
        return kExitUsage;
    } catch (const std::runtime_error &ex) {
        PFLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("command_failed"),
                    QStringLiteral("user_invocation"),
                    QStringLiteral("cli"),
                    patchfleet::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"command", invocation->command}, {"error", ex.what()}}));
        std::cerr << "error: " << ex.what() << "\n";
        return kExitHostFailures;
    }
}
