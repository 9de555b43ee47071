#include "providers/provider.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/sudo_policy.hpp"
#include "providers/apt_provider.hpp"
#include "providers/dnf_provider.hpp"
#include "providers/pkg_provider.hpp"

namespace patchfleet {

namespace {

bool looksLikeSudoRefusal(const CommandResult &result)
{
    return result.stderrText.find("sudo:") != std::string::npos
        || result.stderrText.find("a password is required") != std::string::npos;
}

void logSkipped(const Provider &provider,
                const CommandContext &context,
                const QString &where,
                ProviderOperation operation)
{
    PFLOG_WARN(QStringLiteral("Provider"),
               where,
               QStringLiteral("operation_skipped_privileged"),
               QStringLiteral("sudo_policy_forbids_elevation"),
               QStringLiteral("SudoPolicyResolver::isPermitted"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{
                   {"host", context.hostName()},
                   {"provider", provider.displayName()},
                   {"operation", static_cast<int>(operation)},
                   {"policy", toSudoPolicyString(context.policy())}
               }));
}

} // namespace

CommandResult CommandContext::run(const std::string &command, bool elevated)
{
    const std::string effective = elevated ? "sudo -n " + command : command;

    PFLOG_DEBUG(QStringLiteral("Provider"),
                QStringLiteral("CommandContext::run"),
                QStringLiteral("command_start"),
                QStringLiteral("provider_query"),
                QStringLiteral("transport_run"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{
                    {"host", m_hostName},
                    {"command", effective},
                    {"timeoutMs", m_timeout.count()}
                }));

    CommandResult result = m_transport.run(effective, m_timeout);

    PFLOG_DEBUG(QStringLiteral("Provider"),
                QStringLiteral("CommandContext::run"),
                QStringLiteral("command_end"),
                QStringLiteral("provider_query"),
                QStringLiteral("transport_run"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{
                    {"host", m_hostName},
                    {"command", effective},
                    {"exitCode", result.exitCode},
                    {"stdoutBytes", result.stdoutText.size()},
                    {"stderrBytes", result.stderrText.size()}
                }));

    if (elevated && !result.ok() && looksLikeSudoRefusal(result)) {
        throw PrivilegeError("sudo refused '" + command + "' on " + m_hostName
                             + ": " + result.stderrText);
    }
    return result;
}

SyncResult Provider::syncRepositories(CommandContext &context)
{
    if (!SudoPolicyResolver::canSync(context.policy(), kind())) {
        logSkipped(*this, context, QStringLiteral("Provider::syncRepositories"),
                   ProviderOperation::SyncRepositories);
        return SyncResult{StepStatus::SkippedPrivileged,
                          "repository sync needs sudo; skipped by policy"};
    }

    doSync(context);
    return SyncResult{};
}

FetchResult Provider::fetchUpdates(CommandContext &context)
{
    if (!SudoPolicyResolver::isPermitted(context.policy(), kind(),
                                         ProviderOperation::FetchUpdates)) {
        logSkipped(*this, context, QStringLiteral("Provider::fetchUpdates"),
                   ProviderOperation::FetchUpdates);
        return FetchResult{StepStatus::SkippedPrivileged, {},
                           "update query needs sudo; skipped by policy"};
    }

    FetchResult result;
    result.updates = doFetchUpdates(context);

    PFLOG_INFO(QStringLiteral("Provider"),
               QStringLiteral("Provider::fetchUpdates"),
               QStringLiteral("updates_fetched"),
               QStringLiteral("refresh"),
               QString::fromStdString(displayName()),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{
                   {"host", context.hostName()},
                   {"count", result.updates.size()},
                   {"security", std::count_if(result.updates.begin(),
                                              result.updates.end(),
                                              [](const Update &u) { return u.security(); })}
               }));
    return result;
}

FetchResult Provider::fetchSecurityUpdates(CommandContext &context)
{
    if (!SudoPolicyResolver::isPermitted(context.policy(), kind(),
                                         ProviderOperation::FetchSecurityUpdates)) {
        logSkipped(*this, context, QStringLiteral("Provider::fetchSecurityUpdates"),
                   ProviderOperation::FetchSecurityUpdates);
        return FetchResult{StepStatus::SkippedPrivileged, {},
                           "security query needs sudo; skipped by policy"};
    }

    FetchResult all = fetchUpdates(context);
    FetchResult result;
    std::copy_if(all.updates.begin(), all.updates.end(),
                 std::back_inserter(result.updates),
                 [](const Update &update) { return update.security(); });
    return result;
}

std::vector<Update> reconcileSecurity(const std::vector<Update> &updates,
                                      const std::vector<std::string> &securityKeys,
                                      std::string (*keyOf)(const Update &),
                                      const std::string &hostName)
{
    const std::unordered_set<std::string> keys(securityKeys.begin(), securityKeys.end());
    std::unordered_set<std::string> matched;

    std::vector<Update> result;
    result.reserve(updates.size());
    for (const Update &update : updates) {
        const std::string key = keyOf(update);
        if (keys.contains(key)) {
            matched.insert(key);
            result.push_back(update.withSecurity(true));
        } else {
            result.push_back(update);
        }
    }

    for (const std::string &key : securityKeys) {
        if (matched.contains(key)) {
            continue;
        }
        PFLOG_WARN(QStringLiteral("Provider"),
                   QStringLiteral("reconcileSecurity"),
                   QStringLiteral("security_entry_dropped"),
                   QStringLiteral("no_match_in_update_list"),
                   QStringLiteral("key_match"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{
                       {"host", hostName},
                       {"key", key}
                   }));
    }

    return result;
}

std::unique_ptr<Provider> createProvider(ProviderKind kind)
{
    switch (kind) {
    case ProviderKind::Apt:
        return std::make_unique<AptProvider>();
    case ProviderKind::Dnf:
    case ProviderKind::Yum:
        return std::make_unique<DnfProvider>(kind);
    case ProviderKind::Pkg:
    case ProviderKind::PkgAdd:
        return std::make_unique<PkgProvider>(kind);
    case ProviderKind::None:
        break;
    }
    throw OperationNotSupportedError("no provider for kind '" + toProviderString(kind) + "'");
}

} // namespace patchfleet
