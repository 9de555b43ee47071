#include "providers/dnf_provider.hpp"

#include <algorithm>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/text_utils.hpp"

namespace patchfleet {

namespace {

// check-update exits 100 when updates are pending and 0 when there are none.
constexpr int kUpdatesAvailable = 100;

constexpr size_t kInstalledBatchSize = 64;

std::string packageName(const Update &update)
{
    return update.packageName();
}

} // namespace

DnfProvider::DnfProvider(ProviderKind kind)
    : m_kind(kind == ProviderKind::Yum ? ProviderKind::Yum : ProviderKind::Dnf)
    , m_binary(m_kind == ProviderKind::Yum ? "yum" : "dnf")
{
}

std::vector<DnfPackageLine> DnfProvider::parsePackageList(const std::string &output)
{
    std::vector<DnfPackageLine> rows;
    std::string pending;

    for (const std::string &line : nonEmptyLines(output)) {
        if (line.rfind("Obsoleting Packages", 0) == 0) {
            break;
        }
        if (line.rfind("Last metadata expiration", 0) == 0
            || line == "Installed Packages"
            || line == "Available Upgrades") {
            continue;
        }

        std::vector<std::string> tokens = splitWhitespace(pending.empty() ? line
                                                                          : pending + " " + line);
        if (tokens.size() < 3) {
            // Wrapped name; the version and repository follow on the next line.
            pending = tokens.size() == 1 ? tokens.front() : std::string();
            continue;
        }
        pending.clear();
        rows.push_back(DnfPackageLine{tokens[0], tokens[1], tokens[2]});
    }
    return rows;
}

std::map<std::string, std::string> DnfProvider::parseInstalled(const std::string &output)
{
    std::map<std::string, std::string> versions;
    std::map<std::string, int> counts;
    for (const DnfPackageLine &row : parsePackageList(output)) {
        versions[row.name] = row.version;
        ++counts[row.name];
    }
    for (auto &[name, version] : versions) {
        if (counts[name] > 1) {
            version += " (+)";
        }
    }
    return versions;
}

void DnfProvider::doSync(CommandContext &context)
{
    const CommandResult result = context.run(m_binary + " --quiet -y makecache --refresh");
    if (!result.ok()) {
        throw CommandFailedError(m_binary + " makecache failed on " + context.hostName(),
                                 result.exitCode, result.stderrText);
    }
}

std::vector<DnfPackageLine> DnfProvider::checkUpdate(CommandContext &context, bool securityOnly)
{
    const std::string command = m_binary + " --quiet -y check-update"
        + (securityOnly ? " --security" : "");
    const CommandResult result = context.run(command);

    if (result.exitCode == 0) {
        return {};
    }
    if (result.exitCode != kUpdatesAvailable) {
        throw CommandFailedError(command + " failed on " + context.hostName(),
                                 result.exitCode, result.stderrText);
    }
    return parsePackageList(result.stdoutText);
}

std::map<std::string, std::string> DnfProvider::installedVersions(
    CommandContext &context, const std::vector<std::string> &names)
{
    std::map<std::string, std::string> versions;

    for (size_t offset = 0; offset < names.size(); offset += kInstalledBatchSize) {
        std::string command = m_binary + " list installed --quiet";
        const size_t end = std::min(names.size(), offset + kInstalledBatchSize);
        for (size_t i = offset; i < end; ++i) {
            command += " '" + names[i] + "'";
        }

        const CommandResult result = context.run(command);
        // Exit 1 means none of the names is installed.
        if (!result.ok() && !(result.exitCode == 1 && trim(result.stdoutText).empty())) {
            throw CommandFailedError(m_binary + " list installed failed on "
                                         + context.hostName(),
                                     result.exitCode, result.stderrText);
        }
        for (auto &[name, version] : parseInstalled(result.stdoutText)) {
            versions[name] = version;
        }
    }
    return versions;
}

std::vector<Update> DnfProvider::doFetchUpdates(CommandContext &context)
{
    const std::vector<DnfPackageLine> available = checkUpdate(context, false);
    if (available.empty()) {
        return {};
    }

    std::vector<std::string> names;
    names.reserve(available.size());
    for (const auto &row : available) {
        names.push_back(row.name);
    }
    const auto installed = installedVersions(context, names);

    std::vector<Update> updates;
    updates.reserve(available.size());
    for (const auto &row : available) {
        std::optional<std::string> current;
        auto it = installed.find(row.name);
        if (it != installed.end()) {
            current = it->second;
        }
        updates.emplace_back(row.name, current, row.version, false, row.repository);
    }

    std::vector<std::string> securityNames;
    for (const auto &row : checkUpdate(context, true)) {
        securityNames.push_back(row.name);
    }

    PFLOG_DEBUG(QStringLiteral("DnfProvider"),
                QStringLiteral("DnfProvider::doFetchUpdates"),
                QStringLiteral("check_update_parsed"),
                QStringLiteral("refresh"),
                QString::fromStdString(m_binary),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{
                    {"host", context.hostName()},
                    {"available", available.size()},
                    {"installedResolved", installed.size()},
                    {"security", securityNames.size()}
                }));

    return reconcileSecurity(updates, securityNames, &packageName, context.hostName());
}

} // namespace patchfleet
