#include "providers/pkg_provider.hpp"

#include <regex>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/text_utils.hpp"

namespace patchfleet {

namespace {

// FreeBSD binary packages come from a single mirror unless pkg names one.
const char *const kDefaultSource = "Packages Mirror";

std::string auditKey(const Update &update)
{
    return update.packageName() + "-" + update.currentVersion().value_or("");
}

} // namespace

PkgProvider::PkgProvider(ProviderKind kind)
    : m_kind(kind == ProviderKind::PkgAdd ? ProviderKind::PkgAdd : ProviderKind::Pkg)
{
}

std::string PkgProvider::displayName() const
{
    return m_kind == ProviderKind::PkgAdd ? "pkg_add" : "pkg";
}

std::vector<std::string> PkgProvider::privilegedCommands() const
{
    if (m_kind == ProviderKind::PkgAdd) {
        return {};
    }
    return {"/usr/sbin/pkg update"};
}

std::vector<Update> PkgProvider::parseUpgradePlan(const std::string &output)
{
    static const std::regex upgrade(
        R"(^(\S+):\s+(\S+)\s+->\s+(\S+)(?:\s+\[([^\]]+)\])?$)");
    static const std::regex install(
        R"(^(\S+):\s+(\S+)(?:\s+\[([^\]]+)\])?$)");

    std::vector<Update> updates;
    bool inNewPackages = false;

    for (const std::string &line : nonEmptyLines(output)) {
        // Section headings end with a colon and carry no package.
        if (line.back() == ':') {
            inNewPackages = line.rfind("New packages to be INSTALLED", 0) == 0;
            continue;
        }

        std::smatch match;
        if (std::regex_match(line, match, upgrade)) {
            const std::string source = match[4].matched ? match[4].str() : kDefaultSource;
            updates.emplace_back(match[1].str(), match[2].str(), match[3].str(), false, source);
            continue;
        }
        if (inNewPackages && std::regex_match(line, match, install)) {
            const std::string source = match[3].matched ? match[3].str() : kDefaultSource;
            updates.emplace_back(match[1].str(), std::nullopt, match[2].str(), false, source);
        }
    }
    return updates;
}

std::vector<std::string> PkgProvider::parseAudit(const std::string &output)
{
    return nonEmptyLines(output);
}

std::vector<Update> PkgProvider::parsePkgAddCandidates(const std::string &output)
{
    static const std::regex pattern(
        R"(^Update candidates: ([\w\-.+]+)-([^\s]+) -> ([\w\-.+]+)-([^\s]+)$)");

    std::vector<Update> updates;
    for (const std::string &line : nonEmptyLines(output)) {
        std::smatch match;
        if (!std::regex_match(line, match, pattern)) {
            continue;
        }

        const std::string name = match[1].str();
        const std::string current = match[2].str();
        const std::string newName = match[3].str();
        const std::string next = match[4].str();

        if (name != newName) {
            PFLOG_WARN(QStringLiteral("PkgProvider"),
                       QStringLiteral("PkgProvider::parsePkgAddCandidates"),
                       QStringLiteral("renamed_candidate_skipped"),
                       QStringLiteral("refresh"),
                       QStringLiteral("name_compare"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"from", name}, {"to", newName}}));
            continue;
        }
        if (current == next) {
            continue;
        }
        updates.emplace_back(name, current, next, false, kDefaultSource);
    }
    return updates;
}

void PkgProvider::doSync(CommandContext &context)
{
    if (m_kind == ProviderKind::PkgAdd) {
        // pkg_add queries the mirror directly.
        return;
    }

    const CommandResult result = context.run("pkg update", true);
    if (!result.ok()) {
        throw CommandFailedError("pkg update failed on " + context.hostName(),
                                 result.exitCode, result.stderrText);
    }
}

std::vector<Update> PkgProvider::doFetchUpdates(CommandContext &context)
{
    if (m_kind == ProviderKind::PkgAdd) {
        return fetchOpenBsd(context);
    }
    return fetchFreeBsd(context);
}

std::vector<Update> PkgProvider::fetchFreeBsd(CommandContext &context)
{
    // pkg upgrade -n exits non-zero whenever something would change, so only
    // stderr distinguishes a real failure.
    const CommandResult plan = context.run("pkg upgrade -n");
    if (!plan.ok() && !trim(plan.stderrText).empty()) {
        throw CommandFailedError("pkg upgrade -n failed on " + context.hostName(),
                                 plan.exitCode, plan.stderrText);
    }
    const std::vector<Update> updates = parseUpgradePlan(plan.stdoutText);

    // Likewise pkg audit exits 1 when it finds vulnerable packages.
    const CommandResult audit = context.run("pkg audit -q");
    if (!audit.ok() && !trim(audit.stderrText).empty()) {
        throw CommandFailedError("pkg audit failed on " + context.hostName(),
                                 audit.exitCode, audit.stderrText);
    }
    const std::vector<std::string> vulnerable = parseAudit(audit.stdoutText);

    PFLOG_DEBUG(QStringLiteral("PkgProvider"),
                QStringLiteral("PkgProvider::fetchFreeBsd"),
                QStringLiteral("upgrade_plan_parsed"),
                QStringLiteral("refresh"),
                QStringLiteral("pkg"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{
                    {"host", context.hostName()},
                    {"updates", updates.size()},
                    {"vulnerable", vulnerable.size()}
                }));

    // Audit lists installed name-version pairs; only packages with a pending
    // upgrade can match.
    return reconcileSecurity(updates, vulnerable, &auditKey, context.hostName());
}

std::vector<Update> PkgProvider::fetchOpenBsd(CommandContext &context)
{
    const CommandResult result = context.run("/usr/sbin/pkg_add -u -v -x -n");
    if (!result.ok()) {
        throw CommandFailedError("pkg_add -u -n failed on " + context.hostName(),
                                 result.exitCode, result.stderrText);
    }
    return parsePkgAddCandidates(result.stdoutText);
}

} // namespace patchfleet
