#pragma once

#include <optional>
#include <string>
#include <vector>

#include "providers/provider.hpp"

namespace patchfleet {

// BSD package managers. ProviderKind::Pkg is FreeBSD pkg(8) with pkg audit
// for security; ProviderKind::PkgAdd is OpenBSD pkg_add, which has no
// repository sync and no security metadata.
class PkgProvider : public Provider
{
public:
    explicit PkgProvider(ProviderKind kind = ProviderKind::Pkg);

    ProviderKind kind() const override { return m_kind; }
    std::string displayName() const override;
    std::vector<std::string> privilegedCommands() const override;

    // `pkg upgrade -n` dry run: "name: old -> new [repo]" lines, plus
    // "name: version [repo]" lines under the newly-installed heading.
    static std::vector<Update> parseUpgradePlan(const std::string &output);

    // `pkg audit -q`: one "name-version" per vulnerable package.
    static std::vector<std::string> parseAudit(const std::string &output);

    // `pkg_add -u -v -x -n`: "Update candidates: a-1 -> a-2" lines.
    // Renames and same-version candidates are skipped.
    static std::vector<Update> parsePkgAddCandidates(const std::string &output);

protected:
    void doSync(CommandContext &context) override;
    std::vector<Update> doFetchUpdates(CommandContext &context) override;

private:
    std::vector<Update> fetchFreeBsd(CommandContext &context);
    std::vector<Update> fetchOpenBsd(CommandContext &context);

    ProviderKind m_kind;
};

} // namespace patchfleet
