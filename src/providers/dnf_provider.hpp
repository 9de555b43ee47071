#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "providers/provider.hpp"

namespace patchfleet {

// One row of `check-update` or `list installed` output.
struct DnfPackageLine {
    std::string name;
    std::string version;
    std::string repository;
};

// RHEL, Fedora and CentOS. Yum behaves the same apart from the binary name.
class DnfProvider : public Provider
{
public:
    explicit DnfProvider(ProviderKind kind = ProviderKind::Dnf);

    ProviderKind kind() const override { return m_kind; }
    std::string displayName() const override { return m_binary; }

    const std::string &binary() const { return m_binary; }

    // Rows of check-update output up to the "Obsoleting Packages" section.
    // dnf wraps long package names onto their own line; those are joined.
    static std::vector<DnfPackageLine> parsePackageList(const std::string &output);

    // Latest installed version per package. With several installed versions
    // (kernels) the last one listed wins and is marked " (+)".
    static std::map<std::string, std::string> parseInstalled(const std::string &output);

protected:
    void doSync(CommandContext &context) override;
    std::vector<Update> doFetchUpdates(CommandContext &context) override;

private:
    std::vector<DnfPackageLine> checkUpdate(CommandContext &context, bool securityOnly);
    std::map<std::string, std::string> installedVersions(CommandContext &context,
                                                         const std::vector<std::string> &names);

    ProviderKind m_kind;
    std::string m_binary;
};

} // namespace patchfleet
