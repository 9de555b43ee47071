#pragma once

#include <optional>
#include <string>
#include <vector>

#include "providers/provider.hpp"

namespace patchfleet {

// Debian and Ubuntu. Security is attributed from the repository label of
// each simulated install, so there is no separate security query.
class AptProvider : public Provider
{
public:
    ProviderKind kind() const override { return ProviderKind::Apt; }
    std::string displayName() const override { return "apt"; }
    std::vector<std::string> privilegedCommands() const override;

    // Parses one "Inst" line of `apt-get dist-upgrade -s`. Returns nullopt
    // for lines that are not Inst lines and throws ParseError for Inst lines
    // that do not have the expected shape.
    static std::optional<Update> parseInstLine(const std::string &line);

    static std::vector<Update> parseSimulation(const std::string &output);

protected:
    void doSync(CommandContext &context) override;
    std::vector<Update> doFetchUpdates(CommandContext &context) override;
};

} // namespace patchfleet
