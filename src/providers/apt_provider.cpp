#include "providers/apt_provider.hpp"

#include <regex>

#include "common/errors.hpp"
#include "common/text_utils.hpp"

namespace patchfleet {

std::vector<std::string> AptProvider::privilegedCommands() const
{
    return {"/usr/bin/apt-get update"};
}

std::optional<Update> AptProvider::parseInstLine(const std::string &line)
{
    if (line.rfind("Inst ", 0) != 0) {
        return std::nullopt;
    }

    // Inst <name> [<current>] (<new> <source> [<arch>])
    // The bracketed current version is absent for packages that are being
    // newly pulled in as dependencies.
    static const std::regex pattern(
        R"(^Inst\s+(\S+)\s+(?:\[([^\]]+)\]\s+)?\((\S+)\s+(.+?)\s+\[[^\]]+\]\))");

    std::smatch match;
    if (!std::regex_search(line, match, pattern)) {
        throw ParseError("unrecognized apt simulation line: " + line);
    }

    std::optional<std::string> current;
    if (match[2].matched) {
        current = trim(match[2].str());
    }
    const std::string source = trim(match[4].str());
    const bool security = toLower(source).find("security") != std::string::npos;

    return Update(trim(match[1].str()), current, trim(match[3].str()), security, source);
}

std::vector<Update> AptProvider::parseSimulation(const std::string &output)
{
    std::vector<Update> updates;
    for (const std::string &line : nonEmptyLines(output)) {
        auto update = parseInstLine(line);
        if (update.has_value()) {
            updates.push_back(std::move(*update));
        }
    }
    return updates;
}

void AptProvider::doSync(CommandContext &context)
{
    const CommandResult result = context.run("apt-get update", true);
    if (!result.ok()) {
        throw CommandFailedError("apt-get update failed on " + context.hostName(),
                                 result.exitCode, result.stderrText);
    }
}

std::vector<Update> AptProvider::doFetchUpdates(CommandContext &context)
{
    // Inst lines are filtered here rather than with a remote grep, whose
    // exit status would conflate "no updates" with failure.
    const CommandResult result = context.run("apt-get dist-upgrade -s");
    if (!result.ok()) {
        throw CommandFailedError("apt-get dist-upgrade -s failed on " + context.hostName(),
                                 result.exitCode, result.stderrText);
    }
    return parseSimulation(result.stdoutText);
}

} // namespace patchfleet
