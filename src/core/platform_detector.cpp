#include "core/platform_detector.hpp"

#include <regex>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/text_utils.hpp"

namespace patchfleet {

namespace {

ProviderKind providerForFlavor(const std::string &flavor)
{
    if (flavor == "ubuntu" || flavor == "debian") {
        return ProviderKind::Apt;
    }
    if (flavor == "rhel" || flavor == "fedora" || flavor == "centos") {
        return ProviderKind::Dnf;
    }
    return ProviderKind::None;
}

std::string firstLine(const std::string &text)
{
    const auto lines = nonEmptyLines(text);
    return lines.empty() ? std::string() : lines.front();
}

// Queries that may legitimately fail (missing file, missing key) yield "".
std::string optionalQuery(Transport &transport,
                          const std::string &command,
                          std::chrono::milliseconds timeout)
{
    const CommandResult result = transport.run(command, timeout);
    if (!result.ok()) {
        return std::string();
    }
    return firstLine(result.stdoutText);
}

// Red Hat family hosts older than dnf only ship yum.
ProviderKind rpmProvider(Transport &transport, std::chrono::milliseconds timeout)
{
    if (transport.run("command -v dnf", timeout).ok()) {
        return ProviderKind::Dnf;
    }
    if (transport.run("command -v yum", timeout).ok()) {
        return ProviderKind::Yum;
    }
    return ProviderKind::None;
}

PlatformInfo detectLinux(Transport &transport, std::chrono::milliseconds timeout)
{
    PlatformInfo info;
    info.os.kind = "linux";

    const std::string idLine = optionalQuery(transport, "grep ^ID= /etc/os-release", timeout);
    if (idLine.empty()) {
        info.unsupportedReason = "no ID in /etc/os-release";
        return info;
    }

    const std::string id = osReleaseValue(idLine);
    info.os.flavor = id;
    info.os.version = osReleaseValue(
        optionalQuery(transport, "grep ^VERSION_ID= /etc/os-release", timeout));

    info.provider = providerForFlavor(id);
    if (info.provider == ProviderKind::None) {
        const std::string likeLine =
            optionalQuery(transport, "grep ^ID_LIKE= /etc/os-release", timeout);
        for (const std::string &like : splitWhitespace(osReleaseValue(likeLine))) {
            const ProviderKind kind = providerForFlavor(like);
            if (kind != ProviderKind::None) {
                info.os.flavor = like;
                info.provider = kind;
                break;
            }
        }
    }

    if (info.provider == ProviderKind::None) {
        info.unsupportedReason = "unsupported Linux flavor '" + id + "'";
        return info;
    }

    if (info.provider == ProviderKind::Dnf) {
        info.provider = rpmProvider(transport, timeout);
        if (info.provider == ProviderKind::None) {
            info.unsupportedReason = "neither dnf nor yum found";
        }
    }
    return info;
}

} // namespace

std::string osReleaseValue(const std::string &line)
{
    const auto eq = line.find('=');
    std::string value = trim(eq == std::string::npos ? line : line.substr(eq + 1));
    if (value.size() >= 2
        && (value.front() == '"' || value.front() == '\'')
        && value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }
    return toLower(trim(value));
}

PlatformInfo detectPlatform(Transport &transport, std::chrono::milliseconds timeout)
{
    const CommandResult uname = transport.run("uname -s", timeout);
    const std::string system = firstLine(uname.stdoutText);

    // A shell that cannot run uname, or answers with something that is not a
    // kernel name, is not a POSIX system.
    static const std::regex identifier(R"(^[A-Za-z][A-Za-z0-9_\-]*$)");
    if (!uname.ok() || !std::regex_match(system, identifier)) {
        throw UnsupportedPlatformError("host did not answer `uname -s` like a POSIX system"
                                       " (exit " + std::to_string(uname.exitCode) + ")");
    }

    const std::string kind = toLower(system);
    PlatformInfo info;

    if (kind == "linux") {
        info = detectLinux(transport, timeout);
    } else if (kind == "freebsd" || kind == "openbsd") {
        info.os.kind = kind;
        info.os.flavor = kind;
        info.os.version = firstLine(transport.run("uname -r", timeout).stdoutText);
        info.provider = kind == "freebsd" ? ProviderKind::Pkg : ProviderKind::PkgAdd;
    } else {
        info.os.kind = kind;
        info.os.flavor = kind;
        info.os.version = optionalQuery(transport, "uname -r", timeout);
        info.unsupportedReason = "unsupported operating system '" + kind + "'";
    }

    PFLOG_DEBUG(QStringLiteral("PlatformDetector"),
                QStringLiteral("detectPlatform"),
                QStringLiteral("platform_detected"),
                QStringLiteral("discovery"),
                QStringLiteral("uname_os_release"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{
                    {"os", info.os},
                    {"provider", toProviderString(info.provider)},
                    {"reason", info.unsupportedReason}
                }));

    return info;
}

} // namespace patchfleet
