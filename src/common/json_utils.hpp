#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <QDateTime>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace patchfleet {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            timestamp.time_since_epoch())
                            .count();
    const QDateTime dt = QDateTime::fromMSecsSinceEpoch(millis, Qt::UTC);
    return dt.toString(Qt::ISODateWithMs).toStdString();
}

// Accepts ISO-8601 with or without milliseconds. A value without a zone
// designator is local time of this machine, which is how legacy caches
// wrote them.
inline std::optional<std::chrono::system_clock::time_point> fromIso8601Utc(
    const std::string &value)
{
    QDateTime dt = QDateTime::fromString(QString::fromStdString(value), Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(QString::fromStdString(value), Qt::ISODate);
    }
    if (!dt.isValid()) {
        return std::nullopt;
    }
    if (dt.timeSpec() == Qt::LocalTime) {
        dt = dt.toUTC();
    }
    return std::chrono::system_clock::time_point{
        std::chrono::milliseconds{dt.toMSecsSinceEpoch()}};
}

inline std::string toProviderString(ProviderKind kind)
{
    switch (kind) {
    case ProviderKind::None:
        return "none";
    case ProviderKind::Apt:
        return "apt";
    case ProviderKind::Dnf:
        return "dnf";
    case ProviderKind::Yum:
        return "yum";
    case ProviderKind::Pkg:
        return "pkg";
    case ProviderKind::PkgAdd:
        return "pkg_add";
    }
    return "none";
}

inline std::optional<ProviderKind> parseProviderString(const std::string &value)
{
    if (value == "none" || value.empty()) {
        return ProviderKind::None;
    }
    if (value == "apt") {
        return ProviderKind::Apt;
    }
    if (value == "dnf") {
        return ProviderKind::Dnf;
    }
    if (value == "yum") {
        return ProviderKind::Yum;
    }
    if (value == "pkg") {
        return ProviderKind::Pkg;
    }
    if (value == "pkg_add") {
        return ProviderKind::PkgAdd;
    }
    return std::nullopt;
}

inline std::string toStateString(DiscoveryState state)
{
    switch (state) {
    case DiscoveryState::Unknown:
        return "unknown";
    case DiscoveryState::Discovering:
        return "discovering";
    case DiscoveryState::Discovered:
        return "discovered";
    case DiscoveryState::Unsupported:
        return "unsupported";
    }
    return "unknown";
}

inline std::optional<DiscoveryState> parseStateString(const std::string &value)
{
    if (value == "unknown") {
        return DiscoveryState::Unknown;
    }
    if (value == "discovered") {
        return DiscoveryState::Discovered;
    }
    if (value == "unsupported") {
        return DiscoveryState::Unsupported;
    }
    return std::nullopt;
}

inline std::string toSudoPolicyString(SudoPolicy policy)
{
    switch (policy) {
    case SudoPolicy::Skip:
        return "skip";
    case SudoPolicy::Nopasswd:
        return "nopasswd";
    }
    return "skip";
}

inline std::optional<SudoPolicy> parseSudoPolicyString(const std::string &value)
{
    if (value == "skip") {
        return SudoPolicy::Skip;
    }
    if (value == "nopasswd") {
        return SudoPolicy::Nopasswd;
    }
    return std::nullopt;
}

inline std::string toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return "ok";
    case ErrorKind::Connection:
        return "connection_error";
    case ErrorKind::Authentication:
        return "authentication_error";
    case ErrorKind::UnsupportedPlatform:
        return "unsupported_platform";
    case ErrorKind::Privilege:
        return "privilege_error";
    case ErrorKind::Parse:
        return "parse_error";
    case ErrorKind::CacheCorruption:
        return "cache_corruption";
    case ErrorKind::OperationNotSupported:
        return "operation_not_supported";
    case ErrorKind::CommandFailed:
        return "command_failed";
    case ErrorKind::Busy:
        return "busy";
    case ErrorKind::Superseded:
        return "superseded";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::UnknownHost:
        return "unknown_host";
    case ErrorKind::Internal:
        return "internal_error";
    }
    return "internal_error";
}

inline void to_json(nlohmann::json &j, const OsDescriptor &os)
{
    j = nlohmann::json{
        {"kind", os.kind},
        {"flavor", os.flavor},
        {"version", os.version}
    };
}

} // namespace patchfleet

namespace nlohmann {

// Update has no default constructor, so it goes through adl_serializer.
// Encoding only; CacheStore::deserializeUpdate is the one decoder.
template <>
struct adl_serializer<patchfleet::Update> {
    static void to_json(json &j, const patchfleet::Update &update)
    {
        j = json{
            {"package_name", update.packageName()},
            {"current_version", update.currentVersion().has_value()
                 ? json(*update.currentVersion())
                 : json(nullptr)},
            {"new_version", update.newVersion()},
            {"security", update.security()},
            {"source", update.source()}
        };
    }
};

} // namespace nlohmann
