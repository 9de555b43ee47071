#include "store/cache_store.hpp"

#include <stdexcept>
#include <utility>

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QString>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace patchfleet {

namespace {

const char *const kRemedy = "clear the cache and rediscover (patchfleet cache-reset)";

[[noreturn]] void corrupt(const std::string &detail)
{
    throw CacheCorruptionError("cache is unreadable: " + detail + "; " + kRemedy);
}

const nlohmann::json &field(const nlohmann::json &object, const char *key)
{
    if (!object.is_object() || !object.contains(key)) {
        corrupt(std::string("missing field '") + key + "'");
    }
    return object.at(key);
}

std::string stringField(const nlohmann::json &object, const char *key)
{
    const auto &value = field(object, key);
    if (!value.is_string()) {
        corrupt(std::string("field '") + key + "' is not a string");
    }
    return value.get<std::string>();
}

bool boolField(const nlohmann::json &object, const char *key)
{
    const auto &value = field(object, key);
    if (!value.is_boolean()) {
        corrupt(std::string("field '") + key + "' is not a boolean");
    }
    return value.get<bool>();
}

std::optional<std::chrono::system_clock::time_point> timestampField(const nlohmann::json &object,
                                                                    const char *key)
{
    const auto &value = field(object, key);
    if (value.is_null()) {
        return std::nullopt;
    }
    if (!value.is_string()) {
        corrupt(std::string("field '") + key + "' is not a timestamp");
    }
    auto parsed = fromIso8601Utc(value.get<std::string>());
    if (!parsed.has_value()) {
        corrupt(std::string("field '") + key + "' is not ISO-8601: " + value.get<std::string>());
    }
    return parsed;
}

nlohmann::json timestampJson(const std::optional<std::chrono::system_clock::time_point> &value)
{
    if (!value.has_value()) {
        return nullptr;
    }
    return toIso8601Utc(*value);
}

Update updateFromJson(const nlohmann::json &entry)
{
    const auto &current = field(entry, "current_version");
    if (!current.is_null() && !current.is_string()) {
        corrupt("field 'current_version' is neither a string nor null");
    }
    std::optional<std::string> currentVersion;
    if (current.is_string()) {
        currentVersion = current.get<std::string>();
    }
    return Update(stringField(entry, "package_name"),
                  currentVersion,
                  stringField(entry, "new_version"),
                  boolField(entry, "security"),
                  stringField(entry, "source"));
}

nlohmann::json hostToJson(const HostState &host)
{
    nlohmann::json updates = nlohmann::json::array();
    for (const Update &update : host.updates) {
        updates.push_back(update);
    }

    return nlohmann::json{
        {"name", host.name},
        {"address", host.address},
        {"port", host.port},
        {"username", host.username},
        {"description", host.description},
        {"state", toStateString(host.state)},
        {"os", host.os.has_value() ? nlohmann::json(*host.os) : nlohmann::json(nullptr)},
        {"provider", toProviderString(host.provider)},
        {"online", host.online},
        {"last_refresh", timestampJson(host.lastRefresh)},
        {"unsupported_reason", host.unsupportedReason},
        {"non_posix", host.nonPosix},
        {"updates", updates}
    };
}

HostState hostFromJson(const nlohmann::json &entry)
{
    HostState host;
    host.name = stringField(entry, "name");
    host.address = stringField(entry, "address");
    const auto &port = field(entry, "port");
    if (!port.is_number_integer()) {
        corrupt("field 'port' is not an integer");
    }
    host.port = port.get<int>();
    host.username = stringField(entry, "username");
    host.description = stringField(entry, "description");

    const auto state = parseStateString(stringField(entry, "state"));
    if (!state.has_value()) {
        corrupt("host '" + host.name + "' has an unknown state");
    }
    host.state = *state;

    const auto &os = field(entry, "os");
    if (!os.is_null()) {
        host.os = OsDescriptor{stringField(os, "kind"),
                               stringField(os, "flavor"),
                               stringField(os, "version")};
    }

    const auto provider = parseProviderString(stringField(entry, "provider"));
    if (!provider.has_value()) {
        corrupt("host '" + host.name + "' has an unknown provider");
    }
    host.provider = *provider;
    if (host.state == DiscoveryState::Discovered && host.provider == ProviderKind::None) {
        corrupt("discovered host '" + host.name + "' has no provider");
    }

    host.online = boolField(entry, "online");
    host.lastRefresh = timestampField(entry, "last_refresh");
    host.unsupportedReason = stringField(entry, "unsupported_reason");
    host.nonPosix = boolField(entry, "non_posix");

    const auto &updates = field(entry, "updates");
    if (!updates.is_array()) {
        corrupt("field 'updates' is not an array");
    }
    for (const auto &update : updates) {
        host.updates.push_back(updateFromJson(update));
    }
    if (!host.lastRefresh.has_value() && !host.updates.empty()) {
        corrupt("host '" + host.name + "' has updates but was never refreshed");
    }
    return host;
}

// Legacy readers: an absent or null field takes the fallback, any other
// type mismatch is corruption.
std::string legacyString(const nlohmann::json &object,
                         const char *key,
                         const std::string &fallback)
{
    if (!object.contains(key) || object.at(key).is_null()) {
        return fallback;
    }
    if (!object.at(key).is_string()) {
        corrupt(std::string("legacy field '") + key + "' is not a string");
    }
    return object.at(key).get<std::string>();
}

bool legacyBool(const nlohmann::json &object, const char *key, bool fallback)
{
    if (!object.contains(key) || object.at(key).is_null()) {
        return fallback;
    }
    if (!object.at(key).is_boolean()) {
        corrupt(std::string("legacy field '") + key + "' is not a boolean");
    }
    return object.at(key).get<bool>();
}

// v1 kept one object per host name and no connection details.
nlohmann::json migrateV1(const nlohmann::json &document)
{
    const auto &hosts = field(document, "hosts");
    if (!hosts.is_object()) {
        corrupt("legacy 'hosts' is not an object");
    }

    nlohmann::json migrated = nlohmann::json::array();
    for (const auto &item : hosts.items()) {
        const auto &legacy = item.value();
        if (!legacy.is_object()) {
            corrupt("legacy host '" + item.key() + "' is not an object");
        }

        const std::string osKind = legacyString(legacy, "os", {});
        const std::string packageManager = legacyString(legacy, "package_manager", {});
        const auto provider = parseProviderString(packageManager);
        if (!provider.has_value()) {
            corrupt("legacy host '" + item.key() + "' has unknown package manager '"
                    + packageManager + "'");
        }
        // Hosts written before the flag existed were all supported.
        const bool supported = legacyBool(legacy, "supported", true);

        std::string state = "unknown";
        std::string reason;
        if (!osKind.empty()) {
            if (supported && *provider != ProviderKind::None) {
                state = "discovered";
            } else {
                state = "unsupported";
                reason = "unsupported platform";
            }
        }

        nlohmann::json os = nullptr;
        if (!osKind.empty()) {
            os = nlohmann::json{
                {"kind", osKind},
                {"flavor", legacyString(legacy, "flavor", {})},
                {"version", legacyString(legacy, "version", {})}
            };
        }

        nlohmann::json updates = nlohmann::json::array();
        if (legacy.contains("updates") && !legacy.at("updates").is_null()) {
            if (!legacy.at("updates").is_array()) {
                corrupt("legacy 'updates' is not an array");
            }
            for (const auto &update : legacy.at("updates")) {
                if (!update.is_object()) {
                    corrupt("legacy update entry is not an object");
                }
                nlohmann::json current = nullptr;
                if (update.contains("current_version") && !update.at("current_version").is_null()) {
                    current = legacyString(update, "current_version", {});
                }
                updates.push_back(nlohmann::json{
                    {"package_name", legacyString(update, "name", {})},
                    {"current_version", current},
                    {"new_version", legacyString(update, "new_version", {})},
                    {"security", legacyBool(update, "security", false)},
                    {"source", legacyString(update, "source", {})}
                });
            }
        }

        nlohmann::json lastRefresh = nullptr;
        const std::string legacyRefresh = legacyString(legacy, "last_refresh", {});
        if (!legacyRefresh.empty()) {
            // Naive legacy timestamps are local time; re-encoded as UTC with
            // a zone designator.
            const auto parsed = fromIso8601Utc(legacyRefresh);
            if (!parsed.has_value()) {
                corrupt("legacy 'last_refresh' is not ISO-8601");
            }
            lastRefresh = toIso8601Utc(*parsed);
        }

        if (lastRefresh.is_null() && !updates.empty()) {
            // Updates are only meaningful with the refresh that produced them.
            PFLOG_WARN(QStringLiteral("CacheStore"),
                       QStringLiteral("migrateV1"),
                       QStringLiteral("legacy_updates_dropped"),
                       QStringLiteral("no_last_refresh"),
                       QStringLiteral("schema_migration"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"host", item.key()}, {"updates", updates.size()}}));
            updates = nlohmann::json::array();
        }

        migrated.push_back(nlohmann::json{
            {"name", item.key()},
            {"address", ""},
            {"port", 22},
            {"username", ""},
            {"description", ""},
            {"state", state},
            {"os", os},
            {"provider", toProviderString(*provider)},
            {"online", legacyBool(legacy, "online", false)},
            {"last_refresh", lastRefresh},
            {"unsupported_reason", reason},
            {"non_posix", false},
            {"updates", updates}
        });
    }

    return nlohmann::json{
        {"schema_version", 2},
        {"snapshot_time", toIso8601Utc(nowUtc())},
        {"hosts", migrated}
    };
}

} // namespace

CacheStore::CacheStore(std::string path)
    : m_path(std::move(path))
{
}

int CacheStore::schemaVersionOf(const nlohmann::json &document)
{
    if (!document.is_object()) {
        corrupt("top level is not an object");
    }
    const char *key = document.contains("schema_version") ? "schema_version" : "state_version";
    if (!document.contains(key) || !document.at(key).is_number_integer()) {
        corrupt("no schema version");
    }
    const int version = document.at(key).get<int>();
    if (version < 1 || version > kCurrentSchemaVersion) {
        throw CacheCorruptionError("cache schema version " + std::to_string(version)
                                   + " is not supported; " + kRemedy);
    }
    return version;
}

nlohmann::json CacheStore::migrate(const nlohmann::json &document)
{
    try {
        nlohmann::json current = document;
        int version = schemaVersionOf(current);
        while (version < kCurrentSchemaVersion) {
            if (version == 1) {
                current = migrateV1(current);
            }
            version = schemaVersionOf(current);
        }
        return current;
    } catch (const nlohmann::json::exception &ex) {
        corrupt(std::string("legacy document: ") + ex.what());
    }
}

nlohmann::json CacheStore::serialize(const InventorySnapshot &snapshot)
{
    nlohmann::json hosts = nlohmann::json::array();
    for (const HostState &host : snapshot.hosts) {
        hosts.push_back(hostToJson(host));
    }
    return nlohmann::json{
        {"schema_version", snapshot.schemaVersion},
        {"snapshot_time", toIso8601Utc(snapshot.snapshotTime)},
        {"hosts", hosts}
    };
}

InventorySnapshot CacheStore::deserialize(const nlohmann::json &document)
{
    try {
        if (schemaVersionOf(document) != kCurrentSchemaVersion) {
            corrupt("document is not in the current schema");
        }

        InventorySnapshot snapshot;
        snapshot.schemaVersion = kCurrentSchemaVersion;
        const auto snapshotTime = timestampField(document, "snapshot_time");
        if (!snapshotTime.has_value()) {
            corrupt("'snapshot_time' is null");
        }
        snapshot.snapshotTime = *snapshotTime;

        const auto &hosts = field(document, "hosts");
        if (!hosts.is_array()) {
            corrupt("'hosts' is not an array");
        }
        for (const auto &entry : hosts) {
            snapshot.hosts.push_back(hostFromJson(entry));
        }
        return snapshot;
    } catch (const nlohmann::json::exception &ex) {
        corrupt(ex.what());
    }
}

Update CacheStore::deserializeUpdate(const nlohmann::json &entry)
{
    try {
        return updateFromJson(entry);
    } catch (const nlohmann::json::exception &ex) {
        corrupt(ex.what());
    }
}

std::optional<InventorySnapshot> CacheStore::load()
{
    QFile file(QString::fromStdString(m_path));
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw std::runtime_error("failed to open cache file " + m_path + ": "
                                 + file.errorString().toStdString());
    }
    const QByteArray raw = file.readAll();
    file.close();

    const auto document = nlohmann::json::parse(raw.constData(), raw.constData() + raw.size(),
                                                nullptr, false);
    if (document.is_discarded()) {
        corrupt("not valid JSON");
    }

    const int version = schemaVersionOf(document);
    if (version == kCurrentSchemaVersion) {
        return deserialize(document);
    }

    InventorySnapshot snapshot = deserialize(migrate(document));

    PFLOG_INFO(QStringLiteral("CacheStore"),
               QStringLiteral("CacheStore::load"),
               QStringLiteral("cache_migrated"),
               QStringLiteral("old_schema"),
               QStringLiteral("rewrite_in_place"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{
                   {"path", m_path},
                   {"from", version},
                   {"to", kCurrentSchemaVersion},
                   {"hosts", snapshot.hosts.size()}
               }));

    save(snapshot);
    return snapshot;
}

void CacheStore::save(const InventorySnapshot &snapshot)
{
    const QString path = QString::fromStdString(m_path);
    const QString dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir)) {
        throw std::runtime_error("failed to create cache directory " + dir.toStdString());
    }

    const std::string payload = serialize(snapshot).dump(2);

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw std::runtime_error("failed to open cache file " + m_path + ": "
                                 + file.errorString().toStdString());
    }
    const qint64 written = file.write(payload.data(), static_cast<qint64>(payload.size()));
    if (written != static_cast<qint64>(payload.size())) {
        file.cancelWriting();
        throw std::runtime_error("short write to cache file " + m_path);
    }
    if (!file.commit()) {
        throw std::runtime_error("failed to replace cache file " + m_path + ": "
                                 + file.errorString().toStdString());
    }

    PFLOG_DEBUG(QStringLiteral("CacheStore"),
                QStringLiteral("CacheStore::save"),
                QStringLiteral("cache_saved"),
                QStringLiteral("persist_snapshot"),
                QStringLiteral("qsavefile_commit"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{
                    {"path", m_path},
                    {"hosts", snapshot.hosts.size()},
                    {"bytes", payload.size()}
                }));
}

void CacheStore::reset()
{
    QFile file(QString::fromStdString(m_path));
    if (file.exists() && !file.remove()) {
        throw std::runtime_error("failed to remove cache file " + m_path + ": "
                                 + file.errorString().toStdString());
    }

    PFLOG_INFO(QStringLiteral("CacheStore"),
               QStringLiteral("CacheStore::reset"),
               QStringLiteral("cache_reset"),
               QStringLiteral("operator_request"),
               QStringLiteral("file_remove"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"path", m_path}}));
}

} // namespace patchfleet
