#include "common/config.hpp"

#include <fstream>
#include <set>
#include <string>

#include <QByteArray>
#include <QString>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace patchfleet {

namespace {

const std::set<std::string> kKnownOptions = {
    "default_sudo_policy",
    "connect_timeout",
    "command_timeout",
    "ping_timeout",
    "cancel_grace",
    "max_workers",
    "stale_threshold",
    "cache_file",
    "default_username",
    "ssh_binary",
};

// Longest accepted duration; anything above is a typo, not a timeout.
constexpr int kMaxDurationSeconds = 24 * 60 * 60;

// Durations are configured in (possibly fractional) seconds.
std::chrono::milliseconds secondsValue(const nlohmann::json &value, const std::string &key)
{
    if (!value.is_number()) {
        throw ConfigError("option '" + key + "' must be a number of seconds");
    }
    const double seconds = value.get<double>();
    if (seconds <= 0) {
        throw ConfigError("option '" + key + "' must be positive");
    }
    if (seconds > kMaxDurationSeconds) {
        throw ConfigError("option '" + key + "' must not exceed "
                          + std::to_string(kMaxDurationSeconds) + " seconds");
    }
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::string stringValue(const nlohmann::json &value, const std::string &key)
{
    if (!value.is_string()) {
        throw ConfigError("option '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

SudoPolicy sudoPolicyValue(const nlohmann::json &value, const std::string &key)
{
    const auto policy = parseSudoPolicyString(stringValue(value, key));
    if (!policy.has_value()) {
        throw ConfigError("option '" + key + "' must be 'skip' or 'nopasswd'");
    }
    return *policy;
}

void applyOptions(RunContext &context, const nlohmann::json &options)
{
    if (!options.is_object()) {
        throw ConfigError("'options' must be an object");
    }

    for (const auto &item : options.items()) {
        const std::string &key = item.key();
        const auto &value = item.value();

        if (!kKnownOptions.contains(key)) {
            PFLOG_WARN(QStringLiteral("Config"),
                       QStringLiteral("applyOptions"),
                       QStringLiteral("unknown_option_ignored"),
                       QStringLiteral("config_load"),
                       QStringLiteral("key_filter"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"key", key}});
            continue;
        }

        if (key == "default_sudo_policy") {
            context.defaultSudoPolicy = sudoPolicyValue(value, key);
        } else if (key == "connect_timeout") {
            context.connectTimeout = secondsValue(value, key);
        } else if (key == "command_timeout") {
            context.commandTimeout = secondsValue(value, key);
        } else if (key == "ping_timeout") {
            context.pingTimeout = secondsValue(value, key);
        } else if (key == "cancel_grace") {
            context.cancelGracePeriod = secondsValue(value, key);
        } else if (key == "max_workers") {
            if (!value.is_number_integer() || value.get<int>() < 1) {
                throw ConfigError("option 'max_workers' must be a positive integer");
            }
            context.maxWorkers = value.get<int>();
        } else if (key == "stale_threshold") {
            if (!value.is_number_integer() || value.get<long long>() < 0) {
                throw ConfigError("option 'stale_threshold' must be a non-negative integer");
            }
            context.staleThreshold = std::chrono::seconds(value.get<long long>());
        } else if (key == "cache_file") {
            context.cacheFile = stringValue(value, key);
        } else if (key == "default_username") {
            context.defaultUsername = stringValue(value, key);
        } else if (key == "ssh_binary") {
            context.sshBinary = stringValue(value, key);
        }
    }
}

HostConfig hostFromJson(const nlohmann::json &entry)
{
    if (!entry.is_object()) {
        throw ConfigError("host entries must be objects");
    }

    HostConfig host;
    if (!entry.contains("name") || !entry.at("name").is_string()
        || entry.at("name").get<std::string>().empty()) {
        throw ConfigError("host entry without a name: " + entry.dump());
    }
    host.name = entry.at("name").get<std::string>();

    // "ip" is accepted for compatibility with older inventories.
    const char *addressKey = entry.contains("address") ? "address" : "ip";
    if (!entry.contains(addressKey) || !entry.at(addressKey).is_string()
        || entry.at(addressKey).get<std::string>().empty()) {
        throw ConfigError("host '" + host.name + "' has no address");
    }
    host.address = entry.at(addressKey).get<std::string>();

    if (entry.contains("port")) {
        const auto &port = entry.at("port");
        if (!port.is_number_integer() || port.get<int>() < 1 || port.get<int>() > 65535) {
            throw ConfigError("host '" + host.name + "' has an invalid port");
        }
        host.port = port.get<int>();
    }
    if (entry.contains("username")) {
        host.username = stringValue(entry.at("username"), "username");
    }
    if (entry.contains("description")) {
        host.description = stringValue(entry.at("description"), "description");
    }
    if (entry.contains("sudo_policy")) {
        host.sudoPolicy = sudoPolicyValue(entry.at("sudo_policy"), "sudo_policy");
    }
    if (entry.contains("connect_timeout")) {
        host.connectTimeout = secondsValue(entry.at("connect_timeout"), "connect_timeout");
    }
    if (entry.contains("command_timeout")) {
        host.commandTimeout = secondsValue(entry.at("command_timeout"), "command_timeout");
    }
    return host;
}

} // namespace

std::chrono::milliseconds RunContext::connectTimeoutFor(const HostConfig &host) const
{
    return host.connectTimeout.value_or(connectTimeout);
}

std::chrono::milliseconds RunContext::commandTimeoutFor(const HostConfig &host) const
{
    return host.commandTimeout.value_or(commandTimeout);
}

std::string defaultCacheFilePath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return ".local/share/patchfleet/cache.json";
    }
    return (home + QStringLiteral("/.local/share/patchfleet/cache.json")).toStdString();
}

std::string defaultConfigFilePath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return ".config/patchfleet/config.json";
    }
    return (home + QStringLiteral("/.config/patchfleet/config.json")).toStdString();
}

AppConfig configFromJson(const nlohmann::json &document)
{
    if (!document.is_object()) {
        throw ConfigError("configuration root must be an object");
    }

    AppConfig config;
    config.context.cacheFile = defaultCacheFilePath();

    for (const auto &item : document.items()) {
        if (item.key() != "options" && item.key() != "hosts") {
            PFLOG_WARN(QStringLiteral("Config"),
                       QStringLiteral("configFromJson"),
                       QStringLiteral("unknown_root_key_ignored"),
                       QStringLiteral("config_load"),
                       QStringLiteral("key_filter"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"key", item.key()}});
        }
    }

    if (document.contains("options")) {
        applyOptions(config.context, document.at("options"));
    }

    if (document.contains("hosts")) {
        const auto &hosts = document.at("hosts");
        if (!hosts.is_array()) {
            throw ConfigError("'hosts' must be an array");
        }

        std::set<std::string> seen;
        std::set<std::string> duplicates;
        for (const auto &entry : hosts) {
            HostConfig host = hostFromJson(entry);
            if (host.username.empty()) {
                host.username = config.context.defaultUsername;
            }
            if (!seen.insert(host.name).second) {
                duplicates.insert(host.name);
            }
            config.hosts.push_back(std::move(host));
        }

        if (!duplicates.empty()) {
            std::string names;
            for (const auto &name : duplicates) {
                if (!names.empty()) {
                    names += ", ";
                }
                names += name;
            }
            throw ConfigError("Duplicate host names found in configuration: " + names);
        }
    }

    if (config.hosts.empty()) {
        PFLOG_WARN(QStringLiteral("Config"),
                   QStringLiteral("configFromJson"),
                   QStringLiteral("no_hosts_configured"),
                   QStringLiteral("config_load"),
                   QStringLiteral("hosts_section"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }

    return config;
}

AppConfig loadConfigFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("Unable to load config file " + path);
    }

    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error &ex) {
        throw ConfigError("Unable to parse config file " + path + ": " + ex.what());
    }

    AppConfig config = configFromJson(document);
    applyEnvironmentOverrides(config.context);
    return config;
}

void applyEnvironmentOverrides(RunContext &context)
{
    const QString cacheFile = qEnvironmentVariable("PATCHFLEET_CACHE_FILE");
    if (!cacheFile.isEmpty()) {
        context.cacheFile = cacheFile.toStdString();
    }

    bool ok = false;
    const int workers = qEnvironmentVariableIntValue("PATCHFLEET_MAX_WORKERS", &ok);
    if (ok) {
        if (workers < 1) {
            throw ConfigError("PATCHFLEET_MAX_WORKERS must be a positive integer");
        }
        context.maxWorkers = workers;
    }

    const int connectSeconds = qEnvironmentVariableIntValue("PATCHFLEET_CONNECT_TIMEOUT", &ok);
    if (ok) {
        if (connectSeconds < 1 || connectSeconds > kMaxDurationSeconds) {
            throw ConfigError("PATCHFLEET_CONNECT_TIMEOUT must be between 1 and "
                              + std::to_string(kMaxDurationSeconds) + " seconds");
        }
        context.connectTimeout = std::chrono::seconds(connectSeconds);
    }

    const QString sudo = qEnvironmentVariable("PATCHFLEET_SUDO_POLICY");
    if (!sudo.isEmpty()) {
        const auto policy = parseSudoPolicyString(sudo.toStdString());
        if (!policy.has_value()) {
            throw ConfigError("PATCHFLEET_SUDO_POLICY must be 'skip' or 'nopasswd'");
        }
        context.defaultSudoPolicy = *policy;
    }
}

} // namespace patchfleet
