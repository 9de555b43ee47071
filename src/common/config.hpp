#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace patchfleet {

// Explicit run context handed to the scheduler and providers instead of
// process-wide settings.
struct RunContext {
    SudoPolicy defaultSudoPolicy = SudoPolicy::Skip;
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds commandTimeout{300000};
    std::chrono::milliseconds pingTimeout{5000};
    std::chrono::milliseconds cancelGracePeriod{5000};
    int maxWorkers = 15;
    std::chrono::seconds staleThreshold{86400};
    std::string cacheFile;
    std::string defaultUsername;
    std::string sshBinary = "ssh";

    std::chrono::milliseconds connectTimeoutFor(const HostConfig &host) const;
    std::chrono::milliseconds commandTimeoutFor(const HostConfig &host) const;
};

struct AppConfig {
    RunContext context;
    std::vector<HostConfig> hosts;
};

std::string defaultCacheFilePath();
// $HOME/.config/patchfleet/config.json
std::string defaultConfigFilePath();

// Decode {"options": {...}, "hosts": [...]}. Unknown option keys are logged
// and ignored; invalid values throw ConfigError.
AppConfig configFromJson(const nlohmann::json &document);

// Reads a JSON config file. Throws ConfigError when the file is missing or
// malformed.
AppConfig loadConfigFile(const std::string &path);

// PATCHFLEET_CACHE_FILE, PATCHFLEET_MAX_WORKERS, PATCHFLEET_CONNECT_TIMEOUT
// (seconds) and PATCHFLEET_SUDO_POLICY override file values.
void applyEnvironmentOverrides(RunContext &context);

} // namespace patchfleet
