#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace patchfleet {

// Single-file JSON cache of the inventory. Writes go through a temporary
// file that replaces the cache atomically, so readers never see a partial
// snapshot. Only one process should write a given cache file.
class CacheStore {
public:
    explicit CacheStore(std::string path);

    const std::string &path() const { return m_path; }

    // nullopt when no cache exists yet. Older schemas are migrated and the
    // file is rewritten in the current schema. Throws CacheCorruptionError
    // for anything unreadable or from an unknown schema.
    std::optional<InventorySnapshot> load();

    // Throws std::runtime_error when the file cannot be written.
    void save(const InventorySnapshot &snapshot);

    // Removes the cache file. A missing file is fine.
    void reset();

    static nlohmann::json serialize(const InventorySnapshot &snapshot);
    // Current schema only.
    static InventorySnapshot deserialize(const nlohmann::json &document);
    // One update entry of the current schema. Every field is required.
    static Update deserializeUpdate(const nlohmann::json &entry);

    // Upgrades a document of any known schema to the current one. Returns
    // the input unchanged when it already is current.
    static nlohmann::json migrate(const nlohmann::json &document);

    static int schemaVersionOf(const nlohmann::json &document);

private:
    std::string m_path;
};

} // namespace patchfleet
