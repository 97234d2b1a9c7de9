// modules/checkpoint/checkpoint_store.h
#ifndef HOSTPROV_MODULES_CHECKPOINT_CHECKPOINT_STORE_H
#define HOSTPROV_MODULES_CHECKPOINT_CHECKPOINT_STORE_H

#include "hostprov/core/types.h"
#include "common/logging/logger.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace hostprov {

// Durable "module completed" marker
struct Checkpoint {
    ModuleId module_id;
    std::chrono::system_clock::time_point created_at;
    std::string hostname;
    std::string user;

    nlohmann::json to_json() const;
};

// One marker file per completed module under <state_dir>/checkpoints.
// Presence of "<id>.checkpoint" is the truth value; the JSON body is informational.
class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path directory, Logger& logger = Logger::null());

    // Creates the directory (0750). Called lazily by create().
    void init();

    bool exists(const ModuleId& id) const;

    // Idempotent: an existing marker is left untouched. The marker becomes visible
    // in a single link(2), so exists() never observes a partial file.
    // Throws StorageError on I/O failure, ArgumentError on an unusable id.
    void create(const ModuleId& id);

    // Returns false when no marker existed. Throws StorageError on I/O failure.
    bool remove(const ModuleId& id);

    std::set<ModuleId> list() const;
    size_t count() const { return list().size(); }

    std::optional<Checkpoint> get(const ModuleId& id) const;

    // Marker present, readable and carrying the required fields for this id
    bool validate(const ModuleId& id) const;

    // Explicit cleanup; returns the number of markers removed
    size_t clear_all();
    size_t remove_older_than(std::chrono::seconds age);

    const std::filesystem::path& directory() const { return directory_; }

    static bool is_valid_id(const ModuleId& id);

private:
    std::filesystem::path path_for(const ModuleId& id) const;
    void require_valid_id(const ModuleId& id) const;

    std::filesystem::path directory_;
    Logger& logger_;
};

} // namespace hostprov

#endif // HOSTPROV_MODULES_CHECKPOINT_CHECKPOINT_STORE_H
